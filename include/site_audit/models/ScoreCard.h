#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "Finding.h"

namespace site_audit {

constexpr int kScoreMin = 0;
constexpr int kScoreMax = 100;

enum class ScoreStatus {
    Ok,
    Attention,
    Critical,
    NotEvaluated
};

inline std::string statusToString(ScoreStatus status) {
    switch (status) {
        case ScoreStatus::Ok: return "ok";
        case ScoreStatus::Attention: return "attention";
        case ScoreStatus::Critical: return "critical";
        case ScoreStatus::NotEvaluated: return "not-evaluated";
    }
    return "unknown";
}

struct CategoryScore {
    AuditCategory category = AuditCategory::Seo;
    std::optional<int> value;             // kScoreMin..kScoreMax, absent when nothing was evaluable
    ScoreStatus status = ScoreStatus::NotEvaluated;
    size_t findingCount = 0;
    size_t weaknessCount = 0;             // weaknesses + critical bottlenecks
    double penalty = 0.0;
    double capacity = 0.0;
};

struct ScoreCard {
    std::vector<CategoryScore> categories;   // kAllCategories order
    std::optional<int> overall;
    ScoreStatus overallStatus = ScoreStatus::NotEvaluated;

    const CategoryScore& forCategory(AuditCategory category) const {
        for (const auto& score : categories) {
            if (score.category == category) {
                return score;
            }
        }
        throw std::out_of_range("no score for category " + categoryToString(category));
    }
};

} // namespace site_audit
