#pragma once

#include <array>
#include <cstddef>
#include <string>

namespace site_audit {

enum class AuditCategory {
    Performance,
    Seo,
    Ux,
    Accessibility,
    Conversion
};

constexpr std::array<AuditCategory, 5> kAllCategories = {
    AuditCategory::Performance,
    AuditCategory::Seo,
    AuditCategory::Ux,
    AuditCategory::Accessibility,
    AuditCategory::Conversion
};

enum class FindingKind {
    Strength,
    Weakness,
    Opportunity,
    CriticalBottleneck
};

enum class Severity {
    Low = 1,
    Medium = 2,
    High = 3,
    Critical = 4
};

inline std::string categoryToString(AuditCategory category) {
    switch (category) {
        case AuditCategory::Performance: return "performance";
        case AuditCategory::Seo: return "seo";
        case AuditCategory::Ux: return "ux";
        case AuditCategory::Accessibility: return "accessibility";
        case AuditCategory::Conversion: return "conversion";
    }
    return "unknown";
}

inline std::string kindToString(FindingKind kind) {
    switch (kind) {
        case FindingKind::Strength: return "strength";
        case FindingKind::Weakness: return "weakness";
        case FindingKind::Opportunity: return "opportunity";
        case FindingKind::CriticalBottleneck: return "critical-bottleneck";
    }
    return "unknown";
}

inline std::string severityToString(Severity severity) {
    switch (severity) {
        case Severity::Low: return "low";
        case Severity::Medium: return "medium";
        case Severity::High: return "high";
        case Severity::Critical: return "critical";
    }
    return "unknown";
}

// Weaknesses and critical bottlenecks count against a category score
inline bool isPenalized(FindingKind kind) {
    return kind == FindingKind::Weakness || kind == FindingKind::CriticalBottleneck;
}

struct Evidence {
    size_t pageIndex = 0;   // index of the originating PageRecord
    std::string url;
    std::string metric;     // rule-specific measured value, may be empty
};

struct Finding {
    std::string ruleId;
    AuditCategory category = AuditCategory::Seo;
    FindingKind kind = FindingKind::Weakness;
    Severity severity = Severity::Low;
    std::string title;
    std::string detail;
    std::string howToFix;
    Evidence evidence;
    bool siteWide = false;  // produced by a site rule, evidence points at the seed
};

} // namespace site_audit
