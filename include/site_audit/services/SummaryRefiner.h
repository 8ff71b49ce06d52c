#pragma once

#include <map>
#include <string>
#include "../models/ExecutiveSummary.h"

namespace site_audit::services {

// Optional collaborator that rewrites the deterministic summary sentences.
// Returns a sentence per line key; throws SummaryRefinementError on failure.
class SummaryRefiner {
public:
    virtual ~SummaryRefiner() = default;

    virtual std::map<std::string, std::string> refine(const ExecutiveSummary& summary) = 0;
};

} // namespace site_audit::services
