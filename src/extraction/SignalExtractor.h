#pragma once

#include <string>
#include <gumbo.h>
#include "../../include/site_audit/models/PageSignals.h"

namespace site_audit::extraction {

// Turns one page's HTML into PageSignals. Malformed markup is tolerated by the
// parser, so extraction never fails; missing values stay std::nullopt.
// Stateless and safe to share between worker threads.
class SignalExtractor {
public:
    SignalExtractor() = default;

    // pageUrl is the final (post-redirect) URL, used to resolve relative references
    PageSignals extract(const std::string& html, const std::string& pageUrl) const;

private:
    struct WalkState;

    static void walk(const GumboNode* node, WalkState& state, bool inHead, bool inNav, bool inLabel);
    static void visitElement(const GumboNode* node, WalkState& state, bool inHead, bool inNav, bool inLabel);
    static void collectText(const GumboNode* node, std::string& text);
    static void finish(WalkState& state, PageSignals& signals);
};

} // namespace site_audit::extraction
