#pragma once

#include <stdexcept>
#include <string>

namespace site_audit {

// Base class for failures that prevent an audit from producing a report
class AuditError : public std::runtime_error {
public:
    explicit AuditError(const std::string& message) : std::runtime_error(message) {}
};

// The seed URL could not be reached at all, so no usable crawl result exists
class SeedUnreachableError : public AuditError {
public:
    SeedUnreachableError(const std::string& url, const std::string& reason)
        : AuditError("target unreachable: " + url + " (" + reason + ")"), url_(url) {}

    const std::string& url() const { return url_; }

private:
    std::string url_;
};

// The optional summary refinement collaborator failed; callers keep the deterministic text
class SummaryRefinementError : public std::runtime_error {
public:
    explicit SummaryRefinementError(const std::string& message) : std::runtime_error(message) {}
};

class InvalidUrlError : public std::invalid_argument {
public:
    explicit InvalidUrlError(const std::string& message) : std::invalid_argument(message) {}
};

} // namespace site_audit
