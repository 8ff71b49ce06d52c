#pragma once

#include <regex>
#include <string>
#include <vector>

namespace site_audit::crawler {

// robots.txt rules for one origin. Directive names are case-insensitive, paths are not.
// The most specific matching group applies (named agent before "*"); inside a group the
// longest matching pattern wins and Allow wins ties.
class RobotsTxtParser {
public:
    RobotsTxtParser() = default;

    void parse(const std::string& content);

    // url may be absolute or a path; the query string takes part in matching
    bool isAllowed(const std::string& url, const std::string& userAgent) const;

    const std::vector<std::string>& getSitemaps() const { return sitemaps; }

    size_t groupCount() const { return groups.size(); }

private:
    struct PathRule {
        std::string pattern;
        std::regex regex;
        bool allow = false;
    };

    struct Group {
        std::vector<std::string> agents;   // lowercase product tokens, "*" for default
        std::vector<PathRule> rules;
    };

    static PathRule compileRule(const std::string& pattern, bool allow);
    static std::string productToken(const std::string& userAgent);
    const Group* selectGroup(const std::string& userAgent) const;

    std::vector<Group> groups;
    std::vector<std::string> sitemaps;
};

} // namespace site_audit::crawler
