#include "RobotsTxtParser.h"
#include "../../include/Logger.h"
#include "../../include/site_audit/common/UrlUtils.h"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace site_audit::crawler {

namespace {

std::string trimCopy(const std::string& value) {
    const size_t start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    const size_t end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

std::string lowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string pathForMatching(const std::string& url) {
    if (url.find("://") == std::string::npos) {
        return url.empty() ? "/" : url;
    }
    auto parsed = common::parseUrl(url);
    if (!parsed) {
        return "/";
    }
    return parsed->query.empty() ? parsed->path : parsed->path + "?" + parsed->query;
}

} // namespace

void RobotsTxtParser::parse(const std::string& content) {
    groups.clear();
    sitemaps.clear();

    std::istringstream stream(content);
    std::string line;
    bool lastLineWasAgent = false;

    while (std::getline(stream, line)) {
        const size_t hash = line.find('#');
        if (hash != std::string::npos) {
            line.erase(hash);
        }
        line = trimCopy(line);
        if (line.empty()) {
            continue;
        }

        const size_t colon = line.find(':');
        if (colon == std::string::npos) {
            LOG_TRACE("Ignoring robots.txt line without directive: " + line);
            continue;
        }

        const std::string key = lowerCopy(trimCopy(line.substr(0, colon)));
        const std::string value = trimCopy(line.substr(colon + 1));

        if (key == "user-agent") {
            if (!lastLineWasAgent || groups.empty()) {
                groups.push_back(Group{});
            }
            groups.back().agents.push_back(lowerCopy(value));
            lastLineWasAgent = true;
            continue;
        }

        if (key == "sitemap") {
            if (!value.empty()) {
                sitemaps.push_back(value);
            }
            continue;
        }

        lastLineWasAgent = false;
        if (groups.empty()) {
            // Rules before any User-agent line belong to no group
            continue;
        }

        if (key == "disallow" && !value.empty()) {
            groups.back().rules.push_back(compileRule(value, false));
        } else if (key == "allow" && !value.empty()) {
            groups.back().rules.push_back(compileRule(value, true));
        }
    }

    LOG_DEBUG("Parsed robots.txt: " + std::to_string(groups.size()) + " groups, " +
              std::to_string(sitemaps.size()) + " sitemaps");
}

bool RobotsTxtParser::isAllowed(const std::string& url, const std::string& userAgent) const {
    const Group* group = selectGroup(userAgent);
    if (!group) {
        return true;
    }

    const std::string path = pathForMatching(url);
    const PathRule* best = nullptr;
    for (const auto& rule : group->rules) {
        if (!std::regex_search(path, rule.regex)) {
            continue;
        }
        if (!best ||
            rule.pattern.size() > best->pattern.size() ||
            (rule.pattern.size() == best->pattern.size() && rule.allow && !best->allow)) {
            best = &rule;
        }
    }

    if (best) {
        LOG_TRACE("robots.txt rule '" + best->pattern + "' " + (best->allow ? "allows " : "disallows ") + path);
        return best->allow;
    }
    return true;
}

RobotsTxtParser::PathRule RobotsTxtParser::compileRule(const std::string& pattern, bool allow) {
    std::string body = pattern;
    bool anchoredEnd = false;
    if (!body.empty() && body.back() == '$') {
        anchoredEnd = true;
        body.pop_back();
    }

    std::string regexPattern = "^";
    for (char c : body) {
        switch (c) {
            case '*':
                regexPattern += ".*";
                break;
            case '.': case '+': case '?': case '(': case ')': case '[': case ']':
            case '{': case '}': case '^': case '$': case '|': case '\\':
                regexPattern += '\\';
                regexPattern += c;
                break;
            default:
                regexPattern += c;
        }
    }
    if (anchoredEnd) {
        regexPattern += "$";
    }

    return PathRule{pattern, std::regex(regexPattern), allow};
}

std::string RobotsTxtParser::productToken(const std::string& userAgent) {
    const size_t end = userAgent.find_first_of("/ ");
    return lowerCopy(end == std::string::npos ? userAgent : userAgent.substr(0, end));
}

const RobotsTxtParser::Group* RobotsTxtParser::selectGroup(const std::string& userAgent) const {
    const std::string token = productToken(userAgent);
    const Group* wildcard = nullptr;
    const Group* specific = nullptr;
    size_t specificLength = 0;

    for (const auto& group : groups) {
        for (const auto& agent : group.agents) {
            if (agent.empty()) {
                continue;
            }
            if (agent == "*") {
                if (!wildcard) wildcard = &group;
                continue;
            }
            if (!token.empty() && token.find(agent) != std::string::npos && agent.size() > specificLength) {
                specific = &group;
                specificLength = agent.size();
            }
        }
    }

    return specific ? specific : wildcard;
}

} // namespace site_audit::crawler
