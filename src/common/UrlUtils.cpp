#include "../../include/site_audit/common/UrlUtils.h"
#include "../../include/site_audit/common/Errors.h"

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>
#include <unordered_set>
#include <vector>

namespace site_audit::common {

namespace {

inline bool isAsciiSpace(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trim(const std::string& value) {
    size_t start = 0;
    size_t end = value.size();
    while (start < end && isAsciiSpace(static_cast<unsigned char>(value[start]))) start++;
    while (end > start && isAsciiSpace(static_cast<unsigned char>(value[end - 1]))) end--;
    return value.substr(start, end - start);
}

bool startsWithIgnoreCase(const std::string& value, const std::string& prefix) {
    if (value.size() < prefix.size()) return false;
    return toLower(value.substr(0, prefix.size())) == prefix;
}

// RFC 3986 section 5.2.4
std::string removeDotSegments(const std::string& path) {
    std::vector<std::string> output;
    std::string segment;
    std::istringstream stream(path);
    bool trailingSlash = !path.empty() && path.back() == '/';

    while (std::getline(stream, segment, '/')) {
        if (segment.empty() || segment == ".") {
            continue;
        }
        if (segment == "..") {
            if (!output.empty()) output.pop_back();
            continue;
        }
        output.push_back(segment);
    }

    std::string last = path.substr(path.find_last_of('/') + 1);
    if (last == "." || last == "..") {
        trailingSlash = true;
    }

    std::string result;
    for (const auto& part : output) {
        result += "/" + part;
    }
    if (result.empty() || trailingSlash) {
        result += "/";
    }
    return result;
}

const std::unordered_set<std::string>& nonHtmlExtensions() {
    static const std::unordered_set<std::string> extensions = {
        "pdf", "jpg", "jpeg", "png", "gif", "webp", "avif", "svg", "ico", "bmp", "tif", "tiff",
        "css", "js", "mjs", "json", "xml", "txt", "csv", "rss", "atom",
        "zip", "gz", "tgz", "rar", "7z", "tar", "exe", "dmg", "apk", "iso",
        "mp3", "mp4", "m4a", "wav", "ogg", "webm", "avi", "mov", "mkv",
        "doc", "docx", "xls", "xlsx", "ppt", "pptx", "odt", "ods",
        "woff", "woff2", "ttf", "otf", "eot"
    };
    return extensions;
}

} // namespace

std::string sanitizeUrl(const std::string& input) {
    if (input.empty()) return input;

    std::string s = trim(input);
    std::string out;
    out.reserve(s.size());

    for (size_t i = 0; i < s.size();) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if ((c & 0x80) == 0) {
            if (c < 0x20 || c == 0x7F) { i++; continue; }
            out.push_back(static_cast<char>(c));
            i++;
            continue;
        }

        uint32_t cp = 0;
        size_t adv = 1;
        if ((c & 0xE0) == 0xC0 && i + 1 < s.size()) {
            cp = ((c & 0x1F) << 6) | (static_cast<unsigned char>(s[i + 1]) & 0x3F);
            adv = 2;
        } else if ((c & 0xF0) == 0xE0 && i + 2 < s.size()) {
            cp = ((c & 0x0F) << 12) |
                 ((static_cast<unsigned char>(s[i + 1]) & 0x3F) << 6) |
                 (static_cast<unsigned char>(s[i + 2]) & 0x3F);
            adv = 3;
        } else if ((c & 0xF8) == 0xF0 && i + 3 < s.size()) {
            cp = ((c & 0x07) << 18) |
                 ((static_cast<unsigned char>(s[i + 1]) & 0x3F) << 12) |
                 ((static_cast<unsigned char>(s[i + 2]) & 0x3F) << 6) |
                 (static_cast<unsigned char>(s[i + 3]) & 0x3F);
            adv = 4;
        } else {
            i++;
            continue;
        }

        const bool invisible = (cp >= 0x200B && cp <= 0x200F) || cp == 0x2060 || cp == 0xFEFF ||
                               (cp >= 0x202A && cp <= 0x202E) || (cp >= 0x2066 && cp <= 0x2069);
        if (!invisible) {
            out.append(s, i, adv);
        }
        i += adv;
    }

    return out;
}

std::string hexDump(const std::string& input) {
    std::ostringstream oss;
    oss.setf(std::ios::hex, std::ios::basefield);
    for (size_t i = 0; i < input.size(); ++i) {
        unsigned int v = static_cast<unsigned char>(input[i]);
        if (i) oss << ' ';
        if (v < 0x10) oss << '0';
        oss << v;
    }
    return oss.str();
}

std::string ParsedUrl::origin() const {
    return scheme + "://" + host + (port.empty() ? "" : ":" + port);
}

std::string ParsedUrl::toString() const {
    std::string result = origin() + path;
    if (!query.empty()) {
        result += "?" + query;
    }
    return result;
}

std::optional<ParsedUrl> parseUrl(const std::string& url) {
    const size_t schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        return std::nullopt;
    }

    ParsedUrl parsed;
    parsed.scheme = toLower(url.substr(0, schemeEnd));
    if (parsed.scheme != "http" && parsed.scheme != "https") {
        return std::nullopt;
    }

    const size_t authorityStart = schemeEnd + 3;
    size_t authorityEnd = url.find_first_of("/?#", authorityStart);
    if (authorityEnd == std::string::npos) {
        authorityEnd = url.size();
    }

    std::string authority = url.substr(authorityStart, authorityEnd - authorityStart);
    const size_t at = authority.rfind('@');
    if (at != std::string::npos) {
        authority = authority.substr(at + 1);
    }

    std::string hostPart;
    std::string portPart;
    if (!authority.empty() && authority[0] == '[') {
        const size_t close = authority.find(']');
        if (close == std::string::npos) {
            return std::nullopt;
        }
        hostPart = authority.substr(0, close + 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') return std::nullopt;
            portPart = authority.substr(close + 2);
        }
    } else {
        const size_t colon = authority.rfind(':');
        if (colon != std::string::npos) {
            hostPart = authority.substr(0, colon);
            portPart = authority.substr(colon + 1);
        } else {
            hostPart = authority;
        }
    }

    if (hostPart.empty()) {
        return std::nullopt;
    }
    for (unsigned char c : hostPart) {
        if (std::isspace(c) || c < 0x20) return std::nullopt;
    }
    for (unsigned char c : portPart) {
        if (!std::isdigit(c)) return std::nullopt;
    }

    parsed.host = toLower(hostPart);
    if ((parsed.scheme == "http" && portPart == "80") || (parsed.scheme == "https" && portPart == "443")) {
        portPart.clear();
    }
    parsed.port = portPart;

    std::string rest = url.substr(authorityEnd);
    const size_t hash = rest.find('#');
    if (hash != std::string::npos) {
        parsed.fragment = rest.substr(hash + 1);
        rest = rest.substr(0, hash);
    }
    const size_t question = rest.find('?');
    if (question != std::string::npos) {
        parsed.query = rest.substr(question + 1);
        rest = rest.substr(0, question);
    }
    parsed.path = rest.empty() ? "/" : rest;

    return parsed;
}

std::string resolveUrl(const std::string& baseUrl, const std::string& href) {
    const std::string reference = trim(href);
    if (reference.empty() || reference[0] == '#') {
        return "";
    }
    for (const char* blocked : {"mailto:", "tel:", "javascript:", "data:"}) {
        if (startsWithIgnoreCase(reference, blocked)) {
            return "";
        }
    }

    static const std::regex schemePrefix(R"(^[A-Za-z][A-Za-z0-9+.\-]*:)");
    if (std::regex_search(reference, schemePrefix)) {
        auto absolute = parseUrl(reference);
        if (!absolute) return "";
        absolute->path = removeDotSegments(absolute->path);
        return absolute->toString();
    }

    auto base = parseUrl(baseUrl);
    if (!base) {
        return "";
    }

    std::string combined;
    if (reference.rfind("//", 0) == 0) {
        combined = base->scheme + ":" + reference;
    } else if (reference[0] == '/') {
        combined = base->origin() + reference;
    } else if (reference[0] == '?') {
        combined = base->origin() + base->path + reference;
    } else {
        const std::string directory = base->path.substr(0, base->path.find_last_of('/') + 1);
        combined = base->origin() + directory + reference;
    }

    auto resolved = parseUrl(combined);
    if (!resolved) {
        return "";
    }
    resolved->path = removeDotSegments(resolved->path);
    return resolved->toString();
}

std::string normalizeUrl(const std::string& url) {
    auto parsed = parseUrl(url);
    if (!parsed) {
        return url;
    }
    return parsed->toString();
}

std::string originOf(const std::string& url) {
    auto parsed = parseUrl(url);
    return parsed ? parsed->origin() : "";
}

bool isSameOrigin(const std::string& a, const std::string& b) {
    const std::string originA = originOf(a);
    return !originA.empty() && originA == originOf(b);
}

bool looksLikeHtmlPath(const std::string& path) {
    const size_t lastSlash = path.find_last_of('/');
    const std::string segment = lastSlash == std::string::npos ? path : path.substr(lastSlash + 1);
    const size_t dot = segment.find_last_of('.');
    if (dot == std::string::npos || dot + 1 >= segment.size()) {
        return true;
    }
    return nonHtmlExtensions().count(toLower(segment.substr(dot + 1))) == 0;
}

std::string validateTargetUrl(const std::string& rawUrl) {
    std::string value = trim(sanitizeUrl(rawUrl));
    if (value.empty()) {
        throw InvalidUrlError("url is required");
    }

    const size_t schemeEnd = value.find("://");
    if (schemeEnd == std::string::npos) {
        value = "https://" + value;
    } else {
        const std::string scheme = toLower(value.substr(0, schemeEnd));
        if (scheme != "http" && scheme != "https") {
            throw InvalidUrlError("url must start with http:// or https://");
        }
    }

    auto parsed = parseUrl(value);
    if (!parsed) {
        throw InvalidUrlError("invalid url: " + rawUrl);
    }

    static const std::regex ipv4(R"(^\d{1,3}(\.\d{1,3}){3}$)");
    const std::string& host = parsed->host;
    const bool isIp = std::regex_match(host, ipv4) || host.front() == '[';
    if (host != "localhost" && !isIp && host.find('.') == std::string::npos) {
        throw InvalidUrlError("invalid url host: " + host);
    }
    if (host.front() == '.' || host.back() == '.') {
        throw InvalidUrlError("invalid url host: " + host);
    }

    parsed->fragment.clear();
    return parsed->toString();
}

} // namespace site_audit::common
