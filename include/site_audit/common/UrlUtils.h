#pragma once

#include <optional>
#include <string>

namespace site_audit::common {

// Remove invisible/formatting Unicode codepoints commonly found in copy/pasted URLs
// (U+200B..U+200F, U+2060, U+FEFF and the bidi controls), strip ASCII control
// characters and trim surrounding ASCII whitespace.
std::string sanitizeUrl(const std::string& input);

// Compact hex dump used in fetch error messages, e.g. "68 74 74 70 73 3a 2f ..."
std::string hexDump(const std::string& input);

struct ParsedUrl {
    std::string scheme;   // lowercase
    std::string host;     // lowercase, without port
    std::string port;     // empty when absent or default for the scheme
    std::string path;     // "/" when empty
    std::string query;    // without '?'
    std::string fragment; // without '#'

    // scheme://host[:port]
    std::string origin() const;

    // Serialized form without the fragment
    std::string toString() const;
};

// Parses absolute http(s) URLs. Returns nullopt for anything else.
std::optional<ParsedUrl> parseUrl(const std::string& url);

// Resolves href against an absolute base URL. Returns an empty string when the
// reference is not navigable (mailto:, tel:, javascript:, data:, fragment-only,
// non-http schemes).
std::string resolveUrl(const std::string& baseUrl, const std::string& href);

// Canonical form used for dedup and cache keys: lowercase scheme/host, default
// port dropped, empty path -> "/", fragment dropped, query kept. Returns the input
// unchanged when it is not an http(s) URL.
std::string normalizeUrl(const std::string& url);

// scheme://host[:port] of an http(s) URL, empty when unparsable
std::string originOf(const std::string& url);

bool isSameOrigin(const std::string& a, const std::string& b);

// True when the path's extension does not name a known non-HTML resource
bool looksLikeHtmlPath(const std::string& path);

// Validates and normalizes a user-supplied target. A missing scheme defaults to
// https. Throws InvalidUrlError for empty input, non-http(s) schemes, and hosts
// without a dot (except localhost and IP literals).
std::string validateTargetUrl(const std::string& rawUrl);

} // namespace site_audit::common
