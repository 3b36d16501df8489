#pragma once

#include <optional>
#include <string>

namespace mailsift::common {

struct ParsedUrl {
    std::string scheme;   // lowercased
    std::string host;     // lowercased
    std::string port;     // empty when it is the scheme default
    std::string path;     // always starts with '/'
    std::string query;    // without the leading '?'
};

// Remove invisible/formatting Unicode codepoints commonly found in copy/pasted URLs
// (U+200B..U+200F, U+202A..U+202E, U+2060, U+2066..U+2069, U+FEFF), strip ASCII
// control characters and trim surrounding ASCII whitespace.
std::string sanitizeUrl(const std::string& input);

// Parse an absolute http(s) URL. Returns nullopt for anything else.
std::optional<ParsedUrl> parseUrl(const std::string& url);

// Resolve href against base following RFC 3986 reference resolution
// (relative paths, protocol-relative, fragment-only). The result keeps its fragment.
// Returns nullopt unless the result is an absolute http(s) URL.
std::optional<std::string> resolveUrl(const std::string& base, const std::string& href);

// Canonical form used for frontier and visited-set identity: scheme and host
// lowercased, default port dropped, fragment stripped, empty path -> "/".
// Returns an empty string when the URL does not parse.
std::string normalizeUrl(const std::string& url);

// Lowercased host of an absolute URL, or empty string
std::string extractHost(const std::string& url);

// Prefix "https://" unless the input already starts with "http"
std::string ensureScheme(const std::string& input);

// Percent-encode everything except RFC 3986 unreserved characters
std::string encodeComponent(const std::string& input);

// Decode %XX sequences. Returns nullopt when a '%' is not followed by two hex digits.
std::optional<std::string> decodeComponent(const std::string& input);

} // namespace mailsift::common
