#include "../../include/mailsift/common/Url.h"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <memory>

namespace mailsift::common {

namespace {

using UrlHandle = std::unique_ptr<CURLU, decltype(&curl_url_cleanup)>;

UrlHandle makeHandle() {
    return UrlHandle(curl_url(), &curl_url_cleanup);
}

std::optional<std::string> getPart(CURLU* handle, CURLUPart part, unsigned int flags = 0) {
    char* value = nullptr;
    if (curl_url_get(handle, part, &value, flags) != CURLUE_OK || value == nullptr) {
        return std::nullopt;
    }
    std::string result(value);
    curl_free(value);
    return result;
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool isHttpScheme(const std::string& scheme) {
    return scheme == "http" || scheme == "https";
}

inline bool isAsciiSpace(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f';
}

bool isInvisibleCodepoint(uint32_t cp) {
    return (cp >= 0x200B && cp <= 0x200F) ||
           (cp >= 0x202A && cp <= 0x202E) ||
           cp == 0x2060 ||
           (cp >= 0x2066 && cp <= 0x2069) ||
           cp == 0xFEFF;
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// libcurl rejects raw spaces in URLs; browsers encode them
std::string encodeSpaces(const std::string& href) {
    std::string out;
    out.reserve(href.size());
    for (char c : href) {
        if (c == ' ') {
            out += "%20";
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::string stripFragment(const std::string& url) {
    size_t hashPos = url.find('#');
    return hashPos == std::string::npos ? url : url.substr(0, hashPos);
}

} // namespace

std::string sanitizeUrl(const std::string& input) {
    size_t start = 0;
    size_t end = input.size();
    while (start < end && isAsciiSpace(static_cast<unsigned char>(input[start]))) start++;
    while (end > start && isAsciiSpace(static_cast<unsigned char>(input[end - 1]))) end--;

    std::string out;
    out.reserve(end - start);

    for (size_t i = start; i < end;) {
        unsigned char c = static_cast<unsigned char>(input[i]);
        if ((c & 0x80) == 0) {
            if (c >= 0x20 && c != 0x7F) {
                out.push_back(static_cast<char>(c));
            }
            i++;
            continue;
        }

        uint32_t cp = 0;
        size_t len = 0;
        if ((c & 0xE0) == 0xC0) {
            cp = c & 0x1F;
            len = 2;
        } else if ((c & 0xF0) == 0xE0) {
            cp = c & 0x0F;
            len = 3;
        } else if ((c & 0xF8) == 0xF0) {
            cp = c & 0x07;
            len = 4;
        }

        if (len == 0 || i + len > end) {
            // Stray continuation byte or truncated sequence
            i++;
            continue;
        }
        for (size_t k = 1; k < len; ++k) {
            cp = (cp << 6) | (static_cast<unsigned char>(input[i + k]) & 0x3F);
        }

        if (!isInvisibleCodepoint(cp)) {
            out.append(input, i, len);
        }
        i += len;
    }

    return out;
}

std::optional<ParsedUrl> parseUrl(const std::string& url) {
    UrlHandle handle = makeHandle();
    if (!handle) {
        return std::nullopt;
    }
    if (curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), 0) != CURLUE_OK) {
        return std::nullopt;
    }

    auto scheme = getPart(handle.get(), CURLUPART_SCHEME);
    auto host = getPart(handle.get(), CURLUPART_HOST);
    if (!scheme || !host || host->empty()) {
        return std::nullopt;
    }

    ParsedUrl parsed;
    parsed.scheme = toLower(*scheme);
    if (!isHttpScheme(parsed.scheme)) {
        return std::nullopt;
    }
    parsed.host = toLower(*host);
    parsed.port = getPart(handle.get(), CURLUPART_PORT, CURLU_NO_DEFAULT_PORT).value_or("");
    parsed.path = getPart(handle.get(), CURLUPART_PATH).value_or("/");
    if (parsed.path.empty() || parsed.path.front() != '/') {
        parsed.path.insert(parsed.path.begin(), '/');
    }
    parsed.query = getPart(handle.get(), CURLUPART_QUERY).value_or("");
    return parsed;
}

std::optional<std::string> resolveUrl(const std::string& base, const std::string& href) {
    std::string reference = encodeSpaces(sanitizeUrl(href));

    UrlHandle handle = makeHandle();
    if (!handle) {
        return std::nullopt;
    }
    if (curl_url_set(handle.get(), CURLUPART_URL, base.c_str(), 0) != CURLUE_OK) {
        return std::nullopt;
    }

    if (reference.empty() || reference.front() == '#') {
        // Same-document reference: the base itself with the new fragment
        auto baseUrl = getPart(handle.get(), CURLUPART_URL);
        if (!baseUrl) {
            return std::nullopt;
        }
        std::string resolved = stripFragment(*baseUrl) + reference;
        if (!parseUrl(resolved)) {
            return std::nullopt;
        }
        return resolved;
    }

    // With a URL already set, libcurl resolves a relative one against it
    if (curl_url_set(handle.get(), CURLUPART_URL, reference.c_str(), 0) != CURLUE_OK) {
        return std::nullopt;
    }

    auto scheme = getPart(handle.get(), CURLUPART_SCHEME);
    auto host = getPart(handle.get(), CURLUPART_HOST);
    if (!scheme || !isHttpScheme(toLower(*scheme)) || !host || host->empty()) {
        return std::nullopt;
    }
    return getPart(handle.get(), CURLUPART_URL);
}

std::string normalizeUrl(const std::string& url) {
    auto parsed = parseUrl(sanitizeUrl(url));
    if (!parsed) {
        return "";
    }

    std::string normalized = parsed->scheme + "://" + parsed->host;
    if (!parsed->port.empty()) {
        normalized += ":" + parsed->port;
    }
    normalized += parsed->path;
    if (!parsed->query.empty()) {
        normalized += "?" + parsed->query;
    }
    return normalized;
}

std::string extractHost(const std::string& url) {
    auto parsed = parseUrl(sanitizeUrl(url));
    return parsed ? parsed->host : "";
}

std::string ensureScheme(const std::string& input) {
    std::string trimmed = sanitizeUrl(input);
    if (trimmed.empty()) {
        return trimmed;
    }
    if (toLower(trimmed.substr(0, 4)) == "http") {
        return trimmed;
    }
    return "https://" + trimmed;
}

std::string encodeComponent(const std::string& input) {
    static const char* kHex = "0123456789ABCDEF";
    std::string out;
    out.reserve(input.size() * 3);
    for (unsigned char c : input) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

std::optional<std::string> decodeComponent(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    for (size_t i = 0; i < input.size(); ++i) {
        if (input[i] != '%') {
            out.push_back(input[i]);
            continue;
        }
        if (i + 2 >= input.size()) {
            return std::nullopt;
        }
        int hi = hexValue(input[i + 1]);
        int lo = hexValue(input[i + 2]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
    }
    return out;
}

} // namespace mailsift::common
