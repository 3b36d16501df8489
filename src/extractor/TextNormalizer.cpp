#include "TextNormalizer.h"
#include "../../include/mailsift/common/Url.h"

#include <cctype>
#include <cstdint>
#include <unordered_map>

namespace mailsift::extractor {

namespace {

void appendUtf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

std::optional<uint32_t> parseNumericEntity(const std::string& body) {
    // body is what sits between "&#" and ";"
    if (body.empty()) {
        return std::nullopt;
    }
    bool hex = body[0] == 'x' || body[0] == 'X';
    std::string digits = hex ? body.substr(1) : body;
    if (digits.empty() || digits.size() > 8) {
        return std::nullopt;
    }
    uint32_t value = 0;
    for (char c : digits) {
        int d;
        if (c >= '0' && c <= '9') {
            d = c - '0';
        } else if (hex && c >= 'a' && c <= 'f') {
            d = c - 'a' + 10;
        } else if (hex && c >= 'A' && c <= 'F') {
            d = c - 'A' + 10;
        } else {
            return std::nullopt;
        }
        value = value * (hex ? 16 : 10) + static_cast<uint32_t>(d);
    }
    if (value == 0 || value > 0x10FFFF || (value >= 0xD800 && value <= 0xDFFF)) {
        return std::nullopt;
    }
    return value;
}

const std::unordered_map<std::string, std::string>& namedEntities() {
    static const std::unordered_map<std::string, std::string> entities = {
        {"amp", "&"},
        {"lt", "<"},
        {"gt", ">"},
        {"quot", "\""},
        {"apos", "'"},
        {"nbsp", " "},
        {"commat", "@"},
        {"period", "."},
        {"lowbar", "_"},
        {"hyphen", "-"},
        {"dash", "-"},
        {"plus", "+"},
        {"percnt", "%"},
    };
    return entities;
}

int base64Value(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

inline bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

inline bool isOpenBracket(char c) {
    return c == '[' || c == '(' || c == '{';
}

inline bool isCloseBracket(char c) {
    return c == ']' || c == ')' || c == '}';
}

// Case-insensitive match of the lowercase word at text[pos]
bool matchesWordAt(const std::string& text, size_t pos, const char* word) {
    for (; *word; ++word, ++pos) {
        if (pos >= text.size() || std::tolower(static_cast<unsigned char>(text[pos])) != *word) {
            return false;
        }
    }
    return true;
}

size_t skipSpaces(const std::string& text, size_t pos) {
    while (pos < text.size() && isSpace(text[pos])) {
        ++pos;
    }
    return pos;
}

// "at" or "dot" at pos. Sets the replacement and returns the marker length, or 0.
size_t matchMarkerWord(const std::string& text, size_t pos, char& replacement) {
    if (matchesWordAt(text, pos, "at")) {
        replacement = '@';
        return 2;
    }
    if (matchesWordAt(text, pos, "dot")) {
        replacement = '.';
        return 3;
    }
    return 0;
}

// Length of a non-breaking space entity at text[pos] (which is '&'), or 0
size_t nbspEntityLength(const std::string& text, size_t pos) {
    if (matchesWordAt(text, pos, "&nbsp;") || matchesWordAt(text, pos, "&#160;")) {
        return 6;
    }
    if (!matchesWordAt(text, pos, "&#x")) {
        return 0;
    }
    size_t cursor = pos + 3;
    while (cursor < text.size() && text[cursor] == '0') {
        ++cursor;
    }
    return matchesWordAt(text, cursor, "a0;") ? cursor + 3 - pos : 0;
}

} // namespace

std::string TextNormalizer::normalize(const std::string& raw) {
    std::string text = replaceObfuscationMarkers(raw);
    text = collapseNonBreakingSpaces(text);
    if (auto decoded = common::decodeComponent(text)) {
        text = std::move(*decoded);
    }
    return decodeHtmlEntities(text);
}

std::string TextNormalizer::replaceObfuscationMarkers(const std::string& text) {
    // Single left-to-right pass. Each whitespace run is visited once, so the
    // cost stays linear however much padding a page carries.
    std::string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        const size_t runEnd = skipSpaces(text, i);
        char replacement = 0;

        // "[at]", "( dot )", "{AT}" with optional spaces on either side
        if (runEnd < text.size() && isOpenBracket(text[runEnd])) {
            size_t cursor = skipSpaces(text, runEnd + 1);
            size_t length = matchMarkerWord(text, cursor, replacement);
            if (length > 0) {
                cursor = skipSpaces(text, cursor + length);
                if (cursor < text.size() && isCloseBracket(text[cursor])) {
                    out.push_back(replacement);
                    i = skipSpaces(text, cursor + 1);
                    continue;
                }
            }
        }

        // " at ", " dot " as standalone words
        if (runEnd > i) {
            size_t length = matchMarkerWord(text, runEnd, replacement);
            if (length > 0 && runEnd + length < text.size() && isSpace(text[runEnd + length])) {
                out.push_back(replacement);
                i = skipSpaces(text, runEnd + length);
                continue;
            }
        }

        out.append(text, i, runEnd - i);
        if (runEnd < text.size()) {
            out.push_back(text[runEnd]);
        }
        i = runEnd + 1;
    }
    return out;
}

std::string TextNormalizer::collapseNonBreakingSpaces(const std::string& text) {
    std::string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        if (text[i] == '&') {
            if (size_t length = nbspEntityLength(text, i)) {
                out.push_back(' ');
                i += length;
                continue;
            }
        } else if (text[i] == '\xC2' && i + 1 < text.size() && text[i + 1] == '\xA0') {
            out.push_back(' ');
            i += 2;
            continue;
        }
        out.push_back(text[i++]);
    }
    return out;
}

std::string TextNormalizer::decodeHtmlEntities(const std::string& text) {
    std::string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        if (text[i] != '&') {
            out.push_back(text[i++]);
            continue;
        }

        size_t semi = text.find(';', i + 1);
        // Longest entity we decode is "&#x10FFFF;"
        if (semi == std::string::npos || semi - i > 10) {
            out.push_back(text[i++]);
            continue;
        }

        std::string body = text.substr(i + 1, semi - i - 1);
        if (!body.empty() && body[0] == '#') {
            if (auto cp = parseNumericEntity(body.substr(1))) {
                appendUtf8(out, *cp);
                i = semi + 1;
                continue;
            }
        } else {
            auto it = namedEntities().find(body);
            if (it != namedEntities().end()) {
                out += it->second;
                i = semi + 1;
                continue;
            }
        }

        out.push_back(text[i++]);
    }
    return out;
}

std::string TextNormalizer::deobfuscateConcatenation(const std::string& raw) {
    std::string joined;
    size_t fragments = 0;

    size_t i = 0;
    while (i < raw.size()) {
        char quote = raw[i];
        if (quote != '"' && quote != '\'') {
            ++i;
            continue;
        }

        // Find the matching unescaped closing quote
        size_t close = i + 1;
        while (close < raw.size() && (raw[close] != quote || raw[close - 1] == '\\')) {
            ++close;
        }
        if (close >= raw.size()) {
            break;
        }

        joined.append(raw, i + 1, close - i - 1);
        ++fragments;
        i = close + 1;
    }

    return fragments >= 2 ? joined : raw;
}

std::optional<std::string> TextNormalizer::tryDecodeBase64(const std::string& token) {
    if (token.empty() || token.size() % 4 != 0) {
        return std::nullopt;
    }

    size_t padding = 0;
    if (token.back() == '=') padding++;
    if (token.size() >= 2 && token[token.size() - 2] == '=') padding++;

    const size_t dataLength = token.size() - padding;
    for (size_t i = 0; i < dataLength; ++i) {
        if (base64Value(token[i]) < 0) {
            return std::nullopt;
        }
    }

    std::string decoded;
    decoded.reserve(token.size() / 4 * 3);

    uint32_t buffer = 0;
    int bits = 0;
    for (size_t i = 0; i < dataLength; ++i) {
        buffer = (buffer << 6) | static_cast<uint32_t>(base64Value(token[i]));
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            decoded.push_back(static_cast<char>((buffer >> bits) & 0xFF));
        }
    }

    if (decoded.find('@') == std::string::npos) {
        return std::nullopt;
    }
    return decoded;
}

} // namespace mailsift::extractor
