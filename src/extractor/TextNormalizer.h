#pragma once

#include <optional>
#include <string>

namespace mailsift::extractor {

// Best-effort reversal of the tricks pages use to hide addresses from scrapers.
// Every function is pure and never throws; a step that cannot be applied leaves
// its input unchanged.
class TextNormalizer {
public:
    // Apply, in order: at/dot marker replacement, non-breaking-space collapsing,
    // percent-decoding (when decodable) and HTML entity decoding.
    static std::string normalize(const std::string& raw);

    // Concatenate the contents of every quoted fragment ("..." or '...') in order,
    // undoing `"info" + "@" + "example.com"`. Fewer than two fragments: input unchanged.
    static std::string deobfuscateConcatenation(const std::string& raw);

    // Decode a base64 token; only decodings that contain '@' are returned.
    static std::optional<std::string> tryDecodeBase64(const std::string& token);

    // Individual steps, exposed for testing
    static std::string replaceObfuscationMarkers(const std::string& text);
    static std::string collapseNonBreakingSpaces(const std::string& text);
    static std::string decodeHtmlEntities(const std::string& text);
};

} // namespace mailsift::extractor
