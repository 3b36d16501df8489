#include <catch2/catch_test_macros.hpp>
#include "TextNormalizer.h"

#include <chrono>
#include <string>

using mailsift::extractor::TextNormalizer;

TEST_CASE("TextNormalizer replaces at/dot markers", "[TextNormalizer]") {
    SECTION("Square brackets with surrounding spaces") {
        REQUIRE(TextNormalizer::normalize("user [at] example [dot] com") == "user@example.com");
    }

    SECTION("Parentheses and braces, any case") {
        REQUIRE(TextNormalizer::normalize("info(at)example(dot)org") == "info@example.org");
        REQUIRE(TextNormalizer::normalize("sales {AT} shop {Dot} io") == "sales@shop.io");
    }

    SECTION("Standalone words between spaces") {
        REQUIRE(TextNormalizer::normalize("jane at corp dot net") == "jane@corp.net");
    }

    SECTION("Words merely containing the markers are left alone") {
        REQUIRE(TextNormalizer::normalize("attic dotted") == "attic dotted");
    }

    SECTION("Marker words need whitespace on both sides") {
        REQUIRE(TextNormalizer::replaceObfuscationMarkers("look at") == "look at");
        REQUIRE(TextNormalizer::replaceObfuscationMarkers("[at] x") == "@x");
        REQUIRE(TextNormalizer::replaceObfuscationMarkers("a [at b") == "a [at b");
    }
}

TEST_CASE("TextNormalizer handles heavy whitespace padding", "[TextNormalizer]") {
    const std::string padding(100000, ' ');

    SECTION("Whitespace alone passes through unchanged") {
        auto started = std::chrono::steady_clock::now();
        REQUIRE(TextNormalizer::normalize(padding) == padding);
        REQUIRE(std::chrono::steady_clock::now() - started < std::chrono::seconds(5));
    }

    SECTION("Padding between ordinary words is kept") {
        REQUIRE(TextNormalizer::normalize("x" + padding + "y") == "x" + padding + "y");
        REQUIRE(TextNormalizer::replaceObfuscationMarkers("\t\n" + padding + "\n") == "\t\n" + padding + "\n");
    }

    SECTION("Markers surrounded by long padding are still replaced") {
        REQUIRE(TextNormalizer::normalize("user" + padding + "at" + padding + "example" + padding + "[dot]" +
                                          padding + "com") == "user@example.com");
        REQUIRE(TextNormalizer::normalize("user (" + padding + "at" + padding + ") example.com") ==
                "user@example.com");
    }

    SECTION("Open brackets followed by padding without a marker") {
        std::string text = "(" + padding + "x";
        REQUIRE(TextNormalizer::replaceObfuscationMarkers(text) == text);
    }
}

TEST_CASE("TextNormalizer decodes encodings", "[TextNormalizer]") {
    SECTION("Numeric entities, decimal and hex") {
        REQUIRE(TextNormalizer::normalize("contact&#64;example&#x2E;com") == "contact@example.com");
    }

    SECTION("Named entities") {
        REQUIRE(TextNormalizer::normalize("first&period;last&commat;example&period;com") == "first.last@example.com");
        REQUIRE(TextNormalizer::decodeHtmlEntities("a &amp; b &lt;c&gt;") == "a & b <c>");
    }

    SECTION("Unknown entities pass through") {
        REQUIRE(TextNormalizer::decodeHtmlEntities("&bogus; & alone") == "&bogus; & alone");
    }

    SECTION("Percent-encoded text is decoded") {
        REQUIRE(TextNormalizer::normalize("info%40example.com") == "info@example.com");
    }

    SECTION("Undecodable percent signs leave the text unchanged") {
        REQUIRE(TextNormalizer::normalize("100% sure") == "100% sure");
    }

    SECTION("Non-breaking spaces become plain spaces") {
        REQUIRE(TextNormalizer::collapseNonBreakingSpaces("a&nbsp;b&#160;c&#xA0;d") == "a b c d");
        REQUIRE(TextNormalizer::collapseNonBreakingSpaces("a\xC2\xA0" "b") == "a b");
        REQUIRE(TextNormalizer::collapseNonBreakingSpaces("a&NBSP;b&#x00a0;c") == "a b c");
    }

    SECTION("Near misses are not treated as non-breaking spaces") {
        REQUIRE(TextNormalizer::collapseNonBreakingSpaces("&nbsp &#161; &#xa1; &") == "&nbsp &#161; &#xa1; &");
    }
}

TEST_CASE("TextNormalizer undoes string concatenation", "[TextNormalizer]") {
    SECTION("Double-quoted fragments") {
        REQUIRE(TextNormalizer::deobfuscateConcatenation(R"("a" + "@" + "b.com")") == "a@b.com");
    }

    SECTION("Single-quoted fragments") {
        REQUIRE(TextNormalizer::deobfuscateConcatenation(R"(var m = 'info' + '@' + 'site.org';)") == "info@site.org");
    }

    SECTION("Fewer than two fragments returns the input") {
        REQUIRE(TextNormalizer::deobfuscateConcatenation(R"(say "hello")") == R"(say "hello")");
        REQUIRE(TextNormalizer::deobfuscateConcatenation("no quotes here") == "no quotes here");
    }
}

TEST_CASE("TextNormalizer decodes base64 tokens carrying an address", "[TextNormalizer]") {
    SECTION("Token decoding to an address") {
        auto decoded = TextNormalizer::tryDecodeBase64("Y29udGFjdEBleGFtcGxlLmNvbQ==");
        REQUIRE(decoded.has_value());
        REQUIRE(*decoded == "contact@example.com");
    }

    SECTION("Decoded text without '@' is discarded") {
        REQUIRE_FALSE(TextNormalizer::tryDecodeBase64("SGVsbG8gV29ybGQ=").has_value());
    }

    SECTION("Invalid tokens never throw") {
        REQUIRE_FALSE(TextNormalizer::tryDecodeBase64("").has_value());
        REQUIRE_FALSE(TextNormalizer::tryDecodeBase64("abc").has_value());
        REQUIRE_FALSE(TextNormalizer::tryDecodeBase64("!!!!").has_value());
    }

    SECTION("Unpadded token whose length is not a multiple of four") {
        REQUIRE_FALSE(TextNormalizer::tryDecodeBase64("Y29udGFjdEBleGFtcGxlLmNvbQ").has_value());
    }
}
