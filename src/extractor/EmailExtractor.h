#pragma once

#include <set>
#include <string>
#include <gumbo.h>

namespace mailsift::extractor {

class EmailExtractor {
public:
    // Canonical address pattern; matched case-insensitively, results lowercased
    static constexpr const char* kEmailPattern = R"([A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,})";

    // Shortest base64 token considered a hidden address
    static constexpr size_t kMinBase64TokenLength = 20;

    // RFC 5321 limits; longer runs around an '@' are not addresses
    static constexpr size_t kMaxLocalPartLength = 64;
    static constexpr size_t kMaxDomainLength = 253;

    EmailExtractor();
    ~EmailExtractor();

    // Union of every strategy: raw markup scan, text nodes, attribute values
    // (mailto: targets taken whole) and inline script bodies. Never throws.
    std::set<std::string> extractEmails(const std::string& html, const std::string& pageUrl) const;

    // Add every canonical match in text, lowercased, to out
    static void matchCanonical(const std::string& text, std::set<std::string>& out);

    // Whole-string canonical match, case-insensitive
    static bool isCanonicalEmail(const std::string& candidate);

private:
    // Raw text, its normalized form, its concatenation-deobfuscated form and
    // any base64 tokens it carries
    void scanSurface(const std::string& text, std::set<std::string>& out) const;

    void scanBase64Tokens(const std::string& text, std::set<std::string>& out) const;

    void scanAttributes(const GumboNode* node, std::set<std::string>& out) const;

    void scanScript(const GumboNode* node, std::set<std::string>& out) const;

    void addMailtoTargets(const std::string& href, std::set<std::string>& out) const;

    void walkDocument(const GumboNode* root, std::set<std::string>& out) const;
};

} // namespace mailsift::extractor
