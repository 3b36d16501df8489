#include "EmailExtractor.h"
#include "TextNormalizer.h"
#include "../../include/Logger.h"

#include <algorithm>
#include <cctype>
#include <memory>
#include <regex>
#include <stdexcept>
#include <vector>

namespace mailsift::extractor {

namespace {

struct GumboOutputDeleter {
    void operator()(GumboOutput* output) const {
        if (output) {
            gumbo_destroy_output(&kGumboDefaultOptions, output);
        }
    }
};

using GumboDocument = std::unique_ptr<GumboOutput, GumboOutputDeleter>;

const std::regex& emailRegex() {
    static const std::regex pattern(EmailExtractor::kEmailPattern,
                                    std::regex::ECMAScript | std::regex::icase | std::regex::optimize);
    return pattern;
}

inline bool isLocalChar(unsigned char c) {
    return std::isalnum(c) || c == '.' || c == '_' || c == '%' || c == '+' || c == '-';
}

inline bool isDomainChar(unsigned char c) {
    return std::isalnum(c) || c == '.' || c == '-';
}

inline bool isBase64Char(unsigned char c) {
    return std::isalnum(c) || c == '+' || c == '/';
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    size_t end = s.size();
    while (start < end && std::isspace(static_cast<unsigned char>(s[start]))) start++;
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
    return s.substr(start, end - start);
}

bool isElementLike(const GumboNode* node) {
    return node->type == GUMBO_NODE_ELEMENT || node->type == GUMBO_NODE_TEMPLATE;
}

bool isTextLeaf(const GumboNode* node) {
    return node->type == GUMBO_NODE_TEXT || node->type == GUMBO_NODE_CDATA ||
           node->type == GUMBO_NODE_COMMENT;
}

} // namespace

EmailExtractor::EmailExtractor() {
    LOG_TRACE("EmailExtractor constructor called");
}

EmailExtractor::~EmailExtractor() {
    LOG_TRACE("EmailExtractor destructor called");
}

void EmailExtractor::matchCanonical(const std::string& text, std::set<std::string>& out) {
    // Regex work is confined to the run of address characters around each '@',
    // bounded by the RFC 5321 part lengths so the regex input stays short.
    size_t consumed = 0;
    size_t at = text.find('@');
    while (at != std::string::npos) {
        size_t start = at;
        while (start > consumed && isLocalChar(static_cast<unsigned char>(text[start - 1])) &&
               at - start <= kMaxLocalPartLength) {
            --start;
        }
        size_t end = at + 1;
        while (end < text.size() && isDomainChar(static_cast<unsigned char>(text[end])) &&
               end - at - 1 < kMaxDomainLength) {
            ++end;
        }

        if (at - start > kMaxLocalPartLength) {
            LOG_TRACE("Skipping oversized local part before '@' at offset " + std::to_string(at));
        } else if (start < at && end > at + 1) {
            const std::string window = text.substr(start, end - start);
            std::smatch match;
            if (std::regex_search(window, match, emailRegex())) {
                out.insert(toLower(match.str()));
                consumed = start + static_cast<size_t>(match.position(0) + match.length(0));
            }
        }

        at = text.find('@', at + 1);
    }
}

bool EmailExtractor::isCanonicalEmail(const std::string& candidate) {
    if (candidate.size() > kMaxLocalPartLength + 1 + kMaxDomainLength) {
        return false;
    }
    return std::regex_match(candidate, emailRegex());
}

std::set<std::string> EmailExtractor::extractEmails(const std::string& html, const std::string& pageUrl) const {
    LOG_DEBUG("EmailExtractor::extractEmails called for URL: " + pageUrl + " with HTML length: " + std::to_string(html.length()) + " bytes");
    std::set<std::string> emails;

    try {
        matchCanonical(html, emails);
        LOG_TRACE("Raw markup scan found " + std::to_string(emails.size()) + " addresses");

        GumboDocument document(gumbo_parse_with_options(&kGumboDefaultOptions, html.data(), html.size()));
        if (!document) {
            LOG_WARNING("Failed to parse HTML for email extraction, keeping raw scan results: " + pageUrl);
            return emails;
        }

        walkDocument(document->document, emails);
    } catch (const std::exception& e) {
        LOG_WARNING("Email extraction stopped early for " + pageUrl + ": " + e.what());
    }

    LOG_DEBUG("Extracted " + std::to_string(emails.size()) + " email addresses from " + pageUrl);
    return emails;
}

void EmailExtractor::walkDocument(const GumboNode* root, std::set<std::string>& out) const {
    // Explicit stack: deeply nested markup must not exhaust the call stack
    std::vector<const GumboNode*> pending{root};
    while (!pending.empty()) {
        const GumboNode* node = pending.back();
        pending.pop_back();

        if (isTextLeaf(node)) {
            if (node->v.text.text) {
                scanSurface(node->v.text.text, out);
            }
            continue;
        }
        if (node->type == GUMBO_NODE_DOCUMENT) {
            const GumboVector& children = node->v.document.children;
            for (unsigned int i = 0; i < children.length; ++i) {
                pending.push_back(static_cast<const GumboNode*>(children.data[i]));
            }
            continue;
        }
        if (!isElementLike(node)) {
            continue;
        }

        scanAttributes(node, out);
        if (node->v.element.tag == GUMBO_TAG_SCRIPT) {
            scanScript(node, out);
        }

        const GumboVector& children = node->v.element.children;
        for (unsigned int i = 0; i < children.length; ++i) {
            pending.push_back(static_cast<const GumboNode*>(children.data[i]));
        }
    }
}

void EmailExtractor::scanSurface(const std::string& text, std::set<std::string>& out) const {
    if (text.empty()) {
        return;
    }

    matchCanonical(text, out);
    matchCanonical(TextNormalizer::normalize(text), out);

    std::string joined = TextNormalizer::deobfuscateConcatenation(text);
    if (joined != text) {
        matchCanonical(joined, out);
    }

    scanBase64Tokens(text, out);
}

void EmailExtractor::scanBase64Tokens(const std::string& text, std::set<std::string>& out) const {
    size_t i = 0;
    while (i < text.size()) {
        if (!isBase64Char(static_cast<unsigned char>(text[i]))) {
            ++i;
            continue;
        }

        size_t end = i;
        while (end < text.size() && isBase64Char(static_cast<unsigned char>(text[end]))) {
            ++end;
        }
        for (int pad = 0; pad < 2 && end < text.size() && text[end] == '='; ++pad) {
            ++end;
        }

        if (end - i >= kMinBase64TokenLength) {
            if (auto decoded = TextNormalizer::tryDecodeBase64(text.substr(i, end - i))) {
                LOG_TRACE("Decoded base64 token carrying '@'");
                matchCanonical(*decoded, out);
            }
        }
        i = end;
    }
}

void EmailExtractor::scanAttributes(const GumboNode* node, std::set<std::string>& out) const {
    const GumboVector& attributes = node->v.element.attributes;
    for (unsigned int i = 0; i < attributes.length; ++i) {
        const auto* attribute = static_cast<const GumboAttribute*>(attributes.data[i]);
        if (!attribute->name || !attribute->value) {
            continue;
        }

        std::string value = attribute->value;
        if (std::string(attribute->name) == "href") {
            std::string trimmed = trim(value);
            if (toLower(trimmed.substr(0, 7)) == "mailto:") {
                addMailtoTargets(trimmed.substr(7), out);
                continue;
            }
        }
        scanSurface(value, out);
    }
}

void EmailExtractor::addMailtoTargets(const std::string& target, std::set<std::string>& out) const {
    std::string recipients = target.substr(0, target.find('?'));

    size_t start = 0;
    while (start <= recipients.size()) {
        size_t comma = recipients.find(',', start);
        if (comma == std::string::npos) {
            comma = recipients.size();
        }

        std::string address = toLower(trim(recipients.substr(start, comma - start)));
        if (isCanonicalEmail(address)) {
            out.insert(address);
        } else if (!address.empty()) {
            // Not a clean address (e.g. "Name <a@b.com>"): fall back to substring matching
            matchCanonical(address, out);
        }
        start = comma + 1;
    }
}

void EmailExtractor::scanScript(const GumboNode* node, std::set<std::string>& out) const {
    std::string body;
    const GumboVector& children = node->v.element.children;
    for (unsigned int i = 0; i < children.length; ++i) {
        const auto* child = static_cast<const GumboNode*>(children.data[i]);
        if ((child->type == GUMBO_NODE_TEXT || child->type == GUMBO_NODE_WHITESPACE) && child->v.text.text) {
            body += child->v.text.text;
        }
    }
    if (body.empty()) {
        return;
    }

    matchCanonical(TextNormalizer::normalize(body), out);
    matchCanonical(TextNormalizer::deobfuscateConcatenation(body), out);
}

} // namespace mailsift::extractor
