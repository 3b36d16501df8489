#include "LinkExtractor.h"
#include "../../include/Logger.h"
#include "../../include/mailsift/common/Url.h"

#include <algorithm>
#include <cctype>

namespace mailsift::crawler {

LinkExtractor::LinkExtractor() {
    LOG_TRACE("LinkExtractor constructor called");
}

LinkExtractor::~LinkExtractor() {
    LOG_TRACE("LinkExtractor destructor called");
}

std::vector<std::string> LinkExtractor::extractLinks(const std::string& html, const std::string& baseUrl) {
    LOG_DEBUG("LinkExtractor::extractLinks called for URL: " + baseUrl + " with HTML length: " + std::to_string(html.length()) + " bytes");
    std::vector<std::string> links;
    GumboOutput* output = gumbo_parse_with_options(&kGumboDefaultOptions, html.data(), html.size());

    if (output) {
        extractLinksFromNode(output->root, baseUrl, links);
        gumbo_destroy_output(&kGumboDefaultOptions, output);
        LOG_DEBUG("Extracted " + std::to_string(links.size()) + " links from " + baseUrl);
    } else {
        LOG_WARNING("Failed to parse HTML for link extraction: " + baseUrl);
    }

    return links;
}

void LinkExtractor::extractLinksFromNode(const GumboNode* node, const std::string& baseUrl, std::vector<std::string>& links) {
    if (node->type != GUMBO_NODE_ELEMENT && node->type != GUMBO_NODE_TEMPLATE) {
        return;
    }

    if (node->v.element.tag == GUMBO_TAG_A) {
        GumboAttribute* href = gumbo_get_attribute(&node->v.element.attributes, "href");
        if (href && href->value) {
            std::string value = common::sanitizeUrl(href->value);
            if (!isIgnoredHref(value)) {
                auto resolved = common::resolveUrl(baseUrl, value);
                if (resolved && isValidUrl(*resolved)) {
                    links.push_back(*resolved);
                } else {
                    LOG_TRACE("Dropping unresolvable href: " + value);
                }
            }
        }
    }

    for (unsigned int i = 0; i < node->v.element.children.length; ++i) {
        extractLinksFromNode(static_cast<GumboNode*>(node->v.element.children.data[i]), baseUrl, links);
    }
}

bool LinkExtractor::isIgnoredHref(const std::string& href) {
    if (href.empty()) {
        return true;
    }
    std::string prefix = href.substr(0, 11);
    std::transform(prefix.begin(), prefix.end(), prefix.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return prefix.rfind("mailto:", 0) == 0 || prefix.rfind("javascript:", 0) == 0;
}

bool LinkExtractor::isValidUrl(const std::string& url) {
    return common::parseUrl(url).has_value();
}

} // namespace mailsift::crawler
