#pragma once

#include <string>
#include <vector>
#include <gumbo.h>

namespace mailsift::crawler {

class LinkExtractor {
public:
    LinkExtractor();
    ~LinkExtractor();

    // Absolute http(s) URLs of every <a href> in document order, duplicates kept.
    // Empty, mailto: and javascript: hrefs are skipped; so is anything that does
    // not resolve against baseUrl. Returns an empty list if parsing fails.
    std::vector<std::string> extractLinks(const std::string& html, const std::string& baseUrl);

    // True for absolute http(s) URLs with a host
    bool isValidUrl(const std::string& url);

private:
    void extractLinksFromNode(const GumboNode* node, const std::string& baseUrl, std::vector<std::string>& links);

    // Hrefs that never name a crawlable page
    static bool isIgnoredHref(const std::string& href);
};

} // namespace mailsift::crawler
