#pragma once

#include <string>
#include <chrono>
#include <vector>

namespace mailsift::crawler {

// One way of reaching a target page. In urlTemplate, "{url}" is replaced by the
// percent-encoded target and "{raw}" by the target as-is.
struct AccessRoute {
    std::string name;
    std::string urlTemplate;

    // Concrete request URL for target
    std::string apply(const std::string& target) const;

    // Requests the target itself, so redirects seen by the fetcher are the site's own
    bool isDirect() const;
};

// Direct fetch first, then two public pass-through proxies
std::vector<AccessRoute> defaultAccessRoutes();

struct CrawlConfig {
    // Where the crawl starts; a URL without an http(s) prefix gets https://
    std::string startUrl;

    // Link hops followed from the start page (0 = start page only)
    size_t maxDepth = 2;

    // Upper bound on visited URLs, skipped foreign links included
    size_t maxPages = 50;

    // Pages fetched in parallel per batch
    size_t concurrency = 4;

    // Pause between batches
    std::chrono::milliseconds interBatchDelay{500};

    std::string userAgent = "mailsift/1.0";

    // Timeout for a whole request through one route
    std::chrono::milliseconds requestTimeout{15000};

    std::chrono::milliseconds connectTimeout{10000};

    bool followRedirects = true;

    size_t maxRedirects = 5;

    bool verifySSL = true;

    // Tried in order for every page until one returns 2xx
    std::vector<AccessRoute> accessRoutes = defaultAccessRoutes();
};

} // namespace mailsift::crawler
