#pragma once

#include <memory>
#include <string>
#include <vector>
#include "../../include/mailsift/crawler/IPageFetcher.h"
#include "../../include/mailsift/crawler/models/CrawlConfig.h"

namespace mailsift::crawler {

struct FetchedPage {
    std::string content;
    // Where the body came from after redirects. Only a direct route reports
    // redirects; pass-through routes answer with the target URL.
    std::string effectiveUrl;
    std::string routeName;
};

// Retrieves a page through an ordered list of access routes. Routes are tried
// strictly in order, once each; the first 2xx body wins.
class FetchTransport {
public:
    // Throws std::invalid_argument when fetcher is null or routes is empty
    FetchTransport(std::shared_ptr<IPageFetcher> fetcher, std::vector<AccessRoute> routes);

    // Body of the first successful route. Throws TransportExhaustedError carrying
    // the target URL and the last failure when every route fails.
    std::string fetch(const std::string& targetUrl);

    // As fetch(), also reporting the route used and the effective URL
    FetchedPage fetchPage(const std::string& targetUrl);

    const std::vector<AccessRoute>& routes() const { return routes_; }

private:
    std::shared_ptr<IPageFetcher> fetcher_;
    std::vector<AccessRoute> routes_;
};

} // namespace mailsift::crawler
