#pragma once

#include <memory>
#include <set>
#include <string>
#include <vector>
#include "../../include/mailsift/crawler/CancellationToken.h"
#include "../../include/mailsift/crawler/IPageFetcher.h"
#include "../../include/mailsift/crawler/models/CrawlConfig.h"
#include "../../include/mailsift/crawler/models/CrawlResult.h"
#include "../../include/mailsift/crawler/models/ProgressEvent.h"

namespace mailsift::extractor {
class EmailExtractor;
}

namespace mailsift::crawler {

class URLFrontier;
class FetchTransport;
class LinkExtractor;
struct FrontierEntry;

// Breadth-first, same-host crawl that collects email addresses. Pages are
// fetched in batches of up to config.concurrency; cancellation and the page
// budget are checked between batches.
class Crawler {
public:
    // Throws std::invalid_argument for maxPages == 0, concurrency == 0, an
    // empty access route list or a negative duration. With no fetcher, a libcurl PageFetcher is built
    // from the config.
    explicit Crawler(const CrawlConfig& config, std::shared_ptr<IPageFetcher> fetcher = nullptr);
    ~Crawler();

    Crawler(const Crawler&) = delete;
    Crawler& operator=(const Crawler&) = delete;

    // Called on the crawling thread after every page and batch
    void setProgressCallback(ProgressCallback callback);

    // Run one crawl to completion or cancellation. Throws InvalidUrlError when
    // the start URL is not a usable http(s) URL.
    CrawlResult crawl(CancellationToken& token);

    // Run one crawl observing the token raised by stop()
    CrawlResult crawl();

    // Stop a crawl started with crawl() at the next batch boundary. A stopped
    // Crawler stays stopped.
    void stop();

    const CrawlConfig& getConfig() const { return config; }

private:
    // What one fetch-and-extract unit produced; built off the control thread
    struct PageOutcome {
        bool success = false;
        // Fetched, but a redirect left the start host; nothing was extracted
        bool redirectedOffHost = false;
        std::string effectiveUrl;
        std::set<std::string> emails;
        std::vector<std::string> links;
        std::string error;
    };

    PageOutcome processPage(const FrontierEntry& entry) const;

    bool isSameHost(const std::string& url) const;

    ProgressEvent makeEvent(ProgressEventType type, const std::string& url, size_t depth,
                            size_t visited, size_t emailsFound, const std::string& message) const;

    void notify(const ProgressEvent& event) const;

    static int percentOf(size_t visited, size_t maxPages);

    CrawlConfig config;
    std::shared_ptr<IPageFetcher> fetcher;
    std::unique_ptr<FetchTransport> transport;
    std::unique_ptr<LinkExtractor> linkExtractor;
    std::unique_ptr<extractor::EmailExtractor> emailExtractor;
    ProgressCallback progressCallback;
    CancellationToken stopToken;
    std::string startHost;
};

} // namespace mailsift::crawler
