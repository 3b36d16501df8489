#include "Crawler.h"
#include "URLFrontier.h"
#include "PageFetcher.h"
#include "FetchTransport.h"
#include "LinkExtractor.h"
#include "../extractor/EmailExtractor.h"
#include "../../include/Logger.h"
#include "../../include/mailsift/common/Url.h"
#include "../../include/mailsift/crawler/CrawlErrors.h"
#include "../../include/mailsift/crawler/CrawlLogger.h"

#include <algorithm>
#include <chrono>
#include <future>
#include <stdexcept>

namespace mailsift::crawler {

std::string toString(CrawlStatus status) {
    switch (status) {
        case CrawlStatus::COMPLETED: return "completed";
        case CrawlStatus::CANCELLED: return "cancelled";
    }
    return "unknown";
}

std::string toString(ProgressEventType type) {
    switch (type) {
        case ProgressEventType::PAGE_FETCHED: return "page_fetched";
        case ProgressEventType::PAGE_FAILED: return "page_failed";
        case ProgressEventType::PAGE_SKIPPED: return "page_skipped";
        case ProgressEventType::BATCH_COMPLETED: return "batch_completed";
        case ProgressEventType::CRAWL_FINISHED: return "crawl_finished";
    }
    return "unknown";
}

Crawler::Crawler(const CrawlConfig& config, std::shared_ptr<IPageFetcher> fetcher)
    : config(config)
    , fetcher(std::move(fetcher)) {
    LOG_DEBUG("Crawler constructor called");

    if (config.maxPages == 0) {
        throw std::invalid_argument("maxPages must be at least 1");
    }
    if (config.concurrency == 0) {
        throw std::invalid_argument("concurrency must be at least 1");
    }
    if (config.accessRoutes.empty()) {
        throw std::invalid_argument("at least one access route is required");
    }
    if (config.requestTimeout.count() < 0 || config.connectTimeout.count() < 0 ||
        config.interBatchDelay.count() < 0) {
        throw std::invalid_argument("timeouts and the inter-batch delay cannot be negative");
    }

    if (!this->fetcher) {
        auto pageFetcher = std::make_shared<PageFetcher>(
            config.userAgent,
            config.requestTimeout,
            config.followRedirects,
            config.maxRedirects
        );
        pageFetcher->setConnectTimeout(config.connectTimeout);
        pageFetcher->setVerifySSL(config.verifySSL);
        this->fetcher = std::move(pageFetcher);
    }

    transport = std::make_unique<FetchTransport>(this->fetcher, config.accessRoutes);
    linkExtractor = std::make_unique<LinkExtractor>();
    emailExtractor = std::make_unique<extractor::EmailExtractor>();
}

Crawler::~Crawler() {
    LOG_DEBUG("Crawler destructor called");
}

void Crawler::setProgressCallback(ProgressCallback callback) {
    progressCallback = std::move(callback);
}

CrawlResult Crawler::crawl() {
    return crawl(stopToken);
}

void Crawler::stop() {
    LOG_INFO("Stopping crawler");
    stopToken.cancel();
}

CrawlResult Crawler::crawl(CancellationToken& token) {
    const auto startedAt = std::chrono::steady_clock::now();

    const std::string startUrl = common::normalizeUrl(common::ensureScheme(common::sanitizeUrl(config.startUrl)));
    if (startUrl.empty()) {
        LOG_ERROR("Rejecting start URL: '" + config.startUrl + "'");
        throw InvalidUrlError(config.startUrl);
    }
    startHost = common::extractHost(startUrl);

    URLFrontier frontier;
    frontier.addURL(startUrl, 0);

    CrawlResult result;
    result.startUrl = startUrl;

    CrawlLogger::broadcastLog("Starting crawl of " + startUrl + " (max depth " + std::to_string(config.maxDepth) +
                              ", max pages " + std::to_string(config.maxPages) + ", concurrency " +
                              std::to_string(config.concurrency) + ")", "info");

    struct Dispatched {
        FrontierEntry entry;
        bool foreign = false;
        std::future<PageOutcome> outcome;
    };

    size_t batchNumber = 0;
    while (true) {
        if (token.isCancelled()) {
            result.status = CrawlStatus::CANCELLED;
            CrawlLogger::broadcastLog("Crawl cancelled after " + std::to_string(result.pagesVisited) + " pages", "warning");
            break;
        }
        if (frontier.isEmpty() || frontier.visitedCount() >= config.maxPages) {
            break;
        }

        std::vector<FrontierEntry> batch = frontier.nextBatch(config.concurrency);
        ++batchNumber;
        LOG_DEBUG("Dispatching batch " + std::to_string(batchNumber) + " with " + std::to_string(batch.size()) + " entries");

        // Budget is reserved here so that the visited set never outgrows maxPages
        std::vector<Dispatched> dispatched;
        dispatched.reserve(batch.size());
        for (auto& entry : batch) {
            if (frontier.isVisited(entry.url)) {
                LOG_DEBUG("Already visited, skipping: " + entry.url);
                continue;
            }
            if (frontier.visitedCount() >= config.maxPages) {
                LOG_DEBUG("Page budget exhausted, dropping: " + entry.url);
                continue;
            }
            frontier.markVisited(entry.url);

            Dispatched unit;
            unit.entry = std::move(entry);
            unit.foreign = !isSameHost(unit.entry.url);
            if (!unit.foreign) {
                unit.outcome = std::async(std::launch::async, &Crawler::processPage, this, unit.entry);
            }
            dispatched.push_back(std::move(unit));
        }

        // Merge in batch order on this thread
        for (auto& unit : dispatched) {
            ++result.pagesVisited;
            const FrontierEntry& entry = unit.entry;

            if (unit.foreign) {
                ++result.pagesSkipped;
                LOG_DEBUG("External link recorded, not fetched: " + entry.url);
                notify(makeEvent(ProgressEventType::PAGE_SKIPPED, entry.url, entry.depth,
                                 result.pagesVisited, result.emails.size(), "External link skipped"));
                continue;
            }

            PageOutcome outcome = unit.outcome.get();
            if (outcome.redirectedOffHost) {
                ++result.pagesSkipped;
                LOG_DEBUG("Redirect left the start host, not mined: " + entry.url + " -> " + outcome.effectiveUrl);
                notify(makeEvent(ProgressEventType::PAGE_SKIPPED, entry.url, entry.depth,
                                 result.pagesVisited, result.emails.size(),
                                 "Redirected to external host " + common::extractHost(outcome.effectiveUrl)));
                continue;
            }
            if (!outcome.success) {
                ++result.pagesFailed;
                CrawlLogger::broadcastLog("Failed to fetch " + entry.url + ": " + outcome.error, "error");
                notify(makeEvent(ProgressEventType::PAGE_FAILED, entry.url, entry.depth,
                                 result.pagesVisited, result.emails.size(), outcome.error));
                continue;
            }

            ++result.pagesFetched;
            const size_t emailsBefore = result.emails.size();
            result.emails.insert(outcome.emails.begin(), outcome.emails.end());
            const size_t newEmails = result.emails.size() - emailsBefore;

            size_t queued = 0;
            if (entry.depth < config.maxDepth) {
                for (const auto& link : outcome.links) {
                    if (frontier.addURL(link, entry.depth + 1)) {
                        ++queued;
                    }
                }
            }

            std::string message = "Fetched " + entry.url + " (depth " + std::to_string(entry.depth) + "): " +
                                  std::to_string(newEmails) + " new emails, " + std::to_string(queued) + " links queued";
            CrawlLogger::broadcastLog(message, "info");
            notify(makeEvent(ProgressEventType::PAGE_FETCHED, entry.url, entry.depth,
                             result.pagesVisited, result.emails.size(), message));
        }

        notify(makeEvent(ProgressEventType::BATCH_COMPLETED, "", 0, result.pagesVisited, result.emails.size(),
                         "Batch " + std::to_string(batchNumber) + " completed"));

        const bool moreWork = !frontier.isEmpty() && frontier.visitedCount() < config.maxPages;
        if (moreWork && config.interBatchDelay.count() > 0) {
            if (token.waitFor(config.interBatchDelay)) {
                LOG_DEBUG("Inter-batch delay interrupted by cancellation");
            }
        }
    }

    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startedAt);

    CrawlLogger::broadcastLog("Crawl " + toString(result.status) + ": " + std::to_string(result.pagesVisited) +
                              " pages visited (" + std::to_string(result.pagesFetched) + " fetched, " +
                              std::to_string(result.pagesFailed) + " failed, " + std::to_string(result.pagesSkipped) +
                              " skipped), " + std::to_string(result.emails.size()) + " emails found in " +
                              std::to_string(result.elapsed.count()) + " ms", "info");

    ProgressEvent finished = makeEvent(ProgressEventType::CRAWL_FINISHED, "", 0, result.pagesVisited,
                                       result.emails.size(), "Crawl " + toString(result.status));
    finished.percent = 100;
    notify(finished);

    return result;
}

Crawler::PageOutcome Crawler::processPage(const FrontierEntry& entry) const {
    PageOutcome outcome;
    try {
        FetchedPage page = transport->fetchPage(entry.url);
        outcome.effectiveUrl = page.effectiveUrl;
        if (!isSameHost(page.effectiveUrl)) {
            outcome.redirectedOffHost = true;
            return outcome;
        }
        outcome.emails = emailExtractor->extractEmails(page.content, page.effectiveUrl);
        if (entry.depth < config.maxDepth) {
            // Relative links are relative to where the body actually came from
            outcome.links = linkExtractor->extractLinks(page.content, page.effectiveUrl);
        }
        outcome.success = true;
    } catch (const TransportExhaustedError& e) {
        outcome.error = e.lastError();
    } catch (const std::exception& e) {
        outcome.error = e.what();
    }
    return outcome;
}

bool Crawler::isSameHost(const std::string& url) const {
    return common::extractHost(url) == startHost;
}

ProgressEvent Crawler::makeEvent(ProgressEventType type, const std::string& url, size_t depth,
                                 size_t visited, size_t emailsFound, const std::string& message) const {
    ProgressEvent event;
    event.type = type;
    event.url = url;
    event.depth = depth;
    event.visited = visited;
    event.maxPages = config.maxPages;
    event.percent = percentOf(visited, config.maxPages);
    event.emailsFound = emailsFound;
    event.message = message;
    return event;
}

void Crawler::notify(const ProgressEvent& event) const {
    LOG_TRACE("Progress " + toString(event.type) + " " + std::to_string(event.percent) + "%");
    if (progressCallback) {
        progressCallback(event);
    }
}

int Crawler::percentOf(size_t visited, size_t maxPages) {
    if (maxPages == 0) {
        return 100;
    }
    return static_cast<int>(std::min<size_t>(visited * 100 / maxPages, 100));
}

} // namespace mailsift::crawler
