#pragma once

#include <chrono>
#include <set>
#include <string>

namespace mailsift::crawler {

enum class CrawlStatus {
    COMPLETED,  // frontier drained or page budget used up
    CANCELLED   // stopped at a batch boundary on request
};

std::string toString(CrawlStatus status);

struct CrawlResult {
    // Normalized start URL
    std::string startUrl;

    // Lowercased addresses found on every successfully fetched page
    std::set<std::string> emails;

    CrawlStatus status = CrawlStatus::COMPLETED;

    // URLs that consumed page budget (fetched + failed + skipped)
    size_t pagesVisited = 0;

    size_t pagesFetched = 0;

    // Every access route failed
    size_t pagesFailed = 0;

    // Foreign-host links recorded but never fetched
    size_t pagesSkipped = 0;

    std::chrono::milliseconds elapsed{0};
};

} // namespace mailsift::crawler
