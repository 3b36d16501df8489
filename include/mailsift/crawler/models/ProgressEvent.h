#pragma once

#include <functional>
#include <string>

namespace mailsift::crawler {

enum class ProgressEventType {
    PAGE_FETCHED,
    PAGE_FAILED,
    PAGE_SKIPPED,
    BATCH_COMPLETED,
    CRAWL_FINISHED
};

std::string toString(ProgressEventType type);

struct ProgressEvent {
    ProgressEventType type = ProgressEventType::PAGE_FETCHED;

    // Empty for BATCH_COMPLETED and CRAWL_FINISHED
    std::string url;

    size_t depth = 0;

    // Visited URLs at the time of the event
    size_t visited = 0;

    size_t maxPages = 0;

    // min(visited / maxPages * 100, 100); exactly 100 on CRAWL_FINISHED
    int percent = 0;

    // Distinct addresses collected so far
    size_t emailsFound = 0;

    std::string message;
};

using ProgressCallback = std::function<void(const ProgressEvent&)>;

} // namespace mailsift::crawler
