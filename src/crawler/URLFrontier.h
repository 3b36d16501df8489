#pragma once

#include <deque>
#include <string>
#include <unordered_set>
#include <vector>

namespace mailsift::crawler {

struct FrontierEntry {
    std::string url;  // normalized
    size_t depth = 0; // link hops from the start URL

    bool operator==(const FrontierEntry& other) const { return url == other.url; }
};

// Breadth-first crawl queue with the visited set. Owned by one crawl and used
// only from its controlling thread; not thread-safe.
class URLFrontier {
public:
    URLFrontier();
    ~URLFrontier();

    // Queue url at depth. Returns false when the URL does not parse or was
    // already visited or queued.
    bool addURL(const std::string& url, size_t depth);

    // Remove up to maxCount entries from the front, in FIFO order
    std::vector<FrontierEntry> nextBatch(size_t maxCount);

    bool isEmpty() const;

    // Entries waiting in the queue
    size_t size() const;

    // Idempotent
    void markVisited(const std::string& url);

    bool isVisited(const std::string& url) const;

    bool isQueued(const std::string& url) const;

    size_t visitedCount() const;

    // Normalized form used as identity (see common::normalizeUrl)
    static std::string normalizeURL(const std::string& url);

private:
    std::deque<FrontierEntry> queue;

    // URLs currently in the queue, to reject duplicates in O(1)
    std::unordered_set<std::string> queuedURLs;

    std::unordered_set<std::string> visitedURLs;
};

} // namespace mailsift::crawler
