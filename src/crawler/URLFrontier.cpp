#include "URLFrontier.h"
#include "../../include/Logger.h"
#include "../../include/mailsift/common/Url.h"

#include <algorithm>

namespace mailsift::crawler {

URLFrontier::URLFrontier() {
    LOG_TRACE("URLFrontier constructor called");
}

URLFrontier::~URLFrontier() {
    LOG_TRACE("URLFrontier destructor called");
}

bool URLFrontier::addURL(const std::string& url, size_t depth) {
    std::string normalizedURL = normalizeURL(url);
    if (normalizedURL.empty()) {
        LOG_DEBUG("Rejecting unparsable URL: " + url);
        return false;
    }

    if (visitedURLs.count(normalizedURL) > 0) {
        LOG_TRACE("URL already visited, skipping: " + normalizedURL);
        return false;
    }
    if (!queuedURLs.insert(normalizedURL).second) {
        LOG_TRACE("URL already queued, skipping: " + normalizedURL);
        return false;
    }

    queue.push_back(FrontierEntry{normalizedURL, depth});
    LOG_DEBUG("Queued " + normalizedURL + " at depth " + std::to_string(depth) +
              ", queue size: " + std::to_string(queue.size()));
    return true;
}

std::vector<FrontierEntry> URLFrontier::nextBatch(size_t maxCount) {
    std::vector<FrontierEntry> batch;
    batch.reserve(std::min(maxCount, queue.size()));

    while (batch.size() < maxCount && !queue.empty()) {
        FrontierEntry entry = std::move(queue.front());
        queue.pop_front();
        queuedURLs.erase(entry.url);
        batch.push_back(std::move(entry));
    }

    LOG_TRACE("URLFrontier::nextBatch - took " + std::to_string(batch.size()) +
              ", remaining: " + std::to_string(queue.size()));
    return batch;
}

bool URLFrontier::isEmpty() const {
    return queue.empty();
}

size_t URLFrontier::size() const {
    return queue.size();
}

void URLFrontier::markVisited(const std::string& url) {
    std::string normalizedURL = normalizeURL(url);
    if (normalizedURL.empty()) {
        // Keep the raw form so an unparsable entry still counts once
        normalizedURL = common::sanitizeUrl(url);
    }
    if (visitedURLs.insert(normalizedURL).second) {
        LOG_TRACE("Marked URL as visited: " + normalizedURL + ", visited count: " + std::to_string(visitedURLs.size()));
    }
}

bool URLFrontier::isVisited(const std::string& url) const {
    std::string normalizedURL = normalizeURL(url);
    if (normalizedURL.empty()) {
        normalizedURL = common::sanitizeUrl(url);
    }
    return visitedURLs.count(normalizedURL) > 0;
}

bool URLFrontier::isQueued(const std::string& url) const {
    return queuedURLs.count(normalizeURL(url)) > 0;
}

size_t URLFrontier::visitedCount() const {
    return visitedURLs.size();
}

std::string URLFrontier::normalizeURL(const std::string& url) {
    return common::normalizeUrl(url);
}

} // namespace mailsift::crawler
