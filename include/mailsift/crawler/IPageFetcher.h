#pragma once

#include <string>

namespace mailsift::crawler {

struct PageFetchResult {
    bool success = false;
    int statusCode = 0;
    std::string contentType;
    std::string content;
    std::string errorMessage;
    std::string finalUrl;  // After redirects
};

// Single HTTP GET capability. Implementations must allow concurrent fetch() calls.
class IPageFetcher {
public:
    virtual ~IPageFetcher() = default;

    // success is true only for a 2xx response
    virtual PageFetchResult fetch(const std::string& url) = 0;
};

} // namespace mailsift::crawler
