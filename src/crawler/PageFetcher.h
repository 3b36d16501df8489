#pragma once

#include <string>
#include <vector>
#include <utility>
#include <chrono>
#include <curl/curl.h>
#include "../../include/mailsift/crawler/IPageFetcher.h"

namespace mailsift::crawler {

// libcurl-backed GET. Every fetch() uses its own easy handle, so one instance
// can serve a whole batch concurrently.
class PageFetcher : public IPageFetcher {
public:
    PageFetcher(const std::string& userAgent,
                std::chrono::milliseconds timeout,
                bool followRedirects = true,
                size_t maxRedirects = 5);
    ~PageFetcher() override;

    PageFetchResult fetch(const std::string& url) override;

    void setConnectTimeout(std::chrono::milliseconds connectTimeout);

    void setCustomHeaders(const std::vector<std::pair<std::string, std::string>>& headers);

    void setVerifySSL(bool verify);

private:
    // curl_global_init is not thread-safe; run it once per process
    static void ensureCurlGlobalInit();

    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);

    std::string userAgent;
    std::chrono::milliseconds timeout;
    std::chrono::milliseconds connectTimeout;
    bool followRedirects;
    size_t maxRedirects;
    std::vector<std::pair<std::string, std::string>> customHeaders;
    bool verifySSL;
};

} // namespace mailsift::crawler
