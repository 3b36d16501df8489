#include "PageFetcher.h"
#include "../../include/Logger.h"
#include "../../include/mailsift/common/Url.h"

#include <memory>
#include <mutex>
#include <stdexcept>

namespace mailsift::crawler {

namespace {

struct CurlEasyDeleter {
    void operator()(CURL* handle) const {
        if (handle) {
            curl_easy_cleanup(handle);
        }
    }
};

struct CurlSlistDeleter {
    void operator()(curl_slist* list) const {
        if (list) {
            curl_slist_free_all(list);
        }
    }
};

} // namespace

PageFetcher::PageFetcher(const std::string& userAgent,
                         std::chrono::milliseconds timeout,
                         bool followRedirects,
                         size_t maxRedirects)
    : userAgent(userAgent)
    , timeout(timeout)
    , connectTimeout(10000)
    , followRedirects(followRedirects)
    , maxRedirects(maxRedirects)
    , verifySSL(true) {
    LOG_DEBUG("PageFetcher constructor called with userAgent: " + userAgent);
    ensureCurlGlobalInit();
}

PageFetcher::~PageFetcher() {
    LOG_TRACE("PageFetcher destructor called");
}

void PageFetcher::ensureCurlGlobalInit() {
    static std::once_flag initFlag;
    std::call_once(initFlag, [] {
        CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            LOG_ERROR("curl_global_init failed: " + std::string(curl_easy_strerror(rc)));
            throw std::runtime_error("Failed to initialize libcurl");
        }
        LOG_DEBUG("libcurl initialized: " + std::string(curl_version()));
    });
}

PageFetchResult PageFetcher::fetch(const std::string& url) {
    const std::string cleanedUrl = common::sanitizeUrl(url);
    LOG_DEBUG("PageFetcher::fetch called for URL: " + cleanedUrl);
    PageFetchResult result;

    std::unique_ptr<CURL, CurlEasyDeleter> curl(curl_easy_init());
    if (!curl) {
        result.errorMessage = "Failed to create CURL handle";
        LOG_ERROR("Error: " + result.errorMessage);
        return result;
    }

    char errbuf[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(curl.get(), CURLOPT_URL, cleanedUrl.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_PROTOCOLS, CURLPROTO_HTTP | CURLPROTO_HTTPS);
    curl_easy_setopt(curl.get(), CURLOPT_REDIR_PROTOCOLS, CURLPROTO_HTTP | CURLPROTO_HTTPS);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, userAgent.c_str());
    // libcurl refuses negative timeouts; fail the fetch rather than run unbounded
    CURLcode timeoutSet = curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    if (timeoutSet == CURLE_OK) {
        timeoutSet = curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(connectTimeout.count()));
    }
    if (timeoutSet != CURLE_OK) {
        result.errorMessage = "Invalid timeout: " + std::string(curl_easy_strerror(timeoutSet));
        LOG_ERROR("Error: " + result.errorMessage);
        return result;
    }
    // Worker threads must not receive SIGALRM from the resolver
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, followRedirects ? 1L : 0L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, static_cast<long>(maxRedirects));
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, verifySSL ? 1L : 0L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, verifySSL ? 2L : 0L);
    // Let libcurl advertise and decode every compression it supports
    curl_easy_setopt(curl.get(), CURLOPT_ACCEPT_ENCODING, "");

    std::unique_ptr<curl_slist, CurlSlistDeleter> headers;
    for (const auto& header : customHeaders) {
        std::string headerStr = header.first + ": " + header.second;
        LOG_TRACE("Adding custom header: " + headerStr);
        curl_slist* appended = curl_slist_append(headers.get(), headerStr.c_str());
        if (!appended) {
            LOG_WARNING("Could not add header: " + header.first);
            continue;
        }
        headers.release();
        headers.reset(appended);
    }
    if (headers) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    }

    std::string responseData;
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &responseData);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        result.errorMessage = std::string(curl_easy_strerror(res));
        if (errbuf[0] != '\0') {
            result.errorMessage += " | " + std::string(errbuf);
        }
        LOG_WARNING("CURL error for " + cleanedUrl + ": " + result.errorMessage);
        return result;
    }

    long statusCode = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &statusCode);
    result.statusCode = static_cast<int>(statusCode);

    char* contentType = nullptr;
    curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_TYPE, &contentType);
    if (contentType) {
        result.contentType = contentType;
    }

    char* finalUrl = nullptr;
    curl_easy_getinfo(curl.get(), CURLINFO_EFFECTIVE_URL, &finalUrl);
    if (finalUrl) {
        result.finalUrl = finalUrl;
    }

    result.content = std::move(responseData);
    result.success = (result.statusCode >= 200 && result.statusCode < 300);

    if (result.success) {
        LOG_DEBUG("HTTP " + std::to_string(result.statusCode) + " for " + cleanedUrl +
                  ", content size: " + std::to_string(result.content.size()) + " bytes");
    } else {
        result.errorMessage = "HTTP status " + std::to_string(result.statusCode);
        LOG_WARNING("HTTP " + std::to_string(result.statusCode) + " for " + cleanedUrl);
    }

    return result;
}

void PageFetcher::setConnectTimeout(std::chrono::milliseconds value) {
    connectTimeout = value;
}

void PageFetcher::setCustomHeaders(const std::vector<std::pair<std::string, std::string>>& headers) {
    LOG_DEBUG("PageFetcher::setCustomHeaders called with " + std::to_string(headers.size()) + " headers");
    customHeaders = headers;
}

void PageFetcher::setVerifySSL(bool verify) {
    verifySSL = verify;
}

size_t PageFetcher::writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* responseData = static_cast<std::string*>(userp);
    size_t totalSize = size * nmemb;
    responseData->append(static_cast<char*>(contents), totalSize);
    return totalSize;
}

} // namespace mailsift::crawler
