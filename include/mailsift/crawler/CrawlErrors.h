#pragma once

#include <stdexcept>
#include <string>

namespace mailsift::crawler {

// The start URL is empty, does not parse, or is not http(s)
class InvalidUrlError : public std::runtime_error {
public:
    explicit InvalidUrlError(const std::string& url)
        : std::runtime_error("Invalid URL: '" + url + "'")
        , url_(url) {}

    const std::string& url() const { return url_; }

private:
    std::string url_;
};

// Every access route failed for one page
class TransportExhaustedError : public std::runtime_error {
public:
    TransportExhaustedError(const std::string& targetUrl, const std::string& lastError)
        : std::runtime_error("All access routes failed for " + targetUrl + ": " + lastError)
        , targetUrl_(targetUrl)
        , lastError_(lastError) {}

    const std::string& targetUrl() const { return targetUrl_; }
    const std::string& lastError() const { return lastError_; }

private:
    std::string targetUrl_;
    std::string lastError_;
};

} // namespace mailsift::crawler
