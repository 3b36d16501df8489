#include "FetchTransport.h"
#include "../../include/Logger.h"
#include "../../include/mailsift/common/Url.h"
#include "../../include/mailsift/crawler/CrawlErrors.h"

#include <stdexcept>

namespace mailsift::crawler {

namespace {

void replaceAll(std::string& text, const std::string& token, const std::string& value) {
    size_t pos = 0;
    while ((pos = text.find(token, pos)) != std::string::npos) {
        text.replace(pos, token.size(), value);
        pos += value.size();
    }
}

} // namespace

std::string AccessRoute::apply(const std::string& target) const {
    std::string requestUrl = urlTemplate;
    replaceAll(requestUrl, "{url}", common::encodeComponent(target));
    replaceAll(requestUrl, "{raw}", target);
    return requestUrl;
}

bool AccessRoute::isDirect() const {
    return urlTemplate == "{raw}";
}

std::vector<AccessRoute> defaultAccessRoutes() {
    return {
        {"direct", "{raw}"},
        {"allorigins", "https://api.allorigins.win/raw?url={url}"},
        {"corsproxy", "https://corsproxy.io/?url={url}"},
    };
}

FetchTransport::FetchTransport(std::shared_ptr<IPageFetcher> fetcher, std::vector<AccessRoute> routes)
    : fetcher_(std::move(fetcher))
    , routes_(std::move(routes)) {
    if (!fetcher_) {
        throw std::invalid_argument("FetchTransport requires a page fetcher");
    }
    if (routes_.empty()) {
        throw std::invalid_argument("FetchTransport requires at least one access route");
    }
    LOG_DEBUG("FetchTransport configured with " + std::to_string(routes_.size()) + " access routes");
}

std::string FetchTransport::fetch(const std::string& targetUrl) {
    return fetchPage(targetUrl).content;
}

FetchedPage FetchTransport::fetchPage(const std::string& targetUrl) {
    std::string lastError = "no route attempted";

    for (const auto& route : routes_) {
        const std::string requestUrl = route.apply(targetUrl);
        LOG_DEBUG("Fetching " + targetUrl + " via route '" + route.name + "'");

        PageFetchResult result;
        try {
            result = fetcher_->fetch(requestUrl);
        } catch (const std::exception& e) {
            result.success = false;
            result.errorMessage = e.what();
        }

        if (result.success) {
            LOG_DEBUG("Route '" + route.name + "' succeeded for " + targetUrl +
                      " (" + std::to_string(result.content.size()) + " bytes)");
            FetchedPage page;
            page.content = std::move(result.content);
            page.effectiveUrl = route.isDirect() && !result.finalUrl.empty() ? result.finalUrl : targetUrl;
            page.routeName = route.name;
            if (page.effectiveUrl != targetUrl) {
                LOG_DEBUG("Redirected: " + targetUrl + " -> " + page.effectiveUrl);
            }
            return page;
        }

        lastError = route.name + ": " +
                    (result.errorMessage.empty() ? "HTTP status " + std::to_string(result.statusCode)
                                                 : result.errorMessage);
        LOG_WARNING("Route '" + route.name + "' failed for " + targetUrl + " (" + lastError + "), trying next route");
    }

    throw TransportExhaustedError(targetUrl, lastError);
}

} // namespace mailsift::crawler
