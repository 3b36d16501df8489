#include <catch2/catch_test_macros.hpp>
#include "FetchTransport.h"
#include "mailsift/crawler/CrawlErrors.h"

#include <map>
#include <stdexcept>
#include <vector>

using namespace mailsift::crawler;

namespace {

// Answers from a fixed table of request URLs and records every request
class ScriptedFetcher : public IPageFetcher {
public:
    std::map<std::string, PageFetchResult> responses;
    std::vector<std::string> requests;
    std::string throwOn;

    PageFetchResult fetch(const std::string& url) override {
        requests.push_back(url);
        if (!throwOn.empty() && url == throwOn) {
            throw std::runtime_error("connection reset");
        }
        auto it = responses.find(url);
        if (it != responses.end()) {
            return it->second;
        }
        PageFetchResult result;
        result.errorMessage = "Could not resolve host";
        return result;
    }
};

PageFetchResult ok(const std::string& body) {
    PageFetchResult result;
    result.success = true;
    result.statusCode = 200;
    result.content = body;
    return result;
}

PageFetchResult status(int code) {
    PageFetchResult result;
    result.statusCode = code;
    result.errorMessage = "HTTP status " + std::to_string(code);
    return result;
}

const std::string kTarget = "https://site.test/contact";
const std::string kProxied = "https://proxy.test/raw?url=https%3A%2F%2Fsite.test%2Fcontact";

std::vector<AccessRoute> twoRoutes() {
    return {{"direct", "{raw}"}, {"proxy", "https://proxy.test/raw?url={url}"}};
}

} // namespace

TEST_CASE("AccessRoute builds request URLs", "[FetchTransport]") {
    SECTION("{raw} inserts the target verbatim") {
        AccessRoute route{"direct", "{raw}"};
        REQUIRE(route.apply(kTarget) == kTarget);
    }

    SECTION("{url} inserts the percent-encoded target") {
        AccessRoute route{"proxy", "https://proxy.test/raw?url={url}"};
        REQUIRE(route.apply(kTarget) == kProxied);
    }

    SECTION("Default routes start with a direct fetch") {
        auto routes = defaultAccessRoutes();
        REQUIRE(routes.size() == 3);
        REQUIRE(routes[0].name == "direct");
        REQUIRE(routes[0].apply(kTarget) == kTarget);
        REQUIRE(routes[1].name == "allorigins");
        REQUIRE(routes[2].name == "corsproxy");
    }
}

TEST_CASE("FetchTransport tries routes in order", "[FetchTransport]") {
    auto fetcher = std::make_shared<ScriptedFetcher>();
    FetchTransport transport(fetcher, twoRoutes());

    SECTION("First successful route wins and later routes are not tried") {
        fetcher->responses[kTarget] = ok("<p>direct</p>");
        fetcher->responses[kProxied] = ok("<p>proxy</p>");

        REQUIRE(transport.fetch(kTarget) == "<p>direct</p>");
        REQUIRE(fetcher->requests == std::vector<std::string>{kTarget});
    }

    SECTION("Non-2xx status falls through to the next route") {
        fetcher->responses[kTarget] = status(403);
        fetcher->responses[kProxied] = ok("<p>proxy</p>");

        REQUIRE(transport.fetch(kTarget) == "<p>proxy</p>");
        REQUIRE(fetcher->requests == std::vector<std::string>{kTarget, kProxied});
    }

    SECTION("A throwing fetcher counts as a failed route") {
        fetcher->throwOn = kTarget;
        fetcher->responses[kProxied] = ok("<p>proxy</p>");

        REQUIRE(transport.fetch(kTarget) == "<p>proxy</p>");
    }

    SECTION("Each route is attempted once") {
        fetcher->responses[kTarget] = status(500);
        fetcher->responses[kProxied] = status(502);

        REQUIRE_THROWS_AS(transport.fetch(kTarget), TransportExhaustedError);
        REQUIRE(fetcher->requests.size() == 2);
    }
}

TEST_CASE("FetchTransport reports where a page came from", "[FetchTransport]") {
    auto fetcher = std::make_shared<ScriptedFetcher>();

    SECTION("Direct route passes the fetcher's final URL through") {
        PageFetchResult redirected = ok("<p>moved</p>");
        redirected.finalUrl = "https://site.test/new-contact";
        fetcher->responses[kTarget] = redirected;

        FetchTransport transport(fetcher, twoRoutes());
        FetchedPage page = transport.fetchPage(kTarget);
        REQUIRE(page.content == "<p>moved</p>");
        REQUIRE(page.effectiveUrl == "https://site.test/new-contact");
        REQUIRE(page.routeName == "direct");
    }

    SECTION("Direct route without a final URL reports the target") {
        fetcher->responses[kTarget] = ok("body");

        FetchTransport transport(fetcher, twoRoutes());
        REQUIRE(transport.fetchPage(kTarget).effectiveUrl == kTarget);
    }

    SECTION("Pass-through route reports the target, not the proxy") {
        fetcher->responses[kTarget] = status(503);
        PageFetchResult proxied = ok("via proxy");
        proxied.finalUrl = kProxied;
        fetcher->responses[kProxied] = proxied;

        FetchTransport transport(fetcher, twoRoutes());
        FetchedPage page = transport.fetchPage(kTarget);
        REQUIRE(page.content == "via proxy");
        REQUIRE(page.effectiveUrl == kTarget);
        REQUIRE(page.routeName == "proxy");
    }

    SECTION("Only the verbatim template counts as direct") {
        REQUIRE(AccessRoute{"direct", "{raw}"}.isDirect());
        REQUIRE_FALSE(AccessRoute{"proxy", "https://proxy.test/raw?url={url}"}.isDirect());
    }
}

TEST_CASE("FetchTransport reports exhaustion", "[FetchTransport]") {
    auto fetcher = std::make_shared<ScriptedFetcher>();
    FetchTransport transport(fetcher, twoRoutes());
    fetcher->responses[kTarget] = status(404);
    fetcher->responses[kProxied] = status(429);

    try {
        transport.fetch(kTarget);
        FAIL("Expected TransportExhaustedError");
    } catch (const TransportExhaustedError& e) {
        REQUIRE(e.targetUrl() == kTarget);
        REQUIRE(e.lastError().find("proxy") != std::string::npos);
        REQUIRE(e.lastError().find("429") != std::string::npos);
    }
}

TEST_CASE("FetchTransport rejects unusable setups", "[FetchTransport]") {
    REQUIRE_THROWS_AS(FetchTransport(nullptr, twoRoutes()), std::invalid_argument);
    REQUIRE_THROWS_AS(FetchTransport(std::make_shared<ScriptedFetcher>(), {}), std::invalid_argument);
}
