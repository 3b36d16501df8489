#include <catch2/catch_test_macros.hpp>
#include "mailsift/crawler/CrawlConfigStorage.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace mailsift::crawler;

namespace {

std::string writeTempFile(const std::string& name, const std::string& content) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path, std::ios::trunc);
    out << content;
    return path.string();
}

} // namespace

TEST_CASE("CrawlConfig converts to and from JSON", "[CrawlConfigStorage]") {
    SECTION("toJson writes every key") {
        CrawlConfig config;
        config.maxDepth = 3;
        config.interBatchDelay = std::chrono::milliseconds(250);

        nlohmann::json j = toJson(config);
        REQUIRE(j["maxDepth"] == 3);
        REQUIRE(j["maxPages"] == 50);
        REQUIRE(j["concurrency"] == 4);
        REQUIRE(j["interBatchDelayMs"] == 250);
        REQUIRE(j["requestTimeoutMs"] == 15000);
        REQUIRE(j["accessRoutes"].size() == 3);
        REQUIRE(j["accessRoutes"][0]["name"] == "direct");
    }

    SECTION("fromJson keeps defaults for missing keys") {
        CrawlConfig config = fromJson(nlohmann::json{{"maxPages", 10}, {"userAgent", "agent/2"}});
        REQUIRE(config.maxPages == 10);
        REQUIRE(config.userAgent == "agent/2");
        REQUIRE(config.maxDepth == 2);
        REQUIRE(config.concurrency == 4);
        REQUIRE(config.accessRoutes.size() == 3);
    }

    SECTION("fromJson replaces the route list") {
        auto j = nlohmann::json::parse(R"({
            "accessRoutes": [
                {"name": "mirror", "urlTemplate": "https://mirror.test/?u={url}"},
                {"urlTemplate": "{raw}"}
            ]
        })");
        CrawlConfig config = fromJson(j);
        REQUIRE(config.accessRoutes.size() == 2);
        REQUIRE(config.accessRoutes[0].name == "mirror");
        REQUIRE(config.accessRoutes[1].name == "route2");
        REQUIRE(config.accessRoutes[1].urlTemplate == "{raw}");
    }

    SECTION("Wrong value types are rejected") {
        REQUIRE_THROWS_AS(fromJson(nlohmann::json{{"maxPages", "many"}}), nlohmann::json::exception);
        REQUIRE_THROWS_AS(fromJson(nlohmann::json::array()), std::invalid_argument);
    }

    SECTION("Negative numbers are rejected instead of wrapping") {
        REQUIRE_THROWS_AS(fromJson(nlohmann::json{{"maxDepth", -1}}), std::invalid_argument);
        REQUIRE_THROWS_AS(fromJson(nlohmann::json{{"maxPages", -1}}), std::invalid_argument);
        REQUIRE_THROWS_AS(fromJson(nlohmann::json{{"concurrency", -4}}), std::invalid_argument);
        REQUIRE_THROWS_AS(fromJson(nlohmann::json{{"maxRedirects", -2}}), std::invalid_argument);
        REQUIRE_THROWS_AS(fromJson(nlohmann::json{{"interBatchDelayMs", -500}}), std::invalid_argument);
        REQUIRE_THROWS_AS(fromJson(nlohmann::json{{"requestTimeoutMs", -1}}), std::invalid_argument);
        REQUIRE_THROWS_AS(fromJson(nlohmann::json{{"connectTimeoutMs", -1}}), std::invalid_argument);
    }

    SECTION("Zero pages or zero concurrency are rejected") {
        REQUIRE_THROWS_AS(fromJson(nlohmann::json{{"maxPages", 0}}), std::invalid_argument);
        REQUIRE_THROWS_AS(fromJson(nlohmann::json{{"concurrency", 0}}), std::invalid_argument);
    }

    SECTION("Zero is accepted where it has a meaning") {
        CrawlConfig config = fromJson(nlohmann::json{
            {"maxDepth", 0}, {"interBatchDelayMs", 0}, {"maxRedirects", 0}});
        REQUIRE(config.maxDepth == 0);
        REQUIRE(config.interBatchDelay.count() == 0);
        REQUIRE(config.maxRedirects == 0);
    }
}

TEST_CASE("loadConfigFromFile reports unusable files", "[CrawlConfigStorage]") {
    SECTION("Valid file is layered over the base") {
        std::string path = writeTempFile("mailsift_config_valid.json",
                                         R"({"maxDepth": 1, "interBatchDelayMs": 0, "verifySSL": false})");
        CrawlConfig base;
        base.userAgent = "base-agent";

        auto config = loadConfigFromFile(path, base);
        REQUIRE(config.has_value());
        REQUIRE(config->maxDepth == 1);
        REQUIRE(config->interBatchDelay.count() == 0);
        REQUIRE_FALSE(config->verifySSL);
        REQUIRE(config->userAgent == "base-agent");
        std::filesystem::remove(path);
    }

    SECTION("Malformed JSON") {
        std::string path = writeTempFile("mailsift_config_broken.json", "{ \"maxDepth\": ");
        REQUIRE_FALSE(loadConfigFromFile(path).has_value());
        std::filesystem::remove(path);
    }

    SECTION("Out-of-range values make the file unusable") {
        std::string path = writeTempFile("mailsift_config_negative.json", R"({"maxPages": -1})");
        REQUIRE_FALSE(loadConfigFromFile(path).has_value());
        std::filesystem::remove(path);
    }

    SECTION("Missing file") {
        REQUIRE_FALSE(loadConfigFromFile("/nonexistent/mailsift/config.json").has_value());
    }
}

TEST_CASE("Environment variables override configuration", "[CrawlConfigStorage]") {
    setenv("MAILSIFT_MAX_PAGES", "7", 1);
    setenv("MAILSIFT_DELAY_MS", "25", 1);
    setenv("MAILSIFT_USER_AGENT", "env-agent", 1);
    setenv("MAILSIFT_CONCURRENCY", "lots", 1);

    CrawlConfig config;
    applyEnvironmentOverrides(config);

    REQUIRE(config.maxPages == 7);
    REQUIRE(config.interBatchDelay.count() == 25);
    REQUIRE(config.userAgent == "env-agent");
    REQUIRE(config.concurrency == 4);
    REQUIRE(config.maxDepth == 2);

    unsetenv("MAILSIFT_MAX_PAGES");
    unsetenv("MAILSIFT_DELAY_MS");
    unsetenv("MAILSIFT_USER_AGENT");
    unsetenv("MAILSIFT_CONCURRENCY");
}
