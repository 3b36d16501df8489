#pragma once
#include "models/CrawlConfig.h"
#include "../../Logger.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>

namespace mailsift {
namespace crawler {

inline nlohmann::json toJson(const CrawlConfig& config) {
    nlohmann::json j;
    j["maxDepth"] = config.maxDepth;
    j["maxPages"] = config.maxPages;
    j["concurrency"] = config.concurrency;
    j["interBatchDelayMs"] = config.interBatchDelay.count();
    j["requestTimeoutMs"] = config.requestTimeout.count();
    j["connectTimeoutMs"] = config.connectTimeout.count();
    j["userAgent"] = config.userAgent;
    j["followRedirects"] = config.followRedirects;
    j["maxRedirects"] = config.maxRedirects;
    j["verifySSL"] = config.verifySSL;
    j["accessRoutes"] = nlohmann::json::array();
    for (const auto& route : config.accessRoutes) {
        j["accessRoutes"].push_back({{"name", route.name}, {"urlTemplate", route.urlTemplate}});
    }
    return j;
}

namespace detail {

// Integer key read through a signed type so that negative input is seen
// rather than wrapped by an unsigned conversion
inline long long jsonInteger(const nlohmann::json& j, const char* key, long long minimum) {
    long long value = j[key].get<long long>();
    if (value < minimum) {
        throw std::invalid_argument(std::string(key) + " must be at least " + std::to_string(minimum) +
                                    ", got " + std::to_string(value));
    }
    return value;
}

inline size_t jsonCount(const nlohmann::json& j, const char* key, long long minimum = 0) {
    return static_cast<size_t>(jsonInteger(j, key, minimum));
}

inline std::chrono::milliseconds jsonMillis(const nlohmann::json& j, const char* key) {
    return std::chrono::milliseconds(jsonInteger(j, key, 0));
}

} // namespace detail

// Keys absent from j keep the values already in base. Throws
// nlohmann::json::exception when a key holds the wrong type and
// std::invalid_argument when a number is out of range.
inline CrawlConfig fromJson(const nlohmann::json& j, CrawlConfig base = CrawlConfig{}) {
    CrawlConfig config = std::move(base);
    if (!j.is_object()) {
        throw std::invalid_argument("configuration root must be a JSON object");
    }
    if (j.contains("maxDepth")) config.maxDepth = detail::jsonCount(j, "maxDepth");
    if (j.contains("maxPages")) config.maxPages = detail::jsonCount(j, "maxPages", 1);
    if (j.contains("concurrency")) config.concurrency = detail::jsonCount(j, "concurrency", 1);
    if (j.contains("interBatchDelayMs")) config.interBatchDelay = detail::jsonMillis(j, "interBatchDelayMs");
    if (j.contains("requestTimeoutMs")) config.requestTimeout = detail::jsonMillis(j, "requestTimeoutMs");
    if (j.contains("connectTimeoutMs")) config.connectTimeout = detail::jsonMillis(j, "connectTimeoutMs");
    if (j.contains("userAgent")) config.userAgent = j["userAgent"].get<std::string>();
    if (j.contains("followRedirects")) config.followRedirects = j["followRedirects"].get<bool>();
    if (j.contains("maxRedirects")) config.maxRedirects = detail::jsonCount(j, "maxRedirects");
    if (j.contains("verifySSL")) config.verifySSL = j["verifySSL"].get<bool>();
    if (j.contains("accessRoutes")) {
        config.accessRoutes.clear();
        for (const auto& route : j["accessRoutes"]) {
            AccessRoute parsed;
            parsed.name = route.value("name", "");
            parsed.urlTemplate = route.at("urlTemplate").get<std::string>();
            if (parsed.name.empty()) {
                parsed.name = "route" + std::to_string(config.accessRoutes.size() + 1);
            }
            config.accessRoutes.push_back(std::move(parsed));
        }
    }
    return config;
}

// Layer the JSON file at path over base. Returns nullopt and logs the reason
// when the file cannot be read or does not hold a valid configuration.
inline std::optional<CrawlConfig> loadConfigFromFile(const std::string& path, const CrawlConfig& base = CrawlConfig{}) {
    std::ifstream in(path);
    if (!in.is_open()) {
        LOG_ERROR("Cannot open configuration file: " + path);
        return std::nullopt;
    }
    try {
        nlohmann::json root;
        in >> root;
        return fromJson(root, base);
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Malformed configuration file " + path + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        LOG_ERROR("Invalid configuration file " + path + ": " + e.what());
    }
    return std::nullopt;
}

namespace detail {

inline std::optional<long long> envNumber(const char* name) {
    const char* value = std::getenv(name);
    if (!value || *value == '\0') {
        return std::nullopt;
    }
    try {
        size_t consumed = 0;
        long long number = std::stoll(value, &consumed);
        if (consumed != std::string(value).size() || number < 0) {
            LOG_WARNING(std::string("Ignoring ") + name + "='" + value + "': not a non-negative integer");
            return std::nullopt;
        }
        return number;
    } catch (const std::exception& e) {
        LOG_WARNING(std::string("Ignoring ") + name + "='" + value + "': " + e.what());
        return std::nullopt;
    }
}

} // namespace detail

// MAILSIFT_* environment variables; unset or unparsable ones leave config untouched
inline void applyEnvironmentOverrides(CrawlConfig& config) {
    if (auto v = detail::envNumber("MAILSIFT_MAX_DEPTH")) config.maxDepth = static_cast<size_t>(*v);
    if (auto v = detail::envNumber("MAILSIFT_MAX_PAGES")) config.maxPages = static_cast<size_t>(*v);
    if (auto v = detail::envNumber("MAILSIFT_CONCURRENCY")) config.concurrency = static_cast<size_t>(*v);
    if (auto v = detail::envNumber("MAILSIFT_DELAY_MS")) config.interBatchDelay = std::chrono::milliseconds(*v);
    if (auto v = detail::envNumber("MAILSIFT_TIMEOUT_MS")) config.requestTimeout = std::chrono::milliseconds(*v);
    if (const char* agent = std::getenv("MAILSIFT_USER_AGENT")) {
        if (*agent != '\0') config.userAgent = agent;
    }
}

} // namespace crawler
} // namespace mailsift
