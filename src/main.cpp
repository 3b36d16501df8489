#include "../include/Logger.h"
#include "../include/mailsift/crawler/CancellationToken.h"
#include "../include/mailsift/crawler/CrawlConfigStorage.h"
#include "../include/mailsift/crawler/CrawlErrors.h"
#include "crawler/Crawler.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

using namespace mailsift::crawler;

namespace {

volatile std::sig_atomic_t interruptRequested = 0;

void onInterrupt(int) {
    interruptRequested = 1;
}

void printUsage(std::ostream& out) {
    out << "Usage: mailsift [options] <url>\n"
        << "\n"
        << "Crawl a website's same-host pages and print every email address found.\n"
        << "\n"
        << "Options:\n"
        << "  --config FILE        JSON configuration file\n"
        << "  --depth N            maximum link depth (default 2)\n"
        << "  --pages N            maximum pages visited (default 50)\n"
        << "  --concurrency N      pages fetched in parallel (default 4)\n"
        << "  --delay MS           pause between batches in milliseconds (default 500)\n"
        << "  --timeout MS         per-request timeout in milliseconds (default 15000)\n"
        << "  --json               print the result as JSON\n"
        << "  --log-level LEVEL    trace, debug, info, warning, error or none (default info)\n"
        << "  -h, --help           show this help\n";
}

std::optional<size_t> parseCount(const std::string& text) {
    if (text.empty() || text[0] == '-') {
        return std::nullopt;
    }
    try {
        size_t consumed = 0;
        unsigned long long value = std::stoull(text, &consumed);
        if (consumed != text.size()) {
            return std::nullopt;
        }
        return static_cast<size_t>(value);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

struct Options {
    std::string url;
    std::string configPath;
    std::optional<size_t> depth;
    std::optional<size_t> pages;
    std::optional<size_t> concurrency;
    std::optional<size_t> delayMs;
    std::optional<size_t> timeoutMs;
    std::optional<LogLevel> logLevel;
    bool json = false;
    bool help = false;
};

// Returns nullopt after printing the reason on a usage error
std::optional<Options> parseArguments(int argc, char* argv[]) {
    Options options;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto nextValue = [&](const std::string& flag) -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << "mailsift: " << flag << " requires a value\n";
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };
        auto nextCount = [&](const std::string& flag, std::optional<size_t>& target) -> bool {
            auto value = nextValue(flag);
            if (!value) {
                return false;
            }
            target = parseCount(*value);
            if (!target) {
                std::cerr << "mailsift: " << flag << " expects a non-negative integer, got '" << *value << "'\n";
                return false;
            }
            return true;
        };

        if (arg == "-h" || arg == "--help") {
            options.help = true;
        } else if (arg == "--json") {
            options.json = true;
        } else if (arg == "--config") {
            auto value = nextValue(arg);
            if (!value) return std::nullopt;
            options.configPath = *value;
        } else if (arg == "--depth") {
            if (!nextCount(arg, options.depth)) return std::nullopt;
        } else if (arg == "--pages") {
            if (!nextCount(arg, options.pages)) return std::nullopt;
        } else if (arg == "--concurrency") {
            if (!nextCount(arg, options.concurrency)) return std::nullopt;
        } else if (arg == "--delay") {
            if (!nextCount(arg, options.delayMs)) return std::nullopt;
        } else if (arg == "--timeout") {
            if (!nextCount(arg, options.timeoutMs)) return std::nullopt;
        } else if (arg == "--log-level") {
            auto value = nextValue(arg);
            if (!value) return std::nullopt;
            options.logLevel = parseLogLevel(*value);
            if (!options.logLevel) {
                std::cerr << "mailsift: unknown log level '" << *value << "'\n";
                return std::nullopt;
            }
        } else if (arg.size() > 1 && arg[0] == '-') {
            std::cerr << "mailsift: unknown option '" << arg << "'\n";
            return std::nullopt;
        } else if (options.url.empty()) {
            options.url = arg;
        } else {
            std::cerr << "mailsift: unexpected argument '" << arg << "'\n";
            return std::nullopt;
        }
    }

    if (!options.help && options.url.empty()) {
        std::cerr << "mailsift: missing <url>\n";
        return std::nullopt;
    }
    return options;
}

void printResult(const CrawlResult& result, bool asJson) {
    if (asJson) {
        nlohmann::json j;
        j["startUrl"] = result.startUrl;
        j["status"] = toString(result.status);
        j["emails"] = result.emails;
        j["pagesVisited"] = result.pagesVisited;
        j["pagesFetched"] = result.pagesFetched;
        j["pagesFailed"] = result.pagesFailed;
        j["pagesSkipped"] = result.pagesSkipped;
        j["elapsedMs"] = result.elapsed.count();
        std::cout << j.dump(2) << std::endl;
        return;
    }
    for (const auto& email : result.emails) {
        std::cout << email << "\n";
    }
    std::cout.flush();
}

} // namespace

int main(int argc, char* argv[]) {
    auto options = parseArguments(argc, argv);
    if (!options) {
        printUsage(std::cerr);
        return 2;
    }
    if (options->help) {
        printUsage(std::cout);
        return 0;
    }

    LogLevel logLevel = LogLevel::INFO;
    if (const char* envLevel = std::getenv("MAILSIFT_LOG_LEVEL")) {
        if (auto parsed = parseLogLevel(envLevel)) {
            logLevel = *parsed;
        } else {
            std::cerr << "mailsift: ignoring MAILSIFT_LOG_LEVEL='" << envLevel << "'\n";
        }
    }
    if (options->logLevel) {
        logLevel = *options->logLevel;
    }
    Logger::getInstance().init(logLevel, true);

    CrawlConfig config;
    if (!options->configPath.empty()) {
        auto loaded = loadConfigFromFile(options->configPath, config);
        if (!loaded) {
            std::cerr << "mailsift: could not load configuration from " << options->configPath << "\n";
            return 1;
        }
        config = std::move(*loaded);
    }
    applyEnvironmentOverrides(config);

    if (options->depth) config.maxDepth = *options->depth;
    if (options->pages) config.maxPages = *options->pages;
    if (options->concurrency) config.concurrency = *options->concurrency;
    if (options->delayMs) config.interBatchDelay = std::chrono::milliseconds(*options->delayMs);
    if (options->timeoutMs) config.requestTimeout = std::chrono::milliseconds(*options->timeoutMs);
    config.startUrl = options->url;

    std::unique_ptr<Crawler> crawler;
    try {
        crawler = std::make_unique<Crawler>(config);
    } catch (const std::invalid_argument& e) {
        std::cerr << "mailsift: invalid configuration: " << e.what() << "\n";
        return 1;
    } catch (const std::runtime_error& e) {
        LOG_ERROR(std::string("Failed to set up crawler: ") + e.what());
        return 1;
    }

    crawler->setProgressCallback([](const ProgressEvent& event) {
        if (event.type == ProgressEventType::BATCH_COMPLETED) {
            LOG_INFO_STREAM("Progress " << event.percent << "% (" << event.visited << "/" << event.maxPages
                            << " pages, " << event.emailsFound << " emails)");
        }
    });

    CancellationToken token;
    std::atomic<bool> finished{false};
    std::signal(SIGINT, onInterrupt);

    // Signal handlers may only set a flag; this thread turns it into a cancel()
    std::thread interruptWatcher([&token, &finished] {
        while (!finished.load()) {
            if (interruptRequested) {
                LOG_WARNING("Interrupt received, stopping after the current batch");
                token.cancel();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    int exitCode = 0;
    try {
        CrawlResult result = crawler->crawl(token);
        printResult(result, options->json);
    } catch (const InvalidUrlError& e) {
        std::cerr << "mailsift: " << e.what() << "\n";
        exitCode = 1;
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Crawl aborted: ") + e.what());
        exitCode = 1;
    }

    finished.store(true);
    interruptWatcher.join();
    return exitCode;
}
