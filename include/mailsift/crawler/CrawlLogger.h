#pragma once
#include <string>
#include <functional>
#include <mutex>

namespace mailsift::crawler {

// Human-readable crawl log lines for a progress display. Every line is also written
// to the process Logger; the broadcast sink is optional.
class CrawlLogger {
public:
    // (message, level) where level is one of "info", "warning", "error"
    using LogBroadcastFunction = std::function<void(const std::string&, const std::string&)>;

    // Install or clear (pass nullptr) the broadcast sink
    static void setLogBroadcastFunction(LogBroadcastFunction func);

    static void broadcastLog(const std::string& message, const std::string& level = "info");

private:
    static std::mutex& sinkMutex();

    static LogBroadcastFunction logBroadcastFunction_;
};

} // namespace mailsift::crawler
