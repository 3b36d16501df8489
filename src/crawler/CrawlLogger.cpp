#include "../../include/mailsift/crawler/CrawlLogger.h"
#include "../../include/Logger.h"

namespace mailsift::crawler {

CrawlLogger::LogBroadcastFunction CrawlLogger::logBroadcastFunction_ = nullptr;

std::mutex& CrawlLogger::sinkMutex() {
    static std::mutex m;
    return m;
}

void CrawlLogger::setLogBroadcastFunction(LogBroadcastFunction func) {
    std::lock_guard<std::mutex> lock(sinkMutex());
    logBroadcastFunction_ = std::move(func);
}

void CrawlLogger::broadcastLog(const std::string& message, const std::string& level) {
    if (level == "error") {
        LOG_ERROR(message);
    } else if (level == "warning") {
        LOG_WARNING(message);
    } else {
        LOG_INFO(message);
    }

    std::lock_guard<std::mutex> lock(sinkMutex());
    if (logBroadcastFunction_) {
        logBroadcastFunction_(message, level);
    }
    // No sink installed: the Logger line above is the only output
}

} // namespace mailsift::crawler
