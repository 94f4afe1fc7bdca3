#include "omr/Logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace omr {

std::string logLevelToString(LogLevel level) {
    switch (level) {
    case LogLevel::ERROR:
        return "ERROR";
    case LogLevel::WARNING:
        return "WARN";
    case LogLevel::INFO:
        return "INFO";
    case LogLevel::DEBUG:
        return "DEBUG";
    }
    return "UNKNOWN";
}

StreamLogger::StreamLogger(std::ostream& out, LogLevel level, bool showTimestamp)
    : out_(out),
      level_(level),
      showTimestamp_(showTimestamp)
{
}

std::string StreamLogger::currentTimestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tmBuf{};
    localtime_r(&t, &tmBuf);

    std::ostringstream ss;
    ss << std::put_time(&tmBuf, "%H:%M:%S")
       << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}

void StreamLogger::log(LogLevel level, const std::string& module, const std::string& message) {
    if (!enabled(level)) return;

    std::ostringstream line;
    if (showTimestamp_) line << "[" << currentTimestamp() << "]";
    line << "[" << logLevelToString(level) << "][" << module << "] - " << message << "\n";

    std::lock_guard<std::mutex> lock(mutex_);
    out_ << line.str();
    out_.flush();
}

std::shared_ptr<Logger> makeDefaultLogger() {
    return std::make_shared<StreamLogger>(std::cerr, LogLevel::WARNING);
}

}
