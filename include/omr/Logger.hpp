#ifndef OMR_LOGGER_HPP
#define OMR_LOGGER_HPP

#include <atomic>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>

namespace omr {

enum class LogLevel {
    ERROR = 0,
    WARNING = 1,
    INFO = 2,
    DEBUG = 3
};

std::string logLevelToString(LogLevel level);

// Sink for pipeline diagnostics. One instance is created by the caller
// and handed to every detector; implementations must tolerate calls from
// several batch workers at once.
class Logger {
public:
    virtual ~Logger() = default;

    virtual void log(LogLevel level, const std::string& module, const std::string& message) = 0;
    virtual bool enabled(LogLevel level) const = 0;

    void error(const std::string& module, const std::string& message) { log(LogLevel::ERROR, module, message); }
    void warning(const std::string& module, const std::string& message) { log(LogLevel::WARNING, module, message); }
    void info(const std::string& module, const std::string& message) { log(LogLevel::INFO, module, message); }
    void debug(const std::string& module, const std::string& message) { log(LogLevel::DEBUG, module, message); }
};

// Writes "[LEVEL][MODULE] - message" lines to a stream.
class StreamLogger : public Logger {
public:
    explicit StreamLogger(std::ostream& out, LogLevel level = LogLevel::WARNING, bool showTimestamp = false);

    void log(LogLevel level, const std::string& module, const std::string& message) override;
    bool enabled(LogLevel level) const override { return level <= level_.load(); }

    void setLevel(LogLevel level) { level_ = level; }
    LogLevel getLevel() const { return level_; }

private:
    std::ostream& out_;
    std::atomic<LogLevel> level_;
    bool showTimestamp_;
    std::mutex mutex_;

    static std::string currentTimestamp();
};

class NullLogger : public Logger {
public:
    void log(LogLevel, const std::string&, const std::string&) override {}
    bool enabled(LogLevel) const override { return false; }
};

// StreamLogger on std::cerr at WARNING level.
std::shared_ptr<Logger> makeDefaultLogger();

}

#endif
