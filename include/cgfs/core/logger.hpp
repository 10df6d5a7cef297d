#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace cgfs {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARNING = 3,
    ERROR = 4,
    CRITICAL = 5
};

struct LogMessage {
    LogLevel level;
    std::string message;
    std::string logger_name;
    std::thread::id thread_id;
    std::chrono::system_clock::time_point timestamp;
};

using LogSink = std::function<void(const LogMessage&)>;

/**
 * @brief Named, process-wide logger
 *
 * Request handlers run on FUSE worker threads, so every sink is invoked under
 * the logger's own lock. The console sink writes to stderr because stdout is
 * closed once the daemon detaches.
 */
class Logger {
public:
    static Logger* getInstance(const std::string& name = "cgfs");
    static void resetInstance(const std::string& name = "cgfs");

    ~Logger();

    // Configuration methods
    void setLevel(LogLevel level);
    LogLevel getLevel() const;
    bool isLevelEnabled(LogLevel level) const;
    void setPattern(const std::string& pattern);
    void setConsoleSinkEnabled(bool enabled);

    // Logging methods
    template<typename... Args>
    void trace(const std::string& format, Args&&... args);

    template<typename... Args>
    void debug(const std::string& format, Args&&... args);

    template<typename... Args>
    void info(const std::string& format, Args&&... args);

    template<typename... Args>
    void warning(const std::string& format, Args&&... args);

    template<typename... Args>
    void error(const std::string& format, Args&&... args);

    template<typename... Args>
    void critical(const std::string& format, Args&&... args);

    // Sink management
    void addSink(LogSink sink, LogLevel level = LogLevel::TRACE);
    void addFileSink(const std::filesystem::path& file_path, LogLevel level = LogLevel::INFO);
    void clearSinks();

    void flush();
    std::string getName() const;

    std::string formatMessage(const LogMessage& message) const;

private:
    explicit Logger(std::string name);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    void log(LogLevel level, const std::string& message);

    template<typename... Args>
    std::string formatString(const std::string& format, Args&&... args) const;

    static std::unordered_map<std::string, std::unique_ptr<Logger>> instances_;
    static std::mutex instances_mutex_;

    struct SinkInfo {
        LogSink sink;
        LogLevel level;
    };

    std::string name_;
    std::atomic<LogLevel> level_;
    std::string pattern_;
    std::atomic<bool> console_sink_enabled_;

    std::vector<SinkInfo> sinks_;
    std::vector<std::unique_ptr<std::ofstream>> file_streams_;
    mutable std::mutex sinks_mutex_;
};

std::string toString(LogLevel level);
LogLevel fromString(const std::string& level_str);

template<typename... Args>
void Logger::trace(const std::string& format, Args&&... args)
{
    if (isLevelEnabled(LogLevel::TRACE)) {
        log(LogLevel::TRACE, formatString(format, std::forward<Args>(args)...));
    }
}

template<typename... Args>
void Logger::debug(const std::string& format, Args&&... args)
{
    if (isLevelEnabled(LogLevel::DEBUG)) {
        log(LogLevel::DEBUG, formatString(format, std::forward<Args>(args)...));
    }
}

template<typename... Args>
void Logger::info(const std::string& format, Args&&... args)
{
    if (isLevelEnabled(LogLevel::INFO)) {
        log(LogLevel::INFO, formatString(format, std::forward<Args>(args)...));
    }
}

template<typename... Args>
void Logger::warning(const std::string& format, Args&&... args)
{
    if (isLevelEnabled(LogLevel::WARNING)) {
        log(LogLevel::WARNING, formatString(format, std::forward<Args>(args)...));
    }
}

template<typename... Args>
void Logger::error(const std::string& format, Args&&... args)
{
    if (isLevelEnabled(LogLevel::ERROR)) {
        log(LogLevel::ERROR, formatString(format, std::forward<Args>(args)...));
    }
}

template<typename... Args>
void Logger::critical(const std::string& format, Args&&... args)
{
    if (isLevelEnabled(LogLevel::CRITICAL)) {
        log(LogLevel::CRITICAL, formatString(format, std::forward<Args>(args)...));
    }
}

// Replaces each {} placeholder in turn; surplus arguments are dropped
template<typename... Args>
std::string Logger::formatString(const std::string& format, Args&&... args) const
{
    std::string result = format;

    size_t pos = 0;
    auto format_arg = [&](auto&& arg) {
        size_t brace_pos = result.find("{}", pos);
        if (brace_pos != std::string::npos) {
            std::ostringstream oss;
            oss << arg;
            result.replace(brace_pos, 2, oss.str());
            pos = brace_pos + oss.str().length();
        }
    };

    (format_arg(args), ...);

    return result;
}

} // namespace cgfs
