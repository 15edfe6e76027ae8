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

namespace supervisor_cpp {

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

// %t time, %T thread, %l level, %n logger name, %v message
constexpr const char* DEFAULT_LOG_PATTERN = "%t [%l] %n: %v";

// Named loggers, one per module ("docker.interface", "docker.network", ...).
class Logger {
public:
    static Logger* getInstance(const std::string& name = "supervisor");

    // Applies to every existing logger and becomes the default for new ones.
    static void setGlobalLevel(LogLevel level);

    ~Logger();

    void setLevel(LogLevel level);
    LogLevel getLevel() const;
    bool isLevelEnabled(LogLevel level) const;
    void setPattern(const std::string& pattern);
    void setConsoleSinkEnabled(bool enabled);

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

    // Level chosen at runtime, used when an error decides its own severity
    template<typename... Args>
    void log(LogLevel level, const std::string& format, Args&&... args);

    void addSink(LogSink sink, LogLevel level = LogLevel::TRACE);
    void addFileSink(const std::filesystem::path& file_path, LogLevel level = LogLevel::INFO);
    void clearSinks();

    void flush();
    std::string getName() const;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

private:
    explicit Logger(std::string name, LogLevel level);

    void write(LogLevel level, const std::string& message);
    std::string formatMessage(const LogMessage& message) const;

    template<typename... Args>
    static std::string formatString(const std::string& format, Args&&... args);

    static std::unordered_map<std::string, std::unique_ptr<Logger>> instances_;
    static std::mutex instances_mutex_;
    static LogLevel default_level_;

    std::string name_;
    std::atomic<LogLevel> level_;
    std::string pattern_;
    std::atomic<bool> console_sink_enabled_;

    struct SinkInfo {
        LogSink sink;
        LogLevel level;
    };

    std::vector<SinkInfo> sinks_;
    std::vector<std::shared_ptr<std::ofstream>> file_streams_;
    mutable std::mutex sinks_mutex_;
    mutable std::mutex pattern_mutex_;
};

std::string toString(LogLevel level);
LogLevel logLevelFromString(const std::string& level_str);

template<typename... Args>
void Logger::trace(const std::string& format, Args&&... args)
{
    log(LogLevel::TRACE, format, std::forward<Args>(args)...);
}

template<typename... Args>
void Logger::debug(const std::string& format, Args&&... args)
{
    log(LogLevel::DEBUG, format, std::forward<Args>(args)...);
}

template<typename... Args>
void Logger::info(const std::string& format, Args&&... args)
{
    log(LogLevel::INFO, format, std::forward<Args>(args)...);
}

template<typename... Args>
void Logger::warning(const std::string& format, Args&&... args)
{
    log(LogLevel::WARNING, format, std::forward<Args>(args)...);
}

template<typename... Args>
void Logger::error(const std::string& format, Args&&... args)
{
    log(LogLevel::ERROR, format, std::forward<Args>(args)...);
}

template<typename... Args>
void Logger::critical(const std::string& format, Args&&... args)
{
    log(LogLevel::CRITICAL, format, std::forward<Args>(args)...);
}

template<typename... Args>
void Logger::log(LogLevel level, const std::string& format, Args&&... args)
{
    if (isLevelEnabled(level)) {
        write(level, formatString(format, std::forward<Args>(args)...));
    }
}

template<typename... Args>
std::string Logger::formatString(const std::string& format, Args&&... args)
{
    std::string result = format;

    // Replace {} placeholders left to right
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

} // namespace supervisor_cpp
