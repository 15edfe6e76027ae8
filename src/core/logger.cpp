#include <algorithm>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <supervisor-cpp/core/logger.hpp>

namespace supervisor_cpp {

std::unordered_map<std::string, std::unique_ptr<Logger>> Logger::instances_;
std::mutex Logger::instances_mutex_;
LogLevel Logger::default_level_ = LogLevel::INFO;

Logger* Logger::getInstance(const std::string& name)
{
    std::lock_guard<std::mutex> lock(instances_mutex_);

    auto it = instances_.find(name);
    if (it == instances_.end()) {
        it = instances_.emplace(name, std::unique_ptr<Logger>(new Logger(name, default_level_)))
                 .first;
    }

    return it->second.get();
}

void Logger::setGlobalLevel(LogLevel level)
{
    std::lock_guard<std::mutex> lock(instances_mutex_);
    default_level_ = level;
    for (auto& [unused_name, logger] : instances_) {
        logger->setLevel(level);
    }
}

Logger::Logger(std::string name, LogLevel level)
    : name_(std::move(name)), level_(level), pattern_(DEFAULT_LOG_PATTERN),
      console_sink_enabled_(true)
{}

Logger::~Logger()
{
    flush();
}

void Logger::setLevel(LogLevel level)
{
    level_ = level;
}

LogLevel Logger::getLevel() const
{
    return level_.load();
}

bool Logger::isLevelEnabled(LogLevel level) const
{
    return level >= level_.load();
}

void Logger::setPattern(const std::string& pattern)
{
    std::lock_guard<std::mutex> lock(pattern_mutex_);
    pattern_ = pattern;
}

void Logger::setConsoleSinkEnabled(bool enabled)
{
    console_sink_enabled_ = enabled;
}

void Logger::addSink(LogSink sink, LogLevel level)
{
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    sinks_.push_back({std::move(sink), level});
}

void Logger::addFileSink(const std::filesystem::path& file_path, LogLevel level)
{
    std::filesystem::path dir = file_path.parent_path();
    if (!dir.empty() && !std::filesystem::exists(dir)) {
        std::filesystem::create_directories(dir);
    }

    auto stream = std::make_shared<std::ofstream>(file_path, std::ios::app);
    if (!stream->is_open()) {
        throw std::runtime_error("Failed to open log file: " + file_path.string());
    }

    {
        std::lock_guard<std::mutex> lock(sinks_mutex_);
        file_streams_.push_back(stream);
    }

    // The sink runs under sinks_mutex_, which also serializes the stream writes
    addSink(
        [this, stream](const LogMessage& message) {
            *stream << formatMessage(message) << '\n';
        },
        level);
}

void Logger::clearSinks()
{
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    sinks_.clear();
    file_streams_.clear();
}

void Logger::flush()
{
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    for (auto& stream : file_streams_) {
        if (stream && stream->is_open()) {
            stream->flush();
        }
    }
    std::clog.flush();
}

std::string Logger::getName() const
{
    return name_;
}

void Logger::write(LogLevel level, const std::string& message)
{
    LogMessage log_message;
    log_message.level = level;
    log_message.message = message;
    log_message.logger_name = name_;
    log_message.thread_id = std::this_thread::get_id();
    log_message.timestamp = std::chrono::system_clock::now();

    if (console_sink_enabled_) {
        std::string line = formatMessage(log_message);
        std::lock_guard<std::mutex> lock(instances_mutex_);
        std::clog << line << '\n';
    }

    std::lock_guard<std::mutex> lock(sinks_mutex_);
    for (const auto& sink_info : sinks_) {
        if (level >= sink_info.level) {
            sink_info.sink(log_message);
        }
    }
}

std::string Logger::formatMessage(const LogMessage& message) const
{
    std::string pattern;
    {
        std::lock_guard<std::mutex> lock(pattern_mutex_);
        pattern = pattern_;
    }

    std::string result;
    result.reserve(pattern.size() + message.message.size() + 32);

    for (size_t i = 0; i < pattern.size(); ++i) {
        if (pattern[i] != '%' || i + 1 >= pattern.size()) {
            result += pattern[i];
            continue;
        }

        char token = pattern[++i];
        switch (token) {
            case 'l':
                result += toString(message.level);
                break;
            case 'n':
                result += message.logger_name;
                break;
            case 'v':
                result += message.message;
                break;
            case 't': {
                auto time = std::chrono::system_clock::to_time_t(message.timestamp);
                std::tm tm_buf{};
                localtime_r(&time, &tm_buf);
                std::ostringstream time_stream;
                time_stream << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
                result += time_stream.str();
                break;
            }
            case 'T': {
                std::ostringstream thread_stream;
                thread_stream << message.thread_id;
                result += thread_stream.str();
                break;
            }
            default:
                result += '%';
                result += token;
                break;
        }
    }

    return result;
}

std::string toString(LogLevel level)
{
    switch (level) {
        case LogLevel::TRACE:
            return "TRACE";
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::INFO:
            return "INFO";
        case LogLevel::WARNING:
            return "WARNING";
        case LogLevel::ERROR:
            return "ERROR";
        case LogLevel::CRITICAL:
            return "CRITICAL";
        default:
            return "UNKNOWN";
    }
}

LogLevel logLevelFromString(const std::string& level_str)
{
    std::string upper_str = level_str;
    std::transform(upper_str.begin(), upper_str.end(), upper_str.begin(), ::toupper);

    if (upper_str == "TRACE")
        return LogLevel::TRACE;
    if (upper_str == "DEBUG")
        return LogLevel::DEBUG;
    if (upper_str == "INFO")
        return LogLevel::INFO;
    if (upper_str == "WARNING" || upper_str == "WARN")
        return LogLevel::WARNING;
    if (upper_str == "ERROR")
        return LogLevel::ERROR;
    if (upper_str == "CRITICAL")
        return LogLevel::CRITICAL;

    return LogLevel::INFO;
}

} // namespace supervisor_cpp
