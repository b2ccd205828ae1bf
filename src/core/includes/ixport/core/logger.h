#pragma once

#include <chrono>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

#ifndef PROJECT_ROOT
#define PROJECT_ROOT ""
#define PROJECT_ROOT_LENGTH 0
#endif

#define __RELATIVE_FILEPATH__                                  \
    (strncmp(__FILE__, PROJECT_ROOT, PROJECT_ROOT_LENGTH) == 0 \
         ? &(__FILE__[PROJECT_ROOT_LENGTH])                    \
         : __FILE__)

namespace ixport {

enum class LogLevel {
    NONE = -2,     // Special level to disable all logging
    INHERIT = -1,  // Special level for partitions to inherit global level
    ERROR = 0,
    WARNING = 1,
    INFO = 2,
    DEBUG = 3
};

class Logger
{
private:
    static LogLevel current_level_;
    static std::mutex log_mutex_;
    static std::ostream* output_stream_;
    static std::ostream* error_stream_;

    static bool
    should_log(LogLevel level);

    static std::string
    format_timestamp()
    {
        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()) %
            1000;

        std::tm tm_now;
        localtime_r(&time_t_now, &tm_now);

        std::ostringstream oss;
        oss << "[" << std::setfill('0') << std::setw(2) << tm_now.tm_hour << ":"
            << std::setw(2) << tm_now.tm_min << ":" << std::setw(2)
            << tm_now.tm_sec << "." << std::setw(3) << ms.count() << "] ";

        return oss.str();
    }

    static const char*
    level_tag(LogLevel level)
    {
        switch (level)
        {
            case LogLevel::ERROR:
                return "[ERROR] ";
            case LogLevel::WARNING:
                return "[WARN]  ";
            case LogLevel::INFO:
                return "[INFO]  ";
            case LogLevel::DEBUG:
                return "[DEBUG] ";
            case LogLevel::NONE:
            case LogLevel::INHERIT:
                break;
        }
        return "";
    }

public:
    static void
    set_level(LogLevel level);

    static bool
    set_level(const std::string& level);

    static LogLevel
    get_level();

    // Redirect output (tests capture logs this way). nullptr restores the
    // default std::cout / std::cerr pair.
    static void
    set_output_stream(std::ostream* output_stream);

    static void
    set_error_stream(std::ostream* error_stream);

    static void
    reset_streams();

    // Messages are formatted outside the lock, only the write is serialized
    template <typename... Args>
    static void
    log(LogLevel level, const Args&... args)
    {
        if (!should_log(level))
            return;

        std::ostringstream oss;
        (oss << ... << args);
        emit(level, oss.str());
    }

    // Writes unconditionally; level filtering is the caller's job
    static void
    emit(LogLevel level, const std::string& message)
    {
        std::string line = format_timestamp() + level_tag(level) + message;

        std::lock_guard<std::mutex> lock(log_mutex_);
        std::ostream* out = (level <= LogLevel::WARNING)
            ? (error_stream_ ? error_stream_ : &std::cerr)
            : (output_stream_ ? output_stream_ : &std::cout);
        *out << line << std::endl;
    }
};

/**
 * Named logging area with its own level
 *
 * Areas default to INHERIT, following the global level until a subcommand
 * enables them explicitly (e.g. page-level tracing during an export).
 */
class LogPartition
{
public:
    LogPartition(const std::string& name, LogLevel level = LogLevel::INHERIT)
        : name_(name), level_(level)
    {
    }

    const std::string&
    name() const
    {
        return name_;
    }

    LogLevel
    level() const
    {
        return (level_ == LogLevel::INHERIT) ? Logger::get_level() : level_;
    }

    void
    enable(LogLevel level)
    {
        level_ = level;
    }

    void
    disable()
    {
        level_ = LogLevel::NONE;
    }

    bool
    should_log(LogLevel message_level) const
    {
        LogLevel effective_level = level();
        return effective_level != LogLevel::NONE &&
            message_level <= effective_level;
    }

private:
    std::string name_;
    LogLevel level_;
};

namespace detail {

template <typename... Args>
inline void
log_to_partition(
    const LogPartition& partition,
    LogLevel level,
    const char* file,
    int line,
    const Args&... args)
{
    if (!partition.should_log(level))
        return;

    std::ostringstream oss;
    oss << "[" << partition.name() << "] ";
    (oss << ... << args);
    oss << " (" << file << ":" << line << ")";
    Logger::emit(level, oss.str());
}

}  // namespace detail

}  // namespace ixport

#define LOGE(...)                    \
    ::ixport::Logger::log(           \
        ::ixport::LogLevel::ERROR,   \
        __VA_ARGS__,                 \
        " (",                        \
        __RELATIVE_FILEPATH__,       \
        ":",                         \
        __LINE__,                    \
        ")")
#define LOGW(...)                                                   \
    if (::ixport::Logger::get_level() >= ::ixport::LogLevel::WARNING) \
    ::ixport::Logger::log(                                          \
        ::ixport::LogLevel::WARNING,                                \
        __VA_ARGS__,                                                \
        " (",                                                       \
        __RELATIVE_FILEPATH__,                                      \
        ":",                                                        \
        __LINE__,                                                   \
        ")")
#define LOGI(...)                                                \
    if (::ixport::Logger::get_level() >= ::ixport::LogLevel::INFO) \
    ::ixport::Logger::log(                                       \
        ::ixport::LogLevel::INFO,                                \
        __VA_ARGS__,                                             \
        " (",                                                    \
        __RELATIVE_FILEPATH__,                                   \
        ":",                                                     \
        __LINE__,                                                \
        ")")
#define LOGD(...)                                                 \
    if (::ixport::Logger::get_level() >= ::ixport::LogLevel::DEBUG) \
    ::ixport::Logger::log(                                        \
        ::ixport::LogLevel::DEBUG,                                \
        __VA_ARGS__,                                              \
        " (",                                                     \
        __RELATIVE_FILEPATH__,                                    \
        ":",                                                      \
        __LINE__,                                                 \
        ")")

// Partition-scoped variants: PLOGI(export_log, "Wrote ", n, " documents")
#define PLOGE(partition, ...)          \
    ::ixport::detail::log_to_partition( \
        partition,                     \
        ::ixport::LogLevel::ERROR,     \
        __RELATIVE_FILEPATH__,         \
        __LINE__,                      \
        __VA_ARGS__)
#define PLOGW(partition, ...)          \
    ::ixport::detail::log_to_partition( \
        partition,                     \
        ::ixport::LogLevel::WARNING,   \
        __RELATIVE_FILEPATH__,         \
        __LINE__,                      \
        __VA_ARGS__)
#define PLOGI(partition, ...)          \
    ::ixport::detail::log_to_partition( \
        partition,                     \
        ::ixport::LogLevel::INFO,      \
        __RELATIVE_FILEPATH__,         \
        __LINE__,                      \
        __VA_ARGS__)
#define PLOGD(partition, ...)          \
    ::ixport::detail::log_to_partition( \
        partition,                     \
        ::ixport::LogLevel::DEBUG,     \
        __RELATIVE_FILEPATH__,         \
        __LINE__,                      \
        __VA_ARGS__)
