#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace aria
{

enum class LogLevel : int
{
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5
};

namespace detail
{

template <typename T>
std::string arg_to_string(T&& v)
{
    using D = std::decay_t<T>;
    if constexpr (std::is_same_v<D, std::string>)
        return v;
    else if constexpr (std::is_same_v<D, std::string_view>)
        return std::string(v);
    else if constexpr (std::is_same_v<D, const char*> || std::is_same_v<D, char*>)
    {
        const char* p = v;
        return p ? std::string(p) : std::string("(null)");
    }
    else if constexpr (std::is_same_v<D, bool>)
        return v ? "true" : "false";
    else
        return std::to_string(v);
}

// Replaces each "{}" in order with the next argument; extra arguments are dropped.
template <typename... Args>
std::string format_message(std::string_view format, Args&&... args)
{
    std::string result(format);
    size_t      cursor = 0;
    auto        replace_next = [&](auto&& arg)
    {
        auto pos = result.find("{}", cursor);
        if (pos == std::string::npos)
            return;
        std::string text = arg_to_string(std::forward<decltype(arg)>(arg));
        result.replace(pos, 2, text);
        cursor = pos + text.size();
    };
    (replace_next(std::forward<Args>(args)), ...);
    return result;
}

}   // namespace detail

class Logger
{
   public:
    struct LogEntry
    {
        std::chrono::system_clock::time_point timestamp;
        LogLevel                              level;
        std::string                           category;
        std::string                           message;
    };

    using LogSink = std::function<void(const LogEntry&)>;

    static Logger& instance();

    void     set_level(LogLevel level);
    LogLevel get_level() const;

    // Per-category threshold that replaces the global level for that
    // category, e.g. Trace for "swipe" while everything else stays at Info.
    void set_category_level(std::string_view category, LogLevel level);
    void clear_category_levels();

    void add_sink(LogSink sink);
    void clear_sinks();

    void log(LogLevel level, std::string_view category, std::string_view message);

    template <typename... Args>
    void log_formatted(LogLevel level, std::string_view category, std::string_view format, Args&&... args)
    {
        if (!is_enabled(level, category))
            return;
        try
        {
            log(level, category, detail::format_message(format, std::forward<Args>(args)...));
        }
        catch (const std::exception& e)
        {
            log(LogLevel::Error, "logger", std::string("Format error: ") + e.what());
        }
    }

    bool is_enabled(LogLevel level) const;
    bool is_enabled(LogLevel level, std::string_view category) const;

    static std::string level_to_string(LogLevel level);
    static std::string timestamp_to_string(const std::chrono::system_clock::time_point& tp);

    // "2026-01-01 12:00:00.000 INFO [player] message"
    static std::string format_entry(const LogEntry& entry);

   private:
    Logger()                         = default;
    ~Logger()                        = default;
    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;

    LogLevel threshold_locked(std::string_view category) const;

    struct CategoryLevel
    {
        std::string category;
        LogLevel    level;
    };

    mutable std::mutex         mutex_;
    LogLevel                   min_level_ = LogLevel::Info;
    std::vector<CategoryLevel> category_levels_;
    std::vector<LogSink>       sinks_;
};

// Bounded in-memory history of log entries, oldest dropped first. Backs the
// debug log view and lets tests assert on what the player reported.
class LogHistory
{
   public:
    explicit LogHistory(size_t capacity = 500) : capacity_(capacity > 0 ? capacity : 1) {}

    void                           push(const Logger::LogEntry& entry);
    std::vector<Logger::LogEntry>  entries() const;
    size_t                         size() const;
    void                           clear();
    bool                           contains(std::string_view category, std::string_view needle) const;

   private:
    mutable std::mutex            mutex_;
    size_t                        capacity_;
    std::deque<Logger::LogEntry>  entries_;
};

namespace sinks
{
// ANSI-colored; warnings and above go to stderr.
Logger::LogSink console_sink();
Logger::LogSink file_sink(const std::string& filename);
Logger::LogSink null_sink();
Logger::LogSink history_sink(std::shared_ptr<LogHistory> history);
}   // namespace sinks

#define ARIA_LOG_AT(level, category, ...)                                                  \
    do                                                                                     \
    {                                                                                      \
        if (::aria::Logger::instance().is_enabled(level, category))                        \
        {                                                                                  \
            ::aria::Logger::instance().log_formatted(level, category, __VA_ARGS__);        \
        }                                                                                  \
    } while (0)

#define ARIA_LOG_TRACE(category, ...) ARIA_LOG_AT(::aria::LogLevel::Trace, category, __VA_ARGS__)
#define ARIA_LOG_DEBUG(category, ...) ARIA_LOG_AT(::aria::LogLevel::Debug, category, __VA_ARGS__)
#define ARIA_LOG_INFO(category, ...) ARIA_LOG_AT(::aria::LogLevel::Info, category, __VA_ARGS__)
#define ARIA_LOG_WARN(category, ...) ARIA_LOG_AT(::aria::LogLevel::Warning, category, __VA_ARGS__)
#define ARIA_LOG_ERROR(category, ...) ARIA_LOG_AT(::aria::LogLevel::Error, category, __VA_ARGS__)
#define ARIA_LOG_CRITICAL(category, ...) \
    ARIA_LOG_AT(::aria::LogLevel::Critical, category, __VA_ARGS__)

}   // namespace aria
