#include <aria/logger.hpp>
#include <algorithm>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iostream>

namespace aria
{

Logger& Logger::instance()
{
    static Logger logger;
    return logger;
}

void Logger::set_level(LogLevel level)
{
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

LogLevel Logger::get_level() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return min_level_;
}

void Logger::set_category_level(std::string_view category, LogLevel level)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(category_levels_.begin(),
                           category_levels_.end(),
                           [&](const CategoryLevel& c) { return c.category == category; });
    if (it != category_levels_.end())
        it->level = level;
    else
        category_levels_.push_back({std::string(category), level});
}

void Logger::clear_category_levels()
{
    std::lock_guard<std::mutex> lock(mutex_);
    category_levels_.clear();
}

void Logger::add_sink(LogSink sink)
{
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks()
{
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

LogLevel Logger::threshold_locked(std::string_view category) const
{
    for (const auto& c : category_levels_)
    {
        if (c.category == category)
            return c.level;
    }
    return min_level_;
}

bool Logger::is_enabled(LogLevel level) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= min_level_;
}

bool Logger::is_enabled(LogLevel level, std::string_view category) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= threshold_locked(category);
}

void Logger::log(LogLevel level, std::string_view category, std::string_view message)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < threshold_locked(category) || sinks_.empty())
        return;

    const LogEntry entry{std::chrono::system_clock::now(), level, std::string(category), std::string(message)};
    for (const auto& sink : sinks_)
        sink(entry);
}

std::string Logger::level_to_string(LogLevel level)
{
    static constexpr const char* names[] = {"TRACE", "DEBUG", "INFO", "WARN", "ERROR", "CRITICAL"};
    const int i = static_cast<int>(level);
    if (i < 0 || i > static_cast<int>(LogLevel::Critical))
        return "UNKNOWN";
    return names[i];
}

std::string Logger::timestamp_to_string(const std::chrono::system_clock::time_point& tp)
{
    using namespace std::chrono;
    const std::time_t secs   = system_clock::to_time_t(tp);
    const long long   millis = duration_cast<milliseconds>(tp.time_since_epoch()).count() % 1000;

    std::tm local{};
    localtime_r(&secs, &local);

    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &local);
    char out[40];
    std::snprintf(out, sizeof(out), "%s.%03lld", date, millis < 0 ? millis + 1000 : millis);
    return out;
}

std::string Logger::format_entry(const LogEntry& entry)
{
    std::string line = timestamp_to_string(entry.timestamp);
    line += ' ';
    line += level_to_string(entry.level);
    line += " [";
    line += entry.category;
    line += "] ";
    line += entry.message;
    return line;
}

// ─── LogHistory ─────────────────────────────────────────────────────────────

void LogHistory::push(const Logger::LogEntry& entry)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.size() == capacity_)
        entries_.pop_front();
    entries_.push_back(entry);
}

std::vector<Logger::LogEntry> LogHistory::entries() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<Logger::LogEntry>(entries_.begin(), entries_.end());
}

size_t LogHistory::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void LogHistory::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

bool LogHistory::contains(std::string_view category, std::string_view needle) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(entries_.begin(),
                       entries_.end(),
                       [&](const Logger::LogEntry& e)
                       { return e.category == category && e.message.find(needle) != std::string::npos; });
}

// ─── Sinks ──────────────────────────────────────────────────────────────────

namespace sinks
{

namespace
{

const char* ansi_color(LogLevel level)
{
    switch (level)
    {
        case LogLevel::Trace:
            return "\033[90m";
        case LogLevel::Debug:
            return "\033[36m";
        case LogLevel::Info:
            return "\033[32m";
        case LogLevel::Warning:
            return "\033[33m";
        case LogLevel::Error:
            return "\033[31m";
        case LogLevel::Critical:
            return "\033[1;35m";
    }
    return "";
}

}   // namespace

Logger::LogSink console_sink()
{
    return [](const Logger::LogEntry& entry)
    {
        std::ostream& out = entry.level >= LogLevel::Warning ? std::cerr : std::cout;
        out << ansi_color(entry.level) << Logger::format_entry(entry) << "\033[0m\n";
        if (entry.level >= LogLevel::Warning)
            out.flush();
    };
}

Logger::LogSink file_sink(const std::string& filename)
{
    auto file = std::make_shared<std::ofstream>(filename, std::ios::app);
    if (!file->is_open())
        std::cerr << "aria: cannot open log file '" << filename << "'\n";
    return [file](const Logger::LogEntry& entry)
    {
        if (!file->is_open())
            return;
        *file << Logger::format_entry(entry) << '\n';
        file->flush();
    };
}

Logger::LogSink null_sink()
{
    return [](const Logger::LogEntry&) {};
}

Logger::LogSink history_sink(std::shared_ptr<LogHistory> history)
{
    return [history = std::move(history)](const Logger::LogEntry& entry)
    {
        if (history)
            history->push(entry);
    };
}

}   // namespace sinks

}   // namespace aria
