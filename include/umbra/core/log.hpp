#pragma once

#include <string>
#include <string_view>
#include <fstream>
#include <functional>
#include <mutex>
#include <atomic>
#include <chrono>
#include <source_location>
#include <format>
#include <vector>

namespace umbra::core {

enum class LogLevel : uint8_t {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warning = 3,
    Error = 4,
    Critical = 5
};

// Categories double as bit positions in the enabled-category mask
enum class LogCategory : uint32_t {
    General = 0,
    Geometry = 1,
    Cover = 2,
    Visibility = 3,
    Overrides = 4,
    Integration = 5,
    Recovery = 6,
    Tracking = 7,
    Persistence = 8,
    Config = 9,
    Performance = 10
};

#ifdef NDEBUG
    constexpr LogLevel COMPILE_TIME_LOG_LEVEL = LogLevel::Info;
    constexpr bool LOG_TO_CONSOLE_DEFAULT = false;
#else
    constexpr LogLevel COMPILE_TIME_LOG_LEVEL = LogLevel::Trace;
    constexpr bool LOG_TO_CONSOLE_DEFAULT = true;
#endif

// A single formatted entry as delivered to sinks
struct LogRecord {
    LogLevel level;
    LogCategory category;
    std::string message;
    std::string formatted;
};

// Measures the lifetime of a scope and reports it at Debug level
class ScopedTimer {
public:
    ScopedTimer(std::string_view name, LogCategory category = LogCategory::Performance);
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    std::string name_;
    LogCategory category_;
    std::chrono::steady_clock::time_point start_;
};

/**
 * @brief Process-wide logger for the engine.
 *
 * Entries go to an optional log file, to the console and to any registered
 * sinks. Level filtering happens twice: a compile-time floor removes trace
 * output from release builds entirely, then the runtime level and category
 * mask are consulted.
 */
class Logger {
public:
    using Sink = std::function<void(const LogRecord&)>;
    using SinkId = uint32_t;

    static Logger& instance();

    // Opens (or creates) the log file. Calling it twice is a no-op.
    void initialize(const std::string& log_file_path = "umbra.log",
                    bool append = false,
                    LogLevel min_level = COMPILE_TIME_LOG_LEVEL);

    void shutdown();

    void set_min_level(LogLevel level) noexcept;
    LogLevel get_min_level() const noexcept { return min_level_.load(std::memory_order_relaxed); }

    void enable_category(LogCategory category, bool enabled = true) noexcept;
    bool is_category_enabled(LogCategory category) const noexcept;

    void set_console_output(bool enabled) noexcept { console_enabled_.store(enabled, std::memory_order_relaxed); }

    // Sinks receive every entry that passes filtering
    SinkId add_sink(Sink sink);
    void remove_sink(SinkId id);

    template<LogLevel Level, LogCategory Category = LogCategory::General, typename... Args>
    void log_fmt(const std::source_location& location, std::format_string<Args...> fmt, Args&&... args) {
        if constexpr (Level < COMPILE_TIME_LOG_LEVEL) {
            return;
        }

        if (!should_log(Level, Category)) {
            return;
        }

        try {
            log_impl(Level, Category, std::format(fmt, std::forward<Args>(args)...), location);
        } catch (const std::exception& e) {
            log_impl(LogLevel::Error, LogCategory::General,
                     std::string("log formatting failed: ") + e.what(), location);
        }
    }

    void flush();

    struct Stats {
        uint64_t total_logs = 0;
        uint64_t dropped_logs = 0;
        uint64_t file_writes = 0;
        uint64_t console_writes = 0;
    };
    Stats get_stats() const noexcept;

    void log_impl(LogLevel level, LogCategory category, std::string_view message,
                  const std::source_location& location);

    static const char* level_to_string(LogLevel level) noexcept;
    static const char* category_to_string(LogCategory category) noexcept;

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    bool should_log(LogLevel level, LogCategory category) const noexcept;

    std::string format_entry(LogLevel level, LogCategory category,
                             std::string_view message,
                             const std::source_location& location) const;

    void write_to_file(std::string_view formatted);
    void write_to_console(LogLevel level, std::string_view formatted);
    void dispatch_to_sinks(const LogRecord& record);

    std::atomic<LogLevel> min_level_{COMPILE_TIME_LOG_LEVEL};
    std::atomic<uint32_t> enabled_categories_{0xFFFFFFFF};
    std::atomic<bool> console_enabled_{LOG_TO_CONSOLE_DEFAULT};

    std::ofstream log_file_;
    std::string log_file_path_;
    std::mutex file_mutex_;

    std::vector<std::pair<SinkId, Sink>> sinks_;
    SinkId next_sink_id_ = 1;
    std::mutex sink_mutex_;

    mutable std::atomic<uint64_t> total_logs_{0};
    mutable std::atomic<uint64_t> dropped_logs_{0};
    mutable std::atomic<uint64_t> file_writes_{0};
    mutable std::atomic<uint64_t> console_writes_{0};

    std::atomic<bool> initialized_{false};
};

#define LOG_TRACE(category, ...) \
    ::umbra::core::Logger::instance().log_fmt<::umbra::core::LogLevel::Trace, ::umbra::core::LogCategory::category>(std::source_location::current(), __VA_ARGS__)

#define LOG_DEBUG(category, ...) \
    ::umbra::core::Logger::instance().log_fmt<::umbra::core::LogLevel::Debug, ::umbra::core::LogCategory::category>(std::source_location::current(), __VA_ARGS__)

#define LOG_INFO(category, ...) \
    ::umbra::core::Logger::instance().log_fmt<::umbra::core::LogLevel::Info, ::umbra::core::LogCategory::category>(std::source_location::current(), __VA_ARGS__)

#define LOG_WARNING(category, ...) \
    ::umbra::core::Logger::instance().log_fmt<::umbra::core::LogLevel::Warning, ::umbra::core::LogCategory::category>(std::source_location::current(), __VA_ARGS__)

#define LOG_ERROR(category, ...) \
    ::umbra::core::Logger::instance().log_fmt<::umbra::core::LogLevel::Error, ::umbra::core::LogCategory::category>(std::source_location::current(), __VA_ARGS__)

#define LOG_CRITICAL(category, ...) \
    ::umbra::core::Logger::instance().log_fmt<::umbra::core::LogLevel::Critical, ::umbra::core::LogCategory::category>(std::source_location::current(), __VA_ARGS__)

#define LOG_SCOPE_TIMER(name) \
    ::umbra::core::ScopedTimer UMBRA_UNIQUE_NAME(timer_)(name)

#define LOG_SCOPE_TIMER_CAT(name, category) \
    ::umbra::core::ScopedTimer UMBRA_UNIQUE_NAME(timer_)(name, ::umbra::core::LogCategory::category)

#define UMBRA_CONCAT_IMPL(a, b) a##b
#define UMBRA_CONCAT(a, b) UMBRA_CONCAT_IMPL(a, b)
#define UMBRA_UNIQUE_NAME(prefix) UMBRA_CONCAT(prefix, __LINE__)

} // namespace umbra::core
