#include <umbra/core/log.hpp>

#include <algorithm>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>

namespace umbra::core {

namespace {
    constexpr const char* RESET = "\033[0m";

    constexpr const char* LEVEL_NAMES[] = {"TRACE", "DEBUG", "INFO", "WARN", "ERROR", "CRIT"};
    constexpr const char* LEVEL_COLORS[] = {
        "\033[90m",   // trace: gray
        "\033[96m",   // debug: cyan
        "\033[92m",   // info: green
        "\033[93m",   // warning: yellow
        "\033[91m",   // error: red
        "\033[1;91m"  // critical: bold red
    };

    constexpr const char* CATEGORY_NAMES[] = {
        "General", "Geometry", "Cover", "Visibility", "Overrides", "Integration",
        "Recovery", "Tracking", "Persistence", "Config", "Perf"
    };

    std::string wall_clock_timestamp() {
        const auto now = std::chrono::system_clock::now();
        const auto seconds = std::chrono::system_clock::to_time_t(now);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm{};
        localtime_r(&seconds, &tm);

        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

    std::string current_thread_id() {
        std::ostringstream oss;
        oss << std::this_thread::get_id();
        return oss.str();
    }
}

ScopedTimer::ScopedTimer(std::string_view name, LogCategory category)
    : name_(name)
    , category_(category)
    , start_(std::chrono::steady_clock::now()) {
}

ScopedTimer::~ScopedTimer() {
    const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start_);
    Logger::instance().log_impl(LogLevel::Debug, category_,
                                std::format("{} took {:.3f}ms", name_, elapsed.count() / 1000.0),
                                std::source_location::current());
}

Logger::~Logger() {
    shutdown();
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& log_file_path, bool append, LogLevel min_level) {
    if (initialized_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    log_file_path_ = log_file_path;
    min_level_.store(min_level, std::memory_order_relaxed);

    std::error_code ec;
    const std::filesystem::path path(log_file_path);
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }

    {
        std::lock_guard<std::mutex> lock(file_mutex_);
        log_file_.open(log_file_path, append ? (std::ios::out | std::ios::app)
                                             : (std::ios::out | std::ios::trunc));
    }
    if (!log_file_.is_open()) {
        std::cerr << "umbra: failed to open log file " << log_file_path << std::endl;
        return;
    }

    log_impl(LogLevel::Info, LogCategory::General,
             std::format("Logger initialized, writing to {} (compile-time floor {})",
                         log_file_path, level_to_string(COMPILE_TIME_LOG_LEVEL)),
             std::source_location::current());
}

void Logger::shutdown() {
    if (!initialized_.exchange(false, std::memory_order_acq_rel)) {
        return;
    }

    const auto stats = get_stats();
    write_to_file(format_entry(LogLevel::Info, LogCategory::General,
                               std::format("Logger shutting down - total: {} | dropped: {} | file writes: {}",
                                           stats.total_logs, stats.dropped_logs, stats.file_writes),
                               std::source_location::current()));

    std::lock_guard<std::mutex> lock(file_mutex_);
    if (log_file_.is_open()) {
        log_file_.flush();
        log_file_.close();
    }
}

void Logger::set_min_level(LogLevel level) noexcept {
    min_level_.store(level, std::memory_order_relaxed);
}

void Logger::enable_category(LogCategory category, bool enabled) noexcept {
    const uint32_t mask = 1u << static_cast<uint32_t>(category);
    if (enabled) {
        enabled_categories_.fetch_or(mask, std::memory_order_relaxed);
    } else {
        enabled_categories_.fetch_and(~mask, std::memory_order_relaxed);
    }
}

bool Logger::is_category_enabled(LogCategory category) const noexcept {
    const uint32_t mask = 1u << static_cast<uint32_t>(category);
    return (enabled_categories_.load(std::memory_order_relaxed) & mask) != 0;
}

bool Logger::should_log(LogLevel level, LogCategory category) const noexcept {
    return level >= min_level_.load(std::memory_order_relaxed) && is_category_enabled(category);
}

Logger::SinkId Logger::add_sink(Sink sink) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    const SinkId id = next_sink_id_++;
    sinks_.emplace_back(id, std::move(sink));
    return id;
}

void Logger::remove_sink(SinkId id) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    std::erase_if(sinks_, [id](const auto& entry) { return entry.first == id; });
}

void Logger::log_impl(LogLevel level, LogCategory category, std::string_view message,
                      const std::source_location& location) {
    total_logs_.fetch_add(1, std::memory_order_relaxed);

    LogRecord record{level, category, std::string(message),
                     format_entry(level, category, message, location)};

    if (initialized_.load(std::memory_order_acquire)) {
        write_to_file(record.formatted);
    }

    if (console_enabled_.load(std::memory_order_relaxed)) {
        write_to_console(level, record.formatted);
    }

    dispatch_to_sinks(record);
}

std::string Logger::format_entry(LogLevel level, LogCategory category,
                                 std::string_view message,
                                 const std::source_location& location) const {
    // [TIMESTAMP] [LEVEL] [CATEGORY] [thread:ID] message (file:line)
    std::ostringstream oss;
    oss << '[' << wall_clock_timestamp() << "] "
        << '[' << level_to_string(level) << "] "
        << '[' << category_to_string(category) << "] "
        << "[thread:" << current_thread_id() << "] "
        << message;

    if (level <= LogLevel::Debug) {
        oss << " (" << std::filesystem::path(location.file_name()).filename().string()
            << ':' << location.line() << ')';
    }

    return oss.str();
}

void Logger::write_to_file(std::string_view formatted) {
    std::lock_guard<std::mutex> lock(file_mutex_);
    if (log_file_.is_open()) {
        log_file_ << formatted << '\n';
        file_writes_.fetch_add(1, std::memory_order_relaxed);
    } else {
        dropped_logs_.fetch_add(1, std::memory_order_relaxed);
    }
}

void Logger::write_to_console(LogLevel level, std::string_view formatted) {
    const char* color = LEVEL_COLORS[static_cast<size_t>(level)];
    auto& stream = level >= LogLevel::Error ? std::cerr : std::cout;
    stream << color << formatted << RESET << '\n';
    console_writes_.fetch_add(1, std::memory_order_relaxed);
}

void Logger::dispatch_to_sinks(const LogRecord& record) {
    std::vector<Sink> targets;
    {
        std::lock_guard<std::mutex> lock(sink_mutex_);
        targets.reserve(sinks_.size());
        for (const auto& [id, sink] : sinks_) {
            targets.push_back(sink);
        }
    }
    for (const auto& sink : targets) {
        sink(record);
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(file_mutex_);
    if (log_file_.is_open()) {
        log_file_.flush();
    }
    std::cout.flush();
}

Logger::Stats Logger::get_stats() const noexcept {
    Stats stats;
    stats.total_logs = total_logs_.load(std::memory_order_relaxed);
    stats.dropped_logs = dropped_logs_.load(std::memory_order_relaxed);
    stats.file_writes = file_writes_.load(std::memory_order_relaxed);
    stats.console_writes = console_writes_.load(std::memory_order_relaxed);
    return stats;
}

const char* Logger::level_to_string(LogLevel level) noexcept {
    const auto index = static_cast<size_t>(level);
    return index < std::size(LEVEL_NAMES) ? LEVEL_NAMES[index] : "UNKNOWN";
}

const char* Logger::category_to_string(LogCategory category) noexcept {
    const auto index = static_cast<size_t>(category);
    return index < std::size(CATEGORY_NAMES) ? CATEGORY_NAMES[index] : "Unknown";
}

} // namespace umbra::core
