/**
 * LevelPak - Logging
 *
 * Leveled diagnostics for the decoders and the command-line tool.
 * Lines go to stderr, an optional log file and an optional capture
 * callback. stdout is never written, it belongs to the JSON dump.
 */

#pragma once

#include <string>
#include <string_view>
#include <fstream>
#include <iostream>
#include <mutex>
#include <atomic>
#include <sstream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <filesystem>
#include <functional>
#include <optional>
#include <array>
#include <cstddef>

namespace levelpak {

enum class LogLevel {
    Debug = 0,   // Per-chunk and per-record decode details
    Info = 1,    // Files loaded and written
    Warning = 2, // Recoverable stream oddities (unread payload bytes)
    Error = 3,   // Decode failures
    None = 4     // Disable all logging
};

constexpr const char* log_level_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Error:   return "ERROR";
        default:                return "UNKNOWN";
    }
}

/**
 * Parse a level name as written in settings files ("debug", "info",
 * "warn"/"warning", "error", "none").
 */
inline std::optional<LogLevel> parse_log_level(std::string_view name) {
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "warn" || name == "warning") return LogLevel::Warning;
    if (name == "error") return LogLevel::Error;
    if (name == "none") return LogLevel::None;
    return std::nullopt;
}

/**
 * Process-wide logger. Level checks are lock-free so disabled LOG_DEBUG
 * lines in the per-vertex paths cost one atomic load.
 */
class Logger {
public:
    using Callback = std::function<void(LogLevel, const std::string&)>;

    static Logger& instance() {
        static Logger instance;
        return instance;
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void set_level(LogLevel level) {
        min_level_.store(level, std::memory_order_release);
    }

    LogLevel get_level() const {
        return min_level_.load(std::memory_order_acquire);
    }

    bool is_enabled(LogLevel level) const {
        return level != LogLevel::None && level >= get_level();
    }

    void set_console_output(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        console_enabled_ = enabled;
    }

    /**
     * Open (truncate) a log file and write a session banner.
     * Returns false if the file cannot be created.
     */
    bool set_file(const std::filesystem::path& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        close_file_locked();

        if (path.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(path.parent_path(), ec);
        }

        file_.open(path, std::ios::out | std::ios::trunc);
        if (!file_.is_open()) {
            return false;
        }

        std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        file_ << "=== LevelPak Log - " << std::put_time(local_time(now), "%Y-%m-%d %H:%M:%S") << " ===\n\n";
        file_.flush();
        return true;
    }

    void close_file() {
        std::lock_guard<std::mutex> lock(mutex_);
        close_file_locked();
    }

    /**
     * Receives every emitted line after formatting. Pass nullptr to detach.
     */
    void set_callback(Callback callback) {
        std::lock_guard<std::mutex> lock(mutex_);
        callback_ = std::move(callback);
    }

    /**
     * Number of lines emitted at `level` since the last reset_counts().
     */
    size_t count(LogLevel level) const {
        size_t index = static_cast<size_t>(level);
        return index < counts_.size() ? counts_[index].load(std::memory_order_relaxed) : 0;
    }

    void reset_counts() {
        for (auto& c : counts_) {
            c.store(0, std::memory_order_relaxed);
        }
    }

    void write(LogLevel level, std::string_view tag, const std::string& text) {
        if (!is_enabled(level)) return;

        std::string line = format_line(level, tag, text);
        counts_[static_cast<size_t>(level)].fetch_add(1, std::memory_order_relaxed);

        std::lock_guard<std::mutex> lock(mutex_);
        if (console_enabled_) {
            std::cerr << line << '\n';
        }
        if (file_.is_open()) {
            file_ << line << '\n';
            file_.flush();
        }
        if (callback_) {
            callback_(level, line);
        }
    }

private:
    Logger() = default;
    ~Logger() { close_file_locked(); }

    void close_file_locked() {
        if (file_.is_open()) {
            file_ << "\n=== Log End ===\n";
            file_.close();
        }
    }

    static std::tm* local_time(std::time_t time) {
        static thread_local std::tm tm_buf;
#ifdef _WIN32
        localtime_s(&tm_buf, &time);
#else
        localtime_r(&time, &tm_buf);
#endif
        return &tm_buf;
    }

    // "HH:MM:SS.mmm [LEVEL] [Tag] text"
    static std::string format_line(LogLevel level, std::string_view tag, const std::string& text) {
        auto now = std::chrono::system_clock::now();
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

        std::ostringstream ss;
        ss << std::put_time(local_time(std::chrono::system_clock::to_time_t(now)), "%H:%M:%S")
           << '.' << std::setfill('0') << std::setw(3) << ms.count()
           << " [" << log_level_string(level) << "] ";
        if (!tag.empty()) {
            ss << '[' << tag << "] ";
        }
        ss << text;
        return ss.str();
    }

    std::mutex mutex_;
    std::atomic<LogLevel> min_level_{LogLevel::Info};
    std::array<std::atomic<size_t>, 4> counts_{};
    bool console_enabled_ = false;
    std::ofstream file_;
    Callback callback_;
};

// Stream-style logging: LOG_INFO("Tag", "message " << value << " more")
#define LEVELPAK_LOG(level, tag, msg) \
    do { \
        if (levelpak::Logger::instance().is_enabled(level)) { \
            std::ostringstream _log_ss; \
            _log_ss << msg; \
            levelpak::Logger::instance().write(level, tag, _log_ss.str()); \
        } \
    } while(0)

#define LOG_DEBUG(tag, msg)   LEVELPAK_LOG(levelpak::LogLevel::Debug, tag, msg)
#define LOG_INFO(tag, msg)    LEVELPAK_LOG(levelpak::LogLevel::Info, tag, msg)
#define LOG_WARNING(tag, msg) LEVELPAK_LOG(levelpak::LogLevel::Warning, tag, msg)
#define LOG_WARN(tag, msg)    LOG_WARNING(tag, msg)
#define LOG_ERROR(tag, msg)   LEVELPAK_LOG(levelpak::LogLevel::Error, tag, msg)

} // namespace levelpak
