#pragma once
// ============================================================================
// LIFELINE - Logger
// ============================================================================
// Async logging wrapper. Uses spdlog for high-performance logging.
// Falls back to spdlog's default console logger until initialize() runs.
// ============================================================================

#include <spdlog/fmt/fmt.h>

#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace lifeline::utils {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off
};

/// Parse "trace" ... "off" (case-insensitive). Unknown names yield Info.
[[nodiscard]] LogLevel parse_log_level(std::string_view name) noexcept;

// ============================================================================
// Logger Configuration
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Info;
    std::string log_file = "lifeline.log";   // empty disables the file sink
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v";
    bool console = true;

    // Performance settings
    bool async = true;              // Async logging off the caller's thread
    size_t queue_size = 8192;       // Async queue size
    size_t flush_interval_ms = 1000; // Auto-flush interval

    // File settings
    size_t max_file_size_mb = 100;
    size_t max_files = 10;
    bool rotate_on_open = false;
};

// ============================================================================
// Logger Interface
// ============================================================================

class Logger {
public:
    /// Initialize the global logger
    static void initialize(const LogConfig& config = LogConfig{});

    /// Flush and detach the logger. The detached logger stays alive until
    /// exit, so writers racing with shutdown or re-initialization are safe.
    static void shutdown();

    /// Get the global logger instance
    static Logger& instance();

    /// Set log level
    void set_level(LogLevel level);

    [[nodiscard]] bool should_log(LogLevel level) const noexcept;

    /// Log methods
    template <typename... Args>
    void trace(std::string_view fmt, Args&&... args) {
        log(LogLevel::Trace, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void debug(std::string_view fmt, Args&&... args) {
        log(LogLevel::Debug, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void info(std::string_view fmt, Args&&... args) {
        log(LogLevel::Info, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warn(std::string_view fmt, Args&&... args) {
        log(LogLevel::Warn, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void error(std::string_view fmt, Args&&... args) {
        log(LogLevel::Error, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void critical(std::string_view fmt, Args&&... args) {
        log(LogLevel::Critical, fmt, std::forward<Args>(args)...);
    }

    /// Flush all pending logs
    void flush();

private:
    Logger();
    ~Logger();

    template <typename... Args>
    void log(LogLevel level, std::string_view fmt, Args&&... args) {
        if (!should_log(level)) return;
        if constexpr (sizeof...(Args) == 0) {
            write(level, fmt);
        } else {
            write(level, fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...));
        }
    }

    void write(LogLevel level, std::string_view message);

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// ============================================================================
// Convenience Macros
// ============================================================================

#define LOG_TRACE(...) ::lifeline::utils::Logger::instance().trace(__VA_ARGS__)
#define LOG_DEBUG(...) ::lifeline::utils::Logger::instance().debug(__VA_ARGS__)
#define LOG_INFO(...) ::lifeline::utils::Logger::instance().info(__VA_ARGS__)
#define LOG_WARN(...) ::lifeline::utils::Logger::instance().warn(__VA_ARGS__)
#define LOG_ERROR(...) ::lifeline::utils::Logger::instance().error(__VA_ARGS__)
#define LOG_CRITICAL(...) ::lifeline::utils::Logger::instance().critical(__VA_ARGS__)

}  // namespace lifeline::utils
