// ============================================================================
// LIFELINE - Logger Implementation
// ============================================================================
// spdlog backend: console + rotating file sinks, optional async thread pool
// ============================================================================

#include "lifeline/utils/logger.hpp"

#include <spdlog/async.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <mutex>
#include <vector>

namespace lifeline::utils {

namespace {

constexpr const char* LOGGER_NAME = "lifeline";

spdlog::level::level_enum to_spdlog(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace:    return spdlog::level::trace;
        case LogLevel::Debug:    return spdlog::level::debug;
        case LogLevel::Info:     return spdlog::level::info;
        case LogLevel::Warn:     return spdlog::level::warn;
        case LogLevel::Error:    return spdlog::level::err;
        case LogLevel::Critical: return spdlog::level::critical;
        case LogLevel::Off:      return spdlog::level::off;
    }
    return spdlog::level::info;
}

}  // namespace

LogLevel parse_log_level(std::string_view name) noexcept {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    if (lower == "critical") return LogLevel::Critical;
    if (lower == "off") return LogLevel::Off;
    return LogLevel::Info;
}

// ============================================================================
// Logger Implementation
// ============================================================================

struct Logger::Impl {
    std::mutex init_mutex;
    std::shared_ptr<spdlog::logger> owned;
    std::atomic<spdlog::logger*> active{nullptr};

    // Replaced loggers are kept until exit: writers may still hold the raw
    // pointer they loaded from active before the swap
    std::vector<std::shared_ptr<spdlog::logger>> retired;

    void retire_owned() {
        if (owned) {
            owned->flush();
            retired.push_back(std::move(owned));
        }
    }

    spdlog::logger* get() const noexcept {
        auto* logger = active.load(std::memory_order_acquire);
        return logger != nullptr ? logger : spdlog::default_logger_raw();
    }
};

Logger::Logger() : impl_(std::make_unique<Impl>()) {}

Logger::~Logger() = default;

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::initialize(const LogConfig& config) {
    auto& self = instance();
    std::lock_guard<std::mutex> lock(self.impl_->init_mutex);

    std::vector<spdlog::sink_ptr> sinks;
    if (config.console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }
    if (!config.log_file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.log_file,
            config.max_file_size_mb * 1024 * 1024,
            config.max_files,
            config.rotate_on_open));
    }

    std::shared_ptr<spdlog::logger> logger;
    if (config.async) {
        spdlog::init_thread_pool(config.queue_size, 1);
        logger = std::make_shared<spdlog::async_logger>(
            LOGGER_NAME, sinks.begin(), sinks.end(),
            spdlog::thread_pool(), spdlog::async_overflow_policy::block);
    } else {
        logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    }

    logger->set_pattern(config.pattern);
    logger->set_level(to_spdlog(config.level));
    logger->flush_on(spdlog::level::warn);

    spdlog::drop(LOGGER_NAME);
    spdlog::register_logger(logger);
    spdlog::flush_every(std::chrono::milliseconds(config.flush_interval_ms));

    self.impl_->retire_owned();
    self.impl_->owned = logger;
    self.impl_->active.store(logger.get(), std::memory_order_release);
}

void Logger::shutdown() {
    auto& self = instance();
    std::lock_guard<std::mutex> lock(self.impl_->init_mutex);
    self.impl_->active.store(nullptr, std::memory_order_release);
    self.impl_->retire_owned();
    spdlog::drop(LOGGER_NAME);
}

void Logger::set_level(LogLevel level) {
    impl_->get()->set_level(to_spdlog(level));
}

bool Logger::should_log(LogLevel level) const noexcept {
    return impl_->get()->should_log(to_spdlog(level));
}

void Logger::write(LogLevel level, std::string_view message) {
    impl_->get()->log(to_spdlog(level), spdlog::string_view_t(message.data(), message.size()));
}

void Logger::flush() {
    impl_->get()->flush();
}

}  // namespace lifeline::utils
