#include "log/log.hpp"

#include <algorithm>
#include <iostream>

namespace lintkit::log {

const char* level_name(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Off:
        return "OFF";
    }
    return "OFF";
}

// ============================================================================
// ConsoleSink
// ============================================================================

ConsoleSink::ConsoleSink() : out_(&std::cerr) {}

void ConsoleSink::write(const LogRecord& record) {
    *out_ << "lintkit: " << level_name(record.level) << " [" << record.module << "] "
          << record.message << '\n';
}

void ConsoleSink::flush() {
    out_->flush();
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger() {
    sinks_.push_back(std::make_unique<ConsoleSink>());
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

bool Logger::enabled(LogLevel level, std::string_view module) const {
    if (level == LogLevel::Off || level < floor_.load(std::memory_order_relaxed)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = module_levels_.find(module);
    LogLevel threshold = it != module_levels_.end() ? it->second : level_.load();
    return level >= threshold;
}

void Logger::write(LogLevel level, std::string_view module, std::string message, const char* file,
                   int line) {
    LogRecord record{.level = level,
                     .module = module,
                     .message = std::move(message),
                     .file = file,
                     .line = line};

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->write(record);
    }
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
    update_floor();
}

void Logger::set_module_level(std::string module, LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    module_levels_.insert_or_assign(std::move(module), level);
    update_floor();
}

void Logger::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    module_levels_.clear();
    sinks_.clear();
    sinks_.push_back(std::make_unique<ConsoleSink>());
    level_ = LogLevel::Warn;
    update_floor();
}

void Logger::add_sink(std::unique_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

// Caller holds mutex_.
void Logger::update_floor() {
    LogLevel floor = level_.load();
    for (const auto& [module, level] : module_levels_) {
        floor = std::min(floor, level);
    }
    floor_ = floor;
}

} // namespace lintkit::log
