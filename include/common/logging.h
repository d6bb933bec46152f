#pragma once

#include <atomic>
#include <chrono>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_map>

namespace periwinkle {
namespace common {

/**
 * @brief Severity of a harness log line
 *
 * Program output captured during execution is reported at DEBUG, so
 * raising the level to WARN keeps test runs quiet.
 */
enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    CRITICAL = 5
};

/**
 * @brief One formatted log record
 */
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string module;
    std::string thread_id;
    std::string message;
    std::string error_code;
    std::unordered_map<std::string, std::string> context;
};

/**
 * @brief Process-wide logger shared by every harness component
 *
 * Writes synchronously to a single stream, either as text lines of the form
 * `[time] [LEVEL] [module] message` or as one JSON object per line. Benches
 * run on worker threads, so output is serialized under a mutex.
 */
class Logger {
public:
    static constexpr const char* DEFAULT_MODULE = "periwinkle";

    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    void set_level(LogLevel level) noexcept {
        current_level_.store(static_cast<int>(level), std::memory_order_relaxed);
    }

    LogLevel level() const noexcept {
        return static_cast<LogLevel>(current_level_.load(std::memory_order_relaxed));
    }

    /// Emit one JSON object per line instead of text
    void set_json_format(bool enabled) noexcept {
        json_format_.store(enabled, std::memory_order_relaxed);
    }

    /// Redirect log output (stdout by default). The stream must outlive its use.
    void set_output(std::ostream& out);

    bool is_debug_enabled() const noexcept {
        return current_level_.load(std::memory_order_relaxed) <= static_cast<int>(LogLevel::DEBUG);
    }

    bool is_enabled(LogLevel level) const noexcept {
        return static_cast<int>(level) >= current_level_.load(std::memory_order_relaxed);
    }

    /// Parse "trace", "debug", "info", "warn", "error" or "critical"
    static std::optional<LogLevel> parse_level(const std::string& name);

    static std::string level_to_string(LogLevel level);

    /// Log the concatenation of `args` under the default module.
    /// The first argument should be a string literal; a std::string
    /// first argument selects the overload below and names the module.
    template<typename... Args>
    void log(LogLevel level, Args&&... args) {
        if (!is_enabled(level)) return;

        std::ostringstream oss;
        (oss << ... << args);
        write(make_entry(level, DEFAULT_MODULE, oss.str(), "", {}));
    }

    template<typename... Args>
    void log(LogLevel level, const std::string& module, Args&&... args) {
        if (!is_enabled(level)) return;

        std::ostringstream oss;
        (oss << ... << args);
        write(make_entry(level, module, oss.str(), "", {}));
    }

    void log_structured(LogLevel level, const std::string& module,
                        const std::string& message, const std::string& error_code = "",
                        const std::unordered_map<std::string, std::string>& context = {}) {
        if (!is_enabled(level)) return;
        write(make_entry(level, module, message, error_code, context));
    }

    /// Always written, regardless of the configured level
    void log_critical_failure(const std::string& module, const std::string& message,
                              const std::string& error_code = "",
                              const std::unordered_map<std::string, std::string>& context = {}) {
        write(make_entry(LogLevel::CRITICAL, module, message, error_code, context));
    }

    std::string format_json(const LogEntry& entry) const;
    std::string format_text(const LogEntry& entry) const;

private:
    Logger() : current_level_(static_cast<int>(LogLevel::INFO)), json_format_(false) {}

    std::atomic<int> current_level_;
    std::atomic<bool> json_format_;
    std::mutex output_mutex_;
    std::ostream* out_ = &std::cout;

    LogEntry make_entry(LogLevel level, const std::string& module, const std::string& message,
                        const std::string& error_code,
                        const std::unordered_map<std::string, std::string>& context) const;
    void write(const LogEntry& entry);
    static std::string get_thread_id();
};

} // namespace common
} // namespace periwinkle

/**
 * @brief Level-gated logging macros
 *
 * Arguments are not evaluated when the level is disabled.
 */
#define LOG_TRACE(...) \
    do { \
        if (periwinkle::common::Logger::instance().is_enabled(periwinkle::common::LogLevel::TRACE)) { \
            periwinkle::common::Logger::instance().log(periwinkle::common::LogLevel::TRACE, __VA_ARGS__); \
        } \
    } while(0)

#define LOG_DEBUG(...) \
    do { \
        if (periwinkle::common::Logger::instance().is_debug_enabled()) { \
            periwinkle::common::Logger::instance().log(periwinkle::common::LogLevel::DEBUG, __VA_ARGS__); \
        } \
    } while(0)

#define LOG_INFO(...) \
    periwinkle::common::Logger::instance().log(periwinkle::common::LogLevel::INFO, __VA_ARGS__)

#define LOG_WARN(...) \
    periwinkle::common::Logger::instance().log(periwinkle::common::LogLevel::WARN, __VA_ARGS__)

#define LOG_ERROR(...) \
    periwinkle::common::Logger::instance().log(periwinkle::common::LogLevel::ERROR, __VA_ARGS__)

#define LOG_CRITICAL(...) \
    periwinkle::common::Logger::instance().log(periwinkle::common::LogLevel::CRITICAL, __VA_ARGS__)

#define LOG_STRUCTURED(level, module, message, ...) \
    periwinkle::common::Logger::instance().log_structured(level, module, message, ##__VA_ARGS__)

#define LOG_CRITICAL_FAILURE(module, message, ...) \
    periwinkle::common::Logger::instance().log_critical_failure(module, message, ##__VA_ARGS__)

/**
 * @brief Per-component failure macros taking (message, error_code)
 */
#define LOG_HARNESS_ERROR(message, ...) \
    LOG_CRITICAL_FAILURE("harness", message, ##__VA_ARGS__)

#define LOG_FIXTURE_ERROR(message, ...) \
    LOG_CRITICAL_FAILURE("fixture", message, ##__VA_ARGS__)

#define LOG_BENCHER_ERROR(message, ...) \
    LOG_CRITICAL_FAILURE("bencher", message, ##__VA_ARGS__)
