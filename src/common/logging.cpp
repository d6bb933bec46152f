#include "common/logging.h"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <nlohmann/json.hpp>
#include <thread>
#include <vector>

namespace periwinkle {
namespace common {

std::string Logger::get_thread_id() {
  std::ostringstream oss;
  oss << std::this_thread::get_id();
  return oss.str();
}

std::string Logger::level_to_string(LogLevel level) {
  switch (level) {
  case LogLevel::TRACE:
    return "TRACE";
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARN:
    return "WARN";
  case LogLevel::ERROR:
    return "ERROR";
  case LogLevel::CRITICAL:
    return "CRITICAL";
  }
  return "UNKNOWN";
}

std::optional<LogLevel> Logger::parse_level(const std::string &name) {
  std::string upper = name;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  if (upper == "WARNING") {
    upper = "WARN";
  }
  for (LogLevel level : {LogLevel::TRACE, LogLevel::DEBUG, LogLevel::INFO,
                         LogLevel::WARN, LogLevel::ERROR, LogLevel::CRITICAL}) {
    if (level_to_string(level) == upper) {
      return level;
    }
  }
  return std::nullopt;
}

LogEntry Logger::make_entry(
    LogLevel level, const std::string &module, const std::string &message,
    const std::string &error_code,
    const std::unordered_map<std::string, std::string> &context) const {
  return LogEntry{std::chrono::system_clock::now(),
                  level,
                  module,
                  get_thread_id(),
                  message,
                  error_code,
                  context};
}

void Logger::write(const LogEntry &entry) {
  std::string line = json_format_.load(std::memory_order_relaxed)
                         ? format_json(entry)
                         : format_text(entry);
  std::lock_guard<std::mutex> lock(output_mutex_);
  *out_ << line << std::endl;
}

std::string Logger::format_json(const LogEntry &entry) const {
  auto time_t = std::chrono::system_clock::to_time_t(entry.timestamp);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                entry.timestamp.time_since_epoch()) %
            1000;
  std::tm utc{};
  gmtime_r(&time_t, &utc);

  std::ostringstream timestamp;
  timestamp << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << "."
            << std::setfill('0') << std::setw(3) << ms.count() << "Z";

  nlohmann::json json = {{"timestamp", timestamp.str()},
                         {"level", level_to_string(entry.level)},
                         {"module", entry.module},
                         {"thread_id", entry.thread_id},
                         {"message", entry.message}};
  if (!entry.error_code.empty()) {
    json["error_code"] = entry.error_code;
  }
  if (!entry.context.empty()) {
    json["context"] = entry.context;
  }
  // Program log lines may carry arbitrary bytes
  return json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string Logger::format_text(const LogEntry &entry) const {
  auto time_t = std::chrono::system_clock::to_time_t(entry.timestamp);
  std::tm local{};
  localtime_r(&time_t, &local);

  std::ostringstream text;
  text << "[" << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << "] "
       << "[" << level_to_string(entry.level) << "] "
       << "[" << entry.module << "] " << entry.message;

  if (!entry.error_code.empty()) {
    text << " (error: " << entry.error_code << ")";
  }

  if (!entry.context.empty()) {
    // Sorted so that lines are stable across runs
    std::vector<std::pair<std::string, std::string>> fields(entry.context.begin(),
                                                            entry.context.end());
    std::sort(fields.begin(), fields.end());
    text << " {";
    bool first = true;
    for (const auto &[key, value] : fields) {
      if (!first)
        text << ", ";
      text << key << "=" << value;
      first = false;
    }
    text << "}";
  }

  return text.str();
}

void Logger::set_output(std::ostream &out) {
  std::lock_guard<std::mutex> lock(output_mutex_);
  out_ = &out;
}

} // namespace common
} // namespace periwinkle
