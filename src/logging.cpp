#include "resumegen/logging.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iterator>
#include <memory>
#include <mutex>
#include <ostream>
#include <sstream>

namespace resumegen {
namespace {

std::string utc_timestamp() {
  auto now = std::chrono::system_clock::now();
  std::time_t now_time = std::chrono::system_clock::to_time_t(now);
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &now_time);
#else
  gmtime_r(&now_time, &tm);
#endif
  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << ',' << std::setw(3) << std::setfill('0') << millis;
  return out.str();
}

}  // namespace

LogLevel parse_log_level(const std::string& value, LogLevel fallback) {
  std::string lowered; lowered.reserve(value.size());
  std::transform(value.begin(), value.end(), std::back_inserter(lowered), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lowered == "off") return LogLevel::Off;
  if (lowered == "error") return LogLevel::Error;
  if (lowered == "warn" || lowered == "warning") return LogLevel::Warn;
  if (lowered == "info") return LogLevel::Info;
  if (lowered == "debug") return LogLevel::Debug;
  return fallback;
}

const char* log_level_name(LogLevel level) {
  switch (level) {
    case LogLevel::Off: return "OFF";
    case LogLevel::Error: return "ERROR";
    case LogLevel::Warn: return "WARNING";
    case LogLevel::Info: return "INFO";
    case LogLevel::Debug: return "DEBUG";
  }
  return "UNKNOWN";
}

LoggerCallback make_stream_logger(std::ostream& stream) {
  auto mutex = std::make_shared<std::mutex>();
  return [&stream, mutex](LogLevel level, const std::string& message, const nlohmann::json& details) {
    std::ostringstream line;
    line << utc_timestamp() << " - resumegen - " << log_level_name(level) << " - " << message;
    if (!details.is_null() && !(details.is_object() && details.empty())) {
      line << ' ' << details.dump();
    }
    std::lock_guard<std::mutex> lock(*mutex);
    stream << line.str() << '\n';
  };
}

}  // namespace resumegen
