#pragma once

#include <functional>
#include <iosfwd>
#include <string>

#include <nlohmann/json.hpp>

namespace resumegen {

enum class LogLevel { Off = 0, Error = 1, Warn = 2, Info = 3, Debug = 4 };

using LoggerCallback = std::function<void(LogLevel level, const std::string& message, const nlohmann::json& details)>;

LogLevel parse_log_level(const std::string& value, LogLevel fallback = LogLevel::Off);

const char* log_level_name(LogLevel level);

/**
 * Returns a logger writing one line per event to `stream`:
 * `<UTC timestamp> - resumegen - <LEVEL> - <message> <details>`.
 * The stream must outlive the returned callback.
 */
LoggerCallback make_stream_logger(std::ostream& stream);

}  // namespace resumegen
