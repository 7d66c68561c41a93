#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace resumegen::utils {

std::optional<nlohmann::json> safe_json(const std::string& text);

bool iequals(std::string_view lhs, std::string_view rhs);

std::string to_lower(std::string_view value);

std::string_view trim_view(std::string_view value);

/// Number of UTF-8 code points; continuation bytes are not counted.
std::size_t utf8_length(std::string_view text);

}  // namespace resumegen::utils
