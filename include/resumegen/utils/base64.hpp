#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace resumegen::utils {

std::string encode_base64(const std::vector<std::uint8_t>& input);

/// Builds `data:<mime>;base64,<payload>`.
std::string make_data_uri(std::string_view mime_type, const std::vector<std::uint8_t>& bytes);

}  // namespace resumegen::utils
