#include "resumegen/utils/base64.hpp"

#include <string_view>

namespace resumegen::utils {
namespace {

constexpr std::string_view kAlphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

}  // namespace

std::string encode_base64(const std::vector<std::uint8_t>& input) {
  std::string output;
  output.reserve(((input.size() + 2) / 3) * 4);

  std::size_t i = 0;
  for (; i + 2 < input.size(); i += 3) {
    std::uint32_t triple = (static_cast<std::uint32_t>(input[i]) << 16) |
                           (static_cast<std::uint32_t>(input[i + 1]) << 8) |
                           static_cast<std::uint32_t>(input[i + 2]);
    output.push_back(kAlphabet[(triple >> 18) & 0x3F]);
    output.push_back(kAlphabet[(triple >> 12) & 0x3F]);
    output.push_back(kAlphabet[(triple >> 6) & 0x3F]);
    output.push_back(kAlphabet[triple & 0x3F]);
  }

  const std::size_t rest = input.size() - i;
  if (rest == 1) {
    std::uint32_t triple = static_cast<std::uint32_t>(input[i]) << 16;
    output.push_back(kAlphabet[(triple >> 18) & 0x3F]);
    output.push_back(kAlphabet[(triple >> 12) & 0x3F]);
    output.append("==");
  } else if (rest == 2) {
    std::uint32_t triple = (static_cast<std::uint32_t>(input[i]) << 16) |
                           (static_cast<std::uint32_t>(input[i + 1]) << 8);
    output.push_back(kAlphabet[(triple >> 18) & 0x3F]);
    output.push_back(kAlphabet[(triple >> 12) & 0x3F]);
    output.push_back(kAlphabet[(triple >> 6) & 0x3F]);
    output.push_back('=');
  }

  return output;
}

std::string make_data_uri(std::string_view mime_type, const std::vector<std::uint8_t>& bytes) {
  std::string uri = "data:";
  uri.append(mime_type);
  uri.append(";base64,");
  uri.append(encode_base64(bytes));
  return uri;
}

}  // namespace resumegen::utils
