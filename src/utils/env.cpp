#include "resumegen/utils/env.hpp"

#include "resumegen/error.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace resumegen::utils {
namespace {

std::string trim(std::string value) {
  auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  auto begin = std::find_if_not(value.begin(), value.end(), is_space);
  auto end = std::find_if_not(value.rbegin(), value.rend(), is_space).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

}  // namespace

std::optional<std::string> read_env(const std::string& name) {
  const char* raw = std::getenv(name.c_str());
  if (!raw) {
    return std::nullopt;
  }
  std::string value = trim(raw);
  if (value.empty()) {
    return std::nullopt;
  }
  return value;
}

std::optional<std::uint64_t> read_env_count(const std::string& name) {
  auto value = read_env(name);
  if (!value) {
    return std::nullopt;
  }
  // strtoull accepts a sign and wraps negatives.
  if (!std::isdigit(static_cast<unsigned char>(value->front()))) {
    throw ResumeGenError(ErrorKind::Configuration,
                         name + " must be a non-negative integer, got '" + *value + "'");
  }
  errno = 0;
  char* end = nullptr;
  const unsigned long long parsed = std::strtoull(value->c_str(), &end, 10);
  if (errno != 0 || *end != '\0') {
    throw ResumeGenError(ErrorKind::Configuration,
                         name + " must be a non-negative integer, got '" + *value + "'");
  }
  return static_cast<std::uint64_t>(parsed);
}

}  // namespace resumegen::utils
