#include "resumegen/config.hpp"

#include "resumegen/error.hpp"
#include "resumegen/utils/env.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

namespace resumegen {

RetryPolicy GeneratorConfig::retry_policy() const {
  RetryPolicy policy;
  policy.max_attempts = max_retries + 1;
  policy.initial_delay = initial_retry_delay;
  policy.max_delay = max_retry_delay;
  return policy;
}

GeneratorConfig load_config_from_env(GeneratorConfig base) {
  if (auto retries = utils::read_env_count("RESUMEGEN_MAX_RETRIES")) {
    base.max_retries = static_cast<std::size_t>(*retries);
  }
  if (auto timeout = utils::read_env_count("RESUMEGEN_API_TIMEOUT_MS")) {
    if (*timeout == 0) {
      throw ResumeGenError(ErrorKind::Configuration, "RESUMEGEN_API_TIMEOUT_MS must be positive");
    }
    base.api_timeout = std::chrono::milliseconds(static_cast<long long>(*timeout));
  }
  if (auto bytes = utils::read_env_count("RESUMEGEN_MAX_FILE_BYTES")) {
    base.max_file_bytes = static_cast<std::size_t>(*bytes);
  }
  if (auto value = utils::read_env("RESUMEGEN_DEFAULT_MODEL")) {
    const auto& models = base.available_models;
    if (std::find(models.begin(), models.end(), *value) == models.end()) {
      throw ResumeGenError(ErrorKind::Configuration,
                           "RESUMEGEN_DEFAULT_MODEL '" + *value + "' is not an available model");
    }
    base.default_model = *value;
  }
  return base;
}

std::string load_system_instructions(const std::filesystem::path& path) {
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    throw ResumeGenError(ErrorKind::Configuration, "System instruction file not found: " + path.string());
  }
  std::ostringstream buffer;
  buffer << input.rdbuf();
  if (input.bad()) {
    throw ResumeGenError(ErrorKind::Configuration, "Failed to read system instruction file: " + path.string());
  }
  std::string content = buffer.str();
  if (content.find_first_not_of(" \t\r\n") == std::string::npos) {
    throw ResumeGenError(ErrorKind::Configuration, "System instruction file is empty: " + path.string());
  }
  return content;
}

}  // namespace resumegen
