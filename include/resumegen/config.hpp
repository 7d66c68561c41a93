#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace resumegen {

/// Stateless backoff parameters shared by every request of a client.
struct RetryPolicy {
  std::size_t max_attempts = 4;
  std::chrono::milliseconds initial_delay{2000};
  double backoff_multiplier = 2.0;
  std::chrono::milliseconds max_delay{30000};
};

struct GeneratorConfig {
  std::size_t max_brief_length = 10000;
  std::string hex_color_pattern = "^#[0-9A-Fa-f]{6}$";

  int min_tokens = 1024;
  int max_tokens = 8000;
  int default_tokens = 6000;
  double default_temperature = 0.2;

  std::chrono::milliseconds api_timeout{120000};
  std::size_t max_retries = 3;
  std::chrono::milliseconds initial_retry_delay{2000};
  std::chrono::milliseconds max_retry_delay{30000};

  std::size_t max_file_bytes = 8'000'000;
  int max_image_side = 2048;
  int jpeg_quality = 85;

  std::vector<std::string> available_models{"gpt-4.1-mini", "gpt-4.1", "gpt-4o-mini", "gpt-4o"};
  std::string default_model = "gpt-4.1-mini";
  std::string default_accent_color = "#0b3a6e";

  /// `max_retries` retries on top of the first attempt.
  RetryPolicy retry_policy() const;
};

/**
 * Applies RESUMEGEN_MAX_RETRIES, RESUMEGEN_API_TIMEOUT_MS,
 * RESUMEGEN_MAX_FILE_BYTES and RESUMEGEN_DEFAULT_MODEL on top of `base`.
 * Throws ResumeGenError(Configuration) on malformed values.
 */
GeneratorConfig load_config_from_env(GeneratorConfig base = {});

/// Reads the system-instruction file verbatim; missing or empty files are a Configuration error.
std::string load_system_instructions(const std::filesystem::path& path);

}  // namespace resumegen
