#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace resumegen::utils {

/// Every environment variable the library consults.
inline constexpr std::array<std::string_view, 9> kEnvironmentVariables = {
    "OPENAI_API_KEY",        "OPENAI_BASE_URL",          "OPENAI_ORG_ID",
    "OPENAI_PROJECT_ID",     "RESUMEGEN_LOG",            "RESUMEGEN_MAX_RETRIES",
    "RESUMEGEN_API_TIMEOUT_MS", "RESUMEGEN_MAX_FILE_BYTES", "RESUMEGEN_DEFAULT_MODEL",
};

/**
 * Reads an environment variable with surrounding whitespace trimmed.
 * Unset and blank variables both read as std::nullopt, so callers keep their fallback.
 */
std::optional<std::string> read_env(const std::string& name);

/**
 * Reads a non-negative base-10 integer such as RESUMEGEN_MAX_RETRIES.
 * Returns std::nullopt when the variable is unset or blank; throws
 * ResumeGenError(Configuration) naming the variable when the value is malformed.
 */
std::optional<std::uint64_t> read_env_count(const std::string& name);

}  // namespace resumegen::utils
