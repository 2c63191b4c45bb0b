#pragma once

#include <spdlog/spdlog.h>

#include <optional>
#include <string_view>

namespace lexrisk::core {

// Name of the process-wide spdlog logger used by every lexrisk module.
constexpr const char* kLoggerName = "lexrisk";

// Default level when neither --log-level nor LEXRISK_LOG_LEVEL is given.
constexpr spdlog::level::level_enum kDefaultLogLevel = spdlog::level::warn;

// log returns the shared "lexrisk" logger (stderr sink), creating it on first use.
// Thread-safe; the returned reference stays valid for the life of the process.
[[nodiscard]] spdlog::logger& log();

// parse_log_level maps "trace|debug|info|warn|error|off" to a spdlog level.
// Returns nullopt for anything else.
[[nodiscard]] std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name);

// configure_logging sets the logger level from an explicit name, falling back to the
// LEXRISK_LOG_LEVEL environment variable, then to kDefaultLogLevel.
// Returns false if an explicit name was given but not recognised (the fallback still applies).
bool configure_logging(std::optional<std::string_view> level_name = std::nullopt);

}  // namespace lexrisk::core
