#include "lexrisk/core/logging.h"

#include "lexrisk/core/normalization.h"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <memory>
#include <string>

namespace lexrisk::core {

namespace {

std::shared_ptr<spdlog::logger> make_logger() {
  if (auto existing = spdlog::get(kLoggerName)) {
    return existing;
  }
  auto logger = spdlog::stderr_color_mt(kLoggerName);
  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
  logger->set_level(kDefaultLogLevel);
  return logger;
}

}  // namespace

spdlog::logger& log() {
  static const std::shared_ptr<spdlog::logger> logger = make_logger();
  return *logger;
}

std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name) {
  const std::string lowered = normalize_ascii_lower(trim(name));
  if (lowered == "trace") {
    return spdlog::level::trace;
  }
  if (lowered == "debug") {
    return spdlog::level::debug;
  }
  if (lowered == "info") {
    return spdlog::level::info;
  }
  if (lowered == "warn" || lowered == "warning") {
    return spdlog::level::warn;
  }
  if (lowered == "error") {
    return spdlog::level::err;
  }
  if (lowered == "off") {
    return spdlog::level::off;
  }
  return std::nullopt;
}

bool configure_logging(std::optional<std::string_view> level_name) {
  bool recognised = true;
  if (level_name.has_value()) {
    if (const auto level = parse_log_level(*level_name)) {
      log().set_level(*level);
      return true;
    }
    recognised = false;
  }

  const char* env = std::getenv("LEXRISK_LOG_LEVEL");
  if (env != nullptr) {
    if (const auto level = parse_log_level(env)) {
      log().set_level(*level);
      return recognised;
    }
  }

  log().set_level(kDefaultLogLevel);
  return recognised;
}

}  // namespace lexrisk::core
