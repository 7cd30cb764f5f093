#include <sessionvault/logging.hpp>

#include <cstdlib>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace sessionvault {

namespace {

constexpr const char* kLoggerName = "sessionvault";

std::shared_ptr<spdlog::logger> CreateLogger() {
  // An application may register its own "sessionvault" logger before first use.
  if (auto existing = spdlog::get(kLoggerName)) return existing;

  auto logger = spdlog::stderr_color_mt(kLoggerName);
  logger->set_pattern("%Y-%m-%dT%H:%M:%S.%e%z [%n] [%^%l%$] %v");
  logger->set_level(spdlog::level::info);

  if (const char* level = std::getenv("SESSIONVAULT_LOG_LEVEL")) {
    auto parsed = spdlog::level::from_str(level);
    // from_str() maps unknown names to "off"; only accept an explicit "off".
    if (parsed != spdlog::level::off || std::string(level) == "off") {
      logger->set_level(parsed);
    }
  }
  return logger;
}

}  // namespace

std::shared_ptr<spdlog::logger> Logger() {
  static std::shared_ptr<spdlog::logger> logger = CreateLogger();
  return logger;
}

bool SetLogLevel(const std::string& level) {
  auto parsed = spdlog::level::from_str(level);
  if (parsed == spdlog::level::off && level != "off") return false;
  Logger()->set_level(parsed);
  return true;
}

}  // namespace sessionvault
