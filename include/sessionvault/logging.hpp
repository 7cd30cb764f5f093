#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace sessionvault {

/**
 * Library logger ("sessionvault"). Created lazily with a stderr color sink.
 * The level comes from SESSIONVAULT_LOG_LEVEL when set, otherwise "info".
 */
std::shared_ptr<spdlog::logger> Logger();

/**
 * Set the library log level: trace, debug, info, warn, error, critical, off.
 * Returns false for an unknown level name (level unchanged).
 */
bool SetLogLevel(const std::string& level);

}  // namespace sessionvault
