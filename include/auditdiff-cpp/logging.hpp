/// @file logging.hpp
/// @brief Access to the library's spdlog logger.

#pragma once

#include <spdlog/spdlog.h>

#include <memory>

namespace auditdiff_cpp {

/// Name under which the library logger is registered with spdlog.
inline constexpr auto logger_name = "auditdiff";

/// The library logger. Reuses a logger the host registered under
/// logger_name, otherwise creates a stderr color logger on first use.
auto logger() -> std::shared_ptr<spdlog::logger>;

}  // namespace auditdiff_cpp
