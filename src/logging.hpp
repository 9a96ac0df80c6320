// SPDX-License-Identifier: MIT

// src/logging.hpp
#pragma once

#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

#include "lib/stream/error.hpp"

namespace kvmerge {

/// Process log settings.
struct LogConfig {
    std::string service = "kvmerge";                 ///< Logger name, shown in every line
    std::string hostname;                            ///< Host shown in every line; empty = local host name
    std::optional<std::filesystem::path> file;       ///< Append to this file; stderr when unset
    spdlog::level::level_enum level = spdlog::level::info;
};

/// Create the process logger and install it as the spdlog default.
///
/// Lines look like:
///   2025-01-15 10:42:07 host service[1234]: INFO message
///
/// A logger previously registered under the same service name is replaced.
/// @return LogSetupFailed if the log file cannot be opened.
std::expected<std::shared_ptr<spdlog::logger>, Error> SetupLogging(const LogConfig& config);

/// Upper-case severity label used in log lines (INFO, WARN, ERROR, ...).
std::string_view SeverityName(spdlog::level::level_enum level);

}  // namespace kvmerge
