#pragma once
// src/logging/Log.h
//
// Process-wide spdlog setup for the rustactions executable. Library code logs
// through spdlog's default logger and needs no setup of its own.

#include <spdlog/common.h>

#include <filesystem>
#include <optional>
#include <string_view>

namespace rustactions::logging {

struct LogOptions {
    std::filesystem::path     directory;          // empty: no file sink
    std::string_view          fileName = "rustactions.log";
    spdlog::level::level_enum level    = spdlog::level::info;
    bool                      console  = true;    // colored stderr sink
};

// Replaces the default logger with "rustactions" (rotating file 1 MiB x 4 +
// stderr). Falls back to stderr only when the log directory is unusable.
void Init(const LogOptions& options);

// Flushes and drops every logger.
void Shutdown() noexcept;

// "trace|debug|info|warn|error|critical|off", case-insensitive.
[[nodiscard]] std::optional<spdlog::level::level_enum> ParseLevel(std::string_view text);

} // namespace rustactions::logging
