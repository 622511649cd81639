#pragma once

#include <string>

#include <spdlog/spdlog.h>

namespace tsblob {

// ── Logger façade ─────────────────────────────────────────────────────────────
//
// The library logs through spdlog's default logger.  Executables call
// init_default_logger() once at startup; without it spdlog's stock stdout
// logger is used.

// Install a colored logger named "tsblob" writing to stderr as the default.
// stderr keeps stdout free for blob content written by tsblob-cli.
// Idempotent: a second call only adjusts the level.
void init_default_logger(spdlog::level::level_enum level = spdlog::level::info);

// Parse a log-level string from CLI args ("trace", "debug", "info", …).
// Returns spdlog::level::info on unrecognised input.
[[nodiscard]] spdlog::level::level_enum parse_log_level(const std::string& s);

} // namespace tsblob
