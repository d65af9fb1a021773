#pragma once

#include <string>

#include <spdlog/spdlog.h>

namespace ttlkv {

// ── Logger façade ─────────────────────────────────────────────────────────────

// Initialize the global default logger used by the store, the backing-file
// layer and the CLI.
// Call once at program start before any logging. Safe to call again: an
// existing "ttlkv" logger is reused and only its level is changed.
void init_default_logger(spdlog::level::level_enum level = spdlog::level::info);

// Parse a log-level string from CLI args ("trace", "debug", "info", …).
// Returns spdlog::level::info on unrecognised input.
spdlog::level::level_enum parse_log_level(const std::string& s);

} // namespace ttlkv
