#pragma once

#include "common/store_config.hpp"
#include "storage/entry.hpp"
#include "storage/store.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ttlkv::cli {

// ── Argument parsing ──────────────────────────────────────────────────────────

// A command-line value is stored as JSON when it parses as JSON
// (`42`, `true`, `{"a":1}`), otherwise as a plain string.
[[nodiscard]] Value parse_value(const std::string& arg);

// Optional third argument of add/update: ttl in whole minutes.
// Returns std::nullopt when absent.
// Throws std::runtime_error unless it is a non-negative integer.
[[nodiscard]] std::optional<int64_t> parse_ttl(const std::vector<std::string>& args);

// Strings print bare, everything else as compact JSON.
[[nodiscard]] std::string format_value(const Value& value);

// ── run_command ───────────────────────────────────────────────────────────────

struct CommandResult {
    int         exit_code = 0;  // 0 on success, 1 when `get` finds nothing
    std::string output;         // Text for stdout, newline-terminated
};

// Execute the validated command in `cfg` against `store`.
// Throws std::runtime_error for a bad ttl and std::system_error if the
// backing file cannot be written.
[[nodiscard]] CommandResult run_command(Store& store, const StoreConfig& cfg);

} // namespace ttlkv::cli
