#pragma once

#include <string>
#include <vector>

#include <boost/program_options.hpp>

namespace ttlkv {

// ── StoreConfig ───────────────────────────────────────────────────────────────
// Configuration for one ttlkv-cli invocation.
// Populated by parse_config() from CLI arguments.

struct StoreConfig {
    std::string file;                // Backing file path
    std::string log_level;           // spdlog level string
    std::string command;             // add|update|remove|get|list|expire|...
    std::vector<std::string> args;   // Positional arguments after the command
};

// ── parse_config ──────────────────────────────────────────────────────────────
// Parse CLI arguments into a StoreConfig.
//
// On success: returns a fully validated StoreConfig.
// On error  : throws std::runtime_error with a human-readable message
//             (--help also throws, carrying the help text).
//
// Validates:
//   - file is not empty
//   - command is known
//   - argument count matches the command

[[nodiscard]] StoreConfig parse_config(int argc, char* argv[]);

// ── add_options ───────────────────────────────────────────────────────────────
// Populate a boost::program_options::options_description with ttlkv-cli
// options. Exposed for testing and help-text generation.

void add_options(boost::program_options::options_description& desc);

} // namespace ttlkv
