#include "cli/commands.hpp"
#include "common/logger.hpp"
#include "common/store_config.hpp"
#include "storage/store.hpp"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <exception>
#include <stdexcept>
#include <system_error>

// ── main ──────────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
    ttlkv::StoreConfig cfg;
    try {
        cfg = ttlkv::parse_config(argc, argv);
    } catch (const std::runtime_error& e) {
        fprintf(stderr, "%s\n", e.what());
        return 1;
    }

    ttlkv::init_default_logger(ttlkv::parse_log_level(cfg.log_level));

    try {
        ttlkv::Store store{cfg.file};
        const auto result = ttlkv::cli::run_command(store, cfg);
        fprintf(stdout, "%s", result.output.c_str());
        return result.exit_code;
    } catch (const std::system_error& e) {
        spdlog::error("ttlkv-cli: I/O error: {}", e.what());
        return 2;
    } catch (const std::exception& e) {
        spdlog::error("ttlkv-cli: {}", e.what());
        return 1;
    }
}
