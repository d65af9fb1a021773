#include "cli/commands.hpp"

#include <charconv>
#include <stdexcept>
#include <system_error>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace ttlkv::cli {

namespace {

std::string format_entries(const EntryMap& entries) {
    return to_json(entries).dump(4) + "\n";
}

} // anonymous namespace

Value parse_value(const std::string& arg) {
    auto parsed = nlohmann::json::parse(arg, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded()) {
        return Value(arg);
    }
    return parsed;
}

std::optional<int64_t> parse_ttl(const std::vector<std::string>& args) {
    if (args.size() < 3) {
        return std::nullopt;
    }
    const auto& s = args[2];
    int64_t minutes = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), minutes);
    if (ec != std::errc{} || ptr != s.data() + s.size() || minutes < 0) {
        throw std::runtime_error(
            "ttl must be a non-negative number of minutes, got '" + s + "'");
    }
    return minutes;
}

std::string format_value(const Value& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump();
}

CommandResult run_command(Store& store, const StoreConfig& cfg) {
    const auto& cmd  = cfg.command;
    const auto& args = cfg.args;

    spdlog::debug("ttlkv-cli: {} on {}", cmd, store.path().string());

    if (cmd == "add") {
        store.add(args[0], parse_value(args[1]), parse_ttl(args));
        return {0, "OK\n"};
    }
    if (cmd == "update") {
        const bool updated = store.update(args[0], parse_value(args[1]), parse_ttl(args));
        return {0, updated ? "OK\n" : "NOT_FOUND\n"};
    }
    if (cmd == "remove") {
        const bool removed = store.remove(args[0]);
        return {0, removed ? "DELETED\n" : "NOT_FOUND\n"};
    }
    if (cmd == "get") {
        auto value = store.get(args[0]);
        if (!value) {
            return {1, "NOT_FOUND\n"};
        }
        return {0, format_value(*value) + "\n"};
    }
    if (cmd == "list") {
        return {0, format_entries(store.get_all())};
    }
    if (cmd == "expire") {
        const bool expired = store.expire(args[0]);
        return {0, expired ? "OK\n" : "NOT_FOUND\n"};
    }
    if (cmd == "expire-all") {
        store.expire_all();
        return {0, "OK\n"};
    }
    if (cmd == "expired") {
        return {0, format_entries(store.get_expired_details())};
    }
    if (cmd == "active") {
        return {0, format_entries(store.get_active_details())};
    }
    if (cmd == "clear") {
        store.remove_all();
        return {0, "OK\n"};
    }
    if (cmd == "purge") {
        const auto purged = store.expire_all_expired();
        return {0, "PURGED " + std::to_string(purged) + "\n"};
    }

    // parse_config() rejects unknown commands before we get here.
    throw std::runtime_error("Unknown command '" + cmd + "'");
}

} // namespace ttlkv::cli
