#include "common/store_config.hpp"

#include <cstddef>
#include <format>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include <boost/program_options.hpp>

namespace po = boost::program_options;

namespace ttlkv {

namespace {

// Accepted argument count [min, max] per command.
const std::map<std::string, std::pair<std::size_t, std::size_t>>& command_arity() {
    static const std::map<std::string, std::pair<std::size_t, std::size_t>> table{
        {"add",        {2, 3}},
        {"update",     {2, 3}},
        {"remove",     {1, 1}},
        {"get",        {1, 1}},
        {"list",       {0, 0}},
        {"expire",     {1, 1}},
        {"expire-all", {0, 0}},
        {"expired",    {0, 0}},
        {"active",     {0, 0}},
        {"clear",      {0, 0}},
        {"purge",      {0, 0}},
    };
    return table;
}

void validate(const StoreConfig& cfg) {
    if (cfg.file.empty()) {
        throw std::runtime_error("--file must not be empty");
    }

    const auto& table = command_arity();
    auto it = table.find(cfg.command);
    if (it == table.end()) {
        throw std::runtime_error(std::format("Unknown command '{}'", cfg.command));
    }

    const auto [min_args, max_args] = it->second;
    if (cfg.args.size() < min_args || cfg.args.size() > max_args) {
        if (min_args == max_args) {
            throw std::runtime_error(std::format(
                "'{}' takes {} argument(s), got {}",
                cfg.command, min_args, cfg.args.size()));
        }
        throw std::runtime_error(std::format(
            "'{}' takes {} to {} arguments, got {}",
            cfg.command, min_args, max_args, cfg.args.size()));
    }
}

} // anonymous namespace

// ── add_options ───────────────────────────────────────────────────────────────

void add_options(po::options_description& desc) {
    desc.add_options()
        ("help,h",
            "Show this help message and exit")
        ("file,f",
            po::value<std::string>()->default_value(".env"),
            "Backing file of the store")
        ("log-level,l",
            po::value<std::string>()->default_value("warn"),
            "Log level: trace|debug|info|warn|error|critical")
        ("command",
            po::value<std::string>(),
            "add|update|remove|get|list|expire|expire-all|expired|active|clear|purge")
        ("args",
            po::value<std::vector<std::string>>()->default_value({}, ""),
            "Command arguments");
}

// ── parse_config ──────────────────────────────────────────────────────────────

StoreConfig parse_config(int argc, char* argv[]) {
    po::options_description desc("ttlkv-cli options");
    add_options(desc);

    po::positional_options_description positional;
    positional.add("command", 1);
    positional.add("args", -1);

    po::variables_map vm;
    try {
        po::store(
            po::command_line_parser(argc, argv)
                .options(desc)
                .positional(positional)
                .run(),
            vm);

        if (vm.count("help")) {
            std::ostringstream oss;
            oss << "Usage: ttlkv-cli [options] <command> [args...]\n" << desc;
            throw std::runtime_error(oss.str());
        }

        po::notify(vm);
    } catch (const po::error& e) {
        throw std::runtime_error(std::format("Argument error: {}", e.what()));
    }

    if (!vm.count("command")) {
        throw std::runtime_error("Missing command (see --help)");
    }

    StoreConfig cfg;
    cfg.file      = vm["file"].as<std::string>();
    cfg.log_level = vm["log-level"].as<std::string>();
    cfg.command   = vm["command"].as<std::string>();
    cfg.args      = vm["args"].as<std::vector<std::string>>();

    validate(cfg);
    return cfg;
}

} // namespace ttlkv
