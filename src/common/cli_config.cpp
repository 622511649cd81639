#include "common/cli_config.hpp"

#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

#include <boost/program_options.hpp>
#include <fmt/format.h>

namespace po = boost::program_options;

namespace tsblob {

namespace {

// ── Helpers ───────────────────────────────────────────────────────────────────

// Parse a time stamp option value or throw std::runtime_error.
[[nodiscard]] TimeStamp parse_time_option(const std::string& value, std::string_view option) {
    auto ts = parse_time_stamp(value);
    if (!ts) {
        throw std::runtime_error(
            fmt::format("Invalid time stamp for {}: '{}' "
                        "(expected YYYY-MM-DD[THH:MM:SS] or @<unix seconds>)",
                        option, value));
    }
    return *ts;
}

// Validate the option combination required by the selected command.
void validate(const CliConfig& cfg, const po::variables_map& vm) {
    if (cfg.db_path.empty()) {
        throw std::runtime_error("--db must not be empty");
    }

    const auto name = command_name(cfg.command);
    const bool has_key = vm.count("key") > 0;

    switch (cfg.command) {
        case CliCommand::Put:
        case CliCommand::Get:
        case CliCommand::Remove:
            if (!has_key || !cfg.time_stamp) {
                throw std::runtime_error(
                    fmt::format("'{}' requires --key and --time", name));
            }
            break;
        case CliCommand::Latest:
            if (!has_key) {
                throw std::runtime_error(fmt::format("'{}' requires --key", name));
            }
            break;
        case CliCommand::Purge:
            if (!cfg.before) {
                throw std::runtime_error(fmt::format("'{}' requires --before", name));
            }
            break;
        case CliCommand::List:
            break;
    }
}

} // anonymous namespace

// ── Command names ─────────────────────────────────────────────────────────────

std::optional<CliCommand> parse_command_name(std::string_view name) {
    if (name == "put")    return CliCommand::Put;
    if (name == "get")    return CliCommand::Get;
    if (name == "latest") return CliCommand::Latest;
    if (name == "list")   return CliCommand::List;
    if (name == "rm")     return CliCommand::Remove;
    if (name == "purge")  return CliCommand::Purge;
    return std::nullopt;
}

std::string_view command_name(CliCommand command) {
    switch (command) {
        case CliCommand::Put:    return "put";
        case CliCommand::Get:    return "get";
        case CliCommand::Latest: return "latest";
        case CliCommand::List:   return "list";
        case CliCommand::Remove: return "rm";
        case CliCommand::Purge:  return "purge";
    }
    return "unknown";
}

// ── add_options ───────────────────────────────────────────────────────────────

void add_options(po::options_description& desc) {
    desc.add_options()
        ("help,h",
            "Show this help message and exit")
        ("db,d",
            po::value<std::string>()->required(),
            "Path of the SQLite database file (created when absent)")
        ("command",
            po::value<std::string>()->required(),
            "Command: put|get|latest|list|rm|purge")
        ("key,k",
            po::value<std::string>(),
            "Blob key (any text)")
        ("time,t",
            po::value<std::string>(),
            "Time stamp: YYYY-MM-DDTHH:MM:SS, YYYY-MM-DD or @<unix seconds>")
        ("before",
            po::value<std::string>(),
            "purge: delete blobs older than this time stamp")
        ("in,i",
            po::value<std::string>()->default_value("-"),
            "put: file to read the blob from ('-' for stdin)")
        ("out,o",
            po::value<std::string>()->default_value("-"),
            "get/latest: file to write the blob to ('-' for stdout)")
        ("strict",
            "list: fail on undecodable rows instead of skipping them")
        ("log-level",
            po::value<std::string>()->default_value("warn"),
            "Log level: trace|debug|info|warn|error|critical|off");
}

// ── parse_cli ─────────────────────────────────────────────────────────────────

CliConfig parse_cli(int argc, char* argv[]) {
    po::options_description desc("tsblob-cli options");
    add_options(desc);

    po::positional_options_description positional;
    positional.add("command", 1);

    po::variables_map vm;
    try {
        po::store(
            po::command_line_parser(argc, argv)
                .options(desc)
                .positional(positional)
                .run(),
            vm);

        // Handle --help before notify() so missing required options don't error.
        if (vm.count("help")) {
            std::ostringstream oss;
            oss << "Usage: tsblob-cli --db <file> <command> [options]\n" << desc;
            throw std::runtime_error(oss.str());
        }

        po::notify(vm);
    } catch (const po::error& e) {
        throw std::runtime_error(fmt::format("Argument error: {}", e.what()));
    }

    const auto& name = vm["command"].as<std::string>();
    const auto command = parse_command_name(name);
    if (!command) {
        throw std::runtime_error(
            fmt::format("Unknown command '{}' (expected put|get|latest|list|rm|purge)", name));
    }

    CliConfig cfg;
    cfg.db_path   = vm["db"].as<std::string>();
    cfg.command   = *command;
    cfg.input     = vm["in"].as<std::string>();
    cfg.output    = vm["out"].as<std::string>();
    cfg.strict    = vm.count("strict") > 0;
    cfg.log_level = vm["log-level"].as<std::string>();

    if (vm.count("key")) {
        cfg.key = vm["key"].as<std::string>();
    }
    if (vm.count("time")) {
        cfg.time_stamp = parse_time_option(vm["time"].as<std::string>(), "--time");
    }
    if (vm.count("before")) {
        cfg.before = parse_time_option(vm["before"].as<std::string>(), "--before");
    }

    validate(cfg, vm);
    return cfg;
}

} // namespace tsblob
