#pragma once

#include "common/time_stamp.hpp"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include <boost/program_options.hpp>

namespace tsblob {

// ── CliCommand ────────────────────────────────────────────────────────────────

enum class CliCommand : std::uint8_t {
    Put,    // store --in under (--key, --time)
    Get,    // write the blob at (--key, --time) to --out
    Latest, // write the newest blob for --key to --out
    List,   // print every stored (time stamp, key)
    Remove, // delete (--key, --time)
    Purge,  // delete everything older than --before
};

// Returns std::nullopt for an unknown name.
[[nodiscard]] std::optional<CliCommand> parse_command_name(std::string_view name);

[[nodiscard]] std::string_view command_name(CliCommand command);

// ── CliConfig ─────────────────────────────────────────────────────────────────
// Full configuration for one tsblob-cli invocation.
// Populated by parse_cli() from CLI arguments.

struct CliConfig {
    std::string              db_path;    // SQLite file, created when absent
    CliCommand               command = CliCommand::List;
    std::string              key;        // empty when not given
    std::optional<TimeStamp> time_stamp; // --time
    std::optional<TimeStamp> before;     // --before (purge cutoff)
    std::string              input;      // "-" reads stdin
    std::string              output;     // "-" writes stdout
    bool                     strict = false; // strict listing
    std::string              log_level;  // spdlog level string
};

// ── parse_cli ─────────────────────────────────────────────────────────────────
// Parse CLI arguments into a CliConfig.
//
// On success: returns a fully validated CliConfig.
// On error  : throws std::runtime_error with a human-readable message.
//             --help also throws, carrying the usage text as the message.
//
// Validates:
//   - exactly one command, and a known one
//   - --db is present and non-empty
//   - --time / --before parse as time stamps
//   - put, get and rm have --key and --time; latest has --key
//   - purge has --before
//
// Usage: tsblob-cli --db <file> <command> [options]

[[nodiscard]] CliConfig parse_cli(int argc, char* argv[]);

// ── add_options ───────────────────────────────────────────────────────────────
// Populate a boost::program_options::options_description with tsblob-cli options.
// Exposed for testing and help-text generation.

void add_options(boost::program_options::options_description& desc);

} // namespace tsblob
