#include "common/cli_config.hpp"
#include "common/error.hpp"
#include "common/logger.hpp"
#include "common/time_stamp.hpp"
#include "storage/blob_store.hpp"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <variant>

namespace {

constexpr int kExitOk         = 0;
constexpr int kExitUsage      = 1;
constexpr int kExitStoreError = 2;

// Reads the whole of `path` ("-" for stdin).  std::nullopt if it can't be opened.
std::optional<tsblob::Bytes> read_input(const std::string& path) {
    if (path == "-") {
        return tsblob::Bytes(std::istreambuf_iterator<char>(std::cin),
                             std::istreambuf_iterator<char>());
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    return tsblob::Bytes(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// Writes `data` to `path` ("-" for stdout).  False on I/O failure.
bool write_output(const std::string& path, const tsblob::Bytes& data) {
    if (path == "-") {
        const auto written = fwrite(data.data(), 1, data.size(), stdout);
        return written == data.size() && fflush(stdout) == 0;
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(data.data()),
              static_cast<std::streamsize>(data.size()));
    return static_cast<bool>(out);
}

int report(const tsblob::Error& error) {
    fprintf(stderr, "tsblob-cli: %s\n", tsblob::to_string(error).c_str());
    return kExitStoreError;
}

// Emits the blob of a get/latest command; a NULL row produces no output.
int emit(const tsblob::CliConfig& cfg, const std::optional<tsblob::Bytes>& data) {
    if (!data) {
        spdlog::info("Blob for key {} is stored without content", cfg.key);
        return kExitOk;
    }
    if (!write_output(cfg.output, *data)) {
        fprintf(stderr, "tsblob-cli: failed to write %s\n", cfg.output.c_str());
        return kExitStoreError;
    }
    return kExitOk;
}

int run(const tsblob::CliConfig& cfg, tsblob::BlobStore& store) {
    using tsblob::CliCommand;
    using tsblob::Error;

    switch (cfg.command) {
        case CliCommand::Put: {
            auto data = read_input(cfg.input);
            if (!data) {
                fprintf(stderr, "tsblob-cli: cannot read %s\n", cfg.input.c_str());
                return kExitUsage;
            }
            if (auto err = store.add_file(cfg.key, *cfg.time_stamp, *data)) {
                return report(*err);
            }
            return kExitOk;
        }

        case CliCommand::Get: {
            auto result = store.retrieve_file(cfg.key, *cfg.time_stamp);
            if (auto* err = std::get_if<Error>(&result)) {
                return report(*err);
            }
            return emit(cfg, std::get<std::optional<tsblob::Bytes>>(result));
        }

        case CliCommand::Latest: {
            auto result = store.retrieve_latest(cfg.key);
            if (auto* err = std::get_if<Error>(&result)) {
                return report(*err);
            }
            const auto& latest = std::get<tsblob::LatestBlob>(result);
            spdlog::info("Newest blob for key {} is at {}", cfg.key,
                         tsblob::format_time_stamp(latest.time_stamp));
            return emit(cfg, latest.data);
        }

        case CliCommand::List: {
            const auto mode = cfg.strict ? tsblob::ListMode::Strict : tsblob::ListMode::BestEffort;
            auto result = store.list_all(mode);
            if (auto* err = std::get_if<Error>(&result)) {
                return report(*err);
            }
            const auto& listing = std::get<tsblob::Listing>(result);
            for (const auto& entry : listing.entries) {
                fprintf(stdout, "%s\t%s\n",
                        tsblob::format_time_stamp(entry.time_stamp).c_str(), entry.key.c_str());
            }
            if (listing.skipped > 0) {
                fprintf(stderr, "tsblob-cli: %zu undecodable row(s) skipped\n", listing.skipped);
            }
            return kExitOk;
        }

        case CliCommand::Remove: {
            if (auto err = store.remove_file(cfg.key, *cfg.time_stamp)) {
                return report(*err);
            }
            return kExitOk;
        }

        case CliCommand::Purge: {
            auto result = store.purge_older_than(*cfg.before);
            if (auto* err = std::get_if<Error>(&result)) {
                return report(*err);
            }
            fprintf(stdout, "%zu blob(s) removed\n", std::get<std::size_t>(result));
            return kExitOk;
        }
    }
    return kExitUsage;
}

} // anonymous namespace

// ── main ──────────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
    tsblob::CliConfig cfg;
    try {
        cfg = tsblob::parse_cli(argc, argv);
    } catch (const std::runtime_error& e) {
        fprintf(stderr, "%s\n", e.what());
        return kExitUsage;
    }

    tsblob::init_default_logger(tsblob::parse_log_level(cfg.log_level));

    spdlog::debug("tsblob-cli {} on {}", tsblob::command_name(cfg.command), cfg.db_path);

    auto connected = tsblob::BlobStore::connect(cfg.db_path);
    if (auto* err = std::get_if<tsblob::Error>(&connected)) {
        return report(*err);
    }

    // The store is released (and the retention sweep run) when `connected`
    // goes out of scope.
    return run(cfg, std::get<tsblob::BlobStore>(connected));
}
