// Throughput benchmark for the blob store.
//
// Opens a fresh database, then runs three phases against it:
//   (1) add_file      N blobs of --size bytes
//   (2) retrieve_file the same N blobs
//   (3) list_all      once, timed as a single operation
//
// Prints: total ops, elapsed time, ops/sec, and latency percentiles (p50,
// p90, p99, p999) for each phase.

#include "common/error.hpp"
#include "common/logger.hpp"
#include "common/time_stamp.hpp"
#include "storage/blob_store.hpp"

#include <boost/program_options.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <numeric>
#include <random>
#include <sstream>
#include <string>
#include <system_error>
#include <variant>
#include <vector>

namespace {

namespace po = boost::program_options;
namespace fs = std::filesystem;

using clock = std::chrono::high_resolution_clock;
using ns    = std::chrono::nanoseconds;

// ── Stats helpers ────────────────────────────────────────────────────────────

struct BenchResult {
    std::size_t total_ops{};
    double elapsed_sec{};
    double ops_per_sec{};
    double p50_us{};
    double p90_us{};
    double p99_us{};
    double p999_us{};
    double avg_us{};
};

BenchResult compute_stats(std::vector<int64_t>& latencies_ns) {
    BenchResult r;
    r.total_ops = latencies_ns.size();

    if (latencies_ns.empty()) return r;

    std::sort(latencies_ns.begin(), latencies_ns.end());

    auto total_ns = std::accumulate(latencies_ns.begin(), latencies_ns.end(), int64_t{0});
    r.elapsed_sec = static_cast<double>(total_ns) / 1e9;
    r.ops_per_sec = r.elapsed_sec > 0 ? static_cast<double>(r.total_ops) / r.elapsed_sec : 0.0;
    r.avg_us      = static_cast<double>(total_ns) / static_cast<double>(r.total_ops) / 1000.0;

    auto percentile = [&](double p) -> double {
        auto idx = static_cast<std::size_t>(p * static_cast<double>(latencies_ns.size() - 1));
        return static_cast<double>(latencies_ns[idx]) / 1000.0; // ns → µs
    };

    r.p50_us  = percentile(0.50);
    r.p90_us  = percentile(0.90);
    r.p99_us  = percentile(0.99);
    r.p999_us = percentile(0.999);

    return r;
}

void print_result(const char* label, const BenchResult& r) {
    fprintf(stdout,
        "\n── %s ──\n"
        "  Total ops:    %zu\n"
        "  Elapsed:      %.3f s\n"
        "  Throughput:   %.0f ops/sec\n"
        "  Avg latency:  %.1f µs\n"
        "  p50:          %.1f µs\n"
        "  p90:          %.1f µs\n"
        "  p99:          %.1f µs\n"
        "  p99.9:        %.1f µs\n",
        label, r.total_ops, r.elapsed_sec, r.ops_per_sec,
        r.avg_us, r.p50_us, r.p90_us, r.p99_us, r.p999_us);
}

// Half random, half repeated text, so the codec has something to squeeze.
tsblob::Bytes make_payload(std::size_t size, std::mt19937& rng) {
    tsblob::Bytes payload(size);
    std::uniform_int_distribution<int> byte{0, 255};
    for (std::size_t i = 0; i < size; ++i) {
        payload[i] = (i % 2 == 0) ? static_cast<std::uint8_t>(byte(rng))
                                  : static_cast<std::uint8_t>('a' + i % 26);
    }
    return payload;
}

// Keys repeat every 16 blobs; time stamps are distinct seconds in the recent
// past so the release-time sweep leaves them alone.
tsblob::BlobId blob_id(std::size_t i, tsblob::TimeStamp base) {
    return tsblob::BlobId{"file" + std::to_string(i % 16) + ".bin",
                          base + std::chrono::seconds{static_cast<int64_t>(i)}};
}

// ── Benchmark runners ────────────────────────────────────────────────────────

BenchResult bench_add(tsblob::BlobStore& store, std::size_t count,
                      const tsblob::Bytes& payload, tsblob::TimeStamp base) {
    std::vector<int64_t> latencies;
    latencies.reserve(count);

    for (std::size_t i = 0; i < count; ++i) {
        const auto id = blob_id(i, base);
        auto t0 = clock::now();
        auto err = store.add_file(id.key, id.time_stamp, payload);
        auto t1 = clock::now();
        if (err) {
            spdlog::error("add_file failed: {}", tsblob::to_string(*err));
            break;
        }
        latencies.push_back(std::chrono::duration_cast<ns>(t1 - t0).count());
    }

    return compute_stats(latencies);
}

BenchResult bench_retrieve(tsblob::BlobStore& store, std::size_t count, tsblob::TimeStamp base) {
    std::vector<int64_t> latencies;
    latencies.reserve(count);

    for (std::size_t i = 0; i < count; ++i) {
        const auto id = blob_id(i, base);
        auto t0 = clock::now();
        auto result = store.retrieve_file(id.key, id.time_stamp);
        auto t1 = clock::now();
        if (const auto* err = std::get_if<tsblob::Error>(&result)) {
            spdlog::error("retrieve_file failed: {}", tsblob::to_string(*err));
            break;
        }
        latencies.push_back(std::chrono::duration_cast<ns>(t1 - t0).count());
    }

    return compute_stats(latencies);
}

BenchResult bench_list(tsblob::BlobStore& store) {
    std::vector<int64_t> latencies;
    auto t0 = clock::now();
    auto result = store.list_all();
    auto t1 = clock::now();
    if (const auto* err = std::get_if<tsblob::Error>(&result)) {
        spdlog::error("list_all failed: {}", tsblob::to_string(*err));
    } else {
        latencies.push_back(std::chrono::duration_cast<ns>(t1 - t0).count());
    }
    return compute_stats(latencies);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    po::options_description desc("tsblob-bench options");
    desc.add_options()
        ("help,h",                                                      "Show this help")
        ("db",    po::value<std::string>()->default_value("tsblob-bench.db"), "Database file (recreated)")
        ("count,n", po::value<std::size_t>()->default_value(10'000),   "Number of blobs")
        ("size,s",  po::value<std::size_t>()->default_value(4096),     "Blob size in bytes")
        ("log-level,l", po::value<std::string>()->default_value("warn"), "Log level");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        fprintf(stderr, "Argument error: %s\n", e.what());
        return 1;
    }

    if (vm.count("help")) {
        std::ostringstream oss;
        oss << desc;
        fprintf(stdout, "%s\n", oss.str().c_str());
        return 0;
    }

    const fs::path db_path{vm["db"].as<std::string>()};
    const auto count = vm["count"].as<std::size_t>();
    const auto size  = vm["size"].as<std::size_t>();

    tsblob::init_default_logger(tsblob::parse_log_level(vm["log-level"].as<std::string>()));

    fprintf(stdout,
        "Blob Store Benchmark\n"
        "====================\n"
        "Blobs:    %zu x %zu bytes\n"
        "Database: %s\n",
        count, size, db_path.string().c_str());

    std::error_code ec;
    fs::remove(db_path, ec);

    std::mt19937 rng{42};
    const auto payload = make_payload(size, rng);
    const auto base = tsblob::from_unix_seconds(
        tsblob::to_unix_seconds(std::chrono::system_clock::now()) -
        static_cast<int64_t>(count) - 60);

    BenchResult add_result;
    BenchResult retrieve_result;
    BenchResult list_result;
    {
        auto connected = tsblob::BlobStore::connect(db_path);
        if (const auto* err = std::get_if<tsblob::Error>(&connected)) {
            fprintf(stderr, "Cannot open %s: %s\n", db_path.string().c_str(),
                    tsblob::to_string(*err).c_str());
            return 1;
        }
        auto& store = std::get<tsblob::BlobStore>(connected);

        add_result      = bench_add(store, count, payload, base);
        retrieve_result = bench_retrieve(store, count, base);
        list_result     = bench_list(store);
    }

    print_result("add_file", add_result);
    print_result("retrieve_file", retrieve_result);
    print_result("list_all", list_result);

    fprintf(stdout, "\n  Database size: %ju bytes\n\n",
            static_cast<std::uintmax_t>(fs::file_size(db_path, ec)));

    return 0;
}
