// End-to-end tests for tsblob-cli: run the binary as a child process and check
// exit codes and what it writes to stdout.
//
// The binary path is baked in by the build (TSBLOB_CLI_BINARY).  If it is not
// found, the tests are skipped.

#include "common/time_stamp.hpp"
#include "storage/sqlite.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

namespace fs = std::filesystem;

constexpr int kExitOk         = 0;
constexpr int kExitUsage      = 1;
constexpr int kExitStoreError = 2;

const fs::path kCliBinary = TSBLOB_CLI_BINARY;

struct RunResult {
    int         exit_code = -1;
    std::string out;
};

std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// ── Fixture ───────────────────────────────────────────────────────────────────

class CliTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!fs::exists(kCliBinary)) {
            GTEST_SKIP() << "tsblob-cli binary not found at " << kCliBinary;
        }
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() / (std::string("tsblob_cli_") + info->name());
        std::error_code ec;
        fs::remove_all(dir_, ec);
        fs::create_directories(dir_);
        db_ = (dir_ / "files.db").string();
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    // Runs tsblob-cli with `args`; stdout is captured, stderr discarded.
    RunResult run(std::vector<std::string> args) {
        const auto out_path = dir_ / "stdout.txt";
        args.insert(args.begin(), "tsblob-cli");

        std::vector<char*> argv;
        for (auto& a : args) {
            argv.push_back(a.data());
        }
        argv.push_back(nullptr);

        RunResult result;
        pid_t pid = fork();
        if (pid == 0) {
            // Child process: redirect and exec tsblob-cli.
            int out = ::open(out_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
            int null = ::open("/dev/null", O_RDWR);
            if (out < 0 || null < 0) {
                _exit(127);
            }
            dup2(null, STDIN_FILENO);
            dup2(out, STDOUT_FILENO);
            dup2(null, STDERR_FILENO);
            execv(kCliBinary.c_str(), argv.data());
            _exit(127); // execv failed
        }
        if (pid < 0) {
            ADD_FAILURE() << "fork failed";
            return result;
        }

        int status = 0;
        waitpid(pid, &status, 0);
        if (WIFEXITED(status)) {
            result.exit_code = WEXITSTATUS(status);
        }
        result.out = read_file(out_path);
        return result;
    }

    fs::path    dir_;
    std::string db_;
};

// ── Exit codes ────────────────────────────────────────────────────────────────

TEST_F(CliTest, PutThenGetRoundTripsFileContent) {
    const auto in = dir_ / "in.txt";
    std::ofstream(in, std::ios::binary) << "hello";

    auto put = run({"--db", db_, "put", "--key", "report.txt",
                    "--time", "2023-01-01T00:00:00", "--in", in.string()});
    EXPECT_EQ(put.exit_code, kExitOk);

    auto get = run({"--db", db_, "get", "--key", "report.txt", "--time", "2023-01-01T00:00:00"});
    EXPECT_EQ(get.exit_code, kExitOk);
    EXPECT_EQ(get.out, "hello");
}

TEST_F(CliTest, ArgumentErrorExitsWithUsageCode) {
    EXPECT_EQ(run({"--db", db_, "frobnicate"}).exit_code, kExitUsage);
    EXPECT_EQ(run({"--db", db_, "get", "--key", "k"}).exit_code, kExitUsage);
    EXPECT_EQ(run({"list"}).exit_code, kExitUsage);
}

TEST_F(CliTest, MissingBlobExitsWithStoreErrorCode) {
    auto get = run({"--db", db_, "get", "--key", "absent", "--time", "2023-01-01"});
    EXPECT_EQ(get.exit_code, kExitStoreError);
    EXPECT_TRUE(get.out.empty());

    EXPECT_EQ(run({"--db", db_, "latest", "--key", "absent"}).exit_code, kExitStoreError);
    EXPECT_EQ(run({"--db", db_, "rm", "--key", "absent", "--time", "2023-01-01"}).exit_code,
              kExitStoreError);
}

TEST_F(CliTest, GetOfNullRowPrintsNothing) {
    ASSERT_EQ(run({"--db", db_, "list"}).exit_code, kExitOk); // creates the schema

    const auto seconds = tsblob::to_unix_seconds(tsblob::make_time_stamp(2023, 1, 1));
    {
        auto opened = tsblob::sqlite::Connection::open(db_);
        ASSERT_TRUE(tsblob::is_ok(opened));
        auto err = std::get<tsblob::sqlite::Connection>(opened).exec(
            "INSERT INTO files (key, time_stamp, data) VALUES ('placeholder', " +
            std::to_string(seconds) + ", NULL)");
        ASSERT_FALSE(err.has_value());
    }

    auto get = run({"--db", db_, "get", "--key", "placeholder", "--time", "2023-01-01"});
    EXPECT_EQ(get.exit_code, kExitOk);
    EXPECT_TRUE(get.out.empty());
}

// ── Output format ─────────────────────────────────────────────────────────────

TEST_F(CliTest, ListPrintsTimeStampTabKeyLines) {
    // Recent enough that the retention sweep keeps it.
    const auto ts = tsblob::from_unix_seconds(
        tsblob::to_unix_seconds(std::chrono::system_clock::now()) - 3600);
    const auto when = "@" + std::to_string(tsblob::to_unix_seconds(ts));

    const auto in = dir_ / "in.txt";
    std::ofstream(in, std::ios::binary) << "x";
    ASSERT_EQ(run({"--db", db_, "put", "--key", "notes.md", "--time", when,
                   "--in", in.string()}).exit_code, kExitOk);

    auto list = run({"--db", db_, "list"});
    EXPECT_EQ(list.exit_code, kExitOk);
    EXPECT_EQ(list.out, tsblob::format_time_stamp(ts) + "\tnotes.md\n");
}

TEST_F(CliTest, PurgeReportsRemovedCount) {
    const auto in = dir_ / "in.txt";
    std::ofstream(in, std::ios::binary) << "x";
    const auto recent = "@" + std::to_string(
        tsblob::to_unix_seconds(std::chrono::system_clock::now()) - 60);
    ASSERT_EQ(run({"--db", db_, "put", "--key", "a", "--time", recent,
                   "--in", in.string()}).exit_code, kExitOk);

    auto purge = run({"--db", db_, "purge", "--before", "2000-01-01"});
    EXPECT_EQ(purge.exit_code, kExitOk);
    EXPECT_EQ(purge.out, "0 blob(s) removed\n");
}

} // anonymous namespace
