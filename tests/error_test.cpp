#include "common/error.hpp"
#include "common/time_stamp.hpp"

#include <string>

#include <gtest/gtest.h>

namespace tsblob {

// ── to_string() ───────────────────────────────────────────────────────────────

TEST(ErrorTest, GeneralErrorRendersMessageVerbatim) {
    EXPECT_EQ(to_string(make_general_error("something went wrong")), "something went wrong");
}

TEST(ErrorTest, InternalErrorRendersOriginAndCode) {
    const Error err = make_internal_error("sqlite", 1555, "UNIQUE constraint failed: files.key");
    EXPECT_EQ(to_string(err), "sqlite error (1555): UNIQUE constraint failed: files.key");
}

TEST(ErrorTest, NoMatchRendersKey) {
    EXPECT_EQ(to_string(Error{NoMatch{"photo.jpg"}}), "No match found for key photo.jpg");
}

TEST(ErrorTest, TimeStampNotAvailableRendersKeyAndTime) {
    const Error err = TimeStampNotAvailable{"report.txt", make_time_stamp(2023, 1, 2)};
    EXPECT_EQ(to_string(err),
              "No data available for key report.txt and time stamp 2023-01-02 00:00:00");
}

// ── Result / Status helpers ───────────────────────────────────────────────────

TEST(ErrorTest, HoldsErrorDistinguishesKinds) {
    const Error err = NoMatch{"k"};
    EXPECT_TRUE(holds_error<NoMatch>(err));
    EXPECT_FALSE(holds_error<TimeStampNotAvailable>(err));
    EXPECT_FALSE(holds_error<InternalError>(err));
}

TEST(ErrorTest, StatusHelpers) {
    const Status ok;
    const Status failed = make_general_error("bad");
    EXPECT_FALSE(holds_error<GeneralError>(ok));
    EXPECT_TRUE(holds_error<GeneralError>(failed));
    EXPECT_FALSE(holds_error<InternalError>(failed));
}

TEST(ErrorTest, ResultHelpers) {
    const Result<int> value = 42;
    const Result<int> failure = make_internal_error("zlib", -3, "data error");

    EXPECT_TRUE(is_ok(value));
    EXPECT_FALSE(holds_error<InternalError>(value));

    EXPECT_FALSE(is_ok(failure));
    EXPECT_TRUE(holds_error<InternalError>(failure));
    EXPECT_EQ(std::get<InternalError>(std::get<Error>(failure)).code, -3);
}

} // namespace tsblob
