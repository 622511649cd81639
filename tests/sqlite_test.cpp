#include "storage/sqlite.hpp"

#include <string>

#include <gtest/gtest.h>
#include <sqlite3.h>

namespace tsblob::sqlite {

// ── Fixture ─────────────────────────────────────────────────────────────────
// In-memory database with a scratch table.

class SqliteTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto opened = Connection::open(":memory:");
        ASSERT_TRUE(is_ok(opened)) << to_string(std::get<Error>(opened));
        conn_ = std::move(std::get<Connection>(opened));
        auto err = conn_.exec("CREATE TABLE t (a TEXT, b INTEGER, c BLOB)");
        ASSERT_FALSE(err.has_value()) << to_string(*err);
    }

    Statement prepare(const std::string& sql) {
        auto prepared = conn_.prepare(sql);
        EXPECT_TRUE(is_ok(prepared));
        return std::move(std::get<Statement>(prepared));
    }

    Connection conn_;
};

TEST_F(SqliteTest, BindAndReadBackTypedColumns) {
    auto insert = prepare("INSERT INTO t (a, b, c) VALUES (?1, ?2, ?3)");
    const Bytes blob{0x00, 0x01, 0xfe, 0xff};
    EXPECT_FALSE(insert.bind_text(1, "alpha").has_value());
    EXPECT_FALSE(insert.bind_int64(2, -1234567890123).has_value());
    EXPECT_FALSE(insert.bind_blob(3, blob).has_value());
    auto done = insert.step();
    ASSERT_TRUE(is_ok(done));
    EXPECT_EQ(std::get<StepResult>(done), StepResult::Done);
    EXPECT_EQ(conn_.changes(), 1);

    auto select = prepare("SELECT a, b, c FROM t");
    auto row = select.step();
    ASSERT_TRUE(is_ok(row));
    ASSERT_EQ(std::get<StepResult>(row), StepResult::Row);
    EXPECT_EQ(select.column_type(0), ColumnType::Text);
    EXPECT_EQ(select.column_type(1), ColumnType::Integer);
    EXPECT_EQ(select.column_type(2), ColumnType::Blob);
    EXPECT_EQ(select.column_text(0), "alpha");
    EXPECT_EQ(select.column_int64(1), -1234567890123);
    EXPECT_EQ(select.column_blob(2), blob);

    auto end = select.step();
    ASSERT_TRUE(is_ok(end));
    EXPECT_EQ(std::get<StepResult>(end), StepResult::Done);
}

TEST_F(SqliteTest, EmptyTextAndBlobAreNotNull) {
    auto insert = prepare("INSERT INTO t (a, b, c) VALUES (?1, 0, ?2)");
    EXPECT_FALSE(insert.bind_text(1, std::string_view{}).has_value());
    EXPECT_FALSE(insert.bind_blob(2, Bytes{}).has_value());
    ASSERT_TRUE(is_ok(insert.step()));

    auto select = prepare("SELECT a, c FROM t");
    ASSERT_TRUE(is_ok(select.step()));
    EXPECT_EQ(select.column_type(0), ColumnType::Text);
    EXPECT_EQ(select.column_type(1), ColumnType::Blob);
    EXPECT_TRUE(select.column_text(0).empty());
    EXPECT_TRUE(select.column_blob(1).empty());
}

TEST_F(SqliteTest, NullIsReportedAsNullColumn) {
    auto insert = prepare("INSERT INTO t (a, b, c) VALUES ('k', 1, ?1)");
    EXPECT_FALSE(insert.bind_null(1).has_value());
    ASSERT_TRUE(is_ok(insert.step()));

    auto select = prepare("SELECT c FROM t");
    ASSERT_TRUE(is_ok(select.step()));
    EXPECT_EQ(select.column_type(0), ColumnType::Null);
}

TEST_F(SqliteTest, TextWithEmbeddedNulSurvives) {
    const std::string key("a\0b", 3);
    auto insert = prepare("INSERT INTO t (a, b) VALUES (?1, 1)");
    EXPECT_FALSE(insert.bind_text(1, key).has_value());
    ASSERT_TRUE(is_ok(insert.step()));

    auto select = prepare("SELECT a FROM t");
    ASSERT_TRUE(is_ok(select.step()));
    EXPECT_EQ(select.column_text(0), key);
}

TEST_F(SqliteTest, PrepareErrorIsInternalError) {
    auto prepared = conn_.prepare("SELECT * FROM no_such_table");
    ASSERT_TRUE(holds_error<InternalError>(prepared));
    const auto& err = std::get<InternalError>(std::get<Error>(prepared));
    EXPECT_EQ(err.origin, "sqlite");
    EXPECT_EQ(err.code, SQLITE_ERROR);
    EXPECT_NE(err.message.find("no_such_table"), std::string::npos);
}

TEST_F(SqliteTest, ExecErrorIsInternalError) {
    auto err = conn_.exec("THIS IS NOT SQL");
    ASSERT_TRUE(holds_error<InternalError>(err));
    EXPECT_EQ(std::get<InternalError>(*err).origin, "sqlite");
}

TEST_F(SqliteTest, ConstraintViolationCarriesExtendedCode) {
    ASSERT_FALSE(conn_.exec("CREATE TABLE u (k TEXT PRIMARY KEY)").has_value());
    ASSERT_FALSE(conn_.exec("INSERT INTO u VALUES ('x')").has_value());

    auto insert = prepare("INSERT INTO u VALUES ('x')");
    auto stepped = insert.step();
    ASSERT_TRUE(holds_error<InternalError>(stepped));
    EXPECT_EQ(std::get<InternalError>(std::get<Error>(stepped)).code, SQLITE_CONSTRAINT_PRIMARYKEY);
}

TEST_F(SqliteTest, MovedFromConnectionIsClosed) {
    Connection other = std::move(conn_);
    EXPECT_TRUE(other.is_open());
    EXPECT_FALSE(conn_.is_open());
}

} // namespace tsblob::sqlite
