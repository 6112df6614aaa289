#include <gtest/gtest.h>

#include "qfab/execution/execution_context.h"
#include "qfab/table/mem_table.h"
#include "test_util/fixtures.h"

namespace qfab {
namespace sql {
namespace {

using testutil::Int64Array;
using testutil::Int64Column;
using testutil::LogBatch;
using testutil::LogSchema;
using testutil::StringArray;
using testutil::StringColumn;

class SqlQueryTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto runtime = execution::CreateRuntimeEnv(0);
        ASSERT_TRUE(runtime.ok()) << runtime.error();
        ctx_ = std::make_unique<execution::ExecutionContext>(execution::CreateSessionConfig(false, 2),
                                                             runtime.take_value());
        ASSERT_TRUE(execution::RegisterDefaultFunctions(*ctx_).ok());

        auto logs = table::MemTable::Make(LogSchema(), {
            LogBatch({1, 2, 3}, {"info", "error", "info"}, {10, 20, 30}),
            LogBatch({4, 5, 6}, {"warn", "error", "debug"}, {40, 50, 60}),
        });
        ASSERT_TRUE(logs.ok()) << logs.error();
        ASSERT_TRUE(ctx_->RegisterTable("logs", logs.take_value()).ok());

        auto levels_schema = arrow::schema({arrow::field("name", arrow::utf8()),
                                            arrow::field("severity", arrow::int64())});
        auto levels_batch = arrow::RecordBatch::Make(
            levels_schema, 4,
            {StringArray({"info", "warn", "error", std::nullopt}), Int64Array({1, 2, 3, std::nullopt})});
        auto levels = table::MemTable::Make(levels_schema, {levels_batch});
        ASSERT_TRUE(levels.ok()) << levels.error();
        ASSERT_TRUE(ctx_->RegisterTable("levels", levels.take_value()).ok());
    }

    std::shared_ptr<arrow::Table> Run(const std::string& sql) {
        auto result = ctx_->ExecuteToTable(sql);
        EXPECT_TRUE(result.ok()) << sql << ": " << result.error();
        return result.ok() ? result.value() : nullptr;
    }

    std::unique_ptr<execution::ExecutionContext> ctx_;
};

TEST_F(SqlQueryTest, Distinct) {
    auto table = Run("SELECT DISTINCT level FROM logs ORDER BY level");
    ASSERT_NE(table, nullptr);
    EXPECT_EQ(table->num_columns(), 1);
    EXPECT_EQ(StringColumn(*table, "level"), (std::vector<std::string>{"debug", "error", "info", "warn"}));
}

TEST_F(SqlQueryTest, DistinctRejectsHiddenSortKey) {
    auto result = ctx_->ExecuteToTable("SELECT DISTINCT level FROM logs ORDER BY value");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), core::Error::Code::PLANNING_FAILURE);
}

TEST_F(SqlQueryTest, InListAndSubquery) {
    auto listed = Run("SELECT value FROM logs WHERE level IN ('warn', 'debug') ORDER BY value");
    ASSERT_NE(listed, nullptr);
    EXPECT_EQ(Int64Column(*listed, "value"), (std::vector<int64_t>{40, 60}));

    auto negated = Run("SELECT value FROM logs WHERE level NOT IN ('info', 'error') ORDER BY value");
    ASSERT_NE(negated, nullptr);
    EXPECT_EQ(Int64Column(*negated, "value"), (std::vector<int64_t>{40, 60}));

    auto sub = Run("SELECT value FROM logs WHERE level IN (SELECT name FROM levels WHERE severity >= 2) "
                   "ORDER BY value");
    ASSERT_NE(sub, nullptr);
    EXPECT_EQ(Int64Column(*sub, "value"), (std::vector<int64_t>{20, 40, 50}));

    // The subquery yields a NULL, so NOT IN is never true
    auto none = Run("SELECT value FROM logs WHERE level NOT IN (SELECT name FROM levels)");
    ASSERT_NE(none, nullptr);
    EXPECT_EQ(none->num_rows(), 0);
}

TEST_F(SqlQueryTest, PatternMatching) {
    auto like = Run("SELECT value FROM logs WHERE level LIKE 'in%' ORDER BY value");
    ASSERT_NE(like, nullptr);
    EXPECT_EQ(Int64Column(*like, "value"), (std::vector<int64_t>{10, 30}));

    auto ilike = Run("SELECT value FROM logs WHERE level ILIKE 'ERR%' ORDER BY value");
    ASSERT_NE(ilike, nullptr);
    EXPECT_EQ(Int64Column(*ilike, "value"), (std::vector<int64_t>{20, 50}));

    auto substring = Run("SELECT value FROM logs WHERE str_match(level, 'rr') ORDER BY value");
    ASSERT_NE(substring, nullptr);
    EXPECT_EQ(Int64Column(*substring, "value"), (std::vector<int64_t>{20, 50}));

    auto regex = Run("SELECT value FROM logs WHERE re_match(level, '^(warn|debug)$') ORDER BY value");
    ASSERT_NE(regex, nullptr);
    EXPECT_EQ(Int64Column(*regex, "value"), (std::vector<int64_t>{40, 60}));
}

TEST_F(SqlQueryTest, Cast) {
    auto table = Run("SELECT CAST(value AS double) AS v FROM logs WHERE _timestamp = 1");
    ASSERT_NE(table, nullptr);
    ASSERT_EQ(table->num_rows(), 1);
    EXPECT_TRUE(table->schema()->field(0)->type()->Equals(arrow::float64()));
    auto doubles = std::static_pointer_cast<arrow::DoubleArray>(table->column(0)->chunk(0));
    EXPECT_DOUBLE_EQ(doubles->Value(0), 10.0);

    auto bad = ctx_->ExecuteToTable("SELECT CAST(value AS blob) FROM logs");
    ASSERT_FALSE(bad.ok());
    EXPECT_EQ(bad.error_code(), core::Error::Code::PLANNING_FAILURE);
}

TEST_F(SqlQueryTest, LeftJoin) {
    auto table = Run("SELECT l.value, v.severity FROM logs l LEFT JOIN levels v ON l.level = v.name "
                     "ORDER BY l.value");
    ASSERT_NE(table, nullptr);
    ASSERT_EQ(table->num_rows(), 6);
    EXPECT_EQ(Int64Column(*table, "value"), (std::vector<int64_t>{10, 20, 30, 40, 50, 60}));
    auto severity = table->GetColumnByName("severity");
    ASSERT_NE(severity, nullptr);
    auto combined = arrow::Concatenate(severity->chunks());
    ASSERT_TRUE(combined.ok());
    auto ints = std::static_pointer_cast<arrow::Int64Array>(*combined);
    EXPECT_EQ(ints->Value(0), 1);
    EXPECT_EQ(ints->Value(1), 3);
    EXPECT_TRUE(ints->IsNull(5));
}

TEST_F(SqlQueryTest, OrderByPositionAndHiddenKey) {
    auto by_position = Run("SELECT level, value FROM logs ORDER BY 2 DESC LIMIT 2");
    ASSERT_NE(by_position, nullptr);
    EXPECT_EQ(Int64Column(*by_position, "value"), (std::vector<int64_t>{60, 50}));

    auto hidden = Run("SELECT level FROM logs ORDER BY value DESC LIMIT 3");
    ASSERT_NE(hidden, nullptr);
    EXPECT_EQ(hidden->num_columns(), 1);
    EXPECT_EQ(StringColumn(*hidden, "level"), (std::vector<std::string>{"debug", "error", "warn"}));

    auto out_of_range = ctx_->ExecuteToTable("SELECT level FROM logs ORDER BY 3");
    ASSERT_FALSE(out_of_range.ok());
    EXPECT_EQ(out_of_range.error_code(), core::Error::Code::PLANNING_FAILURE);
}

TEST_F(SqlQueryTest, DescendingPutsNullsFirst) {
    auto table = Run("SELECT name FROM levels ORDER BY severity DESC");
    ASSERT_NE(table, nullptr);
    EXPECT_EQ(StringColumn(*table, "name"), (std::vector<std::string>{"<null>", "error", "warn", "info"}));

    auto last = Run("SELECT name FROM levels ORDER BY severity DESC NULLS LAST");
    ASSERT_NE(last, nullptr);
    EXPECT_EQ(StringColumn(*last, "name"), (std::vector<std::string>{"error", "warn", "info", "<null>"}));
}

TEST_F(SqlQueryTest, LimitOffset) {
    auto table = Run("SELECT value FROM logs ORDER BY value LIMIT 2 OFFSET 3");
    ASSERT_NE(table, nullptr);
    EXPECT_EQ(Int64Column(*table, "value"), (std::vector<int64_t>{40, 50}));

    auto past_end = Run("SELECT value FROM logs ORDER BY value OFFSET 10");
    ASSERT_NE(past_end, nullptr);
    EXPECT_EQ(past_end->num_rows(), 0);
}

TEST_F(SqlQueryTest, CountStarIsNotNullable) {
    auto table = Run("SELECT count(*) AS n, count(severity) AS c FROM levels");
    ASSERT_NE(table, nullptr);
    EXPECT_FALSE(table->schema()->GetFieldByName("n")->nullable());
    EXPECT_EQ(Int64Column(*table, "n"), (std::vector<int64_t>{4}));
    EXPECT_EQ(Int64Column(*table, "c"), (std::vector<int64_t>{3}));
}

TEST_F(SqlQueryTest, DialectDecidesIdentifierCase) {
    auto schema = arrow::schema({arrow::field("HostName", arrow::utf8()), arrow::field("Code", arrow::int64())});
    auto batch = arrow::RecordBatch::Make(schema, 3, {StringArray({"a", "b", "a"}), Int64Array({200, 500, 404})});

    auto session = execution::CreateSessionConfig(false, 2);
    session.dialect = execution::SqlDialect::GENERIC;
    auto runtime = execution::CreateRuntimeEnv(0);
    ASSERT_TRUE(runtime.ok()) << runtime.error();
    execution::ExecutionContext generic(session, runtime.take_value());
    ASSERT_TRUE(execution::RegisterDefaultFunctions(generic).ok());
    auto hosts = table::MemTable::Make(schema, {batch});
    ASSERT_TRUE(hosts.ok()) << hosts.error();
    ASSERT_TRUE(generic.RegisterTable("Hosts", hosts.value()).ok());
    ASSERT_TRUE(ctx_->RegisterTable("Hosts", hosts.value()).ok());

    const std::string sql =
        "SELECT HostName, COUNT(*) AS n FROM Hosts WHERE Code > 250 GROUP BY HostName ORDER BY HostName";
    auto kept = generic.ExecuteToTable(sql);
    ASSERT_TRUE(kept.ok()) << kept.error();
    EXPECT_EQ(StringColumn(*kept.value(), "HostName"), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(Int64Column(*kept.value(), "n"), (std::vector<int64_t>{1, 1}));

    // PostgreSQL folds the unquoted names, which then match nothing
    auto folded = ctx_->ExecuteToTable(sql);
    ASSERT_FALSE(folded.ok());
    EXPECT_EQ(folded.error_code(), core::Error::Code::PLANNING_FAILURE);

    auto quoted = Run("SELECT \"HostName\" FROM \"Hosts\" WHERE \"Code\" > 250 ORDER BY \"HostName\"");
    ASSERT_NE(quoted, nullptr);
    EXPECT_EQ(StringColumn(*quoted, "HostName"), (std::vector<std::string>{"a", "b"}));
}

TEST_F(SqlQueryTest, UnknownNamesFailPlanning) {
    for (const char* sql : {"SELECT nope FROM logs", "SELECT value FROM nope", "SELECT no_such_fn(value) FROM logs",
                            "SELECT sum(level) FROM logs", "SELECT x.value FROM logs"}) {
        auto result = ctx_->ExecuteToTable(sql);
        ASSERT_FALSE(result.ok()) << sql;
        EXPECT_EQ(result.error_code(), core::Error::Code::PLANNING_FAILURE) << sql;
    }
}

} // namespace
} // namespace sql
} // namespace qfab
