#include <gtest/gtest.h>

#include "qfab/plan/optimizer.h"
#include "qfab/plan/query_planner.h"
#include "qfab/table/mem_table.h"
#include "test_util/fixtures.h"

namespace qfab {
namespace plan {
namespace {

using testutil::Int64Array;
using testutil::StringArray;

std::shared_ptr<table::MemTable> KeyedTable(const std::vector<int64_t>& ids, const std::vector<std::string>& names) {
    auto schema = arrow::schema({arrow::field("id", arrow::int64()), arrow::field("name", arrow::utf8())});
    std::vector<std::optional<int64_t>> id_values(ids.begin(), ids.end());
    std::vector<std::optional<std::string>> name_values(names.begin(), names.end());
    auto batch = arrow::RecordBatch::Make(schema, static_cast<int64_t>(ids.size()),
                                          {Int64Array(id_values), StringArray(name_values)});
    auto made = table::MemTable::Make(schema, {batch});
    EXPECT_TRUE(made.ok());
    return made.take_value();
}

ExprPtr Greater(const arrow::Schema& schema, int column, int64_t value) {
    auto expr = MakeCall("greater", {MakeColumn(column, *schema.field(column)),
                                     MakeLiteral(std::make_shared<arrow::Int64Scalar>(value))}, schema);
    EXPECT_TRUE(expr.ok());
    return expr.value();
}

TaskContext DefaultTaskContext() {
    TaskContext ctx;
    ctx.runtime = std::make_shared<execution::RuntimeEnv>();
    ctx.runtime->memory_pool = execution::CreateMemoryPool(execution::MemoryPoolKind::GREEDY, 1 << 20);
    return ctx;
}

TEST(PushDownFilterTest, CopiesConjunctsIntoScan) {
    auto table = KeyedTable({1, 2, 3}, {"a", "b", "c"});
    auto scan = MakeTableScan("t", table);
    auto a = Greater(*scan->schema, 0, 1);
    auto b = Greater(*scan->schema, 0, 2);
    auto both = MakeCall("and_kleene", {a, b}, *scan->schema);
    ASSERT_TRUE(both.ok());
    auto filter = MakeFilter(scan, both.value());

    auto rewritten = PushDownFilter().Rewrite(filter);
    ASSERT_TRUE(rewritten.ok());
    const auto& out = rewritten.value();
    ASSERT_EQ(out->kind, LogicalPlan::Kind::FILTER);
    ASSERT_EQ(out->input()->filters.size(), 2u);
    // The filter stays and the original tree is untouched
    EXPECT_EQ(out->predicate, both.value());
    EXPECT_TRUE(scan->filters.empty());

    auto again = PushDownFilter().Rewrite(out);
    ASSERT_TRUE(again.ok());
    EXPECT_EQ(again.value(), out);
}

TEST(PushDownLimitTest, SortKeepsOnlySkipPlusFetch) {
    auto scan = MakeTableScan("t", KeyedTable({1}, {"a"}));
    SortExpr key;
    key.expr = MakeColumn(0, *scan->schema->field(0));
    auto sort = MakeSort(scan, {key}, std::nullopt);
    auto projection = MakeProjection(sort, {MakeColumn(1, *scan->schema->field(1))}, {"name"});
    auto limit = MakeLimit(projection, 5, 10);

    auto rewritten = PushDownLimit().Rewrite(limit);
    ASSERT_TRUE(rewritten.ok());
    const auto& new_sort = rewritten.value()->input()->input();
    ASSERT_EQ(new_sort->kind, LogicalPlan::Kind::SORT);
    EXPECT_EQ(new_sort->fetch, 15u);
    EXPECT_FALSE(sort->fetch.has_value());

    auto unbounded = PushDownLimit().Rewrite(MakeLimit(sort, 3, std::nullopt));
    ASSERT_TRUE(unbounded.ok());
    EXPECT_FALSE(unbounded.value()->input()->fetch.has_value());
}

TEST(OptimizeTest, AppliesRulesInOrder) {
    auto scan = MakeTableScan("t", KeyedTable({1, 2}, {"a", "b"}));
    auto filter = MakeFilter(scan, Greater(*scan->schema, 0, 1));
    auto optimized = Optimize(filter, DefaultOptimizerRules());
    ASSERT_TRUE(optimized.ok());
    EXPECT_EQ(optimized.value()->input()->filters.size(), 1u);
    EXPECT_NE(optimized.value()->ToString().find("Filter"), std::string::npos);
}

TEST(JoinReorderRuleTest, SmallerInputBecomesBuildSide) {
    auto small = std::make_shared<ScanExec>("small", KeyedTable({1, 2}, {"a", "b"}), std::vector<ExprPtr>{});
    auto big = std::make_shared<ScanExec>("big", KeyedTable({1, 2, 2, 3, 4}, {"w", "x", "y", "z", "q"}),
                                          std::vector<ExprPtr>{});
    auto join = std::make_shared<HashJoinExec>(small, big, JoinType::INNER, std::vector<std::pair<int, int>>{{0, 0}});

    execution::SessionConfig config;
    auto optimized = JoinReorderRule().Optimize(join, config);
    ASSERT_TRUE(optimized.ok());
    ASSERT_EQ(optimized.value()->name(), "ProjectionExec");
    auto swapped = std::dynamic_pointer_cast<HashJoinExec>(optimized.value()->children()[0]);
    ASSERT_NE(swapped, nullptr);
    EXPECT_EQ(swapped->right(), small);
    EXPECT_TRUE(optimized.value()->schema()->Equals(*join->schema()));

    // Column order survives the swap
    auto ctx = DefaultTaskContext();
    auto result = CollectPlan(SortExec(optimized.value(), {SortKeySpec{2, false, false}}, std::nullopt), ctx);
    ASSERT_TRUE(result.ok()) << result.error();
    ASSERT_EQ(result.value()->num_rows(), 3);
    auto first_names = std::static_pointer_cast<arrow::StringArray>(result.value()->column(1)->chunk(0));
    EXPECT_EQ(first_names->GetString(0), "a");

    auto kept = JoinReorderRule().Optimize(
        std::make_shared<HashJoinExec>(big, small, JoinType::INNER, std::vector<std::pair<int, int>>{{0, 0}}), config);
    ASSERT_TRUE(kept.ok());
    EXPECT_EQ(kept.value()->name(), "HashJoinExec");

    auto left_join = std::make_shared<HashJoinExec>(small, big, JoinType::LEFT, std::vector<std::pair<int, int>>{{0, 0}});
    auto unchanged = JoinReorderRule().Optimize(left_join, config);
    ASSERT_TRUE(unchanged.ok());
    EXPECT_EQ(unchanged.value(), left_join);
}

TEST(JoinMatchOneQueryPlannerTest, EachLeftRowMatchesOnce) {
    auto left = MakeTableScan("l", KeyedTable({1, 2}, {"a", "b"}));
    auto right = MakeTableScan("r", KeyedTable({1, 1, 2}, {"x", "y", "z"}));
    auto join = MakeJoin(left, right, JoinType::INNER, {{0, 0}});

    execution::SessionConfig config;
    config.skip_physical_aggregate_schema_check = true;
    auto ctx = DefaultTaskContext();

    auto plain = DefaultQueryPlanner().CreatePhysicalPlan(join, config);
    ASSERT_TRUE(plain.ok()) << plain.error();
    auto plain_rows = CollectPlan(*plain.value(), ctx);
    ASSERT_TRUE(plain_rows.ok()) << plain_rows.error();
    EXPECT_EQ(plain_rows.value()->num_rows(), 3);

    auto match_one = JoinMatchOneQueryPlanner().CreatePhysicalPlan(join, config);
    ASSERT_TRUE(match_one.ok()) << match_one.error();
    EXPECT_TRUE(match_one.value()->schema()->Equals(*join->schema));
    auto rows = CollectPlan(*match_one.value(), ctx);
    ASSERT_TRUE(rows.ok()) << rows.error();
    EXPECT_EQ(rows.value()->num_rows(), 2);
}

} // namespace
} // namespace plan
} // namespace qfab
