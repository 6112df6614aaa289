#include <gtest/gtest.h>

#include <optional>

#include "qfab/plan/expr.h"
#include "qfab/plan/logical_plan.h"
#include "test_util/fixtures.h"

namespace qfab {
namespace plan {
namespace {

using testutil::Int64Array;

std::vector<std::optional<bool>> Evaluate(const ExprPtr& expr, const arrow::RecordBatch& batch) {
    std::vector<std::optional<bool>> out;
    auto bound = BindExpression(*expr, *batch.schema());
    EXPECT_TRUE(bound.ok()) << (bound.ok() ? "" : bound.error());
    if (!bound.ok()) return out;
    auto array = EvaluateExpression(bound.value(), batch);
    EXPECT_TRUE(array.ok());
    if (!array.ok()) return out;
    auto bools = std::static_pointer_cast<arrow::BooleanArray>(array.value());
    for (int64_t i = 0; i < bools->length(); ++i) {
        out.push_back(bools->IsNull(i) ? std::nullopt : std::optional<bool>(bools->Value(i)));
    }
    return out;
}

class ExprTest : public ::testing::Test {
protected:
    void SetUp() override {
        schema_ = arrow::schema({arrow::field("x", arrow::int64()), arrow::field("y", arrow::int64(), false)});
        batch_ = arrow::RecordBatch::Make(schema_, 3, {Int64Array({1, std::nullopt, 3}), Int64Array({1, 2, 3})});
        x_ = MakeColumn(0, *schema_->field(0));
        y_ = MakeColumn(1, *schema_->field(1));
    }

    ExprPtr InValues(bool list_has_null, bool negated) {
        auto set = Int64Array({1});
        auto expr = MakeInValues(x_, set, list_has_null, negated, *schema_);
        EXPECT_TRUE(expr.ok());
        return expr.ok() ? expr.value() : nullptr;
    }

    std::shared_ptr<arrow::Schema> schema_;
    std::shared_ptr<arrow::RecordBatch> batch_;
    ExprPtr x_;
    ExprPtr y_;
};

TEST_F(ExprTest, CallTypeAndNullability) {
    auto sum = MakeCall("add", {x_, y_}, *schema_);
    ASSERT_TRUE(sum.ok()) << sum.error();
    EXPECT_TRUE(sum.value()->type->Equals(*arrow::int64()));
    EXPECT_TRUE(sum.value()->nullable);

    auto doubled = MakeCall("add", {y_, y_}, *schema_);
    ASSERT_TRUE(doubled.ok());
    EXPECT_FALSE(doubled.value()->nullable);

    auto is_null = MakeCall("is_null", {x_}, *schema_);
    ASSERT_TRUE(is_null.ok());
    EXPECT_TRUE(is_null.value()->type->Equals(*arrow::boolean()));
    EXPECT_FALSE(is_null.value()->nullable);

    auto bad = MakeCall("no_such_function", {x_}, *schema_);
    ASSERT_FALSE(bad.ok());
    EXPECT_EQ(bad.error_code(), core::Error::Code::PLANNING_FAILURE);
}

TEST_F(ExprTest, InListThreeValuedLogic) {
    EXPECT_EQ(Evaluate(InValues(false, false), *batch_),
              (std::vector<std::optional<bool>>{true, std::nullopt, false}));
    EXPECT_EQ(Evaluate(InValues(true, false), *batch_),
              (std::vector<std::optional<bool>>{true, std::nullopt, std::nullopt}));
    EXPECT_EQ(Evaluate(InValues(false, true), *batch_),
              (std::vector<std::optional<bool>>{false, std::nullopt, true}));
    EXPECT_EQ(Evaluate(InValues(true, true), *batch_),
              (std::vector<std::optional<bool>>{false, std::nullopt, std::nullopt}));
}

TEST_F(ExprTest, InListNullabilityFollowsInputs) {
    auto on_y = MakeInValues(y_, Int64Array({1}), false, false, *schema_);
    ASSERT_TRUE(on_y.ok());
    EXPECT_FALSE(on_y.value()->nullable);
    EXPECT_TRUE(InValues(false, false)->nullable);
}

TEST_F(ExprTest, UnresolvedSubqueryLowersToNull) {
    auto in = MakeInSubquery(x_, nullptr, false);
    EXPECT_TRUE(ContainsSubquery(in));
    EXPECT_EQ(Evaluate(in, *batch_), (std::vector<std::optional<bool>>{std::nullopt, std::nullopt, std::nullopt}));

    SubqueryResults results;
    results[in.get()] = SubqueryValues{Int64Array({3}), false};
    auto bound = BindExpression(*in, *schema_, &results);
    ASSERT_TRUE(bound.ok());
    auto array = EvaluateExpression(bound.value(), *batch_);
    ASSERT_TRUE(array.ok());
    auto bools = std::static_pointer_cast<arrow::BooleanArray>(array.value());
    EXPECT_FALSE(bools->Value(0));
    EXPECT_TRUE(bools->IsNull(1));
    EXPECT_TRUE(bools->Value(2));
}

TEST_F(ExprTest, ConjunctsAndColumns) {
    auto a = MakeCall("greater", {x_, MakeLiteral(std::make_shared<arrow::Int64Scalar>(0))}, *schema_);
    auto b = MakeCall("less", {y_, MakeLiteral(std::make_shared<arrow::Int64Scalar>(10))}, *schema_);
    ASSERT_TRUE(a.ok() && b.ok());
    auto both = MakeCall("and_kleene", {a.value(), b.value()}, *schema_);
    ASSERT_TRUE(both.ok());

    std::vector<ExprPtr> conjuncts;
    SplitConjunction(both.value(), &conjuncts);
    ASSERT_EQ(conjuncts.size(), 2u);
    EXPECT_EQ(conjuncts[0]->ToString(), "greater(x, 0)");

    std::vector<int> columns;
    CollectColumns(both.value(), &columns);
    EXPECT_EQ(columns, (std::vector<int>{0, 1}));

    auto swapped = RemapColumns(both.value(), {1, 0});
    ASSERT_TRUE(swapped.ok());
    columns.clear();
    CollectColumns(swapped.value(), &columns);
    EXPECT_EQ(columns, (std::vector<int>{1, 0}));

    auto dropped = RemapColumns(both.value(), {0, -1});
    ASSERT_FALSE(dropped.ok());
    EXPECT_EQ(dropped.error_code(), core::Error::Code::PLANNING_FAILURE);
}

TEST_F(ExprTest, CastScalar) {
    auto cast = CastScalar(std::make_shared<arrow::Int32Scalar>(7), arrow::int64());
    ASSERT_TRUE(cast.ok());
    EXPECT_EQ(std::static_pointer_cast<arrow::Int64Scalar>(cast.value())->value, 7);

    auto null_cast = CastScalar(arrow::MakeNullScalar(arrow::utf8()), arrow::int64());
    ASSERT_TRUE(null_cast.ok());
    EXPECT_FALSE(null_cast.value()->is_valid);

    auto bad = CastScalar(std::make_shared<arrow::StringScalar>("abc"), arrow::int64());
    ASSERT_FALSE(bad.ok());
    EXPECT_EQ(bad.error_code(), core::Error::Code::PLANNING_FAILURE);
}

TEST(AggregateOutputTypeTest, CountIsNeverNull) {
    for (const char* fn : {"count", "count_all", "count_distinct"}) {
        auto out = AggregateOutputType(fn, arrow::utf8(), true);
        ASSERT_TRUE(out.ok());
        EXPECT_TRUE(out.value().first->Equals(*arrow::int64()));
        EXPECT_FALSE(out.value().second);
    }
}

TEST(AggregateOutputTypeTest, TypedAggregates) {
    auto sum = AggregateOutputType("sum", arrow::int32(), false);
    ASSERT_TRUE(sum.ok());
    EXPECT_TRUE(sum.value().first->Equals(*arrow::int64()));
    EXPECT_FALSE(sum.value().second);

    auto mean = AggregateOutputType("mean", arrow::int64(), false);
    ASSERT_TRUE(mean.ok());
    EXPECT_TRUE(mean.value().first->Equals(*arrow::float64()));
    EXPECT_TRUE(mean.value().second);

    auto max = AggregateOutputType("max", arrow::utf8(), false);
    ASSERT_TRUE(max.ok());
    EXPECT_TRUE(max.value().first->Equals(*arrow::utf8()));

    EXPECT_EQ(AggregateOutputType("sum", arrow::utf8(), true).error_code(), core::Error::Code::PLANNING_FAILURE);
    EXPECT_EQ(AggregateOutputType("median", arrow::int64(), true).error_code(),
              core::Error::Code::PLANNING_FAILURE);
}

} // namespace
} // namespace plan
} // namespace qfab
