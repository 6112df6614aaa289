#include <gtest/gtest.h>

#include "qfab/table/mem_table.h"
#include "qfab/table/union_table.h"
#include "test_util/fixtures.h"

namespace qfab {
namespace table {
namespace {

using testutil::Int64Array;
using testutil::Int64Column;
using testutil::StringArray;
using testutil::StringColumn;

// Remembers the filter hints of its last scan
class RecordingProvider : public TableProvider {
public:
    explicit RecordingProvider(std::shared_ptr<MemTable> inner) : inner_(std::move(inner)) {}

    std::shared_ptr<arrow::Schema> schema() const override { return inner_->schema(); }
    core::Result<std::unique_ptr<execution::RecordBatchStream>> Scan(
        const ScanContext& ctx, const ScanRequest& request) const override {
        last_filters = request.filters;
        return inner_->Scan(ctx, request);
    }
    TableStatistics Statistics() const override { return inner_->Statistics(); }

    mutable std::vector<plan::ExprPtr> last_filters;

private:
    std::shared_ptr<MemTable> inner_;
};

std::shared_ptr<RecordingProvider> Provider(std::shared_ptr<arrow::Schema> schema,
                                            std::vector<std::shared_ptr<arrow::Array>> columns, int64_t rows) {
    auto batch = arrow::RecordBatch::Make(schema, rows, std::move(columns));
    auto table = MemTable::Make(schema, {batch});
    EXPECT_TRUE(table.ok()) << table.error();
    return std::make_shared<RecordingProvider>(table.take_value());
}

class UnionTableTest : public ::testing::Test {
protected:
    void SetUp() override {
        union_schema_ = arrow::schema({arrow::field("_timestamp", arrow::int64()),
                                       arrow::field("host", arrow::utf8()),
                                       arrow::field("code", arrow::int64())});
        // Same columns in another order
        full_ = Provider(arrow::schema({arrow::field("code", arrow::int64()), arrow::field("host", arrow::utf8()),
                                        arrow::field("_timestamp", arrow::int64())}),
                         {Int64Array({200, 500}), StringArray({"a", "b"}), Int64Array({1, 2})}, 2);
        // No code column
        partial_ = Provider(arrow::schema({arrow::field("_timestamp", arrow::int64()),
                                           arrow::field("host", arrow::utf8())}),
                            {Int64Array({3}), StringArray({"c"})}, 1);
        // code stored as text
        retyped_ = Provider(arrow::schema({arrow::field("_timestamp", arrow::int64()),
                                           arrow::field("code", arrow::utf8())}),
                            {Int64Array({4}), StringArray({"404"})}, 1);
        table_ = std::make_shared<UnionTable>(union_schema_,
                                              std::vector<std::shared_ptr<TableProvider>>{full_, partial_, retyped_});
    }

    std::shared_ptr<arrow::Schema> union_schema_;
    std::shared_ptr<RecordingProvider> full_;
    std::shared_ptr<RecordingProvider> partial_;
    std::shared_ptr<RecordingProvider> retyped_;
    std::shared_ptr<UnionTable> table_;
};

TEST_F(UnionTableTest, AdaptsEveryProviderToUnionSchema) {
    auto stream = table_->Scan(ScanContext(), ScanRequest());
    ASSERT_TRUE(stream.ok()) << stream.error();
    auto collected = execution::CollectToTable(*stream.value());
    ASSERT_TRUE(collected.ok()) << collected.error();
    EXPECT_TRUE(collected.value()->schema()->Equals(*union_schema_));
    EXPECT_EQ(Int64Column(*collected.value(), "_timestamp"), (std::vector<int64_t>{1, 2, 3, 4}));
    EXPECT_EQ(StringColumn(*collected.value(), "host"), (std::vector<std::string>{"a", "b", "c", "<null>"}));

    auto codes = arrow::Concatenate(collected.value()->GetColumnByName("code")->chunks());
    ASSERT_TRUE(codes.ok());
    auto ints = std::static_pointer_cast<arrow::Int64Array>(*codes);
    EXPECT_EQ(ints->Value(1), 500);
    EXPECT_TRUE(ints->IsNull(2));
    EXPECT_EQ(ints->Value(3), 404);

    EXPECT_EQ(table_->Statistics().num_rows, 4);
}

TEST_F(UnionTableTest, FiltersOnlyReachProvidersWithTheColumn) {
    auto code = plan::MakeCall("equal", {plan::MakeColumn(2, *union_schema_->field(2)),
                                         plan::MakeLiteral(std::make_shared<arrow::Int64Scalar>(500))},
                               *union_schema_);
    ASSERT_TRUE(code.ok()) << code.error();
    auto host = plan::MakeCall("equal", {plan::MakeColumn(1, *union_schema_->field(1)),
                                         plan::MakeLiteral(std::make_shared<arrow::StringScalar>("c"))},
                               *union_schema_);
    ASSERT_TRUE(host.ok()) << host.error();

    ScanRequest request;
    request.filters = {code.value(), host.value()};
    auto stream = table_->Scan(ScanContext(), request);
    ASSERT_TRUE(stream.ok()) << stream.error();
    // Hints are not exact, so every row still comes back
    auto collected = execution::CollectToTable(*stream.value());
    ASSERT_TRUE(collected.ok()) << collected.error();
    EXPECT_EQ(collected.value()->num_rows(), 4);

    ASSERT_EQ(full_->last_filters.size(), 2u);
    EXPECT_EQ(full_->last_filters[0]->args[0]->index, 0);
    EXPECT_EQ(full_->last_filters[1]->args[0]->index, 1);
    ASSERT_EQ(partial_->last_filters.size(), 1u);
    EXPECT_EQ(partial_->last_filters[0]->args[0]->index, 1);
    EXPECT_TRUE(retyped_->last_filters.empty());
}

TEST_F(UnionTableTest, NonNullWhereEveryProviderIsNonNull) {
    auto strict = arrow::schema({arrow::field("_timestamp", arrow::int64(), false),
                                 arrow::field("host", arrow::utf8(), false)});
    auto first = Provider(strict, {Int64Array({1}), StringArray({"a"})}, 1);
    auto second = Provider(strict, {Int64Array({2}), StringArray({"b"})}, 1);
    auto loose_host = Provider(arrow::schema({arrow::field("_timestamp", arrow::int64(), false),
                                              arrow::field("host", arrow::utf8())}),
                               {Int64Array({3}), StringArray({"c"})}, 1);

    UnionTable both(union_schema_, {first, second});
    EXPECT_FALSE(both.schema()->GetFieldByName("_timestamp")->nullable());
    EXPECT_FALSE(both.schema()->GetFieldByName("host")->nullable());
    // Missing from every provider
    EXPECT_TRUE(both.schema()->GetFieldByName("code")->nullable());

    UnionTable mixed(union_schema_, {first, loose_host});
    EXPECT_FALSE(mixed.schema()->GetFieldByName("_timestamp")->nullable());
    EXPECT_TRUE(mixed.schema()->GetFieldByName("host")->nullable());

    auto stream = both.Scan(ScanContext(), ScanRequest());
    ASSERT_TRUE(stream.ok()) << stream.error();
    auto collected = execution::CollectToTable(*stream.value());
    ASSERT_TRUE(collected.ok()) << collected.error();
    EXPECT_FALSE(collected.value()->schema()->GetFieldByName("_timestamp")->nullable());
    EXPECT_EQ(Int64Column(*collected.value(), "_timestamp"), (std::vector<int64_t>{1, 2}));
}

TEST_F(UnionTableTest, UnknownRowCountPropagates) {
    class Opaque : public TableProvider {
    public:
        std::shared_ptr<arrow::Schema> schema() const override { return arrow::schema({}); }
        core::Result<std::unique_ptr<execution::RecordBatchStream>> Scan(const ScanContext&,
                                                                         const ScanRequest&) const override {
            std::unique_ptr<execution::RecordBatchStream> stream =
                std::make_unique<execution::VectorBatchStream>(schema(), std::vector<std::shared_ptr<arrow::RecordBatch>>{});
            return core::Result<std::unique_ptr<execution::RecordBatchStream>>(std::move(stream));
        }
    };
    UnionTable table(union_schema_, {full_, std::make_shared<Opaque>()});
    EXPECT_FALSE(table.Statistics().num_rows.has_value());
}

} // namespace
} // namespace table
} // namespace qfab
