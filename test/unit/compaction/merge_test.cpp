#include <gtest/gtest.h>

#include "qfab/compaction/merge.h"
#include "qfab/storage/parquet/bloom_filter_set.hpp"
#include "qfab/storage/parquet/reader.hpp"
#include "qfab/table/mem_table.h"
#include "test_util/fixtures.h"

namespace qfab {
namespace compaction {
namespace {

using testutil::BoolArray;
using testutil::ConfigGuard;
using testutil::Int64Array;
using testutil::Int64Column;
using testutil::LogBatch;
using testutil::LogSchema;
using testutil::StringArray;
using testutil::StringColumn;
using testutil::UpdateConfig;

std::shared_ptr<arrow::Table> ReadAll(const std::shared_ptr<arrow::Buffer>& data, core::FileMeta* meta = nullptr) {
    storage::parquet::ParquetReader reader;
    auto opened = reader.Open(data);
    EXPECT_TRUE(opened.ok()) << opened.error();
    if (meta) *meta = reader.ReadFileMeta();
    std::vector<std::shared_ptr<arrow::RecordBatch>> batches;
    while (true) {
        std::shared_ptr<arrow::RecordBatch> batch;
        auto read = reader.ReadBatch(&batch);
        EXPECT_TRUE(read.ok()) << read.error();
        if (!read.ok() || !batch) break;
        batches.push_back(batch);
    }
    auto table = arrow::Table::FromRecordBatches(reader.schema(), batches);
    EXPECT_TRUE(table.ok());
    return table.ok() ? *table : nullptr;
}

std::shared_ptr<table::TableProvider> Mem(std::shared_ptr<arrow::Schema> schema,
                                          std::vector<std::shared_ptr<arrow::Array>> columns) {
    int64_t rows = columns.empty() ? 0 : columns[0]->length();
    auto batch = arrow::RecordBatch::Make(schema, rows, std::move(columns));
    auto made = table::MemTable::Make(schema, {batch});
    EXPECT_TRUE(made.ok()) << made.error();
    return made.take_value();
}

class MergeTest : public ::testing::Test {
protected:
    ConfigGuard guard_;
};

TEST_F(MergeTest, DefaultQuerySortsByTime) {
    EXPECT_EQ(BuildMergeSql(core::StreamType::LOGS, "app", *LogSchema()),
              "SELECT * FROM tbl ORDER BY _timestamp DESC");
    // Without the rollup switch distinct streams are plain re-sorts too
    EXPECT_EQ(BuildMergeSql(core::StreamType::METADATA, "distinct_values_logs_app", *LogSchema()),
              "SELECT * FROM tbl ORDER BY _timestamp DESC");
}

TEST_F(MergeTest, IndexQueryDropsDeletedFiles) {
    EXPECT_EQ(BuildMergeSql(core::StreamType::INDEX, "app_idx", *LogSchema()),
              "SELECT * FROM tbl WHERE file_name NOT IN (SELECT file_name FROM tbl WHERE deleted IS TRUE "
              "ORDER BY _timestamp DESC) ORDER BY _timestamp DESC");
}

TEST_F(MergeTest, HourlyRollupQuery) {
    UpdateConfig([](core::EngineConfig& c) { c.limit.distinct_values_hourly = true; });
    auto schema = arrow::schema({arrow::field("_timestamp", arrow::int64()), arrow::field("count", arrow::int64()),
                                 arrow::field("field_name", arrow::utf8()), arrow::field("Field Value", arrow::utf8())});
    EXPECT_EQ(BuildMergeSql(core::StreamType::METADATA, "distinct_values_logs_app", *schema),
              "SELECT MIN(_timestamp) AS _timestamp, SUM(count) AS count, field_name, \"Field Value\" FROM tbl "
              "GROUP BY field_name, \"Field Value\" ORDER BY _timestamp DESC");
    EXPECT_EQ(BuildMergeSql(core::StreamType::METADATA, "other", *schema),
              "SELECT * FROM tbl ORDER BY _timestamp DESC");
}

TEST_F(MergeTest, HourlyRollupWithoutValueColumns) {
    UpdateConfig([](core::EngineConfig& c) { c.limit.distinct_values_hourly = true; });
    auto schema = arrow::schema({arrow::field("_timestamp", arrow::int64()), arrow::field("count", arrow::int64())});
    EXPECT_EQ(BuildMergeSql(core::StreamType::METADATA, "distinct_values_logs_app", *schema),
              "SELECT MIN(_timestamp) AS _timestamp, SUM(count) AS count FROM tbl ORDER BY _timestamp DESC");

    std::vector<std::shared_ptr<table::TableProvider>> tables = {
        Mem(schema, {Int64Array({30, 10}), Int64Array({2, 1})}),
        Mem(schema, {Int64Array({20}), Int64Array({5})}),
    };
    auto merged = MergeParquetFiles(core::StreamType::METADATA, "distinct_values_logs_app", schema, tables, {},
                                    core::FileMeta());
    ASSERT_TRUE(merged.ok()) << merged.error();
    EXPECT_EQ(merged.value().rows, 1);
    auto table = ReadAll(merged.value().data);
    ASSERT_NE(table, nullptr);
    EXPECT_EQ(Int64Column(*table, "_timestamp"), (std::vector<int64_t>{10}));
    EXPECT_EQ(Int64Column(*table, "count"), (std::vector<int64_t>{8}));
}

TEST_F(MergeTest, MergesSegmentsIntoOneSortedFile) {
    auto narrow = arrow::schema({arrow::field("_timestamp", arrow::int64()), arrow::field("level", arrow::utf8())});
    std::vector<std::shared_ptr<table::TableProvider>> tables = {
        Mem(LogSchema(), {Int64Array({1, 4}), StringArray({"info", "error"}), Int64Array({10, 40})}),
        Mem(narrow, {Int64Array({3, 2}), StringArray({"warn", "info"})}),
    };
    core::FileMeta meta;
    meta.min_ts = 1;
    meta.max_ts = 4;
    meta.records = 4;

    auto merged = MergeParquetFiles(core::StreamType::LOGS, "app", LogSchema(), tables, {"level"}, meta);
    ASSERT_TRUE(merged.ok()) << merged.error();
    EXPECT_EQ(merged.value().rows, 4);
    EXPECT_TRUE(merged.value().schema->Equals(*LogSchema()));

    core::FileMeta read_meta;
    auto table = ReadAll(merged.value().data, &read_meta);
    ASSERT_NE(table, nullptr);
    EXPECT_EQ(read_meta, meta);
    EXPECT_EQ(Int64Column(*table, "_timestamp"), (std::vector<int64_t>{4, 3, 2, 1}));
    EXPECT_EQ(StringColumn(*table, "level"), (std::vector<std::string>{"error", "warn", "info", "info"}));

    ASSERT_NE(merged.value().bloom_filters, nullptr);
    auto bloom = storage::parquet::BloomFilterSet::Deserialize(merged.value().bloom_filters);
    ASSERT_TRUE(bloom.ok()) << bloom.error();
    EXPECT_EQ(bloom.value().fields(), (std::vector<std::string>{"level"}));
    EXPECT_TRUE(bloom.value().MightContain("level", arrow::StringScalar("warn")));
}

TEST_F(MergeTest, TimeColumnStaysNonNullUnderNullableSchema) {
    auto strict = arrow::schema({arrow::field("_timestamp", arrow::int64(), false),
                                 arrow::field("level", arrow::utf8()), arrow::field("value", arrow::int64())});
    std::vector<std::shared_ptr<table::TableProvider>> tables = {
        Mem(strict, {Int64Array({2, 1}), StringArray({"info", "warn"}), Int64Array({20, 10})}),
        Mem(strict, {Int64Array({3}), StringArray({"error"}), Int64Array({30})}),
    };
    // LogSchema declares _timestamp nullable
    ASSERT_TRUE(LogSchema()->GetFieldByName("_timestamp")->nullable());
    auto merged = MergeParquetFiles(core::StreamType::LOGS, "app", LogSchema(), tables, {}, core::FileMeta());
    ASSERT_TRUE(merged.ok()) << merged.error();
    EXPECT_FALSE(merged.value().schema->GetFieldByName("_timestamp")->nullable());
    EXPECT_TRUE(merged.value().schema->GetFieldByName("level")->nullable());

    auto table = ReadAll(merged.value().data);
    ASSERT_NE(table, nullptr);
    EXPECT_FALSE(table->schema()->GetFieldByName("_timestamp")->nullable());
    EXPECT_EQ(Int64Column(*table, "_timestamp"), (std::vector<int64_t>{3, 2, 1}));
}

TEST_F(MergeTest, NoBloomFiltersWhenNoneRequested) {
    auto merged = MergeParquetFiles(core::StreamType::LOGS, "app", LogSchema(),
                                    {Mem(LogSchema(), {Int64Array({1}), StringArray({"info"}), Int64Array({1})})},
                                    {}, core::FileMeta());
    ASSERT_TRUE(merged.ok()) << merged.error();
    EXPECT_EQ(merged.value().bloom_filters, nullptr);
}

TEST_F(MergeTest, IndexMergeReconcilesDeletions) {
    auto schema = arrow::schema({arrow::field("_timestamp", arrow::int64()), arrow::field("file_name", arrow::utf8()),
                                 arrow::field("term", arrow::utf8()), arrow::field("deleted", arrow::boolean())});
    std::vector<std::shared_ptr<table::TableProvider>> tables = {
        Mem(schema, {Int64Array({1, 2, 3}), StringArray({"f1", "f2", "f3"}), StringArray({"a", "b", "c"}),
                     BoolArray({false, false, false})}),
        // f2 was deleted later; a null marker does not delete f3
        Mem(schema, {Int64Array({4, 5}), StringArray({"f2", "f3"}), StringArray({std::nullopt, std::nullopt}),
                     BoolArray({true, std::nullopt})}),
    };
    auto merged = MergeParquetFiles(core::StreamType::INDEX, "app_idx", schema, tables, {}, core::FileMeta());
    ASSERT_TRUE(merged.ok()) << merged.error();
    auto table = ReadAll(merged.value().data);
    ASSERT_NE(table, nullptr);
    EXPECT_EQ(StringColumn(*table, "file_name"), (std::vector<std::string>{"f3", "f3", "f1"}));
    EXPECT_EQ(Int64Column(*table, "_timestamp"), (std::vector<int64_t>{5, 3, 1}));
}

TEST_F(MergeTest, HourlyRollupMergesCounts) {
    UpdateConfig([](core::EngineConfig& c) { c.limit.distinct_values_hourly = true; });
    auto schema = arrow::schema({arrow::field("_timestamp", arrow::int64()), arrow::field("count", arrow::int64()),
                                 arrow::field("value", arrow::utf8())});
    std::vector<std::shared_ptr<table::TableProvider>> tables = {
        Mem(schema, {Int64Array({30, 10}), Int64Array({2, 1}), StringArray({"x", "y"})}),
        Mem(schema, {Int64Array({20, 40}), Int64Array({5, 1}), StringArray({"x", "y"})}),
    };
    auto merged = MergeParquetFiles(core::StreamType::METADATA, "distinct_values_logs_app", schema, tables, {},
                                    core::FileMeta());
    ASSERT_TRUE(merged.ok()) << merged.error();
    EXPECT_EQ(merged.value().rows, 2);
    auto table = ReadAll(merged.value().data);
    ASSERT_NE(table, nullptr);
    EXPECT_EQ(StringColumn(*table, "value"), (std::vector<std::string>{"x", "y"}));
    EXPECT_EQ(Int64Column(*table, "_timestamp"), (std::vector<int64_t>{20, 10}));
    EXPECT_EQ(Int64Column(*table, "count"), (std::vector<int64_t>{7, 2}));
}

TEST_F(MergeTest, PlanningErrorsPassThrough) {
    auto schema = arrow::schema({arrow::field("level", arrow::utf8())});
    auto merged = MergeParquetFiles(core::StreamType::LOGS, "app", schema, {Mem(schema, {StringArray({"a"})})}, {},
                                    core::FileMeta());
    ASSERT_FALSE(merged.ok());
    EXPECT_EQ(merged.error_code(), core::Error::Code::PLANNING_FAILURE);
}

} // namespace
} // namespace compaction
} // namespace qfab
