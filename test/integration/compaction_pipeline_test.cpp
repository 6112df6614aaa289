#include <gtest/gtest.h>

#include "qfab/compaction/merge.h"
#include "qfab/storage/file_data_cache.h"
#include "qfab/storage/file_list.h"
#include "qfab/storage/file_statistics_cache.h"
#include "qfab/storage/object_store.h"
#include "qfab/storage/parquet/bloom_filter_set.hpp"
#include "qfab/table/table_factory.h"
#include "test_util/fixtures.h"
#include "test_util/temp_dir.h"

namespace qfab {
namespace {

using testutil::BoolArray;
using testutil::ConfigGuard;
using testutil::Int64Array;
using testutil::Int64Column;
using testutil::LogBatch;
using testutil::LogSchema;
using testutil::SegmentFile;
using testutil::StringArray;
using testutil::StringColumn;
using testutil::UpdateConfig;
using testutil::WriteParquet;

/**
 * Segments are persisted, read back as a listing table, merged, persisted
 * again and searched, the way a compactor hands files to search.
 */
class CompactionPipelineTest : public ::testing::Test {
protected:
    CompactionPipelineTest() : data_dir_("qfab_compaction_data") {}

    void SetUp() override {
        Configure(false);
        storage::FileDataCache::Instance().Clear();
        storage::FileStatisticsCache::Instance().Clear();
    }

    void TearDown() override {
        storage::FileDataCache::Instance().Clear();
        storage::FileStatisticsCache::Instance().Clear();
    }

    void Configure(bool distinct_values_hourly) {
        UpdateConfig([&](core::EngineConfig& c) {
            c.common.data_dir = data_dir_.str();
            c.common.bloom_filter_enabled = true;
            c.limit.cpu_num = 2;
            c.limit.distinct_values_hourly = distinct_values_hourly;
        });
    }

    core::SegmentFileKey Persist(const std::string& key, const std::shared_ptr<arrow::Buffer>& data,
                                 int64_t min_ts, int64_t max_ts, int64_t records) {
        storage::LocalObjectStore store(data_dir_.str());
        EXPECT_TRUE(store.Put(key, data).ok());
        return SegmentFile(key, data, min_ts, max_ts, records);
    }

    core::SegmentFileKey PersistBatch(const std::string& key, const std::shared_ptr<arrow::RecordBatch>& batch,
                                      int64_t min_ts, int64_t max_ts) {
        return Persist(key, WriteParquet(batch->schema(), {batch}), min_ts, max_ts, batch->num_rows());
    }

    // Persists a merge output together with its bloom sidecar
    core::SegmentFileKey PersistMerged(const std::string& key, const compaction::CompactionResult& merged,
                                       const core::FileMeta& meta) {
        storage::LocalObjectStore store(data_dir_.str());
        EXPECT_TRUE(store.Put(key, merged.data).ok());
        if (merged.bloom_filters) {
            EXPECT_TRUE(store.Put(storage::parquet::BloomFilterSet::SidecarPath(key), merged.bloom_filters).ok());
        }
        return SegmentFile(key, merged.data, meta.min_ts, meta.max_ts, merged.rows);
    }

    std::shared_ptr<table::TableProvider> Segments(const std::string& session_id,
                                                   const std::shared_ptr<arrow::Schema>& schema,
                                                   const std::vector<core::SegmentFileKey>& files) {
        core::SearchSession session;
        session.id = session_id;
        session.storage_type = core::StorageType::MEMORY;
        auto listing = table::CreateParquetTable(session, schema, files, {}, false, false, nullptr, {});
        EXPECT_TRUE(listing.ok()) << listing.error();
        return listing.ok() ? listing.value() : nullptr;
    }

    ConfigGuard guard_;
    testutil::ScopedTempDir data_dir_;
};

TEST_F(CompactionPipelineTest, MergedFileIsSearchable) {
    auto files = std::vector<core::SegmentFileKey>{
        PersistBatch("files/default/logs/app/2024/01/01/00/a.parquet",
                     LogBatch({1, 5, 3}, {"info", "error", "info"}, {10, 50, 30}), 1, 5),
        PersistBatch("files/default/logs/app/2024/01/01/00/b.parquet",
                     LogBatch({4, 2}, {"warn", "debug"}, {40, 20}), 2, 4),
    };
    core::FileMeta meta;
    meta.min_ts = 1;
    meta.max_ts = 5;
    meta.records = 5;

    auto merged = compaction::MergeParquetFiles(core::StreamType::LOGS, "app", LogSchema(),
                                                {Segments("compact-src", LogSchema(), files)}, {"level"}, meta);
    ASSERT_TRUE(merged.ok()) << merged.error();
    EXPECT_EQ(merged.value().rows, 5);
    auto output = PersistMerged("files/default/logs/app/2024/01/01/00/merged.parquet", merged.value(), meta);

    core::SearchSession session;
    session.id = "compact-search";
    auto ctx = table::RegisterTable(session, LogSchema(), "logs", {output}, {}, {{"_timestamp", true}});
    ASSERT_TRUE(ctx.ok()) << ctx.error();

    auto all = ctx.value()->ExecuteToTable("SELECT _timestamp, level FROM logs");
    ASSERT_TRUE(all.ok()) << all.error();
    // The merged file is written newest first
    EXPECT_EQ(Int64Column(*all.value(), "_timestamp"), (std::vector<int64_t>{5, 4, 3, 2, 1}));

    auto warn = ctx.value()->ExecuteToTable("SELECT value FROM logs WHERE level = 'warn'");
    ASSERT_TRUE(warn.ok()) << warn.error();
    EXPECT_EQ(Int64Column(*warn.value(), "value"), (std::vector<int64_t>{40}));

    // "fatal" never occurs, the sidecar rules the file out
    auto fatal = ctx.value()->ExecuteToTable("SELECT count(*) AS n FROM logs WHERE level = 'fatal'");
    ASSERT_TRUE(fatal.ok()) << fatal.error();
    EXPECT_EQ(Int64Column(*fatal.value(), "n"), (std::vector<int64_t>{0}));
}

TEST_F(CompactionPipelineTest, RemergingIsStable) {
    auto files = std::vector<core::SegmentFileKey>{
        PersistBatch("files/default/logs/app/2024/01/01/00/a.parquet",
                     LogBatch({2, 6}, {"info", "error"}, {20, 60}), 2, 6),
        PersistBatch("files/default/logs/app/2024/01/01/00/b.parquet",
                     LogBatch({4}, {"warn"}, {40}), 4, 4),
    };
    core::FileMeta meta;
    meta.min_ts = 2;
    meta.max_ts = 6;
    meta.records = 3;

    auto first = compaction::MergeParquetFiles(core::StreamType::LOGS, "app", LogSchema(),
                                               {Segments("remerge-1", LogSchema(), files)}, {}, meta);
    ASSERT_TRUE(first.ok()) << first.error();
    auto once = PersistMerged("files/default/logs/app/2024/01/01/00/once.parquet", first.value(), meta);

    auto second = compaction::MergeParquetFiles(core::StreamType::LOGS, "app", LogSchema(),
                                                {Segments("remerge-2", LogSchema(), {once})}, {}, meta);
    ASSERT_TRUE(second.ok()) << second.error();
    EXPECT_EQ(second.value().rows, first.value().rows);
    auto twice = PersistMerged("files/default/logs/app/2024/01/01/00/twice.parquet", second.value(), meta);

    core::SearchSession session;
    session.id = "remerge-search";
    auto ctx = table::RegisterTable(session, LogSchema(), "logs", {twice}, {}, {});
    ASSERT_TRUE(ctx.ok()) << ctx.error();
    auto result = ctx.value()->ExecuteToTable("SELECT _timestamp, level, value FROM logs");
    ASSERT_TRUE(result.ok()) << result.error();
    EXPECT_EQ(Int64Column(*result.value(), "_timestamp"), (std::vector<int64_t>{6, 4, 2}));
    EXPECT_EQ(StringColumn(*result.value(), "level"), (std::vector<std::string>{"error", "warn", "info"}));
    EXPECT_EQ(Int64Column(*result.value(), "value"), (std::vector<int64_t>{60, 40, 20}));
}

TEST_F(CompactionPipelineTest, IndexCompactionDropsDeletedFiles) {
    auto schema = arrow::schema({arrow::field("_timestamp", arrow::int64()), arrow::field("file_name", arrow::utf8()),
                                 arrow::field("term", arrow::utf8()), arrow::field("deleted", arrow::boolean())});
    auto live = arrow::RecordBatch::Make(schema, 3,
                                         {Int64Array({1, 2, 3}), StringArray({"f1", "f2", "f3"}),
                                          StringArray({"alpha", "beta", "gamma"}), BoolArray({false, false, false})});
    auto markers = arrow::RecordBatch::Make(schema, 1,
                                            {Int64Array({9}), StringArray({"f1"}), StringArray({std::nullopt}),
                                             BoolArray({true})});
    auto files = std::vector<core::SegmentFileKey>{
        PersistBatch("files/default/index/app_idx/2024/01/01/00/a.parquet", live, 1, 3),
        PersistBatch("files/default/index/app_idx/2024/01/01/00/b.parquet", markers, 9, 9),
    };

    auto merged = compaction::MergeParquetFiles(core::StreamType::INDEX, "app_idx", schema,
                                                {Segments("index-src", schema, files)}, {}, core::FileMeta());
    ASSERT_TRUE(merged.ok()) << merged.error();
    EXPECT_EQ(merged.value().rows, 2);
    auto output = PersistMerged("files/default/index/app_idx/2024/01/01/00/merged.parquet", merged.value(),
                                core::FileMeta());

    core::SearchSession session;
    session.id = "index-search";
    auto ctx = table::RegisterTable(session, schema, "idx", {output}, {}, {});
    ASSERT_TRUE(ctx.ok()) << ctx.error();
    auto result = ctx.value()->ExecuteToTable("SELECT file_name, term FROM idx ORDER BY file_name");
    ASSERT_TRUE(result.ok()) << result.error();
    EXPECT_EQ(StringColumn(*result.value(), "file_name"), (std::vector<std::string>{"f2", "f3"}));
    EXPECT_EQ(StringColumn(*result.value(), "term"), (std::vector<std::string>{"beta", "gamma"}));
}

TEST_F(CompactionPipelineTest, HourlyDistinctValuesRollUp) {
    Configure(true);
    auto schema = arrow::schema({arrow::field("_timestamp", arrow::int64()), arrow::field("count", arrow::int64()),
                                 arrow::field("field_name", arrow::utf8()), arrow::field("field_value", arrow::utf8())});
    auto early = arrow::RecordBatch::Make(schema, 2,
                                          {Int64Array({100, 110}), Int64Array({3, 1}), StringArray({"level", "level"}),
                                           StringArray({"info", "error"})});
    auto late = arrow::RecordBatch::Make(schema, 2,
                                         {Int64Array({150, 160}), Int64Array({4, 2}), StringArray({"level", "host"}),
                                          StringArray({"info", "web-1"})});
    auto files = std::vector<core::SegmentFileKey>{
        PersistBatch("files/default/metadata/distinct_values_logs_app/2024/01/01/00/a.parquet", early, 100, 110),
        PersistBatch("files/default/metadata/distinct_values_logs_app/2024/01/01/00/b.parquet", late, 150, 160),
    };

    auto merged = compaction::MergeParquetFiles(core::StreamType::METADATA, "distinct_values_logs_app", schema,
                                                {Segments("distinct-src", schema, files)}, {}, core::FileMeta());
    ASSERT_TRUE(merged.ok()) << merged.error();
    EXPECT_EQ(merged.value().rows, 3);

    auto output = PersistMerged("files/default/metadata/distinct_values_logs_app/2024/01/01/00/merged.parquet",
                                merged.value(), core::FileMeta());
    core::SearchSession session;
    session.id = "distinct-search";
    auto ctx = table::RegisterTable(session, schema, "distinct_values", {output}, {}, {});
    ASSERT_TRUE(ctx.ok()) << ctx.error();
    auto result = ctx.value()->ExecuteToTable(
        "SELECT field_value, count, _timestamp FROM distinct_values ORDER BY field_value");
    ASSERT_TRUE(result.ok()) << result.error();
    EXPECT_EQ(StringColumn(*result.value(), "field_value"), (std::vector<std::string>{"error", "info", "web-1"}));
    EXPECT_EQ(Int64Column(*result.value(), "count"), (std::vector<int64_t>{1, 7, 2}));
    EXPECT_EQ(Int64Column(*result.value(), "_timestamp"), (std::vector<int64_t>{110, 100, 160}));
}

TEST_F(CompactionPipelineTest, MissingSegmentFailsWithoutOutput) {
    core::SegmentFileKey ghost = SegmentFile("files/default/logs/app/2024/01/01/00/ghost.parquet",
                                             WriteParquet(LogSchema(), {LogBatch({1}, {"info"}, {1})}), 1, 1, 1);
    auto merged = compaction::MergeParquetFiles(core::StreamType::LOGS, "app", LogSchema(),
                                                {Segments("ghost-src", LogSchema(), {ghost})}, {}, core::FileMeta());
    EXPECT_FALSE(merged.ok());
}

} // namespace
} // namespace qfab
