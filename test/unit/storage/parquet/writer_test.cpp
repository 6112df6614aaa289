#include <gtest/gtest.h>
#include <arrow/api.h>

#include "qfab/storage/parquet/reader.hpp"
#include "qfab/storage/parquet/writer.hpp"
#include "test_util/fixtures.h"

namespace qfab {
namespace storage {
namespace parquet {
namespace {

using testutil::LogBatch;
using testutil::LogSchema;

class ParquetWriterTest : public ::testing::Test {
protected:
    std::shared_ptr<arrow::Buffer> Write(int64_t max_row_group_length, const core::FileMeta& meta) {
        ParquetWriter writer;
        auto opened = writer.Open(LogSchema(), meta, {"level", "missing"}, max_row_group_length);
        EXPECT_TRUE(opened.ok()) << (opened.ok() ? "" : opened.error());
        EXPECT_TRUE(writer.WriteBatch(LogBatch({1, 2, 3}, {"info", "warn", "info"}, {10, 20, 30})).ok());
        EXPECT_TRUE(writer.WriteBatch(LogBatch({4, 5}, {"error", "info"}, {40, 50})).ok());
        EXPECT_EQ(writer.rows_written(), 5);
        auto data = writer.Close();
        EXPECT_TRUE(data.ok());
        bloom_ = writer.TakeBloomFilters();
        return data.ok() ? data.value() : nullptr;
    }

    BloomFilterSet bloom_;
};

TEST_F(ParquetWriterTest, WriteAndReadBack) {
    core::FileMeta meta;
    meta.min_ts = 1;
    meta.max_ts = 5;
    meta.records = 5;
    meta.original_size = 1234;
    auto data = Write(1024, meta);
    ASSERT_NE(data, nullptr);
    ASSERT_GT(data->size(), 0);

    ParquetReader reader;
    auto opened = reader.Open(data);
    ASSERT_TRUE(opened.ok()) << opened.error();
    EXPECT_TRUE(reader.schema()->Equals(*LogSchema()));

    int64_t rows = 0;
    std::vector<int64_t> ts;
    while (true) {
        std::shared_ptr<arrow::RecordBatch> batch;
        auto read = reader.ReadBatch(&batch);
        ASSERT_TRUE(read.ok()) << read.error();
        if (!batch) break;
        rows += batch->num_rows();
        auto col = std::static_pointer_cast<arrow::Int64Array>(batch->GetColumnByName("_timestamp"));
        for (int64_t i = 0; i < col->length(); ++i) ts.push_back(col->Value(i));
    }
    EXPECT_EQ(rows, 5);
    EXPECT_EQ(ts, (std::vector<int64_t>{1, 2, 3, 4, 5}));

    auto read_meta = reader.ReadFileMeta();
    EXPECT_EQ(read_meta.min_ts, 1);
    EXPECT_EQ(read_meta.max_ts, 5);
    EXPECT_EQ(read_meta.records, 5);
    EXPECT_EQ(read_meta.original_size, 1234);
}

TEST_F(ParquetWriterTest, BloomFiltersOnlyForExistingFields) {
    auto data = Write(1024, core::FileMeta());
    ASSERT_NE(data, nullptr);
    EXPECT_EQ(bloom_.fields(), (std::vector<std::string>{"level"}));
    EXPECT_TRUE(bloom_.MightContain("level", arrow::StringScalar("warn")));
    EXPECT_TRUE(bloom_.MightContain("level", arrow::StringScalar("error")));
}

TEST_F(ParquetWriterTest, RowGroupsAndStatistics) {
    auto data = Write(2, core::FileMeta());
    ASSERT_NE(data, nullptr);

    ParquetReader reader;
    ASSERT_TRUE(reader.Open(data).ok());
    auto counts = reader.RowGroupRowCounts();
    int64_t total = 0;
    for (auto c : counts) {
        EXPECT_LE(c, 2);
        total += c;
    }
    EXPECT_EQ(total, 5);
    EXPECT_GE(reader.GetNumRowGroups(), 3);

    auto stats = reader.ReadStatistics();
    ASSERT_TRUE(stats.ok()) << stats.error();
    EXPECT_EQ(stats.value().num_rows, 5);
    EXPECT_EQ(stats.value().row_groups.size(), counts.size());
    const auto* ts = stats.value().column("_timestamp");
    ASSERT_NE(ts, nullptr);
    ASSERT_TRUE(ts->has_min_max());
    EXPECT_EQ(CompareScalars(*ts->min, arrow::Int64Scalar(1)), 0);
    EXPECT_EQ(CompareScalars(*ts->max, arrow::Int64Scalar(5)), 0);

    auto first = reader.ReadRowGroup(0);
    ASSERT_TRUE(first.ok());
    EXPECT_EQ(first.value()->num_rows(), counts[0]);
    auto bad = reader.ReadRowGroup(100);
    EXPECT_FALSE(bad.ok());
    EXPECT_EQ(bad.error_code(), core::Error::Code::INVALID_ARGUMENT);
}

TEST_F(ParquetWriterTest, FooterAloneYieldsStatistics) {
    auto data = Write(2, core::FileMeta());
    ASSERT_NE(data, nullptr);
    ParquetReader reader;
    ASSERT_TRUE(reader.Open(data).ok());
    auto expected = reader.ReadStatistics();
    ASSERT_TRUE(expected.ok()) << expected.error();

    auto tail = arrow::SliceBuffer(data, data->size() - kParquetTrailerSize, kParquetTrailerSize);
    auto length = ParseFooterLength(*tail);
    ASSERT_TRUE(length.ok()) << length.error();
    ASSERT_LT(length.value() + kParquetTrailerSize, data->size());

    // Only the footer bytes, copied so nothing else of the file is reachable
    auto view = arrow::SliceBuffer(data, data->size() - kParquetTrailerSize - length.value(), length.value());
    auto footer = arrow::Buffer::FromString(view->ToString());
    auto stats = ReadFooterStatistics(*footer);
    ASSERT_TRUE(stats.ok()) << stats.error();
    EXPECT_EQ(stats.value().num_rows, expected.value().num_rows);
    EXPECT_EQ(stats.value().total_byte_size, expected.value().total_byte_size);
    EXPECT_EQ(stats.value().row_groups.size(), expected.value().row_groups.size());
    ASSERT_NE(stats.value().file_schema, nullptr);
    EXPECT_TRUE(stats.value().file_schema->Equals(*reader.schema()));
    const auto* ts = stats.value().column("_timestamp");
    ASSERT_NE(ts, nullptr);
    ASSERT_TRUE(ts->has_min_max());
    EXPECT_EQ(CompareScalars(*ts->min, arrow::Int64Scalar(1)), 0);
    EXPECT_EQ(CompareScalars(*ts->max, arrow::Int64Scalar(5)), 0);
}

TEST_F(ParquetWriterTest, SelectRowGroupsRestrictsScan) {
    auto data = Write(2, core::FileMeta());
    ParquetReader reader;
    ASSERT_TRUE(reader.Open(data).ok());
    reader.SelectRowGroups({1});
    int64_t rows = 0;
    while (true) {
        std::shared_ptr<arrow::RecordBatch> batch;
        ASSERT_TRUE(reader.ReadBatch(&batch).ok());
        if (!batch) break;
        rows += batch->num_rows();
    }
    EXPECT_EQ(rows, reader.RowGroupRowCounts()[1]);
}

TEST(ParquetWriterErrorsTest, WriteBeforeOpenFails) {
    ParquetWriter writer;
    auto res = writer.WriteBatch(LogBatch({1}, {"info"}, {1}));
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.error_code(), core::Error::Code::WRITE_FAILURE);
    auto closed = writer.Close();
    EXPECT_FALSE(closed.ok());
}

TEST(ParquetReaderErrorsTest, GarbageIsRejected) {
    ParquetReader reader;
    auto res = reader.Open(arrow::Buffer::FromString("definitely not parquet"));
    EXPECT_FALSE(res.ok());
}

TEST(ParquetReaderErrorsTest, BadTrailerIsRejected) {
    auto short_tail = ParseFooterLength(*arrow::Buffer::FromString("PAR1"));
    ASSERT_FALSE(short_tail.ok());
    EXPECT_EQ(short_tail.error_code(), core::Error::Code::EXECUTION_FAILURE);

    auto no_magic = ParseFooterLength(*arrow::Buffer::FromString(std::string("\x10\x00\x00\x00NOPE", 8)));
    ASSERT_FALSE(no_magic.ok());
    EXPECT_EQ(no_magic.error_code(), core::Error::Code::EXECUTION_FAILURE);

    auto length = ParseFooterLength(*arrow::Buffer::FromString(std::string("xx\x2c\x01\x00\x00PAR1", 10)));
    ASSERT_TRUE(length.ok()) << length.error();
    EXPECT_EQ(length.value(), 300);

    auto garbage = ReadFooterStatistics(*arrow::Buffer::FromString("not a thrift footer"));
    ASSERT_FALSE(garbage.ok());
    EXPECT_EQ(garbage.error_code(), core::Error::Code::EXECUTION_FAILURE);
}

} // namespace
} // namespace parquet
} // namespace storage
} // namespace qfab
