#include <gtest/gtest.h>
#include <arrow/api.h>
#include "qfab/storage/file_data_cache.h"
#include "qfab/storage/file_statistics_cache.h"
#include "qfab/storage/statistics.h"

namespace qfab {
namespace storage {
namespace {

std::shared_ptr<const Statistics> Stats(int64_t rows) {
    auto stats = std::make_shared<Statistics>();
    stats->num_rows = rows;
    return stats;
}

class FileStatisticsCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        cache_.Clear();
        saved_ = cache_.max_entries();
        cache_.SetMaxEntries(2);
    }
    void TearDown() override {
        cache_.Clear();
        cache_.SetMaxEntries(saved_);
    }

    FileStatisticsCache& cache_ = FileStatisticsCache::Instance();
    size_t saved_ = 0;
};

TEST_F(FileStatisticsCacheTest, SizeMismatchIsAMiss) {
    cache_.Put("files/logs/a.parquet", 100, Stats(5));
    auto hit = cache_.Get("files/logs/a.parquet", 100);
    ASSERT_NE(hit, nullptr);
    EXPECT_EQ(hit->num_rows, 5);
    EXPECT_EQ(cache_.Get("files/logs/a.parquet", 101), nullptr);
    EXPECT_EQ(cache_.hits(), 1u);
    EXPECT_EQ(cache_.misses(), 1u);
}

TEST_F(FileStatisticsCacheTest, EvictsLeastRecentlyUsed) {
    cache_.Put("a", 1, Stats(1));
    cache_.Put("b", 1, Stats(2));
    ASSERT_NE(cache_.Get("a", 1), nullptr);
    cache_.Put("c", 1, Stats(3));
    EXPECT_EQ(cache_.size(), 2u);
    EXPECT_NE(cache_.Get("a", 1), nullptr);
    EXPECT_EQ(cache_.Get("b", 1), nullptr);
    EXPECT_NE(cache_.Get("c", 1), nullptr);
}

TEST_F(FileStatisticsCacheTest, ShrinkingEvictsImmediately) {
    cache_.Put("a", 1, Stats(1));
    cache_.Put("b", 1, Stats(2));
    cache_.SetMaxEntries(1);
    EXPECT_EQ(cache_.size(), 1u);
    EXPECT_NE(cache_.Get("b", 1), nullptr);

    cache_.SetMaxEntries(0);
    cache_.Put("c", 1, Stats(3));
    EXPECT_EQ(cache_.size(), 0u);
}

TEST(FileDataCacheTest, BoundedByBytes) {
    auto& cache = FileDataCache::Instance();
    cache.Clear();
    size_t saved = cache.capacity();
    cache.SetCapacity(10);

    cache.Put("a", arrow::Buffer::FromString("12345"));
    cache.Put("b", arrow::Buffer::FromString("12345"));
    EXPECT_EQ(cache.used_bytes(), 10u);
    ASSERT_NE(cache.Get("a"), nullptr);
    cache.Put("c", arrow::Buffer::FromString("123"));
    EXPECT_TRUE(cache.Contains("a"));
    EXPECT_FALSE(cache.Contains("b"));
    EXPECT_TRUE(cache.Contains("c"));

    // Larger than the whole cache
    cache.Put("huge", arrow::Buffer::FromString("0123456789abc"));
    EXPECT_FALSE(cache.Contains("huge"));

    EXPECT_TRUE(cache.Remove("a"));
    EXPECT_FALSE(cache.Remove("a"));
    cache.Clear();
    cache.SetCapacity(saved);
}

TEST(StatisticsTest, CompareScalars) {
    arrow::Int64Scalar i5(5);
    arrow::Int32Scalar i7(7);
    arrow::DoubleScalar d5(5.0);
    arrow::StringScalar a("a");
    arrow::StringScalar b("b");
    EXPECT_EQ(CompareScalars(i5, i7), -1);
    EXPECT_EQ(CompareScalars(i7, i5), 1);
    EXPECT_EQ(CompareScalars(i5, d5), 0);
    EXPECT_EQ(CompareScalars(a, b), -1);
    EXPECT_FALSE(CompareScalars(a, i5).has_value());
    arrow::Int64Scalar null_scalar;
    EXPECT_FALSE(CompareScalars(null_scalar, i5).has_value());
}

TEST(StatisticsTest, MergeColumnStatistics) {
    ColumnStatistics into;
    into.min = std::make_shared<arrow::Int64Scalar>(10);
    into.max = std::make_shared<arrow::Int64Scalar>(20);
    into.null_count = 1;

    ColumnStatistics other;
    other.min = std::make_shared<arrow::Int64Scalar>(5);
    other.max = std::make_shared<arrow::Int64Scalar>(15);
    other.null_count = 2;

    MergeColumnStatistics(&into, other);
    EXPECT_EQ(into.null_count, 3);
    EXPECT_EQ(std::static_pointer_cast<arrow::Int64Scalar>(into.min)->value, 5);
    EXPECT_EQ(std::static_pointer_cast<arrow::Int64Scalar>(into.max)->value, 20);

    MergeColumnStatistics(&into, ColumnStatistics());
    EXPECT_FALSE(into.has_min_max());
}

} // namespace
} // namespace storage
} // namespace qfab
