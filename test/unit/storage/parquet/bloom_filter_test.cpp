#include <gtest/gtest.h>
#include <arrow/api.h>

#include "qfab/storage/parquet/bloom_filter_set.hpp"
#include "test_util/fixtures.h"

namespace qfab {
namespace storage {
namespace parquet {
namespace {

TEST(BloomFilterSetTest, NoFalseNegatives) {
    BloomFilterSet set;
    set.CreateFilter("trace_id", 1000);
    set.CreateFilter("status", 1000);
    for (int i = 0; i < 500; ++i) {
        set.InsertBytes("trace_id", "trace-" + std::to_string(i));
        set.InsertInt("status", i);
    }
    for (int i = 0; i < 500; ++i) {
        EXPECT_TRUE(set.MightContain("trace_id", arrow::StringScalar("trace-" + std::to_string(i))));
        EXPECT_TRUE(set.MightContain("status", arrow::Int64Scalar(i)));
    }
}

TEST(BloomFilterSetTest, RejectsMostAbsentValues) {
    BloomFilterSet set;
    set.CreateFilter("trace_id", 1000, 0.01);
    for (int i = 0; i < 1000; ++i) set.InsertBytes("trace_id", "present-" + std::to_string(i));
    int false_positives = 0;
    for (int i = 0; i < 1000; ++i) {
        if (set.MightContain("trace_id", arrow::StringScalar("absent-" + std::to_string(i)))) ++false_positives;
    }
    EXPECT_LT(false_positives, 50);
}

TEST(BloomFilterSetTest, IntegerWidthsShareHashing) {
    BloomFilterSet set;
    set.CreateFilter("code", 100);
    arrow::Int32Builder builder;
    ASSERT_TRUE(builder.AppendValues({7, 42}).ok());
    std::shared_ptr<arrow::Array> narrow;
    ASSERT_TRUE(builder.Finish(&narrow).ok());

    ASSERT_TRUE(set.InsertArray("code", *narrow).ok());
    EXPECT_TRUE(set.MightContain("code", arrow::Int64Scalar(42)));
    EXPECT_TRUE(set.MightContain("code", arrow::Int32Scalar(7)));
}

TEST(BloomFilterSetTest, UnknownFieldsAndTypesAnswerTrue) {
    BloomFilterSet set;
    set.CreateFilter("level", 100);
    EXPECT_TRUE(set.MightContain("other", arrow::StringScalar("x")));
    EXPECT_TRUE(set.MightContain("level", arrow::DoubleScalar(1.5)));
    EXPECT_TRUE(set.MightContain("level", arrow::StringScalar()));

    auto missing = set.InsertArray("other", *testutil::StringArray({"a"}));
    ASSERT_FALSE(missing.ok());
    EXPECT_EQ(missing.error_code(), core::Error::Code::NOT_FOUND);
    auto unsupported = set.InsertArray("level", *testutil::BoolArray({true}));
    ASSERT_FALSE(unsupported.ok());
    EXPECT_EQ(unsupported.error_code(), core::Error::Code::INVALID_ARGUMENT);

    EXPECT_TRUE(BloomFilterSet::IsSupportedType(*arrow::utf8()));
    EXPECT_FALSE(BloomFilterSet::IsSupportedType(*arrow::float64()));
}

TEST(BloomFilterSetTest, SidecarRoundTrip) {
    BloomFilterSet set;
    set.CreateFilter("level", 100);
    set.CreateFilter("host", 100);
    set.InsertBytes("level", "error");
    set.InsertBytes("host", "node-1");

    auto bytes = set.Serialize();
    ASSERT_TRUE(bytes.ok()) << bytes.error();
    EXPECT_EQ(bytes.value()->ToString().substr(0, 4), "QFBF");

    auto restored = BloomFilterSet::Deserialize(bytes.value());
    ASSERT_TRUE(restored.ok()) << restored.error();
    EXPECT_EQ(restored.value().fields(), (std::vector<std::string>{"host", "level"}));
    EXPECT_TRUE(restored.value().MightContain("level", arrow::StringScalar("error")));
    EXPECT_TRUE(restored.value().MightContain("host", arrow::StringScalar("node-1")));

    EXPECT_EQ(BloomFilterSet::SidecarPath("files/a.parquet"), "files/a.parquet.bloom");
}

TEST(BloomFilterSetTest, CorruptSidecarFails) {
    EXPECT_FALSE(BloomFilterSet::Deserialize(arrow::Buffer::FromString("XXXX")).ok());
    EXPECT_FALSE(BloomFilterSet::Deserialize(arrow::Buffer::FromString("QFBF\x01")).ok());
}

} // namespace
} // namespace parquet
} // namespace storage
} // namespace qfab
