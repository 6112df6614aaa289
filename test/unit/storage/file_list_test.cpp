#include <gtest/gtest.h>
#include "qfab/storage/file_list.h"
#include "qfab/storage/object_store.h"

namespace qfab {
namespace storage {
namespace {

std::vector<core::SegmentFileKey> Files(std::initializer_list<std::pair<const char*, int64_t>> items) {
    std::vector<core::SegmentFileKey> out;
    for (const auto& [key, size] : items) {
        core::FileMeta meta;
        meta.compressed_size = size;
        out.emplace_back(key, meta);
    }
    return out;
}

TEST(FileListRegistryTest, StageAndGet) {
    auto& registry = FileListRegistry::Instance();
    auto lease = registry.Set("fl-session-1", "abc", Files({{"a.parquet", 10}, {"b.parquet", 20}}));
    ASSERT_TRUE(lease.ok()) << lease.error();
    EXPECT_EQ(lease.value().key(), "fl-session-1/schema=abc/");

    auto files = registry.Get("fl-session-1", "abc");
    ASSERT_TRUE(files.has_value());
    ASSERT_EQ(files->size(), 2u);
    EXPECT_EQ((*files)[0].key, "a.parquet");
    EXPECT_EQ((*files)[1].meta.compressed_size, 20);
    EXPECT_FALSE(registry.Get("fl-session-1", "other").has_value());
}

TEST(FileListRegistryTest, ReleasedWithLastLease) {
    auto& registry = FileListRegistry::Instance();
    {
        auto first = registry.Set("fl-session-2", "k", Files({{"a.parquet", 1}}));
        ASSERT_TRUE(first.ok());
        auto second = registry.Set("fl-session-2", "k", Files({{"b.parquet", 2}}));
        ASSERT_TRUE(second.ok());

        // Restaging replaces the list
        auto files = registry.Get("fl-session-2", "k");
        ASSERT_TRUE(files.has_value());
        EXPECT_EQ(files->front().key, "b.parquet");

        first.value().Release();
        EXPECT_TRUE(registry.Contains("fl-session-2", "k"));
    }
    EXPECT_FALSE(registry.Contains("fl-session-2", "k"));
    EXPECT_EQ(registry.CountForSession("fl-session-2"), 0u);
}

TEST(FileListRegistryTest, LeaseMoves) {
    auto& registry = FileListRegistry::Instance();
    auto staged = registry.Set("fl-session-3", "k", Files({{"a.parquet", 1}}));
    ASSERT_TRUE(staged.ok());
    FileListLease moved = staged.take_value();
    EXPECT_TRUE(moved.valid());
    EXPECT_TRUE(registry.Contains("fl-session-3", "k"));
    moved.Release();
    EXPECT_FALSE(moved.valid());
    EXPECT_FALSE(registry.Contains("fl-session-3", "k"));
}

TEST(FileListRegistryTest, RejectsBadKeys) {
    auto& registry = FileListRegistry::Instance();
    EXPECT_EQ(registry.Set("", "k", {}).error_code(), core::Error::Code::INVALID_ARGUMENT);
    EXPECT_EQ(registry.Set("s", "", {}).error_code(), core::Error::Code::INVALID_ARGUMENT);
    EXPECT_EQ(registry.Set("a/b", "k", {}).error_code(), core::Error::Code::INVALID_ARGUMENT);
}

TEST(StagedPathTest, Parse) {
    auto full = ParseStagedPath("/s1/schema=abc/files/x.parquet");
    ASSERT_TRUE(full.has_value());
    EXPECT_EQ(full->session_id, "s1");
    EXPECT_EQ(full->schema_key, "abc");
    EXPECT_EQ(full->file_key, "files/x.parquet");

    auto prefix = ParseStagedPath("s1/schema=abc/");
    ASSERT_TRUE(prefix.has_value());
    EXPECT_TRUE(prefix->file_key.empty());

    EXPECT_FALSE(ParseStagedPath("s1/abc/x.parquet").has_value());
    EXPECT_FALSE(ParseStagedPath("s1/schema=/x").has_value());
}

} // namespace
} // namespace storage
} // namespace qfab
