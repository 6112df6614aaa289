#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <arrow/api.h>
#include <gtest/gtest.h>

#include "qfab/core/config.h"
#include "qfab/core/types.h"
#include "qfab/governor/resource_governor.h"
#include "qfab/storage/parquet/writer.hpp"

namespace qfab {
namespace testutil {

/**
 * @brief Restores the process configuration and governor when a test ends
 */
class ConfigGuard {
public:
    ConfigGuard() : saved_(*core::GetConfig()), governor_(governor::GetResourceGovernor()) {}
    ~ConfigGuard() {
        core::SetConfig(saved_);
        governor::SetResourceGovernor(governor_);
    }

    ConfigGuard(const ConfigGuard&) = delete;
    ConfigGuard& operator=(const ConfigGuard&) = delete;

private:
    core::EngineConfig saved_;
    std::shared_ptr<const governor::ResourceGovernor> governor_;
};

// Installs Default() with the given edits applied
template <typename Fn>
inline void UpdateConfig(Fn&& edit) {
    auto config = core::EngineConfig::Default();
    edit(config);
    core::SetConfig(config);
}

inline std::shared_ptr<arrow::Array> Int64Array(const std::vector<std::optional<int64_t>>& values) {
    arrow::Int64Builder builder;
    for (const auto& v : values) {
        if (v) {
            EXPECT_TRUE(builder.Append(*v).ok());
        } else {
            EXPECT_TRUE(builder.AppendNull().ok());
        }
    }
    std::shared_ptr<arrow::Array> out;
    EXPECT_TRUE(builder.Finish(&out).ok());
    return out;
}

inline std::shared_ptr<arrow::Array> StringArray(const std::vector<std::optional<std::string>>& values) {
    arrow::StringBuilder builder;
    for (const auto& v : values) {
        if (v) {
            EXPECT_TRUE(builder.Append(*v).ok());
        } else {
            EXPECT_TRUE(builder.AppendNull().ok());
        }
    }
    std::shared_ptr<arrow::Array> out;
    EXPECT_TRUE(builder.Finish(&out).ok());
    return out;
}

inline std::shared_ptr<arrow::Array> BoolArray(const std::vector<std::optional<bool>>& values) {
    arrow::BooleanBuilder builder;
    for (const auto& v : values) {
        if (v) {
            EXPECT_TRUE(builder.Append(*v).ok());
        } else {
            EXPECT_TRUE(builder.AppendNull().ok());
        }
    }
    std::shared_ptr<arrow::Array> out;
    EXPECT_TRUE(builder.Finish(&out).ok());
    return out;
}

// (_timestamp int64, level utf8, value int64)
inline std::shared_ptr<arrow::Schema> LogSchema() {
    return arrow::schema({
        arrow::field("_timestamp", arrow::int64()),
        arrow::field("level", arrow::utf8()),
        arrow::field("value", arrow::int64()),
    });
}

inline std::shared_ptr<arrow::RecordBatch> LogBatch(const std::vector<int64_t>& ts,
                                                    const std::vector<std::string>& levels,
                                                    const std::vector<int64_t>& values) {
    std::vector<std::optional<int64_t>> t(ts.begin(), ts.end());
    std::vector<std::optional<std::string>> l(levels.begin(), levels.end());
    std::vector<std::optional<int64_t>> v(values.begin(), values.end());
    return arrow::RecordBatch::Make(LogSchema(), static_cast<int64_t>(ts.size()),
                                    {Int64Array(t), StringArray(l), Int64Array(v)});
}

// Writes batches into an in-memory Parquet file
inline std::shared_ptr<arrow::Buffer> WriteParquet(const std::shared_ptr<arrow::Schema>& schema,
                                                   const std::vector<std::shared_ptr<arrow::RecordBatch>>& batches,
                                                   const std::vector<std::string>& bloom_fields = {},
                                                   storage::parquet::BloomFilterSet* bloom_out = nullptr,
                                                   int64_t max_row_group_length = 1024 * 1024) {
    core::FileMeta meta;
    for (const auto& batch : batches) meta.records += batch->num_rows();
    storage::parquet::ParquetWriter writer;
    auto opened = writer.Open(schema, meta, bloom_fields, max_row_group_length);
    EXPECT_TRUE(opened.ok()) << (opened.ok() ? "" : opened.error());
    for (const auto& batch : batches) {
        auto written = writer.WriteBatch(batch);
        EXPECT_TRUE(written.ok()) << (written.ok() ? "" : written.error());
    }
    auto data = writer.Close();
    EXPECT_TRUE(data.ok()) << (data.ok() ? "" : data.error());
    if (bloom_out) *bloom_out = writer.TakeBloomFilters();
    return data.ok() ? data.value() : nullptr;
}

inline core::SegmentFileKey SegmentFile(const std::string& key, const std::shared_ptr<arrow::Buffer>& data,
                                        int64_t min_ts, int64_t max_ts, int64_t records) {
    core::FileMeta meta;
    meta.min_ts = min_ts;
    meta.max_ts = max_ts;
    meta.records = records;
    meta.original_size = data->size();
    meta.compressed_size = data->size();
    return core::SegmentFileKey(key, meta);
}

inline std::vector<int64_t> Int64Column(const arrow::Table& table, const std::string& name) {
    std::vector<int64_t> out;
    auto column = table.GetColumnByName(name);
    if (!column) {
        ADD_FAILURE() << "missing column " << name;
        return out;
    }
    for (const auto& chunk : column->chunks()) {
        auto ints = std::static_pointer_cast<arrow::Int64Array>(chunk);
        for (int64_t i = 0; i < ints->length(); ++i) out.push_back(ints->Value(i));
    }
    return out;
}

inline std::vector<std::string> StringColumn(const arrow::Table& table, const std::string& name) {
    std::vector<std::string> out;
    auto column = table.GetColumnByName(name);
    if (!column) {
        ADD_FAILURE() << "missing column " << name;
        return out;
    }
    for (const auto& chunk : column->chunks()) {
        auto strings = std::static_pointer_cast<arrow::StringArray>(chunk);
        for (int64_t i = 0; i < strings->length(); ++i) {
            out.push_back(strings->IsNull(i) ? "<null>" : strings->GetString(i));
        }
    }
    return out;
}

} // namespace testutil
} // namespace qfab
