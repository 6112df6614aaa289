#pragma once

#include <arrow/api.h>
#include <arrow/io/memory.h>
#include <parquet/arrow/writer.h>
#include <memory>
#include <string>
#include <vector>

#include "qfab/core/result.h"
#include "qfab/core/types.h"
#include "qfab/storage/parquet/bloom_filter_set.hpp"

namespace qfab {
namespace storage {
namespace parquet {

/**
 * @brief Streams record batches into an in-memory Parquet file
 *
 * The FileMeta passed to Open is embedded as key/value metadata. One bloom
 * filter is kept per requested field that exists in the schema with a
 * supported type.
 */
class ParquetWriter {
public:
    ParquetWriter() = default;
    ~ParquetWriter();

    core::Result<void> Open(std::shared_ptr<arrow::Schema> schema,
                            const core::FileMeta& metadata,
                            const std::vector<std::string>& bloom_filter_fields,
                            int64_t max_row_group_length = 1024 * 1024);

    core::Result<void> WriteBatch(const std::shared_ptr<arrow::RecordBatch>& batch);

    // Writes the footer and returns the file bytes
    core::Result<std::shared_ptr<arrow::Buffer>> Close();

    // Valid after Close()
    BloomFilterSet TakeBloomFilters() { return std::move(bloom_filters_); }

    int64_t rows_written() const { return rows_written_; }
    const std::shared_ptr<arrow::Schema>& schema() const { return schema_; }

private:
    std::shared_ptr<arrow::io::BufferOutputStream> sink_;
    std::unique_ptr<::parquet::arrow::FileWriter> writer_;
    std::shared_ptr<arrow::Schema> schema_;
    int64_t rows_written_ = 0;

    BloomFilterSet bloom_filters_;
};

// Key/value metadata carrying a FileMeta
std::shared_ptr<arrow::KeyValueMetadata> FileMetaToKeyValue(const core::FileMeta& meta);

} // namespace parquet
} // namespace storage
} // namespace qfab
