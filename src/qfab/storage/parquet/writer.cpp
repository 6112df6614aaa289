#include "qfab/storage/parquet/writer.hpp"

#include <parquet/arrow/writer.h>

#include "qfab/common/logger.h"

namespace qfab {
namespace storage {
namespace parquet {

std::shared_ptr<arrow::KeyValueMetadata> FileMetaToKeyValue(const core::FileMeta& meta) {
    return arrow::key_value_metadata(
        {"min_ts", "max_ts", "records", "original_size", "compressed_size"},
        {std::to_string(meta.min_ts), std::to_string(meta.max_ts), std::to_string(meta.records),
         std::to_string(meta.original_size), std::to_string(meta.compressed_size)});
}

ParquetWriter::~ParquetWriter() {
    if (writer_) {
        auto status = writer_->Close();
        if (!status.ok()) {
            QFAB_WARN("[ParquetWriter] Failed to close abandoned writer: {}", status.ToString());
        }
    }
}

core::Result<void> ParquetWriter::Open(std::shared_ptr<arrow::Schema> schema,
                                       const core::FileMeta& metadata,
                                       const std::vector<std::string>& bloom_filter_fields,
                                       int64_t max_row_group_length) {
    auto merged = schema->metadata() ? schema->metadata()->Copy() : std::make_shared<arrow::KeyValueMetadata>();
    auto file_meta = FileMetaToKeyValue(metadata);
    for (int64_t i = 0; i < file_meta->size(); ++i) {
        auto status = merged->Set(file_meta->key(i), file_meta->value(i));
        if (!status.ok()) {
            return core::Result<void>::error("Failed to attach file metadata: " + status.ToString(),
                                             core::Error::Code::WRITE_FAILURE);
        }
    }
    schema_ = schema->WithMetadata(merged);

    auto sink_result = arrow::io::BufferOutputStream::Create();
    if (!sink_result.ok()) {
        return core::Result<void>::error("Failed to allocate output buffer: " + sink_result.status().ToString(),
                                         core::Error::Code::WRITE_FAILURE);
    }
    sink_ = *sink_result;

    ::parquet::WriterProperties::Builder builder;
    builder.compression(::parquet::Compression::ZSTD);
    builder.enable_dictionary();
    builder.max_row_group_length(max_row_group_length);

    // Min/max statistics drive file and row group pruning on read
    builder.enable_statistics();

    std::shared_ptr<::parquet::WriterProperties> props = builder.build();

    auto arrow_props = ::parquet::ArrowWriterProperties::Builder()
        .store_schema()
        ->build();

    auto result = ::parquet::arrow::FileWriter::Open(
        *schema_,
        arrow::default_memory_pool(),
        sink_,
        props,
        arrow_props
    );

    if (!result.ok()) {
        return core::Result<void>::error("Failed to create Parquet writer: " + result.status().ToString(),
                                         core::Error::Code::WRITE_FAILURE);
    }
    writer_ = std::move(result).ValueOrDie();

    uint32_t ndv = metadata.records > 0 ? static_cast<uint32_t>(metadata.records) : BloomFilterSet::kDefaultNdv;
    for (const auto& field_name : bloom_filter_fields) {
        auto field = schema_->GetFieldByName(field_name);
        if (!field) {
            QFAB_DEBUG("[ParquetWriter] Bloom filter field {} not in schema, skipped", field_name);
            continue;
        }
        if (!BloomFilterSet::IsSupportedType(*field->type())) {
            QFAB_WARN("[ParquetWriter] Bloom filter field {} has unsupported type {}, skipped",
                      field_name, field->type()->ToString());
            continue;
        }
        bloom_filters_.CreateFilter(field_name, ndv, BloomFilterSet::kDefaultFpp);
    }

    return core::Result<void>();
}

core::Result<void> ParquetWriter::WriteBatch(const std::shared_ptr<arrow::RecordBatch>& batch) {
    if (!writer_) {
        return core::Result<void>::error("Writer not open", core::Error::Code::WRITE_FAILURE);
    }
    if (!batch || batch->num_rows() == 0) {
        return core::Result<void>();
    }

    auto status = writer_->WriteRecordBatch(*batch);
    if (!status.ok()) {
        std::string err = "Failed to write batch: " + status.ToString();
        QFAB_ERROR("[ParquetWriter] {}", err);
        return core::Result<void>::error(err, core::Error::Code::WRITE_FAILURE);
    }
    rows_written_ += batch->num_rows();

    for (const auto& field_name : bloom_filters_.fields()) {
        auto column = batch->GetColumnByName(field_name);
        if (!column) continue;
        auto res = bloom_filters_.InsertArray(field_name, *column);
        if (!res.ok()) {
            return core::Result<void>::error(res.error(), core::Error::Code::WRITE_FAILURE);
        }
    }

    return core::Result<void>();
}

core::Result<std::shared_ptr<arrow::Buffer>> ParquetWriter::Close() {
    using BufferResult = core::Result<std::shared_ptr<arrow::Buffer>>;
    if (!writer_) {
        return BufferResult::error("Writer not open", core::Error::Code::WRITE_FAILURE);
    }
    auto status = writer_->Close();
    writer_.reset();
    if (!status.ok()) {
        return BufferResult::error("Failed to close writer: " + status.ToString(), core::Error::Code::WRITE_FAILURE);
    }

    auto finished = sink_->Finish();
    sink_.reset();
    if (!finished.ok()) {
        return BufferResult::error("Failed to finish output buffer: " + finished.status().ToString(),
                                   core::Error::Code::WRITE_FAILURE);
    }
    QFAB_DEBUG("[ParquetWriter] Closed file: {} rows, {} bytes, {} bloom filters",
               rows_written_, (*finished)->size(), bloom_filters_.size());
    return BufferResult(*finished);
}

} // namespace parquet
} // namespace storage
} // namespace qfab
