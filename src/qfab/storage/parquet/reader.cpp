#include "qfab/storage/parquet/reader.hpp"

#include <cstring>
#include <numeric>

#include <arrow/io/memory.h>
#include <arrow/table.h>
#include <arrow/record_batch.h>
#include <parquet/arrow/schema.h>
#include <parquet/file_reader.h>
#include <parquet/metadata.h>
#include <parquet/statistics.h>

namespace qfab {
namespace storage {
namespace parquet {

namespace {

using BatchResult = core::Result<std::shared_ptr<arrow::RecordBatch>>;

// Converts typed Parquet min/max into Arrow scalars keyed by physical type
void ToScalars(const ::parquet::Statistics& stats, ColumnStatistics* out) {
    if (!stats.HasMinMax()) return;
    switch (stats.physical_type()) {
        case ::parquet::Type::BOOLEAN: {
            const auto& typed = static_cast<const ::parquet::BoolStatistics&>(stats);
            out->min = std::make_shared<arrow::BooleanScalar>(typed.min());
            out->max = std::make_shared<arrow::BooleanScalar>(typed.max());
            break;
        }
        case ::parquet::Type::INT32: {
            const auto& typed = static_cast<const ::parquet::Int32Statistics&>(stats);
            out->min = std::make_shared<arrow::Int32Scalar>(typed.min());
            out->max = std::make_shared<arrow::Int32Scalar>(typed.max());
            break;
        }
        case ::parquet::Type::INT64: {
            const auto& typed = static_cast<const ::parquet::Int64Statistics&>(stats);
            out->min = std::make_shared<arrow::Int64Scalar>(typed.min());
            out->max = std::make_shared<arrow::Int64Scalar>(typed.max());
            break;
        }
        case ::parquet::Type::FLOAT: {
            const auto& typed = static_cast<const ::parquet::FloatStatistics&>(stats);
            out->min = std::make_shared<arrow::FloatScalar>(typed.min());
            out->max = std::make_shared<arrow::FloatScalar>(typed.max());
            break;
        }
        case ::parquet::Type::DOUBLE: {
            const auto& typed = static_cast<const ::parquet::DoubleStatistics&>(stats);
            out->min = std::make_shared<arrow::DoubleScalar>(typed.min());
            out->max = std::make_shared<arrow::DoubleScalar>(typed.max());
            break;
        }
        case ::parquet::Type::BYTE_ARRAY: {
            const auto& typed = static_cast<const ::parquet::ByteArrayStatistics&>(stats);
            auto lo = typed.min();
            auto hi = typed.max();
            out->min = std::make_shared<arrow::StringScalar>(
                std::string(reinterpret_cast<const char*>(lo.ptr), lo.len));
            out->max = std::make_shared<arrow::StringScalar>(
                std::string(reinterpret_cast<const char*>(hi.ptr), hi.len));
            break;
        }
        default:
            break;
    }
}

int64_t ParseMetaValue(const std::shared_ptr<const arrow::KeyValueMetadata>& kv, const std::string& key) {
    if (!kv) return 0;
    auto idx = kv->FindKey(key);
    if (idx < 0) return 0;
    try {
        return std::stoll(kv->value(idx));
    } catch (const std::exception&) {
        return 0;
    }
}

Statistics BuildStatistics(const ::parquet::FileMetaData& metadata, std::shared_ptr<arrow::Schema> schema) {
    Statistics out;
    out.file_schema = std::move(schema);
    out.num_rows = metadata.num_rows();

    for (int rg = 0; rg < metadata.num_row_groups(); ++rg) {
        auto rg_meta = metadata.RowGroup(rg);
        RowGroupStatistics rg_stats;
        rg_stats.num_rows = rg_meta->num_rows();
        out.total_byte_size += rg_meta->total_byte_size();
        for (int c = 0; c < rg_meta->num_columns(); ++c) {
            std::string name = metadata.schema()->Column(c)->path()->ToDotString();
            ColumnStatistics col;
            auto chunk = rg_meta->ColumnChunk(c);
            auto stats = chunk->is_stats_set() ? chunk->statistics() : nullptr;
            if (stats) {
                col.null_count = stats->HasNullCount() ? stats->null_count() : 0;
                ToScalars(*stats, &col);
            }
            rg_stats.columns[name] = col;
        }
        for (const auto& [name, col] : rg_stats.columns) {
            auto it = out.columns.find(name);
            if (it == out.columns.end() || rg == 0) {
                out.columns[name] = col;
            } else {
                MergeColumnStatistics(&it->second, col);
            }
        }
        out.row_groups.push_back(std::move(rg_stats));
    }
    return out;
}

} // namespace

core::Result<int64_t> ParseFooterLength(const arrow::Buffer& tail) {
    using LengthResult = core::Result<int64_t>;
    if (tail.size() < kParquetTrailerSize) {
        return LengthResult::error("Parquet trailer truncated to " + std::to_string(tail.size()) + " bytes",
                                   core::Error::Code::EXECUTION_FAILURE);
    }
    const uint8_t* trailer = tail.data() + tail.size() - kParquetTrailerSize;
    if (std::memcmp(trailer + 4, "PAR1", 4) != 0) {
        return LengthResult::error("Missing Parquet magic bytes", core::Error::Code::EXECUTION_FAILURE);
    }
    // Little-endian uint32
    uint32_t length = static_cast<uint32_t>(trailer[0]) | (static_cast<uint32_t>(trailer[1]) << 8) |
                      (static_cast<uint32_t>(trailer[2]) << 16) | (static_cast<uint32_t>(trailer[3]) << 24);
    return LengthResult(static_cast<int64_t>(length));
}

core::Result<Statistics> ReadFooterStatistics(const arrow::Buffer& footer) {
    using StatsResult = core::Result<Statistics>;
    auto length = static_cast<uint32_t>(footer.size());
    std::shared_ptr<::parquet::FileMetaData> metadata;
    try {
        metadata = ::parquet::FileMetaData::Make(footer.data(), &length);
    } catch (const std::exception& e) {
        return StatsResult::error("Failed to decode Parquet footer: " + std::string(e.what()),
                                  core::Error::Code::EXECUTION_FAILURE);
    }
    std::shared_ptr<arrow::Schema> schema;
    auto status = ::parquet::arrow::FromParquetSchema(metadata->schema(), ::parquet::ArrowReaderProperties(),
                                                      metadata->key_value_metadata(), &schema);
    if (!status.ok()) {
        return StatsResult::error("Failed to read Parquet schema: " + status.ToString(),
                                  core::Error::Code::EXECUTION_FAILURE);
    }
    return StatsResult(BuildStatistics(*metadata, std::move(schema)));
}

ParquetReader::~ParquetReader() {
    reader_.reset();
}

core::Result<void> ParquetReader::Open(std::shared_ptr<arrow::Buffer> data) {
    data_ = std::move(data);
    auto infile = std::make_shared<arrow::io::BufferReader>(data_);

    try {
        auto status = ::parquet::arrow::FileReader::Make(
            arrow::default_memory_pool(),
            ::parquet::ParquetFileReader::Open(infile),
            &reader_
        );
        if (!status.ok()) {
            return core::Result<void>::error("Failed to create Parquet reader: " + status.ToString(),
                                             core::Error::Code::EXECUTION_FAILURE);
        }
    } catch (const std::exception& e) {
        return core::Result<void>::error("Exception opening Parquet reader: " + std::string(e.what()),
                                         core::Error::Code::EXECUTION_FAILURE);
    }

    auto status = reader_->GetSchema(&schema_);
    if (!status.ok()) {
        return core::Result<void>::error("Failed to read Parquet schema: " + status.ToString(),
                                         core::Error::Code::EXECUTION_FAILURE);
    }
    row_groups_.resize(reader_->num_row_groups());
    std::iota(row_groups_.begin(), row_groups_.end(), 0);
    next_row_group_ = 0;
    pending_.clear();
    return core::Result<void>();
}

void ParquetReader::SelectRowGroups(std::vector<int> row_groups) {
    row_groups_ = std::move(row_groups);
    next_row_group_ = 0;
    pending_.clear();
}

core::Result<void> ParquetReader::LoadRowGroup(int row_group_index) {
    std::shared_ptr<arrow::Table> table;
    auto status = reader_->ReadRowGroup(row_group_index, &table);
    if (!status.ok()) {
        return core::Result<void>::error("Failed to read row group: " + status.ToString(),
                                         core::Error::Code::EXECUTION_FAILURE);
    }
    if (!table) {
        return core::Result<void>::error("ReadRowGroup returned null table", core::Error::Code::EXECUTION_FAILURE);
    }
    arrow::TableBatchReader batch_reader(*table);
    std::shared_ptr<arrow::RecordBatch> batch;
    while (true) {
        auto read_status = batch_reader.ReadNext(&batch);
        if (!read_status.ok()) {
            return core::Result<void>::error("Failed to extract batch from table: " + read_status.ToString(),
                                             core::Error::Code::EXECUTION_FAILURE);
        }
        if (!batch) break;
        if (batch->num_rows() > 0) pending_.push_back(batch);
    }
    return core::Result<void>();
}

core::Result<void> ParquetReader::ReadBatch(std::shared_ptr<arrow::RecordBatch>* out_batch) {
    if (!reader_) {
        return core::Result<void>::error("Reader not open", core::Error::Code::INTERNAL);
    }
    while (pending_.empty() && next_row_group_ < row_groups_.size()) {
        auto res = LoadRowGroup(row_groups_[next_row_group_++]);
        if (!res.ok()) return res;
    }
    if (pending_.empty()) {
        *out_batch = nullptr;
        return core::Result<void>();
    }
    *out_batch = pending_.front();
    pending_.pop_front();
    return core::Result<void>();
}

core::Result<void> ParquetReader::Close() {
    reader_.reset();
    data_.reset();
    pending_.clear();
    return core::Result<void>();
}

int ParquetReader::GetNumRowGroups() const {
    if (!reader_) return 0;
    return reader_->num_row_groups();
}

std::vector<int64_t> ParquetReader::RowGroupRowCounts() const {
    std::vector<int64_t> out;
    if (!reader_) return out;
    auto metadata = reader_->parquet_reader()->metadata();
    for (int rg = 0; rg < metadata->num_row_groups(); ++rg) {
        out.push_back(metadata->RowGroup(rg)->num_rows());
    }
    return out;
}

core::Result<std::shared_ptr<arrow::RecordBatch>> ParquetReader::ReadRowGroup(int row_group_index) {
    if (!reader_) {
        return BatchResult::error("Reader not open", core::Error::Code::INTERNAL);
    }
    if (row_group_index < 0 || row_group_index >= reader_->num_row_groups()) {
        return BatchResult::error("Invalid row group index", core::Error::Code::INVALID_ARGUMENT);
    }
    std::shared_ptr<arrow::Table> table;
    auto status = reader_->ReadRowGroup(row_group_index, &table);
    if (!status.ok()) {
        return BatchResult::error("Failed to read row group: " + status.ToString(),
                                  core::Error::Code::EXECUTION_FAILURE);
    }
    auto combined = table->CombineChunksToBatch();
    if (!combined.ok()) {
        return BatchResult::error("Failed to combine row group: " + combined.status().ToString(),
                                  core::Error::Code::EXECUTION_FAILURE);
    }
    return BatchResult(*combined);
}

core::Result<Statistics> ParquetReader::ReadStatistics() const {
    if (!reader_) {
        return core::Result<Statistics>::error("Reader not open", core::Error::Code::INTERNAL);
    }
    return core::Result<Statistics>(BuildStatistics(*reader_->parquet_reader()->metadata(), schema_));
}

core::FileMeta ParquetReader::ReadFileMeta() const {
    core::FileMeta meta;
    if (!reader_) return meta;
    auto kv = reader_->parquet_reader()->metadata()->key_value_metadata();
    meta.min_ts = ParseMetaValue(kv, "min_ts");
    meta.max_ts = ParseMetaValue(kv, "max_ts");
    meta.records = ParseMetaValue(kv, "records");
    meta.original_size = ParseMetaValue(kv, "original_size");
    meta.compressed_size = ParseMetaValue(kv, "compressed_size");
    return meta;
}

} // namespace parquet
} // namespace storage
} // namespace qfab
