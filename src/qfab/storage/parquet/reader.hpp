#pragma once

#include <deque>
#include <memory>
#include <string>
#include <vector>

#include <arrow/api.h>
#include <parquet/arrow/reader.h>

#include "qfab/core/result.h"
#include "qfab/core/types.h"
#include "qfab/storage/statistics.h"

namespace qfab {
namespace storage {
namespace parquet {

// "<footer length><PAR1>" closing every Parquet file
constexpr int64_t kParquetTrailerSize = 8;

// Footer length from the last bytes of a file; tail must end at the file end
core::Result<int64_t> ParseFooterLength(const arrow::Buffer& tail);

// Footer statistics decoded from the serialized file metadata alone, without
// touching any column data
core::Result<Statistics> ReadFooterStatistics(const arrow::Buffer& footer);

/**
 * @brief Reads a Parquet segment held in memory
 *
 * Batches come out row group by row group in file order. SelectRowGroups
 * restricts the scan to a subset, also in file order.
 */
class ParquetReader {
public:
    ParquetReader() = default;
    ~ParquetReader();

    core::Result<void> Open(std::shared_ptr<arrow::Buffer> data);

    // Reads the next RecordBatch. out_batch is null at end of file.
    core::Result<void> ReadBatch(std::shared_ptr<arrow::RecordBatch>* out_batch);

    core::Result<void> Close();

    int GetNumRowGroups() const;
    std::vector<int64_t> RowGroupRowCounts() const;
    core::Result<std::shared_ptr<arrow::RecordBatch>> ReadRowGroup(int row_group_index);
    void SelectRowGroups(std::vector<int> row_groups);

    std::shared_ptr<arrow::Schema> schema() const { return schema_; }

    // Footer statistics, file level and per row group
    core::Result<Statistics> ReadStatistics() const;

    // FileMeta embedded in the key/value metadata by ParquetWriter. Missing
    // keys stay zero.
    core::FileMeta ReadFileMeta() const;

private:
    core::Result<void> LoadRowGroup(int row_group_index);

    std::shared_ptr<arrow::Buffer> data_;
    std::unique_ptr<::parquet::arrow::FileReader> reader_;
    std::shared_ptr<arrow::Schema> schema_;
    std::vector<int> row_groups_;
    size_t next_row_group_ = 0;
    std::deque<std::shared_ptr<arrow::RecordBatch>> pending_;
};

} // namespace parquet
} // namespace storage
} // namespace qfab
