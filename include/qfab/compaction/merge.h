#ifndef QFAB_COMPACTION_MERGE_H_
#define QFAB_COMPACTION_MERGE_H_

#include <memory>
#include <string>
#include <vector>

#include <arrow/api.h>

#include "qfab/core/result.h"
#include "qfab/core/types.h"
#include "qfab/table/table_provider.h"

namespace qfab {
namespace compaction {

/**
 * @brief Output of one compaction
 *
 * bloom_filters is the serialized filter set of the requested fields, empty
 * when none was requested.
 */
struct CompactionResult {
    std::shared_ptr<arrow::Schema> schema;
    std::shared_ptr<arrow::Buffer> data;
    std::shared_ptr<arrow::Buffer> bloom_filters;
    int64_t rows = 0;
};

/**
 * @brief The compaction query for a stream, reading from table "tbl"
 *
 * Index streams drop every file that has a deletion marker. Hourly
 * distinct-value streams roll rows up by all other fields when
 * limit.distinct_values_hourly is on. Everything else is re-sorted by time.
 */
std::string BuildMergeSql(core::StreamType stream_type, const std::string& stream_name,
                          const arrow::Schema& schema);

/**
 * @brief Merges segment tables into one Parquet file sorted by time
 *
 * Write errors fail with WRITE_FAILURE; planning and execution errors are
 * returned unchanged. No partial output is returned.
 */
core::Result<CompactionResult> MergeParquetFiles(core::StreamType stream_type, const std::string& stream_name,
                                                 const std::shared_ptr<arrow::Schema>& schema,
                                                 std::vector<std::shared_ptr<table::TableProvider>> tables,
                                                 const std::vector<std::string>& bloom_filter_fields,
                                                 const core::FileMeta& metadata);

} // namespace compaction
} // namespace qfab

#endif // QFAB_COMPACTION_MERGE_H_
