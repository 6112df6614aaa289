#ifndef QFAB_TABLE_TABLE_FACTORY_H_
#define QFAB_TABLE_TABLE_FACTORY_H_

#include <memory>
#include <string>
#include <vector>

#include <arrow/api.h>

#include "qfab/core/result.h"
#include "qfab/core/types.h"
#include "qfab/execution/execution_context.h"
#include "qfab/table/index_condition.h"
#include "qfab/table/listing_table.h"

namespace qfab {
namespace table {

/**
 * @brief Presents the segment files of a session as one listing table
 *
 * MEMORY and WAL sessions stage the file list under the schema key first;
 * TMPFS sessions list the scratch prefix of the session. Any other storage
 * type fails with UNSUPPORTED_STORAGE_BACKEND before anything is staged.
 * A nullable time column is exposed as non-nullable int64.
 */
core::Result<std::shared_ptr<ListingTable>> CreateParquetTable(
    const core::SearchSession& session,
    const std::shared_ptr<arrow::Schema>& schema,
    const std::vector<core::SegmentFileKey>& files,
    const TypeCoercionRules& rules,
    bool sorted_by_time,
    bool use_statistics_cache,
    std::shared_ptr<const IndexCondition> index_condition,
    std::vector<std::string> fast_fields);

// True when the sort key is exactly (time column, descending)
bool IsSortedByTime(const core::SortKey& sort_key);

/**
 * @brief Prepares a context for the session and registers its files as a table
 */
core::Result<std::unique_ptr<execution::ExecutionContext>> RegisterTable(
    const core::SearchSession& session,
    const std::shared_ptr<arrow::Schema>& schema,
    const std::string& table_name,
    const std::vector<core::SegmentFileKey>& files,
    const TypeCoercionRules& rules,
    const core::SortKey& sort_key);

} // namespace table
} // namespace qfab

#endif // QFAB_TABLE_TABLE_FACTORY_H_
