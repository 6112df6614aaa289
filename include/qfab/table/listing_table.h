#ifndef QFAB_TABLE_LISTING_TABLE_H_
#define QFAB_TABLE_LISTING_TABLE_H_

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "qfab/storage/file_list.h"
#include "qfab/storage/object_store.h"
#include "qfab/storage/statistics.h"
#include "qfab/table/index_condition.h"
#include "qfab/table/table_provider.h"

namespace qfab {
namespace table {

struct SortColumn {
    std::string name;
    bool descending = false;
    bool nulls_first = false;
};

struct ListingOptions {
    std::string file_extension = ".parquet";
    size_t target_partitions = 1;
    std::vector<SortColumn> file_sort_order;
    bool collect_stat = true;
};

struct ListingTableConfig {
    std::string table_path;                                 // e.g. memory:///{session}/schema={key}/
    ListingOptions options;
    std::shared_ptr<arrow::Schema> schema;
    TypeCoercionRules rules;
    std::shared_ptr<const IndexCondition> index_condition;
    std::vector<std::string> fast_fields;
    bool use_statistics_cache = true;                       // only honoured when the runtime has one
    std::optional<int64_t> row_estimate;
    // Staged file list the table lists from, released with the table
    std::shared_ptr<storage::FileListLease> staged_files;
};

/**
 * @brief A (column op literal) conjunct usable for pruning
 */
struct ColumnPredicate {
    enum class Op { EQ, LT, LT_EQ, GT, GT_EQ };

    std::string column;
    Op op = Op::EQ;
    std::shared_ptr<arrow::Scalar> value;
};

// Extracts pruning predicates from filter hints bound to schema
std::vector<ColumnPredicate> ExtractColumnPredicates(const std::vector<plan::ExprPtr>& filters,
                                                     const arrow::Schema& schema);

// False when the bounds prove no row can satisfy the predicate
bool MayMatch(const ColumnPredicate& predicate, const storage::ColumnStatistics& stats);

/**
 * @brief One segment file chosen for reading
 */
struct PartitionedFile {
    storage::ObjectMeta object;
    std::string file_key;
    std::shared_ptr<const storage::Statistics> statistics;
    std::optional<std::vector<int>> row_groups;   // all when unset
};

using FileGroup = std::vector<PartitionedFile>;

/**
 * @brief Splits files into groups whose sort column ranges do not overlap
 *
 * Returns nullopt when a file lacks bounds for the sort column.
 */
std::optional<std::vector<FileGroup>> SplitGroupsByStatistics(std::vector<PartitionedFile> files,
                                                              const SortColumn& sort);

// Round-robin assignment in listing order
std::vector<FileGroup> SplitGroupsRoundRobin(std::vector<PartitionedFile> files, size_t target_partitions);

/**
 * @brief Table over the segment files found under a store prefix
 */
class ListingTable : public TableProvider {
public:
    explicit ListingTable(ListingTableConfig config);

    std::shared_ptr<arrow::Schema> schema() const override { return schema_; }
    core::Result<std::unique_ptr<execution::RecordBatchStream>> Scan(
        const ScanContext& ctx, const ScanRequest& request) const override;
    TableStatistics Statistics() const override;

    const ListingTableConfig& config() const { return config_; }

    // Files that survive listing and pruning, grouped for reading
    core::Result<std::vector<FileGroup>> PlanFiles(const ScanContext& ctx,
                                                   const std::vector<plan::ExprPtr>& filters) const;

private:
    core::Result<std::vector<storage::ObjectMeta>> ListFiles(const ScanContext& ctx,
                                                             const storage::ObjectStore& store,
                                                             const std::string& prefix) const;

    ListingTableConfig config_;
    std::shared_ptr<arrow::Schema> schema_;
};

} // namespace table
} // namespace qfab

#endif // QFAB_TABLE_LISTING_TABLE_H_
