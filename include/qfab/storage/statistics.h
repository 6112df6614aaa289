#ifndef QFAB_STORAGE_STATISTICS_H_
#define QFAB_STORAGE_STATISTICS_H_

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <arrow/api.h>

namespace qfab {
namespace storage {

/**
 * @brief Min/max/null-count summary of one column
 *
 * min and max are null when the writer recorded no bounds.
 */
struct ColumnStatistics {
    std::shared_ptr<arrow::Scalar> min;
    std::shared_ptr<arrow::Scalar> max;
    int64_t null_count = 0;

    bool has_min_max() const { return min != nullptr && max != nullptr; }
};

struct RowGroupStatistics {
    int64_t num_rows = 0;
    std::map<std::string, ColumnStatistics> columns;
};

/**
 * @brief Footer statistics of one Parquet segment file
 */
struct Statistics {
    int64_t num_rows = 0;
    int64_t total_byte_size = 0;
    std::shared_ptr<arrow::Schema> file_schema;
    std::map<std::string, ColumnStatistics> columns;
    std::vector<RowGroupStatistics> row_groups;

    const ColumnStatistics* column(const std::string& name) const {
        auto it = columns.find(name);
        return it == columns.end() ? nullptr : &it->second;
    }
};

/**
 * @brief Three-way comparison of two scalars of compatible types
 *
 * Integers, floating point values, strings and timestamps are supported,
 * mixed integer/floating comparisons go through double. Returns nullopt when
 * either side is null or the types cannot be compared.
 */
std::optional<int> CompareScalars(const arrow::Scalar& a, const arrow::Scalar& b);

// Folds the bounds of `other` into `into`
void MergeColumnStatistics(ColumnStatistics* into, const ColumnStatistics& other);

} // namespace storage
} // namespace qfab

#endif // QFAB_STORAGE_STATISTICS_H_
