#ifndef QFAB_TABLE_UNION_TABLE_H_
#define QFAB_TABLE_UNION_TABLE_H_

#include <memory>
#include <vector>

#include "qfab/table/table_provider.h"

namespace qfab {
namespace table {

/**
 * @brief One table over providers whose schemas differ
 *
 * Providers are scanned in order and each batch is adapted to the union
 * schema. Filter hints are forwarded only to providers that carry every
 * referenced column with the union type. A column of the union schema is
 * non-null only when every provider carries it non-null with the union type.
 */
class UnionTable : public TableProvider {
public:
    UnionTable(std::shared_ptr<arrow::Schema> schema, std::vector<std::shared_ptr<TableProvider>> providers);

    std::shared_ptr<arrow::Schema> schema() const override { return schema_; }
    core::Result<std::unique_ptr<execution::RecordBatchStream>> Scan(
        const ScanContext& ctx, const ScanRequest& request) const override;
    TableStatistics Statistics() const override;

    const std::vector<std::shared_ptr<TableProvider>>& providers() const { return providers_; }

private:
    std::shared_ptr<arrow::Schema> schema_;
    std::vector<std::shared_ptr<TableProvider>> providers_;
};

} // namespace table
} // namespace qfab

#endif // QFAB_TABLE_UNION_TABLE_H_
