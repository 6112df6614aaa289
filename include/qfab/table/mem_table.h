#ifndef QFAB_TABLE_MEM_TABLE_H_
#define QFAB_TABLE_MEM_TABLE_H_

#include <memory>
#include <vector>

#include "qfab/table/table_provider.h"

namespace qfab {
namespace table {

/**
 * @brief Table over record batches held in memory
 */
class MemTable : public TableProvider {
public:
    // Every batch must match the schema by name and type
    static core::Result<std::shared_ptr<MemTable>> Make(std::shared_ptr<arrow::Schema> schema,
                                                        std::vector<std::shared_ptr<arrow::RecordBatch>> batches,
                                                        TableType type = TableType::BASE);

    std::shared_ptr<arrow::Schema> schema() const override { return schema_; }
    core::Result<std::unique_ptr<execution::RecordBatchStream>> Scan(
        const ScanContext& ctx, const ScanRequest& request) const override;
    TableStatistics Statistics() const override;
    TableType type() const override { return type_; }

    MemTable(std::shared_ptr<arrow::Schema> schema, std::vector<std::shared_ptr<arrow::RecordBatch>> batches,
             TableType type)
        : schema_(std::move(schema)), batches_(std::move(batches)), type_(type) {}

private:
    std::shared_ptr<arrow::Schema> schema_;
    std::vector<std::shared_ptr<arrow::RecordBatch>> batches_;
    TableType type_;
};

} // namespace table
} // namespace qfab

#endif // QFAB_TABLE_MEM_TABLE_H_
