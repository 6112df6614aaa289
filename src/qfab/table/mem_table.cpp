#include "qfab/table/mem_table.h"

namespace qfab {
namespace table {

core::Result<std::shared_ptr<MemTable>> MemTable::Make(std::shared_ptr<arrow::Schema> schema,
                                                       std::vector<std::shared_ptr<arrow::RecordBatch>> batches,
                                                       TableType type) {
    for (auto& batch : batches) {
        if (batch->schema()->Equals(*schema, false)) continue;
        auto adapted = AdaptBatch(batch, schema);
        if (!adapted.ok()) {
            return core::Result<std::shared_ptr<MemTable>>::error(
                "Batch does not match table schema: " + adapted.error(), core::Error::Code::INVALID_ARGUMENT);
        }
        batch = adapted.take_value();
    }
    return core::Result<std::shared_ptr<MemTable>>(
        std::make_shared<MemTable>(std::move(schema), std::move(batches), type));
}

core::Result<std::unique_ptr<execution::RecordBatchStream>> MemTable::Scan(const ScanContext& ctx,
                                                                          const ScanRequest& request) const {
    std::unique_ptr<execution::RecordBatchStream> stream =
        std::make_unique<execution::VectorBatchStream>(schema_, batches_);
    return core::Result<std::unique_ptr<execution::RecordBatchStream>>(
        std::make_unique<ProjectingStream>(std::move(stream), request.projection, request.limit,
                                           ctx.config.batch_size));
}

TableStatistics MemTable::Statistics() const {
    TableStatistics stats;
    int64_t rows = 0;
    for (const auto& batch : batches_) rows += batch->num_rows();
    stats.num_rows = rows;
    return stats;
}

} // namespace table
} // namespace qfab
