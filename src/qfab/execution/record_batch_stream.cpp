#include "qfab/execution/record_batch_stream.h"

namespace qfab {
namespace execution {

core::Result<std::shared_ptr<arrow::Table>> CollectToTable(RecordBatchStream& stream) {
    using TableResult = core::Result<std::shared_ptr<arrow::Table>>;
    std::vector<std::shared_ptr<arrow::RecordBatch>> batches;
    while (true) {
        auto next = stream.Next();
        if (!next.ok()) {
            return TableResult::error(next);
        }
        if (!next.value()) break;
        batches.push_back(next.take_value());
    }
    auto table = arrow::Table::FromRecordBatches(stream.schema(), batches);
    if (!table.ok()) {
        return TableResult::error("Failed to assemble result table: " + table.status().ToString(),
                                  core::Error::Code::EXECUTION_FAILURE);
    }
    return TableResult(*table);
}

} // namespace execution
} // namespace qfab
