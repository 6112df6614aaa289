#ifndef QFAB_EXECUTION_RECORD_BATCH_STREAM_H_
#define QFAB_EXECUTION_RECORD_BATCH_STREAM_H_

#include <memory>
#include <vector>

#include <arrow/api.h>

#include "qfab/core/result.h"

namespace qfab {
namespace execution {

/**
 * @brief Pull-based stream of record batches
 *
 * Next() yields null once the stream is exhausted.
 */
class RecordBatchStream {
public:
    virtual ~RecordBatchStream() = default;

    virtual std::shared_ptr<arrow::Schema> schema() const = 0;
    virtual core::Result<std::shared_ptr<arrow::RecordBatch>> Next() = 0;
};

/**
 * @brief Stream over batches already in memory
 */
class VectorBatchStream : public RecordBatchStream {
public:
    VectorBatchStream(std::shared_ptr<arrow::Schema> schema,
                      std::vector<std::shared_ptr<arrow::RecordBatch>> batches)
        : schema_(std::move(schema)), batches_(std::move(batches)) {}

    std::shared_ptr<arrow::Schema> schema() const override { return schema_; }

    core::Result<std::shared_ptr<arrow::RecordBatch>> Next() override {
        if (pos_ >= batches_.size()) {
            return core::Result<std::shared_ptr<arrow::RecordBatch>>(nullptr);
        }
        return core::Result<std::shared_ptr<arrow::RecordBatch>>(batches_[pos_++]);
    }

private:
    std::shared_ptr<arrow::Schema> schema_;
    std::vector<std::shared_ptr<arrow::RecordBatch>> batches_;
    size_t pos_ = 0;
};

// Drains a stream into a table with the stream's schema
core::Result<std::shared_ptr<arrow::Table>> CollectToTable(RecordBatchStream& stream);

} // namespace execution
} // namespace qfab

#endif // QFAB_EXECUTION_RECORD_BATCH_STREAM_H_
