#ifndef QFAB_TABLE_TABLE_PROVIDER_H_
#define QFAB_TABLE_TABLE_PROVIDER_H_

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <arrow/api.h>

#include "qfab/core/result.h"
#include "qfab/execution/record_batch_stream.h"
#include "qfab/execution/runtime_env.h"
#include "qfab/execution/session_config.h"
#include "qfab/plan/expr.h"

namespace qfab {
namespace table {

enum class TableType {
    BASE,
    VIEW,
    TEMPORARY
};

std::string TableTypeToString(TableType type);

// Column name -> type the column is read as, overriding the table schema
using TypeCoercionRules = std::map<std::string, std::shared_ptr<arrow::DataType>>;

/**
 * @brief Resources a scan runs with
 */
struct ScanContext {
    execution::SessionConfig config;
    std::shared_ptr<execution::RuntimeEnv> runtime;
};

/**
 * @brief What the engine asks of a provider
 *
 * filters are bound to the provider schema and are inexact hints: providers
 * may use them to skip data, the engine re-applies them.
 */
struct ScanRequest {
    std::optional<std::vector<int>> projection;
    std::vector<plan::ExprPtr> filters;
    std::optional<size_t> limit;
};

struct TableStatistics {
    std::optional<int64_t> num_rows;
};

/**
 * @brief A named source of record batches
 */
class TableProvider {
public:
    virtual ~TableProvider() = default;

    virtual std::shared_ptr<arrow::Schema> schema() const = 0;

    virtual core::Result<std::unique_ptr<execution::RecordBatchStream>> Scan(
        const ScanContext& ctx, const ScanRequest& request) const = 0;

    virtual TableStatistics Statistics() const { return TableStatistics(); }
    virtual TableType type() const { return TableType::BASE; }
};

/**
 * @brief Reshapes a batch onto a target schema
 *
 * Columns are matched by name and reordered, missing columns become nulls and
 * mismatched types are cast.
 */
core::Result<std::shared_ptr<arrow::RecordBatch>> AdaptBatch(const std::shared_ptr<arrow::RecordBatch>& batch,
                                                             const std::shared_ptr<arrow::Schema>& target);

// Schema after applying coercion rules to matching fields
std::shared_ptr<arrow::Schema> ApplyCoercionRules(const std::shared_ptr<arrow::Schema>& schema,
                                                  const TypeCoercionRules& rules);

// Projects a schema onto the given field indices
std::shared_ptr<arrow::Schema> ProjectSchema(const std::shared_ptr<arrow::Schema>& schema,
                                             const std::optional<std::vector<int>>& projection);

/**
 * @brief Wraps a stream, applying a projection, a row limit and slicing to
 * at most batch_size rows per batch
 */
class ProjectingStream : public execution::RecordBatchStream {
public:
    ProjectingStream(std::unique_ptr<execution::RecordBatchStream> input,
                     std::optional<std::vector<int>> projection,
                     std::optional<size_t> limit, size_t batch_size);

    std::shared_ptr<arrow::Schema> schema() const override { return schema_; }
    core::Result<std::shared_ptr<arrow::RecordBatch>> Next() override;

private:
    std::unique_ptr<execution::RecordBatchStream> input_;
    std::optional<std::vector<int>> projection_;
    std::optional<size_t> limit_;
    size_t batch_size_;
    std::shared_ptr<arrow::Schema> schema_;
    size_t produced_ = 0;
    std::shared_ptr<arrow::RecordBatch> pending_;
    int64_t pending_offset_ = 0;
};

} // namespace table
} // namespace qfab

#endif // QFAB_TABLE_TABLE_PROVIDER_H_
