#include "qfab/table/table_provider.h"

#include <algorithm>

#include <arrow/compute/api.h>

namespace qfab {
namespace table {

using BatchResult = core::Result<std::shared_ptr<arrow::RecordBatch>>;

std::string TableTypeToString(TableType type) {
    switch (type) {
        case TableType::BASE: return "BASE TABLE";
        case TableType::VIEW: return "VIEW";
        case TableType::TEMPORARY: return "LOCAL TEMPORARY";
    }
    return "BASE TABLE";
}

BatchResult AdaptBatch(const std::shared_ptr<arrow::RecordBatch>& batch,
                       const std::shared_ptr<arrow::Schema>& target) {
    if (batch->schema()->Equals(*target, /*check_metadata=*/false)) {
        return BatchResult(batch);
    }
    std::vector<std::shared_ptr<arrow::Array>> columns;
    columns.reserve(target->num_fields());
    for (const auto& field : target->fields()) {
        auto column = batch->GetColumnByName(field->name());
        if (!column) {
            auto nulls = arrow::MakeArrayOfNull(field->type(), batch->num_rows());
            if (!nulls.ok()) {
                return BatchResult::error("Failed to fill missing column " + field->name() + ": " +
                                              nulls.status().ToString(),
                                          core::Error::Code::EXECUTION_FAILURE);
            }
            columns.push_back(*nulls);
            continue;
        }
        if (!column->type()->Equals(*field->type())) {
            auto cast = arrow::compute::Cast(*column, field->type());
            if (!cast.ok()) {
                return BatchResult::error("Failed to cast column " + field->name() + " from " +
                                              column->type()->ToString() + " to " + field->type()->ToString() +
                                              ": " + cast.status().ToString(),
                                          core::Error::Code::EXECUTION_FAILURE);
            }
            column = *cast;
        }
        columns.push_back(column);
    }
    return BatchResult(arrow::RecordBatch::Make(target, batch->num_rows(), std::move(columns)));
}

std::shared_ptr<arrow::Schema> ApplyCoercionRules(const std::shared_ptr<arrow::Schema>& schema,
                                                  const TypeCoercionRules& rules) {
    if (rules.empty()) return schema;
    std::vector<std::shared_ptr<arrow::Field>> fields;
    for (const auto& field : schema->fields()) {
        auto it = rules.find(field->name());
        fields.push_back(it == rules.end() ? field : field->WithType(it->second));
    }
    return arrow::schema(std::move(fields), schema->metadata());
}

std::shared_ptr<arrow::Schema> ProjectSchema(const std::shared_ptr<arrow::Schema>& schema,
                                             const std::optional<std::vector<int>>& projection) {
    if (!projection) return schema;
    std::vector<std::shared_ptr<arrow::Field>> fields;
    for (int i : *projection) fields.push_back(schema->field(i));
    return arrow::schema(std::move(fields));
}

ProjectingStream::ProjectingStream(std::unique_ptr<execution::RecordBatchStream> input,
                                   std::optional<std::vector<int>> projection,
                                   std::optional<size_t> limit, size_t batch_size)
    : input_(std::move(input)), projection_(std::move(projection)), limit_(limit),
      batch_size_(batch_size == 0 ? 8192 : batch_size) {
    schema_ = ProjectSchema(input_->schema(), projection_);
}

BatchResult ProjectingStream::Next() {
    while (true) {
        if (limit_ && produced_ >= *limit_) {
            return BatchResult(nullptr);
        }
        if (!pending_ || pending_offset_ >= pending_->num_rows()) {
            auto next = input_->Next();
            if (!next.ok()) return next;
            if (!next.value()) return BatchResult(nullptr);
            pending_ = next.take_value();
            pending_offset_ = 0;
            if (pending_->num_rows() == 0) continue;
        }
        int64_t take = std::min<int64_t>(pending_->num_rows() - pending_offset_, static_cast<int64_t>(batch_size_));
        if (limit_) {
            take = std::min<int64_t>(take, static_cast<int64_t>(*limit_ - produced_));
        }
        auto slice = pending_->Slice(pending_offset_, take);
        pending_offset_ += take;
        produced_ += static_cast<size_t>(take);
        if (projection_) {
            auto projected = slice->SelectColumns(*projection_);
            if (!projected.ok()) {
                return BatchResult::error("Failed to project batch: " + projected.status().ToString(),
                                          core::Error::Code::EXECUTION_FAILURE);
            }
            slice = *projected;
        }
        return BatchResult(slice);
    }
}

} // namespace table
} // namespace qfab
