#include "qfab/plan/physical_plan.h"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <mutex>
#include <sstream>

#include <arrow/acero/exec_plan.h>
#include <arrow/acero/options.h>
#include <arrow/compute/api.h>
#include <arrow/io/file.h>
#include <arrow/ipc/reader.h>
#include <arrow/ipc/writer.h>
#include <arrow/util/byte_size.h>

#include "qfab/common/logger.h"
#include "qfab/storage/statistics.h"

namespace qfab {
namespace plan {

namespace cp = arrow::compute;
namespace ac = arrow::acero;

using StreamPtr = std::unique_ptr<execution::RecordBatchStream>;
using StreamResult = core::Result<StreamPtr>;
using BatchResult = core::Result<std::shared_ptr<arrow::RecordBatch>>;

namespace {

BatchResult BatchError(const arrow::Status& status, const std::string& context) {
    auto converted = core::FromStatus(status, core::Error::Code::EXECUTION_FAILURE, context);
    return BatchResult::error(converted);
}

std::string JoinExprs(const std::vector<ExprPtr>& exprs) {
    std::ostringstream oss;
    for (size_t i = 0; i < exprs.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << exprs[i]->ToString();
    }
    return oss.str();
}

/**
 * @brief Evaluates expressions over each input batch
 *
 * IN subqueries are materialized before the first batch is pulled.
 */
class ExprStream : public execution::RecordBatchStream {
public:
    ExprStream(StreamPtr input, std::vector<ExprPtr> exprs, std::shared_ptr<arrow::Schema> schema,
               SubqueryPlans subqueries, TaskContext ctx)
        : input_(std::move(input)), exprs_(std::move(exprs)), schema_(std::move(schema)),
          subqueries_(std::move(subqueries)), ctx_(std::move(ctx)) {}

    std::shared_ptr<arrow::Schema> schema() const override { return schema_; }

    BatchResult Next() override {
        if (!bound_) {
            auto bind = Bind();
            if (!bind.ok()) return BatchResult::error(bind);
        }
        auto next = input_->Next();
        if (!next.ok() || !next.value()) return next;
        const auto& batch = *next.value();
        std::vector<std::shared_ptr<arrow::Array>> columns;
        columns.reserve(bound_exprs_.size());
        for (const auto& bound : bound_exprs_) {
            auto column = EvaluateExpression(bound, batch);
            if (!column.ok()) return BatchResult::error(column);
            columns.push_back(column.take_value());
        }
        return BatchResult(arrow::RecordBatch::Make(schema_, batch.num_rows(), std::move(columns)));
    }

private:
    core::Result<void> Bind() {
        auto results = MaterializeSubqueries(subqueries_, ctx_);
        if (!results.ok()) return core::Result<void>::error(results);
        for (const auto& expr : exprs_) {
            auto bound = BindExpression(*expr, *input_->schema(), &results.value());
            if (!bound.ok()) return core::Result<void>::error(bound);
            bound_exprs_.push_back(bound.take_value());
        }
        bound_ = true;
        return core::Result<void>();
    }

    StreamPtr input_;
    std::vector<ExprPtr> exprs_;
    std::shared_ptr<arrow::Schema> schema_;
    SubqueryPlans subqueries_;
    TaskContext ctx_;
    bool bound_ = false;
    std::vector<cp::Expression> bound_exprs_;
};

class FilterStream : public execution::RecordBatchStream {
public:
    FilterStream(StreamPtr input, ExprPtr predicate, SubqueryPlans subqueries, TaskContext ctx)
        : input_(std::move(input)), predicate_(std::move(predicate)), subqueries_(std::move(subqueries)),
          ctx_(std::move(ctx)) {}

    std::shared_ptr<arrow::Schema> schema() const override { return input_->schema(); }

    BatchResult Next() override {
        if (!bound_) {
            auto results = MaterializeSubqueries(subqueries_, ctx_);
            if (!results.ok()) return BatchResult::error(results);
            auto bound = BindExpression(*predicate_, *input_->schema(), &results.value());
            if (!bound.ok()) return BatchResult::error(bound);
            bound_predicate_ = bound.take_value();
            bound_ = true;
        }
        while (true) {
            auto next = input_->Next();
            if (!next.ok() || !next.value()) return next;
            auto batch = next.take_value();
            auto mask = EvaluateExpression(bound_predicate_, *batch);
            if (!mask.ok()) return BatchResult::error(mask);
            auto filtered = cp::Filter(batch, mask.value());
            if (!filtered.ok()) return BatchError(filtered.status(), "Failed to filter batch");
            auto out = filtered->record_batch();
            if (out->num_rows() > 0) return BatchResult(std::move(out));
        }
    }

private:
    StreamPtr input_;
    ExprPtr predicate_;
    SubqueryPlans subqueries_;
    TaskContext ctx_;
    bool bound_ = false;
    cp::Expression bound_predicate_;
};

// Same columns under another schema
class RenameStream : public execution::RecordBatchStream {
public:
    RenameStream(StreamPtr input, std::shared_ptr<arrow::Schema> schema)
        : input_(std::move(input)), schema_(std::move(schema)) {}

    std::shared_ptr<arrow::Schema> schema() const override { return schema_; }

    BatchResult Next() override {
        auto next = input_->Next();
        if (!next.ok() || !next.value()) return next;
        return BatchResult(arrow::RecordBatch::Make(schema_, next.value()->num_rows(), next.value()->columns()));
    }

private:
    StreamPtr input_;
    std::shared_ptr<arrow::Schema> schema_;
};

// First error seen by a StreamBatchReader, kept with its code
struct ErrorSlot {
    std::mutex mutex;
    std::optional<std::pair<std::string, core::Error::Code>> error;
};

/**
 * @brief Presents a RecordBatchStream to Acero as a RecordBatchReader
 */
class StreamBatchReader : public arrow::RecordBatchReader {
public:
    StreamBatchReader(StreamPtr stream, std::shared_ptr<ErrorSlot> slot)
        : stream_(std::move(stream)), slot_(std::move(slot)) {}

    std::shared_ptr<arrow::Schema> schema() const override { return stream_->schema(); }

    arrow::Status ReadNext(std::shared_ptr<arrow::RecordBatch>* batch) override {
        auto next = stream_->Next();
        if (!next.ok()) {
            std::lock_guard<std::mutex> lock(slot_->mutex);
            if (!slot_->error) slot_->error = std::make_pair(next.error(), next.error_code());
            return arrow::Status::ExecutionError(next.error());
        }
        *batch = next.take_value();
        return arrow::Status::OK();
    }

private:
    StreamPtr stream_;
    std::shared_ptr<ErrorSlot> slot_;
};

ac::Declaration ReaderSource(StreamPtr stream, const std::shared_ptr<ErrorSlot>& slot) {
    std::shared_ptr<arrow::RecordBatchReader> reader = std::make_shared<StreamBatchReader>(std::move(stream), slot);
    return ac::Declaration("record_batch_reader_source", ac::RecordBatchReaderSourceNodeOptions(std::move(reader)));
}

/**
 * @brief Pulls an Acero plan and maps its output columns onto a target schema
 *
 * column_map[i] is the Acero column for target field i. List outputs are
 * unwrapped to their first element; other type differences are cast.
 */
class AceroStream : public execution::RecordBatchStream {
public:
    AceroStream(std::unique_ptr<arrow::RecordBatchReader> reader, std::shared_ptr<arrow::Schema> schema,
                std::vector<int> column_map, std::shared_ptr<ErrorSlot> slot, std::string label)
        : reader_(std::move(reader)), schema_(std::move(schema)), column_map_(std::move(column_map)),
          slot_(std::move(slot)), label_(std::move(label)) {}

    std::shared_ptr<arrow::Schema> schema() const override { return schema_; }

    BatchResult Next() override {
        while (true) {
            std::shared_ptr<arrow::RecordBatch> batch;
            auto status = reader_->ReadNext(&batch);
            if (!status.ok()) {
                std::lock_guard<std::mutex> lock(slot_->mutex);
                if (slot_->error) return BatchResult::error(slot_->error->first, slot_->error->second);
                return BatchError(status, label_);
            }
            if (!batch) return BatchResult(nullptr);
            if (batch->num_rows() == 0 && schema_->num_fields() > 0) continue;
            std::vector<std::shared_ptr<arrow::Array>> columns;
            for (int i = 0; i < schema_->num_fields(); ++i) {
                auto column = batch->column(column_map_[i]);
                auto id = column->type_id();
                if (id == arrow::Type::LIST || id == arrow::Type::LARGE_LIST || id == arrow::Type::FIXED_SIZE_LIST) {
                    auto first = cp::CallFunction("list_element",
                                                  {column, arrow::Datum(arrow::MakeScalar(static_cast<int32_t>(0)))});
                    if (!first.ok()) return BatchError(first.status(), label_);
                    column = first->make_array();
                }
                const auto& target = schema_->field(i)->type();
                if (!column->type()->Equals(*target)) {
                    auto cast = cp::Cast(*column, target);
                    if (!cast.ok()) return BatchError(cast.status(), label_);
                    column = *cast;
                }
                columns.push_back(std::move(column));
            }
            return BatchResult(arrow::RecordBatch::Make(schema_, batch->num_rows(), std::move(columns)));
        }
    }

private:
    std::unique_ptr<arrow::RecordBatchReader> reader_;
    std::shared_ptr<arrow::Schema> schema_;
    std::vector<int> column_map_;
    std::shared_ptr<ErrorSlot> slot_;
    std::string label_;
};

core::Result<std::vector<int>> MapColumns(const arrow::Schema& acero_schema, const std::vector<std::string>& names) {
    std::vector<int> map;
    for (const auto& name : names) {
        int index = acero_schema.GetFieldIndex(name);
        if (index < 0) {
            return core::Result<std::vector<int>>::error("Acero output lacks column " + name,
                                                         core::Error::Code::INTERNAL);
        }
        map.push_back(index);
    }
    return core::Result<std::vector<int>>(std::move(map));
}

class LimitStream : public execution::RecordBatchStream {
public:
    LimitStream(StreamPtr input, size_t skip, std::optional<size_t> fetch)
        : input_(std::move(input)), skip_(skip), fetch_(fetch) {}

    std::shared_ptr<arrow::Schema> schema() const override { return input_->schema(); }

    BatchResult Next() override {
        while (!fetch_ || produced_ < *fetch_) {
            auto next = input_->Next();
            if (!next.ok() || !next.value()) return next;
            auto batch = next.take_value();
            int64_t offset = 0;
            if (skip_ > 0) {
                int64_t skipped = std::min<int64_t>(static_cast<int64_t>(skip_), batch->num_rows());
                skip_ -= static_cast<size_t>(skipped);
                offset = skipped;
            }
            int64_t length = batch->num_rows() - offset;
            if (fetch_) length = std::min<int64_t>(length, static_cast<int64_t>(*fetch_ - produced_));
            if (length <= 0) continue;
            produced_ += static_cast<size_t>(length);
            return BatchResult(batch->Slice(offset, length));
        }
        return BatchResult(nullptr);
    }

private:
    StreamPtr input_;
    size_t skip_;
    std::optional<size_t> fetch_;
    size_t produced_ = 0;
};

// ---------------------------------------------------------------------------
// Sorting

class SortedRun {
public:
    virtual ~SortedRun() = default;
    // Null once the run is exhausted
    virtual BatchResult NextBatch() = 0;
};

class MemoryRun : public SortedRun {
public:
    MemoryRun(std::shared_ptr<arrow::RecordBatch> batch, int64_t batch_size)
        : batch_(std::move(batch)), batch_size_(batch_size) {}

    BatchResult NextBatch() override {
        if (offset_ >= batch_->num_rows()) return BatchResult(nullptr);
        auto out = batch_->Slice(offset_, batch_size_);
        offset_ += out->num_rows();
        return BatchResult(std::move(out));
    }

private:
    std::shared_ptr<arrow::RecordBatch> batch_;
    int64_t batch_size_;
    int64_t offset_ = 0;
};

class FileRun : public SortedRun {
public:
    explicit FileRun(std::string path) : path_(std::move(path)) {}
    ~FileRun() override {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    BatchResult NextBatch() override {
        if (!reader_) {
            auto file = arrow::io::ReadableFile::Open(path_);
            if (!file.ok()) return BatchError(file.status(), "Failed to open spill file " + path_);
            auto reader = arrow::ipc::RecordBatchFileReader::Open(*file);
            if (!reader.ok()) return BatchError(reader.status(), "Failed to read spill file " + path_);
            reader_ = *reader;
        }
        if (next_ >= reader_->num_record_batches()) return BatchResult(nullptr);
        auto batch = reader_->ReadRecordBatch(next_++);
        if (!batch.ok()) return BatchError(batch.status(), "Failed to read spill file " + path_);
        return BatchResult(*batch);
    }

private:
    std::string path_;
    std::shared_ptr<arrow::ipc::RecordBatchFileReader> reader_;
    int next_ = 0;
};

int CompareRows(const std::vector<SortKeySpec>& keys, const arrow::RecordBatch& a, int64_t ra,
                const arrow::RecordBatch& b, int64_t rb) {
    for (const auto& key : keys) {
        const auto& ca = a.column(key.column);
        const auto& cb = b.column(key.column);
        bool na = ca->IsNull(ra);
        bool nb = cb->IsNull(rb);
        if (na && nb) continue;
        if (na != nb) {
            int c = na ? -1 : 1;
            return key.nulls_first ? c : -c;
        }
        auto sa = ca->GetScalar(ra);
        auto sb = cb->GetScalar(rb);
        if (!sa.ok() || !sb.ok()) continue;
        auto c = storage::CompareScalars(**sa, **sb);
        if (!c || *c == 0) continue;
        return key.descending ? -*c : *c;
    }
    return 0;
}

std::atomic<uint64_t> spill_counter{0};

class SortStream : public execution::RecordBatchStream {
public:
    SortStream(StreamPtr input, std::vector<SortKeySpec> keys, std::optional<size_t> fetch, const TaskContext& ctx)
        : input_(std::move(input)), keys_(std::move(keys)), fetch_(fetch),
          batch_size_(static_cast<int64_t>(ctx.config.batch_size == 0 ? 8192 : ctx.config.batch_size)),
          pool_(ctx.runtime->memory_pool), tmp_dir_(ctx.runtime->tmp_dir) {
        reservation_ = pool_->Register(execution::MemoryConsumer("SortExec", /*can_spill=*/true));
    }

    std::shared_ptr<arrow::Schema> schema() const override { return input_->schema(); }

    BatchResult Next() override {
        if (!prepared_) {
            auto prepared = Prepare();
            if (!prepared.ok()) return BatchResult::error(prepared);
            prepared_ = true;
        }
        if (fetch_ && emitted_ >= *fetch_) return BatchResult(nullptr);
        int64_t budget = batch_size_;
        if (fetch_) budget = std::min<int64_t>(budget, static_cast<int64_t>(*fetch_ - emitted_));
        auto batch = runs_.size() == 1 ? NextFromSingleRun(budget) : NextMerged(budget);
        if (batch.ok() && batch.value()) emitted_ += static_cast<size_t>(batch.value()->num_rows());
        return batch;
    }

private:
    struct Cursor {
        std::unique_ptr<SortedRun> run;
        std::shared_ptr<arrow::RecordBatch> batch;
        int64_t row = 0;
    };

    core::Result<void> Prepare() {
        while (true) {
            auto next = input_->Next();
            if (!next.ok()) return core::Result<void>::error(next);
            auto batch = next.take_value();
            if (!batch) break;
            if (batch->num_rows() == 0) continue;
            auto bytes = static_cast<size_t>(arrow::util::TotalBufferSize(*batch));
            auto grown = reservation_.TryGrow(bytes);
            if (!grown.ok()) {
                if (!pool_->supports_spill() || buffered_.empty()) {
                    return grown;
                }
                auto spilled = Spill();
                if (!spilled.ok()) return spilled;
                grown = reservation_.TryGrow(bytes);
                if (!grown.ok()) return grown;
            }
            buffered_.push_back(std::move(batch));
        }

        auto sorted = SortBuffered();
        if (!sorted.ok()) return core::Result<void>::error(sorted);
        if (sorted.value()) {
            runs_.push_back(Cursor{std::make_unique<MemoryRun>(sorted.take_value(), batch_size_), nullptr, 0});
        }
        for (auto& cursor : runs_) {
            auto advanced = Advance(cursor);
            if (!advanced.ok()) return advanced;
        }
        return core::Result<void>();
    }

    // Sorts and truncates the buffered batches into one batch; null when empty
    BatchResult SortBuffered() {
        if (buffered_.empty()) return BatchResult(nullptr);
        auto table = arrow::Table::FromRecordBatches(input_->schema(), buffered_);
        if (!table.ok()) return BatchError(table.status(), "Failed to combine sort input");
        auto combined = (*table)->CombineChunksToBatch();
        if (!combined.ok()) return BatchError(combined.status(), "Failed to combine sort input");
        auto batch = *combined;

        // Each key sorts on (is_null, value) so null placement is per key
        arrow::FieldVector key_fields;
        std::vector<std::shared_ptr<arrow::Array>> key_columns;
        std::vector<cp::SortKey> sort_keys;
        for (size_t i = 0; i < keys_.size(); ++i) {
            const auto& key = keys_[i];
            auto column = batch->column(key.column);
            auto nulls = cp::CallFunction("is_null", {column});
            if (!nulls.ok()) return BatchError(nulls.status(), "Failed to sort");
            key_fields.push_back(arrow::field("n" + std::to_string(i), arrow::boolean()));
            key_columns.push_back(nulls->make_array());
            key_fields.push_back(arrow::field("v" + std::to_string(i), column->type()));
            key_columns.push_back(column);
            sort_keys.emplace_back(arrow::FieldRef(static_cast<int>(2 * i)),
                                   key.nulls_first ? cp::SortOrder::Descending : cp::SortOrder::Ascending);
            sort_keys.emplace_back(arrow::FieldRef(static_cast<int>(2 * i + 1)),
                                   key.descending ? cp::SortOrder::Descending : cp::SortOrder::Ascending);
        }
        auto key_batch = arrow::RecordBatch::Make(arrow::schema(key_fields), batch->num_rows(), key_columns);
        auto indices = cp::SortIndices(arrow::Datum(key_batch), cp::SortOptions(sort_keys));
        if (!indices.ok()) return BatchError(indices.status(), "Failed to sort");
        std::shared_ptr<arrow::Array> order = *indices;
        if (fetch_ && static_cast<size_t>(order->length()) > *fetch_) {
            order = order->Slice(0, static_cast<int64_t>(*fetch_));
        }
        auto taken = cp::Take(arrow::Datum(batch), arrow::Datum(order));
        if (!taken.ok()) return BatchError(taken.status(), "Failed to sort");
        buffered_.clear();
        return BatchResult(taken->record_batch());
    }

    core::Result<void> Spill() {
        auto sorted = SortBuffered();
        if (!sorted.ok()) return core::Result<void>::error(sorted);
        auto batch = sorted.take_value();
        reservation_.Free();

        std::filesystem::path dir = tmp_dir_.empty() ? std::filesystem::temp_directory_path()
                                                     : std::filesystem::path(tmp_dir_);
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        std::string path = (dir / ("qfab-sort-" + std::to_string(stamp) + "-" +
                                   std::to_string(spill_counter.fetch_add(1)) + ".arrow")).string();

        auto out = arrow::io::FileOutputStream::Open(path);
        if (!out.ok()) return core::FromStatus(out.status(), core::Error::Code::EXECUTION_FAILURE, "Failed to spill");
        auto writer = arrow::ipc::MakeFileWriter(*out, input_->schema());
        if (!writer.ok()) {
            return core::FromStatus(writer.status(), core::Error::Code::EXECUTION_FAILURE, "Failed to spill");
        }
        for (int64_t offset = 0; offset < batch->num_rows(); offset += batch_size_) {
            auto status = (*writer)->WriteRecordBatch(*batch->Slice(offset, batch_size_));
            if (!status.ok()) return core::FromStatus(status, core::Error::Code::EXECUTION_FAILURE, "Failed to spill");
        }
        auto status = (*writer)->Close();
        if (status.ok()) status = (*out)->Close();
        if (!status.ok()) return core::FromStatus(status, core::Error::Code::EXECUTION_FAILURE, "Failed to spill");

        QFAB_DEBUG("[sort] spilled {} rows to {}", batch->num_rows(), path);
        runs_.push_back(Cursor{std::make_unique<FileRun>(path), nullptr, 0});
        return core::Result<void>();
    }

    core::Result<void> Advance(Cursor& cursor) {
        while (!cursor.batch || cursor.row >= cursor.batch->num_rows()) {
            auto next = cursor.run->NextBatch();
            if (!next.ok()) return core::Result<void>::error(next);
            cursor.batch = next.take_value();
            cursor.row = 0;
            if (!cursor.batch) break;
        }
        return core::Result<void>();
    }

    BatchResult NextFromSingleRun(int64_t budget) {
        auto& cursor = runs_.front();
        if (!cursor.batch) return BatchResult(nullptr);
        auto out = cursor.batch->Slice(cursor.row, budget);
        cursor.row += out->num_rows();
        auto advanced = Advance(cursor);
        if (!advanced.ok()) return BatchResult::error(advanced);
        return BatchResult(std::move(out));
    }

    // k-way merge; ties go to the earlier run, which holds earlier input
    BatchResult NextMerged(int64_t budget) {
        std::vector<std::shared_ptr<arrow::RecordBatch>> slices;
        std::shared_ptr<arrow::RecordBatch> current;
        int64_t start = 0;
        int64_t length = 0;
        int64_t total = 0;
        auto flush = [&]() {
            if (current && length > 0) slices.push_back(current->Slice(start, length));
            current.reset();
            length = 0;
        };

        while (total < budget) {
            int best = -1;
            for (size_t i = 0; i < runs_.size(); ++i) {
                if (!runs_[i].batch) continue;
                if (best < 0 || CompareRows(keys_, *runs_[i].batch, runs_[i].row, *runs_[best].batch,
                                            runs_[best].row) < 0) {
                    best = static_cast<int>(i);
                }
            }
            if (best < 0) break;
            auto& cursor = runs_[best];
            if (current == cursor.batch && start + length == cursor.row) {
                length++;
            } else {
                flush();
                current = cursor.batch;
                start = cursor.row;
                length = 1;
            }
            cursor.row++;
            total++;
            if (cursor.row >= cursor.batch->num_rows()) {
                flush();
                auto advanced = Advance(cursor);
                if (!advanced.ok()) return BatchResult::error(advanced);
            }
        }
        flush();
        if (slices.empty()) return BatchResult(nullptr);
        auto table = arrow::Table::FromRecordBatches(input_->schema(), slices);
        if (!table.ok()) return BatchError(table.status(), "Failed to merge sorted runs");
        auto combined = (*table)->CombineChunksToBatch();
        if (!combined.ok()) return BatchError(combined.status(), "Failed to merge sorted runs");
        return BatchResult(*combined);
    }

    StreamPtr input_;
    std::vector<SortKeySpec> keys_;
    std::optional<size_t> fetch_;
    int64_t batch_size_;
    std::shared_ptr<execution::MemoryPool> pool_;
    std::string tmp_dir_;
    execution::MemoryReservation reservation_;

    bool prepared_ = false;
    std::vector<std::shared_ptr<arrow::RecordBatch>> buffered_;
    std::vector<Cursor> runs_;
    size_t emitted_ = 0;
};

} // namespace

// ---------------------------------------------------------------------------

std::string ExecNode::ToString(int indent) const {
    std::string out = std::string(static_cast<size_t>(indent) * 2, ' ') + Describe() + "\n";
    for (const auto& child : children()) {
        out += child->ToString(indent + 1);
    }
    return out;
}

ScanExec::ScanExec(std::string table_name, std::shared_ptr<table::TableProvider> provider,
                   std::vector<ExprPtr> filters)
    : table_name_(std::move(table_name)), provider_(std::move(provider)), filters_(std::move(filters)) {}

ExecNodePtr ScanExec::WithNewChildren(std::vector<ExecNodePtr>) const {
    return std::make_shared<ScanExec>(table_name_, provider_, filters_);
}

StreamResult ScanExec::Execute(const TaskContext& ctx) const {
    table::ScanRequest request;
    request.filters = filters_;
    return provider_->Scan(ctx, request);
}

std::optional<int64_t> ScanExec::EstimatedRows() const {
    return provider_->Statistics().num_rows;
}

std::string ScanExec::Describe() const {
    std::string out = "ScanExec: " + table_name_;
    if (!filters_.empty()) out += " filters=[" + JoinExprs(filters_) + "]";
    return out;
}

FilterExec::FilterExec(ExecNodePtr input, ExprPtr predicate, SubqueryPlans subqueries)
    : input_(std::move(input)), predicate_(std::move(predicate)), subqueries_(std::move(subqueries)) {}

ExecNodePtr FilterExec::WithNewChildren(std::vector<ExecNodePtr> children) const {
    return std::make_shared<FilterExec>(std::move(children.at(0)), predicate_, subqueries_);
}

StreamResult FilterExec::Execute(const TaskContext& ctx) const {
    auto input = input_->Execute(ctx);
    if (!input.ok()) return input;
    return StreamResult(std::make_unique<FilterStream>(input.take_value(), predicate_, subqueries_, ctx));
}

std::string FilterExec::Describe() const {
    return "FilterExec: " + predicate_->ToString();
}

ProjectionExec::ProjectionExec(ExecNodePtr input, std::vector<ExprPtr> exprs, std::shared_ptr<arrow::Schema> schema,
                               SubqueryPlans subqueries)
    : input_(std::move(input)), exprs_(std::move(exprs)), schema_(std::move(schema)),
      subqueries_(std::move(subqueries)) {}

ExecNodePtr ProjectionExec::WithNewChildren(std::vector<ExecNodePtr> children) const {
    return std::make_shared<ProjectionExec>(std::move(children.at(0)), exprs_, schema_, subqueries_);
}

StreamResult ProjectionExec::Execute(const TaskContext& ctx) const {
    auto input = input_->Execute(ctx);
    if (!input.ok()) return input;
    return StreamResult(std::make_unique<ExprStream>(input.take_value(), exprs_, schema_, subqueries_, ctx));
}

std::string ProjectionExec::Describe() const {
    std::ostringstream oss;
    oss << "ProjectionExec: ";
    for (size_t i = 0; i < exprs_.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << exprs_[i]->ToString() << " AS " << schema_->field(static_cast<int>(i))->name();
    }
    return oss.str();
}

core::Result<std::shared_ptr<AggregateExec>> AggregateExec::Make(ExecNodePtr input, std::vector<ExprPtr> group_exprs,
                                                                 std::vector<AggregateCall> aggregates,
                                                                 std::shared_ptr<arrow::Schema> schema) {
    using MakeResult = core::Result<std::shared_ptr<AggregateExec>>;
    std::shared_ptr<AggregateExec> node(new AggregateExec());
    node->input_ = std::move(input);
    node->group_exprs_ = std::move(group_exprs);
    node->aggregates_ = std::move(aggregates);
    node->schema_ = std::move(schema);

    arrow::FieldVector staged;
    std::vector<arrow::FieldRef> keys;
    for (size_t i = 0; i < node->group_exprs_.size(); ++i) {
        const auto& expr = node->group_exprs_[i];
        staged.push_back(arrow::field("__g" + std::to_string(i), expr->type, expr->nullable));
        keys.emplace_back("__g" + std::to_string(i));
    }
    std::vector<cp::Aggregate> aggs;
    for (size_t j = 0; j < node->aggregates_.size(); ++j) {
        const auto& agg = node->aggregates_[j];
        std::vector<arrow::FieldRef> targets;
        if (agg.arg) {
            staged.push_back(arrow::field("__a" + std::to_string(j), agg.arg->type, agg.arg->nullable));
            targets.emplace_back("__a" + std::to_string(j));
        }
        std::string function = keys.empty() ? agg.function : "hash_" + agg.function;
        aggs.emplace_back(function, agg.options, std::move(targets), "__out" + std::to_string(j));
    }
    node->staged_schema_ = arrow::schema(std::move(staged));

    auto empty = arrow::Table::MakeEmpty(node->staged_schema_);
    if (!empty.ok()) {
        return MakeResult::error("Failed to plan aggregate: " + empty.status().ToString(),
                                 core::Error::Code::PLANNING_FAILURE);
    }
    auto decl = ac::Declaration::Sequence({
        {"table_source", ac::TableSourceNodeOptions(*empty)},
        {"aggregate", ac::AggregateNodeOptions(std::move(aggs), std::move(keys))},
    });
    auto acero_schema = ac::DeclarationToSchema(decl);
    if (!acero_schema.ok()) {
        return MakeResult::error("Failed to plan aggregate: " + acero_schema.status().ToString(),
                                 core::Error::Code::PLANNING_FAILURE);
    }
    node->acero_schema_ = *acero_schema;

    arrow::FieldVector realised;
    for (int i = 0; i < node->schema_->num_fields(); ++i) {
        std::string acero_name = static_cast<size_t>(i) < node->group_exprs_.size()
                                     ? "__g" + std::to_string(i)
                                     : "__out" + std::to_string(i - static_cast<int>(node->group_exprs_.size()));
        auto field = node->acero_schema_->GetFieldByName(acero_name);
        if (!field) {
            return MakeResult::error("Aggregate output lacks " + acero_name, core::Error::Code::PLANNING_FAILURE);
        }
        auto type = field->type();
        auto id = type->id();
        if (id == arrow::Type::LIST || id == arrow::Type::LARGE_LIST || id == arrow::Type::FIXED_SIZE_LIST) {
            type = std::static_pointer_cast<arrow::BaseListType>(type)->value_type();
        }
        realised.push_back(arrow::field(node->schema_->field(i)->name(), type, field->nullable()));
    }
    node->realised_schema_ = arrow::schema(std::move(realised));
    return MakeResult(std::move(node));
}

ExecNodePtr AggregateExec::WithNewChildren(std::vector<ExecNodePtr> children) const {
    auto copy = std::shared_ptr<AggregateExec>(new AggregateExec(*this));
    copy->input_ = std::move(children.at(0));
    return copy;
}

StreamResult AggregateExec::Execute(const TaskContext& ctx) const {
    auto input = input_->Execute(ctx);
    if (!input.ok()) return input;

    std::vector<ExprPtr> staged_exprs = group_exprs_;
    for (const auto& agg : aggregates_) {
        if (agg.arg) staged_exprs.push_back(agg.arg);
    }
    StreamPtr staged = std::make_unique<ExprStream>(input.take_value(), std::move(staged_exprs), staged_schema_,
                                                    SubqueryPlans{}, ctx);

    std::vector<arrow::FieldRef> keys;
    for (size_t i = 0; i < group_exprs_.size(); ++i) keys.emplace_back("__g" + std::to_string(i));
    std::vector<cp::Aggregate> aggs;
    for (size_t j = 0; j < aggregates_.size(); ++j) {
        const auto& agg = aggregates_[j];
        std::vector<arrow::FieldRef> targets;
        if (agg.arg) targets.emplace_back("__a" + std::to_string(j));
        std::string function = keys.empty() ? agg.function : "hash_" + agg.function;
        aggs.emplace_back(function, agg.options, std::move(targets), "__out" + std::to_string(j));
    }

    auto slot = std::make_shared<ErrorSlot>();
    auto decl = ac::Declaration::Sequence({
        ReaderSource(std::move(staged), slot),
        {"aggregate", ac::AggregateNodeOptions(std::move(aggs), std::move(keys))},
    });
    auto reader = ac::DeclarationToReader(std::move(decl), /*use_threads=*/false);
    if (!reader.ok()) {
        auto err = core::FromStatus(reader.status(), core::Error::Code::EXECUTION_FAILURE, "Failed to start aggregate");
        return StreamResult::error(err);
    }

    std::vector<std::string> names;
    for (size_t i = 0; i < group_exprs_.size(); ++i) names.push_back("__g" + std::to_string(i));
    for (size_t j = 0; j < aggregates_.size(); ++j) names.push_back("__out" + std::to_string(j));
    auto map = MapColumns(*(*reader)->schema(), names);
    if (!map.ok()) return StreamResult::error(map);
    return StreamResult(std::make_unique<AceroStream>(std::move(*reader), schema_, map.take_value(), slot,
                                                      "Aggregate failed"));
}

std::optional<int64_t> AggregateExec::EstimatedRows() const {
    if (group_exprs_.empty()) return 1;
    return std::nullopt;
}

std::string AggregateExec::Describe() const {
    std::ostringstream oss;
    oss << "AggregateExec: groupBy=[" << JoinExprs(group_exprs_) << "] aggr=[";
    for (size_t i = 0; i < aggregates_.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << aggregates_[i].name;
    }
    oss << "]";
    return oss.str();
}

SortExec::SortExec(ExecNodePtr input, std::vector<SortKeySpec> keys, std::optional<size_t> fetch)
    : input_(std::move(input)), keys_(std::move(keys)), fetch_(fetch) {}

ExecNodePtr SortExec::WithNewChildren(std::vector<ExecNodePtr> children) const {
    return std::make_shared<SortExec>(std::move(children.at(0)), keys_, fetch_);
}

StreamResult SortExec::Execute(const TaskContext& ctx) const {
    auto input = input_->Execute(ctx);
    if (!input.ok()) return input;
    return StreamResult(std::make_unique<SortStream>(input.take_value(), keys_, fetch_, ctx));
}

std::optional<int64_t> SortExec::EstimatedRows() const {
    auto rows = input_->EstimatedRows();
    if (fetch_ && (!rows || *rows > static_cast<int64_t>(*fetch_))) return static_cast<int64_t>(*fetch_);
    return rows;
}

std::string SortExec::Describe() const {
    std::ostringstream oss;
    oss << "SortExec: ";
    auto schema = input_->schema();
    for (size_t i = 0; i < keys_.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << schema->field(keys_[i].column)->name() << (keys_[i].descending ? " DESC" : " ASC")
            << (keys_[i].nulls_first ? " NULLS FIRST" : " NULLS LAST");
    }
    if (fetch_) oss << " fetch=" << *fetch_;
    return oss.str();
}

LimitExec::LimitExec(ExecNodePtr input, size_t skip, std::optional<size_t> fetch)
    : input_(std::move(input)), skip_(skip), fetch_(fetch) {}

ExecNodePtr LimitExec::WithNewChildren(std::vector<ExecNodePtr> children) const {
    return std::make_shared<LimitExec>(std::move(children.at(0)), skip_, fetch_);
}

StreamResult LimitExec::Execute(const TaskContext& ctx) const {
    auto input = input_->Execute(ctx);
    if (!input.ok()) return input;
    return StreamResult(std::make_unique<LimitStream>(input.take_value(), skip_, fetch_));
}

std::optional<int64_t> LimitExec::EstimatedRows() const {
    auto rows = input_->EstimatedRows();
    if (rows) *rows = std::max<int64_t>(0, *rows - static_cast<int64_t>(skip_));
    if (fetch_ && (!rows || *rows > static_cast<int64_t>(*fetch_))) return static_cast<int64_t>(*fetch_);
    return rows;
}

std::string LimitExec::Describe() const {
    return "LimitExec: skip=" + std::to_string(skip_) + " fetch=" + (fetch_ ? std::to_string(*fetch_) : "None");
}

HashJoinExec::HashJoinExec(ExecNodePtr left, ExecNodePtr right, JoinType type, std::vector<std::pair<int, int>> on)
    : left_(std::move(left)), right_(std::move(right)), type_(type), on_(std::move(on)) {
    schema_ = JoinSchema(*left_->schema(), *right_->schema(), type_);
}

ExecNodePtr HashJoinExec::WithNewChildren(std::vector<ExecNodePtr> children) const {
    return std::make_shared<HashJoinExec>(std::move(children.at(0)), std::move(children.at(1)), type_, on_);
}

StreamResult HashJoinExec::Execute(const TaskContext& ctx) const {
    auto rename = [](const arrow::Schema& schema, const std::string& prefix) {
        arrow::FieldVector fields;
        for (int i = 0; i < schema.num_fields(); ++i) {
            fields.push_back(schema.field(i)->WithName(prefix + std::to_string(i)));
        }
        return arrow::schema(std::move(fields));
    };

    auto left = left_->Execute(ctx);
    if (!left.ok()) return left;
    auto right = right_->Execute(ctx);
    if (!right.ok()) return right;

    auto left_schema = rename(*left_->schema(), "__l");
    auto right_schema = rename(*right_->schema(), "__r");
    auto slot = std::make_shared<ErrorSlot>();
    auto left_source = ReaderSource(std::make_unique<RenameStream>(left.take_value(), left_schema), slot);
    auto right_source = ReaderSource(std::make_unique<RenameStream>(right.take_value(), right_schema), slot);

    std::vector<arrow::FieldRef> left_keys;
    std::vector<arrow::FieldRef> right_keys;
    for (const auto& pair : on_) {
        left_keys.emplace_back("__l" + std::to_string(pair.first));
        right_keys.emplace_back("__r" + std::to_string(pair.second));
    }
    ac::HashJoinNodeOptions options(type_ == JoinType::LEFT ? ac::JoinType::LEFT_OUTER : ac::JoinType::INNER,
                                    std::move(left_keys), std::move(right_keys));
    ac::Declaration join("hashjoin", {std::move(left_source), std::move(right_source)}, std::move(options));

    auto reader = ac::DeclarationToReader(std::move(join), /*use_threads=*/false);
    if (!reader.ok()) {
        auto err = core::FromStatus(reader.status(), core::Error::Code::EXECUTION_FAILURE, "Failed to start join");
        return StreamResult::error(err);
    }
    std::vector<std::string> names;
    for (int i = 0; i < left_schema->num_fields(); ++i) names.push_back("__l" + std::to_string(i));
    for (int i = 0; i < right_schema->num_fields(); ++i) names.push_back("__r" + std::to_string(i));
    auto map = MapColumns(*(*reader)->schema(), names);
    if (!map.ok()) return StreamResult::error(map);
    return StreamResult(std::make_unique<AceroStream>(std::move(*reader), schema_, map.take_value(), slot,
                                                      "Join failed"));
}

std::string HashJoinExec::Describe() const {
    std::ostringstream oss;
    oss << "HashJoinExec: type=" << JoinTypeToString(type_) << " on=[";
    for (size_t i = 0; i < on_.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << left_->schema()->field(on_[i].first)->name() << " = "
            << right_->schema()->field(on_[i].second)->name();
    }
    oss << "]";
    return oss.str();
}

core::Result<std::shared_ptr<arrow::Table>> CollectPlan(const ExecNode& plan, const TaskContext& ctx) {
    auto stream = plan.Execute(ctx);
    if (!stream.ok()) return core::Result<std::shared_ptr<arrow::Table>>::error(stream);
    return execution::CollectToTable(*stream.value());
}

core::Result<SubqueryResults> MaterializeSubqueries(const SubqueryPlans& plans, const TaskContext& ctx) {
    using ResultsResult = core::Result<SubqueryResults>;
    SubqueryResults results;
    for (const auto& entry : plans) {
        const Expr* expr = entry.first;
        auto table = CollectPlan(*entry.second, ctx);
        if (!table.ok()) return ResultsResult::error(table);
        if (table.value()->num_columns() != 1) {
            return ResultsResult::error("IN subquery must return exactly one column",
                                        core::Error::Code::EXECUTION_FAILURE);
        }
        arrow::Datum values(table.value()->column(0));
        const auto& target = expr->args[0]->type;
        if (!values.type()->Equals(*target)) {
            auto cast = cp::Cast(values, target);
            if (!cast.ok()) {
                auto err = core::FromStatus(cast.status(), core::Error::Code::EXECUTION_FAILURE,
                                            "Failed to cast subquery values");
                return ResultsResult::error(err);
            }
            values = *cast;
        }
        SubqueryValues out;
        out.has_null = values.null_count() > 0;
        auto unique = cp::Unique(values);
        if (!unique.ok()) {
            return ResultsResult::error(core::FromStatus(unique.status(), core::Error::Code::EXECUTION_FAILURE,
                                                         "Failed to collect subquery values"));
        }
        auto non_null = cp::DropNull(**unique);
        if (!non_null.ok()) {
            return ResultsResult::error(core::FromStatus(non_null.status(), core::Error::Code::EXECUTION_FAILURE,
                                                         "Failed to collect subquery values"));
        }
        out.values = *non_null;
        results[expr] = std::move(out);
    }
    return ResultsResult(std::move(results));
}

} // namespace plan
} // namespace qfab
