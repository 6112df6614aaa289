#include "qfab/table/union_table.h"

#include "qfab/common/logger.h"

namespace qfab {
namespace table {

namespace {

using BatchResult = core::Result<std::shared_ptr<arrow::RecordBatch>>;

// Filters rebound onto a provider schema; dropped when a column is missing or
// typed differently
std::vector<plan::ExprPtr> RemapFilters(const std::vector<plan::ExprPtr>& filters,
                                        const arrow::Schema& from, const arrow::Schema& to) {
    std::vector<int> mapping(from.num_fields(), -1);
    for (int i = 0; i < from.num_fields(); ++i) {
        int j = to.GetFieldIndex(from.field(i)->name());
        if (j >= 0 && to.field(j)->type()->Equals(*from.field(i)->type())) {
            mapping[i] = j;
        }
    }
    std::vector<plan::ExprPtr> out;
    for (const auto& filter : filters) {
        auto remapped = plan::RemapColumns(filter, mapping);
        if (remapped.ok()) out.push_back(remapped.take_value());
    }
    return out;
}

// The nominal schema with each field non-null only where every provider carries
// it with the same type and non-null
std::shared_ptr<arrow::Schema> UnionSchema(const std::shared_ptr<arrow::Schema>& nominal,
                                           const std::vector<std::shared_ptr<TableProvider>>& providers) {
    if (providers.empty()) return nominal;
    arrow::FieldVector fields;
    fields.reserve(nominal->num_fields());
    for (const auto& field : nominal->fields()) {
        bool nullable = false;
        for (const auto& provider : providers) {
            auto other = provider->schema()->GetFieldByName(field->name());
            if (!other || other->nullable() || !other->type()->Equals(*field->type())) {
                nullable = true;
                break;
            }
        }
        fields.push_back(nullable == field->nullable() ? field : field->WithNullable(nullable));
    }
    return arrow::schema(std::move(fields), nominal->metadata());
}

class UnionStream : public execution::RecordBatchStream {
public:
    UnionStream(std::shared_ptr<arrow::Schema> schema, std::vector<std::shared_ptr<TableProvider>> providers,
                ScanContext ctx, std::vector<plan::ExprPtr> filters, std::optional<size_t> limit)
        : schema_(std::move(schema)), providers_(std::move(providers)), ctx_(std::move(ctx)),
          filters_(std::move(filters)), limit_(limit) {}

    std::shared_ptr<arrow::Schema> schema() const override { return schema_; }

    BatchResult Next() override {
        while (true) {
            if (!current_) {
                if (next_provider_ >= providers_.size()) {
                    return BatchResult(nullptr);
                }
                const auto& provider = providers_[next_provider_++];
                ScanRequest request;
                request.filters = RemapFilters(filters_, *schema_, *provider->schema());
                request.limit = limit_;
                auto stream = provider->Scan(ctx_, request);
                if (!stream.ok()) {
                    return BatchResult::error(stream);
                }
                current_ = stream.take_value();
            }
            auto next = current_->Next();
            if (!next.ok()) return next;
            if (!next.value()) {
                current_.reset();
                continue;
            }
            return AdaptBatch(next.value(), schema_);
        }
    }

private:
    std::shared_ptr<arrow::Schema> schema_;
    std::vector<std::shared_ptr<TableProvider>> providers_;
    ScanContext ctx_;
    std::vector<plan::ExprPtr> filters_;
    std::optional<size_t> limit_;
    size_t next_provider_ = 0;
    std::unique_ptr<execution::RecordBatchStream> current_;
};

} // namespace

UnionTable::UnionTable(std::shared_ptr<arrow::Schema> schema, std::vector<std::shared_ptr<TableProvider>> providers)
    : schema_(UnionSchema(schema, providers)), providers_(std::move(providers)) {}

core::Result<std::unique_ptr<execution::RecordBatchStream>> UnionTable::Scan(const ScanContext& ctx,
                                                                            const ScanRequest& request) const {
    QFAB_DEBUG("[union] scanning {} providers", providers_.size());
    std::unique_ptr<execution::RecordBatchStream> stream =
        std::make_unique<UnionStream>(schema_, providers_, ctx, request.filters, request.limit);
    return core::Result<std::unique_ptr<execution::RecordBatchStream>>(
        std::make_unique<ProjectingStream>(std::move(stream), request.projection, request.limit,
                                           ctx.config.batch_size));
}

TableStatistics UnionTable::Statistics() const {
    TableStatistics stats;
    int64_t total = 0;
    for (const auto& provider : providers_) {
        auto s = provider->Statistics();
        if (!s.num_rows) {
            return TableStatistics();
        }
        total += *s.num_rows;
    }
    stats.num_rows = total;
    return stats;
}

} // namespace table
} // namespace qfab
