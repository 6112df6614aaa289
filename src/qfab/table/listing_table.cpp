#include "qfab/table/listing_table.h"

#include <algorithm>
#include <deque>
#include <future>

#include <arrow/compute/api.h>

#include "qfab/common/logger.h"
#include "qfab/storage/parquet/bloom_filter_set.hpp"
#include "qfab/storage/parquet/reader.hpp"
#include "qfab/storage/store_registry.h"

namespace qfab {
namespace table {

using BatchResult = core::Result<std::shared_ptr<arrow::RecordBatch>>;
using BufferResult = core::Result<std::shared_ptr<arrow::Buffer>>;

namespace {

std::optional<ColumnPredicate::Op> OpFor(const std::string& function, bool flipped) {
    if (function == "equal") return ColumnPredicate::Op::EQ;
    if (function == "less") return flipped ? ColumnPredicate::Op::GT : ColumnPredicate::Op::LT;
    if (function == "less_equal") return flipped ? ColumnPredicate::Op::GT_EQ : ColumnPredicate::Op::LT_EQ;
    if (function == "greater") return flipped ? ColumnPredicate::Op::LT : ColumnPredicate::Op::GT;
    if (function == "greater_equal") return flipped ? ColumnPredicate::Op::LT_EQ : ColumnPredicate::Op::GT_EQ;
    return std::nullopt;
}

std::string FileKeyOf(const std::string& location) {
    auto staged = storage::ParseStagedPath(location);
    if (staged && !staged->file_key.empty()) {
        return staged->file_key;
    }
    return location;
}

bool HasExtension(const std::string& location, const std::string& extension) {
    return extension.empty() ||
           (location.size() >= extension.size() &&
            location.compare(location.size() - extension.size(), extension.size(), extension) == 0);
}

// One ranged read of this many trailing bytes covers most footers
constexpr int64_t kFooterReadSize = 64 * 1024;

// Statistics from the file footer, fetched with ranged reads so no column
// data is transferred
core::Result<std::shared_ptr<const storage::Statistics>> FetchFooterStatistics(const storage::ObjectStore& store,
                                                                              const storage::ObjectMeta& object) {
    using StatsResult = core::Result<std::shared_ptr<const storage::Statistics>>;
    if (object.size < storage::parquet::kParquetTrailerSize) {
        return StatsResult::error("Object of " + std::to_string(object.size) + " bytes is too small for Parquet",
                                  core::Error::Code::EXECUTION_FAILURE);
    }
    int64_t tail_size = std::min(object.size, kFooterReadSize);
    auto tail = store.GetRange(object.location, object.size - tail_size, tail_size);
    if (!tail.ok()) return StatsResult::error(tail);
    if (tail.value()->size() != tail_size) {
        return StatsResult::error("Short read of footer: listed size " + std::to_string(object.size) +
                                      " is stale",
                                  core::Error::Code::EXECUTION_FAILURE);
    }
    auto footer_size = storage::parquet::ParseFooterLength(*tail.value());
    if (!footer_size.ok()) return StatsResult::error(footer_size);

    int64_t needed = footer_size.value() + storage::parquet::kParquetTrailerSize;
    if (needed > object.size) {
        return StatsResult::error("Footer of " + std::to_string(footer_size.value()) + " bytes exceeds the object",
                                  core::Error::Code::EXECUTION_FAILURE);
    }
    std::shared_ptr<arrow::Buffer> footer;
    if (needed <= tail_size) {
        footer = arrow::SliceBuffer(tail.value(), tail_size - needed, footer_size.value());
    } else {
        QFAB_DEBUG("[listing] footer of {} is {} bytes, reading the remainder", object.location,
                   footer_size.value());
        auto full = store.GetRange(object.location, object.size - needed, footer_size.value());
        if (!full.ok()) return StatsResult::error(full);
        footer = full.take_value();
    }

    auto stats = storage::parquet::ReadFooterStatistics(*footer);
    if (!stats.ok()) return StatsResult::error(stats);
    return StatsResult(std::make_shared<const storage::Statistics>(stats.take_value()));
}

bool FileMayMatch(const std::vector<ColumnPredicate>& predicates, const storage::Statistics& stats) {
    for (const auto& predicate : predicates) {
        const auto* col = stats.column(predicate.column);
        if (col && !MayMatch(predicate, *col)) {
            return false;
        }
    }
    return true;
}

/**
 * Streams the planned files group by group, keeping up to `prefetch` object
 * fetches in flight ahead of the reader.
 */
class ListingStream : public execution::RecordBatchStream {
public:
    ListingStream(std::shared_ptr<arrow::Schema> schema, std::shared_ptr<storage::ObjectStore> store,
                  std::vector<PartitionedFile> files, std::shared_ptr<const IndexCondition> index_condition,
                  size_t prefetch)
        : schema_(std::move(schema)), store_(std::move(store)), files_(std::move(files)),
          index_condition_(std::move(index_condition)), prefetch_(std::max<size_t>(1, prefetch)) {}

    std::shared_ptr<arrow::Schema> schema() const override { return schema_; }

    BatchResult Next() override {
        while (true) {
            if (current_batch_ < current_batches_.size()) {
                return BatchResult(current_batches_[current_batch_++]);
            }
            if (next_file_ >= files_.size()) {
                return BatchResult(nullptr);
            }
            auto res = LoadNextFile();
            if (!res.ok()) {
                return BatchResult::error(res);
            }
        }
    }

private:
    void FillPrefetch() {
        while (in_flight_.size() < prefetch_ && next_fetch_ < files_.size()) {
            const auto& file = files_[next_fetch_++];
            auto store = store_;
            auto location = file.object.location;
            in_flight_.push_back(std::async(std::launch::async, [store, location]() {
                return store->Get(location);
            }));
        }
    }

    core::Result<void> LoadNextFile() {
        FillPrefetch();
        auto fetched = in_flight_.front().get();
        in_flight_.pop_front();
        const PartitionedFile& file = files_[next_file_++];
        FillPrefetch();
        if (!fetched.ok()) {
            return core::Result<void>::error("Failed to fetch " + file.object.location + ": " + fetched.error(),
                                             fetched.error_code());
        }

        current_batches_.clear();
        current_batch_ = 0;

        storage::parquet::ParquetReader reader;
        auto open = reader.Open(fetched.take_value());
        if (!open.ok()) {
            return core::Result<void>::error("Failed to open " + file.object.location + ": " + open.error(),
                                             open.error_code());
        }
        auto counts = reader.RowGroupRowCounts();
        std::vector<int64_t> offsets(counts.size(), 0);
        for (size_t i = 1; i < counts.size(); ++i) offsets[i] = offsets[i - 1] + counts[i - 1];

        std::vector<int> row_groups;
        if (file.row_groups) {
            row_groups = *file.row_groups;
        } else {
            for (int i = 0; i < static_cast<int>(counts.size()); ++i) row_groups.push_back(i);
        }

        const roaring::Roaring64Map* row_filter =
            index_condition_ ? index_condition_->RowFilter(file.file_key) : nullptr;

        for (int rg : row_groups) {
            auto batch = reader.ReadRowGroup(rg);
            if (!batch.ok()) {
                return core::Result<void>::error("Failed to read " + file.object.location + ": " + batch.error(),
                                                 batch.error_code());
            }
            auto current = batch.take_value();
            if (row_filter) {
                auto filtered = ApplyRowFilter(current, *row_filter, offsets[rg]);
                if (!filtered.ok()) return core::Result<void>::error(filtered);
                current = filtered.take_value();
            }
            if (current->num_rows() == 0) continue;
            auto adapted = AdaptBatch(current, schema_);
            if (!adapted.ok()) {
                return core::Result<void>::error(file.object.location + ": " + adapted.error(),
                                                 adapted.error_code());
            }
            current_batches_.push_back(adapted.take_value());
        }
        return core::Result<void>();
    }

    static BatchResult ApplyRowFilter(const std::shared_ptr<arrow::RecordBatch>& batch,
                                      const roaring::Roaring64Map& keep, int64_t base) {
        arrow::BooleanBuilder mask;
        auto status = mask.Reserve(batch->num_rows());
        for (int64_t i = 0; status.ok() && i < batch->num_rows(); ++i) {
            mask.UnsafeAppend(keep.contains(static_cast<uint64_t>(base + i)));
        }
        std::shared_ptr<arrow::Array> mask_array;
        if (status.ok()) status = mask.Finish(&mask_array);
        if (!status.ok()) {
            return BatchResult::error("Failed to build row filter: " + status.ToString(),
                                      core::Error::Code::EXECUTION_FAILURE);
        }
        auto filtered = arrow::compute::Filter(batch, mask_array);
        if (!filtered.ok()) {
            return BatchResult::error("Failed to apply row filter: " + filtered.status().ToString(),
                                      core::Error::Code::EXECUTION_FAILURE);
        }
        return BatchResult(filtered->record_batch());
    }

    std::shared_ptr<arrow::Schema> schema_;
    std::shared_ptr<storage::ObjectStore> store_;
    std::vector<PartitionedFile> files_;
    std::shared_ptr<const IndexCondition> index_condition_;
    size_t prefetch_;

    std::deque<std::future<BufferResult>> in_flight_;
    size_t next_fetch_ = 0;
    size_t next_file_ = 0;
    std::vector<std::shared_ptr<arrow::RecordBatch>> current_batches_;
    size_t current_batch_ = 0;
};

} // namespace

std::vector<ColumnPredicate> ExtractColumnPredicates(const std::vector<plan::ExprPtr>& filters,
                                                     const arrow::Schema& schema) {
    std::vector<ColumnPredicate> out;
    std::vector<plan::ExprPtr> conjuncts;
    for (const auto& filter : filters) {
        plan::SplitConjunction(filter, &conjuncts);
    }
    for (const auto& conjunct : conjuncts) {
        if (conjunct->kind != plan::Expr::Kind::CALL || conjunct->args.size() != 2) continue;
        const auto& lhs = conjunct->args[0];
        const auto& rhs = conjunct->args[1];
        bool flipped = false;
        const plan::Expr* column = nullptr;
        const plan::Expr* literal = nullptr;
        if (lhs->kind == plan::Expr::Kind::COLUMN && rhs->kind == plan::Expr::Kind::LITERAL) {
            column = lhs.get();
            literal = rhs.get();
        } else if (lhs->kind == plan::Expr::Kind::LITERAL && rhs->kind == plan::Expr::Kind::COLUMN) {
            column = rhs.get();
            literal = lhs.get();
            flipped = true;
        } else {
            continue;
        }
        auto op = OpFor(conjunct->function, flipped);
        if (!op || !literal->value || !literal->value->is_valid) continue;
        if (column->index < 0 || column->index >= schema.num_fields()) continue;
        out.push_back(ColumnPredicate{schema.field(column->index)->name(), *op, literal->value});
    }
    return out;
}

bool MayMatch(const ColumnPredicate& predicate, const storage::ColumnStatistics& stats) {
    if (!stats.has_min_max()) return true;
    auto vs_min = storage::CompareScalars(*predicate.value, *stats.min);
    auto vs_max = storage::CompareScalars(*predicate.value, *stats.max);
    if (!vs_min || !vs_max) return true;
    switch (predicate.op) {
        case ColumnPredicate::Op::EQ: return *vs_min >= 0 && *vs_max <= 0;
        case ColumnPredicate::Op::LT: return *vs_min > 0;     // some value < v needs min < v
        case ColumnPredicate::Op::LT_EQ: return *vs_min >= 0;
        case ColumnPredicate::Op::GT: return *vs_max < 0;     // needs max > v
        case ColumnPredicate::Op::GT_EQ: return *vs_max <= 0;
    }
    return true;
}

std::optional<std::vector<FileGroup>> SplitGroupsByStatistics(std::vector<PartitionedFile> files,
                                                              const SortColumn& sort) {
    struct Bounds {
        std::shared_ptr<arrow::Scalar> min;
        std::shared_ptr<arrow::Scalar> max;
    };
    std::vector<Bounds> bounds;
    for (const auto& file : files) {
        const auto* col = file.statistics ? file.statistics->column(sort.name) : nullptr;
        if (!col || !col->has_min_max()) return std::nullopt;
        bounds.push_back(Bounds{col->min, col->max});
    }
    std::vector<size_t> order(files.size());
    for (size_t i = 0; i < order.size(); ++i) order[i] = i;
    // Ascending by min, or descending by max; stable so ties keep listing order
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        auto c = sort.descending ? storage::CompareScalars(*bounds[b].max, *bounds[a].max)
                                 : storage::CompareScalars(*bounds[a].min, *bounds[b].min);
        return c && *c < 0;
    });

    std::vector<FileGroup> groups;
    std::vector<size_t> last_in_group;
    for (size_t idx : order) {
        bool placed = false;
        for (size_t g = 0; g < groups.size(); ++g) {
            const auto& last = bounds[last_in_group[g]];
            auto c = sort.descending ? storage::CompareScalars(*bounds[idx].max, *last.min)
                                     : storage::CompareScalars(*bounds[idx].min, *last.max);
            if (c && (sort.descending ? *c < 0 : *c > 0)) {
                groups[g].push_back(std::move(files[idx]));
                last_in_group[g] = idx;
                placed = true;
                break;
            }
        }
        if (!placed) {
            groups.push_back(FileGroup{});
            groups.back().push_back(std::move(files[idx]));
            last_in_group.push_back(idx);
        }
    }
    return groups;
}

std::vector<FileGroup> SplitGroupsRoundRobin(std::vector<PartitionedFile> files, size_t target_partitions) {
    size_t n = std::max<size_t>(1, std::min(target_partitions, files.size()));
    std::vector<FileGroup> groups(files.empty() ? 0 : n);
    for (size_t i = 0; i < files.size(); ++i) {
        groups[i % n].push_back(std::move(files[i]));
    }
    return groups;
}

ListingTable::ListingTable(ListingTableConfig config) : config_(std::move(config)) {
    schema_ = ApplyCoercionRules(config_.schema, config_.rules);
}

TableStatistics ListingTable::Statistics() const {
    TableStatistics stats;
    stats.num_rows = config_.row_estimate;
    return stats;
}

core::Result<std::vector<storage::ObjectMeta>> ListingTable::ListFiles(const ScanContext& ctx,
                                                                       const storage::ObjectStore& store,
                                                                       const std::string& prefix) const {
    auto listed = store.List(prefix);
    if (!listed.ok()) return listed;
    std::vector<storage::ObjectMeta> out;
    for (auto& object : listed.value()) {
        if (!HasExtension(object.location, config_.options.file_extension)) continue;
        if (ctx.config.listing_table_ignore_subdirectory) {
            std::string rest = object.location.substr(std::min(prefix.size(), object.location.size()));
            if (rest.find('/') != std::string::npos) continue;
        }
        out.push_back(std::move(object));
    }
    std::sort(out.begin(), out.end(), [](const storage::ObjectMeta& a, const storage::ObjectMeta& b) {
        return a.location < b.location;
    });
    return core::Result<std::vector<storage::ObjectMeta>>(std::move(out));
}

core::Result<std::vector<FileGroup>> ListingTable::PlanFiles(const ScanContext& ctx,
                                                             const std::vector<plan::ExprPtr>& filters) const {
    using GroupsResult = core::Result<std::vector<FileGroup>>;
    auto url = storage::ParseStoreUrl(config_.table_path);
    if (!url.ok()) return GroupsResult::error(url);
    auto store = ctx.runtime->object_stores->Resolve(config_.table_path);
    if (!store.ok()) return GroupsResult::error(store);

    auto objects = ListFiles(ctx, *store.value(), url.value().path);
    if (!objects.ok()) return GroupsResult::error(objects);

    auto predicates = ExtractColumnPredicates(filters, *schema_);
    std::vector<ColumnPredicate> equalities;
    for (const auto& p : predicates) {
        if (p.op == ColumnPredicate::Op::EQ) equalities.push_back(p);
    }
    std::vector<ColumnPredicate> fast_predicates;
    for (const auto& p : predicates) {
        if (std::find(config_.fast_fields.begin(), config_.fast_fields.end(), p.column) !=
            config_.fast_fields.end()) {
            fast_predicates.push_back(p);
        }
    }

    storage::FileStatisticsCache* cache =
        config_.use_statistics_cache ? ctx.runtime->file_statistics_cache : nullptr;

    std::vector<PartitionedFile> files;
    size_t listed = objects.value().size();
    size_t pruned = 0;
    for (auto& object : objects.value()) {
        PartitionedFile file;
        file.file_key = FileKeyOf(object.location);
        file.object = object;
        if (config_.index_condition && !config_.index_condition->AllowsFile(file.file_key)) {
            pruned++;
            continue;
        }

        if (config_.options.collect_stat) {
            if (cache) file.statistics = cache->Get(file.file_key, object.size);
            if (!file.statistics) {
                auto stats = FetchFooterStatistics(*store.value(), object);
                if (!stats.ok()) {
                    return GroupsResult::error("Failed to read statistics of " + object.location + ": " +
                                                   stats.error(),
                                               stats.error_code());
                }
                file.statistics = stats.take_value();
                if (cache) cache->Put(file.file_key, object.size, file.statistics);
            }
            if (!FileMayMatch(predicates, *file.statistics)) {
                pruned++;
                continue;
            }
            if (!fast_predicates.empty()) {
                std::vector<int> keep;
                for (size_t rg = 0; rg < file.statistics->row_groups.size(); ++rg) {
                    const auto& rg_stats = file.statistics->row_groups[rg];
                    bool may = true;
                    for (const auto& p : fast_predicates) {
                        auto it = rg_stats.columns.find(p.column);
                        if (it != rg_stats.columns.end() && !MayMatch(p, it->second)) {
                            may = false;
                            break;
                        }
                    }
                    if (may) keep.push_back(static_cast<int>(rg));
                }
                if (keep.empty()) {
                    pruned++;
                    continue;
                }
                file.row_groups = std::move(keep);
            }
        }

        if (ctx.config.bloom_filter_on_read && !equalities.empty()) {
            auto sidecar = store.value()->Get(storage::parquet::BloomFilterSet::SidecarPath(object.location));
            if (sidecar.ok()) {
                auto set = storage::parquet::BloomFilterSet::Deserialize(sidecar.value());
                if (set.ok()) {
                    bool may = true;
                    for (const auto& p : equalities) {
                        if (!set.value().MightContain(p.column, *p.value)) {
                            may = false;
                            break;
                        }
                    }
                    if (!may) {
                        pruned++;
                        continue;
                    }
                } else {
                    QFAB_WARN("[listing] ignoring unreadable bloom sidecar of {}: {}", object.location, set.error());
                }
            }
        }
        files.push_back(std::move(file));
    }

    QFAB_DEBUG("[listing] {}: {} files listed, {} pruned", config_.table_path, listed, pruned);

    const auto& sort_order = config_.options.file_sort_order;
    if (ctx.config.split_file_groups_by_statistics && !sort_order.empty()) {
        auto by_stats = SplitGroupsByStatistics(files, sort_order.front());
        if (by_stats) {
            return GroupsResult(std::move(*by_stats));
        }
        QFAB_DEBUG("[listing] statistics incomplete for {}, using round-robin groups", sort_order.front().name);
    }
    return GroupsResult(SplitGroupsRoundRobin(std::move(files), config_.options.target_partitions));
}

core::Result<std::unique_ptr<execution::RecordBatchStream>> ListingTable::Scan(const ScanContext& ctx,
                                                                              const ScanRequest& request) const {
    using StreamResult = core::Result<std::unique_ptr<execution::RecordBatchStream>>;
    auto groups = PlanFiles(ctx, request.filters);
    if (!groups.ok()) return StreamResult::error(groups);
    auto store = ctx.runtime->object_stores->Resolve(config_.table_path);
    if (!store.ok()) return StreamResult::error(store);

    std::vector<PartitionedFile> ordered;
    for (auto& group : groups.value()) {
        for (auto& file : group) ordered.push_back(std::move(file));
    }
    size_t prefetch = std::max<size_t>(1, config_.options.target_partitions);
    std::unique_ptr<execution::RecordBatchStream> stream = std::make_unique<ListingStream>(
        schema_, store.take_value(), std::move(ordered), config_.index_condition, prefetch);
    return StreamResult(std::make_unique<ProjectingStream>(std::move(stream), request.projection, request.limit,
                                                           ctx.config.batch_size));
}

} // namespace table
} // namespace qfab
