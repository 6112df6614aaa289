#include "qfab/table/table_factory.h"

#include "qfab/common/logger.h"
#include "qfab/core/config.h"
#include "qfab/execution/context_builder.h"
#include "qfab/governor/resource_governor.h"
#include "qfab/storage/file_list.h"
#include "qfab/storage/parquet/schema_key.hpp"

namespace qfab {
namespace table {

core::Result<std::shared_ptr<ListingTable>> CreateParquetTable(
    const core::SearchSession& session,
    const std::shared_ptr<arrow::Schema>& schema,
    const std::vector<core::SegmentFileKey>& files,
    const TypeCoercionRules& rules,
    bool sorted_by_time,
    bool use_statistics_cache,
    std::shared_ptr<const IndexCondition> index_condition,
    std::vector<std::string> fast_fields) {
    using TableResult = core::Result<std::shared_ptr<ListingTable>>;
    auto cfg = core::GetConfig();
    const auto& ts = cfg->common.column_timestamp;

    if (session.storage_type != core::StorageType::MEMORY && session.storage_type != core::StorageType::WAL &&
        session.storage_type != core::StorageType::TMPFS) {
        QFAB_ERROR("[table] unsupported storage type {} for session {}",
                   core::StorageTypeToString(session.storage_type), session.id);
        return TableResult::error("Unsupported storage type " + core::StorageTypeToString(session.storage_type),
                                  core::Error::Code::UNSUPPORTED_STORAGE_BACKEND);
    }

    size_t partitions = execution::ResolveTargetPartitions(session.target_partitions);
    auto limits = governor::GetResourceGovernor()->Govern(session.work_group, partitions, 0);
    if (!limits.ok()) return TableResult::error(limits);
    partitions = limits.value().partitions;
    if (partitions == 0) partitions = core::kMinPartitions;

    ListingTableConfig config;
    config.options.file_extension = core::kParquetExtension;
    config.options.target_partitions = partitions;
    config.options.collect_stat = true;
    if (sorted_by_time) {
        config.options.file_sort_order.push_back(SortColumn{ts, /*descending=*/true, /*nulls_first=*/false});
    }

    std::string schema_key = storage::parquet::SchemaKey(*schema);
    if (session.storage_type == core::StorageType::TMPFS) {
        config.table_path = "tmpfs:///" + session.id + "/";
    } else {
        auto lease = storage::FileListRegistry::Instance().Set(session.id, schema_key, files);
        if (!lease.ok()) {
            QFAB_ERROR("[table] failed to stage files for session {}: {}", session.id, lease.error());
            return TableResult::error(lease);
        }
        config.staged_files = std::make_shared<storage::FileListLease>(lease.take_value());
        std::string scheme = session.storage_type == core::StorageType::MEMORY ? "memory" : "wal";
        config.table_path = scheme + ":///" + session.id + "/schema=" + schema_key + "/";
    }

    // The time column is always read as non-null int64
    int ts_index = schema->GetFieldIndex(ts);
    std::shared_ptr<arrow::Schema> table_schema = schema;
    if (ts_index >= 0 && schema->field(ts_index)->nullable()) {
        auto replaced = schema->SetField(ts_index, arrow::field(ts, arrow::int64(), false));
        if (!replaced.ok()) {
            return TableResult::error("Failed to normalize time column: " + replaced.status().ToString(),
                                      core::Error::Code::INTERNAL);
        }
        table_schema = *replaced;
    }
    config.schema = table_schema;
    config.rules = rules;
    config.index_condition = std::move(index_condition);
    config.fast_fields = std::move(fast_fields);
    config.use_statistics_cache = use_statistics_cache && session.storage_type != core::StorageType::TMPFS;
    if (session.storage_type != core::StorageType::TMPFS) {
        int64_t rows = 0;
        for (const auto& file : files) rows += file.meta.records;
        config.row_estimate = rows;
    }

    QFAB_DEBUG("[table] listing table {} with {} files, {} partitions", config.table_path, files.size(),
               partitions);
    return TableResult(std::make_shared<ListingTable>(std::move(config)));
}

bool IsSortedByTime(const core::SortKey& sort_key) {
    return sort_key.size() == 1 && sort_key[0].first == core::GetConfig()->common.column_timestamp &&
           sort_key[0].second;
}

core::Result<std::unique_ptr<execution::ExecutionContext>> RegisterTable(
    const core::SearchSession& session,
    const std::shared_ptr<arrow::Schema>& schema,
    const std::string& table_name,
    const std::vector<core::SegmentFileKey>& files,
    const TypeCoercionRules& rules,
    const core::SortKey& sort_key) {
    using ContextResult = core::Result<std::unique_ptr<execution::ExecutionContext>>;
    bool sorted_by_time = IsSortedByTime(sort_key);

    auto ctx = execution::PrepareContext(session.work_group, {}, sorted_by_time, session.target_partitions);
    if (!ctx.ok()) return ctx;

    auto table = CreateParquetTable(session, schema, files, rules, sorted_by_time, true, nullptr, {});
    if (!table.ok()) return ContextResult::error(table);

    auto registered = ctx.value()->RegisterTable(table_name, table.take_value());
    if (!registered.ok()) return ContextResult::error(registered);
    return ctx;
}

} // namespace table
} // namespace qfab
