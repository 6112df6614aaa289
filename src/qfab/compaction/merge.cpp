#include "qfab/compaction/merge.h"

#include <cctype>
#include <chrono>

#include "qfab/common/logger.h"
#include "qfab/core/config.h"
#include "qfab/execution/context_builder.h"
#include "qfab/storage/parquet/writer.hpp"
#include "qfab/table/union_table.h"

namespace qfab {
namespace compaction {

namespace {

constexpr const char* kMergeTable = "tbl";

bool IsPlainIdentifier(const std::string& name) {
    if (name.empty() || !(std::islower(static_cast<unsigned char>(name[0])) || name[0] == '_')) return false;
    for (char c : name) {
        auto u = static_cast<unsigned char>(c);
        if (!(std::islower(u) || std::isdigit(u) || c == '_')) return false;
    }
    return true;
}

// Quotes names the SQL lexer would otherwise fold or reject
std::string QuoteIdentifier(const std::string& name) {
    if (IsPlainIdentifier(name)) return name;
    std::string out = "\"";
    for (char c : name) {
        if (c == '"') out += '"';
        out += c;
    }
    return out + "\"";
}

} // namespace

std::string BuildMergeSql(core::StreamType stream_type, const std::string& stream_name,
                          const arrow::Schema& schema) {
    auto cfg = core::GetConfig();
    std::string ts = QuoteIdentifier(cfg->common.column_timestamp);

    if (stream_type == core::StreamType::INDEX) {
        return "SELECT * FROM tbl WHERE file_name NOT IN (SELECT file_name FROM tbl WHERE deleted IS TRUE ORDER BY " +
               ts + " DESC) ORDER BY " + ts + " DESC";
    }
    if (cfg->limit.distinct_values_hourly && stream_type == core::StreamType::METADATA &&
        stream_name.rfind(core::kDistinctStreamPrefix, 0) == 0) {
        std::string fields;
        for (const auto& field : schema.fields()) {
            if (field->name() == cfg->common.column_timestamp || field->name() == "count") continue;
            if (!fields.empty()) fields += ", ";
            fields += QuoteIdentifier(field->name());
        }
        std::string rollup = "SELECT MIN(" + ts + ") AS " + ts + ", SUM(count) AS count";
        // Only the time and count columns: the whole input is one group
        if (fields.empty()) return rollup + " FROM tbl ORDER BY " + ts + " DESC";
        return rollup + ", " + fields + " FROM tbl GROUP BY " + fields + " ORDER BY " + ts + " DESC";
    }
    return "SELECT * FROM tbl ORDER BY " + ts + " DESC";
}

core::Result<CompactionResult> MergeParquetFiles(core::StreamType stream_type, const std::string& stream_name,
                                                 const std::shared_ptr<arrow::Schema>& schema,
                                                 std::vector<std::shared_ptr<table::TableProvider>> tables,
                                                 const std::vector<std::string>& bloom_filter_fields,
                                                 const core::FileMeta& metadata) {
    using MergeResult = core::Result<CompactionResult>;
    auto start = std::chrono::steady_clock::now();
    auto cfg = core::GetConfig();

    std::string sql = BuildMergeSql(stream_type, stream_name, *schema);
    QFAB_DEBUG("[merge] {}/{} sql: {}", core::StreamTypeToString(stream_type), stream_name, sql);

    auto ctx = execution::PrepareContext(std::nullopt, {}, /*sorted_by_time=*/true, cfg->limit.cpu_num);
    if (!ctx.ok()) return MergeResult::error(ctx);

    auto registered = ctx.value()->RegisterTable(kMergeTable,
                                                 std::make_shared<table::UnionTable>(schema, std::move(tables)));
    if (!registered.ok()) return MergeResult::error(registered);

    auto query = ctx.value()->Compile(sql);
    if (!query.ok()) return MergeResult::error(query);

    CompactionResult result;
    result.schema = query.value().schema;

    storage::parquet::ParquetWriter writer;
    auto opened = writer.Open(result.schema, metadata, bloom_filter_fields);
    if (!opened.ok()) {
        QFAB_ERROR("[merge] failed to open writer: {}", opened.error());
        return MergeResult::error(opened.error(), core::Error::Code::WRITE_FAILURE);
    }

    auto stream = ctx.value()->Execute(query.value());
    if (!stream.ok()) {
        QFAB_ERROR("[merge] execute stream error: {}", stream.error());
        return MergeResult::error(stream);
    }
    while (true) {
        auto batch = stream.value()->Next();
        if (!batch.ok()) {
            QFAB_ERROR("[merge] execute stream error: {}", batch.error());
            return MergeResult::error(batch);
        }
        if (!batch.value()) break;
        auto written = writer.WriteBatch(batch.value());
        if (!written.ok()) {
            QFAB_ERROR("[merge] write error: {}", written.error());
            return MergeResult::error(written.error(), core::Error::Code::WRITE_FAILURE);
        }
    }

    auto data = writer.Close();
    if (!data.ok()) {
        QFAB_ERROR("[merge] write error: {}", data.error());
        return MergeResult::error(data.error(), core::Error::Code::WRITE_FAILURE);
    }
    result.data = data.take_value();
    result.rows = writer.rows_written();

    auto filters = writer.TakeBloomFilters();
    if (!filters.empty()) {
        auto serialized = filters.Serialize();
        if (!serialized.ok()) {
            QFAB_ERROR("[merge] failed to serialize bloom filters: {}", serialized.error());
            return MergeResult::error(serialized.error(), core::Error::Code::WRITE_FAILURE);
        }
        result.bloom_filters = serialized.take_value();
    }

    auto dropped = ctx.value()->DeregisterTable(kMergeTable);
    if (!dropped.ok()) return MergeResult::error(dropped);

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    QFAB_DEBUG("[merge] {}/{} wrote {} rows in {} ms", core::StreamTypeToString(stream_type), stream_name,
               result.rows, elapsed.count());
    return MergeResult(std::move(result));
}

} // namespace compaction
} // namespace qfab
