#include <algorithm>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <arrow/api.h>
#include <arrow/io/file.h>
#include <arrow/pretty_print.h>

#include "qfab/common/logger.h"
#include "qfab/compaction/merge.h"
#include "qfab/core/config.h"
#include "qfab/core/types.h"
#include "qfab/execution/context_builder.h"
#include "qfab/storage/parquet/reader.hpp"
#include "qfab/table/mem_table.h"
#include "qfab/table/union_table.h"

using namespace qfab;

namespace {

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " <command> [options]\n"
              << "Commands:\n"
              << "  query   --sql <statement> <file.parquet>...   Run SQL over the files as table 'tbl'\n"
              << "  compact --out <file.parquet> <file.parquet>... Merge the files into one, sorted by time\n"
              << "Options:\n"
              << "  --config <path>        JSON engine configuration\n"
              << "  --stream-type <type>   logs, metrics, traces, metadata, index (compact, default logs)\n"
              << "  --stream <name>        Stream name (compact)\n"
              << "  --bloom <field>        Build a bloom filter for field, repeatable (compact)\n"
              << "  --work-group <name>    Workgroup the query runs in (query)\n"
              << "  --help                 Show this help\n";
}

struct LoadedFile {
    std::shared_ptr<table::MemTable> table;
    core::FileMeta meta;
};

core::Result<std::shared_ptr<arrow::Buffer>> ReadWholeFile(const std::string& path) {
    using BufferResult = core::Result<std::shared_ptr<arrow::Buffer>>;
    auto file = arrow::io::ReadableFile::Open(path);
    if (!file.ok()) return BufferResult::error(file.status().ToString(), core::Error::Code::NOT_FOUND);
    auto size = (*file)->GetSize();
    if (!size.ok()) return BufferResult::error(size.status().ToString(), core::Error::Code::INTERNAL);
    auto data = (*file)->Read(*size);
    if (!data.ok()) return BufferResult::error(data.status().ToString(), core::Error::Code::INTERNAL);
    return BufferResult(*data);
}

core::Result<LoadedFile> LoadParquet(const std::string& path) {
    using LoadResult = core::Result<LoadedFile>;
    auto data = ReadWholeFile(path);
    if (!data.ok()) return LoadResult::error(data);

    storage::parquet::ParquetReader reader;
    auto opened = reader.Open(data.value());
    if (!opened.ok()) return LoadResult::error(path + ": " + opened.error(), opened.error_code());

    std::vector<std::shared_ptr<arrow::RecordBatch>> batches;
    while (true) {
        std::shared_ptr<arrow::RecordBatch> batch;
        auto read = reader.ReadBatch(&batch);
        if (!read.ok()) return LoadResult::error(path + ": " + read.error(), read.error_code());
        if (!batch) break;
        batches.push_back(std::move(batch));
    }

    LoadedFile loaded;
    loaded.meta = reader.ReadFileMeta();
    if (loaded.meta.records == 0) {
        for (const auto& batch : batches) loaded.meta.records += batch->num_rows();
    }
    if (loaded.meta.compressed_size == 0) loaded.meta.compressed_size = data.value()->size();

    auto made = table::MemTable::Make(reader.schema(), std::move(batches));
    if (!made.ok()) return LoadResult::error(made);
    loaded.table = made.take_value();
    return LoadResult(std::move(loaded));
}

core::Result<std::shared_ptr<arrow::Schema>> UnifySchemas(const std::vector<LoadedFile>& files) {
    std::vector<std::shared_ptr<arrow::Schema>> schemas;
    for (const auto& f : files) schemas.push_back(f.table->schema());
    auto merged = arrow::UnifySchemas(schemas);
    if (!merged.ok()) {
        return core::Result<std::shared_ptr<arrow::Schema>>::error(merged.status().ToString(),
                                                                   core::Error::Code::INVALID_ARGUMENT);
    }
    return core::Result<std::shared_ptr<arrow::Schema>>(*merged);
}

core::Result<void> WriteFile(const std::string& path, const std::shared_ptr<arrow::Buffer>& data) {
    auto out = arrow::io::FileOutputStream::Open(path);
    if (!out.ok()) return core::Result<void>::error(out.status().ToString(), core::Error::Code::WRITE_FAILURE);
    auto st = (*out)->Write(data);
    if (st.ok()) st = (*out)->Close();
    if (!st.ok()) return core::Result<void>::error(st.ToString(), core::Error::Code::WRITE_FAILURE);
    return core::Result<void>();
}

int RunQuery(const std::string& sql, const std::optional<std::string>& work_group, const std::vector<LoadedFile>& files,
             const std::shared_ptr<arrow::Schema>& schema) {
    auto cfg = core::GetConfig();
    auto ctx = execution::PrepareContext(work_group, {}, false, cfg->limit.cpu_num);
    if (!ctx.ok()) {
        std::cerr << "Failed to prepare context: " << ctx.error() << std::endl;
        return 1;
    }

    std::vector<std::shared_ptr<table::TableProvider>> providers;
    for (const auto& f : files) providers.push_back(f.table);
    auto registered = ctx.value()->RegisterTable("tbl", std::make_shared<table::UnionTable>(schema, providers));
    if (!registered.ok()) {
        std::cerr << "Failed to register table: " << registered.error() << std::endl;
        return 1;
    }

    auto result = ctx.value()->ExecuteToTable(sql);
    if (!result.ok()) {
        std::cerr << core::ErrorCodeName(result.error_code()) << ": " << result.error() << std::endl;
        return 1;
    }
    auto st = arrow::PrettyPrint(*result.value(), 0, &std::cout);
    if (!st.ok()) {
        std::cerr << st.ToString() << std::endl;
        return 1;
    }
    std::cout << result.value()->num_rows() << " row(s)" << std::endl;
    return 0;
}

int RunCompact(const std::string& out_path, core::StreamType stream_type, const std::string& stream_name,
               const std::vector<std::string>& bloom_fields, const std::vector<LoadedFile>& files,
               const std::shared_ptr<arrow::Schema>& schema) {
    core::FileMeta meta;
    std::vector<std::shared_ptr<table::TableProvider>> tables;
    for (size_t i = 0; i < files.size(); ++i) {
        const auto& m = files[i].meta;
        meta.min_ts = i == 0 ? m.min_ts : std::min(meta.min_ts, m.min_ts);
        meta.max_ts = i == 0 ? m.max_ts : std::max(meta.max_ts, m.max_ts);
        meta.records += m.records;
        meta.original_size += m.original_size;
        tables.push_back(files[i].table);
    }

    auto merged = compaction::MergeParquetFiles(stream_type, stream_name, schema, std::move(tables), bloom_fields,
                                                meta);
    if (!merged.ok()) {
        std::cerr << core::ErrorCodeName(merged.error_code()) << ": " << merged.error() << std::endl;
        return 1;
    }

    auto written = WriteFile(out_path, merged.value().data);
    if (!written.ok()) {
        std::cerr << "Failed to write " << out_path << ": " << written.error() << std::endl;
        return 1;
    }
    if (merged.value().bloom_filters) {
        written = WriteFile(out_path + ".bloom", merged.value().bloom_filters);
        if (!written.ok()) {
            std::cerr << "Failed to write bloom filters: " << written.error() << std::endl;
            return 1;
        }
    }
    std::cout << "Wrote " << merged.value().rows << " rows (" << merged.value().data->size() << " bytes) to "
              << out_path << std::endl;
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }
    std::string command = argv[1];
    if (command == "--help" || command == "-h") {
        print_usage(argv[0]);
        return 0;
    }

    std::string sql;
    std::string out_path;
    std::string config_path;
    std::string stream_name = "default";
    std::string stream_type_name = "logs";
    std::optional<std::string> work_group;
    std::vector<std::string> bloom_fields;
    std::vector<std::string> inputs;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--sql" && i + 1 < argc) sql = argv[++i];
        else if (arg == "--out" && i + 1 < argc) out_path = argv[++i];
        else if (arg == "--config" && i + 1 < argc) config_path = argv[++i];
        else if (arg == "--stream" && i + 1 < argc) stream_name = argv[++i];
        else if (arg == "--stream-type" && i + 1 < argc) stream_type_name = argv[++i];
        else if (arg == "--work-group" && i + 1 < argc) work_group = std::string(argv[++i]);
        else if (arg == "--bloom" && i + 1 < argc) bloom_fields.push_back(argv[++i]);
        else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        } else {
            inputs.push_back(arg);
        }
    }

    common::Logger::Init();

    auto config = config_path.empty() ? core::Result<core::EngineConfig>(core::EngineConfig::Default())
                                      : core::LoadConfigFromFile(config_path);
    if (!config.ok()) {
        std::cerr << "Invalid configuration: " << config.error() << std::endl;
        return 1;
    }
    auto env = core::ApplyEnvOverrides(config.value());
    if (!env.ok()) {
        std::cerr << "Invalid configuration: " << env.error() << std::endl;
        return 1;
    }
    core::SetConfig(config.value());
    common::Logger::SetLevel(config.value().log.level);

    if (inputs.empty()) {
        std::cerr << "No input files" << std::endl;
        return 1;
    }

    std::vector<LoadedFile> files;
    for (const auto& path : inputs) {
        auto loaded = LoadParquet(path);
        if (!loaded.ok()) {
            std::cerr << "Failed to load " << path << ": " << loaded.error() << std::endl;
            return 1;
        }
        files.push_back(loaded.take_value());
    }
    auto schema = UnifySchemas(files);
    if (!schema.ok()) {
        std::cerr << "Incompatible schemas: " << schema.error() << std::endl;
        return 1;
    }

    if (command == "query") {
        if (sql.empty()) {
            std::cerr << "query needs --sql" << std::endl;
            return 1;
        }
        return RunQuery(sql, work_group, files, schema.value());
    }
    if (command == "compact") {
        if (out_path.empty()) {
            std::cerr << "compact needs --out" << std::endl;
            return 1;
        }
        auto stream_type = core::ParseStreamType(stream_type_name);
        if (!stream_type) {
            std::cerr << "Unknown stream type: " << stream_type_name << std::endl;
            return 1;
        }
        return RunCompact(out_path, *stream_type, stream_name, bloom_fields, files, schema.value());
    }

    std::cerr << "Unknown command: " << command << std::endl;
    print_usage(argv[0]);
    return 1;
}
