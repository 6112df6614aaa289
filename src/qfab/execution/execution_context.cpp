#include "qfab/execution/execution_context.h"

#include "qfab/common/logger.h"
#include "qfab/table/mem_table.h"

namespace qfab {
namespace execution {

namespace {

constexpr const char* kCatalogName = "qfab";
constexpr const char* kDefaultSchema = "public";
constexpr const char* kInformationSchema = "information_schema";

using ProviderResult = core::Result<std::shared_ptr<table::TableProvider>>;

core::Result<std::shared_ptr<arrow::Array>> StringArray(const std::vector<std::string>& values) {
    arrow::StringBuilder builder;
    auto status = builder.AppendValues(values);
    std::shared_ptr<arrow::Array> out;
    if (status.ok()) status = builder.Finish(&out);
    if (!status.ok()) {
        return core::Result<std::shared_ptr<arrow::Array>>::error(status.ToString(), core::Error::Code::INTERNAL);
    }
    return core::Result<std::shared_ptr<arrow::Array>>(std::move(out));
}

} // namespace

ExecutionContext::ExecutionContext(SessionConfig config, std::shared_ptr<RuntimeEnv> runtime)
    : config_(config), runtime_(std::move(runtime)),
      optimizer_rules_(plan::DefaultOptimizerRules()),
      query_planner_(std::make_shared<plan::DefaultQueryPlanner>()),
      engine_(std::make_shared<SqlQueryEngine>()) {}

core::Result<void> ExecutionContext::RegisterTable(const std::string& name,
                                                   std::shared_ptr<table::TableProvider> provider) {
    if (!tables_.emplace(name, std::move(provider)).second) {
        return core::Result<void>::error("Table " + name + " already exists", core::Error::Code::ALREADY_EXISTS);
    }
    QFAB_DEBUG("[context] registered table {}", name);
    return core::Result<void>();
}

ProviderResult ExecutionContext::DeregisterTable(const std::string& name) {
    auto it = tables_.find(name);
    if (it == tables_.end()) {
        return ProviderResult::error("Table " + name + " not found", core::Error::Code::NOT_FOUND);
    }
    auto provider = std::move(it->second);
    tables_.erase(it);
    return ProviderResult(std::move(provider));
}

std::shared_ptr<table::TableProvider> ExecutionContext::GetTable(const std::string& name) const {
    auto it = tables_.find(name);
    return it == tables_.end() ? nullptr : it->second;
}

std::vector<std::string> ExecutionContext::TableNames() const {
    std::vector<std::string> names;
    for (const auto& entry : tables_) names.push_back(entry.first);
    return names;
}

ProviderResult ExecutionContext::ResolveTable(const sql::TableRef& ref) const {
    if (ref.schema == kInformationSchema) {
        if (!config_.information_schema) {
            return ProviderResult::error("information_schema is disabled", core::Error::Code::NOT_FOUND);
        }
        return InformationSchemaTable(ref.name);
    }
    if (!ref.schema.empty() && ref.schema != kDefaultSchema) {
        return ProviderResult::error("Schema " + ref.schema + " not found", core::Error::Code::NOT_FOUND);
    }
    auto provider = GetTable(ref.name);
    if (!provider) {
        return ProviderResult::error("Table " + ref.qualified_name() + " not found", core::Error::Code::NOT_FOUND);
    }
    return ProviderResult(std::move(provider));
}

ProviderResult ExecutionContext::InformationSchemaTable(const std::string& name) const {
    std::vector<std::string> table_names;
    std::vector<std::string> table_types;
    std::vector<std::string> column_tables;
    std::vector<std::string> column_names;
    std::vector<int64_t> positions;
    std::vector<std::string> nullables;
    std::vector<std::string> data_types;
    for (const auto& entry : tables_) {
        table_names.push_back(entry.first);
        table_types.push_back(table::TableTypeToString(entry.second->type()));
        auto schema = entry.second->schema();
        for (int i = 0; i < schema->num_fields(); ++i) {
            const auto& field = schema->field(i);
            column_tables.push_back(entry.first);
            column_names.push_back(field->name());
            positions.push_back(i + 1);
            nullables.push_back(field->nullable() ? "YES" : "NO");
            data_types.push_back(field->type()->ToString());
        }
    }

    std::vector<std::shared_ptr<arrow::Array>> columns;
    std::shared_ptr<arrow::Schema> schema;
    auto add = [&columns](const std::vector<std::string>& values) -> core::Result<void> {
        auto array = StringArray(values);
        if (!array.ok()) return core::Result<void>::error(array);
        columns.push_back(array.take_value());
        return core::Result<void>();
    };

    size_t rows = 0;
    if (name == "tables") {
        rows = table_names.size();
        schema = arrow::schema({
            arrow::field("table_catalog", arrow::utf8(), false),
            arrow::field("table_schema", arrow::utf8(), false),
            arrow::field("table_name", arrow::utf8(), false),
            arrow::field("table_type", arrow::utf8(), false),
        });
        auto status = add(std::vector<std::string>(rows, kCatalogName));
        if (status.ok()) status = add(std::vector<std::string>(rows, kDefaultSchema));
        if (status.ok()) status = add(table_names);
        if (status.ok()) status = add(table_types);
        if (!status.ok()) return ProviderResult::error(status);
    } else if (name == "columns") {
        rows = column_names.size();
        schema = arrow::schema({
            arrow::field("table_catalog", arrow::utf8(), false),
            arrow::field("table_schema", arrow::utf8(), false),
            arrow::field("table_name", arrow::utf8(), false),
            arrow::field("column_name", arrow::utf8(), false),
            arrow::field("ordinal_position", arrow::int64(), false),
            arrow::field("is_nullable", arrow::utf8(), false),
            arrow::field("data_type", arrow::utf8(), false),
        });
        auto status = add(std::vector<std::string>(rows, kCatalogName));
        if (status.ok()) status = add(std::vector<std::string>(rows, kDefaultSchema));
        if (status.ok()) status = add(column_tables);
        if (status.ok()) status = add(column_names);
        if (!status.ok()) return ProviderResult::error(status);

        arrow::Int64Builder builder;
        std::shared_ptr<arrow::Array> position_array;
        auto appended = builder.AppendValues(positions);
        if (appended.ok()) appended = builder.Finish(&position_array);
        if (!appended.ok()) return ProviderResult::error(appended.ToString(), core::Error::Code::INTERNAL);
        columns.push_back(std::move(position_array));

        status = add(nullables);
        if (status.ok()) status = add(data_types);
        if (!status.ok()) return ProviderResult::error(status);
    } else {
        return ProviderResult::error("Table information_schema." + name + " not found",
                                     core::Error::Code::NOT_FOUND);
    }

    auto batch = arrow::RecordBatch::Make(schema, static_cast<int64_t>(rows), std::move(columns));
    auto view = table::MemTable::Make(schema, {batch}, table::TableType::VIEW);
    if (!view.ok()) return ProviderResult::error(view);
    return ProviderResult(view.take_value());
}

core::Result<CompiledQuery> ExecutionContext::Compile(const std::string& sql) const {
    return engine_->Compile(sql, *this);
}

core::Result<std::unique_ptr<RecordBatchStream>> ExecutionContext::Execute(const CompiledQuery& query) const {
    return engine_->Execute(query, *this);
}

core::Result<std::shared_ptr<arrow::Table>> ExecutionContext::ExecuteToTable(const std::string& sql) const {
    using TableResult = core::Result<std::shared_ptr<arrow::Table>>;
    auto query = Compile(sql);
    if (!query.ok()) return TableResult::error(query);
    auto stream = Execute(query.value());
    if (!stream.ok()) return TableResult::error(stream);
    return CollectToTable(*stream.value());
}

plan::TaskContext ExecutionContext::task_context() const {
    plan::TaskContext ctx;
    ctx.config = config_;
    ctx.runtime = runtime_;
    return ctx;
}

core::Result<void> RegisterDefaultFunctions(ExecutionContext& ctx) {
    return RegisterDefaultFunctions(ctx.functions());
}

} // namespace execution
} // namespace qfab
