#ifndef QFAB_EXECUTION_EXECUTION_CONTEXT_H_
#define QFAB_EXECUTION_EXECUTION_CONTEXT_H_

#include <map>
#include <memory>
#include <string>
#include <vector>

#include <arrow/api.h>

#include "qfab/core/result.h"
#include "qfab/execution/function_registry.h"
#include "qfab/execution/query_engine.h"
#include "qfab/execution/runtime_env.h"
#include "qfab/execution/session_config.h"
#include "qfab/plan/optimizer.h"
#include "qfab/plan/query_planner.h"
#include "qfab/sql/ast.h"
#include "qfab/table/table_provider.h"

namespace qfab {
namespace execution {

/**
 * @brief Everything one request plans and runs with
 *
 * Owns the registered tables; dropping the context releases them together
 * with any staged file lists they hold. Not shared across requests.
 *
 * When the session enables it, information_schema.tables and
 * information_schema.columns describe the registered tables.
 */
class ExecutionContext {
public:
    ExecutionContext(SessionConfig config, std::shared_ptr<RuntimeEnv> runtime);

    ExecutionContext(const ExecutionContext&) = delete;
    ExecutionContext& operator=(const ExecutionContext&) = delete;

    const SessionConfig& config() const { return config_; }
    const std::shared_ptr<RuntimeEnv>& runtime() const { return runtime_; }

    FunctionRegistry& functions() { return functions_; }
    const FunctionRegistry& functions() const { return functions_; }

    // ALREADY_EXISTS when the name is taken
    core::Result<void> RegisterTable(const std::string& name, std::shared_ptr<table::TableProvider> provider);
    // NOT_FOUND when the name is unknown
    core::Result<std::shared_ptr<table::TableProvider>> DeregisterTable(const std::string& name);
    // Null when unknown
    std::shared_ptr<table::TableProvider> GetTable(const std::string& name) const;
    std::vector<std::string> TableNames() const;

    // Resolves a FROM reference, including information_schema views
    core::Result<std::shared_ptr<table::TableProvider>> ResolveTable(const sql::TableRef& ref) const;

    const std::vector<plan::OptimizerRulePtr>& optimizer_rules() const { return optimizer_rules_; }
    void AddOptimizerRule(plan::OptimizerRulePtr rule) { optimizer_rules_.push_back(std::move(rule)); }

    const std::vector<plan::PhysicalOptimizerRulePtr>& physical_optimizer_rules() const { return physical_rules_; }
    void AddPhysicalOptimizerRule(plan::PhysicalOptimizerRulePtr rule) { physical_rules_.push_back(std::move(rule)); }

    const plan::QueryPlanner& query_planner() const { return *query_planner_; }
    void SetQueryPlanner(std::shared_ptr<const plan::QueryPlanner> planner) { query_planner_ = std::move(planner); }

    void SetQueryEngine(std::shared_ptr<const QueryEngine> engine) { engine_ = std::move(engine); }

    core::Result<CompiledQuery> Compile(const std::string& sql) const;
    core::Result<std::unique_ptr<RecordBatchStream>> Execute(const CompiledQuery& query) const;
    // Compile and execute, collecting every batch
    core::Result<std::shared_ptr<arrow::Table>> ExecuteToTable(const std::string& sql) const;

    plan::TaskContext task_context() const;

private:
    core::Result<std::shared_ptr<table::TableProvider>> InformationSchemaTable(const std::string& name) const;

    SessionConfig config_;
    std::shared_ptr<RuntimeEnv> runtime_;
    FunctionRegistry functions_;
    std::map<std::string, std::shared_ptr<table::TableProvider>> tables_;
    std::vector<plan::OptimizerRulePtr> optimizer_rules_;
    std::vector<plan::PhysicalOptimizerRulePtr> physical_rules_;
    std::shared_ptr<const plan::QueryPlanner> query_planner_;
    std::shared_ptr<const QueryEngine> engine_;
};

// Registers the default function set into the context's registry
core::Result<void> RegisterDefaultFunctions(ExecutionContext& ctx);

} // namespace execution
} // namespace qfab

#endif // QFAB_EXECUTION_EXECUTION_CONTEXT_H_
