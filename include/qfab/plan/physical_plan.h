#ifndef QFAB_PLAN_PHYSICAL_PLAN_H_
#define QFAB_PLAN_PHYSICAL_PLAN_H_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <arrow/api.h>

#include "qfab/core/result.h"
#include "qfab/execution/record_batch_stream.h"
#include "qfab/plan/expr.h"
#include "qfab/plan/logical_plan.h"
#include "qfab/table/table_provider.h"

namespace qfab {
namespace plan {

// Resources an operator runs with
using TaskContext = table::ScanContext;

class ExecNode;
using ExecNodePtr = std::shared_ptr<ExecNode>;

// Physical plans of the IN subqueries of an expression, keyed by node
using SubqueryPlans = std::vector<std::pair<const Expr*, ExecNodePtr>>;

/**
 * @brief Pull-based physical operator
 *
 * Execute() builds a fresh stream each call; the node itself is immutable.
 */
class ExecNode {
public:
    virtual ~ExecNode() = default;

    virtual std::string name() const = 0;
    virtual std::shared_ptr<arrow::Schema> schema() const = 0;
    virtual std::vector<ExecNodePtr> children() const = 0;
    virtual ExecNodePtr WithNewChildren(std::vector<ExecNodePtr> children) const = 0;

    virtual core::Result<std::unique_ptr<execution::RecordBatchStream>> Execute(const TaskContext& ctx) const = 0;

    // Row count estimate used by join reordering
    virtual std::optional<int64_t> EstimatedRows() const { return std::nullopt; }

    // One-line description used by ToString
    virtual std::string Describe() const { return name(); }

    std::string ToString(int indent = 0) const;
};

class ScanExec : public ExecNode {
public:
    ScanExec(std::string table_name, std::shared_ptr<table::TableProvider> provider, std::vector<ExprPtr> filters);

    std::string name() const override { return "ScanExec"; }
    std::shared_ptr<arrow::Schema> schema() const override { return provider_->schema(); }
    std::vector<ExecNodePtr> children() const override { return {}; }
    ExecNodePtr WithNewChildren(std::vector<ExecNodePtr> children) const override;
    core::Result<std::unique_ptr<execution::RecordBatchStream>> Execute(const TaskContext& ctx) const override;
    std::optional<int64_t> EstimatedRows() const override;
    std::string Describe() const override;

    const std::shared_ptr<table::TableProvider>& provider() const { return provider_; }
    const std::vector<ExprPtr>& filters() const { return filters_; }

private:
    std::string table_name_;
    std::shared_ptr<table::TableProvider> provider_;
    std::vector<ExprPtr> filters_;
};

class FilterExec : public ExecNode {
public:
    FilterExec(ExecNodePtr input, ExprPtr predicate, SubqueryPlans subqueries);

    std::string name() const override { return "FilterExec"; }
    std::shared_ptr<arrow::Schema> schema() const override { return input_->schema(); }
    std::vector<ExecNodePtr> children() const override { return {input_}; }
    ExecNodePtr WithNewChildren(std::vector<ExecNodePtr> children) const override;
    core::Result<std::unique_ptr<execution::RecordBatchStream>> Execute(const TaskContext& ctx) const override;
    std::optional<int64_t> EstimatedRows() const override { return input_->EstimatedRows(); }
    std::string Describe() const override;

private:
    ExecNodePtr input_;
    ExprPtr predicate_;
    SubqueryPlans subqueries_;
};

class ProjectionExec : public ExecNode {
public:
    ProjectionExec(ExecNodePtr input, std::vector<ExprPtr> exprs, std::shared_ptr<arrow::Schema> schema,
                   SubqueryPlans subqueries = {});

    std::string name() const override { return "ProjectionExec"; }
    std::shared_ptr<arrow::Schema> schema() const override { return schema_; }
    std::vector<ExecNodePtr> children() const override { return {input_}; }
    ExecNodePtr WithNewChildren(std::vector<ExecNodePtr> children) const override;
    core::Result<std::unique_ptr<execution::RecordBatchStream>> Execute(const TaskContext& ctx) const override;
    std::optional<int64_t> EstimatedRows() const override { return input_->EstimatedRows(); }
    std::string Describe() const override;

    const std::vector<ExprPtr>& exprs() const { return exprs_; }

private:
    ExecNodePtr input_;
    std::vector<ExprPtr> exprs_;
    std::shared_ptr<arrow::Schema> schema_;
    SubqueryPlans subqueries_;
};

/**
 * @brief Hash or scalar aggregation on Arrow Acero
 *
 * Group expressions and aggregate arguments are projected first, then fed
 * through an Acero aggregate node. Outputs are renamed and cast to the
 * logical schema.
 */
class AggregateExec : public ExecNode {
public:
    static core::Result<std::shared_ptr<AggregateExec>> Make(ExecNodePtr input, std::vector<ExprPtr> group_exprs,
                                                             std::vector<AggregateCall> aggregates,
                                                             std::shared_ptr<arrow::Schema> schema);

    std::string name() const override { return "AggregateExec"; }
    std::shared_ptr<arrow::Schema> schema() const override { return schema_; }
    std::vector<ExecNodePtr> children() const override { return {input_}; }
    ExecNodePtr WithNewChildren(std::vector<ExecNodePtr> children) const override;
    core::Result<std::unique_ptr<execution::RecordBatchStream>> Execute(const TaskContext& ctx) const override;
    std::optional<int64_t> EstimatedRows() const override;
    std::string Describe() const override;

    // Schema Acero produces, renamed to the logical names
    const std::shared_ptr<arrow::Schema>& realised_schema() const { return realised_schema_; }

private:
    AggregateExec() = default;

    ExecNodePtr input_;
    std::vector<ExprPtr> group_exprs_;
    std::vector<AggregateCall> aggregates_;
    std::shared_ptr<arrow::Schema> schema_;
    std::shared_ptr<arrow::Schema> staged_schema_;     // projected input
    std::shared_ptr<arrow::Schema> acero_schema_;      // raw Acero output
    std::shared_ptr<arrow::Schema> realised_schema_;
};

struct SortKeySpec {
    int column = 0;
    bool descending = false;
    bool nulls_first = false;
};

/**
 * @brief Stable sort with optional fetch
 *
 * Buffers its input under a spillable memory reservation. When the pool
 * rejects growth and supports spilling, buffered rows are sorted and written
 * as an Arrow IPC run to the scratch directory; runs are merged at the end.
 * A pool without spilling fails the query with RESOURCE_EXHAUSTED.
 */
class SortExec : public ExecNode {
public:
    SortExec(ExecNodePtr input, std::vector<SortKeySpec> keys, std::optional<size_t> fetch);

    std::string name() const override { return "SortExec"; }
    std::shared_ptr<arrow::Schema> schema() const override { return input_->schema(); }
    std::vector<ExecNodePtr> children() const override { return {input_}; }
    ExecNodePtr WithNewChildren(std::vector<ExecNodePtr> children) const override;
    core::Result<std::unique_ptr<execution::RecordBatchStream>> Execute(const TaskContext& ctx) const override;
    std::optional<int64_t> EstimatedRows() const override;
    std::string Describe() const override;

    std::optional<size_t> fetch() const { return fetch_; }

private:
    ExecNodePtr input_;
    std::vector<SortKeySpec> keys_;
    std::optional<size_t> fetch_;
};

class LimitExec : public ExecNode {
public:
    LimitExec(ExecNodePtr input, size_t skip, std::optional<size_t> fetch);

    std::string name() const override { return "LimitExec"; }
    std::shared_ptr<arrow::Schema> schema() const override { return input_->schema(); }
    std::vector<ExecNodePtr> children() const override { return {input_}; }
    ExecNodePtr WithNewChildren(std::vector<ExecNodePtr> children) const override;
    core::Result<std::unique_ptr<execution::RecordBatchStream>> Execute(const TaskContext& ctx) const override;
    std::optional<int64_t> EstimatedRows() const override;
    std::string Describe() const override;

private:
    ExecNodePtr input_;
    size_t skip_;
    std::optional<size_t> fetch_;
};

/**
 * @brief Equi-join on Arrow Acero; the right input is the build side
 */
class HashJoinExec : public ExecNode {
public:
    HashJoinExec(ExecNodePtr left, ExecNodePtr right, JoinType type, std::vector<std::pair<int, int>> on);

    std::string name() const override { return "HashJoinExec"; }
    std::shared_ptr<arrow::Schema> schema() const override { return schema_; }
    std::vector<ExecNodePtr> children() const override { return {left_, right_}; }
    ExecNodePtr WithNewChildren(std::vector<ExecNodePtr> children) const override;
    core::Result<std::unique_ptr<execution::RecordBatchStream>> Execute(const TaskContext& ctx) const override;
    std::string Describe() const override;

    JoinType join_type() const { return type_; }
    const std::vector<std::pair<int, int>>& on() const { return on_; }
    const ExecNodePtr& left() const { return left_; }
    const ExecNodePtr& right() const { return right_; }

private:
    ExecNodePtr left_;
    ExecNodePtr right_;
    JoinType type_;
    std::vector<std::pair<int, int>> on_;
    std::shared_ptr<arrow::Schema> schema_;
};

/**
 * @brief Runs subquery plans and collects their distinct values
 *
 * Values are cast to the type of the tested expression.
 */
core::Result<SubqueryResults> MaterializeSubqueries(const SubqueryPlans& plans, const TaskContext& ctx);

// Executes a plan and collects the result
core::Result<std::shared_ptr<arrow::Table>> CollectPlan(const ExecNode& plan, const TaskContext& ctx);

} // namespace plan
} // namespace qfab

#endif // QFAB_PLAN_PHYSICAL_PLAN_H_
