#include "qfab/plan/optimizer.h"

#include <set>

#include "qfab/common/logger.h"

namespace qfab {
namespace plan {

namespace {

using PlanResult = core::Result<LogicalPlanPtr>;
using ExecResult = core::Result<ExecNodePtr>;

// Rewrites children first, then the node itself
template <typename Fn>
PlanResult TransformUp(const LogicalPlanPtr& plan, const Fn& fn) {
    std::vector<LogicalPlanPtr> inputs;
    bool changed = false;
    for (const auto& input : plan->inputs) {
        auto rewritten = TransformUp(input, fn);
        if (!rewritten.ok()) return rewritten;
        changed = changed || rewritten.value() != input;
        inputs.push_back(rewritten.take_value());
    }
    LogicalPlanPtr node = plan;
    if (changed) {
        auto copy = std::make_shared<LogicalPlan>(*plan);
        copy->inputs = std::move(inputs);
        node = std::move(copy);
    }
    return fn(node);
}

LogicalPlanPtr WithFetch(const LogicalPlanPtr& sort, size_t fetch) {
    if (sort->fetch && *sort->fetch <= fetch) return sort;
    auto copy = std::make_shared<LogicalPlan>(*sort);
    copy->fetch = fetch;
    return copy;
}

} // namespace

PlanResult PushDownFilter::Rewrite(const LogicalPlanPtr& plan) const {
    return TransformUp(plan, [](const LogicalPlanPtr& node) -> PlanResult {
        if (node->kind != LogicalPlan::Kind::FILTER || node->input()->kind != LogicalPlan::Kind::TABLE_SCAN) {
            return PlanResult(node);
        }
        const auto& scan = node->input();
        std::vector<ExprPtr> conjuncts;
        SplitConjunction(node->predicate, &conjuncts);

        std::set<std::string> existing;
        for (const auto& filter : scan->filters) existing.insert(filter->ToString());
        auto new_scan = std::make_shared<LogicalPlan>(*scan);
        bool added = false;
        for (const auto& conjunct : conjuncts) {
            if (ContainsSubquery(conjunct)) continue;
            if (!existing.insert(conjunct->ToString()).second) continue;
            new_scan->filters.push_back(conjunct);
            added = true;
        }
        if (!added) return PlanResult(node);
        auto filter = std::make_shared<LogicalPlan>(*node);
        filter->inputs = {new_scan};
        return PlanResult(std::move(filter));
    });
}

PlanResult PushDownLimit::Rewrite(const LogicalPlanPtr& plan) const {
    return TransformUp(plan, [](const LogicalPlanPtr& node) -> PlanResult {
        if (node->kind != LogicalPlan::Kind::LIMIT || !node->fetch) return PlanResult(node);
        size_t fetch = node->skip + *node->fetch;
        const auto& child = node->input();
        LogicalPlanPtr rewritten_child;
        if (child->kind == LogicalPlan::Kind::SORT) {
            rewritten_child = WithFetch(child, fetch);
        } else if (child->kind == LogicalPlan::Kind::PROJECTION &&
                   child->input()->kind == LogicalPlan::Kind::SORT) {
            auto sort = WithFetch(child->input(), fetch);
            if (sort == child->input()) return PlanResult(node);
            auto projection = std::make_shared<LogicalPlan>(*child);
            projection->inputs = {sort};
            rewritten_child = std::move(projection);
        } else {
            return PlanResult(node);
        }
        if (rewritten_child == child) return PlanResult(node);
        auto limit = std::make_shared<LogicalPlan>(*node);
        limit->inputs = {rewritten_child};
        return PlanResult(std::move(limit));
    });
}

std::vector<OptimizerRulePtr> DefaultOptimizerRules() {
    return {std::make_shared<PushDownFilter>(), std::make_shared<PushDownLimit>()};
}

PlanResult Optimize(const LogicalPlanPtr& plan, const std::vector<OptimizerRulePtr>& rules) {
    LogicalPlanPtr current = plan;
    for (const auto& rule : rules) {
        auto rewritten = rule->Rewrite(current);
        if (!rewritten.ok()) {
            QFAB_ERROR("[optimizer] rule {} failed: {}", rule->name(), rewritten.error());
            return rewritten;
        }
        current = rewritten.take_value();
    }
    return PlanResult(std::move(current));
}

ExecResult JoinReorderRule::Optimize(const ExecNodePtr& plan, const execution::SessionConfig& config) const {
    std::vector<ExecNodePtr> children;
    bool changed = false;
    for (const auto& child : plan->children()) {
        auto rewritten = Optimize(child, config);
        if (!rewritten.ok()) return rewritten;
        changed = changed || rewritten.value() != child;
        children.push_back(rewritten.take_value());
    }
    ExecNodePtr node = changed ? plan->WithNewChildren(std::move(children)) : plan;

    auto join = std::dynamic_pointer_cast<HashJoinExec>(node);
    if (!join || join->join_type() != JoinType::INNER) return ExecResult(node);
    auto left_rows = join->left()->EstimatedRows();
    auto right_rows = join->right()->EstimatedRows();
    if (!left_rows || !right_rows || *left_rows >= *right_rows) return ExecResult(node);

    std::vector<std::pair<int, int>> swapped_on;
    for (const auto& pair : join->on()) swapped_on.emplace_back(pair.second, pair.first);
    auto swapped = std::make_shared<HashJoinExec>(join->right(), join->left(), JoinType::INNER,
                                                  std::move(swapped_on));

    // swapped output is right columns then left columns
    auto schema = join->schema();
    auto swapped_schema = swapped->schema();
    int left_fields = join->left()->schema()->num_fields();
    int right_fields = join->right()->schema()->num_fields();
    std::vector<ExprPtr> exprs;
    for (int i = 0; i < left_fields; ++i) {
        exprs.push_back(MakeColumn(right_fields + i, *swapped_schema->field(right_fields + i)));
    }
    for (int i = 0; i < right_fields; ++i) {
        exprs.push_back(MakeColumn(i, *swapped_schema->field(i)));
    }
    QFAB_DEBUG("[optimizer] swapped join inputs ({} < {} rows)", *left_rows, *right_rows);
    return ExecResult(std::make_shared<ProjectionExec>(std::move(swapped), std::move(exprs), schema));
}

ExecResult OptimizePhysical(const ExecNodePtr& plan, const std::vector<PhysicalOptimizerRulePtr>& rules,
                            const execution::SessionConfig& config) {
    ExecNodePtr current = plan;
    for (const auto& rule : rules) {
        auto rewritten = rule->Optimize(current, config);
        if (!rewritten.ok()) {
            QFAB_ERROR("[optimizer] physical rule {} failed: {}", rule->name(), rewritten.error());
            return rewritten;
        }
        current = rewritten.take_value();
    }
    return ExecResult(std::move(current));
}

} // namespace plan
} // namespace qfab
