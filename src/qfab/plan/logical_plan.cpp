#include "qfab/plan/logical_plan.h"

#include <sstream>

#include <arrow/type_traits.h>

namespace qfab {
namespace plan {

namespace {

std::string Indent(int indent) {
    return std::string(static_cast<size_t>(indent) * 2, ' ');
}

template <typename T>
std::string JoinStrings(const std::vector<T>& items) {
    std::ostringstream oss;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << items[i]->ToString();
    }
    return oss.str();
}

} // namespace

std::string JoinTypeToString(JoinType type) {
    return type == JoinType::LEFT ? "Left" : "Inner";
}

std::string LogicalPlan::ToString(int indent) const {
    std::ostringstream oss;
    oss << Indent(indent);
    switch (kind) {
        case Kind::TABLE_SCAN:
            oss << "TableScan: " << table_name;
            if (!filters.empty()) oss << " filters=[" << JoinStrings(filters) << "]";
            break;
        case Kind::FILTER:
            oss << "Filter: " << predicate->ToString();
            break;
        case Kind::PROJECTION: {
            oss << "Projection: ";
            for (size_t i = 0; i < exprs.size(); ++i) {
                if (i > 0) oss << ", ";
                oss << exprs[i]->ToString();
                if (exprs[i]->kind != Expr::Kind::COLUMN || exprs[i]->name != schema->field(static_cast<int>(i))->name()) {
                    oss << " AS " << schema->field(static_cast<int>(i))->name();
                }
            }
            break;
        }
        case Kind::AGGREGATE: {
            oss << "Aggregate: groupBy=[" << JoinStrings(group_exprs) << "] aggr=[";
            for (size_t i = 0; i < aggregates.size(); ++i) {
                if (i > 0) oss << ", ";
                oss << aggregates[i].function << "(" << (aggregates[i].arg ? aggregates[i].arg->ToString() : "*")
                    << ")";
            }
            oss << "]";
            break;
        }
        case Kind::SORT:
            oss << "Sort: ";
            for (size_t i = 0; i < sort_exprs.size(); ++i) {
                if (i > 0) oss << ", ";
                oss << sort_exprs[i].expr->ToString() << (sort_exprs[i].descending ? " DESC" : " ASC")
                    << (sort_exprs[i].nulls_first ? " NULLS FIRST" : " NULLS LAST");
            }
            if (fetch) oss << " fetch=" << *fetch;
            break;
        case Kind::LIMIT:
            oss << "Limit: skip=" << skip << " fetch=" << (fetch ? std::to_string(*fetch) : "None");
            break;
        case Kind::JOIN: {
            oss << JoinTypeToString(join_type) << " Join: ";
            const auto& left = inputs[0]->schema;
            const auto& right = inputs[1]->schema;
            for (size_t i = 0; i < join_on.size(); ++i) {
                if (i > 0) oss << ", ";
                oss << left->field(join_on[i].first)->name() << " = " << right->field(join_on[i].second)->name();
            }
            break;
        }
    }
    oss << "\n";
    for (const auto& child : inputs) {
        oss << child->ToString(indent + 1);
    }
    return oss.str();
}

LogicalPlanPtr MakeTableScan(std::string table_name, std::shared_ptr<table::TableProvider> provider) {
    auto plan = std::make_shared<LogicalPlan>();
    plan->kind = LogicalPlan::Kind::TABLE_SCAN;
    plan->schema = provider->schema();
    plan->table_name = std::move(table_name);
    plan->provider = std::move(provider);
    return plan;
}

LogicalPlanPtr MakeFilter(LogicalPlanPtr input, ExprPtr predicate) {
    auto plan = std::make_shared<LogicalPlan>();
    plan->kind = LogicalPlan::Kind::FILTER;
    plan->schema = input->schema;
    plan->predicate = std::move(predicate);
    plan->inputs.push_back(std::move(input));
    return plan;
}

LogicalPlanPtr MakeProjection(LogicalPlanPtr input, std::vector<ExprPtr> exprs,
                              const std::vector<std::string>& names) {
    auto plan = std::make_shared<LogicalPlan>();
    plan->kind = LogicalPlan::Kind::PROJECTION;
    arrow::FieldVector fields;
    for (size_t i = 0; i < exprs.size(); ++i) {
        fields.push_back(arrow::field(names[i], exprs[i]->type, exprs[i]->nullable));
    }
    plan->schema = arrow::schema(std::move(fields));
    plan->exprs = std::move(exprs);
    plan->inputs.push_back(std::move(input));
    return plan;
}

LogicalPlanPtr MakeAggregate(LogicalPlanPtr input, std::vector<ExprPtr> group_exprs,
                             const std::vector<std::string>& group_names, std::vector<AggregateCall> aggregates) {
    auto plan = std::make_shared<LogicalPlan>();
    plan->kind = LogicalPlan::Kind::AGGREGATE;
    arrow::FieldVector fields;
    for (size_t i = 0; i < group_exprs.size(); ++i) {
        fields.push_back(arrow::field(group_names[i], group_exprs[i]->type, group_exprs[i]->nullable));
    }
    for (const auto& agg : aggregates) {
        fields.push_back(arrow::field(agg.name, agg.type, agg.nullable));
    }
    plan->schema = arrow::schema(std::move(fields));
    plan->group_exprs = std::move(group_exprs);
    plan->aggregates = std::move(aggregates);
    plan->inputs.push_back(std::move(input));
    return plan;
}

LogicalPlanPtr MakeSort(LogicalPlanPtr input, std::vector<SortExpr> sort_exprs, std::optional<size_t> fetch) {
    auto plan = std::make_shared<LogicalPlan>();
    plan->kind = LogicalPlan::Kind::SORT;
    plan->schema = input->schema;
    plan->sort_exprs = std::move(sort_exprs);
    plan->fetch = fetch;
    plan->inputs.push_back(std::move(input));
    return plan;
}

LogicalPlanPtr MakeLimit(LogicalPlanPtr input, size_t skip, std::optional<size_t> fetch) {
    auto plan = std::make_shared<LogicalPlan>();
    plan->kind = LogicalPlan::Kind::LIMIT;
    plan->schema = input->schema;
    plan->skip = skip;
    plan->fetch = fetch;
    plan->inputs.push_back(std::move(input));
    return plan;
}

std::shared_ptr<arrow::Schema> JoinSchema(const arrow::Schema& left, const arrow::Schema& right, JoinType type) {
    arrow::FieldVector fields = left.fields();
    for (const auto& field : right.fields()) {
        fields.push_back(type == JoinType::LEFT ? field->WithNullable(true) : field);
    }
    return arrow::schema(std::move(fields));
}

LogicalPlanPtr MakeJoin(LogicalPlanPtr left, LogicalPlanPtr right, JoinType type,
                        std::vector<std::pair<int, int>> on) {
    auto plan = std::make_shared<LogicalPlan>();
    plan->kind = LogicalPlan::Kind::JOIN;
    plan->schema = JoinSchema(*left->schema, *right->schema, type);
    plan->join_type = type;
    plan->join_on = std::move(on);
    plan->inputs.push_back(std::move(left));
    plan->inputs.push_back(std::move(right));
    return plan;
}

core::Result<std::pair<std::shared_ptr<arrow::DataType>, bool>> AggregateOutputType(
    const std::string& function, const std::shared_ptr<arrow::DataType>& input_type, bool input_nullable) {
    using TypeResult = core::Result<std::pair<std::shared_ptr<arrow::DataType>, bool>>;
    if (function == "count" || function == "count_all" || function == "count_distinct") {
        return TypeResult(std::make_pair(arrow::int64(), false));
    }
    if (!input_type) {
        return TypeResult::error("Aggregate " + function + " needs an argument", core::Error::Code::PLANNING_FAILURE);
    }
    auto id = input_type->id();
    if (function == "min" || function == "max" || function == "first") {
        return TypeResult(std::make_pair(input_type, input_nullable));
    }
    if (function == "sum") {
        if (arrow::is_signed_integer(id)) return TypeResult(std::make_pair(arrow::int64(), input_nullable));
        if (arrow::is_unsigned_integer(id)) return TypeResult(std::make_pair(arrow::uint64(), input_nullable));
        if (arrow::is_floating(id)) return TypeResult(std::make_pair(arrow::float64(), input_nullable));
        if (arrow::is_decimal(id)) return TypeResult(std::make_pair(input_type, input_nullable));
    } else if (function == "mean") {
        if (arrow::is_integer(id) || arrow::is_floating(id)) return TypeResult(std::make_pair(arrow::float64(), true));
        if (arrow::is_decimal(id)) return TypeResult(std::make_pair(input_type, true));
    } else if (function == "tdigest") {
        if (arrow::is_integer(id) || arrow::is_floating(id)) return TypeResult(std::make_pair(arrow::float64(), true));
    } else {
        return TypeResult::error("Unknown aggregate function " + function, core::Error::Code::PLANNING_FAILURE);
    }
    return TypeResult::error("Aggregate " + function + " does not support " + input_type->ToString(),
                             core::Error::Code::PLANNING_FAILURE);
}

} // namespace plan
} // namespace qfab
