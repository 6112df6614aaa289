#include "qfab/execution/function_registry.h"

namespace qfab {
namespace execution {

core::Result<void> FunctionRegistry::Register(FunctionDef def) {
    if (def.name.empty()) {
        return core::Result<void>::error("Function name must not be empty", core::Error::Code::INVALID_ARGUMENT);
    }
    if (functions_.count(def.name) > 0) {
        return core::Result<void>::error("Function already registered: " + def.name,
                                         core::Error::Code::ALREADY_EXISTS);
    }
    std::string name = def.name;
    functions_.emplace(std::move(name), std::move(def));
    return core::Result<void>();
}

const FunctionDef* FunctionRegistry::Lookup(const std::string& name) const {
    auto it = functions_.find(name);
    return it == functions_.end() ? nullptr : &it->second;
}

std::vector<std::string> FunctionRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(functions_.size());
    for (const auto& [name, def] : functions_) out.push_back(name);
    return out;
}

namespace {

FunctionDef Aggregate(const std::string& name, const std::string& arrow_function,
                      ArgStyle style = ArgStyle::PLAIN) {
    FunctionDef def;
    def.name = name;
    def.kind = FunctionKind::AGGREGATE;
    def.arrow_function = arrow_function;
    def.arg_style = style;
    def.min_args = 1;
    def.max_args = style == ArgStyle::QUANTILE ? 2 : 1;
    if (style == ArgStyle::QUANTILE) def.min_args = 2;
    return def;
}

FunctionDef Scalar(const std::string& name, const std::string& arrow_function) {
    FunctionDef def;
    def.name = name;
    def.kind = FunctionKind::SCALAR;
    def.arrow_function = arrow_function;
    return def;
}

FunctionDef Matcher(const std::string& name, const std::string& arrow_function,
                    bool ignore_case, bool invert) {
    FunctionDef def = Scalar(name, arrow_function);
    def.arg_style = ArgStyle::PATTERN;
    def.min_args = 2;
    def.max_args = 2;
    def.ignore_case = ignore_case;
    def.invert = invert;
    return def;
}

} // namespace

core::Result<void> RegisterDefaultFunctions(FunctionRegistry& registry) {
    std::vector<FunctionDef> defs = {
        Aggregate("min", "min"),
        Aggregate("max", "max"),
        Aggregate("sum", "sum"),
        Aggregate("count", "count"),
        Aggregate("avg", "mean"),
        Aggregate("approx_distinct", "count_distinct"),
        Aggregate("approx_percentile_cont", "tdigest", ArgStyle::QUANTILE),
        Scalar("lower", "utf8_lower"),
        Scalar("upper", "utf8_upper"),
        Scalar("length", "utf8_length"),
        Scalar("abs", "abs"),
        Matcher("str_match", "match_substring", false, false),
        Matcher("str_match_ignore_case", "match_substring", true, false),
        Matcher("re_match", "match_substring_regex", false, false),
        Matcher("re_not_match", "match_substring_regex", false, true),
    };
    for (auto& def : defs) {
        auto res = registry.Register(std::move(def));
        if (!res.ok()) return res;
    }
    return core::Result<void>();
}

} // namespace execution
} // namespace qfab
