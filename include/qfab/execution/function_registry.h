#ifndef QFAB_EXECUTION_FUNCTION_REGISTRY_H_
#define QFAB_EXECUTION_FUNCTION_REGISTRY_H_

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "qfab/core/result.h"

namespace qfab {
namespace execution {

enum class FunctionKind {
    SCALAR,
    AGGREGATE
};

/**
 * @brief How the SQL arguments map onto the Arrow call
 */
enum class ArgStyle {
    PLAIN,      // every argument is an input column
    PATTERN,    // (input, 'literal pattern') -> MatchSubstringOptions
    QUANTILE    // (input, literal quantile) -> TDigestOptions
};

/**
 * @brief A SQL function name bound to an Arrow compute function
 *
 * Aggregates name the ungrouped Arrow function ("sum"); grouped plans use the
 * "hash_" variant.
 */
struct FunctionDef {
    std::string name;
    FunctionKind kind = FunctionKind::SCALAR;
    std::string arrow_function;
    ArgStyle arg_style = ArgStyle::PLAIN;
    size_t min_args = 1;
    size_t max_args = 1;
    bool ignore_case = false;   // PATTERN only
    bool invert = false;        // negate a boolean result
};

/**
 * @brief Functions visible to the planner of one context
 */
class FunctionRegistry {
public:
    // ALREADY_EXISTS when the name is taken
    core::Result<void> Register(FunctionDef def);

    // Case-sensitive. Null when unknown.
    const FunctionDef* Lookup(const std::string& name) const;

    std::vector<std::string> names() const;
    size_t size() const { return functions_.size(); }

private:
    std::map<std::string, FunctionDef> functions_;
};

/**
 * @brief Aggregates min, max, sum, count, avg, approx_distinct and
 * approx_percentile_cont, scalars lower, upper, length, abs, str_match,
 * str_match_ignore_case, re_match and re_not_match
 */
core::Result<void> RegisterDefaultFunctions(FunctionRegistry& registry);

} // namespace execution
} // namespace qfab

#endif // QFAB_EXECUTION_FUNCTION_REGISTRY_H_
