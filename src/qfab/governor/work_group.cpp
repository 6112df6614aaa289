#include "qfab/governor/work_group.h"

#include <algorithm>
#include <cctype>

namespace qfab {
namespace governor {

std::optional<WorkGroup> ParseWorkGroup(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "short") return WorkGroup::SHORT;
    if (lower == "long") return WorkGroup::LONG;
    return std::nullopt;
}

std::string WorkGroupToString(WorkGroup group) {
    return group == WorkGroup::LONG ? "long" : "short";
}

} // namespace governor
} // namespace qfab
