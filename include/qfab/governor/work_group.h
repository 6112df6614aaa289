#ifndef QFAB_GOVERNOR_WORK_GROUP_H_
#define QFAB_GOVERNOR_WORK_GROUP_H_

#include <cstdint>
#include <optional>
#include <string>

namespace qfab {
namespace governor {

/**
 * @brief Named tenant class sharing the query cluster
 */
enum class WorkGroup {
    SHORT,
    LONG
};

// "short" / "long", case-insensitive. Anything else is not a workgroup.
std::optional<WorkGroup> ParseWorkGroup(const std::string& name);
std::string WorkGroupToString(WorkGroup group);

/**
 * @brief Live (cpu_percent, mem_percent) share of a workgroup, each in (0, 100]
 */
struct ResourceShare {
    uint32_t cpu_percent = 100;
    uint32_t mem_percent = 100;

    ResourceShare() = default;
    ResourceShare(uint32_t cpu, uint32_t mem) : cpu_percent(cpu), mem_percent(mem) {}
};

} // namespace governor
} // namespace qfab

#endif // QFAB_GOVERNOR_WORK_GROUP_H_
