#ifndef QFAB_GOVERNOR_RESOURCE_GOVERNOR_H_
#define QFAB_GOVERNOR_RESOURCE_GOVERNOR_H_

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <absl/container/flat_hash_map.h>

#include "qfab/core/config.h"
#include "qfab/core/result.h"
#include "qfab/governor/work_group.h"

namespace qfab {
namespace governor {

/**
 * @brief Source of live workgroup shares
 */
class ResourceProvider {
public:
    virtual ~ResourceProvider() = default;
    virtual core::Result<ResourceShare> GetDynamicResource(WorkGroup group) const = 0;
};

class LocalResourceProvider;

/**
 * @brief Marks one running request of a workgroup while alive
 */
class WorkGroupLease {
public:
    WorkGroupLease() = default;
    ~WorkGroupLease();

    WorkGroupLease(WorkGroupLease&& other) noexcept;
    WorkGroupLease& operator=(WorkGroupLease&& other) noexcept;
    WorkGroupLease(const WorkGroupLease&) = delete;
    WorkGroupLease& operator=(const WorkGroupLease&) = delete;

    void Release();

private:
    friend class LocalResourceProvider;
    WorkGroupLease(std::shared_ptr<LocalResourceProvider> provider, WorkGroup group)
        : provider_(std::move(provider)), group_(group) {}

    std::shared_ptr<LocalResourceProvider> provider_;
    WorkGroup group_ = WorkGroup::SHORT;
};

/**
 * @brief Provider backed by the search_group configuration
 *
 * The dynamic share of a group is its configured share divided by the number
 * of its running requests, never below 1. Lookups do not change state.
 */
class LocalResourceProvider : public ResourceProvider,
                              public std::enable_shared_from_this<LocalResourceProvider> {
public:
    explicit LocalResourceProvider(const core::SearchGroupConfig& config);

    core::Result<ResourceShare> GetDynamicResource(WorkGroup group) const override;

    WorkGroupLease Acquire(WorkGroup group);
    size_t Running(WorkGroup group) const;

private:
    friend class WorkGroupLease;
    void Release(WorkGroup group);

    core::SearchGroupConfig config_;
    mutable std::mutex mutex_;
    size_t running_short_ = 0;
    size_t running_long_ = 0;
};

/**
 * @brief Scales (partitions, memory) for a request
 */
class ResourceGovernor {
public:
    struct Limits {
        size_t partitions = 0;
        size_t memory = 0;

        Limits() = default;
        Limits(size_t p, size_t m) : partitions(p), memory(m) {}
    };

    virtual ~ResourceGovernor() = default;

    virtual core::Result<Limits> Govern(const std::optional<std::string>& work_group,
                                        size_t partitions, size_t memory) const = 0;
};

class NoopResourceGovernor : public ResourceGovernor {
public:
    core::Result<Limits> Govern(const std::optional<std::string>& work_group,
                                size_t partitions, size_t memory) const override;
};

/**
 * @brief Scales by the provider's live share of a known workgroup
 *
 * Unknown or absent workgroup names pass values through. Memory is always
 * scaled, partitions only when cpu limiting is enabled.
 */
class WorkGroupResourceGovernor : public ResourceGovernor {
public:
    WorkGroupResourceGovernor(std::shared_ptr<const ResourceProvider> provider, bool cpu_limit_enabled);

    core::Result<Limits> Govern(const std::optional<std::string>& work_group,
                                size_t partitions, size_t memory) const override;

private:
    std::shared_ptr<const ResourceProvider> provider_;
    bool cpu_limit_enabled_;
};

// Process-wide governor, the no-op one until replaced
std::shared_ptr<const ResourceGovernor> GetResourceGovernor();
void SetResourceGovernor(std::shared_ptr<const ResourceGovernor> governor);

} // namespace governor
} // namespace qfab

#endif // QFAB_GOVERNOR_RESOURCE_GOVERNOR_H_
