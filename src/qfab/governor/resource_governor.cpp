#include "qfab/governor/resource_governor.h"

#include <algorithm>

#include "qfab/common/logger.h"

namespace qfab {
namespace governor {

WorkGroupLease::~WorkGroupLease() {
    Release();
}

WorkGroupLease::WorkGroupLease(WorkGroupLease&& other) noexcept
    : provider_(std::move(other.provider_)), group_(other.group_) {}

WorkGroupLease& WorkGroupLease::operator=(WorkGroupLease&& other) noexcept {
    if (this != &other) {
        Release();
        provider_ = std::move(other.provider_);
        group_ = other.group_;
    }
    return *this;
}

void WorkGroupLease::Release() {
    if (provider_) {
        provider_->Release(group_);
        provider_.reset();
    }
}

LocalResourceProvider::LocalResourceProvider(const core::SearchGroupConfig& config) : config_(config) {}

core::Result<ResourceShare> LocalResourceProvider::GetDynamicResource(WorkGroup group) const {
    uint32_t cpu = group == WorkGroup::LONG ? config_.long_cpu_percent : config_.short_cpu_percent;
    uint32_t mem = group == WorkGroup::LONG ? config_.long_mem_percent : config_.short_mem_percent;
    if (cpu == 0 || cpu > 100 || mem == 0 || mem > 100) {
        return core::Result<ResourceShare>::error(
            "Workgroup " + WorkGroupToString(group) + " has no valid configured share",
            core::Error::Code::RESOURCE_RESOLUTION_FAILURE);
    }
    size_t running;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running = group == WorkGroup::LONG ? running_long_ : running_short_;
    }
    if (running > 1) {
        cpu = std::max<uint32_t>(1, static_cast<uint32_t>(cpu / running));
        mem = std::max<uint32_t>(1, static_cast<uint32_t>(mem / running));
    }
    return core::Result<ResourceShare>(ResourceShare(cpu, mem));
}

WorkGroupLease LocalResourceProvider::Acquire(WorkGroup group) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        (group == WorkGroup::LONG ? running_long_ : running_short_)++;
    }
    return WorkGroupLease(shared_from_this(), group);
}

size_t LocalResourceProvider::Running(WorkGroup group) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return group == WorkGroup::LONG ? running_long_ : running_short_;
}

void LocalResourceProvider::Release(WorkGroup group) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& counter = group == WorkGroup::LONG ? running_long_ : running_short_;
    if (counter > 0) counter--;
}

core::Result<ResourceGovernor::Limits> NoopResourceGovernor::Govern(const std::optional<std::string>&,
                                                                    size_t partitions, size_t memory) const {
    return core::Result<Limits>(Limits(partitions, memory));
}

WorkGroupResourceGovernor::WorkGroupResourceGovernor(std::shared_ptr<const ResourceProvider> provider,
                                                     bool cpu_limit_enabled)
    : provider_(std::move(provider)), cpu_limit_enabled_(cpu_limit_enabled) {}

core::Result<ResourceGovernor::Limits> WorkGroupResourceGovernor::Govern(
        const std::optional<std::string>& work_group, size_t partitions, size_t memory) const {
    if (!work_group) {
        return core::Result<Limits>(Limits(partitions, memory));
    }
    auto group = ParseWorkGroup(*work_group);
    if (!group) {
        QFAB_DEBUG("[governor] unknown workgroup '{}', limits unchanged", *work_group);
        return core::Result<Limits>(Limits(partitions, memory));
    }
    if (!provider_) {
        return core::Result<Limits>::error("No resource provider installed",
                                           core::Error::Code::RESOURCE_RESOLUTION_FAILURE);
    }
    auto share = provider_->GetDynamicResource(*group);
    if (!share.ok()) {
        QFAB_ERROR("[governor] failed to resolve workgroup {}: {}", *work_group, share.error());
        return core::Result<Limits>::error(share.error(), core::Error::Code::RESOURCE_RESOLUTION_FAILURE);
    }
    Limits out(partitions, memory);
    if (cpu_limit_enabled_) {
        out.partitions = partitions * share.value().cpu_percent / 100;
    }
    out.memory = memory / 100 * share.value().mem_percent + memory % 100 * share.value().mem_percent / 100;
    QFAB_DEBUG("[governor] {} cpu={}% mem={}% -> partitions {} memory {}", *work_group,
               share.value().cpu_percent, share.value().mem_percent, out.partitions, out.memory);
    return core::Result<Limits>(out);
}

namespace {
std::mutex g_governor_mutex;
std::shared_ptr<const ResourceGovernor> g_governor = std::make_shared<NoopResourceGovernor>();
} // namespace

std::shared_ptr<const ResourceGovernor> GetResourceGovernor() {
    std::lock_guard<std::mutex> lock(g_governor_mutex);
    return g_governor;
}

void SetResourceGovernor(std::shared_ptr<const ResourceGovernor> governor) {
    std::lock_guard<std::mutex> lock(g_governor_mutex);
    g_governor = governor ? std::move(governor) : std::make_shared<NoopResourceGovernor>();
}

} // namespace governor
} // namespace qfab
