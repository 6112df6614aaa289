#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <limits>

#include "qfab/governor/resource_governor.h"
#include "test_util/fixtures.h"

namespace qfab {
namespace governor {
namespace {

using ::testing::Return;

class MockResourceProvider : public ResourceProvider {
public:
    MOCK_METHOD(core::Result<ResourceShare>, GetDynamicResource, (WorkGroup group), (const, override));
};

core::SearchGroupConfig Groups(uint32_t long_cpu, uint32_t long_mem, uint32_t short_cpu, uint32_t short_mem) {
    core::SearchGroupConfig config;
    config.cpu_limit_enabled = true;
    config.long_cpu_percent = long_cpu;
    config.long_mem_percent = long_mem;
    config.short_cpu_percent = short_cpu;
    config.short_mem_percent = short_mem;
    return config;
}

TEST(WorkGroupTest, Parse) {
    EXPECT_EQ(ParseWorkGroup("short"), WorkGroup::SHORT);
    EXPECT_EQ(ParseWorkGroup("LONG"), WorkGroup::LONG);
    EXPECT_FALSE(ParseWorkGroup("batch").has_value());
    EXPECT_FALSE(ParseWorkGroup("").has_value());
    EXPECT_EQ(WorkGroupToString(WorkGroup::LONG), "long");
}

TEST(WorkGroupResourceGovernorTest, ScalesPartitionsAndMemory) {
    auto provider = std::make_shared<MockResourceProvider>();
    EXPECT_CALL(*provider, GetDynamicResource(WorkGroup::SHORT))
        .WillOnce(Return(core::Result<ResourceShare>(ResourceShare(50, 80))));
    WorkGroupResourceGovernor governor(provider, true);

    auto limits = governor.Govern(std::string("short"), 8, 1000);
    ASSERT_TRUE(limits.ok());
    EXPECT_EQ(limits.value().partitions, 4u);
    EXPECT_EQ(limits.value().memory, 800u);
}

TEST(WorkGroupResourceGovernorTest, CpuLimitingOffKeepsPartitions) {
    auto provider = std::make_shared<MockResourceProvider>();
    EXPECT_CALL(*provider, GetDynamicResource(WorkGroup::SHORT))
        .WillOnce(Return(core::Result<ResourceShare>(ResourceShare(50, 80))));
    WorkGroupResourceGovernor governor(provider, false);

    auto limits = governor.Govern(std::string("short"), 8, 1000);
    ASSERT_TRUE(limits.ok());
    EXPECT_EQ(limits.value().partitions, 8u);
    EXPECT_EQ(limits.value().memory, 800u);
}

TEST(WorkGroupResourceGovernorTest, MemoryScalingAvoidsOverflow) {
    auto provider = std::make_shared<MockResourceProvider>();
    EXPECT_CALL(*provider, GetDynamicResource(WorkGroup::LONG))
        .WillOnce(Return(core::Result<ResourceShare>(ResourceShare(100, 30))));
    WorkGroupResourceGovernor governor(provider, true);

    size_t memory = std::numeric_limits<size_t>::max() - 5;
    auto limits = governor.Govern(std::string("long"), 3, memory);
    ASSERT_TRUE(limits.ok());
    EXPECT_EQ(limits.value().memory, memory / 100 * 30 + memory % 100 * 30 / 100);
    EXPECT_EQ(limits.value().partitions, 3u);
}

TEST(WorkGroupResourceGovernorTest, UnknownOrAbsentGroupPassesThrough) {
    auto provider = std::make_shared<MockResourceProvider>();
    EXPECT_CALL(*provider, GetDynamicResource(::testing::_)).Times(0);
    WorkGroupResourceGovernor governor(provider, true);

    auto absent = governor.Govern(std::nullopt, 8, 1000);
    ASSERT_TRUE(absent.ok());
    EXPECT_EQ(absent.value().partitions, 8u);
    EXPECT_EQ(absent.value().memory, 1000u);

    auto unknown = governor.Govern(std::string("batch"), 8, 1000);
    ASSERT_TRUE(unknown.ok());
    EXPECT_EQ(unknown.value().partitions, 8u);
    EXPECT_EQ(unknown.value().memory, 1000u);
}

TEST(WorkGroupResourceGovernorTest, ProviderFailureIsResolutionFailure) {
    auto provider = std::make_shared<MockResourceProvider>();
    EXPECT_CALL(*provider, GetDynamicResource(WorkGroup::LONG))
        .WillOnce(Return(core::Result<ResourceShare>::error("backend down", core::Error::Code::INTERNAL)));
    WorkGroupResourceGovernor governor(provider, true);

    auto limits = governor.Govern(std::string("long"), 8, 1000);
    ASSERT_FALSE(limits.ok());
    EXPECT_EQ(limits.error_code(), core::Error::Code::RESOURCE_RESOLUTION_FAILURE);

    WorkGroupResourceGovernor no_provider(nullptr, true);
    auto missing = no_provider.Govern(std::string("long"), 8, 1000);
    ASSERT_FALSE(missing.ok());
    EXPECT_EQ(missing.error_code(), core::Error::Code::RESOURCE_RESOLUTION_FAILURE);
}

TEST(LocalResourceProviderTest, ShareDividedByRunningRequests) {
    auto provider = std::make_shared<LocalResourceProvider>(Groups(80, 80, 20, 20));
    auto idle = provider->GetDynamicResource(WorkGroup::LONG);
    ASSERT_TRUE(idle.ok());
    EXPECT_EQ(idle.value().cpu_percent, 80u);

    {
        auto first = provider->Acquire(WorkGroup::LONG);
        auto second = provider->Acquire(WorkGroup::LONG);
        EXPECT_EQ(provider->Running(WorkGroup::LONG), 2u);
        EXPECT_EQ(provider->Running(WorkGroup::SHORT), 0u);
        auto busy = provider->GetDynamicResource(WorkGroup::LONG);
        ASSERT_TRUE(busy.ok());
        EXPECT_EQ(busy.value().cpu_percent, 40u);
        EXPECT_EQ(busy.value().mem_percent, 40u);

        auto moved = std::move(first);
        moved.Release();
        EXPECT_EQ(provider->Running(WorkGroup::LONG), 1u);
    }
    EXPECT_EQ(provider->Running(WorkGroup::LONG), 0u);
}

TEST(LocalResourceProviderTest, ShareNeverBelowOne) {
    auto provider = std::make_shared<LocalResourceProvider>(Groups(80, 80, 2, 2));
    std::vector<WorkGroupLease> leases;
    for (int i = 0; i < 5; ++i) leases.push_back(provider->Acquire(WorkGroup::SHORT));
    auto share = provider->GetDynamicResource(WorkGroup::SHORT);
    ASSERT_TRUE(share.ok());
    EXPECT_EQ(share.value().cpu_percent, 1u);
    EXPECT_EQ(share.value().mem_percent, 1u);
}

TEST(LocalResourceProviderTest, UnconfiguredGroupFails) {
    auto provider = std::make_shared<LocalResourceProvider>(Groups(0, 80, 20, 20));
    auto share = provider->GetDynamicResource(WorkGroup::LONG);
    ASSERT_FALSE(share.ok());
    EXPECT_EQ(share.error_code(), core::Error::Code::RESOURCE_RESOLUTION_FAILURE);
}

TEST(ResourceGovernorRegistryTest, NullResetsToNoop) {
    testutil::ConfigGuard guard;
    auto provider = std::make_shared<LocalResourceProvider>(Groups(50, 50, 50, 50));
    SetResourceGovernor(std::make_shared<WorkGroupResourceGovernor>(provider, true));
    auto scaled = GetResourceGovernor()->Govern(std::string("short"), 8, 1000);
    ASSERT_TRUE(scaled.ok());
    EXPECT_EQ(scaled.value().partitions, 4u);

    SetResourceGovernor(nullptr);
    auto passed = GetResourceGovernor()->Govern(std::string("short"), 8, 1000);
    ASSERT_TRUE(passed.ok());
    EXPECT_EQ(passed.value().partitions, 8u);
    EXPECT_EQ(passed.value().memory, 1000u);
}

} // namespace
} // namespace governor
} // namespace qfab
