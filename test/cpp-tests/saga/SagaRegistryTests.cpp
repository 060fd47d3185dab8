/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "stablecore/saga/SagaRegistry.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace stablecore;
using namespace stablecore::saga;

using namespace testing;

//-------------------------------------------------------------------------

namespace
{

PendingAction pendingBuy(uint64_t amount)
{
    return PendingBuy{.caller = "alice", .recipient = "alice", .nativeAmount = Balance{amount}};
}

}  // namespace

//-------------------------------------------------------------------------

TEST(SagaRegistryTests, OpenAssignsIncreasingIds)
{
    SagaRegistry registry;
    EXPECT_TRUE(registry.empty());

    const SagaId first = registry.open(pendingBuy(1), 0, 30'000);
    const SagaId second = registry.open(
        PendingSell{.caller = "bob", .recipient = "carol", .stableAmount = Balance{5}}, 10, 30'010);

    EXPECT_EQ(first, 1u);
    EXPECT_EQ(second, 2u);
    EXPECT_EQ(registry.size(), 2u);

    const PendingRecord* record = registry.find(second);
    ASSERT_NE(record, nullptr);
    EXPECT_EQ(record->startedAt, 10u);
    EXPECT_EQ(record->deadline, 30'010u);
    EXPECT_EQ(pendingActionName(record->action), "Sell");
    EXPECT_EQ(std::get<PendingSell>(record->action).recipient, "carol");
}

//-------------------------------------------------------------------------

TEST(SagaRegistryTests, ResolvesExactlyOnce)
{
    SagaRegistry registry;
    const SagaId id = registry.open(pendingBuy(7), 0, 30'000);
    EXPECT_FALSE(registry.wasResolved(id));

    const auto record = registry.resolve(id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(std::get<PendingBuy>(record->action).nativeAmount, Balance{7});
    EXPECT_TRUE(registry.wasResolved(id));
    EXPECT_EQ(registry.find(id), nullptr);

    EXPECT_EQ(registry.resolve(id), std::nullopt);
    EXPECT_EQ(registry.resolve(42), std::nullopt);
    EXPECT_FALSE(registry.wasResolved(42));
    EXPECT_FALSE(registry.wasResolved(0));
}

//-------------------------------------------------------------------------

TEST(SagaRegistryTests, ExpiredListsRecordsPastDeadline)
{
    SagaRegistry registry;
    const SagaId early = registry.open(pendingBuy(1), 0, 30'000);
    const SagaId late = registry.open(pendingBuy(2), 5'000, 35'000);

    EXPECT_THAT(registry.expired(30'000), IsEmpty());
    EXPECT_THAT(registry.expired(30'001), ElementsAre(early));
    EXPECT_THAT(registry.expired(35'001), ElementsAre(early, late));

    (void)registry.resolve(early);
    EXPECT_THAT(registry.expired(35'001), ElementsAre(late));
}

//-------------------------------------------------------------------------
