/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "stablecore/ledger/InMemoryBalanceLedger.hpp"
#include "stablecore/treasury/StableTreasury.hpp"
#include "test-common/formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace stablecore;
using namespace stablecore::treasury;
using namespace stablecore::literals;

using namespace testing;

//-------------------------------------------------------------------------

struct StableTreasuryTest : Test
{
    void SetUp() override
    {
        treasury.addAsset(owner, "usdt", 6);
    }

    exchange::CommissionSchedule commissions;
    ledger::InMemoryBalanceLedger ledger;
    StableTreasury treasury{"usn", commissions, ledger};
    const auth::AuthContext owner{.caller = "dao", .roles = {auth::Role::Owner}};
    const auth::AuthContext alice = auth::AuthContext::anonymous("alice");
};

//-------------------------------------------------------------------------

TEST_F(StableTreasuryTest, AddAsset)
{
    EXPECT_TRUE(treasury.contains("usdt"));
    EXPECT_TRUE(commissions.contains("usdt"));
    EXPECT_EQ(treasury.asset("usdt").status, TreasuryAssetStatus::Enabled);

    EXPECT_ERROR_CODE(treasury.addAsset(alice, "dai", 18), ErrorCode::Unauthorized);
    EXPECT_ERROR_CODE(treasury.addAsset(owner, "usdt", 6), ErrorCode::InvalidConfiguration);
    EXPECT_ERROR_CODE(treasury.addAsset(owner, "usn", 18), ErrorCode::InvalidConfiguration);
    EXPECT_ERROR_CODE(treasury.addAsset(owner, "dai", 0), ErrorCode::InvalidConfiguration);
    EXPECT_ERROR_CODE(
        treasury.addAsset(owner, "dai", 18, exchange::CommissionRates{.deposit = 60'000}),
        ErrorCode::InvalidConfiguration);
    EXPECT_FALSE(treasury.contains("dai"));

    treasury.addAsset(owner, "dai", 18, exchange::CommissionRates{.deposit = 0, .withdraw = 0});
    EXPECT_EQ(commissions.rates("dai").deposit, 0);
}

//-------------------------------------------------------------------------

TEST_F(StableTreasuryTest, DepositMintsLessCommission)
{
    const Balance minted = treasury.deposit("alice", "usdt", Balance{1'000'000'000});

    EXPECT_EQ(minted, 999'900000000000000000_bal);
    EXPECT_EQ(ledger.balanceOf("alice", "usn"), minted);
    EXPECT_EQ(commissions.collected("usdt"), 100000000000000000_bal);
}

//-------------------------------------------------------------------------

TEST_F(StableTreasuryTest, WithdrawAndRefund)
{
    treasury.deposit("alice", "usdt", Balance{1'000'000'000});

    const WithdrawPlan plan = treasury.withdraw("alice", "usdt", 500'000000000000000000_bal);
    EXPECT_EQ(plan.account, "alice");
    EXPECT_EQ(plan.commission, 50000000000000000_bal);
    EXPECT_EQ(plan.tokenAmount, Balance{499'950'000});
    EXPECT_EQ(ledger.balanceOf("alice", "usn"), 499'900000000000000000_bal);
    EXPECT_EQ(commissions.collected("usdt"), 150000000000000000_bal);

    treasury.refundWithdraw(plan);
    EXPECT_EQ(ledger.balanceOf("alice", "usn"), 999'900000000000000000_bal);
    EXPECT_EQ(commissions.collected("usdt"), 100000000000000000_bal);

    EXPECT_ERROR_CODE(
        (void)treasury.withdraw("alice", "usdt", 1'000'000000000000000000_bal),
        ErrorCode::InsufficientBalance);
    EXPECT_EQ(commissions.collected("usdt"), 100000000000000000_bal);
    EXPECT_ERROR_CODE(
        (void)treasury.withdraw("alice", "usdt", Balance{1}), ErrorCode::BelowMinimumExchange);
}

//-------------------------------------------------------------------------

TEST_F(StableTreasuryTest, DisabledAssetRejectsFlows)
{
    treasury.deposit("alice", "usdt", Balance{1'000'000});
    treasury.disableAsset(owner, "usdt");

    EXPECT_ERROR_CODE(
        (void)treasury.deposit("alice", "usdt", Balance{1'000'000}), ErrorCode::AssetDisabled);
    EXPECT_ERROR_CODE(
        (void)treasury.withdraw("alice", "usdt", 1'000000000000000_bal), ErrorCode::AssetDisabled);
    EXPECT_ERROR_CODE(treasury.disableAsset(owner, "usdt"), ErrorCode::InvalidArgument);
    EXPECT_ERROR_CODE(treasury.enableAsset(alice, "usdt"), ErrorCode::Unauthorized);
    EXPECT_ERROR_CODE(treasury.enableAsset(owner, "dai"), ErrorCode::UnknownAsset);

    treasury.enableAsset(owner, "usdt");
    EXPECT_NO_THROW((void)treasury.deposit("alice", "usdt", Balance{1'000'000}));
}

//-------------------------------------------------------------------------

TEST_F(StableTreasuryTest, DustDepositMintsNothing)
{
    treasury.addAsset(owner, "fine", 24);
    EXPECT_ERROR_CODE(
        (void)treasury.deposit("alice", "fine", Balance{1}), ErrorCode::BelowMinimumExchange);
    EXPECT_ERROR_CODE(
        (void)treasury.deposit("alice", "usdt", Balance{}), ErrorCode::InvalidArgument);
    EXPECT_EQ(ledger.totalSupply("usn"), Balance{});
}

//-------------------------------------------------------------------------

TEST_F(StableTreasuryTest, TransferCommission)
{
    treasury.deposit("alice", "usdt", Balance{1'000'000'000});

    EXPECT_ERROR_CODE(
        treasury.transferCommission(alice, "alice", Balance{1}), ErrorCode::Unauthorized);
    EXPECT_ERROR_CODE(
        treasury.transferCommission(owner, "dao", 100000000000000001_bal),
        ErrorCode::InsufficientBalance);

    treasury.transferCommission(owner, "dao", 100000000000000000_bal);
    EXPECT_EQ(ledger.balanceOf("dao", "usn"), 100000000000000000_bal);
    EXPECT_EQ(commissions.total(), Balance{});
}

//-------------------------------------------------------------------------
