/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "stablecore/ledger/InMemoryBalanceLedger.hpp"
#include "test-common/formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace stablecore;
using namespace stablecore::ledger;

using namespace testing;

//-------------------------------------------------------------------------

TEST(InMemoryBalanceLedgerTests, CreditDebitAndSupply)
{
    InMemoryBalanceLedger ledger;
    EXPECT_EQ(ledger.balanceOf("alice", "usn"), Balance{});
    EXPECT_EQ(ledger.totalSupply("usn"), Balance{});

    ledger.credit("alice", "usn", Balance{700});
    ledger.credit("bob", "usn", Balance{300});
    EXPECT_EQ(ledger.totalSupply("usn"), Balance{1'000});

    ledger.debit("alice", "usn", Balance{200});
    EXPECT_EQ(ledger.balanceOf("alice", "usn"), Balance{500});
    EXPECT_EQ(ledger.totalSupply("usn"), Balance{800});

    EXPECT_ERROR_CODE(ledger.debit("bob", "usn", Balance{301}), ErrorCode::InsufficientBalance);
    EXPECT_ERROR_CODE(ledger.debit("carol", "dai", Balance{1}), ErrorCode::InsufficientBalance);
    EXPECT_EQ(ledger.balanceOf("bob", "usn"), Balance{300});
    EXPECT_EQ(ledger.totalSupply("usn"), Balance{800});

    EXPECT_NO_THROW(ledger.debit("carol", "dai", Balance{}));
}

//-------------------------------------------------------------------------

TEST(InMemoryBalanceLedgerTests, TransferKeepsSupply)
{
    InMemoryBalanceLedger ledger;
    ledger.credit("alice", "wrap.near", Balance{50});

    ledger.transfer("alice", "bob", "wrap.near", Balance{50});
    EXPECT_EQ(ledger.balanceOf("alice", "wrap.near"), Balance{});
    EXPECT_EQ(ledger.balanceOf("bob", "wrap.near"), Balance{50});
    EXPECT_EQ(ledger.totalSupply("wrap.near"), Balance{50});

    EXPECT_ERROR_CODE(
        ledger.transfer("alice", "bob", "wrap.near", Balance{1}), ErrorCode::InsufficientBalance);
    EXPECT_EQ(ledger.balanceOf("bob", "wrap.near"), Balance{50});
}

//-------------------------------------------------------------------------

TEST(InMemoryBalanceLedgerTests, JsonSerialize)
{
    InMemoryBalanceLedger ledger;
    ledger.credit("alice", "usn", Balance{12});
    ledger.credit("bob", "usn", Balance{3});
    ledger.debit("bob", "usn", Balance{3});

    rapidjson::Document json;
    ledger.jsonSerialize(json);

    ASSERT_TRUE(json.HasMember("usn"));
    EXPECT_STREQ(json["usn"]["alice"].GetString(), "12");
    EXPECT_FALSE(json["usn"].HasMember("bob"));
}

//-------------------------------------------------------------------------
