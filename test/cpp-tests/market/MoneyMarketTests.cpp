/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "stablecore/ledger/InMemoryBalanceLedger.hpp"
#include "stablecore/market/MoneyMarket.hpp"
#include "test-common/formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace stablecore;
using namespace stablecore::market;
using namespace stablecore::literals;

using namespace testing;

//-------------------------------------------------------------------------

namespace
{

const AssetId stable = "usn";
const AssetId tokenA = "token.a";
const AssetId tokenB = "token.b";

Balance units(uint64_t n)
{
    return Balance{n} * 1'000000000000000000_bal;
}

oracle::Price dollars(uint64_t tenThousandths)
{
    return {.multiplier = Balance{tenThousandths}, .decimals = 22};
}

oracle::Prices makePrices(uint64_t priceA = 10'000)
{
    return oracle::Prices{
        std::map<AssetId, oracle::Price>{
            {stable, oracle::stablePrice()},
            {tokenA, dollars(priceA)},
            {tokenB, dollars(10'000)}
        },
        0};
}

const event::IssuerEvent* findEvent(const event::EventRecord& events, event::EventKind kind)
{
    auto it = std::ranges::find_if(
        events, [kind](const event::IssuerEvent& e) { return e.kind == kind; });
    return it != events.end() ? &*it : nullptr;
}

}  // namespace

//-------------------------------------------------------------------------

struct MoneyMarketTest : Test
{
    void SetUp() override
    {
        market.registerAsset(owner, stable, AssetConfig{}, 0);
        market.registerAsset(owner, tokenA, AssetConfig{.volatilityRatio = 6'000}, 0);
        market.registerAsset(owner, tokenB, AssetConfig{.volatilityRatio = 6'000}, 0);
    }

    // Supplier funds token A; the borrower posts all of its token B as
    // collateral and borrows the given amount of A.
    void openBorrow(const Balance& borrowA, const Balance& collateralB = units(1'000))
    {
        market.deposit("supplier", tokenA, units(1'000), 0);
        market.deposit("borrower", tokenB, collateralB, 0);
        market.execute(
            borrower,
            {IncreaseCollateral{{tokenB}}, Borrow{AssetAmount::exact(tokenA, borrowA)}},
            &prices,
            0);
    }

    ledger::InMemoryBalanceLedger ledger;
    MoneyMarket market{stable, MarketConfig{}, ledger};
    const auth::AuthContext owner{.caller = "owner", .roles = {auth::Role::Owner}};
    const auth::AuthContext borrower = auth::AuthContext::anonymous("borrower");
    const auth::AuthContext liquidator = auth::AuthContext::anonymous("liquidator");
    const oracle::Prices prices = makePrices();
};

//-------------------------------------------------------------------------

TEST_F(MoneyMarketTest, Registration)
{
    EXPECT_ERROR_CODE(
        market.registerAsset(borrower, "token.c", AssetConfig{}, 0), ErrorCode::Unauthorized);
    EXPECT_ERROR_CODE(
        market.registerAsset(owner, tokenA, AssetConfig{}, 0), ErrorCode::InvalidConfiguration);
    EXPECT_ERROR_CODE(
        market.registerAsset(owner, "token.c", AssetConfig{.volatilityRatio = kMaxRatio}, 0),
        ErrorCode::InvalidConfiguration);
    EXPECT_FALSE(market.registry().contains("token.c"));
    EXPECT_TRUE(market.registry().at(stable).synthetic());
    EXPECT_THAT(market.registry().ids(), ElementsAre(stable, tokenA, tokenB));
}

//-------------------------------------------------------------------------

TEST_F(MoneyMarketTest, DepositAndWithdraw)
{
    const ExecutionResult deposited = market.deposit("alice", tokenA, units(10), 0);
    EXPECT_EQ(market.suppliedAmount("alice", tokenA), units(10));
    ASSERT_EQ(deposited.events.size(), 1u);
    EXPECT_EQ(deposited.events.back().kind, event::EventKind::Deposit);

    const ExecutionResult withdrawn = market.execute(
        auth::AuthContext::anonymous("alice"),
        {Withdraw{AssetAmount::exact(tokenA, units(4))}},
        nullptr,
        0);
    ASSERT_EQ(withdrawn.transfers.size(), 1u);
    EXPECT_EQ(withdrawn.transfers[0].receiver, "alice");
    EXPECT_EQ(withdrawn.transfers[0].amount, units(4));
    EXPECT_EQ(market.suppliedAmount("alice", tokenA), units(6));

    market.restoreWithdrawal("alice", tokenA, units(4), 0);
    EXPECT_EQ(market.suppliedAmount("alice", tokenA), units(10));

    EXPECT_ERROR_CODE(
        (void)market.deposit("alice", stable, units(1), 0), ErrorCode::InvalidArgument);
    EXPECT_ERROR_CODE(
        (void)market.deposit("alice", "token.z", units(1), 0), ErrorCode::UnknownAsset);

    market.setAssetEnabled(owner, tokenA, false);
    EXPECT_ERROR_CODE(
        (void)market.deposit("alice", tokenA, units(1), 0), ErrorCode::AssetDisabled);
}

//-------------------------------------------------------------------------

TEST_F(MoneyMarketTest, DisabledAssetStillWithdraws)
{
    (void)market.deposit("alice", tokenA, units(10), 0);
    market.setAssetEnabled(owner, tokenA, false);

    EXPECT_ERROR_CODE(
        (void)market.deposit("alice", tokenA, units(1), 0), ErrorCode::AssetDisabled);

    const ExecutionResult withdrawn = market.execute(
        auth::AuthContext::anonymous("alice"),
        {Withdraw{AssetAmount::exact(tokenA, units(10))}},
        nullptr,
        0);
    ASSERT_EQ(withdrawn.transfers.size(), 1u);
    EXPECT_EQ(withdrawn.transfers[0].amount, units(10));
    EXPECT_EQ(market.suppliedAmount("alice", tokenA), Balance{0});
}

//-------------------------------------------------------------------------

TEST_F(MoneyMarketTest, BorrowedFundsLandInSupply)
{
    openBorrow(units(500));

    EXPECT_EQ(market.collateralAmount("borrower", tokenB), units(1'000));
    EXPECT_EQ(market.borrowedAmount("borrower", tokenA), units(500));
    EXPECT_EQ(market.suppliedAmount("borrower", tokenA), units(500));

    const Health health = market.health("borrower", prices);
    EXPECT_EQ(health.borrowingPower, decimal_t{600});
    EXPECT_EQ(health.debtValue, decimal_t{500});
    EXPECT_TRUE(health.healthy());

    EXPECT_THAT(
        market.priceDependencies("borrower", {Withdraw{{tokenA}}}),
        ElementsAre(tokenA, tokenB));
}

//-------------------------------------------------------------------------

TEST_F(MoneyMarketTest, FailedRiskCheckRollsBackEveryAction)
{
    market.deposit("supplier", tokenA, units(1'000), 0);
    market.deposit("borrower", tokenB, units(1'000), 0);
    const AccountPosition before = market.positions().get("borrower");

    EXPECT_ERROR_CODE(
        market.execute(
            borrower,
            {IncreaseCollateral{{tokenB}}, Borrow{AssetAmount::exact(tokenA, units(700))}},
            &prices,
            0),
        ErrorCode::InsufficientCollateral);

    EXPECT_EQ(market.positions().get("borrower"), before);
    EXPECT_EQ(market.collateralAmount("borrower", tokenB), Balance{});
    EXPECT_EQ(market.registry().at(tokenA).borrowed().balance, Balance{});
}

//-------------------------------------------------------------------------

TEST_F(MoneyMarketTest, BorrowNeedsPrices)
{
    market.deposit("borrower", tokenB, units(1'000), 0);
    EXPECT_ERROR_CODE(
        market.execute(borrower, {Borrow{AssetAmount::exact(tokenB, units(1))}}, nullptr, 0),
        ErrorCode::InvalidArgument);
}

//-------------------------------------------------------------------------

TEST_F(MoneyMarketTest, RepayIsCappedAtDebt)
{
    openBorrow(units(100));
    market.deposit("borrower", tokenA, Balance{500}, 0);

    const ExecutionResult result = market.execute(
        borrower, {Repay{AssetAmount::exact(tokenA, units(5'000))}}, nullptr, 0);

    EXPECT_EQ(market.borrowedAmount("borrower", tokenA), Balance{});
    EXPECT_EQ(market.suppliedAmount("borrower", tokenA), Balance{500});
    const event::IssuerEvent* repay = findEvent(result.events, event::EventKind::Repay);
    ASSERT_NE(repay, nullptr);
    EXPECT_EQ(repay->amount, units(100));
}

//-------------------------------------------------------------------------

TEST_F(MoneyMarketTest, RepayIncludesAccruedInterest)
{
    const InterestCurve curve{
        .slope1 = decimal_t::fromString("0.000000000001560000000000004"),
        .slope2 = decimal_t::fromString("0.000000000001560000000000004"),
        .kink = 5'000
    };
    market.registerAsset(owner, "token.c", AssetConfig{.curve = curve}, 0);
    market.deposit("supplier", "token.c", units(1'000), 0);
    market.deposit("borrower", tokenB, units(1'000), 0);
    market.deposit("borrower", "token.c", units(10), 0);
    const oracle::Prices withC{
        std::map<AssetId, oracle::Price>{{tokenB, dollars(10'000)}, {"token.c", dollars(10'000)}},
        0};
    market.execute(
        borrower,
        {IncreaseCollateral{{tokenB}}, Borrow{AssetAmount::exact("token.c", units(100))}},
        &withC,
        0);

    const Timestamp oneDay = 86'400'000;
    const ExecutionResult result = market.execute(
        borrower, {Repay{AssetAmount::exact("token.c", units(5'000))}}, nullptr, oneDay);

    const event::IssuerEvent* repay = findEvent(result.events, event::EventKind::Repay);
    ASSERT_NE(repay, nullptr);
    EXPECT_GT(repay->amount, units(100));
    EXPECT_EQ(market.borrowedAmount("borrower", "token.c"), Balance{});
    EXPECT_GT(market.suppliedAmount("borrower", "token.c"), Balance{});
    EXPECT_LT(market.suppliedAmount("borrower", "token.c"), units(10));
    EXPECT_GT(market.suppliedAmount("supplier", "token.c"), units(1'000));
}

//-------------------------------------------------------------------------

TEST_F(MoneyMarketTest, SharePriceNeverDecreases)
{
    const InterestCurve curve{
        .slope1 = decimal_t::fromString("0.000000000001560000000000004"),
        .slope2 = decimal_t::fromString("0.000000000001560000000000004"),
        .kink = 5'000
    };
    market.registerAsset(owner, "token.c", AssetConfig{.curve = curve}, 0);
    market.deposit("supplier", "token.c", units(1'000), 0);
    market.deposit("borrower", tokenB, units(1'000), 0);
    const oracle::Prices withC{
        std::map<AssetId, oracle::Price>{{tokenB, dollars(10'000)}, {"token.c", dollars(10'000)}},
        0};
    market.execute(
        borrower,
        {IncreaseCollateral{{tokenB}}, Borrow{AssetAmount::exact("token.c", units(300))}},
        &withC,
        0);

    Balance previous = market.suppliedAmount("supplier", "token.c");
    for (Timestamp now : {1'000u, 60'000u, 3'600'000u, 86'400'000u, 2'592'000'000u}) {
        market.deposit("poker", "token.c", units(1), now);
        const Balance current = market.suppliedAmount("supplier", "token.c");
        EXPECT_GE(current, previous) << "at " << now;
        previous = current;
    }
    EXPECT_GT(previous, units(1'000));
}

//-------------------------------------------------------------------------

TEST_F(MoneyMarketTest, BorrowRoundsDebtSharesUp)
{
    const InterestCurve curve{
        .baseRate = decimal_t::fromString("0.000000000010000000000000000"),
        .slope1 = decimal_t::fromString("0.000000000001560000000000004"),
        .slope2 = decimal_t::fromString("0.000000000001560000000000004"),
        .kink = 5'000
    };
    market.registerAsset(owner, "token.c", AssetConfig{.curve = curve}, 0);
    market.deposit("supplier", "token.c", units(1'000), 0);
    market.deposit("borrower", tokenB, units(1'000), 0);
    const oracle::Prices withC{
        std::map<AssetId, oracle::Price>{{tokenB, dollars(10'000)}, {"token.c", dollars(10'000)}},
        0};
    market.execute(
        borrower,
        {IncreaseCollateral{{tokenB}}, Borrow{AssetAmount::exact("token.c", units(100))}},
        &withC,
        0);

    // A year of interest leaves the debt pool at a fractional share price.
    const Timestamp later = 31'536'000'000;
    market.deposit("supplier", "token.c", units(1), later);
    const Pool& debt = market.registry().at("token.c").borrowed();
    ASSERT_GT(debt.balance, debt.shares);

    for (const Balance amount : {Balance{4}, Balance{1'000}, Balance{999'999'999}}) {
        const Balance before = sharesOf(market.positions().get("borrower").borrowed, "token.c");
        market.execute(
            borrower, {Borrow{AssetAmount::exact("token.c", amount)}}, &withC, later);
        const Balance shares =
            sharesOf(market.positions().get("borrower").borrowed, "token.c") - before;
        const Pool& pool = market.registry().at("token.c").borrowed();
        EXPECT_GE(pool.sharesToAmount(shares, false), amount) << "borrowing " << amount;
        EXPECT_GE(pool.sharesToAmount(shares, true), amount) << "borrowing " << amount;
    }
}

//-------------------------------------------------------------------------

TEST_F(MoneyMarketTest, AprFollowsUtilization)
{
    const InterestCurve curve{
        .slope1 = decimal_t::fromString("0.000000000001560000000000004"),
        .slope2 = decimal_t::fromString("0.000000000001560000000000004"),
        .kink = 5'000
    };
    market.registerAsset(owner, "token.c", AssetConfig{.curve = curve}, 0);
    market.deposit("supplier", "token.c", units(1'000), 0);
    market.deposit("borrower", tokenB, units(2'000), 0);
    const oracle::Prices withC{
        std::map<AssetId, oracle::Price>{{tokenB, dollars(10'000)}, {"token.c", dollars(10'000)}},
        0};
    market.execute(
        borrower,
        {IncreaseCollateral{{tokenB}}, Borrow{AssetAmount::exact("token.c", units(1'000))}},
        &withC,
        0);

    const Asset& asset = market.registry().at("token.c");
    EXPECT_EQ(asset.utilization(), decimal_t::fromString("0.5"));
    EXPECT_EQ(asset.borrowApr().toString(), "0.024903108674625580324879543");
    EXPECT_EQ(asset.supplyApr().toString(), "0.0124515543373127901625");

    market.execute(borrower, {Repay{{"token.c"}}}, nullptr, 0);
    EXPECT_EQ(market.registry().at("token.c").borrowApr().toString(), "0.0");
    EXPECT_EQ(market.registry().at("token.c").supplyApr().toString(), "0.0");
}

//-------------------------------------------------------------------------

TEST_F(MoneyMarketTest, StableIsMintedAndBurned)
{
    market.deposit("borrower", tokenB, units(1'000), 0);
    market.execute(
        borrower, {IncreaseCollateral{{tokenB}}, BorrowStable{units(100)}}, &prices, 0);
    EXPECT_EQ(ledger.balanceOf("borrower", stable), units(100));
    EXPECT_EQ(market.borrowedAmount("borrower", stable), units(100));

    market.execute(borrower, {RepayStable{units(40)}}, nullptr, 0);
    EXPECT_EQ(ledger.balanceOf("borrower", stable), units(60));
    EXPECT_EQ(market.borrowedAmount("borrower", stable), units(60));

    EXPECT_ERROR_CODE(
        market.execute(borrower, {BorrowStable{units(600)}}, &prices, 0),
        ErrorCode::InsufficientCollateral);
    EXPECT_EQ(ledger.balanceOf("borrower", stable), units(60));
    EXPECT_EQ(ledger.totalSupply(stable), units(60));

    const ExecutionResult result =
        market.execute(borrower, {RepayStable{units(1'000)}}, nullptr, 0);
    EXPECT_EQ(ledger.balanceOf("borrower", stable), Balance{});
    EXPECT_EQ(market.borrowedAmount("borrower", stable), Balance{});
    const event::IssuerEvent* burn = findEvent(result.events, event::EventKind::Burn);
    ASSERT_NE(burn, nullptr);
    EXPECT_EQ(burn->amount, units(60));
}

//-------------------------------------------------------------------------

TEST_F(MoneyMarketTest, LiquidationSeizesWithinIncentive)
{
    openBorrow(units(500));
    market.deposit("liquidator", tokenA, units(200), 0);
    const oracle::Prices risen = makePrices(15'000);
    EXPECT_FALSE(market.health("borrower", risen).healthy());

    const ExecutionResult result = market.execute(
        liquidator,
        {Liquidate{
            .target = "borrower",
            .inAssets = {AssetAmount::exact(tokenA, units(100))},
            .outAssets = {AssetAmount::exact(tokenB, units(155))}
        }},
        &risen,
        0);

    EXPECT_EQ(market.borrowedAmount("borrower", tokenA), units(400));
    EXPECT_EQ(market.collateralAmount("borrower", tokenB), units(845));
    EXPECT_EQ(market.suppliedAmount("liquidator", tokenB), units(155));
    EXPECT_EQ(market.suppliedAmount("liquidator", tokenA), units(100));

    const event::IssuerEvent* liquidation = findEvent(result.events, event::EventKind::Liquidate);
    ASSERT_NE(liquidation, nullptr);
    EXPECT_EQ(liquidation->counterparty, std::optional<AccountId>{"borrower"});
    EXPECT_EQ(liquidation->debtValue, std::optional{decimal_t{150}});
    EXPECT_EQ(liquidation->collateralValue, std::optional{decimal_t{155}});
}

//-------------------------------------------------------------------------

TEST_F(MoneyMarketTest, LiquidationRejections)
{
    openBorrow(units(500));
    market.deposit("liquidator", tokenA, units(200), 0);
    const oracle::Prices risen = makePrices(15'000);
    const AccountPosition borrowerBefore = market.positions().get("borrower");
    const AccountPosition liquidatorBefore = market.positions().get("liquidator");

    auto liquidate = [&](const auth::AuthContext& auth, const Balance& seize, const oracle::Prices& p) {
        market.execute(
            auth,
            {Liquidate{
                .target = "borrower",
                .inAssets = {AssetAmount::exact(tokenA, units(100))},
                .outAssets = {AssetAmount::exact(tokenB, seize)}
            }},
            &p,
            0);
    };

    EXPECT_ERROR_CODE(liquidate(liquidator, units(200), risen), ErrorCode::InvalidArgument);
    EXPECT_ERROR_CODE(liquidate(borrower, units(155), risen), ErrorCode::InvalidArgument);
    EXPECT_ERROR_CODE(liquidate(liquidator, units(100), prices), ErrorCode::NotLiquidatable);
    EXPECT_ERROR_CODE(
        market.execute(
            liquidator,
            {Liquidate{.target = "borrower", .outAssets = {AssetAmount::exact(tokenB, units(1))}}},
            &risen,
            0),
        ErrorCode::InvalidArgument);

    EXPECT_EQ(market.positions().get("borrower"), borrowerBefore);
    EXPECT_EQ(market.positions().get("liquidator"), liquidatorBefore);
    EXPECT_EQ(market.registry().at(tokenA).borrowed().balance, units(500));
}

//-------------------------------------------------------------------------

TEST_F(MoneyMarketTest, ForceCloseMovesCollateralToReserve)
{
    openBorrow(units(500));
    market.depositToReserve("owner", tokenA, units(500), 0);
    const oracle::Prices crashed = makePrices(30'000);
    const auth::AuthContext keeper{.caller = "keeper", .roles = {auth::Role::Liquidator}};

    EXPECT_ERROR_CODE(
        market.execute(keeper, {ForceClose{"borrower"}}, &crashed, 0), ErrorCode::InvalidArgument);

    market.setConfig(owner, MarketConfig{.forceClosingEnabled = true});
    EXPECT_ERROR_CODE(
        market.execute(liquidator, {ForceClose{"borrower"}}, &crashed, 0),
        ErrorCode::Unauthorized);
    EXPECT_ERROR_CODE(
        market.execute(keeper, {ForceClose{"borrower"}}, &prices, 0),
        ErrorCode::NotLiquidatable);

    const ExecutionResult result = market.execute(keeper, {ForceClose{"borrower"}}, &crashed, 0);

    const AccountPosition position = market.positions().get("borrower");
    EXPECT_TRUE(position.collateral.empty());
    EXPECT_TRUE(position.borrowed.empty());
    EXPECT_EQ(market.registry().at(tokenA).reserved(), Balance{});
    EXPECT_EQ(market.registry().at(tokenB).reserved(), units(1'000));
    EXPECT_EQ(market.registry().at(tokenA).borrowed().balance, Balance{});
    EXPECT_EQ(result.events.back().kind, event::EventKind::ForceClose);
}

//-------------------------------------------------------------------------

TEST(InterestCurveTests, Validation)
{
    const decimal_t small = decimal_t::fromString("0.000000001");

    EXPECT_NO_THROW((InterestCurve{.slope1 = small, .slope2 = small, .kink = 8'000}.validate()));
    EXPECT_ERROR_CODE(
        (InterestCurve{.slope1 = small, .slope2 = decimal_t{}, .kink = 8'000}.validate()),
        ErrorCode::InvalidConfiguration);
    EXPECT_ERROR_CODE(
        (InterestCurve{.kink = kMaxRatio}.validate()), ErrorCode::InvalidConfiguration);
    EXPECT_ERROR_CODE(
        (InterestCurve{.slope2 = decimal_t::one()}.validate()), ErrorCode::InvalidConfiguration);
    EXPECT_ERROR_CODE(
        (InterestCurve{.baseRate = decimal_t::fromString("0.001")}.validate()),
        ErrorCode::InvalidConfiguration);
}

//-------------------------------------------------------------------------

TEST(InterestCurveTests, AcceptedCurveHasRepresentableApr)
{
    struct Case
    {
        const char* baseRate;
        const char* slope2;
        bool accepted;
    };
    const Case cases[] = {
        {"0", "0.000000000030", true},
        {"0", "0.000000001", true},
        {"0.000000001", "0.000000001", true},
        {"0", "0.00000001", false},
        {"0.0000001", "0.0000001", false},
        {"0.001", "0.001", false}
    };

    for (const Case& c : cases) {
        const InterestCurve curve{
            .baseRate = decimal_t::fromString(c.baseRate),
            .slope1 = decimal_t::fromString(c.slope2),
            .slope2 = decimal_t::fromString(c.slope2),
            .kink = 8'000
        };
        if (c.accepted) {
            EXPECT_NO_THROW(curve.validate()) << c.baseRate << " / " << c.slope2;
            EXPECT_NO_THROW((void)rate2apr(curve.rate(decimal_t::one())))
                << c.baseRate << " / " << c.slope2;
        }
        else {
            EXPECT_ERROR_CODE(curve.validate(), ErrorCode::InvalidConfiguration)
                << c.baseRate << " / " << c.slope2;
        }
    }
}

//-------------------------------------------------------------------------

TEST(InterestCurveTests, RateBendsAtKink)
{
    const InterestCurve curve{
        .baseRate = decimal_t::fromString("0.01"),
        .slope1 = decimal_t::fromString("0.1"),
        .slope2 = decimal_t::fromString("0.5"),
        .kink = 8'000
    };

    EXPECT_EQ(curve.rate(decimal_t{}), decimal_t::fromString("1.01"));
    EXPECT_EQ(curve.rate(decimal_t::fromString("0.5")), decimal_t::fromString("1.06"));
    EXPECT_EQ(curve.rate(decimal_t::fromString("0.9")), decimal_t::fromString("1.14"));
    EXPECT_EQ(rate2apr(decimal_t::one()), decimal_t::zero());
}

//-------------------------------------------------------------------------

TEST(AssetConfigTests, FromXML)
{
    pugi::xml_document doc;
    ASSERT_TRUE(doc.load_string(R"(
        <Asset id="usdc" decimals="6" extraDecimals="12" reserveRatio="2500"
            volatilityRatio="9500" slope1="0.000000000001" slope2="0.00000000001"
            kink="8000" canBorrow="false"/>)"));

    const AssetConfig config = AssetConfig::fromXML(doc.child("Asset"));
    EXPECT_EQ(config.decimals, 6);
    EXPECT_EQ(config.extraDecimals, 12);
    EXPECT_EQ(config.reserveRatio, 2'500);
    EXPECT_EQ(config.volatilityRatio, 9'500);
    EXPECT_EQ(config.curve.kink, 8'000);
    EXPECT_TRUE(config.canDeposit);
    EXPECT_FALSE(config.canBorrow);

    ASSERT_TRUE(doc.load_string(R"(<Asset id="usdc" decimals="0"/>)"));
    EXPECT_ERROR_CODE(
        (void)AssetConfig::fromXML(doc.child("Asset")), ErrorCode::InvalidConfiguration);
}

//-------------------------------------------------------------------------
