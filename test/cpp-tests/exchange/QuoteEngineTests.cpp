/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "stablecore/exchange/AdaptiveSpreadPolicy.hpp"
#include "stablecore/exchange/FixedSpreadPolicy.hpp"
#include "stablecore/exchange/QuoteEngine.hpp"
#include "stablecore/exchange/SpreadPolicyFactory.hpp"
#include "test-common/formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace stablecore;
using namespace stablecore::exchange;
using namespace stablecore::literals;

using namespace testing;

//-------------------------------------------------------------------------

namespace
{

const AssetId native = "wrap.near";

// One smallest native unit for one smallest stable unit.
const ExchangeRate parity{.multiplier = Balance{1}, .decimals = 18};

const ExchangeRate nearRate{.multiplier = Balance{111'439}, .decimals = 28};

// Two smallest stable units per smallest native unit.
const ExchangeRate coarseRate{.multiplier = Balance{2}, .decimals = 18};

}  // namespace

//-------------------------------------------------------------------------

struct QuoteEngineTest : Test
{
    void SetUp() override
    {
        commissions.addAsset(native);
        engine = std::make_unique<QuoteEngine>(
            std::make_unique<FixedSpreadPolicy>(FixedSpreadParams{.bps = 10}), commissions, native);
    }

    CommissionSchedule commissions;
    std::unique_ptr<QuoteEngine> engine;
};

//-------------------------------------------------------------------------

TEST_F(QuoteEngineTest, BuyDeductsSpreadAndDepositCommission)
{
    const Balance notional = 1'000000'000000000000000000_bal;

    const Quote quote = engine->predictBuy(notional, parity, 0);

    EXPECT_EQ(quote.side, QuoteSide::Buy);
    EXPECT_EQ(quote.spread, decimal_t::fromString("0.001"));
    EXPECT_EQ(quote.gross, notional);
    EXPECT_EQ(quote.spreadFee, 1000'000000000000000000_bal);
    EXPECT_EQ(quote.commission, 100'000000000000000000_bal);
    EXPECT_EQ(quote.output, 998900'000000000000000000_bal);
    EXPECT_EQ(quote.netStable, quote.output);
}

//-------------------------------------------------------------------------

TEST_F(QuoteEngineTest, RoundTripLosesTwoSpreadsAndBothCommissions)
{
    const Balance notional = 1'000000'000000000000000000_bal;

    const Quote buy = engine->predictBuy(notional, parity, 0);
    const Quote sell = engine->predictSell(notional, parity, 0);

    const decimal_t lossRate = decimal_t::fromRatio(10) + decimal_t::fromRatio(10)
        + decimal_t::fromMillionths(commissions.rates(native).deposit)
        + decimal_t::fromMillionths(commissions.rates(native).withdraw);
    const Balance loss = (notional - buy.output) + (notional - sell.output);

    EXPECT_EQ(loss, lossRate.floorMulBalance(notional));
    EXPECT_EQ(loss, 2200'000000000000000000_bal);
}

//-------------------------------------------------------------------------

TEST_F(QuoteEngineTest, SellConvertsNetStableToNative)
{
    const Quote quote = engine->predictSell(11'143900000000000000_bal, nearRate, 0);

    EXPECT_EQ(quote.side, QuoteSide::Sell);
    EXPECT_EQ(quote.spreadFee, 11143900000000000_bal);
    EXPECT_EQ(quote.commission, 1114390000000000_bal);
    EXPECT_EQ(quote.netStable, 11'131641710000000000_bal);
    EXPECT_EQ(quote.output, nearRate.stableToNative(quote.netStable));
    EXPECT_EQ(quote.output, 998'900000000000000000000_bal);
}

//-------------------------------------------------------------------------

TEST_F(QuoteEngineTest, DustIsBelowMinimumExchange)
{
    EXPECT_ERROR_CODE(
        (void)engine->predictBuy(Balance{1}, nearRate, 0), ErrorCode::BelowMinimumExchange);
    EXPECT_ERROR_CODE(
        (void)engine->predictSell(Balance{1}, coarseRate, 0), ErrorCode::BelowMinimumExchange);
    EXPECT_ERROR_CODE(
        (void)engine->predictBuy(Balance{}, parity, 0), ErrorCode::InvalidArgument);
}

//-------------------------------------------------------------------------

TEST_F(QuoteEngineTest, SettleCollectsCommission)
{
    const Quote quote = engine->predictBuy(1'000000000000000000_bal, parity, 0);
    engine->settle(quote, 0);
    engine->settle(quote, 0);

    EXPECT_EQ(commissions.collected(native), Balance{2 * quote.commission});
}

//-------------------------------------------------------------------------

struct SlippageTestParams
{
    ExpectedRate expected;
    bool accepted;
};

void PrintTo(const SlippageTestParams& params, std::ostream* os)
{
    *os << fmt::format(
        "{{.expected = {}e-{} +/- {}, .accepted = {}}}",
        params.expected.multiplier,
        params.expected.decimals,
        params.expected.slippage,
        params.accepted);
}

struct SlippageTest : TestWithParam<SlippageTestParams> {};

TEST_P(SlippageTest, GuardsRealisedRate)
{
    const auto& [expected, accepted] = GetParam();
    CommissionSchedule commissions;
    commissions.addAsset(native);
    const QuoteEngine engine{
        std::make_unique<FixedSpreadPolicy>(FixedSpreadParams{}), commissions, native};

    const auto code = STABLECORE_ERROR_CODE(
        (void)engine.quoteBuy(1'000000000000000000000000_bal, nearRate, expected, 0));
    if (accepted) {
        EXPECT_EQ(code, std::nullopt);
    } else {
        EXPECT_EQ(code, std::optional{ErrorCode::SlippageExceeded});
    }
}

INSTANTIATE_TEST_SUITE_P(
    QuoteEngineTests,
    SlippageTest,
    Values(
        SlippageTestParams{
            .expected = {.multiplier = Balance{111'439}, .decimals = 28, .slippage = 0},
            .accepted = true
        },
        SlippageTestParams{
            .expected = {.multiplier = Balance{1'114'390}, .decimals = 29, .slippage = 0},
            .accepted = true
        },
        SlippageTestParams{
            .expected = {.multiplier = Balance{111'500}, .decimals = 28, .slippage = 1'000},
            .accepted = true
        },
        SlippageTestParams{
            .expected = {.multiplier = Balance{111'600}, .decimals = 28, .slippage = 1'000},
            .accepted = false
        },
        SlippageTestParams{
            .expected = {.multiplier = Balance{111'440}, .decimals = 28, .slippage = 0},
            .accepted = false
        }));

//-------------------------------------------------------------------------

struct CollateralisedStableTestParams
{
    uint32_t collateralRatio;
    Balance refAmount;
};

void PrintTo(const CollateralisedStableTestParams& params, std::ostream* os)
{
    *os << fmt::format(
        "{{.collateralRatio = {}, .refAmount = {}}}", params.collateralRatio, params.refAmount);
}

struct CollateralisedStableTest : TestWithParam<CollateralisedStableTestParams> {};

TEST_P(CollateralisedStableTest, WorksCorrectly)
{
    const auto& [collateralRatio, refAmount] = GetParam();
    const Balance tenNear = 10'000000000000000000000000_bal;
    EXPECT_EQ(nearRate.collateralisedStable(tenNear, collateralRatio), refAmount);
}

INSTANTIATE_TEST_SUITE_P(
    ExchangeRateTests,
    CollateralisedStableTest,
    Values(
        CollateralisedStableTestParams{
            .collateralRatio = 100, .refAmount = 111439000000000000000_bal
        },
        CollateralisedStableTestParams{
            .collateralRatio = 210, .refAmount = 53066190476190476190_bal
        },
        CollateralisedStableTestParams{
            .collateralRatio = 1000, .refAmount = 11143900000000000000_bal
        }));

//-------------------------------------------------------------------------

TEST(ExchangeRateTests, Conversions)
{
    const Balance oneNear = 1'000000000000000000000000_bal;
    EXPECT_EQ(nearRate.nativeToStable(oneNear), 11'143900000000000000_bal);
    EXPECT_EQ(nearRate.stableToNative(11'143900000000000000_bal), oneNear);
    EXPECT_EQ(nearRate.normalised(), decimal_t::fromString("0.0000111439"));
    EXPECT_ERROR_CODE(
        (void)nearRate.collateralisedStable(oneNear, 0), ErrorCode::InvalidArgument);
    EXPECT_ERROR_CODE(
        (void)ExchangeRate{}.stableToNative(Balance{1}), ErrorCode::InvalidArgument);
}

//-------------------------------------------------------------------------

TEST(AdaptiveSpreadPolicyTests, WidensWithVolumeAndDecays)
{
    AdaptiveSpreadPolicy policy{
        AdaptiveSpreadParams{
            .min = decimal_t::fromString("0.001"),
            .max = decimal_t::fromString("0.01"),
            .scaler = decimal_t::fromString("0.002")
        },
        0};

    EXPECT_EQ(policy.spread(0), decimal_t::fromString("0.001"));

    policy.recordVolume(1'000000'000000000000000000_bal, 0);
    EXPECT_EQ(policy.accumulator(0), Balance{1'000'000});
    EXPECT_EQ(policy.spread(0), decimal_t::fromString("0.003"));

    const Timestamp oneDecay = AdaptiveSpreadPolicy::kDecayPeriod;
    EXPECT_EQ(policy.spread(oneDecay - 1), decimal_t::fromString("0.003"));
    EXPECT_EQ(policy.accumulator(oneDecay), Balance{998'000});
    EXPECT_EQ(policy.spread(oneDecay), decimal_t::fromString("0.002996"));

    policy.recordVolume(100'000000'000000000000000000_bal, oneDecay);
    EXPECT_EQ(policy.spread(oneDecay), decimal_t::fromString("0.01"));
}

//-------------------------------------------------------------------------

TEST(SpreadPolicyTests, Validation)
{
    EXPECT_ERROR_CODE(
        FixedSpreadPolicy(FixedSpreadParams{.bps = SpreadPolicy::kMaxSpreadBps}),
        ErrorCode::InvalidConfiguration);
    EXPECT_NO_THROW(
        FixedSpreadPolicy(FixedSpreadParams{.bps = SpreadPolicy::kMaxSpreadBps - 1}));

    auto adaptive = [](std::string_view min, std::string_view max, std::string_view scaler) {
        return AdaptiveSpreadPolicy{
            AdaptiveSpreadParams{
                .min = decimal_t::fromString(min),
                .max = decimal_t::fromString(max),
                .scaler = decimal_t::fromString(scaler)
            },
            0};
    };
    EXPECT_ERROR_CODE(adaptive("0.01", "0.001", "0.1"), ErrorCode::InvalidConfiguration);
    EXPECT_ERROR_CODE(adaptive("0.001", "0.06", "0.1"), ErrorCode::InvalidConfiguration);
    EXPECT_ERROR_CODE(adaptive("0.001", "0.01", "0"), ErrorCode::InvalidConfiguration);
    EXPECT_ERROR_CODE(adaptive("0.001", "0.01", "0.41"), ErrorCode::InvalidConfiguration);
}

//-------------------------------------------------------------------------

TEST(SpreadPolicyFactoryTests, CreateFromXML)
{
    pugi::xml_document doc;
    ASSERT_TRUE(doc.load_string(R"(
        <Policies>
            <Spread type="fixed" bps="25"/>
            <Spread type="adaptive" min="0.001" max="0.02" scaler="0.0001"/>
            <Spread type="dynamic"/>
        </Policies>)"));

    auto spreads = doc.child("Policies").children("Spread");
    auto it = spreads.begin();

    const auto fixed = SpreadPolicyFactory::createFromXML(*it++, 0);
    EXPECT_EQ(fixed->spread(0), decimal_t::fromString("0.0025"));
    EXPECT_TRUE(std::holds_alternative<FixedSpreadParams>(fixed->config()));

    const auto adaptive = SpreadPolicyFactory::createFromXML(*it++, 0);
    EXPECT_EQ(adaptive->spread(0), decimal_t::fromString("0.001"));
    EXPECT_TRUE(std::holds_alternative<AdaptiveSpreadParams>(adaptive->config()));

    EXPECT_ERROR_CODE(
        (void)SpreadPolicyFactory::createFromXML(*it, 0), ErrorCode::InvalidConfiguration);
}

//-------------------------------------------------------------------------
