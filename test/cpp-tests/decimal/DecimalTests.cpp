/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "stablecore/decimal/decimal.hpp"
#include "test-common/formatting.hpp"
#include "Timestamp.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace stablecore;
using namespace stablecore::literals;

using namespace testing;

//-------------------------------------------------------------------------

struct ToStringTestParams
{
    std::string literal;
    std::string refString;
};

void PrintTo(const ToStringTestParams& params, std::ostream* os)
{
    *os << fmt::format(
        "{{.literal = {}, .refString = {}}}", params.literal, params.refString);
}

struct ToStringTest : TestWithParam<ToStringTestParams> {};

TEST_P(ToStringTest, WorksCorrectly)
{
    const auto& [literal, refString] = GetParam();
    EXPECT_EQ(decimal_t::fromString(literal).toString(), refString);
}

INSTANTIATE_TEST_SUITE_P(
    DecimalTests,
    ToStringTest,
    Values(
        ToStringTestParams{.literal = "0", .refString = "0.0"},
        ToStringTestParams{.literal = "0.000", .refString = "0.0"},
        ToStringTestParams{.literal = "42", .refString = "42.0"},
        ToStringTestParams{.literal = "1.5000", .refString = "1.5"},
        ToStringTestParams{.literal = "007.25", .refString = "7.25"},
        ToStringTestParams{
            .literal = "0.000000000000000000000000001",
            .refString = "0.000000000000000000000000001"
        },
        ToStringTestParams{
            .literal = "0.024903108674625580324879543",
            .refString = "0.024903108674625580324879543"
        }));

//-------------------------------------------------------------------------

TEST(DecimalTests, FromStringRejectsMalformedInput)
{
    EXPECT_THROW(decimal_t::fromString(""), std::invalid_argument);
    EXPECT_THROW(decimal_t::fromString(".5"), std::invalid_argument);
    EXPECT_THROW(decimal_t::fromString("-1.0"), std::invalid_argument);
    EXPECT_THROW(decimal_t::fromString("1.2.3"), std::invalid_argument);
    EXPECT_THROW(
        decimal_t::fromString("0.0000000000000000000000000001"), std::invalid_argument);
}

//-------------------------------------------------------------------------

TEST(DecimalTests, ArithmeticRoundsHalfUp)
{
    const decimal_t tiny = decimal_t::fromString("0.000000000000000000000000001");
    const decimal_t half = decimal_t::fromString("0.5");

    EXPECT_EQ(tiny * half, tiny);
    EXPECT_EQ(decimal_t::one() / decimal_t{3}, decimal_t::fromString("0.333333333333333333333333333"));
    EXPECT_EQ(decimal_t{2} / decimal_t{3}, decimal_t::fromString("0.666666666666666666666666667"));
    EXPECT_EQ(3_dec + half - decimal_t::one(), decimal_t::fromString("2.5"));
    EXPECT_THROW((void)(decimal_t::one() / decimal_t::zero()), std::domain_error);
}

//-------------------------------------------------------------------------

TEST(DecimalTests, Pow)
{
    EXPECT_EQ(decimal_t{2}.pow(0), decimal_t::one());
    EXPECT_EQ(decimal_t{2}.pow(10), decimal_t{1024});
    EXPECT_EQ(decimal_t::fromString("1.1").pow(2), decimal_t::fromString("1.21"));
    EXPECT_EQ(decimal_t::one().pow(kMillisPerYear), decimal_t::one());
}

//-------------------------------------------------------------------------

TEST(DecimalTests, Ratios)
{
    EXPECT_EQ(decimal_t::fromRatio(2'500), decimal_t::fromString("0.25"));
    EXPECT_EQ(decimal_t::fromMillionths(100), decimal_t::fromString("0.0001"));
    EXPECT_EQ(decimal_t{10}.mulRatio(6'000), decimal_t{6});
    EXPECT_EQ(decimal_t{6}.divRatio(6'000), decimal_t{10});
    EXPECT_EQ(decimal_t{1}.divBalance(Balance{4}), decimal_t::fromString("0.25"));
}

//-------------------------------------------------------------------------

TEST(DecimalTests, BalanceConversions)
{
    const decimal_t rate = decimal_t::fromString("0.0015");

    EXPECT_EQ(rate.floorMulBalance(Balance{1'000}), Balance{1});
    EXPECT_EQ(rate.roundMulBalance(Balance{1'000}), Balance{2});
    EXPECT_EQ(decimal_t::fromString("12.9").toBalance(), Balance{12});
}

//-------------------------------------------------------------------------

TEST(DecimalTests, FromBalancePrice)
{
    // One whole 18-decimal token at one dollar.
    EXPECT_EQ(
        decimal_t::fromBalancePrice(1'000000000000000000_bal, Balance{10'000}, 22),
        decimal_t::one());
    // The same token lifted by 6 extra decimals inside the market.
    EXPECT_EQ(
        decimal_t::fromBalancePrice(
            1'000000000000000000'000000_bal, Balance{10'000}, 22, 6),
        decimal_t::one());
    // Price decimals beyond the fixed point precision truncate.
    EXPECT_EQ(
        decimal_t::fromBalancePrice(Balance{1}, Balance{15}, 28),
        decimal_t::fromString("0.000000000000000000000000001"));
}

//-------------------------------------------------------------------------

TEST(DecimalUtilTests, ParseBalance)
{
    EXPECT_EQ(util::parseBalance("0"), Balance{});
    EXPECT_EQ(util::parseBalance("010"), Balance{10});
    EXPECT_EQ(util::parseBalance("1'000'000"), Balance{1'000'000});
    EXPECT_EQ(
        util::parseBalance("340282366920938463463374607431768211455"),
        std::numeric_limits<Balance>::max());
    EXPECT_THROW(util::parseBalance(""), std::invalid_argument);
    EXPECT_THROW(util::parseBalance("12a"), std::invalid_argument);
    EXPECT_THROW(util::parseBalance("340282366920938463463374607431768211456"), std::overflow_error);
}

//-------------------------------------------------------------------------

TEST(DecimalUtilTests, RatioHelpers)
{
    EXPECT_EQ(util::ratio(Balance{999}, 5'000), Balance{499});
    EXPECT_EQ(util::u128Ratio(Balance{999}, Balance{1}, Balance{2}, true), Balance{500});
    EXPECT_THROW((void)util::ratio(Balance{1}, kMaxRatio + 1), std::invalid_argument);
    EXPECT_EQ(util::convertDecimals(Balance{1'500'000}, 6, 18), 1'500000000000000000_bal);
    EXPECT_EQ(util::convertDecimals(1'500000000000000001_bal, 18, 6), Balance{1'500'000});
}

//-------------------------------------------------------------------------
