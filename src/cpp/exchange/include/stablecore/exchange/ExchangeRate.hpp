/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "stablecore/oracle/Price.hpp"

//-------------------------------------------------------------------------

namespace stablecore::exchange
{

//-------------------------------------------------------------------------

inline constexpr uint8_t kStableDecimals = 18;
inline constexpr uint32_t kMillionth = 1'000'000;

// Oracle quote of the native coin: one smallest native unit buys
// multiplier / 10^(decimals - 18) smallest stable units.
struct ExchangeRate
{
    Balance multiplier;
    uint8_t decimals{};

    [[nodiscard]] Balance nativeToStable(const Balance& nativeAmount) const;
    [[nodiscard]] Balance stableToNative(const Balance& stableAmount) const;
    // Stable backed by nativeAmount at a collateral ratio given in percent.
    [[nodiscard]] Balance collateralisedStable(
        const Balance& nativeAmount, uint32_t collateralRatio) const;

    // Stable units per native unit, comparable across differing decimals.
    [[nodiscard]] decimal_t normalised() const;

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;

    [[nodiscard]] static ExchangeRate fromPrice(const oracle::Price& price) noexcept
    {
        return {.multiplier = price.multiplier, .decimals = price.decimals};
    }
};

//-------------------------------------------------------------------------

// Caller-side expectation; slippage is in millionths of the expected rate.
struct ExpectedRate
{
    Balance multiplier;
    uint8_t decimals{};
    uint32_t slippage{};

    void check(const ExchangeRate& realised) const;
};

//-------------------------------------------------------------------------

}  // namespace stablecore::exchange

//-------------------------------------------------------------------------
