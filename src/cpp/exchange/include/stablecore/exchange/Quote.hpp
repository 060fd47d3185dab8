/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "stablecore/exchange/ExchangeRate.hpp"

//-------------------------------------------------------------------------

namespace stablecore::exchange
{

//-------------------------------------------------------------------------

enum class QuoteSide : uint8_t
{
    Buy,
    Sell
};

// All deductions are in smallest stable units. For a buy, input is native and
// output stable; for a sell, input is stable and output native.
struct Quote
{
    QuoteSide side{};
    ExchangeRate rate;
    decimal_t spread;
    Balance input;
    Balance gross;
    Balance spreadFee;
    Balance commission;
    Balance netStable;
    Balance output;

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;
};

//-------------------------------------------------------------------------

}  // namespace stablecore::exchange

//-------------------------------------------------------------------------
