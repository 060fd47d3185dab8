/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "stablecore/market/InterestCurve.hpp"

//-------------------------------------------------------------------------

namespace stablecore::market
{

//-------------------------------------------------------------------------

struct AssetConfig
{
    // Token decimals as reported by the token; extraDecimals lift the inner
    // balance to a common precision.
    uint8_t decimals{18};
    uint8_t extraDecimals{};
    // Share of accrued interest kept as reserve, in 1/10000.
    uint32_t reserveRatio{};
    // Collateral factor in 1/10000; never 100% so liquidations are never free.
    uint32_t volatilityRatio{};
    InterestCurve curve;
    bool canDeposit{true};
    bool canWithdraw{true};
    bool canUseAsCollateral{true};
    bool canBorrow{true};

    void validate() const;

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;

    [[nodiscard]] static AssetConfig fromXML(pugi::xml_node node);
};

//-------------------------------------------------------------------------

}  // namespace stablecore::market

//-------------------------------------------------------------------------
