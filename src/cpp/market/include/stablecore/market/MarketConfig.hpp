/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "JsonSerializable.hpp"
#include "common.hpp"

//-------------------------------------------------------------------------

namespace stablecore::market
{

//-------------------------------------------------------------------------

struct MarketConfig
{
    // Bound on collateral plus borrowed entries of a single account.
    uint32_t maxNumAssets{20};
    bool forceClosingEnabled{};
    // Excess of seized value over repaid value a liquidator may take, in 1/10000.
    uint32_t liquidationIncentive{500};

    void validate() const;

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;

    [[nodiscard]] static MarketConfig fromXML(pugi::xml_node node);
};

//-------------------------------------------------------------------------

}  // namespace stablecore::market

//-------------------------------------------------------------------------
