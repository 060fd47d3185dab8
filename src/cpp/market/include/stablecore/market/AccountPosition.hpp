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

// Shares per asset; an entry that reaches zero is erased.
using ShareMap = std::map<AssetId, Balance>;

struct AccountPosition
{
    ShareMap supplied;
    ShareMap collateral;
    ShareMap borrowed;

    [[nodiscard]] bool empty() const noexcept
    {
        return supplied.empty() && collateral.empty() && borrowed.empty();
    }

    [[nodiscard]] size_t numRiskEntries() const noexcept
    {
        return collateral.size() + borrowed.size();
    }

    [[nodiscard]] bool operator==(const AccountPosition& other) const = default;

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;
};

//-------------------------------------------------------------------------

[[nodiscard]] Balance sharesOf(const ShareMap& shares, const AssetId& assetId);

void addShares(ShareMap& shares, const AssetId& assetId, const Balance& amount);

// Throws InsufficientBalance without touching the map if the entry is short.
void removeShares(
    ShareMap& shares,
    const AssetId& assetId,
    const Balance& amount,
    std::source_location sl = std::source_location::current());

//-------------------------------------------------------------------------

}  // namespace stablecore::market

//-------------------------------------------------------------------------
