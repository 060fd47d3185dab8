/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "stablecore/market/AccountPosition.hpp"
#include "stablecore/market/Asset.hpp"
#include "stablecore/oracle/Prices.hpp"

//-------------------------------------------------------------------------

namespace stablecore::market
{

//-------------------------------------------------------------------------

struct Health
{
    // Collateral value weighted by each asset's collateral factor.
    decimal_t borrowingPower;
    decimal_t debtValue;

    [[nodiscard]] bool healthy() const noexcept { return debtValue <= borrowingPower; }
};

//-------------------------------------------------------------------------

class HealthEvaluator
{
public:
    using AssetLookup = std::function<const Asset&(const AssetId&)>;

    explicit HealthEvaluator(AssetLookup lookup);

    [[nodiscard]] Health evaluate(
        const AccountPosition& position, const oracle::Prices& prices) const;

    // Collateral at face value, without the collateral factor.
    [[nodiscard]] decimal_t collateralValue(
        const AccountPosition& position, const oracle::Prices& prices) const;

    [[nodiscard]] decimal_t debtValue(
        const AccountPosition& position, const oracle::Prices& prices) const;

    [[nodiscard]] decimal_t value(
        const AssetId& assetId, const Balance& amount, const oracle::Prices& prices) const;

    void requireHealthy(
        const AccountId& accountId,
        const AccountPosition& position,
        const oracle::Prices& prices,
        std::source_location sl = std::source_location::current()) const;

private:
    AssetLookup m_lookup;
};

//-------------------------------------------------------------------------

}  // namespace stablecore::market

//-------------------------------------------------------------------------
