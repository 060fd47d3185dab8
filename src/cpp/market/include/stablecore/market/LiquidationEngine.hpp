/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "stablecore/market/HealthEvaluator.hpp"
#include "stablecore/market/MarketTransaction.hpp"

//-------------------------------------------------------------------------

namespace stablecore::market
{

//-------------------------------------------------------------------------

struct LiquidationResult
{
    decimal_t repaidValue;
    decimal_t seizedValue;
};

//-------------------------------------------------------------------------

class LiquidationEngine
{
public:
    explicit LiquidationEngine(uint32_t incentive);

    [[nodiscard]] uint32_t incentive() const noexcept { return m_incentive; }
    void setIncentive(uint32_t incentive);

    // Repays inAssets of the target out of the liquidator's supplied balance
    // (or by burning the liquidator's stable) and hands the outAssets
    // collateral of the target to the liquidator's supplied balance.
    LiquidationResult liquidate(
        MarketTransaction& tx,
        const HealthEvaluator& health,
        const oracle::Prices& prices,
        const AccountId& liquidatorId,
        const Liquidate& action) const;

    // Moves all collateral of an insolvent account to the reserves and
    // writes its debt off against them.
    LiquidationResult forceClose(
        MarketTransaction& tx,
        const HealthEvaluator& health,
        const oracle::Prices& prices,
        const AccountId& targetId) const;

private:
    uint32_t m_incentive;
};

//-------------------------------------------------------------------------

}  // namespace stablecore::market

//-------------------------------------------------------------------------
