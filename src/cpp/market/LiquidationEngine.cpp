/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "stablecore/market/LiquidationEngine.hpp"

#include "stablecore/error/Error.hpp"

//-------------------------------------------------------------------------

namespace stablecore::market
{

//-------------------------------------------------------------------------

LiquidationEngine::LiquidationEngine(uint32_t incentive)
{
    setIncentive(incentive);
}

//-------------------------------------------------------------------------

void LiquidationEngine::setIncentive(uint32_t incentive)
{
    if (incentive >= kMaxRatio) {
        raise(
            ErrorCode::InvalidConfiguration,
            std::source_location::current(),
            "Liquidation incentive should be less than {}, was {}",
            kMaxRatio, incentive);
    }
    m_incentive = incentive;
}

//-------------------------------------------------------------------------

LiquidationResult LiquidationEngine::liquidate(
    MarketTransaction& tx,
    const HealthEvaluator& health,
    const oracle::Prices& prices,
    const AccountId& liquidatorId,
    const Liquidate& action) const
{
    static constexpr auto ctx = std::source_location::current();

    if (liquidatorId == action.target) {
        raise(ErrorCode::InvalidArgument, ctx, "Account '{}' cannot liquidate itself", liquidatorId);
    }
    if (action.inAssets.empty() || action.outAssets.empty()) {
        raise(
            ErrorCode::InvalidArgument,
            ctx,
            "Liquidation of '{}' needs both assets to repay and assets to seize",
            action.target);
    }

    const Health before = health.evaluate(tx.account(action.target), prices);
    if (tx.account(action.target).borrowed.empty() || before.healthy()) {
        raise(
            ErrorCode::NotLiquidatable,
            ctx,
            "Account '{}' is not at risk: borrowing power {}, debt {}",
            action.target, before.borrowingPower, before.debtValue);
    }

    LiquidationResult result;

    for (const auto& assetAmount : action.inAssets) {
        Balance repaid;
        if (assetAmount.assetId == tx.stableAssetId()) {
            const Balance requested = assetAmount.amount.value_or(
                assetAmount.maxAmount.value_or(tx.owed(action.target, assetAmount.assetId)));
            repaid = tx.repayStable(liquidatorId, action.target, requested);
        } else {
            repaid = tx.repay(liquidatorId, action.target, assetAmount);
        }
        result.repaidValue += health.value(assetAmount.assetId, repaid, prices);
    }

    for (const auto& assetAmount : action.outAssets) {
        const Balance seized = tx.decreaseCollateral(action.target, liquidatorId, assetAmount);
        result.seizedValue += health.value(assetAmount.assetId, seized, prices);
    }

    const decimal_t bound = result.repaidValue + result.repaidValue.mulRatio(m_incentive);
    if (result.seizedValue > bound) {
        raise(
            ErrorCode::InvalidArgument,
            ctx,
            "Seized collateral {} exceeds repaid debt {} plus incentive",
            result.seizedValue, result.repaidValue);
    }

    // The shortfall (debt less borrowing power) must not grow.
    const Health after = health.evaluate(tx.account(action.target), prices);
    if (after.debtValue + before.borrowingPower > before.debtValue + after.borrowingPower) {
        raise(
            ErrorCode::InvalidArgument,
            ctx,
            "Liquidation would worsen the health of '{}': shortfall {} -> {}",
            action.target,
            before.debtValue - before.borrowingPower,
            after.debtValue > after.borrowingPower
                ? after.debtValue - after.borrowingPower : decimal_t::zero());
    }

    tx.emit({
        .kind = event::EventKind::Liquidate,
        .account = liquidatorId,
        .counterparty = action.target,
        .collateralValue = result.seizedValue,
        .debtValue = result.repaidValue
    });
    return result;
}

//-------------------------------------------------------------------------

LiquidationResult LiquidationEngine::forceClose(
    MarketTransaction& tx,
    const HealthEvaluator& health,
    const oracle::Prices& prices,
    const AccountId& targetId) const
{
    static constexpr auto ctx = std::source_location::current();

    AccountPosition& position = tx.account(targetId);
    const decimal_t collateralSum = health.collateralValue(position, prices);
    const decimal_t debtSum = health.debtValue(position, prices);
    if (position.borrowed.empty() || debtSum <= collateralSum) {
        raise(
            ErrorCode::NotLiquidatable,
            ctx,
            "Total debt {} of '{}' does not exceed its collateral {}",
            debtSum, targetId, collateralSum);
    }

    const ShareMap collateral = std::exchange(position.collateral, {});
    for (const auto& [assetId, shares] : collateral) {
        Asset& asset = tx.asset(assetId);
        const Balance amount = asset.supplied().sharesToAmount(shares, false);
        asset.supplied().withdraw(shares, amount);
        asset.reserved() += amount;
    }

    const ShareMap borrowed = std::exchange(position.borrowed, {});
    for (const auto& [assetId, shares] : borrowed) {
        Asset& asset = tx.asset(assetId);
        const Balance amount = asset.borrowed().sharesToAmount(shares, true);
        if (asset.reserved() < amount) {
            raise(
                ErrorCode::InsufficientBalance,
                ctx,
                "Not enough '{}' in reserve: {} < {}", assetId, asset.reserved(), amount);
        }
        asset.reserved() -= amount;
        asset.borrowed().withdraw(shares, amount);
    }

    tx.emit({
        .kind = event::EventKind::ForceClose,
        .account = targetId,
        .collateralValue = collateralSum,
        .debtValue = debtSum
    });
    return {.repaidValue = debtSum, .seizedValue = collateralSum};
}

//-------------------------------------------------------------------------

}  // namespace stablecore::market

//-------------------------------------------------------------------------
