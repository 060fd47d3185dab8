/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "stablecore/market/HealthEvaluator.hpp"

#include "stablecore/error/Error.hpp"

//-------------------------------------------------------------------------

namespace stablecore::market
{

//-------------------------------------------------------------------------

HealthEvaluator::HealthEvaluator(AssetLookup lookup)
    : m_lookup{std::move(lookup)}
{
    if (!m_lookup) {
        throw std::invalid_argument{fmt::format(
            "{}: Asset lookup cannot be empty", std::source_location::current().function_name())};
    }
}

//-------------------------------------------------------------------------

Health HealthEvaluator::evaluate(
    const AccountPosition& position, const oracle::Prices& prices) const
{
    Health health;
    for (const auto& [assetId, shares] : position.collateral) {
        const Asset& asset = m_lookup(assetId);
        const Balance amount = asset.supplied().sharesToAmount(shares, false);
        health.borrowingPower +=
            value(assetId, amount, prices).mulRatio(asset.config().volatilityRatio);
    }
    health.debtValue = debtValue(position, prices);
    return health;
}

//-------------------------------------------------------------------------

decimal_t HealthEvaluator::collateralValue(
    const AccountPosition& position, const oracle::Prices& prices) const
{
    decimal_t sum;
    for (const auto& [assetId, shares] : position.collateral) {
        const Balance amount = m_lookup(assetId).supplied().sharesToAmount(shares, false);
        sum += value(assetId, amount, prices);
    }
    return sum;
}

//-------------------------------------------------------------------------

decimal_t HealthEvaluator::debtValue(
    const AccountPosition& position, const oracle::Prices& prices) const
{
    decimal_t sum;
    for (const auto& [assetId, shares] : position.borrowed) {
        const Balance amount = m_lookup(assetId).borrowed().sharesToAmount(shares, true);
        sum += value(assetId, amount, prices);
    }
    return sum;
}

//-------------------------------------------------------------------------

decimal_t HealthEvaluator::value(
    const AssetId& assetId, const Balance& amount, const oracle::Prices& prices) const
{
    const oracle::Price& price = prices.at(assetId);
    return decimal_t::fromBalancePrice(
        amount, price.multiplier, price.decimals, m_lookup(assetId).config().extraDecimals);
}

//-------------------------------------------------------------------------

void HealthEvaluator::requireHealthy(
    const AccountId& accountId,
    const AccountPosition& position,
    const oracle::Prices& prices,
    std::source_location sl) const
{
    if (position.borrowed.empty()) return;
    const Health health = evaluate(position, prices);
    if (!health.healthy()) {
        raise(
            ErrorCode::InsufficientCollateral,
            sl,
            "Account '{}' borrowing power {} does not cover debt {}",
            accountId, health.borrowingPower, health.debtValue);
    }
}

//-------------------------------------------------------------------------

}  // namespace stablecore::market

//-------------------------------------------------------------------------
