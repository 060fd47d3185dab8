/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "stablecore/exchange/QuoteEngine.hpp"

#include "stablecore/error/Error.hpp"

//-------------------------------------------------------------------------

namespace stablecore::exchange
{

//-------------------------------------------------------------------------

QuoteEngine::QuoteEngine(
    std::unique_ptr<SpreadPolicy> spreadPolicy,
    CommissionSchedule& commissions,
    AssetId nativeAssetId)
    : m_spreadPolicy{std::move(spreadPolicy)},
      m_commissions{commissions},
      m_nativeAssetId{std::move(nativeAssetId)}
{
    if (!m_spreadPolicy) {
        throw std::invalid_argument{fmt::format(
            "{}: Spread policy cannot be null", std::source_location::current().function_name())};
    }
}

//-------------------------------------------------------------------------

void QuoteEngine::setSpreadPolicy(std::unique_ptr<SpreadPolicy> spreadPolicy)
{
    if (!spreadPolicy) {
        throw std::invalid_argument{fmt::format(
            "{}: Spread policy cannot be null", std::source_location::current().function_name())};
    }
    m_spreadPolicy = std::move(spreadPolicy);
}

//-------------------------------------------------------------------------

Quote QuoteEngine::predictBuy(
    const Balance& nativeAmount, const ExchangeRate& rate, Timestamp now) const
{
    static constexpr auto ctx = std::source_location::current();

    if (nativeAmount.is_zero()) {
        raise(ErrorCode::InvalidArgument, ctx, "Native amount should be positive");
    }

    const Balance gross = rate.nativeToStable(nativeAmount);
    auto [spread, spreadFee, commission] =
        deductions(gross, CommissionDirection::Deposit, now);
    const Balance net = gross - spreadFee - commission;

    if (net.is_zero()) {
        raise(
            ErrorCode::BelowMinimumExchange,
            ctx,
            "{} native at {} yields nothing after spread and commission", nativeAmount, rate.multiplier);
    }

    return {
        .side = QuoteSide::Buy,
        .rate = rate,
        .spread = std::move(spread),
        .input = nativeAmount,
        .gross = gross,
        .spreadFee = std::move(spreadFee),
        .commission = std::move(commission),
        .netStable = net,
        .output = net
    };
}

//-------------------------------------------------------------------------

Quote QuoteEngine::predictSell(
    const Balance& stableAmount, const ExchangeRate& rate, Timestamp now) const
{
    static constexpr auto ctx = std::source_location::current();

    if (stableAmount.is_zero()) {
        raise(ErrorCode::InvalidArgument, ctx, "Stable amount should be positive");
    }

    auto [spread, spreadFee, commission] =
        deductions(stableAmount, CommissionDirection::Withdraw, now);
    const Balance netStable = stableAmount - spreadFee - commission;
    const Balance native = rate.stableToNative(netStable);

    if (native.is_zero()) {
        raise(
            ErrorCode::BelowMinimumExchange,
            ctx,
            "{} stable at {} yields no native after spread and commission",
            stableAmount, rate.multiplier);
    }

    return {
        .side = QuoteSide::Sell,
        .rate = rate,
        .spread = std::move(spread),
        .input = stableAmount,
        .gross = stableAmount,
        .spreadFee = std::move(spreadFee),
        .commission = std::move(commission),
        .netStable = netStable,
        .output = native
    };
}

//-------------------------------------------------------------------------

Quote QuoteEngine::quoteBuy(
    const Balance& nativeAmount,
    const ExchangeRate& rate,
    const std::optional<ExpectedRate>& expected,
    Timestamp now) const
{
    if (expected.has_value()) {
        expected->check(rate);
    }
    return predictBuy(nativeAmount, rate, now);
}

//-------------------------------------------------------------------------

Quote QuoteEngine::quoteSell(
    const Balance& stableAmount,
    const ExchangeRate& rate,
    const std::optional<ExpectedRate>& expected,
    Timestamp now) const
{
    if (expected.has_value()) {
        expected->check(rate);
    }
    return predictSell(stableAmount, rate, now);
}

//-------------------------------------------------------------------------

void QuoteEngine::settle(const Quote& quote, Timestamp now)
{
    m_commissions.accrue(m_nativeAssetId, quote.commission);
    m_spreadPolicy->recordVolume(quote.gross, now);
}

//-------------------------------------------------------------------------

QuoteEngine::Deductions QuoteEngine::deductions(
    const Balance& stableAmount, CommissionDirection direction, Timestamp now) const
{
    decimal_t spread = m_spreadPolicy->spread(now);
    Balance spreadFee = spread.floorMulBalance(stableAmount);
    Balance commission = m_commissions.commissionOn(m_nativeAssetId, stableAmount, direction);
    return {
        .spread = std::move(spread),
        .spreadFee = std::move(spreadFee),
        .commission = std::move(commission)
    };
}

//-------------------------------------------------------------------------

}  // namespace stablecore::exchange

//-------------------------------------------------------------------------
