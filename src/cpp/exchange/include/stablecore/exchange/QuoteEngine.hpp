/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "stablecore/exchange/CommissionSchedule.hpp"
#include "stablecore/exchange/Quote.hpp"
#include "stablecore/exchange/SpreadPolicy.hpp"

//-------------------------------------------------------------------------

namespace stablecore::exchange
{

//-------------------------------------------------------------------------

class QuoteEngine
{
public:
    QuoteEngine(
        std::unique_ptr<SpreadPolicy> spreadPolicy,
        CommissionSchedule& commissions,
        AssetId nativeAssetId);

    [[nodiscard]] const SpreadPolicy& spreadPolicy() const noexcept { return *m_spreadPolicy; }
    [[nodiscard]] const AssetId& nativeAssetId() const noexcept { return m_nativeAssetId; }

    void setSpreadPolicy(std::unique_ptr<SpreadPolicy> spreadPolicy);

    // Pure pricing at an explicit rate.
    [[nodiscard]] Quote predictBuy(
        const Balance& nativeAmount, const ExchangeRate& rate, Timestamp now) const;
    [[nodiscard]] Quote predictSell(
        const Balance& stableAmount, const ExchangeRate& rate, Timestamp now) const;

    // Pricing against a realised oracle rate, guarded by the caller's expectation.
    [[nodiscard]] Quote quoteBuy(
        const Balance& nativeAmount,
        const ExchangeRate& rate,
        const std::optional<ExpectedRate>& expected,
        Timestamp now) const;
    [[nodiscard]] Quote quoteSell(
        const Balance& stableAmount,
        const ExchangeRate& rate,
        const std::optional<ExpectedRate>& expected,
        Timestamp now) const;

    // Books a completed trade: feeds the spread and collects the commission.
    void settle(const Quote& quote, Timestamp now);

private:
    struct Deductions
    {
        decimal_t spread;
        Balance spreadFee;
        Balance commission;
    };

    [[nodiscard]] Deductions deductions(
        const Balance& stableAmount, CommissionDirection direction, Timestamp now) const;

    std::unique_ptr<SpreadPolicy> m_spreadPolicy;
    CommissionSchedule& m_commissions;
    AssetId m_nativeAssetId;
};

//-------------------------------------------------------------------------

}  // namespace stablecore::exchange

//-------------------------------------------------------------------------
