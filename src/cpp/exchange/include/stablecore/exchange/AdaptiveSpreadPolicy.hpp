/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "stablecore/exchange/SpreadPolicy.hpp"

//-------------------------------------------------------------------------

namespace stablecore::exchange
{

//-------------------------------------------------------------------------

// Spread widening with recently traded notional. The accumulator holds whole
// stable units and shrinks by (1 - scaler) for every full decay period.
class AdaptiveSpreadPolicy : public SpreadPolicy
{
public:
    static constexpr Timestamp kDecayPeriod = 60 * kMillisPerSecond;
    static constexpr uint64_t kResponseUnit = 1'000'000;
    static constexpr uint8_t kStableDecimals = 18;

    AdaptiveSpreadPolicy(AdaptiveSpreadParams params, Timestamp now);

    [[nodiscard]] virtual decimal_t spread(Timestamp now) const override;
    virtual void recordVolume(const Balance& stableAmount, Timestamp now) override;
    [[nodiscard]] virtual SpreadConfig config() const override { return m_params; }

    [[nodiscard]] Balance accumulator(Timestamp now) const;

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

    [[nodiscard]] static std::unique_ptr<AdaptiveSpreadPolicy> fromXML(
        pugi::xml_node node, Timestamp now);

private:
    [[nodiscard]] uint64_t elapsedPeriods(Timestamp now) const noexcept;

    AdaptiveSpreadParams m_params;
    Balance m_accumulator{};
    Timestamp m_anchor;
};

//-------------------------------------------------------------------------

}  // namespace stablecore::exchange

//-------------------------------------------------------------------------
