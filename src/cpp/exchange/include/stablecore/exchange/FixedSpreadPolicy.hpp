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

class FixedSpreadPolicy : public SpreadPolicy
{
public:
    explicit FixedSpreadPolicy(FixedSpreadParams params);

    [[nodiscard]] virtual decimal_t spread(Timestamp) const override { return m_spread; }
    virtual void recordVolume(const Balance&, Timestamp) override {}
    [[nodiscard]] virtual SpreadConfig config() const override { return m_params; }

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

    [[nodiscard]] static std::unique_ptr<FixedSpreadPolicy> fromXML(pugi::xml_node node);

private:
    FixedSpreadParams m_params;
    decimal_t m_spread;
};

//-------------------------------------------------------------------------

}  // namespace stablecore::exchange

//-------------------------------------------------------------------------
