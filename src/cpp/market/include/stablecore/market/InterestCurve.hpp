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

// Piecewise linear per-millisecond compounding rate over utilization:
//   1 + base + u * slope1                                 for u < kink
//   1 + base + kink * slope1 + (u - kink) * slope2        otherwise
struct InterestCurve
{
    decimal_t baseRate;
    decimal_t slope1;
    decimal_t slope2;
    uint32_t kink{};

    [[nodiscard]] decimal_t rate(const decimal_t& utilization) const;

    void validate() const;

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;

    [[nodiscard]] static InterestCurve fromXML(pugi::xml_node node);
};

// (rate^msPerYear - 1), the annualised rate.
[[nodiscard]] decimal_t rate2apr(const decimal_t& rate);

//-------------------------------------------------------------------------

}  // namespace stablecore::market

//-------------------------------------------------------------------------
