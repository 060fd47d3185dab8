/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "JsonSerializable.hpp"
#include "common.hpp"

//-------------------------------------------------------------------------

namespace stablecore::exchange
{

//-------------------------------------------------------------------------

struct FixedSpreadParams
{
    uint32_t bps{};
};

struct AdaptiveSpreadParams
{
    decimal_t min;
    decimal_t max;
    decimal_t scaler;
};

using SpreadConfig = std::variant<FixedSpreadParams, AdaptiveSpreadParams>;

//-------------------------------------------------------------------------

class SpreadPolicy : public JsonSerializable
{
public:
    // Spreads live in [0, kMaxSpread).
    static constexpr uint32_t kMaxSpreadBps = 500;

    virtual ~SpreadPolicy() noexcept = default;

    [[nodiscard]] virtual decimal_t spread(Timestamp now) const = 0;
    virtual void recordVolume(const Balance& stableAmount, Timestamp now) = 0;
    [[nodiscard]] virtual SpreadConfig config() const = 0;

protected:
    [[nodiscard]] static decimal_t checkSpread(const decimal_t& spread, std::string_view name);
};

//-------------------------------------------------------------------------

}  // namespace stablecore::exchange

//-------------------------------------------------------------------------
