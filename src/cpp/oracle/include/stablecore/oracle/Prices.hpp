/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "stablecore/oracle/Price.hpp"

//-------------------------------------------------------------------------

namespace stablecore::oracle
{

//-------------------------------------------------------------------------

// Immutable snapshot of validated prices shared by one continuation.
class Prices
{
public:
    Prices() noexcept = default;
    Prices(std::map<AssetId, Price> prices, Timestamp timestamp) noexcept
        : m_prices{std::move(prices)}, m_timestamp{timestamp}
    {}

    [[nodiscard]] const Price& at(
        const AssetId& assetId,
        std::source_location sl = std::source_location::current()) const;

    [[nodiscard]] const Price* find(const AssetId& assetId) const noexcept;
    [[nodiscard]] bool contains(const AssetId& assetId) const noexcept;
    [[nodiscard]] size_t size() const noexcept { return m_prices.size(); }
    [[nodiscard]] Timestamp timestamp() const noexcept { return m_timestamp; }

    [[nodiscard]] auto begin() const noexcept { return m_prices.begin(); }
    [[nodiscard]] auto end() const noexcept { return m_prices.end(); }

private:
    std::map<AssetId, Price> m_prices;
    Timestamp m_timestamp{};
};

//-------------------------------------------------------------------------

}  // namespace stablecore::oracle

//-------------------------------------------------------------------------
