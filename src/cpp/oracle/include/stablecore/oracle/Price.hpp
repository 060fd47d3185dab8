/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "JsonSerializable.hpp"
#include "common.hpp"

//-------------------------------------------------------------------------

namespace stablecore::oracle
{

//-------------------------------------------------------------------------

inline constexpr uint8_t kMaxPriceDecimals = 37;

// Value of one smallest unit is multiplier * 10^-decimals USD.
struct Price
{
    Balance multiplier;
    uint8_t decimals{};

    [[nodiscard]] bool operator==(const Price& other) const noexcept = default;

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;

    [[nodiscard]] static Price fromXML(pugi::xml_node node);
};

// One stable unit with 18 decimals is worth exactly one USD.
[[nodiscard]] inline Price stablePrice()
{
    return {.multiplier = Balance{10'000}, .decimals = 22};
}

//-------------------------------------------------------------------------

struct PriceQuote
{
    AssetId assetId;
    Price price;
    Timestamp observedAt{};
};

//-------------------------------------------------------------------------

struct AssetOptionalPrice
{
    AssetId assetId;
    std::optional<Price> price;
};

// A batch as delivered by the oracle venue.
struct PriceData
{
    Timestamp timestamp{};
    DurationSec recencyDurationSec{};
    std::vector<AssetOptionalPrice> prices;

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;
};

//-------------------------------------------------------------------------

}  // namespace stablecore::oracle

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<stablecore::oracle::Price>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const stablecore::oracle::Price& price, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}e-{}", price.multiplier, price.decimals);
    }
};

//-------------------------------------------------------------------------
