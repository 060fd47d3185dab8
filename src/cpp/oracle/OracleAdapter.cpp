/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "stablecore/oracle/OracleAdapter.hpp"

#include "stablecore/error/Error.hpp"
#include "xml_util.hpp"

//-------------------------------------------------------------------------

namespace stablecore::oracle
{

//-------------------------------------------------------------------------

OracleConfig OracleConfig::fromXML(pugi::xml_node node, AssetId stableAssetId)
{
    OracleConfig config{
        .maxRecencyDurationSec = xml::getUint<DurationSec>(node, "maxRecencyDurationSec", 90),
        .maxStalenessDurationSec = xml::getUint<DurationSec>(node, "maxStalenessDurationSec", 15),
        .stableAssetId = std::move(stableAssetId)
    };
    if (config.maxStalenessDurationSec == 0) {
        throw Error{
            ErrorCode::InvalidConfiguration,
            fmt::format(
                "{}: 'maxStalenessDurationSec' should be positive",
                std::source_location::current().function_name())};
    }
    return config;
}

//-------------------------------------------------------------------------

Prices OracleAdapter::accept(const PriceData& data, Timestamp now)
{
    validate(data, now);

    std::map<AssetId, Price> prices;
    for (const auto& [assetId, price] : data.prices) {
        if (!price.has_value()) continue;
        if (price->decimals > kMaxPriceDecimals) {
            raise(
                ErrorCode::InvalidConfiguration,
                std::source_location::current(),
                "Price decimals of '{}' should be <= {}, was {}",
                assetId, kMaxPriceDecimals, price->decimals);
        }
        prices.insert_or_assign(assetId, *price);
    }
    prices.insert_or_assign(m_config.stableAssetId, stablePrice());

    for (const auto& [assetId, price] : prices) {
        m_lastQuotes.insert_or_assign(
            assetId,
            PriceQuote{.assetId = assetId, .price = price, .observedAt = data.timestamp});
    }

    return Prices{std::move(prices), data.timestamp};
}

//-------------------------------------------------------------------------

PriceQuote OracleAdapter::quote(const AssetId& assetId, Timestamp now) const
{
    static constexpr auto ctx = std::source_location::current();

    if (assetId == m_config.stableAssetId) {
        return {.assetId = assetId, .price = stablePrice(), .observedAt = now};
    }
    auto it = m_lastQuotes.find(assetId);
    if (it == m_lastQuotes.end()) {
        raise(ErrorCode::UnknownAsset, ctx, "No quote for asset '{}'", assetId);
    }
    const Timestamp age = now > it->second.observedAt ? now - it->second.observedAt : 0;
    if (age > sec2ms(m_config.maxStalenessDurationSec)) {
        raise(
            ErrorCode::StalePrice,
            ctx,
            "Quote for '{}' is {}ms old, window is {}s",
            assetId, age, m_config.maxStalenessDurationSec);
    }
    return it->second;
}

//-------------------------------------------------------------------------

void OracleAdapter::validate(const PriceData& data, Timestamp now) const
{
    static constexpr auto ctx = std::source_location::current();

    if (data.recencyDurationSec > m_config.maxRecencyDurationSec) {
        raise(
            ErrorCode::StalePrice,
            ctx,
            "Recency duration {}s exceeds the maximum of {}s",
            data.recencyDurationSec, m_config.maxRecencyDurationSec);
    }
    if (data.timestamp > now) {
        raise(
            ErrorCode::StalePrice,
            ctx,
            "Price data timestamp {} is in the future (now {})",
            data.timestamp, now);
    }
    if (now - data.timestamp > sec2ms(m_config.maxStalenessDurationSec)) {
        raise(
            ErrorCode::StalePrice,
            ctx,
            "Price data from {} is older than {}s at {}",
            data.timestamp, m_config.maxStalenessDurationSec, now);
    }
}

//-------------------------------------------------------------------------

}  // namespace stablecore::oracle

//-------------------------------------------------------------------------
