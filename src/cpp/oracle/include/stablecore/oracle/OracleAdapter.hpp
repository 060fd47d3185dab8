/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "stablecore/oracle/Prices.hpp"

//-------------------------------------------------------------------------

namespace stablecore::oracle
{

//-------------------------------------------------------------------------

struct OracleConfig
{
    DurationSec maxRecencyDurationSec{90};
    DurationSec maxStalenessDurationSec{15};
    AssetId stableAssetId;

    [[nodiscard]] static OracleConfig fromXML(pugi::xml_node node, AssetId stableAssetId);
};

//-------------------------------------------------------------------------

class OracleAdapter
{
public:
    explicit OracleAdapter(OracleConfig config) noexcept : m_config{std::move(config)} {}

    [[nodiscard]] const OracleConfig& config() const noexcept { return m_config; }

    // Turns a delivered batch into a snapshot; throws StalePrice before
    // anything from the batch is used or remembered.
    [[nodiscard]] Prices accept(const PriceData& data, Timestamp now);

    // Freshest remembered quote for a single asset.
    [[nodiscard]] PriceQuote quote(const AssetId& assetId, Timestamp now) const;

    [[nodiscard]] const std::map<AssetId, PriceQuote>& lastQuotes() const noexcept
    {
        return m_lastQuotes;
    }

private:
    void validate(const PriceData& data, Timestamp now) const;

    OracleConfig m_config;
    std::map<AssetId, PriceQuote> m_lastQuotes;
};

//-------------------------------------------------------------------------

}  // namespace stablecore::oracle

//-------------------------------------------------------------------------
