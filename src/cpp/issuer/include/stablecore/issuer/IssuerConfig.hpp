/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "stablecore/auth/AuthContext.hpp"
#include "stablecore/exchange/CommissionSchedule.hpp"
#include "stablecore/exchange/SpreadPolicy.hpp"
#include "stablecore/market/AssetConfig.hpp"
#include "stablecore/market/MarketConfig.hpp"
#include "stablecore/oracle/OracleAdapter.hpp"

//-------------------------------------------------------------------------

namespace stablecore::issuer
{

//-------------------------------------------------------------------------

struct MarketAssetSpec
{
    AssetId assetId;
    market::AssetConfig config;
};

struct TreasuryAssetSpec
{
    AssetId assetId;
    uint8_t decimals{};
    std::optional<exchange::CommissionRates> rates;
};

struct OracleVenueSpec
{
    std::string name{"oracle"};
    Timestamp latency{};
    DurationSec recencyDurationSec{60};
    std::vector<std::pair<AssetId, oracle::Price>> prices;
};

struct TokenVenueSpec
{
    std::string name;
    AssetId assetId;
    Timestamp latency{};
};

// Opening balance; native and stable live on the host ledger, anything else
// on the token venue carrying the asset.
struct BalanceSpec
{
    AccountId account;
    AssetId assetId;
    Balance amount;
};

//-------------------------------------------------------------------------

struct IssuerConfig
{
    static constexpr Timestamp kDefaultCallTimeout = 30'000;

    std::string name{"core"};
    Timestamp start{};
    // Deadline of an external call, counted from its dispatch.
    Timestamp callTimeout{kDefaultCallTimeout};
    bool debug{};
    AssetId stableAssetId;
    AssetId nativeAssetId;
    auth::RoleRegistry roles;
    oracle::OracleConfig oracle;
    exchange::SpreadConfig spread{exchange::FixedSpreadParams{}};
    market::MarketConfig market;
    exchange::CommissionSchedule commissions;
    std::vector<MarketAssetSpec> marketAssets;
    std::vector<TreasuryAssetSpec> treasuryAssets;
    OracleVenueSpec oracleVenue;
    std::vector<TokenVenueSpec> tokenVenues;
    std::vector<BalanceSpec> balances;

    [[nodiscard]] const TokenVenueSpec* tokenVenueFor(const AssetId& assetId) const noexcept;

    [[nodiscard]] static IssuerConfig fromXML(pugi::xml_node node);
};

//-------------------------------------------------------------------------

}  // namespace stablecore::issuer

//-------------------------------------------------------------------------
