/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "stablecore/issuer/IssuerConfig.hpp"

#include "stablecore/error/Error.hpp"
#include "stablecore/exchange/SpreadPolicyFactory.hpp"
#include "xml_util.hpp"

//-------------------------------------------------------------------------

namespace stablecore::issuer
{

//-------------------------------------------------------------------------

const TokenVenueSpec* IssuerConfig::tokenVenueFor(const AssetId& assetId) const noexcept
{
    auto it = std::ranges::find(tokenVenues, assetId, &TokenVenueSpec::assetId);
    return it != tokenVenues.end() ? &*it : nullptr;
}

//-------------------------------------------------------------------------

IssuerConfig IssuerConfig::fromXML(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (std::string_view{node.name()} != "Issuer") {
        throw Error{
            ErrorCode::InvalidConfiguration,
            fmt::format("{}: expected <Issuer>, got <{}>", ctx, node.name())};
    }

    IssuerConfig config;
    config.name = node.attribute("name").as_string("core");
    config.start = xml::getUint<Timestamp>(node, "start", 0);
    config.callTimeout = xml::getUint(node, "callTimeout", kDefaultCallTimeout);
    if (config.callTimeout == 0) {
        throw Error{
            ErrorCode::InvalidConfiguration,
            fmt::format("{}: attribute 'callTimeout' should be positive", ctx)};
    }
    config.debug = node.attribute("debug").as_bool();
    config.stableAssetId = xml::requireAttribute(node, "stable").as_string();
    config.nativeAssetId = xml::requireAttribute(node, "native").as_string();
    if (config.stableAssetId == config.nativeAssetId) {
        throw Error{
            ErrorCode::InvalidConfiguration,
            fmt::format(
                "{}: stable and native asset ids should differ, both are '{}'",
                ctx, config.stableAssetId)};
    }

    config.roles = auth::RoleRegistry::fromXML(node);

    pugi::xml_node oracleNode = node.child("Oracle");
    config.oracle = oracle::OracleConfig::fromXML(oracleNode, config.stableAssetId);
    config.oracleVenue.name = oracleNode.attribute("venue").as_string("oracle");
    config.oracleVenue.latency = xml::getUint<Timestamp>(oracleNode, "latency", 0);
    config.oracleVenue.recencyDurationSec = xml::getUint<DurationSec>(oracleNode, "recencyDurationSec", 60);
    for (pugi::xml_node priceNode : oracleNode.children("Price")) {
        config.oracleVenue.prices.emplace_back(
            xml::requireAttribute(priceNode, "asset").as_string(),
            oracle::Price::fromXML(priceNode));
    }

    if (pugi::xml_node spreadNode = node.child("Spread")) {
        config.spread =
            exchange::SpreadPolicyFactory::createFromXML(spreadNode, config.start)->config();
    }

    config.market = market::MarketConfig::fromXML(node.child("Market"));
    config.commissions = exchange::CommissionSchedule::fromXML(node.child("Commission"));
    if (!config.commissions.contains(config.nativeAssetId)) {
        config.commissions.addAsset(config.nativeAssetId);
    }

    for (pugi::xml_node assetNode : node.child("Assets").children("Asset")) {
        config.marketAssets.push_back({
            .assetId = xml::requireAttribute(assetNode, "id").as_string(),
            .config = market::AssetConfig::fromXML(assetNode)
        });
    }

    for (pugi::xml_node assetNode : node.child("Treasury").children("Asset")) {
        TreasuryAssetSpec spec{
            .assetId = xml::requireAttribute(assetNode, "id").as_string(),
            .decimals = xml::getUint<uint8_t>(assetNode, "decimals")
        };
        if (assetNode.attribute("deposit") || assetNode.attribute("withdraw")) {
            spec.rates = exchange::CommissionRates{
                .deposit = xml::getUint(
                    assetNode, "deposit", exchange::CommissionRates::kDefault),
                .withdraw = xml::getUint(
                    assetNode, "withdraw", exchange::CommissionRates::kDefault)
            };
        }
        config.treasuryAssets.push_back(std::move(spec));
    }

    for (pugi::xml_node tokenNode : node.child("Venues").children("Token")) {
        TokenVenueSpec spec{
            .name = xml::requireAttribute(tokenNode, "name").as_string(),
            .assetId = xml::requireAttribute(tokenNode, "asset").as_string(),
            .latency = xml::getUint<Timestamp>(tokenNode, "latency", 0)
        };
        if (config.tokenVenueFor(spec.assetId) != nullptr) {
            throw Error{
                ErrorCode::InvalidConfiguration,
                fmt::format("{}: asset '{}' has more than one token venue", ctx, spec.assetId)};
        }
        config.tokenVenues.push_back(std::move(spec));
    }

    for (pugi::xml_node balanceNode : node.child("Balances").children("Balance")) {
        config.balances.push_back({
            .account = xml::requireAttribute(balanceNode, "account").as_string(),
            .assetId = xml::requireAttribute(balanceNode, "asset").as_string(),
            .amount = xml::getBalance(balanceNode, "amount")
        });
        const AssetId& assetId = config.balances.back().assetId;
        if (assetId != config.stableAssetId
            && assetId != config.nativeAssetId
            && config.tokenVenueFor(assetId) == nullptr) {
            throw Error{
                ErrorCode::InvalidConfiguration,
                fmt::format("{}: no venue carries balance asset '{}'", ctx, assetId)};
        }
    }

    return config;
}

//-------------------------------------------------------------------------

}  // namespace stablecore::issuer

//-------------------------------------------------------------------------
