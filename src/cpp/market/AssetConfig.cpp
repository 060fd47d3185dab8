/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "stablecore/market/AssetConfig.hpp"

#include "stablecore/error/Error.hpp"
#include "xml_util.hpp"

//-------------------------------------------------------------------------

namespace stablecore::market
{

//-------------------------------------------------------------------------

void AssetConfig::validate() const
{
    static constexpr auto ctx = std::source_location::current();
    static constexpr uint32_t maxDecimals = 37;

    if (decimals == 0 || decimals + extraDecimals > maxDecimals) {
        raise(
            ErrorCode::InvalidConfiguration,
            ctx,
            "Decimals should be within (0, {}] including extra; were {} + {}",
            maxDecimals, decimals, extraDecimals);
    }
    if (reserveRatio > kMaxRatio) {
        raise(
            ErrorCode::InvalidConfiguration,
            ctx,
            "'reserveRatio' should be <= {}; was {}", kMaxRatio, reserveRatio);
    }
    if (volatilityRatio >= kMaxRatio) {
        raise(
            ErrorCode::InvalidConfiguration,
            ctx,
            "'volatilityRatio' should be < {}; was {}", kMaxRatio, volatilityRatio);
    }
    curve.validate();
}

//-------------------------------------------------------------------------

void AssetConfig::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("decimals", rapidjson::Value{decimals}, allocator);
        json.AddMember("extraDecimals", rapidjson::Value{extraDecimals}, allocator);
        json.AddMember("reserveRatio", rapidjson::Value{reserveRatio}, allocator);
        json.AddMember("volatilityRatio", rapidjson::Value{volatilityRatio}, allocator);
        curve.jsonSerialize(json, "curve");
        json.AddMember("canDeposit", rapidjson::Value{canDeposit}, allocator);
        json.AddMember("canWithdraw", rapidjson::Value{canWithdraw}, allocator);
        json.AddMember("canUseAsCollateral", rapidjson::Value{canUseAsCollateral}, allocator);
        json.AddMember("canBorrow", rapidjson::Value{canBorrow}, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

AssetConfig AssetConfig::fromXML(pugi::xml_node node)
{
    AssetConfig config{
        .decimals = xml::getUint<uint8_t>(node, "decimals", 18),
        .extraDecimals = xml::getUint<uint8_t>(node, "extraDecimals", 0),
        .reserveRatio = xml::getUint<uint32_t>(node, "reserveRatio", 0),
        .volatilityRatio = xml::getUint<uint32_t>(node, "volatilityRatio", 0),
        .curve = InterestCurve::fromXML(node),
        .canDeposit = node.attribute("canDeposit").as_bool(true),
        .canWithdraw = node.attribute("canWithdraw").as_bool(true),
        .canUseAsCollateral = node.attribute("canUseAsCollateral").as_bool(true),
        .canBorrow = node.attribute("canBorrow").as_bool(true)
    };
    config.validate();
    return config;
}

//-------------------------------------------------------------------------

}  // namespace stablecore::market

//-------------------------------------------------------------------------
