/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "stablecore/market/MarketConfig.hpp"

#include "stablecore/error/Error.hpp"
#include "xml_util.hpp"

//-------------------------------------------------------------------------

namespace stablecore::market
{

//-------------------------------------------------------------------------

void MarketConfig::validate() const
{
    static constexpr auto ctx = std::source_location::current();

    if (maxNumAssets == 0) {
        raise(ErrorCode::InvalidConfiguration, ctx, "maxNumAssets must be positive");
    }
    if (liquidationIncentive >= kMaxRatio) {
        raise(
            ErrorCode::InvalidConfiguration,
            ctx,
            "liquidationIncentive should be less than {}, was {}",
            kMaxRatio, liquidationIncentive);
    }
}

//-------------------------------------------------------------------------

void MarketConfig::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("maxNumAssets", rapidjson::Value{maxNumAssets}, allocator);
        json.AddMember("forceClosingEnabled", rapidjson::Value{forceClosingEnabled}, allocator);
        json.AddMember(
            "liquidationIncentive", rapidjson::Value{liquidationIncentive}, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

MarketConfig MarketConfig::fromXML(pugi::xml_node node)
{
    MarketConfig config;
    if (!node) return config;
    config.maxNumAssets = xml::getUint(node, "maxNumAssets", config.maxNumAssets);
    config.forceClosingEnabled =
        node.attribute("forceClosingEnabled").as_bool(config.forceClosingEnabled);
    config.liquidationIncentive =
        xml::getUint(node, "liquidationIncentive", config.liquidationIncentive);
    config.validate();
    return config;
}

//-------------------------------------------------------------------------

}  // namespace stablecore::market

//-------------------------------------------------------------------------
