/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "stablecore/oracle/Price.hpp"

#include "stablecore/error/Error.hpp"
#include "xml_util.hpp"

//-------------------------------------------------------------------------

namespace stablecore::oracle
{

//-------------------------------------------------------------------------

void Price::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("multiplier", json::balance2json(multiplier, allocator), allocator);
        json.AddMember("decimals", rapidjson::Value{decimals}, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

Price Price::fromXML(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    const auto decimals = xml::getUint<uint32_t>(node, "decimals");
    if (decimals > kMaxPriceDecimals) {
        throw Error{
            ErrorCode::InvalidConfiguration,
            fmt::format("{}: Price decimals should be <= {}, was {}", ctx, kMaxPriceDecimals, decimals)};
    }
    return {
        .multiplier = xml::getBalance(node, "multiplier"),
        .decimals = static_cast<uint8_t>(decimals)
    };
}

//-------------------------------------------------------------------------

void PriceData::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("timestamp", rapidjson::Value{timestamp}, allocator);
        json.AddMember("recencyDurationSec", rapidjson::Value{recencyDurationSec}, allocator);
        rapidjson::Value pricesJson{rapidjson::kArrayType};
        for (const auto& [assetId, price] : prices) {
            rapidjson::Document priceJson{rapidjson::kObjectType, &allocator};
            priceJson.AddMember(
                "assetId", rapidjson::Value{assetId.c_str(), allocator}, allocator);
            if (price.has_value()) {
                price->jsonSerialize(priceJson, "price");
            } else {
                priceJson.AddMember("price", rapidjson::Value{}, allocator);
            }
            pricesJson.PushBack(priceJson, allocator);
        }
        json.AddMember("prices", pricesJson, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace stablecore::oracle

//-------------------------------------------------------------------------
