/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "stablecore/exchange/Quote.hpp"

//-------------------------------------------------------------------------

namespace stablecore::exchange
{

//-------------------------------------------------------------------------

void Quote::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember(
            "side",
            rapidjson::Value{magic_enum::enum_name(side).data(), allocator},
            allocator);
        rate.jsonSerialize(json, "rate");
        json.AddMember("spread", json::decimal2json(spread, allocator), allocator);
        json.AddMember("input", json::balance2json(input, allocator), allocator);
        json.AddMember("gross", json::balance2json(gross, allocator), allocator);
        json.AddMember("spreadFee", json::balance2json(spreadFee, allocator), allocator);
        json.AddMember("commission", json::balance2json(commission, allocator), allocator);
        json.AddMember("netStable", json::balance2json(netStable, allocator), allocator);
        json.AddMember("output", json::balance2json(output, allocator), allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace stablecore::exchange

//-------------------------------------------------------------------------
