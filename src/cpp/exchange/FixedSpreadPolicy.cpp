/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "stablecore/exchange/FixedSpreadPolicy.hpp"

#include "stablecore/error/Error.hpp"
#include "xml_util.hpp"

//-------------------------------------------------------------------------

namespace stablecore::exchange
{

//-------------------------------------------------------------------------

FixedSpreadPolicy::FixedSpreadPolicy(FixedSpreadParams params)
    : m_params{params}, m_spread{checkSpread(decimal_t::fromRatio(params.bps), "bps")}
{}

//-------------------------------------------------------------------------

void FixedSpreadPolicy::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("type", "fixed", allocator);
        json.AddMember("bps", rapidjson::Value{m_params.bps}, allocator);
        json.AddMember("spread", json::decimal2json(m_spread, allocator), allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

std::unique_ptr<FixedSpreadPolicy> FixedSpreadPolicy::fromXML(pugi::xml_node node)
{
    return std::make_unique<FixedSpreadPolicy>(
        FixedSpreadParams{.bps = xml::getUint<uint32_t>(node, "bps")});
}

//-------------------------------------------------------------------------

}  // namespace stablecore::exchange

//-------------------------------------------------------------------------
