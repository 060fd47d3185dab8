/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "stablecore/market/PositionLedger.hpp"

//-------------------------------------------------------------------------

namespace stablecore::market
{

//-------------------------------------------------------------------------

const AccountPosition* PositionLedger::find(const AccountId& id) const
{
    auto it = m_positions.find(id);
    return it != m_positions.end() ? &it->second : nullptr;
}

//-------------------------------------------------------------------------

AccountPosition PositionLedger::get(const AccountId& id) const
{
    const AccountPosition* position = find(id);
    return position != nullptr ? *position : AccountPosition{};
}

//-------------------------------------------------------------------------

void PositionLedger::put(const AccountId& id, AccountPosition position)
{
    if (position.empty()) {
        m_positions.erase(id);
        return;
    }
    m_positions.insert_or_assign(id, std::move(position));
}

//-------------------------------------------------------------------------

void PositionLedger::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        for (const auto& [id, position] : m_positions) {
            position.jsonSerialize(json, id);
        }
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace stablecore::market

//-------------------------------------------------------------------------
