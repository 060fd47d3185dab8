/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "stablecore/event/IssuerEvent.hpp"

//-------------------------------------------------------------------------

namespace stablecore::event
{

//-------------------------------------------------------------------------

void IssuerEvent::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        const auto kindName = magic_enum::enum_name(kind);
        json.AddMember(
            "event",
            rapidjson::Value{
                kindName.data(), static_cast<rapidjson::SizeType>(kindName.size()), allocator},
            allocator);
        json.AddMember("timestamp", rapidjson::Value{timestamp}, allocator);
        json.AddMember("account", rapidjson::Value{account.c_str(), allocator}, allocator);
        if (!assetId.empty()) {
            json.AddMember("assetId", rapidjson::Value{assetId.c_str(), allocator}, allocator);
        }
        json.AddMember("amount", json::balance2json(amount, allocator), allocator);
        if (counterparty) {
            json.AddMember(
                "counterparty", rapidjson::Value{counterparty->c_str(), allocator}, allocator);
        }
        if (collateralValue) {
            json.AddMember(
                "collateralValue", json::decimal2json(*collateralValue, allocator), allocator);
        }
        if (debtValue) {
            json.AddMember("debtValue", json::decimal2json(*debtValue, allocator), allocator);
        }
        if (memo) {
            json.AddMember("memo", rapidjson::Value{memo->c_str(), allocator}, allocator);
        }
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

void EventRecord::append(const EventRecord& other)
{
    m_entries.insert(m_entries.end(), other.m_entries.begin(), other.m_entries.end());
}

//-------------------------------------------------------------------------

void EventRecord::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetArray();
        auto& allocator = json.GetAllocator();
        for (const auto& entry : m_entries) {
            rapidjson::Document entryJson{&allocator};
            entry.jsonSerialize(entryJson);
            json.PushBack(entryJson, allocator);
        }
        if (json.Size() == 0) {
            json.SetNull();
        }
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace stablecore::event

//-------------------------------------------------------------------------
