/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "stablecore/message/Message.hpp"

//-------------------------------------------------------------------------

void Message::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("timestamp", rapidjson::Value{occurrence}, allocator);
        json.AddMember("delay", rapidjson::Value{arrival - occurrence}, allocator);
        json.AddMember("source", rapidjson::Value{source.c_str(), allocator}, allocator);
        json.AddMember("target", rapidjson::Value{target.c_str(), allocator}, allocator);
        json.AddMember("type", rapidjson::Value{type.c_str(), allocator}, allocator);
        stablecore::json::setOptionalMember(json, "deadline", deadline);
        payload->jsonSerialize(json, "payload");
    };
    stablecore::json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------
