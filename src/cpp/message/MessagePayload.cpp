/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "stablecore/message/MessagePayload.hpp"

//-------------------------------------------------------------------------

void ErrorResponsePayload::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("message", rapidjson::Value{message.c_str(), allocator}, allocator);
    };
    stablecore::json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

void EmptyPayload::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    stablecore::json::serializeHelper(
        json, key, [](rapidjson::Document& json) { json.SetObject(); });
}

//-------------------------------------------------------------------------
