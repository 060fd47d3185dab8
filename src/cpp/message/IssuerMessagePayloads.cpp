/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "stablecore/message/IssuerMessagePayloads.hpp"

//-------------------------------------------------------------------------

using namespace stablecore;

//-------------------------------------------------------------------------

void PriceDataRequestPayload::jsonSerialize(
    rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("sagaId", rapidjson::Value{sagaId}, allocator);
        rapidjson::Value ids{rapidjson::kArrayType};
        for (const auto& assetId : assetIds) {
            ids.PushBack(rapidjson::Value{assetId.c_str(), allocator}, allocator);
        }
        json.AddMember("assetIds", ids, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

void PriceDataResponsePayload::jsonSerialize(
    rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("sagaId", rapidjson::Value{sagaId}, allocator);
        data.jsonSerialize(json, "data");
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

void TransferRequestPayload::jsonSerialize(
    rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("sagaId", rapidjson::Value{sagaId}, allocator);
        json.AddMember("receiver", rapidjson::Value{receiver.c_str(), allocator}, allocator);
        json.AddMember("amount", json::balance2json(amount, allocator), allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

void TransferResponsePayload::jsonSerialize(
    rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("sagaId", rapidjson::Value{sagaId}, allocator);
        json.AddMember("receiver", rapidjson::Value{receiver.c_str(), allocator}, allocator);
        json.AddMember("amount", json::balance2json(amount, allocator), allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

void SagaErrorPayload::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("sagaId", rapidjson::Value{sagaId}, allocator);
        json.AddMember("message", rapidjson::Value{message.c_str(), allocator}, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

void TokensReceivedPayload::jsonSerialize(
    rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("transferId", rapidjson::Value{transferId}, allocator);
        json.AddMember("sender", rapidjson::Value{sender.c_str(), allocator}, allocator);
        json.AddMember("assetId", rapidjson::Value{assetId.c_str(), allocator}, allocator);
        json.AddMember("amount", json::balance2json(amount, allocator), allocator);
        const auto routeName = magic_enum::enum_name(route);
        json.AddMember(
            "route",
            rapidjson::Value{
                routeName.data(), static_cast<rapidjson::SizeType>(routeName.size()), allocator},
            allocator);
        rapidjson::Value names{rapidjson::kArrayType};
        for (const auto& action : actions) {
            const auto name = market::actionName(action);
            names.PushBack(
                rapidjson::Value{
                    name.data(), static_cast<rapidjson::SizeType>(name.size()), allocator},
                allocator);
        }
        json.AddMember("actions", names, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

void TokensReceivedResponsePayload::jsonSerialize(
    rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("transferId", rapidjson::Value{transferId}, allocator);
        json.AddMember("unused", json::balance2json(unused, allocator), allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------
