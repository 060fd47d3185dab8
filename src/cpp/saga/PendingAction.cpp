/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "stablecore/saga/PendingAction.hpp"

#include <array>

//-------------------------------------------------------------------------

namespace stablecore::saga
{

//-------------------------------------------------------------------------

std::string_view pendingActionName(const PendingAction& action) noexcept
{
    static constexpr std::array<std::string_view, std::variant_size_v<PendingAction>> names{
        "Buy",
        "Sell",
        "MintByNative",
        "MarketExecute",
        "MarketWithdraw",
        "TreasuryWithdraw"
    };
    return names[action.index()];
}

//-------------------------------------------------------------------------

void PendingRecord::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        const auto kind = pendingActionName(action);
        json.AddMember("sagaId", rapidjson::Value{id}, allocator);
        json.AddMember(
            "kind",
            rapidjson::Value{kind.data(), static_cast<rapidjson::SizeType>(kind.size()), allocator},
            allocator);
        json.AddMember("startedAt", rapidjson::Value{startedAt}, allocator);
        json.AddMember("deadline", rapidjson::Value{deadline}, allocator);
        std::visit(
            [&](auto&& a) {
                using T = std::remove_cvref_t<decltype(a)>;
                if constexpr (std::same_as<T, PendingBuy> || std::same_as<T, PendingSell>) {
                    json.AddMember(
                        "caller", rapidjson::Value{a.caller.c_str(), allocator}, allocator);
                    json.AddMember(
                        "recipient", rapidjson::Value{a.recipient.c_str(), allocator}, allocator);
                }
                else if constexpr (std::same_as<T, PendingMintByNative>) {
                    json.AddMember(
                        "caller", rapidjson::Value{a.caller.c_str(), allocator}, allocator);
                    json.AddMember(
                        "nativeAmount", json::balance2json(a.nativeAmount, allocator), allocator);
                }
                else if constexpr (std::same_as<T, PendingMarketExecute>) {
                    json.AddMember(
                        "caller", rapidjson::Value{a.auth.caller.c_str(), allocator}, allocator);
                    json.AddMember(
                        "numActions",
                        rapidjson::Value{static_cast<uint64_t>(a.actions.size())},
                        allocator);
                }
                else if constexpr (std::same_as<T, PendingMarketWithdraw>) {
                    json.AddMember(
                        "account", rapidjson::Value{a.account.c_str(), allocator}, allocator);
                    json.AddMember(
                        "assetId", rapidjson::Value{a.assetId.c_str(), allocator}, allocator);
                    json.AddMember("amount", json::balance2json(a.amount, allocator), allocator);
                }
                else if constexpr (std::same_as<T, PendingTreasuryWithdraw>) {
                    a.plan.jsonSerialize(json, "plan");
                }
            },
            action);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

void SagaResolution::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        const auto outcomeName = magic_enum::enum_name(outcome);
        json.AddMember("event", rapidjson::Value{"SagaResolved", allocator}, allocator);
        json.AddMember("sagaId", rapidjson::Value{sagaId}, allocator);
        json.AddMember(
            "kind",
            rapidjson::Value{kind.data(), static_cast<rapidjson::SizeType>(kind.size()), allocator},
            allocator);
        json.AddMember(
            "outcome",
            rapidjson::Value{
                outcomeName.data(),
                static_cast<rapidjson::SizeType>(outcomeName.size()),
                allocator},
            allocator);
        if (error) {
            const auto errorName = errorCode2String(*error);
            json.AddMember(
                "error",
                rapidjson::Value{
                    errorName.data(), static_cast<rapidjson::SizeType>(errorName.size()), allocator},
                allocator);
        }
        if (!message.empty()) {
            json.AddMember("message", rapidjson::Value{message.c_str(), allocator}, allocator);
        }
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace stablecore::saga

//-------------------------------------------------------------------------
