/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "stablecore/market/AccountPosition.hpp"

#include "stablecore/error/Error.hpp"

//-------------------------------------------------------------------------

namespace stablecore::market
{

//-------------------------------------------------------------------------

Balance sharesOf(const ShareMap& shares, const AssetId& assetId)
{
    auto it = shares.find(assetId);
    return it != shares.end() ? it->second : Balance{};
}

//-------------------------------------------------------------------------

void addShares(ShareMap& shares, const AssetId& assetId, const Balance& amount)
{
    if (amount.is_zero()) return;
    shares[assetId] += amount;
}

//-------------------------------------------------------------------------

void removeShares(
    ShareMap& shares, const AssetId& assetId, const Balance& amount, std::source_location sl)
{
    if (amount.is_zero()) return;
    auto it = shares.find(assetId);
    if (it == shares.end() || it->second < amount) {
        raise(
            ErrorCode::InsufficientBalance,
            sl,
            "Not enough shares of '{}': have {}, need {}",
            assetId, sharesOf(shares, assetId), amount);
    }
    it->second -= amount;
    if (it->second.is_zero()) {
        shares.erase(it);
    }
}

//-------------------------------------------------------------------------

void AccountPosition::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serializeShares = [](const ShareMap& shares) {
        return [&shares](rapidjson::Document& json) {
            json.SetObject();
            auto& allocator = json.GetAllocator();
            for (const auto& [assetId, amount] : shares) {
                json.AddMember(
                    rapidjson::Value{assetId.c_str(), allocator},
                    json::balance2json(amount, allocator),
                    allocator);
            }
        };
    };
    auto serialize = [&](rapidjson::Document& json) {
        json.SetObject();
        json::serializeHelper(json, "supplied", serializeShares(supplied));
        json::serializeHelper(json, "collateral", serializeShares(collateral));
        json::serializeHelper(json, "borrowed", serializeShares(borrowed));
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace stablecore::market

//-------------------------------------------------------------------------
