/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "stablecore/market/AssetRegistry.hpp"

#include "stablecore/error/Error.hpp"

//-------------------------------------------------------------------------

namespace stablecore::market
{

//-------------------------------------------------------------------------

AssetRegistry::AssetRegistry(AssetId stableAssetId)
    : m_stableAssetId{std::move(stableAssetId)}
{
    if (m_stableAssetId.empty()) {
        raise(
            ErrorCode::InvalidConfiguration,
            std::source_location::current(),
            "Stable asset id must not be empty");
    }
}

//-------------------------------------------------------------------------

Asset& AssetRegistry::registerAsset(AssetId id, AssetConfig config, Timestamp now)
{
    static constexpr auto ctx = std::source_location::current();

    if (id.empty()) {
        raise(ErrorCode::InvalidConfiguration, ctx, "Asset id must not be empty");
    }
    if (m_assets.contains(id)) {
        raise(ErrorCode::InvalidConfiguration, ctx, "Asset '{}' is already registered", id);
    }
    const bool synthetic = id == m_stableAssetId;
    auto [it, _] = m_assets.emplace(id, Asset{id, std::move(config), now, synthetic});
    m_ids.push_back(std::move(id));
    return it->second;
}

//-------------------------------------------------------------------------

Asset& AssetRegistry::at(const AssetId& id, std::source_location sl)
{
    auto it = m_assets.find(id);
    if (it == m_assets.end()) {
        raise(ErrorCode::UnknownAsset, sl, "Asset '{}' is not registered", id);
    }
    return it->second;
}

//-------------------------------------------------------------------------

const Asset& AssetRegistry::at(const AssetId& id, std::source_location sl) const
{
    auto it = m_assets.find(id);
    if (it == m_assets.end()) {
        raise(ErrorCode::UnknownAsset, sl, "Asset '{}' is not registered", id);
    }
    return it->second;
}

//-------------------------------------------------------------------------

Asset* AssetRegistry::find(const AssetId& id)
{
    auto it = m_assets.find(id);
    return it != m_assets.end() ? &it->second : nullptr;
}

//-------------------------------------------------------------------------

const Asset* AssetRegistry::find(const AssetId& id) const
{
    auto it = m_assets.find(id);
    return it != m_assets.end() ? &it->second : nullptr;
}

//-------------------------------------------------------------------------

void AssetRegistry::setEnabled(const AssetId& id, bool flag)
{
    at(id).setEnabled(flag);
}

//-------------------------------------------------------------------------

void AssetRegistry::updateConfig(const AssetId& id, AssetConfig config, Timestamp now)
{
    config.validate();
    Asset& asset = at(id);
    // Interest up to now is owed under the old curve.
    asset.accrue(now);
    asset.setConfig(std::move(config));
}

//-------------------------------------------------------------------------

void AssetRegistry::store(const Asset& asset)
{
    at(asset.id()) = asset;
}

//-------------------------------------------------------------------------

void AssetRegistry::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetArray();
        auto& allocator = json.GetAllocator();
        for (const auto& id : m_ids) {
            rapidjson::Document assetJson{&allocator};
            m_assets.at(id).jsonSerialize(assetJson);
            json.PushBack(assetJson, allocator);
        }
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace stablecore::market

//-------------------------------------------------------------------------
