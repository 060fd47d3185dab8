/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "stablecore/market/Asset.hpp"

//-------------------------------------------------------------------------

namespace stablecore::market
{

//-------------------------------------------------------------------------

// Open-ended set of market assets. Records are only ever enabled or
// disabled, never removed, so outstanding positions stay resolvable.
class AssetRegistry : public JsonSerializable
{
public:
    explicit AssetRegistry(AssetId stableAssetId);

    [[nodiscard]] const AssetId& stableAssetId() const noexcept { return m_stableAssetId; }
    [[nodiscard]] const std::vector<AssetId>& ids() const noexcept { return m_ids; }
    [[nodiscard]] size_t size() const noexcept { return m_assets.size(); }

    [[nodiscard]] bool contains(const AssetId& id) const { return m_assets.contains(id); }
    [[nodiscard]] bool isStable(const AssetId& id) const noexcept { return id == m_stableAssetId; }

    Asset& registerAsset(AssetId id, AssetConfig config, Timestamp now);

    [[nodiscard]] Asset& at(
        const AssetId& id, std::source_location sl = std::source_location::current());
    [[nodiscard]] const Asset& at(
        const AssetId& id, std::source_location sl = std::source_location::current()) const;

    [[nodiscard]] Asset* find(const AssetId& id);
    [[nodiscard]] const Asset* find(const AssetId& id) const;

    void setEnabled(const AssetId& id, bool flag);
    void updateConfig(const AssetId& id, AssetConfig config, Timestamp now);

    // Writes back a record previously copied out of the registry.
    void store(const Asset& asset);

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

private:
    AssetId m_stableAssetId;
    std::map<AssetId, Asset> m_assets;
    std::vector<AssetId> m_ids;
};

//-------------------------------------------------------------------------

}  // namespace stablecore::market

//-------------------------------------------------------------------------
