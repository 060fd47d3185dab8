/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "stablecore/market/AssetConfig.hpp"
#include "stablecore/market/Pool.hpp"

//-------------------------------------------------------------------------

namespace stablecore::market
{

//-------------------------------------------------------------------------

// Market record of one accepted token. A synthetic asset (the stable asset
// itself) is minted on borrow instead of being drawn from suppliers.
class Asset : public JsonSerializable
{
public:
    Asset(AssetId id, AssetConfig config, Timestamp timestamp, bool synthetic = false);

    [[nodiscard]] const AssetId& id() const noexcept { return m_id; }
    [[nodiscard]] const AssetConfig& config() const noexcept { return m_config; }
    [[nodiscard]] bool synthetic() const noexcept { return m_synthetic; }
    [[nodiscard]] bool enabled() const noexcept { return m_enabled; }
    [[nodiscard]] Timestamp lastUpdate() const noexcept { return m_lastUpdate; }

    [[nodiscard]] Pool& supplied() noexcept { return m_supplied; }
    [[nodiscard]] const Pool& supplied() const noexcept { return m_supplied; }
    [[nodiscard]] Pool& borrowed() noexcept { return m_borrowed; }
    [[nodiscard]] const Pool& borrowed() const noexcept { return m_borrowed; }
    [[nodiscard]] Balance& reserved() noexcept { return m_reserved; }
    [[nodiscard]] const Balance& reserved() const noexcept { return m_reserved; }

    void setEnabled(bool flag) noexcept { m_enabled = flag; }
    void setConfig(AssetConfig config);

    [[nodiscard]] decimal_t utilization() const;
    [[nodiscard]] decimal_t rate() const;
    [[nodiscard]] decimal_t borrowApr() const;
    [[nodiscard]] decimal_t supplyApr() const;

    // Liquid funds: supplied plus reserved, less what is lent out.
    [[nodiscard]] Balance availableAmount() const;

    // Compounds interest for the whole milliseconds elapsed since the last update.
    void accrue(Timestamp now);

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

private:
    AssetId m_id;
    AssetConfig m_config;
    Pool m_supplied;
    Pool m_borrowed;
    Balance m_reserved{};
    Timestamp m_lastUpdate;
    bool m_synthetic;
    bool m_enabled{true};
};

//-------------------------------------------------------------------------

}  // namespace stablecore::market

//-------------------------------------------------------------------------
