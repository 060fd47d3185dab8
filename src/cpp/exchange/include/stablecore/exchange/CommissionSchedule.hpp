/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "JsonSerializable.hpp"
#include "common.hpp"

//-------------------------------------------------------------------------

namespace stablecore::exchange
{

//-------------------------------------------------------------------------

enum class CommissionDirection : uint8_t
{
    Deposit,
    Withdraw
};

// Rates are in millionths.
struct CommissionRates
{
    static constexpr uint32_t kDefault = 100;

    uint32_t deposit{kDefault};
    uint32_t withdraw{kDefault};

    [[nodiscard]] uint32_t of(CommissionDirection direction) const noexcept
    {
        return direction == CommissionDirection::Deposit ? deposit : withdraw;
    }
};

//-------------------------------------------------------------------------

// Per accepted asset commission rates and the commission collected on it,
// denominated in stable units.
class CommissionSchedule : public JsonSerializable
{
public:
    static constexpr uint32_t kMaxRate = 50'000;
    static constexpr uint32_t kRateUnit = 1'000'000;

    void addAsset(const AssetId& assetId, CommissionRates rates = {});
    void setRates(const AssetId& assetId, CommissionRates rates);

    [[nodiscard]] bool contains(const AssetId& assetId) const noexcept;
    [[nodiscard]] const CommissionRates& rates(const AssetId& assetId) const;

    [[nodiscard]] Balance commissionOn(
        const AssetId& assetId, const Balance& amount, CommissionDirection direction) const;

    void accrue(const AssetId& assetId, const Balance& amount);
    void refund(const AssetId& assetId, const Balance& amount);

    [[nodiscard]] Balance collected(const AssetId& assetId) const;
    [[nodiscard]] Balance total() const;

    // Takes amount out of the collected commission, emptying assets in id order.
    std::vector<std::pair<AssetId, Balance>> drain(const Balance& amount);

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

    static void checkRates(const CommissionRates& rates);

    [[nodiscard]] static CommissionSchedule fromXML(pugi::xml_node node);

private:
    struct Entry
    {
        CommissionRates rates;
        Balance collected{};
    };

    [[nodiscard]] Entry& entry(const AssetId& assetId);
    [[nodiscard]] const Entry& entry(const AssetId& assetId) const;

    std::map<AssetId, Entry> m_entries;
};

//-------------------------------------------------------------------------

}  // namespace stablecore::exchange

//-------------------------------------------------------------------------
