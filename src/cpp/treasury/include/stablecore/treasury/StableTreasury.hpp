/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "stablecore/auth/AuthContext.hpp"
#include "stablecore/exchange/CommissionSchedule.hpp"
#include "stablecore/ledger/BalanceLedger.hpp"

//-------------------------------------------------------------------------

namespace stablecore::treasury
{

//-------------------------------------------------------------------------

enum class TreasuryAssetStatus : uint8_t
{
    Enabled,
    Disabled
};

struct TreasuryAsset
{
    AssetId assetId;
    uint8_t decimals{};
    TreasuryAssetStatus status{TreasuryAssetStatus::Enabled};
};

// Outcome of a withdrawal whose token transfer is still outstanding.
struct WithdrawPlan
{
    AccountId account;
    AssetId assetId;
    Balance stableAmount;
    Balance commission;
    Balance tokenAmount;

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;
};

//-------------------------------------------------------------------------

// One-to-one exchange between the stable asset and accepted stable tokens.
class StableTreasury : public JsonSerializable
{
public:
    static constexpr uint8_t kStableDecimals = 18;
    static constexpr uint8_t kMaxDecimals = 37;

    StableTreasury(
        AssetId stableAssetId,
        exchange::CommissionSchedule& commissions,
        ledger::BalanceLedger& hostLedger);

    void addAsset(
        const auth::AuthContext& auth,
        const AssetId& assetId,
        uint8_t decimals,
        std::optional<exchange::CommissionRates> rates = {});
    void enableAsset(const auth::AuthContext& auth, const AssetId& assetId);
    void disableAsset(const auth::AuthContext& auth, const AssetId& assetId);

    [[nodiscard]] bool contains(const AssetId& assetId) const noexcept;
    [[nodiscard]] const TreasuryAsset& asset(const AssetId& assetId) const;

    // Mints the deposit, less commission, to accountId; returns the minted amount.
    Balance deposit(const AccountId& accountId, const AssetId& assetId, const Balance& amount);

    // Burns stableAmount from accountId and books the commission. The caller
    // starts the token transfer and calls refundWithdraw if it fails.
    WithdrawPlan withdraw(
        const AccountId& accountId, const AssetId& assetId, const Balance& stableAmount);

    void refundWithdraw(const WithdrawPlan& plan);

    // Drains collected commission and mints it to accountId.
    void transferCommission(
        const auth::AuthContext& auth, const AccountId& accountId, const Balance& amount);

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

private:
    [[nodiscard]] const TreasuryAsset& enabledAsset(
        const AssetId& assetId, std::source_location sl) const;
    void setStatus(const AssetId& assetId, TreasuryAssetStatus status);

    AssetId m_stableAssetId;
    exchange::CommissionSchedule& m_commissions;
    ledger::BalanceLedger& m_hostLedger;
    std::map<AssetId, TreasuryAsset> m_assets;
};

//-------------------------------------------------------------------------

}  // namespace stablecore::treasury

//-------------------------------------------------------------------------
