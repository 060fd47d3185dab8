/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "stablecore/auth/AuthContext.hpp"
#include "stablecore/market/LiquidationEngine.hpp"
#include "stablecore/market/MarketConfig.hpp"

//-------------------------------------------------------------------------

namespace stablecore::market
{

//-------------------------------------------------------------------------

struct ExecutionResult
{
    std::vector<OutgoingTransfer> transfers;
    event::EventRecord events;
};

//-------------------------------------------------------------------------

// Supply, collateral, borrow and liquidation bookkeeping over the asset
// registry. Every public mutation is all-or-nothing.
class MoneyMarket : public JsonSerializable
{
public:
    MoneyMarket(AssetId stableAssetId, MarketConfig config, ledger::BalanceLedger& hostLedger);

    [[nodiscard]] AssetRegistry& registry() noexcept { return m_registry; }
    [[nodiscard]] const AssetRegistry& registry() const noexcept { return m_registry; }
    [[nodiscard]] const PositionLedger& positions() const noexcept { return m_positions; }
    [[nodiscard]] const MarketConfig& config() const noexcept { return m_config; }
    [[nodiscard]] const AssetId& stableAssetId() const noexcept
    {
        return m_registry.stableAssetId();
    }

    void registerAsset(
        const auth::AuthContext& auth, AssetId assetId, AssetConfig config, Timestamp now);
    void setAssetEnabled(const auth::AuthContext& auth, const AssetId& assetId, bool flag);
    void updateAssetConfig(
        const auth::AuthContext& auth, const AssetId& assetId, AssetConfig config, Timestamp now);
    void setConfig(const auth::AuthContext& auth, MarketConfig config);

    ExecutionResult deposit(
        const AccountId& accountId, const AssetId& assetId, const Balance& amount, Timestamp now);

    ExecutionResult depositToReserve(
        const AccountId& accountId, const AssetId& assetId, const Balance& amount, Timestamp now);

    // prices may be null only when no action needs them.
    ExecutionResult execute(
        const auth::AuthContext& auth,
        const std::vector<Action>& actions,
        const oracle::Prices* prices,
        Timestamp now);

    // A deposit followed by actions, applied as one unit.
    ExecutionResult depositAndExecute(
        const auth::AuthContext& auth,
        const AssetId& assetId,
        const Balance& amount,
        const std::vector<Action>& actions,
        const oracle::Prices* prices,
        Timestamp now);

    ExecutionResult restoreWithdrawal(
        const AccountId& accountId, const AssetId& assetId, const Balance& amount, Timestamp now);

    // Every asset whose price the actions of caller may consult.
    [[nodiscard]] std::set<AssetId> priceDependencies(
        const AccountId& caller, const std::vector<Action>& actions) const;

    [[nodiscard]] Balance suppliedAmount(const AccountId& accountId, const AssetId& assetId) const;
    [[nodiscard]] Balance collateralAmount(const AccountId& accountId, const AssetId& assetId) const;
    [[nodiscard]] Balance borrowedAmount(const AccountId& accountId, const AssetId& assetId) const;

    [[nodiscard]] Health health(const AccountId& accountId, const oracle::Prices& prices) const;

    void assetView(
        rapidjson::Document& json, const AssetId& assetId, const std::string& key = {}) const;
    void accountView(
        rapidjson::Document& json,
        const AccountId& accountId,
        const oracle::Prices* prices = nullptr,
        const std::string& key = {}) const;

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

private:
    template<typename F>
    ExecutionResult transact(Timestamp now, F&& body);

    void apply(
        MarketTransaction& tx,
        const HealthEvaluator& health,
        const auth::AuthContext& auth,
        const std::vector<Action>& actions,
        const oracle::Prices* prices);

    [[nodiscard]] HealthEvaluator::AssetLookup registryLookup() const;

    AssetRegistry m_registry;
    PositionLedger m_positions;
    MarketConfig m_config;
    LiquidationEngine m_liquidation;
    ledger::BalanceLedger& m_hostLedger;
};

//-------------------------------------------------------------------------

}  // namespace stablecore::market

//-------------------------------------------------------------------------
