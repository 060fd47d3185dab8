/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "stablecore/market/MoneyMarket.hpp"

#include "stablecore/error/Error.hpp"

//-------------------------------------------------------------------------

namespace stablecore::market
{

//-------------------------------------------------------------------------

MoneyMarket::MoneyMarket(
    AssetId stableAssetId, MarketConfig config, ledger::BalanceLedger& hostLedger)
    : m_registry{std::move(stableAssetId)},
      m_config{config},
      m_liquidation{config.liquidationIncentive},
      m_hostLedger{hostLedger}
{
    m_config.validate();
}

//-------------------------------------------------------------------------

void MoneyMarket::registerAsset(
    const auth::AuthContext& auth, AssetId assetId, AssetConfig config, Timestamp now)
{
    auth.require(auth::Role::Owner);
    m_registry.registerAsset(std::move(assetId), std::move(config), now);
}

//-------------------------------------------------------------------------

void MoneyMarket::setAssetEnabled(
    const auth::AuthContext& auth, const AssetId& assetId, bool flag)
{
    auth.require(auth::Role::Owner);
    m_registry.setEnabled(assetId, flag);
}

//-------------------------------------------------------------------------

void MoneyMarket::updateAssetConfig(
    const auth::AuthContext& auth, const AssetId& assetId, AssetConfig config, Timestamp now)
{
    auth.require(auth::Role::Owner);
    m_registry.updateConfig(assetId, std::move(config), now);
}

//-------------------------------------------------------------------------

void MoneyMarket::setConfig(const auth::AuthContext& auth, MarketConfig config)
{
    auth.require(auth::Role::Owner);
    config.validate();
    m_liquidation.setIncentive(config.liquidationIncentive);
    m_config = config;
}

//-------------------------------------------------------------------------

template<typename F>
ExecutionResult MoneyMarket::transact(Timestamp now, F&& body)
{
    MarketTransaction tx{m_registry, m_positions, m_hostLedger, now};
    try {
        body(tx);
    }
    catch (...) {
        tx.rollback();
        throw;
    }
    ExecutionResult result{tx.transfers(), tx.events()};
    tx.commit();
    return result;
}

//-------------------------------------------------------------------------

ExecutionResult MoneyMarket::deposit(
    const AccountId& accountId, const AssetId& assetId, const Balance& amount, Timestamp now)
{
    return transact(now, [&](MarketTransaction& tx) {
        tx.deposit(accountId, assetId, amount);
        tx.emit(event::EventKind::Deposit, accountId, assetId, amount);
    });
}

//-------------------------------------------------------------------------

ExecutionResult MoneyMarket::depositToReserve(
    const AccountId& accountId, const AssetId& assetId, const Balance& amount, Timestamp now)
{
    return transact(now, [&](MarketTransaction& tx) {
        tx.depositToReserve(assetId, amount);
        tx.emit(event::EventKind::DepositToReserve, accountId, assetId, amount);
    });
}

//-------------------------------------------------------------------------

ExecutionResult MoneyMarket::execute(
    const auth::AuthContext& auth,
    const std::vector<Action>& actions,
    const oracle::Prices* prices,
    Timestamp now)
{
    return transact(now, [&](MarketTransaction& tx) {
        HealthEvaluator health{[&tx](const AssetId& id) -> const Asset& { return tx.asset(id); }};
        apply(tx, health, auth, actions, prices);
    });
}

//-------------------------------------------------------------------------

ExecutionResult MoneyMarket::depositAndExecute(
    const auth::AuthContext& auth,
    const AssetId& assetId,
    const Balance& amount,
    const std::vector<Action>& actions,
    const oracle::Prices* prices,
    Timestamp now)
{
    return transact(now, [&](MarketTransaction& tx) {
        tx.deposit(auth.caller, assetId, amount);
        tx.emit(event::EventKind::Deposit, auth.caller, assetId, amount);
        HealthEvaluator health{[&tx](const AssetId& id) -> const Asset& { return tx.asset(id); }};
        apply(tx, health, auth, actions, prices);
    });
}

//-------------------------------------------------------------------------

ExecutionResult MoneyMarket::restoreWithdrawal(
    const AccountId& accountId, const AssetId& assetId, const Balance& amount, Timestamp now)
{
    return transact(now, [&](MarketTransaction& tx) {
        tx.restoreWithdrawal(accountId, assetId, amount);
    });
}

//-------------------------------------------------------------------------

void MoneyMarket::apply(
    MarketTransaction& tx,
    const HealthEvaluator& health,
    const auth::AuthContext& auth,
    const std::vector<Action>& actions,
    const oracle::Prices* prices)
{
    static constexpr auto ctx = std::source_location::current();

    if (needsPrices(actions) && prices == nullptr) {
        raise(ErrorCode::InvalidArgument, ctx, "Market actions require a price snapshot");
    }

    const AccountId& caller = auth.caller;
    bool needRiskCheck{};
    bool needNumberCheck{};

    for (const auto& action : actions) {
        std::visit(
            [&](auto&& a) {
                using T = std::remove_cvref_t<decltype(a)>;
                if constexpr (std::same_as<T, Withdraw>) {
                    tx.withdraw(caller, a.asset);
                }
                else if constexpr (std::same_as<T, IncreaseCollateral>) {
                    needNumberCheck = true;
                    tx.increaseCollateral(caller, a.asset);
                }
                else if constexpr (std::same_as<T, DecreaseCollateral>) {
                    needRiskCheck = true;
                    tx.decreaseCollateral(caller, caller, a.asset);
                }
                else if constexpr (std::same_as<T, Borrow>) {
                    needNumberCheck = true;
                    needRiskCheck = true;
                    tx.borrow(caller, a.asset);
                }
                else if constexpr (std::same_as<T, Repay>) {
                    tx.repay(caller, caller, a.asset);
                }
                else if constexpr (std::same_as<T, BorrowStable>) {
                    needNumberCheck = true;
                    needRiskCheck = true;
                    tx.borrowStable(caller, a.amount);
                }
                else if constexpr (std::same_as<T, RepayStable>) {
                    tx.repayStable(caller, caller, a.amount);
                }
                else if constexpr (std::same_as<T, Liquidate>) {
                    m_liquidation.liquidate(tx, health, *prices, caller, a);
                }
                else if constexpr (std::same_as<T, ForceClose>) {
                    auth.requireAny({auth::Role::Owner, auth::Role::Liquidator});
                    if (!m_config.forceClosingEnabled) {
                        raise(ErrorCode::InvalidArgument, ctx, "Force closing is not enabled");
                    }
                    if (a.target == caller) {
                        raise(ErrorCode::InvalidArgument, ctx, "Account '{}' cannot force close itself", caller);
                    }
                    m_liquidation.forceClose(tx, health, *prices, a.target);
                }
            },
            action);
    }

    if (needNumberCheck && tx.account(caller).numRiskEntries() > m_config.maxNumAssets) {
        raise(
            ErrorCode::InvalidArgument,
            ctx,
            "Account '{}' would hold {} collateral and borrowed assets, at most {} allowed",
            caller, tx.account(caller).numRiskEntries(), m_config.maxNumAssets);
    }
    if (needRiskCheck) {
        health.requireHealthy(caller, tx.account(caller), *prices, ctx);
    }
}

//-------------------------------------------------------------------------

std::set<AssetId> MoneyMarket::priceDependencies(
    const AccountId& caller, const std::vector<Action>& actions) const
{
    std::set<AssetId> ids = referencedAssets(actions);
    auto addPosition = [&](const AccountId& accountId) {
        const AccountPosition* position = m_positions.find(accountId);
        if (position == nullptr) return;
        for (const auto& [assetId, _] : position->collateral) ids.insert(assetId);
        for (const auto& [assetId, _] : position->borrowed) ids.insert(assetId);
    };
    addPosition(caller);
    for (const auto& action : actions) {
        if (const auto* liquidate = std::get_if<Liquidate>(&action)) {
            addPosition(liquidate->target);
        }
        else if (const auto* forceClose = std::get_if<ForceClose>(&action)) {
            addPosition(forceClose->target);
        }
        else if (std::holds_alternative<BorrowStable>(action)) {
            ids.insert(stableAssetId());
        }
    }
    return ids;
}

//-------------------------------------------------------------------------

Balance MoneyMarket::suppliedAmount(const AccountId& accountId, const AssetId& assetId) const
{
    const AccountPosition* position = m_positions.find(accountId);
    if (position == nullptr) return {};
    return m_registry.at(assetId).supplied().sharesToAmount(
        sharesOf(position->supplied, assetId), false);
}

//-------------------------------------------------------------------------

Balance MoneyMarket::collateralAmount(const AccountId& accountId, const AssetId& assetId) const
{
    const AccountPosition* position = m_positions.find(accountId);
    if (position == nullptr) return {};
    return m_registry.at(assetId).supplied().sharesToAmount(
        sharesOf(position->collateral, assetId), false);
}

//-------------------------------------------------------------------------

Balance MoneyMarket::borrowedAmount(const AccountId& accountId, const AssetId& assetId) const
{
    const AccountPosition* position = m_positions.find(accountId);
    if (position == nullptr) return {};
    return m_registry.at(assetId).borrowed().sharesToAmount(
        sharesOf(position->borrowed, assetId), true);
}

//-------------------------------------------------------------------------

Health MoneyMarket::health(const AccountId& accountId, const oracle::Prices& prices) const
{
    const HealthEvaluator evaluator{registryLookup()};
    return evaluator.evaluate(m_positions.get(accountId), prices);
}

//-------------------------------------------------------------------------

HealthEvaluator::AssetLookup MoneyMarket::registryLookup() const
{
    return [this](const AssetId& id) -> const Asset& { return m_registry.at(id); };
}

//-------------------------------------------------------------------------

void MoneyMarket::assetView(
    rapidjson::Document& json, const AssetId& assetId, const std::string& key) const
{
    const Asset& asset = m_registry.at(assetId);
    auto serialize = [&](rapidjson::Document& json) {
        asset.jsonSerialize(json);
        auto& allocator = json.GetAllocator();
        json.AddMember(
            "availableAmount", json::balance2json(asset.availableAmount(), allocator), allocator);
        json.AddMember(
            "utilization", json::decimal2json(asset.utilization(), allocator), allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

void MoneyMarket::accountView(
    rapidjson::Document& json,
    const AccountId& accountId,
    const oracle::Prices* prices,
    const std::string& key) const
{
    const AccountPosition position = m_positions.get(accountId);

    auto serializeEntries = [this](const ShareMap& shares, bool debt) {
        return [this, &shares, debt](rapidjson::Document& json) {
            json.SetArray();
            auto& allocator = json.GetAllocator();
            for (const auto& [assetId, amount] : shares) {
                const Asset& asset = m_registry.at(assetId);
                const Pool& pool = debt ? asset.borrowed() : asset.supplied();
                rapidjson::Value entry{rapidjson::kObjectType};
                entry.AddMember(
                    "assetId", rapidjson::Value{assetId.c_str(), allocator}, allocator);
                entry.AddMember("shares", json::balance2json(amount, allocator), allocator);
                entry.AddMember(
                    "balance",
                    json::balance2json(pool.sharesToAmount(amount, debt), allocator),
                    allocator);
                json.PushBack(entry, allocator);
            }
        };
    };

    auto serialize = [&](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("accountId", rapidjson::Value{accountId.c_str(), allocator}, allocator);
        json::serializeHelper(json, "supplied", serializeEntries(position.supplied, false));
        json::serializeHelper(json, "collateral", serializeEntries(position.collateral, false));
        json::serializeHelper(json, "borrowed", serializeEntries(position.borrowed, true));
        if (prices != nullptr) {
            const Health health = HealthEvaluator{registryLookup()}.evaluate(position, *prices);
            json.AddMember(
                "borrowingPower", json::decimal2json(health.borrowingPower, allocator), allocator);
            json.AddMember("debtValue", json::decimal2json(health.debtValue, allocator), allocator);
            json.AddMember("healthy", rapidjson::Value{health.healthy()}, allocator);
        }
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

void MoneyMarket::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        m_config.jsonSerialize(json, "config");
        m_registry.jsonSerialize(json, "assets");
        m_positions.jsonSerialize(json, "accounts");
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace stablecore::market

//-------------------------------------------------------------------------
