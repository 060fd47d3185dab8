/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "stablecore/treasury/StableTreasury.hpp"

#include "stablecore/error/Error.hpp"

//-------------------------------------------------------------------------

namespace stablecore::treasury
{

//-------------------------------------------------------------------------

void WithdrawPlan::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("account", rapidjson::Value{account.c_str(), allocator}, allocator);
        json.AddMember("assetId", rapidjson::Value{assetId.c_str(), allocator}, allocator);
        json.AddMember("stableAmount", json::balance2json(stableAmount, allocator), allocator);
        json.AddMember("commission", json::balance2json(commission, allocator), allocator);
        json.AddMember("tokenAmount", json::balance2json(tokenAmount, allocator), allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

StableTreasury::StableTreasury(
    AssetId stableAssetId,
    exchange::CommissionSchedule& commissions,
    ledger::BalanceLedger& hostLedger)
    : m_stableAssetId{std::move(stableAssetId)},
      m_commissions{commissions},
      m_hostLedger{hostLedger}
{}

//-------------------------------------------------------------------------

void StableTreasury::addAsset(
    const auth::AuthContext& auth,
    const AssetId& assetId,
    uint8_t decimals,
    std::optional<exchange::CommissionRates> rates)
{
    static constexpr auto ctx = std::source_location::current();

    auth.require(auth::Role::Owner);
    if (decimals == 0 || decimals > kMaxDecimals) {
        raise(
            ErrorCode::InvalidConfiguration,
            ctx,
            "Decimals of '{}' should be in (0, {}], was {}",
            assetId, kMaxDecimals, decimals);
    }
    if (assetId == m_stableAssetId || m_assets.contains(assetId)) {
        raise(ErrorCode::InvalidConfiguration, ctx, "Asset '{}' cannot be added twice", assetId);
    }
    if (rates) {
        exchange::CommissionSchedule::checkRates(*rates);
    }

    if (!m_commissions.contains(assetId)) {
        m_commissions.addAsset(assetId, rates.value_or(exchange::CommissionRates{}));
    } else if (rates) {
        m_commissions.setRates(assetId, *rates);
    }
    m_assets.emplace(assetId, TreasuryAsset{assetId, decimals, TreasuryAssetStatus::Enabled});
}

//-------------------------------------------------------------------------

void StableTreasury::enableAsset(const auth::AuthContext& auth, const AssetId& assetId)
{
    auth.require(auth::Role::Owner);
    setStatus(assetId, TreasuryAssetStatus::Enabled);
}

//-------------------------------------------------------------------------

void StableTreasury::disableAsset(const auth::AuthContext& auth, const AssetId& assetId)
{
    auth.require(auth::Role::Owner);
    setStatus(assetId, TreasuryAssetStatus::Disabled);
}

//-------------------------------------------------------------------------

void StableTreasury::setStatus(const AssetId& assetId, TreasuryAssetStatus status)
{
    auto it = m_assets.find(assetId);
    if (it == m_assets.end()) {
        raise(
            ErrorCode::UnknownAsset,
            std::source_location::current(),
            "Asset '{}' is not accepted by the treasury", assetId);
    }
    if (it->second.status == status) {
        raise(
            ErrorCode::InvalidArgument,
            std::source_location::current(),
            "Asset '{}' is already {}", assetId, magic_enum::enum_name(status));
    }
    it->second.status = status;
}

//-------------------------------------------------------------------------

bool StableTreasury::contains(const AssetId& assetId) const noexcept
{
    return m_assets.contains(assetId);
}

//-------------------------------------------------------------------------

const TreasuryAsset& StableTreasury::asset(const AssetId& assetId) const
{
    auto it = m_assets.find(assetId);
    if (it == m_assets.end()) {
        raise(
            ErrorCode::UnknownAsset,
            std::source_location::current(),
            "Asset '{}' is not accepted by the treasury", assetId);
    }
    return it->second;
}

//-------------------------------------------------------------------------

const TreasuryAsset& StableTreasury::enabledAsset(
    const AssetId& assetId, std::source_location sl) const
{
    const TreasuryAsset& treasuryAsset = asset(assetId);
    if (treasuryAsset.status != TreasuryAssetStatus::Enabled) {
        raise(ErrorCode::AssetDisabled, sl, "Asset '{}' is disabled", assetId);
    }
    return treasuryAsset;
}

//-------------------------------------------------------------------------

Balance StableTreasury::deposit(
    const AccountId& accountId, const AssetId& assetId, const Balance& amount)
{
    static constexpr auto ctx = std::source_location::current();

    const TreasuryAsset& treasuryAsset = enabledAsset(assetId, ctx);
    if (amount.is_zero()) {
        raise(ErrorCode::InvalidArgument, ctx, "Deposit amount must be positive");
    }

    const Balance stableAmount =
        util::convertDecimals(amount, treasuryAsset.decimals, kStableDecimals);
    const Balance commission = m_commissions.commissionOn(
        assetId, stableAmount, exchange::CommissionDirection::Deposit);
    const Balance minted = stableAmount - commission;
    if (minted.is_zero()) {
        raise(
            ErrorCode::BelowMinimumExchange,
            ctx,
            "Deposit of {} '{}' mints nothing", amount, assetId);
    }

    m_hostLedger.credit(accountId, m_stableAssetId, minted);
    m_commissions.accrue(assetId, commission);
    return minted;
}

//-------------------------------------------------------------------------

WithdrawPlan StableTreasury::withdraw(
    const AccountId& accountId, const AssetId& assetId, const Balance& stableAmount)
{
    static constexpr auto ctx = std::source_location::current();

    const TreasuryAsset& treasuryAsset = enabledAsset(assetId, ctx);
    if (stableAmount.is_zero()) {
        raise(ErrorCode::InvalidArgument, ctx, "Withdraw amount must be positive");
    }

    const Balance commission = m_commissions.commissionOn(
        assetId, stableAmount, exchange::CommissionDirection::Withdraw);
    const Balance tokenAmount = util::convertDecimals(
        stableAmount - commission, kStableDecimals, treasuryAsset.decimals);
    if (tokenAmount.is_zero()) {
        raise(
            ErrorCode::BelowMinimumExchange,
            ctx,
            "Withdrawal of {} stable yields no '{}'", stableAmount, assetId);
    }

    m_hostLedger.debit(accountId, m_stableAssetId, stableAmount);
    m_commissions.accrue(assetId, commission);

    return {
        .account = accountId,
        .assetId = assetId,
        .stableAmount = stableAmount,
        .commission = commission,
        .tokenAmount = tokenAmount
    };
}

//-------------------------------------------------------------------------

void StableTreasury::refundWithdraw(const WithdrawPlan& plan)
{
    m_commissions.refund(plan.assetId, plan.commission);
    m_hostLedger.credit(plan.account, m_stableAssetId, plan.stableAmount);
}

//-------------------------------------------------------------------------

void StableTreasury::transferCommission(
    const auth::AuthContext& auth, const AccountId& accountId, const Balance& amount)
{
    auth.require(auth::Role::Owner);
    m_commissions.drain(amount);
    m_hostLedger.credit(accountId, m_stableAssetId, amount);
}

//-------------------------------------------------------------------------

void StableTreasury::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetArray();
        auto& allocator = json.GetAllocator();
        for (const auto& [assetId, treasuryAsset] : m_assets) {
            rapidjson::Value entry{rapidjson::kObjectType};
            entry.AddMember("assetId", rapidjson::Value{assetId.c_str(), allocator}, allocator);
            entry.AddMember("decimals", rapidjson::Value{treasuryAsset.decimals}, allocator);
            const auto status = magic_enum::enum_name(treasuryAsset.status);
            entry.AddMember(
                "status",
                rapidjson::Value{
                    status.data(), static_cast<rapidjson::SizeType>(status.size()), allocator},
                allocator);
            entry.AddMember(
                "commission",
                json::balance2json(m_commissions.collected(assetId), allocator),
                allocator);
            json.PushBack(entry, allocator);
        }
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace stablecore::treasury

//-------------------------------------------------------------------------
