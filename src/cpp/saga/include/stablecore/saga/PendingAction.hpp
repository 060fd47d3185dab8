/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "stablecore/auth/AuthContext.hpp"
#include "stablecore/exchange/ExchangeRate.hpp"
#include "stablecore/market/Action.hpp"
#include "stablecore/message/Message.hpp"
#include "stablecore/treasury/StableTreasury.hpp"

//-------------------------------------------------------------------------

namespace stablecore::saga
{

//-------------------------------------------------------------------------

// Native coin taken from the caller, stable not yet minted.
struct PendingBuy
{
    AccountId caller;
    AccountId recipient;
    Balance nativeAmount;
    std::optional<exchange::ExpectedRate> expected;
};

// Stable burned from the caller, native not yet paid out.
struct PendingSell
{
    AccountId caller;
    AccountId recipient;
    Balance stableAmount;
    std::optional<exchange::ExpectedRate> expected;
};

// Native coin taken from the owner, stable not yet minted.
struct PendingMintByNative
{
    AccountId caller;
    Balance nativeAmount;
    uint32_t collateralRatio;
};

// Tokens received on a venue whose fate hangs on the continuation.
struct PendingDeposit
{
    AssetId assetId;
    Balance amount;
    Message::Ptr origin;
};

// Market actions waiting for prices; nothing is applied yet.
struct PendingMarketExecute
{
    auth::AuthContext auth;
    std::vector<market::Action> actions;
    std::optional<PendingDeposit> deposit;
};

// Supplied balance already withdrawn, token transfer outstanding.
struct PendingMarketWithdraw
{
    AccountId account;
    AssetId assetId;
    Balance amount;
};

// Stable burned, token transfer outstanding.
struct PendingTreasuryWithdraw
{
    treasury::WithdrawPlan plan;
};

using PendingAction = std::variant<
    PendingBuy,
    PendingSell,
    PendingMintByNative,
    PendingMarketExecute,
    PendingMarketWithdraw,
    PendingTreasuryWithdraw>;

[[nodiscard]] std::string_view pendingActionName(const PendingAction& action) noexcept;

//-------------------------------------------------------------------------

struct PendingRecord
{
    SagaId id;
    PendingAction action;
    Timestamp startedAt;
    Timestamp deadline;

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;
};

//-------------------------------------------------------------------------

enum class SagaOutcome : uint8_t
{
    Committed,
    Compensated
};

struct SagaResolution
{
    SagaId sagaId;
    std::string_view kind;
    SagaOutcome outcome;
    std::optional<ErrorCode> error;
    std::string message;

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;
};

//-------------------------------------------------------------------------

}  // namespace stablecore::saga

//-------------------------------------------------------------------------
