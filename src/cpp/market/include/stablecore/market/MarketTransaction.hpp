/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "stablecore/event/IssuerEvent.hpp"
#include "stablecore/ledger/BalanceLedger.hpp"
#include "stablecore/market/Action.hpp"
#include "stablecore/market/AssetRegistry.hpp"
#include "stablecore/market/PositionLedger.hpp"

//-------------------------------------------------------------------------

namespace stablecore::market
{

//-------------------------------------------------------------------------

// Tokens leaving the market through an external transfer.
struct OutgoingTransfer
{
    AccountId receiver;
    AssetId assetId;
    Balance amount;
};

//-------------------------------------------------------------------------

// Working copy of every asset and account an operation touches. Assets are
// accrued to the transaction time when first touched. Nothing reaches the
// registry or the position ledger until commit(); host ledger movements are
// applied immediately and journaled so rollback() can reverse them.
class MarketTransaction
{
public:
    MarketTransaction(
        AssetRegistry& registry,
        PositionLedger& positions,
        ledger::BalanceLedger& hostLedger,
        Timestamp now);

    MarketTransaction(const MarketTransaction&) = delete;
    MarketTransaction& operator=(const MarketTransaction&) = delete;

    [[nodiscard]] Timestamp now() const noexcept { return m_now; }
    [[nodiscard]] const AssetId& stableAssetId() const noexcept
    {
        return m_registry.stableAssetId();
    }

    [[nodiscard]] Asset& asset(const AssetId& assetId);
    [[nodiscard]] AccountPosition& account(const AccountId& accountId);

    // Host ledger movements of the stable asset.
    void mintStable(const AccountId& accountId, const Balance& amount);
    void burnStable(const AccountId& accountId, const Balance& amount);

    void emit(
        event::EventKind kind,
        const AccountId& accountId,
        const AssetId& assetId,
        const Balance& amount);
    void emit(event::IssuerEvent event);

    Balance deposit(const AccountId& accountId, const AssetId& assetId, const Balance& amount);
    void depositToReserve(const AssetId& assetId, const Balance& amount);
    Balance withdraw(const AccountId& accountId, const AssetAmount& assetAmount);
    // Returns the amount of a failed withdrawal to the supplied balance,
    // regardless of the asset's flags.
    Balance restoreWithdrawal(
        const AccountId& accountId, const AssetId& assetId, const Balance& amount);
    Balance increaseCollateral(const AccountId& accountId, const AssetAmount& assetAmount);
    Balance decreaseCollateral(
        const AccountId& ownerId, const AccountId& receiverId, const AssetAmount& assetAmount);
    Balance borrow(const AccountId& accountId, const AssetAmount& assetAmount);
    Balance repay(
        const AccountId& payerId, const AccountId& debtorId, const AssetAmount& assetAmount);
    Balance borrowStable(const AccountId& accountId, const Balance& amount);
    // Burns from payerId, at most what debtorId owes.
    Balance repayStable(
        const AccountId& payerId, const AccountId& debtorId, const Balance& amount);

    // Principal plus accrued interest, rounded against the borrower.
    [[nodiscard]] Balance owed(const AccountId& accountId, const AssetId& assetId);

    [[nodiscard]] const event::EventRecord& events() const noexcept { return m_events; }
    [[nodiscard]] const std::vector<OutgoingTransfer>& transfers() const noexcept
    {
        return m_transfers;
    }

    void commit();
    void rollback();

private:
    struct LedgerEntry
    {
        AccountId accountId;
        AssetId assetId;
        Balance amount;
        bool credit;
    };

    void requireFlag(
        const Asset& asset, bool flag, std::string_view what, std::source_location sl) const;

    AssetRegistry& m_registry;
    PositionLedger& m_positions;
    ledger::BalanceLedger& m_hostLedger;
    Timestamp m_now;

    std::map<AssetId, Asset> m_assets;
    std::map<AccountId, AccountPosition> m_accounts;
    std::vector<LedgerEntry> m_journal;
    event::EventRecord m_events;
    std::vector<OutgoingTransfer> m_transfers;
    bool m_done{};
};

//-------------------------------------------------------------------------

}  // namespace stablecore::market

//-------------------------------------------------------------------------
