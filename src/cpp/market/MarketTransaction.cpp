/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "stablecore/market/MarketTransaction.hpp"

#include "stablecore/error/Error.hpp"

//-------------------------------------------------------------------------

namespace stablecore::market
{

//-------------------------------------------------------------------------

MarketTransaction::MarketTransaction(
    AssetRegistry& registry,
    PositionLedger& positions,
    ledger::BalanceLedger& hostLedger,
    Timestamp now)
    : m_registry{registry}, m_positions{positions}, m_hostLedger{hostLedger}, m_now{now}
{}

//-------------------------------------------------------------------------

Asset& MarketTransaction::asset(const AssetId& assetId)
{
    auto it = m_assets.find(assetId);
    if (it == m_assets.end()) {
        it = m_assets.emplace(assetId, m_registry.at(assetId)).first;
        it->second.accrue(m_now);
    }
    return it->second;
}

//-------------------------------------------------------------------------

AccountPosition& MarketTransaction::account(const AccountId& accountId)
{
    auto it = m_accounts.find(accountId);
    if (it == m_accounts.end()) {
        it = m_accounts.emplace(accountId, m_positions.get(accountId)).first;
    }
    return it->second;
}

//-------------------------------------------------------------------------

void MarketTransaction::mintStable(const AccountId& accountId, const Balance& amount)
{
    m_hostLedger.credit(accountId, stableAssetId(), amount);
    m_journal.push_back({accountId, stableAssetId(), amount, true});
}

//-------------------------------------------------------------------------

void MarketTransaction::burnStable(const AccountId& accountId, const Balance& amount)
{
    m_hostLedger.debit(accountId, stableAssetId(), amount);
    m_journal.push_back({accountId, stableAssetId(), amount, false});
}

//-------------------------------------------------------------------------

void MarketTransaction::emit(
    event::EventKind kind,
    const AccountId& accountId,
    const AssetId& assetId,
    const Balance& amount)
{
    m_events.push({
        .kind = kind,
        .timestamp = m_now,
        .account = accountId,
        .assetId = assetId,
        .amount = amount
    });
}

//-------------------------------------------------------------------------

void MarketTransaction::emit(event::IssuerEvent event)
{
    event.timestamp = m_now;
    m_events.push(std::move(event));
}

//-------------------------------------------------------------------------

Balance MarketTransaction::deposit(
    const AccountId& accountId, const AssetId& assetId, const Balance& amount)
{
    static constexpr auto ctx = std::source_location::current();

    if (m_registry.isStable(assetId)) {
        raise(
            ErrorCode::InvalidArgument,
            ctx,
            "The stable asset '{}' can be borrowed but never supplied", assetId);
    }
    if (amount.is_zero()) {
        raise(ErrorCode::InvalidArgument, ctx, "Deposit amount must be positive");
    }
    Asset& target = asset(assetId);
    requireFlag(target, target.config().canDeposit, "deposits", ctx);

    const Balance shares = target.supplied().amountToShares(amount, false);
    if (shares.is_zero()) {
        raise(ErrorCode::InvalidArgument, ctx, "Deposit of {} '{}' buys no shares", amount, assetId);
    }
    target.supplied().deposit(shares, amount);
    addShares(account(accountId).supplied, assetId, shares);
    return shares;
}

//-------------------------------------------------------------------------

void MarketTransaction::depositToReserve(const AssetId& assetId, const Balance& amount)
{
    static constexpr auto ctx = std::source_location::current();

    if (amount.is_zero()) {
        raise(ErrorCode::InvalidArgument, ctx, "Reserve deposit amount must be positive");
    }
    asset(assetId).reserved() += amount;
}

//-------------------------------------------------------------------------

Balance MarketTransaction::withdraw(const AccountId& accountId, const AssetAmount& assetAmount)
{
    static constexpr auto ctx = std::source_location::current();

    // Disabling an asset closes it to new supply only; suppliers can still exit.
    Asset& target = asset(assetAmount.assetId);
    if (!target.config().canWithdraw) {
        raise(
            ErrorCode::AssetDisabled,
            ctx,
            "Withdrawals of '{}' are not enabled", assetAmount.assetId);
    }
    AccountPosition& position = account(accountId);

    const auto [shares, amount] = assetAmountToShares(
        target.supplied(), sharesOf(position.supplied, assetAmount.assetId), assetAmount, false);

    const Balance available = target.availableAmount();
    if (amount > available) {
        raise(
            ErrorCode::InsufficientBalance,
            ctx,
            "Exceeded available amount {} of '{}'", available, assetAmount.assetId);
    }
    removeShares(position.supplied, assetAmount.assetId, shares, ctx);
    target.supplied().withdraw(shares, amount);

    m_transfers.push_back({accountId, assetAmount.assetId, amount});
    emit(event::EventKind::WithdrawStarted, accountId, assetAmount.assetId, amount);
    return amount;
}

//-------------------------------------------------------------------------

Balance MarketTransaction::restoreWithdrawal(
    const AccountId& accountId, const AssetId& assetId, const Balance& amount)
{
    Asset& target = asset(assetId);
    const Balance shares = target.supplied().amountToShares(amount, false);
    target.supplied().deposit(shares, amount);
    addShares(account(accountId).supplied, assetId, shares);
    emit(event::EventKind::WithdrawFailed, accountId, assetId, amount);
    return shares;
}

//-------------------------------------------------------------------------

Balance MarketTransaction::increaseCollateral(
    const AccountId& accountId, const AssetAmount& assetAmount)
{
    static constexpr auto ctx = std::source_location::current();

    Asset& target = asset(assetAmount.assetId);
    requireFlag(target, target.config().canUseAsCollateral, "collateral use", ctx);
    AccountPosition& position = account(accountId);

    const auto [shares, amount] = assetAmountToShares(
        target.supplied(), sharesOf(position.supplied, assetAmount.assetId), assetAmount, false);

    removeShares(position.supplied, assetAmount.assetId, shares, ctx);
    addShares(position.collateral, assetAmount.assetId, shares);

    emit(event::EventKind::IncreaseCollateral, accountId, assetAmount.assetId, amount);
    return amount;
}

//-------------------------------------------------------------------------

Balance MarketTransaction::decreaseCollateral(
    const AccountId& ownerId, const AccountId& receiverId, const AssetAmount& assetAmount)
{
    static constexpr auto ctx = std::source_location::current();

    Asset& target = asset(assetAmount.assetId);
    AccountPosition& owner = account(ownerId);

    const auto [shares, amount] = assetAmountToShares(
        target.supplied(), sharesOf(owner.collateral, assetAmount.assetId), assetAmount, false);

    removeShares(owner.collateral, assetAmount.assetId, shares, ctx);
    addShares(account(receiverId).supplied, assetAmount.assetId, shares);

    if (ownerId == receiverId) {
        emit(event::EventKind::DecreaseCollateral, ownerId, assetAmount.assetId, amount);
    }
    return amount;
}

//-------------------------------------------------------------------------

Balance MarketTransaction::borrow(const AccountId& accountId, const AssetAmount& assetAmount)
{
    static constexpr auto ctx = std::source_location::current();

    if (m_registry.isStable(assetAmount.assetId)) {
        raise(
            ErrorCode::InvalidArgument,
            ctx,
            "The stable asset '{}' is borrowed by minting, not from supply",
            assetAmount.assetId);
    }
    Asset& target = asset(assetAmount.assetId);
    requireFlag(target, target.config().canBorrow, "borrowing", ctx);

    const Balance available = target.availableAmount();
    const Balance maxBorrowShares = target.borrowed().amountToShares(available, false);

    // Debt shares round up and the amount handed out rounds down.
    const auto [borrowedShares, amount] =
        assetAmountToShares(target.borrowed(), maxBorrowShares, assetAmount, false);

    if (amount > available) {
        raise(
            ErrorCode::InsufficientBalance,
            ctx,
            "Exceeded available amount {} of '{}'", available, assetAmount.assetId);
    }

    // Borrowed funds land in the borrower's supplied balance.
    const Balance suppliedShares = target.supplied().amountToShares(amount, false);
    target.borrowed().deposit(borrowedShares, amount);
    target.supplied().deposit(suppliedShares, amount);

    AccountPosition& position = account(accountId);
    addShares(position.borrowed, assetAmount.assetId, borrowedShares);
    addShares(position.supplied, assetAmount.assetId, suppliedShares);

    emit(event::EventKind::Borrow, accountId, assetAmount.assetId, amount);
    return amount;
}

//-------------------------------------------------------------------------

Balance MarketTransaction::repay(
    const AccountId& payerId, const AccountId& debtorId, const AssetAmount& assetAmount)
{
    static constexpr auto ctx = std::source_location::current();

    if (m_registry.isStable(assetAmount.assetId)) {
        raise(
            ErrorCode::InvalidArgument,
            ctx,
            "The stable asset '{}' is repaid by burning, not from supply",
            assetAmount.assetId);
    }
    Asset& target = asset(assetAmount.assetId);
    const Balance debtShares = sharesOf(account(debtorId).borrowed, assetAmount.assetId);
    if (debtShares.is_zero()) {
        raise(
            ErrorCode::InvalidArgument,
            ctx,
            "Account '{}' owes no '{}'", debtorId, assetAmount.assetId);
    }

    // Anything beyond what is owed stays with the payer.
    const Balance owedAmount = target.borrowed().sharesToAmount(debtShares, true);
    AssetAmount capped = assetAmount;
    if (capped.amount && *capped.amount >= owedAmount) {
        capped.amount.reset();
        capped.maxAmount.reset();
    }
    auto [borrowedShares, amount] =
        assetAmountToShares(target.borrowed(), debtShares, capped, true);
    if (borrowedShares > debtShares) {
        borrowedShares = debtShares;
        amount = owedAmount;
    }

    const Balance payerShares = sharesOf(account(payerId).supplied, assetAmount.assetId);
    Balance suppliedShares = target.supplied().amountToShares(amount, true);
    if (suppliedShares > payerShares) {
        suppliedShares = payerShares;
        amount = target.supplied().sharesToAmount(suppliedShares, false);
        if (assetAmount.amount && amount < std::min(*assetAmount.amount, owedAmount)) {
            raise(
                ErrorCode::InsufficientBalance,
                ctx,
                "Not enough supplied '{}' to repay {}: {}",
                assetAmount.assetId, *assetAmount.amount, amount);
        }
        borrowedShares = target.borrowed().amountToShares(amount, false);
        if (amount.is_zero() || borrowedShares.is_zero()) {
            raise(
                ErrorCode::InsufficientBalance,
                ctx,
                "Account '{}' has no supplied '{}' to repay with", payerId, assetAmount.assetId);
        }
    }

    removeShares(account(payerId).supplied, assetAmount.assetId, suppliedShares, ctx);
    removeShares(account(debtorId).borrowed, assetAmount.assetId, borrowedShares, ctx);
    target.supplied().withdraw(suppliedShares, amount);
    target.borrowed().withdraw(borrowedShares, amount);

    emit(event::EventKind::Repay, debtorId, assetAmount.assetId, amount);
    return amount;
}

//-------------------------------------------------------------------------

Balance MarketTransaction::borrowStable(const AccountId& accountId, const Balance& amount)
{
    static constexpr auto ctx = std::source_location::current();

    if (amount.is_zero()) {
        raise(ErrorCode::InvalidArgument, ctx, "Borrow amount must be positive");
    }
    Asset& stable = asset(stableAssetId());
    requireFlag(stable, stable.config().canBorrow, "borrowing", ctx);

    const Balance shares = stable.borrowed().amountToShares(amount, true);
    stable.borrowed().deposit(shares, amount);
    addShares(account(accountId).borrowed, stableAssetId(), shares);
    mintStable(accountId, amount);

    emit(event::EventKind::Borrow, accountId, stableAssetId(), amount);
    emit(event::EventKind::Mint, accountId, stableAssetId(), amount);
    return amount;
}

//-------------------------------------------------------------------------

Balance MarketTransaction::repayStable(
    const AccountId& payerId, const AccountId& debtorId, const Balance& amount)
{
    static constexpr auto ctx = std::source_location::current();

    if (amount.is_zero()) {
        raise(ErrorCode::InvalidArgument, ctx, "Repay amount must be positive");
    }
    Asset& stable = asset(stableAssetId());
    const Balance debtShares = sharesOf(account(debtorId).borrowed, stableAssetId());
    if (debtShares.is_zero()) {
        raise(ErrorCode::InvalidArgument, ctx, "Account '{}' owes no stable", debtorId);
    }

    const Balance owedAmount = stable.borrowed().sharesToAmount(debtShares, true);
    Balance repaid = std::min(amount, owedAmount);
    Balance shares = debtShares;
    if (repaid < owedAmount) {
        shares = stable.borrowed().amountToShares(repaid, false);
        if (shares.is_zero()) {
            raise(ErrorCode::InvalidArgument, ctx, "Repay of {} stable clears no debt", repaid);
        }
    }

    burnStable(payerId, repaid);
    removeShares(account(debtorId).borrowed, stableAssetId(), shares, ctx);
    stable.borrowed().withdraw(shares, std::min(repaid, stable.borrowed().balance));

    emit(event::EventKind::Burn, payerId, stableAssetId(), repaid);
    emit(event::EventKind::Repay, debtorId, stableAssetId(), repaid);
    return repaid;
}

//-------------------------------------------------------------------------

Balance MarketTransaction::owed(const AccountId& accountId, const AssetId& assetId)
{
    const Balance shares = sharesOf(account(accountId).borrowed, assetId);
    return asset(assetId).borrowed().sharesToAmount(shares, true);
}

//-------------------------------------------------------------------------

void MarketTransaction::commit()
{
    if (m_done) return;
    for (const auto& [_, asset] : m_assets) {
        m_registry.store(asset);
    }
    for (auto& [accountId, position] : m_accounts) {
        m_positions.put(accountId, std::move(position));
    }
    m_journal.clear();
    m_done = true;
}

//-------------------------------------------------------------------------

void MarketTransaction::rollback()
{
    if (m_done) return;
    for (const auto& entry : m_journal | views::reverse) {
        if (entry.credit) {
            m_hostLedger.debit(entry.accountId, entry.assetId, entry.amount);
        } else {
            m_hostLedger.credit(entry.accountId, entry.assetId, entry.amount);
        }
    }
    m_journal.clear();
    m_assets.clear();
    m_accounts.clear();
    m_events.clear();
    m_transfers.clear();
    m_done = true;
}

//-------------------------------------------------------------------------

void MarketTransaction::requireFlag(
    const Asset& asset, bool flag, std::string_view what, std::source_location sl) const
{
    if (!asset.enabled()) {
        raise(ErrorCode::AssetDisabled, sl, "Asset '{}' is disabled", asset.id());
    }
    if (!flag) {
        raise(ErrorCode::AssetDisabled, sl, "Asset '{}' does not allow {}", asset.id(), what);
    }
}

//-------------------------------------------------------------------------

}  // namespace stablecore::market

//-------------------------------------------------------------------------
