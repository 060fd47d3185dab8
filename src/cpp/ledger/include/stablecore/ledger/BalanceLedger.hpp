/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"

//-------------------------------------------------------------------------

namespace stablecore::ledger
{

//-------------------------------------------------------------------------

// Token-credit interface of the fungible balance collaborator.
class BalanceLedger
{
public:
    virtual ~BalanceLedger() noexcept = default;

    virtual void credit(const AccountId& accountId, const AssetId& assetId, const Balance& amount) = 0;

    // Throws InsufficientBalance and leaves balances untouched on underflow.
    virtual void debit(const AccountId& accountId, const AssetId& assetId, const Balance& amount) = 0;

    [[nodiscard]] virtual Balance balanceOf(
        const AccountId& accountId, const AssetId& assetId) const = 0;

    [[nodiscard]] virtual Balance totalSupply(const AssetId& assetId) const = 0;

    void transfer(
        const AccountId& from, const AccountId& to, const AssetId& assetId, const Balance& amount)
    {
        debit(from, assetId, amount);
        credit(to, assetId, amount);
    }

protected:
    BalanceLedger() noexcept = default;
};

//-------------------------------------------------------------------------

}  // namespace stablecore::ledger

//-------------------------------------------------------------------------
