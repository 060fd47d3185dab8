/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "JsonSerializable.hpp"
#include "stablecore/ledger/BalanceLedger.hpp"

//-------------------------------------------------------------------------

namespace stablecore::ledger
{

//-------------------------------------------------------------------------

class InMemoryBalanceLedger : public BalanceLedger, public JsonSerializable
{
public:
    InMemoryBalanceLedger() noexcept = default;

    virtual void credit(
        const AccountId& accountId, const AssetId& assetId, const Balance& amount) override;
    virtual void debit(
        const AccountId& accountId, const AssetId& assetId, const Balance& amount) override;

    [[nodiscard]] virtual Balance balanceOf(
        const AccountId& accountId, const AssetId& assetId) const override;
    [[nodiscard]] virtual Balance totalSupply(const AssetId& assetId) const override;

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

private:
    struct AssetBook
    {
        std::map<AccountId, Balance> balances;
        Balance supply{};
    };

    std::map<AssetId, AssetBook> m_books;
};

//-------------------------------------------------------------------------

}  // namespace stablecore::ledger

//-------------------------------------------------------------------------
