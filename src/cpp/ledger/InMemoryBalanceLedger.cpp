/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "stablecore/ledger/InMemoryBalanceLedger.hpp"

#include "stablecore/error/Error.hpp"

//-------------------------------------------------------------------------

namespace stablecore::ledger
{

//-------------------------------------------------------------------------

void InMemoryBalanceLedger::credit(
    const AccountId& accountId, const AssetId& assetId, const Balance& amount)
{
    if (amount.is_zero()) return;
    auto& book = m_books[assetId];
    const Balance supply = book.supply + amount;
    book.balances[accountId] += amount;
    book.supply = supply;
}

//-------------------------------------------------------------------------

void InMemoryBalanceLedger::debit(
    const AccountId& accountId, const AssetId& assetId, const Balance& amount)
{
    if (amount.is_zero()) return;
    const Balance available = balanceOf(accountId, assetId);
    if (available < amount) {
        raise(
            ErrorCode::InsufficientBalance,
            std::source_location::current(),
            "'{}' holds {} of '{}', cannot debit {}",
            accountId, available, assetId, amount);
    }
    auto& book = m_books.at(assetId);
    auto it = book.balances.find(accountId);
    it->second -= amount;
    if (it->second.is_zero()) {
        book.balances.erase(it);
    }
    book.supply -= amount;
}

//-------------------------------------------------------------------------

Balance InMemoryBalanceLedger::balanceOf(const AccountId& accountId, const AssetId& assetId) const
{
    auto bookIt = m_books.find(assetId);
    if (bookIt == m_books.end()) return {};
    auto it = bookIt->second.balances.find(accountId);
    return it != bookIt->second.balances.end() ? it->second : Balance{};
}

//-------------------------------------------------------------------------

Balance InMemoryBalanceLedger::totalSupply(const AssetId& assetId) const
{
    auto it = m_books.find(assetId);
    return it != m_books.end() ? it->second.supply : Balance{};
}

//-------------------------------------------------------------------------

void InMemoryBalanceLedger::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        for (const auto& [assetId, book] : m_books) {
            rapidjson::Value bookJson{rapidjson::kObjectType};
            for (const auto& [accountId, balance] : book.balances) {
                bookJson.AddMember(
                    rapidjson::Value{accountId.c_str(), allocator},
                    json::balance2json(balance, allocator),
                    allocator);
            }
            json.AddMember(rapidjson::Value{assetId.c_str(), allocator}, bookJson, allocator);
        }
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace stablecore::ledger

//-------------------------------------------------------------------------
