/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "stablecore/market/Pool.hpp"

#include "stablecore/error/Error.hpp"

//-------------------------------------------------------------------------

namespace stablecore::market
{

//-------------------------------------------------------------------------

Balance Pool::amountToShares(const Balance& amount, bool roundUp) const
{
    if (balance.is_zero()) {
        return amount;
    }
    return util::u128Ratio(shares, amount, balance, roundUp);
}

//-------------------------------------------------------------------------

Balance Pool::sharesToAmount(const Balance& sharesIn, bool roundUp) const
{
    if (sharesIn.is_zero()) {
        return {};
    }
    if (sharesIn >= shares) {
        return balance;
    }
    return util::u128Ratio(balance, sharesIn, shares, roundUp);
}

//-------------------------------------------------------------------------

void Pool::deposit(const Balance& sharesIn, const Balance& amount)
{
    shares += sharesIn;
    balance += amount;
}

//-------------------------------------------------------------------------

void Pool::withdraw(const Balance& sharesOut, const Balance& amount)
{
    if (sharesOut > shares || amount > balance) {
        raise(
            ErrorCode::InsufficientBalance,
            std::source_location::current(),
            "Pool holds {} shares / {}, cannot withdraw {} shares / {}",
            shares, balance, sharesOut, amount);
    }
    shares -= sharesOut;
    balance -= amount;
}

//-------------------------------------------------------------------------

void Pool::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("shares", json::balance2json(shares, allocator), allocator);
        json.AddMember("balance", json::balance2json(balance, allocator), allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace stablecore::market

//-------------------------------------------------------------------------
