/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "JsonSerializable.hpp"
#include "common.hpp"

//-------------------------------------------------------------------------

namespace stablecore::market
{

//-------------------------------------------------------------------------

// Shares against a growing balance; the share price is balance / shares.
struct Pool
{
    Balance shares{};
    Balance balance{};

    [[nodiscard]] Balance amountToShares(const Balance& amount, bool roundUp) const;
    [[nodiscard]] Balance sharesToAmount(const Balance& sharesIn, bool roundUp) const;

    void deposit(const Balance& sharesIn, const Balance& amount);
    void withdraw(const Balance& sharesOut, const Balance& amount);

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;
};

//-------------------------------------------------------------------------

}  // namespace stablecore::market

//-------------------------------------------------------------------------
