/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "stablecore/market/AccountPosition.hpp"

//-------------------------------------------------------------------------

namespace stablecore::market
{

//-------------------------------------------------------------------------

class PositionLedger : public JsonSerializable
{
public:
    [[nodiscard]] size_t size() const noexcept { return m_positions.size(); }
    [[nodiscard]] bool contains(const AccountId& id) const { return m_positions.contains(id); }

    [[nodiscard]] const AccountPosition* find(const AccountId& id) const;

    // Copy of the account's position, empty if it holds nothing.
    [[nodiscard]] AccountPosition get(const AccountId& id) const;

    // Empty positions are elided from the ledger.
    void put(const AccountId& id, AccountPosition position);

    [[nodiscard]] auto begin() const noexcept { return m_positions.begin(); }
    [[nodiscard]] auto end() const noexcept { return m_positions.end(); }

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

private:
    std::map<AccountId, AccountPosition> m_positions;
};

//-------------------------------------------------------------------------

}  // namespace stablecore::market

//-------------------------------------------------------------------------
