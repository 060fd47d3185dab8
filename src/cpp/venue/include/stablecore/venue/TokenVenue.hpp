/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "IMessageable.hpp"
#include "stablecore/ledger/InMemoryBalanceLedger.hpp"
#include "stablecore/message/IssuerMessagePayloads.hpp"

//-------------------------------------------------------------------------

namespace stablecore::venue
{

//-------------------------------------------------------------------------

// External fungible token contract. Keeps its own balances, notifies the
// issuer of tokens sent to it and refunds whatever the issuer reports unused.
class TokenVenue : public IMessageable
{
public:
    TokenVenue(Host* host, const std::string& name, AssetId assetId, AccountId issuer);

    [[nodiscard]] const AssetId& assetId() const noexcept { return m_assetId; }
    [[nodiscard]] ledger::InMemoryBalanceLedger& ledger() noexcept { return m_ledger; }
    [[nodiscard]] const ledger::InMemoryBalanceLedger& ledger() const noexcept { return m_ledger; }

    void mint(const AccountId& account, const Balance& amount);
    [[nodiscard]] Balance balanceOf(const AccountId& account) const;

    // Moves tokens to the issuer and notifies it; returns the transfer id.
    uint64_t transferCall(
        const AccountId& sender,
        const Balance& amount,
        TransferRoute route,
        std::vector<market::Action> actions = {});

    void setFailing(bool flag) noexcept { m_failing = flag; }

    virtual void receiveMessage(Message::Ptr msg) override;

private:
    struct InFlight
    {
        AccountId sender;
        Balance amount;
    };

    void handleTransferRequest(Message::Ptr msg);
    void handleTokensReceivedResponse(Message::Ptr msg);

    AssetId m_assetId;
    AccountId m_issuer;
    ledger::InMemoryBalanceLedger m_ledger;
    std::map<uint64_t, InFlight> m_inFlight;
    uint64_t m_transferCounter{};
    bool m_failing{};
};

//-------------------------------------------------------------------------

}  // namespace stablecore::venue

//-------------------------------------------------------------------------
