/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "stablecore/venue/TokenVenue.hpp"

#include "Host.hpp"
#include "stablecore/error/Error.hpp"

//-------------------------------------------------------------------------

namespace stablecore::venue
{

//-------------------------------------------------------------------------

TokenVenue::TokenVenue(Host* host, const std::string& name, AssetId assetId, AccountId issuer)
    : IMessageable{host, name}, m_assetId{std::move(assetId)}, m_issuer{std::move(issuer)}
{}

//-------------------------------------------------------------------------

void TokenVenue::mint(const AccountId& account, const Balance& amount)
{
    m_ledger.credit(account, m_assetId, amount);
}

//-------------------------------------------------------------------------

Balance TokenVenue::balanceOf(const AccountId& account) const
{
    return m_ledger.balanceOf(account, m_assetId);
}

//-------------------------------------------------------------------------

uint64_t TokenVenue::transferCall(
    const AccountId& sender,
    const Balance& amount,
    TransferRoute route,
    std::vector<market::Action> actions)
{
    if (amount == 0) {
        raise(
            ErrorCode::InvalidArgument,
            std::source_location::current(),
            "Transfer amount of '{}' should be positive", m_assetId);
    }
    m_ledger.transfer(sender, m_issuer, m_assetId, amount);

    const uint64_t transferId = ++m_transferCounter;
    m_inFlight.emplace(transferId, InFlight{.sender = sender, .amount = amount});

    const Timestamp now = host()->currentTimestamp();
    host()->dispatchMessage(
        now,
        host()->latency(name()),
        name(),
        m_issuer,
        std::string{message::kTokensReceived},
        MessagePayload::create<TokensReceivedPayload>(
            transferId, sender, m_assetId, amount, route, std::move(actions)));
    return transferId;
}

//-------------------------------------------------------------------------

void TokenVenue::receiveMessage(Message::Ptr msg)
{
    if (msg->type == message::kTransfer) {
        handleTransferRequest(msg);
    }
    else if (msg->type == fmt::format("{}{}", message::kResponsePrefix, message::kTokensReceived)) {
        handleTokensReceivedResponse(msg);
    }
    else {
        host()->logDebug("{} ignoring message of type {}", name(), msg->type);
    }
}

//-------------------------------------------------------------------------

void TokenVenue::handleTransferRequest(Message::Ptr msg)
{
    const auto payload = std::dynamic_pointer_cast<TransferRequestPayload>(msg->payload);
    if (payload == nullptr) {
        throw std::invalid_argument{fmt::format(
            "{}: malformed {} payload from {}",
            std::source_location::current().function_name(), msg->type, msg->source)};
    }

    const auto fail = [&](std::string reason) {
        respondToMessage(
            msg,
            std::string{message::kErrorPrefix},
            MessagePayload::create<SagaErrorPayload>(payload->sagaId, std::move(reason)));
    };

    if (m_failing) {
        fail(fmt::format("{} is unavailable", name()));
        return;
    }
    if (m_ledger.balanceOf(msg->source, m_assetId) < payload->amount) {
        fail(fmt::format(
            "{} holds {} of '{}', cannot send {}",
            msg->source, m_ledger.balanceOf(msg->source, m_assetId), m_assetId, payload->amount));
        return;
    }

    m_ledger.transfer(msg->source, payload->receiver, m_assetId, payload->amount);
    respondToMessage(
        msg,
        MessagePayload::create<TransferResponsePayload>(
            payload->sagaId, payload->receiver, payload->amount));
}

//-------------------------------------------------------------------------

void TokenVenue::handleTokensReceivedResponse(Message::Ptr msg)
{
    const auto payload =
        std::dynamic_pointer_cast<TokensReceivedResponsePayload>(msg->payload);
    if (payload == nullptr) {
        throw std::invalid_argument{fmt::format(
            "{}: malformed {} payload from {}",
            std::source_location::current().function_name(), msg->type, msg->source)};
    }

    auto node = m_inFlight.extract(payload->transferId);
    if (node.empty()) {
        host()->logDebug("{} got a response for unknown transfer #{}", name(), payload->transferId);
        return;
    }
    const auto& inFlight = node.mapped();
    const Balance refund = std::min(payload->unused, inFlight.amount);
    if (refund > 0) {
        m_ledger.transfer(m_issuer, inFlight.sender, m_assetId, refund);
    }
}

//-------------------------------------------------------------------------

}  // namespace stablecore::venue

//-------------------------------------------------------------------------
