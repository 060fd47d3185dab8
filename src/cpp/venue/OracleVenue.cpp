/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "stablecore/venue/OracleVenue.hpp"

#include "Host.hpp"
#include "stablecore/message/IssuerMessagePayloads.hpp"

//-------------------------------------------------------------------------

namespace stablecore::venue
{

//-------------------------------------------------------------------------

OracleVenue::OracleVenue(Host* host, const std::string& name, DurationSec recencyDurationSec)
    : IMessageable{host, name}, m_recencyDurationSec{recencyDurationSec}
{}

//-------------------------------------------------------------------------

void OracleVenue::publish(const AssetId& assetId, oracle::Price price)
{
    m_prices.insert_or_assign(assetId, std::move(price));
    m_lastPublished = host()->currentTimestamp();
}

//-------------------------------------------------------------------------

void OracleVenue::retract(const AssetId& assetId)
{
    m_prices.erase(assetId);
}

//-------------------------------------------------------------------------

oracle::PriceData OracleVenue::snapshot(const std::vector<AssetId>& assetIds) const
{
    oracle::PriceData data{
        .timestamp = m_frozenAt.value_or(m_lastPublished),
        .recencyDurationSec = m_recencyDurationSec
    };
    for (const auto& assetId : assetIds) {
        auto it = m_prices.find(assetId);
        data.prices.push_back({
            .assetId = assetId,
            .price = it != m_prices.end() ? std::make_optional(it->second) : std::nullopt
        });
    }
    return data;
}

//-------------------------------------------------------------------------

void OracleVenue::receiveMessage(Message::Ptr msg)
{
    if (msg->type == message::kPriceData) {
        handlePriceDataRequest(msg);
    }
    else {
        host()->logDebug("{} ignoring message of type {}", name(), msg->type);
    }
}

//-------------------------------------------------------------------------

void OracleVenue::handlePriceDataRequest(Message::Ptr msg)
{
    const auto payload = std::dynamic_pointer_cast<PriceDataRequestPayload>(msg->payload);
    if (payload == nullptr) {
        throw std::invalid_argument{fmt::format(
            "{}: malformed {} payload from {}",
            std::source_location::current().function_name(), msg->type, msg->source)};
    }

    if (m_failing) {
        respondToMessage(
            msg,
            std::string{message::kErrorPrefix},
            MessagePayload::create<SagaErrorPayload>(
                payload->sagaId, fmt::format("{} is unavailable", name())));
        return;
    }

    ++m_requestsServed;
    respondToMessage(
        msg,
        MessagePayload::create<PriceDataResponsePayload>(
            payload->sagaId, snapshot(payload->assetIds)));
}

//-------------------------------------------------------------------------

}  // namespace stablecore::venue

//-------------------------------------------------------------------------
