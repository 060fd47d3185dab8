/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "IMessageable.hpp"
#include "stablecore/oracle/Price.hpp"

//-------------------------------------------------------------------------

namespace stablecore::venue
{

//-------------------------------------------------------------------------

// External price feed. Answers PRICE_DATA with the latest published price of
// every requested asset, stamped with the time of publication.
class OracleVenue : public IMessageable
{
public:
    OracleVenue(Host* host, const std::string& name, DurationSec recencyDurationSec = 60);

    void publish(const AssetId& assetId, oracle::Price price);
    void retract(const AssetId& assetId);

    // Publishes every later call with this timestamp instead of host time.
    void freezeAt(std::optional<Timestamp> timestamp) noexcept { m_frozenAt = timestamp; }
    void setFailing(bool flag) noexcept { m_failing = flag; }
    void setRecencyDuration(DurationSec duration) noexcept { m_recencyDurationSec = duration; }

    [[nodiscard]] oracle::PriceData snapshot(const std::vector<AssetId>& assetIds) const;
    [[nodiscard]] uint64_t requestsServed() const noexcept { return m_requestsServed; }

    virtual void receiveMessage(Message::Ptr msg) override;

private:
    void handlePriceDataRequest(Message::Ptr msg);

    std::map<AssetId, oracle::Price> m_prices;
    Timestamp m_lastPublished{};
    std::optional<Timestamp> m_frozenAt;
    DurationSec m_recencyDurationSec;
    bool m_failing{};
    uint64_t m_requestsServed{};
};

//-------------------------------------------------------------------------

}  // namespace stablecore::venue

//-------------------------------------------------------------------------
