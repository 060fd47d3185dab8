/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "stablecore/market/Asset.hpp"

//-------------------------------------------------------------------------

namespace stablecore::market
{

//-------------------------------------------------------------------------

Asset::Asset(AssetId id, AssetConfig config, Timestamp timestamp, bool synthetic)
    : m_id{std::move(id)},
      m_config{std::move(config)},
      m_lastUpdate{timestamp},
      m_synthetic{synthetic}
{
    m_config.validate();
}

//-------------------------------------------------------------------------

void Asset::setConfig(AssetConfig config)
{
    config.validate();
    m_config = std::move(config);
}

//-------------------------------------------------------------------------

decimal_t Asset::utilization() const
{
    if (m_synthetic) {
        return m_borrowed.balance.is_zero() ? decimal_t::zero() : decimal_t::one();
    }
    const Balance funds = m_supplied.balance + m_reserved;
    if (funds.is_zero()) {
        return decimal_t::zero();
    }
    return decimal_t{m_borrowed.balance}.divBalance(funds);
}

//-------------------------------------------------------------------------

decimal_t Asset::rate() const
{
    if (m_borrowed.balance.is_zero()) {
        return decimal_t::one();
    }
    return m_config.curve.rate(utilization());
}

//-------------------------------------------------------------------------

decimal_t Asset::borrowApr() const
{
    return rate2apr(rate());
}

//-------------------------------------------------------------------------

decimal_t Asset::supplyApr() const
{
    if (m_supplied.balance.is_zero() || m_borrowed.balance.is_zero()) {
        return decimal_t::zero();
    }
    const decimal_t borrowRate = borrowApr();
    if (borrowRate.isZero()) {
        return borrowRate;
    }
    const Balance interest = borrowRate.roundMulBalance(m_borrowed.balance);
    const Balance supplyInterest = util::ratio(interest, kMaxRatio - m_config.reserveRatio);
    return decimal_t{supplyInterest}.divBalance(m_supplied.balance);
}

//-------------------------------------------------------------------------

Balance Asset::availableAmount() const
{
    const Balance funds = m_supplied.balance + m_reserved;
    return funds > m_borrowed.balance ? funds - m_borrowed.balance : Balance{};
}

//-------------------------------------------------------------------------

void Asset::accrue(Timestamp now)
{
    if (now <= m_lastUpdate) return;
    const Timestamp elapsed = now - m_lastUpdate;
    m_lastUpdate = now;

    if (m_borrowed.balance.is_zero()) return;

    const Balance grown = rate().pow(elapsed).roundMulBalance(m_borrowed.balance);
    const Balance interest = grown - m_borrowed.balance;
    const Balance reserveShare = util::ratio(interest, m_config.reserveRatio);

    if (!m_supplied.shares.is_zero()) {
        m_supplied.balance += interest - reserveShare;
        m_reserved += reserveShare;
    } else {
        m_reserved += interest;
    }
    m_borrowed.balance += interest;
}

//-------------------------------------------------------------------------

void Asset::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("assetId", rapidjson::Value{m_id.c_str(), allocator}, allocator);
        json.AddMember("synthetic", rapidjson::Value{m_synthetic}, allocator);
        json.AddMember("enabled", rapidjson::Value{m_enabled}, allocator);
        m_supplied.jsonSerialize(json, "supplied");
        m_borrowed.jsonSerialize(json, "borrowed");
        json.AddMember("reserved", json::balance2json(m_reserved, allocator), allocator);
        json.AddMember("lastUpdate", rapidjson::Value{m_lastUpdate}, allocator);
        m_config.jsonSerialize(json, "config");
        json.AddMember("supplyApr", json::decimal2json(supplyApr(), allocator), allocator);
        json.AddMember("borrowApr", json::decimal2json(borrowApr(), allocator), allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace stablecore::market

//-------------------------------------------------------------------------
