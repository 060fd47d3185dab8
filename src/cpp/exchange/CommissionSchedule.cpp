/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "stablecore/exchange/CommissionSchedule.hpp"

#include "stablecore/error/Error.hpp"
#include "xml_util.hpp"

//-------------------------------------------------------------------------

namespace stablecore::exchange
{

//-------------------------------------------------------------------------

void CommissionSchedule::addAsset(const AssetId& assetId, CommissionRates rates)
{
    checkRates(rates);
    if (!m_entries.try_emplace(assetId, Entry{.rates = rates}).second) {
        raise(
            ErrorCode::InvalidConfiguration,
            std::source_location::current(),
            "Commission for '{}' is already set up", assetId);
    }
}

//-------------------------------------------------------------------------

void CommissionSchedule::setRates(const AssetId& assetId, CommissionRates rates)
{
    checkRates(rates);
    entry(assetId).rates = rates;
}

//-------------------------------------------------------------------------

bool CommissionSchedule::contains(const AssetId& assetId) const noexcept
{
    return m_entries.contains(assetId);
}

//-------------------------------------------------------------------------

const CommissionRates& CommissionSchedule::rates(const AssetId& assetId) const
{
    return entry(assetId).rates;
}

//-------------------------------------------------------------------------

Balance CommissionSchedule::commissionOn(
    const AssetId& assetId, const Balance& amount, CommissionDirection direction) const
{
    return util::u128Ratio(
        amount, Balance{rates(assetId).of(direction)}, Balance{kRateUnit}, false);
}

//-------------------------------------------------------------------------

void CommissionSchedule::accrue(const AssetId& assetId, const Balance& amount)
{
    entry(assetId).collected += amount;
}

//-------------------------------------------------------------------------

void CommissionSchedule::refund(const AssetId& assetId, const Balance& amount)
{
    auto& e = entry(assetId);
    if (e.collected < amount) {
        raise(
            ErrorCode::InsufficientBalance,
            std::source_location::current(),
            "Cannot refund {} of '{}' commission, only {} collected",
            amount, assetId, e.collected);
    }
    e.collected -= amount;
}

//-------------------------------------------------------------------------

Balance CommissionSchedule::collected(const AssetId& assetId) const
{
    return entry(assetId).collected;
}

//-------------------------------------------------------------------------

Balance CommissionSchedule::total() const
{
    return ranges::accumulate(
        m_entries | views::values | views::transform(&Entry::collected), Balance{});
}

//-------------------------------------------------------------------------

std::vector<std::pair<AssetId, Balance>> CommissionSchedule::drain(const Balance& amount)
{
    static constexpr auto ctx = std::source_location::current();

    if (amount.is_zero()) {
        raise(ErrorCode::InvalidArgument, ctx, "Commission amount should be positive");
    }
    if (const Balance available = total(); amount > available) {
        raise(
            ErrorCode::InsufficientBalance,
            ctx,
            "Requested commission {} exceeds the collected {}", amount, available);
    }

    std::vector<std::pair<AssetId, Balance>> taken;
    Balance remaining = amount;
    for (auto& [assetId, e] : m_entries) {
        if (remaining.is_zero()) break;
        const Balance part = std::min(e.collected, remaining);
        if (part.is_zero()) continue;
        e.collected -= part;
        remaining -= part;
        taken.emplace_back(assetId, part);
    }
    return taken;
}

//-------------------------------------------------------------------------

void CommissionSchedule::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        for (const auto& [assetId, e] : m_entries) {
            rapidjson::Value entryJson{rapidjson::kObjectType};
            entryJson.AddMember("deposit", rapidjson::Value{e.rates.deposit}, allocator);
            entryJson.AddMember("withdraw", rapidjson::Value{e.rates.withdraw}, allocator);
            entryJson.AddMember(
                "collected", json::balance2json(e.collected, allocator), allocator);
            json.AddMember(rapidjson::Value{assetId.c_str(), allocator}, entryJson, allocator);
        }
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

void CommissionSchedule::checkRates(const CommissionRates& rates)
{
    if (rates.deposit > kMaxRate || rates.withdraw > kMaxRate) {
        raise(
            ErrorCode::InvalidConfiguration,
            std::source_location::current(),
            "Commission rates should be <= {}; were {} and {}",
            kMaxRate, rates.deposit, rates.withdraw);
    }
}

//-------------------------------------------------------------------------

CommissionSchedule CommissionSchedule::fromXML(pugi::xml_node node)
{
    CommissionSchedule schedule;
    for (pugi::xml_node rateNode : node.children("Rate")) {
        schedule.addAsset(
            rateNode.attribute("asset").as_string(),
            CommissionRates{
                .deposit = xml::getUint(rateNode, "deposit", CommissionRates::kDefault),
                .withdraw = xml::getUint(rateNode, "withdraw", CommissionRates::kDefault)
            });
    }
    return schedule;
}

//-------------------------------------------------------------------------

CommissionSchedule::Entry& CommissionSchedule::entry(const AssetId& assetId)
{
    auto it = m_entries.find(assetId);
    if (it == m_entries.end()) {
        raise(
            ErrorCode::UnknownAsset,
            std::source_location::current(),
            "No commission schedule for '{}'", assetId);
    }
    return it->second;
}

//-------------------------------------------------------------------------

const CommissionSchedule::Entry& CommissionSchedule::entry(const AssetId& assetId) const
{
    auto it = m_entries.find(assetId);
    if (it == m_entries.end()) {
        raise(
            ErrorCode::UnknownAsset,
            std::source_location::current(),
            "No commission schedule for '{}'", assetId);
    }
    return it->second;
}

//-------------------------------------------------------------------------

}  // namespace stablecore::exchange

//-------------------------------------------------------------------------
