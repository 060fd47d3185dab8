/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "stablecore/exchange/AdaptiveSpreadPolicy.hpp"

#include "stablecore/error/Error.hpp"
#include "xml_util.hpp"

//-------------------------------------------------------------------------

namespace stablecore::exchange
{

//-------------------------------------------------------------------------

AdaptiveSpreadPolicy::AdaptiveSpreadPolicy(AdaptiveSpreadParams params, Timestamp now)
    : m_params{params}, m_anchor{now}
{
    static constexpr auto ctx = std::source_location::current().function_name();
    static const decimal_t scalerMax = decimal_t::fromRatio(4'000);

    checkSpread(m_params.min, "min");
    checkSpread(m_params.max, "max");
    if (!(m_params.min < m_params.max)) {
        throw Error{
            ErrorCode::InvalidConfiguration,
            fmt::format(
                "{}: 'min' ({}) should be below 'max' ({})", ctx, m_params.min, m_params.max)};
    }
    if (m_params.scaler.isZero() || m_params.scaler > scalerMax) {
        throw Error{
            ErrorCode::InvalidConfiguration,
            fmt::format(
                "{}: 'scaler' should be within (0, {}]; was {}", ctx, scalerMax, m_params.scaler)};
    }
}

//-------------------------------------------------------------------------

decimal_t AdaptiveSpreadPolicy::spread(Timestamp now) const
{
    const decimal_t response =
        m_params.scaler * decimal_t{accumulator(now)}.divBalance(Balance{kResponseUnit});
    return std::clamp(m_params.min + response, m_params.min, m_params.max);
}

//-------------------------------------------------------------------------

void AdaptiveSpreadPolicy::recordVolume(const Balance& stableAmount, Timestamp now)
{
    m_accumulator = accumulator(now);
    m_anchor += elapsedPeriods(now) * kDecayPeriod;
    m_accumulator += stableAmount / util::narrow(util::pow10(kStableDecimals));
}

//-------------------------------------------------------------------------

Balance AdaptiveSpreadPolicy::accumulator(Timestamp now) const
{
    const uint64_t periods = elapsedPeriods(now);
    if (periods == 0 || m_accumulator.is_zero()) {
        return m_accumulator;
    }
    return (decimal_t::one() - m_params.scaler).pow(periods).floorMulBalance(m_accumulator);
}

//-------------------------------------------------------------------------

void AdaptiveSpreadPolicy::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("type", "adaptive", allocator);
        json.AddMember("min", json::decimal2json(m_params.min, allocator), allocator);
        json.AddMember("max", json::decimal2json(m_params.max, allocator), allocator);
        json.AddMember("scaler", json::decimal2json(m_params.scaler, allocator), allocator);
        json.AddMember("accumulator", json::balance2json(m_accumulator, allocator), allocator);
        json.AddMember("anchor", rapidjson::Value{m_anchor}, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

std::unique_ptr<AdaptiveSpreadPolicy> AdaptiveSpreadPolicy::fromXML(
    pugi::xml_node node, Timestamp now)
{
    return std::make_unique<AdaptiveSpreadPolicy>(
        AdaptiveSpreadParams{
            .min = xml::getDecimal(node, "min"),
            .max = xml::getDecimal(node, "max"),
            .scaler = xml::getDecimal(node, "scaler")
        },
        now);
}

//-------------------------------------------------------------------------

uint64_t AdaptiveSpreadPolicy::elapsedPeriods(Timestamp now) const noexcept
{
    return now > m_anchor ? (now - m_anchor) / kDecayPeriod : 0;
}

//-------------------------------------------------------------------------

}  // namespace stablecore::exchange

//-------------------------------------------------------------------------
