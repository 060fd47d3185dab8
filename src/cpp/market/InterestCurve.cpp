/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "stablecore/market/InterestCurve.hpp"

#include "stablecore/error/Error.hpp"
#include "xml_util.hpp"

#include <stdexcept>

//-------------------------------------------------------------------------

namespace stablecore::market
{

//-------------------------------------------------------------------------

decimal_t InterestCurve::rate(const decimal_t& utilization) const
{
    const decimal_t kinkPoint = decimal_t::fromRatio(kink);
    if (utilization < kinkPoint) {
        return decimal_t::one() + baseRate + utilization * slope1;
    }
    return decimal_t::one() + baseRate + kinkPoint * slope1 + (utilization - kinkPoint) * slope2;
}

//-------------------------------------------------------------------------

void InterestCurve::validate() const
{
    static constexpr auto ctx = std::source_location::current();

    if (kink >= kMaxRatio) {
        raise(
            ErrorCode::InvalidConfiguration, ctx, "'kink' should be < {}; was {}", kMaxRatio, kink);
    }
    if (slope2 < slope1) {
        raise(
            ErrorCode::InvalidConfiguration,
            ctx,
            "'slope2' ({}) should not be below 'slope1' ({})", slope2, slope1);
    }
    if (!(decimal_t::one() + baseRate + slope2 < decimal_t{2})) {
        raise(
            ErrorCode::InvalidConfiguration,
            ctx,
            "Per-millisecond rate would reach 2 with base {} and slope2 {}", baseRate, slope2);
    }
    // The borrow APR peaks at full utilization and has to stay representable.
    try {
        (void)rate2apr(rate(decimal_t::one()));
    }
    catch (const std::overflow_error&) {
        raise(
            ErrorCode::InvalidConfiguration,
            ctx,
            "Borrow APR at full utilization overflows with base {} and slope2 {}",
            baseRate, slope2);
    }
}

//-------------------------------------------------------------------------

void InterestCurve::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("baseRate", json::decimal2json(baseRate, allocator), allocator);
        json.AddMember("slope1", json::decimal2json(slope1, allocator), allocator);
        json.AddMember("slope2", json::decimal2json(slope2, allocator), allocator);
        json.AddMember("kink", rapidjson::Value{kink}, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

InterestCurve InterestCurve::fromXML(pugi::xml_node node)
{
    InterestCurve curve{
        .baseRate = xml::getDecimal(node, "baseRate", decimal_t{}),
        .slope1 = xml::getDecimal(node, "slope1", decimal_t{}),
        .slope2 = xml::getDecimal(node, "slope2", decimal_t{}),
        .kink = xml::getUint<uint32_t>(node, "kink", 0)
    };
    curve.validate();
    return curve;
}

//-------------------------------------------------------------------------

decimal_t rate2apr(const decimal_t& rate)
{
    return rate.pow(kMillisPerYear) - decimal_t::one();
}

//-------------------------------------------------------------------------

}  // namespace stablecore::market

//-------------------------------------------------------------------------
