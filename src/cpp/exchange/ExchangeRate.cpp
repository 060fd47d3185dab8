/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "stablecore/exchange/ExchangeRate.hpp"

#include "stablecore/error/Error.hpp"

//-------------------------------------------------------------------------

namespace stablecore::exchange
{

//-------------------------------------------------------------------------

Balance ExchangeRate::nativeToStable(const Balance& nativeAmount) const
{
    const WideUint num = WideUint{nativeAmount} * WideUint{multiplier};
    if (decimals >= kStableDecimals) {
        return util::narrow(num / util::pow10(decimals - kStableDecimals));
    }
    return util::narrow(num * util::pow10(kStableDecimals - decimals));
}

//-------------------------------------------------------------------------

Balance ExchangeRate::stableToNative(const Balance& stableAmount) const
{
    if (multiplier.is_zero()) {
        raise(
            ErrorCode::InvalidArgument,
            std::source_location::current(),
            "Exchange rate multiplier is zero");
    }
    if (decimals >= kStableDecimals) {
        return util::narrow(
            WideUint{stableAmount} * util::pow10(decimals - kStableDecimals)
            / WideUint{multiplier});
    }
    return util::narrow(
        WideUint{stableAmount}
        / (WideUint{multiplier} * util::pow10(kStableDecimals - decimals)));
}

//-------------------------------------------------------------------------

Balance ExchangeRate::collateralisedStable(
    const Balance& nativeAmount, uint32_t collateralRatio) const
{
    if (collateralRatio == 0) {
        raise(
            ErrorCode::InvalidArgument,
            std::source_location::current(),
            "Collateral ratio is zero");
    }
    const WideUint num = WideUint{nativeAmount} * WideUint{multiplier} * 100;
    if (decimals >= kStableDecimals) {
        return util::narrow(
            num / (util::pow10(decimals - kStableDecimals) * WideUint{collateralRatio}));
    }
    return util::narrow(
        num * util::pow10(kStableDecimals - decimals) / WideUint{collateralRatio});
}

//-------------------------------------------------------------------------

decimal_t ExchangeRate::normalised() const
{
    return decimal_t::fromBalancePrice(
        util::narrow(util::pow10(kStableDecimals)), multiplier, decimals);
}

//-------------------------------------------------------------------------

void ExchangeRate::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("multiplier", json::balance2json(multiplier, allocator), allocator);
        json.AddMember("decimals", rapidjson::Value{decimals}, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

void ExpectedRate::check(const ExchangeRate& realised) const
{
    const decimal_t expected =
        ExchangeRate{.multiplier = multiplier, .decimals = decimals}.normalised();
    const decimal_t actual = realised.normalised();
    const decimal_t deviation = actual > expected ? actual - expected : expected - actual;
    const decimal_t tolerance = expected * decimal_t::fromMillionths(slippage);

    if (deviation > tolerance) {
        raise(
            ErrorCode::SlippageExceeded,
            std::source_location::current(),
            "Rate {} deviates from expected {} by {}, tolerance {}",
            actual, expected, deviation, tolerance);
    }
}

//-------------------------------------------------------------------------

}  // namespace stablecore::exchange

//-------------------------------------------------------------------------
