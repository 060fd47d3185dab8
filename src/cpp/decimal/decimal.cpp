/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "stablecore/decimal/decimal.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <source_location>
#include <stdexcept>

//-------------------------------------------------------------------------

namespace stablecore
{

//-------------------------------------------------------------------------

namespace
{

// Accumulates base-10 digits; boost's string constructor would read a
// leading zero as an octal prefix.
WideUint digits2wide(std::string_view digits)
{
    WideUint res;
    for (char c : digits) {
        res = res * 10 + static_cast<uint32_t>(c - '0');
    }
    return res;
}

}  // namespace

//-------------------------------------------------------------------------

const WideUint& FixedDecimal::scale()
{
    static const WideUint s_scale = util::pow10(kNumDecimals);
    return s_scale;
}

//-------------------------------------------------------------------------

FixedDecimal& FixedDecimal::operator+=(const FixedDecimal& other)
{
    m_raw += other.m_raw;
    return *this;
}

//-------------------------------------------------------------------------

FixedDecimal& FixedDecimal::operator-=(const FixedDecimal& other)
{
    m_raw -= other.m_raw;
    return *this;
}

//-------------------------------------------------------------------------

FixedDecimal FixedDecimal::operator+(const FixedDecimal& other) const
{
    return fromRaw(m_raw + other.m_raw);
}

//-------------------------------------------------------------------------

FixedDecimal FixedDecimal::operator-(const FixedDecimal& other) const
{
    return fromRaw(m_raw - other.m_raw);
}

//-------------------------------------------------------------------------

FixedDecimal FixedDecimal::operator*(const FixedDecimal& other) const
{
    return fromRaw((m_raw * other.m_raw + scale() / 2) / scale());
}

//-------------------------------------------------------------------------

FixedDecimal FixedDecimal::operator/(const FixedDecimal& other) const
{
    if (other.isZero()) {
        throw std::domain_error{fmt::format(
            "{}: division by zero", std::source_location::current().function_name())};
    }
    return fromRaw((m_raw * scale() + other.m_raw / 2) / other.m_raw);
}

//-------------------------------------------------------------------------

FixedDecimal FixedDecimal::pow(uint64_t exponent) const
{
    FixedDecimal res = one();
    FixedDecimal x = *this;
    while (exponent != 0) {
        if ((exponent & 1) != 0) {
            res = res * x;
        }
        exponent >>= 1;
        if (exponent != 0) {
            x = x * x;
        }
    }
    return res;
}

//-------------------------------------------------------------------------

FixedDecimal FixedDecimal::mulRatio(uint32_t ratio) const
{
    return fromRaw((m_raw * ratio + kMaxRatio / 2) / kMaxRatio);
}

//-------------------------------------------------------------------------

FixedDecimal FixedDecimal::divRatio(uint32_t ratio) const
{
    if (ratio == 0) {
        throw std::domain_error{fmt::format(
            "{}: division by zero ratio", std::source_location::current().function_name())};
    }
    return fromRaw((m_raw * kMaxRatio + ratio / 2) / ratio);
}

//-------------------------------------------------------------------------

FixedDecimal FixedDecimal::divBalance(const Balance& divisor) const
{
    if (divisor.is_zero()) {
        throw std::domain_error{fmt::format(
            "{}: division by zero balance", std::source_location::current().function_name())};
    }
    return fromRaw(m_raw / WideUint{divisor});
}

//-------------------------------------------------------------------------

Balance FixedDecimal::roundMulBalance(const Balance& val) const
{
    return util::narrow((m_raw * WideUint{val} + scale() / 2) / scale());
}

//-------------------------------------------------------------------------

Balance FixedDecimal::floorMulBalance(const Balance& val) const
{
    return util::narrow(m_raw * WideUint{val} / scale());
}

//-------------------------------------------------------------------------

Balance FixedDecimal::toBalance() const
{
    return util::narrow(m_raw / scale());
}

//-------------------------------------------------------------------------

std::string FixedDecimal::toString() const
{
    const WideUint integral = m_raw / scale();
    const WideUint fractional = m_raw % scale();
    if (fractional.is_zero()) {
        return fmt::format("{}.0", integral.str());
    }
    std::string digits = fractional.str();
    digits.insert(0, kNumDecimals - digits.size(), '0');
    digits.erase(digits.find_last_not_of('0') + 1);
    return fmt::format("{}.{}", integral.str(), digits);
}

//-------------------------------------------------------------------------

FixedDecimal FixedDecimal::fromRaw(WideUint raw) noexcept
{
    FixedDecimal res;
    res.m_raw = std::move(raw);
    return res;
}

//-------------------------------------------------------------------------

FixedDecimal FixedDecimal::fromRatio(uint32_t ratio)
{
    return fromRaw(WideUint{ratio} * (scale() / kMaxRatio));
}

//-------------------------------------------------------------------------

FixedDecimal FixedDecimal::fromMillionths(uint32_t rate)
{
    static const WideUint s_millionth = scale() / 1'000'000;
    return fromRaw(WideUint{rate} * s_millionth);
}

//-------------------------------------------------------------------------

FixedDecimal FixedDecimal::fromBalancePrice(
    const Balance& balance,
    const Balance& multiplier,
    uint8_t priceDecimals,
    uint8_t extraDecimals)
{
    const WideUint num = WideUint{multiplier} * WideUint{balance};
    const uint32_t denominatorDecimals = uint32_t{priceDecimals} + extraDecimals;
    if (denominatorDecimals > kNumDecimals) {
        return fromRaw(num / util::pow10(denominatorDecimals - kNumDecimals));
    }
    return fromRaw(num * util::pow10(kNumDecimals - denominatorDecimals));
}

//-------------------------------------------------------------------------

FixedDecimal FixedDecimal::fromString(std::string_view str)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    const auto dot = str.find('.');
    const std::string_view integral = str.substr(0, dot);
    const std::string_view fractional =
        dot == std::string_view::npos ? std::string_view{} : str.substr(dot + 1);

    auto isDigits = [](std::string_view s) {
        return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
    };
    if (integral.empty() || !isDigits(integral) || !isDigits(fractional)) {
        throw std::invalid_argument{fmt::format("{}: Malformed decimal '{}'", ctx, str)};
    }
    if (fractional.size() > kNumDecimals) {
        throw std::invalid_argument{fmt::format(
            "{}: More than {} fractional digits in '{}'", ctx, kNumDecimals, str)};
    }

    std::string padded{fractional};
    padded.append(kNumDecimals - padded.size(), '0');
    return fromRaw(digits2wide(integral) * scale() + digits2wide(padded));
}

//-------------------------------------------------------------------------

}  // namespace stablecore

//-------------------------------------------------------------------------

namespace stablecore::util
{

//-------------------------------------------------------------------------

WideUint pow10(uint32_t exponent)
{
    return bmp::pow(WideUint{10}, exponent);
}

//-------------------------------------------------------------------------

Balance narrow(const WideUint& val)
{
    if (val > WideUint{std::numeric_limits<Balance>::max()}) {
        throw std::overflow_error{fmt::format(
            "{}: {} does not fit into a balance",
            std::source_location::current().function_name(), val.str())};
    }
    return static_cast<Balance>(val);
}

//-------------------------------------------------------------------------

Balance u128Ratio(const Balance& a, const Balance& num, const Balance& denom, bool roundUp)
{
    const WideUint extra = roundUp ? WideUint{denom} - 1 : WideUint{};
    return narrow((WideUint{a} * WideUint{num} + extra) / WideUint{denom});
}

//-------------------------------------------------------------------------

Balance ratio(const Balance& balance, uint32_t r)
{
    if (r > kMaxRatio) {
        throw std::invalid_argument{fmt::format(
            "{}: ratio should be <= {}, was {}",
            std::source_location::current().function_name(), kMaxRatio, r)};
    }
    return u128Ratio(balance, Balance{r}, Balance{kMaxRatio}, false);
}

//-------------------------------------------------------------------------

Balance convertDecimals(const Balance& amount, uint8_t decimalsFrom, uint8_t decimalsTo)
{
    if (decimalsFrom < decimalsTo) {
        return narrow(WideUint{amount} * pow10(decimalsTo - decimalsFrom));
    } else if (decimalsFrom > decimalsTo) {
        return narrow(WideUint{amount} / pow10(decimalsFrom - decimalsTo));
    }
    return amount;
}

//-------------------------------------------------------------------------

Balance parseBalance(std::string_view str)
{
    std::string digits;
    digits.reserve(str.size());
    for (char c : str) {
        if (c == '\'') continue;
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw std::invalid_argument{fmt::format(
                "{}: Malformed balance '{}'",
                std::source_location::current().function_name(), str)};
        }
        digits.push_back(c);
    }
    if (digits.empty()) {
        throw std::invalid_argument{fmt::format(
            "{}: Empty balance string", std::source_location::current().function_name())};
    }
    return narrow(digits2wide(digits));
}

//-------------------------------------------------------------------------

}  // namespace stablecore::util

//-------------------------------------------------------------------------
