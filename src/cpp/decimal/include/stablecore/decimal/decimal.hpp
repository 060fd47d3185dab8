/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <boost/multiprecision/cpp_int.hpp>
#include <fmt/format.h>

#include <compare>
#include <cstdint>
#include <string>
#include <string_view>

//-------------------------------------------------------------------------

namespace stablecore
{

namespace bmp = boost::multiprecision;

using Balance = bmp::number<
    bmp::cpp_int_backend<128, 128, bmp::unsigned_magnitude, bmp::checked, void>>;

using WideUint = bmp::number<
    bmp::cpp_int_backend<384, 384, bmp::unsigned_magnitude, bmp::checked, void>>;

inline constexpr uint32_t kMaxRatio = 10'000;

//-------------------------------------------------------------------------
// Unsigned fixed point with 27 fractional digits. Products and quotients
// round half up; conversions back to balances state their rounding.

class FixedDecimal
{
public:
    static constexpr uint32_t kNumDecimals = 27;

    FixedDecimal() noexcept = default;
    FixedDecimal(uint64_t val) : m_raw{WideUint{val} * scale()} {}
    explicit FixedDecimal(const Balance& val) : m_raw{WideUint{val} * scale()} {}

    [[nodiscard]] const WideUint& raw() const noexcept { return m_raw; }

    FixedDecimal& operator+=(const FixedDecimal& other);
    FixedDecimal& operator-=(const FixedDecimal& other);

    [[nodiscard]] FixedDecimal operator+(const FixedDecimal& other) const;
    [[nodiscard]] FixedDecimal operator-(const FixedDecimal& other) const;
    [[nodiscard]] FixedDecimal operator*(const FixedDecimal& other) const;
    [[nodiscard]] FixedDecimal operator/(const FixedDecimal& other) const;

    [[nodiscard]] bool operator==(const FixedDecimal& other) const noexcept
    {
        return m_raw == other.m_raw;
    }

    [[nodiscard]] std::strong_ordering operator<=>(const FixedDecimal& other) const noexcept
    {
        const int cmp = m_raw.compare(other.m_raw);
        if (cmp < 0) return std::strong_ordering::less;
        if (cmp > 0) return std::strong_ordering::greater;
        return std::strong_ordering::equal;
    }

    [[nodiscard]] bool isZero() const noexcept { return m_raw.is_zero(); }

    [[nodiscard]] FixedDecimal pow(uint64_t exponent) const;
    [[nodiscard]] FixedDecimal mulRatio(uint32_t ratio) const;
    [[nodiscard]] FixedDecimal divRatio(uint32_t ratio) const;
    [[nodiscard]] FixedDecimal divBalance(const Balance& divisor) const;

    [[nodiscard]] Balance roundMulBalance(const Balance& val) const;
    [[nodiscard]] Balance floorMulBalance(const Balance& val) const;
    [[nodiscard]] Balance toBalance() const;

    [[nodiscard]] std::string toString() const;

    [[nodiscard]] static FixedDecimal fromRaw(WideUint raw) noexcept;
    [[nodiscard]] static FixedDecimal fromRatio(uint32_t ratio);
    [[nodiscard]] static FixedDecimal fromMillionths(uint32_t rate);
    [[nodiscard]] static FixedDecimal fromBalancePrice(
        const Balance& balance,
        const Balance& multiplier,
        uint8_t priceDecimals,
        uint8_t extraDecimals = 0);
    [[nodiscard]] static FixedDecimal fromString(std::string_view str);

    [[nodiscard]] static FixedDecimal zero() noexcept { return {}; }
    [[nodiscard]] static FixedDecimal one() { return FixedDecimal{1}; }

    [[nodiscard]] static const WideUint& scale();

private:
    WideUint m_raw{};
};

using decimal_t = FixedDecimal;

}  // namespace stablecore

//-------------------------------------------------------------------------

namespace stablecore::util
{

[[nodiscard]] WideUint pow10(uint32_t exponent);

[[nodiscard]] Balance narrow(const WideUint& val);

[[nodiscard]] Balance u128Ratio(
    const Balance& a, const Balance& num, const Balance& denom, bool roundUp);

[[nodiscard]] Balance ratio(const Balance& balance, uint32_t r);

[[nodiscard]] Balance convertDecimals(
    const Balance& amount, uint8_t decimalsFrom, uint8_t decimalsTo);

[[nodiscard]] Balance parseBalance(std::string_view str);

}  // namespace stablecore::util

//-------------------------------------------------------------------------

namespace stablecore::literals
{

[[nodiscard]] inline decimal_t operator"" _dec(unsigned long long int val)
{
    return decimal_t{static_cast<uint64_t>(val)};
}

[[nodiscard]] inline Balance operator"" _bal(const char* digits)
{
    return util::parseBalance(digits);
}

}  // namespace stablecore::literals

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<stablecore::decimal_t>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const stablecore::decimal_t& val, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", val.toString());
    }
};

template<>
struct fmt::formatter<stablecore::Balance>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const stablecore::Balance& val, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", val.str());
    }
};

//-------------------------------------------------------------------------
