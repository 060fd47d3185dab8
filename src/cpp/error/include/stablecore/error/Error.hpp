/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <fmt/format.h>

#include <cstdint>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>

//-------------------------------------------------------------------------

namespace stablecore
{

//-------------------------------------------------------------------------

enum class ErrorCode : uint8_t
{
    StalePrice,
    UnknownAsset,
    AssetDisabled,
    SlippageExceeded,
    BelowMinimumExchange,
    InsufficientBalance,
    InsufficientCollateral,
    NotLiquidatable,
    Unauthorized,
    InvalidConfiguration,
    InvalidArgument,
    ExternalCallFailed
};

[[nodiscard]] std::string_view errorCode2String(ErrorCode code) noexcept;

//-------------------------------------------------------------------------

class Error : public std::runtime_error
{
public:
    Error(ErrorCode code, const std::string& message)
        : std::runtime_error{message}, m_code{code}
    {}

    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

private:
    ErrorCode m_code;
};

//-------------------------------------------------------------------------

template<typename... Args>
[[noreturn]] void raise(
    ErrorCode code,
    std::source_location sl,
    fmt::format_string<Args...> fmt,
    Args&&... args)
{
    throw Error{
        code,
        fmt::format(
            "{}: {}: {}",
            sl.function_name(),
            errorCode2String(code),
            fmt::format(fmt, std::forward<Args>(args)...))};
}

//-------------------------------------------------------------------------

}  // namespace stablecore

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<stablecore::ErrorCode>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(stablecore::ErrorCode code, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", stablecore::errorCode2String(code));
    }
};

//-------------------------------------------------------------------------
