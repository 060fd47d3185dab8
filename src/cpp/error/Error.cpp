/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "stablecore/error/Error.hpp"

#include <magic_enum.hpp>

//-------------------------------------------------------------------------

namespace stablecore
{

//-------------------------------------------------------------------------

std::string_view errorCode2String(ErrorCode code) noexcept
{
    const auto name = magic_enum::enum_name(code);
    return !name.empty() ? name : std::string_view{"Unknown ErrorCode"};
}

//-------------------------------------------------------------------------

}  // namespace stablecore

//-------------------------------------------------------------------------
