/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <cstdint>

//-------------------------------------------------------------------------
// Host time, in milliseconds.

using Timestamp = uint64_t;
using DurationSec = uint32_t;

inline constexpr Timestamp TIMESTAMP_INVALID = 0;
inline constexpr Timestamp kMillisPerSecond = 1000;
inline constexpr Timestamp kMillisPerYear = 31'536'000'000;

[[nodiscard]] constexpr Timestamp sec2ms(DurationSec sec) noexcept
{
    return Timestamp{sec} * kMillisPerSecond;
}

//-------------------------------------------------------------------------
