/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "stablecore/decimal/decimal.hpp"

#include <pugixml.hpp>

#include <charconv>
#include <concepts>
#include <cstdint>
#include <string_view>

//-------------------------------------------------------------------------

namespace stablecore::xml
{

//-------------------------------------------------------------------------

// Malformed or missing values raise InvalidConfiguration naming the attribute and its element.

[[nodiscard]] pugi::xml_attribute requireAttribute(pugi::xml_node node, const char* name);

[[noreturn]] void raiseMalformed(pugi::xml_node node, const char* name, std::string_view reason);

// Rejects signs, blanks, trailing garbage and values that do not fit T.
template<std::unsigned_integral T = uint64_t>
[[nodiscard]] T getUint(pugi::xml_node node, const char* name)
{
    const std::string_view text = requireAttribute(node, name).as_string();
    T value{};
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec == std::errc::result_out_of_range) {
        raiseMalformed(node, name, "value out of range");
    }
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        raiseMalformed(node, name, "expected an unsigned integer");
    }
    return value;
}

template<std::unsigned_integral T = uint64_t>
[[nodiscard]] T getUint(pugi::xml_node node, const char* name, T fallback)
{
    return node.attribute(name) ? getUint<T>(node, name) : fallback;
}

[[nodiscard]] decimal_t getDecimal(pugi::xml_node node, const char* name);
[[nodiscard]] decimal_t getDecimal(pugi::xml_node node, const char* name, decimal_t fallback);

[[nodiscard]] Balance getBalance(pugi::xml_node node, const char* name);
[[nodiscard]] Balance getBalance(pugi::xml_node node, const char* name, Balance fallback);

//-------------------------------------------------------------------------

}  // namespace stablecore::xml

//-------------------------------------------------------------------------
