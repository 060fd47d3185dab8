/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "xml_util.hpp"

#include "stablecore/error/Error.hpp"

#include <stdexcept>
#include <string_view>

//-------------------------------------------------------------------------

namespace stablecore::xml
{

//-------------------------------------------------------------------------

namespace
{

template<typename T, typename Parse>
[[nodiscard]] T parseAttribute(pugi::xml_node node, const char* name, Parse parse)
{
    const std::string_view text = requireAttribute(node, name).as_string();
    try {
        return parse(text);
    }
    catch (const std::invalid_argument& e) {
        raiseMalformed(node, name, e.what());
    }
    catch (const std::overflow_error& e) {
        raiseMalformed(node, name, e.what());
    }
}

}  // namespace

//-------------------------------------------------------------------------

pugi::xml_attribute requireAttribute(pugi::xml_node node, const char* name)
{
    if (pugi::xml_attribute attr = node.attribute(name)) {
        return attr;
    }
    raise(
        ErrorCode::InvalidConfiguration,
        std::source_location::current(),
        "Missing required attribute '{}' on <{}>", name, node.name());
}

//-------------------------------------------------------------------------

void raiseMalformed(pugi::xml_node node, const char* name, std::string_view reason)
{
    raise(
        ErrorCode::InvalidConfiguration,
        std::source_location::current(),
        "Malformed attribute '{}=\"{}\"' on <{}>: {}",
        name, node.attribute(name).as_string(), node.name(), reason);
}

//-------------------------------------------------------------------------

decimal_t getDecimal(pugi::xml_node node, const char* name)
{
    return parseAttribute<decimal_t>(node, name, [](std::string_view text) {
        return decimal_t::fromString(text);
    });
}

decimal_t getDecimal(pugi::xml_node node, const char* name, decimal_t fallback)
{
    return node.attribute(name) ? getDecimal(node, name) : fallback;
}

//-------------------------------------------------------------------------

Balance getBalance(pugi::xml_node node, const char* name)
{
    return parseAttribute<Balance>(node, name, [](std::string_view text) {
        return util::parseBalance(text);
    });
}

Balance getBalance(pugi::xml_node node, const char* name, Balance fallback)
{
    return node.attribute(name) ? getBalance(node, name) : fallback;
}

//-------------------------------------------------------------------------

}  // namespace stablecore::xml

//-------------------------------------------------------------------------
