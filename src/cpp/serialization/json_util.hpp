/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "stablecore/decimal/decimal.hpp"

#include <rapidjson/document.h>

#include <functional>
#include <optional>
#include <string>

//-------------------------------------------------------------------------

namespace stablecore::json
{

//-------------------------------------------------------------------------

struct IndentOptions
{
    char indentChar = ' ';
    uint8_t indentCharCount = 4;
};

struct FormatOptions
{
    std::optional<IndentOptions> indent = {};
};

[[nodiscard]] std::string json2str(
    const rapidjson::Value& json, const FormatOptions& formatOptions = {});

// Balances and decimals travel as strings; 128-bit values do not fit a Json number.
[[nodiscard]] rapidjson::Value decimal2json(
    const decimal_t& val, rapidjson::Document::AllocatorType& allocator);
[[nodiscard]] rapidjson::Value balance2json(
    const Balance& val, rapidjson::Document::AllocatorType& allocator);

void serializeHelper(
    rapidjson::Document& json,
    const std::string& key,
    std::function<void(rapidjson::Document&)> serializer);

template<typename T>
void setOptionalMember(rapidjson::Document& json, const std::string& key, std::optional<T> opt)
{
    auto& allocator = json.GetAllocator();
    rapidjson::Value member;
    if (opt.has_value()) {
        if constexpr (std::same_as<T, Balance>) {
            member = balance2json(*opt, allocator);
        } else if constexpr (std::same_as<T, std::string>) {
            member.SetString(opt->c_str(), allocator);
        } else {
            member = rapidjson::Value{*opt};
        }
    }
    json.AddMember(rapidjson::Value{key.c_str(), allocator}, member, allocator);
}

//-------------------------------------------------------------------------

}  // namespace stablecore::json

//-------------------------------------------------------------------------
