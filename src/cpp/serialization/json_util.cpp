/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "json_util.hpp"

#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

//-------------------------------------------------------------------------

namespace stablecore::json
{

//-------------------------------------------------------------------------

std::string json2str(const rapidjson::Value& json, const FormatOptions& formatOptions)
{
    rapidjson::StringBuffer buffer;
    if (formatOptions.indent.has_value()) {
        const auto& opts = formatOptions.indent.value();
        rapidjson::PrettyWriter<rapidjson::StringBuffer> writer{buffer};
        writer.SetIndent(opts.indentChar, opts.indentCharCount);
        json.Accept(writer);
    } else {
        rapidjson::Writer<rapidjson::StringBuffer> writer{buffer};
        json.Accept(writer);
    }
    return buffer.GetString();
}

//-------------------------------------------------------------------------

rapidjson::Value decimal2json(
    const decimal_t& val, rapidjson::Document::AllocatorType& allocator)
{
    return rapidjson::Value{val.toString().c_str(), allocator};
}

//-------------------------------------------------------------------------

rapidjson::Value balance2json(
    const Balance& val, rapidjson::Document::AllocatorType& allocator)
{
    return rapidjson::Value{val.str().c_str(), allocator};
}

//-------------------------------------------------------------------------

void serializeHelper(
    rapidjson::Document& json,
    const std::string& key,
    std::function<void(rapidjson::Document&)> serializer)
{
    if (key.empty()) return serializer(json);
    auto& allocator = json.GetAllocator();
    rapidjson::Document subJson{&allocator};
    serializer(subJson);
    json.AddMember(rapidjson::Value{key.c_str(), allocator}, subJson, allocator);
}

//-------------------------------------------------------------------------

}  // namespace stablecore::json

//-------------------------------------------------------------------------
