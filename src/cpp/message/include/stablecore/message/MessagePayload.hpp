/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "JsonSerializable.hpp"
#include "common.hpp"

//-------------------------------------------------------------------------

struct MessagePayload : public JsonSerializable
{
    using Ptr = std::shared_ptr<MessagePayload>;

    virtual ~MessagePayload() noexcept = default;

    template<typename T, typename... Args>
    requires std::derived_from<T, MessagePayload> && std::constructible_from<T, Args...>
    [[nodiscard]] static std::shared_ptr<T> create(Args&&... args)
    {
        return std::make_shared<T>(std::forward<Args>(args)...);
    }

protected:
    MessagePayload() noexcept = default;
};

//-------------------------------------------------------------------------

struct ErrorResponsePayload : public MessagePayload
{
    using Ptr = std::shared_ptr<ErrorResponsePayload>;

    std::string message;

    ErrorResponsePayload(std::string message) : message{std::move(message)} {}

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;
};

//-------------------------------------------------------------------------

struct EmptyPayload : public MessagePayload
{
    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;
};

//-------------------------------------------------------------------------
