/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "stablecore/message/MessagePayload.hpp"

//-------------------------------------------------------------------------

struct Message : public JsonSerializable
{
    using Ptr = std::shared_ptr<Message>;

    Timestamp occurrence;
    Timestamp arrival;
    std::string source;
    std::string target;
    std::string type;
    MessagePayload::Ptr payload;
    // A request whose response would arrive after the deadline is dropped
    // by the host before delivery.
    std::optional<Timestamp> deadline;

    Message(
        Timestamp occurrence,
        Timestamp arrival,
        std::string source,
        std::string target,
        std::string type,
        MessagePayload::Ptr payload,
        std::optional<Timestamp> deadline = {}) noexcept
        : occurrence{occurrence},
          arrival{arrival},
          source{std::move(source)},
          target{std::move(target)},
          type{std::move(type)},
          payload{std::move(payload)},
          deadline{deadline}
    {}

    // Replies travel back with the same delay as the request.
    [[nodiscard]] Timestamp responseArrival() const noexcept
    {
        return arrival + (arrival - occurrence);
    }

    [[nodiscard]] bool expired() const noexcept
    {
        return deadline && responseArrival() > *deadline;
    }

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

    template<typename... Args>
    requires std::constructible_from<Message, Args...>
    [[nodiscard]] static Ptr create(Args&&... args)
    {
        return std::make_shared<Message>(std::forward<Args>(args)...);
    }
};

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<Message>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const Message& msg, FormatContext& ctx) const
    {
        rapidjson::Document json;
        msg.jsonSerialize(json);
        return fmt::format_to(ctx.out(), "{}", stablecore::json::json2str(json));
    }
};

//-------------------------------------------------------------------------
