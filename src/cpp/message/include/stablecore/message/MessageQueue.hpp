/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "stablecore/message/Message.hpp"

#include <queue>

//-------------------------------------------------------------------------

// Messages in arrival order; equal arrivals keep dispatch order.
class MessageQueue
{
public:
    MessageQueue() noexcept = default;

    [[nodiscard]] Message::Ptr top() const { return m_queue.top().msg; }
    [[nodiscard]] bool empty() const { return m_queue.empty(); }
    [[nodiscard]] size_t size() const { return m_queue.size(); }

    void push(Message::Ptr msg) { m_queue.emplace(std::move(msg), m_idCounter++); }
    void pop() { m_queue.pop(); }

private:
    struct MessageWithId
    {
        Message::Ptr msg;
        uint64_t id;

        MessageWithId(Message::Ptr msg, uint64_t id) noexcept : msg{std::move(msg)}, id{id} {}
    };

    struct CompareQueueMessages
    {
        bool operator()(const MessageWithId& lhs, const MessageWithId& rhs) const;
    };

    std::priority_queue<MessageWithId, std::vector<MessageWithId>, CompareQueueMessages> m_queue;
    uint64_t m_idCounter{};
};

//-------------------------------------------------------------------------
