/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "stablecore/message/MessageQueue.hpp"

//-------------------------------------------------------------------------

bool MessageQueue::CompareQueueMessages::operator()(
    const MessageWithId& lhs, const MessageWithId& rhs) const
{
    if (lhs.msg->arrival != rhs.msg->arrival) [[likely]] {
        return lhs.msg->arrival > rhs.msg->arrival;
    }
    return lhs.id > rhs.id;
}

//-------------------------------------------------------------------------
