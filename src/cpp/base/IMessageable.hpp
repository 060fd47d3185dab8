/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "stablecore/message/Message.hpp"

//-------------------------------------------------------------------------

class Host;

//-------------------------------------------------------------------------

class IMessageable
{
public:
    virtual ~IMessageable() = default;

    const std::string& name() const noexcept { return m_name; }
    Host* host() const noexcept { return m_host; }

    virtual void receiveMessage(Message::Ptr msg) = 0;

    virtual void respondToMessage(
        Message::Ptr msg,
        const std::string& typePrefix,
        MessagePayload::Ptr payload,
        Timestamp processingDelay = 0) const;

    virtual void respondToMessage(
        Message::Ptr msg, MessagePayload::Ptr payload, Timestamp processingDelay = 0) const;

protected:
    IMessageable(Host* host, const std::string& name) noexcept
        : m_host{host}, m_name{name}
    {}

private:
    Host* m_host;
    std::string m_name;
};

//-------------------------------------------------------------------------
