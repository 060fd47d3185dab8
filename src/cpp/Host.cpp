/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "Host.hpp"

#include <source_location>
#include <stdexcept>

//-------------------------------------------------------------------------

Host::Host(Timestamp start)
    : IMessageable{this, "HOST"}, m_time{start}
{}

//-------------------------------------------------------------------------

void Host::dispatchMessage(
    Timestamp occurrence,
    Timestamp delay,
    const std::string& source,
    const std::string& target,
    const std::string& type,
    MessagePayload::Ptr payload,
    std::optional<Timestamp> deadline) const
{
    queueMessage(Message::create(
        occurrence, occurrence + delay, source, target, type, std::move(payload), deadline));
}

//-------------------------------------------------------------------------

void Host::queueMessage(Message::Ptr msg) const
{
    m_messageQueue.push(std::move(msg));
}

//-------------------------------------------------------------------------

void Host::addParticipant(std::unique_ptr<IMessageable> participant)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (participant == nullptr) {
        throw std::invalid_argument{fmt::format("{}: participant cannot be null", ctx)};
    }
    const std::string name = participant->name();
    if (name == this->name() || m_participants.contains(name)) {
        throw std::invalid_argument{fmt::format(
            "{}: participant name '{}' is already taken", ctx, name)};
    }
    m_participants.emplace(name, std::move(participant));
}

//-------------------------------------------------------------------------

IMessageable* Host::participant(const std::string& name) const noexcept
{
    auto it = m_participants.find(name);
    return it != m_participants.end() ? it->second.get() : nullptr;
}

//-------------------------------------------------------------------------

Timestamp Host::latency(const std::string& name) const noexcept
{
    auto it = m_latencies.find(name);
    return it != m_latencies.end() ? it->second : 0;
}

//-------------------------------------------------------------------------

void Host::setLatency(const std::string& name, Timestamp latency)
{
    m_latencies.insert_or_assign(name, latency);
}

//-------------------------------------------------------------------------

void Host::runUntil(Timestamp cutoff)
{
    while (!m_messageQueue.empty() && m_messageQueue.top()->arrival <= cutoff) {
        step();
    }
    updateTime(cutoff);
}

//-------------------------------------------------------------------------

void Host::runUntilIdle()
{
    while (!m_messageQueue.empty()) {
        step();
    }
}

//-------------------------------------------------------------------------

void Host::receiveMessage(Message::Ptr msg)
{
    logDebug("HOST received {}", msg->type);
}

//-------------------------------------------------------------------------

void Host::step()
{
    Message::Ptr msg = m_messageQueue.top();
    m_messageQueue.pop();
    updateTime(msg->arrival);
    deliverMessage(msg);
}

//-------------------------------------------------------------------------

void Host::deliverMessage(Message::Ptr msg)
{
    if (msg->expired()) {
        logDebug(
            "Dropping {} from {} to {}: reply due at {}, deadline {}",
            msg->type, msg->source, msg->target, msg->responseArrival(), *msg->deadline);
        m_signals.timeout(msg);
        return;
    }

    if (msg->target == name()) {
        receiveMessage(msg);
        return;
    }

    auto it = m_participants.find(msg->target);
    if (it == m_participants.end()) {
        throw std::runtime_error{fmt::format(
            "{}: unknown message target '{}'",
            std::source_location::current().function_name(),
            msg->target)};
    }
    logDebug("{} -> {}: {}", msg->source, msg->target, msg->type);
    it->second->receiveMessage(msg);
}

//-------------------------------------------------------------------------
