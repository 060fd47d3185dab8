/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "HostSignals.hpp"
#include "IMessageable.hpp"
#include "stablecore/ledger/InMemoryBalanceLedger.hpp"
#include "stablecore/message/MessageQueue.hpp"

//-------------------------------------------------------------------------

// Single-threaded host: delivers timestamped messages to named participants
// one at a time, in arrival order, and keeps the fungible balance ledger of
// the host chain.
class Host : public IMessageable
{
public:
    explicit Host(Timestamp start = 0);

    void dispatchMessage(
        Timestamp occurrence,
        Timestamp delay,
        const std::string& source,
        const std::string& target,
        const std::string& type,
        MessagePayload::Ptr payload = MessagePayload::create<EmptyPayload>(),
        std::optional<Timestamp> deadline = {}) const;

    void queueMessage(Message::Ptr msg) const;

    template<typename T, typename... Args>
    requires std::derived_from<T, IMessageable>
    T& emplaceParticipant(Args&&... args)
    {
        auto participant = std::make_unique<T>(this, std::forward<Args>(args)...);
        T& ref = *participant;
        addParticipant(std::move(participant));
        return ref;
    }

    void addParticipant(std::unique_ptr<IMessageable> participant);

    [[nodiscard]] IMessageable* participant(const std::string& name) const noexcept;

    // One-way delay of messages to and from a participant.
    [[nodiscard]] Timestamp latency(const std::string& name) const noexcept;
    void setLatency(const std::string& name, Timestamp latency);

    [[nodiscard]] Timestamp currentTimestamp() const noexcept { return m_time; }
    [[nodiscard]] HostSignals& signals() const noexcept { return m_signals; }
    [[nodiscard]] stablecore::ledger::InMemoryBalanceLedger& ledger() noexcept { return m_ledger; }
    [[nodiscard]] const stablecore::ledger::InMemoryBalanceLedger& ledger() const noexcept
    {
        return m_ledger;
    }
    [[nodiscard]] size_t pendingMessages() const noexcept { return m_messageQueue.size(); }

    // Delivers every message arriving up to and including cutoff, then
    // moves the clock to cutoff.
    void runUntil(Timestamp cutoff);
    void advance(Timestamp delta) { runUntil(m_time + delta); }
    // Delivers messages until none remain.
    void runUntilIdle();

    virtual void receiveMessage(Message::Ptr msg) override;

    template<typename... Args>
    void logDebug(fmt::format_string<Args...> fmt, Args&&... args) const
    {
        if (m_debug) {
            fmt::print("[{}] {}\n", m_time, fmt::format(fmt, std::forward<Args>(args)...));
        }
    }

    void setDebug(bool flag) noexcept { m_debug = flag; }
    [[nodiscard]] bool debug() const noexcept { return m_debug; }

private:
    void deliverMessage(Message::Ptr msg);
    void step();

    void updateTime(Timestamp newTime)
    {
        if (newTime <= m_time) [[unlikely]] return;
        m_time = newTime;
    }

    mutable MessageQueue m_messageQueue;
    mutable HostSignals m_signals;
    Timestamp m_time;
    std::map<std::string, std::unique_ptr<IMessageable>> m_participants;
    std::map<std::string, Timestamp> m_latencies;
    stablecore::ledger::InMemoryBalanceLedger m_ledger;
    bool m_debug{};
};

//-------------------------------------------------------------------------
