/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "Host.hpp"
#include "stablecore/error/Error.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace stablecore;

using namespace testing;

//-------------------------------------------------------------------------

namespace
{

// Records every delivery and answers requests after the host latency.
class EchoParticipant : public IMessageable
{
public:
    EchoParticipant(Host* host, const std::string& name) : IMessageable{host, name} {}

    virtual void receiveMessage(Message::Ptr msg) override
    {
        received.push_back(fmt::format("{}@{}", msg->type, host()->currentTimestamp()));
        if (msg->type.starts_with("PING")) {
            respondToMessage(msg, MessagePayload::create<EmptyPayload>());
        }
    }

    std::vector<std::string> received;
};

}  // namespace

//-------------------------------------------------------------------------

TEST(HostTests, DeliversInArrivalOrder)
{
    Host host{100};
    auto& issuer = host.emplaceParticipant<EchoParticipant>("issuer");
    auto& oracle = host.emplaceParticipant<EchoParticipant>("oracle");

    host.dispatchMessage(100, 50, "issuer", "oracle", "PING");
    host.dispatchMessage(100, 10, "oracle", "issuer", "NOTICE");
    EXPECT_EQ(host.pendingMessages(), 2u);

    host.runUntilIdle();

    EXPECT_THAT(oracle.received, ElementsAre("PING@150"));
    EXPECT_THAT(issuer.received, ElementsAre("NOTICE@110", "RESPONSE_PING@200"));
    EXPECT_EQ(host.currentTimestamp(), 200);
}

//-------------------------------------------------------------------------

TEST(HostTests, RunUntilStopsAtCutoff)
{
    Host host;
    auto& oracle = host.emplaceParticipant<EchoParticipant>("oracle");

    host.dispatchMessage(0, 1'000, "issuer", "oracle", "NOTICE");
    host.runUntil(999);
    EXPECT_TRUE(oracle.received.empty());
    EXPECT_EQ(host.currentTimestamp(), 999);

    host.advance(1);
    EXPECT_THAT(oracle.received, ElementsAre("NOTICE@1000"));
}

//-------------------------------------------------------------------------

TEST(HostTests, DropsRequestsWhoseReplyMissesDeadline)
{
    Host host;
    auto& issuer = host.emplaceParticipant<EchoParticipant>("issuer");
    auto& oracle = host.emplaceParticipant<EchoParticipant>("oracle");
    std::vector<std::string> timedOut;
    host.signals().timeout.connect([&](Message::Ptr msg) { timedOut.push_back(msg->type); });

    host.dispatchMessage(
        0, 20'000, "issuer", "oracle", "PING_SLOW", MessagePayload::create<EmptyPayload>(), 30'000);
    host.dispatchMessage(
        0, 15'000, "issuer", "oracle", "PING_FAST", MessagePayload::create<EmptyPayload>(), 30'000);
    host.runUntilIdle();

    EXPECT_THAT(oracle.received, ElementsAre("PING_FAST@15000"));
    EXPECT_THAT(issuer.received, ElementsAre("RESPONSE_PING_FAST@30000"));
    EXPECT_THAT(timedOut, ElementsAre("PING_SLOW"));
}

//-------------------------------------------------------------------------

TEST(HostTests, Participants)
{
    Host host;
    host.emplaceParticipant<EchoParticipant>("issuer");
    host.setLatency("issuer", 250);

    EXPECT_NE(host.participant("issuer"), nullptr);
    EXPECT_EQ(host.participant("nobody"), nullptr);
    EXPECT_EQ(host.latency("issuer"), 250);
    EXPECT_EQ(host.latency("nobody"), 0);
    EXPECT_THROW(host.emplaceParticipant<EchoParticipant>("issuer"), std::invalid_argument);
    EXPECT_THROW(host.emplaceParticipant<EchoParticipant>("HOST"), std::invalid_argument);

    host.dispatchMessage(0, 1, "issuer", "nobody", "NOTICE");
    EXPECT_THROW(host.runUntilIdle(), std::runtime_error);
}

//-------------------------------------------------------------------------

TEST(HostTests, LedgerTransfers)
{
    Host host;
    host.ledger().credit("alice", "wrap.near", Balance{100});
    host.ledger().transfer("alice", "bob", "wrap.near", Balance{40});

    EXPECT_EQ(host.ledger().balanceOf("alice", "wrap.near"), Balance{60});
    EXPECT_EQ(host.ledger().balanceOf("bob", "wrap.near"), Balance{40});
    EXPECT_EQ(host.ledger().totalSupply("wrap.near"), Balance{100});
    EXPECT_THROW(
        host.ledger().debit("bob", "wrap.near", Balance{41}), stablecore::Error);
    EXPECT_EQ(host.ledger().balanceOf("bob", "wrap.near"), Balance{40});
}

//-------------------------------------------------------------------------
