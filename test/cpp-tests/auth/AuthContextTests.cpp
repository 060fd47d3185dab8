/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "stablecore/auth/AuthContext.hpp"
#include "test-common/formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace stablecore;
using namespace stablecore::auth;

using namespace testing;

//-------------------------------------------------------------------------

TEST(RoleSetTests, API)
{
    RoleSet roles;
    EXPECT_TRUE(roles.empty());

    roles.insert(Role::Liquidator);
    roles.insert(Role::Owner);
    EXPECT_TRUE(roles.contains(Role::Owner));
    EXPECT_FALSE(roles.contains(Role::Guardian));
    EXPECT_TRUE(roles.containsAny({Role::Guardian, Role::Liquidator}));
    EXPECT_THAT(roles.toVector(), ElementsAre(Role::Owner, Role::Liquidator));

    roles.erase(Role::Owner);
    EXPECT_EQ(roles, RoleSet{Role::Liquidator});
}

//-------------------------------------------------------------------------

TEST(RoleRegistryTests, Resolve)
{
    RoleRegistry registry{"owner"};
    registry.addGuardian("guardian");
    registry.addGuardian("owner");
    registry.addLiquidator("bot");

    EXPECT_EQ(registry.resolve("owner").roles, (RoleSet{Role::Owner, Role::Guardian}));
    EXPECT_EQ(registry.resolve("guardian").roles, RoleSet{Role::Guardian});
    EXPECT_EQ(registry.resolve("bot").roles, RoleSet{Role::Liquidator});
    EXPECT_TRUE(registry.resolve("alice").roles.empty());
    EXPECT_EQ(registry.resolve("alice").caller, "alice");
}

//-------------------------------------------------------------------------

TEST(AuthContextTests, RequireThrowsUnauthorized)
{
    RoleRegistry registry{"owner"};
    registry.addGuardian("guardian");

    EXPECT_NO_THROW(registry.resolve("owner").require(Role::Owner));
    EXPECT_ERROR_CODE(registry.resolve("guardian").require(Role::Owner), ErrorCode::Unauthorized);
    EXPECT_NO_THROW(registry.resolve("guardian").requireAny({Role::Owner, Role::Guardian}));
    EXPECT_ERROR_CODE(
        AuthContext::anonymous("alice").requireAny({Role::Owner, Role::Guardian}),
        ErrorCode::Unauthorized);
}

//-------------------------------------------------------------------------

TEST(RoleRegistryTests, FromXML)
{
    pugi::xml_document doc;
    ASSERT_TRUE(doc.load_string(R"(
        <Issuer owner="dao">
            <Roles>
                <Guardian id="g1"/>
                <Guardian id="g2"/>
                <Liquidator id="keeper"/>
            </Roles>
        </Issuer>)"));

    const RoleRegistry registry = RoleRegistry::fromXML(doc.child("Issuer"));
    EXPECT_EQ(registry.owner(), "dao");
    EXPECT_TRUE(registry.resolve("g2").has(Role::Guardian));
    EXPECT_TRUE(registry.resolve("keeper").has(Role::Liquidator));

    pugi::xml_document ownerless;
    ASSERT_TRUE(ownerless.load_string("<Issuer/>"));
    EXPECT_ERROR_CODE(
        (void)RoleRegistry::fromXML(ownerless.child("Issuer")), ErrorCode::InvalidConfiguration);
}

//-------------------------------------------------------------------------
