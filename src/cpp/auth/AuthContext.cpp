/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "stablecore/auth/AuthContext.hpp"

#include "stablecore/error/Error.hpp"

//-------------------------------------------------------------------------

namespace stablecore::auth
{

//-------------------------------------------------------------------------

RoleSet::RoleSet(std::initializer_list<Role> roles) noexcept
{
    for (Role role : roles) {
        insert(role);
    }
}

//-------------------------------------------------------------------------

bool RoleSet::containsAny(std::initializer_list<Role> roles) const noexcept
{
    return ranges::any_of(roles, [this](Role role) { return contains(role); });
}

//-------------------------------------------------------------------------

std::vector<Role> RoleSet::toVector() const
{
    std::vector<Role> res;
    for (Role role : magic_enum::enum_values<Role>()) {
        if (contains(role)) {
            res.push_back(role);
        }
    }
    return res;
}

//-------------------------------------------------------------------------

void AuthContext::require(Role role, std::source_location sl) const
{
    if (!has(role)) {
        raise(ErrorCode::Unauthorized, sl, "'{}' lacks role {}", caller, role);
    }
}

//-------------------------------------------------------------------------

void AuthContext::requireAny(std::initializer_list<Role> accepted, std::source_location sl) const
{
    if (!roles.containsAny(accepted)) {
        raise(
            ErrorCode::Unauthorized,
            sl,
            "'{}' holds none of the roles [{}]",
            caller,
            fmt::join(accepted, ", "));
    }
}

//-------------------------------------------------------------------------

AuthContext RoleRegistry::resolve(const AccountId& caller) const
{
    AuthContext ctx{.caller = caller};
    if (caller == m_owner) {
        ctx.roles.insert(Role::Owner);
    }
    if (m_guardians.contains(caller)) {
        ctx.roles.insert(Role::Guardian);
    }
    if (m_liquidators.contains(caller)) {
        ctx.roles.insert(Role::Liquidator);
    }
    return ctx;
}

//-------------------------------------------------------------------------

RoleRegistry RoleRegistry::fromXML(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    pugi::xml_attribute attr;
    if (attr = node.attribute("owner"); attr.empty()) {
        throw Error{
            ErrorCode::InvalidConfiguration,
            fmt::format("{}: missing required attribute 'owner'", ctx)};
    }
    RoleRegistry registry{attr.as_string()};

    if (pugi::xml_node rolesNode = node.child("Roles")) {
        for (pugi::xml_node guardian : rolesNode.children("Guardian")) {
            registry.addGuardian(guardian.attribute("id").as_string());
        }
        for (pugi::xml_node liquidator : rolesNode.children("Liquidator")) {
            registry.addLiquidator(liquidator.attribute("id").as_string());
        }
    }

    return registry;
}

//-------------------------------------------------------------------------

}  // namespace stablecore::auth

//-------------------------------------------------------------------------
