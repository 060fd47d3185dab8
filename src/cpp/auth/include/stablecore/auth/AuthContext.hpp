/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"

#include <bitset>
#include <initializer_list>

//-------------------------------------------------------------------------

namespace stablecore::auth
{

//-------------------------------------------------------------------------

enum class Role : uint8_t
{
    Owner,
    Guardian,
    Liquidator
};

//-------------------------------------------------------------------------

class RoleSet
{
public:
    RoleSet() noexcept = default;
    RoleSet(std::initializer_list<Role> roles) noexcept;

    void insert(Role role) noexcept { m_bits.set(std::to_underlying(role)); }
    void erase(Role role) noexcept { m_bits.reset(std::to_underlying(role)); }

    [[nodiscard]] bool contains(Role role) const noexcept
    {
        return m_bits.test(std::to_underlying(role));
    }

    [[nodiscard]] bool containsAny(std::initializer_list<Role> roles) const noexcept;
    [[nodiscard]] bool empty() const noexcept { return m_bits.none(); }

    [[nodiscard]] bool operator==(const RoleSet& other) const noexcept = default;

    [[nodiscard]] std::vector<Role> toVector() const;

private:
    std::bitset<magic_enum::enum_count<Role>()> m_bits;
};

//-------------------------------------------------------------------------

// Resolved identity of whoever invoked an entry point.
struct AuthContext
{
    AccountId caller;
    RoleSet roles;

    [[nodiscard]] bool has(Role role) const noexcept { return roles.contains(role); }

    void require(
        Role role,
        std::source_location sl = std::source_location::current()) const;

    void requireAny(
        std::initializer_list<Role> accepted,
        std::source_location sl = std::source_location::current()) const;

    [[nodiscard]] static AuthContext anonymous(AccountId caller) { return {std::move(caller), {}}; }
};

//-------------------------------------------------------------------------

// Static roster of privileged accounts; roster governance lives outside the core.
class RoleRegistry
{
public:
    RoleRegistry() noexcept = default;
    explicit RoleRegistry(AccountId owner) : m_owner{std::move(owner)} {}

    [[nodiscard]] const AccountId& owner() const noexcept { return m_owner; }

    void addGuardian(const AccountId& id) { m_guardians.insert(id); }
    void addLiquidator(const AccountId& id) { m_liquidators.insert(id); }

    [[nodiscard]] AuthContext resolve(const AccountId& caller) const;

    [[nodiscard]] static RoleRegistry fromXML(pugi::xml_node node);

private:
    AccountId m_owner;
    std::set<AccountId> m_guardians;
    std::set<AccountId> m_liquidators;
};

//-------------------------------------------------------------------------

}  // namespace stablecore::auth

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<stablecore::auth::Role>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(stablecore::auth::Role role, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", magic_enum::enum_name(role));
    }
};

//-------------------------------------------------------------------------
