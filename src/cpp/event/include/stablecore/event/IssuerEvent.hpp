/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "JsonSerializable.hpp"
#include "common.hpp"

//-------------------------------------------------------------------------

namespace stablecore::event
{

//-------------------------------------------------------------------------

enum class EventKind : uint8_t
{
    Mint,
    Burn,
    Deposit,
    DepositToReserve,
    WithdrawStarted,
    WithdrawSucceeded,
    WithdrawFailed,
    IncreaseCollateral,
    DecreaseCollateral,
    Borrow,
    Repay,
    Liquidate,
    ForceClose,
    CommissionTransferred
};

//-------------------------------------------------------------------------

struct IssuerEvent
{
    EventKind kind{};
    Timestamp timestamp{};
    AccountId account;
    AssetId assetId;
    Balance amount{};
    std::optional<AccountId> counterparty{};
    std::optional<decimal_t> collateralValue{};
    std::optional<decimal_t> debtValue{};
    std::optional<std::string> memo{};

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;
};

//-------------------------------------------------------------------------

class EventRecord : public JsonSerializable
{
public:
    [[nodiscard]] size_t size() const noexcept { return m_entries.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_entries.empty(); }

    void push(IssuerEvent entry) { m_entries.push_back(std::move(entry)); }
    void append(const EventRecord& other);
    void clear() noexcept { m_entries.clear(); }

    [[nodiscard]] auto begin() const noexcept { return m_entries.begin(); }
    [[nodiscard]] auto end() const noexcept { return m_entries.end(); }
    [[nodiscard]] const IssuerEvent& back() const { return m_entries.back(); }

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

private:
    std::vector<IssuerEvent> m_entries;
};

//-------------------------------------------------------------------------

}  // namespace stablecore::event

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<stablecore::event::EventKind>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(stablecore::event::EventKind kind, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", magic_enum::enum_name(kind));
    }
};

//-------------------------------------------------------------------------
