/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "IMessageable.hpp"
#include "stablecore/exchange/QuoteEngine.hpp"
#include "stablecore/issuer/IssuerConfig.hpp"
#include "stablecore/issuer/IssuerSignals.hpp"
#include "stablecore/market/MoneyMarket.hpp"
#include "stablecore/message/IssuerMessagePayloads.hpp"
#include "stablecore/saga/SagaRegistry.hpp"
#include "stablecore/treasury/StableTreasury.hpp"

//-------------------------------------------------------------------------

namespace stablecore::issuer
{

//-------------------------------------------------------------------------

// The issuer core: exchange, owner mint, stable treasury and money market
// behind one host participant. Every call that needs an external venue opens
// a saga whose continuation either commits or compensates exactly once.
class IssuerAgent : public IMessageable, public JsonSerializable
{
public:
    IssuerAgent(Host* host, const IssuerConfig& config);

    [[nodiscard]] const IssuerConfig& config() const noexcept { return m_config; }
    [[nodiscard]] IssuerSignals& signals() noexcept { return m_signals; }
    [[nodiscard]] const auth::RoleRegistry& roles() const noexcept { return m_config.roles; }
    [[nodiscard]] const oracle::OracleAdapter& oracle() const noexcept { return m_oracle; }
    [[nodiscard]] const exchange::CommissionSchedule& commissions() const noexcept
    {
        return m_commissions;
    }
    [[nodiscard]] const exchange::QuoteEngine& quoteEngine() const noexcept { return m_quoteEngine; }
    [[nodiscard]] const market::MoneyMarket& market() const noexcept { return m_market; }
    [[nodiscard]] const treasury::StableTreasury& treasury() const noexcept { return m_treasury; }
    [[nodiscard]] const saga::SagaRegistry& sagas() const noexcept { return m_sagas; }

    // Routes external token transfers of assetId through venue.
    void setTokenVenue(const AssetId& assetId, const std::string& venue);

    // Exchange of the native coin against the stable asset.
    SagaId buy(
        const AccountId& caller,
        const Balance& nativeAmount,
        std::optional<AccountId> recipient = {},
        std::optional<exchange::ExpectedRate> expected = {});
    SagaId sell(
        const AccountId& caller,
        const Balance& stableAmount,
        std::optional<AccountId> recipient = {},
        std::optional<exchange::ExpectedRate> expected = {});
    [[nodiscard]] exchange::Quote predictBuy(
        const Balance& nativeAmount, const exchange::ExchangeRate& rate) const;
    [[nodiscard]] exchange::Quote predictSell(
        const Balance& stableAmount, const exchange::ExchangeRate& rate) const;

    SagaId mintByNative(
        const AccountId& caller, const Balance& nativeAmount, uint32_t collateralRatio);

    void setSpread(const AccountId& caller, const exchange::SpreadConfig& config);
    void setCommissionRates(
        const AccountId& caller, const AssetId& assetId, exchange::CommissionRates rates);

    // Stable treasury.
    void addTreasuryAsset(
        const AccountId& caller,
        const AssetId& assetId,
        uint8_t decimals,
        std::optional<exchange::CommissionRates> rates = {});
    void enableTreasuryAsset(const AccountId& caller, const AssetId& assetId);
    void disableTreasuryAsset(const AccountId& caller, const AssetId& assetId);
    SagaId treasuryWithdraw(
        const AccountId& caller, const AssetId& assetId, const Balance& stableAmount);
    void transferCommission(
        const AccountId& caller, const AccountId& receiver, const Balance& amount);

    // Money market. execute returns a saga id only when prices are needed.
    std::optional<SagaId> execute(
        const AccountId& caller, const std::vector<market::Action>& actions);
    void registerAsset(
        const AccountId& caller, const AssetId& assetId, const market::AssetConfig& config);
    void setAssetEnabled(const AccountId& caller, const AssetId& assetId, bool flag);
    void updateAssetConfig(
        const AccountId& caller, const AssetId& assetId, const market::AssetConfig& config);
    void setMarketConfig(const AccountId& caller, const market::MarketConfig& config);

    // Runs the compensation of a saga whose external call timed out.
    void recover(const AccountId& caller, SagaId sagaId);

    virtual void receiveMessage(Message::Ptr msg) override;

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

private:
    [[nodiscard]] Timestamp now() const noexcept;
    [[nodiscard]] ledger::BalanceLedger& hostLedger() noexcept;
    // Throws InvalidConfiguration when no venue carries assetId.
    const std::string& venueFor(const AssetId& assetId) const;

    void emit(event::IssuerEvent event);
    void emitAll(const event::EventRecord& events);
    void report(
        const saga::PendingRecord& record,
        saga::SagaOutcome outcome,
        const Error* error = nullptr);

    SagaId requestPrices(saga::PendingAction action, std::vector<AssetId> assetIds);
    SagaId startTransfer(
        saga::PendingAction action,
        const AssetId& assetId,
        const AccountId& receiver,
        const Balance& amount);
    void startTransfers(const std::vector<market::OutgoingTransfer>& transfers);

    void handleTokensReceived(Message::Ptr msg);
    void depositTokens(const TokensReceivedPayload& payload, Message::Ptr msg);
    void handlePriceDataResponse(Message::Ptr msg);
    void handleTransferResponse(Message::Ptr msg);
    void handleSagaErrorResponse(Message::Ptr msg);
    void handleUnknownMessage(Message::Ptr msg);

    void completeWithPrices(const saga::PendingRecord& record, const oracle::Prices& prices);
    void completeTransfer(const saga::PendingRecord& record);
    void compensate(const saga::PendingRecord& record);
    void respondTokensReceived(const Message::Ptr& origin, const Balance& unused);

    IssuerConfig m_config;
    IssuerSignals m_signals;
    oracle::OracleAdapter m_oracle;
    exchange::CommissionSchedule m_commissions;
    exchange::QuoteEngine m_quoteEngine;
    market::MoneyMarket m_market;
    treasury::StableTreasury m_treasury;
    saga::SagaRegistry m_sagas;
    std::map<AssetId, std::string> m_tokenVenues;
};

//-------------------------------------------------------------------------

}  // namespace stablecore::issuer

//-------------------------------------------------------------------------
