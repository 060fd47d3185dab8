/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "stablecore/issuer/IssuerAgent.hpp"

#include "Host.hpp"
#include "stablecore/error/Error.hpp"
#include "stablecore/exchange/SpreadPolicyFactory.hpp"

//-------------------------------------------------------------------------

namespace stablecore::issuer
{

//-------------------------------------------------------------------------

namespace
{

[[nodiscard]] std::string responseType(std::string_view type)
{
    return fmt::format("{}{}", message::kResponsePrefix, type);
}

[[nodiscard]] std::string errorResponseType(std::string_view type)
{
    return fmt::format("{}_{}{}", message::kErrorPrefix, message::kResponsePrefix, type);
}

template<typename T>
[[nodiscard]] std::shared_ptr<T> payloadAs(const Message::Ptr& msg)
{
    auto payload = std::dynamic_pointer_cast<T>(msg->payload);
    if (payload == nullptr) {
        throw std::invalid_argument{fmt::format(
            "{}: malformed {} payload from {}",
            std::source_location::current().function_name(), msg->type, msg->source)};
    }
    return payload;
}

[[nodiscard]] bool waitsForPrices(const saga::PendingAction& action) noexcept
{
    return !std::holds_alternative<saga::PendingMarketWithdraw>(action)
        && !std::holds_alternative<saga::PendingTreasuryWithdraw>(action);
}

}  // namespace

//-------------------------------------------------------------------------

IssuerAgent::IssuerAgent(Host* host, const IssuerConfig& config)
    : IMessageable{host, config.name},
      m_config{config},
      m_oracle{config.oracle},
      m_commissions{config.commissions},
      m_quoteEngine{
          exchange::SpreadPolicyFactory::create(config.spread, config.start),
          m_commissions,
          config.nativeAssetId},
      m_market{config.stableAssetId, config.market, host->ledger()},
      m_treasury{config.stableAssetId, m_commissions, host->ledger()}
{
    for (const auto& venue : m_config.tokenVenues) {
        setTokenVenue(venue.assetId, venue.name);
    }

    const auth::AuthContext owner = m_config.roles.resolve(m_config.roles.owner());
    for (const auto& [assetId, assetConfig] : m_config.marketAssets) {
        if (assetId != m_config.stableAssetId) {
            venueFor(assetId);
        }
        m_market.registerAsset(owner, assetId, assetConfig, m_config.start);
    }
    for (const auto& spec : m_config.treasuryAssets) {
        venueFor(spec.assetId);
        m_treasury.addAsset(owner, spec.assetId, spec.decimals, spec.rates);
    }

    host->signals().timeout.connect([this](Message::Ptr msg) {
        if (msg->source != name()) return;
        this->host()->logDebug(
            "{}: {} to {} timed out, awaiting recovery", name(), msg->type, msg->target);
    });
}

//-------------------------------------------------------------------------

void IssuerAgent::setTokenVenue(const AssetId& assetId, const std::string& venue)
{
    if (assetId == m_config.stableAssetId || assetId == m_config.nativeAssetId) {
        throw Error{
            ErrorCode::InvalidConfiguration,
            fmt::format(
                "{}: '{}' lives on the host ledger",
                std::source_location::current().function_name(), assetId)};
    }
    m_tokenVenues.insert_or_assign(assetId, venue);
}

//-------------------------------------------------------------------------

SagaId IssuerAgent::buy(
    const AccountId& caller,
    const Balance& nativeAmount,
    std::optional<AccountId> recipient,
    std::optional<exchange::ExpectedRate> expected)
{
    if (nativeAmount.is_zero()) {
        raise(
            ErrorCode::InvalidArgument,
            std::source_location::current(),
            "Attached native amount should be positive");
    }
    hostLedger().transfer(caller, name(), m_config.nativeAssetId, nativeAmount);

    return requestPrices(
        saga::PendingBuy{
            .caller = caller,
            .recipient = recipient.value_or(caller),
            .nativeAmount = nativeAmount,
            .expected = std::move(expected)
        },
        {m_config.nativeAssetId});
}

//-------------------------------------------------------------------------

SagaId IssuerAgent::sell(
    const AccountId& caller,
    const Balance& stableAmount,
    std::optional<AccountId> recipient,
    std::optional<exchange::ExpectedRate> expected)
{
    if (stableAmount.is_zero()) {
        raise(
            ErrorCode::InvalidArgument,
            std::source_location::current(),
            "Stable amount should be positive");
    }
    hostLedger().debit(caller, m_config.stableAssetId, stableAmount);
    emit({
        .kind = event::EventKind::Burn,
        .account = caller,
        .assetId = m_config.stableAssetId,
        .amount = stableAmount,
        .memo = "sell"
    });

    return requestPrices(
        saga::PendingSell{
            .caller = caller,
            .recipient = recipient.value_or(caller),
            .stableAmount = stableAmount,
            .expected = std::move(expected)
        },
        {m_config.nativeAssetId});
}

//-------------------------------------------------------------------------

exchange::Quote IssuerAgent::predictBuy(
    const Balance& nativeAmount, const exchange::ExchangeRate& rate) const
{
    return m_quoteEngine.predictBuy(nativeAmount, rate, now());
}

//-------------------------------------------------------------------------

exchange::Quote IssuerAgent::predictSell(
    const Balance& stableAmount, const exchange::ExchangeRate& rate) const
{
    return m_quoteEngine.predictSell(stableAmount, rate, now());
}

//-------------------------------------------------------------------------

SagaId IssuerAgent::mintByNative(
    const AccountId& caller, const Balance& nativeAmount, uint32_t collateralRatio)
{
    static constexpr auto ctx = std::source_location::current();
    static constexpr uint32_t kMinCollateralRatio = 100, kMaxCollateralRatio = 1000;

    m_config.roles.resolve(caller).require(auth::Role::Owner, ctx);
    if (nativeAmount.is_zero()) {
        raise(ErrorCode::InvalidArgument, ctx, "Attached native amount should be positive");
    }
    if (collateralRatio < kMinCollateralRatio || collateralRatio > kMaxCollateralRatio) {
        raise(
            ErrorCode::InvalidArgument,
            ctx,
            "Collateral ratio should be in [{}, {}], was {}",
            kMinCollateralRatio, kMaxCollateralRatio, collateralRatio);
    }
    hostLedger().transfer(caller, name(), m_config.nativeAssetId, nativeAmount);

    return requestPrices(
        saga::PendingMintByNative{
            .caller = caller,
            .nativeAmount = nativeAmount,
            .collateralRatio = collateralRatio
        },
        {m_config.nativeAssetId});
}

//-------------------------------------------------------------------------

void IssuerAgent::setSpread(const AccountId& caller, const exchange::SpreadConfig& config)
{
    m_config.roles.resolve(caller).require(auth::Role::Owner);
    m_quoteEngine.setSpreadPolicy(exchange::SpreadPolicyFactory::create(config, now()));
    m_config.spread = config;
}

//-------------------------------------------------------------------------

void IssuerAgent::setCommissionRates(
    const AccountId& caller, const AssetId& assetId, exchange::CommissionRates rates)
{
    m_config.roles.resolve(caller).require(auth::Role::Owner);
    m_commissions.setRates(assetId, rates);
}

//-------------------------------------------------------------------------

void IssuerAgent::addTreasuryAsset(
    const AccountId& caller,
    const AssetId& assetId,
    uint8_t decimals,
    std::optional<exchange::CommissionRates> rates)
{
    const auth::AuthContext auth = m_config.roles.resolve(caller);
    auth.require(auth::Role::Owner);
    venueFor(assetId);
    m_treasury.addAsset(auth, assetId, decimals, rates);
}

//-------------------------------------------------------------------------

void IssuerAgent::enableTreasuryAsset(const AccountId& caller, const AssetId& assetId)
{
    m_treasury.enableAsset(m_config.roles.resolve(caller), assetId);
}

//-------------------------------------------------------------------------

void IssuerAgent::disableTreasuryAsset(const AccountId& caller, const AssetId& assetId)
{
    m_treasury.disableAsset(m_config.roles.resolve(caller), assetId);
}

//-------------------------------------------------------------------------

SagaId IssuerAgent::treasuryWithdraw(
    const AccountId& caller, const AssetId& assetId, const Balance& stableAmount)
{
    venueFor(assetId);
    treasury::WithdrawPlan plan = m_treasury.withdraw(caller, assetId, stableAmount);
    emit({
        .kind = event::EventKind::Burn,
        .account = caller,
        .assetId = m_config.stableAssetId,
        .amount = plan.stableAmount,
        .memo = "treasury withdraw"
    });
    emit({
        .kind = event::EventKind::WithdrawStarted,
        .account = caller,
        .assetId = assetId,
        .amount = plan.tokenAmount
    });
    const Balance tokenAmount = plan.tokenAmount;
    return startTransfer(
        saga::PendingTreasuryWithdraw{std::move(plan)}, assetId, caller, tokenAmount);
}

//-------------------------------------------------------------------------

void IssuerAgent::transferCommission(
    const AccountId& caller, const AccountId& receiver, const Balance& amount)
{
    m_treasury.transferCommission(m_config.roles.resolve(caller), receiver, amount);
    emit({
        .kind = event::EventKind::CommissionTransferred,
        .account = receiver,
        .assetId = m_config.stableAssetId,
        .amount = amount,
        .counterparty = caller
    });
}

//-------------------------------------------------------------------------

std::optional<SagaId> IssuerAgent::execute(
    const AccountId& caller, const std::vector<market::Action>& actions)
{
    if (actions.empty()) {
        raise(
            ErrorCode::InvalidArgument,
            std::source_location::current(),
            "Action list of '{}' is empty", caller);
    }
    const auth::AuthContext auth = m_config.roles.resolve(caller);

    if (!market::needsPrices(actions)) {
        market::ExecutionResult result = m_market.execute(auth, actions, nullptr, now());
        emitAll(result.events);
        startTransfers(result.transfers);
        return {};
    }

    const std::set<AssetId> dependencies = m_market.priceDependencies(caller, actions);
    return requestPrices(
        saga::PendingMarketExecute{.auth = auth, .actions = actions},
        {dependencies.begin(), dependencies.end()});
}

//-------------------------------------------------------------------------

void IssuerAgent::registerAsset(
    const AccountId& caller, const AssetId& assetId, const market::AssetConfig& config)
{
    const auth::AuthContext auth = m_config.roles.resolve(caller);
    auth.require(auth::Role::Owner);
    if (assetId != m_config.stableAssetId) {
        venueFor(assetId);
    }
    m_market.registerAsset(auth, assetId, config, now());
}

//-------------------------------------------------------------------------

void IssuerAgent::setAssetEnabled(const AccountId& caller, const AssetId& assetId, bool flag)
{
    m_market.setAssetEnabled(m_config.roles.resolve(caller), assetId, flag);
}

//-------------------------------------------------------------------------

void IssuerAgent::updateAssetConfig(
    const AccountId& caller, const AssetId& assetId, const market::AssetConfig& config)
{
    m_market.updateAssetConfig(m_config.roles.resolve(caller), assetId, config, now());
}

//-------------------------------------------------------------------------

void IssuerAgent::setMarketConfig(const AccountId& caller, const market::MarketConfig& config)
{
    m_market.setConfig(m_config.roles.resolve(caller), config);
    m_config.market = config;
}

//-------------------------------------------------------------------------

void IssuerAgent::recover(const AccountId& caller, SagaId sagaId)
{
    static constexpr auto ctx = std::source_location::current();

    m_config.roles.resolve(caller).requireAny({auth::Role::Owner, auth::Role::Guardian}, ctx);

    const saga::PendingRecord* pending = m_sagas.find(sagaId);
    if (pending == nullptr) {
        raise(ErrorCode::InvalidArgument, ctx, "Saga #{} is not pending", sagaId);
    }
    if (pending->deadline >= now()) {
        raise(
            ErrorCode::InvalidArgument,
            ctx,
            "Saga #{} may still complete until {}", sagaId, pending->deadline);
    }

    const saga::PendingRecord record = *m_sagas.resolve(sagaId);
    compensate(record);
    const Error timeout{
        ErrorCode::ExternalCallFailed,
        fmt::format("Saga #{} timed out at {}, recovered by '{}'", sagaId, record.deadline, caller)};
    report(record, saga::SagaOutcome::Compensated, &timeout);
}

//-------------------------------------------------------------------------

void IssuerAgent::receiveMessage(Message::Ptr msg)
{
    if (msg->type == message::kTokensReceived) {
        handleTokensReceived(msg);
    }
    else if (msg->type == responseType(message::kPriceData)) {
        handlePriceDataResponse(msg);
    }
    else if (msg->type == responseType(message::kTransfer)) {
        handleTransferResponse(msg);
    }
    else if (msg->type == errorResponseType(message::kPriceData)
        || msg->type == errorResponseType(message::kTransfer)) {
        handleSagaErrorResponse(msg);
    }
    else {
        handleUnknownMessage(msg);
    }
}

//-------------------------------------------------------------------------

void IssuerAgent::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("name", rapidjson::Value{name().c_str(), allocator}, allocator);
        json.AddMember("timestamp", rapidjson::Value{now()}, allocator);
        json.AddMember(
            "stableSupply",
            json::balance2json(
                host()->ledger().totalSupply(m_config.stableAssetId), allocator),
            allocator);
        json.AddMember(
            "nativeHeld",
            json::balance2json(
                host()->ledger().balanceOf(name(), m_config.nativeAssetId), allocator),
            allocator);
        m_quoteEngine.spreadPolicy().jsonSerialize(json, "spread");
        m_commissions.jsonSerialize(json, "commissions");
        m_treasury.jsonSerialize(json, "treasury");
        m_market.jsonSerialize(json, "market");
        m_sagas.jsonSerialize(json, "pendingSagas");
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

Timestamp IssuerAgent::now() const noexcept
{
    return host()->currentTimestamp();
}

//-------------------------------------------------------------------------

ledger::BalanceLedger& IssuerAgent::hostLedger() noexcept
{
    return host()->ledger();
}

//-------------------------------------------------------------------------

const std::string& IssuerAgent::venueFor(const AssetId& assetId) const
{
    auto it = m_tokenVenues.find(assetId);
    if (it == m_tokenVenues.end()) {
        raise(
            ErrorCode::InvalidConfiguration,
            std::source_location::current(),
            "No token venue carries '{}'", assetId);
    }
    return it->second;
}

//-------------------------------------------------------------------------

void IssuerAgent::emit(event::IssuerEvent event)
{
    event.timestamp = now();
    m_signals.event(event);
}

//-------------------------------------------------------------------------

void IssuerAgent::emitAll(const event::EventRecord& events)
{
    for (const auto& event : events) {
        m_signals.event(event);
    }
}

//-------------------------------------------------------------------------

void IssuerAgent::report(
    const saga::PendingRecord& record, saga::SagaOutcome outcome, const Error* error)
{
    saga::SagaResolution resolution{
        .sagaId = record.id,
        .kind = saga::pendingActionName(record.action),
        .outcome = outcome
    };
    if (error != nullptr) {
        resolution.error = error->code();
        resolution.message = error->what();
    }
    host()->logDebug(
        "{}: saga #{} ({}) {}",
        name(), record.id, resolution.kind, magic_enum::enum_name(outcome));
    m_signals.sagaResolved(resolution);
}

//-------------------------------------------------------------------------

SagaId IssuerAgent::requestPrices(saga::PendingAction action, std::vector<AssetId> assetIds)
{
    std::erase(assetIds, m_config.stableAssetId);

    const Timestamp timestamp = now();
    const SagaId sagaId =
        m_sagas.open(std::move(action), timestamp, timestamp + m_config.callTimeout);
    const std::string& oracle = m_config.oracleVenue.name;
    host()->dispatchMessage(
        timestamp,
        host()->latency(oracle),
        name(),
        oracle,
        std::string{message::kPriceData},
        MessagePayload::create<PriceDataRequestPayload>(sagaId, std::move(assetIds)),
        timestamp + m_config.callTimeout);
    return sagaId;
}

//-------------------------------------------------------------------------

SagaId IssuerAgent::startTransfer(
    saga::PendingAction action,
    const AssetId& assetId,
    const AccountId& receiver,
    const Balance& amount)
{
    const std::string& venue = venueFor(assetId);
    const Timestamp timestamp = now();
    const SagaId sagaId =
        m_sagas.open(std::move(action), timestamp, timestamp + m_config.callTimeout);
    host()->dispatchMessage(
        timestamp,
        host()->latency(venue),
        name(),
        venue,
        std::string{message::kTransfer},
        MessagePayload::create<TransferRequestPayload>(sagaId, receiver, amount),
        timestamp + m_config.callTimeout);
    return sagaId;
}

//-------------------------------------------------------------------------

void IssuerAgent::startTransfers(const std::vector<market::OutgoingTransfer>& transfers)
{
    for (const auto& transfer : transfers) {
        startTransfer(
            saga::PendingMarketWithdraw{
                .account = transfer.receiver,
                .assetId = transfer.assetId,
                .amount = transfer.amount
            },
            transfer.assetId,
            transfer.receiver,
            transfer.amount);
    }
}

//-------------------------------------------------------------------------

void IssuerAgent::handleTokensReceived(Message::Ptr msg)
{
    const auto payload = payloadAs<TokensReceivedPayload>(msg);

    auto it = m_tokenVenues.find(payload->assetId);
    if (it == m_tokenVenues.end() || it->second != msg->source) {
        host()->logDebug(
            "{}: refusing '{}' from {}, not its venue", name(), payload->assetId, msg->source);
        respondTokensReceived(msg, payload->amount);
        return;
    }

    try {
        if (payload->route == TransferRoute::Market && market::needsPrices(payload->actions)) {
            std::set<AssetId> dependencies =
                m_market.priceDependencies(payload->sender, payload->actions);
            dependencies.insert(payload->assetId);
            requestPrices(
                saga::PendingMarketExecute{
                    .auth = m_config.roles.resolve(payload->sender),
                    .actions = payload->actions,
                    .deposit = saga::PendingDeposit{
                        .assetId = payload->assetId,
                        .amount = payload->amount,
                        .origin = msg
                    }
                },
                {dependencies.begin(), dependencies.end()});
            return;
        }
        depositTokens(*payload, msg);
    }
    catch (const Error& e) {
        host()->logDebug(
            "{}: returning {} '{}' to {}: {}",
            name(), payload->amount, payload->assetId, payload->sender, e.what());
        respondTokensReceived(msg, payload->amount);
        return;
    }
    respondTokensReceived(msg, Balance{});
}

//-------------------------------------------------------------------------

void IssuerAgent::depositTokens(const TokensReceivedPayload& payload, Message::Ptr msg)
{
    switch (payload.route) {
        case TransferRoute::Treasury: {
            const Balance minted =
                m_treasury.deposit(payload.sender, payload.assetId, payload.amount);
            emit({
                .kind = event::EventKind::Mint,
                .account = payload.sender,
                .assetId = m_config.stableAssetId,
                .amount = minted,
                .memo = fmt::format("treasury deposit of {} '{}'", payload.amount, payload.assetId)
            });
            break;
        }
        case TransferRoute::Reserve: {
            emitAll(m_market.depositToReserve(
                payload.sender, payload.assetId, payload.amount, now()).events);
            break;
        }
        case TransferRoute::Market: {
            market::ExecutionResult result = payload.actions.empty()
                ? m_market.deposit(payload.sender, payload.assetId, payload.amount, now())
                : m_market.depositAndExecute(
                    m_config.roles.resolve(payload.sender),
                    payload.assetId,
                    payload.amount,
                    payload.actions,
                    nullptr,
                    now());
            emitAll(result.events);
            startTransfers(result.transfers);
            break;
        }
    }
    host()->logDebug(
        "{}: accepted transfer #{} from {}", name(), payload.transferId, msg->source);
}

//-------------------------------------------------------------------------

void IssuerAgent::handlePriceDataResponse(Message::Ptr msg)
{
    const auto payload = payloadAs<PriceDataResponsePayload>(msg);

    const saga::PendingRecord* pending = m_sagas.find(payload->sagaId);
    if (pending == nullptr || !waitsForPrices(pending->action)) {
        host()->logDebug(
            "{}: ignoring price data for saga #{}{}",
            name(),
            payload->sagaId,
            m_sagas.wasResolved(payload->sagaId) ? ", already resolved" : "");
        return;
    }
    const saga::PendingRecord record = *m_sagas.resolve(payload->sagaId);

    try {
        const oracle::Prices prices = m_oracle.accept(payload->data, now());
        completeWithPrices(record, prices);
    }
    catch (const Error& e) {
        compensate(record);
        report(record, saga::SagaOutcome::Compensated, &e);
        return;
    }
    catch (const std::exception& e) {
        // Arithmetic failures inside the continuation still owe the caller a refund.
        compensate(record);
        const Error failure{
            ErrorCode::ExternalCallFailed,
            fmt::format("{}: saga #{} continuation failed: {}", name(), record.id, e.what())};
        report(record, saga::SagaOutcome::Compensated, &failure);
        return;
    }
    report(record, saga::SagaOutcome::Committed);
}

//-------------------------------------------------------------------------

void IssuerAgent::handleTransferResponse(Message::Ptr msg)
{
    const auto payload = payloadAs<TransferResponsePayload>(msg);

    const saga::PendingRecord* pending = m_sagas.find(payload->sagaId);
    if (pending == nullptr || waitsForPrices(pending->action)) {
        host()->logDebug(
            "{}: ignoring transfer result for saga #{}{}",
            name(),
            payload->sagaId,
            m_sagas.wasResolved(payload->sagaId) ? ", already resolved" : "");
        return;
    }
    const saga::PendingRecord record = *m_sagas.resolve(payload->sagaId);
    completeTransfer(record);
    report(record, saga::SagaOutcome::Committed);
}

//-------------------------------------------------------------------------

void IssuerAgent::handleSagaErrorResponse(Message::Ptr msg)
{
    const auto payload = payloadAs<SagaErrorPayload>(msg);

    auto record = m_sagas.resolve(payload->sagaId);
    if (!record) {
        host()->logDebug(
            "{}: ignoring {} for saga #{}", name(), msg->type, payload->sagaId);
        return;
    }
    compensate(*record);
    const Error failure{
        ErrorCode::ExternalCallFailed,
        fmt::format("{} failed: {}", msg->source, payload->message)};
    report(*record, saga::SagaOutcome::Compensated, &failure);
}

//-------------------------------------------------------------------------

void IssuerAgent::handleUnknownMessage(Message::Ptr msg)
{
    host()->logDebug("{}: unknown message {} from {}", name(), msg->type, msg->source);
}

//-------------------------------------------------------------------------

void IssuerAgent::completeWithPrices(
    const saga::PendingRecord& record, const oracle::Prices& prices)
{
    const Timestamp timestamp = now();

    std::visit(
        [&](auto&& action) {
            using T = std::remove_cvref_t<decltype(action)>;
            if constexpr (std::same_as<T, saga::PendingBuy>) {
                const auto rate =
                    exchange::ExchangeRate::fromPrice(prices.at(m_config.nativeAssetId));
                const exchange::Quote quote = m_quoteEngine.quoteBuy(
                    action.nativeAmount, rate, action.expected, timestamp);
                hostLedger().credit(action.recipient, m_config.stableAssetId, quote.output);
                m_quoteEngine.settle(quote, timestamp);
                emit({
                    .kind = event::EventKind::Mint,
                    .account = action.recipient,
                    .assetId = m_config.stableAssetId,
                    .amount = quote.output,
                    .counterparty = action.caller,
                    .memo = "buy"
                });
            }
            else if constexpr (std::same_as<T, saga::PendingSell>) {
                const auto rate =
                    exchange::ExchangeRate::fromPrice(prices.at(m_config.nativeAssetId));
                const exchange::Quote quote = m_quoteEngine.quoteSell(
                    action.stableAmount, rate, action.expected, timestamp);
                hostLedger().transfer(
                    name(), action.recipient, m_config.nativeAssetId, quote.output);
                m_quoteEngine.settle(quote, timestamp);
            }
            else if constexpr (std::same_as<T, saga::PendingMintByNative>) {
                const auto rate =
                    exchange::ExchangeRate::fromPrice(prices.at(m_config.nativeAssetId));
                const Balance amount =
                    rate.collateralisedStable(action.nativeAmount, action.collateralRatio);
                if (amount.is_zero()) {
                    raise(
                        ErrorCode::BelowMinimumExchange,
                        std::source_location::current(),
                        "{} native at ratio {}% mints nothing",
                        action.nativeAmount, action.collateralRatio);
                }
                hostLedger().credit(action.caller, m_config.stableAssetId, amount);
                emit({
                    .kind = event::EventKind::Mint,
                    .account = action.caller,
                    .assetId = m_config.stableAssetId,
                    .amount = amount,
                    .memo = fmt::format("mint by native at {}%", action.collateralRatio)
                });
            }
            else if constexpr (std::same_as<T, saga::PendingMarketExecute>) {
                market::ExecutionResult result = action.deposit
                    ? m_market.depositAndExecute(
                        action.auth,
                        action.deposit->assetId,
                        action.deposit->amount,
                        action.actions,
                        &prices,
                        timestamp)
                    : m_market.execute(action.auth, action.actions, &prices, timestamp);
                emitAll(result.events);
                startTransfers(result.transfers);
                if (action.deposit) {
                    respondTokensReceived(action.deposit->origin, Balance{});
                }
            }
            else {
                throw std::logic_error{fmt::format(
                    "{}: saga #{} does not wait for prices",
                    std::source_location::current().function_name(), record.id)};
            }
        },
        record.action);
}

//-------------------------------------------------------------------------

void IssuerAgent::completeTransfer(const saga::PendingRecord& record)
{
    std::visit(
        [&](auto&& action) {
            using T = std::remove_cvref_t<decltype(action)>;
            if constexpr (std::same_as<T, saga::PendingMarketWithdraw>) {
                emit({
                    .kind = event::EventKind::WithdrawSucceeded,
                    .account = action.account,
                    .assetId = action.assetId,
                    .amount = action.amount
                });
            }
            else if constexpr (std::same_as<T, saga::PendingTreasuryWithdraw>) {
                emit({
                    .kind = event::EventKind::WithdrawSucceeded,
                    .account = action.plan.account,
                    .assetId = action.plan.assetId,
                    .amount = action.plan.tokenAmount,
                    .memo = "treasury"
                });
            }
            else {
                throw std::logic_error{fmt::format(
                    "{}: saga #{} does not wait for a transfer",
                    std::source_location::current().function_name(), record.id)};
            }
        },
        record.action);
}

//-------------------------------------------------------------------------

void IssuerAgent::compensate(const saga::PendingRecord& record)
{
    std::visit(
        [&](auto&& action) {
            using T = std::remove_cvref_t<decltype(action)>;
            if constexpr (std::same_as<T, saga::PendingBuy>) {
                hostLedger().transfer(
                    name(), action.caller, m_config.nativeAssetId, action.nativeAmount);
            }
            else if constexpr (std::same_as<T, saga::PendingSell>) {
                hostLedger().credit(action.caller, m_config.stableAssetId, action.stableAmount);
                emit({
                    .kind = event::EventKind::Mint,
                    .account = action.caller,
                    .assetId = m_config.stableAssetId,
                    .amount = action.stableAmount,
                    .memo = "sell refund"
                });
            }
            else if constexpr (std::same_as<T, saga::PendingMintByNative>) {
                hostLedger().transfer(
                    name(), action.caller, m_config.nativeAssetId, action.nativeAmount);
            }
            else if constexpr (std::same_as<T, saga::PendingMarketExecute>) {
                if (action.deposit) {
                    respondTokensReceived(action.deposit->origin, action.deposit->amount);
                }
            }
            else if constexpr (std::same_as<T, saga::PendingMarketWithdraw>) {
                emitAll(m_market.restoreWithdrawal(
                    action.account, action.assetId, action.amount, now()).events);
            }
            else if constexpr (std::same_as<T, saga::PendingTreasuryWithdraw>) {
                m_treasury.refundWithdraw(action.plan);
                emit({
                    .kind = event::EventKind::WithdrawFailed,
                    .account = action.plan.account,
                    .assetId = action.plan.assetId,
                    .amount = action.plan.tokenAmount,
                    .memo = "treasury"
                });
                emit({
                    .kind = event::EventKind::Mint,
                    .account = action.plan.account,
                    .assetId = m_config.stableAssetId,
                    .amount = action.plan.stableAmount,
                    .memo = "treasury withdraw refund"
                });
            }
        },
        record.action);
}

//-------------------------------------------------------------------------

void IssuerAgent::respondTokensReceived(const Message::Ptr& origin, const Balance& unused)
{
    const auto payload = payloadAs<TokensReceivedPayload>(origin);
    respondToMessage(
        origin,
        MessagePayload::create<TokensReceivedResponsePayload>(payload->transferId, unused),
        now() - origin->arrival);
}

//-------------------------------------------------------------------------

}  // namespace stablecore::issuer

//-------------------------------------------------------------------------
