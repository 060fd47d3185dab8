/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "stablecore/market/Action.hpp"
#include "stablecore/message/MessagePayload.hpp"
#include "stablecore/oracle/Price.hpp"

//-------------------------------------------------------------------------

namespace stablecore::message
{

inline constexpr std::string_view kPriceData = "PRICE_DATA";
inline constexpr std::string_view kTransfer = "TRANSFER";
inline constexpr std::string_view kTokensReceived = "TOKENS_RECEIVED";
inline constexpr std::string_view kResponsePrefix = "RESPONSE_";
inline constexpr std::string_view kErrorPrefix = "ERROR";

}  // namespace stablecore::message

//-------------------------------------------------------------------------

struct PriceDataRequestPayload : public MessagePayload
{
    using Ptr = std::shared_ptr<PriceDataRequestPayload>;

    SagaId sagaId;
    std::vector<AssetId> assetIds;

    PriceDataRequestPayload(SagaId sagaId, std::vector<AssetId> assetIds) noexcept
        : sagaId{sagaId}, assetIds{std::move(assetIds)}
    {}

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;
};

//-------------------------------------------------------------------------

struct PriceDataResponsePayload : public MessagePayload
{
    using Ptr = std::shared_ptr<PriceDataResponsePayload>;

    SagaId sagaId;
    stablecore::oracle::PriceData data;

    PriceDataResponsePayload(SagaId sagaId, stablecore::oracle::PriceData data) noexcept
        : sagaId{sagaId}, data{std::move(data)}
    {}

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;
};

//-------------------------------------------------------------------------

struct TransferRequestPayload : public MessagePayload
{
    using Ptr = std::shared_ptr<TransferRequestPayload>;

    SagaId sagaId;
    AccountId receiver;
    Balance amount;

    TransferRequestPayload(SagaId sagaId, AccountId receiver, Balance amount) noexcept
        : sagaId{sagaId}, receiver{std::move(receiver)}, amount{std::move(amount)}
    {}

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;
};

//-------------------------------------------------------------------------

struct TransferResponsePayload : public MessagePayload
{
    using Ptr = std::shared_ptr<TransferResponsePayload>;

    SagaId sagaId;
    AccountId receiver;
    Balance amount;

    TransferResponsePayload(SagaId sagaId, AccountId receiver, Balance amount) noexcept
        : sagaId{sagaId}, receiver{std::move(receiver)}, amount{std::move(amount)}
    {}

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;
};

//-------------------------------------------------------------------------

// Failure of an external venue while serving a saga step.
struct SagaErrorPayload : public MessagePayload
{
    using Ptr = std::shared_ptr<SagaErrorPayload>;

    SagaId sagaId;
    std::string message;

    SagaErrorPayload(SagaId sagaId, std::string message) noexcept
        : sagaId{sagaId}, message{std::move(message)}
    {}

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;
};

//-------------------------------------------------------------------------

enum class TransferRoute : uint8_t
{
    Market,
    Reserve,
    Treasury
};

// Tokens moved to the issuer on a token venue, with what to do with them.
struct TokensReceivedPayload : public MessagePayload
{
    using Ptr = std::shared_ptr<TokensReceivedPayload>;

    uint64_t transferId;
    AccountId sender;
    AssetId assetId;
    Balance amount;
    TransferRoute route;
    std::vector<stablecore::market::Action> actions;

    TokensReceivedPayload(
        uint64_t transferId,
        AccountId sender,
        AssetId assetId,
        Balance amount,
        TransferRoute route,
        std::vector<stablecore::market::Action> actions = {}) noexcept
        : transferId{transferId},
          sender{std::move(sender)},
          assetId{std::move(assetId)},
          amount{std::move(amount)},
          route{route},
          actions{std::move(actions)}
    {}

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;
};

//-------------------------------------------------------------------------

// The part of a TokensReceived transfer the issuer hands back.
struct TokensReceivedResponsePayload : public MessagePayload
{
    using Ptr = std::shared_ptr<TokensReceivedResponsePayload>;

    uint64_t transferId;
    Balance unused;

    TokensReceivedResponsePayload(uint64_t transferId, Balance unused) noexcept
        : transferId{transferId}, unused{std::move(unused)}
    {}

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;
};

//-------------------------------------------------------------------------
