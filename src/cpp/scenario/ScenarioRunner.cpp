/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "stablecore/scenario/ScenarioRunner.hpp"

#include "stablecore/error/Error.hpp"
#include "stablecore/exchange/SpreadPolicyFactory.hpp"
#include "xml_util.hpp"

//-------------------------------------------------------------------------

namespace stablecore::scenario
{

//-------------------------------------------------------------------------

namespace
{

using xml::requireAttribute;

[[nodiscard]] Balance amountOf(pugi::xml_node node, const char* name = "amount")
{
    return xml::getBalance(node, name);
}

[[nodiscard]] std::optional<AccountId> optionalAccount(pugi::xml_node node, const char* name)
{
    if (pugi::xml_attribute attr = node.attribute(name)) {
        return attr.as_string();
    }
    return {};
}

[[nodiscard]] std::optional<exchange::ExpectedRate> expectedRateOf(pugi::xml_node node)
{
    pugi::xml_attribute multiplier = node.attribute("expectedMultiplier");
    if (!multiplier) return {};
    return exchange::ExpectedRate{
        .multiplier = xml::getBalance(node, "expectedMultiplier"),
        .decimals = xml::getUint<uint8_t>(node, "expectedDecimals"),
        .slippage = xml::getUint<uint32_t>(node, "slippage", 0)
    };
}

[[nodiscard]] TransferRoute routeOf(pugi::xml_node node)
{
    const std::string_view name = node.attribute("route").as_string("market");
    const auto route = magic_enum::enum_cast<TransferRoute>(name, magic_enum::case_insensitive);
    if (!route) {
        raise(
            ErrorCode::InvalidConfiguration,
            std::source_location::current(),
            "Unknown route '{}' on <{}>", name, node.name());
    }
    return *route;
}

}  // namespace

//-------------------------------------------------------------------------

void StepOutcome::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("index", rapidjson::Value{static_cast<uint64_t>(index)}, allocator);
        json.AddMember("op", rapidjson::Value{op.c_str(), allocator}, allocator);
        json.AddMember("timestamp", rapidjson::Value{timestamp}, allocator);
        json.AddMember("ok", rapidjson::Value{ok()}, allocator);
        if (error) {
            const auto errorName = errorCode2String(*error);
            json.AddMember(
                "error",
                rapidjson::Value{
                    errorName.data(), static_cast<rapidjson::SizeType>(errorName.size()), allocator},
                allocator);
            json.AddMember("message", rapidjson::Value{message.c_str(), allocator}, allocator);
        }
        json::setOptionalMember(json, "sagaId", sagaId);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

ScenarioRunner::ScenarioRunner(const issuer::IssuerConfig& config)
    : m_host{std::make_unique<Host>(config.start)}
{
    m_host->setDebug(config.debug);

    m_oracle = &m_host->emplaceParticipant<venue::OracleVenue>(
        config.oracleVenue.name, config.oracleVenue.recencyDurationSec);
    m_host->setLatency(config.oracleVenue.name, config.oracleVenue.latency);
    for (const auto& [assetId, price] : config.oracleVenue.prices) {
        m_oracle->publish(assetId, price);
    }

    for (const auto& spec : config.tokenVenues) {
        m_tokenVenues[spec.assetId] =
            &m_host->emplaceParticipant<venue::TokenVenue>(spec.name, spec.assetId, config.name);
        m_host->setLatency(spec.name, spec.latency);
    }

    m_issuer = &m_host->emplaceParticipant<issuer::IssuerAgent>(config);

    for (const auto& [account, assetId, amount] : config.balances) {
        if (assetId == config.stableAssetId || assetId == config.nativeAssetId) {
            m_host->ledger().credit(account, assetId, amount);
        } else {
            tokenVenue(assetId).mint(account, amount);
        }
    }

    m_resolutionFeed = m_issuer->signals().sagaResolved.connect(
        [this](const saga::SagaResolution& resolution) { m_resolutions.push_back(resolution); });
}

//-------------------------------------------------------------------------

venue::TokenVenue& ScenarioRunner::tokenVenue(const AssetId& assetId)
{
    auto it = m_tokenVenues.find(assetId);
    if (it == m_tokenVenues.end()) {
        raise(
            ErrorCode::UnknownAsset,
            std::source_location::current(),
            "No token venue carries '{}'", assetId);
    }
    return *it->second;
}

//-------------------------------------------------------------------------

const saga::SagaResolution* ScenarioRunner::resolution(SagaId sagaId) const noexcept
{
    auto it = std::ranges::find(m_resolutions, sagaId, &saga::SagaResolution::sagaId);
    return it != m_resolutions.end() ? &*it : nullptr;
}

//-------------------------------------------------------------------------

void ScenarioRunner::attachEventLog(const fs::path& logDir)
{
    fs::create_directories(logDir);
    m_eventLogger = std::make_unique<issuer::IssuerEventLogger>(
        logDir / fmt::format("{}.events.log", m_issuer->name()), m_issuer->signals());
}

//-------------------------------------------------------------------------

void ScenarioRunner::run(pugi::xml_node script)
{
    for (pugi::xml_node op : script.children()) {
        if (op.type() != pugi::node_element) continue;
        step(op);
    }
    m_host->runUntilIdle();
}

//-------------------------------------------------------------------------

const StepOutcome& ScenarioRunner::step(pugi::xml_node op)
{
    StepOutcome outcome{
        .index = m_outcomes.size(),
        .op = op.name(),
        .timestamp = m_host->currentTimestamp()
    };
    try {
        outcome.sagaId = dispatch(op);
    }
    catch (const Error& e) {
        outcome.error = e.code();
        outcome.message = e.what();
        m_host->logDebug("{} #{} failed: {}", outcome.op, outcome.index, e.what());
    }
    m_outcomes.push_back(std::move(outcome));
    return m_outcomes.back();
}

//-------------------------------------------------------------------------

std::optional<SagaId> ScenarioRunner::dispatch(pugi::xml_node op)
{
    const std::string_view name = op.name();

    if (name == "Advance") {
        if (op.attribute("to")) {
            m_host->runUntil(xml::getUint<Timestamp>(op, "to"));
        } else {
            m_host->advance(xml::getUint<Timestamp>(op, "by"));
        }
        return {};
    }
    if (name == "Run") {
        m_host->runUntilIdle();
        return {};
    }
    if (name == "PublishPrice") {
        m_oracle->publish(requireAttribute(op, "asset").as_string(), oracle::Price::fromXML(op));
        return {};
    }
    if (name == "OracleFailing") {
        m_oracle->setFailing(op.attribute("flag").as_bool(true));
        return {};
    }
    if (name == "VenueFailing") {
        tokenVenue(requireAttribute(op, "asset").as_string())
            .setFailing(op.attribute("flag").as_bool(true));
        return {};
    }
    if (name == "Latency") {
        m_host->setLatency(
            requireAttribute(op, "participant").as_string(),
            xml::getUint(op, "value"));
        return {};
    }
    if (name == "Buy") {
        return m_issuer->buy(
            requireAttribute(op, "caller").as_string(),
            amountOf(op),
            optionalAccount(op, "recipient"),
            expectedRateOf(op));
    }
    if (name == "Sell") {
        return m_issuer->sell(
            requireAttribute(op, "caller").as_string(),
            amountOf(op),
            optionalAccount(op, "recipient"),
            expectedRateOf(op));
    }
    if (name == "MintByNative") {
        return m_issuer->mintByNative(
            requireAttribute(op, "caller").as_string(),
            amountOf(op),
            xml::getUint<uint32_t>(op, "ratio"));
    }
    if (name == "Deposit") {
        tokenVenue(requireAttribute(op, "asset").as_string()).transferCall(
            requireAttribute(op, "sender").as_string(),
            amountOf(op),
            routeOf(op),
            market::actionsFromXML(op));
        return {};
    }
    if (name == "Execute") {
        return m_issuer->execute(
            requireAttribute(op, "caller").as_string(), market::actionsFromXML(op));
    }
    if (name == "TreasuryWithdraw") {
        return m_issuer->treasuryWithdraw(
            requireAttribute(op, "caller").as_string(),
            requireAttribute(op, "asset").as_string(),
            amountOf(op));
    }
    if (name == "TransferCommission") {
        m_issuer->transferCommission(
            requireAttribute(op, "caller").as_string(),
            requireAttribute(op, "receiver").as_string(),
            amountOf(op));
        return {};
    }
    if (name == "Recover") {
        m_issuer->recover(
            requireAttribute(op, "caller").as_string(),
            xml::getUint(op, "saga"));
        return {};
    }
    if (name == "SetAssetEnabled") {
        m_issuer->setAssetEnabled(
            requireAttribute(op, "caller").as_string(),
            requireAttribute(op, "asset").as_string(),
            op.attribute("flag").as_bool(true));
        return {};
    }
    if (name == "SetSpread") {
        m_issuer->setSpread(
            requireAttribute(op, "caller").as_string(),
            exchange::SpreadPolicyFactory::createFromXML(op, m_host->currentTimestamp())->config());
        return {};
    }

    raise(
        ErrorCode::InvalidConfiguration,
        std::source_location::current(),
        "Unknown operation <{}>", name);
}

//-------------------------------------------------------------------------

void ScenarioRunner::report(rapidjson::Document& json) const
{
    json.SetObject();
    auto& allocator = json.GetAllocator();

    const market::MoneyMarket& market = m_issuer->market();

    rapidjson::Document assetsJson{rapidjson::kObjectType, &allocator};
    for (const AssetId& assetId : market.registry().ids()) {
        market.assetView(assetsJson, assetId, assetId);
    }
    json.AddMember("assets", assetsJson, allocator);

    rapidjson::Document accountsJson{rapidjson::kObjectType, &allocator};
    for (const auto& [accountId, _] : market.positions()) {
        market.accountView(accountsJson, accountId, nullptr, accountId);
    }
    json.AddMember("accounts", accountsJson, allocator);

    m_host->ledger().jsonSerialize(json, "ledger");

    rapidjson::Document stepsJson{rapidjson::kArrayType, &allocator};
    for (const auto& outcome : m_outcomes) {
        rapidjson::Document outcomeJson{&allocator};
        outcome.jsonSerialize(outcomeJson);
        stepsJson.PushBack(outcomeJson, allocator);
    }
    json.AddMember("steps", stepsJson, allocator);

    rapidjson::Document sagasJson{rapidjson::kArrayType, &allocator};
    for (const auto& resolution : m_resolutions) {
        rapidjson::Document resolutionJson{&allocator};
        resolution.jsonSerialize(resolutionJson);
        sagasJson.PushBack(resolutionJson, allocator);
    }
    json.AddMember("sagas", sagasJson, allocator);
}

//-------------------------------------------------------------------------

std::unique_ptr<ScenarioRunner> ScenarioRunner::fromConfig(
    const fs::path& path, pugi::xml_document& doc)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    pugi::xml_parse_result result = doc.load_file(path.c_str());
    if (!result) {
        throw Error{
            ErrorCode::InvalidConfiguration,
            fmt::format("{}: cannot load '{}': {}", ctx, path.generic_string(), result.description())};
    }
    return std::make_unique<ScenarioRunner>(issuer::IssuerConfig::fromXML(doc.child("Issuer")));
}

//-------------------------------------------------------------------------

}  // namespace stablecore::scenario

//-------------------------------------------------------------------------
