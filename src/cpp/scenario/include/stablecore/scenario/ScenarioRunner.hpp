/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "Host.hpp"
#include "stablecore/issuer/IssuerAgent.hpp"
#include "stablecore/issuer/IssuerEventLogger.hpp"
#include "stablecore/venue/OracleVenue.hpp"
#include "stablecore/venue/TokenVenue.hpp"

//-------------------------------------------------------------------------

namespace stablecore::scenario
{

//-------------------------------------------------------------------------

struct StepOutcome
{
    size_t index{};
    std::string op;
    Timestamp timestamp{};
    std::optional<ErrorCode> error;
    std::string message;
    std::optional<SagaId> sagaId;

    [[nodiscard]] bool ok() const noexcept { return !error.has_value(); }

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;
};

//-------------------------------------------------------------------------

// Wires the issuer, the oracle venue and the token venues onto one host and
// drives them through a script of user operations.
class ScenarioRunner
{
public:
    explicit ScenarioRunner(const issuer::IssuerConfig& config);

    [[nodiscard]] Host& host() noexcept { return *m_host; }
    [[nodiscard]] issuer::IssuerAgent& issuer() noexcept { return *m_issuer; }
    [[nodiscard]] venue::OracleVenue& oracle() noexcept { return *m_oracle; }
    [[nodiscard]] venue::TokenVenue& tokenVenue(const AssetId& assetId);

    [[nodiscard]] const std::vector<StepOutcome>& outcomes() const noexcept { return m_outcomes; }
    [[nodiscard]] const std::vector<saga::SagaResolution>& resolutions() const noexcept
    {
        return m_resolutions;
    }
    [[nodiscard]] const saga::SagaResolution* resolution(SagaId sagaId) const noexcept;

    void attachEventLog(const fs::path& logDir);

    // Runs every operation in order, then drains the host.
    void run(pugi::xml_node script);
    // Synchronous failures are recorded in the outcome, never thrown.
    const StepOutcome& step(pugi::xml_node op);

    void report(rapidjson::Document& json) const;

    [[nodiscard]] static std::unique_ptr<ScenarioRunner> fromConfig(
        const fs::path& path, pugi::xml_document& doc);

private:
    std::optional<SagaId> dispatch(pugi::xml_node op);

    std::unique_ptr<Host> m_host;
    issuer::IssuerAgent* m_issuer{};
    venue::OracleVenue* m_oracle{};
    std::map<AssetId, venue::TokenVenue*> m_tokenVenues;
    std::unique_ptr<issuer::IssuerEventLogger> m_eventLogger;
    std::vector<StepOutcome> m_outcomes;
    std::vector<saga::SagaResolution> m_resolutions;
    bs2::scoped_connection m_resolutionFeed;
};

//-------------------------------------------------------------------------

}  // namespace stablecore::scenario

//-------------------------------------------------------------------------
