/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "stablecore/issuer/IssuerEventLogger.hpp"

//-------------------------------------------------------------------------

namespace stablecore::issuer
{

//-------------------------------------------------------------------------

IssuerEventLogger::IssuerEventLogger(const fs::path& filepath, IssuerSignals& signals)
    : m_filepath{filepath}
{
    m_logger = std::make_unique<spdlog::logger>(
        "IssuerEventLogger",
        std::make_unique<spdlog::sinks::basic_file_sink_st>(m_filepath.generic_string(), true));
    m_logger->set_level(spdlog::level::trace);
    m_logger->set_pattern("%v");

    m_eventFeed = signals.event.connect(
        [this](const event::IssuerEvent& event) { log(event); });
    m_sagaFeed = signals.sagaResolved.connect(
        [this](const saga::SagaResolution& resolution) { log(resolution); });
}

//-------------------------------------------------------------------------

void IssuerEventLogger::log(const event::IssuerEvent& event)
{
    rapidjson::Document json;
    event.jsonSerialize(json);
    write(json);
}

//-------------------------------------------------------------------------

void IssuerEventLogger::log(const saga::SagaResolution& resolution)
{
    rapidjson::Document json;
    resolution.jsonSerialize(json);
    write(json);
}

//-------------------------------------------------------------------------

void IssuerEventLogger::write(const rapidjson::Document& json)
{
    m_logger->trace(json::json2str(json));
    m_logger->flush();
    ++m_entries;
}

//-------------------------------------------------------------------------

}  // namespace stablecore::issuer

//-------------------------------------------------------------------------
