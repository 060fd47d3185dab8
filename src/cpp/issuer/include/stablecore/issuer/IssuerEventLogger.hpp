/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "stablecore/issuer/IssuerSignals.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>

//-------------------------------------------------------------------------

namespace stablecore::issuer
{

//-------------------------------------------------------------------------

// One JSON object per line for every issuer event and saga resolution.
class IssuerEventLogger
{
public:
    IssuerEventLogger(const fs::path& filepath, IssuerSignals& signals);

    [[nodiscard]] const fs::path& filepath() const noexcept { return m_filepath; }
    [[nodiscard]] uint64_t entries() const noexcept { return m_entries; }

private:
    void log(const event::IssuerEvent& event);
    void log(const saga::SagaResolution& resolution);
    void write(const rapidjson::Document& json);

    std::unique_ptr<spdlog::logger> m_logger;
    fs::path m_filepath;
    bs2::scoped_connection m_eventFeed;
    bs2::scoped_connection m_sagaFeed;
    uint64_t m_entries{};
};

//-------------------------------------------------------------------------

}  // namespace stablecore::issuer

//-------------------------------------------------------------------------
