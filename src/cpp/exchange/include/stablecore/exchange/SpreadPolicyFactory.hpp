/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "stablecore/exchange/SpreadPolicy.hpp"

//-------------------------------------------------------------------------

namespace stablecore::exchange
{

//-------------------------------------------------------------------------

class SpreadPolicyFactory
{
public:
    [[nodiscard]] static std::unique_ptr<SpreadPolicy> create(
        const SpreadConfig& config, Timestamp now);

    [[nodiscard]] static std::unique_ptr<SpreadPolicy> createFromXML(
        pugi::xml_node node, Timestamp now);

private:
    SpreadPolicyFactory() noexcept = default;
};

//-------------------------------------------------------------------------

}  // namespace stablecore::exchange

//-------------------------------------------------------------------------
