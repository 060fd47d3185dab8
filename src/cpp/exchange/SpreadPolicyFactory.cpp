/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "stablecore/exchange/SpreadPolicyFactory.hpp"

#include "stablecore/error/Error.hpp"
#include "stablecore/exchange/AdaptiveSpreadPolicy.hpp"
#include "stablecore/exchange/FixedSpreadPolicy.hpp"

//-------------------------------------------------------------------------

namespace stablecore::exchange
{

//-------------------------------------------------------------------------

std::unique_ptr<SpreadPolicy> SpreadPolicyFactory::create(
    const SpreadConfig& config, Timestamp now)
{
    return std::visit(
        [&](auto&& params) -> std::unique_ptr<SpreadPolicy> {
            using T = std::remove_cvref_t<decltype(params)>;
            if constexpr (std::same_as<T, FixedSpreadParams>) {
                return std::make_unique<FixedSpreadPolicy>(params);
            } else if constexpr (std::same_as<T, AdaptiveSpreadParams>) {
                return std::make_unique<AdaptiveSpreadPolicy>(params, now);
            }
        },
        config);
}

//-------------------------------------------------------------------------

std::unique_ptr<SpreadPolicy> SpreadPolicyFactory::createFromXML(
    pugi::xml_node node, Timestamp now)
{
    std::string_view policyType = node.attribute("type").as_string();

    if (policyType == "fixed") {
        return FixedSpreadPolicy::fromXML(node);
    } else if (policyType == "adaptive") {
        return AdaptiveSpreadPolicy::fromXML(node, now);
    }

    throw Error{
        ErrorCode::InvalidConfiguration,
        fmt::format(
            "{}: Unknown spread type '{}'",
            std::source_location::current().function_name(), policyType)};
}

//-------------------------------------------------------------------------

}  // namespace stablecore::exchange

//-------------------------------------------------------------------------
