/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "stablecore/exchange/SpreadPolicy.hpp"

#include "stablecore/error/Error.hpp"

//-------------------------------------------------------------------------

namespace stablecore::exchange
{

//-------------------------------------------------------------------------

decimal_t SpreadPolicy::checkSpread(const decimal_t& spread, std::string_view name)
{
    static const decimal_t spreadMax = decimal_t::fromRatio(kMaxSpreadBps);

    if (!(spread < spreadMax)) {
        throw Error{
            ErrorCode::InvalidConfiguration,
            fmt::format(
                "{}: Spread '{}' should be within [0, {}); was {}",
                std::source_location::current().function_name(),
                name, spreadMax, spread)};
    }

    return spread;
}

//-------------------------------------------------------------------------

}  // namespace stablecore::exchange

//-------------------------------------------------------------------------
