/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "stablecore/oracle/Prices.hpp"

#include "stablecore/error/Error.hpp"

//-------------------------------------------------------------------------

namespace stablecore::oracle
{

//-------------------------------------------------------------------------

const Price& Prices::at(const AssetId& assetId, std::source_location sl) const
{
    auto it = m_prices.find(assetId);
    if (it == m_prices.end()) {
        raise(ErrorCode::UnknownAsset, sl, "No price for asset '{}'", assetId);
    }
    return it->second;
}

//-------------------------------------------------------------------------

const Price* Prices::find(const AssetId& assetId) const noexcept
{
    auto it = m_prices.find(assetId);
    return it != m_prices.end() ? &it->second : nullptr;
}

//-------------------------------------------------------------------------

bool Prices::contains(const AssetId& assetId) const noexcept
{
    return m_prices.contains(assetId);
}

//-------------------------------------------------------------------------

}  // namespace stablecore::oracle

//-------------------------------------------------------------------------
