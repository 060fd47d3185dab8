/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "stablecore/market/Pool.hpp"

//-------------------------------------------------------------------------

namespace stablecore::market
{

//-------------------------------------------------------------------------

// Exact amount, amount capped at maxAmount, or everything available when
// neither is given.
struct AssetAmount
{
    AssetId assetId;
    std::optional<Balance> amount{};
    std::optional<Balance> maxAmount{};

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;

    [[nodiscard]] static AssetAmount exact(AssetId assetId, Balance amount)
    {
        return {std::move(assetId), std::move(amount), {}};
    }

    [[nodiscard]] static AssetAmount fromXML(pugi::xml_node node);
};

struct SharesAndAmount
{
    Balance shares;
    Balance amount;
};

// Resolves the requested amount against a pool. roundUp applies to the
// shares-to-amount leg; the amount-to-shares leg rounds the other way.
[[nodiscard]] SharesAndAmount assetAmountToShares(
    const Pool& pool,
    const Balance& availableShares,
    const AssetAmount& assetAmount,
    bool roundUp);

//-------------------------------------------------------------------------

struct Withdraw { AssetAmount asset; };
struct IncreaseCollateral { AssetAmount asset; };
struct DecreaseCollateral { AssetAmount asset; };
struct Borrow { AssetAmount asset; };
struct Repay { AssetAmount asset; };
struct BorrowStable { Balance amount; };
struct RepayStable { Balance amount; };

struct Liquidate
{
    AccountId target;
    std::vector<AssetAmount> inAssets;
    std::vector<AssetAmount> outAssets;
};

struct ForceClose { AccountId target; };

using Action = std::variant<
    Withdraw,
    IncreaseCollateral,
    DecreaseCollateral,
    Borrow,
    Repay,
    BorrowStable,
    RepayStable,
    Liquidate,
    ForceClose>;

[[nodiscard]] bool needsPrices(const Action& action) noexcept;
[[nodiscard]] bool needsPrices(const std::vector<Action>& actions) noexcept;

// Every asset whose price the actions may consult.
[[nodiscard]] std::set<AssetId> referencedAssets(const std::vector<Action>& actions);

[[nodiscard]] std::string_view actionName(const Action& action) noexcept;

[[nodiscard]] Action actionFromXML(pugi::xml_node node);
[[nodiscard]] std::vector<Action> actionsFromXML(pugi::xml_node node);

//-------------------------------------------------------------------------

}  // namespace stablecore::market

//-------------------------------------------------------------------------
