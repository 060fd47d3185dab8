/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "stablecore/market/Action.hpp"

#include "stablecore/error/Error.hpp"
#include "xml_util.hpp"

#include <array>

//-------------------------------------------------------------------------

namespace stablecore::market
{

//-------------------------------------------------------------------------

void AssetAmount::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("assetId", rapidjson::Value{assetId.c_str(), allocator}, allocator);
        json::setOptionalMember(json, "amount", amount);
        json::setOptionalMember(json, "maxAmount", maxAmount);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

AssetAmount AssetAmount::fromXML(pugi::xml_node node)
{
    AssetAmount assetAmount;
    assetAmount.assetId = xml::requireAttribute(node, "asset").as_string();
    if (node.attribute("amount")) {
        assetAmount.amount = xml::getBalance(node, "amount");
    }
    if (node.attribute("maxAmount")) {
        assetAmount.maxAmount = xml::getBalance(node, "maxAmount");
    }
    return assetAmount;
}

//-------------------------------------------------------------------------

SharesAndAmount assetAmountToShares(
    const Pool& pool,
    const Balance& availableShares,
    const AssetAmount& assetAmount,
    bool roundUp)
{
    static constexpr auto ctx = std::source_location::current();

    SharesAndAmount result;
    if (assetAmount.amount) {
        result.shares = pool.amountToShares(*assetAmount.amount, !roundUp);
        result.amount = *assetAmount.amount;
    }
    else if (assetAmount.maxAmount) {
        result.shares =
            std::min(availableShares, pool.amountToShares(*assetAmount.maxAmount, !roundUp));
        result.amount =
            std::min(pool.sharesToAmount(result.shares, roundUp), *assetAmount.maxAmount);
    }
    else {
        result.shares = availableShares;
        result.amount = pool.sharesToAmount(availableShares, roundUp);
    }

    if (result.shares.is_zero() || result.amount.is_zero()) {
        raise(
            ErrorCode::InvalidArgument,
            ctx,
            "Amount of '{}' resolves to zero", assetAmount.assetId);
    }
    return result;
}

//-------------------------------------------------------------------------

bool needsPrices(const Action& action) noexcept
{
    return std::holds_alternative<DecreaseCollateral>(action)
        || std::holds_alternative<Borrow>(action)
        || std::holds_alternative<BorrowStable>(action)
        || std::holds_alternative<Liquidate>(action)
        || std::holds_alternative<ForceClose>(action);
}

//-------------------------------------------------------------------------

bool needsPrices(const std::vector<Action>& actions) noexcept
{
    return std::ranges::any_of(actions, [](const Action& action) { return needsPrices(action); });
}

//-------------------------------------------------------------------------

std::set<AssetId> referencedAssets(const std::vector<Action>& actions)
{
    std::set<AssetId> ids;
    for (const auto& action : actions) {
        std::visit(
            [&](auto&& a) {
                using T = std::remove_cvref_t<decltype(a)>;
                if constexpr (std::same_as<T, Liquidate>) {
                    for (const auto& assetAmount : a.inAssets) ids.insert(assetAmount.assetId);
                    for (const auto& assetAmount : a.outAssets) ids.insert(assetAmount.assetId);
                }
                else if constexpr (std::same_as<T, BorrowStable>
                    || std::same_as<T, RepayStable>
                    || std::same_as<T, ForceClose>) {
                    return;
                }
                else {
                    ids.insert(a.asset.assetId);
                }
            },
            action);
    }
    return ids;
}

//-------------------------------------------------------------------------

std::string_view actionName(const Action& action) noexcept
{
    static constexpr std::array<std::string_view, std::variant_size_v<Action>> names{
        "Withdraw",
        "IncreaseCollateral",
        "DecreaseCollateral",
        "Borrow",
        "Repay",
        "BorrowStable",
        "RepayStable",
        "Liquidate",
        "ForceClose"
    };
    return names[action.index()];
}

//-------------------------------------------------------------------------

Action actionFromXML(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current();

    const std::string_view name = node.name();
    if (name == "Withdraw") return Withdraw{AssetAmount::fromXML(node)};
    if (name == "IncreaseCollateral") return IncreaseCollateral{AssetAmount::fromXML(node)};
    if (name == "DecreaseCollateral") return DecreaseCollateral{AssetAmount::fromXML(node)};
    if (name == "Borrow") return Borrow{AssetAmount::fromXML(node)};
    if (name == "Repay") return Repay{AssetAmount::fromXML(node)};
    if (name == "BorrowStable") {
        return BorrowStable{xml::getBalance(node, "amount")};
    }
    if (name == "RepayStable") {
        return RepayStable{xml::getBalance(node, "amount")};
    }
    if (name == "Liquidate") {
        Liquidate liquidate{.target = xml::requireAttribute(node, "target").as_string()};
        for (pugi::xml_node child : node.children("In")) {
            liquidate.inAssets.push_back(AssetAmount::fromXML(child));
        }
        for (pugi::xml_node child : node.children("Out")) {
            liquidate.outAssets.push_back(AssetAmount::fromXML(child));
        }
        return liquidate;
    }
    if (name == "ForceClose") return ForceClose{xml::requireAttribute(node, "target").as_string()};

    raise(ErrorCode::InvalidConfiguration, ctx, "Unknown market action <{}>", name);
}

//-------------------------------------------------------------------------

std::vector<Action> actionsFromXML(pugi::xml_node node)
{
    std::vector<Action> actions;
    for (pugi::xml_node child : node.children()) {
        if (child.type() != pugi::node_element) continue;
        actions.push_back(actionFromXML(child));
    }
    return actions;
}

//-------------------------------------------------------------------------

}  // namespace stablecore::market

//-------------------------------------------------------------------------
