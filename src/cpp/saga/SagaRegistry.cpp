/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "stablecore/saga/SagaRegistry.hpp"

//-------------------------------------------------------------------------

namespace stablecore::saga
{

//-------------------------------------------------------------------------

SagaId SagaRegistry::open(PendingAction action, Timestamp now, Timestamp deadline)
{
    const SagaId id = m_idCounter++;
    m_pending.emplace(
        id,
        PendingRecord{
            .id = id, .action = std::move(action), .startedAt = now, .deadline = deadline});
    return id;
}

//-------------------------------------------------------------------------

std::optional<PendingRecord> SagaRegistry::resolve(SagaId id)
{
    auto node = m_pending.extract(id);
    if (node.empty()) return {};
    return std::move(node.mapped());
}

//-------------------------------------------------------------------------

const PendingRecord* SagaRegistry::find(SagaId id) const
{
    auto it = m_pending.find(id);
    return it != m_pending.end() ? &it->second : nullptr;
}

//-------------------------------------------------------------------------

bool SagaRegistry::wasResolved(SagaId id) const noexcept
{
    return id != 0 && id < m_idCounter && !m_pending.contains(id);
}

//-------------------------------------------------------------------------

std::vector<SagaId> SagaRegistry::expired(Timestamp now) const
{
    return m_pending
        | views::filter([now](const auto& entry) { return entry.second.deadline < now; })
        | views::keys
        | ranges::to<std::vector>();
}

//-------------------------------------------------------------------------

void SagaRegistry::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetArray();
        auto& allocator = json.GetAllocator();
        for (const auto& [_, record] : m_pending) {
            rapidjson::Document recordJson{&allocator};
            record.jsonSerialize(recordJson);
            json.PushBack(recordJson, allocator);
        }
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace stablecore::saga

//-------------------------------------------------------------------------
