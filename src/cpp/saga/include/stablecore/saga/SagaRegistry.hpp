/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "stablecore/saga/PendingAction.hpp"

//-------------------------------------------------------------------------

namespace stablecore::saga
{

//-------------------------------------------------------------------------

// Pending-action markers of in-flight sagas. Each record resolves once.
class SagaRegistry : public JsonSerializable
{
public:
    SagaId open(PendingAction action, Timestamp now, Timestamp deadline);

    // Removes and returns the record; empty if the id is unknown or was
    // already resolved.
    [[nodiscard]] std::optional<PendingRecord> resolve(SagaId id);

    [[nodiscard]] const PendingRecord* find(SagaId id) const;
    [[nodiscard]] bool wasResolved(SagaId id) const noexcept;

    // Ids of records whose deadline passed before now.
    [[nodiscard]] std::vector<SagaId> expired(Timestamp now) const;

    [[nodiscard]] size_t size() const noexcept { return m_pending.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_pending.empty(); }

    [[nodiscard]] auto begin() const noexcept { return m_pending.begin(); }
    [[nodiscard]] auto end() const noexcept { return m_pending.end(); }

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

private:
    std::map<SagaId, PendingRecord> m_pending;
    SagaId m_idCounter{1};
};

//-------------------------------------------------------------------------

}  // namespace stablecore::saga

//-------------------------------------------------------------------------
