/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "stablecore/event/IssuerEvent.hpp"
#include "stablecore/saga/PendingAction.hpp"

//-------------------------------------------------------------------------

namespace stablecore::issuer
{

//-------------------------------------------------------------------------

struct IssuerSignals
{
    UnsyncSignal<void(const event::IssuerEvent&)> event;
    UnsyncSignal<void(const saga::SagaResolution&)> sagaResolved;
};

//-------------------------------------------------------------------------

}  // namespace stablecore::issuer

//-------------------------------------------------------------------------
