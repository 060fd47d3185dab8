/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "stablecore/message/Message.hpp"

//-------------------------------------------------------------------------

struct HostSignals
{
    UnsyncSignal<void(Message::Ptr)> timeout;
};

//-------------------------------------------------------------------------
