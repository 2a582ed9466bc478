/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <cstdint>

//-------------------------------------------------------------------------

// Step index of a discretized process.
using Timestamp = uint64_t;

//-------------------------------------------------------------------------
