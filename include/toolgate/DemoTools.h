//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: DemoTools.h
// Purpose: Built-in demonstration tools served by the gateway executable
//==========================================================================================================

#pragma once

#include "toolgate/ToolRegistry.h"

namespace toolgate {

//==========================================================================================================
// RegisterDemoTools
// Purpose: Registers echo(message) and add(a, b).
// Notes:
//   add sums two int64 values exactly. Non-integer operands, or a sum that overflows int64, are added
//   as doubles instead.
//==========================================================================================================
void RegisterDemoTools(ToolRegistry& registry);

} // namespace toolgate
