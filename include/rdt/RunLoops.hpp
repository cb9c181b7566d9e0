#pragma once

// Copyright © 2022 Michael Thornburgh
// SPDX-License-Identifier: MIT

// Consolidated include file for all available RunLoop implementations.
// PreferredRunLoop is EPollRunLoop on Linux and SelectRunLoop elsewhere.

#include "SelectRunLoop.hpp"
#include "EPollRunLoop.hpp"

namespace rdt {

#ifdef __linux__

using PreferredRunLoop = EPollRunLoop;

#else

using PreferredRunLoop = SelectRunLoop;

#endif

} // namespace rdt
