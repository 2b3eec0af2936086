#pragma once

/*
===============================================================================
vinforge: Public API Entry Point
===============================================================================

vinforge exposes a stable, user-facing API via vinforge Lite, built on top
of vinforge Core (codec, sequence stores, batch allocator).

Only symbols declared in the vinforge::lite namespace are part of the
public API contract.
===============================================================================
*/

#include <vinforge/lite.hpp>
