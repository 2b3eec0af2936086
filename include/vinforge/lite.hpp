#pragma once

/*
===============================================================================
vinforge Lite: Public API Contract (v1)
===============================================================================

This header defines the complete public surface of the vinforge Lite API:
batch generation of unique codes, code validation, and inspection and
administration of the sequence counters.

Lite hides the Core codec, store and allocator types behind plain request
and response structs and a single error type.

Include this header to use vinforge Lite.
===============================================================================
*/

#include <vinforge/lite/service.hpp>
#include <vinforge/lite/error.hpp>
#include <vinforge/lite/version.hpp>
