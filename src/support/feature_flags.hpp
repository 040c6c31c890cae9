// src/support/feature_flags.hpp
#pragma once

/// @brief Provides default values for optional compile-time feature toggles.
/// @notes Include from translation units that depend on optionally enabled
/// features so builds succeed even when the compiler does not define the
/// corresponding macros.

/// Address width of the deployment: 0 maps the 'p' signature tag to i32,
/// 1 maps it to i64. Fixed per build.
#ifndef FUNTAB_MEMORY64
#define FUNTAB_MEMORY64 0
#endif

/// Default assertion level for function-table managers (0, 1 or 2).
/// Level 2 adds a full table scan before every new registration.
#ifndef FUNTAB_ASSERTIONS
#ifdef NDEBUG
#define FUNTAB_ASSERTIONS 0
#else
#define FUNTAB_ASSERTIONS 1
#endif
#endif
