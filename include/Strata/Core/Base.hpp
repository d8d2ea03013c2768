#pragma once

#include "Platform.hpp"

// Base macros shared by every Strata header

#define STRATA_NODISCARD [[nodiscard]]
#define STRATA_LIKELY [[likely]]
#define STRATA_UNLIKELY [[unlikely]]

// Contract checks. Violations are programmer errors and are never recovered.
#ifdef STRATA_BUILD_DEBUG
    #include <cassert>
    #define STRATA_ASSERT(condition, message) assert((condition) && (message))
#else
    #define STRATA_ASSERT(condition, message) ((void)0)
#endif
