#pragma once

// Debug/Release Detection
#if defined(DEBUG) || defined(_DEBUG) || defined(STRATA_DEBUG)
    #define STRATA_BUILD_DEBUG 1
#elif defined(NDEBUG) || defined(STRATA_RELEASE)
    #define STRATA_BUILD_RELEASE 1
#endif

// C++ Standard Detection
#if __cplusplus >= 202002L || (defined(_MSVC_LANG) && _MSVC_LANG >= 202002L)
    #define STRATA_CPP20 1
#endif

#if !defined(STRATA_CPP20)
    #error "Strata requires C++20 or later"
#endif
