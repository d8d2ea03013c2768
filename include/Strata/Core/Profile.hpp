#pragma once

#include <cstdint>

#include "Base.hpp"

// Tracy integration - only enabled in Release builds with TRACY_ENABLE
#if defined(STRATA_BUILD_RELEASE) && defined(TRACY_ENABLE)
    #include <tracy/Tracy.hpp>

    #define STRATA_PROFILE_ZONE_COLOR(color) ZoneScopedC(color)
#else
    #define STRATA_PROFILE_ZONE_COLOR(color)
#endif

namespace Strata::Profile
{
    constexpr std::uint32_t ColorTable = 0x0088FF;
    constexpr std::uint32_t ColorNetwork = 0x00DDDD;
    constexpr std::uint32_t ColorPredict = 0xDDDD00;
}
