#pragma once

#include <cstddef>
#include <cstdint>

#include "Base.hpp"

// Number of generation bits in an EntityId. The remaining bits hold the index.
#ifndef STRATA_ENTITY_GENERATION_BITS
    #define STRATA_ENTITY_GENERATION_BITS 8
#endif

namespace Strata
{
    namespace config
    {
        // Bits per presence word
        inline constexpr std::uint32_t MASK_BITS_POW = 6;
        inline constexpr std::uint32_t MASK_BITS = 1u << MASK_BITS_POW;
        inline constexpr std::uint32_t MASK_BITS_MASK = MASK_BITS - 1;

        // 16 words * 64 bits = 1024 slots per page
        inline constexpr std::uint32_t PAGE_MASK_COUNT_POW = 4;
        inline constexpr std::size_t PAGE_MASK_COUNT = std::size_t{1} << PAGE_MASK_COUNT_POW;
        inline constexpr std::uint32_t PAGE_SIZE_POW = PAGE_MASK_COUNT_POW + MASK_BITS_POW;
        inline constexpr std::uint32_t PAGE_SIZE = 1u << PAGE_SIZE_POW;
        inline constexpr std::uint32_t PAGE_MASK = PAGE_SIZE - 1;

        // Ownership masks of EntityPool cover repeating runs of this many pages
        inline constexpr std::size_t OWNERSHIP_PERIOD = 64;

        // Ring capacity of a PredictBuffer, in ticks
        inline constexpr std::int64_t PREDICT_BUFFER_SIZE_POW = 5;
        inline constexpr std::int64_t PREDICT_BUFFER_SIZE = std::int64_t{1} << PREDICT_BUFFER_SIZE_POW;
        inline constexpr std::int64_t PREDICT_BUFFER_MASK = PREDICT_BUFFER_SIZE - 1;

        inline constexpr std::size_t MAX_JOIN_ARITY = 9;
    }

    inline constexpr std::uint32_t PAGE_SIZE = config::PAGE_SIZE;
}
