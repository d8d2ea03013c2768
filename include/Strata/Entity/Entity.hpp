#pragma once

#include <concepts>
#include <cstdint>
#include <functional>
#include <limits>
#include <string_view>
#include <type_traits>

#include <fmt/format.h>

#include "../Core/Base.hpp"
#include "../Core/Config.hpp"

namespace Strata
{
    template<typename T>
    concept EntityTraitsConcept = requires
    {
        typename T::ValueType;

        { T::INDEX_BITS } -> std::convertible_to<std::uint32_t>;
        { T::GENERATION_BITS } -> std::convertible_to<std::uint32_t>;
        { T::INDEX_MASK } -> std::convertible_to<typename T::ValueType>;
        { T::GENERATION_MASK } -> std::convertible_to<typename T::ValueType>;

        requires std::unsigned_integral<typename T::ValueType>;
    };

    namespace Detail
    {
        /**
        * Entity identifier: index in the low bits, generation in the high bits.
        * Two ids are equal only if both fields match. Tables address storage by
        * the index alone.
        */
        template<EntityTraitsConcept Traits>
        class BasicEntityId
        {
        public:
            using ValueType = typename Traits::ValueType;

            static constexpr std::uint32_t BITS = sizeof(ValueType) * 8;
            static constexpr std::uint32_t INDEX_BITS = Traits::INDEX_BITS;
            static constexpr std::uint32_t GENERATION_BITS = Traits::GENERATION_BITS;
            static constexpr ValueType INDEX_MASK = Traits::INDEX_MASK;
            static constexpr ValueType GENERATION_MASK = Traits::GENERATION_MASK;
            static constexpr ValueType INDEX_COUNT = INDEX_MASK + 1;
            static constexpr std::uint32_t GENERATION_COUNT = std::uint32_t{1} << GENERATION_BITS;

            constexpr BasicEntityId() noexcept = default;
            constexpr explicit BasicEntityId(ValueType value) noexcept : m_value{value} {}

            STRATA_NODISCARD static constexpr BasicEntityId FromParts(ValueType index, ValueType generation) noexcept
            {
                return BasicEntityId((index & INDEX_MASK) | ((generation & GENERATION_MASK) << INDEX_BITS));
            }

            // All bits set. Pools never hand out the last index, so no live id compares equal to it.
            STRATA_NODISCARD static constexpr BasicEntityId Invalid() noexcept
            {
                return BasicEntityId(std::numeric_limits<ValueType>::max());
            }

            STRATA_NODISCARD constexpr bool IsValid() const noexcept { return m_value != std::numeric_limits<ValueType>::max(); }

            STRATA_NODISCARD constexpr bool operator==(const BasicEntityId& other) const noexcept = default;
            STRATA_NODISCARD constexpr bool operator<(const BasicEntityId& other) const noexcept { return m_value < other.m_value; }

            STRATA_NODISCARD constexpr std::size_t GetIndex() const noexcept { return static_cast<std::size_t>(m_value & INDEX_MASK); }
            STRATA_NODISCARD constexpr ValueType GetGeneration() const noexcept { return m_value >> INDEX_BITS; }
            STRATA_NODISCARD constexpr ValueType GetValue() const noexcept { return m_value; }

            STRATA_NODISCARD constexpr std::size_t GetPageIndex() const noexcept { return GetIndex() >> config::PAGE_SIZE_POW; }
            STRATA_NODISCARD constexpr std::size_t GetSlot() const noexcept { return GetIndex() & config::PAGE_MASK; }

            STRATA_NODISCARD constexpr BasicEntityId WithGeneration(ValueType generation) const noexcept
            {
                return FromParts(m_value & INDEX_MASK, generation);
            }

            // Generation wraps around, so a recycled index never becomes invalid
            STRATA_NODISCARD constexpr BasicEntityId NextGeneration() const noexcept
            {
                return WithGeneration((GetGeneration() + 1) & GENERATION_MASK);
            }

        private:
            ValueType m_value = 0;
        };
    }

    template<std::uint32_t TotalBits, std::uint32_t GenerationBits>
    struct EntityTraits
    {
        static_assert(TotalBits == 32 || TotalBits == 64, "Only 32 or 64 bit variants supported");
        static_assert(GenerationBits > 0 && GenerationBits < TotalBits, "Generation bits must leave room for the index");

        using ValueType = std::conditional_t<TotalBits == 32, std::uint32_t, std::uint64_t>;

        static constexpr std::uint32_t INDEX_BITS = TotalBits - GenerationBits;
        static constexpr std::uint32_t GENERATION_BITS = GenerationBits;
        static constexpr ValueType INDEX_MASK = (ValueType{1} << INDEX_BITS) - 1;
        static constexpr ValueType GENERATION_MASK = (ValueType{1} << GenerationBits) - 1;
    };

    using EntityTraits32 = EntityTraits<32, STRATA_ENTITY_GENERATION_BITS>;

    using EntityId = Detail::BasicEntityId<EntityTraits32>;

    struct EntityHash
    {
        std::size_t operator()(const EntityId& id) const noexcept
        {
            // Fibonacci hashing spreads sequential ids across buckets
            return static_cast<std::size_t>(std::uint64_t{id.GetValue()} * 0x9E3779B97F4A7C15ULL);
        }
    };
}

namespace std
{
    template<>
    struct hash<Strata::EntityId>
    {
        STRATA_NODISCARD std::size_t operator()(const Strata::EntityId& id) const noexcept
        {
            return Strata::EntityHash{}(id);
        }
    };
}

// Formats as "index-generation"
template<>
struct fmt::formatter<Strata::EntityId> : fmt::formatter<std::string_view>
{
    template<typename FormatContext>
    auto format(const Strata::EntityId& id, FormatContext& ctx) const -> decltype(ctx.out())
    {
        return fmt::format_to(ctx.out(), "{}-{}", id.GetIndex(), id.GetGeneration());
    }
};
