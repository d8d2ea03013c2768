#pragma once

#include <array>
#include <bit>
#include <cstdint>
#include <span>

#include "../Core/Base.hpp"
#include "../Core/Config.hpp"

namespace Strata
{
    /**
    * Fixed-size presence bitmap. Bit i lives in word i >> 6 at position i & 63.
    * Indices are caller-guaranteed in range.
    */
    template<std::size_t Bits>
    class Bitmap
    {
    public:
        static constexpr std::size_t BITS_PER_WORD = config::MASK_BITS;
        static constexpr std::size_t WORD_COUNT = (Bits + BITS_PER_WORD - 1) / BITS_PER_WORD;

        using Word = std::uint64_t;

        constexpr Bitmap() noexcept : m_words{} {}

        // Returns true if the bit was previously clear
        constexpr bool Set(std::size_t index) noexcept
        {
            STRATA_ASSERT(index < Bits, "Bitmap index out of range");
            Word& word = m_words[index >> config::MASK_BITS_POW];
            const Word bit = Word(1) << (index & config::MASK_BITS_MASK);
            const bool added = (word & bit) == 0;
            word |= bit;
            return added;
        }

        // Returns true if the bit was previously set
        constexpr bool Reset(std::size_t index) noexcept
        {
            STRATA_ASSERT(index < Bits, "Bitmap index out of range");
            Word& word = m_words[index >> config::MASK_BITS_POW];
            const Word bit = Word(1) << (index & config::MASK_BITS_MASK);
            const bool removed = (word & bit) != 0;
            word &= ~bit;
            return removed;
        }

        STRATA_NODISCARD constexpr bool Test(std::size_t index) const noexcept
        {
            STRATA_ASSERT(index < Bits, "Bitmap index out of range");
            const Word word = m_words[index >> config::MASK_BITS_POW];
            return ((word >> (index & config::MASK_BITS_MASK)) & 1) != 0;
        }

        STRATA_NODISCARD constexpr Word GetWord(std::size_t w) const noexcept
        {
            STRATA_ASSERT(w < WORD_COUNT, "Bitmap word out of range");
            return m_words[w];
        }

        constexpr void AddWord(std::size_t w, Word mask) noexcept
        {
            STRATA_ASSERT(w < WORD_COUNT, "Bitmap word out of range");
            m_words[w] |= mask;
        }

        // Clears the bits of mask in word w and returns the bits that were actually set
        constexpr Word RemoveWord(std::size_t w, Word mask) noexcept
        {
            STRATA_ASSERT(w < WORD_COUNT, "Bitmap word out of range");
            const Word removed = m_words[w] & mask;
            m_words[w] &= ~mask;
            return removed;
        }

        STRATA_NODISCARD constexpr bool HasAll(const Bitmap& mask) const noexcept
        {
            for (std::size_t i = 0; i < WORD_COUNT; ++i)
            {
                if ((m_words[i] & mask.m_words[i]) != mask.m_words[i]) STRATA_UNLIKELY
                    return false;
            }
            return true;
        }

        STRATA_NODISCARD constexpr bool operator==(const Bitmap& other) const noexcept = default;

        STRATA_NODISCARD constexpr Bitmap operator&(const Bitmap& other) const noexcept
        {
            Bitmap result;
            for (std::size_t i = 0; i < WORD_COUNT; ++i)
            {
                result.m_words[i] = m_words[i] & other.m_words[i];
            }
            return result;
        }

        // Number of set bits
        STRATA_NODISCARD constexpr std::size_t Count() const noexcept
        {
            std::size_t count = 0;
            for (Word word : m_words)
            {
                count += static_cast<std::size_t>(std::popcount(word));
            }
            return count;
        }

        STRATA_NODISCARD constexpr bool Any() const noexcept
        {
            for (Word word : m_words)
            {
                if (word != 0) return true;
            }
            return false;
        }

        STRATA_NODISCARD constexpr bool None() const noexcept { return !Any(); }

        constexpr void Clear() noexcept { m_words.fill(0); }

        STRATA_NODISCARD constexpr std::span<const Word, WORD_COUNT> Words() const noexcept { return m_words; }

        STRATA_NODISCARD const Word* Data() const noexcept { return m_words.data(); }
        STRATA_NODISCARD Word* Data() noexcept { return m_words.data(); }

    private:
        std::array<Word, WORD_COUNT> m_words;
    };
}
