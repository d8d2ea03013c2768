#pragma once

#include <array>
#include <bit>
#include <cstdint>
#include <optional>
#include <span>
#include <type_traits>
#include <utility>

#include "../Container/Bitmap.hpp"
#include "../Core/Base.hpp"
#include "../Core/Config.hpp"
#include "../Query/MaskIterator.hpp"

namespace Strata
{
    /**
    * Fixed block of PAGE_SIZE slots: a presence bitmap next to a dense value
    * array. A slot's value is only meaningful while its bit is set; removed
    * slots are reset to T{}.
    */
    template<typename T>
    class Page
    {
        static_assert(std::is_default_constructible_v<T>, "Page values must be default constructible");

    public:
        using ValueType = T;
        using MaskType = Bitmap<config::PAGE_SIZE>;
        using Word = typename MaskType::Word;

        static constexpr std::size_t SIZE = config::PAGE_SIZE;
        static constexpr std::size_t WORD_COUNT = config::PAGE_MASK_COUNT;

        Page() = default;

        STRATA_NODISCARD bool Contains(std::size_t index) const noexcept
        {
            return m_mask.Test(index);
        }

        STRATA_NODISCARD T& Get(std::size_t index) noexcept
        {
            STRATA_ASSERT(m_mask.Test(index), "Page slot is empty");
            return m_values[index];
        }

        STRATA_NODISCARD const T& Get(std::size_t index) const noexcept
        {
            STRATA_ASSERT(m_mask.Test(index), "Page slot is empty");
            return m_values[index];
        }

        STRATA_NODISCARD T* TryGet(std::size_t index) noexcept
        {
            return m_mask.Test(index) ? &m_values[index] : nullptr;
        }

        STRATA_NODISCARD const T* TryGet(std::size_t index) const noexcept
        {
            return m_mask.Test(index) ? &m_values[index] : nullptr;
        }

        // Inserts or overwrites
        T& Add(std::size_t index, T value)
        {
            m_mask.Set(index);
            m_values[index] = std::move(value);
            return m_values[index];
        }

        // Inserts only if the slot is empty; returns whether it inserted
        bool TryAdd(std::size_t index, T value)
        {
            if (!m_mask.Set(index))
            {
                return false;
            }
            m_values[index] = std::move(value);
            return true;
        }

        T& GetOrAdd(std::size_t index)
        {
            m_mask.Set(index);
            return m_values[index];
        }

        // Marks a slot present and returns it, or nullptr if it was already present
        T* TryAddDefault(std::size_t index)
        {
            if (!m_mask.Set(index))
            {
                return nullptr;
            }
            return &m_values[index];
        }

        std::optional<T> Remove(std::size_t index)
        {
            if (!m_mask.Reset(index))
            {
                return std::nullopt;
            }

            std::optional<T> removed(std::move(m_values[index]));
            m_values[index] = T{};
            return removed;
        }

        // Removes the slots of word w named by mask and returns the bits that were present
        Word RemoveMask(std::size_t w, Word mask)
        {
            const Word removed = m_mask.RemoveWord(w, mask);
            ResetValues(w, removed);
            return removed;
        }

        template<typename Words>
        void RemoveMaskRange(const Words& words)
        {
            std::size_t w = 0;
            for (Word mask : words)
            {
                if (w >= WORD_COUNT)
                {
                    break;
                }
                RemoveMask(w++, mask);
            }
        }

        void Clear()
        {
            for (std::size_t w = 0; w < WORD_COUNT; ++w)
            {
                RemoveMask(w, ~Word{0});
            }
        }

        STRATA_NODISCARD std::size_t Size() const noexcept { return m_mask.Count(); }
        STRATA_NODISCARD bool Empty() const noexcept { return m_mask.None(); }

        STRATA_NODISCARD Word GetWord(std::size_t w) const noexcept { return m_mask.GetWord(w); }
        STRATA_NODISCARD std::span<const Word, WORD_COUNT> Words() const noexcept { return m_mask.Words(); }
        STRATA_NODISCARD const MaskType& GetMask() const noexcept { return m_mask; }

        // Raw slot storage, including slots that are not present
        STRATA_NODISCARD std::span<T, SIZE> Values() noexcept { return m_values; }
        STRATA_NODISCARD std::span<const T, SIZE> Values() const noexcept { return m_values; }

        STRATA_NODISCARD MaskRange<const T*> Iter() const noexcept
        {
            return MaskRange<const T*>(m_mask.Words(), m_values.data());
        }

        STRATA_NODISCARD MaskRange<T*> IterMut() noexcept
        {
            return MaskRange<T*>(m_mask.Words(), m_values.data());
        }

    private:
        void ResetValues(std::size_t w, Word bits)
        {
            const std::size_t base = w << config::MASK_BITS_POW;
            while (bits != 0)
            {
                m_values[base + static_cast<std::size_t>(std::countr_zero(bits))] = T{};
                bits &= bits - 1;
            }
        }

        MaskType m_mask;
        std::array<T, SIZE> m_values{};
    };
}
