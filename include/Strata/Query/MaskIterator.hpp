#pragma once

#include <bit>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <span>

#include "../Core/Base.hpp"
#include "../Core/Config.hpp"

namespace Strata
{
    template<typename S>
    concept WordSource = requires(const S& source, std::size_t w)
    {
        { source.WordCount() } -> std::convertible_to<std::size_t>;
        { source.GetWord(w) } -> std::convertible_to<std::uint64_t>;
    };

    // Contiguous presence words, e.g. the bitmap of a page
    struct WordSpan
    {
        std::span<const std::uint64_t> words;

        STRATA_NODISCARD std::size_t WordCount() const noexcept { return words.size(); }
        STRATA_NODISCARD std::uint64_t GetWord(std::size_t w) const noexcept { return words[w]; }
    };

    /**
    * Yields the positions of set bits across a sequence of 64-bit words.
    *
    * Within a word the next position is found with a trailing-zero count and the
    * lowest bit is then cleared. An all-zero word advances the position by 64
    * without testing any bit. Words are fetched lazily, one at a time.
    */
    template<WordSource Source>
    class MaskCursor
    {
    public:
        MaskCursor() = default;

        explicit MaskCursor(Source source) :
            m_source(source),
            m_wordCount(m_source.WordCount())
        {
            if (m_wordCount > 0)
            {
                m_current = m_source.GetWord(0);
            }
            Seek();
        }

        STRATA_NODISCARD bool Done() const noexcept { return m_word >= m_wordCount; }

        STRATA_NODISCARD std::size_t Position() const noexcept
        {
            return (m_word << config::MASK_BITS_POW) + m_bit;
        }

        void Advance() noexcept
        {
            m_current &= m_current - 1;
            Seek();
        }

    private:
        void Seek() noexcept
        {
            while (m_current == 0)
            {
                if (++m_word >= m_wordCount)
                {
                    return;
                }
                m_current = m_source.GetWord(m_word);
            }
            m_bit = static_cast<std::size_t>(std::countr_zero(m_current));
        }

        Source m_source{};
        std::size_t m_wordCount = 0;
        std::size_t m_word = 0;
        std::size_t m_bit = 0;
        std::uint64_t m_current = 0;
    };

    /**
    * Zips presence words with a random-access value sequence and visits only
    * the values whose bit is set.
    */
    template<std::random_access_iterator It>
    class MaskRange
    {
    public:
        using Reference = std::iter_reference_t<It>;

        class Iterator
        {
        public:
            using difference_type = std::ptrdiff_t;
            using value_type = std::iter_value_t<It>;
            using reference = Reference;
            using iterator_category = std::input_iterator_tag;

            Iterator() = default;
            Iterator(std::span<const std::uint64_t> words, It values) :
                m_cursor(WordSpan{words}),
                m_values(values)
            {}

            STRATA_NODISCARD Reference operator*() const
            {
                return m_values[static_cast<difference_type>(m_cursor.Position())];
            }

            Iterator& operator++() noexcept
            {
                m_cursor.Advance();
                return *this;
            }

            void operator++(int) noexcept { ++*this; }

            STRATA_NODISCARD bool operator==(std::default_sentinel_t) const noexcept { return m_cursor.Done(); }

            // Slot of the current value
            STRATA_NODISCARD std::size_t Index() const noexcept { return m_cursor.Position(); }

        private:
            MaskCursor<WordSpan> m_cursor;
            It m_values{};
        };

        MaskRange(std::span<const std::uint64_t> words, It values) : m_words(words), m_values(values) {}

        STRATA_NODISCARD Iterator begin() const { return Iterator(m_words, m_values); }
        STRATA_NODISCARD std::default_sentinel_t end() const noexcept { return {}; }

    private:
        std::span<const std::uint64_t> m_words;
        It m_values;
    };
}
