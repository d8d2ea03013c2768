#pragma once

#include <bit>
#include <cstdint>
#include <vector>

#include "../Core/Base.hpp"
#include "../Core/Config.hpp"
#include "../Serialization/SerializationError.hpp"

namespace Strata
{
    /**
    * Growable, append-only sequence of bits. Used to encode presence and
    * modification flags of replication records. Earlier bits are never mutated.
    */
    class BitStream
    {
    public:
        using Word = std::uint64_t;

        BitStream() = default;

        STRATA_NODISCARD std::size_t Size() const noexcept { return m_size; }
        STRATA_NODISCARD bool Empty() const noexcept { return m_size == 0; }
        STRATA_NODISCARD std::size_t WordCount() const noexcept { return m_words.size(); }

        STRATA_NODISCARD std::size_t CountOnes() const noexcept
        {
            std::size_t count = 0;
            for (Word word : m_words)
            {
                count += static_cast<std::size_t>(std::popcount(word));
            }
            return count;
        }

        STRATA_NODISCARD bool Get(std::size_t index) const noexcept
        {
            STRATA_ASSERT(index < m_size, "BitStream index out of range");
            const Word word = m_words[index >> config::MASK_BITS_POW];
            return ((word >> (index & config::MASK_BITS_MASK)) & 1) != 0;
        }

        void PushTrue()
        {
            const std::size_t bit = m_size & config::MASK_BITS_MASK;
            if (bit == 0)
            {
                m_words.push_back(1);
            }
            else
            {
                m_words.back() |= Word(1) << bit;
            }
            ++m_size;
        }

        void PushFalse()
        {
            if ((m_size & config::MASK_BITS_MASK) == 0)
            {
                m_words.push_back(0);
            }
            ++m_size;
        }

        void Push(bool value)
        {
            if (value)
                PushTrue();
            else
                PushFalse();
        }

        void Clear() noexcept
        {
            m_size = 0;
            m_words.clear();
        }

        STRATA_NODISCARD bool operator==(const BitStream& other) const noexcept = default;

        template<typename Archive>
        void Serialize(Archive& ar)
        {
            std::uint64_t size = m_size;
            ar(size);
            ar(m_words);

            if (ar.IsLoading())
            {
                if (ar.HasError())
                {
                    Clear();
                    return;
                }

                // Rounded up without overflow for lengths near UINT64_MAX
                const std::uint64_t expectedWords =
                    (size >> config::MASK_BITS_POW) + ((size & config::MASK_BITS_MASK) != 0 ? 1 : 0);
                if (m_words.size() != expectedWords)
                {
                    ar.SetError(SerializationError::CorruptedData);
                    Clear();
                    return;
                }
                // Bits past the end must stay clear so CountOnes matches the content
                if (const std::size_t tail = size & config::MASK_BITS_MASK; tail != 0)
                {
                    m_words.back() &= (Word(1) << tail) - 1;
                }
                m_size = static_cast<std::size_t>(size);
            }
        }

    private:
        std::size_t m_size = 0;
        std::vector<Word> m_words;
    };
}
