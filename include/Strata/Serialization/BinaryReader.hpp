#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <type_traits>
#include <vector>

#include "BinaryArchive.hpp"

namespace Strata
{
    /**
     * Binary reader over a borrowed byte span. Reads past the end set
     * SerializationError::CorruptedData and leave the destination untouched.
     */
    class BinaryReader : public BinaryArchive
    {
    public:
        explicit BinaryReader(std::span<const std::byte> data) noexcept
            : m_data(data)
        {}

        [[nodiscard]] bool IsLoading() const noexcept override { return true; }

        /**
         * Read raw bytes
         */
        void ReadBytes(void* data, std::size_t size)
        {
            if (HasError()) return;

            if (size > Remaining())
            {
                SetError(SerializationError::CorruptedData);
                return;
            }

            if (size > 0)
            {
                std::memcpy(data, m_data.data() + m_position, size);
            }
            m_position += size;
        }

        /**
         * Deserialize POD types
         */
        template<typename T>
        requires std::is_trivially_copyable_v<T>
        BinaryReader& operator()(T& value)
        {
            ReadBytes(&value, sizeof(T));
            return *this;
        }

        /**
         * Deserialize types with custom Serialize method
         */
        template<typename T>
        requires (!std::is_trivially_copyable_v<T> && HasSerializeMethod<T, BinaryReader>)
        BinaryReader& operator()(T& value)
        {
            value.Serialize(*this);
            return *this;
        }

        /**
         * Deserialize vectors
         */
        template<typename T>
        BinaryReader& operator()(std::vector<T>& vec)
        {
            std::uint64_t size = 0;
            (*this)(size);
            if (HasError()) return *this;

            // Sanity check to prevent huge allocations from corrupted input
            if constexpr (std::is_trivially_copyable_v<T>)
            {
                if (size > Remaining() / sizeof(T))
                {
                    SetError(SerializationError::CorruptedData);
                    return *this;
                }

                vec.resize(static_cast<std::size_t>(size));
                ReadBytes(vec.data(), vec.size() * sizeof(T));
            }
            else
            {
                if (size > Remaining())
                {
                    SetError(SerializationError::CorruptedData);
                    return *this;
                }

                vec.clear();
                vec.reserve(static_cast<std::size_t>(size));
                for (std::uint64_t i = 0; i < size && !HasError(); ++i)
                {
                    (*this)(vec.emplace_back());
                }
            }
            return *this;
        }

        [[nodiscard]] std::size_t GetPosition() const noexcept { return m_position; }
        [[nodiscard]] std::size_t Remaining() const noexcept { return m_data.size() - m_position; }
        [[nodiscard]] bool AtEnd() const noexcept { return m_position == m_data.size(); }

    private:
        std::span<const std::byte> m_data;
        std::size_t m_position = 0;
    };
}
