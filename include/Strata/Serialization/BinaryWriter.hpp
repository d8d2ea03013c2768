#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <type_traits>
#include <vector>

#include "BinaryArchive.hpp"

namespace Strata
{
    /**
     * Binary writer appending to a caller-owned byte buffer
     */
    class BinaryWriter : public BinaryArchive
    {
    public:
        explicit BinaryWriter(std::vector<std::byte>& output, std::size_t reserveSize = 4096)
            : m_output(&output)
        {
            m_output->reserve(m_output->size() + reserveSize);
        }

        [[nodiscard]] bool IsLoading() const noexcept override { return false; }

        /**
         * Write raw bytes
         */
        void WriteBytes(const void* data, std::size_t size)
        {
            if (HasError() || size == 0) return;

            const std::size_t offset = m_output->size();
            m_output->resize(offset + size);
            std::memcpy(m_output->data() + offset, data, size);
        }

        /**
         * Serialize POD types
         */
        template<typename T>
        requires std::is_trivially_copyable_v<T>
        BinaryWriter& operator()(const T& value)
        {
            WriteBytes(&value, sizeof(T));
            return *this;
        }

        /**
         * Serialize types with custom Serialize method
         */
        template<typename T>
        requires (!std::is_trivially_copyable_v<T> && HasSerializeMethod<T, BinaryWriter>)
        BinaryWriter& operator()(T& value)
        {
            value.Serialize(*this);
            return *this;
        }

        /**
         * Serialize vectors
         */
        template<typename T>
        BinaryWriter& operator()(const std::vector<T>& vec)
        {
            const std::uint64_t size = vec.size();
            (*this)(size);

            if constexpr (std::is_trivially_copyable_v<T>)
            {
                WriteBytes(vec.data(), vec.size() * sizeof(T));
            }
            else
            {
                for (const auto& item : vec)
                {
                    (*this)(item);
                }
            }
            return *this;
        }

        [[nodiscard]] std::size_t GetBytesWritten() const noexcept { return m_output->size(); }

    private:
        std::vector<std::byte>* m_output;
    };
}
