#pragma once

#include <bit>
#include <concepts>
#include <cstdint>

#include "../Core/Base.hpp"
#include "SerializationError.hpp"

namespace Strata
{
    // Values are copied byte for byte
    static_assert(std::endian::native == std::endian::little, "Strata archives require a little-endian host");

    /**
     * Type trait to detect if a type has a Serialize method
     */
    template<typename T, typename Archive>
    concept HasSerializeMethod = requires(T& t, Archive& ar)
    {
        { t.Serialize(ar) } -> std::same_as<void>;
    };

    /**
     * Base class for binary archive operations.
     * Archives are in-memory only: records are encoded little-endian, without
     * framing or compression.
     */
    class BinaryArchive
    {
    public:
        BinaryArchive() = default;
        virtual ~BinaryArchive() = default;

        // Non-copyable, movable
        BinaryArchive(const BinaryArchive&) = delete;
        BinaryArchive& operator=(const BinaryArchive&) = delete;
        BinaryArchive(BinaryArchive&&) = default;
        BinaryArchive& operator=(BinaryArchive&&) = default;

        [[nodiscard]] virtual bool IsLoading() const noexcept = 0;
        [[nodiscard]] bool IsSaving() const noexcept { return !IsLoading(); }

        [[nodiscard]] bool HasError() const noexcept { return m_error != SerializationError::None; }
        [[nodiscard]] SerializationError GetError() const noexcept { return m_error; }

        // The first error sticks; later operations become no-ops
        void SetError(SerializationError error) noexcept
        {
            if (m_error == SerializationError::None)
                m_error = error;
        }

    protected:
        SerializationError m_error = SerializationError::None;
    };
}
