#pragma once

#include <cstddef>
#include <span>
#include <type_traits>
#include <vector>

#include "../Core/Base.hpp"
#include "../Core/Log.hpp"
#include "../Core/Result.hpp"
#include "BinaryArchive.hpp"
#include "BinaryReader.hpp"
#include "BinaryWriter.hpp"
#include "SerializationError.hpp"

namespace Strata
{
    /**
    * Encodes a record (BitStream, MaskedStream, DeltaStream) into a fresh byte
    * buffer. Non-const for the unified Serialize method.
    */
    template<typename T>
    requires HasSerializeMethod<T, BinaryWriter>
    STRATA_NODISCARD std::vector<std::byte> Serialize(T& record)
    {
        std::vector<std::byte> bytes;
        BinaryWriter writer(bytes, 256);
        writer(record);
        return bytes;
    }

    /**
    * Decodes a record from bytes. The whole input must be consumed.
    */
    template<typename T>
    requires std::is_default_constructible_v<T> && HasSerializeMethod<T, BinaryReader>
    STRATA_NODISCARD Result<T, SerializationError> Deserialize(std::span<const std::byte> bytes)
    {
        T record{};
        BinaryReader reader(bytes);
        reader(record);

        if (!reader.HasError() && !reader.AtEnd())
        {
            reader.SetError(SerializationError::TrailingData);
        }

        if (reader.HasError())
        {
            STRATA_LOG_WARN("Failed to decode record of {} bytes at offset {}: {}",
                bytes.size(), reader.GetPosition(), SerializationErrorName(reader.GetError()));
            return Err(reader.GetError());
        }
        return record;
    }
}
