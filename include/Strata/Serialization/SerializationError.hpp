#pragma once

#include <cstdint>

namespace Strata
{
    /**
    * Error codes for decoding replication records
    */
    enum class SerializationError
    {
        None,
        CorruptedData,
        TrailingData
    };

    [[nodiscard]] constexpr const char* SerializationErrorName(SerializationError error) noexcept
    {
        switch (error)
        {
            case SerializationError::None: return "none";
            case SerializationError::CorruptedData: return "corrupted data";
            case SerializationError::TrailingData: return "trailing data";
        }
        return "unknown";
    }
}
