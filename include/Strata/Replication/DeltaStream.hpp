#pragma once

#include <algorithm>
#include <cstdint>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

#include "../Container/BitStream.hpp"
#include "../Core/Base.hpp"
#include "../Core/Profile.hpp"
#include "../Entity/Entity.hpp"
#include "../Serialization/SerializationError.hpp"
#include "../Storage/Table.hpp"

namespace Strata
{
    /**
    * One presence bit per entry plus a dense list holding only the present
    * values, in entry order.
    */
    template<typename T>
    class MaskedStream
    {
    public:
        using ValueType = T;

        STRATA_NODISCARD std::size_t Size() const noexcept { return m_present.Size(); }
        STRATA_NODISCARD std::size_t PresentCount() const noexcept { return m_present.CountOnes(); }
        STRATA_NODISCARD std::size_t ValueCount() const noexcept { return m_values.size(); }

        STRATA_NODISCARD bool IsPresent(std::size_t presentIndex) const noexcept { return m_present.Get(presentIndex); }

        STRATA_NODISCARD const T& GetValue(std::size_t valueIndex) const noexcept
        {
            STRATA_ASSERT(valueIndex < m_values.size(), "MaskedStream value index out of range");
            return m_values[valueIndex];
        }

        void PushSome(T value)
        {
            m_present.PushTrue();
            m_values.push_back(std::move(value));
        }

        void PushNone() { m_present.PushFalse(); }

        void Push(const T* value)
        {
            if (value)
                PushSome(*value);
            else
                PushNone();
        }

        void Push(std::optional<T> value)
        {
            if (value)
                PushSome(std::move(*value));
            else
                PushNone();
        }

        void Clear() noexcept
        {
            m_present.Clear();
            m_values.clear();
        }

        STRATA_NODISCARD bool operator==(const MaskedStream& other) const = default;

        template<typename Archive>
        void Serialize(Archive& ar)
        {
            static_assert(std::is_trivially_copyable_v<T>, "Only trivially copyable values can be encoded");

            ar(m_present);
            ar(m_values);

            if (ar.IsLoading() && !ar.HasError() && m_values.size() != m_present.CountOnes())
            {
                ar.SetError(SerializationError::CorruptedData);
            }
        }

    private:
        BitStream m_present;
        std::vector<T> m_values;
    };

    /**
    * Replication record for one component type over an ordered entity list.
    *
    * Layout: one modified bit per entity; for each set modified bit one
    * present bit; for each set present bit one value. Entities that did not
    * change contribute nothing past their modified bit.
    */
    template<typename T>
    class DeltaStream
    {
    public:
        using ValueType = T;

        STRATA_NODISCARD std::size_t Size() const noexcept { return m_modified.Size(); }
        STRATA_NODISCARD std::size_t ModifiedCount() const noexcept { return m_modified.CountOnes(); }
        STRATA_NODISCARD std::size_t PresentCount() const noexcept { return m_values.PresentCount(); }
        STRATA_NODISCARD std::size_t ValueCount() const noexcept { return m_values.ValueCount(); }

        STRATA_NODISCARD bool IsModified(std::size_t modifiedIndex) const noexcept { return m_modified.Get(modifiedIndex); }
        STRATA_NODISCARD bool IsPresent(std::size_t presentIndex) const noexcept { return m_values.IsPresent(presentIndex); }
        STRATA_NODISCARD const T& GetValue(std::size_t valueIndex) const noexcept { return m_values.GetValue(valueIndex); }

        void PushUnmodified() { m_modified.PushFalse(); }

        void PushModified(const T* value)
        {
            m_modified.PushTrue();
            m_values.Push(value);
        }

        void PushModified(std::optional<T> value)
        {
            m_modified.PushTrue();
            m_values.Push(std::move(value));
        }

        void Clear() noexcept
        {
            m_modified.Clear();
            m_values.Clear();
        }

        STRATA_NODISCARD const BitStream& GetModified() const noexcept { return m_modified; }
        STRATA_NODISCARD const MaskedStream<T>& GetValues() const noexcept { return m_values; }

        /**
        * Replays the record onto a destination table. entities must be the same
        * ordered list the record was produced for: modified entities are added
        * or overwritten when present and removed when absent.
        */
        template<TableWriter<T> W>
        void ApplyTo(const std::vector<EntityId>& entities, W& destination) const
        {
            STRATA_PROFILE_ZONE_COLOR(Profile::ColorNetwork);

            const std::size_t count = std::min(entities.size(), m_modified.Size());
            std::size_t pi = 0;
            std::size_t vi = 0;
            for (std::size_t mi = 0; mi < count; ++mi)
            {
                if (!m_modified.Get(mi))
                {
                    continue;
                }

                if (m_values.IsPresent(pi))
                {
                    destination.Add(entities[mi], m_values.GetValue(vi));
                    ++vi;
                }
                else
                {
                    (void)destination.Remove(entities[mi]);
                }
                ++pi;
            }
        }

        STRATA_NODISCARD bool operator==(const DeltaStream& other) const = default;

        template<typename Archive>
        void Serialize(Archive& ar)
        {
            ar(m_modified);
            ar(m_values);

            if (ar.IsLoading() && !ar.HasError() && m_values.Size() != m_modified.CountOnes())
            {
                ar.SetError(SerializationError::CorruptedData);
            }
        }

    private:
        BitStream m_modified;
        MaskedStream<T> m_values;
    };

    /**
    * Ids present in both tables, in index order. This is the entity list a
    * DeltaStream produced from anyModified is applied against.
    */
    template<typename U>
    STRATA_NODISCARD std::vector<EntityId> IterModified(const Table<EntityId>& entities, const Table<U>& anyModified)
    {
        std::vector<EntityId> ids;
        for (const auto& item : entities.Iter().Join(anyModified.Iter()))
        {
            ids.push_back(item.first);
        }
        return ids;
    }
}
