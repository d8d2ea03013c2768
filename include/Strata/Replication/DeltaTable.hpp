#pragma once

#include <optional>

#include "../Core/Base.hpp"
#include "../Core/Profile.hpp"
#include "../Entity/Entity.hpp"
#include "../Storage/Table.hpp"
#include "DeltaStream.hpp"

namespace Strata
{
    /**
    * Last replicated value of one component type per entity, with a flag for
    * every entity whose value changed since the last Flush.
    */
    template<typename T>
    class DeltaTable
    {
    public:
        using ValueType = T;

        /**
        * Compares newValue (nullptr meaning absent) with the stored value and
        * stores it. Returns true and flags the entity if presence or value
        * changed.
        */
        bool Write(EntityId id, const T* newValue)
        {
            T* current = m_values.TryGet(id);

            bool modified = false;
            if (current && newValue)
            {
                modified = !(*current == *newValue);
                if (modified)
                {
                    *current = *newValue;
                }
            }
            else if (current)
            {
                (void)m_values.Remove(id);
                modified = true;
            }
            else if (newValue)
            {
                m_values.Add(id, *newValue);
                modified = true;
            }

            if (modified)
            {
                m_modified.Add(id, Tag{});
            }
            return modified;
        }

        bool Write(EntityId id, const std::optional<T>& newValue)
        {
            return Write(id, newValue ? &*newValue : nullptr);
        }

        /**
        * Appends one modified bit per entity of anyModified, in index order. An
        * entity flagged here since the last flush also gets a present bit and,
        * if present, its value. Clears the flags afterwards.
        */
        template<typename U>
        void Flush(const Table<U>& anyModified, DeltaStream<T>& output)
        {
            STRATA_PROFILE_ZONE_COLOR(Profile::ColorNetwork);

            for ([[maybe_unused]] const auto& [any, changed] : anyModified.Iter().LeftJoin(m_modified.Iter().LeftJoin(m_values.Iter())))
            {
                if (changed)
                {
                    output.PushModified(changed->second);
                }
                else
                {
                    output.PushUnmodified();
                }
            }
            m_modified.Clear();
        }

        // Forgets both the value and the change flag
        void Remove(EntityId id)
        {
            (void)m_modified.Remove(id);
            (void)m_values.Remove(id);
        }

        void Clear() noexcept
        {
            m_modified.Clear();
            m_values.Clear();
        }

        STRATA_NODISCARD const Table<T>& Values() const noexcept { return m_values; }
        STRATA_NODISCARD const Table<Tag>& Modified() const noexcept { return m_modified; }

    private:
        Table<Tag> m_modified;
        Table<T> m_values;
    };
}
