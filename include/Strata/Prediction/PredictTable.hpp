#pragma once

#include <optional>
#include <unordered_map>
#include <utility>

#include "../Core/Base.hpp"
#include "../Core/Log.hpp"
#include "../Core/Profile.hpp"
#include "../Entity/Entity.hpp"
#include "../Storage/Table.hpp"
#include "Delta.hpp"
#include "PredictBuffer.hpp"

namespace Strata
{
    template<typename T, Delta<T> D>
    class PredictTableWriter;

    /**
    * Authoritative component table with optional client-side prediction.
    *
    * When enabled, local deltas are recorded per entity in a PredictBuffer and
    * applied to the stored value immediately. Authoritative writes for an
    * entity with pending deltas only move the buffer's base; the stored value
    * is recomputed on the next Predict. When disabled, every call goes
    * straight to the inner table.
    */
    template<typename T, Delta<T> D = ReplaceDelta<T>>
    class PredictTable
    {
    public:
        using ValueType = T;
        using DeltaType = D;
        using BufferType = PredictBuffer<T, D>;
        using Writer = PredictTableWriter<T, D>;

        explicit PredictTable(bool enabled = false) : m_enabled(enabled) {}

        STRATA_NODISCARD bool Enabled() const noexcept { return m_enabled; }

        // Authoritative write received for tick
        void Add(EntityId id, Tick tick, T value)
        {
            if (m_enabled)
            {
                if (auto it = m_buffers.find(id); it != m_buffers.end())
                {
                    it->second.SetBaseValue(std::move(value), tick);
                    return;
                }
            }
            m_table.Add(id, std::move(value));
        }

        std::optional<T> Remove(EntityId id)
        {
            if (m_enabled)
            {
                m_buffers.erase(id);
            }
            return m_table.Remove(id);
        }

        void Set(EntityId id, Tick tick, std::optional<T> value)
        {
            if (value)
            {
                Add(id, tick, std::move(*value));
            }
            else
            {
                (void)Remove(id);
            }
        }

        /**
        * Applies a local delta to the stored value. With prediction enabled the
        * delta is also recorded for tick, creating the entity's buffer from the
        * current value on first use. Absent entities are left alone.
        */
        void ApplyDelta(EntityId id, Tick tick, D delta)
        {
            T* value = m_table.TryGet(id);
            if (!value)
            {
                return;
            }

            if (!m_enabled)
            {
                delta.ApplyTo(*value);
                return;
            }

            auto it = m_buffers.find(id);
            if (it == m_buffers.end())
            {
                it = m_buffers.emplace(id, BufferType(*value, tick)).first;
            }
            delta.ApplyTo(*value);
            it->second.WriteDelta(tick, std::move(delta));
        }

        /**
        * Recomputes every predicted value for predictTick and drops the buffers
        * that have no delta left.
        */
        void Predict(Tick predictTick)
        {
            if (!m_enabled)
            {
                return;
            }

            STRATA_PROFILE_ZONE_COLOR(Profile::ColorPredict);

            for (auto& [id, buffer] : m_buffers)
            {
                if (T* value = m_table.TryGet(id))
                {
                    buffer.Predict(predictTick, *value);
                }
                else
                {
                    // Value removed without going through this table
                    buffer = BufferType(buffer.Initial(), buffer.BaseTick());
                }
            }

            const std::size_t discarded = std::erase_if(m_buffers, [](const auto& entry)
            {
                return entry.second.Empty();
            });
            if (discarded > 0)
            {
                STRATA_LOG_DEBUG("PredictTable: discarded {} settled buffers at tick {}", discarded, predictTick);
            }
        }

        // Removes the values and buffers of every entity listed in destroyed
        void RemoveJoin(const Table<EntityId>& destroyed)
        {
            if (m_enabled)
            {
                for (const EntityId& id : destroyed.Iter())
                {
                    m_buffers.erase(id);
                }
            }
            m_table.RemoveJoin(destroyed);
        }

        void MoveValue(EntityId from, EntityId to)
        {
            if (m_enabled)
            {
                auto node = m_buffers.extract(from);
                m_buffers.erase(to);
                if (node)
                {
                    node.key() = to;
                    m_buffers.insert(std::move(node));
                }
            }
            m_table.MoveValue(from, to);
        }

        void Clear() noexcept
        {
            m_table.Clear();
            m_buffers.clear();
        }

        STRATA_NODISCARD bool Contains(EntityId id) const noexcept { return m_table.Contains(id); }
        STRATA_NODISCARD const T* TryGet(EntityId id) const noexcept { return m_table.TryGet(id); }
        STRATA_NODISCARD const T& Get(EntityId id) const noexcept { return m_table.Get(id); }

        STRATA_NODISCARD std::size_t Size() const noexcept { return m_table.Size(); }
        STRATA_NODISCARD bool Empty() const noexcept { return m_table.Empty(); }
        STRATA_NODISCARD std::size_t PredictCount() const noexcept { return m_buffers.size(); }

        STRATA_NODISCARD const BufferType* GetBuffer(EntityId id) const noexcept
        {
            auto it = m_buffers.find(id);
            return it != m_buffers.end() ? &it->second : nullptr;
        }

        STRATA_NODISCARD const Table<T>& GetTable() const noexcept { return m_table; }

        STRATA_NODISCARD Query<TableColumn<const T>> Iter() const { return m_table.Iter(); }

        // Bypasses prediction; meant for the authoritative side
        STRATA_NODISCARD Query<TableColumn<T>> IterBaseMut() { return m_table.IterMut(); }

        STRATA_NODISCARD Writer AsWriter(Tick tick) noexcept { return Writer(*this, tick); }

    private:
        bool m_enabled;
        Table<T> m_table;
        std::unordered_map<EntityId, BufferType, EntityHash> m_buffers;
    };

    /**
    * TableWriter view of a PredictTable that stamps every write with one tick.
    * Lets a DeltaStream be applied to a predicted table.
    */
    template<typename T, Delta<T> D = ReplaceDelta<T>>
    class PredictTableWriter
    {
    public:
        PredictTableWriter(PredictTable<T, D>& table, Tick tick) noexcept : m_table(&table), m_tick(tick) {}

        void Add(EntityId id, T value) { m_table->Add(id, m_tick, std::move(value)); }
        std::optional<T> Remove(EntityId id) { return m_table->Remove(id); }

        STRATA_NODISCARD Tick GetTick() const noexcept { return m_tick; }

    private:
        PredictTable<T, D>* m_table;
        Tick m_tick;
    };
}
