#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <utility>

#include "../Core/Base.hpp"
#include "../Core/Config.hpp"
#include "Delta.hpp"

namespace Strata
{
    using Tick = std::int64_t;

    /**
    * Ring of per-tick deltas on top of the last authoritative value.
    *
    * Slot (tick & 31) holds the merged delta written during that tick. The
    * predicted value for a tick is the base value with every delta from the
    * base tick up to that tick applied in order. Slots older than the 32-tick
    * window or older than the base tick are dropped on Predict.
    */
    template<typename T, Delta<T> D = ReplaceDelta<T>>
    class PredictBuffer
    {
    public:
        using ValueType = T;
        using DeltaType = D;
        using MaskType = std::uint32_t;

        static constexpr Tick SIZE = config::PREDICT_BUFFER_SIZE;

        static_assert(SIZE <= static_cast<Tick>(sizeof(MaskType) * 8), "Occupancy mask too small for the ring");

        PredictBuffer(T baseValue, Tick baseTick) : m_baseValue(std::move(baseValue)), m_baseTick(baseTick) {}

        // Records an authoritative value. Ordering of base updates is the caller's concern.
        void SetBaseValue(T value, Tick tick)
        {
            m_baseValue = std::move(value);
            m_baseTick = tick;
        }

        STRATA_NODISCARD const T& Initial() const noexcept { return m_baseValue; }
        STRATA_NODISCARD Tick BaseTick() const noexcept { return m_baseTick; }
        STRATA_NODISCARD MaskType Mask() const noexcept { return m_mask; }
        STRATA_NODISCARD bool Empty() const noexcept { return m_mask == 0; }

        STRATA_NODISCARD const D* GetDelta(Tick tick) const noexcept
        {
            const std::size_t slot = SlotOf(tick);
            return (m_mask & Bit(slot)) != 0 ? &m_deltas[slot] : nullptr;
        }

        /**
        * Prepares tick predictTick: drops stale slots, empties the slot for
        * predictTick and recomputes value by replaying [base, predictTick) onto
        * the base value. The stored base tick is left unchanged.
        */
        void Predict(Tick predictTick, T& value)
        {
            const Tick minTick = predictTick - SIZE;
            const Tick baseTick = std::max(m_baseTick, minTick);
            for (Tick tick = minTick; tick < baseTick; ++tick)
            {
                ClearEntry(tick);
            }
            ClearEntry(predictTick);

            T predicted = m_baseValue;
            if (m_mask != 0)
            {
                for (Tick tick = baseTick; tick < predictTick; ++tick)
                {
                    if (const D* delta = GetDelta(tick))
                    {
                        delta->ApplyTo(predicted);
                    }
                }
            }
            value = std::move(predicted);
        }

        // A second delta for the same tick is merged into the first
        void WriteDelta(Tick tick, D delta)
        {
            const std::size_t slot = SlotOf(tick);
            if ((m_mask & Bit(slot)) != 0)
            {
                m_deltas[slot].Merge(delta);
            }
            else
            {
                m_deltas[slot] = std::move(delta);
                m_mask |= Bit(slot);
            }
        }

    private:
        // Negative ticks wrap the same way as positive ones
        static constexpr std::size_t SlotOf(Tick tick) noexcept
        {
            return static_cast<std::size_t>(tick & config::PREDICT_BUFFER_MASK);
        }

        static constexpr MaskType Bit(std::size_t slot) noexcept { return MaskType{1} << slot; }

        void ClearEntry(Tick tick)
        {
            const std::size_t slot = SlotOf(tick);
            m_mask &= ~Bit(slot);
            m_deltas[slot] = D{};
        }

        T m_baseValue;
        Tick m_baseTick;
        MaskType m_mask = 0;
        std::array<D, static_cast<std::size_t>(SIZE)> m_deltas{};
    };
}
