#include <gtest/gtest.h>
#include <cstdint>
#include <random>
#include <vector>
#include "Strata/Prediction/Delta.hpp"
#include "Strata/Prediction/PredictBuffer.hpp"
#include "Strata/Prediction/PredictTable.hpp"
#include "Strata/Replication/DeltaStream.hpp"

using Strata::AddDelta;
using Strata::EntityId;
using Strata::PredictBuffer;
using Strata::PredictTable;
using Strata::ReplaceDelta;
using Strata::Tick;

class PredictTest : public ::testing::Test
{
protected:
    void SetUp() override {}
    void TearDown() override {}

    using IntTable = PredictTable<int, AddDelta<int>>;
    using IntBuffer = PredictBuffer<int, AddDelta<int>>;
};

// Deltas written for the same tick merge
TEST_F(PredictTest, WriteDeltaMerges)
{
    IntBuffer buffer(0, 0);
    buffer.WriteDelta(3, {2});
    buffer.WriteDelta(3, {5});

    const auto* delta = buffer.GetDelta(3);
    ASSERT_NE(delta, nullptr);
    EXPECT_EQ(delta->value, 7);
    EXPECT_EQ(buffer.Mask(), 1u << 3);
    EXPECT_EQ(buffer.GetDelta(4), nullptr);
}

// ReplaceDelta keeps the last write
TEST_F(PredictTest, ReplaceDeltaKeepsLast)
{
    PredictBuffer<int> buffer(1, 0);
    buffer.WriteDelta(0, ReplaceDelta<int>{4});
    buffer.WriteDelta(0, ReplaceDelta<int>{9});

    int value = 0;
    buffer.Predict(1, value);
    EXPECT_EQ(value, 9);
}

// Predict replays [base, predictTick) onto the base value
TEST_F(PredictTest, PredictFoldsDeltas)
{
    IntBuffer buffer(100, 10);
    buffer.WriteDelta(10, {1});
    buffer.WriteDelta(12, {10});
    buffer.WriteDelta(14, {100});

    int value = 0;
    buffer.Predict(14, value);
    EXPECT_EQ(value, 111);

    // The slot for the predicted tick was emptied
    EXPECT_EQ(buffer.GetDelta(14), nullptr);
    EXPECT_EQ(buffer.BaseTick(), 10);
}

// Property: the predicted value is the base with every retained delta applied in order
TEST_F(PredictTest, PredictMatchesReferenceFold)
{
    std::mt19937 rng(7);
    for (int round = 0; round < 20; ++round)
    {
        const Tick baseTick = static_cast<Tick>(rng() % 100);
        const int baseValue = static_cast<int>(rng() % 1000);
        IntBuffer buffer(baseValue, baseTick);

        const Tick predictTick = baseTick + 1 + static_cast<Tick>(rng() % 31);
        int expected = baseValue;
        for (Tick tick = baseTick; tick < predictTick; ++tick)
        {
            if (rng() % 2 == 0)
            {
                const int delta = static_cast<int>(rng() % 50) - 25;
                buffer.WriteDelta(tick, {delta});
                expected += delta;
            }
        }

        int value = 0;
        buffer.Predict(predictTick, value);
        EXPECT_EQ(value, expected) << "round " << round;
    }
}

// Slots older than the base tick are dropped once the base advances
TEST_F(PredictTest, BaseAdvanceDropsOldSlots)
{
    IntBuffer buffer(0, 0);
    buffer.WriteDelta(1, {1});
    buffer.WriteDelta(2, {2});

    buffer.SetBaseValue(50, 2);
    int value = 0;
    buffer.Predict(3, value);

    EXPECT_EQ(value, 52);
    EXPECT_EQ(buffer.GetDelta(1), nullptr);
    EXPECT_NE(buffer.GetDelta(2), nullptr);

    buffer.SetBaseValue(60, 3);
    buffer.Predict(4, value);
    EXPECT_EQ(value, 60);
    EXPECT_TRUE(buffer.Empty());
}

// Negative ticks use the same ring slots as positive ones
TEST_F(PredictTest, NegativeTicks)
{
    IntBuffer buffer(0, -5);
    buffer.WriteDelta(-5, {3});
    buffer.WriteDelta(-1, {4});

    int value = 0;
    buffer.Predict(0, value);
    EXPECT_EQ(value, 7);
    EXPECT_EQ(buffer.GetDelta(-5), buffer.GetDelta(27));
}

// Authoritative writes and local deltas reconcile across ticks
TEST_F(PredictTest, PredictWithDeltas)
{
    IntTable table(true);
    const EntityId id(1);

    table.Add(id, 0, 10);
    // Base update, no deltas
    table.Add(id, 10, 100);
    EXPECT_EQ(table.Get(id), 100);
    EXPECT_EQ(table.PredictCount(), 0u);

    // Local delta
    table.ApplyDelta(id, 15, {200});
    EXPECT_EQ(table.Get(id), 300);
    EXPECT_EQ(table.PredictCount(), 1u);

    // No new base
    table.Predict(16);
    EXPECT_EQ(table.Get(id), 300);
    EXPECT_EQ(table.PredictCount(), 1u);

    // New base moves the buffer, not the value
    table.Add(id, 11, 105);
    EXPECT_EQ(table.Get(id), 300);
    EXPECT_EQ(table.PredictCount(), 1u);
    table.Predict(17);
    EXPECT_EQ(table.Get(id), 305);
    EXPECT_EQ(table.PredictCount(), 1u);

    // Another local delta
    table.ApplyDelta(id, 16, {-50});
    EXPECT_EQ(table.Get(id), 255);

    table.Predict(18);
    EXPECT_EQ(table.Get(id), 255);
    table.Predict(28);
    EXPECT_EQ(table.Get(id), 255);
    EXPECT_EQ(table.PredictCount(), 1u);

    // Base catches up past every delta; the buffer settles and is dropped
    table.Add(id, 20, 500);
    table.Predict(21);
    EXPECT_EQ(table.Get(id), 500);
    EXPECT_EQ(table.PredictCount(), 0u);
}

// A disabled table is a passthrough
TEST_F(PredictTest, DisabledPassthrough)
{
    IntTable table;
    const EntityId id(4);
    EXPECT_FALSE(table.Enabled());

    table.Add(id, 0, 10);
    table.ApplyDelta(id, 1, {5});
    EXPECT_EQ(table.Get(id), 15);
    EXPECT_EQ(table.PredictCount(), 0u);

    table.Predict(2);
    EXPECT_EQ(table.Get(id), 15);

    // Deltas on absent entities are ignored
    table.ApplyDelta(EntityId(5), 1, {5});
    EXPECT_FALSE(table.Contains(EntityId(5)));
}

// Remove drops both value and buffer
TEST_F(PredictTest, RemoveDropsBuffer)
{
    IntTable table(true);
    const EntityId id(2);

    table.Add(id, 0, 1);
    table.ApplyDelta(id, 1, {1});
    ASSERT_NE(table.GetBuffer(id), nullptr);

    auto removed = table.Remove(id);
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(*removed, 2);
    EXPECT_EQ(table.GetBuffer(id), nullptr);
    EXPECT_FALSE(table.Contains(id));

    table.Set(id, 5, 9);
    EXPECT_EQ(table.Get(id), 9);
    table.Set(id, 6, std::nullopt);
    EXPECT_FALSE(table.Contains(id));
}

// RemoveJoin drops the values and buffers of destroyed entities
TEST_F(PredictTest, RemoveJoin)
{
    IntTable table(true);
    Strata::Table<EntityId> destroyed;

    for (std::uint32_t i = 0; i < 4; ++i)
    {
        table.Add(EntityId(i), 0, 0);
        table.ApplyDelta(EntityId(i), 1, {1});
    }
    destroyed.Add(EntityId(1), EntityId(1));
    destroyed.Add(EntityId(3), EntityId(3));

    table.RemoveJoin(destroyed);
    EXPECT_EQ(table.Size(), 2u);
    EXPECT_EQ(table.PredictCount(), 2u);
    EXPECT_EQ(table.GetBuffer(EntityId(1)), nullptr);
    EXPECT_NE(table.GetBuffer(EntityId(2)), nullptr);
}

// MoveValue carries the buffer to the new id
TEST_F(PredictTest, MoveValue)
{
    IntTable table(true);
    table.Add(EntityId(1), 0, 10);
    table.ApplyDelta(EntityId(1), 1, {1});

    table.MoveValue(EntityId(1), EntityId(7));
    EXPECT_FALSE(table.Contains(EntityId(1)));
    EXPECT_EQ(table.Get(EntityId(7)), 11);
    EXPECT_EQ(table.GetBuffer(EntityId(1)), nullptr);
    ASSERT_NE(table.GetBuffer(EntityId(7)), nullptr);
    EXPECT_EQ(table.GetBuffer(EntityId(7))->Initial(), 10);
}

// A replicated stream can be applied through a tick-stamped writer
TEST_F(PredictTest, WriterAppliesStream)
{
    IntTable table(true);
    table.Add(EntityId(1), 0, 10);
    table.ApplyDelta(EntityId(1), 1, {5});

    Strata::DeltaStream<int> stream;
    stream.PushModified(std::optional<int>(100));
    stream.PushModified(std::optional<int>(200));

    auto writer = table.AsWriter(1);
    stream.ApplyTo({EntityId(1), EntityId(2)}, writer);

    // Entity 1 has a pending delta: only its base moved
    EXPECT_EQ(table.Get(EntityId(1)), 15);
    EXPECT_EQ(table.GetBuffer(EntityId(1))->Initial(), 100);
    EXPECT_EQ(table.Get(EntityId(2)), 200);

    table.Predict(2);
    EXPECT_EQ(table.Get(EntityId(1)), 105);
}
