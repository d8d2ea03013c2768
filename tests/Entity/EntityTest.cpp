#include <gtest/gtest.h>
#include <string>
#include <unordered_set>
#include <fmt/format.h>
#include "Strata/Entity/Entity.hpp"

class EntityTest : public ::testing::Test
{
protected:
    void SetUp() override {}
    void TearDown() override {}
};

// Test the 24/8 bit layout
TEST_F(EntityTest, Layout)
{
    EXPECT_EQ(Strata::EntityId::BITS, 32u);
    EXPECT_EQ(Strata::EntityId::INDEX_BITS, 24u);
    EXPECT_EQ(Strata::EntityId::GENERATION_BITS, 8u);
    EXPECT_EQ(Strata::EntityId::GENERATION_COUNT, 256u);

    Strata::EntityId id = Strata::EntityId::FromParts(100, 5);
    EXPECT_EQ(id.GetIndex(), 100u);
    EXPECT_EQ(id.GetGeneration(), 5u);
    EXPECT_EQ(id.GetValue(), (5u << 24) | 100u);
}

// Test construction with raw value
TEST_F(EntityTest, ConstructionWithRawValue)
{
    Strata::EntityId id(0x05000064u);

    EXPECT_EQ(id.GetIndex(), 100u);
    EXPECT_EQ(id.GetGeneration(), 5u);

    Strata::EntityId zero;
    EXPECT_EQ(zero.GetValue(), 0u);
}

// Page index and slot come from the index bits only
TEST_F(EntityTest, PageAddress)
{
    Strata::EntityId id = Strata::EntityId::FromParts(2 * 1024 + 17, 9);

    EXPECT_EQ(id.GetPageIndex(), 2u);
    EXPECT_EQ(id.GetSlot(), 17u);
}

// Equality requires both fields to match
TEST_F(EntityTest, EqualityUsesGeneration)
{
    Strata::EntityId a = Strata::EntityId::FromParts(7, 0);
    Strata::EntityId b = Strata::EntityId::FromParts(7, 1);

    EXPECT_NE(a, b);
    EXPECT_EQ(a.GetIndex(), b.GetIndex());
    EXPECT_EQ(a.WithGeneration(1), b);
}

// Generation wraps modulo 256 without touching the index
TEST_F(EntityTest, GenerationWraps)
{
    Strata::EntityId id = Strata::EntityId::FromParts(12345, 0);

    for (std::uint32_t gen = 1; gen <= 256; ++gen)
    {
        id = id.NextGeneration();
        EXPECT_EQ(id.GetIndex(), 12345u);
        EXPECT_EQ(id.GetGeneration(), gen & 0xFFu);
    }
    EXPECT_EQ(id, Strata::EntityId::FromParts(12345, 0));
}

// Test use as a hash key
TEST_F(EntityTest, HashSet)
{
    std::unordered_set<Strata::EntityId> ids;
    for (std::uint32_t i = 0; i < 100; ++i)
    {
        ids.insert(Strata::EntityId(i));
        ids.insert(Strata::EntityId(i).NextGeneration());
    }
    EXPECT_EQ(ids.size(), 200u);
    EXPECT_TRUE(ids.contains(Strata::EntityId::FromParts(50, 1)));
}

// Test the invalid sentinel
TEST_F(EntityTest, InvalidId)
{
    const Strata::EntityId invalid = Strata::EntityId::Invalid();

    EXPECT_FALSE(invalid.IsValid());
    EXPECT_EQ(invalid.GetIndex(), Strata::EntityId::INDEX_MASK);
    EXPECT_TRUE(Strata::EntityId().IsValid());
    EXPECT_TRUE(Strata::EntityId::FromParts(Strata::EntityId::INDEX_MASK - 1, 255).IsValid());
}

// Ids format as index-generation
TEST_F(EntityTest, Format)
{
    EXPECT_EQ(fmt::format("{}", Strata::EntityId::FromParts(100, 5)), "100-5");
    EXPECT_EQ(fmt::format("{}", Strata::EntityId(0)), "0-0");
    EXPECT_EQ(fmt::format("[{}]", Strata::EntityId::FromParts(1024, 255)), "[1024-255]");
}
