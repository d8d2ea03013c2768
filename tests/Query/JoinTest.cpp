#include <gtest/gtest.h>
#include <iterator>
#include <map>
#include <optional>
#include <random>
#include <utility>
#include <vector>
#include "Strata/Storage/Table.hpp"
#include "Strata/Query/Query.hpp"

using Strata::EntityId;
using Strata::Table;

class JoinTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        a.Add(EntityId(9), 10);
        a.Add(EntityId(10), 20);
        b.Add(EntityId(10), 100);
        b.Add(EntityId(11), 200);
        c.Add(EntityId(10), 1000);
        c.Add(EntityId(12), 2000);
    }

    void TearDown() override {}

    static std::vector<int> Collect(const Table<int>& table)
    {
        std::vector<int> values;
        for (int value : table.Iter())
        {
            values.push_back(value);
        }
        return values;
    }

    Table<int> a;
    Table<int> b;
    Table<int> c;
};

// Two-way inner join through the member combinator
TEST_F(JoinTest, JoinTwoTables)
{
    for (auto [x, y] : a.IterMut().Join(b.Iter()))
    {
        x += y;
    }
    EXPECT_EQ(Collect(a), (std::vector<int>{10, 120}));
}

// Three-way join flattened into a tuple
TEST_F(JoinTest, JoinThreeTablesFlattened)
{
    for (auto [x, y, z] : Strata::Join(a.IterMut(), b.Iter(), c.Iter()))
    {
        x += y + z;
    }
    EXPECT_EQ(Collect(a), (std::vector<int>{10, 1120}));
}

// Chained joins nest left to right
TEST_F(JoinTest, JoinThreeTablesNested)
{
    for (auto [xy, z] : a.IterMut().Join(b.Iter()).Join(c.Iter()))
    {
        auto [x, y] = xy;
        x += y + z;
    }
    EXPECT_EQ(Collect(a), (std::vector<int>{10, 1120}));
}

// operator& is a synonym for Join
TEST_F(JoinTest, AmpersandOperator)
{
    int sum = 0;
    for (auto [x, y] : a.Iter() & b.Iter())
    {
        sum += x + y;
    }
    EXPECT_EQ(sum, 120);
}

// Left join keeps every left item and reports right presence
TEST_F(JoinTest, LeftJoin)
{
    Table<int> left;
    Table<int> right;
    left.Add(EntityId(1), 10);
    left.Add(EntityId(2), 20);
    left.Add(EntityId(2000), 30);
    right.Add(EntityId(2), 200);
    right.Add(EntityId(2000), 300);

    std::vector<std::pair<int, std::optional<int>>> rows;
    for (auto [x, y] : left.Iter().LeftJoin(right.Iter()))
    {
        rows.emplace_back(x, y ? std::optional<int>(*y) : std::nullopt);
    }

    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[0], std::make_pair(10, std::optional<int>()));
    EXPECT_EQ(rows[1], std::make_pair(20, std::optional<int>(200)));
    EXPECT_EQ(rows[2], std::make_pair(30, std::optional<int>(300)));
}

// A right side with fewer pages acts as absent
TEST_F(JoinTest, LeftJoinShortRightTable)
{
    Table<int> left;
    Table<int> right;
    left.Add(EntityId(5000), 1);
    right.Add(EntityId(5), 1);

    std::size_t missing = 0;
    for (auto [x, y] : left.Iter().LeftJoin(right.Iter()))
    {
        EXPECT_EQ(x, 1);
        missing += (y == nullptr) ? 1 : 0;
    }
    EXPECT_EQ(missing, 1u);
}

// Left join over a nested join yields an optional pair
TEST_F(JoinTest, LeftJoinOfJoin)
{
    std::vector<int> sums;
    for (auto [x, rest] : a.Iter().LeftJoin(b.Iter().Join(c.Iter())))
    {
        sums.push_back(rest ? x + rest->first + rest->second : x);
    }
    EXPECT_EQ(sums, (std::vector<int>{10, 1120}));
}

// Index reports the entity index of the current item
TEST_F(JoinTest, IteratorIndex)
{
    auto query = a.Iter().Join(c.Iter());
    auto it = query.begin();
    ASSERT_TRUE(it != query.end());
    EXPECT_EQ(it.Index(), 10u);
    ++it;
    EXPECT_TRUE(it == query.end());
    EXPECT_EQ(query.Count(), 1u);
}

// RemoveWhere removes exactly the slots a query yields
TEST_F(JoinTest, RemoveWhereJoin)
{
    Table<int> victims;
    victims.Add(EntityId(9), 0);
    victims.Add(EntityId(10), 0);

    // Only index 10 is in both b and c
    victims.RemoveWhere(b.Iter().Join(c.Iter()));
    EXPECT_TRUE(victims.Contains(EntityId(9)));
    EXPECT_FALSE(victims.Contains(EntityId(10)));
}

// Randomized tables agree with a set-based reference
TEST_F(JoinTest, RandomizedMatchesReference)
{
    std::mt19937 rng(42);
    std::uniform_int_distribution<std::uint32_t> index(0, 5 * 1024);

    for (int round = 0; round < 10; ++round)
    {
        Table<int> left;
        Table<int> right;
        std::map<std::uint32_t, int> leftRef;
        std::map<std::uint32_t, int> rightRef;

        for (int i = 0; i < 400; ++i)
        {
            const std::uint32_t l = index(rng);
            const std::uint32_t r = index(rng) / 2;
            left.Add(EntityId(l), static_cast<int>(l));
            right.Add(EntityId(r), static_cast<int>(r) * 2);
            leftRef[l] = static_cast<int>(l);
            rightRef[r] = static_cast<int>(r) * 2;
        }
        // Punch out a whole page on the right
        right.RemovePage(2);
        for (auto it = rightRef.begin(); it != rightRef.end();)
        {
            it = (it->first / 1024 == 2) ? rightRef.erase(it) : std::next(it);
        }

        std::vector<std::pair<int, int>> inner;
        for (auto [x, y] : left.Iter().Join(right.Iter()))
        {
            inner.emplace_back(x, y);
        }
        std::vector<std::pair<int, int>> innerRef;
        for (auto [key, value] : leftRef)
        {
            if (auto found = rightRef.find(key); found != rightRef.end())
            {
                innerRef.emplace_back(value, found->second);
            }
        }
        EXPECT_EQ(inner, innerRef);

        std::vector<std::pair<int, int>> outer;
        for (auto [x, y] : left.Iter().LeftJoin(right.Iter()))
        {
            outer.emplace_back(x, y ? *y : -1);
        }
        std::vector<std::pair<int, int>> outerRef;
        for (auto [key, value] : leftRef)
        {
            auto found = rightRef.find(key);
            outerRef.emplace_back(value, found != rightRef.end() ? found->second : -1);
        }
        EXPECT_EQ(outer, outerRef);
    }
}

// Joins of up to nine columns flatten into one tuple
TEST_F(JoinTest, WideJoin)
{
    std::vector<Table<int>> tables(9);
    for (std::size_t t = 0; t < tables.size(); ++t)
    {
        for (std::uint32_t i = 0; i < 50; ++i)
        {
            if (i % (t + 1) == 0)
            {
                tables[t].Add(EntityId(i), 1);
            }
        }
    }

    int rows = 0;
    for (auto [v0, v1, v2, v3, v4, v5, v6, v7, v8] : Strata::Join(
             tables[0].Iter(), tables[1].Iter(), tables[2].Iter(), tables[3].Iter(), tables[4].Iter(),
             tables[5].Iter(), tables[6].Iter(), tables[7].Iter(), tables[8].Iter()))
    {
        EXPECT_EQ(v0 + v1 + v2 + v3 + v4 + v5 + v6 + v7 + v8, 9);
        ++rows;
    }
    // Multiples of lcm(1..9) = 2520 below 50: only index 0
    EXPECT_EQ(rows, 1);
}
