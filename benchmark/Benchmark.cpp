#include <Strata/Strata.hpp>
#include <benchmark/benchmark.h>
#include <cstdint>
#include <vector>

struct Position
{
    std::uint64_t x;
    std::uint64_t y;

    bool operator==(const Position&) const = default;
};

struct Velocity : Position {};

template<int N>
struct Comp
{
    int x;
};


static void BM_CreateEntities(benchmark::State& state)
{
    const size_t count = state.range(0);

    for(auto _ : state)
    {
        Strata::EntityPool pool;
        for(size_t i = 0; i < count; ++i)
        {
            benchmark::DoNotOptimize(pool.Create());
        }
    }

    state.SetItemsProcessed(state.iterations() * count);
}

static void BM_RecycleEntities(benchmark::State& state)
{
    const size_t count = state.range(0);
    Strata::EntityPool pool;
    std::vector<Strata::EntityId> entities(count);

    for(auto _ : state)
    {
        for(size_t i = 0; i < count; ++i)
        {
            entities[i] = pool.Create();
        }
        for(auto entity : entities)
        {
            pool.Recycle(entity);
        }
    }

    state.SetItemsProcessed(state.iterations() * count);
}

// Table manipulation benchmarks
static void BM_AddComponents(benchmark::State& state)
{
    const size_t count = state.range(0);

    for(auto _ : state)
    {
        Strata::Table<Position> positions;
        for(size_t i = 0; i < count; ++i)
        {
            positions.Add(Strata::EntityId(static_cast<std::uint32_t>(i)), Position{i, i});
        }
        benchmark::DoNotOptimize(positions.PageCount());
    }

    state.SetItemsProcessed(state.iterations() * count);
}

static void BM_RemoveJoin(benchmark::State& state)
{
    const size_t count = state.range(0);

    for(auto _ : state)
    {
        state.PauseTiming();
        Strata::Table<Position> positions;
        Strata::Table<Strata::Tag> destroyed;
        for(size_t i = 0; i < count; ++i)
        {
            const Strata::EntityId id(static_cast<std::uint32_t>(i));
            positions.Add(id, Position{i, i});
            if(i % 2 == 0)
            {
                destroyed.Add(id, {});
            }
        }
        state.ResumeTiming();

        positions.RemoveJoin(destroyed);
    }

    state.SetItemsProcessed(state.iterations() * count);
}

// Iteration benchmarks
static void BM_IterateSingleComponent(benchmark::State& state)
{
    const size_t count = state.range(0);
    Strata::Table<Position> positions;
    for(size_t i = 0; i < count; ++i)
    {
        positions.Add(Strata::EntityId(static_cast<std::uint32_t>(i)), Position{i, i});
    }

    for(auto _ : state)
    {
        for(Position& pos : positions.IterMut())
        {
            pos.x += 1;
            benchmark::DoNotOptimize(pos);
        }
    }

    state.SetItemsProcessed(state.iterations() * count);
}

// Velocity on every entity, joined against position
static void BM_IterateTwoComponents(benchmark::State& state)
{
    const size_t count = state.range(0);
    Strata::Table<Position> positions;
    Strata::Table<Velocity> velocities;
    for(size_t i = 0; i < count; ++i)
    {
        const Strata::EntityId id(static_cast<std::uint32_t>(i));
        positions.Add(id, Position{i, i});
        velocities.Add(id, Velocity{{1, 1}});
    }

    for(auto _ : state)
    {
        for(auto [pos, vel] : Strata::Join(positions.IterMut(), velocities.Iter()))
        {
            pos.x += vel.x;
            pos.y += vel.y;
            benchmark::DoNotOptimize(pos);
        }
    }

    state.SetItemsProcessed(state.iterations() * count);
}

// Velocity on every other entity
static void BM_IterateTwoComponentsHalf(benchmark::State& state)
{
    const size_t count = state.range(0);
    Strata::Table<Position> positions;
    Strata::Table<Velocity> velocities;
    for(size_t i = 0; i < count; ++i)
    {
        const Strata::EntityId id(static_cast<std::uint32_t>(i));
        positions.Add(id, Position{i, i});
        if(i % 2 == 0)
        {
            velocities.Add(id, Velocity{{1, 1}});
        }
    }

    for(auto _ : state)
    {
        for(auto [pos, vel] : Strata::Join(positions.IterMut(), velocities.Iter()))
        {
            pos.x += vel.x;
            benchmark::DoNotOptimize(pos);
        }
    }

    state.SetItemsProcessed(state.iterations() * count / 2);
}

static void BM_IterateFiveComponents(benchmark::State& state)
{
    const size_t count = state.range(0);
    Strata::Table<Comp<0>> c0;
    Strata::Table<Comp<1>> c1;
    Strata::Table<Comp<2>> c2;
    Strata::Table<Comp<3>> c3;
    Strata::Table<Comp<4>> c4;
    for(size_t i = 0; i < count; ++i)
    {
        const Strata::EntityId id(static_cast<std::uint32_t>(i));
        c0.Add(id, {1});
        c1.Add(id, {1});
        c2.Add(id, {1});
        c3.Add(id, {1});
        c4.Add(id, {1});
    }

    for(auto _ : state)
    {
        for(auto [a, b, c, d, e] : Strata::Join(c0.IterMut(), c1.Iter(), c2.Iter(), c3.Iter(), c4.Iter()))
        {
            a.x += b.x + c.x + d.x + e.x;
        }
        benchmark::DoNotOptimize(c0);
    }

    state.SetItemsProcessed(state.iterations() * count);
}

// Replication benchmarks
static void BM_DeltaFlush(benchmark::State& state)
{
    const size_t count = state.range(0);
    Strata::Table<Position> positions;
    Strata::Table<Strata::Tag> anyModified;
    for(size_t i = 0; i < count; ++i)
    {
        const Strata::EntityId id(static_cast<std::uint32_t>(i));
        positions.Add(id, Position{i, i});
        anyModified.Add(id, {});
    }

    Strata::DeltaTable<Position> tracked;
    Strata::DeltaStream<Position> stream;
    std::uint64_t frame = 0;

    for(auto _ : state)
    {
        ++frame;
        for(size_t i = 0; i < count; i += 8)
        {
            const Strata::EntityId id(static_cast<std::uint32_t>(i));
            positions.Get(id).x = frame;
            tracked.Write(id, positions.TryGet(id));
        }
        stream.Clear();
        tracked.Flush(anyModified, stream);
        benchmark::DoNotOptimize(stream.ModifiedCount());
    }

    state.SetItemsProcessed(state.iterations() * count);
}

// Prediction benchmarks
static void BM_Predict(benchmark::State& state)
{
    const size_t count = state.range(0);
    Strata::PredictTable<int, Strata::AddDelta<int>> table(true);
    for(size_t i = 0; i < count; ++i)
    {
        table.Add(Strata::EntityId(static_cast<std::uint32_t>(i)), 0, 0);
    }

    Strata::Tick tick = 0;
    for(auto _ : state)
    {
        ++tick;
        for(size_t i = 0; i < count; ++i)
        {
            table.ApplyDelta(Strata::EntityId(static_cast<std::uint32_t>(i)), tick, {1});
        }
        table.Predict(tick + 1);
    }

    state.SetItemsProcessed(state.iterations() * count);
}

BENCHMARK(BM_CreateEntities)->Arg(10000)->Arg(100000)->Arg(1000000);
BENCHMARK(BM_RecycleEntities)->Arg(10000)->Arg(100000);
BENCHMARK(BM_AddComponents)->Arg(10000)->Arg(100000)->Arg(1000000);
BENCHMARK(BM_RemoveJoin)->Arg(10000)->Arg(100000)->Arg(1000000);

BENCHMARK(BM_IterateSingleComponent)->Arg(10000)->Arg(100000)->Arg(1000000);
BENCHMARK(BM_IterateTwoComponents)->Arg(10000)->Arg(100000)->Arg(1000000);
BENCHMARK(BM_IterateTwoComponentsHalf)->Arg(10000)->Arg(100000)->Arg(1000000);
BENCHMARK(BM_IterateFiveComponents)->Arg(10000)->Arg(100000)->Arg(1000000);

BENCHMARK(BM_DeltaFlush)->Arg(10000)->Arg(100000);
BENCHMARK(BM_Predict)->Arg(1000)->Arg(10000);

BENCHMARK_MAIN();
