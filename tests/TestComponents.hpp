#pragma once

#include <array>
#include <cstdint>
#include "Strata/Core/Base.hpp"

namespace Strata::Test
{
    // Basic position component (trivially copyable)
    struct Position
    {
        float x = 0.0f;
        float y = 0.0f;
        float z = 0.0f;

        Position() = default;
        Position(float x_, float y_, float z_) : x(x_), y(y_), z(z_) {}

        bool operator==(const Position&) const = default;
    };

    // Velocity component (trivially copyable)
    struct Velocity
    {
        float dx = 0.0f;
        float dy = 0.0f;
        float dz = 0.0f;

        Velocity() = default;
        Velocity(float dx_, float dy_, float dz_) : dx(dx_), dy(dy_), dz(dz_) {}

        bool operator==(const Velocity&) const = default;
    };

    // Health component with logic
    struct Health
    {
        int current = 100;
        int max = 100;

        Health() = default;
        Health(int current_, int max_) : current(current_), max(max_) {}

        bool IsDead() const { return current <= 0; }
        bool operator==(const Health&) const = default;
    };

    // Larger replicated payload, compared field by field
    struct Snapshot
    {
        std::array<std::uint16_t, 32> data{};

        bool operator==(const Snapshot&) const = default;
    };
}
