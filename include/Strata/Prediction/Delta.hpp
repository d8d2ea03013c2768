#pragma once

#include <concepts>
#include <utility>

#include "../Core/Base.hpp"

namespace Strata
{
    /**
    * A speculative change to a value. Deltas only change an existing value;
    * adding and removing components is never predicted.
    *
    * ApplyTo folds the delta into a value, Merge folds a later delta for the
    * same tick into this one.
    */
    template<typename D, typename T>
    concept Delta = std::default_initializable<D> && requires(const D& delta, D& target, T& value)
    {
        delta.ApplyTo(value);
        target.Merge(delta);
    };

    // Last write wins
    template<typename T>
    struct ReplaceDelta
    {
        T value{};

        void ApplyTo(T& target) const { target = value; }
        void Merge(const ReplaceDelta& other) { value = other.value; }
    };

    // Deltas accumulate by addition
    template<typename T>
    struct AddDelta
    {
        T value{};

        void ApplyTo(T& target) const { target = target + value; }
        void Merge(const AddDelta& other) { value = value + other.value; }
    };
}
