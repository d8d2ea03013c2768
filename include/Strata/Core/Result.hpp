#pragma once

#include <memory>
#include <type_traits>
#include <utility>

#include "Base.hpp"

namespace Strata
{
    template<typename E>
    struct ErrorValue
    {
        E value;

        constexpr explicit ErrorValue(const E& e) : value(e) {}
        constexpr explicit ErrorValue(E&& e) : value(std::move(e)) {}
    };

    template<typename E>
    constexpr ErrorValue<std::decay_t<E>> Err(E&& e)
    {
        return ErrorValue<std::decay_t<E>>(std::forward<E>(e));
    }

    /**
    * Holds either a value or an error. Used for the few operations in Strata
    * that can fail at runtime: fallible construction and decoding.
    */
    template<typename T, typename E>
    class Result
    {
        static_assert(!std::is_reference_v<T>, "T cannot be a reference type");
        static_assert(!std::is_reference_v<E>, "E cannot be a reference type");

    public:
        using ValueType = T;
        using ErrorType = E;

        constexpr Result(const T& value) noexcept(std::is_nothrow_copy_constructible_v<T>) : m_hasValue(true)
        {
            std::construct_at(&m_value, value);
        }

        constexpr Result(T&& value) noexcept(std::is_nothrow_move_constructible_v<T>) : m_hasValue(true)
        {
            std::construct_at(&m_value, std::move(value));
        }

        constexpr Result(const ErrorValue<E>& err) noexcept(std::is_nothrow_copy_constructible_v<E>) : m_hasValue(false)
        {
            std::construct_at(&m_error, err.value);
        }

        constexpr Result(ErrorValue<E>&& err) noexcept(std::is_nothrow_move_constructible_v<E>) : m_hasValue(false)
        {
            std::construct_at(&m_error, std::move(err.value));
        }

        constexpr Result(const Result& other) : m_hasValue(other.m_hasValue)
        {
            if (m_hasValue)
                std::construct_at(&m_value, other.m_value);
            else
                std::construct_at(&m_error, other.m_error);
        }

        constexpr Result(Result&& other) noexcept(std::is_nothrow_move_constructible_v<T> && std::is_nothrow_move_constructible_v<E>)
            : m_hasValue(other.m_hasValue)
        {
            if (m_hasValue)
                std::construct_at(&m_value, std::move(other.m_value));
            else
                std::construct_at(&m_error, std::move(other.m_error));
        }

        constexpr Result& operator=(const Result& other)
        {
            if (this != &other)
            {
                Destroy();
                m_hasValue = other.m_hasValue;
                if (m_hasValue)
                    std::construct_at(&m_value, other.m_value);
                else
                    std::construct_at(&m_error, other.m_error);
            }
            return *this;
        }

        constexpr Result& operator=(Result&& other) noexcept(std::is_nothrow_move_constructible_v<T> && std::is_nothrow_move_constructible_v<E>)
        {
            if (this != &other)
            {
                Destroy();
                m_hasValue = other.m_hasValue;
                if (m_hasValue)
                    std::construct_at(&m_value, std::move(other.m_value));
                else
                    std::construct_at(&m_error, std::move(other.m_error));
            }
            return *this;
        }

        constexpr ~Result()
        {
            Destroy();
        }

        [[nodiscard]] constexpr bool HasValue() const noexcept { return m_hasValue; }
        [[nodiscard]] constexpr bool IsOk() const noexcept { return m_hasValue; }
        [[nodiscard]] constexpr bool IsErr() const noexcept { return !m_hasValue; }
        [[nodiscard]] constexpr explicit operator bool() const noexcept { return m_hasValue; }

        constexpr T& Value() &
        {
            STRATA_ASSERT(m_hasValue, "Called Value() on Result containing error");
            return m_value;
        }

        constexpr const T& Value() const&
        {
            STRATA_ASSERT(m_hasValue, "Called Value() on Result containing error");
            return m_value;
        }

        constexpr T&& Value() &&
        {
            STRATA_ASSERT(m_hasValue, "Called Value() on Result containing error");
            return std::move(m_value);
        }

        constexpr E& Error() &
        {
            STRATA_ASSERT(!m_hasValue, "Called Error() on Result containing value");
            return m_error;
        }

        constexpr const E& Error() const&
        {
            STRATA_ASSERT(!m_hasValue, "Called Error() on Result containing value");
            return m_error;
        }

        constexpr T& operator*() & { return Value(); }
        constexpr const T& operator*() const& { return Value(); }
        constexpr T&& operator*() && { return std::move(*this).Value(); }

        constexpr T* operator->() noexcept { return &Value(); }
        constexpr const T* operator->() const noexcept { return &Value(); }

        template<typename U>
        [[nodiscard]] constexpr T ValueOr(U&& defaultValue) const&
        {
            return m_hasValue ? m_value : static_cast<T>(std::forward<U>(defaultValue));
        }

        template<typename U>
        [[nodiscard]] constexpr T ValueOr(U&& defaultValue) &&
        {
            return m_hasValue ? std::move(m_value) : static_cast<T>(std::forward<U>(defaultValue));
        }

    private:
        constexpr void Destroy()
        {
            if (m_hasValue)
            {
                if constexpr (!std::is_trivially_destructible_v<T>)
                    std::destroy_at(&m_value);
            }
            else
            {
                if constexpr (!std::is_trivially_destructible_v<E>)
                    std::destroy_at(&m_error);
            }
        }

        union
        {
            T m_value;
            E m_error;
        };
        bool m_hasValue;
    };
}
