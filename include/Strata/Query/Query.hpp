#pragma once

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <tuple>
#include <type_traits>
#include <utility>

#include "../Core/Base.hpp"
#include "../Core/Config.hpp"
#include "MaskIterator.hpp"

namespace Strata
{
    /**
    * A column exposes storage page by page: whether a page exists, the presence
    * words of an existing page, and the item stored at a slot. HasPage must
    * accept any page index, including indices past PageCount.
    */
    template<typename C>
    concept Column = requires(const C& column, std::size_t page, std::size_t index)
    {
        typename C::Reference;

        { column.PageCount() } -> std::convertible_to<std::size_t>;
        { column.HasPage(page) } -> std::convertible_to<bool>;
        { column.GetWord(page, index) } -> std::convertible_to<std::uint64_t>;
        { column.Get(page, index) } -> std::same_as<typename C::Reference>;
    };

    namespace Detail
    {
        template<typename R>
        struct OptionalItem
        {
            using type = std::optional<R>;

            static type None() noexcept { return std::nullopt; }
            static type Some(R&& item) { return type(std::move(item)); }
        };

        // A missing reference is a null pointer
        template<typename U>
        struct OptionalItem<U&>
        {
            using type = U*;

            static type None() noexcept { return nullptr; }
            static type Some(U& item) noexcept { return &item; }
        };

        template<Column C>
        STRATA_NODISCARD bool TestSlot(const C& column, std::size_t page, std::size_t slot)
        {
            const std::uint64_t word = column.GetWord(page, slot >> config::MASK_BITS_POW);
            return ((word >> (slot & config::MASK_BITS_MASK)) & 1) != 0;
        }
    }

    template<typename R>
    using Optional = typename Detail::OptionalItem<R>::type;

    /**
    * Inner join: a page exists only where it exists on both sides, and a slot
    * is yielded only where both presence bits are set.
    */
    template<Column A, Column B>
    class JoinColumn
    {
    public:
        using Reference = std::pair<typename A::Reference, typename B::Reference>;
        using LeftColumn = A;
        using RightColumn = B;

        JoinColumn(A left, B right) : m_left(std::move(left)), m_right(std::move(right)) {}

        STRATA_NODISCARD std::size_t PageCount() const noexcept
        {
            return std::min<std::size_t>(m_left.PageCount(), m_right.PageCount());
        }

        STRATA_NODISCARD bool HasPage(std::size_t page) const noexcept
        {
            return m_left.HasPage(page) && m_right.HasPage(page);
        }

        STRATA_NODISCARD std::uint64_t GetWord(std::size_t page, std::size_t w) const noexcept
        {
            return m_left.GetWord(page, w) & m_right.GetWord(page, w);
        }

        STRATA_NODISCARD Reference Get(std::size_t page, std::size_t slot) const
        {
            return Reference(m_left.Get(page, slot), m_right.Get(page, slot));
        }

        STRATA_NODISCARD const A& Left() const noexcept { return m_left; }
        STRATA_NODISCARD const B& Right() const noexcept { return m_right; }

    private:
        A m_left;
        B m_right;
    };

    /**
    * Left join: pages and slots follow the left side. The right item is present
    * only if the right page exists and its bit is set; otherwise it is
    * nullptr (for references) or std::nullopt.
    */
    template<Column A, Column B>
    class LeftJoinColumn
    {
    public:
        using RightItem = Optional<typename B::Reference>;
        using Reference = std::pair<typename A::Reference, RightItem>;

        LeftJoinColumn(A left, B right) : m_left(std::move(left)), m_right(std::move(right)) {}

        STRATA_NODISCARD std::size_t PageCount() const noexcept { return m_left.PageCount(); }
        STRATA_NODISCARD bool HasPage(std::size_t page) const noexcept { return m_left.HasPage(page); }

        STRATA_NODISCARD std::uint64_t GetWord(std::size_t page, std::size_t w) const noexcept
        {
            return m_left.GetWord(page, w);
        }

        STRATA_NODISCARD Reference Get(std::size_t page, std::size_t slot) const
        {
            using Item = Detail::OptionalItem<typename B::Reference>;

            if (m_right.HasPage(page) && Detail::TestSlot(m_right, page, slot))
            {
                return Reference(m_left.Get(page, slot), Item::Some(m_right.Get(page, slot)));
            }
            return Reference(m_left.Get(page, slot), Item::None());
        }

    private:
        A m_left;
        B m_right;
    };

    namespace Detail
    {
        // Left-nested inner joins ((a, b), c) flatten into std::tuple<a, b, c>
        template<Column C>
        struct FlatItem
        {
            using type = std::tuple<typename C::Reference>;

            static type Make(typename C::Reference item) { return type(std::forward<typename C::Reference>(item)); }
        };

        template<Column A, Column B>
        struct FlatItem<JoinColumn<A, B>>
        {
            using LeftType = typename FlatItem<A>::type;
            using RightType = std::tuple<typename B::Reference>;
            using type = decltype(std::tuple_cat(std::declval<LeftType>(), std::declval<RightType>()));

            static type Make(typename JoinColumn<A, B>::Reference item)
            {
                return std::tuple_cat(
                    FlatItem<A>::Make(std::get<0>(std::move(item))),
                    RightType(std::get<1>(std::move(item))));
            }
        };
    }

    template<Column C>
    class FlattenColumn
    {
    public:
        using Reference = typename Detail::FlatItem<C>::type;

        static_assert(std::tuple_size_v<Reference> <= config::MAX_JOIN_ARITY, "Too many columns in one join");

        explicit FlattenColumn(C inner) : m_inner(std::move(inner)) {}

        STRATA_NODISCARD std::size_t PageCount() const noexcept { return m_inner.PageCount(); }
        STRATA_NODISCARD bool HasPage(std::size_t page) const noexcept { return m_inner.HasPage(page); }
        STRATA_NODISCARD std::uint64_t GetWord(std::size_t page, std::size_t w) const noexcept { return m_inner.GetWord(page, w); }

        STRATA_NODISCARD Reference Get(std::size_t page, std::size_t slot) const
        {
            return Detail::FlatItem<C>::Make(m_inner.Get(page, slot));
        }

    private:
        C m_inner;
    };

    /**
    * Lazy range over a column. Pages the column reports absent are skipped
    * without touching their words, and within a page only set bits are
    * visited. Nothing is allocated. The query borrows the tables it was built
    * from and must not outlive them.
    */
    template<Column C>
    class Query
    {
    public:
        using ColumnType = C;
        using Reference = typename C::Reference;

        class Iterator
        {
        public:
            using difference_type = std::ptrdiff_t;
            using value_type = Reference;
            using reference = Reference;
            using iterator_category = std::input_iterator_tag;

            Iterator() = default;
            explicit Iterator(const C* column) :
                m_column(column),
                m_pageCount(column->PageCount())
            {
                SeekPage();
            }

            STRATA_NODISCARD Reference operator*() const
            {
                return m_column->Get(m_page, m_cursor.Position());
            }

            Iterator& operator++()
            {
                m_cursor.Advance();
                if (m_cursor.Done())
                {
                    ++m_page;
                    SeekPage();
                }
                return *this;
            }

            void operator++(int) { ++*this; }

            STRATA_NODISCARD bool operator==(std::default_sentinel_t) const noexcept { return m_page >= m_pageCount; }

            // Entity index of the current item
            STRATA_NODISCARD std::size_t Index() const noexcept
            {
                return (m_page << config::PAGE_SIZE_POW) + m_cursor.Position();
            }

        private:
            struct PageWords
            {
                const C* column = nullptr;
                std::size_t page = 0;

                STRATA_NODISCARD std::size_t WordCount() const noexcept { return config::PAGE_MASK_COUNT; }
                STRATA_NODISCARD std::uint64_t GetWord(std::size_t w) const { return column->GetWord(page, w); }
            };

            void SeekPage()
            {
                for (; m_page < m_pageCount; ++m_page)
                {
                    if (!m_column->HasPage(m_page))
                    {
                        continue;
                    }

                    m_cursor = MaskCursor<PageWords>(PageWords{m_column, m_page});
                    if (!m_cursor.Done())
                    {
                        return;
                    }
                }
            }

            const C* m_column = nullptr;
            std::size_t m_page = 0;
            std::size_t m_pageCount = 0;
            MaskCursor<PageWords> m_cursor;
        };

        explicit Query(C column) : m_column(std::move(column)) {}

        STRATA_NODISCARD Iterator begin() const { return Iterator(&m_column); }
        STRATA_NODISCARD std::default_sentinel_t end() const noexcept { return {}; }

        STRATA_NODISCARD const C& GetColumn() const noexcept { return m_column; }

        template<Column D>
        STRATA_NODISCARD Query<JoinColumn<C, D>> Join(const Query<D>& other) const
        {
            return Query<JoinColumn<C, D>>(JoinColumn<C, D>(m_column, other.GetColumn()));
        }

        template<Column D>
        STRATA_NODISCARD Query<LeftJoinColumn<C, D>> LeftJoin(const Query<D>& other) const
        {
            return Query<LeftJoinColumn<C, D>>(LeftJoinColumn<C, D>(m_column, other.GetColumn()));
        }

        template<Column D>
        STRATA_NODISCARD friend Query<JoinColumn<C, D>> operator&(const Query& lhs, const Query<D>& rhs)
        {
            return lhs.Join(rhs);
        }

        // Counts items by walking the query
        STRATA_NODISCARD std::size_t Count() const
        {
            std::size_t count = 0;
            for (auto it = begin(); it != end(); ++it)
            {
                ++count;
            }
            return count;
        }

    private:
        C m_column;
    };

    namespace Detail
    {
        template<Column C>
        auto NestJoin(const Query<C>& query)
        {
            return query;
        }

        template<Column A, Column B, Column... Rest>
        auto NestJoin(const Query<A>& first, const Query<B>& second, const Query<Rest>&... rest)
        {
            return NestJoin(first.Join(second), rest...);
        }
    }

    /**
    * Inner join of two or more queries. Items are flattened into a std::tuple
    * so they can be unpacked with structured bindings:
    *
    * for (auto [pos, vel] : Join(positions.IterMut(), velocities.Iter()))
    */
    template<Column A, Column B, Column... Rest>
    STRATA_NODISCARD auto Join(const Query<A>& first, const Query<B>& second, const Query<Rest>&... rest)
    {
        static_assert(2 + sizeof...(Rest) <= config::MAX_JOIN_ARITY, "Too many columns in one join");

        auto nested = Detail::NestJoin(first, second, rest...);
        using Nested = typename decltype(nested)::ColumnType;
        return Query<FlattenColumn<Nested>>(FlattenColumn<Nested>(nested.GetColumn()));
    }
}
