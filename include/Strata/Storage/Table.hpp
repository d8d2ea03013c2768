#pragma once

#include <algorithm>
#include <concepts>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <type_traits>
#include <utility>
#include <vector>

#include "../Core/Base.hpp"
#include "../Core/Config.hpp"
#include "../Core/Profile.hpp"
#include "../Entity/Entity.hpp"
#include "../Query/Query.hpp"
#include "Page.hpp"

namespace Strata
{
    // Empty component, used where only presence matters
    struct Tag
    {
        STRATA_NODISCARD constexpr bool operator==(const Tag&) const noexcept = default;
    };

    /**
    * Destination of replicated or predicted writes.
    */
    template<typename W, typename T>
    concept TableWriter = requires(W& writer, EntityId id, T value)
    {
        writer.Add(id, std::move(value));
        writer.Remove(id);
    };

    template<typename T>
    class TableColumn;

    /**
    * Column of one component type, stored as a sparse sequence of pages.
    *
    * Page p covers entity indices [p * PAGE_SIZE, (p + 1) * PAGE_SIZE). Pages
    * are created on the first write to their range and are never moved once
    * created, so references into a page stay valid while the table grows.
    * Tables address storage by entity index only; the generation is ignored.
    */
    template<typename T>
    class Table
    {
    public:
        using ValueType = T;
        using PageType = Page<T>;
        using PagePtr = std::unique_ptr<PageType>;

        Table() = default;
        ~Table() = default;

        Table(const Table& other) { CopyFrom(other); }
        Table& operator=(const Table& other)
        {
            if (this != &other)
            {
                m_pages.clear();
                CopyFrom(other);
            }
            return *this;
        }

        Table(Table&&) noexcept = default;
        Table& operator=(Table&&) noexcept = default;

        // Number of present values
        STRATA_NODISCARD std::size_t Size() const noexcept
        {
            std::size_t size = 0;
            for (const PagePtr& page : m_pages)
            {
                if (page)
                {
                    size += page->Size();
                }
            }
            return size;
        }

        STRATA_NODISCARD bool Empty() const noexcept
        {
            return std::none_of(m_pages.begin(), m_pages.end(), [](const PagePtr& page)
            {
                return page && !page->Empty();
            });
        }

        // Drops every page
        void Clear() noexcept { m_pages.clear(); }

        // Empties every page but keeps it allocated
        void ClearPages()
        {
            for (PagePtr& page : m_pages)
            {
                if (page)
                {
                    page->Clear();
                }
            }
        }

        STRATA_NODISCARD std::size_t PageCount() const noexcept { return m_pages.size(); }

        STRATA_NODISCARD const PageType* TryGetPage(std::size_t index) const noexcept
        {
            return index < m_pages.size() ? m_pages[index].get() : nullptr;
        }

        STRATA_NODISCARD PageType* TryGetPage(std::size_t index) noexcept
        {
            return index < m_pages.size() ? m_pages[index].get() : nullptr;
        }

        STRATA_NODISCARD const PageType& GetPage(std::size_t index) const noexcept
        {
            const PageType* page = TryGetPage(index);
            STRATA_ASSERT(page != nullptr, "Table page does not exist");
            return *page;
        }

        STRATA_NODISCARD PageType& GetPage(std::size_t index) noexcept
        {
            PageType* page = TryGetPage(index);
            STRATA_ASSERT(page != nullptr, "Table page does not exist");
            return *page;
        }

        // Materializes page index, growing the page sequence with empty entries
        PageType& AddPage(std::size_t index)
        {
            if (index >= m_pages.size())
            {
                m_pages.resize(index + 1);
            }

            PagePtr& page = m_pages[index];
            if (!page)
            {
                page = std::make_unique<PageType>();
            }
            return *page;
        }

        bool RemovePage(std::size_t index) noexcept
        {
            if (index >= m_pages.size() || !m_pages[index])
            {
                return false;
            }
            m_pages[index].reset();
            return true;
        }

        STRATA_NODISCARD bool Contains(EntityId id) const noexcept
        {
            const PageType* page = TryGetPage(id.GetPageIndex());
            return page && page->Contains(id.GetSlot());
        }

        STRATA_NODISCARD const T* TryGet(EntityId id) const noexcept
        {
            const PageType* page = TryGetPage(id.GetPageIndex());
            return page ? page->TryGet(id.GetSlot()) : nullptr;
        }

        STRATA_NODISCARD T* TryGet(EntityId id) noexcept
        {
            PageType* page = TryGetPage(id.GetPageIndex());
            return page ? page->TryGet(id.GetSlot()) : nullptr;
        }

        STRATA_NODISCARD const T& Get(EntityId id) const noexcept
        {
            return GetPage(id.GetPageIndex()).Get(id.GetSlot());
        }

        STRATA_NODISCARD T& Get(EntityId id) noexcept
        {
            return GetPage(id.GetPageIndex()).Get(id.GetSlot());
        }

        // Inserts or overwrites
        T& Add(EntityId id, T value)
        {
            return AddPage(id.GetPageIndex()).Add(id.GetSlot(), std::move(value));
        }

        // Inserts only if absent; returns whether it inserted
        bool TryAdd(EntityId id, T value)
        {
            return AddPage(id.GetPageIndex()).TryAdd(id.GetSlot(), std::move(value));
        }

        T& GetOrAdd(EntityId id)
        {
            return AddPage(id.GetPageIndex()).GetOrAdd(id.GetSlot());
        }

        T* TryAddDefault(EntityId id)
        {
            return AddPage(id.GetPageIndex()).TryAddDefault(id.GetSlot());
        }

        std::optional<T> Remove(EntityId id)
        {
            PageType* page = TryGetPage(id.GetPageIndex());
            if (!page)
            {
                return std::nullopt;
            }
            return page->Remove(id.GetSlot());
        }

        void Set(EntityId id, std::optional<T> value)
        {
            if (value)
            {
                Add(id, std::move(*value));
            }
            else
            {
                (void)Remove(id);
            }
        }

        template<typename Range>
        void AddRange(Range&& entries)
        {
            for (auto&& [id, value] : entries)
            {
                Add(id, value);
            }
        }

        // After the call `to` holds what `from` held, and `from` is empty
        void MoveValue(EntityId from, EntityId to)
        {
            Set(to, Remove(from));
        }

        STRATA_NODISCARD std::span<const PagePtr> IterPages() const noexcept { return m_pages; }

        STRATA_NODISCARD Query<TableColumn<const T>> Iter() const
        {
            return Query<TableColumn<const T>>(TableColumn<const T>(*this));
        }

        STRATA_NODISCARD Query<TableColumn<T>> IterMut()
        {
            return Query<TableColumn<T>>(TableColumn<T>(*this));
        }

        /**
        * Removes every slot the query yields, page by page and word by word.
        * Pages missing on either side are skipped.
        */
        template<Column C>
        void RemoveWhere(const Query<C>& query)
        {
            STRATA_PROFILE_ZONE_COLOR(Profile::ColorTable);

            const C& column = query.GetColumn();
            const std::size_t pageCount = std::min<std::size_t>(m_pages.size(), column.PageCount());
            for (std::size_t p = 0; p < pageCount; ++p)
            {
                PageType* page = m_pages[p].get();
                if (!page || !column.HasPage(p))
                {
                    continue;
                }

                for (std::size_t w = 0; w < config::PAGE_MASK_COUNT; ++w)
                {
                    page->RemoveMask(w, column.GetWord(p, w));
                }
            }
        }

        // Removes every id present in other
        template<typename U>
        void RemoveJoin(const Table<U>& other)
        {
            RemoveWhere(other.Iter());
        }

    private:
        void CopyFrom(const Table& other)
        {
            m_pages.resize(other.m_pages.size());
            for (std::size_t i = 0; i < other.m_pages.size(); ++i)
            {
                if (other.m_pages[i])
                {
                    m_pages[i] = std::make_unique<PageType>(*other.m_pages[i]);
                }
            }
        }

        std::vector<PagePtr> m_pages;
    };

    /**
    * Leaf column over a table. TableColumn<const T> reads, TableColumn<T>
    * writes through the table it was created from.
    */
    template<typename T>
    class TableColumn
    {
    public:
        using ValueType = std::remove_const_t<T>;
        using TableType = std::conditional_t<std::is_const_v<T>, const Table<ValueType>, Table<ValueType>>;
        using Reference = T&;

        explicit TableColumn(TableType& table) noexcept : m_table(&table) {}

        STRATA_NODISCARD std::size_t PageCount() const noexcept { return m_table->PageCount(); }
        STRATA_NODISCARD bool HasPage(std::size_t page) const noexcept { return m_table->TryGetPage(page) != nullptr; }

        STRATA_NODISCARD std::uint64_t GetWord(std::size_t page, std::size_t w) const noexcept
        {
            return m_table->TryGetPage(page)->GetWord(w);
        }

        STRATA_NODISCARD Reference Get(std::size_t page, std::size_t slot) const noexcept
        {
            return m_table->TryGetPage(page)->Values()[slot];
        }

    private:
        TableType* m_table;
    };
}
