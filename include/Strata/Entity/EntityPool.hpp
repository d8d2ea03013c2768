#pragma once

#include <cstdint>
#include <deque>
#include <limits>
#include <vector>

#include "../Core/Base.hpp"
#include "../Core/Config.hpp"
#include "../Core/Error.hpp"
#include "../Core/Log.hpp"
#include "../Core/Result.hpp"
#include "Entity.hpp"

namespace Strata
{
    /**
    * Logical partition tag. Every index page handed out by an EntityPool
    * belongs to exactly one group.
    */
    struct GroupId
    {
        std::uint32_t value = 0;

        STRATA_NODISCARD constexpr bool operator==(const GroupId& other) const noexcept = default;
    };

    inline constexpr GroupId DEFAULT_GROUP{0};

    /**
    * EntityPool hands out generational entity ids one index page at a time.
    *
    * Pages are claimed lazily: when a group runs out of recycled ids the pool
    * takes the next page allowed by its ownership mask, queues every slot of
    * that page for the group, and returns the first one. Bit (page % 64) of the
    * mask decides whether a page may be claimed, so two pools with disjoint
    * masks never produce the same index.
    */
    class EntityPool
    {
    public:
        using PageMask = std::uint64_t;

        struct Config
        {
            PageMask pageMask = std::numeric_limits<PageMask>::max();
        };

        EntityPool() = default;

        // Rejects an all-zero mask, which would leave the pool without any page
        STRATA_NODISCARD static Result<EntityPool, Error> Create(PageMask pageMask)
        {
            return Create(Config{pageMask});
        }

        STRATA_NODISCARD static Result<EntityPool, Error> Create(const Config& config)
        {
            if (config.pageMask == 0) STRATA_UNLIKELY
            {
                STRATA_LOG_ERROR("EntityPool: ownership mask is empty, no page can be claimed");
                return Err(MakeError(ErrorCode::InvalidArgument, "Ownership mask must have at least one bit set"));
            }

            return EntityPool(config);
        }

        STRATA_NODISCARD EntityId Create()
        {
            return CreateIn(DEFAULT_GROUP);
        }

        // Returns EntityId::Invalid() once every page the mask allows has been claimed
        STRATA_NODISCARD EntityId CreateIn(GroupId group)
        {
            if (group.value >= m_groups.size())
            {
                m_groups.resize(static_cast<std::size_t>(group.value) + 1);
            }

            std::deque<EntityId>& queue = m_groups[group.value];
            if (!queue.empty()) STRATA_LIKELY
            {
                EntityId id = queue.front();
                queue.pop_front();
                return id;
            }

            // Pages we may not use still get an entry so page indices line up
            while (m_pages.size() < MAX_PAGE_COUNT && !IsPageUsable(m_pages.size()))
            {
                m_pages.push_back(UNOWNED_GROUP);
            }

            if (m_pages.size() >= MAX_PAGE_COUNT) STRATA_UNLIKELY
            {
                STRATA_LOG_ERROR("EntityPool: index space exhausted, no page left for group {}", group.value);
                return EntityId::Invalid();
            }

            const std::size_t page = m_pages.size();
            const auto base = static_cast<EntityId::ValueType>(page << config::PAGE_SIZE_POW);

            for (EntityId::ValueType slot = 1; slot < config::PAGE_SIZE; ++slot)
            {
                // The last index is reserved for EntityId::Invalid()
                if (base + slot == EntityId::INDEX_MASK)
                {
                    break;
                }
                queue.push_back(EntityId(base + slot));
            }
            m_pages.push_back(group);

            STRATA_LOG_DEBUG("EntityPool: claimed page {} for group {}", page, group.value);
            return EntityId(base);
        }

        /**
        * Returns an id to the free queue of the group that owns its page, with
        * the generation bumped. Ids on pages this pool does not own, and
        * EntityId::Invalid(), are ignored.
        */
        void Recycle(EntityId id)
        {
            const std::size_t page = id.GetPageIndex();
            if (id.GetIndex() == EntityId::INDEX_MASK || !IsPageUsable(page) || page >= m_pages.size())
            {
                STRATA_LOG_DEBUG("EntityPool: ignoring recycle of {}, page {} is not owned", id, page);
                return;
            }

            const GroupId group = m_pages[page];
            STRATA_ASSERT(group.value < m_groups.size(), "Page owned by an unknown group");
            m_groups[group.value].push_back(id.NextGeneration());
        }

        STRATA_NODISCARD bool IsPageUsable(std::size_t page) const noexcept
        {
            return (m_config.pageMask & (PageMask{1} << (page % config::OWNERSHIP_PERIOD))) != 0;
        }

        STRATA_NODISCARD PageMask GetPageMask() const noexcept { return m_config.pageMask; }
        STRATA_NODISCARD std::size_t GetPageCount() const noexcept { return m_pages.size(); }
        STRATA_NODISCARD std::size_t GetGroupCount() const noexcept { return m_groups.size(); }

        // Number of ids currently queued for reuse in a group
        STRATA_NODISCARD std::size_t GetFreeCount(GroupId group) const noexcept
        {
            return group.value < m_groups.size() ? m_groups[group.value].size() : 0;
        }

    private:
        static constexpr GroupId UNOWNED_GROUP{std::numeric_limits<std::uint32_t>::max()};
        static constexpr std::size_t MAX_PAGE_COUNT = std::size_t{EntityId::INDEX_COUNT} >> config::PAGE_SIZE_POW;

        explicit EntityPool(const Config& config) : m_config(config) {}

        Config m_config;
        std::vector<std::deque<EntityId>> m_groups;
        std::vector<GroupId> m_pages;
    };
}
