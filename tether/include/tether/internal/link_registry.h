/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <cstddef>
#include <memory>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include <tether/internal/amqp_object.h>
#include <tether/internal/refresh_timer.h>

namespace tether
{
    /**
     * @brief The links a connection scope has opened and their refresh timers
     *
     * A link that needs no authorization renewal is still tracked, with a null timer.
     *
     * Removal Semantics:
     * - try_remove hands the entry to exactly one caller, that caller disposes the timer
     * - close() drains every entry at once and refuses later additions, so a link opened
     *   concurrently with disposal can never be left untracked
     *
     * Thread Safety:
     * - all members are guarded by mutex_, no callbacks run under it
     */
    class link_registry
    {
    public:
        struct entry
        {
            std::shared_ptr<i_link> link;
            std::shared_ptr<refresh_timer> timer;
        };

    private:
        mutable std::shared_mutex mutex_;
        std::unordered_map<const i_link*, entry> links_;
        bool closed_ = false;

    public:
        link_registry() = default;

        link_registry(const link_registry&) = delete;
        link_registry& operator=(const link_registry&) = delete;

        // error::OBJECT_DISPOSED() once closed, error::DUPLICATE_LINK() if already tracked
        int try_add(std::shared_ptr<i_link> link, std::shared_ptr<refresh_timer> timer);

        bool try_remove(const i_link* link, entry& removed);

        // true if the link is tracked, timer is null for links without renewal
        bool try_get_timer(const i_link* link, std::shared_ptr<refresh_timer>& timer) const;

        bool contains(const i_link* link) const;
        size_t size() const;
        bool empty() const { return size() == 0; }

        std::vector<entry> close();
        bool is_closed() const;
    };
}
