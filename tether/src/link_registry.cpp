/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <mutex>

#include <tether/tether.h>

namespace tether
{
    int link_registry::try_add(std::shared_ptr<i_link> link, std::shared_ptr<refresh_timer> timer)
    {
        if (!link)
            return error::INVALID_ARGUMENT();

        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (closed_)
            return error::OBJECT_DISPOSED();

        const i_link* key = link.get();
        auto [it, success] = links_.try_emplace(key, entry{std::move(link), std::move(timer)});
        if (!success)
        {
            TETHER_ERROR("link_registry: link {} is already registered", it->second.link->get_address());
            return error::DUPLICATE_LINK();
        }
        return error::OK();
    }

    bool link_registry::try_remove(const i_link* link, entry& removed)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = links_.find(link);
        if (it == links_.end())
            return false;
        removed = std::move(it->second);
        links_.erase(it);
        return true;
    }

    bool link_registry::try_get_timer(const i_link* link, std::shared_ptr<refresh_timer>& timer) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = links_.find(link);
        if (it == links_.end())
            return false;
        timer = it->second.timer;
        return true;
    }

    bool link_registry::contains(const i_link* link) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return links_.find(link) != links_.end();
    }

    size_t link_registry::size() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return links_.size();
    }

    std::vector<link_registry::entry> link_registry::close()
    {
        std::vector<entry> drained;
        std::unique_lock<std::shared_mutex> lock(mutex_);
        closed_ = true;
        drained.reserve(links_.size());
        for (auto& [key, value] : links_)
            drained.push_back(std::move(value));
        links_.clear();
        return drained;
    }

    bool link_registry::is_closed() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return closed_;
    }
}
