/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <algorithm>

#include <tether/internal/cancellation.h>

namespace tether
{
    linked_cancellation::linked_cancellation(std::stop_token first, std::stop_token second)
        : source_()
        , first_(first, stop_requester{source_})
        , second_(second, stop_requester{source_})
    {
    }

    timeout_budget::timeout_budget(std::chrono::milliseconds timeout)
    {
        auto now = std::chrono::steady_clock::now();
        // saturate so "effectively forever" timeouts do not overflow the clock
        auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::time_point::max() - now);
        deadline_ = now + std::min(timeout, headroom);
    }

    std::chrono::milliseconds timeout_budget::remaining() const
    {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline_ - std::chrono::steady_clock::now());
        return std::max(left, std::chrono::milliseconds::zero());
    }
}
