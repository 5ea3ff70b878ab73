/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <chrono>
#include <stop_token>

namespace tether
{
    /**
     * @brief A token that fires when either of two other tokens fires
     *
     * Used to combine the scope-wide operation cancellation with the token a caller
     * passed in. Not copyable or movable, the callbacks point at the owned source.
     */
    class linked_cancellation
    {
        struct stop_requester
        {
            std::stop_source source;
            void operator()() noexcept { source.request_stop(); }
        };

        std::stop_source source_;
        std::stop_callback<stop_requester> first_;
        std::stop_callback<stop_requester> second_;

    public:
        linked_cancellation(std::stop_token first, std::stop_token second);

        linked_cancellation(const linked_cancellation&) = delete;
        linked_cancellation& operator=(const linked_cancellation&) = delete;

        std::stop_token get_token() const { return source_.get_token(); }
        bool is_cancellation_requested() const { return source_.stop_requested(); }
    };

    // The time left for a multi step operation
    class timeout_budget
    {
        std::chrono::steady_clock::time_point deadline_;

    public:
        explicit timeout_budget(std::chrono::milliseconds timeout);

        std::chrono::milliseconds remaining() const;
        bool expired() const { return remaining() <= std::chrono::milliseconds::zero(); }
    };
}
