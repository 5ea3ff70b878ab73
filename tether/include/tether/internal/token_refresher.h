/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <chrono>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

#include <tether/internal/coroutine_support.h>
#include <tether/internal/transport.h>

namespace tether
{
    /**
     * @brief When a link's authorization is renewed
     *
     * A renewal is due at refresh_fraction of the remaining token validity, never
     * sooner than minimum_refresh_interval and never later than maximum_refresh_interval.
     */
    struct authorization_refresh_options
    {
        double refresh_fraction = 0.85;
        std::chrono::milliseconds minimum_refresh_interval = std::chrono::minutes(4);
        std::chrono::milliseconds maximum_refresh_interval = std::chrono::hours(24 * 49);
    };

    // Acquires CBS tokens for a resource scope and decides when they should be renewed
    class token_refresher
    {
        std::shared_ptr<i_cbs_token_requester> requester_;
        authorization_refresh_options options_;

    public:
        token_refresher(std::shared_ptr<i_cbs_token_requester> requester, authorization_refresh_options options);

        const authorization_refresh_options& get_options() const { return options_; }

        CORO_TASK(int)
        request_authorization(std::shared_ptr<i_connection> connection,
            std::string audience,
            std::vector<std::string> required_claims,
            std::chrono::milliseconds timeout,
            std::stop_token cancellation,
            std::chrono::system_clock::time_point& expires_at);

        std::chrono::milliseconds calculate_refresh_interval(std::chrono::system_clock::time_point expires_at) const;
        std::chrono::milliseconds calculate_refresh_interval(
            std::chrono::system_clock::time_point expires_at, std::chrono::system_clock::time_point now) const;
    };
}
