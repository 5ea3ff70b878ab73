/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <algorithm>
#include <cmath>

#include <fmt/ranges.h>

#include <tether/tether.h>

namespace tether
{
    token_refresher::token_refresher(
        std::shared_ptr<i_cbs_token_requester> requester, authorization_refresh_options options)
        : requester_(std::move(requester))
        , options_(options)
    {
        options_.refresh_fraction = std::clamp(options_.refresh_fraction, 0.0, 1.0);
        if (options_.maximum_refresh_interval < options_.minimum_refresh_interval)
            options_.maximum_refresh_interval = options_.minimum_refresh_interval;
    }

    CORO_TASK(int)
    token_refresher::request_authorization(std::shared_ptr<i_connection> connection,
        std::string audience,
        std::vector<std::string> required_claims,
        std::chrono::milliseconds timeout,
        std::stop_token cancellation,
        std::chrono::system_clock::time_point& expires_at)
    {
        if (!connection || !requester_)
        {
            TETHER_ERROR("request_authorization for {} has no connection or token requester", audience);
            CO_RETURN error::INVALID_ARGUMENT();
        }
        if (cancellation.stop_requested())
            CO_RETURN error::OPERATION_CANCELLED();

        TETHER_DEBUG("request_authorization audience={} claims={}", audience, fmt::join(required_claims, ","));

        cbs_token token;
        int err = CO_AWAIT requester_->request_token(connection, audience, required_claims, timeout, cancellation, token);
        if (err != error::OK())
        {
            TETHER_ERROR("request_authorization for {} failed {}", audience, error::to_string(err));
            CO_RETURN err;
        }

        expires_at = token.expires_at;
        CO_RETURN error::OK();
    }

    std::chrono::milliseconds token_refresher::calculate_refresh_interval(
        std::chrono::system_clock::time_point expires_at) const
    {
        return calculate_refresh_interval(expires_at, std::chrono::system_clock::now());
    }

    std::chrono::milliseconds token_refresher::calculate_refresh_interval(
        std::chrono::system_clock::time_point expires_at, std::chrono::system_clock::time_point now) const
    {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(expires_at - now);
        if (remaining < std::chrono::milliseconds::zero())
            remaining = std::chrono::milliseconds::zero();

        auto interval
            = std::chrono::milliseconds(std::llround(static_cast<double>(remaining.count()) * options_.refresh_fraction));
        return std::clamp(interval, options_.minimum_refresh_interval, options_.maximum_refresh_interval);
    }
}
