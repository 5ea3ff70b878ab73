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

#include <tether/internal/amqp_object.h>
#include <tether/internal/coroutine_support.h>
#include <tether/internal/types.h>

namespace tether
{
    /**
     * @brief The protocol engine seam
     *
     * Implementations own framing, sessions and flow control. All calls return an
     * error code from tether::error and must honour both the timeout and the token,
     * returning error::OPERATION_CANCELLED() when the token fires.
     */
    class i_transport
    {
    public:
        virtual ~i_transport() = default;

        virtual CORO_TASK(int) open_connection(const connection_scope_identity& identity,
            std::chrono::milliseconds timeout,
            std::stop_token cancellation,
            std::shared_ptr<i_connection>& connection)
            = 0;

        // settings.kind is link_kind::management
        virtual CORO_TASK(int) open_management_link(std::shared_ptr<i_connection> connection,
            const link_settings& settings,
            std::chrono::milliseconds timeout,
            std::stop_token cancellation,
            std::shared_ptr<i_link>& link)
            = 0;

        // settings.kind is link_kind::receiver, the position is translated to a filter by the engine
        virtual CORO_TASK(int) open_receiving_link(std::shared_ptr<i_connection> connection,
            const link_settings& settings,
            const event_position& position,
            std::chrono::milliseconds timeout,
            std::stop_token cancellation,
            std::shared_ptr<i_link>& link)
            = 0;
    };

    // Puts a claims-based-security token on the connection's $cbs node for an audience
    class i_cbs_token_requester
    {
    public:
        virtual ~i_cbs_token_requester() = default;

        virtual CORO_TASK(int) request_token(std::shared_ptr<i_connection> connection,
            const std::string& audience,
            const std::vector<std::string>& required_claims,
            std::chrono::milliseconds timeout,
            std::stop_token cancellation,
            cbs_token& token)
            = 0;
    };
}
