/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

/**
 * @file connection_scope.h
 * @brief The entry point that opens links to one entity of a messaging service
 *
 * A connection scope owns one shared AMQP connection to a service endpoint and
 * multiplexes links for a single entity (an event hub) over it:
 * - a management link, used for metadata requests
 * - consumer links, one per consumer group and partition being read
 *
 * Every link is authorized with a claims-based-security (CBS) token before it is
 * attached. Consumer links keep their authorization valid with a refresh_timer that
 * re-requests the token ahead of its expiry.
 *
 * Lifecycle:
 * - the connection is created on the first link request and replaced when it closes
 * - a link is tracked until it closes, its closed notification unregisters it
 * - dispose() cancels in-flight operations, closes every link and the connection
 */

#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include <tether/internal/coroutine_support.h>
#include <tether/internal/fault_tolerant_connection.h>
#include <tether/internal/link_registry.h>
#include <tether/internal/refresh_timer.h>
#include <tether/internal/token_refresher.h>
#include <tether/internal/transport.h>
#include <tether/internal/types.h>

#ifdef TETHER_BUILD_COROUTINE
#include <coro/io_scheduler.hpp>
#endif

namespace tether
{
    struct connection_scope_options
    {
        // used for authorization renewal, which has no caller to supply a timeout
        std::chrono::milliseconds default_timeout = std::chrono::minutes(1);

        authorization_refresh_options authorization_refresh;

        // management links are normally authorized once for their whole life
        bool refresh_management_authorization = false;

        std::vector<std::string> management_claims = {claims::manage, claims::listen};
    };

    class connection_scope
    {
        const connection_scope_identity identity_;
        const connection_scope_options options_;

        std::shared_ptr<i_transport> transport_;
        std::shared_ptr<token_refresher> token_refresher_;
#ifdef TETHER_BUILD_COROUTINE
        std::shared_ptr<coro::io_scheduler> scheduler_;
#endif

        // fired once, by dispose()
        std::stop_source operation_cancellation_;
        std::atomic<bool> disposed_{false};

        std::shared_ptr<link_registry> active_links_;
        fault_tolerant_connection active_connection_;

        // error::OBJECT_DISPOSED() takes precedence over error::OPERATION_CANCELLED()
        int check_can_operate(const std::stop_token& cancellation) const;

        // maps a collaborator failure to disposal or cancellation when either caused it
        int resolve_error(int err, const std::stop_token& cancellation) const;

        CORO_TASK(int)
        create_connection(
            std::chrono::milliseconds timeout, std::stop_token cancellation, std::shared_ptr<i_connection>& connection);

        std::shared_ptr<refresh_timer> create_refresh_timer(std::shared_ptr<i_connection> connection,
            std::shared_ptr<i_link> link,
            std::string audience,
            std::vector<std::string> required_claims,
            std::chrono::system_clock::time_point expires_at);

        int track_link(std::shared_ptr<i_link> link, std::shared_ptr<refresh_timer> timer, const std::stop_token& cancellation);

    public:
        connection_scope(connection_scope_identity identity,
            std::shared_ptr<i_transport> transport,
            std::shared_ptr<i_cbs_token_requester> token_requester,
#ifdef TETHER_BUILD_COROUTINE
            std::shared_ptr<coro::io_scheduler> scheduler,
#endif
            connection_scope_options options = {});

        ~connection_scope();

        connection_scope(const connection_scope&) = delete;
        connection_scope& operator=(const connection_scope&) = delete;

        const connection_scope_identity& get_identity() const { return identity_; }
        const connection_scope_options& get_options() const { return options_; }

        CORO_TASK(int)
        open_management_link(
            std::chrono::milliseconds timeout, std::stop_token cancellation, std::shared_ptr<i_link>& link);

        CORO_TASK(int)
        open_consumer_link(const std::string& consumer_group,
            const std::string& partition_id,
            const std::optional<event_position>& position,
            const consumer_options* options,
            std::chrono::milliseconds timeout,
            std::stop_token cancellation,
            std::shared_ptr<i_link>& link);

        void dispose();
        bool is_disposed() const { return disposed_.load(std::memory_order_acquire); }

        std::stop_token get_operation_cancellation() const { return operation_cancellation_.get_token(); }
        const link_registry& get_active_links() const { return *active_links_; }
        const fault_tolerant_connection& get_active_connection() const { return active_connection_; }

        // <endpoint>/<entity>/ConsumerGroups/<group>/Partitions/<partition>
        std::string build_consumer_address(const std::string& consumer_group, const std::string& partition_id) const;

        static link_settings build_consumer_link_settings(std::string address, const consumer_options& options);
    };
}
