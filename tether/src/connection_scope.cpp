/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <tether/tether.h>

namespace tether
{
    connection_scope::connection_scope(connection_scope_identity identity,
        std::shared_ptr<i_transport> transport,
        std::shared_ptr<i_cbs_token_requester> token_requester,
#ifdef TETHER_BUILD_COROUTINE
        std::shared_ptr<coro::io_scheduler> scheduler,
#endif
        connection_scope_options options)
        : identity_(std::move(identity))
        , options_(std::move(options))
        , transport_(std::move(transport))
        , token_refresher_(std::make_shared<token_refresher>(std::move(token_requester), options_.authorization_refresh))
#ifdef TETHER_BUILD_COROUTINE
        , scheduler_(std::move(scheduler))
#endif
        , active_links_(std::make_shared<link_registry>())
        , active_connection_([this](std::chrono::milliseconds timeout,
                                 std::stop_token cancellation,
                                 std::shared_ptr<i_connection>& connection) -> CORO_TASK(int)
              { CO_RETURN CO_AWAIT create_connection(timeout, cancellation, connection); })
    {
        TETHER_DEBUG("connection_scope created for {} over {}", identity_.get_entity_address(), to_string(identity_.transport));
    }

    connection_scope::~connection_scope()
    {
        dispose();
    }

    int connection_scope::check_can_operate(const std::stop_token& cancellation) const
    {
        if (is_disposed())
            return error::OBJECT_DISPOSED();
        if (cancellation.stop_requested())
            return error::OPERATION_CANCELLED();
        return error::OK();
    }

    int connection_scope::resolve_error(int err, const std::stop_token& cancellation) const
    {
        auto state = check_can_operate(cancellation);
        return state != error::OK() ? state : err;
    }

    CORO_TASK(int)
    connection_scope::create_connection(
        std::chrono::milliseconds timeout, std::stop_token cancellation, std::shared_ptr<i_connection>& connection)
    {
        if (!transport_)
        {
            TETHER_ERROR("connection_scope for {} has no transport", identity_.get_entity_address());
            CO_RETURN error::CONNECTION_FAILED();
        }

        TETHER_DEBUG("opening {} connection to {}{}",
            to_string(identity_.transport),
            identity_.endpoint,
            identity_.proxy ? fmt::format(" via proxy {}", *identity_.proxy) : std::string());

        CO_RETURN CO_AWAIT transport_->open_connection(identity_, timeout, cancellation, connection);
    }

    CORO_TASK(int)
    connection_scope::open_management_link(
        std::chrono::milliseconds timeout, std::stop_token cancellation, std::shared_ptr<i_link>& link)
    {
        int err = check_can_operate(cancellation);
        if (err != error::OK())
            CO_RETURN err;

        err = identity_.validate();
        if (err != error::OK())
            CO_RETURN err;

        timeout_budget budget(timeout);
        linked_cancellation operation(operation_cancellation_.get_token(), cancellation);

        std::shared_ptr<i_connection> connection;
        err = CO_AWAIT active_connection_.get_or_create(budget.remaining(), operation.get_token(), connection);
        if (err != error::OK())
            CO_RETURN resolve_error(err, cancellation);

        auto audience = identity_.get_entity_address();
        std::chrono::system_clock::time_point expires_at{};
        err = CO_AWAIT token_refresher_->request_authorization(
            connection, audience, options_.management_claims, budget.remaining(), operation.get_token(), expires_at);
        if (err != error::OK())
            CO_RETURN resolve_error(err, cancellation);

        if (budget.expired())
            CO_RETURN resolve_error(error::TIMEOUT(), cancellation);

        link_settings settings{.kind = link_kind::management, .address = management_address};

        std::shared_ptr<i_link> opened;
        err = CO_AWAIT transport_->open_management_link(
            connection, settings, budget.remaining(), operation.get_token(), opened);
        if (err == error::OK() && !opened)
            err = error::LINK_ATTACH_FAILED();
        if (err != error::OK())
        {
            TETHER_ERROR("management link for {} failed to attach {}", audience, error::to_string(err));
            CO_RETURN resolve_error(err, cancellation);
        }

        std::shared_ptr<refresh_timer> timer;
        if (options_.refresh_management_authorization)
            timer = create_refresh_timer(connection, opened, audience, options_.management_claims, expires_at);

        err = track_link(opened, timer, cancellation);
        if (err != error::OK())
            CO_RETURN err;

        link = opened;
        CO_RETURN error::OK();
    }

    CORO_TASK(int)
    connection_scope::open_consumer_link(const std::string& consumer_group,
        const std::string& partition_id,
        const std::optional<event_position>& position,
        const consumer_options* options,
        std::chrono::milliseconds timeout,
        std::stop_token cancellation,
        std::shared_ptr<i_link>& link)
    {
        if (consumer_group.empty())
        {
            TETHER_ERROR("open_consumer_link requires a consumer group");
            CO_RETURN error::INVALID_ARGUMENT();
        }
        if (partition_id.empty())
        {
            TETHER_ERROR("open_consumer_link requires a partition id");
            CO_RETURN error::INVALID_ARGUMENT();
        }
        if (!position)
        {
            TETHER_ERROR("open_consumer_link requires an event position");
            CO_RETURN error::INVALID_ARGUMENT();
        }
        if (!options)
        {
            TETHER_ERROR("open_consumer_link requires consumer options");
            CO_RETURN error::INVALID_ARGUMENT();
        }

        int err = check_can_operate(cancellation);
        if (err != error::OK())
            CO_RETURN err;

        err = identity_.validate();
        if (err != error::OK())
            CO_RETURN err;

        // copied before the first suspension, the caller's objects are not ours to keep
        const event_position start_position = *position;
        auto address = build_consumer_address(consumer_group, partition_id);
        auto settings = build_consumer_link_settings(address, *options);
        std::vector<std::string> required_claims = {claims::listen};

        timeout_budget budget(timeout);
        linked_cancellation operation(operation_cancellation_.get_token(), cancellation);

        std::shared_ptr<i_connection> connection;
        err = CO_AWAIT active_connection_.get_or_create(budget.remaining(), operation.get_token(), connection);
        if (err != error::OK())
            CO_RETURN resolve_error(err, cancellation);

        std::chrono::system_clock::time_point expires_at{};
        err = CO_AWAIT token_refresher_->request_authorization(
            connection, address, required_claims, budget.remaining(), operation.get_token(), expires_at);
        if (err != error::OK())
            CO_RETURN resolve_error(err, cancellation);

        if (budget.expired())
            CO_RETURN resolve_error(error::TIMEOUT(), cancellation);

        std::shared_ptr<i_link> opened;
        err = CO_AWAIT transport_->open_receiving_link(
            connection, settings, start_position, budget.remaining(), operation.get_token(), opened);
        if (err == error::OK() && !opened)
            err = error::LINK_ATTACH_FAILED();
        if (err != error::OK())
        {
            TETHER_ERROR("consumer link {} failed to attach {}", address, error::to_string(err));
            CO_RETURN resolve_error(err, cancellation);
        }

        auto timer = create_refresh_timer(connection, opened, address, required_claims, expires_at);

        err = track_link(opened, timer, cancellation);
        if (err != error::OK())
            CO_RETURN err;

        link = opened;
        CO_RETURN error::OK();
    }

    std::shared_ptr<refresh_timer> connection_scope::create_refresh_timer(std::shared_ptr<i_connection> connection,
        std::shared_ptr<i_link> link,
        std::string audience,
        std::vector<std::string> required_claims,
        std::chrono::system_clock::time_point expires_at)
    {
        auto refresher = token_refresher_;
        std::weak_ptr<i_connection> weak_connection = connection;
        std::weak_ptr<i_link> weak_link = link;
        auto scope_cancellation = operation_cancellation_.get_token();
        auto timeout = options_.default_timeout;

        auto on_due = [refresher, weak_connection, weak_link, audience, required_claims, timeout, scope_cancellation](
                          std::stop_token timer_cancellation) -> CORO_TASK(std::optional<std::chrono::milliseconds>)
        {
            auto link = weak_link.lock();
            auto connection = weak_connection.lock();
            if (!link || link->is_closed() || !connection || connection->is_closed())
            {
                TETHER_DEBUG("authorization refresh for {} skipped, the link or connection is closed", audience);
                CO_RETURN std::nullopt;
            }

            linked_cancellation cancellation(scope_cancellation, timer_cancellation);
            std::chrono::system_clock::time_point refreshed_expiry{};
            int err = CO_AWAIT refresher->request_authorization(
                connection, audience, required_claims, timeout, cancellation.get_token(), refreshed_expiry);
            if (err != error::OK())
            {
                // the link stays open, the broker rejects it if the old token lapses
                TETHER_WARNING("authorization refresh for {} failed {}", audience, error::to_string(err));
#ifdef TETHER_USE_TELEMETRY
                if (auto telemetry_service = tether::get_telemetry_service(); telemetry_service)
                    telemetry_service->on_authorization_refresh_failed(audience, err);
#endif
                CO_RETURN std::nullopt;
            }

#ifdef TETHER_USE_TELEMETRY
            if (auto telemetry_service = tether::get_telemetry_service(); telemetry_service)
                telemetry_service->on_authorization_refreshed(audience, refreshed_expiry);
#endif
            auto next = refresher->calculate_refresh_interval(refreshed_expiry);
            TETHER_DEBUG("authorization for {} refreshed, next refresh in {}ms", audience, next.count());
            CO_RETURN next;
        };

        auto interval = token_refresher_->calculate_refresh_interval(expires_at);
        TETHER_DEBUG("authorization for {} refreshes in {}ms", audience, interval.count());
#ifdef TETHER_BUILD_COROUTINE
        return refresh_timer::create(scheduler_, interval, std::move(on_due));
#else
        return refresh_timer::create(interval, std::move(on_due));
#endif
    }

    int connection_scope::track_link(
        std::shared_ptr<i_link> link, std::shared_ptr<refresh_timer> timer, const std::stop_token& cancellation)
    {
        // a cancellation or disposal that raced the attach must not leave a link behind
        int err = check_can_operate(cancellation);
        if (err == error::OK())
            err = active_links_->try_add(link, timer);
        if (err != error::OK())
        {
            if (timer)
                timer->dispose();
            // a duplicate is already tracked and still owned by its first registration
            if (err != error::DUPLICATE_LINK())
                link->close();
            return resolve_error(err, cancellation);
        }

        std::weak_ptr<link_registry> registry = active_links_;
        const i_link* key = link.get();
        auto address = link->get_address();
        link->add_closed_handler(
            [registry, key, address]()
            {
                auto links = registry.lock();
                if (!links)
                    return;

                link_registry::entry removed;
                if (!links->try_remove(key, removed))
                    return;
                if (removed.timer)
                    removed.timer->dispose();

                TETHER_DEBUG("link {} closed and is no longer tracked", address);
#ifdef TETHER_USE_TELEMETRY
                if (auto telemetry_service = tether::get_telemetry_service(); telemetry_service)
                    telemetry_service->on_link_closed(address);
#endif
            });

        // a disposal or close that landed before the handler was installed has already untracked the link
        err = check_can_operate(cancellation);
        if (err == error::OK() && !active_links_->contains(key))
            err = error::LINK_ATTACH_FAILED();
        if (err != error::OK())
        {
            link->close();
            return resolve_error(err, cancellation);
        }

        TETHER_INFO("{} link {} opened{}",
            to_string(link->get_settings().kind),
            address,
            timer ? " with authorization refresh" : "");
#ifdef TETHER_USE_TELEMETRY
        if (auto telemetry_service = tether::get_telemetry_service(); telemetry_service)
            telemetry_service->on_link_opened(address, to_string(link->get_settings().kind), timer != nullptr);
#endif
        return error::OK();
    }

    void connection_scope::dispose()
    {
        bool expected = false;
        if (!disposed_.compare_exchange_strong(expected, true, std::memory_order_acq_rel))
            return;

        TETHER_DEBUG("disposing connection_scope for {}", identity_.get_entity_address());
        operation_cancellation_.request_stop();

        auto entries = active_links_->close();
        for (auto& entry : entries)
        {
            if (entry.timer)
                entry.timer->dispose();
            if (entry.link)
            {
                entry.link->close();
#ifdef TETHER_USE_TELEMETRY
                if (auto telemetry_service = tether::get_telemetry_service(); telemetry_service)
                    telemetry_service->on_link_closed(entry.link->get_address());
#endif
            }
        }

        active_connection_.close();
    }

    std::string connection_scope::build_consumer_address(
        const std::string& consumer_group, const std::string& partition_id) const
    {
        return fmt::format("{}/ConsumerGroups/{}/Partitions/{}", identity_.get_entity_address(), consumer_group, partition_id);
    }

    link_settings connection_scope::build_consumer_link_settings(std::string address, const consumer_options& options)
    {
        link_settings settings{
            .kind = link_kind::receiver, .address = std::move(address), .total_link_credit = options.prefetch_count};

        settings.properties[amqp_property::entity_type] = static_cast<int64_t>(messaging_entity_type::consumer_group);
        if (!options.identifier.empty())
            settings.properties[amqp_property::consumer_identifier] = options.identifier;
        if (options.owner_level)
            settings.properties[amqp_property::owner_level] = *options.owner_level;
        if (options.track_last_enqueued_event_information)
            settings.desired_capabilities.emplace_back(amqp_property::track_last_enqueued_event_information);

        return settings;
    }
}
