/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <algorithm>
#include <condition_variable>
#include <tuple>

#include <transports/mock_test/transport.h>

namespace tether::mock_test
{
    void mock_connection::on_close()
    {
        std::vector<std::weak_ptr<mock_link>> links;
        {
            std::scoped_lock lock(links_mutex_);
            links.swap(links_);
        }
        for (auto& weak_link : links)
        {
            if (auto link = weak_link.lock())
                link->close();
        }
    }

    void mock_connection::add_link(const std::shared_ptr<mock_link>& link)
    {
        {
            std::scoped_lock lock(links_mutex_);
            if (!is_closed())
            {
                links_.push_back(link);
                return;
            }
        }
        link->close();
    }

#ifdef TETHER_BUILD_COROUTINE
    mock_transport::mock_transport(std::shared_ptr<coro::io_scheduler> scheduler)
        : scheduler_(std::move(scheduler))
    {
    }
#else
    mock_transport::mock_transport() = default;
#endif

    void mock_transport::set_before_link_attach(hook handler)
    {
        std::scoped_lock lock(mutex_);
        before_link_attach_ = std::move(handler);
    }

    void mock_transport::set_before_token_request(hook handler)
    {
        std::scoped_lock lock(mutex_);
        before_token_request_ = std::move(handler);
    }

    void mock_transport::set_before_add_closed_handler(hook handler)
    {
        std::scoped_lock lock(mutex_);
        before_add_closed_handler_ = std::move(handler);
    }

    mock_transport::hook mock_transport::get_hook(const hook& source) const
    {
        std::scoped_lock lock(mutex_);
        return source;
    }

    std::vector<mock_transport::token_request> mock_transport::get_token_history() const
    {
        std::scoped_lock lock(mutex_);
        return token_history_;
    }

    std::vector<std::shared_ptr<mock_connection>> mock_transport::get_connections() const
    {
        std::scoped_lock lock(mutex_);
        return connections_;
    }

    std::vector<std::shared_ptr<mock_link>> mock_transport::get_links() const
    {
        std::scoped_lock lock(mutex_);
        return links_;
    }

    void mock_transport::clear_call_history()
    {
        std::scoped_lock lock(mutex_);
        token_history_.clear();
    }

    CORO_TASK(bool) mock_transport::delay(std::chrono::milliseconds duration, const std::stop_token& cancellation)
    {
        if (duration > std::chrono::milliseconds::zero())
        {
#ifdef TETHER_BUILD_COROUTINE
            CO_AWAIT scheduler_->yield_for(duration);
#else
            std::mutex mtx;
            std::condition_variable_any cv;
            std::unique_lock<std::mutex> lock(mtx);
            std::ignore = cv.wait_for(lock, cancellation, duration, [] { return false; });
#endif
        }
        CO_RETURN !cancellation.stop_requested();
    }

    CORO_TASK(int)
    mock_transport::open_connection(const connection_scope_identity& identity,
        std::chrono::milliseconds timeout,
        std::stop_token cancellation,
        std::shared_ptr<i_connection>& connection)
    {
        auto count = ++open_connection_count_;

        auto configured_delay = std::chrono::milliseconds(connection_delay_ms_.load(std::memory_order_acquire));
        if (!CO_AWAIT delay(std::min(configured_delay, timeout), cancellation))
            CO_RETURN error::OPERATION_CANCELLED();
        if (configured_delay > timeout)
            CO_RETURN error::TIMEOUT();

        auto err = connection_error_.load(std::memory_order_acquire);
        if (err != error::OK())
            CO_RETURN err;

        auto created = std::make_shared<mock_connection>(
            identity.get_host(), fmt::format("{}-mock-connection-{}", identity.client_identifier, count));
        {
            std::scoped_lock lock(mutex_);
            connections_.push_back(created);
        }
        connection = created;
        CO_RETURN error::OK();
    }

    CORO_TASK(int)
    mock_transport::attach_link(std::shared_ptr<i_connection> connection,
        const link_settings& settings,
        std::optional<event_position> position,
        std::chrono::milliseconds timeout,
        std::stop_token cancellation,
        std::shared_ptr<i_link>& link)
    {
        std::ignore = timeout;
        if (cancellation.stop_requested())
            CO_RETURN error::OPERATION_CANCELLED();

        auto mock = std::dynamic_pointer_cast<mock_connection>(connection);
        if (!mock || mock->is_closed())
            CO_RETURN error::LINK_ATTACH_FAILED();

        if (auto before_attach = get_hook(before_link_attach_))
            before_attach();

        auto err = link_error_.load(std::memory_order_acquire);
        if (err != error::OK())
            CO_RETURN err;

        auto created = std::make_shared<mock_link>(settings, std::move(position));
        created->set_before_add_closed_handler(get_hook(before_add_closed_handler_));
        mock->add_link(created);
        {
            std::scoped_lock lock(mutex_);
            links_.push_back(created);
        }
        link = created;
        CO_RETURN error::OK();
    }

    CORO_TASK(int)
    mock_transport::open_management_link(std::shared_ptr<i_connection> connection,
        const link_settings& settings,
        std::chrono::milliseconds timeout,
        std::stop_token cancellation,
        std::shared_ptr<i_link>& link)
    {
        ++open_management_link_count_;
        CO_RETURN CO_AWAIT attach_link(connection, settings, std::nullopt, timeout, cancellation, link);
    }

    CORO_TASK(int)
    mock_transport::open_receiving_link(std::shared_ptr<i_connection> connection,
        const link_settings& settings,
        const event_position& position,
        std::chrono::milliseconds timeout,
        std::stop_token cancellation,
        std::shared_ptr<i_link>& link)
    {
        ++open_receiving_link_count_;
        CO_RETURN CO_AWAIT attach_link(connection, settings, position, timeout, cancellation, link);
    }

    CORO_TASK(int)
    mock_transport::request_token(std::shared_ptr<i_connection> connection,
        const std::string& audience,
        const std::vector<std::string>& required_claims,
        std::chrono::milliseconds timeout,
        std::stop_token cancellation,
        cbs_token& token)
    {
        ++request_token_count_;
        {
            std::scoped_lock lock(mutex_);
            token_history_.push_back(token_request{audience,
                required_claims,
                connection ? connection->get_container_id() : std::string(),
                std::chrono::steady_clock::now()});
        }

        auto configured_delay = std::chrono::milliseconds(token_delay_ms_.load(std::memory_order_acquire));
        if (!CO_AWAIT delay(std::min(configured_delay, timeout), cancellation))
            CO_RETURN error::OPERATION_CANCELLED();
        if (configured_delay > timeout)
            CO_RETURN error::TIMEOUT();

        if (!connection || connection->is_closed())
            CO_RETURN error::AUTHORIZATION_FAILED();

        if (auto before_token = get_hook(before_token_request_))
            before_token();

        auto err = token_error_.load(std::memory_order_acquire);
        if (err != error::OK())
            CO_RETURN err;

        auto lifetime = std::chrono::milliseconds(token_lifetime_ms_.load(std::memory_order_acquire));
        token.token = fmt::format("SharedAccessSignature sr={}", audience);
        token.token_type = "servicebus.windows.net:sastoken";
        token.expires_at = std::chrono::system_clock::now() + lifetime;
        CO_RETURN error::OK();
    }
}
