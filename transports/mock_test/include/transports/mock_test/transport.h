/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <tether/tether.h>

namespace tether::mock_test
{
    // Closed-notification bookkeeping shared by the mock connection and link
    template<class Interface> class mock_amqp_object : public Interface
    {
        mutable std::mutex mutex_;
        bool closed_ = false;
        std::vector<std::function<void()>> closed_handlers_;

    protected:
        // runs once, before the closed handlers
        virtual void on_close() { }

    public:
        bool is_closed() const override
        {
            std::scoped_lock lock(mutex_);
            return closed_;
        }

        void close() override
        {
            std::vector<std::function<void()>> handlers;
            {
                std::scoped_lock lock(mutex_);
                if (closed_)
                    return;
                closed_ = true;
                handlers.swap(closed_handlers_);
            }
            on_close();
            for (auto& handler : handlers)
                handler();
        }

        void add_closed_handler(std::function<void()> handler) override
        {
            {
                std::scoped_lock lock(mutex_);
                if (!closed_)
                {
                    closed_handlers_.push_back(std::move(handler));
                    return;
                }
            }
            handler();
        }
    };

    class mock_link : public mock_amqp_object<i_link>
    {
        link_settings settings_;
        std::optional<event_position> position_;
        std::function<void()> before_add_closed_handler_;

    public:
        mock_link(link_settings settings, std::optional<event_position> position)
            : settings_(std::move(settings))
            , position_(std::move(position))
        {
        }

        const link_settings& get_settings() const override { return settings_; }
        const std::optional<event_position>& get_position() const { return position_; }

        void set_before_add_closed_handler(std::function<void()> hook) { before_add_closed_handler_ = std::move(hook); }

        void add_closed_handler(std::function<void()> handler) override
        {
            if (before_add_closed_handler_)
                before_add_closed_handler_();
            mock_amqp_object<i_link>::add_closed_handler(std::move(handler));
        }

        // the broker detached the link
        void simulate_peer_close() { close(); }
    };

    class mock_connection : public mock_amqp_object<i_connection>
    {
        std::string host_;
        std::string container_id_;

        std::mutex links_mutex_;
        std::vector<std::weak_ptr<mock_link>> links_;

    protected:
        // closing a connection ends every link on it
        void on_close() override;

    public:
        mock_connection(std::string host, std::string container_id)
            : host_(std::move(host))
            , container_id_(std::move(container_id))
        {
        }

        std::string get_host() const override { return host_; }
        std::string get_container_id() const override { return container_id_; }

        void add_link(const std::shared_ptr<mock_link>& link);

        // the broker dropped the connection
        void simulate_peer_close() { close(); }
    };

    // In memory protocol engine for testing connection scopes
    // Allows simulation of connection, attach and authorization failures and tracks every call
    class mock_transport : public i_transport, public i_cbs_token_requester
    {
    public:
        struct token_request
        {
            std::string audience;
            std::vector<std::string> claims;
            std::string container_id;
            std::chrono::steady_clock::time_point timestamp;
        };

        using hook = std::function<void()>;

    private:
#ifdef TETHER_BUILD_COROUTINE
        std::shared_ptr<coro::io_scheduler> scheduler_;
#endif
        std::atomic<int> connection_error_{0};
        std::atomic<int> link_error_{0};
        std::atomic<int> token_error_{0};
        std::atomic<int64_t> token_lifetime_ms_{std::chrono::milliseconds(std::chrono::hours(1)).count()};
        std::atomic<int64_t> connection_delay_ms_{0};
        std::atomic<int64_t> token_delay_ms_{0};

        std::atomic<uint64_t> open_connection_count_{0};
        std::atomic<uint64_t> open_management_link_count_{0};
        std::atomic<uint64_t> open_receiving_link_count_{0};
        std::atomic<uint64_t> request_token_count_{0};

        mutable std::mutex mutex_;
        std::vector<token_request> token_history_;
        std::vector<std::shared_ptr<mock_connection>> connections_;
        std::vector<std::shared_ptr<mock_link>> links_;
        hook before_link_attach_;
        hook before_token_request_;
        hook before_add_closed_handler_;

        CORO_TASK(bool) delay(std::chrono::milliseconds duration, const std::stop_token& cancellation);

        CORO_TASK(int)
        attach_link(std::shared_ptr<i_connection> connection,
            const link_settings& settings,
            std::optional<event_position> position,
            std::chrono::milliseconds timeout,
            std::stop_token cancellation,
            std::shared_ptr<i_link>& link);

        hook get_hook(const hook& source) const;

    public:
#ifdef TETHER_BUILD_COROUTINE
        explicit mock_transport(std::shared_ptr<coro::io_scheduler> scheduler);
#else
        mock_transport();
#endif
        virtual ~mock_transport() = default;

        // Control methods for testing, error::OK() clears a forced failure
        void set_connection_failure(int error_code) { connection_error_.store(error_code, std::memory_order_release); }
        void set_link_failure(int error_code) { link_error_.store(error_code, std::memory_order_release); }
        void set_token_failure(int error_code) { token_error_.store(error_code, std::memory_order_release); }
        void set_token_lifetime(std::chrono::milliseconds lifetime)
        {
            token_lifetime_ms_.store(lifetime.count(), std::memory_order_release);
        }
        void set_connection_delay(std::chrono::milliseconds delay)
        {
            connection_delay_ms_.store(delay.count(), std::memory_order_release);
        }
        void set_token_delay(std::chrono::milliseconds delay)
        {
            token_delay_ms_.store(delay.count(), std::memory_order_release);
        }

        // called on the attaching thread just before a link would be attached
        void set_before_link_attach(hook handler);
        // called on the requesting thread just before a token is issued
        void set_before_token_request(hook handler);
        // installed on each new link, called when its owner subscribes to its closure
        void set_before_add_closed_handler(hook handler);

        uint64_t get_open_connection_count() const { return open_connection_count_.load(std::memory_order_acquire); }
        uint64_t get_open_management_link_count() const
        {
            return open_management_link_count_.load(std::memory_order_acquire);
        }
        uint64_t get_open_receiving_link_count() const
        {
            return open_receiving_link_count_.load(std::memory_order_acquire);
        }
        uint64_t get_request_token_count() const { return request_token_count_.load(std::memory_order_acquire); }

        std::vector<token_request> get_token_history() const;
        std::vector<std::shared_ptr<mock_connection>> get_connections() const;
        std::vector<std::shared_ptr<mock_link>> get_links() const;
        void clear_call_history();

        CORO_TASK(int)
        open_connection(const connection_scope_identity& identity,
            std::chrono::milliseconds timeout,
            std::stop_token cancellation,
            std::shared_ptr<i_connection>& connection) override;

        CORO_TASK(int)
        open_management_link(std::shared_ptr<i_connection> connection,
            const link_settings& settings,
            std::chrono::milliseconds timeout,
            std::stop_token cancellation,
            std::shared_ptr<i_link>& link) override;

        CORO_TASK(int)
        open_receiving_link(std::shared_ptr<i_connection> connection,
            const link_settings& settings,
            const event_position& position,
            std::chrono::milliseconds timeout,
            std::stop_token cancellation,
            std::shared_ptr<i_link>& link) override;

        CORO_TASK(int)
        request_token(std::shared_ptr<i_connection> connection,
            const std::string& audience,
            const std::vector<std::string>& required_claims,
            std::chrono::milliseconds timeout,
            std::stop_token cancellation,
            cbs_token& token) override;
    };
}
