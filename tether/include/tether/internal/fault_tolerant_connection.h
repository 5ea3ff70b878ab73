/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>

#include <tether/internal/amqp_object.h>
#include <tether/internal/coroutine_support.h>
#include <tether/internal/event.h>

namespace tether
{
    /**
     * @brief Owns the single shared connection of a connection scope
     *
     * The connection is created lazily by the first caller of get_or_create. Callers
     * arriving while a creation is in flight wait for that creation instead of starting
     * their own, and all of them see its outcome. A connection that has been closed,
     * locally or by the peer, is replaced on the next request.
     *
     * A creation runs under its creator's token and timeout. When that caller cancels or
     * runs out of time, waiters whose own token and timeout still allow it start a fresh
     * attempt. Any other failure is reported to everyone who waited on it and the next
     * call starts a fresh attempt.
     *
     * Thread Safety:
     * - mutex_ guards connection_, pending_ and closed_, it is never held across an await
     */
    class fault_tolerant_connection
    {
    public:
        using connection_factory = std::function<CORO_TASK(int)(
            std::chrono::milliseconds timeout, std::stop_token cancellation, std::shared_ptr<i_connection>& connection)>;

    private:
        struct creation_attempt
        {
            event ready;
            int error_code = 0;
            std::shared_ptr<i_connection> connection;
        };

        connection_factory factory_;

        mutable std::mutex mutex_;
        std::shared_ptr<i_connection> connection_;
        std::shared_ptr<creation_attempt> pending_;
        bool closed_ = false;

        std::atomic<uint64_t> creation_count_{0};

        CORO_TASK(int)
        create(std::shared_ptr<creation_attempt> attempt, std::chrono::milliseconds timeout, std::stop_token cancellation);

    public:
        explicit fault_tolerant_connection(connection_factory factory);
        ~fault_tolerant_connection();

        fault_tolerant_connection(const fault_tolerant_connection&) = delete;
        fault_tolerant_connection& operator=(const fault_tolerant_connection&) = delete;

        CORO_TASK(int)
        get_or_create(
            std::chrono::milliseconds timeout, std::stop_token cancellation, std::shared_ptr<i_connection>& connection);

        // the current live connection, never creates one
        std::shared_ptr<i_connection> try_get() const;

        // closes the current connection, later calls to get_or_create fail with OBJECT_DISPOSED
        void close();
        bool is_closed() const;

        uint64_t get_creation_count() const { return creation_count_.load(std::memory_order_acquire); }
    };
}
