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
#include <optional>
#include <stop_token>

#include <tether/internal/coroutine_support.h>

#ifdef TETHER_BUILD_COROUTINE
#include <coro/io_scheduler.hpp>
#else
#include <condition_variable>
#include <thread>
#endif

namespace tether
{
    /**
     * @brief A cancellable one-shot timer that drives authorization renewal for one link
     *
     * The callback runs when the timer falls due. Returning an interval re-arms the
     * timer, returning std::nullopt leaves it idle until change() is called. The token
     * handed to the callback fires when the timer is disposed.
     *
     * Ownership:
     * - a timer belongs to exactly one link_registry entry
     * - dispose() is idempotent and may be called from inside the callback
     *
     * Scheduling:
     * - synchronous builds run each timer on its own std::jthread
     * - coroutine builds run it as a task on the scope's io_scheduler, a change() starts a
     *   new task and any older task exits when it wakes
     */
    class refresh_timer
    {
    public:
        using callback = std::function<CORO_TASK(std::optional<std::chrono::milliseconds>)(std::stop_token cancellation)>;

    private:
        struct timer_state
        {
            std::mutex mutex;
            callback on_due;
            std::stop_source stop;
            uint64_t generation = 0;
            uint64_t fire_count = 0;
            bool disposed = false;
#ifdef TETHER_BUILD_COROUTINE
            std::shared_ptr<coro::io_scheduler> scheduler;
#else
            std::condition_variable_any cv;
            std::chrono::steady_clock::time_point due;
            bool armed = false;
#endif
        };

        std::shared_ptr<timer_state> state_;
#ifndef TETHER_BUILD_COROUTINE
        std::jthread worker_;
#endif

#ifdef TETHER_BUILD_COROUTINE
        static CORO_TASK(void) run(
            std::shared_ptr<timer_state> state, uint64_t generation, std::chrono::milliseconds due_in);
#else
        static void run(std::stop_token stop, std::shared_ptr<timer_state> state);
#endif

        refresh_timer() = default;

    public:
#ifdef TETHER_BUILD_COROUTINE
        static std::shared_ptr<refresh_timer> create(
            std::shared_ptr<coro::io_scheduler> scheduler, std::chrono::milliseconds due_in, callback on_due);
#else
        static std::shared_ptr<refresh_timer> create(std::chrono::milliseconds due_in, callback on_due);
#endif

        ~refresh_timer();

        refresh_timer(const refresh_timer&) = delete;
        refresh_timer& operator=(const refresh_timer&) = delete;

        // re-arms the timer, returns error::OBJECT_DISPOSED() once disposed
        int change(std::chrono::milliseconds due_in);

        void dispose();
        bool is_disposed() const;

        // how many times the callback has completed
        uint64_t get_fire_count() const;
    };
}
