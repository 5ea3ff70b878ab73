/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <stop_token>

#include <tether/internal/coroutine_support.h>

#ifdef TETHER_BUILD_COROUTINE
#include <coro/event.hpp>
#else
#include <mutex>
#include <condition_variable>
#endif

namespace tether
{
#ifdef TETHER_BUILD_COROUTINE
    class event
    {
    public:
        explicit event(bool signaled = false)
            : event_(signaled)
        {
        }

        // Signal the event: Wake all waiting coroutines
        void set() { event_.set(); }

        // Reset the event: Future calls to wait() will suspend
        void reset() { event_.reset(); }

        bool is_set() const { return event_.is_set(); }

        // Suspend until the event is set
        CORO_TASK(void) wait() const { CO_AWAIT event_; }

        // coro::event cannot be interrupted, the token is only consulted once the event fires
        CORO_TASK(bool) wait(std::stop_token cancellation) const
        {
            CO_AWAIT event_;
            CO_RETURN !cancellation.stop_requested();
        }

    private:
        coro::event event_;
    };
#else
    class event
    {
    public:
        explicit event(bool signaled = false)
            : signaled_(signaled)
        {
        }

        // Signal the event: Wake all waiting threads
        void set()
        {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                signaled_ = true;
            }
            cv_.notify_all(); // Wake everyone
        }

        // Reset the event: Future calls to wait() will block
        void reset()
        {
            std::lock_guard<std::mutex> lock(mutex_);
            signaled_ = false;
        }

        bool is_set() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return signaled_;
        }

        // Block until the event is set
        void wait() const
        {
            std::unique_lock<std::mutex> lock(mutex_);
            // The lambda handles "spurious wakeups"
            cv_.wait(lock, [this] { return signaled_; });
        }

        // Block until the event is set or the token is cancelled, returns false on cancellation
        bool wait(std::stop_token cancellation) const
        {
            std::unique_lock<std::mutex> lock(mutex_);
            return cv_.wait(lock, cancellation, [this] { return signaled_; });
        }

    private:
        mutable std::mutex mutex_;
        mutable std::condition_variable_any cv_;
        bool signaled_;
    };
#endif
}
