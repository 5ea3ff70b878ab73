/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <algorithm>

#include <tether/tether.h>

namespace tether
{
#ifdef TETHER_BUILD_COROUTINE
    std::shared_ptr<refresh_timer> refresh_timer::create(
        std::shared_ptr<coro::io_scheduler> scheduler, std::chrono::milliseconds due_in, callback on_due)
    {
        auto timer = std::shared_ptr<refresh_timer>(new refresh_timer());
        timer->state_ = std::make_shared<timer_state>();
        timer->state_->on_due = std::move(on_due);
        timer->state_->scheduler = std::move(scheduler);
        if (timer->change(due_in) != error::OK())
            TETHER_WARNING("refresh_timer created without a schedule");
        return timer;
    }

    CORO_TASK(void)
    refresh_timer::run(std::shared_ptr<timer_state> state, uint64_t generation, std::chrono::milliseconds due_in)
    {
        // libcoro sleeps cannot be interrupted, so a superseded or disposed task notices within one slice
        constexpr auto slice = std::chrono::milliseconds(250);
        for (;;)
        {
            auto due = std::chrono::steady_clock::now() + due_in;
            for (;;)
            {
                {
                    std::scoped_lock lock(state->mutex);
                    if (state->disposed || state->generation != generation)
                        CO_RETURN;
                }
                auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(due - std::chrono::steady_clock::now());
                if (remaining <= std::chrono::milliseconds::zero())
                    break;
                CO_AWAIT state->scheduler->yield_for(std::min(remaining, slice));
            }

            auto next = CO_AWAIT state->on_due(state->stop.get_token());

            {
                std::scoped_lock lock(state->mutex);
                ++state->fire_count;
                // a change() during the callback started a newer task which now owns the schedule
                if (!next || state->disposed || state->generation != generation)
                    CO_RETURN;
            }
            due_in = *next;
        }
    }

    int refresh_timer::change(std::chrono::milliseconds due_in)
    {
        uint64_t generation = 0;
        {
            std::scoped_lock lock(state_->mutex);
            if (state_->disposed)
                return error::OBJECT_DISPOSED();
            generation = ++state_->generation;
        }

        if (!state_->scheduler->spawn(run(state_, generation, due_in)))
        {
            TETHER_ERROR("refresh_timer failed to spawn its scheduled task");
            return error::OBJECT_DISPOSED();
        }
        return error::OK();
    }

    void refresh_timer::dispose()
    {
        {
            std::scoped_lock lock(state_->mutex);
            if (state_->disposed)
                return;
            state_->disposed = true;
        }
        state_->stop.request_stop();
    }
#else
    std::shared_ptr<refresh_timer> refresh_timer::create(std::chrono::milliseconds due_in, callback on_due)
    {
        auto timer = std::shared_ptr<refresh_timer>(new refresh_timer());
        timer->state_ = std::make_shared<timer_state>();
        timer->state_->on_due = std::move(on_due);
        timer->state_->due = std::chrono::steady_clock::now() + due_in;
        timer->state_->armed = true;

        // the worker only holds the state so it can outlive a timer disposed from its own callback
        auto state = timer->state_;
        timer->worker_ = std::jthread([state](std::stop_token stop) { run(stop, state); });
        return timer;
    }

    void refresh_timer::run(std::stop_token stop, std::shared_ptr<timer_state> state)
    {
        std::unique_lock<std::mutex> lock(state->mutex);
        while (!stop.stop_requested())
        {
            if (!state->armed)
            {
                state->cv.wait(lock, stop, [&state] { return state->armed; });
                continue;
            }

            auto generation = state->generation;
            bool rescheduled = state->cv.wait_until(
                lock, stop, state->due, [&state, generation] { return state->generation != generation; });
            if (rescheduled)
                continue;
            if (stop.stop_requested())
                break;

            state->armed = false;
            lock.unlock();
            auto next = state->on_due(state->stop.get_token());
            lock.lock();

            ++state->fire_count;
            // a change() during the callback wins over the callback's own answer
            if (next && !state->armed && !stop.stop_requested())
            {
                state->due = std::chrono::steady_clock::now() + *next;
                state->armed = true;
            }
        }
    }

    int refresh_timer::change(std::chrono::milliseconds due_in)
    {
        {
            std::scoped_lock lock(state_->mutex);
            if (state_->disposed)
                return error::OBJECT_DISPOSED();
            state_->due = std::chrono::steady_clock::now() + due_in;
            state_->armed = true;
            ++state_->generation;
        }
        state_->cv.notify_all();
        return error::OK();
    }

    void refresh_timer::dispose()
    {
        {
            std::scoped_lock lock(state_->mutex);
            if (state_->disposed)
                return;
            state_->disposed = true;
        }
        state_->stop.request_stop();
        worker_.request_stop();

        if (worker_.get_id() == std::this_thread::get_id())
        {
            // disposed from inside the callback, the worker exits once the callback returns
            worker_.detach();
        }
        else if (worker_.joinable())
        {
            worker_.join();
        }
    }
#endif

    refresh_timer::~refresh_timer()
    {
        if (state_)
            dispose();
    }

    bool refresh_timer::is_disposed() const
    {
        std::scoped_lock lock(state_->mutex);
        return state_->disposed;
    }

    uint64_t refresh_timer::get_fire_count() const
    {
        std::scoped_lock lock(state_->mutex);
        return state_->fire_count;
    }
}
