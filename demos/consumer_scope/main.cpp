/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

/*
 *   Consumer Scope Demo
 *   Walks a connection scope through its lifecycle over the in-memory mock transport
 *
 *   - a management link and a consumer link share one lazily created connection
 *   - the consumer link's authorization is renewed by its refresh timer
 *   - the broker dropping the connection untracks its links, the next request reconnects
 *   - dispose closes everything
 *
 *   To build and run:
 *   1. cmake -S . -B build -DTETHER_BUILD_DEMOS=ON
 *   2. cmake --build build --target consumer_scope_demo
 *   3. ./build/demos/consumer_scope_demo
 */

#include <chrono>
#include <thread>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <tether/tether.h>
#include <transports/mock_test/transport.h>
#ifdef TETHER_USE_TELEMETRY
#include <tether/telemetry/console_telemetry_service.h>
#endif

using namespace std::chrono_literals;

namespace demo
{
    CORO_TASK(bool)
    run_consumer_scope_demo(
#ifdef TETHER_BUILD_COROUTINE
        std::shared_ptr<coro::io_scheduler> scheduler
#endif
    )
    {
#ifdef TETHER_BUILD_COROUTINE
        auto transport = std::make_shared<tether::mock_test::mock_transport>(scheduler);
#else
        auto transport = std::make_shared<tether::mock_test::mock_transport>();
#endif
        // short lived tokens so renewal is visible
        transport->set_token_lifetime(10min);

        tether::connection_scope_identity identity;
        identity.endpoint = "amqps://demo-namespace.servicebus.windows.net";
        identity.entity_name = "telemetry";
        identity.transport = tether::transport_kind::amqp_tcp;
        identity.client_identifier = "consumer-scope-demo";

        tether::connection_scope scope(identity,
            transport,
            transport,
#ifdef TETHER_BUILD_COROUTINE
            scheduler,
#endif
            {});

        std::shared_ptr<tether::i_link> management;
        auto err = CO_AWAIT scope.open_management_link(1min, {}, management);
        if (err != tether::error::OK())
        {
            spdlog::error("open_management_link failed {}", tether::error::to_string(err));
            CO_RETURN false;
        }

        tether::consumer_options options;
        options.prefetch_count = 500;
        options.identifier = "demo-reader";
        options.track_last_enqueued_event_information = true;

        std::shared_ptr<tether::i_link> consumer;
        err = CO_AWAIT scope.open_consumer_link(
            "$Default", "0", tether::event_position::earliest(), &options, 1min, {}, consumer);
        if (err != tether::error::OK())
        {
            spdlog::error("open_consumer_link failed {}", tether::error::to_string(err));
            CO_RETURN false;
        }
        spdlog::info("{} links open over {} connection(s)",
            scope.get_active_links().size(),
            transport->get_open_connection_count());

        std::shared_ptr<tether::refresh_timer> timer;
        if (scope.get_active_links().try_get_timer(consumer.get(), timer) && timer)
        {
            // renew now rather than in eight and a half minutes
            if (timer->change(0ms) != tether::error::OK())
                CO_RETURN false;
            while (timer->get_fire_count() == 0)
            {
#ifdef TETHER_BUILD_COROUTINE
                CO_AWAIT scheduler->yield_for(1ms);
#else
                std::this_thread::sleep_for(1ms);
#endif
            }
            spdlog::info("authorization renewed, {} token requests so far", transport->get_request_token_count());
        }

        for (auto& connection : transport->get_connections())
            connection->simulate_peer_close();
        spdlog::info("connection dropped, {} links still tracked", scope.get_active_links().size());

        err = CO_AWAIT scope.open_consumer_link(
            "$Default", "1", tether::event_position::latest(), &options, 1min, {}, consumer);
        if (err != tether::error::OK())
        {
            spdlog::error("reopening failed {}", tether::error::to_string(err));
            CO_RETURN false;
        }
        spdlog::info("reconnected, {} connection(s) created in total", scope.get_active_connection().get_creation_count());

        scope.dispose();
        spdlog::info("disposed, consumer link closed={}", consumer->is_closed());
        CO_RETURN true;
    }

#ifdef TETHER_BUILD_COROUTINE
    CORO_TASK(void)
    demo_task(std::shared_ptr<coro::io_scheduler> scheduler, bool* result_flag, bool* completed_flag)
    {
        *result_flag = CO_AWAIT run_consumer_scope_demo(scheduler);
        *completed_flag = true;
        CO_RETURN;
    }
#endif
}

extern "C"
{
    void tether_log(int level, const char* str, size_t sz)
    {
        std::string message(str, sz);
        switch (level)
        {
        case 0:
            spdlog::debug(message);
            break;
        case 1:
            spdlog::trace(message);
            break;
        case 2:
            spdlog::info(message);
            break;
        case 3:
            spdlog::warn(message);
            break;
        case 4:
            spdlog::error(message);
            break;
        default:
            spdlog::critical(message);
            break;
        }
    }
}

int main()
{
    spdlog::set_level(spdlog::level::debug);
    spdlog::info("tether consumer scope demo");

#ifdef TETHER_USE_TELEMETRY
    std::shared_ptr<tether::i_telemetry_service> telemetry;
    tether::console_telemetry_service::create(telemetry, "", "", {});
    tether::set_telemetry_service(telemetry);
#endif

#ifdef TETHER_BUILD_COROUTINE
    auto scheduler = coro::io_scheduler::make_shared(
        coro::io_scheduler::options{.thread_strategy = coro::io_scheduler::thread_strategy_t::manual,
            .pool = coro::thread_pool::options{
                .thread_count = 1,
            }});

    bool result = false;
    bool completed = false;
    if (!scheduler->spawn(demo::demo_task(scheduler, &result, &completed)))
        return 1;

    while (!completed)
    {
        scheduler->process_events(std::chrono::milliseconds(1));
    }
#else
    bool result = demo::run_consumer_scope_demo();
#endif

#ifdef TETHER_USE_TELEMETRY
    tether::set_telemetry_service(nullptr);
#endif
    return result ? 0 : 1;
}
