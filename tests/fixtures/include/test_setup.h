/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <thread>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <tether/tether.h>
#include <transports/mock_test/transport.h>

#ifdef TETHER_BUILD_COROUTINE
#include <coro/io_scheduler.hpp>
#endif

#ifdef TETHER_USE_TELEMETRY
#include <tether/telemetry/console_telemetry_service.h>
#include <tether/telemetry/i_telemetry_service.h>

class mock_telemetry_service : public tether::i_telemetry_service
{
public:
    MOCK_METHOD(void, on_connection_creation, (const std::string&, const std::string&), (const, override));
    MOCK_METHOD(void, on_connection_closed, (const std::string&, const std::string&), (const, override));
    MOCK_METHOD(void, on_link_opened, (const std::string&, const std::string&, bool), (const, override));
    MOCK_METHOD(void, on_link_closed, (const std::string&), (const, override));
    MOCK_METHOD(void,
        on_authorization_refreshed,
        (const std::string&, std::chrono::system_clock::time_point),
        (const, override));
    MOCK_METHOD(void, on_authorization_refresh_failed, (const std::string&, int), (const, override));
    MOCK_METHOD(void, message, (level_enum, const std::string&), (const, override));
};
#endif

#ifdef TETHER_USE_TELEMETRY
// console telemetry for the running test, also written to <directory>/<suite>/<test>_console.log
inline std::shared_ptr<tether::i_telemetry_service> make_test_console_telemetry(const std::filesystem::path& directory)
{
    auto test_info = ::testing::UnitTest::GetInstance()->current_test_info();
    if (!test_info)
        return nullptr;

    std::shared_ptr<tether::i_telemetry_service> service;
    if (!tether::console_telemetry_service::create(service, test_info->test_suite_name(), test_info->name(), directory))
        return nullptr;
    return service;
}
#endif

// Generic fixture used to instantiate tests for multiple setups
template<class T> class type_test : public testing::Test
{
    T lib_;

public:
    T& get_lib() { return lib_; }
    const T& get_lib() const { return lib_; }

    void SetUp() override { this->lib_.set_up(); }
    void TearDown() override { this->lib_.tear_down(); }
};

// A connection scope over the mock transport, for either transport kind
template<tether::transport_kind Kind> class connection_scope_setup
{
#ifdef TETHER_BUILD_COROUTINE
    std::shared_ptr<coro::io_scheduler> io_scheduler_;
#endif
    std::shared_ptr<tether::mock_test::mock_transport> transport_;
    std::shared_ptr<tether::connection_scope> scope_;
#ifdef TETHER_USE_TELEMETRY
    std::shared_ptr<testing::NiceMock<mock_telemetry_service>> telemetry_;
#endif

    bool error_has_occurred_ = false;

public:
    static constexpr const char* endpoint = "amqps://tether-test.servicebus.windows.net";
    static constexpr const char* entity_name = "hub";

#ifdef TETHER_BUILD_COROUTINE
    std::shared_ptr<coro::io_scheduler> get_scheduler() const { return io_scheduler_; }
#endif
    bool error_has_occurred() const { return error_has_occurred_; }
    std::shared_ptr<tether::mock_test::mock_transport> get_transport() const { return transport_; }
    std::shared_ptr<tether::connection_scope> get_scope() const { return scope_; }
#ifdef TETHER_USE_TELEMETRY
    testing::NiceMock<mock_telemetry_service>& get_telemetry() const { return *telemetry_; }
#endif

    tether::connection_scope_identity make_identity() const
    {
        tether::connection_scope_identity identity;
        identity.endpoint = endpoint;
        identity.entity_name = entity_name;
        identity.transport = Kind;
        if (Kind == tether::transport_kind::amqp_web_sockets)
            identity.proxy = "http://proxy.local:8080";
        identity.client_identifier = "tether-tests";
        return identity;
    }

    std::shared_ptr<tether::connection_scope> make_scope(
        tether::connection_scope_identity identity, tether::connection_scope_options options = {}) const
    {
#ifdef TETHER_BUILD_COROUTINE
        return std::make_shared<tether::connection_scope>(
            std::move(identity), transport_, transport_, io_scheduler_, std::move(options));
#else
        return std::make_shared<tether::connection_scope>(std::move(identity), transport_, transport_, std::move(options));
#endif
    }

    // replaces the fixture's scope, the old one is disposed
    void reset_scope(tether::connection_scope_options options)
    {
        if (scope_)
            scope_->dispose();
        scope_ = make_scope(make_identity(), std::move(options));
    }

    CORO_TASK(void) check_for_error(CORO_TASK(bool) task)
    {
        auto ret = CO_AWAIT task;
        if (!ret)
        {
            error_has_occurred_ = true;
        }
        CO_RETURN;
    }

    // polls a condition that another thread or task will make true
    CORO_TASK(bool)
    wait_until(std::function<bool()> condition, std::chrono::milliseconds timeout = std::chrono::seconds(5))
    {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!condition())
        {
            if (std::chrono::steady_clock::now() > deadline)
                CO_RETURN false;
#ifdef TETHER_BUILD_COROUTINE
            CO_AWAIT io_scheduler_->yield_for(std::chrono::milliseconds(1));
#else
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
#endif
        }
        CO_RETURN true;
    }

    virtual void set_up()
    {
#ifdef TETHER_BUILD_COROUTINE
        io_scheduler_ = coro::io_scheduler::make_shared(
            coro::io_scheduler::options{.thread_strategy = coro::io_scheduler::thread_strategy_t::manual,
                .pool = coro::thread_pool::options{
                    .thread_count = 1,
                }});
        transport_ = std::make_shared<tether::mock_test::mock_transport>(io_scheduler_);
#else
        transport_ = std::make_shared<tether::mock_test::mock_transport>();
#endif
#ifdef TETHER_USE_TELEMETRY
        telemetry_ = std::make_shared<testing::NiceMock<mock_telemetry_service>>();
        tether::set_telemetry_service(telemetry_);
#endif
        scope_ = make_scope(make_identity());
    }

    virtual void tear_down()
    {
        if (scope_)
            scope_->dispose();
        scope_.reset();
#ifdef TETHER_BUILD_COROUTINE
        while (io_scheduler_->process_events(std::chrono::milliseconds(1)) > 0)
        {
        }
#endif
        transport_.reset();
#ifdef TETHER_USE_TELEMETRY
        tether::set_telemetry_service(nullptr);
        telemetry_.reset();
#endif
    }

    virtual ~connection_scope_setup() = default;
};

using tcp_scope_setup = connection_scope_setup<tether::transport_kind::amqp_tcp>;
using web_sockets_scope_setup = connection_scope_setup<tether::transport_kind::amqp_web_sockets>;

// Runs a CORO_TASK(bool) test body to completion, pumping the scheduler in coroutine builds
template<typename TestFixture, typename CoroFunc, typename... Args>
void run_coro_test(TestFixture& test_fixture, CoroFunc&& coro_function, Args&&... args)
{
    auto& lib = test_fixture.get_lib();
#ifdef TETHER_BUILD_COROUTINE
    bool is_ready = false;
    auto wrapper_function = [&]() -> CORO_TASK(bool)
    {
        auto result = CO_AWAIT coro_function(lib, std::forward<Args>(args)...);
        is_ready = true;
        CO_RETURN result;
    };

    ASSERT_TRUE(lib.get_scheduler()->spawn(lib.check_for_error(wrapper_function())));

    while (!is_ready)
    {
        lib.get_scheduler()->process_events(std::chrono::milliseconds(1));
    }
#else
    lib.check_for_error(coro_function(lib, std::forward<Args>(args)...));
#endif
    ASSERT_EQ(lib.error_has_occurred(), false);
}
