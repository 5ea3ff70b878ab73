/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <functional>
#include <memory>
#include <string>

#include <tether/internal/types.h>

namespace tether
{
    /**
     * @brief An opaque protocol object owned by the AMQP engine
     *
     * Connections and links are opened by an i_transport implementation, tether only
     * ever observes and closes them.
     *
     * Closed Notification:
     * - handlers run exactly once, on the thread that closed the object
     * - a handler added after the object has closed runs immediately
     * - close() is idempotent and may be called from any thread
     */
    class i_amqp_object
    {
    public:
        virtual ~i_amqp_object() = default;

        virtual bool is_closed() const = 0;
        virtual void close() = 0;
        virtual void add_closed_handler(std::function<void()> handler) = 0;
    };

    class i_connection : public i_amqp_object
    {
    public:
        virtual std::string get_host() const = 0;
        virtual std::string get_container_id() const = 0;
    };

    class i_link : public i_amqp_object
    {
    public:
        virtual const link_settings& get_settings() const = 0;
        virtual std::string get_address() const { return get_settings().address; }
    };
}
