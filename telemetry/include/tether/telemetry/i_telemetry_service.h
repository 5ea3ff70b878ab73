/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <chrono>
#include <memory>
#include <string>

// copied from spdlog
#define I_TELEMETRY_LEVEL_DEBUG 0
#define I_TELEMETRY_LEVEL_TRACE 1
#define I_TELEMETRY_LEVEL_INFO 2
#define I_TELEMETRY_LEVEL_WARN 3
#define I_TELEMETRY_LEVEL_ERROR 4
#define I_TELEMETRY_LEVEL_CRITICAL 5
#define I_TELEMETRY_LEVEL_OFF 6

namespace tether
{
    class i_telemetry_service
    {
    public:
        enum level_enum
        {
            debug = I_TELEMETRY_LEVEL_DEBUG,
            trace = I_TELEMETRY_LEVEL_TRACE,
            info = I_TELEMETRY_LEVEL_INFO,
            warn = I_TELEMETRY_LEVEL_WARN,
            err = I_TELEMETRY_LEVEL_ERROR,
            critical = I_TELEMETRY_LEVEL_CRITICAL,
            off = I_TELEMETRY_LEVEL_OFF,
            n_levels
        };
        virtual ~i_telemetry_service() = default;

        // fault_tolerant_connection
        virtual void on_connection_creation(const std::string& host, const std::string& container_id) const = 0;
        virtual void on_connection_closed(const std::string& host, const std::string& container_id) const = 0;

        // connection_scope links
        virtual void on_link_opened(const std::string& address, const std::string& kind, bool has_refresh_timer) const
            = 0;
        virtual void on_link_closed(const std::string& address) const = 0;

        // authorization renewal
        virtual void on_authorization_refreshed(
            const std::string& audience, std::chrono::system_clock::time_point expires_at) const
            = 0;
        virtual void on_authorization_refresh_failed(const std::string& audience, int error_code) const = 0;

        virtual void message(level_enum level, const std::string& message) const = 0;
    };

    // Global telemetry service - defined in telemetry_service.cpp, installed by the host
    extern std::shared_ptr<i_telemetry_service> telemetry_service_;

    inline std::shared_ptr<i_telemetry_service> get_telemetry_service()
    {
        return telemetry_service_;
    }

    inline void set_telemetry_service(std::shared_ptr<i_telemetry_service> service)
    {
        telemetry_service_ = std::move(service);
    }
}
