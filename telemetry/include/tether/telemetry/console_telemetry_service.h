/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <filesystem>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include <spdlog/logger.h>

#include <tether/telemetry/i_telemetry_service.h>

namespace tether
{
    // Writes telemetry events to the console, and to a per test log file when a directory is given
    class console_telemetry_service : public i_telemetry_service
    {
        mutable std::shared_ptr<spdlog::logger> logger_;
        mutable std::string logger_name_;
        std::filesystem::path log_directory_;
        std::string test_suite_name_;
        std::string test_name_;

        mutable std::shared_mutex host_ids_mutex_;
        mutable std::unordered_map<std::string, uint64_t> host_ids_;

        console_telemetry_service(
            const std::string& test_suite_name, const std::string& test_name, const std::filesystem::path& directory);

        void init_logger() const;
        uint64_t get_host_id(const std::string& host) const;
        std::string get_host_color(const std::string& host) const;
        std::string get_level_color(level_enum level) const;
        std::string reset_color() const;

    public:
        console_telemetry_service();
        ~console_telemetry_service() override;

        static bool create(std::shared_ptr<i_telemetry_service>& service,
            const std::string& test_suite_name,
            const std::string& name,
            const std::filesystem::path& directory);

        void on_connection_creation(const std::string& host, const std::string& container_id) const override;
        void on_connection_closed(const std::string& host, const std::string& container_id) const override;

        void on_link_opened(const std::string& address, const std::string& kind, bool has_refresh_timer) const override;
        void on_link_closed(const std::string& address) const override;

        void on_authorization_refreshed(
            const std::string& audience, std::chrono::system_clock::time_point expires_at) const override;
        void on_authorization_refresh_failed(const std::string& audience, int error_code) const override;

        void message(level_enum level, const std::string& message) const override;
    };
}
