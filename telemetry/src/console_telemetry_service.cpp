/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
// Standard C++ headers
#include <chrono>
#include <thread>

// tether headers
#include <tether/tether.h>
#include <tether/telemetry/console_telemetry_service.h>

// Other headers
#include <fmt/chrono.h>
#include <spdlog/async.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/sink.h>
#include <spdlog/spdlog.h>

namespace tether
{
    namespace
    {
        // amqps://host/entity/... -> host
        std::string host_of(const std::string& address)
        {
            auto start = address.find("://");
            start = start == std::string::npos ? 0 : start + 3;
            auto end = address.find_first_of("/:", start);
            return address.substr(start, end == std::string::npos ? std::string::npos : end - start);
        }
    }

    console_telemetry_service::console_telemetry_service() = default;

    console_telemetry_service::console_telemetry_service(
        const std::string& test_suite_name, const std::string& test_name, const std::filesystem::path& directory)
        : log_directory_(directory)
        , test_suite_name_(test_suite_name)
        , test_name_(test_name)
    {
    }

    console_telemetry_service::~console_telemetry_service()
    {
        if (logger_)
        {
            // Flush any pending async messages - this blocks until complete
            logger_->flush();

            auto tp = spdlog::thread_pool();

            if (!logger_name_.empty())
            {
                spdlog::drop(logger_name_);
            }

            logger_.reset();

            if (tp)
            {
                constexpr int max_wait_ms = 100;
                constexpr int check_interval_ms = 1;

                for (int waited = 0; waited < max_wait_ms; waited += check_interval_ms)
                {
                    if (tp->queue_size() == 0)
                    {
                        break;
                    }
                    std::this_thread::sleep_for(std::chrono::milliseconds(check_interval_ms));
                }
            }
        }
    }

    uint64_t console_telemetry_service::get_host_id(const std::string& host) const
    {
        {
            std::shared_lock<std::shared_mutex> lock(host_ids_mutex_);
            auto it = host_ids_.find(host);
            if (it != host_ids_.end())
                return it->second;
        }
        std::unique_lock<std::shared_mutex> lock(host_ids_mutex_);
        auto [it, inserted] = host_ids_.try_emplace(host, host_ids_.size());
        return it->second;
    }

    std::string console_telemetry_service::get_host_color(const std::string& host) const
    {
        // ANSI color codes - cycle through 8 bright colors
        static const char* colors[] = {
            "\033[91m", // Bright Red
            "\033[92m", // Bright Green
            "\033[93m", // Bright Yellow
            "\033[94m", // Bright Blue
            "\033[95m", // Bright Magenta
            "\033[96m", // Bright Cyan
            "\033[97m", // Bright White
            "\033[90m"  // Bright Black (Gray)
        };
        return colors[get_host_id(host) % 8];
    }

    std::string console_telemetry_service::get_level_color(level_enum level) const
    {
        switch (level)
        {
        case warn:
            return "\033[93m"; // Bright Yellow
        case err:
            return "\033[91m"; // Bright Red
        case critical:
            return "\033[95m"; // Bright Magenta
        default:
            return "";
        }
    }

    std::string console_telemetry_service::reset_color() const
    {
        return "\033[0m";
    }

    void console_telemetry_service::init_logger() const
    {
        if (logger_)
            return;

        if (log_directory_.empty() || test_suite_name_.empty() || test_name_.empty())
        {
            logger_ = spdlog::default_logger();
            return;
        }

        // gtest parameterised suite names contain '/'
        auto fixed_suite_name = test_suite_name_;
        for (auto& ch : fixed_suite_name)
        {
            if (ch == '/' || ch == '\\' || ch == ':' || ch == '*')
                ch = '#';
        }

        std::error_code ec;
        auto full_directory_path = log_directory_ / fixed_suite_name;
        std::filesystem::create_directories(full_directory_path, ec);
        if (ec)
        {
            logger_ = spdlog::default_logger();
            logger_->warn("Failed to create console telemetry directory '{}': {} - falling back to console-only mode",
                full_directory_path.string(),
                ec.message());
            return;
        }

        auto log_file_path = full_directory_path / (test_name_ + "_console.log");
        logger_name_ = "console_telemetry_" + std::to_string(reinterpret_cast<uintptr_t>(this));

        try
        {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file_path.string());

            console_sink->set_pattern("%v");                     // Raw pattern preserves our ANSI formatting
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] %v"); // Clean timestamped format for file

            std::vector<spdlog::sink_ptr> sinks = {console_sink, file_sink};
            logger_ = std::make_shared<spdlog::logger>(logger_name_, sinks.begin(), sinks.end());
            logger_->set_level(spdlog::level::trace);
            logger_->flush_on(spdlog::level::trace);
            spdlog::register_logger(logger_);

            spdlog::default_logger()->info("Console telemetry logging to file: {}", log_file_path.string());
        }
        catch (const spdlog::spdlog_ex& ex)
        {
            logger_name_.clear();
            logger_ = spdlog::default_logger();
            logger_->warn("Console telemetry file logging to '{}' unavailable: {}", log_file_path.string(), ex.what());
        }
    }

    bool console_telemetry_service::create(std::shared_ptr<i_telemetry_service>& service,
        const std::string& test_suite_name,
        const std::string& name,
        const std::filesystem::path& directory)
    {
        std::shared_ptr<console_telemetry_service> console_service;

        if (!directory.empty())
        {
            console_service = std::shared_ptr<console_telemetry_service>(
                new console_telemetry_service(test_suite_name, name, directory));
        }
        else
        {
            console_service = std::make_shared<console_telemetry_service>();
        }

        console_service->init_logger();
        service = console_service;
        return true;
    }

    void console_telemetry_service::on_connection_creation(const std::string& host, const std::string& container_id) const
    {
        init_logger();
        logger_->info("{}[{}] connection_creation: container_id={}{}",
            get_host_color(host),
            host,
            container_id,
            reset_color());
    }

    void console_telemetry_service::on_connection_closed(const std::string& host, const std::string& container_id) const
    {
        init_logger();
        logger_->info(
            "{}[{}] connection_closed: container_id={}{}", get_host_color(host), host, container_id, reset_color());
    }

    void console_telemetry_service::on_link_opened(
        const std::string& address, const std::string& kind, bool has_refresh_timer) const
    {
        auto host = host_of(address);
        init_logger();
        logger_->info("{}[{}] link_opened: kind={} address={} refresh={}{}",
            get_host_color(host),
            host,
            kind,
            address,
            has_refresh_timer,
            reset_color());
    }

    void console_telemetry_service::on_link_closed(const std::string& address) const
    {
        auto host = host_of(address);
        init_logger();
        logger_->info("{}[{}] link_closed: address={}{}", get_host_color(host), host, address, reset_color());
    }

    void console_telemetry_service::on_authorization_refreshed(
        const std::string& audience, std::chrono::system_clock::time_point expires_at) const
    {
        auto host = host_of(audience);
        init_logger();
        logger_->info("{}[{}] authorization_refreshed: audience={} expires_at={:%Y-%m-%d %H:%M:%S}{}",
            get_host_color(host),
            host,
            audience,
            fmt::gmtime(std::chrono::system_clock::to_time_t(expires_at)),
            reset_color());
    }

    void console_telemetry_service::on_authorization_refresh_failed(const std::string& audience, int error_code) const
    {
        init_logger();
        logger_->warn("{}[{}] authorization_refresh_failed: audience={} error={}{}",
            get_level_color(warn),
            host_of(audience),
            audience,
            error::to_string(error_code),
            reset_color());
    }

    void console_telemetry_service::message(level_enum level, const std::string& message) const
    {
        const char* level_str;
        switch (level)
        {
        case debug:
            level_str = "DEBUG";
            break;
        case trace:
            level_str = "TRACE";
            break;
        case info:
            level_str = "INFO";
            break;
        case warn:
            level_str = "WARN";
            break;
        case err:
            level_str = "ERROR";
            break;
        case critical:
            level_str = "CRITICAL";
            break;
        case off:
            return;
        default:
            level_str = "UNKNOWN";
            break;
        }

        init_logger();
        std::string level_color = get_level_color(level);
        if (!level_color.empty())
        {
            logger_->info("{}{} {}{}", level_color, level_str, message, reset_color());
        }
        else
        {
            logger_->info("{} {}", level_str, message);
        }
    }
}
