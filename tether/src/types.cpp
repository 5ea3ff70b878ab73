/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <algorithm>
#include <array>
#include <string_view>

#include <tether/tether.h>

namespace tether
{
    namespace
    {
        constexpr std::array<std::string_view, 3> supported_schemes = {"amqp://", "amqps://", "sb://"};

        std::string_view strip_scheme(std::string_view endpoint)
        {
            for (auto scheme : supported_schemes)
            {
                if (endpoint.size() > scheme.size() && endpoint.substr(0, scheme.size()) == scheme)
                    return endpoint.substr(scheme.size());
            }
            return {};
        }

        std::string_view trim_trailing_slashes(std::string_view value)
        {
            while (!value.empty() && value.back() == '/')
                value.remove_suffix(1);
            return value;
        }
    }

    const char* to_string(transport_kind kind)
    {
        switch (kind)
        {
        case transport_kind::amqp_tcp:
            return "amqp_tcp";
        case transport_kind::amqp_web_sockets:
            return "amqp_web_sockets";
        }
        return "unknown";
    }

    const char* to_string(link_kind kind)
    {
        switch (kind)
        {
        case link_kind::management:
            return "management";
        case link_kind::receiver:
            return "receiver";
        }
        return "unknown";
    }

    int connection_scope_identity::validate() const
    {
        if (endpoint.empty())
        {
            TETHER_ERROR("connection scope endpoint is empty");
            return error::INVALID_ARGUMENT();
        }
        if (get_host().empty())
        {
            TETHER_ERROR("connection scope endpoint '{}' is not an amqp, amqps or sb address", endpoint);
            return error::INVALID_ARGUMENT();
        }
        if (entity_name.empty())
        {
            TETHER_ERROR("connection scope entity name is empty");
            return error::INVALID_ARGUMENT();
        }
        if (transport != transport_kind::amqp_tcp && transport != transport_kind::amqp_web_sockets)
        {
            TETHER_ERROR("connection scope transport {} is not supported", static_cast<int>(transport));
            return error::INVALID_ARGUMENT();
        }
        return error::OK();
    }

    std::string connection_scope_identity::get_host() const
    {
        auto remainder = strip_scheme(endpoint);
        auto end = std::find_if(remainder.begin(), remainder.end(), [](char ch) { return ch == '/' || ch == ':'; });
        return std::string(remainder.begin(), end);
    }

    std::string connection_scope_identity::get_entity_address() const
    {
        return fmt::format("{}/{}", trim_trailing_slashes(endpoint), entity_name);
    }

    event_position event_position::earliest()
    {
        return event_position{.position_kind = kind::earliest, .is_inclusive = false};
    }

    event_position event_position::latest()
    {
        return event_position{.position_kind = kind::latest, .is_inclusive = false};
    }

    event_position event_position::from_offset(int64_t offset, bool is_inclusive)
    {
        return event_position{.position_kind = kind::offset, .offset = offset, .is_inclusive = is_inclusive};
    }

    event_position event_position::from_sequence_number(int64_t sequence_number, bool is_inclusive)
    {
        return event_position{
            .position_kind = kind::sequence_number, .sequence_number = sequence_number, .is_inclusive = is_inclusive};
    }

    event_position event_position::from_enqueued_time(std::chrono::system_clock::time_point enqueued_time)
    {
        return event_position{.position_kind = kind::enqueued_time, .enqueued_time = enqueued_time};
    }

    bool link_settings::has_desired_capability(const std::string& capability) const
    {
        return std::find(desired_capabilities.begin(), desired_capabilities.end(), capability)
               != desired_capabilities.end();
    }
}
