/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tether
{
    enum class transport_kind
    {
        amqp_tcp,
        amqp_web_sockets
    };

    const char* to_string(transport_kind kind);

    // The identity of a connection scope, fixed at construction
    struct connection_scope_identity
    {
        std::string endpoint;    // e.g. amqps://my-namespace.servicebus.windows.net
        std::string entity_name; // the event hub
        transport_kind transport = transport_kind::amqp_tcp;
        std::optional<std::string> proxy; // only meaningful for web sockets
        std::string client_identifier;

        // returns error::INVALID_ARGUMENT() for an unusable identity
        int validate() const;

        // <endpoint>/<entity>, the audience used for CBS authorization
        std::string get_entity_address() const;

        std::string get_host() const;
    };

    enum class messaging_entity_type : int32_t
    {
        queue = 0,
        topic = 1,
        subscriber = 2,
        filter = 3,
        name_space = 4,
        volatile_topic = 5,
        volatile_topic_subscription = 6,
        event_hub = 7,
        consumer_group = 8,
        partition = 9,
        checkpoint = 10,
        revoked_publisher = 11,
        unknown = 0x7FFFFFFE
    };

    /**
     * @brief Where in a partition a consumer link starts reading
     *
     * The translation into a broker filter belongs to the transport, this type only
     * carries the caller's choice.
     */
    struct event_position
    {
        enum class kind
        {
            earliest,
            latest,
            offset,
            sequence_number,
            enqueued_time
        };

        kind position_kind = kind::latest;
        int64_t offset = 0;
        int64_t sequence_number = 0;
        std::chrono::system_clock::time_point enqueued_time{};
        bool is_inclusive = false;

        static event_position earliest();
        static event_position latest();
        static event_position from_offset(int64_t offset, bool is_inclusive = true);
        static event_position from_sequence_number(int64_t sequence_number, bool is_inclusive = false);
        static event_position from_enqueued_time(std::chrono::system_clock::time_point enqueued_time);

        bool operator==(const event_position& other) const = default;
    };

    struct consumer_options
    {
        uint32_t prefetch_count = 300;
        std::optional<int64_t> owner_level;
        std::string identifier;
        bool track_last_enqueued_event_information = false;
    };

    enum class link_kind
    {
        management,
        receiver
    };

    const char* to_string(link_kind kind);

    using link_property_value = std::variant<std::string, int64_t>;

    // What the protocol engine needs to attach a link
    struct link_settings
    {
        link_kind kind = link_kind::receiver;
        std::string address;
        uint32_t total_link_credit = 0;
        std::map<std::string, link_property_value> properties;
        std::vector<std::string> desired_capabilities;

        template<class T> std::optional<T> get_property(const std::string& name) const
        {
            auto it = properties.find(name);
            if (it == properties.end())
                return std::nullopt;
            if (auto* value = std::get_if<T>(&it->second))
                return *value;
            return std::nullopt;
        }

        bool has_desired_capability(const std::string& capability) const;
    };

    struct cbs_token
    {
        std::string token;
        std::string token_type;
        std::chrono::system_clock::time_point expires_at{};
    };

    namespace claims
    {
        constexpr const char* listen = "Listen";
        constexpr const char* manage = "Manage";
        constexpr const char* send = "Send";
    }

    namespace amqp_property
    {
        constexpr const char* entity_type = "com.microsoft:entity-type";
        constexpr const char* owner_level = "com.microsoft:epoch";
        constexpr const char* consumer_identifier = "com.microsoft:receiver-name";
        constexpr const char* track_last_enqueued_event_information = "com.microsoft:enable-receiver-runtime-metric";
    }

    constexpr const char* management_address = "$management";
}
