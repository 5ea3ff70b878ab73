/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <tether/tether.h>

namespace tether
{
    fault_tolerant_connection::fault_tolerant_connection(connection_factory factory)
        : factory_(std::move(factory))
    {
    }

    fault_tolerant_connection::~fault_tolerant_connection()
    {
        close();
    }

    CORO_TASK(int)
    fault_tolerant_connection::get_or_create(
        std::chrono::milliseconds timeout, std::stop_token cancellation, std::shared_ptr<i_connection>& connection)
    {
        timeout_budget budget(timeout);
        for (;;)
        {
            std::shared_ptr<creation_attempt> attempt;
            bool is_creator = false;
            {
                std::scoped_lock lock(mutex_);
                if (closed_)
                    CO_RETURN error::OBJECT_DISPOSED();

                if (connection_ && !connection_->is_closed())
                {
                    connection = connection_;
                    CO_RETURN error::OK();
                }

                if (connection_)
                {
                    TETHER_DEBUG("fault_tolerant_connection: cached connection to {} is closed, replacing it",
                        connection_->get_host());
                    connection_.reset();
                }

                if (!pending_)
                {
                    pending_ = std::make_shared<creation_attempt>();
                    is_creator = true;
                }
                attempt = pending_;
            }

            if (is_creator)
            {
                CO_AWAIT create(attempt, budget.remaining(), cancellation);
            }
            else if (!CO_AWAIT attempt->ready.wait(cancellation))
            {
                CO_RETURN error::OPERATION_CANCELLED();
            }

            if (attempt->error_code == error::OK())
            {
                connection = attempt->connection;
                CO_RETURN error::OK();
            }

            // an attempt ended by its creator's own token or deadline does not end ours
            bool ended_by_creator = attempt->error_code == error::OPERATION_CANCELLED()
                                    || (attempt->error_code == error::TIMEOUT() && !budget.expired());
            if (is_creator || !ended_by_creator || cancellation.stop_requested())
                CO_RETURN attempt->error_code;

            TETHER_DEBUG("fault_tolerant_connection: creation abandoned by its caller ({}), retrying",
                error::to_string(attempt->error_code));
        }
    }

    CORO_TASK(int)
    fault_tolerant_connection::create(
        std::shared_ptr<creation_attempt> attempt, std::chrono::milliseconds timeout, std::stop_token cancellation)
    {
        std::shared_ptr<i_connection> created;
        int err = error::OK();
        if (!factory_)
        {
            TETHER_ERROR("fault_tolerant_connection has no connection factory");
            err = error::CONNECTION_FAILED();
        }
        else
        {
            err = CO_AWAIT factory_(timeout, cancellation, created);
            if (err == error::OK() && !created)
            {
                TETHER_ERROR("connection factory reported success without a connection");
                err = error::CONNECTION_FAILED();
            }
        }

        std::shared_ptr<i_connection> orphan;
        {
            std::scoped_lock lock(mutex_);
            if (err == error::OK() && closed_)
            {
                // closed while we were creating, nobody may use this connection
                orphan = created;
                err = error::OBJECT_DISPOSED();
            }

            if (err == error::OK())
            {
                connection_ = created;
                attempt->connection = created;
                creation_count_.fetch_add(1, std::memory_order_release);
            }
            attempt->error_code = err;
            pending_.reset();
        }

        if (orphan)
            orphan->close();

        if (err == error::OK())
        {
            TETHER_INFO("fault_tolerant_connection: connection to {} established ({})",
                created->get_host(),
                created->get_container_id());
#ifdef TETHER_USE_TELEMETRY
            if (auto telemetry_service = tether::get_telemetry_service(); telemetry_service)
                telemetry_service->on_connection_creation(created->get_host(), created->get_container_id());
#endif
        }
        else
        {
            TETHER_ERROR("fault_tolerant_connection: connection creation failed {}", error::to_string(err));
        }

        attempt->ready.set();
        CO_RETURN err;
    }

    std::shared_ptr<i_connection> fault_tolerant_connection::try_get() const
    {
        std::scoped_lock lock(mutex_);
        if (connection_ && !connection_->is_closed())
            return connection_;
        return nullptr;
    }

    void fault_tolerant_connection::close()
    {
        std::shared_ptr<i_connection> connection;
        {
            std::scoped_lock lock(mutex_);
            if (closed_)
                return;
            closed_ = true;
            connection = std::move(connection_);
        }

        if (connection)
        {
            TETHER_DEBUG("fault_tolerant_connection: closing connection to {}", connection->get_host());
            connection->close();
#ifdef TETHER_USE_TELEMETRY
            if (auto telemetry_service = tether::get_telemetry_service(); telemetry_service)
                telemetry_service->on_connection_closed(connection->get_host(), connection->get_container_id());
#endif
        }
    }

    bool fault_tolerant_connection::is_closed() const
    {
        std::scoped_lock lock(mutex_);
        return closed_;
    }
}
