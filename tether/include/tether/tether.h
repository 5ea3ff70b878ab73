/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <tether/internal/coroutine_support.h>
#include <tether/internal/logger.h>
#include <tether/internal/error_codes.h>
#include <tether/internal/types.h>
#include <tether/internal/event.h>
#include <tether/internal/cancellation.h>
#include <tether/internal/amqp_object.h>
#include <tether/internal/transport.h>
#include <tether/internal/token_refresher.h>
#include <tether/internal/fault_tolerant_connection.h>
#include <tether/internal/refresh_timer.h>
#include <tether/internal/link_registry.h>
#include <tether/internal/connection_scope.h>

#ifdef TETHER_USE_TELEMETRY
#include <tether/telemetry/i_telemetry_service.h>
#endif
