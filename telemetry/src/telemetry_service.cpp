/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <tether/telemetry/i_telemetry_service.h>

namespace tether
{
    // Global telemetry service definition for host builds
    std::shared_ptr<i_telemetry_service> telemetry_service_ = nullptr;
}
