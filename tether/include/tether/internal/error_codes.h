/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

namespace tether
{
    namespace error
    {
        int OK();
        int MIN();
        int MAX();

        int INVALID_ARGUMENT();    // a caller bug, never worth retrying
        int OPERATION_CANCELLED(); // the caller's token or the scope-wide cancellation fired
        int OBJECT_DISPOSED();     // the scope (or the component) has been disposed
        int CONNECTION_FAILED();   // the protocol engine could not establish the connection
        int LINK_ATTACH_FAILED();  // the attach handshake for a link failed
        int AUTHORIZATION_FAILED(); // the CBS token request was rejected or could not be made
        int TIMEOUT();             // the operation ran out of its timeout budget
        int DUPLICATE_LINK();      // a link handle was registered twice

        const char* to_string(int err);

        // true for errors that a higher layer may reasonably retry
        bool is_transient(int err);
    }
}
