/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <tether/internal/error_codes.h>

namespace tether
{
    namespace error
    {
        namespace
        {
            constexpr int offset = 0x2000;
        }

        int OK()
        {
            return 0;
        }
        int MIN()
        {
            return offset + 1;
        }
        int MAX()
        {
            return offset + 8;
        }

        int INVALID_ARGUMENT()
        {
            return offset + 1;
        }
        int OPERATION_CANCELLED()
        {
            return offset + 2;
        }
        int OBJECT_DISPOSED()
        {
            return offset + 3;
        }
        int CONNECTION_FAILED()
        {
            return offset + 4;
        }
        int LINK_ATTACH_FAILED()
        {
            return offset + 5;
        }
        int AUTHORIZATION_FAILED()
        {
            return offset + 6;
        }
        int TIMEOUT()
        {
            return offset + 7;
        }
        int DUPLICATE_LINK()
        {
            return offset + 8;
        }

        const char* to_string(int err)
        {
            if (err == OK())
                return "OK";
            if (err == INVALID_ARGUMENT())
                return "INVALID_ARGUMENT";
            if (err == OPERATION_CANCELLED())
                return "OPERATION_CANCELLED";
            if (err == OBJECT_DISPOSED())
                return "OBJECT_DISPOSED";
            if (err == CONNECTION_FAILED())
                return "CONNECTION_FAILED";
            if (err == LINK_ATTACH_FAILED())
                return "LINK_ATTACH_FAILED";
            if (err == AUTHORIZATION_FAILED())
                return "AUTHORIZATION_FAILED";
            if (err == TIMEOUT())
                return "TIMEOUT";
            if (err == DUPLICATE_LINK())
                return "DUPLICATE_LINK";
            return "UNKNOWN_ERROR";
        }

        bool is_transient(int err)
        {
            return err == CONNECTION_FAILED() || err == LINK_ATTACH_FAILED() || err == AUTHORIZATION_FAILED()
                   || err == TIMEOUT();
        }
    }
}
