/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#include <muniverse/internal/error_codes.h>

namespace muniverse
{
    namespace error
    {
        int OK_val = 0;
        int offset_val = 0;
        int offset_val_is_negative = true;

        namespace
        {
            int code(int ordinal)
            {
                return offset_val + (offset_val_is_negative ? -ordinal : ordinal);
            }
        }

        [[nodiscard]] int OK()
        {
            return OK_val;
        }
        [[nodiscard]] int CONFIGURATION_ERROR()
        {
            return code(1);
        }
        [[nodiscard]] int PROVISIONING_ERROR()
        {
            return code(2);
        }
        [[nodiscard]] int DISCOVERY_ERROR()
        {
            return code(3);
        }
        [[nodiscard]] int PROTOCOL_CONNECT_ERROR()
        {
            return code(4);
        }
        [[nodiscard]] int NOT_FOUND()
        {
            return code(5);
        }
        [[nodiscard]] int SEQUENCE_ERROR()
        {
            return code(6);
        }
        [[nodiscard]] int UNSUPPORTED_EVENT()
        {
            return code(7);
        }
        [[nodiscard]] int EVALUATION_ERROR()
        {
            return code(8);
        }
        [[nodiscard]] int DEADLINE_EXCEEDED()
        {
            return code(9);
        }
        [[nodiscard]] int RUNTIME_COMMAND_ERROR()
        {
            return code(10);
        }
        [[nodiscard]] int TRANSPORT_ERROR()
        {
            return code(11);
        }
        [[nodiscard]] int INVALID_DATA()
        {
            return code(12);
        }
        // dont forget to update MIN & MAX if new values

        [[nodiscard]] int MIN()
        {
            return offset_val + (offset_val_is_negative ? -12 : 1);
        }
        [[nodiscard]] int MAX()
        {
            return offset_val + (offset_val_is_negative ? -1 : 12);
        }

        void set_OK_val(int val)
        {
            OK_val = val;
        }
        void set_offset_val(int val)
        {
            offset_val = val;
        }
        void set_offset_val_is_negative(bool val)
        {
            offset_val_is_negative = val;
        }

        const char* to_string(int err)
        {
            if (err == OK())
            {
                return "ok";
            }
            if (err == CONFIGURATION_ERROR())
            {
                return "configuration error";
            }
            if (err == PROVISIONING_ERROR())
            {
                return "provisioning error";
            }
            if (err == DISCOVERY_ERROR())
            {
                return "discovery error";
            }
            if (err == PROTOCOL_CONNECT_ERROR())
            {
                return "protocol connect error";
            }
            if (err == NOT_FOUND())
            {
                return "not found";
            }
            if (err == SEQUENCE_ERROR())
            {
                return "sequence error";
            }
            if (err == UNSUPPORTED_EVENT())
            {
                return "unsupported event";
            }
            if (err == EVALUATION_ERROR())
            {
                return "evaluation error";
            }
            if (err == DEADLINE_EXCEEDED())
            {
                return "deadline exceeded";
            }
            if (err == RUNTIME_COMMAND_ERROR())
            {
                return "runtime command error";
            }
            if (err == TRANSPORT_ERROR())
            {
                return "transport error";
            }
            if (err == INVALID_DATA())
            {
                return "invalid data";
            }
            return "invalid error code";
        }
    };
}
