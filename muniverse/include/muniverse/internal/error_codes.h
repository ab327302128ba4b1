/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

namespace muniverse
{
    namespace error
    {
        int OK();
        int MIN();
        int CONFIGURATION_ERROR();   // invalid combination of construction options
        int PROVISIONING_ERROR();    // the sandbox could not be started or its liveness channel opened
        int DISCOVERY_ERROR();       // container inspection returned an unexpected shape
        int PROTOCOL_CONNECT_ERROR(); // no usable control endpoint appeared in time
        int NOT_FOUND();             // the game page or spec does not exist
        int SEQUENCE_ERROR();        // operation invoked in the wrong episode state or after close
        int UNSUPPORTED_EVENT();     // input event kind cannot be dispatched
        int EVALUATION_ERROR();      // in-page script evaluation faulted or returned the wrong type
        int DEADLINE_EXCEEDED();     // the per-call deadline fired
        int RUNTIME_COMMAND_ERROR(); // the container runtime client exited unsuccessfully
        int TRANSPORT_ERROR();       // a socket or pipe level failure
        int INVALID_DATA();          // malformed input such as bad json or base64
        int MAX(); // the biggest value

        void set_OK_val(int val);
        void set_offset_val(int val);
        void set_offset_val_is_negative(bool val);
        const char* to_string(int);
    };
}
