/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <string>
#include <vector>

#include <muniverse/call_context.h>

namespace muniverse
{
    struct process_result
    {
        int exit_code = -1;
        std::string stdout_text;
        std::string stderr_text;
    };

    // Runs program (looked up on PATH) with args, capturing both output streams.
    // The child is killed if ctx's deadline passes first, which is reported as DEADLINE_EXCEEDED.
    // A non-zero exit status is not an error here, the caller inspects exit_code.
    int run_process(call_context& ctx, const std::string& program, const std::vector<std::string>& args,
                    process_result& result);
}
