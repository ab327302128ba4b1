/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#include <muniverse/internal/error_codes.h>
#include <muniverse/internal/logger.h>
#include <muniverse/teardown.h>

namespace muniverse
{
    void teardown_coordinator::add_step(std::string name, release_function release)
    {
        steps_.push_back({std::move(name), std::move(release)});
    }

    int teardown_coordinator::run(call_context& ctx)
    {
        int first_err = error::OK();
        std::string first_message;
        for (auto& s : steps_)
        {
            auto step_ctx = ctx.child();
            int err = s.release(step_ctx);
            if (err == error::OK())
            {
                MUNIVERSE_DEBUG("released {}", s.name);
                continue;
            }
            step_ctx.add_context(s.name.c_str(), err);
            MUNIVERSE_ERROR("teardown step failed: {}", step_ctx.message());
            if (first_err == error::OK())
            {
                first_err = err;
                first_message = step_ctx.message();
            }
        }
        steps_.clear();
        if (first_err != error::OK())
            return ctx.fail(first_err, first_message);
        return error::OK();
    }
}
