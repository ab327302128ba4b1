/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <functional>
#include <string>
#include <vector>

#include <muniverse/call_context.h>

namespace muniverse
{
    // Runs an ordered list of release steps, every one of them regardless of earlier failures.
    class teardown_coordinator
    {
    public:
        using release_function = std::function<int(call_context&)>;

        struct step
        {
            std::string name;
            release_function release;
        };

    private:
        std::vector<step> steps_;

    public:
        teardown_coordinator() = default;

        void add_step(std::string name, release_function release);
        size_t size() const { return steps_.size(); }

        // Returns the first failure with its step name prefixed onto ctx's trail; later failures are only logged.
        int run(call_context& ctx);
    };
}
