/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <muniverse/env_options.h>
#include <muniverse/env_spec.h>
#include <muniverse/events.h>
#include <muniverse/i_container_runtime.h>
#include <muniverse/i_devtools.h>
#include <muniverse/i_telemetry_service.h>
#include <muniverse/liveness_channel.h>
#include <muniverse/observation.h>
#include <muniverse/observation_capturer.h>
#include <muniverse/sandbox_provisioner.h>

namespace muniverse
{
    enum class episode_state
    {
        uninitialized, // constructed, never reset
        ready,         // an episode is running
        terminated,    // the episode ended (or a reset failed), observe still works but step needs a reset
        closed
    };

    const char* to_string(episode_state state);

    // Collaborators an environment is built from. Only devtools_client has no default.
    struct environment_dependencies
    {
        std::shared_ptr<i_devtools_client> devtools_client;
        // docker_runtime when null
        std::shared_ptr<i_container_runtime> runtime;
        // tcp_liveness_connector when null
        std::shared_ptr<i_liveness_connector> liveness_connector;
        // global_runtime_lock() when null
        std::shared_ptr<std::mutex> runtime_lock;
        // get_telemetry_service() when null
        std::shared_ptr<i_telemetry_service> telemetry;
    };

    // Controls and observes one game environment.
    //
    // Reset starts an episode, then step and observe may be called in any order until step reports
    // done. After that observe still works but step needs another reset. Close releases the sandbox;
    // every later call fails with SEQUENCE_ERROR.
    //
    // An environment is not thread safe, callers must not use one instance from several threads at once.
    // Every public call runs under its own deadline of env_options::call_timeout.
    class environment
    {
        env_spec spec_;
        env_options options_;
        std::string game_host_;
        uint64_t id_;

        std::unique_ptr<i_devtools_session> session_;
        std::unique_ptr<sandbox_provisioner> provisioner_;
        sandbox_handle sandbox_;
        observation_capturer capturer_;
        std::shared_ptr<i_telemetry_service> telemetry_;

        double last_score_ = 0;
        bool needs_reset_ = true;
        bool has_navigated_before_ = false;
        bool has_reset_ = false;
        bool closed_ = false;
        std::string last_error_;

        environment(const env_spec& spec, const env_options& options, std::shared_ptr<i_telemetry_service> telemetry);

        int finish(const char* operation, call_context& ctx, int err);
        int check_open(call_context& ctx) const;

        int do_reset(call_context& ctx);
        int do_step(call_context& ctx, std::chrono::milliseconds elapsed, const std::vector<input_event>& events,
                    double& reward, bool& done, size_t& dispatched, size_t& dropped);
        int dispatch(call_context& ctx, const input_event& event, size_t& dispatched, size_t& dropped);
        int do_close(call_context& ctx);

        int evaluate_bool(call_context& ctx, const std::string& script, bool& value);
        int evaluate_number(call_context& ctx, const std::string& script, double& value);

    public:
        // Builds an environment either in a new sandbox or, with options.devtools_host set, in an
        // existing browser. The error trail of a failure is written to error_message.
        static int create(const env_spec& spec,
            const env_options& options,
            environment_dependencies dependencies,
            std::unique_ptr<environment>& env,
            std::string& error_message);

        environment(const environment&) = delete;
        environment& operator=(const environment&) = delete;
        ~environment();

        // copy of the spec the environment was created with
        env_spec spec() const { return spec_; }
        uint64_t id() const { return id_; }
        episode_state state() const;
        const std::string& game_host() const { return game_host_; }
        std::string env_url() const;

        int reset();
        int step(std::chrono::nanoseconds duration, const std::vector<input_event>& events, double& reward, bool& done);
        int observe(observation& obs);
        int close();

        // copy of the browser's diagnostics, empty once closed
        std::vector<std::string> log() const;

        // "operation: cause" description of the most recent failed call
        const std::string& last_error() const { return last_error_; }
    };
}
