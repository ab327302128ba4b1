/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#include <atomic>
#include <variant>

#include <fmt/format.h>

#include <muniverse/docker_runtime.h>
#include <muniverse/environment.h>
#include <muniverse/internal/error_codes.h>
#include <muniverse/internal/logger.h>
#include <muniverse/session_establisher.h>
#include <muniverse/teardown.h>

namespace muniverse
{
    namespace
    {
        std::atomic<uint64_t> env_id_generator = 0;

        const char* check_404_script = "Promise.resolve(!window.muniverse && document.title.startsWith('404'));";
        const char* score_script = "window.muniverse.score();";

        template<class... Ts> struct overloaded : Ts...
        {
            using Ts::operator()...;
        };
        template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;
    }

    const char* to_string(episode_state state)
    {
        switch (state)
        {
        case episode_state::uninitialized:
            return "uninitialized";
        case episode_state::ready:
            return "ready";
        case episode_state::terminated:
            return "terminated";
        case episode_state::closed:
            return "closed";
        }
        return "closed";
    }

    environment::environment(const env_spec& spec, const env_options& options, std::shared_ptr<i_telemetry_service> telemetry)
        : spec_(spec)
        , options_(options)
        , id_(++env_id_generator)
        , capturer_(spec, options.compression, options.compression_quality)
        , telemetry_(std::move(telemetry))
    {
    }

    environment::~environment()
    {
        if (!closed_)
        {
            MUNIVERSE_WARNING("environment {} ({}) destroyed without close", id_, spec_.name);
            if (close() != error::OK())
            {
                MUNIVERSE_ERROR("implicit close of environment {} failed: {}", id_, last_error_);
            }
        }
    }

    int environment::create(const env_spec& spec,
        const env_options& options,
        environment_dependencies dependencies,
        std::unique_ptr<environment>& env,
        std::string& error_message)
    {
        call_context ctx(options.call_timeout);
        auto telemetry = dependencies.telemetry ? dependencies.telemetry : get_telemetry_service();
        auto fail = [&](int err) {
            ctx.add_context("create environment", err);
            error_message = ctx.message();
            MUNIVERSE_ERROR("{}", error_message);
            if (telemetry)
                telemetry->message(i_telemetry_service::err, error_message.c_str());
            return err;
        };

        std::string validation_message;
        int err = validate_options(options, validation_message);
        if (err != error::OK())
            return fail(ctx.fail(err, validation_message));
        if (spec.name.empty() || spec.width <= 0 || spec.height <= 0)
            return fail(ctx.fail(error::CONFIGURATION_ERROR(), "spec needs a name and a positive size"));
        if (!dependencies.devtools_client)
            return fail(ctx.fail(error::CONFIGURATION_ERROR(), "no devtools client supplied"));

        std::unique_ptr<environment> ret(new environment(spec, options, telemetry));
        session_establisher establisher(dependencies.devtools_client, options.connect_attempts, options.connect_retry_interval);

        if (!options.uses_container())
        {
            err = establisher.establish(ctx, options.devtools_host, ret->session_);
            if (err != error::OK())
            {
                // nothing to release yet
                ret->closed_ = true;
                return fail(err);
            }
            ret->game_host_ = options.game_host;
        }
        else
        {
            auto runtime = dependencies.runtime ? dependencies.runtime : std::make_shared<docker_runtime>();
            auto connector = dependencies.liveness_connector ? dependencies.liveness_connector
                                                             : std::make_shared<tcp_liveness_connector>();
            ret->provisioner_ = std::make_unique<sandbox_provisioner>(
                std::move(runtime), std::move(connector), dependencies.runtime_lock, options);

            provision_request request;
            request.image = options.image();
            request.mount_path = options.games_dir;
            request.width = spec.width;
            request.height = spec.height;
            err = ret->provisioner_->provision(ctx, request, establisher, ret->sandbox_, ret->session_);
            if (err != error::OK())
            {
                ret->closed_ = true;
                return fail(err);
            }
            // the file server runs inside the sandbox next to the browser
            ret->game_host_ = "localhost";
        }

        if (ret->telemetry_)
        {
            ret->telemetry_->on_environment_creation(ret->id_, spec.name, ret->sandbox_.container_id);
            auto where = ret->sandbox_.container_id.empty() ? options.devtools_host
                                                             : "container " + ret->sandbox_.container_id;
            ret->telemetry_->message(i_telemetry_service::info,
                fmt::format("environment {} ({}) ready on {}", ret->id_, spec.name, where).c_str());
        }
        env = std::move(ret);
        return error::OK();
    }

    episode_state environment::state() const
    {
        if (closed_)
            return episode_state::closed;
        if (!has_reset_)
            return episode_state::uninitialized;
        return needs_reset_ ? episode_state::terminated : episode_state::ready;
    }

    std::string environment::env_url() const
    {
        return "http://" + game_host_ + "/" + spec_.base_name();
    }

    std::vector<std::string> environment::log() const
    {
        if (!session_)
            return {};
        return session_->console_log();
    }

    int environment::finish(const char* operation, call_context& ctx, int err)
    {
        if (err == error::OK())
            return err;
        ctx.add_context(operation, err);
        last_error_ = ctx.message();
        MUNIVERSE_ERROR("environment {}: {}", id_, last_error_);
        if (telemetry_)
            telemetry_->message(i_telemetry_service::err, fmt::format("environment {}: {}", id_, last_error_).c_str());
        return err;
    }

    int environment::check_open(call_context& ctx) const
    {
        if (closed_ || !session_)
            return ctx.fail(error::SEQUENCE_ERROR(), "already closed");
        return error::OK();
    }

    int environment::evaluate_bool(call_context& ctx, const std::string& script, bool& value)
    {
        nlohmann::json result;
        int err = session_->evaluate(ctx, script, result);
        if (err != error::OK())
            return err;
        if (!result.is_boolean())
            return ctx.fail(error::EVALUATION_ERROR(), "expected a boolean but got " + result.dump());
        value = result.get<bool>();
        return error::OK();
    }

    int environment::evaluate_number(call_context& ctx, const std::string& script, double& value)
    {
        nlohmann::json result;
        int err = session_->evaluate(ctx, script, result);
        if (err != error::OK())
            return err;
        if (!result.is_number())
            return ctx.fail(error::EVALUATION_ERROR(), "expected a number but got " + result.dump());
        value = result.get<double>();
        return error::OK();
    }

    int environment::reset()
    {
        call_context ctx(options_.call_timeout);
        int err = check_open(ctx);
        if (err == error::OK())
            err = do_reset(ctx);
        if (telemetry_)
            telemetry_->on_environment_reset(id_, err, last_score_);
        return finish("reset environment", ctx, err);
    }

    int environment::do_reset(call_context& ctx)
    {
        // a failed reset leaves the episode unusable until the next successful one
        needs_reset_ = true;

        int err = error::OK();
        if (!has_navigated_before_)
        {
            // the first load has to wait for the page's own bootstrap
            err = session_->navigate(ctx, env_url(), navigation_wait::load);
            if (err != error::OK())
                return ctx.add_context("navigate", err);
            has_navigated_before_ = true;
        }
        else
        {
            err = session_->navigate(ctx, env_url(), navigation_wait::commit);
            if (err != error::OK())
                return ctx.add_context("navigate", err);
        }

        bool is_404 = false;
        err = evaluate_bool(ctx, check_404_script, is_404);
        if (err != error::OK())
            return ctx.add_context("check for 404", err);
        if (is_404)
            return ctx.fail(error::NOT_FOUND(), "likely 404 page (no base game found)");

        nlohmann::json ignored;
        err = session_->evaluate(ctx, "window.muniverse.init(" + spec_.options + ");", ignored);
        if (err != error::OK())
            return ctx.add_context("init game", err);

        double score = 0;
        err = evaluate_number(ctx, score_script, score);
        if (err != error::OK())
            return ctx.add_context("get score", err);

        last_score_ = score;
        needs_reset_ = false;
        has_reset_ = true;
        return error::OK();
    }

    int environment::step(std::chrono::nanoseconds duration, const std::vector<input_event>& events, double& reward, bool& done)
    {
        call_context ctx(options_.call_timeout);
        size_t dispatched = 0;
        size_t dropped = 0;
        reward = 0;
        done = false;
        int err = check_open(ctx);
        if (err == error::OK())
        {
            err = do_step(ctx, std::chrono::duration_cast<std::chrono::milliseconds>(duration), events, reward, done,
                dispatched, dropped);
        }
        if (telemetry_)
            telemetry_->on_environment_step(id_, err, reward, done, dispatched, dropped);
        return finish("step environment", ctx, err);
    }

    int environment::dispatch(call_context& ctx, const input_event& event, size_t& dispatched, size_t& dropped)
    {
        return std::visit(overloaded{[&](const mouse_event& e) {
                                         int err = session_->dispatch_mouse_event(ctx, e);
                                         if (err == error::OK())
                                             dispatched++;
                                         return err;
                                     },
                              [&](const key_event& e) {
                                  if (!spec_.allows_key_code(e.code))
                                  {
                                      dropped++;
                                      return error::OK();
                                  }
                                  int err = session_->dispatch_key_event(ctx, e);
                                  if (err == error::OK())
                                      dispatched++;
                                  return err;
                              },
                              [&](const std::monostate&) {
                                  return ctx.fail(error::UNSUPPORTED_EVENT(), "unsupported event type: unset");
                              }},
            event);
    }

    int environment::do_step(call_context& ctx, std::chrono::milliseconds elapsed, const std::vector<input_event>& events,
                             double& reward, bool& done, size_t& dispatched, size_t& dropped)
    {
        if (needs_reset_)
            return ctx.fail(error::SEQUENCE_ERROR(), "environment needs reset");

        // strictly in order; already dispatched events stay applied if a later one fails
        for (const auto& event : events)
        {
            int err = dispatch(ctx, event, dispatched, dropped);
            if (err != error::OK())
                return err;
        }

        bool is_done = false;
        int err = evaluate_bool(ctx, "window.muniverse.step(" + std::to_string(elapsed.count()) + ");", is_done);
        if (err != error::OK())
            return ctx.add_context("advance game", err);
        done = is_done;
        if (is_done)
            needs_reset_ = true;

        double score = 0;
        err = evaluate_number(ctx, score_script, score);
        if (err != error::OK())
            return ctx.add_context("get score", err);
        reward = score - last_score_;
        last_score_ = score;
        return error::OK();
    }

    int environment::observe(observation& obs)
    {
        call_context ctx(options_.call_timeout);
        int err = check_open(ctx);
        if (err == error::OK() && !has_reset_)
            err = ctx.fail(error::SEQUENCE_ERROR(), "environment needs initial reset");
        if (err == error::OK())
            err = capturer_.capture(ctx, *session_, obs);
        if (telemetry_)
            telemetry_->on_environment_observe(id_, err, obs.kind(), err == error::OK() ? obs.data().size() : 0);
        return finish("observe environment", ctx, err);
    }

    int environment::close()
    {
        call_context ctx(options_.call_timeout);
        int err = error::OK();
        if (closed_)
            err = ctx.fail(error::SEQUENCE_ERROR(), "already closed");
        else
        {
            err = do_close(ctx);
            if (telemetry_)
                telemetry_->on_environment_close(id_, err);
        }
        return finish("close environment", ctx, err);
    }

    int environment::do_close(call_context& ctx)
    {
        closed_ = true;

        // Order matters: the sandbox treats the liveness channel closing as a signal to shut itself down,
        // which can race an explicit kill and make the kill fail, so the channel goes last.
        teardown_coordinator teardown;
        if (session_)
        {
            teardown.add_step("close devtools", [this](call_context&) { return session_->close(); });
        }
        if (!sandbox_.container_id.empty() && provisioner_)
        {
            teardown.add_step("kill container",
                [this](call_context& step_ctx) { return provisioner_->terminate(step_ctx, sandbox_.container_id); });
        }
        if (sandbox_.liveness)
        {
            teardown.add_step("close kill socket", [this](call_context&) { return sandbox_.liveness->close(); });
        }
        int err = teardown.run(ctx);

        // any later call sees a plain "already closed" rather than touching released resources
        session_.reset();
        sandbox_ = sandbox_handle{};
        provisioner_.reset();
        return err;
    }
}
