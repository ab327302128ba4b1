/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <muniverse/docker_runtime.h>
#include <muniverse/env_options.h>
#include <muniverse/internal/error_codes.h>
#include <muniverse/internal/process_runner.h>
#include <muniverse/liveness_channel.h>

using testing::HasSubstr;

using namespace muniverse;

namespace
{
    const char* inspect_output = R"([
        {
            "Id": "c0ffee",
            "NetworkSettings": {
                "Ports": {
                    "1337/tcp": [{"HostIp": "0.0.0.0", "HostPort": "9002"}],
                    "9222/tcp": [{"HostIp": "0.0.0.0", "HostPort": "9001"}],
                    "5900/tcp": null
                },
                "Networks": {
                    "bridge": {"IPAddress": "172.17.0.2"}
                }
            }
        }
    ])";

    // a stand-in for the docker client that answers from canned output
    class fake_client
    {
        std::filesystem::path path_;

    public:
        explicit fake_client(const std::string& body)
        {
            path_ = std::filesystem::temp_directory_path()
                    / ("muniverse_fake_docker_" + std::to_string(getpid()) + "_" + std::to_string(counter()++));
            {
                std::ofstream out(path_);
                out << "#!/bin/sh\n" << body;
            }
            std::filesystem::permissions(path_, std::filesystem::perms::owner_all);
        }
        ~fake_client() { std::filesystem::remove(path_); }

        std::string path() const { return path_.string(); }

        static int& counter()
        {
            static int value = 0;
            return value;
        }
    };
}

TEST(docker_runtime_test, run_arguments_publish_ports_and_size_the_window)
{
    run_request request;
    request.image = "unixpickle/muniverse:0.107.0";
    request.width = 320;
    request.height = 480;
    request.published_ports = {DEVTOOLS_PORT, LIVENESS_PORT};
    request.port_range = DEFAULT_PORT_RANGE;

    EXPECT_EQ(make_run_arguments(request),
        (std::vector<std::string>{"run",
            "-p",
            "9000-9999:9222",
            "-p",
            "9000-9999:1337",
            "--shm-size=200m",
            "-d",
            "--rm",
            "-i",
            "unixpickle/muniverse:0.107.0",
            "--window-size=320,480"}));

    request.mount_path = "/srv/games";
    auto args = make_run_arguments(request);
    auto it = std::find(args.begin(), args.end(), "-v");
    ASSERT_NE(it, args.end());
    EXPECT_EQ(*(it + 1), "/srv/games:/downloaded_games");
    EXPECT_EQ(args.back(), "--window-size=320,480");
}

TEST(docker_runtime_test, parses_inspect_output)
{
    container_inspection inspection;
    std::string error_message;
    ASSERT_EQ(parse_inspection(inspect_output, inspection, error_message), error::OK()) << error_message;
    ASSERT_EQ(inspection.records.size(), 1u);
    const auto& record = inspection.records.front();
    EXPECT_EQ(record.port_bindings.at("9222/tcp"), (std::vector<std::string>{"9001"}));
    EXPECT_EQ(record.port_bindings.at("1337/tcp"), (std::vector<std::string>{"9002"}));
    EXPECT_TRUE(record.port_bindings.at("5900/tcp").empty());
    EXPECT_EQ(record.network_addresses.at("bridge"), "172.17.0.2");
}

TEST(docker_runtime_test, malformed_inspect_output_is_a_discovery_error)
{
    container_inspection inspection;
    std::string error_message;
    EXPECT_EQ(parse_inspection("not json", inspection, error_message), error::DISCOVERY_ERROR());
    EXPECT_EQ(parse_inspection(R"({"Id": "x"})", inspection, error_message), error::DISCOVERY_ERROR());
    EXPECT_EQ(parse_inspection(R"([{"NetworkSettings": {"Ports": {"9222/tcp": [{"HostPort": 9001}]}}}])",
                  inspection,
                  error_message),
        error::DISCOVERY_ERROR());

    ASSERT_EQ(parse_inspection("[]", inspection, error_message), error::OK());
    EXPECT_TRUE(inspection.records.empty());
}

TEST(docker_runtime_test, drives_the_client)
{
    fake_client client(std::string("case \"$1\" in\n"
                                   "  run) echo '  c0ffee  ' ;;\n"
                                   "  inspect) cat <<'JSON'\n")
                       + inspect_output
                       + "\nJSON\n"
                         "  ;;\n"
                         "  kill) echo 'No such container' >&2; exit 3 ;;\n"
                         "esac\n");
    docker_runtime runtime(client.path());

    run_request request;
    request.image = DEFAULT_IMAGE;
    request.width = 10;
    request.height = 10;
    call_context ctx(std::chrono::seconds(10));
    std::string id;
    ASSERT_EQ(runtime.run(ctx, request, id), error::OK()) << ctx.message();
    EXPECT_EQ(id, "c0ffee");

    container_inspection inspection;
    ASSERT_EQ(runtime.inspect(ctx, id, inspection), error::OK()) << ctx.message();
    EXPECT_EQ(inspection.records.size(), 1u);

    EXPECT_EQ(runtime.kill(ctx, id), error::RUNTIME_COMMAND_ERROR());
    EXPECT_THAT(ctx.message(), HasSubstr("docker kill: "));
    EXPECT_THAT(ctx.message(), HasSubstr("exit status 3: No such container"));
}

TEST(docker_runtime_test, failed_run_suggests_updating_docker)
{
    fake_client client("echo 'unknown flag: --shm-size' >&2\nexit 125\n");
    docker_runtime runtime(client.path());
    run_request request;
    request.image = DEFAULT_IMAGE;
    call_context ctx(std::chrono::seconds(10));
    std::string id;
    EXPECT_EQ(runtime.run(ctx, request, id), error::RUNTIME_COMMAND_ERROR());
    EXPECT_THAT(ctx.message(), HasSubstr("docker run: "));
    EXPECT_THAT(ctx.message(), HasSubstr("unknown flag: --shm-size (make sure docker is up-to-date)"));
    EXPECT_TRUE(id.empty());
}

TEST(docker_runtime_test, colon_in_mount_path_is_rejected_before_running)
{
    docker_runtime runtime("/nonexistent/docker");
    run_request request;
    request.mount_path = "C:/games";
    call_context ctx(std::chrono::seconds(1));
    std::string id;
    EXPECT_EQ(runtime.run(ctx, request, id), error::CONFIGURATION_ERROR());
    EXPECT_EQ(ctx.message(), "path contains colons: C:/games");
}

TEST(process_runner_test, captures_output_and_exit_status)
{
    call_context ctx(std::chrono::seconds(10));
    process_result result;
    ASSERT_EQ(run_process(ctx, "sh", {"-c", "echo out; echo err >&2; exit 4"}, result), error::OK());
    EXPECT_EQ(result.exit_code, 4);
    EXPECT_EQ(result.stdout_text, "out\n");
    EXPECT_EQ(result.stderr_text, "err\n");
}

TEST(process_runner_test, missing_program_exits_127)
{
    call_context ctx(std::chrono::seconds(10));
    process_result result;
    ASSERT_EQ(run_process(ctx, "/nonexistent/muniverse-client", {}, result), error::OK());
    EXPECT_EQ(result.exit_code, 127);
}

TEST(process_runner_test, child_stdin_is_the_only_dev_null_descriptor)
{
    call_context ctx(std::chrono::seconds(10));
    process_result result;
    ASSERT_EQ(run_process(ctx,
                  "sh",
                  {"-c", "readlink /proc/$$/fd/0; for f in /proc/$$/fd/*; do n=${f##*/}; "
                         "if [ \"$n\" -gt 2 ]; then readlink \"$f\"; fi; done; true"},
                  result),
        error::OK());
    EXPECT_EQ(result.exit_code, 0);
    // stdin is the only descriptor left on /dev/null
    EXPECT_EQ(result.stdout_text.find("/dev/null"), 0u);
    EXPECT_EQ(result.stdout_text.find("/dev/null", 1), std::string::npos);
}

TEST(process_runner_test, deadline_kills_the_child)
{
    call_context ctx(std::chrono::milliseconds(200));
    process_result result;
    auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(run_process(ctx, "sleep", {"10"}, result), error::DEADLINE_EXCEEDED());
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
    EXPECT_EQ(ctx.message(), "sleep: context deadline exceeded");
}

namespace
{
    // a loopback listener on an ephemeral port
    class loopback_listener
    {
        int fd_ = -1;
        int port_ = 0;

    public:
        explicit loopback_listener(bool listening)
        {
            fd_ = socket(AF_INET, SOCK_STREAM, 0);
            sockaddr_in addr{};
            addr.sin_family = AF_INET;
            addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
            addr.sin_port = 0;
            EXPECT_EQ(bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);
            socklen_t len = sizeof(addr);
            EXPECT_EQ(getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len), 0);
            port_ = ntohs(addr.sin_port);
            if (listening)
            {
                EXPECT_EQ(listen(fd_, 1), 0);
            }
        }
        ~loopback_listener() { ::close(fd_); }

        std::string port() const { return std::to_string(port_); }
    };
}

TEST(liveness_channel_test, connects_and_closes)
{
    loopback_listener listener(true);
    tcp_liveness_connector connector;
    call_context ctx(std::chrono::seconds(5));
    std::unique_ptr<i_liveness_channel> channel;
    ASSERT_EQ(connector.connect(ctx, "127.0.0.1", listener.port(), channel), error::OK()) << ctx.message();
    ASSERT_NE(channel, nullptr);
    EXPECT_TRUE(channel->is_open());
    EXPECT_EQ(channel->close(), error::OK());
    EXPECT_FALSE(channel->is_open());
    // closing twice is harmless
    EXPECT_EQ(channel->close(), error::OK());
}

TEST(liveness_channel_test, refused_connection_is_a_transport_error)
{
    loopback_listener listener(false);
    tcp_liveness_connector connector;
    call_context ctx(std::chrono::seconds(5));
    std::unique_ptr<i_liveness_channel> channel;
    EXPECT_EQ(connector.connect(ctx, "127.0.0.1", listener.port(), channel), error::TRANSPORT_ERROR());
    EXPECT_THAT(ctx.message(), HasSubstr("dial tcp 127.0.0.1:" + listener.port()));
    EXPECT_EQ(channel, nullptr);
}
