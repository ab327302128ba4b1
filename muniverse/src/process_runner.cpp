/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <muniverse/internal/error_codes.h>
#include <muniverse/internal/logger.h>
#include <muniverse/internal/process_runner.h>

namespace muniverse
{
    namespace
    {
        void close_pipe(int (&fds)[2])
        {
            if (fds[0] >= 0)
                close(fds[0]);
            if (fds[1] >= 0)
                close(fds[1]);
            fds[0] = fds[1] = -1;
        }

        // returns false once the stream has hit end of file
        bool drain(int fd, std::string& out)
        {
            char buf[4096];
            while (true)
            {
                ssize_t n = read(fd, buf, sizeof(buf));
                if (n > 0)
                {
                    out.append(buf, static_cast<size_t>(n));
                    continue;
                }
                if (n == 0)
                    return false;
                if (errno == EINTR)
                    continue;
                return errno == EAGAIN || errno == EWOULDBLOCK;
            }
        }
    }

    int run_process(call_context& ctx, const std::string& program, const std::vector<std::string>& args,
                    process_result& result)
    {
        result = process_result{};

        int out_pipe[2] = {-1, -1};
        int err_pipe[2] = {-1, -1};
        if (pipe(out_pipe) != 0 || pipe(err_pipe) != 0)
        {
            auto message = std::string("pipe: ") + std::strerror(errno);
            close_pipe(out_pipe);
            close_pipe(err_pipe);
            return ctx.fail(error::TRANSPORT_ERROR(), message);
        }

        std::vector<std::string> all = {program};
        all.insert(all.end(), args.begin(), args.end());
        std::vector<char*> argv;
        argv.reserve(all.size() + 1);
        for (auto& s : all)
            argv.push_back(s.data());
        argv.push_back(nullptr);

        pid_t pid = fork();
        if (pid < 0)
        {
            auto message = std::string("fork: ") + std::strerror(errno);
            close_pipe(out_pipe);
            close_pipe(err_pipe);
            return ctx.fail(error::TRANSPORT_ERROR(), message);
        }

        if (pid == 0)
        {
            // never let the client read the caller's terminal
            int null_fd = open("/dev/null", O_RDONLY);
            if (null_fd >= 0)
            {
                dup2(null_fd, STDIN_FILENO);
                if (null_fd != STDIN_FILENO)
                    close(null_fd);
            }
            dup2(out_pipe[1], STDOUT_FILENO);
            dup2(err_pipe[1], STDERR_FILENO);
            close(out_pipe[0]);
            close(out_pipe[1]);
            close(err_pipe[0]);
            close(err_pipe[1]);
            execvp(argv[0], argv.data());
            _exit(127);
        }

        close(out_pipe[1]);
        close(err_pipe[1]);
        out_pipe[1] = err_pipe[1] = -1;
        fcntl(out_pipe[0], F_SETFL, O_NONBLOCK);
        fcntl(err_pipe[0], F_SETFL, O_NONBLOCK);

        bool out_open = true;
        bool err_open = true;
        int status = 0;
        bool timed_out = false;
        int poll_errno = 0;
        while (out_open || err_open)
        {
            if (ctx.expired())
            {
                timed_out = true;
                break;
            }
            pollfd fds[2];
            nfds_t count = 0;
            if (out_open)
                fds[count++] = {out_pipe[0], POLLIN, 0};
            if (err_open)
                fds[count++] = {err_pipe[0], POLLIN, 0};
            int ready = poll(fds, count, std::min(ctx.poll_timeout(), 100));
            if (ready < 0 && errno != EINTR)
            {
                poll_errno = errno;
                break;
            }
            if (out_open)
                out_open = drain(out_pipe[0], result.stdout_text);
            if (err_open)
                err_open = drain(err_pipe[0], result.stderr_text);
        }

        // the child may be blocked on a full pipe nobody reads any more
        if (timed_out || poll_errno != 0)
        {
            kill(pid, SIGKILL);
        }
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR)
        {
        }
        close(out_pipe[0]);
        close(err_pipe[0]);

        if (timed_out)
        {
            MUNIVERSE_WARNING("{} killed after the call deadline passed", program);
            return ctx.fail(error::DEADLINE_EXCEEDED(), program + ": context deadline exceeded");
        }
        if (poll_errno != 0)
        {
            MUNIVERSE_ERROR("{} killed after its output could not be polled", program);
            return ctx.fail(error::TRANSPORT_ERROR(), program + ": poll: " + std::strerror(poll_errno));
        }

        if (WIFEXITED(status))
            result.exit_code = WEXITSTATUS(status);
        else if (WIFSIGNALED(status))
            result.exit_code = 128 + WTERMSIG(status);
        return error::OK();
    }
}
