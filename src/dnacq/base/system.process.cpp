#include <dnacq/base/checks.h>
#include <dnacq/base/chrono.h>
#include <dnacq/base/messages.h>
#include <dnacq/base/strings.h>
#include <dnacq/base/system.debug.h>
#include <dnacq/base/system.h>
#include <dnacq/base/system.process.h>

#include <atomic>
#include <initializer_list>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace
{
    using namespace dnacq;

    std::atomic<int32_t> g_debug_id(0);

    // Owns a file descriptor; -1 when empty.
    struct ScopedFd
    {
        ScopedFd() = default;
        ScopedFd(const ScopedFd&) = delete;
        ScopedFd& operator=(const ScopedFd&) = delete;
        ~ScopedFd() { reset(); }

        void reset() noexcept
        {
            if (fd >= 0)
            {
                ::close(fd);
                fd = -1;
            }
        }

        explicit operator bool() const noexcept { return fd >= 0; }

        int fd = -1;
    };

    // Both ends are close-on-exec so that only the descriptors dup2'd by the spawn actions reach the child.
    struct Pipe
    {
        ScopedFd read_end;
        ScopedFd write_end;

        Optional<LocalizedString> open()
        {
            int ends[2];
#if defined(__APPLE__)
            if (::pipe(ends) != 0)
            {
                return format_system_error_message("pipe", errno);
            }

            read_end.fd = ends[0];
            write_end.fd = ends[1];
            if (::fcntl(ends[0], F_SETFD, FD_CLOEXEC) != 0 || ::fcntl(ends[1], F_SETFD, FD_CLOEXEC) != 0)
            {
                return format_system_error_message("fcntl", errno);
            }
#else  // ^^^ __APPLE__ // !__APPLE__ vvv
            if (::pipe2(ends, O_CLOEXEC) != 0)
            {
                return format_system_error_message("pipe2", errno);
            }

            read_end.fd = ends[0];
            write_end.fd = ends[1];
#endif // ^^^ !__APPLE__
            return nullopt;
        }
    };

    struct SpawnFileActions
    {
        posix_spawn_file_actions_t actions;

        SpawnFileActions() { Checks::check_exit(DNACQ_LINE_INFO, posix_spawn_file_actions_init(&actions) == 0); }
        SpawnFileActions(const SpawnFileActions&) = delete;
        SpawnFileActions& operator=(const SpawnFileActions&) = delete;
        ~SpawnFileActions() { posix_spawn_file_actions_destroy(&actions); }

        // stdin from the null device; stdout to out; stderr to err
        Optional<LocalizedString> redirect_standard_streams(int out, int err)
        {
            int rc = posix_spawn_file_actions_addopen(&actions, 0, "/dev/null", O_RDONLY, 0);
            if (rc != 0)
            {
                return format_system_error_message("posix_spawn_file_actions_addopen", rc);
            }

            for (auto&& mapping : {std::make_pair(out, 1), std::make_pair(err, 2)})
            {
                rc = posix_spawn_file_actions_adddup2(&actions, mapping.first, mapping.second);
                if (rc != 0)
                {
                    return format_system_error_message("posix_spawn_file_actions_adddup2", rc);
                }
            }

            return nullopt;
        }
    };

    ExitCodeIntegral decode_wait_status(int status) noexcept
    {
        if (WIFEXITED(status)) return WEXITSTATUS(status);
        if (WIFSIGNALED(status)) return WTERMSIG(status);
        if (WIFSTOPPED(status)) return WSTOPSIG(status);
        return -1;
    }

    // A spawned child that is always reaped, even on early return.
    struct ChildProcess
    {
        ChildProcess() = default;
        ChildProcess(const ChildProcess&) = delete;
        ChildProcess& operator=(const ChildProcess&) = delete;
        ~ChildProcess()
        {
            if (pid != -1)
            {
                (void)wait();
            }
        }

        ExpectedL<ExitCodeIntegral> wait()
        {
            int status = 0;
            pid_t reaped;
            do
            {
                reaped = ::waitpid(pid, &status, 0);
            } while (reaped == -1 && errno == EINTR);

            const int wait_errno = errno;
            const bool ok = reaped == pid;
            pid = -1;
            if (!ok)
            {
                return format_system_error_message("waitpid", wait_errno);
            }

            return decode_wait_status(status);
        }

        pid_t pid = -1;
    };

    struct CapturedStream
    {
        ScopedFd* source;
        std::string* destination;
    };

    // Reads every stream until each reaches end of file.
    Optional<LocalizedString> drain(std::vector<CapturedStream>& streams, int32_t debug_id, EchoInDebug echo)
    {
        char buffer[1024];
        std::vector<pollfd> polls;
        std::vector<CapturedStream*> polled;
        for (;;)
        {
            polls.clear();
            polled.clear();
            for (auto&& stream : streams)
            {
                if (*stream.source)
                {
                    polls.push_back(pollfd{stream.source->fd, POLLIN, 0});
                    polled.push_back(&stream);
                }
            }

            if (polls.empty())
            {
                return nullopt;
            }

            if (::poll(polls.data(), static_cast<nfds_t>(polls.size()), -1) < 0)
            {
                if (errno == EINTR) continue;
                return format_system_error_message("poll", errno);
            }

            for (size_t idx = 0; idx < polls.size(); ++idx)
            {
                if ((polls[idx].revents & (POLLIN | POLLHUP | POLLERR)) == 0)
                {
                    continue;
                }

                auto& stream = *polled[idx];
                const auto count = ::read(stream.source->fd, buffer, sizeof(buffer));
                if (count < 0)
                {
                    if (errno == EINTR) continue;
                    return format_system_error_message("read", errno);
                }

                if (count == 0)
                {
                    stream.source->reset();
                    continue;
                }

                const StringView chunk{buffer, static_cast<size_t>(count)};
                if (echo == EchoInDebug::Show)
                {
                    Debug::print(debug_id, ": ", chunk);
                }

                stream.destination->append(chunk.data(), chunk.size());
            }
        }
    }

    // Runs cmd with `/bin/sh -c`. When stderr_destination is null, stderr is merged into stdout.
    ExpectedL<ExitCodeIntegral> spawn_and_collect(const Command& cmd,
                                                  const RedirectedProcessLaunchSettings& settings,
                                                  std::string& stdout_destination,
                                                  std::string* stderr_destination)
    {
        const auto debug_id = g_debug_id.fetch_add(1, std::memory_order_relaxed);
        const ElapsedTimer timer;
        std::string command_line = cmd.command_line().to_string();
        Debug::println(debug_id, ": execute_process(", command_line, ')');
        fflush(stdout);

        // outlives the pipes: the read ends close before the destructor reaps the child
        ChildProcess child;
        Pipe out;
        Pipe err;
        Optional<LocalizedString> setup_error = out.open();
        if (!setup_error && stderr_destination)
        {
            setup_error = err.open();
        }

        SpawnFileActions actions;
        if (!setup_error)
        {
            setup_error = actions.redirect_standard_streams(out.write_end.fd,
                                                            stderr_destination ? err.write_end.fd : out.write_end.fd);
        }

        if (auto error = setup_error.get())
        {
            return std::move(*error);
        }

        char shell_name[] = "sh";
        char dash_c[] = "-c";
        char* argv[] = {shell_name, dash_c, &command_line[0], nullptr};

        const int spawn_error = ::posix_spawn(&child.pid, "/bin/sh", &actions.actions, nullptr, argv, environ);
        if (spawn_error != 0)
        {
            child.pid = -1;
            return format_system_error_message("posix_spawn", spawn_error);
        }

        out.write_end.reset();
        err.write_end.reset();

        std::vector<CapturedStream> streams{{&out.read_end, &stdout_destination}};
        if (stderr_destination)
        {
            streams.push_back({&err.read_end, stderr_destination});
        }

        auto maybe_read_error = drain(streams, debug_id, settings.echo_in_debug);
        if (auto read_error = maybe_read_error.get())
        {
            return std::move(*read_error);
        }

        auto exit_code = child.wait();
        if (auto code = exit_code.get())
        {
            Debug::println(debug_id, ": process exited with ", *code, " after ", timer);
        }

        return exit_code;
    }
}

namespace dnacq
{
    void append_shell_escaped(std::string& target, StringView content)
    {
        if (Strings::find_first_of(content, " \t\n\r\"\\`$,;&^|'()") == content.end())
        {
            target.append(content.data(), content.size());
            return;
        }

        target.push_back('"');
        // These keep their special meaning inside double quotes.
        for (auto ch : content)
        {
            if (ch == '\\' || ch == '"' || ch == '`' || ch == '$')
            {
                target.push_back('\\');
            }

            target.push_back(ch);
        }

        target.push_back('"');
    }

    Command& Command::string_arg(StringView s) &
    {
        if (!buf.empty()) buf.push_back(' ');
        append_shell_escaped(buf, s);
        return *this;
    }

    Command& Command::raw_arg(StringView s) &
    {
        if (!buf.empty()) buf.push_back(' ');
        buf.append(s.data(), s.size());
        return *this;
    }

    ExpectedL<ExitCodeAndOutput> cmd_execute_and_capture_output(const Command& cmd,
                                                                const RedirectedProcessLaunchSettings& settings)
    {
        std::string output;
        return spawn_and_collect(cmd, settings, output, nullptr).map([&](ExitCodeIntegral exit_code) {
            return ExitCodeAndOutput{exit_code, std::move(output)};
        });
    }

    ExpectedL<ExitCodeAndSplitOutput> cmd_execute_and_capture_split_output(
        const Command& cmd, const RedirectedProcessLaunchSettings& settings)
    {
        std::string standard_output;
        std::string standard_error;
        return spawn_and_collect(cmd, settings, standard_output, &standard_error)
            .map([&](ExitCodeIntegral exit_code) {
                return ExitCodeAndSplitOutput{exit_code, std::move(standard_output), std::move(standard_error)};
            });
    }
}
