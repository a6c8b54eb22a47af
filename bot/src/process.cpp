#include "clipferry/bot/process.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

extern char **environ;

namespace clipferry::bot
{

    namespace
    {

        class FileDescriptor
        {
        public:
            FileDescriptor() = default;
            explicit FileDescriptor(int fd) : fd_(fd) {}
            ~FileDescriptor() { reset(); }

            FileDescriptor(const FileDescriptor &) = delete;
            FileDescriptor &operator=(const FileDescriptor &) = delete;

            FileDescriptor(FileDescriptor &&other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
            FileDescriptor &operator=(FileDescriptor &&other) noexcept
            {
                if (this != &other)
                {
                    reset();
                    fd_ = other.fd_;
                    other.fd_ = -1;
                }
                return *this;
            }

            int get() const noexcept { return fd_; }

            void reset() noexcept
            {
                if (fd_ >= 0)
                {
                    ::close(fd_);
                    fd_ = -1;
                }
            }

        private:
            int fd_{-1};
        };

        struct Pipe
        {
            FileDescriptor read_end;
            FileDescriptor write_end;
        };

        void open_pipe(Pipe &pipe)
        {
            std::array<int, 2> fds{};
            if (::pipe2(fds.data(), O_CLOEXEC) != 0)
            {
                throw std::system_error(errno, std::generic_category(), "pipe2 failed");
            }
            pipe.read_end = FileDescriptor(fds[0]);
            pipe.write_end = FileDescriptor(fds[1]);
            const int flags = ::fcntl(fds[0], F_GETFL);
            ::fcntl(fds[0], F_SETFL, flags | O_NONBLOCK);
        }

        class SpawnActions
        {
        public:
            SpawnActions() { ::posix_spawn_file_actions_init(&actions_); }
            ~SpawnActions() { ::posix_spawn_file_actions_destroy(&actions_); }

            SpawnActions(const SpawnActions &) = delete;
            SpawnActions &operator=(const SpawnActions &) = delete;

            posix_spawn_file_actions_t *get() noexcept { return &actions_; }

        private:
            posix_spawn_file_actions_t actions_{};
        };

        // Drains whatever is readable; returns false once the peer closed the pipe.
        bool drain(int fd, std::string &sink)
        {
            std::array<char, 64 * 1024> buffer{};
            while (true)
            {
                const auto count = ::read(fd, buffer.data(), buffer.size());
                if (count > 0)
                {
                    sink.append(buffer.data(), static_cast<std::size_t>(count));
                    continue;
                }
                if (count == 0)
                {
                    return false;
                }
                if (errno == EINTR)
                {
                    continue;
                }
                return errno == EAGAIN || errno == EWOULDBLOCK;
            }
        }

        int decode_status(int status)
        {
            if (WIFEXITED(status))
            {
                return WEXITSTATUS(status);
            }
            if (WIFSIGNALED(status))
            {
                return 128 + WTERMSIG(status);
            }
            return -1;
        }

    } // namespace

    ProcessResult run_process(const std::string &program, const std::vector<std::string> &args,
                              std::chrono::milliseconds timeout)
    {
        Pipe out;
        Pipe err;
        open_pipe(out);
        open_pipe(err);

        SpawnActions actions;
        ::posix_spawn_file_actions_addopen(actions.get(), STDIN_FILENO, "/dev/null", O_RDONLY, 0);
        ::posix_spawn_file_actions_adddup2(actions.get(), out.write_end.get(), STDOUT_FILENO);
        ::posix_spawn_file_actions_adddup2(actions.get(), err.write_end.get(), STDERR_FILENO);

        std::vector<char *> argv;
        argv.reserve(args.size() + 2);
        argv.push_back(const_cast<char *>(program.c_str()));
        for (const auto &arg : args)
        {
            argv.push_back(const_cast<char *>(arg.c_str()));
        }
        argv.push_back(nullptr);

        pid_t pid = 0;
        const int spawn_rc = ::posix_spawnp(&pid, program.c_str(), actions.get(), nullptr, argv.data(), environ);
        out.write_end.reset();
        err.write_end.reset();
        if (spawn_rc != 0)
        {
            throw std::system_error(spawn_rc, std::generic_category(), "Failed to launch " + program);
        }
        spdlog::debug("Launched {} (pid {})", program, pid);

        ProcessResult result;
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        std::array<pollfd, 2> fds{{{out.read_end.get(), POLLIN, 0}, {err.read_end.get(), POLLIN, 0}}};
        std::array<std::string *, 2> sinks{&result.standard_output, &result.standard_error};
        std::size_t open_streams = fds.size();

        while (open_streams > 0)
        {
            const auto remaining =
                std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0)
            {
                result.timed_out = true;
                break;
            }
            const auto wait_ms = static_cast<int>(std::min<std::chrono::milliseconds::rep>(remaining.count(), 200));
            const int ready = ::poll(fds.data(), fds.size(), wait_ms);
            if (ready < 0)
            {
                if (errno == EINTR)
                {
                    continue;
                }
                throw std::system_error(errno, std::generic_category(), "poll failed");
            }
            for (std::size_t i = 0; i < fds.size(); ++i)
            {
                if (fds[i].fd < 0 || (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0)
                {
                    continue;
                }
                if (!drain(fds[i].fd, *sinks[i]))
                {
                    fds[i].fd = -1;
                    --open_streams;
                }
            }
        }

        int status = 0;
        while (!result.timed_out)
        {
            const auto waited = ::waitpid(pid, &status, WNOHANG);
            if (waited == pid)
            {
                result.exit_code = decode_status(status);
                break;
            }
            if (waited < 0 && errno != EINTR)
            {
                throw std::system_error(errno, std::generic_category(), "waitpid failed");
            }
            if (std::chrono::steady_clock::now() >= deadline)
            {
                result.timed_out = true;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }

        if (result.timed_out)
        {
            spdlog::warn("{} (pid {}) exceeded {} ms, killing it", program, pid, timeout.count());
            ::kill(pid, SIGKILL);
            while (::waitpid(pid, &status, 0) < 0 && errno == EINTR)
            {
            }
            result.exit_code = decode_status(status);
        }

        spdlog::debug("{} (pid {}) exited with {}", program, pid, result.exit_code);
        return result;
    }

    std::string last_line(const std::string &text)
    {
        auto end = text.find_last_not_of(" \t\r\n");
        if (end == std::string::npos)
        {
            return {};
        }
        const auto begin = text.rfind('\n', end);
        const auto start = begin == std::string::npos ? 0 : begin + 1;
        return text.substr(start, end - start + 1);
    }

} // namespace clipferry::bot
