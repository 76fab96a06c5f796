#include "PosixProcessInvoker.hpp"
#include "TextUtils.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace pipeline
{

namespace
{

using Clock = std::chrono::steady_clock;

constexpr std::size_t kReadChunk = 64 * 1024;
constexpr int kSpawnFailureExit = 127;

std::once_flag g_sigpipe_once;

class FdGuard
{
public:
    FdGuard() = default;
    explicit FdGuard(int fd) : fd_(fd) {}
    ~FdGuard() { reset(); }

    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

    void reset(int fd = -1)
    {
        if (fd_ >= 0)
            ::close(fd_);
        fd_ = fd;
    }

private:
    int fd_ = -1;
};

struct PipePair
{
    FdGuard read_end;
    FdGuard write_end;

    bool open()
    {
        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) != 0)
            return false;
        read_end.reset(fds[0]);
        write_end.reset(fds[1]);
        return true;
    }
};

std::string errno_text(int err) { return std::string(std::strerror(err)); }

bool set_nonblocking(int fd)
{
    int flags = ::fcntl(fd, F_GETFL, 0);
    return flags >= 0 && ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

int decode_exit_status(int status)
{
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

void kill_worker(pid_t pid)
{
    // The worker leads its own process group so helpers it spawned go too
    if (::kill(-pid, SIGKILL) != 0)
        ::kill(pid, SIGKILL);
}

int wait_blocking(pid_t pid)
{
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0)
    {
        if (errno != EINTR)
            return -1;
    }
    return decode_exit_status(status);
}

// Only async-signal-safe calls between fork and exec.
[[noreturn]] void exec_child(const std::vector<char*>& argv, int stdin_fd, int stdout_fd, int stderr_fd, int status_fd)
{
    struct sigaction dfl {};
    dfl.sa_handler = SIG_DFL;
    ::sigemptyset(&dfl.sa_mask);
    ::sigaction(SIGPIPE, &dfl, nullptr);

    sigset_t empty;
    ::sigemptyset(&empty);
    ::sigprocmask(SIG_SETMASK, &empty, nullptr);

    ::setpgid(0, 0);

    if (::dup2(stdin_fd, STDIN_FILENO) < 0 || ::dup2(stdout_fd, STDOUT_FILENO) < 0 ||
        ::dup2(stderr_fd, STDERR_FILENO) < 0)
    {
        int err = errno;
        (void)!::write(status_fd, &err, sizeof(err));
        ::_exit(kSpawnFailureExit);
    }

    ::execvp(argv[0], argv.data());

    int err = errno;
    (void)!::write(status_fd, &err, sizeof(err));
    ::_exit(kSpawnFailureExit);
}

} // namespace

PosixProcessInvoker::PosixProcessInvoker()
{
    // A worker that exits without reading stdin must surface as EPIPE, not kill the service
    std::call_once(g_sigpipe_once, []() { std::signal(SIGPIPE, SIG_IGN); });
}

WorkerOutcome PosixProcessInvoker::run(const WorkerInvocation& invocation,
                                       std::optional<std::chrono::milliseconds> timeout)
{
    WorkerOutcome outcome;
    const auto started = Clock::now();
    const bool has_deadline = timeout.has_value() && timeout->count() > 0;
    const auto deadline = has_deadline ? started + *timeout : Clock::time_point::max();

    auto finish = [&](WorkerOutcome& out) -> WorkerOutcome {
        out.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);
        out.stdout_data = trim_whitespace(out.stdout_data);
        return std::move(out);
    };

    if (invocation.command.empty())
    {
        outcome.spawn_error = "empty worker command";
        return finish(outcome);
    }

    std::vector<std::string> argv_storage;
    argv_storage.reserve(invocation.args.size() + 1);
    argv_storage.push_back(invocation.command);
    argv_storage.insert(argv_storage.end(), invocation.args.begin(), invocation.args.end());

    std::vector<char*> argv;
    argv.reserve(argv_storage.size() + 1);
    for (auto& arg : argv_storage)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    PipePair in_pipe, out_pipe, err_pipe, status_pipe;
    if (!in_pipe.open() || !out_pipe.open() || !err_pipe.open() || !status_pipe.open())
    {
        outcome.spawn_error = "pipe() failed: " + errno_text(errno);
        return finish(outcome);
    }

    pid_t pid = ::fork();
    if (pid < 0)
    {
        outcome.spawn_error = "fork() failed: " + errno_text(errno);
        return finish(outcome);
    }

    if (pid == 0)
    {
        exec_child(argv, in_pipe.read_end.get(), out_pipe.write_end.get(), err_pipe.write_end.get(),
                   status_pipe.write_end.get());
    }

    PLOG_DEBUG << "Worker started: pid=" << pid << " command=" << invocation.command
               << " args=" << invocation.args.size();

    in_pipe.read_end.reset();
    out_pipe.write_end.reset();
    err_pipe.write_end.reset();
    status_pipe.write_end.reset();

    // Blocks until exec succeeds (close-on-exec gives EOF) or the child reports errno
    int exec_errno = 0;
    ssize_t status_read = 0;
    do
    {
        status_read = ::read(status_pipe.read_end.get(), &exec_errno, sizeof(exec_errno));
    } while (status_read < 0 && errno == EINTR);

    if (status_read == static_cast<ssize_t>(sizeof(exec_errno)))
    {
        wait_blocking(pid);
        outcome.spawn_error = "failed to start '" + invocation.command + "': " + errno_text(exec_errno);
        PLOG_WARNING << "Worker spawn failed: " << *outcome.spawn_error;
        return finish(outcome);
    }

    const std::string payload = invocation.stdin_payload.value_or(std::string());
    std::size_t payload_offset = 0;
    if (payload.empty())
        in_pipe.write_end.reset();
    else
        set_nonblocking(in_pipe.write_end.get());
    set_nonblocking(out_pipe.read_end.get());
    set_nonblocking(err_pipe.read_end.get());

    std::array<char, kReadChunk> buffer{};
    bool io_failed = false;

    auto drain = [&](FdGuard& fd, std::string& sink) {
        for (;;)
        {
            ssize_t n = ::read(fd.get(), buffer.data(), buffer.size());
            if (n > 0)
            {
                sink.append(buffer.data(), static_cast<std::size_t>(n));
                continue;
            }
            if (n == 0)
            {
                fd.reset();
                return;
            }
            if (errno == EINTR)
                continue;
            if (errno != EAGAIN && errno != EWOULDBLOCK)
                fd.reset();
            return;
        }
    };

    while (out_pipe.read_end.valid() || err_pipe.read_end.valid())
    {
        std::vector<pollfd> fds;
        fds.reserve(3);
        if (out_pipe.read_end.valid())
            fds.push_back({ out_pipe.read_end.get(), POLLIN, 0 });
        if (err_pipe.read_end.valid())
            fds.push_back({ err_pipe.read_end.get(), POLLIN, 0 });
        if (in_pipe.write_end.valid())
            fds.push_back({ in_pipe.write_end.get(), POLLOUT, 0 });

        int wait_ms = -1;
        if (has_deadline)
        {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
            if (remaining.count() <= 0)
            {
                outcome.timed_out = true;
                break;
            }
            wait_ms = static_cast<int>(std::min<long long>(remaining.count(), 1000));
        }

        int ready = ::poll(fds.data(), fds.size(), wait_ms);
        if (ready < 0)
        {
            if (errno == EINTR)
                continue;
            PLOG_ERROR << "poll() failed while running worker: " << errno_text(errno);
            outcome.stderr_data += "\n[cvscrub] poll() failed: " + errno_text(errno);
            io_failed = true;
            break;
        }
        if (ready == 0)
            continue;

        for (const auto& p : fds)
        {
            if (p.revents == 0)
                continue;

            if (p.fd == out_pipe.read_end.get())
            {
                drain(out_pipe.read_end, outcome.stdout_data);
            }
            else if (p.fd == err_pipe.read_end.get())
            {
                drain(err_pipe.read_end, outcome.stderr_data);
            }
            else if (p.fd == in_pipe.write_end.get())
            {
                if (p.revents & (POLLERR | POLLHUP | POLLNVAL))
                {
                    in_pipe.write_end.reset();
                    continue;
                }
                ssize_t n = ::write(in_pipe.write_end.get(), payload.data() + payload_offset,
                                    payload.size() - payload_offset);
                if (n > 0)
                {
                    payload_offset += static_cast<std::size_t>(n);
                    if (payload_offset >= payload.size())
                        in_pipe.write_end.reset();
                }
                else if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)
                {
                    PLOG_DEBUG << "Worker stdin closed early: " << errno_text(errno);
                    in_pipe.write_end.reset();
                }
            }
        }
    }

    in_pipe.write_end.reset();

    if (outcome.timed_out || io_failed)
    {
        kill_worker(pid);
        outcome.exit_code = wait_blocking(pid);
    }
    else if (!has_deadline)
    {
        outcome.exit_code = wait_blocking(pid);
    }
    else
    {
        // Output is closed but the worker may still be running
        for (;;)
        {
            int status = 0;
            pid_t r = ::waitpid(pid, &status, WNOHANG);
            if (r == pid)
            {
                outcome.exit_code = decode_exit_status(status);
                break;
            }
            if (r < 0 && errno != EINTR)
            {
                outcome.exit_code = -1;
                break;
            }
            if (Clock::now() >= deadline)
            {
                outcome.timed_out = true;
                kill_worker(pid);
                outcome.exit_code = wait_blocking(pid);
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }

    if (outcome.timed_out)
        PLOG_WARNING << "Worker timed out and was killed: pid=" << pid << " command=" << invocation.command;
    else
        PLOG_DEBUG << "Worker finished: pid=" << pid << " exit=" << outcome.exit_code
                   << " stdout=" << outcome.stdout_data.size() << "B stderr=" << outcome.stderr_data.size() << "B";

    return finish(outcome);
}

} // namespace pipeline
