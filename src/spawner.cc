#include <algorithm>
#include <array>
#include <cerrno>
#include <climits>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <linux/close_range.h>
#include <poll.h>
#include <runlib/call_in_destructor.hh>
#include <runlib/concat_tostr.hh>
#include <runlib/debug_logger.hh>
#include <runlib/errmsg.hh>
#include <runlib/file_contents.hh>
#include <runlib/file_descriptor.hh>
#include <runlib/macros/throw.hh>
#include <runlib/pipe.hh>
#include <runlib/spawner.hh>
#include <runlib/syscalls.hh>
#include <sys/wait.h>
#include <unistd.h>

using std::string;
using std::vector;

namespace {

constexpr DebugLogger<false> debuglog;

using Clock = std::chrono::steady_clock;

// Sends @p errnum and the name of the failed call through @p fd and _exits with -1
[[noreturn]] void send_error_and_exit(int fd, int errnum, const char* what) noexcept {
    (void)write_all(fd, &errnum, sizeof(errnum));
    (void)write_all(fd, what, std::strlen(what));
    _exit(-1);
}

// Executed in the child process after fork(), only async-signal-safe calls are allowed
[[noreturn]] void run_child(
    const vector<char*>& argv,
    const Spawner::Options& opts,
    int stdin_fd,
    int stdout_fd,
    int stderr_fd,
    int error_fd
) noexcept {
    if (setpgid(0, 0)) {
        send_error_and_exit(error_fd, errno, "setpgid()");
    }

    sigset_t mask;
    sigemptyset(&mask);
    if (sigprocmask(SIG_SETMASK, &mask, nullptr)) {
        send_error_and_exit(error_fd, errno, "sigprocmask()");
    }
    // Ignored signals stay ignored across execvp(), the parent may ignore SIGPIPE
    struct sigaction sa {};
    sa.sa_handler = SIG_DFL;
    if (sigaction(SIGPIPE, &sa, nullptr)) {
        send_error_and_exit(error_fd, errno, "sigaction(SIGPIPE)");
    }

    if (dup2(stdin_fd, STDIN_FILENO) == -1) {
        send_error_and_exit(error_fd, errno, "dup2()");
    }
    if (dup2(stdout_fd, STDOUT_FILENO) == -1) {
        send_error_and_exit(error_fd, errno, "dup2()");
    }
    if (dup2(stderr_fd, STDERR_FILENO) == -1) {
        send_error_and_exit(error_fd, errno, "dup2()");
    }

    // Descriptors not created with O_CLOEXEC by other threads must not leak
    if (close_range(STDERR_FILENO + 1, ~0U, CLOSE_RANGE_CLOEXEC)) {
        send_error_and_exit(error_fd, errno, "close_range()");
    }

    if (not opts.working_dir.empty() and chdir(opts.working_dir.c_str())) {
        send_error_and_exit(error_fd, errno, "chdir()");
    }

    execvp(argv[0], argv.data());
    send_error_and_exit(error_fd, errno, "execvp()");
}

struct CapturedStream {
    FileDescriptor fd;
    string data;
    bool truncated = false;
};

// Reads what is available in @p stream without blocking, returns false on EOF
bool read_available(CapturedStream& stream, size_t max_size) {
    std::array<char, 1 << 16> buff; // NOLINT(cppcoreguidelines-pro-type-member-init)
    for (;;) {
        auto len = read(stream.fd, buff.data(), buff.size());
        if (len == 0) {
            return false;
        }
        if (len < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN) {
                return true;
            }
            THROW("read()", errmsg());
        }

        auto ulen = static_cast<size_t>(len);
        auto space_left = max_size - std::min(max_size, stream.data.size());
        if (ulen > space_left) {
            stream.truncated = true;
        }
        stream.data.append(buff.data(), std::min(ulen, space_left));
    }
}

void kill_process_group(pid_t pgid) noexcept {
    // ESRCH is expected if the whole group is already gone
    (void)kill(-pgid, SIGKILL);
}

siginfo_t reap(pid_t pid) {
    siginfo_t si{};
    while (syscalls::waitid(P_PID, pid, &si, WEXITED, nullptr)) {
        if (errno != EINTR) {
            THROW("waitid()", errmsg());
        }
    }
    return si;
}

} // namespace

string Spawner::Si::description() const {
    auto signal_description = [](const char* prefix, int signum) {
        auto abbrev = sigabbrev_np(signum);
        auto desc = sigdescr_np(signum);
        if (abbrev) {
            if (desc) {
                return concat_tostr(prefix, ' ', abbrev, " - ", desc);
            }
            return concat_tostr(prefix, ' ', abbrev);
        }
        if (desc) {
            return concat_tostr(prefix, " with number ", signum, " - ", desc);
        }
        return concat_tostr(prefix, " with number ", signum);
    };
    switch (code) {
    case CLD_EXITED: return concat_tostr("exited with ", status);
    case CLD_KILLED: return signal_description("killed by signal", status);
    case CLD_DUMPED: return signal_description("killed and dumped by signal", status);
    case CLD_TRAPPED: return signal_description("trapped by signal", status);
    case CLD_STOPPED: return signal_description("stopped by signal", status);
    case CLD_CONTINUED: return signal_description("continued by signal", status);
    }
    return concat_tostr("unable to describe (code ", code, ", status ", status, ')');
}

bool Spawner::ExitStat::exited_normally() const noexcept {
    return not timed_out and si == Si{.code = CLD_EXITED, .status = 0};
}

Result<Spawner::ExitStat, Spawner::SpawnError>
Spawner::run(const vector<string>& argv, const Options& opts) {
    if (argv.empty()) {
        THROW("Spawner::run(): argv cannot be empty");
    }

    // Running out of descriptors or processes means the process cannot be started
    auto resource_error = [](auto&&... what) {
        return Err{SpawnError{.description = concat_tostr(what..., errmsg())}};
    };

    FileDescriptor stdin_fd{opts.stdin_file.value_or("/dev/null"), O_RDONLY | O_CLOEXEC};
    if (not stdin_fd.is_open()) {
        return resource_error("open('", opts.stdin_file.value_or("/dev/null"), "')");
    }

    auto stdout_pipe = pipe2(O_CLOEXEC);
    if (not stdout_pipe) {
        return resource_error("pipe2()");
    }
    auto stderr_pipe = pipe2(O_CLOEXEC);
    if (not stderr_pipe) {
        return resource_error("pipe2()");
    }
    auto error_pipe = pipe2(O_CLOEXEC);
    if (not error_pipe) {
        return resource_error("pipe2()");
    }
    if (fcntl(stdout_pipe->readable, F_SETFL, O_NONBLOCK) or
        fcntl(stderr_pipe->readable, F_SETFL, O_NONBLOCK))
    {
        THROW("fcntl()", errmsg());
    }

    // Prepare everything the child needs before fork(), allocating afterwards is unsafe
    vector<char*> child_argv;
    child_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        child_argv.emplace_back(const_cast<char*>(arg.c_str()));
    }
    child_argv.emplace_back(nullptr);

    debuglog("Spawner: running ", argv[0]);
    auto start = Clock::now();
    pid_t pid = fork();
    if (pid == -1) {
        return resource_error("fork()");
    }
    if (pid == 0) {
        run_child(
            child_argv, opts, stdin_fd, stdout_pipe->writable, stderr_pipe->writable,
            error_pipe->writable
        );
    }

    CallInDtor kill_and_reap_child = [pid] {
        kill_process_group(pid);
        (void)kill(pid, SIGKILL);
        siginfo_t si;
        while (syscalls::waitid(P_PID, pid, &si, WEXITED, nullptr) and errno == EINTR) {
        }
    };
    // Closes the race with the child's own setpgid() (EACCES after execve() is fine)
    (void)setpgid(pid, pid);

    (void)stdin_fd.close();
    (void)stdout_pipe->writable.close();
    (void)stderr_pipe->writable.close();
    (void)error_pipe->writable.close();

    // The error pipe is closed on a successful execvp() by O_CLOEXEC
    auto child_error = get_file_contents(error_pipe->readable);
    if (not child_error.empty()) {
        kill_and_reap_child.call_and_cancel();
        int errnum = 0;
        if (child_error.size() >= sizeof(errnum)) {
            std::memcpy(&errnum, child_error.data(), sizeof(errnum));
            child_error.erase(0, sizeof(errnum));
        }
        debuglog("Spawner: failed to start ", argv[0], ": ", child_error, errmsg(errnum));
        return Err{SpawnError{
            .description = concat_tostr(child_error, errmsg(errnum)),
        }};
    }

    FileDescriptor pidfd{syscalls::pidfd_open(pid, 0)};
    if (not pidfd.is_open()) {
        THROW("pidfd_open()", errmsg());
    }

    CapturedStream out{.fd = std::move(stdout_pipe->readable)};
    CapturedStream err{.fd = std::move(stderr_pipe->readable)};

    enum {
        STDOUT = 0,
        STDERR = 1,
        PIDFD = 2,
    };
    std::array<pollfd, 3> pfds;
    pfds[STDOUT] = {.fd = out.fd, .events = POLLIN, .revents = 0};
    pfds[STDERR] = {.fd = err.fd, .events = POLLIN, .revents = 0};
    pfds[PIDFD] = {.fd = pidfd, .events = POLLIN, .revents = 0};

    std::optional<Clock::time_point> deadline;
    // A limit too large to be represented means no limit
    if (opts.time_limit and *opts.time_limit < Clock::time_point::max() - start) {
        deadline = start + *opts.time_limit;
    }

    ExitStat res;
    for (;;) {
        int timeout_ms = -1;
        if (deadline) {
            auto now = Clock::now();
            if (now >= *deadline) {
                debuglog("Spawner: ", argv[0], " timed out");
                res.timed_out = true;
                kill_process_group(pid);
                break;
            }
            // Round up, so that poll() does not return just before the deadline
            timeout_ms = static_cast<int>(std::min<std::chrono::milliseconds::rep>(
                std::chrono::ceil<std::chrono::milliseconds>(*deadline - now).count(), INT_MAX
            ));
        }

        for (auto& pfd : pfds) {
            pfd.revents = 0;
        }
        int rc = poll(pfds.data(), pfds.size(), timeout_ms);
        if (rc == -1) {
            if (errno == EINTR) {
                continue;
            }
            THROW("poll()", errmsg());
        }

        if (pfds[STDOUT].revents and not read_available(out, opts.max_output_size_in_bytes)) {
            pfds[STDOUT].fd = -1;
        }
        if (pfds[STDERR].revents and not read_available(err, opts.max_output_size_in_bytes)) {
            pfds[STDERR].fd = -1;
        }
        if (pfds[PIDFD].revents & POLLIN) {
            break; // The process has exited
        }
    }

    // Descendants may still be alive and hold the pipes open
    kill_process_group(pid);
    auto si = reap(pid);
    res.runtime = Clock::now() - start;
    kill_and_reap_child.cancel();

    if (pfds[STDOUT].fd >= 0) {
        (void)read_available(out, opts.max_output_size_in_bytes);
    }
    if (pfds[STDERR].fd >= 0) {
        (void)read_available(err, opts.max_output_size_in_bytes);
    }

    res.si = {.code = si.si_code, .status = si.si_status};
    res.stdout_data = std::move(out.data);
    res.stdout_truncated = out.truncated;
    res.stderr_data = std::move(err.data);
    res.stderr_truncated = err.truncated;
    debuglog(
        "Spawner: ", argv[0], ' ', res.si_description(), " after ",
        std::chrono::duration_cast<std::chrono::milliseconds>(res.runtime).count(), " ms"
    );
    return Ok{std::move(res)};
}
