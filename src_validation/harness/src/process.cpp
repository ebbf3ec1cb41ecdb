#include "wasi_conformance/process.hpp"
#include "wasi_conformance/errors.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

using wasi::conformance::ProcessLaunchError;

constexpr int kPollSliceMs = 50;
constexpr std::size_t kReadChunk = 64 * 1024;

class FileDescriptor {
public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) noexcept : fd_(fd) {}
    ~FileDescriptor() { reset(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    FileDescriptor(FileDescriptor&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = std::exchange(other.fd_, -1);
        }
        return *this;
    }

    [[nodiscard]] int get() const noexcept { return fd_; }
    [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }

    void reset() noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_{-1};
};

struct Pipe {
    FileDescriptor read;
    FileDescriptor write;
};

std::string errno_text(int err) {
    return std::strerror(err);
}

Pipe make_pipe(const std::string& program) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        const int err = errno;
        throw ProcessLaunchError("pipe() failed while launching '" + program + "': " + errno_text(err), err);
    }
    return Pipe{FileDescriptor{fds[0]}, FileDescriptor{fds[1]}};
}

void set_nonblocking(const FileDescriptor& fd) {
    const int flags = ::fcntl(fd.get(), F_GETFL);
    if (flags >= 0) {
        ::fcntl(fd.get(), F_SETFL, flags | O_NONBLOCK);
    }
}

// Only async-signal-safe calls between fork() and exec().
[[noreturn]] void child_fail(int status_fd) {
    const int err = errno;
    [[maybe_unused]] const auto written = ::write(status_fd, &err, sizeof(err));
    ::_exit(127);
}

// Reads everything currently available; closes the descriptor on EOF.
void drain(FileDescriptor& fd, std::string& sink) {
    char buffer[kReadChunk];
    while (fd.valid()) {
        const auto n = ::read(fd.get(), buffer, sizeof(buffer));
        if (n > 0) {
            sink.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0) {
            fd.reset();
            return;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            fd.reset();
        }
        return;
    }
}

void feed(FileDescriptor& fd, const std::string& data, std::size_t& offset) {
    while (fd.valid() && offset < data.size()) {
        const auto chunk = std::min(data.size() - offset, kReadChunk);
        const auto n = ::write(fd.get(), data.data() + offset, chunk);
        if (n > 0) {
            offset += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        // EPIPE: the child closed its stdin early, which is its business.
        fd.reset();
        return;
    }
    fd.reset();
}

int wait_blocking(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    return status;
}

void ignore_sigpipe_once() {
    static std::once_flag flag;
    std::call_once(flag, [] { ::signal(SIGPIPE, SIG_IGN); });
}

}  // namespace

namespace wasi::conformance {

ProcessLauncher::ProcessLauncher(Config config) : config_{config} {
    ignore_sigpipe_once();
}

ProcessOutput ProcessLauncher::run(const ProcessSpec& spec) const {
    if (spec.argv.empty()) {
        throw ProcessLaunchError("Empty command line", EINVAL);
    }
    const std::string& program = spec.argv.front();

    // Everything the child touches is prepared before fork().
    std::vector<char*> argv;
    argv.reserve(spec.argv.size() + 1);
    for (const auto& arg : spec.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    const std::string cwd = spec.working_directory.string();

    Pipe in = make_pipe(program);
    Pipe out = make_pipe(program);
    Pipe err = make_pipe(program);
    Pipe status = make_pipe(program);

    const pid_t pid = ::fork();
    if (pid < 0) {
        const int e = errno;
        throw ProcessLaunchError("fork() failed while launching '" + program + "': " + errno_text(e), e);
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        if (::dup2(in.read.get(), STDIN_FILENO) < 0 || ::dup2(out.write.get(), STDOUT_FILENO) < 0 ||
            ::dup2(err.write.get(), STDERR_FILENO) < 0) {
            child_fail(status.write.get());
        }
        if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
            child_fail(status.write.get());
        }
        // An ignored disposition survives exec; give the child the default back.
        ::signal(SIGPIPE, SIG_DFL);
        ::execvp(argv[0], argv.data());
        child_fail(status.write.get());
    }

    // Both sides set the group to close the race with an early kill().
    ::setpgid(pid, pid);

    in.read.reset();
    out.write.reset();
    err.write.reset();
    status.write.reset();

    int child_errno = 0;
    ssize_t got = 0;
    do {
        got = ::read(status.read.get(), &child_errno, sizeof(child_errno));
    } while (got < 0 && errno == EINTR);
    if (got == static_cast<ssize_t>(sizeof(child_errno))) {
        wait_blocking(pid);
        throw ProcessLaunchError("Failed to launch '" + program + "': " + errno_text(child_errno),
                                 child_errno);
    }
    status.read.reset();

    FileDescriptor stdin_fd = std::move(in.write);
    FileDescriptor stdout_fd = std::move(out.read);
    FileDescriptor stderr_fd = std::move(err.read);
    set_nonblocking(stdin_fd);
    set_nonblocking(stdout_fd);
    set_nonblocking(stderr_fd);

    const std::string no_input;
    const std::string& input = spec.stdin_data ? *spec.stdin_data : no_input;
    std::size_t input_offset = 0;
    if (input.empty()) {
        stdin_fd.reset();
    }

    ProcessOutput output;
    const bool bounded = config_.deadline.has_value() || config_.timeout.count() > 0;
    const auto deadline = config_.deadline ? *config_.deadline : std::chrono::steady_clock::now() + config_.timeout;

    bool reaped = false;
    bool cancelled = false;
    int wait_status = 0;

    auto kill_group = [&]() {
        ::kill(-pid, SIGKILL);
        if (!reaped) {
            ::kill(pid, SIGKILL);
        }
    };

    while (true) {
        if (!reaped) {
            const pid_t r = ::waitpid(pid, &wait_status, WNOHANG);
            if (r == pid) {
                reaped = true;
            }
        }
        // Wait for EOF as well: a descendant may still be writing into the pipes.
        if (reaped && !stdout_fd.valid() && !stderr_fd.valid()) {
            break;
        }

        if (config_.cancel != nullptr && config_.cancel->load()) {
            cancelled = true;
            kill_group();
            break;
        }

        int wait_ms = kPollSliceMs;
        if (bounded) {
            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                output.timed_out = true;
                kill_group();
                break;
            }
            wait_ms = static_cast<int>(std::min<std::chrono::milliseconds::rep>(remaining.count(), wait_ms));
        }

        std::array<pollfd, 3> fds{};
        nfds_t count = 0;
        if (stdout_fd.valid()) {
            fds[count++] = pollfd{stdout_fd.get(), POLLIN, 0};
        }
        if (stderr_fd.valid()) {
            fds[count++] = pollfd{stderr_fd.get(), POLLIN, 0};
        }
        if (stdin_fd.valid()) {
            fds[count++] = pollfd{stdin_fd.get(), POLLOUT, 0};
        }
        if (count == 0) {
            // Pipes closed but the child lives on; poll() doubles as a short sleep.
            wait_ms = std::min(wait_ms, 10);
        }

        const int rc = ::poll(fds.data(), count, wait_ms);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            const int e = errno;
            kill_group();
            if (!reaped) {
                wait_blocking(pid);
            }
            throw ProcessLaunchError("poll() failed while running '" + program + "': " + errno_text(e), e);
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0) {
                continue;
            }
            if (fds[i].fd == stdout_fd.get()) {
                drain(stdout_fd, output.stdout_bytes);
            } else if (fds[i].fd == stderr_fd.get()) {
                drain(stderr_fd, output.stderr_bytes);
            } else if (fds[i].fd == stdin_fd.get()) {
                feed(stdin_fd, input, input_offset);
            }
        }
    }

    stdin_fd.reset();
    stdout_fd.reset();
    stderr_fd.reset();
    if (!reaped) {
        wait_status = wait_blocking(pid);
    }

    if (cancelled) {
        throw RunInterrupted("Run interrupted while '" + program + "' was executing");
    }

    if (WIFEXITED(wait_status)) {
        output.exit_code = WEXITSTATUS(wait_status);
    } else if (WIFSIGNALED(wait_status)) {
        output.term_signal = WTERMSIG(wait_status);
        output.exit_code = -output.term_signal;
    }
    return output;
}

}  // namespace wasi::conformance
