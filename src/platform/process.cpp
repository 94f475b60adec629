#include "process.hpp"
#include "platform.hpp"

#include <unistd.h>
#include <sys/wait.h>
#include <signal.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <chrono>
#include <mutex>

extern char** environ;

namespace platform {

namespace {

// Writing a manifest to a child that already exited must not kill us.
void ignore_sigpipe_once() {
    static std::once_flag flag;
    std::call_once(flag, [] { signal(SIGPIPE, SIG_IGN); });
}

// Inherited environment with extra_env applied on top.
std::vector<std::string> build_environment(const EnvList& extra_env) {
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        bool overridden = false;
        for (const auto& kv : extra_env) {
            if (entry.compare(0, kv.first.size() + 1, kv.first + "=") == 0) {
                overridden = true;
                break;
            }
        }
        if (!overridden) env.push_back(std::move(entry));
    }
    for (const auto& kv : extra_env) env.push_back(kv.first + "=" + kv.second);
    return env;
}

std::vector<char*> to_cstrings(std::vector<std::string>& v) {
    std::vector<char*> out;
    out.reserve(v.size() + 1);
    for (auto& s : v) out.push_back(s.data());
    out.push_back(nullptr);
    return out;
}

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

} // namespace

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
    if (valid() && !reaped_) terminate();
    close_fds();
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept {
    pid_ = other.pid_;
    stdout_fd_ = other.stdout_fd_;
    reaped_ = other.reaped_;
    exit_code_ = other.exit_code_;
    other.pid_ = -1;
    other.stdout_fd_ = -1;
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        if (valid() && !reaped_) terminate();
        close_fds();
        pid_ = other.pid_;
        stdout_fd_ = other.stdout_fd_;
        reaped_ = other.reaped_;
        exit_code_ = other.exit_code_;
        other.pid_ = -1;
        other.stdout_fd_ = -1;
    }
    return *this;
}

bool ProcessHandle::valid() const {
    return pid_ > 0;
}

void ProcessHandle::close_fds() {
    if (stdout_fd_ >= 0) {
        close(stdout_fd_);
        stdout_fd_ = -1;
    }
}

void ProcessHandle::record_exit(int status) {
    reaped_ = true;
    exit_code_ = decode_status(status);
}

bool ProcessHandle::running() {
    if (pid_ <= 0 || reaped_) return false;
    int status;
    pid_t ret = waitpid(pid_, &status, WNOHANG);
    if (ret == pid_) {
        record_exit(status);
        return false;
    }
    return ret == 0;  // 0 means still running
}

int ProcessHandle::wait(int timeout_ms) {
    if (pid_ <= 0) return -1;
    if (reaped_) return exit_code_;
    if (timeout_ms < 0) {
        int status;
        if (waitpid(pid_, &status, 0) == pid_) record_exit(status);
        return exit_code_;
    }
    // Poll with timeout
    int elapsed = 0;
    while (elapsed < timeout_ms) {
        int status;
        pid_t ret = waitpid(pid_, &status, WNOHANG);
        if (ret == pid_) {
            record_exit(status);
            return exit_code_;
        }
        sleep_ms(100);
        elapsed += 100;
    }
    return -1;  // timed out
}

void ProcessHandle::terminate() {
    if (pid_ <= 0 || reaped_) return;
    kill(pid_, SIGTERM);
    // Wait up to 2s for graceful exit
    for (int i = 0; i < 20; i++) {
        int status;
        if (waitpid(pid_, &status, WNOHANG) == pid_) {
            record_exit(status);
            return;
        }
        sleep_ms(100);
    }
    kill(pid_, SIGKILL);
    int status;
    if (waitpid(pid_, &status, 0) == pid_) record_exit(status);
}

ProcessHandle::ReadStatus ProcessHandle::read_some(std::string& out, int timeout_ms) {
    if (stdout_fd_ < 0) return ReadStatus::Eof;

    struct pollfd pfd = {stdout_fd_, POLLIN, 0};
    int rc = poll(&pfd, 1, timeout_ms);
    if (rc < 0) {
        return errno == EINTR ? ReadStatus::Idle : ReadStatus::Eof;
    }
    if (rc == 0) return ReadStatus::Idle;

    char buf[4096];
    ssize_t n = read(stdout_fd_, buf, sizeof(buf));
    if (n > 0) {
        out.append(buf, static_cast<size_t>(n));
        return ReadStatus::Data;
    }
    if (n < 0 && (errno == EAGAIN || errno == EINTR)) return ReadStatus::Idle;
    close_fds();
    return ReadStatus::Eof;
}

// ── spawn ────────────────────────────────────────────────────

ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    const SpawnOptions& opts) {
    ProcessHandle handle;

    int out_pipe[2] = {-1, -1};
    if (opts.pipe_stdout && pipe2(out_pipe, O_CLOEXEC) != 0) return handle;

    // Built before fork: the child only calls async-signal-safe functions.
    std::vector<std::string> argv_store;
    argv_store.push_back(program);
    for (const auto& a : args) argv_store.push_back(a);
    auto argv = to_cstrings(argv_store);
    auto env_store = build_environment(opts.extra_env);
    auto envp = to_cstrings(env_store);

    pid_t pid = fork();
    if (pid < 0) {
        if (opts.pipe_stdout) {
            close(out_pipe[0]);
            close(out_pipe[1]);
        }
        return handle;  // fork failed
    }

    if (pid == 0) {
        // Child process
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        if (opts.pipe_stdout) dup2(out_pipe[1], STDOUT_FILENO);

        if (!opts.stderr_log.empty()) {
            int fd = open(opts.stderr_log.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
            if (fd >= 0) {
                dup2(fd, STDERR_FILENO);
                close(fd);
            }
        }

        execvpe(program.c_str(), argv.data(), envp.data());
        _exit(127);  // exec failed
    }

    // Parent
    handle.pid_ = pid;
    if (opts.pipe_stdout) {
        close(out_pipe[1]);
        handle.stdout_fd_ = out_pipe[0];
        set_nonblocking(handle.stdout_fd_);
    }
    return handle;
}

// ── run_command ──────────────────────────────────────────────

CommandResult run_command(const std::string& program,
                          const std::vector<std::string>& args,
                          const std::string& stdin_data,
                          int timeout_ms,
                          const EnvList& extra_env) {
    ignore_sigpipe_once();

    CommandResult result{-1, "", "", false};

    int in_pipe[2], out_pipe[2], err_pipe[2];
    if (pipe2(in_pipe, O_CLOEXEC) != 0) {
        result.stderr_data = std::string("pipe: ") + std::strerror(errno);
        return result;
    }
    if (pipe2(out_pipe, O_CLOEXEC) != 0) {
        close(in_pipe[0]); close(in_pipe[1]);
        result.stderr_data = std::string("pipe: ") + std::strerror(errno);
        return result;
    }
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        close(in_pipe[0]); close(in_pipe[1]);
        close(out_pipe[0]); close(out_pipe[1]);
        result.stderr_data = std::string("pipe: ") + std::strerror(errno);
        return result;
    }

    std::vector<std::string> argv_store;
    argv_store.push_back(program);
    for (const auto& a : args) argv_store.push_back(a);
    auto argv = to_cstrings(argv_store);
    auto env_store = build_environment(extra_env);
    auto envp = to_cstrings(env_store);

    pid_t pid = fork();
    if (pid < 0) {
        for (int fd : {in_pipe[0], in_pipe[1], out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]})
            close(fd);
        result.stderr_data = std::string("fork: ") + std::strerror(errno);
        return result;
    }

    if (pid == 0) {
        dup2(in_pipe[0], STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        execvpe(program.c_str(), argv.data(), envp.data());
        _exit(127);
    }

    close(in_pipe[0]);
    close(out_pipe[1]);
    close(err_pipe[1]);

    int in_fd = in_pipe[1];
    int out_fd = out_pipe[0];
    int err_fd = err_pipe[0];
    set_nonblocking(in_fd);
    set_nonblocking(out_fd);
    set_nonblocking(err_fd);

    size_t written = 0;
    if (stdin_data.empty()) {
        close(in_fd);
        in_fd = -1;
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    char buf[4096];

    while (out_fd >= 0 || err_fd >= 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (timeout_ms >= 0 && remaining <= 0) {
            result.timed_out = true;
            break;
        }

        struct pollfd fds[3];
        int n = 0;
        int out_idx = -1, err_idx = -1, in_idx = -1;
        if (out_fd >= 0) { fds[n] = {out_fd, POLLIN, 0}; out_idx = n++; }
        if (err_fd >= 0) { fds[n] = {err_fd, POLLIN, 0}; err_idx = n++; }
        if (in_fd >= 0)  { fds[n] = {in_fd, POLLOUT, 0}; in_idx = n++; }

        int rc = poll(fds, n, timeout_ms >= 0 ? static_cast<int>(remaining) : -1);
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }

        if (in_idx >= 0 && (fds[in_idx].revents & (POLLOUT | POLLERR | POLLHUP))) {
            ssize_t w = write(in_fd, stdin_data.data() + written, stdin_data.size() - written);
            if (w > 0) written += static_cast<size_t>(w);
            if (w < 0 && errno != EAGAIN && errno != EINTR) written = stdin_data.size();
            if (written >= stdin_data.size()) {
                close(in_fd);
                in_fd = -1;
            }
        }

        auto drain = [&](int idx, int& fd, std::string& sink) {
            if (idx < 0 || !(fds[idx].revents & (POLLIN | POLLHUP | POLLERR))) return;
            ssize_t r = read(fd, buf, sizeof(buf));
            if (r > 0) {
                sink.append(buf, static_cast<size_t>(r));
            } else if (r == 0 || (errno != EAGAIN && errno != EINTR)) {
                close(fd);
                fd = -1;
            }
        };
        drain(out_idx, out_fd, result.stdout_data);
        drain(err_idx, err_fd, result.stderr_data);
    }

    if (in_fd >= 0) close(in_fd);
    if (out_fd >= 0) close(out_fd);
    if (err_fd >= 0) close(err_fd);

    int status = 0;
    if (result.timed_out) {
        kill(pid, SIGKILL);
        waitpid(pid, &status, 0);
        result.exit_code = -1;
    } else if (waitpid(pid, &status, 0) == pid) {
        result.exit_code = decode_status(status);
    }
    return result;
}

std::string describe_command(const std::string& program,
                             const std::vector<std::string>& args) {
    std::string s = program;
    for (const auto& a : args) {
        s += ' ';
        if (a.find_first_of(" \t'\"") != std::string::npos) {
            s += "'" + a + "'";
        } else {
            s += a;
        }
    }
    return s;
}

} // namespace platform
