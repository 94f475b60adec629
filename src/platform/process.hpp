#pragma once

#include <string>
#include <utility>
#include <vector>
#include <core/types.hpp>

namespace platform {

using EnvList = std::vector<std::pair<std::string, std::string>>;

struct SpawnOptions {
    EnvList extra_env;           // added to (or overriding) the inherited environment
    bool pipe_stdout = false;    // expose stdout through ProcessHandle::read_some
    std::string stderr_log;      // if non-empty, append child's stderr to this file
};

// Opaque handle to a spawned child process. Terminates the child if it is
// still running when the handle is destroyed.
class ProcessHandle {
public:
    enum class ReadStatus { Data, Idle, Eof };

    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // True if the process is still running.
    bool running();

    // Wait for the process to exit. Returns exit code.
    // timeout_ms = -1 means indefinite wait; -1 is also returned on timeout.
    int wait(int timeout_ms = -1);

    // Terminate the process (SIGTERM, then SIGKILL after 2s).
    void terminate();

    // Append whatever stdout bytes arrive within timeout_ms to `out`.
    // Requires SpawnOptions::pipe_stdout.
    ReadStatus read_some(std::string& out, int timeout_ms);

    int native_handle() const { return pid_; }

private:
    int pid_ = -1;
    int stdout_fd_ = -1;
    bool reaped_ = false;
    int exit_code_ = -1;

    void close_fds();
    void record_exit(int status);

    friend ProcessHandle spawn(const std::string& program,
                               const std::vector<std::string>& args,
                               const SpawnOptions& opts);
};

// Spawn a child process.
ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    const SpawnOptions& opts = {});

// Run a child to completion: feed stdin_data, capture stdout and stderr.
// The child is killed once timeout_ms elapses (timed_out is then set).
CommandResult run_command(const std::string& program,
                          const std::vector<std::string>& args,
                          const std::string& stdin_data = "",
                          int timeout_ms = 30000,
                          const EnvList& extra_env = {});

// Render a program + args as a single shell-like string for logging.
std::string describe_command(const std::string& program,
                             const std::vector<std::string>& args);

} // namespace platform
