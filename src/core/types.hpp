#pragma once

#include <string>
#include <map>
#include <functional>

// Distinguishes the failure outcomes callers branch on.
// NotFound is expected (object deleted while we were working), not an error.
enum class ErrorKind {
    None,
    NotFound,
    Conflict,
    AlreadyExists,
    Invalid,
    Transient,
};

const char* error_kind_name(ErrorKind kind);

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorKind::None};
    }

    static Result<T> Err(const std::string& err, ErrorKind kind = ErrorKind::Transient) {
        return {false, T{}, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
    bool not_found() const { return !success && kind == ErrorKind::NotFound; }
    bool conflict() const { return !success && kind == ErrorKind::Conflict; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<void> Ok() {
        return {true, "", ErrorKind::None};
    }

    static Result<void> Err(const std::string& err, ErrorKind kind = ErrorKind::Transient) {
        return {false, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
    bool not_found() const { return !success && kind == ErrorKind::NotFound; }
    bool conflict() const { return !success && kind == ErrorKind::Conflict; }
};

// Child process execution result
struct CommandResult {
    int exit_code;
    std::string stdout_data;
    std::string stderr_data;
    bool timed_out = false;

    bool success() const { return exit_code == 0 && !timed_out; }
    bool failed() const { return !success(); }

    std::string get_output() const {
        return stdout_data.empty() ? stderr_data : stdout_data;
    }
};

// Partial status document: field name → value. Merged into status, never replaces it.
using StatusFields = std::map<std::string, std::string>;

// Returns the current wall-clock time as unix seconds. Injected so tests can pin it.
using Clock = std::function<long long()>;

// Configuration structures
enum class WorkloadKind { Site, Session };

struct StorageConfig {
    std::string endpoint;
    std::string access_key;
    std::string secret_key;
    std::string bucket;
    std::string client;        // MinIO client binary
};

struct KubectlConfig {
    std::string binary;
    std::string kubeconfig;    // empty = in-cluster service account
    std::string ns;
    int request_timeout_secs = 30;
};

struct MonitorConfig {
    int poll_interval_secs = 10;
    int message_cap = 500;
};

struct JobDefaults {
    int backoff_limit = 3;
    int active_deadline_secs = 1800;
};
