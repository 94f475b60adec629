#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>
#include <core/constants.hpp>
#include <core/types.hpp>

using EnvVars = std::vector<std::pair<std::string, std::string>>;

struct ResourceQuantities {
    std::string cpu;     // e.g. "500m"
    std::string memory;  // e.g. "1Gi"
};

// Everything needed to launch one isolated execution unit.
// Restart policy is always Never; retries belong to backoff_limit.
struct JobSpec {
    std::string name;
    std::map<std::string, std::string> labels;
    std::string container_name;
    std::string image;
    EnvVars env;
    ResourceQuantities requests;
    ResourceQuantities limits;
    int backoff_limit = DEFAULT_BACKOFF_LIMIT;
    int active_deadline_secs = 0;   // 0 = no wall-clock deadline

    // Value of an env var in the bundle, or nullptr when absent.
    const std::string* env_value(const std::string& key) const {
        for (const auto& kv : env) {
            if (kv.first == key) return &kv.second;
        }
        return nullptr;
    }
};

struct JobStatus {
    std::string name;
    int active = 0;
    int succeeded = 0;
    int failed = 0;
    int backoff_limit = DEFAULT_BACKOFF_LIMIT;
    // The job carries a Failed=True condition: it will not retry again
    // (backoff limit reached or active deadline exceeded).
    bool failed_terminal = false;
    std::string failure_reason;   // condition reason, e.g. "DeadlineExceeded"
};

// Launches and observes execution jobs. A job that no longer exists is
// reported as ErrorKind::NotFound.
class JobRunner {
public:
    virtual ~JobRunner() = default;

    // An existing job of the same name yields ErrorKind::AlreadyExists.
    virtual Result<void> create_job(const JobSpec& spec) = 0;
    virtual Result<JobStatus> get_job(const std::string& name) = 0;
    virtual Result<std::vector<std::string>> list_pods_for_job(const std::string& name) = 0;
    virtual Result<std::string> get_logs(const std::string& pod_name) = 0;
};
