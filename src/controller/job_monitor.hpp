#pragma once

#include <atomic>
#include <optional>
#include <string>
#include <core/constants.hpp>
#include <core/types.hpp>
#include <jobs/job_runner.hpp>
#include <store/resource_store.hpp>
#include <workloads/workload.hpp>

enum class MonitorOutcome {
    Succeeded,
    Failed,
    Abandoned,   // object or job disappeared
    Canceled,    // controller shutting down
};

const char* monitor_outcome_name(MonitorOutcome outcome);

struct MonitorOptions {
    int poll_interval_ms = MONITOR_POLL_SECS * 1000;
    int message_cap = STATUS_MESSAGE_CAP;
};

// Polls one job until it reaches a terminal state, then writes the outcome
// onto the owning object's status.
class JobMonitor {
public:
    JobMonitor(ResourceStore& store, JobRunner& runner, const Workload& workload,
               Clock clock, MonitorOptions opts = {});

    // Sleep, poll, repeat until terminal or `canceled` is set.
    MonitorOutcome run(const std::string& job_name, const std::string& object_name,
                       const std::atomic<bool>& canceled);

    // A single poll. nullopt while the job is still running or within its retry budget.
    std::optional<MonitorOutcome> poll_once(const std::string& job_name,
                                            const std::string& object_name);

    // "<prefix>: <first pod's logs>", capped; the bare prefix when logs are unavailable.
    std::string failure_message(const std::string& job_name);

private:
    ResourceStore& store_;
    JobRunner& runner_;
    const Workload& workload_;
    Clock clock_;
    MonitorOptions opts_;

    void write_status(const std::string& object_name, const StatusFields& fields);
};
