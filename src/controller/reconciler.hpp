#pragma once

#include <deque>
#include <set>
#include <string>
#include <core/constants.hpp>
#include <core/types.hpp>
#include <jobs/job_runner.hpp>
#include <storage/artifact_store.hpp>
#include <store/resource_store.hpp>
#include <workloads/workload.hpp>
#include "job_monitor.hpp"
#include "monitor_registry.hpp"

// What handling one event amounted to.
enum class ReconcileOutcome {
    Ignored,          // gone, not Pending, or an Error event
    JobExists,        // a job of that name is already there
    Superseded,       // object changed under us; its own event takes over
    InvalidSpec,      // spec could not be decoded; marked Failed
    CreateFailed,     // job creation refused; marked Failed
    Launched,
    Reattached,       // active object without a monitor; monitor started
    Deleted,          // deletion observed, nothing to clean
    CleanedUp,
    CleanupFailed,
    DuplicateDelete,
};

const char* reconcile_outcome_name(ReconcileOutcome outcome);

struct ReconcilerOptions {
    int settle_ms = EVENT_SETTLE_MS;
    MonitorOptions monitor;
};

// Decides one action per event. Never waits on a job: monitoring is handed
// to the registry and runs on its own thread.
class Reconciler {
public:
    // `artifacts` may be null when the workload keeps nothing outside the store.
    Reconciler(ResourceStore& store, JobRunner& runner, const Workload& workload,
               ArtifactStore* artifacts, MonitorRegistry& monitors,
               Clock clock, ReconcilerOptions opts = {});

    ReconcileOutcome handle(const WatchEvent& event);

    // Added/Modified path for `name`.
    ReconcileOutcome reconcile(const std::string& name);

    // Deleted path.
    ReconcileOutcome remove(const Resource& obj);

private:
    ResourceStore& store_;
    JobRunner& runner_;
    const Workload& workload_;
    ArtifactStore* artifacts_;
    MonitorRegistry& monitors_;
    Clock clock_;
    ReconcilerOptions opts_;

    // UIDs of recently handled deletions, oldest first.
    std::deque<std::string> recent_deletions_;
    std::set<std::string> recent_deletion_set_;

    bool remember_deletion(const std::string& uid);
    ReconcileOutcome reattach(const Resource& obj);
    void start_monitor(const std::string& job_name, const std::string& object_name);
    void mark_failed(const std::string& name, const std::string& message, long long now);
};
