#pragma once

#include <atomic>
#include <core/types.hpp>
#include <jobs/job_runner.hpp>
#include <storage/artifact_store.hpp>
#include <store/resource_store.hpp>
#include <workloads/workload.hpp>
#include "event_watcher.hpp"
#include "monitor_registry.hpp"
#include "reconciler.hpp"

struct ControllerOptions {
    WatchOptions watch;
    ReconcilerOptions reconcile;
};

// EventWatcher → Reconciler → MonitorRegistry. One thread drains the
// watch in delivery order; monitors run on their own threads.
class Controller {
public:
    Controller(ResourceStore& store, JobRunner& runner, const Workload& workload,
               ArtifactStore* artifacts, const std::atomic<bool>& stop,
               Clock clock, ControllerOptions opts = {});
    ~Controller();

    // Drain events until `stop` is set, then cancel every monitor.
    void run();

    // Events handled so far.
    long long processed() const { return processed_.load(); }

    MonitorRegistry& monitors() { return monitors_; }

private:
    const Workload& workload_;
    const std::atomic<bool>& stop_;
    MonitorRegistry monitors_;
    EventWatcher watcher_;
    Reconciler reconciler_;
    std::atomic<long long> processed_{0};
};
