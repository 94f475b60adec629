#include "controller.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

Controller::Controller(ResourceStore& store, JobRunner& runner, const Workload& workload,
                       ArtifactStore* artifacts, const std::atomic<bool>& stop,
                       Clock clock, ControllerOptions opts)
    : workload_(workload),
      stop_(stop),
      watcher_(store, stop, opts.watch),
      reconciler_(store, runner, workload, artifacts, monitors_, std::move(clock), opts.reconcile) {}

Controller::~Controller() {
    monitors_.stop_all();
}

void Controller::run() {
    forgeop_log(fmt::format("controller: watching {}", workload_.resource().qualified()));

    WatchEvent event;
    while (watcher_.next(event)) {
        std::string name = event.type == WatchEventType::Error ? "-" : event.object.name;
        auto outcome = reconciler_.handle(event);
        processed_.fetch_add(1);
        if (outcome != ReconcileOutcome::Ignored) {
            forgeop_log(fmt::format("controller: {} {} -> {}", watch_event_name(event.type),
                                    name, reconcile_outcome_name(outcome)));
        }
        monitors_.reap();
    }

    forgeop_log("controller: shutting down");
    monitors_.stop_all();
}
