#include "reconciler.hpp"
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

const char* reconcile_outcome_name(ReconcileOutcome outcome) {
    switch (outcome) {
        case ReconcileOutcome::Ignored:         return "ignored";
        case ReconcileOutcome::JobExists:       return "job-exists";
        case ReconcileOutcome::Superseded:      return "superseded";
        case ReconcileOutcome::InvalidSpec:     return "invalid-spec";
        case ReconcileOutcome::CreateFailed:    return "create-failed";
        case ReconcileOutcome::Launched:        return "launched";
        case ReconcileOutcome::Reattached:      return "reattached";
        case ReconcileOutcome::Deleted:         return "deleted";
        case ReconcileOutcome::CleanedUp:       return "cleaned-up";
        case ReconcileOutcome::CleanupFailed:   return "cleanup-failed";
        case ReconcileOutcome::DuplicateDelete: return "duplicate-delete";
    }
    return "unknown";
}

Reconciler::Reconciler(ResourceStore& store, JobRunner& runner, const Workload& workload,
                       ArtifactStore* artifacts, MonitorRegistry& monitors,
                       Clock clock, ReconcilerOptions opts)
    : store_(store), runner_(runner), workload_(workload), artifacts_(artifacts),
      monitors_(monitors), clock_(std::move(clock)), opts_(opts) {}

ReconcileOutcome Reconciler::handle(const WatchEvent& event) {
    switch (event.type) {
        case WatchEventType::Added:
        case WatchEventType::Modified:
            // Let the write that produced this event settle before re-reading.
            platform::sleep_ms(opts_.settle_ms);
            return reconcile(event.object.name);
        case WatchEventType::Deleted:
            return remove(event.object);
        case WatchEventType::Error:
            forgeop_log_warn("reconcile: watch reported an error: " + event.message);
            return ReconcileOutcome::Ignored;
    }
    return ReconcileOutcome::Ignored;
}

ReconcileOutcome Reconciler::reconcile(const std::string& name) {
    // 1. Work from the current object, not the event's copy.
    auto current = store_.get(name);
    if (current.not_found()) {
        forgeop_log(fmt::format("reconcile: {} no longer exists", name));
        return ReconcileOutcome::Ignored;
    }
    if (current.is_err()) {
        forgeop_log_error(fmt::format("reconcile: fetching {} failed: {}", name, current.error));
        return ReconcileOutcome::Ignored;
    }
    const Resource& obj = current.value;

    // 2. New work is only driven from an unset or Pending phase.
    std::string phase = obj.phase();
    if (!is_pending_phase(phase)) {
        if (phase == workload_.active_phase()) return reattach(obj);
        return ReconcileOutcome::Ignored;
    }
    forgeop_log(fmt::format("reconcile: processing {} (phase '{}')", name, phase));

    // 3. One job per attempt.
    long long now = clock_();
    std::string job_name = workload_.job_name(name, now);
    auto existing = runner_.get_job(job_name);
    if (existing.is_ok()) {
        forgeop_log(fmt::format("reconcile: job {} already exists for {}", job_name, name));
        return ReconcileOutcome::JobExists;
    }

    // 4. Spec → job.
    auto job = workload_.build_job(obj, job_name);
    if (job.is_err()) {
        forgeop_log_warn(fmt::format("reconcile: {} has an invalid spec: {}", name, job.error));
        auto w = store_.update_status_if_unchanged(
            obj, workload_.failure_status("Invalid spec: " + job.error, now));
        if (w.conflict()) return ReconcileOutcome::Superseded;
        if (w.is_err() && !w.not_found()) {
            forgeop_log_error(fmt::format("reconcile: marking {} failed: {}", name, w.error));
        }
        return ReconcileOutcome::InvalidSpec;
    }

    // 5. Claim the object against the version read in step 1.
    auto claimed = store_.update_status_if_unchanged(obj, workload_.launch_status(job_name, now));
    if (claimed.conflict()) {
        forgeop_log(fmt::format("reconcile: {} changed since it was read, skipping", name));
        return ReconcileOutcome::Superseded;
    }
    if (claimed.not_found()) {
        forgeop_log(fmt::format("reconcile: {} was deleted before launch", name));
        return ReconcileOutcome::Ignored;
    }
    if (claimed.is_err()) {
        forgeop_log_warn(fmt::format("reconcile: launch status for {} not written: {}",
                                     name, claimed.error));
    }

    // 6. Create. Failure is terminal for this attempt.
    auto created = runner_.create_job(job.value);
    if (created.is_err()) {
        if (created.kind == ErrorKind::AlreadyExists) {
            forgeop_log(fmt::format("reconcile: job {} already exists for {}", job_name, name));
            return ReconcileOutcome::JobExists;
        }
        forgeop_log_error(fmt::format("reconcile: creating job {} failed: {}", job_name, created.error));
        mark_failed(name, "Failed to create job: " + created.error, now);
        return ReconcileOutcome::CreateFailed;
    }
    forgeop_log(fmt::format("reconcile: created job {} for {}", job_name, name));

    // 7. Hand off.
    start_monitor(job_name, name);
    return ReconcileOutcome::Launched;
}

ReconcileOutcome Reconciler::reattach(const Resource& obj) {
    std::string job_name = obj.status_field("jobName");
    if (job_name.empty() || monitors_.contains(job_name)) return ReconcileOutcome::Ignored;

    // A monitor that finished after our read has already written its outcome.
    auto fresh = store_.get(obj.name);
    if (fresh.is_err() || fresh.value.phase() != workload_.active_phase() ||
        fresh.value.status_field("jobName") != job_name) {
        return ReconcileOutcome::Ignored;
    }

    forgeop_log(fmt::format("reconcile: {} is {} with no monitor, reattaching to job {}",
                            obj.name, obj.phase(), job_name));
    start_monitor(job_name, obj.name);
    return ReconcileOutcome::Reattached;
}

ReconcileOutcome Reconciler::remove(const Resource& obj) {
    std::string key = obj.uid.empty() ? obj.name : obj.uid;
    if (!remember_deletion(key)) {
        forgeop_log(fmt::format("reconcile: deletion of {} already handled", obj.name));
        return ReconcileOutcome::DuplicateDelete;
    }

    forgeop_log(fmt::format("reconcile: {} deleted", obj.name));
    if (!artifacts_) return ReconcileOutcome::Deleted;

    auto r = artifacts_->remove(obj.name);
    if (r.is_err()) {
        forgeop_log_error(fmt::format("reconcile: cleanup for {} failed: {}", obj.name, r.error));
        return ReconcileOutcome::CleanupFailed;
    }
    return ReconcileOutcome::CleanedUp;
}

bool Reconciler::remember_deletion(const std::string& uid) {
    if (recent_deletion_set_.count(uid)) return false;

    recent_deletions_.push_back(uid);
    recent_deletion_set_.insert(uid);
    while (recent_deletions_.size() > static_cast<size_t>(RECENT_DELETIONS_MAX)) {
        recent_deletion_set_.erase(recent_deletions_.front());
        recent_deletions_.pop_front();
    }
    return true;
}

void Reconciler::start_monitor(const std::string& job_name, const std::string& object_name) {
    ResourceStore& store = store_;
    JobRunner& runner = runner_;
    const Workload& workload = workload_;
    Clock clock = clock_;
    MonitorOptions opts = opts_.monitor;

    monitors_.start(job_name, [&store, &runner, &workload, clock, opts, job_name, object_name]
                              (const std::atomic<bool>& canceled) {
        JobMonitor monitor(store, runner, workload, clock, opts);
        monitor.run(job_name, object_name, canceled);
    });
}

void Reconciler::mark_failed(const std::string& name, const std::string& message, long long now) {
    auto r = store_.update_status(name, workload_.failure_status(message, now));
    if (r.not_found()) return;
    if (r.is_err()) {
        forgeop_log_error(fmt::format("reconcile: marking {} failed: {}", name, r.error));
    }
}
