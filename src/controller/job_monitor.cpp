#include "job_monitor.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

const char* monitor_outcome_name(MonitorOutcome outcome) {
    switch (outcome) {
        case MonitorOutcome::Succeeded: return "succeeded";
        case MonitorOutcome::Failed:    return "failed";
        case MonitorOutcome::Abandoned: return "abandoned";
        case MonitorOutcome::Canceled:  return "canceled";
    }
    return "unknown";
}

JobMonitor::JobMonitor(ResourceStore& store, JobRunner& runner, const Workload& workload,
                       Clock clock, MonitorOptions opts)
    : store_(store), runner_(runner), workload_(workload),
      clock_(std::move(clock)), opts_(opts) {}

MonitorOutcome JobMonitor::run(const std::string& job_name, const std::string& object_name,
                               const std::atomic<bool>& canceled) {
    forgeop_log(fmt::format("monitor: watching job {} for {}", job_name, object_name));

    while (true) {
        if (!platform::sleep_unless(canceled, opts_.poll_interval_ms, MONITOR_SLEEP_SLICE_MS)) {
            return MonitorOutcome::Canceled;
        }

        auto outcome = poll_once(job_name, object_name);
        if (outcome) {
            forgeop_log(fmt::format("monitor: job {} {}", job_name, monitor_outcome_name(*outcome)));
            return *outcome;
        }
    }
}

std::optional<MonitorOutcome> JobMonitor::poll_once(const std::string& job_name,
                                                    const std::string& object_name) {
    auto obj = store_.get(object_name);
    if (obj.not_found()) {
        forgeop_log(fmt::format("monitor: {} no longer exists, stopping monitoring of {}",
                                object_name, job_name));
        return MonitorOutcome::Abandoned;
    }
    if (obj.is_err()) {
        forgeop_log_warn(fmt::format("monitor: checking {} failed: {}", object_name, obj.error));
    }

    auto job = runner_.get_job(job_name);
    if (job.not_found()) {
        forgeop_log(fmt::format("monitor: job {} not found, stopping monitoring", job_name));
        return MonitorOutcome::Abandoned;
    }
    if (job.is_err()) {
        forgeop_log_warn(fmt::format("monitor: getting job {} failed: {}", job_name, job.error));
        return std::nullopt;
    }

    const JobStatus& st = job.value;
    if (st.succeeded > 0) {
        write_status(object_name, workload_.success_status(object_name, clock_()));
        return MonitorOutcome::Succeeded;
    }

    if (st.failed_terminal || (st.failed > 0 && st.failed >= st.backoff_limit)) {
        forgeop_log(fmt::format("monitor: job {} failed after {} attempts{}", job_name, st.failed,
                                st.failure_reason.empty() ? "" : " (" + st.failure_reason + ")"));
        write_status(object_name, workload_.failure_status(failure_message(job_name), clock_()));
        return MonitorOutcome::Failed;
    }

    return std::nullopt;
}

std::string JobMonitor::failure_message(const std::string& job_name) {
    std::string prefix = workload_.failure_prefix();

    auto pods = runner_.list_pods_for_job(job_name);
    if (pods.is_err() || pods.value.empty()) return prefix;

    auto logs = runner_.get_logs(pods.value.front());
    if (logs.is_err()) {
        forgeop_log(fmt::format("monitor: no logs for {}: {}", pods.value.front(), logs.error));
        return prefix;
    }

    std::string text = logs.value;
    trim(text);
    if (text.empty()) return prefix;
    return truncate_message(prefix + ": " + text, static_cast<size_t>(opts_.message_cap));
}

void JobMonitor::write_status(const std::string& object_name, const StatusFields& fields) {
    auto r = store_.update_status(object_name, fields);
    if (r.not_found()) {
        forgeop_log(fmt::format("monitor: {} was deleted, skipping status update", object_name));
    } else if (r.is_err()) {
        forgeop_log_error(fmt::format("monitor: status update for {} failed: {}", object_name, r.error));
    }
}
