#include "kubectl_job_runner.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

static Json quantities(const ResourceQuantities& q) {
    Json n = Json::object();
    if (!q.cpu.empty()) n["cpu"] = q.cpu;
    if (!q.memory.empty()) n["memory"] = q.memory;
    return n;
}

Json build_job_manifest(const JobSpec& spec, const std::string& ns) {
    Json labels = Json::object();
    for (const auto& [k, v] : spec.labels) labels[k] = v;

    Json env = Json::array();
    for (const auto& [k, v] : spec.env) {
        env.push_back({{"name", k}, {"value", v}});
    }

    Json container = {
        {"name", spec.container_name},
        {"image", spec.image},
        {"env", env},
        {"resources", {{"requests", quantities(spec.requests)},
                       {"limits", quantities(spec.limits)}}},
    };

    Json job;
    job["apiVersion"] = "batch/v1";
    job["kind"] = "Job";
    job["metadata"]["name"] = spec.name;
    if (!ns.empty()) job["metadata"]["namespace"] = ns;
    job["metadata"]["labels"] = labels;
    job["spec"]["backoffLimit"] = spec.backoff_limit;
    if (spec.active_deadline_secs > 0) {
        job["spec"]["activeDeadlineSeconds"] = spec.active_deadline_secs;
    }
    job["spec"]["template"]["metadata"]["labels"] = labels;
    job["spec"]["template"]["spec"] = {
        {"restartPolicy", "Never"},
        {"containers", Json::array({container})},
    };
    return job;
}

KubectlJobRunner::KubectlJobRunner(const Kubectl& kubectl) : kubectl_(kubectl) {}

Result<void> KubectlJobRunner::create_job(const JobSpec& spec) {
    std::vector<std::string> args = {"create", "-f", "-", "-o", "name"};
    std::string manifest = Kubectl::emit(build_job_manifest(spec, kubectl_.config().ns));
    auto r = kubectl_.run(args, manifest);
    if (r.failed()) {
        auto kind = Kubectl::classify(r);
        if (kind != ErrorKind::AlreadyExists) forgeop_log_cmd("jobs:create", kubectl_.describe(args), r);
        return Result<void>::Err(Kubectl::error_text(r), kind);
    }
    return Result<void>::Ok();
}

Result<JobStatus> KubectlJobRunner::get_job(const std::string& name) {
    std::vector<std::string> args = {"get", "job", name, "-o", "json"};
    auto r = kubectl_.run(args);
    if (r.failed()) {
        auto kind = Kubectl::classify(r);
        if (kind != ErrorKind::NotFound) forgeop_log_cmd("jobs:get", kubectl_.describe(args), r);
        return Result<JobStatus>::Err(Kubectl::error_text(r), kind);
    }

    auto doc = Kubectl::parse(r.stdout_data);
    if (doc.is_err()) return Result<JobStatus>::Err(doc.error, doc.kind);

    JobStatus st;
    st.name = name;
    const Json& status = json_child(doc.value, "status");
    st.active = json_int(json_child(status, "active"));
    st.succeeded = json_int(json_child(status, "succeeded"));
    st.failed = json_int(json_child(status, "failed"));
    st.backoff_limit = json_int(json_path(doc.value, {"spec", "backoffLimit"}),
                                DEFAULT_BACKOFF_LIMIT);

    const Json& conditions = json_child(status, "conditions");
    if (conditions.is_array()) {
        for (const auto& c : conditions) {
            if (json_string(json_child(c, "type")) == "Failed" &&
                json_string(json_child(c, "status")) == "True") {
                st.failed_terminal = true;
                st.failure_reason = json_string(json_child(c, "reason"));
            }
        }
    }
    return Result<JobStatus>::Ok(st);
}

Result<std::vector<std::string>> KubectlJobRunner::list_pods_for_job(const std::string& name) {
    std::vector<std::string> args = {"get", "pods", "-l", "job-name=" + name, "-o", "json"};
    auto r = kubectl_.run(args);
    if (r.failed()) {
        return Result<std::vector<std::string>>::Err(Kubectl::error_text(r), Kubectl::classify(r));
    }

    auto doc = Kubectl::parse(r.stdout_data);
    if (doc.is_err()) return Result<std::vector<std::string>>::Err(doc.error, doc.kind);

    std::vector<std::string> pods;
    const Json& items = json_child(doc.value, "items");
    if (items.is_array()) {
        for (const auto& item : items) {
            std::string pod = json_string(json_path(item, {"metadata", "name"}));
            if (!pod.empty()) pods.push_back(pod);
        }
    }
    return Result<std::vector<std::string>>::Ok(pods);
}

Result<std::string> KubectlJobRunner::get_logs(const std::string& pod_name) {
    std::vector<std::string> args = {"logs", pod_name};
    auto r = kubectl_.run(args);
    if (r.failed()) {
        return Result<std::string>::Err(Kubectl::error_text(r), Kubectl::classify(r));
    }
    return Result<std::string>::Ok(r.stdout_data);
}
