#pragma once

#include <optional>
#include <string>
#include "workload.hpp"

struct LlmSettings {
    std::string model;
    double temperature = 0.0;
    long long max_tokens = 0;
};

struct TraceSettings {
    bool enabled = false;
    std::string retention;
};

struct SessionSpec {
    std::string prompt;
    std::string website_url;
    long long timeout = 0;
    LlmSettings llm;
    std::optional<TraceSettings> trace;
};

Result<SessionSpec> decode_session_spec(const Json& spec);

// Research sessions: one agent run per object, result written back by the runner.
class SessionWorkload : public Workload {
public:
    explicit SessionWorkload(WorkloadSettings settings);

    WorkloadKind kind() const override { return WorkloadKind::Session; }
    const ResourceRef& resource() const override { return ref_; }
    const char* active_phase() const override { return "Running"; }
    const char* failure_prefix() const override { return "Job failed"; }

    std::string job_name(const std::string& object_name, long long now) const override;
    Result<JobSpec> build_job(const Resource& obj, const std::string& job_name) const override;

    StatusFields launch_status(const std::string& job_name, long long now) const override;
    StatusFields success_status(const std::string& object_name, long long now) const override;
    StatusFields failure_status(const std::string& message, long long now) const override;

private:
    WorkloadSettings settings_;
    ResourceRef ref_;
};
