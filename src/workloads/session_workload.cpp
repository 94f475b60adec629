#include "session_workload.hpp"
#include "source_spec.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>
#include <type_traits>

// Integral targets take JSON integers only; floating targets take any number.
template <typename T>
static bool decode_number(const Json& node, const std::string& what,
                          T& out, std::string& error) {
    if (node.is_null()) return true;
    bool ok = std::is_integral<T>::value ? node.is_number_integer() : node.is_number();
    if (!ok) {
        error = fmt::format("{} must be a number", what);
        return false;
    }
    out = node.get<T>();
    return true;
}

Result<SessionSpec> decode_session_spec(const Json& spec_node) {
    std::string error;
    SessionSpec spec;

    Json spec_map, llm, trace;
    if (!decode_optional_map(spec_node, "spec", spec_map, error) ||
        !decode_optional_map(json_child(spec_map, "llmSettings"), "spec.llmSettings", llm, error) ||
        !decode_optional_map(json_child(spec_map, "traceSettings"), "spec.traceSettings",
                             trace, error)) {
        return Result<SessionSpec>::Err(error, ErrorKind::Invalid);
    }

    std::optional<std::string> prompt, website, model, retention;
    std::optional<bool> trace_enabled;
    if (!decode_optional_string(json_child(spec_map, "prompt"), "spec.prompt", prompt, error) ||
        !decode_optional_string(json_child(spec_map, "websiteURL"), "spec.websiteURL",
                                website, error) ||
        !decode_number(json_child(spec_map, "timeout"), "spec.timeout", spec.timeout, error) ||
        !decode_optional_string(json_child(llm, "model"), "spec.llmSettings.model", model, error) ||
        !decode_number(json_child(llm, "temperature"), "spec.llmSettings.temperature",
                       spec.llm.temperature, error) ||
        !decode_number(json_child(llm, "maxTokens"), "spec.llmSettings.maxTokens",
                       spec.llm.max_tokens, error) ||
        !decode_optional_bool(json_child(trace, "enabled"), "spec.traceSettings.enabled",
                              trace_enabled, error) ||
        !decode_optional_string(json_child(trace, "retention"), "spec.traceSettings.retention",
                                retention, error)) {
        return Result<SessionSpec>::Err(error, ErrorKind::Invalid);
    }

    spec.prompt = prompt.value_or("");
    spec.website_url = website.value_or("");
    spec.llm.model = model.value_or("");
    if (!json_child(spec_map, "traceSettings").is_null()) {
        spec.trace = TraceSettings{trace_enabled.value_or(false), retention.value_or("")};
    }
    return Result<SessionSpec>::Ok(spec);
}

SessionWorkload::SessionWorkload(WorkloadSettings settings)
    : settings_(std::move(settings)),
      ref_{"research.example.com", "v1", "researchsessions", "ResearchSession"} {}

std::string SessionWorkload::job_name(const std::string& object_name, long long) const {
    return object_name + "-job";
}

Result<JobSpec> SessionWorkload::build_job(const Resource& obj, const std::string& job_name) const {
    auto decoded = decode_session_spec(obj.spec());
    if (decoded.is_err()) return Result<JobSpec>::Err(decoded.error, decoded.kind);
    const SessionSpec& spec = decoded.value;

    JobSpec job;
    job.name = job_name;
    job.labels = {{"research-session", obj.name}, {"app", "claude-runner"}};
    job.container_name = "claude-runner";
    job.image = settings_.image;
    job.requests = {"100m", "256Mi"};
    job.limits = {"1000m", "1Gi"};
    job.backoff_limit = settings_.job.backoff_limit;
    job.active_deadline_secs = settings_.job.active_deadline_secs;

    job.env = {
        {"RESEARCH_SESSION_NAME", obj.name},
        {"RESEARCH_SESSION_NAMESPACE", obj.ns.empty() ? settings_.ns : obj.ns},
        {"PROMPT", spec.prompt},
        {"WEBSITE_URL", spec.website_url},
        {"LLM_MODEL", spec.llm.model},
        {"LLM_TEMPERATURE", fmt::format("{:.2f}", spec.llm.temperature)},
        {"LLM_MAX_TOKENS", std::to_string(spec.llm.max_tokens)},
        {"TIMEOUT", std::to_string(spec.timeout)},
        {"BACKEND_API_URL", settings_.backend_api_url},
    };
    if (spec.trace) {
        job.env.emplace_back("TRACE_ENABLED", spec.trace->enabled ? "true" : "false");
        job.env.emplace_back("TRACE_RETENTION", spec.trace->retention);
    }

    return Result<JobSpec>::Ok(job);
}

StatusFields SessionWorkload::launch_status(const std::string& job_name, long long now) const {
    return {
        {"phase", active_phase()},
        {"message", "Job created and running"},
        {"startTime", format_rfc3339(now)},
        {"jobName", job_name},
    };
}

StatusFields SessionWorkload::success_status(const std::string&, long long now) const {
    return {
        {"phase", "Completed"},
        {"message", "Job completed successfully"},
        {"completionTime", format_rfc3339(now)},
    };
}

StatusFields SessionWorkload::failure_status(const std::string& message, long long now) const {
    return {
        {"phase", PHASE_FAILED},
        {"message", message},
        {"completionTime", format_rfc3339(now)},
    };
}
