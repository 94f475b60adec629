#include "site_workload.hpp"
#include <core/utils.hpp>
#include <algorithm>
#include <fmt/format.h>

SiteWorkload::SiteWorkload(WorkloadSettings settings)
    : settings_(std::move(settings)),
      ref_{"hosting.example.com", "v1", "staticsites", "StaticSite"} {}

std::string SiteWorkload::job_name(const std::string& object_name, long long now) const {
    return fmt::format("{}-build-{}", object_name, now);
}

Result<JobSpec> SiteWorkload::build_job(const Resource& obj, const std::string& job_name) const {
    auto decoded = decode_site_spec(obj.spec());
    if (decoded.is_err()) return Result<JobSpec>::Err(decoded.error, decoded.kind);
    const SiteSpec& spec = decoded.value;

    JobSpec job;
    job.name = job_name;
    job.labels = {{"static-site", obj.name}, {"app", "static-site-builder"}};
    job.container_name = "builder";
    job.image = settings_.image;
    job.requests = {"500m", "1Gi"};
    job.limits = {"2000m", "4Gi"};
    job.backoff_limit = settings_.job.backoff_limit;
    job.active_deadline_secs = settings_.job.active_deadline_secs;

    job.env = {
        {"SITE_NAME", obj.name},
        {"SOURCE_TYPE", spec.source_type},
        {"MINIO_ENDPOINT", settings_.storage.endpoint},
        {"MINIO_ACCESS_KEY", settings_.storage.access_key},
        {"MINIO_SECRET_KEY", settings_.storage.secret_key},
        {"BUILD_ENABLED", spec.build.enabled ? "true" : "false"},
        {"BUILD_COMMAND", spec.build.command},
        {"BUILD_OUTPUT_DIR", spec.build.output_dir},
    };
    if (spec.spa) job.env.emplace_back("SPA_MODE", *spec.spa ? "true" : "false");
    append_source_env(spec.source, job.env);

    return Result<JobSpec>::Ok(job);
}

StatusFields SiteWorkload::launch_status(const std::string& job_name, long long) const {
    return {
        {"phase", active_phase()},
        {"message", "Build job created and running"},
        {"jobName", job_name},
    };
}

StatusFields SiteWorkload::success_status(const std::string& object_name, long long now) const {
    return {
        {"phase", "Ready"},
        {"message", "Site built and deployed successfully"},
        {"url", site_url(object_name)},
        {"lastBuildTime", format_rfc3339(now)},
    };
}

StatusFields SiteWorkload::failure_status(const std::string& message, long long) const {
    return {
        {"phase", PHASE_FAILED},
        {"message", message},
    };
}

std::string SiteWorkload::site_url(const std::string& object_name) const {
    std::string host = to_lower(object_name);
    std::replace(host.begin(), host.end(), '_', '-');
    return fmt::format("https://{}.{}", host, settings_.base_domain);
}
