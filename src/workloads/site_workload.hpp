#pragma once

#include "source_spec.hpp"
#include "workload.hpp"

// Static-site builds: fetch a source, optionally build it, upload the
// output to object storage under the site's name.
class SiteWorkload : public Workload {
public:
    explicit SiteWorkload(WorkloadSettings settings);

    WorkloadKind kind() const override { return WorkloadKind::Site; }
    const ResourceRef& resource() const override { return ref_; }
    const char* active_phase() const override { return "Building"; }
    const char* failure_prefix() const override { return "Build failed"; }

    std::string job_name(const std::string& object_name, long long now) const override;
    Result<JobSpec> build_job(const Resource& obj, const std::string& job_name) const override;

    StatusFields launch_status(const std::string& job_name, long long now) const override;
    StatusFields success_status(const std::string& object_name, long long now) const override;
    StatusFields failure_status(const std::string& message, long long now) const override;

    // https://<name, lowercased, '_' → '-'>.<base domain>
    std::string site_url(const std::string& object_name) const;

private:
    WorkloadSettings settings_;
    ResourceRef ref_;
};
