#pragma once

#include <memory>
#include <string>
#include <core/config.hpp>
#include <core/types.hpp>
#include <jobs/job_runner.hpp>
#include <store/resource.hpp>

// What a workload profile needs from configuration.
struct WorkloadSettings {
    std::string ns;
    std::string image;
    std::string base_domain;
    std::string backend_api_url;
    StorageConfig storage;
    JobDefaults job;
};

WorkloadSettings workload_settings(const Config& config);

// One instantiation of the reconcile/monitor loop: which collection it
// watches, how jobs are named and built, and what status it writes.
class Workload {
public:
    virtual ~Workload() = default;

    virtual WorkloadKind kind() const = 0;
    virtual const ResourceRef& resource() const = 0;

    // Phase written when a job is launched.
    virtual const char* active_phase() const = 0;

    // Job for `object_name`; `now` is unix seconds.
    virtual std::string job_name(const std::string& object_name, long long now) const = 0;

    // Decode the object's spec into a job. ErrorKind::Invalid on a malformed spec.
    virtual Result<JobSpec> build_job(const Resource& obj, const std::string& job_name) const = 0;

    virtual StatusFields launch_status(const std::string& job_name, long long now) const = 0;
    virtual StatusFields success_status(const std::string& object_name, long long now) const = 0;
    virtual StatusFields failure_status(const std::string& message, long long now) const = 0;

    // Leads every job-failure message ("Build failed: <logs>").
    virtual const char* failure_prefix() const = 0;
};

std::unique_ptr<Workload> make_workload(const Config& config);
