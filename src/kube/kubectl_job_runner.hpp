#pragma once

#include <string>
#include <vector>
#include <jobs/job_runner.hpp>
#include "kubectl.hpp"

// batch/v1 Jobs through kubectl.
class KubectlJobRunner : public JobRunner {
public:
    explicit KubectlJobRunner(const Kubectl& kubectl);

    Result<void> create_job(const JobSpec& spec) override;
    Result<JobStatus> get_job(const std::string& name) override;
    Result<std::vector<std::string>> list_pods_for_job(const std::string& name) override;
    Result<std::string> get_logs(const std::string& pod_name) override;

private:
    const Kubectl& kubectl_;
};

// The Job manifest kubectl create is fed.
Json build_job_manifest(const JobSpec& spec, const std::string& ns);
