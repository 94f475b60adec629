#include "workload.hpp"
#include "session_workload.hpp"
#include "site_workload.hpp"

WorkloadSettings workload_settings(const Config& config) {
    WorkloadSettings s;
    s.ns = config.ns();
    s.image = config.image();
    s.base_domain = config.base_domain();
    s.backend_api_url = config.backend_api_url();
    s.storage = config.storage();
    s.job = config.job();
    return s;
}

std::unique_ptr<Workload> make_workload(const Config& config) {
    auto settings = workload_settings(config);
    switch (config.kind()) {
        case WorkloadKind::Session:
            return std::make_unique<SessionWorkload>(settings);
        case WorkloadKind::Site:
            break;
    }
    return std::make_unique<SiteWorkload>(settings);
}
