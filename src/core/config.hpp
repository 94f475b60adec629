#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load the optional YAML file (FORGEOP_CONFIG, else default_config_path() when
    // present), then apply environment overrides. Read once at startup.
    static Result<Config> load();

    // Same, with an explicit file (nullopt = environment and defaults only).
    static Result<Config> load_from(const std::optional<fs::path>& file);

    // Accessors
    WorkloadKind kind() const { return kind_; }
    const std::string& ns() const { return kubectl_.ns; }
    const std::string& image() const { return image_; }
    const std::string& base_domain() const { return base_domain_; }
    const std::string& backend_api_url() const { return backend_api_url_; }
    const StorageConfig& storage() const { return storage_; }
    const KubectlConfig& kubectl() const { return kubectl_; }
    const MonitorConfig& monitor() const { return monitor_; }
    const JobDefaults& job() const { return job_; }
    const std::string& log_file() const { return log_file_; }
    const std::optional<fs::path>& source_file() const { return source_file_; }

    // Human-readable dump with credentials masked.
    std::string describe() const;

public:
    Config() = default;

private:
    WorkloadKind kind_ = WorkloadKind::Site;
    std::string image_;
    std::string base_domain_;
    std::string backend_api_url_;
    StorageConfig storage_;
    KubectlConfig kubectl_;
    MonitorConfig monitor_;
    JobDefaults job_;
    std::string log_file_;
    std::optional<fs::path> source_file_;

    friend class ConfigBuilder;
};

const char* workload_kind_name(WorkloadKind kind);

// "site" / "session" → kind. Returns false for anything else.
bool parse_workload_kind(const std::string& s, WorkloadKind& out);

fs::path default_config_path();
