#include "config.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <yaml-cpp/yaml.h>
#include <map>
#include <vector>

namespace fs = std::filesystem;

namespace {

// One scalar setting: dotted YAML key and the environment variables that override it.
struct Setting {
    const char* key;
    std::vector<const char*> env;
};

const std::vector<Setting>& settings_table() {
    static const std::vector<Setting> table = {
        {"kind",                          {"CONTROLLER_KIND"}},
        {"namespace",                     {"NAMESPACE"}},
        {"image",                         {"EXECUTION_IMAGE"}},
        {"base_domain",                   {"BASE_DOMAIN"}},
        {"backend_api_url",               {"BACKEND_API_URL"}},
        {"storage.endpoint",              {"MINIO_ENDPOINT"}},
        {"storage.access_key",            {"MINIO_ACCESS_KEY"}},
        {"storage.secret_key",            {"MINIO_SECRET_KEY"}},
        {"storage.bucket",                {"MINIO_BUCKET"}},
        {"storage.client",                {"MC_BINARY"}},
        {"kubectl.binary",                {"KUBECTL"}},
        {"kubectl.kubeconfig",            {"KUBECONFIG"}},
        {"kubectl.request_timeout_secs",  {"KUBECTL_TIMEOUT_SECS"}},
        {"monitor.poll_interval_secs",    {"POLL_INTERVAL_SECS"}},
        {"monitor.message_cap",           {}},
        {"job.backoff_limit",             {"BACKOFF_LIMIT"}},
        {"job.active_deadline_secs",      {"ACTIVE_DEADLINE_SECS"}},
        {"log_file",                      {"FORGEOP_LOG_FILE"}},
    };
    return table;
}

// Walk "a.b" through nested maps. Undefined when any level is missing.
YAML::Node lookup_dotted(const YAML::Node& root, const std::string& dotted) {
    YAML::Node cur;
    cur.reset(root);
    size_t start = 0;
    while (start <= dotted.size()) {
        size_t dot = dotted.find('.', start);
        std::string part = dotted.substr(start, dot == std::string::npos ? std::string::npos
                                                                         : dot - start);
        if (!cur || !cur.IsMap()) return YAML::Node(YAML::NodeType::Undefined);
        const YAML::Node& c = cur;
        YAML::Node next = c[part];
        if (!next) return YAML::Node(YAML::NodeType::Undefined);
        cur.reset(next);
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return cur;
}

} // namespace

class ConfigBuilder {
public:
    static Result<Config> build(const std::optional<fs::path>& file);

private:
    using Values = std::map<std::string, std::string>;

    static Result<void> read_file(const fs::path& file, Values& values);
    static void apply_env(Values& values);
    static Result<void> positive_int(const Values& values, const std::string& key,
                                     int fallback, int& out, bool allow_zero = false,
                                     int max = 0);
    static std::string value_or(const Values& values, const std::string& key,
                                const std::string& fallback);
};

std::string ConfigBuilder::value_or(const Values& values, const std::string& key,
                                    const std::string& fallback) {
    auto it = values.find(key);
    if (it == values.end() || it->second.empty()) return fallback;
    return it->second;
}

Result<void> ConfigBuilder::read_file(const fs::path& file, Values& values) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(file.string());
    } catch (const std::exception& e) {
        return Result<void>::Err(fmt::format("Failed to read config {}: {}",
                                             file.string(), e.what()),
                                 ErrorKind::Invalid);
    }

    if (root.IsNull()) return Result<void>::Ok();  // empty file
    if (!root.IsMap()) {
        return Result<void>::Err(fmt::format("Config {} must be a YAML map", file.string()),
                                 ErrorKind::Invalid);
    }

    for (const auto& s : settings_table()) {
        YAML::Node n = lookup_dotted(root, s.key);
        if (!n || n.IsNull()) continue;
        if (!n.IsScalar()) {
            return Result<void>::Err(fmt::format("Config key '{}' must be a scalar", s.key),
                                     ErrorKind::Invalid);
        }
        values[s.key] = n.as<std::string>();
    }
    return Result<void>::Ok();
}

void ConfigBuilder::apply_env(Values& values) {
    for (const auto& s : settings_table()) {
        for (const char* name : s.env) {
            if (auto v = platform::env_var(name)) {
                values[s.key] = *v;
                break;
            }
        }
    }
}

Result<void> ConfigBuilder::positive_int(const Values& values, const std::string& key,
                                         int fallback, int& out, bool allow_zero, int max) {
    auto it = values.find(key);
    if (it == values.end() || it->second.empty()) {
        out = fallback;
        return Result<void>::Ok();
    }
    int v;
    if (!parse_int(it->second, v) || v < 0 || (v == 0 && !allow_zero)) {
        return Result<void>::Err(fmt::format("Config key '{}' must be a {} integer, got '{}'",
                                             key, allow_zero ? "non-negative" : "positive",
                                             it->second),
                                 ErrorKind::Invalid);
    }
    if (max > 0 && v > max) {
        return Result<void>::Err(fmt::format("Config key '{}' must be at most {}, got '{}'",
                                             key, max, it->second),
                                 ErrorKind::Invalid);
    }
    out = v;
    return Result<void>::Ok();
}

Result<Config> ConfigBuilder::build(const std::optional<fs::path>& file) {
    Values values;
    if (file) {
        auto r = read_file(*file, values);
        if (r.is_err()) return Result<Config>::Err(r.error, r.kind);
    }
    apply_env(values);

    Config cfg;
    cfg.source_file_ = file;

    std::string kind = value_or(values, "kind", "site");
    if (!parse_workload_kind(kind, cfg.kind_)) {
        return Result<Config>::Err(
            fmt::format("Unknown controller kind '{}' (expected 'site' or 'session')", kind),
            ErrorKind::Invalid);
    }
    bool site = cfg.kind_ == WorkloadKind::Site;

    // Legacy per-kind image variables, below EXECUTION_IMAGE and the file.
    std::string legacy_image;
    if (auto v = platform::env_var(site ? "BUILDER_IMAGE" : "RUNNER_IMAGE")) legacy_image = *v;
    cfg.image_ = value_or(values, "image",
                          !legacy_image.empty() ? legacy_image
                          : site ? "quay.io/example/static-site-builder:latest"
                                 : "claude-runner:latest");

    cfg.base_domain_ = value_or(values, "base_domain", "sites.apps.example.com");
    cfg.backend_api_url_ = value_or(values, "backend_api_url", "");

    cfg.storage_.endpoint = value_or(values, "storage.endpoint", "http://minio.minio.svc:9000");
    cfg.storage_.access_key = value_or(values, "storage.access_key", "admin");
    cfg.storage_.secret_key = value_or(values, "storage.secret_key", "password123");
    cfg.storage_.bucket = value_or(values, "storage.bucket", "sites");
    cfg.storage_.client = value_or(values, "storage.client", "mc");

    cfg.kubectl_.binary = value_or(values, "kubectl.binary", "kubectl");
    cfg.kubectl_.kubeconfig = value_or(values, "kubectl.kubeconfig", "");
    cfg.kubectl_.ns = value_or(values, "namespace", site ? "static-hosting" : "default");

    for (auto r : {
             positive_int(values, "kubectl.request_timeout_secs", KUBECTL_TIMEOUT_SECS,
                          cfg.kubectl_.request_timeout_secs, false, KUBECTL_TIMEOUT_MAX_SECS),
             positive_int(values, "monitor.poll_interval_secs", MONITOR_POLL_SECS,
                          cfg.monitor_.poll_interval_secs, false, MONITOR_POLL_MAX_SECS),
             positive_int(values, "monitor.message_cap", STATUS_MESSAGE_CAP,
                          cfg.monitor_.message_cap),
             positive_int(values, "job.backoff_limit", DEFAULT_BACKOFF_LIMIT,
                          cfg.job_.backoff_limit, true),
             positive_int(values, "job.active_deadline_secs", DEFAULT_ACTIVE_DEADLINE,
                          cfg.job_.active_deadline_secs, true),
         }) {
        if (r.is_err()) return Result<Config>::Err(r.error, r.kind);
    }

    cfg.log_file_ = value_or(values, "log_file", "");
    return Result<Config>::Ok(std::move(cfg));
}

// ── Public API ──────────────────────────────────────────────

Result<Config> Config::load() {
    if (auto explicit_path = platform::env_var("FORGEOP_CONFIG")) {
        fs::path p(*explicit_path);
        if (!fs::exists(p)) {
            return Result<Config>::Err("Config file not found: " + p.string(), ErrorKind::Invalid);
        }
        return load_from(p);
    }
    fs::path def = default_config_path();
    if (fs::exists(def)) return load_from(def);
    return load_from(std::nullopt);
}

Result<Config> Config::load_from(const std::optional<fs::path>& file) {
    return ConfigBuilder::build(file);
}

std::string Config::describe() const {
    auto mask = [](const std::string& s) { return s.empty() ? std::string("") : std::string("****"); };
    std::string out;
    out += fmt::format("kind:              {}\n", workload_kind_name(kind_));
    out += fmt::format("namespace:         {}\n", kubectl_.ns);
    out += fmt::format("image:             {}\n", image_);
    if (kind_ == WorkloadKind::Site) {
        out += fmt::format("base_domain:       {}\n", base_domain_);
        out += fmt::format("storage.endpoint:  {}\n", storage_.endpoint);
        out += fmt::format("storage.access:    {}\n", storage_.access_key);
        out += fmt::format("storage.secret:    {}\n", mask(storage_.secret_key));
        out += fmt::format("storage.bucket:    {}\n", storage_.bucket);
    } else {
        out += fmt::format("backend_api_url:   {}\n", backend_api_url_);
    }
    out += fmt::format("kubectl:           {}{}\n", kubectl_.binary,
                       kubectl_.kubeconfig.empty() ? "" : " (kubeconfig " + kubectl_.kubeconfig + ")");
    out += fmt::format("poll_interval:     {}s\n", monitor_.poll_interval_secs);
    out += fmt::format("backoff_limit:     {}\n", job_.backoff_limit);
    out += fmt::format("active_deadline:   {}s\n", job_.active_deadline_secs);
    out += fmt::format("config_file:       {}\n", source_file_ ? source_file_->string() : "-");
    return out;
}

const char* workload_kind_name(WorkloadKind kind) {
    return kind == WorkloadKind::Site ? "site" : "session";
}

bool parse_workload_kind(const std::string& s, WorkloadKind& out) {
    std::string k = to_lower(s);
    if (k == "site" || k == "staticsite") {
        out = WorkloadKind::Site;
        return true;
    }
    if (k == "session" || k == "researchsession") {
        out = WorkloadKind::Session;
        return true;
    }
    return false;
}

fs::path default_config_path() {
    return fs::path("/etc/forgeop/config.yaml");
}
