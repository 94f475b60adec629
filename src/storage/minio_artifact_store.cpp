#include "minio_artifact_store.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>
#include <cctype>

static constexpr const char* MC_ALIAS = "forgeop";

// RFC 3986 userinfo escaping: only unreserved characters pass through.
static std::string percent_encode(const std::string& text) {
    std::string out;
    for (unsigned char c : text) {
        if (std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += fmt::format("%{:02X}", c);
        }
    }
    return out;
}

MinioArtifactStore::MinioArtifactStore(StorageConfig config) : config_(std::move(config)) {}

std::string MinioArtifactStore::host_url(const StorageConfig& config) {
    std::string scheme = "http";
    std::string host = config.endpoint;
    auto sep = host.find("://");
    if (sep != std::string::npos) {
        scheme = host.substr(0, sep);
        host = host.substr(sep + 3);
    }
    while (!host.empty() && host.back() == '/') host.pop_back();
    return fmt::format("{}://{}:{}@{}", scheme, percent_encode(config.access_key),
                       percent_encode(config.secret_key), host);
}

Result<void> MinioArtifactStore::remove(const std::string& object_name) {
    if (object_name.empty()) {
        return Result<void>::Err("refusing to remove an empty prefix", ErrorKind::Invalid);
    }

    std::string target = fmt::format("{}/{}/{}/", MC_ALIAS, config_.bucket, object_name);
    std::vector<std::string> args = {"rm", "--recursive", "--force", target};
    platform::EnvList env = {{fmt::format("MC_HOST_{}", MC_ALIAS), host_url(config_)}};

    auto r = platform::run_command(config_.client, args, "", CLEANUP_TIMEOUT_SECS * 1000, env);
    if (r.failed()) {
        forgeop_log_cmd("storage:rm", platform::describe_command(config_.client, args), r);
        std::string err = r.timed_out ? "mc timed out"
                                      : fmt::format("mc exited with code {}", r.exit_code);
        return Result<void>::Err(err, ErrorKind::Transient);
    }
    forgeop_log(fmt::format("storage: removed {}/{}/", config_.bucket, object_name));
    return Result<void>::Ok();
}
