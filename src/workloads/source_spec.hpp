#pragma once

#include <optional>
#include <string>
#include <variant>
#include <core/constants.hpp>
#include <core/types.hpp>
#include <jobs/job_runner.hpp>
#include <store/json_util.hpp>

// Fields are optional: only what the object actually carries is exported.
struct GitSource {
    std::optional<std::string> repository;
    std::optional<std::string> branch;
    std::optional<std::string> path;
};

struct DockerSource {
    std::optional<std::string> image;
    std::optional<std::string> path;
};

// Also accepted under the legacy type name "url".
struct ArchiveSource {
    std::optional<std::string> url;
    std::optional<std::string> path;
};

// A type this controller does not know. Passed through to the job untouched.
struct UnknownSource {};

using SourceSpec = std::variant<GitSource, DockerSource, ArchiveSource, UnknownSource>;

struct BuildSpec {
    bool enabled = false;
    std::string command = DEFAULT_BUILD_COMMAND;
    std::string output_dir = DEFAULT_OUTPUT_DIR;
};

struct SiteSpec {
    std::string source_type;    // as written, exported as SOURCE_TYPE
    SourceSpec source = UnknownSource{};
    BuildSpec build;
    std::optional<bool> spa;
};

// Decode a site object's spec. A structurally malformed payload is
// ErrorKind::Invalid; an unrecognized source.type is not.
Result<SiteSpec> decode_site_spec(const Json& spec);

// GIT_* / DOCKER_* / URL_* variables for the present fields.
void append_source_env(const SourceSpec& source, EnvVars& env);

const char* source_kind_name(const SourceSpec& source);

// ── Decoding helpers shared by the workload profiles ────────

// Null or absent is fine; anything but an object is not.
bool decode_optional_map(const Json& node, const std::string& what,
                         Json& out, std::string& error);

// JSON strings only.
bool decode_optional_string(const Json& node, const std::string& what,
                            std::optional<std::string>& out, std::string& error);

// JSON true/false only; "true" is rejected.
bool decode_optional_bool(const Json& node, const std::string& what,
                          std::optional<bool>& out, std::string& error);
