#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>
#include <platform/process.hpp>
#include <store/json_util.hpp>

// Thin runner for the kubectl CLI, bound to one namespace.
class Kubectl {
public:
    explicit Kubectl(KubectlConfig config);

    // Run to completion with the namespace/kubeconfig/timeout flags prepended.
    CommandResult run(const std::vector<std::string>& args,
                      const std::string& stdin_data = "") const;

    // Start a long-lived child (watch) with stdout piped back.
    platform::ProcessHandle spawn_stream(const std::vector<std::string>& args) const;

    // Map a failed invocation to the error kind the callers branch on.
    static ErrorKind classify(const CommandResult& r);

    // One-line error text for a failed invocation.
    static std::string error_text(const CommandResult& r);

    // Parse one JSON document from kubectl's output.
    static Result<Json> parse(const std::string& text);

    // Serialize a document for `kubectl ... -f -`.
    static std::string emit(const Json& doc);

    // Remove every complete JSON value from the front of `buffer` and return
    // them in order. A trailing incomplete value stays buffered. Malformed
    // input is discarded and described in `error`.
    static std::vector<Json> take_documents(std::string& buffer, std::string& error);

    const KubectlConfig& config() const { return config_; }
    std::string describe(const std::vector<std::string>& args) const;

private:
    KubectlConfig config_;

    std::vector<std::string> full_args(const std::vector<std::string>& args,
                                       bool with_timeout) const;
};
