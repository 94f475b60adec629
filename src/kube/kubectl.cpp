#include "kubectl.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>
#include <sstream>

Kubectl::Kubectl(KubectlConfig config) : config_(std::move(config)) {}

std::vector<std::string> Kubectl::full_args(const std::vector<std::string>& args,
                                            bool with_timeout) const {
    std::vector<std::string> full;
    if (!config_.kubeconfig.empty()) {
        full.push_back("--kubeconfig=" + config_.kubeconfig);
    }
    if (!config_.ns.empty()) {
        full.push_back("--namespace=" + config_.ns);
    }
    if (with_timeout) {
        full.push_back(fmt::format("--request-timeout={}s", config_.request_timeout_secs));
    }
    full.insert(full.end(), args.begin(), args.end());
    return full;
}

CommandResult Kubectl::run(const std::vector<std::string>& args,
                           const std::string& stdin_data) const {
    // Local grace on top of the server-side request timeout.
    int timeout_ms = (config_.request_timeout_secs + 5) * 1000;
    return platform::run_command(config_.binary, full_args(args, true), stdin_data, timeout_ms);
}

platform::ProcessHandle Kubectl::spawn_stream(const std::vector<std::string>& args) const {
    platform::SpawnOptions opts;
    opts.pipe_stdout = true;
    return platform::spawn(config_.binary, full_args(args, false), opts);
}

std::string Kubectl::describe(const std::vector<std::string>& args) const {
    return platform::describe_command(config_.binary, full_args(args, true));
}

ErrorKind Kubectl::classify(const CommandResult& r) {
    if (r.success()) return ErrorKind::None;
    if (r.timed_out || r.exit_code == 127) return ErrorKind::Transient;

    const std::string& err = r.stderr_data;
    if (err.find("(NotFound)") != std::string::npos ||
        err.find("not found") != std::string::npos) {
        return ErrorKind::NotFound;
    }
    if (err.find("(Conflict)") != std::string::npos ||
        err.find("the object has been modified") != std::string::npos) {
        return ErrorKind::Conflict;
    }
    if (err.find("(AlreadyExists)") != std::string::npos ||
        err.find("already exists") != std::string::npos) {
        return ErrorKind::AlreadyExists;
    }
    if (err.find("(Invalid)") != std::string::npos ||
        err.find("(BadRequest)") != std::string::npos) {
        return ErrorKind::Invalid;
    }
    return ErrorKind::Transient;
}

std::string Kubectl::error_text(const CommandResult& r) {
    if (r.timed_out) return "kubectl timed out";
    if (r.exit_code == 127) return "kubectl could not be executed";
    std::string text = r.stderr_data.empty() ? r.stdout_data : r.stderr_data;
    trim(text);
    auto nl = text.find('\n');
    if (nl != std::string::npos) text = text.substr(0, nl);
    if (text.empty()) text = fmt::format("kubectl exited with code {}", r.exit_code);
    return text;
}

Result<Json> Kubectl::parse(const std::string& text) {
    try {
        return Result<Json>::Ok(Json::parse(text));
    } catch (const Json::parse_error& e) {
        return Result<Json>::Err(fmt::format("failed to parse kubectl output: {}", e.what()),
                                 ErrorKind::Invalid);
    }
}

std::string Kubectl::emit(const Json& doc) {
    // Pod logs end up in status messages and need not be valid UTF-8.
    return doc.dump(-1, ' ', false, Json::error_handler_t::replace) + "\n";
}

std::vector<Json> Kubectl::take_documents(std::string& buffer, std::string& error) {
    std::vector<Json> docs;
    std::istringstream in(buffer);
    size_t consumed = 0;

    while (true) {
        in >> std::ws;
        if (in.eof()) {
            consumed = buffer.size();
            break;
        }
        size_t start = static_cast<size_t>(in.tellg());

        Json doc;
        try {
            in >> doc;
        } catch (const Json::parse_error& e) {
            // The lexer counts the end of input as one byte past the data.
            if (e.byte > buffer.size() - start) {
                consumed = start;
            } else {
                error = fmt::format("discarding malformed watch output: {}", e.what());
                consumed = buffer.size();
            }
            break;
        }
        docs.push_back(std::move(doc));

        auto pos = in.tellg();
        if (pos < 0) {
            consumed = buffer.size();
            break;
        }
        consumed = static_cast<size_t>(pos);
    }

    buffer.erase(0, consumed);
    return docs;
}
