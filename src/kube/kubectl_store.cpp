#include "kubectl_store.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

// ── KubectlWatchStream ──────────────────────────────────────

KubectlWatchStream::KubectlWatchStream(platform::ProcessHandle proc)
    : proc_(std::move(proc)) {}

KubectlWatchStream::~KubectlWatchStream() {
    close();
}

void KubectlWatchStream::close() {
    if (closed_) return;
    closed_ = true;
    if (proc_.valid()) proc_.terminate();
}

void KubectlWatchStream::decode(const Json& doc) {
    std::string type = json_string(json_child(doc, "type"));
    const Json& object = json_child(doc, "object");

    WatchEvent ev;
    if (type == "ADDED") {
        ev.type = WatchEventType::Added;
    } else if (type == "MODIFIED") {
        ev.type = WatchEventType::Modified;
    } else if (type == "DELETED") {
        ev.type = WatchEventType::Deleted;
    } else if (type == "ERROR") {
        ev.type = WatchEventType::Error;
        ev.message = json_string(json_child(object, "message"), "watch error");
        queued_.push_back(ev);
        return;
    } else {
        return;  // BOOKMARK and anything newer
    }

    auto res = Resource::from_json(object);
    if (res.is_err()) {
        forgeop_log_warn(fmt::format("watch: dropping {} event: {}", type, res.error));
        return;
    }
    ev.object = res.value;
    queued_.push_back(ev);
}

WatchStream::ReadStatus KubectlWatchStream::next(WatchEvent& out, int timeout_ms) {
    if (queued_.empty() && !closed_) {
        std::string chunk;
        auto st = proc_.read_some(chunk, timeout_ms);
        if (st == platform::ProcessHandle::ReadStatus::Data) {
            buffer_ += chunk;
            std::string error;
            for (const auto& doc : Kubectl::take_documents(buffer_, error)) decode(doc);
            if (!error.empty()) forgeop_log_warn("watch: " + error);
        } else if (st == platform::ProcessHandle::ReadStatus::Eof) {
            int code = proc_.wait(2000);
            closed_ = true;
            if (code != 0 && !delivered_) {
                error_ = fmt::format("kubectl watch exited with code {}", code);
            }
        }
    }

    if (!queued_.empty()) {
        out = queued_.front();
        queued_.pop_front();
        delivered_ = true;
        return ReadStatus::Event;
    }
    return closed_ ? ReadStatus::Closed : ReadStatus::Idle;
}

// ── KubectlResourceStore ────────────────────────────────────

KubectlResourceStore::KubectlResourceStore(const Kubectl& kubectl, ResourceRef ref)
    : kubectl_(kubectl), ref_(std::move(ref)) {}

Result<Resource> KubectlResourceStore::get(const std::string& name) {
    std::vector<std::string> args = {"get", ref_.qualified(), name, "-o", "json"};
    auto r = kubectl_.run(args);
    if (r.failed()) {
        auto kind = Kubectl::classify(r);
        if (kind != ErrorKind::NotFound) forgeop_log_cmd("store:get", kubectl_.describe(args), r);
        return Result<Resource>::Err(Kubectl::error_text(r), kind);
    }

    auto doc = Kubectl::parse(r.stdout_data);
    if (doc.is_err()) return Result<Resource>::Err(doc.error, doc.kind);
    return Resource::from_json(std::move(doc.value));
}

Result<void> KubectlResourceStore::replace_status(const Resource& obj) {
    std::vector<std::string> args = {"replace", "--subresource=status", "-f", "-", "-o", "name"};
    auto r = kubectl_.run(args, Kubectl::emit(obj.object));
    if (r.failed()) {
        auto kind = Kubectl::classify(r);
        if (kind != ErrorKind::NotFound && kind != ErrorKind::Conflict)
            forgeop_log_cmd("store:replace-status", kubectl_.describe(args), r);
        return Result<void>::Err(Kubectl::error_text(r), kind);
    }
    return Result<void>::Ok();
}

Result<std::unique_ptr<WatchStream>> KubectlResourceStore::watch() {
    std::vector<std::string> args = {"get", ref_.qualified(), "--watch",
                                     "--output-watch-events", "-o", "json"};
    auto proc = kubectl_.spawn_stream(args);
    if (!proc.valid()) {
        return Result<std::unique_ptr<WatchStream>>::Err(
            "failed to spawn " + kubectl_.config().binary, ErrorKind::Transient);
    }
    std::unique_ptr<WatchStream> stream = std::make_unique<KubectlWatchStream>(std::move(proc));
    return Result<std::unique_ptr<WatchStream>>::Ok(std::move(stream));
}

Result<void> KubectlResourceStore::check_access() {
    std::vector<std::string> args = {"get", ref_.qualified(), "-o", "name", "--limit=1"};
    auto r = kubectl_.run(args);
    if (r.failed()) {
        forgeop_log_cmd("store:access", kubectl_.describe(args), r);
        return Result<void>::Err(Kubectl::error_text(r), Kubectl::classify(r));
    }
    return Result<void>::Ok();
}
