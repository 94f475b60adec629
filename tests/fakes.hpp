#pragma once

#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>
#include <jobs/job_runner.hpp>
#include <storage/artifact_store.hpp>
#include <store/resource_store.hpp>
#include <store/json_util.hpp>

constexpr long long TEST_NOW = 1700000000;   // 2023-11-14T22:13:20Z

inline Clock fixed_clock() {
    return [] { return TEST_NOW; };
}

// Parse a JSON document into a Resource. Fails the test on bad input.
inline Resource make_resource(const std::string& json) {
    auto r = Resource::from_json(Json::parse(json));
    if (r.is_err()) throw std::runtime_error("bad test resource: " + r.error);
    return r.value;
}

// ── Watch ───────────────────────────────────────────────────

class FakeWatchStream : public WatchStream {
public:
    FakeWatchStream(std::deque<WatchEvent> events, std::string error)
        : events_(std::move(events)), error_(std::move(error)) {}

    ReadStatus next(WatchEvent& out, int) override {
        if (closed_ || events_.empty()) {
            closed_ = true;
            return ReadStatus::Closed;
        }
        out = events_.front();
        events_.pop_front();
        return ReadStatus::Event;
    }

    void close() override { closed_ = true; }
    std::string error() const override { return closed_ ? error_ : ""; }

private:
    std::deque<WatchEvent> events_;
    std::string error_;
    bool closed_ = false;
};

// One scripted watch() call: either an open failure or a stream.
struct WatchSession {
    bool open_fails = false;
    std::deque<WatchEvent> events;
    std::string close_error;   // non-empty: stream dies with an error
};

inline WatchEvent make_event(WatchEventType type, const std::string& name,
                             const std::string& uid = "") {
    WatchEvent ev;
    ev.type = type;
    Json doc = {{"metadata", {{"name", name}, {"uid", uid}}}};
    ev.object = make_resource(doc.dump());
    return ev;
}

// ── Store ───────────────────────────────────────────────────

// In-memory object collection with resourceVersion checks on status writes.
class FakeStore : public ResourceStore {
public:
    // Insert or overwrite an object, bumping its version.
    void put(const std::string& json) {
        Json doc = Json::parse(json);
        std::string name = json_string(json_path(doc, {"metadata", "name"}));
        std::lock_guard<std::mutex> lock(mutex_);
        objects_[name] = doc;
        bump_locked(name);
    }

    void erase(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        objects_.erase(name);
    }

    // Simulate a concurrent writer.
    void touch(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        bump_locked(name);
    }

    bool exists(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        return objects_.count(name) > 0;
    }

    std::string status(const std::string& name, const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = objects_.find(name);
        if (it == objects_.end()) return "";
        return json_string(json_path(it->second, {"status", key.c_str()}));
    }

    int replace_calls() {
        std::lock_guard<std::mutex> lock(mutex_);
        return replace_calls_;
    }

    Result<Resource> get(const std::string& name) override {
        std::function<void()> hook;
        Result<Resource> result = read(name);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            hook = std::move(after_get);
            after_get = nullptr;
        }
        if (hook) hook();
        return result;
    }

    Result<void> replace_status(const Resource& obj) override {
        std::function<void()> hook;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            hook = std::move(before_replace);
            before_replace = nullptr;
        }
        if (hook) hook();

        std::lock_guard<std::mutex> lock(mutex_);
        ++replace_calls_;
        if (conflicts_to_inject > 0) {
            --conflicts_to_inject;
            return Result<void>::Err("the object has been modified", ErrorKind::Conflict);
        }
        if (replace_errors_to_inject > 0) {
            --replace_errors_to_inject;
            return Result<void>::Err("injected status failure", ErrorKind::Transient);
        }

        auto it = objects_.find(obj.name);
        if (it == objects_.end()) return Result<void>::Err("not found", ErrorKind::NotFound);

        std::string current = json_string(json_path(it->second, {"metadata", "resourceVersion"}));
        if (obj.resource_version != current) {
            return Result<void>::Err("the object has been modified", ErrorKind::Conflict);
        }

        it->second["status"] = json_child(obj.object, "status");
        bump_locked(obj.name);
        return Result<void>::Ok();
    }

    Result<std::unique_ptr<WatchStream>> watch() override {
        WatchSession session;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++watch_calls;
            if (sessions.empty()) {
                if (on_exhausted) on_exhausted();
                return Result<std::unique_ptr<WatchStream>>::Err("no more sessions");
            }
            session = std::move(sessions.front());
            sessions.pop_front();
        }
        if (session.open_fails) {
            return Result<std::unique_ptr<WatchStream>>::Err("connection refused");
        }
        std::unique_ptr<WatchStream> stream =
            std::make_unique<FakeWatchStream>(std::move(session.events), session.close_error);
        return Result<std::unique_ptr<WatchStream>>::Ok(std::move(stream));
    }

    // Knobs. Set before the code under test runs.
    ErrorKind get_error_kind = ErrorKind::None;
    int conflicts_to_inject = 0;
    int replace_errors_to_inject = 0;
    std::function<void()> before_replace;     // runs once, outside the lock
    std::function<void()> after_get;          // runs once, after the read is taken
    std::deque<WatchSession> sessions;
    std::function<void()> on_exhausted;
    int watch_calls = 0;

private:
    std::mutex mutex_;
    std::map<std::string, Json> objects_;
    std::map<std::string, long long> versions_;
    int replace_calls_ = 0;

    Result<Resource> read(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (get_error_kind != ErrorKind::None) {
            return Result<Resource>::Err("injected get failure", get_error_kind);
        }
        auto it = objects_.find(name);
        if (it == objects_.end()) return Result<Resource>::Err("not found", ErrorKind::NotFound);
        return Resource::from_json(it->second);
    }

    void bump_locked(const std::string& name) {
        long long v = ++versions_[name];
        auto it = objects_.find(name);
        if (it == objects_.end()) return;
        it->second["metadata"]["resourceVersion"] = std::to_string(v);
    }
};

// ── Runner ──────────────────────────────────────────────────

class FakeRunner : public JobRunner {
public:
    Result<void> create_job(const JobSpec& spec) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (create_error_kind != ErrorKind::None) {
            return Result<void>::Err(create_error_text, create_error_kind);
        }
        if (jobs_.count(spec.name)) {
            return Result<void>::Err("jobs \"" + spec.name + "\" already exists",
                                     ErrorKind::AlreadyExists);
        }
        JobStatus st;
        st.name = spec.name;
        st.active = 1;
        st.backoff_limit = spec.backoff_limit;
        jobs_[spec.name] = st;
        created_.push_back(spec);
        return Result<void>::Ok();
    }

    Result<JobStatus> get_job(const std::string& name) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (get_error_kind != ErrorKind::None) {
            return Result<JobStatus>::Err("injected job failure", get_error_kind);
        }
        auto it = jobs_.find(name);
        if (it == jobs_.end()) return Result<JobStatus>::Err("not found", ErrorKind::NotFound);
        return Result<JobStatus>::Ok(it->second);
    }

    Result<std::vector<std::string>> list_pods_for_job(const std::string& name) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pods_.find(name);
        if (it == pods_.end()) return Result<std::vector<std::string>>::Ok({});
        return Result<std::vector<std::string>>::Ok(it->second);
    }

    Result<std::string> get_logs(const std::string& pod_name) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = logs_.find(pod_name);
        if (it == logs_.end()) return Result<std::string>::Err("container not started");
        return Result<std::string>::Ok(it->second);
    }

    // Test setup
    void add_job(const std::string& name, int succeeded, int failed, int backoff_limit = 3) {
        std::lock_guard<std::mutex> lock(mutex_);
        JobStatus st;
        st.name = name;
        st.succeeded = succeeded;
        st.failed = failed;
        st.backoff_limit = backoff_limit;
        jobs_[name] = st;
    }

    // Attach a Failed=True condition, as the job controller does when the
    // deadline passes or the backoff limit is hit.
    void mark_failed(const std::string& name, const std::string& reason) {
        std::lock_guard<std::mutex> lock(mutex_);
        jobs_[name].failed_terminal = true;
        jobs_[name].failure_reason = reason;
    }

    void remove_job(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        jobs_.erase(name);
    }

    void add_pod(const std::string& job, const std::string& pod, const std::string& logs) {
        std::lock_guard<std::mutex> lock(mutex_);
        pods_[job].push_back(pod);
        logs_[pod] = logs;
    }

    void add_pod_without_logs(const std::string& job, const std::string& pod) {
        std::lock_guard<std::mutex> lock(mutex_);
        pods_[job].push_back(pod);
    }

    std::vector<JobSpec> created() {
        std::lock_guard<std::mutex> lock(mutex_);
        return created_;
    }

    ErrorKind create_error_kind = ErrorKind::None;
    std::string create_error_text = "admission webhook denied the request";
    ErrorKind get_error_kind = ErrorKind::None;

private:
    std::mutex mutex_;
    std::map<std::string, JobStatus> jobs_;
    std::map<std::string, std::vector<std::string>> pods_;
    std::map<std::string, std::string> logs_;
    std::vector<JobSpec> created_;
};

// ── Artifacts ───────────────────────────────────────────────

class FakeArtifacts : public ArtifactStore {
public:
    Result<void> remove(const std::string& object_name) override {
        removed.push_back(object_name);
        if (fail) return Result<void>::Err("mc exited with code 1");
        return Result<void>::Ok();
    }

    std::vector<std::string> removed;
    bool fail = false;
};
