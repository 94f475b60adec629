#pragma once

#include <deque>
#include <string>
#include <store/resource_store.hpp>
#include "kubectl.hpp"

// `kubectl get --watch --output-watch-events -o json` as a WatchStream.
class KubectlWatchStream : public WatchStream {
public:
    explicit KubectlWatchStream(platform::ProcessHandle proc);
    ~KubectlWatchStream() override;

    ReadStatus next(WatchEvent& out, int timeout_ms) override;
    void close() override;

    // Non-empty when the child exited with an error before delivering anything.
    std::string error() const override { return error_; }

private:
    platform::ProcessHandle proc_;
    std::string buffer_;   // watch output not yet decoded
    std::deque<WatchEvent> queued_;
    std::string error_;
    bool delivered_ = false;
    bool closed_ = false;

    void decode(const Json& doc);
};

class KubectlResourceStore : public ResourceStore {
public:
    KubectlResourceStore(const Kubectl& kubectl, ResourceRef ref);

    Result<Resource> get(const std::string& name) override;
    Result<void> replace_status(const Resource& obj) override;
    Result<std::unique_ptr<WatchStream>> watch() override;

    // Startup reachability check: can we list the collection at all?
    Result<void> check_access();

    const ResourceRef& ref() const { return ref_; }

private:
    const Kubectl& kubectl_;
    ResourceRef ref_;
};
