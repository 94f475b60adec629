#pragma once

#include <atomic>
#include <memory>
#include <core/constants.hpp>
#include <store/resource_store.hpp>

struct WatchOptions {
    int open_retry_ms = WATCH_OPEN_RETRY_SECS * 1000;   // after a failed open
    int restart_ms = WATCH_RESTART_SECS * 1000;         // after a normal server-side close
    int read_slice_ms = WATCH_READ_SLICE_MS;
};

// Endless event sequence over a store's collection. Reopens the underlying
// stream whenever it ends; delivery is at-least-once and may repeat.
class EventWatcher {
public:
    EventWatcher(ResourceStore& store, const std::atomic<bool>& stop, WatchOptions opts = {});
    ~EventWatcher();

    // Block until the next event. Returns false only once `stop` is set.
    bool next(WatchEvent& out);

    int open_failures() const { return open_failures_; }
    int restarts() const { return restarts_; }

private:
    ResourceStore& store_;
    const std::atomic<bool>& stop_;
    WatchOptions opts_;
    std::unique_ptr<WatchStream> stream_;
    int open_failures_ = 0;
    int restarts_ = 0;

    void backoff(int ms);
};
