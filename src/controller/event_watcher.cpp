#include "event_watcher.hpp"
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

EventWatcher::EventWatcher(ResourceStore& store, const std::atomic<bool>& stop, WatchOptions opts)
    : store_(store), stop_(stop), opts_(opts) {}

EventWatcher::~EventWatcher() {
    if (stream_) stream_->close();
}

void EventWatcher::backoff(int ms) {
    platform::sleep_unless(stop_, ms, WATCH_READ_SLICE_MS);
}

bool EventWatcher::next(WatchEvent& out) {
    while (!stop_.load()) {
        if (!stream_) {
            auto opened = store_.watch();
            if (opened.is_err()) {
                ++open_failures_;
                forgeop_log_warn(fmt::format("watch: open failed: {}, retrying in {}ms",
                                             opened.error, opts_.open_retry_ms));
                backoff(opts_.open_retry_ms);
                continue;
            }
            stream_ = std::move(opened.value);
            forgeop_log("watch: stream open");
        }

        auto st = stream_->next(out, opts_.read_slice_ms);
        if (st == WatchStream::ReadStatus::Event) return true;
        if (st == WatchStream::ReadStatus::Idle) continue;

        std::string err = stream_->error();
        stream_.reset();
        if (!err.empty()) {
            ++open_failures_;
            forgeop_log_warn(fmt::format("watch: {}, retrying in {}ms", err, opts_.open_retry_ms));
            backoff(opts_.open_retry_ms);
        } else {
            ++restarts_;
            forgeop_log(fmt::format("watch: stream closed, restarting in {}ms", opts_.restart_ms));
            backoff(opts_.restart_ms);
        }
    }

    if (stream_) {
        stream_->close();
        stream_.reset();
    }
    return false;
}
