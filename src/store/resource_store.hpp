#pragma once

#include <memory>
#include <string>
#include <core/types.hpp>
#include "resource.hpp"

enum class WatchEventType { Added, Modified, Deleted, Error };

const char* watch_event_name(WatchEventType type);

struct WatchEvent {
    WatchEventType type = WatchEventType::Error;
    Resource object;          // unset for Error events
    std::string message;      // Error events only
};

// One open subscription. Not restartable; EventWatcher reopens on close.
class WatchStream {
public:
    enum class ReadStatus { Event, Idle, Closed };

    virtual ~WatchStream() = default;

    // Block up to timeout_ms for the next event.
    virtual ReadStatus next(WatchEvent& out, int timeout_ms) = 0;

    virtual void close() = 0;

    // Why the stream closed, when it failed before delivering anything.
    // Empty for a normal server-side close.
    virtual std::string error() const { return ""; }
};

// Namespaced collection of desired-state objects. Every operation reports
// a deleted object as ErrorKind::NotFound.
class ResourceStore {
public:
    virtual ~ResourceStore() = default;

    virtual Result<Resource> get(const std::string& name) = 0;

    // Write obj.object's status back. Conditional on obj.resource_version:
    // a concurrent modification yields ErrorKind::Conflict.
    virtual Result<void> replace_status(const Resource& obj) = 0;

    virtual Result<std::unique_ptr<WatchStream>> watch() = 0;

    // Read current, merge `fields` into status, write back. Retries on conflict.
    Result<void> update_status(const std::string& name, const StatusFields& fields);

    // Single conditional attempt against the version observed in `observed`.
    Result<void> update_status_if_unchanged(const Resource& observed,
                                            const StatusFields& fields);
};
