#include "resource_store.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

const char* watch_event_name(WatchEventType type) {
    switch (type) {
        case WatchEventType::Added:    return "Added";
        case WatchEventType::Modified: return "Modified";
        case WatchEventType::Deleted:  return "Deleted";
        case WatchEventType::Error:    return "Error";
    }
    return "Unknown";
}

Result<void> ResourceStore::update_status(const std::string& name,
                                          const StatusFields& fields) {
    std::string last_error;
    for (int attempt = 1; attempt <= STATUS_UPDATE_MAX_ATTEMPTS; ++attempt) {
        auto current = get(name);
        if (current.is_err()) {
            return Result<void>::Err(current.error, current.kind);
        }

        auto written = update_status_if_unchanged(current.value, fields);
        if (written.is_ok() || !written.conflict()) return written;

        last_error = written.error;
        forgeop_log(fmt::format("status update for {} conflicted (attempt {}/{}), re-reading",
                                name, attempt, STATUS_UPDATE_MAX_ATTEMPTS));
    }
    return Result<void>::Err(last_error, ErrorKind::Conflict);
}

Result<void> ResourceStore::update_status_if_unchanged(const Resource& observed,
                                                       const StatusFields& fields) {
    Resource updated = observed;
    updated.object = merge_status(observed.object, fields);
    return replace_status(updated);
}
