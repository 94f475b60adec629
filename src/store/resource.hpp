#pragma once

#include <string>
#include <core/types.hpp>
#include "json_util.hpp"

// Group/version/plural of a custom resource collection.
struct ResourceRef {
    std::string group;
    std::string version;
    std::string plural;
    std::string kind;

    // "staticsites.hosting.example.com", the form kubectl accepts.
    std::string qualified() const { return plural + "." + group; }
};

// A desired-state object as read from the store. The full document is kept
// opaque in `object`; the identity fields are lifted out for convenience.
struct Resource {
    std::string name;
    std::string ns;
    std::string uid;
    std::string resource_version;
    Json object;

    // status.phase, or "" when the object has no status yet.
    std::string phase() const;

    // status.<key> as a string, or "" when absent.
    std::string status_field(const std::string& key) const;

    // The spec sub-document (null when absent).
    const Json& spec() const;

    // Lift identity fields out of a parsed document. Fails when metadata.name is missing.
    static Result<Resource> from_json(Json doc);
};

// True for an absent phase or Pending: the only states new work is driven from.
bool is_pending_phase(const std::string& phase);

// Copy of `object` with `fields` merged into its status map (created if missing).
Json merge_status(const Json& object, const StatusFields& fields);
