#pragma once

#include <string>
#include <core/types.hpp>

// External storage holding the artifacts a job uploaded for an object.
class ArtifactStore {
public:
    virtual ~ArtifactStore() = default;

    // Remove everything stored under `object_name`. Removing an absent
    // prefix succeeds, so repeated calls are harmless.
    virtual Result<void> remove(const std::string& object_name) = 0;
};
