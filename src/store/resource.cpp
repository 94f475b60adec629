#include "resource.hpp"
#include <core/constants.hpp>

std::string Resource::phase() const {
    return json_string(json_path(object, {"status", "phase"}));
}

std::string Resource::status_field(const std::string& key) const {
    return json_string(json_child(json_child(object, "status"), key.c_str()));
}

const Json& Resource::spec() const {
    return json_child(object, "spec");
}

Result<Resource> Resource::from_json(Json doc) {
    if (!doc.is_object()) {
        return Result<Resource>::Err("object is not a map", ErrorKind::Invalid);
    }

    const Json& meta = json_child(doc, "metadata");
    Resource r;
    r.name = json_string(json_child(meta, "name"));
    if (r.name.empty()) {
        return Result<Resource>::Err("object has no metadata.name", ErrorKind::Invalid);
    }
    r.ns = json_string(json_child(meta, "namespace"));
    r.uid = json_string(json_child(meta, "uid"));
    r.resource_version = json_string(json_child(meta, "resourceVersion"));
    r.object = std::move(doc);
    return Result<Resource>::Ok(std::move(r));
}

bool is_pending_phase(const std::string& phase) {
    return phase.empty() || phase == PHASE_PENDING;
}

Json merge_status(const Json& object, const StatusFields& fields) {
    Json copy = object;
    if (!copy["status"].is_object()) copy["status"] = Json::object();
    Json& status = copy["status"];
    for (const auto& [key, value] : fields) {
        status[key] = value;
    }
    return copy;
}
