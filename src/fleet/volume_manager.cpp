#include "fleet/volume_manager.hpp"
#include <spdlog/spdlog.h>

#include <limits>

namespace sandpool::fleet {

namespace {

bool is_str(const json& j, const char* key) {
    return j.contains(key) && j[key].is_string();
}

std::string str_or_empty(const json& j, const char* key) {
    return is_str(j, key) ? j[key].get<std::string>() : "";
}

} // namespace

VolumeInfo VolumeInfo::from_json(const json& j) {
    VolumeInfo v;
    v.id = str_or_empty(j, "id");
    v.name = str_or_empty(j, "name");
    v.state = str_or_empty(j, "state");
    v.attached_machine_id = str_or_empty(j, "attached_machine_id");
    v.region = str_or_empty(j, "region");
    if (j.contains("size_gb") && j["size_gb"].is_number_integer()) {
        v.size_gb = j["size_gb"].get<int>();
    }
    v.created_at = str_or_empty(j, "created_at");
    return v;
}

json mounts_to_json(const std::vector<ResolvedMount>& mounts) {
    json out = json::array();
    for (const auto& m : mounts) {
        out.push_back({{"volume", m.volume}, {"path", m.path}});
    }
    return out;
}

// ============================================================================
// Validation
// ============================================================================

bool VolumeManager::validate(const json& mounts, std::vector<ValidatedMount>& out, Error& error) {
    out.clear();
    if (mounts.is_null() || (mounts.is_array() && mounts.empty())) {
        return true;
    }
    if (!mounts.is_array()) {
        error = Error(ErrorKind::INVALID_MOUNT, mounts.dump());
        return false;
    }

    for (const auto& m : mounts) {
        ValidatedMount v;
        if (m.is_object() && is_str(m, "volume") && is_str(m, "path")) {
            v.kind = ValidatedMount::Kind::EXISTING;
            v.volume_id = m["volume"].get<std::string>();
            v.path = m["path"].get<std::string>();
        } else if (m.is_object() && is_str(m, "name") && is_str(m, "path") &&
                   m.contains("size_gb") && m["size_gb"].is_number_integer() &&
                   m["size_gb"].get<int64_t>() > 0 &&
                   m["size_gb"].get<int64_t>() <= std::numeric_limits<int>::max()) {
            v.kind = ValidatedMount::Kind::CREATE;
            v.name = m["name"].get<std::string>();
            v.path = m["path"].get<std::string>();
            v.size_gb = m["size_gb"].get<int>();
        } else {
            out.clear();
            error = Error(ErrorKind::INVALID_MOUNT, m.dump());
            return false;
        }
        out.push_back(std::move(v));
    }
    return true;
}

// ============================================================================
// Resolution
// ============================================================================

ResolveResult VolumeManager::resolve(const std::vector<ValidatedMount>& mounts,
                                     const std::string& app, const std::string& region,
                                     const std::string& api_token) {
    ResolveResult result;

    for (const auto& m : mounts) {
        if (m.kind == ValidatedMount::Kind::EXISTING) {
            result.mounts.push_back({m.volume_id, m.path});
            continue;
        }

        auto created = client_.create_volume(app, m.name, m.size_gb, region, api_token);
        if (!created.success || !is_str(created.body, "id")) {
            std::string reason = created.success ? "response without volume id"
                                                 : created.error.to_string();
            spdlog::error("Volume {} creation failed in {}: {}", m.name, app, reason);
            cleanup(result.created_volumes, app, api_token);
            result.mounts.clear();
            result.created_volumes.clear();
            result.error = Error(ErrorKind::VOLUME_CREATION_FAILED, m.name + ": " + reason,
                                 created.error.code);
            return result;
        }

        std::string volume_id = created.body["id"].get<std::string>();
        spdlog::info("Created volume {} ({}, {}GB) for {}", volume_id, m.name, m.size_gb, app);
        result.mounts.push_back({volume_id, m.path});
        result.created_volumes.push_back(volume_id);
    }

    result.success = true;
    return result;
}

void VolumeManager::cleanup(const std::vector<std::string>& volume_ids, const std::string& app,
                            const std::string& api_token) {
    for (const auto& id : volume_ids) {
        auto deleted = client_.delete_volume(app, id, api_token);
        if (!deleted.success) {
            spdlog::warn("Failed to clean up volume {} in {}: {}", id, app, deleted.error.to_string());
        } else {
            spdlog::debug("Cleaned up volume {} in {}", id, app);
        }
    }
}

// ============================================================================
// Queries
// ============================================================================

ApiResult VolumeManager::list(const std::string& app, const std::string& api_token,
                              std::vector<VolumeInfo>& out) {
    out.clear();
    auto result = client_.list_volumes(app, api_token);
    if (result.success && result.body.is_array()) {
        for (const auto& v : result.body) {
            out.push_back(VolumeInfo::from_json(v));
        }
    }
    return result;
}

ApiResult VolumeManager::machine_volumes(const std::string& app, const std::string& machine_id,
                                         const std::string& api_token,
                                         std::vector<ResolvedMount>& out) {
    out.clear();
    auto result = client_.get_machine(app, machine_id, api_token);
    if (!result.success) return result;

    const auto& body = result.body;
    if (body.is_object() && body.contains("config") && body["config"].is_object() &&
        body["config"].contains("mounts") && body["config"]["mounts"].is_array()) {
        for (const auto& m : body["config"]["mounts"]) {
            out.push_back({str_or_empty(m, "volume"), str_or_empty(m, "path")});
        }
    }
    return result;
}

} // namespace sandpool::fleet
