#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "fleet/client.hpp"

namespace sandpool::fleet {

// A mount after shape validation
struct ValidatedMount {
    enum class Kind { EXISTING, CREATE };

    Kind kind = Kind::EXISTING;
    std::string volume_id;   // EXISTING
    std::string name;        // CREATE
    std::string path;
    int size_gb = 0;         // CREATE, > 0
};

// A mount ready for the machine config
struct ResolvedMount {
    std::string volume;
    std::string path;
};

struct ResolveResult {
    bool success = false;
    std::vector<ResolvedMount> mounts;
    std::vector<std::string> created_volumes;
    Error error;
};

struct VolumeInfo {
    std::string id;
    std::string name;
    std::string state;
    std::string attached_machine_id;   // Empty when unattached
    std::string region;
    int size_gb = 0;
    std::string created_at;

    static VolumeInfo from_json(const json& j);
};

class VolumeManager {
public:
    explicit VolumeManager(FleetClient& client) : client_(client) {}

    // Accepts {volume, path} or {name, path, size_gb > 0}. Anything else
    // fails with INVALID_MOUNT carrying the offending mount. Null or empty
    // input yields no mounts. No network access.
    static bool validate(const json& mounts, std::vector<ValidatedMount>& out, Error& error);

    // Creates volumes for CREATE mounts in the given region. On failure
    // the volumes created so far are deleted.
    ResolveResult resolve(const std::vector<ValidatedMount>& mounts, const std::string& app,
                          const std::string& region, const std::string& api_token);

    // Best effort delete, failures are logged
    void cleanup(const std::vector<std::string>& volume_ids, const std::string& app,
                 const std::string& api_token);

    ApiResult list(const std::string& app, const std::string& api_token,
                   std::vector<VolumeInfo>& out);

    ApiResult machine_volumes(const std::string& app, const std::string& machine_id,
                              const std::string& api_token, std::vector<ResolvedMount>& out);

private:
    FleetClient& client_;
};

json mounts_to_json(const std::vector<ResolvedMount>& mounts);

} // namespace sandpool::fleet
