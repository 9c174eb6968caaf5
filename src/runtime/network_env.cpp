#include "runtime/network_env.hpp"

namespace sandpool::runtime {

std::map<std::string, std::string> build_network_env(const ProxySpec& proxy) {
    if (!proxy.enabled()) {
        return {{kNetworkModeVar, "none"}};
    }
    return {
        {kNetworkModeVar, "proxy_only"},
        {kProxyIpVar, proxy.ip},
        {kProxyPortVar, std::to_string(proxy.port)}
    };
}

std::map<std::string, std::string> merge_network_env(const std::map<std::string, std::string>& env,
                                                     const ProxySpec& proxy) {
    auto merged = env;
    for (const auto& [key, value] : build_network_env(proxy)) {
        merged[key] = value;
    }
    return merged;
}

} // namespace sandpool::runtime
