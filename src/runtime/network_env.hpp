#pragma once
#include <map>
#include <string>
#include "runtime/adapter.hpp"

namespace sandpool::runtime {

constexpr const char* kNetworkModeVar = "SANDPOOL_NETWORK_MODE";
constexpr const char* kProxyIpVar = "SANDPOOL_PROXY_IP";
constexpr const char* kProxyPortVar = "SANDPOOL_PROXY_PORT";

// Environment variables describing the sandbox network policy:
//   no proxy  -> SANDPOOL_NETWORK_MODE=none
//   proxy     -> SANDPOOL_NETWORK_MODE=proxy_only plus proxy ip and port
std::map<std::string, std::string> build_network_env(const ProxySpec& proxy);

// User env with the network variables layered on top
std::map<std::string, std::string> merge_network_env(const std::map<std::string, std::string>& env,
                                                     const ProxySpec& proxy);

} // namespace sandpool::runtime
