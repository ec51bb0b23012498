/**
 * @file GatewayConfig.cpp
 * @brief Implementation of GatewayConfig
 */

#include "../config/GatewayConfig.hpp"
#include <fmt/format.h>

namespace SpreadArb {

std::string GatewayConfig::baseUrl() const {
    return fmt::format("https://{}:{}/v1/api", domain, port);
}

GatewayConfig GatewayConfig::fromConfig(const ConfigManager& config) {
    GatewayConfig result;
    result.domain = config.getEnvOrString("DOMAIN", "gateway/domain", result.domain);
    result.port = config.getEnvOrString("PORT", "gateway/port", result.port);
    result.verifyPeer = config.getBoolValue("gateway/verify_peer", result.verifyPeer);
    result.connectionTimeoutMs = config.getIntValue("gateway/connection_timeout_ms",
                                                    static_cast<int>(result.connectionTimeoutMs));
    result.requestTimeoutMs = config.getIntValue("gateway/request_timeout_ms",
                                                 static_cast<int>(result.requestTimeoutMs));
    return result;
}

}  // namespace SpreadArb
