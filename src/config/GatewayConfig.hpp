/**
 * @file GatewayConfig.hpp
 * @brief Connection settings for the local brokerage gateway
 */

#pragma once

#include <string>
#include "../config/ConfigManager.hpp"

namespace SpreadArb {

/**
 * @struct GatewayConfig
 * @brief Where the gateway listens and how to talk to it
 */
struct GatewayConfig {
    std::string domain = "localhost";
    std::string port = "5000";
    bool verifyPeer = false;                ///< The local gateway serves a self-signed certificate
    long connectionTimeoutMs = 5000;
    long requestTimeoutMs = 10000;

    /**
     * @brief https://<domain>:<port>/v1/api
     */
    std::string baseUrl() const;

    /**
     * @brief Read the "gateway" section; DOMAIN and PORT override it
     */
    static GatewayConfig fromConfig(const ConfigManager& config);
};

}  // namespace SpreadArb
