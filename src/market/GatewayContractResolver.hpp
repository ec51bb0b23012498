/**
 * @file GatewayContractResolver.hpp
 * @brief Resolves option contract ids through the gateway's security definition endpoint
 */

#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include "../utils/Logger.hpp"
#include "../utils/HttpClient.hpp"
#include "../config/GatewayConfig.hpp"
#include "../market/MarketDataSource.hpp"

namespace SpreadArb {

/**
 * @class GatewayContractResolver
 * @brief One secdef lookup per distinct leg of the selected contenders
 */
class GatewayContractResolver : public ContractResolver {
public:
    /**
     * @brief Constructor
     * @param gateway Gateway connection settings
     * @param underlyingConid Contract id of the underlying index
     * @param httpClient HTTP client
     * @param logger Logger instance
     */
    GatewayContractResolver(GatewayConfig gateway, std::string underlyingConid,
                            std::shared_ptr<HttpClient> httpClient, std::shared_ptr<Logger> logger);

    ContractIdIndex resolve(const std::vector<Contender>& contenders) override;

    /**
     * @brief Pick the contract maturing on @p compactDate from a secdef/info response
     * @param body Response body, a JSON array of contract definitions
     * @param compactDate Maturity as YYYYMMDD
     * @return Contract id, or std::nullopt if none matches
     */
    static std::optional<std::string> parseSecdefInfo(const std::string& body, const std::string& compactDate);

    /**
     * @brief Query path for one leg
     */
    std::string secdefPath(const Leg& leg) const;

private:
    std::optional<std::string> lookup(const Leg& leg);

    GatewayConfig m_gateway;
    std::string m_underlyingConid;
    std::shared_ptr<HttpClient> m_httpClient;
    std::shared_ptr<Logger> m_logger;
};

}  // namespace SpreadArb
