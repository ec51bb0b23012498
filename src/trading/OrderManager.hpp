/**
 * @file OrderManager.hpp
 * @brief Live order submission and account queries through the brokerage gateway
 */

#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include "../utils/Logger.hpp"
#include "../utils/HttpClient.hpp"
#include "../config/GatewayConfig.hpp"
#include "../models/OrderModel.hpp"
#include "../trading/OrderSink.hpp"

namespace SpreadArb {

/**
 * @struct SubmissionReply
 * @brief What the gateway said about a submitted batch
 */
struct SubmissionReply {
    std::vector<std::string> orderIds;     ///< Orders accepted
    std::vector<std::string> promptIds;    ///< Confirmation prompts awaiting a reply
    std::string error;                     ///< Rejection message, empty if none
};

/**
 * @class OrderManager
 * @brief Gateway-backed order sink and portfolio query
 */
class OrderManager : public OrderSubmissionSink, public PortfolioQuery {
public:
    /**
     * @brief Constructor
     * @param gateway Gateway connection settings
     * @param accountId Account to trade in
     * @param httpClient HTTP client
     * @param logger Logger instance
     */
    OrderManager(GatewayConfig gateway, std::string accountId,
                 std::shared_ptr<HttpClient> httpClient, std::shared_ptr<Logger> logger);

    /**
     * @brief Net liquidation value of the account, -1 if it cannot be read
     */
    double getPortfolioValue() override;

    /**
     * @brief Post the batch and confirm any prompts
     * @return True if the gateway accepted the batch without error
     */
    bool submitOrders(const std::vector<OrderRequest>& orders) override;

    /**
     * @brief Cancel orders still PreSubmitted, Submitted or PendingSubmit
     * @return Number of orders cancelled
     */
    int cancelPendingOrders() override;

    /**
     * @brief netliquidation.amount from a portfolio summary response
     */
    static std::optional<double> parseNetLiquidation(const std::string& body);

    /**
     * @brief Split an order or reply response into accepted ids, prompts and errors
     */
    static SubmissionReply parseSubmissionReply(const std::string& body);

    /**
     * @brief Ids of working orders in a live orders response
     */
    static std::vector<std::string> parsePendingOrderIds(const std::string& body);

    static constexpr int MAX_CONFIRMATIONS = 5;

private:
    HttpResponse makeApiRequest(HttpMethod method, const std::string& endpoint, const std::string& body = "");

    GatewayConfig m_gateway;
    std::string m_accountId;
    std::shared_ptr<HttpClient> m_httpClient;
    std::shared_ptr<Logger> m_logger;
};

}  // namespace SpreadArb
