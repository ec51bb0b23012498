/**
 * @file OrderBuilder.hpp
 * @brief Turns ranked contenders into combo order requests
 */

#pragma once

#include <string>
#include <vector>
#include <memory>
#include "../utils/Logger.hpp"
#include "../config/ConfigManager.hpp"
#include "../market/ChainIndex.hpp"
#include "../models/ContenderModel.hpp"
#include "../models/OrderModel.hpp"

namespace SpreadArb {

/**
 * @struct OrderBuilderConfig
 * @brief Read-only order context for a session
 */
struct OrderBuilderConfig {
    std::string accountId;
    double discountFactor = 1.0;               ///< Share of the edge offered as credit, in (0, 1]
    std::string underlyingSymbol = "SPX";
    std::string underlyingConid = "28812380";

    /**
     * @brief Read account/id, trading/discount_factor and the underlying section
     *
     * ACCOUNT_ID and DISCOUNT_VALUE override the file.
     */
    static OrderBuilderConfig fromConfig(const ConfigManager& config);
};

/**
 * @class OrderBuilder
 * @brief Encodes signed legs and prices a combo as a limit credit
 */
class OrderBuilder {
public:
    /**
     * @brief Constructor
     * @param config Order context
     * @param logger Logger instance
     * @throws std::invalid_argument if the discount factor is outside (0, 1]
     */
    OrderBuilder(OrderBuilderConfig config, std::shared_ptr<Logger> logger);

    /**
     * @brief Build one order
     *
     * limitPrice = -roundToCents(arbValue * discountFactor).
     *
     * @param contender Contender to trade
     * @param contractIds Resolved contract ids for the contender's legs
     * @param numFills Quantity
     * @return Order request
     * @throws DataInconsistencyError if a leg has no contract id
     */
    OrderRequest build(const Contender& contender, const ContractIdIndex& contractIds, int numFills) const;

    /**
     * @brief Build orders for every contender, skipping those with missing ids
     *        or a limit price that rounds to zero
     */
    std::vector<OrderRequest> buildBatch(const std::vector<Contender>& contenders,
                                         const ContractIdIndex& contractIds, int numFills) const;

    /**
     * @brief "<id>/<ratio>" per signed leg, joined with ","
     * @throws DataInconsistencyError if a leg has no contract id
     */
    static std::string encodeLegs(const Contender& contender, const ContractIdIndex& contractIds);

    const OrderBuilderConfig& getConfig() const { return m_config; }

private:
    OrderBuilderConfig m_config;
    std::shared_ptr<Logger> m_logger;
};

}  // namespace SpreadArb
