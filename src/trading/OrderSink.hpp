/**
 * @file OrderSink.hpp
 * @brief Interfaces for order submission and account valuation
 */

#pragma once

#include <vector>
#include "../models/OrderModel.hpp"

namespace SpreadArb {

/**
 * @class OrderSubmissionSink
 * @brief Accepts order batches
 */
class OrderSubmissionSink {
public:
    virtual ~OrderSubmissionSink() = default;

    /**
     * @brief Submit a batch
     * @return True if every order was accepted
     */
    virtual bool submitOrders(const std::vector<OrderRequest>& orders) = 0;

    /**
     * @brief Cancel orders still working from previous cycles
     * @return Number of orders cancelled
     */
    virtual int cancelPendingOrders() = 0;
};

/**
 * @class PortfolioQuery
 * @brief Reports capital available to trade
 */
class PortfolioQuery {
public:
    virtual ~PortfolioQuery() = default;

    /**
     * @brief Net liquidation value, or a negative value if it cannot be read
     */
    virtual double getPortfolioValue() = 0;
};

}  // namespace SpreadArb
