/**
 * @file PaperTrader.hpp
 * @brief Simulated order sink and portfolio for paper trading
 */

#pragma once

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <chrono>
#include "../utils/Logger.hpp"
#include "../config/ConfigManager.hpp"
#include "../models/OrderModel.hpp"
#include "../trading/OrderSink.hpp"

namespace SpreadArb {

/**
 * @struct PaperBatch
 * @brief One batch accepted by the paper trader
 */
struct PaperBatch {
    std::vector<OrderRequest> orders;
    std::chrono::system_clock::time_point submittedAt;
};

/**
 * @class PaperTrader
 * @brief Accepts every order, reports a fixed portfolio value
 *
 * Batches are kept in memory for the session only.
 */
class PaperTrader : public OrderSubmissionSink, public PortfolioQuery {
public:
    static constexpr double DEFAULT_PORTFOLIO_VALUE = 100000.0;

    /**
     * @brief Constructor
     * @param portfolioValue Value reported by getPortfolioValue()
     * @param logger Logger instance
     */
    PaperTrader(double portfolioValue, std::shared_ptr<Logger> logger);

    /**
     * @brief Build from "paper/portfolio_value"
     */
    static std::shared_ptr<PaperTrader> fromConfig(const ConfigManager& config, std::shared_ptr<Logger> logger);

    double getPortfolioValue() override;

    bool submitOrders(const std::vector<OrderRequest>& orders) override;

    /**
     * @brief Nothing rests in the paper book, always 0
     */
    int cancelPendingOrders() override;

    /**
     * @brief Batches submitted so far
     */
    std::vector<PaperBatch> getBatches() const;

    /**
     * @brief Total orders across all batches
     */
    size_t getOrderCount() const;

    void setPortfolioValue(double value);

private:
    double m_portfolioValue;                ///< Reported net liquidation value
    std::vector<PaperBatch> m_batches;      ///< Submission history
    mutable std::mutex m_mutex;             ///< Guards the fields above
    std::shared_ptr<Logger> m_logger;       ///< Logger instance
};

}  // namespace SpreadArb
