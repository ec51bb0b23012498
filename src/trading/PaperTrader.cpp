/**
 * @file PaperTrader.cpp
 * @brief Implementation of the PaperTrader class
 */

#include "../trading/PaperTrader.hpp"

namespace SpreadArb {

PaperTrader::PaperTrader(double portfolioValue, std::shared_ptr<Logger> logger)
    : m_portfolioValue(portfolioValue), m_logger(logger) {
    m_logger->info("Paper trading with a portfolio value of {:.2f}", m_portfolioValue);
}

std::shared_ptr<PaperTrader> PaperTrader::fromConfig(const ConfigManager& config, std::shared_ptr<Logger> logger) {
    return std::make_shared<PaperTrader>(
        config.getDoubleValue("paper/portfolio_value", DEFAULT_PORTFOLIO_VALUE), logger);
}

double PaperTrader::getPortfolioValue() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_portfolioValue;
}

bool PaperTrader::submitOrders(const std::vector<OrderRequest>& orders) {
    for (const auto& order : orders) {
        m_logger->info("[PAPER] {} {} x{} @ {:.2f} {} legs {}",
                       OrderRequest::transactionTypeToString(order.side),
                       order.underlyingSymbol, order.quantity, order.limitPrice,
                       OrderRequest::orderTypeToString(order.orderType), order.conidex());
    }

    PaperBatch batch;
    batch.orders = orders;
    batch.submittedAt = std::chrono::system_clock::now();

    std::lock_guard<std::mutex> lock(m_mutex);
    m_batches.push_back(std::move(batch));
    return true;
}

int PaperTrader::cancelPendingOrders() {
    return 0;
}

std::vector<PaperBatch> PaperTrader::getBatches() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_batches;
}

size_t PaperTrader::getOrderCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t count = 0;
    for (const auto& batch : m_batches) {
        count += batch.orders.size();
    }
    return count;
}

void PaperTrader::setPortfolioValue(double value) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_portfolioValue = value;
}

}  // namespace SpreadArb
