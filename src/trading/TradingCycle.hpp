/**
 * @file TradingCycle.hpp
 * @brief One snapshot-to-orders pass of the strategy
 */

#pragma once

#include <string>
#include <vector>
#include <memory>
#include "../utils/Logger.hpp"
#include "../utils/ThreadPool.hpp"
#include "../analysis/ArbitrageScanner.hpp"
#include "../analysis/ContenderRanker.hpp"
#include "../risk/SizingPolicy.hpp"
#include "../market/MarketDataSource.hpp"
#include "../trading/OrderBuilder.hpp"
#include "../trading/OrderSink.hpp"

namespace SpreadArb {

/**
 * @struct CycleContext
 * @brief Read-only inputs of one cycle
 */
struct CycleContext {
    std::string referenceDate;      ///< Today, used for time to expiration
    std::string fillType = "1";     ///< Sizing mode, "1", "2" or "3"
    double portfolioValue = 0.0;    ///< Capital available this cycle
    int maxOrders = 0;              ///< Cap on orders per cycle, 0 for none
};

/**
 * @struct CycleResult
 * @brief What one cycle decided and did
 */
struct CycleResult {
    Allocation allocation;
    bool halted = false;                    ///< Not enough capital, the loop should stop
    size_t candidateCount = 0;              ///< Contenders found before ranking
    std::vector<Contender> selected;        ///< Ranked contenders that were sized
    std::vector<OrderRequest> orders;       ///< Orders handed to the sink
    bool submitted = false;                 ///< Sink accepted the batch
};

/**
 * @class TradingCycle
 * @brief Size, scan, rank, resolve, build and submit
 */
class TradingCycle {
public:
    /**
     * @brief Constructor
     * @param scanner Arbitrage scanner
     * @param ranker Contender ranker
     * @param sizing Sizing policy
     * @param builder Order builder
     * @param marketData Snapshot source
     * @param resolver Contract id resolver
     * @param sink Order sink
     * @param pool Pool for parallel scanning, may be null
     * @param logger Logger instance
     */
    TradingCycle(std::shared_ptr<ArbitrageScanner> scanner,
                 std::shared_ptr<ContenderRanker> ranker,
                 std::shared_ptr<SizingPolicy> sizing,
                 std::shared_ptr<OrderBuilder> builder,
                 std::shared_ptr<MarketDataSource> marketData,
                 std::shared_ptr<ContractResolver> resolver,
                 std::shared_ptr<OrderSubmissionSink> sink,
                 std::shared_ptr<ThreadPool> pool,
                 std::shared_ptr<Logger> logger);

    /**
     * @brief Run one cycle
     * @throws std::runtime_error if the snapshot cannot be fetched
     * @throws std::invalid_argument for an unknown fill type
     */
    CycleResult run(const CycleContext& context);

private:
    std::shared_ptr<ArbitrageScanner> m_scanner;
    std::shared_ptr<ContenderRanker> m_ranker;
    std::shared_ptr<SizingPolicy> m_sizing;
    std::shared_ptr<OrderBuilder> m_builder;
    std::shared_ptr<MarketDataSource> m_marketData;
    std::shared_ptr<ContractResolver> m_resolver;
    std::shared_ptr<OrderSubmissionSink> m_sink;
    std::shared_ptr<ThreadPool> m_pool;
    std::shared_ptr<Logger> m_logger;
};

}  // namespace SpreadArb
