/**
 * @file TradingCycle.cpp
 * @brief Implementation of the TradingCycle class
 */

#include "../trading/TradingCycle.hpp"
#include <algorithm>

namespace SpreadArb {

TradingCycle::TradingCycle(std::shared_ptr<ArbitrageScanner> scanner,
                           std::shared_ptr<ContenderRanker> ranker,
                           std::shared_ptr<SizingPolicy> sizing,
                           std::shared_ptr<OrderBuilder> builder,
                           std::shared_ptr<MarketDataSource> marketData,
                           std::shared_ptr<ContractResolver> resolver,
                           std::shared_ptr<OrderSubmissionSink> sink,
                           std::shared_ptr<ThreadPool> pool,
                           std::shared_ptr<Logger> logger)
    : m_scanner(scanner),
      m_ranker(ranker),
      m_sizing(sizing),
      m_builder(builder),
      m_marketData(marketData),
      m_resolver(resolver),
      m_sink(sink),
      m_pool(pool),
      m_logger(logger) {
}

CycleResult TradingCycle::run(const CycleContext& context) {
    CycleResult result;

    result.allocation = m_sizing->size(context.fillType, context.portfolioValue);
    if (result.allocation.isEmpty()) {
        m_logger->warn("Not enough equity in account to make a trade.");
        result.halted = true;
        return result;
    }

    ChainSnapshot snapshot = m_marketData->fetchSnapshot();

    std::vector<Contender> candidates = m_scanner->scanAll(snapshot, m_pool.get());
    result.candidateCount = candidates.size();

    int depth = result.allocation.numOrders;
    if (context.maxOrders > 0) {
        depth = std::min(depth, context.maxOrders);
    }

    result.selected = m_ranker->rank(std::move(candidates), context.referenceDate, depth);
    if (result.selected.empty()) {
        m_logger->info("No contenders this cycle");
        return result;
    }

    ContractIdIndex contractIds = m_resolver->resolve(result.selected);
    result.orders = m_builder->buildBatch(result.selected, contractIds, result.allocation.numFills);
    if (result.orders.empty()) {
        m_logger->warn("None of the {} selected contenders could be turned into orders", result.selected.size());
        return result;
    }

    result.submitted = m_sink->submitOrders(result.orders);
    m_logger->info("Cycle submitted {} orders of {} fills ({})", result.orders.size(),
                   result.allocation.numFills, result.submitted ? "accepted" : "rejected");
    return result;
}

}  // namespace SpreadArb
