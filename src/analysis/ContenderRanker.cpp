/**
 * @file ContenderRanker.cpp
 * @brief Implementation of the ContenderRanker class
 */

#include "../analysis/ContenderRanker.hpp"
#include "../market/ExpiryCalendar.hpp"
#include <algorithm>
#include <stdexcept>

namespace SpreadArb {

ContenderRanker::ContenderRanker(std::shared_ptr<Logger> logger)
    : m_logger(logger) {
}

long ContenderRanker::timeDifference(const std::string& referenceDate, const std::string& targetDate) {
    return ExpiryCalendar::daysBetween(referenceDate, targetDate);
}

double ContenderRanker::rankScore(double avgAskSize, double arbValue,
                                  const std::string& referenceDate, const std::string& expirationDate) {
    long days = std::max(1L, timeDifference(referenceDate, expirationDate));
    return (avgAskSize * arbValue) / static_cast<double>(days);
}

std::vector<Contender> ContenderRanker::rank(std::vector<Contender> candidates, const std::string& referenceDate,
                                             int depth) const {
    if (depth <= 0) {
        return {};
    }

    std::vector<Contender> scored;
    scored.reserve(candidates.size());

    for (auto& contender : candidates) {
        try {
            contender.rankScore = rankScore(contender.avgAskSize, contender.arbValue,
                                            referenceDate, contender.primaryExpiration);
            scored.push_back(std::move(contender));
        } catch (const std::invalid_argument& e) {
            m_logger->warn("Dropping {} contender expiring {}: {}",
                           spreadStrategyToString(contender.strategy()), contender.primaryExpiration, e.what());
        }
    }

    std::stable_sort(scored.begin(), scored.end(), [](const Contender& a, const Contender& b) {
        return a.rankScore > b.rankScore;
    });

    if (scored.size() > static_cast<size_t>(depth)) {
        scored.resize(static_cast<size_t>(depth));
    }

    m_logger->info("Ranked {} contenders, keeping {}", candidates.size(), scored.size());
    return scored;
}

}  // namespace SpreadArb
