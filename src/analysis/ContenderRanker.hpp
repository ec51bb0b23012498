/**
 * @file ContenderRanker.hpp
 * @brief Orders contenders by liquidity- and time-weighted edge
 */

#pragma once

#include <string>
#include <vector>
#include <memory>
#include "../utils/Logger.hpp"
#include "../models/ContenderModel.hpp"

namespace SpreadArb {

/**
 * @class ContenderRanker
 * @brief Scores contenders and keeps the best ones
 */
class ContenderRanker {
public:
    /**
     * @brief Constructor
     * @param logger Logger instance
     */
    explicit ContenderRanker(std::shared_ptr<Logger> logger);

    /**
     * @brief Signed day count from @p referenceDate to @p targetDate
     * @throws std::invalid_argument when either date is malformed
     */
    static long timeDifference(const std::string& referenceDate, const std::string& targetDate);

    /**
     * @brief (avgAskSize * arbValue) / max(1, days to expiration)
     */
    static double rankScore(double avgAskSize, double arbValue,
                            const std::string& referenceDate, const std::string& expirationDate);

    /**
     * @brief Score, sort descending and truncate
     *
     * Ties keep the order in which the candidates were supplied. A
     * contender whose expiration cannot be parsed is logged and dropped.
     *
     * @param candidates Contenders from every strategy
     * @param referenceDate Today's date
     * @param depth Maximum number of contenders to keep, non-positive keeps none
     * @return Best contenders with rankScore filled in
     */
    std::vector<Contender> rank(std::vector<Contender> candidates, const std::string& referenceDate,
                                int depth) const;

private:
    std::shared_ptr<Logger> m_logger;
};

}  // namespace SpreadArb
