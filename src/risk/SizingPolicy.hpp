/**
 * @file SizingPolicy.hpp
 * @brief Turns available capital into a number of orders and fills per order
 */

#pragma once

#include <string>
#include <memory>
#include <utility>
#include "../utils/Logger.hpp"
#include "../config/ConfigManager.hpp"

namespace SpreadArb {

/**
 * @struct Allocation
 * @brief How many distinct orders to place and how many fills each carries
 */
struct Allocation {
    int numOrders = 0;
    int numFills = 0;

    /**
     * @brief (0, 0) means there is not enough capital to trade
     */
    bool isEmpty() const { return numOrders == 0 && numFills == 0; }
};

/**
 * @class SizingPolicy
 * @brief Allocates capital in fixed units
 *
 * Fill type "1" places a single one-lot order, "2" puts every unit into
 * one order and "3" spreads the units over separate one-lot orders.
 */
class SizingPolicy {
public:
    static constexpr double DEFAULT_CAPITAL_UNIT = 600.0;

    /**
     * @brief Constructor
     * @param capitalUnit Capital required per fill
     * @param logger Logger instance
     * @throws std::invalid_argument if capitalUnit is not positive
     */
    SizingPolicy(double capitalUnit, std::shared_ptr<Logger> logger);

    /**
     * @brief Build from "sizing/capital_unit"
     */
    static SizingPolicy fromConfig(const ConfigManager& config, std::shared_ptr<Logger> logger);

    /**
     * @brief Check a fill type code
     * @throws std::invalid_argument unless it is "1", "2" or "3"
     */
    static void validateFillType(const std::string& fillType);

    /**
     * @brief Size one cycle
     * @param fillType "1", "2" or "3"
     * @param portfolioValue Capital available to trade
     * @return Allocation, empty when portfolioValue is below one capital unit
     * @throws std::invalid_argument for an unknown fill type
     */
    Allocation size(const std::string& fillType, double portfolioValue) const;

    double getCapitalUnit() const { return m_capitalUnit; }

private:
    double m_capitalUnit;                ///< Capital required per fill
    std::shared_ptr<Logger> m_logger;    ///< Logger instance
};

}  // namespace SpreadArb
