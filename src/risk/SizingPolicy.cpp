/**
 * @file SizingPolicy.cpp
 * @brief Implementation of the SizingPolicy class
 */

#include "../risk/SizingPolicy.hpp"
#include <cmath>
#include <stdexcept>

namespace SpreadArb {

SizingPolicy::SizingPolicy(double capitalUnit, std::shared_ptr<Logger> logger)
    : m_capitalUnit(capitalUnit), m_logger(logger) {
    if (!(capitalUnit > 0.0)) {
        throw std::invalid_argument("Capital unit must be positive, got " + std::to_string(capitalUnit));
    }
}

SizingPolicy SizingPolicy::fromConfig(const ConfigManager& config, std::shared_ptr<Logger> logger) {
    return SizingPolicy(config.getDoubleValue("sizing/capital_unit", DEFAULT_CAPITAL_UNIT), logger);
}

void SizingPolicy::validateFillType(const std::string& fillType) {
    if (fillType != "1" && fillType != "2" && fillType != "3") {
        throw std::invalid_argument("Unknown fill type: '" + fillType + "' (expected 1, 2 or 3)");
    }
}

Allocation SizingPolicy::size(const std::string& fillType, double portfolioValue) const {
    validateFillType(fillType);

    Allocation allocation;
    if (!(portfolioValue >= m_capitalUnit)) {
        m_logger->warn("Portfolio value {:.2f} is below one capital unit of {:.2f}", portfolioValue, m_capitalUnit);
        return allocation;
    }

    int units = static_cast<int>(std::floor(portfolioValue / m_capitalUnit));

    if (fillType == "1") {
        allocation.numOrders = 1;
        allocation.numFills = 1;
    } else if (fillType == "2") {
        allocation.numOrders = 1;
        allocation.numFills = units;
    } else {
        allocation.numOrders = units;
        allocation.numFills = 1;
    }

    m_logger->debug("Fill type {} with portfolio value {:.2f}: {} orders of {} fills",
                    fillType, portfolioValue, allocation.numOrders, allocation.numFills);
    return allocation;
}

}  // namespace SpreadArb
