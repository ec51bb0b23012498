/**
 * @file MarketHours.hpp
 * @brief Regular trading session gate for the polling loop
 */

#pragma once

#include <chrono>
#include <ctime>
#include <memory>
#include "../config/ConfigManager.hpp"

namespace SpreadArb {

/**
 * @struct MarketHoursConfig
 * @brief Session bounds in exchange-local minutes after midnight
 */
struct MarketHoursConfig {
    int utcOffsetMinutes = -240;   ///< Exchange local time minus UTC
    int openMinute = 9 * 60 + 30;  ///< First open minute, inclusive
    int closeMinute = 15 * 60 + 15; ///< Last open minute, inclusive

    /**
     * @brief Read "market/utc_offset_minutes", "market/open_minute" and "market/close_minute"
     */
    static MarketHoursConfig fromConfig(const ConfigManager& config);
};

/**
 * @class MarketHours
 * @brief Decides whether a cycle may trade at a given instant
 */
class MarketHours {
public:
    explicit MarketHours(MarketHoursConfig config);

    /**
     * @brief True on weekdays between the open and close minute, both inclusive
     * @param now Instant to test
     */
    bool isOpen(const std::chrono::system_clock::time_point& now) const;

    /**
     * @brief True when the exchange-local day of @p now is Monday to Friday
     */
    bool isWeekday(const std::chrono::system_clock::time_point& now) const;

private:
    /**
     * @brief Broken-down exchange-local time of @p now
     */
    std::tm localTime(const std::chrono::system_clock::time_point& now) const;

    MarketHoursConfig m_config;
};

}  // namespace SpreadArb
