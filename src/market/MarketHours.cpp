/**
 * @file MarketHours.cpp
 * @brief Implementation of the MarketHours gate
 */

#include "../market/MarketHours.hpp"
#include <ctime>

namespace SpreadArb {

MarketHoursConfig MarketHoursConfig::fromConfig(const ConfigManager& config) {
    MarketHoursConfig result;
    result.utcOffsetMinutes = config.getIntValue("market/utc_offset_minutes", result.utcOffsetMinutes);
    result.openMinute = config.getIntValue("market/open_minute", result.openMinute);
    result.closeMinute = config.getIntValue("market/close_minute", result.closeMinute);
    return result;
}

MarketHours::MarketHours(MarketHoursConfig config)
    : m_config(config) {
}

bool MarketHours::isOpen(const std::chrono::system_clock::time_point& now) const {
    if (!isWeekday(now)) {
        return false;
    }

    std::tm tm = localTime(now);
    int minuteOfDay = tm.tm_hour * 60 + tm.tm_min;
    return minuteOfDay >= m_config.openMinute && minuteOfDay <= m_config.closeMinute;
}

bool MarketHours::isWeekday(const std::chrono::system_clock::time_point& now) const {
    std::tm tm = localTime(now);
    return tm.tm_wday >= 1 && tm.tm_wday <= 5;
}

std::tm MarketHours::localTime(const std::chrono::system_clock::time_point& now) const {
    std::time_t shifted = std::chrono::system_clock::to_time_t(now) +
                          static_cast<std::time_t>(m_config.utcOffsetMinutes) * 60;
    std::tm tm{};
    gmtime_r(&shifted, &tm);
    return tm;
}

}  // namespace SpreadArb
