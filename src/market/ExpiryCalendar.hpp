/**
 * @file ExpiryCalendar.hpp
 * @brief Expiration date parsing, day arithmetic and month labels
 */

#pragma once

#include <string>
#include <vector>
#include <chrono>

namespace SpreadArb {

/**
 * @struct CivilDate
 * @brief Proleptic Gregorian calendar date
 */
struct CivilDate {
    int year = 1970;
    unsigned month = 1;
    unsigned day = 1;
};

/**
 * @class ExpiryCalendar
 * @brief Stateless helpers for option expiration dates
 *
 * Accepted date formats are "YYMMDD" (years 2000-2099), "YYYYMMDD" and
 * "YYYY-MM-DD". Anything else raises std::invalid_argument.
 */
class ExpiryCalendar {
public:
    /**
     * @brief Parse an expiration date
     * @param date Date string in one of the accepted formats
     * @return Calendar date
     * @throws std::invalid_argument on malformed input or impossible dates
     */
    static CivilDate parse(const std::string& date);

    /**
     * @brief Days since 1970-01-01 for a calendar date
     */
    static long daysFromCivil(const CivilDate& date);

    /**
     * @brief Signed number of days from @p reference to @p target
     */
    static long daysBetween(const std::string& reference, const std::string& target);

    /**
     * @brief Month selector label for a "YYMMDD" date, e.g. "211101" -> "NOV21"
     * @throws std::invalid_argument when the date is not YYMMDD or the month is out of range
     */
    static std::string monthLabel(const std::string& date);

    /**
     * @brief Month labels of @p dates without duplicates, first-seen order kept
     */
    static std::vector<std::string> distinctMonthLabels(const std::vector<std::string>& dates);

    /**
     * @brief Date as "YYYYMMDD", the gateway's maturityDate format
     */
    static std::string toCompactDate(const std::string& date);

    /**
     * @brief UTC calendar date of a time point as "YYMMDD"
     */
    static std::string toShortDate(const std::chrono::system_clock::time_point& tp);

    /**
     * @brief Today's UTC date as "YYMMDD"
     */
    static std::string today();
};

}  // namespace SpreadArb
