/**
 * @file ExpiryCalendar.cpp
 * @brief Implementation of the ExpiryCalendar helpers
 */

#include "../market/ExpiryCalendar.hpp"
#include <array>
#include <algorithm>
#include <cctype>
#include <ctime>
#include <stdexcept>
#include <unordered_set>
#include <fmt/format.h>

namespace SpreadArb {

namespace {

const std::array<const char*, 12> kMonthCodes = {
    "JAN", "FEB", "MAR", "APR", "MAY", "JUN",
    "JUL", "AUG", "SEP", "OCT", "NOV", "DEC"
};

bool allDigits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(),
                                     [](unsigned char c) { return std::isdigit(c) != 0; });
}

bool isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

unsigned lastDayOfMonth(int year, unsigned month) {
    static const std::array<unsigned, 12> days = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && isLeapYear(year)) {
        return 29;
    }
    return days[month - 1];
}

}  // namespace

CivilDate ExpiryCalendar::parse(const std::string& date) {
    std::string digits;
    if (date.size() == 10 && date[4] == '-' && date[7] == '-') {
        digits = date.substr(0, 4) + date.substr(5, 2) + date.substr(8, 2);
    } else {
        digits = date;
    }

    if (!allDigits(digits) || (digits.size() != 6 && digits.size() != 8)) {
        throw std::invalid_argument("Malformed expiration date: " + date);
    }

    CivilDate result;
    if (digits.size() == 6) {
        result.year = 2000 + std::stoi(digits.substr(0, 2));
        result.month = static_cast<unsigned>(std::stoi(digits.substr(2, 2)));
        result.day = static_cast<unsigned>(std::stoi(digits.substr(4, 2)));
    } else {
        result.year = std::stoi(digits.substr(0, 4));
        result.month = static_cast<unsigned>(std::stoi(digits.substr(4, 2)));
        result.day = static_cast<unsigned>(std::stoi(digits.substr(6, 2)));
    }

    if (result.month < 1 || result.month > 12 ||
        result.day < 1 || result.day > lastDayOfMonth(result.year, result.month)) {
        throw std::invalid_argument("Invalid calendar date: " + date);
    }
    return result;
}

long ExpiryCalendar::daysFromCivil(const CivilDate& date) {
    // Era-based conversion, valid for the whole proleptic Gregorian calendar
    long y = static_cast<long>(date.year) - (date.month <= 2 ? 1 : 0);
    long era = (y >= 0 ? y : y - 399) / 400;
    long yoe = y - era * 400;
    long mp = (static_cast<long>(date.month) + 9) % 12;
    long doy = (153 * mp + 2) / 5 + static_cast<long>(date.day) - 1;
    long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

long ExpiryCalendar::daysBetween(const std::string& reference, const std::string& target) {
    return daysFromCivil(parse(target)) - daysFromCivil(parse(reference));
}

std::string ExpiryCalendar::monthLabel(const std::string& date) {
    if (date.size() != 6 || !allDigits(date)) {
        throw std::invalid_argument("Expected YYMMDD date, got: " + date);
    }

    int month = std::stoi(date.substr(2, 2));
    if (month < 1 || month > 12) {
        throw std::invalid_argument("Month out of range in date: " + date);
    }
    return std::string(kMonthCodes[month - 1]) + date.substr(0, 2);
}

std::vector<std::string> ExpiryCalendar::distinctMonthLabels(const std::vector<std::string>& dates) {
    std::vector<std::string> labels;
    std::unordered_set<std::string> seen;

    for (const auto& date : dates) {
        std::string label = monthLabel(date);
        if (seen.insert(label).second) {
            labels.push_back(label);
        }
    }
    return labels;
}

std::string ExpiryCalendar::toCompactDate(const std::string& date) {
    CivilDate civil = parse(date);
    return fmt::format("{:04d}{:02d}{:02d}", civil.year, civil.month, civil.day);
}

std::string ExpiryCalendar::toShortDate(const std::chrono::system_clock::time_point& tp) {
    std::time_t timeT = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&timeT, &tm);
    return fmt::format("{:02d}{:02d}{:02d}", tm.tm_year % 100, tm.tm_mon + 1, tm.tm_mday);
}

std::string ExpiryCalendar::today() {
    return toShortDate(std::chrono::system_clock::now());
}

}  // namespace SpreadArb
