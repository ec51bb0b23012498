/**
 * @file OptionModel.hpp
 * @brief Quote, leg and strike key types for a listed option chain
 */

#pragma once

#include <string>
#include <cmath>

namespace SpreadArb {

/**
 * @enum OptionType
 * @brief Types of options
 */
enum class OptionType {
    CALL,
    PUT
};

/**
 * @brief Convert option type to the gateway's right code ("C" / "P")
 * @param type Option type
 * @return Right code
 */
std::string optionTypeToString(OptionType type);

/**
 * @brief Convert a right code to an option type
 * @param typeStr "C", "P", "CALL" or "PUT" (case insensitive)
 * @return Option type
 * @throws std::invalid_argument for any other value
 */
OptionType stringToOptionType(const std::string& typeStr);

/**
 * @brief Round a price to whole cents, halves away from zero
 */
inline double roundToCents(double price) {
    return std::round(price * 100.0) / 100.0;
}

/**
 * @struct StrikeKey
 * @brief Exact map key for a strike price
 *
 * Equality and ordering are over the exact double received, with no
 * tolerance. NaN compares equal to NaN and greater than every number so
 * the ordering stays total.
 */
struct StrikeKey {
    double value;

    StrikeKey() : value(0.0) {}
    StrikeKey(double v) : value(v) {}

    bool operator<(const StrikeKey& other) const {
        bool lhsNan = std::isnan(value);
        bool rhsNan = std::isnan(other.value);
        if (lhsNan || rhsNan) {
            return !lhsNan && rhsNan;
        }
        return value < other.value;
    }

    bool operator==(const StrikeKey& other) const {
        if (std::isnan(value) || std::isnan(other.value)) {
            return std::isnan(value) && std::isnan(other.value);
        }
        return value == other.value;
    }

    bool operator!=(const StrikeKey& other) const { return !(*this == other); }
};

/**
 * @struct Quote
 * @brief Top-of-book snapshot for one (date, type, strike)
 */
struct Quote {
    double midPrice = 0.0;   ///< Mid (mark) price
    double bid = 0.0;        ///< Best bid
    double askSize = 0.0;    ///< Size resting at the best ask
};

/**
 * @struct Leg
 * @brief One option contract taking part in a spread
 */
struct Leg {
    std::string date;                       ///< Expiration, as listed by the data source
    OptionType optionType = OptionType::CALL;
    double strike = 0.0;
    double midPrice = 0.0;                  ///< Mid price at detection time

    /**
     * @brief Human-readable form, e.g. "4500C 231020"
     */
    std::string describe() const;
};

}  // namespace SpreadArb
