/**
 * @file ContenderModel.hpp
 * @brief Detected spread candidates and their signed leg layout
 */

#pragma once

#include <string>
#include <vector>
#include <variant>
#include "../models/OptionModel.hpp"

namespace SpreadArb {

/**
 * @enum SpreadStrategy
 * @brief Strategies the scanner knows how to detect
 */
enum class SpreadStrategy {
    CALENDAR,
    BUTTERFLY,
    BOXSPREAD
};

/**
 * @brief Strategy display name ("Calendar", "Butterfly", "Boxspread")
 */
std::string spreadStrategyToString(SpreadStrategy strategy);

/**
 * @brief Parse a strategy name, case insensitive
 * @throws std::invalid_argument for unknown names
 */
SpreadStrategy stringToSpreadStrategy(const std::string& name);

/**
 * @struct CalendarLegs
 * @brief Same type and strike at two consecutive expirations
 */
struct CalendarLegs {
    Leg near;   ///< Earlier-listed expiration, sold
    Leg far;    ///< Next expiration, bought
};

/**
 * @struct ButterflyLegs
 * @brief Three consecutive strikes at one expiration
 */
struct ButterflyLegs {
    Leg low;    ///< Bought once
    Leg mid;    ///< Sold twice
    Leg high;   ///< Bought once
};

/**
 * @struct BoxspreadLegs
 * @brief Call spread and put spread over the same two strikes
 */
struct BoxspreadLegs {
    Leg lowCall;    ///< Bought
    Leg highCall;   ///< Sold
    Leg lowPut;     ///< Bought
    Leg highPut;    ///< Sold
};

using SpreadLegs = std::variant<CalendarLegs, ButterflyLegs, BoxspreadLegs>;

/**
 * @struct SignedLeg
 * @brief A leg with its order ratio, positive to buy and negative to sell
 */
struct SignedLeg {
    Leg leg;
    int ratio = 0;

    /**
     * @brief "BUY" for positive ratios, "SELL" otherwise
     */
    std::string action() const;
};

/**
 * @struct Contender
 * @brief A positive-edge spread candidate awaiting ranking and submission
 */
struct Contender {
    SpreadLegs legs;                 ///< Strategy-specific legs, the active alternative is the strategy
    double arbValue = 0.0;           ///< Edge per unit, rounded to cents
    double avgAskSize = 0.0;         ///< Mean ask size over exactly the legs above
    std::string primaryExpiration;   ///< Expiration used for time decay in ranking
    double rankScore = 0.0;          ///< Filled in by ContenderRanker

    /**
     * @brief Strategy derived from the active legs alternative
     */
    SpreadStrategy strategy() const;

    /**
     * @brief Legs in canonical positional order
     *
     * Calendar [near, far], Butterfly [low, mid, high],
     * Boxspread [lowCall, highCall, lowPut, highPut].
     */
    std::vector<Leg> flatLegs() const;

    /**
     * @brief Legs in order-encoding order with their ratios
     *
     * Calendar: near -1, far +1.
     * Butterfly: mid -2, low +1, high +1.
     * Boxspread: highPut -1, lowPut +1, lowCall +1, highCall -1.
     */
    std::vector<SignedLeg> signedLegs() const;
};

}  // namespace SpreadArb
