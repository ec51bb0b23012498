/**
 * @file OrderModel.hpp
 * @brief Multi-leg combo order request sent to the brokerage gateway
 */

#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace SpreadArb {

/**
 * @enum OrderType
 * @brief Types of orders
 */
enum class OrderType {
    LIMIT
};

/**
 * @enum TransactionType
 * @brief Side of the combo order
 */
enum class TransactionType {
    BUY
};

/**
 * @enum Validity
 * @brief Order time in force
 */
enum class Validity {
    DAY
};

/**
 * @struct OrderRequest
 * @brief One combo order, ready for submission
 *
 * legEncoding holds "<conid>/<ratio>" pairs joined by commas; the wire
 * form prefixes it with the underlying conid as "<underlying>;;;<legs>".
 */
struct OrderRequest {
    std::string accountId;                            ///< Account the order is placed in
    std::string underlyingConid;                      ///< Combo underlying contract id
    std::string legEncoding;                          ///< Signed legs, e.g. "123/-1,456/1"
    OrderType orderType = OrderType::LIMIT;
    std::string venue = "SMART";                      ///< Listing exchange / routing destination
    bool outsideRegularHours = false;
    double limitPrice = 0.0;                          ///< Negative for a credit
    TransactionType side = TransactionType::BUY;
    std::string underlyingSymbol;                     ///< Ticker of the underlying, e.g. "SPX"
    Validity timeInForce = Validity::DAY;
    std::string referrerTag = "NO_REFERRER_PROVIDED";
    int quantity = 0;
    bool useAdaptiveRouting = false;

    /**
     * @brief Full combo contract expression, "<underlyingConid>;;;<legEncoding>"
     */
    std::string conidex() const;

    /**
     * @brief Gateway order object
     */
    nlohmann::json toJson() const;

    static std::string orderTypeToString(OrderType type);
    static std::string transactionTypeToString(TransactionType type);
    static std::string validityToString(Validity validity);
};

/**
 * @brief Gateway batch body, {"orders": [...]}
 */
nlohmann::json buildOrdersPayload(const std::vector<OrderRequest>& orders);

}  // namespace SpreadArb
