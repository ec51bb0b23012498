/**
 * @file OrderModel.cpp
 * @brief Implementation of the OrderModel
 */

#include "../models/OrderModel.hpp"

namespace SpreadArb {

std::string OrderRequest::conidex() const {
    return underlyingConid + ";;;" + legEncoding;
}

nlohmann::json OrderRequest::toJson() const {
    return nlohmann::json{
        {"acctId", accountId},
        {"conidex", conidex()},
        {"orderType", orderTypeToString(orderType)},
        {"listingExchange", venue},
        {"outsideRTH", outsideRegularHours},
        {"price", limitPrice},
        {"side", transactionTypeToString(side)},
        {"ticker", underlyingSymbol},
        {"tif", validityToString(timeInForce)},
        {"referrer", referrerTag},
        {"quantity", quantity},
        {"useAdaptive", useAdaptiveRouting}
    };
}

std::string OrderRequest::orderTypeToString(OrderType type) {
    switch (type) {
        case OrderType::LIMIT: return "LMT";
    }
    return "UNKNOWN";
}

std::string OrderRequest::transactionTypeToString(TransactionType type) {
    switch (type) {
        case TransactionType::BUY: return "BUY";
    }
    return "UNKNOWN";
}

std::string OrderRequest::validityToString(Validity validity) {
    switch (validity) {
        case Validity::DAY: return "DAY";
    }
    return "UNKNOWN";
}

nlohmann::json buildOrdersPayload(const std::vector<OrderRequest>& orders) {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& order : orders) {
        list.push_back(order.toJson());
    }
    return nlohmann::json{{"orders", list}};
}

}  // namespace SpreadArb
