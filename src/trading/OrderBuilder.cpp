/**
 * @file OrderBuilder.cpp
 * @brief Implementation of the OrderBuilder class
 */

#include "../trading/OrderBuilder.hpp"
#include "../utils/Errors.hpp"
#include <stdexcept>
#include <fmt/format.h>

namespace SpreadArb {

OrderBuilderConfig OrderBuilderConfig::fromConfig(const ConfigManager& config) {
    OrderBuilderConfig result;
    result.accountId = config.getEnvOrString("ACCOUNT_ID", "account/id");
    result.discountFactor = config.getEnvOrDouble("DISCOUNT_VALUE", "trading/discount_factor",
                                                  result.discountFactor);
    result.underlyingSymbol = config.getStringValue("underlying/symbol", result.underlyingSymbol);
    result.underlyingConid = config.getStringValue("underlying/conid", result.underlyingConid);
    return result;
}

OrderBuilder::OrderBuilder(OrderBuilderConfig config, std::shared_ptr<Logger> logger)
    : m_config(std::move(config)), m_logger(logger) {
    if (!(m_config.discountFactor > 0.0 && m_config.discountFactor <= 1.0)) {
        throw std::invalid_argument(fmt::format("Discount factor must be in (0, 1], got {}",
                                                m_config.discountFactor));
    }
    m_logger->info("OrderBuilder initialized for account {} on {} (discount {})",
                   m_config.accountId, m_config.underlyingSymbol, m_config.discountFactor);
}

std::string OrderBuilder::encodeLegs(const Contender& contender, const ContractIdIndex& contractIds) {
    std::string encoding;

    for (const auto& signedLeg : contender.signedLegs()) {
        const Leg& leg = signedLeg.leg;
        const std::string* conid = contractIds.find(leg.date, leg.optionType, leg.strike);
        if (conid == nullptr) {
            throw DataInconsistencyError(fmt::format("No contract id for {} leg {}",
                                                     spreadStrategyToString(contender.strategy()),
                                                     leg.describe()));
        }

        if (!encoding.empty()) {
            encoding += ",";
        }
        encoding += fmt::format("{}/{}", *conid, signedLeg.ratio);
    }
    return encoding;
}

OrderRequest OrderBuilder::build(const Contender& contender, const ContractIdIndex& contractIds,
                                 int numFills) const {
    OrderRequest order;
    order.accountId = m_config.accountId;
    order.underlyingConid = m_config.underlyingConid;
    order.underlyingSymbol = m_config.underlyingSymbol;
    order.legEncoding = encodeLegs(contender, contractIds);
    order.limitPrice = -roundToCents(contender.arbValue * m_config.discountFactor);
    if (order.limitPrice == 0.0) {
        order.limitPrice = 0.0;  // no "-0.0" on the wire
    }
    order.quantity = numFills;
    return order;
}

std::vector<OrderRequest> OrderBuilder::buildBatch(const std::vector<Contender>& contenders,
                                                   const ContractIdIndex& contractIds, int numFills) const {
    std::vector<OrderRequest> orders;
    orders.reserve(contenders.size());

    for (const auto& contender : contenders) {
        try {
            OrderRequest order = build(contender, contractIds, numFills);
            if (order.limitPrice == 0.0) {
                m_logger->warn("Skipping {} order: limit price rounds to zero (arb {:.2f}, discount {})",
                               spreadStrategyToString(contender.strategy()), contender.arbValue,
                               m_config.discountFactor);
                continue;
            }
            orders.push_back(std::move(order));
        } catch (const DataInconsistencyError& e) {
            m_logger->error("Skipping order: {}", e.what());
        }
    }

    m_logger->debug("Built {} of {} orders", orders.size(), contenders.size());
    return orders;
}

}  // namespace SpreadArb
