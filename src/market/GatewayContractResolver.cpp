/**
 * @file GatewayContractResolver.cpp
 * @brief Implementation of the GatewayContractResolver class
 */

#include "../market/GatewayContractResolver.hpp"
#include "../market/ExpiryCalendar.hpp"
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace SpreadArb {

GatewayContractResolver::GatewayContractResolver(GatewayConfig gateway, std::string underlyingConid,
                                                 std::shared_ptr<HttpClient> httpClient,
                                                 std::shared_ptr<Logger> logger)
    : m_gateway(std::move(gateway)),
      m_underlyingConid(std::move(underlyingConid)),
      m_httpClient(httpClient),
      m_logger(logger) {
}

ContractIdIndex GatewayContractResolver::resolve(const std::vector<Contender>& contenders) {
    ContractIdIndex result;

    std::vector<std::string> dates;
    for (const auto& contender : contenders) {
        for (const auto& leg : contender.flatLegs()) {
            dates.push_back(leg.date);
        }
    }

    try {
        auto months = ExpiryCalendar::distinctMonthLabels(dates);
        m_logger->info("Resolving contract ids for {} contenders across months {}",
                       contenders.size(), fmt::join(months, ","));
    } catch (const std::invalid_argument& e) {
        m_logger->warn("Leg dates are not in YYMMDD form: {}", e.what());
    }

    for (const auto& contender : contenders) {
        for (const auto& leg : contender.flatLegs()) {
            if (result.contains(leg.date, leg.optionType, leg.strike)) {
                continue;
            }
            auto conid = lookup(leg);
            if (conid) {
                result.insert(leg.date, leg.optionType, leg.strike, *conid);
            } else {
                m_logger->warn("Could not resolve contract id for {}", leg.describe());
            }
        }
    }

    m_logger->debug("Resolved {} contract ids", result.size());
    return result;
}

std::string GatewayContractResolver::secdefPath(const Leg& leg) const {
    return fmt::format("/iserver/secdef/info?conid={}&sectype=OPT&month={}&strike={:g}&right={}",
                       m_underlyingConid, ExpiryCalendar::monthLabel(leg.date), leg.strike,
                       optionTypeToString(leg.optionType));
}

std::optional<std::string> GatewayContractResolver::lookup(const Leg& leg) {
    try {
        std::string url = m_gateway.baseUrl() + secdefPath(leg);
        HttpResponse response = m_httpClient->request(HttpMethod::GET, url);
        if (response.statusCode != 200) {
            m_logger->error("secdef/info for {} failed with status {}: {}",
                            leg.describe(), response.statusCode, response.body);
            return std::nullopt;
        }
        return parseSecdefInfo(response.body, ExpiryCalendar::toCompactDate(leg.date));
    } catch (const std::invalid_argument& e) {
        m_logger->error("Cannot build secdef query for {}: {}", leg.describe(), e.what());
    }
    return std::nullopt;
}

std::optional<std::string> GatewayContractResolver::parseSecdefInfo(const std::string& body,
                                                                    const std::string& compactDate) {
    nlohmann::json contracts = nlohmann::json::parse(body, nullptr, false);
    if (contracts.is_discarded() || !contracts.is_array()) {
        return std::nullopt;
    }

    for (const auto& contract : contracts) {
        if (!contract.is_object() || !contract.contains("conid")) {
            continue;
        }
        auto maturity = contract.find("maturityDate");
        if (maturity == contract.end() || !maturity->is_string() ||
            maturity->get_ref<const std::string&>() != compactDate) {
            continue;
        }

        const auto& conid = contract.at("conid");
        if (conid.is_string()) {
            return conid.get<std::string>();
        }
        if (conid.is_number_integer()) {
            return std::to_string(conid.get<long long>());
        }
    }
    return std::nullopt;
}

}  // namespace SpreadArb
