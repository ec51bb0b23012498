/**
 * @file OrderManager.cpp
 * @brief Implementation of the OrderManager class
 */

#include "../trading/OrderManager.hpp"
#include <nlohmann/json.hpp>

namespace SpreadArb {

namespace {

std::string idToString(const json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_number_integer()) {
        return std::to_string(value.get<long long>());
    }
    return std::string();
}

}  // namespace

OrderManager::OrderManager(GatewayConfig gateway, std::string accountId,
                           std::shared_ptr<HttpClient> httpClient, std::shared_ptr<Logger> logger)
    : m_gateway(std::move(gateway)),
      m_accountId(std::move(accountId)),
      m_httpClient(httpClient),
      m_logger(logger) {
    m_logger->info("OrderManager using gateway {} for account {}", m_gateway.baseUrl(), m_accountId);
}

double OrderManager::getPortfolioValue() {
    HttpResponse response = makeApiRequest(HttpMethod::GET, "/portfolio/" + m_accountId + "/summary");
    if (response.statusCode != 200) {
        m_logger->error("Failed to get portfolio summary. Status code: {}, Response: {}",
                        response.statusCode, response.body);
        return -1.0;
    }

    auto value = parseNetLiquidation(response.body);
    if (!value) {
        m_logger->error("Portfolio summary has no net liquidation amount: {}", response.body);
        return -1.0;
    }

    m_logger->debug("Net liquidation value: {:.2f}", *value);
    return *value;
}

bool OrderManager::submitOrders(const std::vector<OrderRequest>& orders) {
    if (orders.empty()) {
        return true;
    }

    std::string requestBody = buildOrdersPayload(orders).dump();
    m_logger->debug("Submitting orders: {}", requestBody);

    HttpResponse response = makeApiRequest(HttpMethod::POST,
                                           "/iserver/account/" + m_accountId + "/orders", requestBody);
    if (response.statusCode != 200) {
        m_logger->error("Failed to place orders. Status code: {}, Response: {}",
                        response.statusCode, response.body);
        return false;
    }

    SubmissionReply reply = parseSubmissionReply(response.body);

    // The gateway may answer a confirmation with another prompt
    for (int round = 0; round < MAX_CONFIRMATIONS && reply.error.empty() && !reply.promptIds.empty(); ++round) {
        SubmissionReply next;
        next.orderIds = reply.orderIds;

        for (const auto& promptId : reply.promptIds) {
            m_logger->info("Confirming order prompt {}", promptId);
            HttpResponse confirm = makeApiRequest(HttpMethod::POST, "/iserver/reply/" + promptId,
                                                  R"({"confirmed":true})");
            if (confirm.statusCode != 200) {
                next.error = "Reply to prompt " + promptId + " failed with status " +
                             std::to_string(confirm.statusCode);
                break;
            }

            SubmissionReply confirmed = parseSubmissionReply(confirm.body);
            next.orderIds.insert(next.orderIds.end(), confirmed.orderIds.begin(), confirmed.orderIds.end());
            next.promptIds.insert(next.promptIds.end(), confirmed.promptIds.begin(), confirmed.promptIds.end());
            if (!confirmed.error.empty()) {
                next.error = confirmed.error;
                break;
            }
        }
        reply = std::move(next);
    }

    if (!reply.error.empty()) {
        m_logger->error("Order submission rejected: {}", reply.error);
        return false;
    }
    if (!reply.promptIds.empty()) {
        m_logger->error("Order submission still awaiting {} confirmations", reply.promptIds.size());
        return false;
    }

    m_logger->info("Submitted {} orders, gateway accepted {}", orders.size(), reply.orderIds.size());
    return true;
}

int OrderManager::cancelPendingOrders() {
    HttpResponse response = makeApiRequest(HttpMethod::GET, "/iserver/account/orders");
    if (response.statusCode != 200) {
        m_logger->error("Failed to list live orders. Status code: {}, Response: {}",
                        response.statusCode, response.body);
        return 0;
    }

    int cancelled = 0;
    for (const auto& orderId : parsePendingOrderIds(response.body)) {
        HttpResponse cancel = makeApiRequest(HttpMethod::DELETE,
                                             "/iserver/account/" + m_accountId + "/order/" + orderId);
        if (cancel.statusCode == 200) {
            m_logger->info("Cancelled order {}", orderId);
            ++cancelled;
        } else {
            m_logger->error("Failed to cancel order {}. Status code: {}, Response: {}",
                            orderId, cancel.statusCode, cancel.body);
        }
    }
    return cancelled;
}

std::optional<double> OrderManager::parseNetLiquidation(const std::string& body) {
    json summary = json::parse(body, nullptr, false);
    if (summary.is_discarded() || !summary.is_object()) {
        return std::nullopt;
    }

    auto it = summary.find("netliquidation");
    if (it == summary.end() || !it->is_object()) {
        return std::nullopt;
    }
    auto amount = it->find("amount");
    if (amount == it->end() || !amount->is_number()) {
        return std::nullopt;
    }
    return amount->get<double>();
}

SubmissionReply OrderManager::parseSubmissionReply(const std::string& body) {
    SubmissionReply reply;

    json parsed = json::parse(body, nullptr, false);
    if (parsed.is_discarded()) {
        reply.error = "Unreadable gateway response: " + body;
        return reply;
    }

    if (parsed.is_object()) {
        if (parsed.contains("error")) {
            reply.error = parsed["error"].is_string() ? parsed["error"].get<std::string>() : parsed["error"].dump();
            return reply;
        }
        parsed = json::array({parsed});
    }
    if (!parsed.is_array()) {
        reply.error = "Unexpected gateway response: " + body;
        return reply;
    }

    for (const auto& item : parsed) {
        if (!item.is_object()) {
            continue;
        }
        if (item.contains("error")) {
            reply.error = item["error"].is_string() ? item["error"].get<std::string>() : item["error"].dump();
        } else if (item.contains("order_id")) {
            reply.orderIds.push_back(idToString(item["order_id"]));
        } else if (item.contains("id")) {
            reply.promptIds.push_back(idToString(item["id"]));
        }
    }
    return reply;
}

std::vector<std::string> OrderManager::parsePendingOrderIds(const std::string& body) {
    std::vector<std::string> result;

    json parsed = json::parse(body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object() || !parsed.contains("orders") || !parsed["orders"].is_array()) {
        return result;
    }

    for (const auto& order : parsed["orders"]) {
        if (!order.is_object()) {
            continue;
        }
        auto statusIt = order.find("status");
        if (statusIt == order.end() || !statusIt->is_string()) {
            continue;
        }
        const std::string& status = statusIt->get_ref<const std::string&>();
        if (status != "PreSubmitted" && status != "Submitted" && status != "PendingSubmit") {
            continue;
        }
        if (order.contains("orderId")) {
            std::string id = idToString(order["orderId"]);
            if (!id.empty()) {
                result.push_back(id);
            }
        }
    }
    return result;
}

HttpResponse OrderManager::makeApiRequest(HttpMethod method, const std::string& endpoint, const std::string& body) {
    std::unordered_map<std::string, std::string> headers;
    if (!body.empty()) {
        headers["Content-Type"] = "application/json";
    }
    return m_httpClient->request(method, m_gateway.baseUrl() + endpoint, headers, body);
}

}  // namespace SpreadArb
