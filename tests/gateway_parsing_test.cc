#include <gtest/gtest.h>
#include "market/GatewayContractResolver.hpp"
#include "trading/OrderManager.hpp"
#include "test_support.hpp"

namespace SpreadArb {
namespace {

using testing_support::quietLogger;

TEST(SecdefInfoTest, MatchesMaturityDate) {
    const char* body = R"([
        {"conid": 11111, "maturityDate": "20211029", "right": "C", "strike": 4500},
        {"conid": 22222, "maturityDate": "20211101", "right": "C", "strike": 4500},
        {"conid": "33333", "maturityDate": "20211103", "right": "C", "strike": 4500}
    ])";

    EXPECT_EQ(GatewayContractResolver::parseSecdefInfo(body, "20211101").value_or(""), "22222");
    EXPECT_EQ(GatewayContractResolver::parseSecdefInfo(body, "20211103").value_or(""), "33333");
    EXPECT_FALSE(GatewayContractResolver::parseSecdefInfo(body, "20211105").has_value());
}

TEST(SecdefInfoTest, UnexpectedBodiesYieldNothing) {
    EXPECT_FALSE(GatewayContractResolver::parseSecdefInfo("", "20211101").has_value());
    EXPECT_FALSE(GatewayContractResolver::parseSecdefInfo(R"({"error": "no contracts"})", "20211101").has_value());
    EXPECT_FALSE(GatewayContractResolver::parseSecdefInfo(R"([{"maturityDate": "20211101"}])", "20211101")
                     .has_value());
}

TEST(SecdefInfoTest, NonStringMaturityDatesAreSkipped) {
    const char* body = R"([
        {"conid": 1, "maturityDate": 20231020},
        {"conid": 2, "maturityDate": null},
        {"conid": 3, "maturityDate": "20231020"}
    ])";

    EXPECT_NO_THROW(GatewayContractResolver::parseSecdefInfo(body, "20231020"));
    EXPECT_EQ(GatewayContractResolver::parseSecdefInfo(body, "20231020").value_or(""), "3");
    EXPECT_FALSE(GatewayContractResolver::parseSecdefInfo(R"([{"conid": 1, "maturityDate": 20231020}])",
                                                          "20231020").has_value());
}

TEST(SecdefInfoTest, QueryPathCarriesMonthStrikeAndRight) {
    GatewayContractResolver resolver(GatewayConfig{}, "28812380", std::make_shared<HttpClient>(quietLogger()),
                                     quietLogger());
    Leg leg;
    leg.date = "211101";
    leg.optionType = OptionType::PUT;
    leg.strike = 4525.0;

    EXPECT_EQ(resolver.secdefPath(leg),
              "/iserver/secdef/info?conid=28812380&sectype=OPT&month=NOV21&strike=4525&right=P");
}

TEST(PortfolioSummaryTest, ReadsNetLiquidation) {
    auto value = OrderManager::parseNetLiquidation(
        R"({"netliquidation": {"amount": 125000.5, "currency": "USD"}, "availablefunds": {"amount": 1}})");
    ASSERT_TRUE(value.has_value());
    EXPECT_DOUBLE_EQ(*value, 125000.5);

    EXPECT_FALSE(OrderManager::parseNetLiquidation(R"({"availablefunds": {"amount": 1}})").has_value());
    EXPECT_FALSE(OrderManager::parseNetLiquidation("not json").has_value());
}

TEST(SubmissionReplyTest, AcceptedOrders) {
    SubmissionReply reply = OrderManager::parseSubmissionReply(
        R"([{"order_id": "987654", "order_status": "PreSubmitted"}])");
    EXPECT_TRUE(reply.error.empty());
    ASSERT_EQ(reply.orderIds.size(), 1u);
    EXPECT_EQ(reply.orderIds[0], "987654");
    EXPECT_TRUE(reply.promptIds.empty());
}

TEST(SubmissionReplyTest, ConfirmationPrompts) {
    SubmissionReply reply = OrderManager::parseSubmissionReply(
        R"([{"id": "07a13a5a-4a48-44a5-bb25-5ab37b79186c", "message": ["Are you sure?"]}])");
    EXPECT_TRUE(reply.error.empty());
    ASSERT_EQ(reply.promptIds.size(), 1u);
    EXPECT_EQ(reply.promptIds[0], "07a13a5a-4a48-44a5-bb25-5ab37b79186c");
}

TEST(SubmissionReplyTest, Errors) {
    EXPECT_EQ(OrderManager::parseSubmissionReply(R"({"error": "Account not found"})").error, "Account not found");
    EXPECT_FALSE(OrderManager::parseSubmissionReply("<html>").error.empty());
}

TEST(PendingOrdersTest, KeepsOnlyWorkingOrders) {
    const char* body = R"({"orders": [
        {"orderId": 1, "status": "Submitted"},
        {"orderId": 2, "status": "Filled"},
        {"orderId": 3, "status": "PreSubmitted"},
        {"orderId": "4", "status": "PendingSubmit"},
        {"orderId": 5, "status": "Cancelled"}
    ]})";

    std::vector<std::string> expected = {"1", "3", "4"};
    EXPECT_EQ(OrderManager::parsePendingOrderIds(body), expected);
    EXPECT_TRUE(OrderManager::parsePendingOrderIds(R"({"orders": []})").empty());
    EXPECT_TRUE(OrderManager::parsePendingOrderIds("[]").empty());
}

TEST(PendingOrdersTest, MalformedEntriesAreSkipped) {
    const char* body = R"({"orders": [
        {"orderId": 1, "status": null},
        {"orderId": 2, "status": 7},
        {"orderId": 3},
        "not an order",
        {"orderId": 4, "status": "Submitted"}
    ]})";

    std::vector<std::string> expected = {"4"};
    std::vector<std::string> ids;
    EXPECT_NO_THROW(ids = OrderManager::parsePendingOrderIds(body));
    EXPECT_EQ(ids, expected);
}

}  // namespace
}  // namespace SpreadArb
