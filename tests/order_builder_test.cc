#include <gtest/gtest.h>
#include <cmath>
#include <cstdlib>
#include "trading/OrderBuilder.hpp"
#include "utils/Errors.hpp"
#include "test_support.hpp"

namespace SpreadArb {
namespace {

using testing_support::quietLogger;

Leg leg(const std::string& date, OptionType type, double strike) {
    Leg result;
    result.date = date;
    result.optionType = type;
    result.strike = strike;
    return result;
}

OrderBuilder makeBuilder(double discountFactor) {
    OrderBuilderConfig config;
    config.accountId = "U1234567";
    config.discountFactor = discountFactor;
    return OrderBuilder(config, quietLogger());
}

Contender calendar(double arbValue) {
    Contender contender;
    contender.legs = CalendarLegs{leg("211101", OptionType::CALL, 100.0), leg("211102", OptionType::CALL, 100.0)};
    contender.arbValue = arbValue;
    contender.primaryExpiration = "211101";
    return contender;
}

Contender butterfly(double arbValue) {
    Contender contender;
    contender.legs = ButterflyLegs{leg("211101", OptionType::PUT, 95.0),
                                   leg("211101", OptionType::PUT, 100.0),
                                   leg("211101", OptionType::PUT, 105.0)};
    contender.arbValue = arbValue;
    contender.primaryExpiration = "211101";
    return contender;
}

Contender boxspread(double arbValue) {
    Contender contender;
    contender.legs = BoxspreadLegs{leg("211101", OptionType::CALL, 95.0),
                                   leg("211101", OptionType::CALL, 100.0),
                                   leg("211101", OptionType::PUT, 95.0),
                                   leg("211101", OptionType::PUT, 100.0)};
    contender.arbValue = arbValue;
    contender.primaryExpiration = "211101";
    return contender;
}

ContractIdIndex contractIds() {
    ContractIdIndex ids;
    ids.insert("211101", OptionType::CALL, 100.0, "NEAR");
    ids.insert("211102", OptionType::CALL, 100.0, "FAR");
    ids.insert("211101", OptionType::PUT, 95.0, "LOW");
    ids.insert("211101", OptionType::PUT, 100.0, "MID");
    ids.insert("211101", OptionType::PUT, 105.0, "HIGH");
    ids.insert("211101", OptionType::CALL, 95.0, "LC");
    return ids;
}

TEST(OrderBuilderTest, CalendarSellsNearBuysFar) {
    auto builder = makeBuilder(0.9);
    OrderRequest order = builder.build(calendar(1.0), contractIds(), 2);

    EXPECT_EQ(order.limitPrice, -0.9);
    EXPECT_EQ(order.quantity, 2);
    EXPECT_EQ(order.legEncoding, "NEAR/-1,FAR/1");
}

TEST(OrderBuilderTest, ButterflySellsTwoMiddles) {
    auto builder = makeBuilder(0.95);
    OrderRequest order = builder.build(butterfly(2.0), contractIds(), 3);

    EXPECT_EQ(order.limitPrice, -1.9);
    EXPECT_EQ(order.quantity, 3);
    EXPECT_EQ(order.legEncoding, "MID/-2,LOW/1,HIGH/1");
}

TEST(OrderBuilderTest, BoxspreadEncodingOrder) {
    auto builder = makeBuilder(0.9);
    // Box legs: low call 95 = LC, high call 100 = NEAR, low put 95 = LOW, high put 100 = MID
    OrderRequest order = builder.build(boxspread(2.5), contractIds(), 4);

    EXPECT_EQ(order.limitPrice, -2.25);
    EXPECT_EQ(order.quantity, 4);
    EXPECT_EQ(order.legEncoding, "MID/-1,LOW/1,LC/1,NEAR/-1");
}

TEST(OrderBuilderTest, FixedOrderFields) {
    auto builder = makeBuilder(1.0);
    OrderRequest order = builder.build(calendar(0.3), contractIds(), 1);

    EXPECT_EQ(order.accountId, "U1234567");
    EXPECT_EQ(order.orderType, OrderType::LIMIT);
    EXPECT_EQ(order.venue, "SMART");
    EXPECT_EQ(order.side, TransactionType::BUY);
    EXPECT_EQ(order.timeInForce, Validity::DAY);
    EXPECT_EQ(order.referrerTag, "NO_REFERRER_PROVIDED");
    EXPECT_FALSE(order.outsideRegularHours);
    EXPECT_FALSE(order.useAdaptiveRouting);
    EXPECT_EQ(order.underlyingSymbol, "SPX");
    EXPECT_EQ(order.underlyingConid, "28812380");
    EXPECT_EQ(order.limitPrice, -0.3);
}

TEST(OrderBuilderTest, MissingContractIdIsDataInconsistency) {
    auto builder = makeBuilder(0.9);
    ContractIdIndex ids = contractIds();

    Contender contender = calendar(1.0);
    std::get<CalendarLegs>(contender.legs).far.strike = 110.0;

    EXPECT_THROW(builder.build(contender, ids, 1), DataInconsistencyError);
}

TEST(OrderBuilderTest, BatchSkipsOrdersWithMissingIds) {
    auto builder = makeBuilder(0.9);

    Contender broken = calendar(1.0);
    std::get<CalendarLegs>(broken.legs).near.date = "211105";

    std::vector<Contender> contenders = {calendar(1.0), broken, butterfly(2.0)};
    auto orders = builder.buildBatch(contenders, contractIds(), 1);

    ASSERT_EQ(orders.size(), 2u);
    EXPECT_EQ(orders[0].legEncoding, "NEAR/-1,FAR/1");
    EXPECT_EQ(orders[1].legEncoding, "MID/-2,LOW/1,HIGH/1");
}

TEST(OrderBuilderTest, LimitPriceRoundingToZeroIsUnsigned) {
    auto builder = makeBuilder(0.4);
    OrderRequest order = builder.build(calendar(0.01), contractIds(), 1);

    EXPECT_EQ(order.limitPrice, 0.0);
    EXPECT_FALSE(std::signbit(order.limitPrice));
    EXPECT_EQ(order.toJson()["price"].dump(), "0.0");
}

TEST(OrderBuilderTest, BatchSkipsZeroPricedOrders) {
    auto builder = makeBuilder(0.4);

    std::vector<Contender> contenders = {calendar(0.01), butterfly(2.0)};
    auto orders = builder.buildBatch(contenders, contractIds(), 1);

    ASSERT_EQ(orders.size(), 1u);
    EXPECT_EQ(orders[0].legEncoding, "MID/-2,LOW/1,HIGH/1");
    EXPECT_EQ(orders[0].limitPrice, -0.8);
}

TEST(OrderBuilderTest, DiscountFactorOutsideUnitIntervalIsRejected) {
    EXPECT_THROW(makeBuilder(0.0), std::invalid_argument);
    EXPECT_THROW(makeBuilder(-0.5), std::invalid_argument);
    EXPECT_THROW(makeBuilder(1.01), std::invalid_argument);
    EXPECT_NO_THROW(makeBuilder(1.0));
}

TEST(OrderBuilderConfigTest, ReadsAccountAndUnderlying) {
    auto logger = quietLogger();
    ConfigManager config("unused.json", logger);
    ASSERT_TRUE(config.loadFromString(R"({
        "account": {"id": "DU000001"},
        "trading": {"discount_factor": 0.8},
        "underlying": {"symbol": "XSP", "conid": "137851301"}
    })"));

    OrderBuilderConfig builderConfig = OrderBuilderConfig::fromConfig(config);
    if (std::getenv("ACCOUNT_ID") == nullptr) {
        EXPECT_EQ(builderConfig.accountId, "DU000001");
    }
    if (std::getenv("DISCOUNT_VALUE") == nullptr) {
        EXPECT_DOUBLE_EQ(builderConfig.discountFactor, 0.8);
    }
    EXPECT_EQ(builderConfig.underlyingSymbol, "XSP");
    EXPECT_EQ(builderConfig.underlyingConid, "137851301");
}

TEST(SignedLegsTest, RatiosFollowEncodingOrder) {
    auto legs = boxspread(1.0).signedLegs();
    ASSERT_EQ(legs.size(), 4u);
    EXPECT_EQ(legs[0].leg.optionType, OptionType::PUT);
    EXPECT_EQ(legs[0].leg.strike, 100.0);
    EXPECT_EQ(legs[0].ratio, -1);
    EXPECT_EQ(legs[0].action(), "SELL");
    EXPECT_EQ(legs[2].leg.optionType, OptionType::CALL);
    EXPECT_EQ(legs[2].ratio, 1);
    EXPECT_EQ(legs[2].action(), "BUY");

    auto fly = butterfly(1.0).signedLegs();
    ASSERT_EQ(fly.size(), 3u);
    EXPECT_EQ(fly[0].ratio, -2);
    EXPECT_EQ(fly[0].leg.strike, 100.0);
}

TEST(FlatLegsTest, CanonicalOrder) {
    auto legs = boxspread(1.0).flatLegs();
    ASSERT_EQ(legs.size(), 4u);
    EXPECT_EQ(legs[0].strike, 95.0);
    EXPECT_EQ(legs[0].optionType, OptionType::CALL);
    EXPECT_EQ(legs[1].strike, 100.0);
    EXPECT_EQ(legs[1].optionType, OptionType::CALL);
    EXPECT_EQ(legs[2].optionType, OptionType::PUT);
    EXPECT_EQ(legs[3].strike, 100.0);
    EXPECT_EQ(legs[3].optionType, OptionType::PUT);
}

}  // namespace
}  // namespace SpreadArb
