#include <gtest/gtest.h>
#include <fmt/format.h>
#include "trading/TradingCycle.hpp"
#include "trading/PaperTrader.hpp"
#include "test_support.hpp"

namespace SpreadArb {
namespace {

using testing_support::SnapshotBuilder;
using testing_support::quietLogger;

class FixedMarketData : public MarketDataSource {
public:
    explicit FixedMarketData(ChainSnapshot snapshot) : m_snapshot(std::move(snapshot)) {}

    ChainSnapshot fetchSnapshot() override {
        ++fetches;
        return m_snapshot;
    }

    int fetches = 0;

private:
    ChainSnapshot m_snapshot;
};

// Names every leg "<date><right><strike>", except for one optional date
class NamingResolver : public ContractResolver {
public:
    ContractIdIndex resolve(const std::vector<Contender>& contenders) override {
        ContractIdIndex ids;
        for (const auto& contender : contenders) {
            for (const auto& leg : contender.flatLegs()) {
                if (leg.date == unresolvableDate) {
                    continue;
                }
                ids.insert(leg.date, leg.optionType, leg.strike,
                           fmt::format("{}{}{:g}", leg.date, optionTypeToString(leg.optionType), leg.strike));
            }
        }
        return ids;
    }

    std::string unresolvableDate;
};

class TradingCycleTest : public ::testing::Test {
protected:
    void SetUp() override {
        m_logger = quietLogger();
        m_marketData = std::make_shared<FixedMarketData>(SnapshotBuilder()
            // Box on 231020, arb 0.3, avg ask 10
            .quote("231020", OptionType::CALL, 95.0, 1.4, 8.0)
            .quote("231020", OptionType::CALL, 100.0, 2.1, 12.0)
            .quote("231020", OptionType::PUT, 95.0, 1.5, 8.0)
            .quote("231020", OptionType::PUT, 100.0, 2.5, 12.0)
            // Butterfly on 231027, arb 0.3, avg ask 10
            .quote("231027", OptionType::PUT, 90.0, 2.1, 8.0)
            .quote("231027", OptionType::PUT, 92.0, 2.3, 10.0)
            .quote("231027", OptionType::PUT, 94.0, 2.2, 12.0)
            // Calendar 231027/231103, arb 0.5, avg ask 10
            .quote("231027", OptionType::CALL, 110.0, 2.4, 8.0)
            .quote("231103", OptionType::CALL, 110.0, 1.9, 12.0)
            .build());
        m_resolver = std::make_shared<NamingResolver>();
        m_paper = std::make_shared<PaperTrader>(PaperTrader::DEFAULT_PORTFOLIO_VALUE, m_logger);

        OrderBuilderConfig builderConfig;
        builderConfig.accountId = "DU000001";
        builderConfig.discountFactor = 0.9;

        m_cycle = std::make_unique<TradingCycle>(
            std::make_shared<ArbitrageScanner>(ScannerConfig{}, m_logger),
            std::make_shared<ContenderRanker>(m_logger),
            std::make_shared<SizingPolicy>(SizingPolicy::DEFAULT_CAPITAL_UNIT, m_logger),
            std::make_shared<OrderBuilder>(builderConfig, m_logger),
            m_marketData, m_resolver, m_paper,
            std::make_shared<ThreadPool>(2, m_logger),
            m_logger);
    }

    CycleContext context(const std::string& fillType, double portfolioValue, int maxOrders = 0) const {
        CycleContext result;
        result.referenceDate = "231020";
        result.fillType = fillType;
        result.portfolioValue = portfolioValue;
        result.maxOrders = maxOrders;
        return result;
    }

    std::shared_ptr<Logger> m_logger;
    std::shared_ptr<FixedMarketData> m_marketData;
    std::shared_ptr<NamingResolver> m_resolver;
    std::shared_ptr<PaperTrader> m_paper;
    std::unique_ptr<TradingCycle> m_cycle;
};

TEST_F(TradingCycleTest, SubmitsRankedOrdersToSink) {
    CycleResult result = m_cycle->run(context("3", 1800.0));

    EXPECT_FALSE(result.halted);
    EXPECT_EQ(result.allocation.numOrders, 3);
    EXPECT_EQ(result.allocation.numFills, 1);
    EXPECT_EQ(result.candidateCount, 3u);
    ASSERT_EQ(result.selected.size(), 3u);

    // Box: 10*0.3/max(1,0) = 3.0, butterfly: 10*0.3/7, calendar: 10*0.5/7
    EXPECT_EQ(result.selected[0].strategy(), SpreadStrategy::BOXSPREAD);
    EXPECT_EQ(result.selected[1].strategy(), SpreadStrategy::CALENDAR);
    EXPECT_EQ(result.selected[2].strategy(), SpreadStrategy::BUTTERFLY);

    ASSERT_EQ(result.orders.size(), 3u);
    EXPECT_EQ(result.orders[0].legEncoding, "231020P100/-1,231020P95/1,231020C95/1,231020C100/-1");
    EXPECT_EQ(result.orders[0].limitPrice, -0.27);
    EXPECT_EQ(result.orders[1].legEncoding, "231027C110/-1,231103C110/1");
    EXPECT_EQ(result.orders[1].limitPrice, -0.45);
    EXPECT_EQ(result.orders[2].legEncoding, "231027P92/-2,231027P90/1,231027P94/1");
    EXPECT_EQ(result.orders[2].quantity, 1);

    EXPECT_TRUE(result.submitted);
    EXPECT_EQ(m_paper->getBatches().size(), 1u);
    EXPECT_EQ(m_paper->getOrderCount(), 3u);
}

TEST_F(TradingCycleTest, SingleOrderCarriesAllFills) {
    CycleResult result = m_cycle->run(context("2", 1800.0));

    ASSERT_EQ(result.orders.size(), 1u);
    EXPECT_EQ(result.orders[0].quantity, 3);
    EXPECT_EQ(result.selected[0].strategy(), SpreadStrategy::BOXSPREAD);
}

TEST_F(TradingCycleTest, InsufficientCapitalHaltsBeforeFetching) {
    CycleResult result = m_cycle->run(context("1", 599.0));

    EXPECT_TRUE(result.halted);
    EXPECT_TRUE(result.allocation.isEmpty());
    EXPECT_EQ(m_marketData->fetches, 0);
    EXPECT_TRUE(m_paper->getBatches().empty());
}

TEST_F(TradingCycleTest, MaxOrdersCapsDepth) {
    CycleResult result = m_cycle->run(context("3", 100000.0, 2));

    EXPECT_EQ(result.allocation.numOrders, 166);
    EXPECT_EQ(result.selected.size(), 2u);
    EXPECT_EQ(result.orders.size(), 2u);
}

TEST_F(TradingCycleTest, UnresolvedContendersAreDropped) {
    m_resolver->unresolvableDate = "231103";
    CycleResult result = m_cycle->run(context("3", 1800.0));

    EXPECT_EQ(result.selected.size(), 3u);
    ASSERT_EQ(result.orders.size(), 2u);
    EXPECT_EQ(result.orders[0].legEncoding.substr(0, 10), "231020P100");
    EXPECT_EQ(result.orders[1].legEncoding.substr(0, 9), "231027P92");
    EXPECT_EQ(m_paper->getOrderCount(), 2u);
}

TEST_F(TradingCycleTest, UnknownFillTypeIsRejected) {
    EXPECT_THROW(m_cycle->run(context("9", 1800.0)), std::invalid_argument);
}

TEST(TradingCycleEmptyTest, NoContendersMeansNoSubmission) {
    auto logger = quietLogger();
    auto paper = std::make_shared<PaperTrader>(1000.0, logger);
    auto marketData = std::make_shared<FixedMarketData>(SnapshotBuilder()
        .quote("231020", OptionType::CALL, 100.0, 1.0, 5.0)
        .build());

    OrderBuilderConfig builderConfig;
    builderConfig.accountId = "DU000001";

    TradingCycle cycle(std::make_shared<ArbitrageScanner>(ScannerConfig{}, logger),
                       std::make_shared<ContenderRanker>(logger),
                       std::make_shared<SizingPolicy>(SizingPolicy::DEFAULT_CAPITAL_UNIT, logger),
                       std::make_shared<OrderBuilder>(builderConfig, logger),
                       marketData, std::make_shared<NamingResolver>(), paper, nullptr, logger);

    CycleContext context;
    context.referenceDate = "231020";
    context.fillType = "1";
    context.portfolioValue = paper->getPortfolioValue();

    CycleResult result = cycle.run(context);
    EXPECT_FALSE(result.halted);
    EXPECT_EQ(marketData->fetches, 1);
    EXPECT_TRUE(result.selected.empty());
    EXPECT_FALSE(result.submitted);
    EXPECT_TRUE(paper->getBatches().empty());
}

}  // namespace
}  // namespace SpreadArb
