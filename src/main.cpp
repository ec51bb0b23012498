/**
 * @file main.cpp
 * @brief Main entry point for the spread arbitrage trader
 */

#include <iostream>
#include <memory>
#include <string>
#include <chrono>
#include <thread>
#include <csignal>
#include <atomic>
#include <algorithm>
#include <cstdlib>

#include "utils/Logger.hpp"
#include "utils/HttpClient.hpp"
#include "utils/ThreadPool.hpp"
#include "config/ConfigManager.hpp"
#include "config/GatewayConfig.hpp"
#include "market/ExpiryCalendar.hpp"
#include "market/MarketHours.hpp"
#include "market/SnapshotFileSource.hpp"
#include "market/GatewayContractResolver.hpp"
#include "analysis/ArbitrageScanner.hpp"
#include "analysis/ContenderRanker.hpp"
#include "risk/SizingPolicy.hpp"
#include "trading/OrderBuilder.hpp"
#include "trading/OrderManager.hpp"
#include "trading/PaperTrader.hpp"
#include "trading/TradingCycle.hpp"

using namespace SpreadArb;

// Global flag for graceful shutdown
std::atomic<bool> g_running{true};

void signalHandler(int signum) {
    (void)signum;
    g_running = false;
}

namespace {

void sleepWhileRunning(std::chrono::milliseconds duration) {
    auto deadline = std::chrono::steady_clock::now() + duration;
    while (g_running && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
}

void logSubmitted(Logger& logger, const CycleResult& result) {
    for (const auto& contender : result.selected) {
        logger.info("{} arb {:.2f} avg ask {:.1f} score {:.4f} expiring {}",
                    spreadStrategyToString(contender.strategy()), contender.arbValue,
                    contender.avgAskSize, contender.rankScore, contender.primaryExpiration);
        for (const auto& signedLeg : contender.signedLegs()) {
            int qty = std::abs(signedLeg.ratio) * result.allocation.numFills;
            logger.info("    {} {} {} @ {:.2f}", signedLeg.action(), qty,
                        signedLeg.leg.describe(), signedLeg.leg.midPrice);
        }
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    try {
        std::string configPath = "config.json";
        if (argc > 1) {
            configPath = argv[1];
        }

        // Console-only logger until the configured one exists
        auto bootLogger = std::make_shared<Logger>("", true, LogLevel::INFO);
        auto configManager = std::make_shared<ConfigManager>(configPath, bootLogger);
        if (!configManager->loadConfig()) {
            bootLogger->fatal("Failed to load configuration from {}", configPath);
            return 1;
        }

        auto logger = std::make_shared<Logger>(
            configManager->getStringValue("logging/file", "spread_arb.log"),
            configManager->getBoolValue("logging/console", true),
            Logger::parseLevel(configManager->getStringValue("logging/level", "INFO")));
        configManager = std::make_shared<ConfigManager>(configPath, logger);
        if (!configManager->loadConfig()) {
            logger->fatal("Failed to reload configuration from {}", configPath);
            return 1;
        }
        logger->info("Starting spread arbitrage trader");

        bool liveMode = configManager->getEnvOrBool("MODE", "trading/live", false);
        std::string fillType = configManager->getEnvOrString("FILL_TYPE", "trading/fill_type", "1");
        double secondsToSleep = configManager->getEnvOrDouble("SECONDS_TO_SLEEP", "trading/seconds_to_sleep", 60.0);
        int maxOrders = configManager->getIntValue("trading/max_orders", 0);
        int numThreads = configManager->getIntValue("system/num_threads",
                                                    static_cast<int>(ThreadPool::getOptimalThreadCount()));

        SizingPolicy::validateFillType(fillType);

        logger->info("Mode: {}, fill type: {}, sleep: {}s", liveMode ? "live" : "paper", fillType, secondsToSleep);

        auto threadPool = std::make_shared<ThreadPool>(static_cast<size_t>(std::max(1, numThreads)), logger);

        auto builderConfig = OrderBuilderConfig::fromConfig(*configManager);
        auto scanner = std::make_shared<ArbitrageScanner>(ScannerConfig::fromConfig(*configManager), logger);
        auto ranker = std::make_shared<ContenderRanker>(logger);
        auto sizing = std::make_shared<SizingPolicy>(SizingPolicy::fromConfig(*configManager, logger));
        auto builder = std::make_shared<OrderBuilder>(builderConfig, logger);

        auto snapshotSource = std::make_shared<SnapshotFileSource>(
            configManager->getStringValue("market/snapshot_file", "data/sample_snapshot.json"), logger);

        std::shared_ptr<ContractResolver> resolver = snapshotSource;
        std::shared_ptr<OrderSubmissionSink> sink;
        std::shared_ptr<PortfolioQuery> portfolio;
        std::shared_ptr<PaperTrader> paperTrader;

        if (liveMode) {
            auto gateway = GatewayConfig::fromConfig(*configManager);
            auto httpClient = std::make_shared<HttpClient>(logger);
            httpClient->setVerifyPeer(gateway.verifyPeer);
            httpClient->setConnectionTimeout(gateway.connectionTimeoutMs);
            httpClient->setRequestTimeout(gateway.requestTimeoutMs);

            auto orderManager = std::make_shared<OrderManager>(gateway, builderConfig.accountId, httpClient, logger);
            resolver = std::make_shared<GatewayContractResolver>(gateway, builderConfig.underlyingConid,
                                                                 httpClient, logger);
            sink = orderManager;
            portfolio = orderManager;
        } else {
            paperTrader = PaperTrader::fromConfig(*configManager, logger);
            sink = paperTrader;
            portfolio = paperTrader;
        }

        MarketHours marketHours(MarketHoursConfig::fromConfig(*configManager));
        TradingCycle cycle(scanner, ranker, sizing, builder, snapshotSource, resolver, sink, threadPool, logger);

        auto sleepDuration = std::chrono::milliseconds(static_cast<long long>(secondsToSleep * 1000.0));

        logger->info("Starting main trading loop");

        while (g_running) {
            if (liveMode && !marketHours.isOpen(std::chrono::system_clock::now())) {
                logger->info("Market is closed.");
                break;
            }

            auto start = std::chrono::steady_clock::now();

            try {
                CycleContext context;
                context.referenceDate = ExpiryCalendar::today();
                context.fillType = fillType;
                context.portfolioValue = portfolio->getPortfolioValue();
                context.maxOrders = maxOrders;

                if (context.portfolioValue < 0.0) {
                    logger->error("Portfolio value unavailable, retrying");
                    sleepWhileRunning(std::chrono::seconds(5));
                    continue;
                }

                CycleResult result = cycle.run(context);
                if (result.halted) {
                    logger->info("Stopping: allocation is empty");
                    break;
                }

                logSubmitted(*logger, result);

                auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - start);
                logger->info("Cycle took {} ms", elapsed.count());

                sleepWhileRunning(sleepDuration);

                if (liveMode && g_running) {
                    int cancelled = sink->cancelPendingOrders();
                    logger->info("Cancelled {} pending orders", cancelled);
                }
            } catch (const std::exception& e) {
                logger->error("Exception in main trading loop: {}", e.what());
                sleepWhileRunning(std::chrono::seconds(5));
            }
        }

        logger->info("Main trading loop terminated");

        if (paperTrader) {
            logger->info("Paper trading submitted {} orders in {} batches",
                         paperTrader->getOrderCount(), paperTrader->getBatches().size());
        }

        logger->info("Spread arbitrage trader shutting down");
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
