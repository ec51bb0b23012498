/**
 * @file ArbitrageScanner.cpp
 * @brief Implementation of the ArbitrageScanner class
 */

#include "../analysis/ArbitrageScanner.hpp"
#include <algorithm>
#include <cmath>
#include <future>
#include <iterator>
#include <set>

namespace SpreadArb {

ScannerConfig ScannerConfig::fromConfig(const ConfigManager& config) {
    ScannerConfig result;
    result.minEdge = config.getDoubleValue("scanner/min_edge", result.minEdge);

    std::vector<std::string> names = config.getStringArray("scanner/strategies");
    if (!names.empty()) {
        result.calendarEnabled = false;
        result.butterflyEnabled = false;
        result.boxspreadEnabled = false;

        for (const auto& name : names) {
            switch (stringToSpreadStrategy(name)) {
                case SpreadStrategy::CALENDAR:  result.calendarEnabled = true; break;
                case SpreadStrategy::BUTTERFLY: result.butterflyEnabled = true; break;
                case SpreadStrategy::BOXSPREAD: result.boxspreadEnabled = true; break;
            }
        }
    }
    return result;
}

ArbitrageScanner::ArbitrageScanner(ScannerConfig config, std::shared_ptr<Logger> logger)
    : m_config(config), m_logger(logger) {
    m_logger->info("ArbitrageScanner initialized (min edge {:.2f}, calendar {}, butterfly {}, boxspread {})",
                   m_config.minEdge, m_config.calendarEnabled, m_config.butterflyEnabled,
                   m_config.boxspreadEnabled);
}

std::vector<Contender> ArbitrageScanner::findCalendarSpreads(const ChainSnapshot& snapshot) const {
    std::vector<Contender> result;
    const auto& dates = snapshot.dates;

    for (size_t i = 0; i + 1 < dates.size(); ++i) {
        const std::string& nearDate = dates[i];
        const std::string& farDate = dates[i + 1];

        for (OptionType type : {OptionType::CALL, OptionType::PUT}) {
            std::vector<double> nearStrikes = sortedStrikes(snapshot, nearDate, type);
            std::vector<double> farStrikes = sortedStrikes(snapshot, farDate, type);
            if (nearStrikes.empty() || farStrikes.empty()) {
                continue;
            }

            std::set<StrikeKey> farListed(farStrikes.begin(), farStrikes.end());

            for (double strike : nearStrikes) {
                if (farListed.count(StrikeKey(strike)) == 0) {
                    m_logger->warn("Skipping calendar {}/{} {:g}{}: strike not listed at {}", nearDate, farDate,
                                   strike, optionTypeToString(type), farDate);
                    continue;
                }

                try {
                    const Quote& nearQuote = snapshot.quotes.at(nearDate, type, strike);
                    const Quote& farQuote = snapshot.quotes.at(farDate, type, strike);

                    double arbValue = roundToCents(nearQuote.midPrice - farQuote.midPrice);
                    if (!passesGate(arbValue)) {
                        continue;
                    }

                    Contender contender;
                    contender.legs = CalendarLegs{
                        makeLeg(nearDate, type, strike, nearQuote),
                        makeLeg(farDate, type, strike, farQuote)
                    };
                    contender.arbValue = arbValue;
                    contender.avgAskSize = (nearQuote.askSize + farQuote.askSize) / 2.0;
                    contender.primaryExpiration = nearDate;
                    result.push_back(std::move(contender));
                } catch (const LookupError& e) {
                    m_logger->warn("Skipping calendar {}/{} {:g}{}: {}", nearDate, farDate, strike,
                                   optionTypeToString(type), e.what());
                }
            }
        }
    }

    m_logger->debug("Calendar scan produced {} contenders", result.size());
    return result;
}

std::vector<Contender> ArbitrageScanner::findButterflySpreads(const ChainSnapshot& snapshot) const {
    std::vector<Contender> result;

    for (const auto& date : snapshot.dates) {
        for (OptionType type : {OptionType::CALL, OptionType::PUT}) {
            std::vector<double> strikes = sortedStrikes(snapshot, date, type);

            for (size_t i = 0; i + 2 < strikes.size(); ++i) {
                try {
                    const Quote& low = snapshot.quotes.at(date, type, strikes[i]);
                    const Quote& mid = snapshot.quotes.at(date, type, strikes[i + 1]);
                    const Quote& high = snapshot.quotes.at(date, type, strikes[i + 2]);

                    double arbValue = roundToCents(2.0 * mid.midPrice - (low.midPrice + high.midPrice));
                    if (!passesGate(arbValue)) {
                        continue;
                    }

                    Contender contender;
                    contender.legs = ButterflyLegs{
                        makeLeg(date, type, strikes[i], low),
                        makeLeg(date, type, strikes[i + 1], mid),
                        makeLeg(date, type, strikes[i + 2], high)
                    };
                    contender.arbValue = arbValue;
                    contender.avgAskSize = (low.askSize + mid.askSize + high.askSize) / 3.0;
                    contender.primaryExpiration = date;
                    result.push_back(std::move(contender));
                } catch (const LookupError& e) {
                    m_logger->warn("Skipping butterfly {} {}{:g}: {}", date, optionTypeToString(type),
                                   strikes[i + 1], e.what());
                }
            }
        }
    }

    m_logger->debug("Butterfly scan produced {} contenders", result.size());
    return result;
}

std::vector<Contender> ArbitrageScanner::findBoxSpreads(const ChainSnapshot& snapshot) const {
    std::vector<Contender> result;

    for (const auto& date : snapshot.dates) {
        std::vector<double> callStrikes = sortedStrikes(snapshot, date, OptionType::CALL);
        std::vector<double> putStrikes = sortedStrikes(snapshot, date, OptionType::PUT);

        // Only strikes listed on both sides can form a box
        std::vector<double> strikes;
        std::set_intersection(callStrikes.begin(), callStrikes.end(),
                              putStrikes.begin(), putStrikes.end(),
                              std::back_inserter(strikes));

        for (size_t i = 0; i < strikes.size(); ++i) {
            for (size_t j = i + 1; j < strikes.size(); ++j) {
                double lowStrike = strikes[i];
                double highStrike = strikes[j];

                try {
                    const Quote& lowCall = snapshot.quotes.at(date, OptionType::CALL, lowStrike);
                    const Quote& highCall = snapshot.quotes.at(date, OptionType::CALL, highStrike);
                    const Quote& lowPut = snapshot.quotes.at(date, OptionType::PUT, lowStrike);
                    const Quote& highPut = snapshot.quotes.at(date, OptionType::PUT, highStrike);

                    double arbValue = roundToCents((lowCall.midPrice + highPut.midPrice) -
                                                   (highCall.midPrice + lowPut.midPrice));
                    if (!passesGate(arbValue)) {
                        continue;
                    }

                    Contender contender;
                    contender.legs = BoxspreadLegs{
                        makeLeg(date, OptionType::CALL, lowStrike, lowCall),
                        makeLeg(date, OptionType::CALL, highStrike, highCall),
                        makeLeg(date, OptionType::PUT, lowStrike, lowPut),
                        makeLeg(date, OptionType::PUT, highStrike, highPut)
                    };
                    contender.arbValue = arbValue;
                    contender.avgAskSize = (lowCall.askSize + highCall.askSize +
                                            lowPut.askSize + highPut.askSize) / 4.0;
                    contender.primaryExpiration = date;
                    result.push_back(std::move(contender));
                } catch (const LookupError& e) {
                    m_logger->warn("Skipping box spread {} {:g}/{:g}: {}", date, lowStrike, highStrike, e.what());
                }
            }
        }
    }

    m_logger->debug("Box spread scan produced {} contenders", result.size());
    return result;
}

std::vector<Contender> ArbitrageScanner::scanAll(const ChainSnapshot& snapshot, ThreadPool* pool) const {
    std::vector<Contender> calendars;
    std::vector<Contender> butterflies;
    std::vector<Contender> boxes;

    if (pool) {
        std::future<std::vector<Contender>> calendarFuture;
        std::future<std::vector<Contender>> butterflyFuture;
        std::future<std::vector<Contender>> boxFuture;

        if (m_config.calendarEnabled) {
            calendarFuture = pool->enqueue([this, &snapshot]() { return findCalendarSpreads(snapshot); });
        }
        if (m_config.butterflyEnabled) {
            butterflyFuture = pool->enqueue([this, &snapshot]() { return findButterflySpreads(snapshot); });
        }
        if (m_config.boxspreadEnabled) {
            boxFuture = pool->enqueue([this, &snapshot]() { return findBoxSpreads(snapshot); });
        }

        // Tasks hold a reference to the snapshot, so none may outlive this call
        for (auto* future : {&calendarFuture, &butterflyFuture, &boxFuture}) {
            if (future->valid()) {
                future->wait();
            }
        }

        if (calendarFuture.valid()) {
            calendars = calendarFuture.get();
        }
        if (butterflyFuture.valid()) {
            butterflies = butterflyFuture.get();
        }
        if (boxFuture.valid()) {
            boxes = boxFuture.get();
        }
    } else {
        if (m_config.calendarEnabled) {
            calendars = findCalendarSpreads(snapshot);
        }
        if (m_config.butterflyEnabled) {
            butterflies = findButterflySpreads(snapshot);
        }
        if (m_config.boxspreadEnabled) {
            boxes = findBoxSpreads(snapshot);
        }
    }

    m_logger->info("Scan found {} calendar, {} butterfly and {} box spread contenders",
                   calendars.size(), butterflies.size(), boxes.size());

    std::vector<Contender> result;
    result.reserve(calendars.size() + butterflies.size() + boxes.size());
    std::move(calendars.begin(), calendars.end(), std::back_inserter(result));
    std::move(butterflies.begin(), butterflies.end(), std::back_inserter(result));
    std::move(boxes.begin(), boxes.end(), std::back_inserter(result));
    return result;
}

std::vector<double> ArbitrageScanner::sortedStrikes(const ChainSnapshot& snapshot, const std::string& date,
                                                    OptionType type) {
    std::vector<double> strikes;

    auto dateIt = snapshot.strikes.find(date);
    if (dateIt == snapshot.strikes.end()) {
        return strikes;
    }
    auto typeIt = dateIt->second.find(type);
    if (typeIt == dateIt->second.end()) {
        return strikes;
    }

    for (double strike : typeIt->second) {
        if (std::isfinite(strike)) {
            strikes.push_back(strike);
        }
    }
    std::sort(strikes.begin(), strikes.end());
    strikes.erase(std::unique(strikes.begin(), strikes.end()), strikes.end());
    return strikes;
}

Leg ArbitrageScanner::makeLeg(const std::string& date, OptionType type, double strike, const Quote& quote) {
    Leg leg;
    leg.date = date;
    leg.optionType = type;
    leg.strike = strike;
    leg.midPrice = quote.midPrice;
    return leg;
}

bool ArbitrageScanner::passesGate(double arbValue) const {
    return arbValue > 0.0 && arbValue > m_config.minEdge;
}

}  // namespace SpreadArb
