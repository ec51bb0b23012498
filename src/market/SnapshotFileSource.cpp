/**
 * @file SnapshotFileSource.cpp
 * @brief Implementation of the SnapshotFileSource class
 */

#include "../market/SnapshotFileSource.hpp"
#include <fstream>
#include <sstream>
#include <set>
#include <stdexcept>

namespace SpreadArb {

SnapshotFileSource::SnapshotFileSource(const std::string& filePath, std::shared_ptr<Logger> logger)
    : m_filePath(filePath), m_logger(logger) {
    m_logger->info("Reading chain snapshots from {}", m_filePath);
}

ChainSnapshot SnapshotFileSource::fetchSnapshot() {
    std::ifstream file(m_filePath);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open snapshot file: " + m_filePath);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parseSnapshot(buffer.str());
}

ChainSnapshot SnapshotFileSource::parseSnapshot(const std::string& content) {
    json doc;
    try {
        doc = json::parse(content);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("Malformed snapshot document: ") + e.what());
    }

    ChainSnapshot snapshot;

    try {
        snapshot.dates = doc.at("dates").get<std::vector<std::string>>();

        QuoteIndex observed;
        std::map<std::string, std::map<OptionType, std::set<double>>> quotedStrikes;

        for (const auto& row : doc.value("quotes", json::array())) {
            std::string date = row.at("date").get<std::string>();
            OptionType type = stringToOptionType(row.at("right").get<std::string>());
            double strike = row.at("strike").get<double>();

            Quote quote;
            quote.midPrice = row.at("mid").get<double>();
            quote.bid = row.value("bid", 0.0);
            quote.askSize = row.value("askSize", 0.0);

            observed.insert(date, type, strike, quote);
            quotedStrikes[date][type].insert(strike);
        }

        if (doc.contains("strikes")) {
            snapshot.strikes = parseStrikes(doc.at("strikes"));
        } else {
            for (const auto& dateEntry : quotedStrikes) {
                for (const auto& typeEntry : dateEntry.second) {
                    snapshot.strikes[dateEntry.first][typeEntry.first].assign(
                        typeEntry.second.begin(), typeEntry.second.end());
                }
            }
        }

        size_t missing = snapshot.quotes.build(snapshot.dates, snapshot.strikes,
            [&observed](const std::string& date, OptionType type, double strike) -> std::optional<Quote> {
                const Quote* quote = observed.find(date, type, strike);
                if (quote == nullptr) {
                    return std::nullopt;
                }
                return *quote;
            });
        if (missing > 0) {
            m_logger->warn("{} listed contracts have no quote", missing);
        }

        m_contracts.clear();
        for (const auto& row : doc.value("contracts", json::array())) {
            m_contracts.insert(row.at("date").get<std::string>(),
                               stringToOptionType(row.at("right").get<std::string>()),
                               row.at("strike").get<double>(),
                               conidToString(row.at("conid")));
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Invalid snapshot document: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("Invalid snapshot document: ") + e.what());
    }

    m_logger->debug("Snapshot has {} expirations, {} quotes and {} contract ids",
                    snapshot.dates.size(), snapshot.quotes.size(), m_contracts.size());
    return snapshot;
}

ContractIdIndex SnapshotFileSource::resolve(const std::vector<Contender>& contenders) {
    ContractIdIndex result;

    for (const auto& contender : contenders) {
        for (const auto& leg : contender.flatLegs()) {
            const std::string* conid = m_contracts.find(leg.date, leg.optionType, leg.strike);
            if (conid == nullptr) {
                m_logger->warn("No contract id recorded for {}", leg.describe());
                continue;
            }
            result.insert(leg.date, leg.optionType, leg.strike, *conid);
        }
    }
    return result;
}

StrikeSlice SnapshotFileSource::parseStrikes(const json& strikesJson) {
    StrikeSlice result;
    for (auto dateIt = strikesJson.begin(); dateIt != strikesJson.end(); ++dateIt) {
        for (auto typeIt = dateIt.value().begin(); typeIt != dateIt.value().end(); ++typeIt) {
            result[dateIt.key()][stringToOptionType(typeIt.key())] = typeIt.value().get<std::vector<double>>();
        }
    }
    return result;
}

std::string SnapshotFileSource::conidToString(const json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return std::to_string(value.get<long long>());
}

}  // namespace SpreadArb
