/**
 * @file ArbitrageScanner.hpp
 * @brief Detects calendar, butterfly and box spread mispricings in a chain snapshot
 */

#pragma once

#include <string>
#include <vector>
#include <memory>
#include "../utils/Logger.hpp"
#include "../utils/ThreadPool.hpp"
#include "../config/ConfigManager.hpp"
#include "../market/ChainIndex.hpp"
#include "../models/ContenderModel.hpp"

namespace SpreadArb {

/**
 * @struct ScannerConfig
 * @brief Detection knobs
 */
struct ScannerConfig {
    double minEdge = 0.0;            ///< A candidate needs arbValue strictly above this and above zero
    bool calendarEnabled = true;
    bool butterflyEnabled = true;
    bool boxspreadEnabled = true;

    /**
     * @brief Read "scanner/min_edge" and "scanner/strategies"
     *
     * When "scanner/strategies" is absent or empty every strategy is
     * enabled; otherwise only the listed ones are.
     */
    static ScannerConfig fromConfig(const ConfigManager& config);
};

/**
 * @class ArbitrageScanner
 * @brief Three independent strategies over one immutable snapshot
 *
 * Every strategy only reads the snapshot, so they can run concurrently.
 * Edges are rounded to cents before the minimum-edge gate is applied.
 * A quote missing for a listed contract skips that candidate only.
 */
class ArbitrageScanner {
public:
    /**
     * @brief Constructor
     * @param config Detection knobs
     * @param logger Logger instance
     */
    ArbitrageScanner(ScannerConfig config, std::shared_ptr<Logger> logger);

    /**
     * @brief Same type and strike at consecutive expirations, near priced above far
     *
     * For each consecutive pair (dates[i], dates[i+1]) and each strike
     * listed for the option type at both dates:
     * arbValue = near.mid - far.mid.
     */
    std::vector<Contender> findCalendarSpreads(const ChainSnapshot& snapshot) const;

    /**
     * @brief Middle strike overpriced against its two neighbours
     *
     * For each window of three consecutive sorted strikes:
     * arbValue = 2 * mid - (low + high).
     */
    std::vector<Contender> findButterflySpreads(const ChainSnapshot& snapshot) const;

    /**
     * @brief Call and put spreads over the same strikes priced inconsistently
     *
     * For each strike pair low < high listed for both calls and puts:
     * arbValue = (lowCall + highPut) - (highCall + lowPut).
     */
    std::vector<Contender> findBoxSpreads(const ChainSnapshot& snapshot) const;

    /**
     * @brief Run every enabled strategy and merge the results
     *
     * The merged order is calendar, butterfly, then box spreads whether or
     * not a pool is used.
     *
     * @param snapshot Chain snapshot
     * @param pool Optional pool used to run the strategies in parallel
     * @return All candidates
     */
    std::vector<Contender> scanAll(const ChainSnapshot& snapshot, ThreadPool* pool = nullptr) const;

    const ScannerConfig& getConfig() const { return m_config; }

private:
    /**
     * @brief Listed strikes for a date and type, finite, sorted ascending, without duplicates
     */
    static std::vector<double> sortedStrikes(const ChainSnapshot& snapshot, const std::string& date,
                                             OptionType type);

    static Leg makeLeg(const std::string& date, OptionType type, double strike, const Quote& quote);

    bool passesGate(double arbValue) const;

    ScannerConfig m_config;
    std::shared_ptr<Logger> m_logger;
};

}  // namespace SpreadArb
