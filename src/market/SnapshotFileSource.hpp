/**
 * @file SnapshotFileSource.hpp
 * @brief Chain snapshots and contract ids read from a JSON file
 */

#pragma once

#include <string>
#include <vector>
#include <memory>
#include "../utils/Logger.hpp"
#include "../config/ConfigManager.hpp"
#include "../market/MarketDataSource.hpp"

namespace SpreadArb {

/**
 * @class SnapshotFileSource
 * @brief Replays a recorded chain for paper trading and tests
 *
 * Document layout:
 * @code
 * {
 *   "dates":     ["231020", "231027"],
 *   "strikes":   { "231020": { "C": [95, 100], "P": [95, 100] } },
 *   "quotes":    [ { "date": "231020", "right": "C", "strike": 95,
 *                    "mid": 1.4, "bid": 1.35, "askSize": 8 } ],
 *   "contracts": [ { "date": "231020", "right": "C", "strike": 95, "conid": "101" } ]
 * }
 * @endcode
 * "strikes" is optional and derived from the quotes when absent;
 * "contracts" is optional. The file is re-read on every fetch.
 */
class SnapshotFileSource : public MarketDataSource, public ContractResolver {
public:
    /**
     * @brief Constructor
     * @param filePath Path to the snapshot document
     * @param logger Logger instance
     */
    SnapshotFileSource(const std::string& filePath, std::shared_ptr<Logger> logger);

    /**
     * @brief Read and parse the file
     * @throws std::runtime_error if the file cannot be opened or parsed
     */
    ChainSnapshot fetchSnapshot() override;

    /**
     * @brief Contract ids for the legs of @p contenders from the last parsed document
     */
    ContractIdIndex resolve(const std::vector<Contender>& contenders) override;

    /**
     * @brief Parse a snapshot document held in memory
     *
     * Also replaces the contract ids used by resolve().
     *
     * @throws std::runtime_error if the document is malformed
     */
    ChainSnapshot parseSnapshot(const std::string& content);

    const std::string& getFilePath() const { return m_filePath; }

private:
    static StrikeSlice parseStrikes(const json& strikesJson);
    static std::string conidToString(const json& value);

    std::string m_filePath;               ///< Snapshot document path
    ContractIdIndex m_contracts;          ///< Contract ids from the last document
    std::shared_ptr<Logger> m_logger;     ///< Logger instance
};

}  // namespace SpreadArb
