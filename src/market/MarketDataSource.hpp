/**
 * @file MarketDataSource.hpp
 * @brief Interfaces for chain snapshots and contract id resolution
 */

#pragma once

#include <vector>
#include "../market/ChainIndex.hpp"
#include "../models/ContenderModel.hpp"

namespace SpreadArb {

/**
 * @class MarketDataSource
 * @brief Supplies one chain snapshot per cycle
 */
class MarketDataSource {
public:
    virtual ~MarketDataSource() = default;

    /**
     * @brief Fetch dates, listed strikes and quotes
     * @throws std::runtime_error if no snapshot can be produced
     */
    virtual ChainSnapshot fetchSnapshot() = 0;
};

/**
 * @class ContractResolver
 * @brief Maps the legs of selected contenders to tradable contract ids
 */
class ContractResolver {
public:
    virtual ~ContractResolver() = default;

    /**
     * @brief Resolve ids for exactly the legs referenced by @p contenders
     *
     * Legs that cannot be resolved are left out of the index.
     */
    virtual ContractIdIndex resolve(const std::vector<Contender>& contenders) = 0;
};

}  // namespace SpreadArb
