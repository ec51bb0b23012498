/**
 * @file ChainIndex.hpp
 * @brief Nested date -> option type -> strike lookup for one chain snapshot
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <unordered_map>
#include <optional>
#include <fmt/format.h>
#include "../models/OptionModel.hpp"
#include "../utils/Errors.hpp"

namespace SpreadArb {

/**
 * @brief Listed strikes per expiration and option type
 *
 * Strike order within a vector is whatever the data source delivered;
 * consumers sort before forming combinations.
 */
using StrikeSlice = std::unordered_map<std::string, std::map<OptionType, std::vector<double>>>;

/**
 * @class ChainIndex
 * @brief Exact-key index of per-contract values for one snapshot
 *
 * The same shape holds quotes during scanning and contract ids during
 * order construction. Strikes are keyed by StrikeKey, so lookups never
 * use a tolerance.
 */
template<typename T>
class ChainIndex {
public:
    using StrikeMap = std::map<StrikeKey, T>;
    using TypeMap = std::map<OptionType, StrikeMap>;

    /**
     * @brief Rebuild the index from the listed dates and strikes
     *
     * The previous contents are discarded. For every date in @p dates and
     * every (type, strike) listed under it, @p leafFor is asked for the
     * value; a std::nullopt answer leaves the triple out. Later duplicates
     * of a triple overwrite earlier ones.
     *
     * @param dates Expirations to index
     * @param strikes Listed strikes per expiration and type
     * @param leafFor Callable (date, type, strike) -> std::optional<T>
     * @return Number of listed triples for which no value was available
     */
    template<typename LeafFn>
    size_t build(const std::vector<std::string>& dates, const StrikeSlice& strikes, LeafFn&& leafFor) {
        m_index.clear();
        size_t missing = 0;

        for (const auto& date : dates) {
            auto dateIt = strikes.find(date);
            if (dateIt == strikes.end()) {
                continue;
            }
            for (const auto& typeEntry : dateIt->second) {
                for (double strike : typeEntry.second) {
                    std::optional<T> leaf = leafFor(date, typeEntry.first, strike);
                    if (leaf) {
                        insert(date, typeEntry.first, strike, std::move(*leaf));
                    } else {
                        ++missing;
                    }
                }
            }
        }
        return missing;
    }

    /**
     * @brief Insert or overwrite one value
     */
    void insert(const std::string& date, OptionType type, double strike, T value) {
        m_index[date][type][StrikeKey(strike)] = std::move(value);
    }

    /**
     * @brief Find a value
     * @return Pointer to the value, nullptr when the triple is absent
     */
    const T* find(const std::string& date, OptionType type, double strike) const {
        auto dateIt = m_index.find(date);
        if (dateIt == m_index.end()) {
            return nullptr;
        }
        auto typeIt = dateIt->second.find(type);
        if (typeIt == dateIt->second.end()) {
            return nullptr;
        }
        auto strikeIt = typeIt->second.find(StrikeKey(strike));
        if (strikeIt == typeIt->second.end()) {
            return nullptr;
        }
        return &strikeIt->second;
    }

    /**
     * @brief Get a value that must be present
     * @throws LookupError when the triple is absent
     */
    const T& at(const std::string& date, OptionType type, double strike) const {
        const T* value = find(date, type, strike);
        if (!value) {
            throw LookupError(fmt::format("No entry for {} {} {:g}", date, optionTypeToString(type), strike));
        }
        return *value;
    }

    bool contains(const std::string& date, OptionType type, double strike) const {
        return find(date, type, strike) != nullptr;
    }

    /**
     * @brief Number of (date, type, strike) entries
     */
    size_t size() const {
        size_t count = 0;
        for (const auto& dateEntry : m_index) {
            for (const auto& typeEntry : dateEntry.second) {
                count += typeEntry.second.size();
            }
        }
        return count;
    }

    bool empty() const { return m_index.empty(); }

    void clear() { m_index.clear(); }

private:
    std::unordered_map<std::string, TypeMap> m_index;  ///< date -> type -> strike -> value
};

using QuoteIndex = ChainIndex<Quote>;
using ContractIdIndex = ChainIndex<std::string>;

/**
 * @struct ChainSnapshot
 * @brief Everything the scanner reads for one cycle
 */
struct ChainSnapshot {
    std::vector<std::string> dates;  ///< Expirations in listing order
    StrikeSlice strikes;             ///< Listed strikes per date and type
    QuoteIndex quotes;               ///< Quotes for the listed contracts
};

}  // namespace SpreadArb
