/**
 * @file Errors.hpp
 * @brief Exception types raised by the scanning and order pipeline
 */

#pragma once

#include <stdexcept>
#include <string>

namespace SpreadArb {

/**
 * @class LookupError
 * @brief A (date, type, strike) triple is missing from a chain index
 *
 * Recoverable: the scanner skips the affected candidate and continues.
 */
class LookupError : public std::out_of_range {
public:
    explicit LookupError(const std::string& what) : std::out_of_range(what) {}
};

/**
 * @class DataInconsistencyError
 * @brief A contract id is missing for a leg the scanner found quoted
 *
 * Aborts the construction of one order; the rest of the batch proceeds.
 */
class DataInconsistencyError : public std::runtime_error {
public:
    explicit DataInconsistencyError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace SpreadArb
