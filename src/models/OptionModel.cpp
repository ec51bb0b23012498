/**
 * @file OptionModel.cpp
 * @brief Implementation of the option chain value types
 */

#include "../models/OptionModel.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <fmt/format.h>

namespace SpreadArb {

std::string optionTypeToString(OptionType type) {
    switch (type) {
        case OptionType::CALL: return "C";
        case OptionType::PUT:  return "P";
    }
    return "?";
}

OptionType stringToOptionType(const std::string& typeStr) {
    std::string upper(typeStr);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "C" || upper == "CALL") return OptionType::CALL;
    if (upper == "P" || upper == "PUT")  return OptionType::PUT;
    throw std::invalid_argument("Unknown option right: " + typeStr);
}

std::string Leg::describe() const {
    return fmt::format("{:g}{} {}", strike, optionTypeToString(optionType), date);
}

}  // namespace SpreadArb
