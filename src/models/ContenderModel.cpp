/**
 * @file ContenderModel.cpp
 * @brief Implementation of the Contender model
 */

#include "../models/ContenderModel.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace SpreadArb {

namespace {

struct StrategyOf {
    SpreadStrategy operator()(const CalendarLegs&) const { return SpreadStrategy::CALENDAR; }
    SpreadStrategy operator()(const ButterflyLegs&) const { return SpreadStrategy::BUTTERFLY; }
    SpreadStrategy operator()(const BoxspreadLegs&) const { return SpreadStrategy::BOXSPREAD; }
};

struct FlattenLegs {
    std::vector<Leg> operator()(const CalendarLegs& legs) const {
        return {legs.near, legs.far};
    }
    std::vector<Leg> operator()(const ButterflyLegs& legs) const {
        return {legs.low, legs.mid, legs.high};
    }
    std::vector<Leg> operator()(const BoxspreadLegs& legs) const {
        return {legs.lowCall, legs.highCall, legs.lowPut, legs.highPut};
    }
};

struct SignLegs {
    std::vector<SignedLeg> operator()(const CalendarLegs& legs) const {
        return {{legs.near, -1}, {legs.far, 1}};
    }
    std::vector<SignedLeg> operator()(const ButterflyLegs& legs) const {
        return {{legs.mid, -2}, {legs.low, 1}, {legs.high, 1}};
    }
    std::vector<SignedLeg> operator()(const BoxspreadLegs& legs) const {
        return {{legs.highPut, -1}, {legs.lowPut, 1}, {legs.lowCall, 1}, {legs.highCall, -1}};
    }
};

}  // namespace

std::string spreadStrategyToString(SpreadStrategy strategy) {
    switch (strategy) {
        case SpreadStrategy::CALENDAR:  return "Calendar";
        case SpreadStrategy::BUTTERFLY: return "Butterfly";
        case SpreadStrategy::BOXSPREAD: return "Boxspread";
    }
    return "Unknown";
}

SpreadStrategy stringToSpreadStrategy(const std::string& name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "calendar")  return SpreadStrategy::CALENDAR;
    if (lower == "butterfly") return SpreadStrategy::BUTTERFLY;
    if (lower == "boxspread" || lower == "box") return SpreadStrategy::BOXSPREAD;
    throw std::invalid_argument("Unknown spread strategy: " + name);
}

std::string SignedLeg::action() const {
    return ratio > 0 ? "BUY" : "SELL";
}

SpreadStrategy Contender::strategy() const {
    return std::visit(StrategyOf{}, legs);
}

std::vector<Leg> Contender::flatLegs() const {
    return std::visit(FlattenLegs{}, legs);
}

std::vector<SignedLeg> Contender::signedLegs() const {
    return std::visit(SignLegs{}, legs);
}

}  // namespace SpreadArb
