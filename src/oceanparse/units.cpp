// filename: units.cpp
// part of OCEAN Spectroscopy Output Parser
// MIT License

#include "oceanparse/units.hpp"

#include "oceanparse/types.hpp"

#include <stdexcept>
#include <unordered_map>

namespace oceanparse {
namespace {

enum class Dimension { Length, InverseLength, Energy };

struct UnitInfo {
    Dimension dimension{Dimension::Length};
    double toSi{1.0};
};

const UnitInfo& lookupUnit(const std::string& unit) {
    static const std::unordered_map<std::string, UnitInfo> table = {
        {"m", {Dimension::Length, 1.0}},
        {"angstrom", {Dimension::Length, ANGSTROM}},
        {"bohr", {Dimension::Length, BOHR}},
        {"1/m", {Dimension::InverseLength, 1.0}},
        {"1/angstrom", {Dimension::InverseLength, 1.0 / ANGSTROM}},
        {"1/bohr", {Dimension::InverseLength, 1.0 / BOHR}},
        {"J", {Dimension::Energy, 1.0}},
        {"eV", {Dimension::Energy, ELECTRON_VOLT}},
        {"hartree", {Dimension::Energy, HARTREE}},
    };
    const auto it = table.find(unit);
    if (it == table.end()) {
        throw std::invalid_argument("Unknown unit: " + unit);
    }
    return it->second;
}

}  // namespace

double convert(double value, const std::string& fromUnit, const std::string& toUnit) {
    const UnitInfo& from = lookupUnit(fromUnit);
    const UnitInfo& to = lookupUnit(toUnit);
    if (from.dimension != to.dimension) {
        throw std::invalid_argument("Cannot convert " + fromUnit + " to " + toUnit);
    }
    return value * from.toSi / to.toSi;
}

std::vector<double> convert(const std::vector<double>& values, const std::string& fromUnit,
                            const std::string& toUnit) {
    std::vector<double> result;
    result.reserve(values.size());
    for (double value : values) {
        result.push_back(convert(value, fromUnit, toUnit));
    }
    return result;
}

}  // namespace oceanparse
