// filename: units.hpp
// part of OCEAN Spectroscopy Output Parser
// MIT License

#pragma once

#include <string>
#include <vector>

namespace oceanparse {

/**
 * @brief Convert a value between two units of the same dimension.
 *
 * Recognised lengths: "m", "angstrom", "bohr"; reciprocal lengths: "1/m",
 * "1/angstrom", "1/bohr"; energies: "J", "eV", "hartree".
 * Throws std::invalid_argument for unknown units or mismatched dimensions.
 */
double convert(double value, const std::string& fromUnit, const std::string& toUnit);

std::vector<double> convert(const std::vector<double>& values, const std::string& fromUnit,
                            const std::string& toUnit);

}  // namespace oceanparse
