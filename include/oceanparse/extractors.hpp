// filename: extractors.hpp
// part of OCEAN Spectroscopy Output Parser
// MIT License

#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "oceanparse/archive.hpp"

namespace oceanparse {

// Reads the whole file; nullopt when it cannot be opened.
std::optional<std::string> readTextFile(const std::string& path);

// Splits text into rows of numbers. Blank and '#' lines are skipped, and a
// row stops at its first non-numeric token. Fortran 'D' exponents are accepted.
std::vector<std::vector<double>> parseNumericRows(const std::string& text);

struct PhotonData {
    std::optional<std::string> operatorType;  // "dipole", "quad" or "NRIXS"
    std::vector<Vec3> vectors;                 // every "cartesian" vector in file order
    std::optional<double> energy;              // eV, the value following "end"
};

PhotonData extractPhoton(const std::string& text);

struct LanczosData {
    std::size_t dimension{0};
    double scalingFactor{0.0};
    std::vector<std::array<double, 2>> tridiagonalMatrix;
    std::vector<std::vector<double>> eigenvalues;
};

// nullopt when the header record is missing or malformed.
std::optional<LanczosData> extractLanczos(const std::string& text);

struct SpectrumData {
    std::vector<double> energies;  // eV, column 0
    std::vector<double> intensities;  // column 2
};

SpectrumData extractSpectrum(const std::string& text);

}  // namespace oceanparse
