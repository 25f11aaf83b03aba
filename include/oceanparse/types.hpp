// filename: types.hpp
// part of OCEAN Spectroscopy Output Parser
// MIT License

#pragma once

namespace oceanparse {

// CODATA 2018
constexpr double BOHR = 5.29177210903e-11;          // m
constexpr double ANGSTROM = 1.0e-10;                // m
constexpr double ELECTRON_VOLT = 1.602176634e-19;   // J
constexpr double HARTREE = 4.3597447222071e-18;     // J

}  // namespace oceanparse
