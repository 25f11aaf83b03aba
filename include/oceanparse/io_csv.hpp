// filename: io_csv.hpp
// part of OCEAN Spectroscopy Output Parser
// MIT License

#pragma once

#include <string>

#include "oceanparse/archive.hpp"

namespace oceanparse {

// energy_eV,intensity per row, energies converted back from J.
void write_csv_spectrum(const std::string& path, const Spectra& spectra);

// index,a,b per tridiagonal row.
void write_csv_tridiagonal(const std::string& path, const LanczosResults& lanczos);

}  // namespace oceanparse
