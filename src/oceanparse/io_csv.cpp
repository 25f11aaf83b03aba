// filename: io_csv.cpp
// part of OCEAN Spectroscopy Output Parser
// MIT License

#include "oceanparse/io_csv.hpp"

#include "oceanparse/units.hpp"

#include <fstream>
#include <limits>
#include <stdexcept>

namespace oceanparse {

void write_csv_spectrum(const std::string& path, const Spectra& spectra) {
    if (spectra.excitationEnergies.size() != spectra.intensities.size()) {
        throw std::invalid_argument("write_csv_spectrum: mismatched vector sizes");
    }

    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        throw std::runtime_error("Failed to open CSV output: " + path);
    }
    ofs.precision(std::numeric_limits<double>::max_digits10);

    ofs << "energy_eV,intensity\n";
    for (std::size_t i = 0; i < spectra.intensities.size(); ++i) {
        ofs << convert(spectra.excitationEnergies[i], "J", "eV") << ',' << spectra.intensities[i]
            << '\n';
    }
}

void write_csv_tridiagonal(const std::string& path, const LanczosResults& lanczos) {
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        throw std::runtime_error("Failed to open CSV output: " + path);
    }
    ofs.precision(std::numeric_limits<double>::max_digits10);

    ofs << "index,a,b\n";
    for (std::size_t i = 0; i < lanczos.tridiagonalMatrix.size(); ++i) {
        const auto& row = lanczos.tridiagonalMatrix[i];
        ofs << i << ',' << row[0] << ',' << row[1] << '\n';
    }
}

}  // namespace oceanparse
