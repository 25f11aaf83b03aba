// filename: extractors.cpp
// part of OCEAN Spectroscopy Output Parser
// MIT License

#include "oceanparse/extractors.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace oceanparse {
namespace {

bool parseNumber(std::string token, double& out) {
    if (token.empty()) {
        return false;
    }
    for (char& c : token) {
        if (c == 'D' || c == 'd') {
            c = 'E';
        }
    }
    char* end = nullptr;
    const double value = std::strtod(token.c_str(), &end);
    if (end != token.c_str() + token.size() || !std::isfinite(value)) {
        return false;
    }
    out = value;
    return true;
}

// Upper bound on the header dimension; larger values are treated as a corrupt header.
constexpr double kMaxLanczosDimension = 1.0e9;

bool isOperatorKeyword(const std::string& token) {
    return token == "dipole" || token == "quad" || token == "NRIXS";
}

}  // namespace

std::optional<std::string> readTextFile(const std::string& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    if (input.bad()) {
        return std::nullopt;
    }
    return buffer.str();
}

std::vector<std::vector<double>> parseNumericRows(const std::string& text) {
    std::vector<std::vector<double>> rows;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        const auto first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos || line[first] == '#') {
            continue;
        }
        std::istringstream fields(line);
        std::vector<double> row;
        std::string token;
        double value = 0.0;
        while (fields >> token) {
            if (!parseNumber(token, value)) {
                break;
            }
            row.push_back(value);
        }
        if (!row.empty()) {
            rows.push_back(std::move(row));
        }
    }
    return rows;
}

PhotonData extractPhoton(const std::string& text) {
    PhotonData data{};
    std::istringstream stream(text);
    std::string line;
    bool afterEnd = false;
    bool inVector = false;
    std::vector<double> pending;

    const auto flushVector = [&]() {
        if (inVector && pending.size() == 3) {
            data.vectors.push_back({pending[0], pending[1], pending[2]});
        }
        inVector = false;
        pending.clear();
    };

    while (std::getline(stream, line)) {
        std::istringstream fields(line);
        std::string token;
        bool firstToken = true;
        while (fields >> token) {
            double value = 0.0;
            if (firstToken && !data.operatorType && isOperatorKeyword(token)) {
                data.operatorType = token;
            } else if (token == "cartesian") {
                flushVector();
                inVector = true;
            } else if (token == "end") {
                flushVector();
                afterEnd = true;
                firstToken = false;
                continue;
            } else if (parseNumber(token, value)) {
                if (firstToken && afterEnd && !data.energy) {
                    data.energy = value;
                } else if (inVector && pending.size() < 3) {
                    pending.push_back(value);
                }
            } else {
                flushVector();
            }
            firstToken = false;
            afterEnd = false;
        }
    }
    flushVector();
    return data;
}

std::optional<LanczosData> extractLanczos(const std::string& text) {
    const std::vector<std::vector<double>> rows = parseNumericRows(text);
    if (rows.empty() || rows.front().size() < 2) {
        return std::nullopt;
    }
    const double rawDimension = rows.front()[0];
    if (!std::isfinite(rawDimension) || rawDimension < 0.0 || rawDimension > kMaxLanczosDimension ||
        std::floor(rawDimension) != rawDimension) {
        return std::nullopt;
    }

    LanczosData data{};
    data.dimension = static_cast<std::size_t>(rawDimension);
    data.scalingFactor = rows.front()[1];

    const std::size_t matrixEnd = std::min(rows.size(), data.dimension + 1);
    for (std::size_t i = 1; i < matrixEnd; ++i) {
        const auto& row = rows[i];
        const double offDiagonal = (i == 1 || row.size() < 2) ? 0.0 : row[1];
        data.tridiagonalMatrix.push_back({row[0], offDiagonal});
    }
    for (std::size_t i = matrixEnd; i < rows.size(); ++i) {
        data.eigenvalues.push_back(rows[i]);
    }
    return data;
}

SpectrumData extractSpectrum(const std::string& text) {
    SpectrumData data{};
    for (const auto& row : parseNumericRows(text)) {
        if (row.size() < 3) {
            continue;
        }
        data.energies.push_back(row[0]);
        data.intensities.push_back(row[2]);
    }
    return data;
}

}  // namespace oceanparse
