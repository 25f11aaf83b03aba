// filename: lanczos_extractor_test.cpp
// part of OCEAN Spectroscopy Output Parser
// MIT License

#include "oceanparse/extractors.hpp"

#include <cmath>
#include <iostream>
#include <string>

int main() {
    using namespace oceanparse;

    const std::string text =
        "  4  0.75\n"
        "  1.0   9.0\n"
        "  2.0   0.2\n"
        "  3.0   0.3\n"
        "  4.0   0.4\n"
        "  5.0   0.5  0.6\n"
        "  7.0\n";

    const auto data = extractLanczos(text);
    if (!data) {
        std::cerr << "Lanczos text with a valid header was rejected\n";
        return 1;
    }
    if (data->dimension != 4 || std::abs(data->scalingFactor - 0.75) > 1e-12) {
        std::cerr << "Header mismatch: dimension=" << data->dimension
                  << " scaling=" << data->scalingFactor << "\n";
        return 1;
    }
    if (data->tridiagonalMatrix.size() != 4) {
        std::cerr << "Expected 4 tridiagonal rows, got " << data->tridiagonalMatrix.size() << "\n";
        return 1;
    }
    if (data->tridiagonalMatrix[0][0] != 1.0 || data->tridiagonalMatrix[0][1] != 0.0) {
        std::cerr << "First tridiagonal row must be [1.0, 0.0], got [" << data->tridiagonalMatrix[0][0]
                  << ", " << data->tridiagonalMatrix[0][1] << "]\n";
        return 1;
    }
    if (data->tridiagonalMatrix[3][0] != 4.0 || std::abs(data->tridiagonalMatrix[3][1] - 0.4) > 1e-12) {
        std::cerr << "Last tridiagonal row mismatch\n";
        return 1;
    }
    if (data->eigenvalues.size() != 2 || data->eigenvalues[0].size() != 3 ||
        data->eigenvalues[1].size() != 1 || data->eigenvalues[1][0] != 7.0) {
        std::cerr << "Rows after the matrix must become eigenvalue rows\n";
        return 1;
    }

    const auto truncated = extractLanczos("  5  1.0\n  1.0\n  2.0  0.1\n");
    if (!truncated || truncated->tridiagonalMatrix.size() != 2 || !truncated->eigenvalues.empty()) {
        std::cerr << "Truncated Lanczos text should keep the rows it has\n";
        return 1;
    }

    if (extractLanczos("1e30 1.0\n-12.5 7.7\n0.1 0.2\n").has_value() ||
        extractLanczos("-1 1.0\n1 2\n").has_value()) {
        std::cerr << "Out-of-range Lanczos dimensions must produce no result\n";
        return 1;
    }

    if (extractLanczos("").has_value() || extractLanczos("2.5 1.0\n1 2\n").has_value() ||
        extractLanczos("header text\n").has_value()) {
        std::cerr << "Malformed Lanczos headers must produce no result\n";
        return 1;
    }

    std::cout << "Lanczos extraction verified successfully\n";
    return 0;
}
