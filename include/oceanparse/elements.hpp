// filename: elements.hpp
// part of OCEAN Spectroscopy Output Parser
// MIT License

#pragma once

#include <optional>
#include <string>

namespace oceanparse {

constexpr int MAX_ATOMIC_NUMBER = 118;

// Returns the chemical symbol for Z in [1, 118]; "X" is returned for Z == 0
// (dummy atom), nullopt otherwise.
std::optional<std::string> chemicalSymbol(int atomicNumber);

}  // namespace oceanparse
