// filename: method_mapper.hpp
// part of OCEAN Spectroscopy Output Parser
// MIT License

#pragma once

#include <string>
#include <vector>

#include "oceanparse/archive.hpp"
#include "oceanparse/configuration.hpp"

namespace oceanparse {

// "[1, 0]" -> "K", "[2, 1]" -> "L23" using the trailing two quantum numbers
// of `edge`. Throws MappingError for any other pair.
std::string coreLevelLabel(const std::vector<int>& edge);

// "haydock" -> "lanczos-haydock", "gmres" -> "gmres"; throws MappingError otherwise.
std::string solverName(const std::string& name);

// Index into {"emission", "absorption"}; throws MappingError when out of range.
std::string coreHoleMode(int strength);

// Reads calc.edges, entries being "<atom> <n> <l>" strings or integer arrays.
// Throws MappingError when the list is missing, empty or malformed.
std::vector<std::vector<int>> parseEdges(const Configuration& configuration);

/**
 * @brief Build the BSE method section (k-mesh, BSE and core-hole, code
 *        specific BSE and screening parameters, edges) from the configuration.
 *
 * Pure: identical configurations give identical sections. Throws MappingError
 * for unmapped edges or solver names.
 */
Method mapMethod(const Configuration& configuration);

}  // namespace oceanparse
