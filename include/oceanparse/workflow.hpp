// filename: workflow.hpp
// part of OCEAN Spectroscopy Output Parser
// MIT License

#pragma once

#include <string>
#include <vector>

#include "oceanparse/archive.hpp"
#include "oceanparse/configuration.hpp"
#include "oceanparse/logging.hpp"

namespace oceanparse {

// True when the child exposes program, system, both methods, a calculation
// with a spectrum and its SinglePoint workflow.
bool isCompleteChild(const Archive& child);

/**
 * @brief Stitch the polarization archives into one PhotonPolarization workflow.
 *
 * Program and system are shared with the first complete child (first wins);
 * placeholders are created when there is none. The method is mapped again
 * from the configuration. One task per complete child, in the given order.
 *
 * The returned archive refers into `children`, which must outlive it.
 */
Archive aggregate(const std::vector<Archive>& children, const Configuration& configuration,
                  Logger& logger, const std::string& entryName = "photon_polarization");

}  // namespace oceanparse
