// filename: child_builder.hpp
// part of OCEAN Spectroscopy Output Parser
// MIT License

#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "oceanparse/archive.hpp"
#include "oceanparse/configuration.hpp"
#include "oceanparse/discovery.hpp"
#include "oceanparse/logging.hpp"

namespace oceanparse {

// Program name, version, commit hash and the DFT code OCEAN started from.
// Wrongly typed fields are logged and left unset.
void populateProgram(Program& program, const Configuration& configuration, Logger& logger);

// Fills atoms from the "structure" block. Returns false when the block is absent.
bool populateSystem(System& system, const Configuration& configuration, Logger& logger);

// Copies the photon descriptor into `method`; the momentum transfer is only
// taken for quad and NRIXS operators.
void populatePhoton(Method& method, const std::string& photonText);

/**
 * @brief Build the archive of one polarization sub-calculation.
 *
 * The archive holds one run with program, system, the photon method
 * (method[0]), the BSE method (method[1], referring back to method[0]) and a
 * calculation with the spectrum plus optional Lanczos results.
 *
 * Returns nullopt when the spectra file of `key` cannot be read. A missing
 * structure or a mapping error yields a partial archive without a workflow.
 */
std::optional<Archive> buildChild(const std::string& key, const Configuration& configuration,
                                  const std::filesystem::path& directory, Logger& logger,
                                  const NamingConvention& convention = {});

}  // namespace oceanparse
