// filename: discovery.hpp
// part of OCEAN Spectroscopy Output Parser
// MIT License

#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace oceanparse {

/**
 * @brief Regular files in `directory` whose name starts with `prefix` and,
 *        when `suffix` is non-empty, ends with it. Sorted by file name.
 *
 * A missing directory or no match yields an empty list.
 */
std::vector<std::filesystem::path> findFiles(const std::filesystem::path& directory,
                                             const std::string& prefix,
                                             const std::string& suffix = {});

enum class FileRole { Spectra, Photon, Lanczos };

std::string fileRoleName(FileRole role);

/**
 * @brief Naming rule tying auxiliary files to a polarization key (the name of
 *        its spectra file). Auxiliary files share the key's trailing characters.
 */
struct NamingConvention {
    std::string spectraPrefix{"absspct"};
    std::string photonPrefix{"photon"};
    std::string lanczosPrefix{"abslanc"};
    std::size_t photonSuffixLength{1};
    std::size_t lanczosSuffixLength{2};

    [[nodiscard]] const std::string& prefix(FileRole role) const;
    [[nodiscard]] std::string suffix(FileRole role, const std::string& key) const;
};

// Polarization keys: spectra file names in lexical order.
std::vector<std::string> discoverPolarizationKeys(const std::filesystem::path& directory,
                                                  const NamingConvention& convention = {});

// Files of `role` belonging to polarization `key`, in lexical order. The
// spectra role matches the file named `key` exactly.
std::vector<std::filesystem::path> discover(const std::filesystem::path& directory, FileRole role,
                                            const std::string& key,
                                            const NamingConvention& convention = {});

}  // namespace oceanparse
