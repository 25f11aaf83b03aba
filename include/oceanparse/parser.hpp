// filename: parser.hpp
// part of OCEAN Spectroscopy Output Parser
// MIT License

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "oceanparse/archive.hpp"
#include "oceanparse/configuration.hpp"
#include "oceanparse/discovery.hpp"
#include "oceanparse/logging.hpp"

namespace oceanparse {

/**
 * @brief Polarization archives in discovery order plus the workflow archive
 *        linking them. The workflow refers into `children`.
 */
struct ParseResult {
    Configuration configuration;
    std::vector<Archive> children;
    Archive workflow;
};

class OceanParser {
public:
    explicit OceanParser(Logger& logger = defaultLogger(), NamingConvention convention = {});

    // Spectra file names beside `mainfile`, one per polarization.
    [[nodiscard]] std::vector<std::string> mainfileKeys(const std::string& mainfile) const;

    // nullopt when the main JSON cannot be loaded; the failure is logged.
    [[nodiscard]] std::optional<ParseResult> parse(const std::string& mainfile) const;

private:
    Logger* logger_;
    NamingConvention convention_;
};

}  // namespace oceanparse
