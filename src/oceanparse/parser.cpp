// filename: parser.cpp
// part of OCEAN Spectroscopy Output Parser
// MIT License

#include "oceanparse/parser.hpp"

#include "oceanparse/child_builder.hpp"
#include "oceanparse/errors.hpp"
#include "oceanparse/workflow.hpp"

#include <filesystem>
#include <utility>

namespace oceanparse {

OceanParser::OceanParser(Logger& logger, NamingConvention convention)
    : logger_(&logger), convention_(std::move(convention)) {}

std::vector<std::string> OceanParser::mainfileKeys(const std::string& mainfile) const {
    return discoverPolarizationKeys(std::filesystem::path(mainfile).parent_path(), convention_);
}

std::optional<ParseResult> OceanParser::parse(const std::string& mainfile) const {
    ParseResult result{};
    try {
        result.configuration = loadConfiguration(mainfile);
    } catch (const ConfigLoadError& ex) {
        logger_->error(std::string("Error opening json output file. ") + ex.what());
        return std::nullopt;
    }

    const std::filesystem::path directory = result.configuration.directory();
    const std::vector<std::string> keys = discoverPolarizationKeys(directory, convention_);
    logger_->info("Found " + std::to_string(keys.size()) + " polarization spectra in " +
                  (directory.empty() ? std::string(".") : directory.string()));

    for (const auto& key : keys) {
        try {
            auto child = buildChild(key, result.configuration, directory, *logger_, convention_);
            if (child) {
                result.children.push_back(std::move(*child));
            }
        } catch (const MappingError& ex) {
            logger_->error("Skipping polarization " + key + ": " + ex.what());
        }
    }

    result.workflow = aggregate(result.children, result.configuration, *logger_);
    return result;
}

}  // namespace oceanparse
