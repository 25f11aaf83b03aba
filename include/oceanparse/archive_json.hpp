// filename: archive_json.hpp
// part of OCEAN Spectroscopy Output Parser
// MIT License

#pragma once

#include <filesystem>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "oceanparse/archive.hpp"
#include "oceanparse/parser.hpp"

namespace oceanparse {

/**
 * @brief Maps sections to "entry#/run/0/system/0" style locations.
 *
 * A section shared by several archives resolves to the archive that
 * registered it first.
 */
class ReferenceIndex {
public:
    void add(const Archive& archive);

    // "#/path" inside `from`, "entry#/path" across archives. Throws
    // std::runtime_error for sections that were never registered.
    [[nodiscard]] std::string resolve(const void* section, const Archive& from) const;

private:
    struct Location {
        std::string entryName;
        std::string path;
    };

    void registerSection(const void* section, const std::string& entryName, std::string path);

    std::unordered_map<const void*, Location> locations_;
};

// Children first, so shared program/system sections resolve to their owners.
ReferenceIndex makeReferenceIndex(const ParseResult& result);

nlohmann::json archiveToJson(const Archive& archive, const ReferenceIndex& index);

// Writes "<entry>.archive.json" per archive into `directory`; returns the paths written.
std::vector<std::filesystem::path> writeArchives(const ParseResult& result,
                                                 const std::filesystem::path& directory);

}  // namespace oceanparse
