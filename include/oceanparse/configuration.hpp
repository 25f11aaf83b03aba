// filename: configuration.hpp
// part of OCEAN Spectroscopy Output Parser
// MIT License

#pragma once

#include <filesystem>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace oceanparse {

/**
 * @brief Main OCEAN JSON document, read-only after loading.
 */
struct Configuration {
    std::filesystem::path mainfile;
    nlohmann::json data;

    [[nodiscard]] std::filesystem::path directory() const { return mainfile.parent_path(); }
};

// Throws ConfigLoadError when the file cannot be opened or is not a JSON object.
Configuration loadConfiguration(const std::string& path);

Configuration makeConfiguration(nlohmann::json data, std::filesystem::path mainfile = {});

using KeyPath = std::initializer_list<const char*>;

std::string joinKeyPath(KeyPath keys);

// Null values and empty arrays, objects or strings count as absent.
bool isPresent(const nlohmann::json& value);

// Follows keys through nested objects; nullptr when any level is absent.
const nlohmann::json* findValue(const nlohmann::json& root, KeyPath keys);

// Integers and integral floats that fit in an int; nullopt otherwise.
std::optional<int> jsonToInt(const nlohmann::json& value);

// Typed lookups. An absent key gives nullopt; a present value of the wrong
// type throws MappingError naming the key path.
std::optional<double> optionalDouble(const nlohmann::json& root, KeyPath keys);
std::optional<int> optionalInt(const nlohmann::json& root, KeyPath keys);
std::optional<std::string> optionalString(const nlohmann::json& root, KeyPath keys);
std::optional<std::vector<int>> optionalIntVector(const nlohmann::json& root, KeyPath keys);
std::optional<std::vector<double>> optionalDoubleVector(const nlohmann::json& root, KeyPath keys);
std::optional<std::vector<std::vector<double>>> optionalMatrix(const nlohmann::json& root,
                                                               KeyPath keys);

}  // namespace oceanparse
