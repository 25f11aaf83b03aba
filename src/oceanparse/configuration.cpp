// filename: configuration.cpp
// part of OCEAN Spectroscopy Output Parser
// MIT License

#include "oceanparse/configuration.hpp"

#include "oceanparse/errors.hpp"

#include <cmath>
#include <cstdint>
#include <fstream>
#include <limits>
#include <utility>

namespace oceanparse {
namespace {

[[noreturn]] void throwTypeError(KeyPath keys, const nlohmann::json& value, const char* expected) {
    throw MappingError(joinKeyPath(keys), value.dump(), std::string("expected ") + expected);
}

bool toDoubleRow(const nlohmann::json& value, std::vector<double>& out) {
    if (!value.is_array()) {
        return false;
    }
    out.clear();
    out.reserve(value.size());
    for (const auto& entry : value) {
        if (!entry.is_number()) {
            return false;
        }
        out.push_back(entry.get<double>());
    }
    return true;
}

}  // namespace

std::optional<int> jsonToInt(const nlohmann::json& value) {
    constexpr auto kMin = std::numeric_limits<int>::min();
    constexpr auto kMax = std::numeric_limits<int>::max();
    if (value.is_number_unsigned()) {
        const auto raw = value.get<std::uint64_t>();
        if (raw > static_cast<std::uint64_t>(kMax)) {
            return std::nullopt;
        }
        return static_cast<int>(raw);
    }
    if (value.is_number_integer()) {
        const auto raw = value.get<std::int64_t>();
        if (raw < kMin || raw > kMax) {
            return std::nullopt;
        }
        return static_cast<int>(raw);
    }
    if (value.is_number_float()) {
        const double raw = value.get<double>();
        if (!std::isfinite(raw) || std::floor(raw) != raw || raw < static_cast<double>(kMin) ||
            raw > static_cast<double>(kMax)) {
            return std::nullopt;
        }
        return static_cast<int>(raw);
    }
    return std::nullopt;
}

Configuration loadConfiguration(const std::string& path) {
    std::ifstream input(path);
    if (!input) {
        throw ConfigLoadError("Failed to open OCEAN JSON output: " + path);
    }

    nlohmann::json json;
    try {
        input >> json;
    } catch (const nlohmann::json::parse_error& ex) {
        throw ConfigLoadError("Failed to parse OCEAN JSON output " + path + ": " + ex.what());
    }
    if (!json.is_object()) {
        throw ConfigLoadError("OCEAN JSON output must be an object: " + path);
    }
    return makeConfiguration(std::move(json), path);
}

Configuration makeConfiguration(nlohmann::json data, std::filesystem::path mainfile) {
    Configuration configuration{};
    configuration.mainfile = std::move(mainfile);
    configuration.data = std::move(data);
    return configuration;
}

std::string joinKeyPath(KeyPath keys) {
    std::string joined;
    for (const char* key : keys) {
        if (!joined.empty()) {
            joined += '.';
        }
        joined += key;
    }
    return joined;
}

bool isPresent(const nlohmann::json& value) {
    if (value.is_null()) {
        return false;
    }
    if (value.is_array() || value.is_object() || value.is_string()) {
        return !value.empty() && !(value.is_string() && value.get_ref<const std::string&>().empty());
    }
    return true;
}

const nlohmann::json* findValue(const nlohmann::json& root, KeyPath keys) {
    const nlohmann::json* node = &root;
    for (const char* key : keys) {
        if (!node->is_object()) {
            return nullptr;
        }
        const auto it = node->find(key);
        if (it == node->end()) {
            return nullptr;
        }
        node = &(*it);
    }
    return isPresent(*node) ? node : nullptr;
}

std::optional<double> optionalDouble(const nlohmann::json& root, KeyPath keys) {
    const nlohmann::json* value = findValue(root, keys);
    if (value == nullptr) {
        return std::nullopt;
    }
    if (!value->is_number()) {
        throwTypeError(keys, *value, "a number");
    }
    return value->get<double>();
}

std::optional<int> optionalInt(const nlohmann::json& root, KeyPath keys) {
    const nlohmann::json* value = findValue(root, keys);
    if (value == nullptr) {
        return std::nullopt;
    }
    const std::optional<int> result = jsonToInt(*value);
    if (!result) {
        throwTypeError(keys, *value, "an integer");
    }
    return result;
}

std::optional<std::string> optionalString(const nlohmann::json& root, KeyPath keys) {
    const nlohmann::json* value = findValue(root, keys);
    if (value == nullptr) {
        return std::nullopt;
    }
    if (!value->is_string()) {
        throwTypeError(keys, *value, "a string");
    }
    return value->get<std::string>();
}

std::optional<std::vector<int>> optionalIntVector(const nlohmann::json& root, KeyPath keys) {
    const nlohmann::json* value = findValue(root, keys);
    if (value == nullptr) {
        return std::nullopt;
    }
    if (!value->is_array()) {
        throwTypeError(keys, *value, "an array of integers");
    }
    std::vector<int> result;
    result.reserve(value->size());
    for (const auto& entry : *value) {
        const std::optional<int> item = jsonToInt(entry);
        if (!item) {
            throwTypeError(keys, *value, "an array of integers");
        }
        result.push_back(*item);
    }
    return result;
}

std::optional<std::vector<double>> optionalDoubleVector(const nlohmann::json& root, KeyPath keys) {
    const nlohmann::json* value = findValue(root, keys);
    if (value == nullptr) {
        return std::nullopt;
    }
    std::vector<double> result;
    if (!toDoubleRow(*value, result)) {
        throwTypeError(keys, *value, "an array of numbers");
    }
    return result;
}

// Accepts nested rows ([[x, y, z], ...]) or a flat list whose length is a
// multiple of three.
std::optional<std::vector<std::vector<double>>> optionalMatrix(const nlohmann::json& root,
                                                               KeyPath keys) {
    const nlohmann::json* value = findValue(root, keys);
    if (value == nullptr) {
        return std::nullopt;
    }
    if (!value->is_array()) {
        throwTypeError(keys, *value, "an array of rows");
    }

    std::vector<std::vector<double>> rows;
    if (value->front().is_number()) {
        std::vector<double> flat;
        if (!toDoubleRow(*value, flat) || flat.size() % 3 != 0) {
            throwTypeError(keys, *value, "a flat array with a multiple of three numbers");
        }
        for (std::size_t i = 0; i < flat.size(); i += 3) {
            rows.push_back({flat[i], flat[i + 1], flat[i + 2]});
        }
        return rows;
    }

    rows.reserve(value->size());
    for (const auto& entry : *value) {
        std::vector<double> row;
        if (!toDoubleRow(entry, row)) {
            throwTypeError(keys, *value, "an array of numeric rows");
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

}  // namespace oceanparse
