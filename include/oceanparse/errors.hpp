// filename: errors.hpp
// part of OCEAN Spectroscopy Output Parser
// MIT License

#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace oceanparse {

// The main JSON document could not be opened or parsed.
class ConfigLoadError : public std::runtime_error {
public:
    explicit ConfigLoadError(const std::string& message) : std::runtime_error(message) {}
};

// A configuration value has no mapping onto the result model, e.g. an edge
// with an unknown [n, l] pair or an unrecognised solver name.
class MappingError : public std::runtime_error {
public:
    MappingError(std::string field, std::string value, const std::string& reason)
        : std::runtime_error(field + " = " + value + ": " + reason),
          field_(std::move(field)),
          value_(std::move(value)) {}

    [[nodiscard]] const std::string& field() const { return field_; }
    [[nodiscard]] const std::string& value() const { return value_; }

private:
    std::string field_;
    std::string value_;
};

}  // namespace oceanparse
