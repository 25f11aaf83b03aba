// filename: configuration_units_test.cpp
// part of OCEAN Spectroscopy Output Parser
// MIT License

#include "oceanparse/configuration.hpp"
#include "oceanparse/elements.hpp"
#include "oceanparse/errors.hpp"
#include "oceanparse/types.hpp"
#include "oceanparse/units.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <optional>
#include <string>
#include <vector>

namespace {

bool approx(double a, double b, double rel = 1e-12) {
    return std::abs(a - b) <= rel * std::max(std::abs(a), std::abs(b));
}

}  // namespace

int main() {
    using namespace oceanparse;
    namespace fs = std::filesystem;

    int status = 0;
    const auto fail = [&status](const std::string& message) {
        std::cerr << message << "\n";
        status = 1;
    };

    if (!approx(convert(1.0, "bohr", "m"), BOHR) || !approx(convert(1.0, "angstrom", "bohr"), ANGSTROM / BOHR)) {
        fail("Length conversion is wrong");
    }
    if (!approx(convert(2.0, "1/bohr", "1/m"), 2.0 / BOHR)) {
        fail("Reciprocal length conversion is wrong");
    }
    if (!approx(convert(1.0, "hartree", "eV"), 27.211386245988, 1e-9)) {
        fail("Hartree to eV conversion is wrong: " + std::to_string(convert(1.0, "hartree", "eV")));
    }
    if (!approx(convert(0.89, "eV", "J"), 0.89 * ELECTRON_VOLT)) {
        fail("eV to J conversion is wrong");
    }
    try {
        (void)convert(1.0, "eV", "m");
        fail("Converting energy to length must throw");
    } catch (const std::invalid_argument&) {
    }
    try {
        (void)convert(1.0, "rydberg", "J");
        fail("Unknown units must throw");
    } catch (const std::invalid_argument&) {
    }

    if (chemicalSymbol(22) != std::optional<std::string>("Ti") || chemicalSymbol(0) != std::optional<std::string>("X") ||
        chemicalSymbol(MAX_ATOMIC_NUMBER) != std::optional<std::string>("Og") || chemicalSymbol(119) ||
        chemicalSymbol(-1)) {
        fail("Chemical symbol lookup is wrong");
    }

    const nlohmann::json data = nlohmann::json::parse(R"({
        "structure": {"avecs": [7.0, 0, 0, 0, 7.0, 0, 0, 0, 7.0], "znucl": [22.0, 8], "label": ""},
        "bse": {"nbands": 80, "xmesh": [], "core": {"solver": "haydock", "broaden": 0.5, "strength": null}},
        "calc": {"mode": 3}
    })");
    const Configuration configuration = makeConfiguration(data, "/tmp/run/postDefaultsOceanDatafile");
    if (configuration.directory() != fs::path("/tmp/run")) {
        fail("Configuration directory must be the mainfile parent");
    }

    if (findValue(data, {"bse", "xmesh"}) != nullptr || findValue(data, {"structure", "label"}) != nullptr ||
        findValue(data, {"bse", "core", "strength"}) != nullptr || findValue(data, {"bse", "nbands", "x"}) != nullptr) {
        fail("Empty, null and non-object lookups must be absent");
    }
    if (optionalInt(data, {"bse", "nbands"}) != 80 || optionalDouble(data, {"bse", "core", "broaden"}) != 0.5 ||
        optionalString(data, {"bse", "core", "solver"}) != std::optional<std::string>("haydock")) {
        fail("Scalar lookups return wrong values");
    }
    if (optionalIntVector(data, {"structure", "znucl"}) != std::optional<std::vector<int>>({22, 8})) {
        fail("Integral floats must be accepted as integers");
    }
    const auto avecs = optionalMatrix(data, {"structure", "avecs"});
    if (!avecs || avecs->size() != 3 || (*avecs)[1][1] != 7.0) {
        fail("A flat nine-element array must reshape into three rows");
    }
    if (optionalDouble(data, {"screen", "nbands"})) {
        fail("Missing keys must give nullopt");
    }
    try {
        (void)optionalString(data, {"calc", "mode"});
        fail("A number where a string is expected must throw");
    } catch (const MappingError& ex) {
        if (ex.field() != "calc.mode" || ex.value() != "3") {
            fail(std::string("MappingError names the wrong field: ") + ex.what());
        }
    }

    const nlohmann::json overflow = nlohmann::json::parse(R"({
        "bse": {"nbands": 1e20, "kmesh": [4, 3000000000, 4], "niter": -3000000000, "half": 2.5},
        "screen": {"nbands": 2147483647}
    })");
    if (jsonToInt(nlohmann::json(2147483647)) != 2147483647 || jsonToInt(nlohmann::json(2147483648.0)) ||
        jsonToInt(nlohmann::json(4294967296u)) || jsonToInt(nlohmann::json("7"))) {
        fail("jsonToInt must accept exactly the values that fit in an int");
    }
    if (optionalInt(overflow, {"screen", "nbands"}) != 2147483647) {
        fail("The largest int must still be accepted");
    }
    const auto expectIntRejected = [&](const char* key) {
        try {
            (void)optionalInt(overflow, {"bse", key});
            fail(std::string("Out-of-range or fractional integer at bse.") + key + " must throw");
        } catch (const MappingError& ex) {
            if (ex.field() != std::string("bse.") + key) {
                fail(std::string("MappingError names the wrong field: ") + ex.what());
            }
        }
    };
    expectIntRejected("nbands");
    expectIntRejected("niter");
    expectIntRejected("half");
    try {
        (void)optionalIntVector(overflow, {"bse", "kmesh"});
        fail("An integer array with an out-of-range entry must throw");
    } catch (const MappingError&) {
    }

    try {
        (void)loadConfiguration("/nonexistent/postDefaultsOceanDatafile");
        fail("Loading a missing file must throw");
    } catch (const ConfigLoadError&) {
    }

    const fs::path fixture = (fs::path(__FILE__).parent_path() /
                              "../inputs/tests/ocean_ti_k_edge/postDefaultsOceanDatafile")
                                 .lexically_normal();
    try {
        const Configuration loaded = loadConfiguration(fixture.string());
        if (optionalString(loaded.data, {"calc", "mode"}) != std::optional<std::string>("xas")) {
            fail("Fixture calc.mode must be xas");
        }
    } catch (const std::exception& ex) {
        fail(std::string("Loading the fixture failed: ") + ex.what());
    }

    if (status == 0) {
        std::cout << "Configuration and unit helpers verified\n";
    }
    return status;
}
