// filename: method_mapper.cpp
// part of OCEAN Spectroscopy Output Parser
// MIT License

#include "oceanparse/method_mapper.hpp"

#include "oceanparse/errors.hpp"
#include "oceanparse/units.hpp"

#include <array>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace oceanparse {
namespace {

constexpr std::array<const char*, 8> kScreenKeys = {
    "all_augment", "augment", "convertstyle", "dft_energy_range",
    "inversionstyle", "kshift", "mimic_exciting_bands", "shells"};

constexpr std::array<const char*, 3> kScreenGroups = {"core_offset", "final", "grid"};

constexpr std::array<const char*, 7> kGmresKeys = {
    "echamp", "elist", "erange", "estyle", "ffff", "gprc", "nloop"};

std::string formatEdge(const std::vector<int>& edge) {
    std::ostringstream out;
    out << '[';
    for (std::size_t i = 0; i < edge.size(); ++i) {
        out << (i == 0 ? "" : ", ") << edge[i];
    }
    out << ']';
    return out.str();
}

std::vector<int> parseEdgeEntry(const nlohmann::json& entry, std::size_t index) {
    const std::string field = "calc.edges[" + std::to_string(index) + "]";
    std::vector<int> edge;
    if (entry.is_string()) {
        std::istringstream tokens(entry.get<std::string>());
        std::string token;
        while (tokens >> token) {
            try {
                std::size_t consumed = 0;
                const int value = std::stoi(token, &consumed);
                if (consumed != token.size()) {
                    throw MappingError(field, entry.dump(), "edge entries must be integers");
                }
                edge.push_back(value);
            } catch (const std::logic_error&) {
                throw MappingError(field, entry.dump(), "edge entries must be integers");
            }
        }
    } else if (entry.is_array()) {
        for (const auto& item : entry) {
            const std::optional<int> value =
                item.is_number_integer() ? jsonToInt(item) : std::nullopt;
            if (!value) {
                throw MappingError(field, entry.dump(), "edge entries must be integers");
            }
            edge.push_back(*value);
        }
    } else {
        throw MappingError(field, entry.dump(), "edge must be a string or an integer array");
    }
    if (edge.size() < 2) {
        throw MappingError(field, entry.dump(), "edge requires at least the [n, l] quantum numbers");
    }
    return edge;
}

HaydockParameters mapHaydock(const nlohmann::json& root) {
    HaydockParameters haydock{};
    haydock.convergeSpacing = optionalDouble(root, {"bse", "core", "haydock", "converge", "spacing"});
    haydock.convergeThresh = optionalDouble(root, {"bse", "core", "haydock", "converge", "thresh"});
    haydock.niter = optionalInt(root, {"bse", "core", "haydock", "niter"});
    return haydock;
}

GmresParameters mapGmres(const nlohmann::json& root) {
    GmresParameters gmres{};
    const nlohmann::json* block = findValue(root, {"bse", "core", "gmres"});
    if (block == nullptr || !block->is_object()) {
        return gmres;
    }
    for (const char* key : kGmresKeys) {
        const auto it = block->find(key);
        if (it != block->end() && !it->is_null()) {
            gmres.values.emplace(key, *it);
        }
    }
    return gmres;
}

OceanScreenParameters mapScreen(const nlohmann::json& root) {
    OceanScreenParameters screen{};
    const nlohmann::json* section = findValue(root, {"screen"});
    if (section == nullptr || !section->is_object()) {
        return screen;
    }
    for (const char* key : kScreenKeys) {
        const auto it = section->find(key);
        if (it != section->end() && !it->is_null()) {
            screen.values.emplace(key, *it);
        }
    }
    for (const char* group : kScreenGroups) {
        const auto it = section->find(group);
        if (it == section->end() || !it->is_object()) {
            continue;
        }
        for (const auto& item : it->items()) {
            screen.values.emplace(std::string(group) + "_" + item.key(), item.value());
        }
    }
    screen.modelFlavor = optionalString(root, {"screen", "model", "flavor"});
    return screen;
}

}  // namespace

std::string coreLevelLabel(const std::vector<int>& edge) {
    if (edge.size() < 2) {
        throw MappingError("calc.edges[0]", formatEdge(edge), "edge requires [n, l]");
    }
    const int n = edge[edge.size() - 2];
    const int l = edge[edge.size() - 1];
    if (n == 1 && l == 0) {
        return "K";
    }
    if (n == 2 && l == 1) {
        return "L23";
    }
    throw MappingError("calc.edges[0]", formatEdge({n, l}), "no core-level label for this [n, l]");
}

std::string solverName(const std::string& name) {
    if (name == "haydock") {
        return "lanczos-haydock";
    }
    if (name == "gmres") {
        return "gmres";
    }
    throw MappingError("bse.core.solver", name, "unsupported core-hole solver");
}

std::string coreHoleMode(int strength) {
    if (strength == 0) {
        return "emission";
    }
    if (strength == 1) {
        return "absorption";
    }
    throw MappingError("bse.core.strength", std::to_string(strength),
                       "expected 0 (emission) or 1 (absorption)");
}

std::vector<std::vector<int>> parseEdges(const Configuration& configuration) {
    const nlohmann::json* edges = findValue(configuration.data, {"calc", "edges"});
    if (edges == nullptr) {
        throw MappingError("calc.edges", "[]", "at least one edge is required");
    }
    if (!edges->is_array()) {
        throw MappingError("calc.edges", edges->dump(), "edges must be an array");
    }
    std::vector<std::vector<int>> result;
    result.reserve(edges->size());
    for (std::size_t i = 0; i < edges->size(); ++i) {
        result.push_back(parseEdgeEntry(edges->at(i), i));
    }
    return result;
}

Method mapMethod(const Configuration& configuration) {
    const nlohmann::json& root = configuration.data;
    Method method{};

    KMesh kMesh{};
    kMesh.grid = optionalIntVector(root, {"bse", "kmesh"});
    method.kMesh = kMesh;

    const std::optional<std::string> solver = optionalString(root, {"bse", "core", "solver"});
    if (!solver) {
        throw MappingError("bse.core.solver", "<missing>", "unsupported core-hole solver");
    }
    const std::string solverType = solverName(*solver);

    BSE bse{};
    bse.type = solverType;
    bse.nEmptyStates = optionalInt(root, {"bse", "nbands"});
    bse.screeningType = optionalString(root, {"screen", "mode"});
    bse.dielectricInfinity = optionalDouble(root, {"structure", "epsilon"});
    bse.nEmptyStatesScreening = optionalInt(root, {"screen", "nbands"});
    KMesh screeningMesh{};
    screeningMesh.grid = optionalIntVector(root, {"screen", "kmesh"});
    bse.kMeshScreening = screeningMesh;

    OceanBseParameters oceanBse{};
    oceanBse.screenRadius = optionalDouble(root, {"bse", "core", "screen_radius"});
    oceanBse.xmesh = optionalIntVector(root, {"bse", "xmesh"});
    if (solverType == "lanczos-haydock") {
        oceanBse.solver = mapHaydock(root);
    } else {
        oceanBse.solver = mapGmres(root);
    }
    method.oceanBse = std::move(oceanBse);

    method.oceanScreen = mapScreen(root);

    method.edges = parseEdges(configuration);
    if (method.edges.empty()) {
        throw MappingError("calc.edges", "[]", "at least one edge is required");
    }

    // Core level follows the first edge: K for 1s, L23 for 2p.
    const std::optional<int> strength = optionalInt(root, {"bse", "core", "strength"});
    if (!strength) {
        throw MappingError("bse.core.strength", "<missing>", "expected 0 (emission) or 1 (absorption)");
    }
    CoreHole coreHole{};
    coreHole.mode = coreHoleMode(*strength);
    coreHole.solver = solverType;
    coreHole.edge = coreLevelLabel(method.edges.front());
    if (const auto broaden = optionalDouble(root, {"bse", "core", "broaden"})) {
        coreHole.broadening = convert(*broaden, "eV", "J");
    }
    bse.coreHole = std::move(coreHole);
    method.bse = std::move(bse);

    return method;
}

}  // namespace oceanparse
