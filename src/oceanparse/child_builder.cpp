// filename: child_builder.cpp
// part of OCEAN Spectroscopy Output Parser
// MIT License

#include "oceanparse/child_builder.hpp"

#include "oceanparse/elements.hpp"
#include "oceanparse/errors.hpp"
#include "oceanparse/extractors.hpp"
#include "oceanparse/method_mapper.hpp"
#include "oceanparse/units.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>
#include <utility>
#include <vector>

namespace oceanparse {
namespace {

const std::unordered_map<std::string, std::string> kDftCodes = {
    {"qe", "QuantumESPRESSO"},
    {"abi", "ABINIT"},
};

std::vector<Vec3> toVectors(const std::vector<std::vector<double>>& rows, const char* field,
                            const std::string& fromUnit, const std::string& toUnit) {
    std::vector<Vec3> vectors;
    vectors.reserve(rows.size());
    for (const auto& row : rows) {
        if (row.size() != 3) {
            throw MappingError(field, std::to_string(row.size()) + " components",
                               "expected three components per vector");
        }
        vectors.push_back({convert(row[0], fromUnit, toUnit), convert(row[1], fromUnit, toUnit),
                           convert(row[2], fromUnit, toUnit)});
    }
    return vectors;
}

std::optional<std::vector<std::string>> resolveLabels(const std::vector<int>& znucl,
                                                      const std::vector<int>& typat,
                                                      Logger& logger) {
    std::vector<std::string> labels;
    labels.reserve(typat.size());
    for (int species : typat) {
        if (species < 1 || static_cast<std::size_t>(species) > znucl.size()) {
            logger.warning("structure.typat refers to unknown species " + std::to_string(species));
            return std::nullopt;
        }
        const auto symbol = chemicalSymbol(znucl[static_cast<std::size_t>(species - 1)]);
        if (!symbol) {
            logger.warning("structure.znucl holds an invalid atomic number " +
                           std::to_string(znucl[static_cast<std::size_t>(species - 1)]));
            return std::nullopt;
        }
        labels.push_back(*symbol);
    }
    return labels;
}

// A value of the wrong type is logged and treated as absent.
std::optional<std::string> stringField(const nlohmann::json& root, KeyPath keys, Logger& logger) {
    try {
        return optionalString(root, keys);
    } catch (const MappingError& ex) {
        logger.error(std::string("Ignoring invalid value in the main output file: ") + ex.what());
        return std::nullopt;
    }
}

std::string toUpper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

Spectra makeSpectra(const SpectrumData& data, const Configuration& configuration, Logger& logger) {
    Spectra spectra{};
    spectra.type = toUpper(stringField(configuration.data, {"calc", "mode"}, logger).value_or(""));
    spectra.nEnergies = data.energies.size();
    spectra.excitationEnergies = convert(data.energies, "eV", "J");
    spectra.intensities = data.intensities;
    return spectra;
}

LanczosResults makeLanczos(LanczosData data) {
    LanczosResults lanczos{};
    lanczos.nTridiagonalMatrix = data.dimension;
    lanczos.scalingFactor = data.scalingFactor;
    lanczos.tridiagonalMatrix = std::move(data.tridiagonalMatrix);
    lanczos.eigenvalues = std::move(data.eigenvalues);
    return lanczos;
}

}  // namespace

void populateProgram(Program& program, const Configuration& configuration, Logger& logger) {
    const nlohmann::json& root = configuration.data;
    program.name = "OCEAN";
    program.version = stringField(root, {"version", "."}, logger);
    program.commitHash = stringField(root, {"version", "hash"}, logger);
    if (const auto code = stringField(root, {"dft", "program"}, logger)) {
        const auto it = kDftCodes.find(*code);
        if (it != kDftCodes.end()) {
            program.originalDftCode = it->second;
        }
    }
}

bool populateSystem(System& system, const Configuration& configuration, Logger& logger) {
    const nlohmann::json& root = configuration.data;
    if (findValue(root, {"structure"}) == nullptr) {
        return false;
    }

    Atoms& atoms = system.atoms.emplace();
    try {
        if (const auto avecs = optionalMatrix(root, {"structure", "avecs"})) {
            atoms.latticeVectors = toVectors(*avecs, "structure.avecs", "bohr", "m");
            atoms.periodic = std::array<bool, 3>{true, true, true};
        }
        if (const auto bvecs = optionalMatrix(root, {"structure", "bvecs"})) {
            atoms.latticeVectorsReciprocal = toVectors(*bvecs, "structure.bvecs", "1/bohr", "1/m");
        }
        const auto znucl = optionalIntVector(root, {"structure", "znucl"});
        const auto typat = optionalIntVector(root, {"structure", "typat"});
        if (znucl && typat) {
            atoms.labels = resolveLabels(*znucl, *typat, logger);
        }
        // OCEAN writes xangst in bohr despite the key name.
        if (const auto xangst = optionalMatrix(root, {"structure", "xangst"})) {
            atoms.positions = toVectors(*xangst, "structure.xangst", "bohr", "m");
        }
    } catch (const MappingError& ex) {
        logger.error(std::string("Invalid structure in the main output file: ") + ex.what());
    }
    return true;
}

void populatePhoton(Method& method, const std::string& photonText) {
    const PhotonData data = extractPhoton(photonText);
    Photon& photon = method.photon.emplace();
    photon.multipoleType = data.operatorType;
    if (!data.vectors.empty()) {
        photon.polarization = data.vectors[0];
    }
    const bool needsMomentum =
        data.operatorType && (*data.operatorType == "quad" || *data.operatorType == "NRIXS");
    if (needsMomentum && data.vectors.size() > 1) {
        photon.momentumTransfer = data.vectors[1];
    }
    if (data.energy) {
        photon.energy = convert(*data.energy, "eV", "J");
    }
}

std::optional<Archive> buildChild(const std::string& key, const Configuration& configuration,
                                  const std::filesystem::path& directory, Logger& logger,
                                  const NamingConvention& convention) {
    const auto spectraFiles = discover(directory, FileRole::Spectra, key, convention);
    std::optional<std::string> spectraText;
    if (!spectraFiles.empty()) {
        spectraText = readTextFile(spectraFiles.front().string());
    }
    if (!spectraText) {
        logger.error("Cannot read the " + fileRoleName(FileRole::Spectra) + " file for polarization " + key);
        return std::nullopt;
    }

    Archive archive{};
    archive.entryName = key;
    Run& run = archive.createRun();
    populateProgram(run.createProgram(), configuration, logger);

    System system{};
    if (!populateSystem(system, configuration, logger)) {
        logger.error("Error finding the structure in the main output file.");
        return archive;
    }
    run.system.push_back(std::make_shared<System>(std::move(system)));

    Method& photonMethod = run.createMethod();
    const auto photonFiles = discover(directory, FileRole::Photon, key, convention);
    if (!photonFiles.empty()) {
        if (const auto text = readTextFile(photonFiles.front().string())) {
            populatePhoton(photonMethod, *text);
        } else {
            logger.warning("Cannot read " + fileRoleName(FileRole::Photon) + " file " +
                           photonFiles.front().string());
        }
    }

    try {
        Method bseMethod = mapMethod(configuration);
        if (!run.method.empty()) {
            bseMethod.startingMethodRef = run.method.front().get();
        }
        run.appendMethod(std::move(bseMethod));
    } catch (const MappingError& ex) {
        logger.error("Cannot map the BSE method for polarization " + key + ": " + ex.what());
        return archive;
    }

    Calculation& calculation = run.createCalculation();
    calculation.systemRef = run.system.back().get();
    calculation.methodRef = run.method.back().get();
    calculation.spectra = makeSpectra(extractSpectrum(*spectraText), configuration, logger);

    const auto lanczosFiles = discover(directory, FileRole::Lanczos, key, convention);
    if (!lanczosFiles.empty()) {
        const auto text = readTextFile(lanczosFiles.front().string());
        std::optional<LanczosData> data;
        if (text) {
            data = extractLanczos(*text);
        }
        if (data) {
            calculation.lanczos = makeLanczos(std::move(*data));
        } else {
            logger.warning("Skipping unreadable " + fileRoleName(FileRole::Lanczos) + " file " +
                           lanczosFiles.front().string());
        }
    }

    archive.createWorkflow(Workflow::Kind::SinglePoint);
    return archive;
}

}  // namespace oceanparse
