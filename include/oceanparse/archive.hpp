// filename: archive.hpp
// part of OCEAN Spectroscopy Output Parser
// MIT License

#pragma once

#include <array>
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace oceanparse {

using Vec3 = std::array<double, 3>;

struct Program {
    std::string name;
    std::optional<std::string> version;
    std::optional<std::string> commitHash;
    std::optional<std::string> originalDftCode;
};

// Lengths in m, reciprocal lengths in 1/m.
struct Atoms {
    std::optional<std::vector<std::string>> labels;
    std::optional<std::vector<Vec3>> positions;
    std::optional<std::vector<Vec3>> latticeVectors;
    std::optional<std::vector<Vec3>> latticeVectorsReciprocal;
    std::optional<std::array<bool, 3>> periodic;
};

struct System {
    std::optional<Atoms> atoms;
};

struct Photon {
    std::optional<std::string> multipoleType;
    std::optional<Vec3> polarization;
    std::optional<Vec3> momentumTransfer;
    std::optional<double> energy;  // J
};

struct KMesh {
    std::optional<std::vector<int>> grid;
};

struct CoreHole {
    std::string mode;
    std::string solver;
    std::string edge;
    std::optional<double> broadening;  // J
};

struct BSE {
    std::optional<std::string> type;
    std::optional<int> nEmptyStates;
    std::optional<std::string> screeningType;
    std::optional<double> dielectricInfinity;
    std::optional<int> nEmptyStatesScreening;
    std::optional<KMesh> kMeshScreening;
    std::optional<CoreHole> coreHole;
};

struct HaydockParameters {
    std::optional<double> convergeSpacing;
    std::optional<double> convergeThresh;
    std::optional<int> niter;
};

struct GmresParameters {
    // echamp, elist, erange, estyle, ffff, gprc, nloop as found in the input
    std::map<std::string, nlohmann::json> values;
};

// Exactly one solver block exists for a given core-hole solver.
using SolverParameters = std::variant<HaydockParameters, GmresParameters>;

struct OceanBseParameters {
    std::optional<double> screenRadius;
    std::optional<std::vector<int>> xmesh;
    SolverParameters solver;
};

struct OceanScreenParameters {
    // keyed by parameter name, groups flattened as "<group>_<key>"
    std::map<std::string, nlohmann::json> values;
    std::optional<std::string> modelFlavor;
};

struct Method {
    std::optional<Photon> photon;
    std::optional<KMesh> kMesh;
    std::optional<BSE> bse;
    std::optional<OceanBseParameters> oceanBse;
    std::optional<OceanScreenParameters> oceanScreen;
    std::vector<std::vector<int>> edges;
    const Method* startingMethodRef{nullptr};
};

struct Spectra {
    std::string type;
    std::size_t nEnergies{0};
    std::vector<double> excitationEnergies;  // J
    std::vector<double> intensities;
};

struct LanczosResults {
    std::size_t nTridiagonalMatrix{0};
    double scalingFactor{0.0};
    std::vector<std::array<double, 2>> tridiagonalMatrix;
    std::vector<std::vector<double>> eigenvalues;
};

struct Calculation {
    const System* systemRef{nullptr};
    const Method* methodRef{nullptr};
    std::optional<Spectra> spectra;
    std::optional<LanczosResults> lanczos;
};

/**
 * @brief One program execution. Sections are heap allocated and shared so
 *        that other runs and links can reference them without copying.
 */
struct Run {
    std::shared_ptr<Program> program;
    std::vector<std::shared_ptr<System>> system;
    std::vector<std::shared_ptr<Method>> method;
    std::vector<std::shared_ptr<Calculation>> calculation;

    Program& createProgram();
    System& createSystem();
    Method& createMethod();
    Method& appendMethod(Method section);
    Calculation& createCalculation();

    void referenceProgram(std::shared_ptr<Program> section);
    void referenceSystem(std::shared_ptr<System> section);
};

using SectionRef = std::variant<const System*, const Method*, const Calculation*>;

struct Link {
    std::string name;
    SectionRef section;
};

struct Workflow;

struct TaskReference {
    std::string name;
    const Workflow* task{nullptr};
    std::vector<Link> inputs;
    std::vector<Link> outputs;
};

struct PhotonPolarizationResults {
    std::size_t nPolarizations{0};
    std::vector<const Spectra*> spectrumPolarization;
};

struct Workflow {
    enum class Kind { SinglePoint, PhotonPolarization };

    Kind kind{Kind::SinglePoint};
    const Method* method{nullptr};
    std::vector<Link> inputs;
    std::vector<Link> outputs;
    std::vector<TaskReference> tasks;
    std::optional<PhotonPolarizationResults> results;
};

std::string workflowKindName(Workflow::Kind kind);

/**
 * @brief One entry of the result graph: its runs plus an optional workflow.
 */
struct Archive {
    std::string entryName;
    std::vector<Run> run;
    std::shared_ptr<Workflow> workflow;

    Run& createRun();
    Workflow& createWorkflow(Workflow::Kind kind);
};

}  // namespace oceanparse
