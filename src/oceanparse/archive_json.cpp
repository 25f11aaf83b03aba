// filename: archive_json.cpp
// part of OCEAN Spectroscopy Output Parser
// MIT License

#include "oceanparse/archive_json.hpp"

#include <fstream>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <variant>

namespace oceanparse {
namespace {

template <typename T>
void setOptional(nlohmann::json& out, const char* key, const std::optional<T>& value) {
    if (value) {
        out[key] = *value;
    }
}

nlohmann::json vectorsToJson(const std::vector<Vec3>& vectors) {
    nlohmann::json rows = nlohmann::json::array();
    for (const auto& v : vectors) {
        rows.push_back({v[0], v[1], v[2]});
    }
    return rows;
}

const void* sectionAddress(const SectionRef& ref) {
    return std::visit([](const auto* section) { return static_cast<const void*>(section); }, ref);
}

nlohmann::json programToJson(const Program& program) {
    nlohmann::json out = nlohmann::json::object();
    if (!program.name.empty()) {
        out["name"] = program.name;
    }
    setOptional(out, "version", program.version);
    setOptional(out, "x_ocean_commit_hash", program.commitHash);
    setOptional(out, "x_ocean_original_dft_code", program.originalDftCode);
    return out;
}

nlohmann::json systemToJson(const System& system) {
    nlohmann::json out = nlohmann::json::object();
    if (!system.atoms) {
        return out;
    }
    const Atoms& atoms = *system.atoms;
    nlohmann::json jsonAtoms = nlohmann::json::object();
    setOptional(jsonAtoms, "labels", atoms.labels);
    if (atoms.positions) {
        jsonAtoms["positions"] = vectorsToJson(*atoms.positions);
    }
    if (atoms.latticeVectors) {
        jsonAtoms["lattice_vectors"] = vectorsToJson(*atoms.latticeVectors);
    }
    if (atoms.latticeVectorsReciprocal) {
        jsonAtoms["lattice_vectors_reciprocal"] = vectorsToJson(*atoms.latticeVectorsReciprocal);
    }
    setOptional(jsonAtoms, "periodic", atoms.periodic);
    out["atoms"] = std::move(jsonAtoms);
    return out;
}

nlohmann::json kMeshToJson(const KMesh& kMesh) {
    nlohmann::json out = nlohmann::json::object();
    setOptional(out, "grid", kMesh.grid);
    return out;
}

nlohmann::json methodToJson(const Method& method, const Archive& archive,
                            const ReferenceIndex& index) {
    nlohmann::json out = nlohmann::json::object();
    if (method.startingMethodRef != nullptr) {
        out["starting_method_ref"] = index.resolve(method.startingMethodRef, archive);
    }
    if (method.photon) {
        const Photon& photon = *method.photon;
        nlohmann::json jsonPhoton = nlohmann::json::object();
        setOptional(jsonPhoton, "multipole_type", photon.multipoleType);
        setOptional(jsonPhoton, "polarization", photon.polarization);
        setOptional(jsonPhoton, "momentum_transfer", photon.momentumTransfer);
        setOptional(jsonPhoton, "energy", photon.energy);
        out["photon"] = nlohmann::json::array();
        out["photon"].push_back(std::move(jsonPhoton));
    }
    if (method.kMesh) {
        out["k_mesh"] = kMeshToJson(*method.kMesh);
    }
    if (method.bse) {
        const BSE& bse = *method.bse;
        nlohmann::json jsonBse = nlohmann::json::object();
        setOptional(jsonBse, "type", bse.type);
        setOptional(jsonBse, "n_empty_states", bse.nEmptyStates);
        setOptional(jsonBse, "screening_type", bse.screeningType);
        setOptional(jsonBse, "dielectric_infinity", bse.dielectricInfinity);
        setOptional(jsonBse, "n_empty_states_screening", bse.nEmptyStatesScreening);
        if (bse.kMeshScreening) {
            jsonBse["k_mesh_screening"] = kMeshToJson(*bse.kMeshScreening);
        }
        if (bse.coreHole) {
            const CoreHole& coreHole = *bse.coreHole;
            nlohmann::json jsonCoreHole = {
                {"mode", coreHole.mode}, {"solver", coreHole.solver}, {"edge", coreHole.edge}};
            setOptional(jsonCoreHole, "broadening", coreHole.broadening);
            jsonBse["core_hole"] = std::move(jsonCoreHole);
        }
        out["bse"] = std::move(jsonBse);
    }
    if (method.oceanBse) {
        const OceanBseParameters& params = *method.oceanBse;
        nlohmann::json jsonParams = nlohmann::json::object();
        setOptional(jsonParams, "x_ocean_screen_radius", params.screenRadius);
        setOptional(jsonParams, "x_ocean_xmesh", params.xmesh);
        if (const auto* haydock = std::get_if<HaydockParameters>(&params.solver)) {
            nlohmann::json block = nlohmann::json::object();
            setOptional(block, "x_ocean_converge_spacing", haydock->convergeSpacing);
            setOptional(block, "x_ocean_converge_thresh", haydock->convergeThresh);
            setOptional(block, "x_ocean_niter", haydock->niter);
            jsonParams["x_ocean_core_haydock_parameters"] = std::move(block);
        } else if (const auto* gmres = std::get_if<GmresParameters>(&params.solver)) {
            nlohmann::json block = nlohmann::json::object();
            for (const auto& entry : gmres->values) {
                block["x_ocean_" + entry.first] = entry.second;
            }
            jsonParams["x_ocean_core_gmres_parameters"] = std::move(block);
        }
        out["x_ocean_bse_parameters"] = std::move(jsonParams);
    }
    if (method.oceanScreen) {
        nlohmann::json jsonScreen = nlohmann::json::object();
        for (const auto& entry : method.oceanScreen->values) {
            jsonScreen["x_ocean_" + entry.first] = entry.second;
        }
        setOptional(jsonScreen, "x_ocean_model_flavor", method.oceanScreen->modelFlavor);
        out["x_ocean_screen_parameters"] = std::move(jsonScreen);
    }
    if (!method.edges.empty()) {
        out["x_ocean_edges"] = method.edges;
    }
    return out;
}

nlohmann::json calculationToJson(const Calculation& calculation, const Archive& archive,
                                 const ReferenceIndex& index) {
    nlohmann::json out = nlohmann::json::object();
    if (calculation.systemRef != nullptr) {
        out["system_ref"] = index.resolve(calculation.systemRef, archive);
    }
    if (calculation.methodRef != nullptr) {
        out["method_ref"] = index.resolve(calculation.methodRef, archive);
    }
    if (calculation.spectra) {
        const Spectra& spectra = *calculation.spectra;
        nlohmann::json entry = {
            {"type", spectra.type},
            {"n_energies", spectra.nEnergies},
            {"excitation_energies", spectra.excitationEnergies},
            {"intensities", spectra.intensities},
        };
        out["spectra"] = nlohmann::json::array();
        out["spectra"].push_back(std::move(entry));
    }
    if (calculation.lanczos) {
        const LanczosResults& lanczos = *calculation.lanczos;
        nlohmann::json entry = {
            {"x_ocean_n_tridiagonal_matrix", lanczos.nTridiagonalMatrix},
            {"x_ocean_scaling_factor", lanczos.scalingFactor},
            {"x_ocean_tridiagonal_matrix", lanczos.tridiagonalMatrix},
            {"x_ocean_eigenvalues", lanczos.eigenvalues},
        };
        out["x_ocean_lanczos_results"] = nlohmann::json::array();
        out["x_ocean_lanczos_results"].push_back(std::move(entry));
    }
    return out;
}

nlohmann::json linksToJson(const std::vector<Link>& links, const Archive& archive,
                           const ReferenceIndex& index) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& link : links) {
        out.push_back({{"name", link.name},
                       {"section", index.resolve(sectionAddress(link.section), archive)}});
    }
    return out;
}

nlohmann::json workflowToJson(const Workflow& workflow, const Archive& archive,
                              const ReferenceIndex& index) {
    nlohmann::json out = {{"m_def", workflowKindName(workflow.kind)}};
    if (workflow.method != nullptr) {
        out["method"] = index.resolve(workflow.method, archive);
    }
    if (!workflow.inputs.empty()) {
        out["inputs"] = linksToJson(workflow.inputs, archive, index);
    }
    if (!workflow.outputs.empty()) {
        out["outputs"] = linksToJson(workflow.outputs, archive, index);
    }
    if (!workflow.tasks.empty()) {
        nlohmann::json tasks = nlohmann::json::array();
        for (const auto& task : workflow.tasks) {
            nlohmann::json jsonTask = {{"name", task.name}};
            if (task.task != nullptr) {
                jsonTask["task"] = index.resolve(task.task, archive);
            }
            jsonTask["inputs"] = linksToJson(task.inputs, archive, index);
            jsonTask["outputs"] = linksToJson(task.outputs, archive, index);
            tasks.push_back(std::move(jsonTask));
        }
        out["tasks"] = std::move(tasks);
    }
    if (workflow.results) {
        nlohmann::json spectra = nlohmann::json::array();
        for (const Spectra* entry : workflow.results->spectrumPolarization) {
            spectra.push_back(index.resolve(entry, archive));
        }
        out["results"] = {{"n_polarizations", workflow.results->nPolarizations},
                          {"spectrum_polarization", std::move(spectra)}};
    }
    return out;
}

}  // namespace

void ReferenceIndex::registerSection(const void* section, const std::string& entryName,
                                     std::string path) {
    if (section == nullptr) {
        return;
    }
    locations_.emplace(section, Location{entryName, std::move(path)});
}

void ReferenceIndex::add(const Archive& archive) {
    for (std::size_t r = 0; r < archive.run.size(); ++r) {
        const Run& run = archive.run[r];
        const std::string runPath = "/run/" + std::to_string(r);
        registerSection(run.program.get(), archive.entryName, runPath + "/program");
        for (std::size_t i = 0; i < run.system.size(); ++i) {
            registerSection(run.system[i].get(), archive.entryName,
                            runPath + "/system/" + std::to_string(i));
        }
        for (std::size_t i = 0; i < run.method.size(); ++i) {
            registerSection(run.method[i].get(), archive.entryName,
                            runPath + "/method/" + std::to_string(i));
        }
        for (std::size_t i = 0; i < run.calculation.size(); ++i) {
            const Calculation* calculation = run.calculation[i].get();
            const std::string path = runPath + "/calculation/" + std::to_string(i);
            registerSection(calculation, archive.entryName, path);
            if (calculation->spectra) {
                registerSection(&(*calculation->spectra), archive.entryName, path + "/spectra/0");
            }
        }
    }
    registerSection(archive.workflow.get(), archive.entryName, "/workflow2");
}

std::string ReferenceIndex::resolve(const void* section, const Archive& from) const {
    const auto it = locations_.find(section);
    if (it == locations_.end()) {
        throw std::runtime_error("Reference to a section outside the indexed archives in " +
                                 from.entryName);
    }
    if (it->second.entryName == from.entryName) {
        return "#" + it->second.path;
    }
    return it->second.entryName + "#" + it->second.path;
}

ReferenceIndex makeReferenceIndex(const ParseResult& result) {
    ReferenceIndex index;
    for (const auto& child : result.children) {
        index.add(child);
    }
    index.add(result.workflow);
    return index;
}

nlohmann::json archiveToJson(const Archive& archive, const ReferenceIndex& index) {
    nlohmann::json runs = nlohmann::json::array();
    for (const auto& run : archive.run) {
        nlohmann::json jsonRun = nlohmann::json::object();
        if (run.program) {
            jsonRun["program"] = programToJson(*run.program);
        }
        nlohmann::json systems = nlohmann::json::array();
        for (const auto& system : run.system) {
            systems.push_back(systemToJson(*system));
        }
        jsonRun["system"] = std::move(systems);
        nlohmann::json methods = nlohmann::json::array();
        for (const auto& method : run.method) {
            methods.push_back(methodToJson(*method, archive, index));
        }
        jsonRun["method"] = std::move(methods);
        nlohmann::json calculations = nlohmann::json::array();
        for (const auto& calculation : run.calculation) {
            calculations.push_back(calculationToJson(*calculation, archive, index));
        }
        jsonRun["calculation"] = std::move(calculations);
        runs.push_back(std::move(jsonRun));
    }

    nlohmann::json out = {{"entry_name", archive.entryName}, {"run", std::move(runs)}};
    if (archive.workflow) {
        out["workflow2"] = workflowToJson(*archive.workflow, archive, index);
    }
    return out;
}

std::vector<std::filesystem::path> writeArchives(const ParseResult& result,
                                                 const std::filesystem::path& directory) {
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        throw std::runtime_error("Failed to create output directory " + directory.string() + ": " +
                                 ec.message());
    }

    const ReferenceIndex index = makeReferenceIndex(result);
    std::vector<std::filesystem::path> written;
    const auto writeOne = [&](const Archive& archive) {
        const std::filesystem::path path = directory / (archive.entryName + ".archive.json");
        std::ofstream ofs(path);
        if (!ofs.is_open()) {
            throw std::runtime_error("Failed to open archive output: " + path.string());
        }
        ofs << archiveToJson(archive, index).dump(2) << '\n';
        written.push_back(path);
    };

    for (const auto& child : result.children) {
        writeOne(child);
    }
    writeOne(result.workflow);
    return written;
}

}  // namespace oceanparse
