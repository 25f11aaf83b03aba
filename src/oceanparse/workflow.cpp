// filename: workflow.cpp
// part of OCEAN Spectroscopy Output Parser
// MIT License

#include "oceanparse/workflow.hpp"

#include "oceanparse/errors.hpp"
#include "oceanparse/method_mapper.hpp"

#include <utility>

namespace oceanparse {

bool isCompleteChild(const Archive& child) {
    if (!child.workflow || child.run.empty()) {
        return false;
    }
    const Run& run = child.run.back();
    return run.program && !run.system.empty() && run.method.size() >= 2 &&
           !run.calculation.empty() && run.calculation.back()->spectra.has_value();
}

Archive aggregate(const std::vector<Archive>& children, const Configuration& configuration,
                  Logger& logger, const std::string& entryName) {
    std::vector<const Archive*> complete;
    complete.reserve(children.size());
    for (const auto& child : children) {
        if (isCompleteChild(child)) {
            complete.push_back(&child);
        } else {
            logger.warning("Polarization " + child.entryName +
                           " is incomplete and is left out of the workflow");
        }
    }

    Archive archive{};
    archive.entryName = entryName;
    Run& run = archive.createRun();

    if (complete.empty()) {
        logger.warning("Cannot resolve program and system from the first photon archive. "
                       "Generating empty sections.");
        run.createProgram();
        run.createSystem();
    } else {
        const Run& first = complete.front()->run.back();
        run.referenceProgram(first.program);
        run.referenceSystem(first.system.back());
    }

    try {
        run.appendMethod(mapMethod(configuration));
    } catch (const MappingError& ex) {
        logger.error(std::string("Cannot map the BSE method for the workflow: ") + ex.what());
    }

    Workflow& workflow = archive.createWorkflow(Workflow::Kind::PhotonPolarization);
    PhotonPolarizationResults& results = workflow.results.emplace();
    results.nPolarizations = complete.size();

    const System* inputStructure = run.system.back().get();
    const Method* inputMethod = run.method.empty() ? nullptr : run.method.back().get();
    workflow.method = inputMethod;
    workflow.inputs.push_back(Link{"Input structure", inputStructure});
    if (inputMethod != nullptr) {
        workflow.inputs.push_back(Link{"Input BSE methodology", inputMethod});
    }

    for (std::size_t i = 0; i < complete.size(); ++i) {
        const Archive& child = *complete[i];
        const Run& childRun = child.run.back();
        const Calculation* calculation = childRun.calculation.back().get();
        const std::string outputName = "Output polarization " + std::to_string(i + 1);

        TaskReference task{};
        task.name = child.entryName;
        task.task = child.workflow.get();
        task.inputs.push_back(Link{"Input structure", childRun.system.back().get()});
        task.inputs.push_back(Link{"Input photon parameters", childRun.method.front().get()});
        task.outputs.push_back(Link{outputName, calculation});
        workflow.tasks.push_back(std::move(task));

        workflow.outputs.push_back(Link{outputName, calculation});
        results.spectrumPolarization.push_back(&calculation->spectra.value());
    }

    return archive;
}

}  // namespace oceanparse
