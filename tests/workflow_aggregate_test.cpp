// filename: workflow_aggregate_test.cpp
// part of OCEAN Spectroscopy Output Parser
// MIT License

#include "oceanparse/child_builder.hpp"
#include "oceanparse/configuration.hpp"
#include "oceanparse/workflow.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <variant>
#include <vector>

namespace {

struct RecordingLogger : oceanparse::Logger {
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void error(const std::string& message) override { errors.push_back(message); }
    void warning(const std::string& message) override { warnings.push_back(message); }
};

template <typename T>
const T* linkTarget(const oceanparse::Link& link) {
    const auto* target = std::get_if<const T*>(&link.section);
    return target != nullptr ? *target : nullptr;
}

}  // namespace

int main() {
    using namespace oceanparse;
    namespace fs = std::filesystem;

    const fs::path runDir =
        (fs::path(__FILE__).parent_path() / "../inputs/tests/ocean_ti_k_edge").lexically_normal();

    Configuration configuration;
    try {
        configuration = loadConfiguration((runDir / "postDefaultsOceanDatafile").string());
    } catch (const std::exception& ex) {
        std::cerr << "Failed to load OCEAN configuration: " << ex.what() << "\n";
        return 1;
    }

    RecordingLogger logger;
    std::vector<Archive> children;
    for (const auto& key : discoverPolarizationKeys(runDir)) {
        auto child = buildChild(key, configuration, runDir, logger);
        if (child) {
            children.push_back(std::move(*child));
        }
    }
    if (children.size() != 3) {
        std::cerr << "Expected three polarization archives, got " << children.size() << "\n";
        return 1;
    }

    const Archive archive = aggregate(children, configuration, logger);
    if (!archive.workflow || archive.workflow->kind != Workflow::Kind::PhotonPolarization) {
        std::cerr << "Aggregation must produce a PhotonPolarization workflow\n";
        return 1;
    }
    const Workflow& workflow = *archive.workflow;
    const Run& run = archive.run.front();

    if (run.program != children.front().run.front().program ||
        run.system.front() != children.front().run.front().system.front()) {
        std::cerr << "Program and system must be shared with the first polarization archive\n";
        return 1;
    }
    if (run.method.size() != 1 || run.method.front() == children.front().run.front().method.back() ||
        workflow.method != run.method.front().get()) {
        std::cerr << "The workflow method must be mapped again, not taken from a child\n";
        return 1;
    }
    if (workflow.inputs.size() != 2 || workflow.inputs[0].name != "Input structure" ||
        workflow.inputs[1].name != "Input BSE methodology" ||
        linkTarget<Method>(workflow.inputs[1]) != workflow.method) {
        std::cerr << "Workflow inputs must be the shared structure and BSE method\n";
        return 1;
    }

    if (workflow.tasks.size() != children.size() || !workflow.results ||
        workflow.results->nPolarizations != children.size() ||
        workflow.results->spectrumPolarization.size() != children.size() ||
        workflow.outputs.size() != children.size()) {
        std::cerr << "Expected one task, output and spectrum per polarization\n";
        return 1;
    }
    for (std::size_t i = 0; i < children.size(); ++i) {
        const Run& childRun = children[i].run.front();
        const TaskReference& task = workflow.tasks[i];
        const std::string outputName = "Output polarization " + std::to_string(i + 1);
        if (task.name != children[i].entryName || task.task != children[i].workflow.get()) {
            std::cerr << "Task " << i << " does not follow discovery order\n";
            return 1;
        }
        if (task.inputs.size() != 2 || linkTarget<System>(task.inputs[0]) != childRun.system.front().get() ||
            linkTarget<Method>(task.inputs[1]) != childRun.method.front().get()) {
            std::cerr << "Task " << i << " inputs must be the child structure and photon method\n";
            return 1;
        }
        if (task.outputs.size() != 1 || task.outputs[0].name != outputName ||
            linkTarget<Calculation>(task.outputs[0]) != childRun.calculation.front().get() ||
            linkTarget<Calculation>(workflow.outputs[i]) != childRun.calculation.front().get()) {
            std::cerr << "Task " << i << " output must be " << outputName << "\n";
            return 1;
        }
        if (workflow.results->spectrumPolarization[i] != &childRun.calculation.front()->spectra.value()) {
            std::cerr << "spectrum_polarization must reference the child spectrum " << i << "\n";
            return 1;
        }
    }
    if (!logger.warnings.empty() || !logger.errors.empty()) {
        std::cerr << "Aggregating complete archives should not log anything\n";
        return 1;
    }

    RecordingLogger emptyLogger;
    const Archive empty = aggregate({}, configuration, emptyLogger);
    const Run& emptyRun = empty.run.front();
    if (!emptyRun.program || !emptyRun.program->name.empty() || emptyRun.system.size() != 1 ||
        emptyRun.system.front()->atoms.has_value()) {
        std::cerr << "Zero children must give placeholder program and system\n";
        return 1;
    }
    if (!empty.workflow || !empty.workflow->tasks.empty() || empty.workflow->results->nPolarizations != 0 ||
        emptyRun.method.size() != 1 || emptyLogger.warnings.size() != 1) {
        std::cerr << "Zero children must still map the method, warn once and have no tasks\n";
        return 1;
    }

    Configuration noStructure = configuration;
    noStructure.data.erase("structure");
    RecordingLogger partialLogger;
    std::vector<Archive> mixed;
    mixed.push_back(*buildChild("absspct_Ti.0001_1s_01", noStructure, runDir, partialLogger));
    mixed.push_back(*buildChild("absspct_Ti.0001_1s_02", configuration, runDir, partialLogger));
    const Archive skipped = aggregate(mixed, configuration, partialLogger);
    if (skipped.workflow->tasks.size() != 1 ||
        skipped.run.front().program != mixed[1].run.front().program ||
        skipped.workflow->tasks.front().outputs.front().name != "Output polarization 1") {
        std::cerr << "Incomplete archives must be skipped and program taken from the first complete one\n";
        return 1;
    }

    Configuration badSolver = configuration;
    badSolver.data["bse"]["core"]["solver"] = "cg";
    RecordingLogger solverLogger;
    const Archive noMethod = aggregate(children, badSolver, solverLogger);
    if (!noMethod.run.front().method.empty() || noMethod.workflow->method != nullptr ||
        noMethod.workflow->tasks.size() != children.size() || solverLogger.errors.size() != 1) {
        std::cerr << "A workflow mapping error must be logged without dropping tasks\n";
        return 1;
    }

    std::cout << "Workflow aggregation verified successfully\n";
    return 0;
}
