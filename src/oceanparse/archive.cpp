// filename: archive.cpp
// part of OCEAN Spectroscopy Output Parser
// MIT License

#include "oceanparse/archive.hpp"

#include <stdexcept>
#include <utility>

namespace oceanparse {

Program& Run::createProgram() {
    program = std::make_shared<Program>();
    return *program;
}

System& Run::createSystem() {
    system.push_back(std::make_shared<System>());
    return *system.back();
}

Method& Run::createMethod() {
    method.push_back(std::make_shared<Method>());
    return *method.back();
}

Method& Run::appendMethod(Method section) {
    method.push_back(std::make_shared<Method>(std::move(section)));
    return *method.back();
}

Calculation& Run::createCalculation() {
    calculation.push_back(std::make_shared<Calculation>());
    return *calculation.back();
}

void Run::referenceProgram(std::shared_ptr<Program> section) {
    if (!section) {
        throw std::invalid_argument("Run::referenceProgram: null section");
    }
    program = std::move(section);
}

void Run::referenceSystem(std::shared_ptr<System> section) {
    if (!section) {
        throw std::invalid_argument("Run::referenceSystem: null section");
    }
    system.push_back(std::move(section));
}

std::string workflowKindName(Workflow::Kind kind) {
    switch (kind) {
        case Workflow::Kind::PhotonPolarization:
            return "PhotonPolarization";
        case Workflow::Kind::SinglePoint:
        default:
            return "SinglePoint";
    }
}

Run& Archive::createRun() {
    run.emplace_back();
    return run.back();
}

Workflow& Archive::createWorkflow(Workflow::Kind kind) {
    workflow = std::make_shared<Workflow>();
    workflow->kind = kind;
    return *workflow;
}

}  // namespace oceanparse
