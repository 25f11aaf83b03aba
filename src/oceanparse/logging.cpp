// filename: logging.cpp
// part of OCEAN Spectroscopy Output Parser
// MIT License

#include "oceanparse/logging.hpp"

#include <iostream>

namespace oceanparse {

StreamLogger::StreamLogger() : out_(&std::cout), err_(&std::cerr) {}

StreamLogger::StreamLogger(std::ostream& out, std::ostream& err, bool quiet)
    : out_(&out), err_(&err), quiet_(quiet) {}

void StreamLogger::error(const std::string& message) {
    *err_ << "Error: " << message << "\n";
}

void StreamLogger::warning(const std::string& message) {
    *err_ << "Warning: " << message << "\n";
}

void StreamLogger::info(const std::string& message) {
    if (quiet_) {
        return;
    }
    *out_ << message << "\n";
}

Logger& defaultLogger() {
    static StreamLogger logger;
    return logger;
}

}  // namespace oceanparse
