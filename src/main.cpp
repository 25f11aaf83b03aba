// filename: main.cpp
// part of OCEAN Spectroscopy Output Parser
// MIT License

#include "oceanparse/archive_json.hpp"
#include "oceanparse/io_csv.hpp"
#include "oceanparse/logging.hpp"
#include "oceanparse/parser.hpp"
#include "oceanparse/units.hpp"

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>

namespace {

void printUsage() {
    std::cout << "Usage: ocean_parser [--mainfile] PATH [--output DIR] [--spectra-csv DIR]"
                 " [--list-keys] [--summary] [--quiet]\n";
}

bool ensureDirectory(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec) {
        std::cerr << "Failed to create directory '" << path.string() << "': " << ec.message() << "\n";
        return false;
    }
    return true;
}

void printSummary(const oceanparse::ParseResult& result) {
    using namespace oceanparse;

    const Workflow* workflow = result.workflow.workflow.get();
    const std::size_t nPolarizations =
        (workflow != nullptr && workflow->results) ? workflow->results->nPolarizations : 0;
    std::cout << "Mainfile: " << result.configuration.mainfile.string() << "\n";
    std::cout << "Polarization archives: " << result.children.size()
              << " (workflow tasks: " << nPolarizations << ")\n";

    if (!result.workflow.run.empty()) {
        const Run& run = result.workflow.run.back();
        if (!run.method.empty() && run.method.back()->bse && run.method.back()->bse->coreHole) {
            const CoreHole& coreHole = *run.method.back()->bse->coreHole;
            std::cout << "Core hole: edge=" << coreHole.edge << " mode=" << coreHole.mode
                      << " solver=" << coreHole.solver << "\n";
        }
    }

    for (const auto& child : result.children) {
        std::cout << "  " << child.entryName << ":";
        if (child.run.empty() || child.run.back().calculation.empty()) {
            std::cout << " no calculation\n";
            continue;
        }
        const Calculation& calculation = *child.run.back().calculation.back();
        if (calculation.spectra) {
            const Spectra& spectra = *calculation.spectra;
            std::cout << " " << spectra.type << " n_energies=" << spectra.nEnergies;
            if (!spectra.excitationEnergies.empty()) {
                std::cout << " range=[" << convert(spectra.excitationEnergies.front(), "J", "eV")
                          << ", " << convert(spectra.excitationEnergies.back(), "J", "eV")
                          << "] eV";
            }
        }
        const Run& run = child.run.back();
        const bool hasPhoton = !run.method.empty() && run.method.front()->photon.has_value();
        std::cout << " photon=" << (hasPhoton ? "yes" : "no")
                  << " lanczos=" << (calculation.lanczos ? "yes" : "no") << "\n";
    }
}

}  // namespace

int main(int argc, char** argv) {
    using namespace oceanparse;

    std::optional<std::string> mainfile;
    std::optional<std::string> outputDir;
    std::optional<std::string> spectraCsvDir;
    bool listKeys = false;
    bool summary = false;
    bool quiet = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--mainfile") {
            if (i + 1 >= argc) {
                std::cerr << "--mainfile requires a path argument\n";
                printUsage();
                return 1;
            }
            mainfile = std::string(argv[++i]);
        } else if (arg == "--output") {
            if (i + 1 >= argc) {
                std::cerr << "--output requires a directory argument\n";
                printUsage();
                return 1;
            }
            outputDir = std::string(argv[++i]);
        } else if (arg == "--spectra-csv") {
            if (i + 1 >= argc) {
                std::cerr << "--spectra-csv requires a directory argument\n";
                printUsage();
                return 1;
            }
            spectraCsvDir = std::string(argv[++i]);
        } else if (arg == "--list-keys") {
            listKeys = true;
        } else if (arg == "--summary") {
            summary = true;
        } else if (arg == "--quiet") {
            quiet = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        } else if (!arg.empty() && arg[0] != '-' && !mainfile) {
            mainfile = arg;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            printUsage();
            return 1;
        }
    }

    if (!mainfile) {
        std::cerr << "A mainfile path is required\n";
        printUsage();
        return 1;
    }

    StreamLogger logger(std::cout, std::cerr, quiet);
    const OceanParser parser(logger);

    if (listKeys) {
        for (const auto& key : parser.mainfileKeys(*mainfile)) {
            std::cout << key << "\n";
        }
        return 0;
    }

    std::optional<ParseResult> result = parser.parse(*mainfile);
    if (!result) {
        return 1;
    }

    if (outputDir) {
        try {
            for (const auto& path : writeArchives(*result, *outputDir)) {
                logger.info("Wrote " + path.string());
            }
        } catch (const std::exception& ex) {
            std::cerr << "Failed to write archives: " << ex.what() << "\n";
            return 1;
        }
    }

    if (spectraCsvDir) {
        if (!ensureDirectory(*spectraCsvDir)) {
            return 1;
        }
        const std::filesystem::path base(*spectraCsvDir);
        try {
            for (const auto& child : result->children) {
                if (child.run.empty() || child.run.back().calculation.empty()) {
                    continue;
                }
                const Calculation& calculation = *child.run.back().calculation.back();
                if (calculation.spectra) {
                    const auto path = base / (child.entryName + ".csv");
                    write_csv_spectrum(path.string(), *calculation.spectra);
                    logger.info("Wrote " + path.string());
                }
                if (calculation.lanczos) {
                    const auto path = base / (child.entryName + "_tridiagonal.csv");
                    write_csv_tridiagonal(path.string(), *calculation.lanczos);
                    logger.info("Wrote " + path.string());
                }
            }
        } catch (const std::exception& ex) {
            std::cerr << "Failed to write spectra CSV: " << ex.what() << "\n";
            return 1;
        }
    }

    if (summary || (!outputDir && !spectraCsvDir)) {
        printSummary(*result);
    }
    return 0;
}
