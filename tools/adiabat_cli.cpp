/// @file adiabat_cli.cpp
/// @brief Command-line driver for adiabatic equilibrium calculations
/// @details Reads a propellant and a combustion-product list, solves for the
/// adiabatic temperature and composition, prints a summary and optionally
/// writes the result document.
///
/// Usage: adiabat --propellant P.json --combustion-products C.json --pressure Pa
///                [--output-json out.json] [--root-finder brent|bisection] [--verbose]

#include "adiabat/Adiabat.hpp"
#include "adiabat/io/JsonReader.hpp"
#include "adiabat/io/JsonWriter.hpp"
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

using namespace Adiabat;

namespace {

struct CommandLine {
    std::string cPropellantFile;
    std::string cProductsFile;
    std::string cOutputFile;
    std::string cPressure;
    RootFinderType iRootFinder = RootFinderType::Brent;
    bool lVerbose = false;
};

void printUsage(const char* program) {
    std::cerr << "Usage: " << program
              << " --propellant <file.json> --combustion-products <file.json>"
              << " --pressure <Pa> [--output-json <file.json>]"
              << " [--root-finder brent|bisection] [--verbose]" << std::endl;
}

bool parseCommandLine(int argc, char* argv[], CommandLine& cmd) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&](std::string& value) {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a value" << std::endl;
                return false;
            }
            value = argv[++i];
            return true;
        };

        if (arg == "--propellant") {
            if (!next(cmd.cPropellantFile)) return false;
        } else if (arg == "--combustion-products") {
            if (!next(cmd.cProductsFile)) return false;
        } else if (arg == "--pressure") {
            if (!next(cmd.cPressure)) return false;
        } else if (arg == "--output-json") {
            if (!next(cmd.cOutputFile)) return false;
        } else if (arg == "--root-finder") {
            std::string method;
            if (!next(method)) return false;
            if (method == "brent") {
                cmd.iRootFinder = RootFinderType::Brent;
            } else if (method == "bisection") {
                cmd.iRootFinder = RootFinderType::Bisection;
            } else {
                std::cerr << "Error: unknown root finder '" << method << "'" << std::endl;
                return false;
            }
        } else if (arg == "--verbose") {
            cmd.lVerbose = true;
        } else if (arg == "--help" || arg == "-h") {
            return false;
        } else {
            std::cerr << "Error: unknown argument '" << arg << "'" << std::endl;
            return false;
        }
    }

    if (cmd.cPropellantFile.empty() || cmd.cProductsFile.empty() || cmd.cPressure.empty()) {
        std::cerr << "Error: --propellant, --combustion-products and --pressure are required"
                  << std::endl;
        return false;
    }
    return true;
}

bool parsePressure(const std::string& text, double& dPressure) {
    errno = 0;
    char* end = nullptr;
    dPressure = std::strtod(text.c_str(), &end);
    return end != text.c_str() && *end == '\0' && errno != ERANGE;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CommandLine cmd;
    if (!parseCommandLine(argc, argv, cmd)) {
        printUsage(argv[0]);
        return 1;
    }

    double dPressure = 0.0;
    if (!parsePressure(cmd.cPressure, dPressure) || dPressure <= 0.0) {
        std::cerr << "Error: pressure must be a positive number of pascals, got '"
                  << cmd.cPressure << "'" << std::endl;
        return 1;
    }

    std::cout << "Loading data..." << std::endl;

    std::string cError;
    std::vector<CandidateSpecies> candidates;
    int info = JsonReader::readCandidateSpecies(cmd.cProductsFile, candidates, cError);
    if (info != ErrorCode::kSuccess) {
        std::cerr << "Error (code " << info << ", " << ErrorCode::getMessage(info) << "): "
                  << cError << std::endl;
        return 1;
    }

    Propellant propellant;
    info = JsonReader::readPropellant(cmd.cPropellantFile, propellant, cError);
    if (info != ErrorCode::kSuccess) {
        std::cerr << "Error (code " << info << ", " << ErrorCode::getMessage(info) << "): "
                  << cError << std::endl;
        return 1;
    }

    std::cout << "Loaded " << candidates.size() << " combustion products" << std::endl;

    AdiabatContext ctx;
    setPressure(ctx, dPressure);
    setPropellant(ctx, propellant);
    setCandidateSpecies(ctx, candidates);
    setRootFinder(ctx, cmd.iRootFinder);
    setPrintResultsMode(ctx, cmd.lVerbose ? 2 : 1);
    setDebugMode(ctx, cmd.lVerbose);

    std::cout << "Solving for the adiabatic temperature..." << std::endl;
    adiabat(ctx);

    if (!ctx.isSuccess()) {
        std::cerr << "Error (code " << getInfoCode(ctx) << "): " << getErrorMessage(ctx) << std::endl;
        return 1;
    }

    if (cmd.cOutputFile.empty()) {
        std::cout << "Output JSON file path not provided. Skipping JSON generation." << std::endl;
        return 0;
    }

    // Ensure the output directory exists
    std::error_code ec;
    const std::filesystem::path outputPath = std::filesystem::absolute(cmd.cOutputFile, ec);
    if (ec) {
        std::cerr << "Error: invalid output path '" << cmd.cOutputFile << "': " << ec.message() << std::endl;
        return 1;
    }
    if (outputPath.has_parent_path()) {
        std::filesystem::create_directories(outputPath.parent_path(), ec);
        if (ec) {
            std::cerr << "Error: could not create " << outputPath.parent_path()
                      << ": " << ec.message() << std::endl;
            return 1;
        }
    }

    info = JsonWriter::writeResults(outputPath.string(), ctx);
    if (info != ErrorCode::kSuccess) {
        std::cerr << "Error (code " << info << "): " << ErrorCode::getMessage(info)
                  << " for " << outputPath << std::endl;
        return 1;
    }

    std::cout << "Results written to " << outputPath.string() << std::endl;
    return 0;
}
