#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "ArchiveAnalyzer.hpp"
#include "JsonReport.hpp"
#include "RenameEngine.hpp"
#include "RequestParser.hpp"

namespace {
void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " <analyze|rename> <request.json> [--date YYYY-MM-DD] [--rename-top-level]"
              << std::endl;
}

// Non-UTF-8 names must still reach the caller, so invalid bytes are replaced instead of thrown on.
void printJson(const nlohmann::json& result) {
    std::cout << result.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}
} // namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        printUsage(argv[0]);
        return EXIT_FAILURE;
    }

    const std::string command = argv[1];
    const std::string requestPath = argv[2];
    if (command != "analyze" && command != "rename") {
        std::cerr << "Unknown command `" << command << "`." << std::endl;
        printUsage(argv[0]);
        return EXIT_FAILURE;
    }

    RenameOptions renameOptions;
    for (int i = 3; i < argc; ++i) {
        const std::string option = argv[i];
        if (option == "--date" && i + 1 < argc) {
            renameOptions.date = argv[++i];
        } else if (option == "--rename-top-level") {
            renameOptions.renameTopLevelDirectories = true;
        } else {
            std::cerr << "Unknown option `" << option << "`." << std::endl;
            printUsage(argv[0]);
            return EXIT_FAILURE;
        }
    }

    // Settings ship in a config folder beside the working directory.
    Settings settings;
    if (!loadSettings(std::filesystem::current_path(), settings)) {
        std::cerr << "Failed to load settings. Exiting." << std::endl;
        return EXIT_FAILURE;
    }

    RequestParser parser;
    if (!parser.load(requestPath)) {
        std::cerr << "Failed to load request. Exiting." << std::endl;
        return EXIT_FAILURE;
    }

    const std::vector<ArchiveEntry>& entries = parser.getEntries();
    if (entries.size() > settings.maxEntries) {
        std::cerr << "Request lists " << entries.size() << " entries; the limit is " << settings.maxEntries << "."
                  << std::endl;
        return EXIT_FAILURE;
    }

    if (command == "analyze") {
        ArchiveAnalyzer analyzer;
        const AnalysisReport report = analyzer.analyze(entries);
        std::clog << "Analysis finished with severity `" << severityName(report.severity) << "`." << std::endl;
        printJson(toJson(report));
        return EXIT_SUCCESS;
    }

    if (parser.getRuleGroups().empty()) {
        std::clog << "No rule groups supplied; paths are only normalized." << std::endl;
    }

    RenameEngine engine(parser.getRuleGroups());
    const std::vector<RenameResult> results = engine.rename(entries, renameOptions);
    std::clog << "Renamed " << results.size() << " entr" << (results.size() == 1 ? "y" : "ies") << "." << std::endl;
    printJson(toJson(results));
    return EXIT_SUCCESS;
}
