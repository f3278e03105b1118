#include "JsonReport.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {
json statsToJson(const ArchiveStats& stats) {
    return json{
        {"totalFiles", stats.totalFiles},
        {"totalDirectories", stats.totalDirectories},
        {"totalSize", stats.totalSize},
        {"maxDepth", stats.maxDepth},
        {"largestFile", {{"path", stats.largestFile.path}, {"size", stats.largestFile.size}}},
    };
}

json warningsToJson(const AnalysisWarnings& warnings) {
    json conflicts = json::array();
    for (const auto& conflict : warnings.renameConflicts) {
        conflicts.push_back({{"directory", conflict.directory},
                             {"conflictingFiles", conflict.conflictingFiles},
                             {"resultName", conflict.resultName},
                             {"count", conflict.count},
                             {"type", conflict.type}});
    }

    json pathTooLong = json::array();
    for (const auto& warning : warnings.pathTooLong) {
        pathTooLong.push_back(
            {{"path", warning.path}, {"length", warning.length}, {"os", warning.os}, {"limit", warning.limit}});
    }

    json duplicates = json::array();
    for (const auto& warning : warnings.duplicateNames) {
        duplicates.push_back({{"directory", warning.directory},
                              {"filename", warning.filename},
                              {"count", warning.count},
                              {"paths", warning.paths}});
    }

    json invalidChars = json::array();
    for (const auto& warning : warnings.invalidChars) {
        invalidChars.push_back({{"path", warning.path}, {"invalidChars", warning.invalidChars}, {"os", warning.os}});
    }

    json unicodeIssues = json::array();
    for (const auto& warning : warnings.unicodeIssues) {
        unicodeIssues.push_back({{"path", warning.path}, {"issue", warning.issue}, {"details", warning.details}});
    }

    json systemFiles = json::array();
    for (const auto& warning : warnings.systemFiles) {
        systemFiles.push_back({{"path", warning.path}, {"type", warning.type}});
    }

    return json{
        {"renameConflicts", conflicts},
        {"pathTooLong", pathTooLong},
        {"duplicateNames", duplicates},
        {"invalidChars", invalidChars},
        {"unicodeIssues", unicodeIssues},
        {"systemFiles", systemFiles},
    };
}
} // namespace

json toJson(const AnalysisReport& report) {
    return json{
        {"stats", statsToJson(report.stats)},
        {"warnings", warningsToJson(report.warnings)},
        {"severity", severityName(report.severity)},
        {"timestamp", report.timestamp},
    };
}

json toJson(const std::vector<RenameResult>& results) {
    json items = json::array();
    for (const auto& result : results) {
        items.push_back({{"originalPath", result.originalPath}, {"finalPath", result.finalPath}});
    }
    return items;
}
