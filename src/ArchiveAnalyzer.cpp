#include "ArchiveAnalyzer.hpp"

#include <algorithm>
#include <array>
#include <cstdio>
#include <exception>
#include <map>
#include <set>
#include <utility>

#include "Clock.hpp"
#include "PathUtils.hpp"
#include "Utf8.hpp"

namespace {
struct OsPathLimit {
    const char* os;
    std::size_t limit;
};

constexpr std::array<OsPathLimit, 3> kPathLimits{{
    {"windows", 260},
    {"linux", 4096},
    {"macos", 1024},
}};

struct OsCharSet {
    const char* os;
    bool (*forbidden)(unsigned char);
};

constexpr std::array<OsCharSet, 3> kInvalidCharSets{{
    {"windows", [](unsigned char ch) {
         return ch < 0x20 || ch == '<' || ch == '>' || ch == ':' || ch == '"' || ch == '|' || ch == '?' || ch == '*';
     }},
    {"macos", [](unsigned char ch) { return ch == ':' || ch == '/' || ch == '\0'; }},
    {"linux", [](unsigned char ch) { return ch == '\0'; }},
}};

const std::set<std::string> kReservedWindowsNames = {
    "CON", "PRN", "AUX", "NUL",
    "COM1", "COM2", "COM3", "COM4", "COM5", "COM6", "COM7", "COM8", "COM9",
    "LPT1", "LPT2", "LPT3", "LPT4", "LPT5", "LPT6", "LPT7", "LPT8", "LPT9",
};

constexpr const char* kReservedNameMarker = "RESERVED_NAME";

// Entries sharing a directory and a case-folded base name, in first-seen order.
struct NameGroup {
    std::string directory;
    std::string foldedName;
    std::vector<std::string> paths;
    std::vector<std::string> baseNames;
};

std::string directoryOf(const PathParts& parts) {
    std::string directory = parts.parentPath;
    while (!directory.empty() && directory.back() == '/') {
        directory.pop_back();
    }
    return directory.empty() ? std::string(".") : directory;
}

std::vector<NameGroup> groupByFoldedName(const std::vector<ArchiveEntry>& entries) {
    std::vector<NameGroup> groups;
    std::map<std::pair<std::string, std::string>, std::size_t> index;

    for (const auto& entry : entries) {
        if (entry.isDirectory || entry.path.empty()) {
            continue;
        }

        const PathParts parts = decomposePath(entry.path, false);
        auto key = std::make_pair(directoryOf(parts), toLowerUtf8(parts.baseName));
        auto it = index.find(key);
        if (it == index.end()) {
            it = index.emplace(key, groups.size()).first;
            groups.push_back(NameGroup{key.first, key.second, {}, {}});
        }

        NameGroup& group = groups[it->second];
        group.paths.push_back(entry.path);
        group.baseNames.push_back(parts.baseName);
    }
    return groups;
}

bool hasDistinctSpellings(const NameGroup& group) {
    return std::set<std::string>(group.baseNames.begin(), group.baseNames.end()).size() > 1;
}

std::string printableChar(unsigned char ch) {
    if (ch < 0x20) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\x%02x", static_cast<unsigned>(ch));
        return buffer;
    }
    return std::string(1, static_cast<char>(ch));
}

bool containsSegment(const std::string& path, const std::string& segment) {
    // Rooting the path lets a top-level directory match as well.
    return ("/" + path).find("/" + segment + "/") != std::string::npos;
}
} // namespace

AnalysisReport ArchiveAnalyzer::analyze(const std::vector<ArchiveEntry>& entries, const AnalyzerOptions& options) const {
    std::vector<ArchiveEntry> valid;
    valid.reserve(entries.size());
    for (const auto& entry : entries) {
        if (!entry.path.empty()) {
            valid.push_back(entry);
        }
    }

    AnalysisReport report;
    report.stats = computeStats(valid);
    report.warnings.pathTooLong = checkPathLengths(valid);
    report.warnings.invalidChars = checkInvalidChars(valid);
    report.warnings.unicodeIssues = checkUnicode(valid);
    report.warnings.duplicateNames = detectDuplicates(valid);
    report.warnings.systemFiles = detectSystemFiles(valid);
    report.warnings.renameConflicts = simulateConflicts(valid);
    report.severity = classifySeverity(report.warnings);
    report.timestamp = formatIsoTimestamp(options.now.value_or(std::chrono::system_clock::now()));
    return report;
}

ArchiveStats ArchiveAnalyzer::computeStats(const std::vector<ArchiveEntry>& entries) const {
    ArchiveStats stats;
    bool sawFile = false;

    for (const auto& entry : entries) {
        if (entry.isDirectory) {
            ++stats.totalDirectories;
        } else {
            ++stats.totalFiles;
            stats.totalSize += entry.size;
            // Strictly larger, so the first file seen keeps ties.
            if (!sawFile || entry.size > stats.largestFile.size) {
                stats.largestFile = LargestFile{entry.path, entry.size};
                sawFile = true;
            }
        }

        const std::string normalized = normalizeSeparators(entry.path);
        const std::size_t depth = static_cast<std::size_t>(std::count(normalized.begin(), normalized.end(), '/'));
        if (depth > stats.maxDepth) {
            stats.maxDepth = depth;
        }
    }
    return stats;
}

std::vector<PathLengthWarning> ArchiveAnalyzer::checkPathLengths(const std::vector<ArchiveEntry>& entries) const {
    std::vector<PathLengthWarning> warnings;
    for (const auto& entry : entries) {
        if (entry.isDirectory) {
            continue;
        }

        // std::string holds the UTF-8 bytes, so size() is the encoded length.
        const std::size_t length = entry.path.size();
        for (const auto& limit : kPathLimits) {
            if (length > limit.limit) {
                warnings.push_back(PathLengthWarning{entry.path, length, limit.os, limit.limit});
            }
        }
    }
    return warnings;
}

std::vector<InvalidCharWarning> ArchiveAnalyzer::checkInvalidChars(const std::vector<ArchiveEntry>& entries) const {
    std::vector<InvalidCharWarning> warnings;
    for (const auto& entry : entries) {
        if (!entry.isDirectory) {
            checkInvalidCharsFor(entry.path, warnings);
        }
    }
    return warnings;
}

void ArchiveAnalyzer::checkInvalidCharsFor(const std::string& path, std::vector<InvalidCharWarning>& warnings) const {
    const std::string normalized = normalizeSeparators(path);

    for (const auto& charSet : kInvalidCharSets) {
        std::vector<std::string> found;
        std::set<unsigned char> seen;
        for (unsigned char ch : normalized) {
            // Separators are not part of any name.
            if (ch == '/') {
                continue;
            }
            if (charSet.forbidden(ch) && seen.insert(ch).second) {
                found.push_back(printableChar(ch));
            }
        }

        if (!found.empty()) {
            warnings.push_back(InvalidCharWarning{path, std::move(found), charSet.os});
        }
    }

    const PathParts parts = decomposePath(normalized, false);
    if (kReservedWindowsNames.count(toUpperUtf8(parts.stem)) != 0) {
        warnings.push_back(InvalidCharWarning{path, {kReservedNameMarker}, "windows"});
    }
}

std::vector<UnicodeWarning> ArchiveAnalyzer::checkUnicode(const std::vector<ArchiveEntry>& entries) const {
    std::vector<UnicodeWarning> warnings;
    for (const auto& entry : entries) {
        if (entry.isDirectory) {
            continue;
        }

        try {
            checkUnicodeFor(entry.path, warnings);
        } catch (const std::exception& e) {
            warnings.push_back(UnicodeWarning{entry.path, "invalid_sequence", e.what()});
        }
    }
    return warnings;
}

void ArchiveAnalyzer::checkUnicodeFor(const std::string& path, std::vector<UnicodeWarning>& warnings) const {
    std::string nfc;
    std::string nfd;
    if (!toNfc(path, nfc) || !toNfd(path, nfd)) {
        warnings.push_back(UnicodeWarning{path, "invalid_sequence", "Invalid UTF-8 encoding detected"});
        return;
    }

    if (nfc != nfd && path != nfc) {
        warnings.push_back(UnicodeWarning{path, "nfc_nfd_mismatch",
                                          "Filename uses NFD normalization, may cause issues on Windows/Linux"});
    }
}

std::vector<DuplicateWarning> ArchiveAnalyzer::detectDuplicates(const std::vector<ArchiveEntry>& entries) const {
    std::vector<DuplicateWarning> duplicates;
    for (const auto& group : groupByFoldedName(entries)) {
        if (group.paths.size() < 2 || !hasDistinctSpellings(group)) {
            continue;
        }

        DuplicateWarning warning;
        warning.directory = group.directory;
        warning.filename = group.baseNames.front();
        warning.count = group.paths.size();
        const std::size_t kept = std::min(group.paths.size(), kMaxDuplicatePaths);
        warning.paths.assign(group.paths.begin(), group.paths.begin() + static_cast<std::ptrdiff_t>(kept));
        duplicates.push_back(std::move(warning));
    }
    return duplicates;
}

std::vector<SystemFileWarning> ArchiveAnalyzer::detectSystemFiles(const std::vector<ArchiveEntry>& entries) const {
    std::vector<SystemFileWarning> matches;
    for (const auto& entry : entries) {
        if (matches.size() >= kMaxSystemFiles) {
            break;
        }

        const std::string normalized = normalizeSeparators(entry.path);
        const std::string baseName = decomposePath(normalized, entry.isDirectory).baseName;
        const std::string foldedName = toLowerUtf8(baseName);
        // A directory entry is its own container, so test it with its trailing '/'.
        const std::string container = entry.isDirectory ? normalized : decomposePath(normalized, false).parentPath;

        if (containsSegment(container, "__MACOSX")) {
            matches.push_back(SystemFileWarning{entry.path, "__MACOSX"});
        } else if (!entry.isDirectory && baseName == ".DS_Store") {
            matches.push_back(SystemFileWarning{entry.path, ".DS_Store"});
        } else if (!entry.isDirectory && foldedName == "thumbs.db") {
            matches.push_back(SystemFileWarning{entry.path, "Thumbs.db"});
        } else if (!entry.isDirectory && foldedName == "desktop.ini") {
            matches.push_back(SystemFileWarning{entry.path, "desktop.ini"});
        } else if (containsSegment(container, ".git")) {
            matches.push_back(SystemFileWarning{entry.path, ".git"});
        }
    }
    return matches;
}

std::vector<RenameConflict> ArchiveAnalyzer::simulateConflicts(const std::vector<ArchiveEntry>& entries) const {
    std::vector<RenameConflict> conflicts;
    for (const auto& group : groupByFoldedName(entries)) {
        if (conflicts.size() >= kMaxConflicts) {
            break;
        }
        if (group.baseNames.size() < 2 || !hasDistinctSpellings(group)) {
            continue;
        }

        conflicts.push_back(RenameConflict{group.directory, group.baseNames, group.foldedName, group.baseNames.size(),
                                           "case_sensitivity"});
    }
    return conflicts;
}

Severity classifySeverity(const AnalysisWarnings& warnings) {
    constexpr std::size_t kHighThreshold = 5;

    if (!warnings.renameConflicts.empty()) {
        return Severity::Critical;
    }
    if (warnings.pathTooLong.size() > kHighThreshold || warnings.invalidChars.size() > kHighThreshold) {
        return Severity::High;
    }
    if (!warnings.duplicateNames.empty() || !warnings.unicodeIssues.empty()) {
        return Severity::Medium;
    }
    if (!warnings.systemFiles.empty()) {
        return Severity::Low;
    }
    return Severity::None;
}

std::string severityName(Severity severity) {
    switch (severity) {
    case Severity::None:
        return "none";
    case Severity::Low:
        return "low";
    case Severity::Medium:
        return "medium";
    case Severity::High:
        return "high";
    case Severity::Critical:
        return "critical";
    }
    return "none";
}
