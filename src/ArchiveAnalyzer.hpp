#ifndef ARCHIVE_ANALYZER_HPP
#define ARCHIVE_ANALYZER_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "ArchiveEntry.hpp"

struct LargestFile {
    std::string path;
    std::uint64_t size = 0;
};

struct ArchiveStats {
    std::size_t totalFiles = 0;
    std::size_t totalDirectories = 0;
    std::uint64_t totalSize = 0;
    std::size_t maxDepth = 0;
    LargestFile largestFile;
};

struct PathLengthWarning {
    std::string path;
    std::size_t length = 0;
    std::string os;
    std::size_t limit = 0;
};

struct InvalidCharWarning {
    std::string path;
    std::vector<std::string> invalidChars; // printable form, control bytes as \xNN
    std::string os;
};

struct UnicodeWarning {
    std::string path;
    std::string issue; // nfc_nfd_mismatch | invalid_sequence
    std::string details;
};

struct DuplicateWarning {
    std::string directory;
    std::string filename;
    std::size_t count = 0;
    std::vector<std::string> paths;
};

struct SystemFileWarning {
    std::string path;
    std::string type;
};

struct RenameConflict {
    std::string directory;
    std::vector<std::string> conflictingFiles;
    std::string resultName;
    std::size_t count = 0;
    std::string type;
};

struct AnalysisWarnings {
    std::vector<RenameConflict> renameConflicts;
    std::vector<PathLengthWarning> pathTooLong;
    std::vector<DuplicateWarning> duplicateNames;
    std::vector<InvalidCharWarning> invalidChars;
    std::vector<UnicodeWarning> unicodeIssues;
    std::vector<SystemFileWarning> systemFiles;
};

enum class Severity { None, Low, Medium, High, Critical };

struct AnalysisReport {
    ArchiveStats stats;
    AnalysisWarnings warnings;
    Severity severity = Severity::None;
    std::string timestamp;
};

struct AnalyzerOptions {
    // Report time; the current time when unset.
    std::optional<std::chrono::system_clock::time_point> now;
};

// Pre-flight checks of an archive listing against cross-platform filesystem constraints.
// Every detector is independent of the others and of any rename rules.
class ArchiveAnalyzer {
public:
    static constexpr std::size_t kMaxDuplicatePaths = 10;
    static constexpr std::size_t kMaxSystemFiles = 20;
    static constexpr std::size_t kMaxConflicts = 10;

    // Run every detector and classify the result. Entries without a path are ignored.
    AnalysisReport analyze(const std::vector<ArchiveEntry>& entries, const AnalyzerOptions& options = {}) const;

    ArchiveStats computeStats(const std::vector<ArchiveEntry>& entries) const;
    std::vector<PathLengthWarning> checkPathLengths(const std::vector<ArchiveEntry>& entries) const;
    std::vector<InvalidCharWarning> checkInvalidChars(const std::vector<ArchiveEntry>& entries) const;
    std::vector<UnicodeWarning> checkUnicode(const std::vector<ArchiveEntry>& entries) const;
    std::vector<DuplicateWarning> detectDuplicates(const std::vector<ArchiveEntry>& entries) const;
    std::vector<SystemFileWarning> detectSystemFiles(const std::vector<ArchiveEntry>& entries) const;
    std::vector<RenameConflict> simulateConflicts(const std::vector<ArchiveEntry>& entries) const;

private:
    void checkInvalidCharsFor(const std::string& path, std::vector<InvalidCharWarning>& warnings) const;
    void checkUnicodeFor(const std::string& path, std::vector<UnicodeWarning>& warnings) const;
};

// Reduce the warnings to one risk level; the first matching tier wins.
Severity classifySeverity(const AnalysisWarnings& warnings);
std::string severityName(Severity severity);

#endif
