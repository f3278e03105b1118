#ifndef RENAME_ENGINE_HPP
#define RENAME_ENGINE_HPP

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include "ArchiveEntry.hpp"
#include "RuleGroup.hpp"

struct RenameResult {
    std::string originalPath;
    std::string finalPath;
};

struct RenameOptions {
    // Value of the {date} placeholder; today's UTC date when empty.
    std::string date;
    // Top-level containers keep their names unless this is set.
    bool renameTopLevelDirectories = false;
};

// Computes the final path of every archive entry from an ordered list of scoped rule groups.
class RenameEngine {
public:
    explicit RenameEngine(std::vector<RuleGroup> groups);

    // Rename every valid entry; results follow the container listing order.
    std::vector<RenameResult> rename(const std::vector<ArchiveEntry>& entries, const RenameOptions& options = {}) const;
    // Replace the rule groups used by later runs.
    void updateGroups(std::vector<RuleGroup> groups);
    const std::vector<RuleGroup>& groups() const;

private:
    // State of one rename() call. Never outlives it.
    struct RunState {
        std::string date;
        bool renameTopLevelDirectories = false;
        std::unordered_map<std::string, std::size_t> counters;           // group id -> next scoped index
        std::unordered_map<std::string, std::string> renamedDirectories; // old dir path -> new base name
        std::unordered_map<std::string, std::string> resolvedDirectories;
    };

    // Run every matching group over one base name, advancing the group counters.
    std::string applyGroups(const ArchiveEntry& entry, const std::string& baseName, const std::string& parentPath,
                            RunState& state) const;
    // Final location of a directory (no trailing '/'), inheriting every ancestor rename.
    std::string resolveDirectory(const std::string& directory, RunState& state) const;

    std::vector<RuleGroup> m_groups;
};

#endif
