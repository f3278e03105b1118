#include "RenameEngine.hpp"

#include <chrono>
#include <iostream>
#include <optional>

#include "Clock.hpp"
#include "PathUtils.hpp"

namespace {
std::string stripTrailingSlashes(std::string path) {
    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }
    return path;
}

// Rules may inject separators; only the last segment is kept as the new name.
std::string lastSegment(const std::string& name) {
    const std::size_t slash = name.find_last_of("/\\");
    return slash == std::string::npos ? name : name.substr(slash + 1);
}

std::string joinPath(const std::string& parent, const std::string& name) {
    if (parent.empty()) {
        return name;
    }
    return parent + "/" + name;
}
} // namespace

RenameEngine::RenameEngine(std::vector<RuleGroup> groups) : m_groups(std::move(groups)) {}

void RenameEngine::updateGroups(std::vector<RuleGroup> groups) {
    m_groups = std::move(groups);
}

const std::vector<RuleGroup>& RenameEngine::groups() const {
    return m_groups;
}

std::vector<RenameResult> RenameEngine::rename(const std::vector<ArchiveEntry>& entries,
                                               const RenameOptions& options) const {
    RunState state;
    state.date = options.date.empty() ? formatIsoDate(std::chrono::system_clock::now()) : options.date;
    state.renameTopLevelDirectories = options.renameTopLevelDirectories;

    std::vector<std::optional<RenameResult>> slots(entries.size());

    // Phase 1: directory names, recorded before any file path is rewritten.
    std::vector<std::size_t> directoryIndices;
    for (std::size_t i = 0; i < entries.size(); ++i) {
        const ArchiveEntry& entry = entries[i];
        if (!entry.isDirectory) {
            continue;
        }
        if (entry.path.empty()) {
            std::cerr << "Warning: skipping directory entry #" << i << " without a path." << std::endl;
            continue;
        }

        const PathParts parts = decomposePath(entry.path, true);
        const std::string directory = parts.parentPath + parts.baseName;
        directoryIndices.push_back(i);
        if (parts.parentPath.empty() && !state.renameTopLevelDirectories) {
            // Top-level containers pass through unrenamed.
            continue;
        }

        // The first listing of a directory is authoritative.
        state.renamedDirectories.emplace(directory, applyGroups(entry, parts.baseName, parts.parentPath, state));
    }

    for (std::size_t i : directoryIndices) {
        const PathParts parts = decomposePath(entries[i].path, true);
        const std::string resolved = sanitizePath(resolveDirectory(parts.parentPath + parts.baseName, state));
        slots[i] = RenameResult{entries[i].path, resolved.empty() ? std::string{} : resolved + "/"};
    }

    // Phase 2: files inherit the directory renames, then rename their own base name.
    for (std::size_t i = 0; i < entries.size(); ++i) {
        const ArchiveEntry& entry = entries[i];
        if (entry.isDirectory) {
            continue;
        }
        if (entry.path.empty()) {
            std::cerr << "Warning: skipping file entry #" << i << " without a path." << std::endl;
            continue;
        }

        const PathParts parts = decomposePath(entry.path, false);
        const std::string parent = resolveDirectory(stripTrailingSlashes(parts.parentPath), state);
        const std::string name = applyGroups(entry, parts.baseName, parts.parentPath, state);
        slots[i] = RenameResult{entry.path, sanitizePath(joinPath(parent, name))};
    }

    std::vector<RenameResult> results;
    results.reserve(entries.size());
    for (auto& slot : slots) {
        if (slot) {
            results.push_back(std::move(*slot));
        }
    }
    return results;
}

std::string RenameEngine::applyGroups(const ArchiveEntry& entry, const std::string& baseName,
                                      const std::string& parentPath, RunState& state) const {
    std::string working = baseName;
    for (const auto& group : m_groups) {
        if (group.rules.empty() || !matchesScope(group, entry, state.renameTopLevelDirectories)) {
            continue;
        }

        RuleContext context;
        context.scopedIndex = state.counters[group.id]++;
        context.parentPath = parentPath;
        context.date = state.date;

        std::string stem;
        std::string extension;
        if (entry.isDirectory) {
            stem = working;
        } else {
            splitStem(working, stem, extension);
        }

        applyRules(group.rules, context, stem, extension);
        working = lastSegment(stem + extension);
    }

    if (working.empty() || working == "." || working == "..") {
        std::cerr << "Warning: rules produced an unusable name for `" << entry.path << "`; keeping `" << baseName
                  << "`." << std::endl;
        return baseName;
    }
    return working;
}

std::string RenameEngine::resolveDirectory(const std::string& directory, RunState& state) const {
    if (directory.empty()) {
        return {};
    }

    auto cached = state.resolvedDirectories.find(directory);
    if (cached != state.resolvedDirectories.end()) {
        return cached->second;
    }

    const PathParts parts = decomposePath(directory, true);
    const std::string parent = resolveDirectory(stripTrailingSlashes(parts.parentPath), state);

    auto renamed = state.renamedDirectories.find(parts.parentPath + parts.baseName);
    const std::string& name = renamed == state.renamedDirectories.end() ? parts.baseName : renamed->second;

    std::string resolved = joinPath(parent, name);
    state.resolvedDirectories.emplace(directory, resolved);
    return resolved;
}
