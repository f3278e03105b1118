#include "RuleGroup.hpp"

#include "PathUtils.hpp"

std::optional<GroupScope> parseGroupScope(const std::string& name) {
    if (name == "global") {
        return GroupScope::Global;
    }
    if (name == "folders") {
        return GroupScope::Folders;
    }
    if (name == "extension") {
        return GroupScope::Extension;
    }
    if (name == "folder") {
        return GroupScope::Folder;
    }
    return std::nullopt;
}

std::string groupScopeName(GroupScope scope) {
    switch (scope) {
    case GroupScope::Global:
        return "global";
    case GroupScope::Folders:
        return "folders";
    case GroupScope::Extension:
        return "extension";
    case GroupScope::Folder:
        return "folder";
    }
    return "global";
}

bool isTopLevelDirectory(const ArchiveEntry& entry) {
    return entry.isDirectory && decomposePath(entry.path, true).parentPath.empty();
}

bool matchesScope(const RuleGroup& group, const ArchiveEntry& entry, bool includeTopLevelDirectories) {
    if (!includeTopLevelDirectories && isTopLevelDirectory(entry)) {
        return false;
    }

    switch (group.scope) {
    case GroupScope::Global:
        return !entry.isDirectory;
    case GroupScope::Folders:
        return entry.isDirectory;
    case GroupScope::Extension: {
        if (entry.isDirectory) {
            return false;
        }
        const std::string extension = normalizeExtension(decomposePath(entry.path, false).extension);
        const bool extensionMatches = extension == normalizeExtension(group.scopeValue);
        return group.exclude ? !extensionMatches : extensionMatches;
    }
    case GroupScope::Folder: {
        const std::string prefix = normalizeSeparators(group.scopeValue);
        return !prefix.empty() && normalizeSeparators(entry.path).rfind(prefix, 0) == 0;
    }
    }
    return false;
}
