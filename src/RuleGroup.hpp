#ifndef RULE_GROUP_HPP
#define RULE_GROUP_HPP

#include <optional>
#include <string>
#include <vector>

#include "ArchiveEntry.hpp"
#include "RenameRule.hpp"

enum class GroupScope {
    Global,     // files only
    Folders,    // directories only
    Extension,  // files whose extension equals scopeValue
    Folder      // anything under the scopeValue path prefix
};

// Ordered rule list plus the predicate selecting which entries it touches.
struct RuleGroup {
    std::string id;
    GroupScope scope = GroupScope::Global;
    std::string scopeValue;
    bool exclude = false; // inverts the extension comparison only
    std::vector<RenameRule> rules;
};

std::optional<GroupScope> parseGroupScope(const std::string& name);
std::string groupScopeName(GroupScope scope);

// True for directory entries that sit at the archive root.
bool isTopLevelDirectory(const ArchiveEntry& entry);

// Decide whether the group applies to the entry. Top-level directories never match unless
// the caller opts in.
bool matchesScope(const RuleGroup& group, const ArchiveEntry& entry, bool includeTopLevelDirectories = false);

#endif
