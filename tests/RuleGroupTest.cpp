#include <gtest/gtest.h>

#include "RuleGroup.hpp"

namespace {
RuleGroup makeGroup(GroupScope scope, std::string value = {}, bool exclude = false) {
    RuleGroup group;
    group.id = "g";
    group.scope = scope;
    group.scopeValue = std::move(value);
    group.exclude = exclude;
    return group;
}

ArchiveEntry file(std::string path) {
    return ArchiveEntry{std::move(path), 1, false};
}

ArchiveEntry dir(std::string path) {
    return ArchiveEntry{std::move(path), 0, true};
}
} // namespace

TEST(ScopeMatcherTest, GlobalMatchesFilesOnly) {
    const RuleGroup group = makeGroup(GroupScope::Global);
    EXPECT_TRUE(matchesScope(group, file("a.txt")));
    EXPECT_TRUE(matchesScope(group, file("Root/a.txt")));
    EXPECT_FALSE(matchesScope(group, dir("Root/Sub/")));
}

TEST(ScopeMatcherTest, FoldersMatchesNestedDirectoriesOnly) {
    const RuleGroup group = makeGroup(GroupScope::Folders);
    EXPECT_TRUE(matchesScope(group, dir("Root/Sub/")));
    EXPECT_FALSE(matchesScope(group, file("Root/a.txt")));
}

// Top-level containers are never renamed unless the caller opts in.
TEST(ScopeMatcherTest, TopLevelDirectoriesNeverMatch) {
    EXPECT_FALSE(matchesScope(makeGroup(GroupScope::Folders), dir("Root/")));
    EXPECT_FALSE(matchesScope(makeGroup(GroupScope::Folder, "Root"), dir("Root/")));
    EXPECT_TRUE(matchesScope(makeGroup(GroupScope::Folders), dir("Root/"), true));
    EXPECT_TRUE(isTopLevelDirectory(dir("Root/")));
    EXPECT_FALSE(isTopLevelDirectory(file("Root")));
}

TEST(ScopeMatcherTest, ExtensionIsCaseInsensitive) {
    const RuleGroup group = makeGroup(GroupScope::Extension, "txt");
    EXPECT_TRUE(matchesScope(group, file("notes/A.TXT")));
    EXPECT_TRUE(matchesScope(group, file("a.txt")));
    EXPECT_FALSE(matchesScope(group, file("a.txt.bak")));
    EXPECT_FALSE(matchesScope(group, file("txt")));
    EXPECT_FALSE(matchesScope(group, dir("Root/folder.txt/")));
}

// Exclude inverts the extension comparison but directories stay out.
TEST(ScopeMatcherTest, ExcludeInvertsExtensionMatch) {
    const RuleGroup group = makeGroup(GroupScope::Extension, ".jpg", true);
    EXPECT_TRUE(matchesScope(group, file("a.png")));
    EXPECT_TRUE(matchesScope(group, file("README")));
    EXPECT_FALSE(matchesScope(group, file("a.JPG")));
    EXPECT_FALSE(matchesScope(group, dir("Root/Sub/")));
}

TEST(ScopeMatcherTest, FolderMatchesPathPrefix) {
    const RuleGroup group = makeGroup(GroupScope::Folder, "docs\\");
    EXPECT_TRUE(matchesScope(group, file("docs/a.txt")));
    EXPECT_TRUE(matchesScope(group, file("docs\\b.txt")));
    EXPECT_TRUE(matchesScope(group, dir("docs/sub/")));
    EXPECT_FALSE(matchesScope(group, file("other/docs/a.txt")));
}

// The exclude flag only affects extension scopes.
TEST(ScopeMatcherTest, ExcludeIgnoredForOtherScopes) {
    const RuleGroup group = makeGroup(GroupScope::Global, {}, true);
    EXPECT_TRUE(matchesScope(group, file("a.txt")));
}

TEST(GroupScopeTest, ParsesKnownNames) {
    EXPECT_EQ(parseGroupScope("global"), GroupScope::Global);
    EXPECT_EQ(parseGroupScope("folders"), GroupScope::Folders);
    EXPECT_EQ(parseGroupScope("extension"), GroupScope::Extension);
    EXPECT_EQ(parseGroupScope("folder"), GroupScope::Folder);
    EXPECT_FALSE(parseGroupScope("everything").has_value());
    EXPECT_EQ(groupScopeName(GroupScope::Folder), "folder");
}
