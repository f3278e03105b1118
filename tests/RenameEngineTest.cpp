#include <gtest/gtest.h>

#include "RenameEngine.hpp"

namespace {
ArchiveEntry file(std::string path, std::uint64_t size = 1) {
    return ArchiveEntry{std::move(path), size, false};
}

ArchiveEntry dir(std::string path) {
    return ArchiveEntry{std::move(path), 0, true};
}

RuleGroup group(std::string id, GroupScope scope, std::vector<RenameRule> rules, std::string scopeValue = {},
                bool exclude = false) {
    RuleGroup g;
    g.id = std::move(id);
    g.scope = scope;
    g.scopeValue = std::move(scopeValue);
    g.exclude = exclude;
    g.rules = std::move(rules);
    return g;
}

std::vector<std::string> finalPaths(const std::vector<RenameResult>& results) {
    std::vector<std::string> paths;
    for (const auto& result : results) {
        paths.push_back(result.finalPath);
    }
    return paths;
}

RenameOptions fixedDate() {
    RenameOptions options;
    options.date = "2024-03-09";
    return options;
}
} // namespace

// Without rule groups every entry keeps its path.
TEST(RenameEngineTest, NoGroupsIsIdentity) {
    const std::vector<ArchiveEntry> entries{dir("Root/"), dir("Root/Sub/"), file("Root/Sub/a.txt"), file("b.jpg")};
    const RenameEngine engine(std::vector<RuleGroup>{});
    const auto results = engine.rename(entries, fixedDate());

    ASSERT_EQ(results.size(), entries.size());
    for (std::size_t i = 0; i < entries.size(); ++i) {
        EXPECT_EQ(results[i].originalPath, entries[i].path);
        EXPECT_EQ(results[i].finalPath, entries[i].path);
    }
}

TEST(RenameEngineTest, RepeatedRunsAreIdentical) {
    const std::vector<ArchiveEntry> entries{dir("Root/"), dir("Root/A/"), file("Root/A/x.jpg"), file("Root/y.jpg")};
    const RenameEngine engine({group("n", GroupScope::Global, {NumberingRule{}}),
                               group("f", GroupScope::Folders, {PatternRule{"{name}_{index}"}})});

    const auto first = engine.rename(entries, fixedDate());
    const auto second = engine.rename(entries, fixedDate());
    EXPECT_EQ(finalPaths(first), finalPaths(second));
}

// The extension scope compares case-insensitively; the rule itself changes only the stem.
TEST(RenameEngineTest, ExtensionScopeIsCaseInsensitive) {
    const RenameEngine engine({group("g", GroupScope::Extension, {LowercaseRule{}}, ".txt")});
    const auto results = engine.rename({file("A.TXT"), file("B.md")}, fixedDate());

    const std::vector<std::string> expected{"a.TXT", "B.md"};
    EXPECT_EQ(finalPaths(results), expected);
}

// Directory renames propagate to their contents.
TEST(RenameEngineTest, FolderRenamePropagatesToFiles) {
    const std::vector<ArchiveEntry> entries{dir("Photos/"), file("Photos/img.jpg")};
    const RenameEngine engine({group("g", GroupScope::Folders, {PrefixRule{"new_"}})});

    RenameOptions options = fixedDate();
    options.renameTopLevelDirectories = true;
    const std::vector<std::string> renamed{"new_Photos/", "new_Photos/img.jpg"};
    EXPECT_EQ(finalPaths(engine.rename(entries, options)), renamed);

    // By default the top-level container keeps its name.
    const std::vector<std::string> preserved{"Photos/", "Photos/img.jpg"};
    EXPECT_EQ(finalPaths(engine.rename(entries, fixedDate())), preserved);
}

TEST(RenameEngineTest, NestedDirectoriesInheritAncestorRenames) {
    const std::vector<ArchiveEntry> entries{dir("Root/"), dir("Root/Photos/"), dir("Root/Photos/Trip/"),
                                            file("Root/Photos/Trip/a.jpg"), file("Root/Photos/b.jpg")};
    const RenameEngine engine({group("g", GroupScope::Folders, {PrefixRule{"x_"}})});

    const std::vector<std::string> expected{"Root/", "Root/x_Photos/", "Root/x_Photos/x_Trip/",
                                            "Root/x_Photos/x_Trip/a.jpg", "Root/x_Photos/b.jpg"};
    EXPECT_EQ(finalPaths(engine.rename(entries, fixedDate())), expected);
}

// Children listed before their parent still see the parent's new name.
TEST(RenameEngineTest, ListingOrderDoesNotBreakPropagation) {
    const std::vector<ArchiveEntry> entries{file("Root/Sub/a.txt"), dir("Root/Sub/Deep/"), dir("Root/Sub/")};
    const RenameEngine engine({group("g", GroupScope::Folders, {UppercaseRule{}})});

    const std::vector<std::string> expected{"Root/SUB/a.txt", "Root/SUB/DEEP/", "Root/SUB/"};
    EXPECT_EQ(finalPaths(engine.rename(entries, fixedDate())), expected);
}

TEST(RenameEngineTest, GlobalNumberingCountsMatchingFiles) {
    NumberingRule numbering;
    numbering.padding = 3;
    numbering.separator = "_";
    const RenameEngine engine({group("g", GroupScope::Global, {numbering})});

    const std::vector<std::string> expected{"a_001.jpg", "b_002.jpg"};
    EXPECT_EQ(finalPaths(engine.rename({file("a.jpg"), file("b.jpg")}, fixedDate())), expected);
}

// One counter per group spans the directory phase and the file phase.
TEST(RenameEngineTest, CounterIsSharedAcrossPhases) {
    const std::vector<ArchiveEntry> entries{dir("Root/"), file("Root/a.txt"), dir("Root/Sub/"), file("Root/Sub/b.txt")};
    const RenameEngine engine({group("g", GroupScope::Folder, {NumberingRule{}}, "Root/")});

    const std::vector<std::string> expected{"Root/", "Root/a-2.txt", "Root/Sub-1/", "Root/Sub-1/b-3.txt"};
    EXPECT_EQ(finalPaths(engine.rename(entries, fixedDate())), expected);
}

TEST(RenameEngineTest, CountersArePerGroupId) {
    const std::vector<ArchiveEntry> entries{file("a.jpg"), file("b.png"), file("c.jpg")};
    const RenameEngine engine({group("jpg", GroupScope::Extension, {NumberingRule{}}, "jpg"),
                               group("png", GroupScope::Extension, {NumberingRule{}}, "png")});

    const std::vector<std::string> expected{"a-1.jpg", "b-1.png", "c-2.jpg"};
    EXPECT_EQ(finalPaths(engine.rename(entries, fixedDate())), expected);
}

// Groups sharing an id share one counter.
TEST(RenameEngineTest, SameIdSharesCounter) {
    const std::vector<ArchiveEntry> entries{file("a.jpg"), file("b.png")};
    const RenameEngine engine({group("same", GroupScope::Extension, {NumberingRule{}}, "jpg"),
                               group("same", GroupScope::Extension, {NumberingRule{}}, "png")});

    const std::vector<std::string> expected{"a-1.jpg", "b-2.png"};
    EXPECT_EQ(finalPaths(engine.rename(entries, fixedDate())), expected);
}

// A group without rules never advances its counter.
TEST(RenameEngineTest, EmptyGroupDoesNotCount) {
    const RenameEngine engine({group("g", GroupScope::Global, {}), group("g", GroupScope::Global, {NumberingRule{}})});
    const std::vector<std::string> expected{"a-1.txt"};
    EXPECT_EQ(finalPaths(engine.rename({file("a.txt")}, fixedDate())), expected);
}

TEST(RenameEngineTest, CountersResetBetweenRuns) {
    const RenameEngine engine({group("g", GroupScope::Global, {NumberingRule{}})});
    EXPECT_EQ(engine.rename({file("a.txt")}, fixedDate())[0].finalPath, "a-1.txt");
    EXPECT_EQ(engine.rename({file("a.txt")}, fixedDate())[0].finalPath, "a-1.txt");
}

TEST(RenameEngineTest, GroupsApplyInOrder) {
    const RenameEngine engine({group("one", GroupScope::Global, {PrefixRule{"a_"}}),
                               group("two", GroupScope::Global, {UppercaseRule{}, SuffixRule{"_z"}})});
    EXPECT_EQ(engine.rename({file("dir/name.txt")}, fixedDate())[0].finalPath, "dir/A_NAME_z.txt");
}

// Folder scopes follow the listed path even after the folder itself was renamed.
TEST(RenameEngineTest, FolderScopeUsesOriginalPath) {
    const std::vector<ArchiveEntry> entries{dir("Root/"), dir("Root/Docs/"), file("Root/Docs/a.txt")};
    const RenameEngine engine({group("f", GroupScope::Folders, {PrefixRule{"new_"}}),
                               group("d", GroupScope::Folder, {SuffixRule{"_x"}}, "Root/Docs/")});

    const std::vector<std::string> expected{"Root/", "Root/new_Docs_x/", "Root/new_Docs_x/a_x.txt"};
    EXPECT_EQ(finalPaths(engine.rename(entries, fixedDate())), expected);
}

TEST(RenameEngineTest, PatternRuleUsesContext) {
    const std::vector<ArchiveEntry> entries{dir("Root/"), dir("Root/Trip/"), file("Root/Trip/img.jpg"),
                                            file("Root/Trip/doc.txt")};
    const RenameEngine engine({group("p", GroupScope::Extension, {PatternRule{"{parent}_{index}_{date}"}}, "jpg"),
                               group("q", GroupScope::Extension, {PatternRule{"{name}.{ext}.bak"}}, "txt")});

    const std::vector<std::string> expected{"Root/", "Root/Trip/", "Root/Trip/Trip_001_2024-03-09.jpg",
                                            "Root/Trip/doc.txt.bak"};
    EXPECT_EQ(finalPaths(engine.rename(entries, fixedDate())), expected);
}

TEST(RenameEngineTest, TraversalSegmentsAreDropped) {
    const RenameEngine engine(std::vector<RuleGroup>{});
    const std::vector<std::string> expected{"evil/a.txt", "x/y.txt"};
    EXPECT_EQ(finalPaths(engine.rename({file("../evil/./a.txt"), file("x\\y.txt")}, fixedDate())), expected);
}

// Separators injected by rules cannot move a file.
TEST(RenameEngineTest, InjectedSeparatorsAreStripped) {
    const RenameEngine engine({group("g", GroupScope::Global, {PrefixRule{"../up/"}})});
    EXPECT_EQ(engine.rename({file("dir/a.txt")}, fixedDate())[0].finalPath, "dir/a.txt");
}

// A rule that erases a name leaves the original name in place.
TEST(RenameEngineTest, EmptyResultKeepsOriginalName) {
    const RenameEngine engine({group("g", GroupScope::Folders, {RemoveSpecialRule{}})});
    const std::vector<std::string> expected{"Root/", "Root/!!!/", "Root/!!!/a.txt"};
    EXPECT_EQ(finalPaths(engine.rename({dir("Root/"), dir("Root/!!!/"), file("Root/!!!/a.txt")}, fixedDate())),
              expected);
}

TEST(RenameEngineTest, EntriesWithoutPathAreSkipped) {
    const RenameEngine engine({group("g", GroupScope::Global, {NumberingRule{}})});
    const auto results = engine.rename({file(""), file("a.txt"), dir("")}, fixedDate());

    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].originalPath, "a.txt");
    EXPECT_EQ(results[0].finalPath, "a-1.txt");
}

TEST(RenameEngineTest, UnknownRulesAreIgnored) {
    const RenameEngine engine({group("g", GroupScope::Global, {UnknownRule{"explode"}, SuffixRule{"_ok"}})});
    EXPECT_EQ(engine.rename({file("a.txt")}, fixedDate())[0].finalPath, "a_ok.txt");
}

TEST(RenameEngineTest, UpdateGroupsReplacesRules) {
    RenameEngine engine({group("g", GroupScope::Global, {SuffixRule{"_1"}})});
    engine.updateGroups({group("g", GroupScope::Global, {SuffixRule{"_2"}})});
    ASSERT_EQ(engine.groups().size(), 1u);
    EXPECT_EQ(engine.rename({file("a.txt")}, fixedDate())[0].finalPath, "a_2.txt");
}
