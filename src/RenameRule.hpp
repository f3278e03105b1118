#ifndef RENAME_RULE_HPP
#define RENAME_RULE_HPP

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <unicode/regex.h>

// Literal, case-sensitive substitution of every occurrence of `find`.
struct ReplaceRule {
    std::string find;
    std::string replace;
};

// User-supplied expression matched over code points; only built through makeRegexRule().
struct RegexRule {
    std::string pattern;
    std::string replace;
    std::shared_ptr<const icu::RegexPattern> compiled;
    icu::UnicodeString replacement; // `replace` rewritten into ICU's replacement syntax
    bool global = true;
};

struct PrefixRule {
    std::string text;
};

struct SuffixRule {
    std::string text;
};

struct LowercaseRule {};
struct UppercaseRule {};
struct TrimRule {};
struct NormalizeSpaceRule {};
struct KebabCaseRule {};
struct RemoveSpecialRule {};

struct NumberingRule {
    long long start = 1;
    std::size_t padding = 1;
    std::string separator = "-";
    bool atStart = false;
};

// Template over {name} {index} {ext} {parent} {date} {depth}; replaces the whole stem.
struct PatternRule {
    std::string pattern;
};

// Anything the decoder did not recognise. Evaluates to nothing.
struct UnknownRule {
    std::string type;
};

using RenameRule = std::variant<ReplaceRule, RegexRule, PrefixRule, SuffixRule, LowercaseRule, UppercaseRule,
                                TrimRule, NormalizeSpaceRule, KebabCaseRule, RemoveSpecialRule, NumberingRule,
                                PatternRule, UnknownRule>;

// Per-call inputs that are not part of the name itself.
struct RuleContext {
    std::size_t scopedIndex = 0;
    std::string parentPath; // original parent path of the entry, '/'-terminated or empty
    std::string date;       // YYYY-MM-DD
};

// Compile a regex rule; returns nothing (and logs) when the expression is invalid.
std::optional<RegexRule> makeRegexRule(const std::string& pattern, const std::string& flags, const std::string& replace);

// Apply one rule to the stem. Pattern rules may clear the extension.
void applyRule(const RenameRule& rule, const RuleContext& context, std::string& stem, std::string& extension);

// Apply the rules in order, each one consuming the previous result.
void applyRules(const std::vector<RenameRule>& rules, const RuleContext& context, std::string& stem,
                std::string& extension);

// Replace every occurrence of `token` in `text` without rescanning inserted text.
std::string replaceAll(std::string text, const std::string& token, const std::string& replacement);

std::string ruleTypeName(const RenameRule& rule);

#endif
