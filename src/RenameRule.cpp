#include "RenameRule.hpp"

#include <cctype>
#include <cstdint>
#include <iostream>
#include <limits>
#include <map>
#include <type_traits>

#include "PathUtils.hpp"
#include "Utf8.hpp"

namespace {
constexpr std::size_t kPatternIndexWidth = 3;
// Backtracking memory in bytes, and match time in ICU's coarse ticks (a few ms each).
constexpr std::int32_t kRegexStackLimit = 8 * 1024 * 1024;
constexpr std::int32_t kRegexTimeLimit = 2000;

template <class>
inline constexpr bool kAlwaysFalse = false;

std::string padLeft(std::string digits, std::size_t width) {
    if (digits.size() < width) {
        digits.insert(digits.begin(), width - digits.size(), '0');
    }
    return digits;
}

bool isKeptSpecial(unsigned char ch) {
    return std::isalnum(ch) || ch == ' ' || ch == '-' || ch == '_';
}

std::string trimWhitespace(const std::string& text) {
    std::size_t first = 0;
    std::size_t last = text.size();
    while (first < last && std::isspace(static_cast<unsigned char>(text[first]))) {
        ++first;
    }
    while (last > first && std::isspace(static_cast<unsigned char>(text[last - 1]))) {
        --last;
    }
    return text.substr(first, last - first);
}

std::string collapseWhitespace(const std::string& text, char replacement, bool includeUnderscore) {
    std::string result;
    result.reserve(text.size());
    bool inRun = false;
    for (unsigned char ch : text) {
        const bool separator = std::isspace(ch) || (includeUnderscore && ch == '_');
        if (separator) {
            if (!inRun) {
                result += replacement;
            }
            inRun = true;
            continue;
        }
        inRun = false;
        result += static_cast<char>(ch);
    }
    return result;
}

std::string toKebabCase(const std::string& text) {
    std::string split;
    split.reserve(text.size() + 8);
    for (std::size_t i = 0; i < text.size(); ++i) {
        split += text[i];
        const unsigned char current = static_cast<unsigned char>(text[i]);
        if (i + 1 < text.size() && std::islower(current) &&
            std::isupper(static_cast<unsigned char>(text[i + 1]))) {
            split += '-';
        }
    }
    return toLowerUtf8(collapseWhitespace(split, '-', true));
}

std::string expandPattern(const PatternRule& rule, const RuleContext& context, const std::string& stem,
                          const std::string& extension) {
    const auto parents = pathSegments(context.parentPath);
    const std::map<std::string, std::string> values = {
        {"name", stem},
        {"index", padLeft(std::to_string(context.scopedIndex + 1), kPatternIndexWidth)},
        {"ext", (!extension.empty() && extension.front() == '.') ? extension.substr(1) : extension},
        {"parent", parents.empty() ? std::string{} : parents.back()},
        {"date", context.date},
        {"depth", std::to_string(parents.size())},
    };

    // Single pass over the template, so substituted text is never expanded again.
    std::string result;
    std::size_t pos = 0;
    while (pos < rule.pattern.size()) {
        const std::size_t open = rule.pattern.find('{', pos);
        if (open == std::string::npos) {
            break;
        }
        const std::size_t close = rule.pattern.find('}', open + 1);
        if (close == std::string::npos) {
            break;
        }

        result.append(rule.pattern, pos, open - pos);
        auto value = values.find(rule.pattern.substr(open + 1, close - open - 1));
        if (value != values.end()) {
            result += value->second;
            pos = close + 1;
        } else {
            result += '{';
            pos = open + 1;
        }
    }
    result.append(rule.pattern, pos, std::string::npos);
    return result;
}

// ECMAScript replacement text ($&, $1, $$) rewritten for ICU ($0, $1, \$).
// References to groups the pattern does not have stay literal.
std::string translateReplacement(const std::string& replace, std::int32_t groupCount) {
    std::string result;
    result.reserve(replace.size() + 4);
    for (std::size_t i = 0; i < replace.size(); ++i) {
        const char ch = replace[i];
        if (ch == '\\') {
            result += "\\\\";
            continue;
        }
        if (ch != '$' || i + 1 == replace.size()) {
            result += ch == '$' ? "\\$" : std::string(1, ch);
            continue;
        }

        const char next = replace[i + 1];
        if (next == '$') {
            result += "\\$";
            ++i;
        } else if (next == '&') {
            result += "$0";
            ++i;
        } else if (std::isdigit(static_cast<unsigned char>(next))) {
            // Two digits win when they name an existing group, as in ECMAScript.
            std::size_t digits = 0;
            int group = 0;
            if (i + 2 < replace.size() && std::isdigit(static_cast<unsigned char>(replace[i + 2]))) {
                const int twoDigits = (next - '0') * 10 + (replace[i + 2] - '0');
                if (twoDigits >= 1 && twoDigits <= groupCount) {
                    digits = 2;
                    group = twoDigits;
                }
            }
            if (digits == 0 && next != '0' && next - '0' <= groupCount) {
                digits = 1;
                group = next - '0';
            }

            if (digits == 0) {
                result += "\\$";
                continue;
            }
            result += "$" + std::to_string(group);
            i += digits;
            // ICU would read a following digit as part of the group number.
            if (i + 1 < replace.size() && std::isdigit(static_cast<unsigned char>(replace[i + 1]))) {
                result += '\\';
            }
        } else {
            result += "\\$";
        }
    }
    return result;
}

std::string applyRegex(const RegexRule& rule, const std::string& stem) {
    if (!rule.compiled) {
        return stem;
    }
    if (!isValidUtf8(stem)) {
        std::cerr << "Warning: skipping regex `" << rule.pattern << "` on a name that is not valid UTF-8." << std::endl;
        return stem;
    }

    const icu::UnicodeString input = icu::UnicodeString::fromUTF8(stem);
    UErrorCode status = U_ZERO_ERROR;
    std::unique_ptr<icu::RegexMatcher> matcher(rule.compiled->matcher(input, status));
    if (U_SUCCESS(status)) {
        matcher->setStackLimit(kRegexStackLimit, status);
    }
    if (U_SUCCESS(status)) {
        matcher->setTimeLimit(kRegexTimeLimit, status);
    }

    icu::UnicodeString output;
    if (U_SUCCESS(status)) {
        output = rule.global ? matcher->replaceAll(rule.replacement, status)
                             : matcher->replaceFirst(rule.replacement, status);
    }
    if (U_FAILURE(status)) {
        std::cerr << "Warning: skipping regex `" << rule.pattern << "`: " << u_errorName(status) << std::endl;
        return stem;
    }

    std::string result;
    output.toUTF8String(result);
    return result;
}

// start + index, saturating instead of overflowing.
long long numberFor(const NumberingRule& rule, std::size_t index) {
    constexpr long long kMax = std::numeric_limits<long long>::max();
    if (index > static_cast<unsigned long long>(kMax)) {
        return kMax;
    }
    const long long offset = static_cast<long long>(index);
    return rule.start > kMax - offset ? kMax : rule.start + offset;
}
} // namespace

std::string replaceAll(std::string text, const std::string& token, const std::string& replacement) {
    if (token.empty()) {
        return text;
    }

    std::size_t pos = 0;
    while ((pos = text.find(token, pos)) != std::string::npos) {
        text.replace(pos, token.size(), replacement);
        pos += replacement.size();
    }
    return text;
}

std::optional<RegexRule> makeRegexRule(const std::string& pattern, const std::string& flags, const std::string& replace) {
    if (pattern.empty()) {
        return std::nullopt;
    }
    if (!isValidUtf8(pattern) || !isValidUtf8(replace)) {
        std::cerr << "Warning: ignoring regex `" << pattern << "`: not valid UTF-8." << std::endl;
        return std::nullopt;
    }

    std::uint32_t icuFlags = 0;
    if (flags.find('i') != std::string::npos) {
        icuFlags |= UREGEX_CASE_INSENSITIVE;
    }

    UParseError parseError;
    UErrorCode status = U_ZERO_ERROR;
    std::shared_ptr<const icu::RegexPattern> compiled(
        icu::RegexPattern::compile(icu::UnicodeString::fromUTF8(pattern), icuFlags, parseError, status));
    if (U_FAILURE(status) || !compiled) {
        std::cerr << "Warning: ignoring invalid regex `" << pattern << "`: " << u_errorName(status) << " at offset "
                  << parseError.offset << std::endl;
        return std::nullopt;
    }

    std::unique_ptr<icu::RegexMatcher> probe(compiled->matcher(status));
    if (U_FAILURE(status) || !probe) {
        std::cerr << "Warning: ignoring regex `" << pattern << "`: " << u_errorName(status) << std::endl;
        return std::nullopt;
    }

    RegexRule rule;
    rule.pattern = pattern;
    rule.replace = replace;
    rule.replacement = icu::UnicodeString::fromUTF8(translateReplacement(replace, probe->groupCount()));
    rule.compiled = std::move(compiled);
    rule.global = flags.empty() || flags.find('g') != std::string::npos;
    return rule;
}

void applyRule(const RenameRule& rule, const RuleContext& context, std::string& stem, std::string& extension) {
    std::visit([&](const auto& r) {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, ReplaceRule>) {
            stem = replaceAll(stem, r.find, r.replace);
        } else if constexpr (std::is_same_v<T, RegexRule>) {
            stem = applyRegex(r, stem);
        } else if constexpr (std::is_same_v<T, PrefixRule>) {
            stem = r.text + stem;
        } else if constexpr (std::is_same_v<T, SuffixRule>) {
            stem += r.text;
        } else if constexpr (std::is_same_v<T, LowercaseRule>) {
            stem = toLowerUtf8(stem);
        } else if constexpr (std::is_same_v<T, UppercaseRule>) {
            stem = toUpperUtf8(stem);
        } else if constexpr (std::is_same_v<T, TrimRule>) {
            stem = trimWhitespace(stem);
        } else if constexpr (std::is_same_v<T, NormalizeSpaceRule>) {
            stem = collapseWhitespace(stem, ' ', false);
        } else if constexpr (std::is_same_v<T, KebabCaseRule>) {
            stem = toKebabCase(stem);
        } else if constexpr (std::is_same_v<T, RemoveSpecialRule>) {
            std::string kept;
            for (unsigned char ch : stem) {
                if (isKeptSpecial(ch)) {
                    kept += static_cast<char>(ch);
                }
            }
            stem = std::move(kept);
        } else if constexpr (std::is_same_v<T, NumberingRule>) {
            const std::string digits = padLeft(std::to_string(numberFor(r, context.scopedIndex)), r.padding);
            stem = r.atStart ? digits + r.separator + stem : stem + r.separator + digits;
        } else if constexpr (std::is_same_v<T, PatternRule>) {
            if (r.pattern.empty()) {
                return;
            }
            stem = expandPattern(r, context, stem, extension);
            // The template owns the whole name once it mentions the extension.
            if (r.pattern.find("{ext}") != std::string::npos) {
                extension.clear();
            }
        } else if constexpr (std::is_same_v<T, UnknownRule>) {
            // no-op
        } else {
            static_assert(kAlwaysFalse<T>, "unhandled rename rule");
        }
    }, rule);
}

void applyRules(const std::vector<RenameRule>& rules, const RuleContext& context, std::string& stem,
                std::string& extension) {
    for (const auto& rule : rules) {
        applyRule(rule, context, stem, extension);
    }
}

std::string ruleTypeName(const RenameRule& rule) {
    return std::visit([](const auto& r) -> std::string {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, ReplaceRule>) {
            return "replace";
        } else if constexpr (std::is_same_v<T, RegexRule>) {
            return "regex";
        } else if constexpr (std::is_same_v<T, PrefixRule>) {
            return "prefix";
        } else if constexpr (std::is_same_v<T, SuffixRule>) {
            return "suffix";
        } else if constexpr (std::is_same_v<T, LowercaseRule>) {
            return "lowercase";
        } else if constexpr (std::is_same_v<T, UppercaseRule>) {
            return "uppercase";
        } else if constexpr (std::is_same_v<T, TrimRule>) {
            return "trim";
        } else if constexpr (std::is_same_v<T, NormalizeSpaceRule>) {
            return "normalize_space";
        } else if constexpr (std::is_same_v<T, KebabCaseRule>) {
            return "kebab_case";
        } else if constexpr (std::is_same_v<T, RemoveSpecialRule>) {
            return "remove_special";
        } else if constexpr (std::is_same_v<T, NumberingRule>) {
            return "numbering";
        } else if constexpr (std::is_same_v<T, PatternRule>) {
            return "pattern";
        } else {
            return r.type;
        }
    }, rule);
}
