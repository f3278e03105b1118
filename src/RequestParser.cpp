#include "RequestParser.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>
#include <iostream>
#include <system_error>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {
constexpr std::size_t kMaxNumberPadding = 255;
constexpr long long kMaxNumberStart = 1000000000000000LL;

// Integers that fit in a long long; fractions truncate, anything else is nullopt.
std::optional<long long> readInteger(const json& value) {
    if (value.is_number_unsigned()) {
        const auto number = value.get<std::uint64_t>();
        if (number > static_cast<std::uint64_t>(std::numeric_limits<long long>::max())) {
            return std::nullopt;
        }
        return static_cast<long long>(number);
    }
    if (value.is_number_integer()) {
        return value.get<long long>();
    }
    if (value.is_number_float()) {
        // 2^63 is exact as a double; every double below it converts.
        const double number = std::trunc(value.get<double>());
        if (!std::isfinite(number) || number >= 9223372036854775808.0 || number < -9223372036854775808.0) {
            return std::nullopt;
        }
        return static_cast<long long>(number);
    }
    if (value.is_string()) {
        try {
            return std::stoll(value.get<std::string>());
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

// Optional string field; nullopt when absent or not a string.
std::optional<std::string> readString(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

std::string readGroupId(const json& groupJson, std::size_t position) {
    auto it = groupJson.find("id");
    if (it != groupJson.end()) {
        if (it->is_string()) {
            return it->get<std::string>();
        }
        if (it->is_number()) {
            return it->dump();
        }
    }
    return "group-" + std::to_string(position);
}
} // namespace

const std::vector<ArchiveEntry>& RequestParser::getEntries() const {
    return m_entries;
}

const std::vector<RuleGroup>& RequestParser::getRuleGroups() const {
    return m_groups;
}

bool RequestParser::load(const std::string& filePath) {
    std::ifstream requestFile(filePath);
    if (!requestFile) {
        std::cerr << "Failed to open request file: " << filePath << std::endl;
        return false;
    }

    json data;
    try {
        requestFile >> data;
    } catch (const json::parse_error& e) {
        std::cerr << "Failed to parse request file: " << e.what() << std::endl;
        return false;
    }

    return parse(data);
}

bool RequestParser::parse(const json& data) {
    m_entries.clear();
    m_groups.clear();

    if (!data.is_object()) {
        std::cerr << "Invalid request: expected a JSON object." << std::endl;
        return false;
    }

    try {
        if (auto it = data.find("entries"); it != data.end()) {
            if (!parseEntries(*it)) {
                return false;
            }
        } else {
            std::cerr << "Request has no `entries`; nothing to process." << std::endl;
        }

        auto groupsIt = data.find("ruleGroups");
        if (groupsIt != data.end() && !groupsIt->is_null() && !parseGroupArray(*groupsIt)) {
            return false;
        }

        if (m_groups.empty() && (groupsIt == data.end() || groupsIt->is_null() || groupsIt->empty())) {
            parseLegacyRules(data);
        }
    } catch (const json::exception& e) {
        std::cerr << "Invalid request: " << e.what() << std::endl;
        return false;
    }

    std::clog << "Loaded " << m_entries.size() << " entr" << (m_entries.size() == 1 ? "y" : "ies") << " and "
              << m_groups.size() << " rule group(s)." << std::endl;
    return true;
}

void RequestParser::parseLegacyRules(const json& data) {
    auto legacyIt = data.find("rules");
    if (legacyIt == data.end() || !legacyIt->is_array() || legacyIt->empty()) {
        return;
    }

    // A flat rule list is one global group.
    RuleGroup group;
    group.id = "default";
    group.scope = GroupScope::Global;
    group.rules = parseRuleArray(*legacyIt, group.id);
    m_groups.push_back(std::move(group));
}

bool RequestParser::parseEntries(const json& entriesArray) {
    if (!entriesArray.is_array()) {
        std::cerr << "Invalid request: `entries` must be an array." << std::endl;
        return false;
    }

    std::size_t position = 0;
    for (const auto& entryJson : entriesArray) {
        const std::size_t current = position++;
        if (!entryJson.is_object()) {
            std::cerr << "Warning: dropping entry #" << current << ": expected an object." << std::endl;
            continue;
        }

        const auto path = readString(entryJson, "path");
        if (!path || path->empty()) {
            std::cerr << "Warning: dropping entry #" << current << ": missing or invalid `path`." << std::endl;
            continue;
        }

        ArchiveEntry entry;
        entry.path = *path;
        entry.isDirectory = entry.path.back() == '/' || entry.path.back() == '\\';
        if (auto dirIt = entryJson.find("isDirectory"); dirIt != entryJson.end()) {
            if (dirIt->is_boolean()) {
                entry.isDirectory = dirIt->get<bool>();
            } else {
                std::cerr << "Warning: entry `" << entry.path << "` has a non-boolean `isDirectory`; ignoring it."
                          << std::endl;
            }
        }

        if (auto sizeIt = entryJson.find("size"); sizeIt != entryJson.end() && !sizeIt->is_null()) {
            const auto size = readInteger(*sizeIt);
            if (size && *size >= 0) {
                entry.size = static_cast<std::uint64_t>(*size);
            } else {
                std::cerr << "Warning: entry `" << entry.path << "` has an invalid `size`; using 0." << std::endl;
            }
        }

        m_entries.push_back(std::move(entry));
    }

    return true;
}

bool RequestParser::parseGroupArray(const json& groupsArray) {
    if (!groupsArray.is_array()) {
        std::cerr << "Invalid request: `ruleGroups` must be an array." << std::endl;
        return false;
    }

    std::size_t position = 0;
    for (const auto& groupJson : groupsArray) {
        if (auto group = parseGroup(groupJson, position++)) {
            m_groups.push_back(std::move(*group));
        }
    }
    return true;
}

std::optional<RuleGroup> RequestParser::parseGroup(const json& groupJson, std::size_t position) const {
    if (!groupJson.is_object()) {
        std::cerr << "Warning: dropping rule group #" << position << ": expected an object." << std::endl;
        return std::nullopt;
    }

    RuleGroup group;
    group.id = readGroupId(groupJson, position);

    const std::string scopeName = readString(groupJson, "scope").value_or("global");
    const auto scope = parseGroupScope(scopeName);
    if (!scope) {
        std::cerr << "Warning: dropping rule group `" << group.id << "`: unknown scope `" << scopeName << "`."
                  << std::endl;
        return std::nullopt;
    }
    group.scope = *scope;

    group.scopeValue = readString(groupJson, "scopeValue").value_or("");
    if ((group.scope == GroupScope::Extension || group.scope == GroupScope::Folder) && group.scopeValue.empty()) {
        std::cerr << "Warning: dropping rule group `" << group.id << "`: scope `" << scopeName
                  << "` requires a `scopeValue`." << std::endl;
        return std::nullopt;
    }

    if (auto excludeIt = groupJson.find("exclude"); excludeIt != groupJson.end() && excludeIt->is_boolean()) {
        group.exclude = excludeIt->get<bool>();
    }

    if (auto rulesIt = groupJson.find("rules"); rulesIt != groupJson.end()) {
        group.rules = parseRuleArray(*rulesIt, group.id);
    }
    return group;
}

std::vector<RenameRule> RequestParser::parseRuleArray(const json& rulesArray, const std::string& groupId) const {
    std::vector<RenameRule> rules;
    if (!rulesArray.is_array()) {
        std::cerr << "Warning: `rules` of group `" << groupId << "` is not an array; the group has no rules."
                  << std::endl;
        return rules;
    }

    for (const auto& ruleJson : rulesArray) {
        rules.push_back(parseRule(ruleJson, groupId));
    }
    return rules;
}

RenameRule RequestParser::parseRule(const json& ruleJson, const std::string& groupId) const {
    if (!ruleJson.is_object()) {
        std::cerr << "Warning: ignoring non-object rule in group `" << groupId << "`." << std::endl;
        return UnknownRule{};
    }

    const std::string type = readString(ruleJson, "type").value_or("");
    auto missing = [&](const char* field) -> RenameRule {
        std::cerr << "Warning: ignoring `" << type << "` rule in group `" << groupId << "`: missing `" << field
                  << "`." << std::endl;
        return UnknownRule{type};
    };

    if (type == "replace") {
        auto find = readString(ruleJson, "find");
        if (!find) {
            return missing("find");
        }
        return ReplaceRule{*find, readString(ruleJson, "replace").value_or("")};
    }
    if (type == "regex") {
        auto pattern = readString(ruleJson, "pattern");
        if (!pattern) {
            return missing("pattern");
        }
        auto rule = makeRegexRule(*pattern, readString(ruleJson, "flags").value_or("g"),
                                  readString(ruleJson, "replace").value_or(""));
        if (!rule) {
            return UnknownRule{type};
        }
        return std::move(*rule);
    }
    if (type == "prefix" || type == "suffix") {
        auto text = readString(ruleJson, "text");
        if (!text) {
            return missing("text");
        }
        if (type == "prefix") {
            return PrefixRule{*text};
        }
        return SuffixRule{*text};
    }
    if (type == "lowercase") {
        return LowercaseRule{};
    }
    if (type == "uppercase") {
        return UppercaseRule{};
    }
    if (type == "trim") {
        return TrimRule{};
    }
    if (type == "normalize_space") {
        return NormalizeSpaceRule{};
    }
    if (type == "kebab_case") {
        return KebabCaseRule{};
    }
    if (type == "remove_special") {
        return RemoveSpecialRule{};
    }
    if (type == "numbering") {
        NumberingRule rule;
        if (auto it = ruleJson.find("start"); it != ruleJson.end()) {
            const auto start = readInteger(*it);
            if (!start) {
                std::cerr << "Warning: numbering rule in group `" << groupId << "` has an unusable `start`; using "
                          << rule.start << "." << std::endl;
            } else if (*start > kMaxNumberStart || *start < -kMaxNumberStart) {
                rule.start = std::clamp(*start, -kMaxNumberStart, kMaxNumberStart);
                std::cerr << "Warning: numbering rule in group `" << groupId << "` has `start` out of range; using "
                          << rule.start << "." << std::endl;
            } else {
                rule.start = *start;
            }
        }
        if (auto it = ruleJson.find("padding"); it != ruleJson.end()) {
            const long long padding = readInteger(*it).value_or(1);
            rule.padding = padding < 0 ? 0 : std::min(static_cast<std::size_t>(padding), kMaxNumberPadding);
        }
        if (auto separator = readString(ruleJson, "separator"); separator && !separator->empty()) {
            rule.separator = *separator;
        }
        rule.atStart = readString(ruleJson, "position").value_or("end") == "start";
        return rule;
    }
    if (type == "pattern") {
        auto pattern = readString(ruleJson, "pattern");
        if (!pattern) {
            return missing("pattern");
        }
        return PatternRule{*pattern};
    }

    std::cerr << "Warning: ignoring unknown rule type `" << type << "` in group `" << groupId << "`." << std::endl;
    return UnknownRule{type};
}

bool loadSettings(const std::filesystem::path& configRoot, Settings& settings) {
    const std::filesystem::path settingsPath = configRoot / "config" / "settings.json";

    std::error_code ec;
    if (!std::filesystem::exists(settingsPath, ec)) {
        if (ec) {
            std::cerr << "Unable to check settings file `" << settingsPath.string() << "`: " << ec.message()
                      << std::endl;
            return false;
        }
        return true;
    }

    std::ifstream settingsFile(settingsPath);
    if (!settingsFile) {
        std::cerr << "Failed to open settings file: " << settingsPath << std::endl;
        return false;
    }

    json data;
    try {
        settingsFile >> data;
    } catch (const json::parse_error& e) {
        std::cerr << "Failed to parse settings file: " << e.what() << std::endl;
        return false;
    }

    if (auto it = data.find("max_entries"); it != data.end()) {
        const auto maxEntries = readInteger(*it);
        if (!maxEntries || *maxEntries <= 0) {
            std::cerr << "`max_entries` must be a positive integer." << std::endl;
            return false;
        }
        settings.maxEntries = static_cast<std::size_t>(*maxEntries);
    }

    std::clog << "Loaded settings from " << settingsPath << std::endl;
    return true;
}
