#ifndef REQUEST_PARSER_HPP
#define REQUEST_PARSER_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "ArchiveEntry.hpp"
#include "RuleGroup.hpp"

// Limits the request driver enforces before handing work to the core.
struct Settings {
    std::size_t maxEntries = 100000;
};

// Decodes a rename/analyze request: the archive listing plus the client's rule groups.
class RequestParser {
public:
    // Load a request from a JSON file; returns false on I/O or structural errors.
    bool load(const std::string& filePath);
    // Decode an already parsed request document.
    bool parse(const nlohmann::json& data);

    const std::vector<ArchiveEntry>& getEntries() const;
    const std::vector<RuleGroup>& getRuleGroups() const;

private:
    // Decode the listing, dropping entries without a usable path.
    bool parseEntries(const nlohmann::json& entriesArray);
    // Decode grouped rules, dropping structurally invalid groups.
    bool parseGroupArray(const nlohmann::json& groupsArray);
    // Accept the older flat `rules` list as a single global group.
    void parseLegacyRules(const nlohmann::json& data);
    std::optional<RuleGroup> parseGroup(const nlohmann::json& groupJson, std::size_t position) const;
    // Decode the ordered rules of one group; malformed rules become no-ops.
    std::vector<RenameRule> parseRuleArray(const nlohmann::json& rulesArray, const std::string& groupId) const;
    RenameRule parseRule(const nlohmann::json& ruleJson, const std::string& groupId) const;

    std::vector<ArchiveEntry> m_entries;
    std::vector<RuleGroup> m_groups;
};

// Read <configRoot>/config/settings.json when present; defaults otherwise.
bool loadSettings(const std::filesystem::path& configRoot, Settings& settings);

#endif
