#ifndef JSON_REPORT_HPP
#define JSON_REPORT_HPP

#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "ArchiveAnalyzer.hpp"
#include "RenameEngine.hpp"

// JSON shapes handed back to the request layer.
nlohmann::json toJson(const AnalysisReport& report);
nlohmann::json toJson(const std::vector<RenameResult>& results);

#endif
