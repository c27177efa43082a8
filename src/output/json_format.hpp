#pragma once

#include "processing/change.hpp"
#include "processing/insights.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace textdiff {

// Field names follow the camelCase wire format: type, original, modified,
// originalLine, modifiedLine, similarity, explanation, keyWords. Absent
// optional fields are left out.
void
to_json(nlohmann::json& j, const KeyWords& key_words);

void
to_json(nlohmann::json& j, const ChangeRecord& change);

void
to_json(nlohmann::json& j, const ChangeStats& stats);

void
to_json(nlohmann::json& j, const DiffResult& result);

void
to_json(nlohmann::json& j, const DiffInsights& insights);

void
to_json(nlohmann::json& j, const ChangeSummary& summary);

// Pretty printed with two space indentation. Invalid UTF-8 in the texts
// is replaced with U+FFFD.
std::string
format_json(const DiffResult& result);

// The result plus "insights" and "summary" objects.
std::string
format_json(const DiffResult& result, const DiffInsights& insights, const ChangeSummary& summary);

}  // namespace textdiff
