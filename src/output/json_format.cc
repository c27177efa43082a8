#include "json_format.hpp"

using json = nlohmann::json;

using namespace textdiff;

void
textdiff::to_json(json& j, const KeyWords& key_words) {
    j = json{{"added", key_words.added}, {"removed", key_words.removed}};
}

void
textdiff::to_json(json& j, const ChangeRecord& change) {
    j = json::object();
    j["type"] = to_string(change.kind);
    if (change.original_text) {
        j["original"] = *change.original_text;
    }
    if (change.modified_text) {
        j["modified"] = *change.modified_text;
    }
    if (change.original_line) {
        j["originalLine"] = *change.original_line;
    }
    if (change.modified_line) {
        j["modifiedLine"] = *change.modified_line;
    }
    if (change.similarity) {
        j["similarity"] = *change.similarity;
    }
    if (change.explanation) {
        j["explanation"] = *change.explanation;
    }
    if (change.key_words) {
        j["keyWords"] = *change.key_words;
    }
}

void
textdiff::to_json(json& j, const ChangeStats& stats) {
    j = json{
        {"added", stats.added},
        {"removed", stats.removed},
        {"modified", stats.modified},
        {"unchanged", stats.unchanged},
    };
}

void
textdiff::to_json(json& j, const DiffResult& result) {
    j = json::object();
    j["changes"] = json::array();
    for (const auto& change : result.changes) {
        j["changes"].push_back(change);
    }
    j["stats"] = result.stats;
}

void
textdiff::to_json(json& j, const DiffInsights& insights) {
    j = json::object();
    j["totalChanges"] = insights.total_changes;
    j["changePercentage"] = insights.change_percentage;
    j["similarity"] = insights.similarity;
    j["largestChange"] = insights.largest_change ? json(*insights.largest_change) : json(nullptr);
    j["changeDistribution"] = insights.change_distribution;
}

void
textdiff::to_json(json& j, const ChangeSummary& summary) {
    j = json{
        {"summary", summary.summary},
        {"changeTypes", summary.change_types},
        {"impact", to_string(summary.impact)},
        {"recommendations", summary.recommendations},
    };
}

std::string
textdiff::format_json(const DiffResult& result) {
    return json(result).dump(2, ' ', false, json::error_handler_t::replace);
}

std::string
textdiff::format_json(const DiffResult& result, const DiffInsights& insights, const ChangeSummary& summary) {
    json j = result;
    j["insights"] = insights;
    j["summary"] = summary;
    return j.dump(2, ' ', false, json::error_handler_t::replace);
}
