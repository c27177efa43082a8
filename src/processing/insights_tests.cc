#include "processing/insights.hpp"

#include "processing/text_diff.hpp"

#include <doctest.h>

#include <string>
#include <vector>

using namespace textdiff;

namespace {

std::string
numbered_lines(int count, const std::string& prefix = "line") {
    std::string text;
    for (int i = 0; i < count; i++) {
        if (i > 0) {
            text += "\n";
        }
        text += prefix + std::to_string(i);
    }
    return text;
}

ChangeRecord
record(ChangeKind kind) {
    ChangeRecord change;
    change.kind = kind;
    return change;
}

}  // namespace

TEST_CASE("insights") {
    SUBCASE("empty") {
        DiffResult empty;
        auto insights = compute_insights(empty);
        REQUIRE(insights.total_changes == 0);
        REQUIRE(insights.change_percentage == doctest::Approx(0.0));
        REQUIRE(insights.similarity == doctest::Approx(100.0));
        REQUIRE(!insights.largest_change.has_value());

        auto summary = summarize_changes(empty);
        REQUIRE(summary.summary == "No changes detected");
        REQUIRE(summary.impact == Impact::Low);
        REQUIRE(summary.recommendations.empty());
    }

    SUBCASE("mixed") {
        auto result = diff("a\nb\nc\nd", "a\nx\nc\nd\ne");
        auto insights = compute_insights(result);
        REQUIRE(insights.total_changes == 2);
        REQUIRE(insights.change_percentage == doctest::Approx(40.0));
        REQUIRE(insights.similarity == doctest::Approx(60.0));
        REQUIRE(insights.change_distribution == result.stats);
        // Both changes have length one; the first one wins.
        REQUIRE(insights.largest_change->kind == ChangeKind::Modified);

        auto summary = summarize_changes(result);
        REQUIRE(summary.summary == "Added 1 item. Modified 1 item. 3 items unchanged.");
        REQUIRE(summary.impact == Impact::High);
        REQUIRE(summary.recommendations ==
                std::vector<std::string>{"Content expansion detected - verify new information is accurate"});
    }

    SUBCASE("largest_change") {
        auto result = diff("short\nkeep\nx", "tiny\nkeep\na much longer line");
        auto insights = compute_insights(result);
        REQUIRE(*insights.largest_change->modified_text == "a much longer line");
    }

    SUBCASE("empty_change_is_never_largest") {
        // The trailing newline adds one empty line.
        auto result = diff("a", "a\n");
        REQUIRE(result.stats.added == 1);
        auto insights = compute_insights(result);
        REQUIRE(insights.total_changes == 1);
        REQUIRE(!insights.largest_change.has_value());
    }

    SUBCASE("rounding") {
        auto result = diff("a\nb\nc", "a\nb\nz");
        auto insights = compute_insights(result);
        REQUIRE(insights.change_percentage == doctest::Approx(33.33));
        REQUIRE(insights.similarity == doctest::Approx(66.67));
    }

    SUBCASE("impact_levels") {
        REQUIRE(impact_from_ratio(0.0) == Impact::Low);
        REQUIRE(impact_from_ratio(0.09) == Impact::Low);
        REQUIRE(impact_from_ratio(0.1) == Impact::Medium);
        REQUIRE(impact_from_ratio(0.29) == Impact::Medium);
        REQUIRE(impact_from_ratio(0.3) == Impact::High);

        auto low = diff(numbered_lines(20), numbered_lines(19));
        REQUIRE(summarize_changes(low).impact == Impact::Low);
    }

    SUBCASE("reduction") {
        auto result = diff("a\nb\nc", "");
        auto summary = summarize_changes(result);
        REQUIRE(summary.summary == "Removed 3 items.");
        REQUIRE(summary.recommendations.size() == 2);
        REQUIRE(summary.recommendations[0] ==
                "Content reduction detected - verify important information was not lost");
        REQUIRE(summary.recommendations[1] == "Major changes detected - comprehensive review recommended");
    }

    SUBCASE("rewording") {
        auto result = diff("one\ntwo\nthree\nfour", "uno\ndos\nthree\nfour");
        auto summary = summarize_changes(result);
        REQUIRE(result.stats.modified == 2);
        REQUIRE(summary.recommendations ==
                std::vector<std::string>{"Extensive rewording detected - review for meaning preservation"});
        REQUIRE(summary.impact == Impact::High);
    }

    SUBCASE("navigation") {
        std::vector<ChangeRecord> changes = {
            record(ChangeKind::Unchanged), record(ChangeKind::Added),     record(ChangeKind::Unchanged),
            record(ChangeKind::Unchanged), record(ChangeKind::Modified),  record(ChangeKind::Unchanged),
        };
        REQUIRE(*find_next_change(changes, -1) == 1);
        REQUIRE(*find_next_change(changes, 1) == 4);
        REQUIRE(!find_next_change(changes, 4).has_value());
        REQUIRE(*find_previous_change(changes, 4) == 1);
        REQUIRE(*find_previous_change(changes, 6) == 4);
        REQUIRE(!find_previous_change(changes, 1).has_value());
        REQUIRE(all_change_indices(changes) == std::vector<std::size_t>{1, 4});
        REQUIRE(all_change_indices({}).empty());
    }
}
