#include "text_format.hpp"

#include "processing/text_diff.hpp"

#include <doctest.h>

#include <string>

using namespace textdiff;

TEST_CASE("format_text") {
    SUBCASE("plain") {
        auto result = diff("a\nb\nc", "a\nB\nd\ne");
        const std::string expected =
            "  a\n"
            "~ b -> B\n"
            "~ c -> d\n"
            "+ e\n"
            "\n"
            "Statistics:\n"
            "  Added:    1\n"
            "  Removed:  0\n"
            "  Modified: 2\n"
            "  Unchanged: 1";
        REQUIRE(format_text(result) == expected);
    }

    SUBCASE("removed") {
        auto result = diff("a\nb", "a");
        REQUIRE(format_text(result).rfind("  a\n- b\n", 0) == 0);
    }

    SUBCASE("empty") {
        REQUIRE(format_text(DiffResult{}) ==
                "\nStatistics:\n  Added:    0\n  Removed:  0\n  Modified: 0\n  Unchanged: 0");
    }

    SUBCASE("explanations") {
        DiffOptions options;
        options.semantic_analysis = true;
        auto result = diff("The quick fox", "The fast fox", options);
        auto text = format_text(result);
        REQUIRE(text.rfind("~ The quick fox -> The fast fox\n    Reworded with 63% similarity.", 0) == 0);
    }
}

TEST_CASE("format_text_colored") {
    ColorScheme colors;

    SUBCASE("line numbers") {
        auto result = diff("a\nb", "a\nc");
        const std::string expected =
            "   1    1 \033[90m \033[0m a\n"
            "   2    2 \033[33m~\033[0m \033[31mb\033[0m \033[90m->\033[0m \033[32mc\033[0m\n"
            "\n"
            "Statistics:\n"
            "  Added:    0\n"
            "  Removed:  0\n"
            "  Modified: 1\n"
            "  Unchanged: 1";
        REQUIRE(format_text_colored(result, colors) == expected);
    }

    SUBCASE("missing line numbers are blank") {
        auto result = diff("a", "a\nb");
        auto text = format_text_colored(result, colors);
        REQUIRE(text.find("        2 \033[32m+\033[0m \033[32mb\033[0m") != std::string::npos);
    }

    SUBCASE("no prefix without line numbers") {
        DiffOptions options;
        options.granularity = Granularity::Word;
        auto result = diff("one", "two", options);
        auto text = format_text_colored(result, colors);
        REQUIRE(text.rfind("\033[33m~\033[0m", 0) == 0);
    }

    SUBCASE("empty styles print plain text") {
        ColorScheme plain;
        plain.added = TermStyle{};
        plain.removed = TermStyle{};
        plain.modified = TermStyle{};
        plain.context = TermStyle{};

        DiffOptions options;
        options.granularity = Granularity::Word;
        auto result = diff("one", "two", options);
        REQUIRE(format_text_colored(result, plain) == format_text(result));
    }
}

TEST_CASE("format_insights") {
    auto result = diff("a\nb\nc", "a\nx\nc");
    auto text = format_insights(compute_insights(result), summarize_changes(result));
    REQUIRE(text.rfind("Summary:\n  Modified 1 item. 2 items unchanged.\n", 0) == 0);
    REQUIRE(text.find("Impact:     high") != std::string::npos);
    REQUIRE(text.find("Similarity: 66.67%") != std::string::npos);
}
