#include "config.hpp"

#include <doctest.h>

#include <string>

using namespace textdiff;

namespace {

Value
parse(const std::string& input) {
    ParseResult result;
    Value value;
    REQUIRE(cfg_parse_value_tree(input, result, value));
    return value;
}

}  // namespace

TEST_CASE("config") {
    ProgramOptions options;

    SUBCASE("an empty table is filled with defaults") {
        Value config;
        REQUIRE(config_apply_table(config, options) == 0);

        REQUIRE(config.lookup_value_by_path("general.granularity")->get().as_string() == "line");
        REQUIRE(config.lookup_value_by_path("general.ignore_case")->get().as_bool() == false);
        REQUIRE(config.lookup_value_by_path("general.similarity_threshold")->get().as_float() ==
                doctest::Approx(0.5));
        REQUIRE(config.lookup_value_by_path("general.chunk_size")->get().as_int() == 1000);
        REQUIRE(config.lookup_value_by_path("general.output")->get().as_string() == "text");
        REQUIRE(config.lookup_value_by_path("colors.added")->get().as_string() == "green");
        REQUIRE(config.lookup_value_by_path("colors.context")->get().as_string() == "dark_gray");

        REQUIRE(options.diff.granularity == Granularity::Line);
        REQUIRE(options.output == OutputFormat::Text);
    }

    SUBCASE("values are applied") {
        auto config = parse(R"(
[general]
granularity = word
ignore_whitespace = true
ignore_case = true
semantic_analysis = true
similarity_threshold = 1
chunk_size = 64
output = "json"

[colors]
added = "bold #00ff00"
removed = "underline red"
)");
        REQUIRE(config_apply_table(config, options) == 0);

        REQUIRE(options.diff.granularity == Granularity::Word);
        REQUIRE(options.diff.ignore_whitespace);
        REQUIRE(options.diff.ignore_case);
        REQUIRE(options.diff.semantic_analysis);
        REQUIRE(options.diff.similarity_threshold == doctest::Approx(1.0));
        REQUIRE(options.chunk_size == 64);
        REQUIRE(options.output == OutputFormat::Json);

        REQUIRE(options.colors.added.attr == TermStyle::Attribute::Bold);
        REQUIRE(options.colors.added.fg == TermColor(TermColor::Kind::Color24bit, 0, 0xff, 0));
        REQUIRE(options.colors.removed.fg == TermColor::kRed);
        REQUIRE(options.colors.modified.fg == TermColor::kYellow);
    }

    SUBCASE("bad values keep the defaults") {
        auto config = parse(R"(
[general]
granularity = "chapter"
ignore_case = "yes"
similarity_threshold = 1.5
chunk_size = 0
output = xml

[colors]
added = "chartreuse"
)");
        REQUIRE(config_apply_table(config, options) == 6);

        REQUIRE(options.diff.granularity == Granularity::Line);
        REQUIRE_FALSE(options.diff.ignore_case);
        REQUIRE(options.diff.similarity_threshold == doctest::Approx(0.5));
        REQUIRE(options.chunk_size == 1000);
        REQUIRE(options.output == OutputFormat::Text);
        REQUIRE(options.colors.added.fg == TermColor::kGreen);
    }

    SUBCASE("names") {
        REQUIRE(output_format_from_string("json") == OutputFormat::Json);
        REQUIRE_FALSE(output_format_from_string("yaml"));
        REQUIRE(to_string(OutputFormat::Text) == "text");
    }
}
