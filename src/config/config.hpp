#pragma once

#include "processing/options.hpp"
#include "util/color.hpp"
#include "util/config_parser/config_parser.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace textdiff {

enum class OutputFormat { Text, Json };

std::optional<OutputFormat>
output_format_from_string(const std::string& s);

std::string
to_string(OutputFormat format);

struct ColorScheme {
    // clang-format off
    TermStyle added    = TermStyle { TermColor::kGreen };
    TermStyle removed  = TermStyle { TermColor::kRed };
    TermStyle modified = TermStyle { TermColor::kYellow };
    TermStyle context  = TermStyle { TermColor::kDarkGray };
    // clang-format on
};

struct ProgramOptions {
    bool help = false;

    DiffOptions diff;

    OutputFormat output = OutputFormat::Text;

    // Stream the comparison, reporting progress on stderr.
    bool stream = false;
    int64_t chunk_size = 1000;

    // Append insights and a summary to text output.
    bool summary = false;

    // Only honoured when stdout is a terminal.
    bool color = true;
    ColorScheme colors;

    std::string original;
    std::string modified;
};

std::string
config_get_directory();

// Copy settings from a config table into the options. Keys the table lacks
// are added with the current option values so that the table can be saved
// as a complete config file. Returns the number of values that were
// rejected (wrong type or out of range); those are reported on stderr.
int
config_apply_table(Value& config, ProgramOptions& program_options);

// Load <config dir>/textdiff.conf into the options, creating it with
// default values if it does not exist.
void
config_apply_options(ProgramOptions& program_options);

}  // namespace textdiff
