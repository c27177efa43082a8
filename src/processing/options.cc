#include "processing/options.hpp"

#include <array>
#include <tuple>

using namespace textdiff;

namespace {

// clang-format off
const std::array<std::tuple<Granularity, const char*>, 5> kGranularityNames {{
    { Granularity::Character, "character" },
    { Granularity::Word,      "word" },
    { Granularity::Line,      "line" },
    { Granularity::Sentence,  "sentence" },
    { Granularity::Paragraph, "paragraph" },
}};
// clang-format on

}  // namespace

std::optional<Granularity>
textdiff::granularity_from_string(const std::string& s) {
    for (const auto& [granularity, name] : kGranularityNames) {
        if (s == name) {
            return granularity;
        }
    }
    return std::nullopt;
}

std::string
textdiff::to_string(Granularity granularity) {
    for (const auto& [g, name] : kGranularityNames) {
        if (g == granularity) {
            return name;
        }
    }
    return "line";
}
