#include "config/config.hpp"
#include "output/json_format.hpp"
#include "output/text_format.hpp"
#include "processing/insights.hpp"
#include "processing/stream_diff.hpp"
#include "processing/text_diff.hpp"
#include "util/read_input.hpp"
#include "util/tty.hpp"

#include <getopt.h>

#include <fmt/format.h>

#include <cstdio>
#include <cstdlib>
#include <optional>
#include <string>

#ifndef TEXTDIFF_VERSION
#define TEXTDIFF_VERSION "unknown"
#endif

namespace {

std::optional<double>
parse_threshold(const char* s) {
    char* end = nullptr;
    double value = std::strtod(s, &end);
    if (end == s || *end != '\0' || !(value >= 0.0 && value <= 1.0)) {
        return std::nullopt;
    }
    return value;
}

std::optional<int64_t>
parse_chunk_size(const char* s) {
    char* end = nullptr;
    long long value = std::strtoll(s, &end, 10);
    if (end == s || *end != '\0' || value <= 0) {
        return std::nullopt;
    }
    return static_cast<int64_t>(value);
}

textdiff::DiffResult
run_stream(const textdiff::ProgramOptions& opts, const std::string& original, const std::string& modified) {
    textdiff::StreamDiff stream(original, modified, opts.diff, static_cast<std::size_t>(opts.chunk_size));

    textdiff::DiffResult result;
    textdiff::StreamEvent event;
    while (stream.next(event)) {
        fmt::print(stderr, "progress: {:.1f}%{}\n", event.progress, event.complete ? " (complete)" : "");
        if (event.complete && event.partial_result) {
            result = *event.partial_result;
        }
    }
    return result;
}

}  // namespace

int
main(int argc, char* argv[]) {
    textdiff::ProgramOptions opts;

    auto show_help = [&](const std::string& optional_error_message) {
        std::string help = fmt::format(R"(
Usage: {} [options] <original> <modified>

Compare two texts and classify every unit as unchanged, added, removed or
modified. Arguments are file paths, '-' for stdin, or literal text.

Options:
    -g, --granularity <unit>     character, word, line, sentence or paragraph (default: {})
    -w, --ignore-whitespace      ignore whitespace differences
    -i, --ignore-case            ignore case differences
    -s, --semantic               score and explain modified entries
    -t, --threshold <0..1>       similarity above which a change reads as reworded (default: {})
    -o, --output <format>        text or json (default: {})
    -c, --chunk-size <n>         stream the comparison in chunks of n characters,
                                 reporting progress on stderr
        --summary                append insights and a change summary
        --no-color               never use colors
    -v, --version                show program version and exit
    -h, --help                   show this help message

Examples:
    {} original.txt modified.txt
    {} -g word "old text" "new text"
    echo "text1" | {} - "text2"
)",
                                       argv[0], textdiff::to_string(opts.diff.granularity),
                                       opts.diff.similarity_threshold, textdiff::to_string(opts.output), argv[0],
                                       argv[0], argv[0]);

        help += "\n";
        help += "Config directory:\n    " + textdiff::config_get_directory() + "\n";

        if (!optional_error_message.empty()) {
            fmt::print(stderr, "{}\n{}\n", help, optional_error_message);
        } else {
            fmt::print("{}\n", help);
        }
    };

    auto parse_args = [&](int in_argc, char* in_argv[]) {
        enum LongOnly { kSummary = 1000, kNoColor };

        static struct option long_options[] = {{"granularity", required_argument, 0, 'g'},
                                               {"ignore-whitespace", no_argument, 0, 'w'},
                                               {"ignore-case", no_argument, 0, 'i'},
                                               {"semantic", no_argument, 0, 's'},
                                               {"threshold", required_argument, 0, 't'},
                                               {"output", required_argument, 0, 'o'},
                                               {"chunk-size", required_argument, 0, 'c'},
                                               {"summary", no_argument, 0, kSummary},
                                               {"no-color", no_argument, 0, kNoColor},
                                               {"version", no_argument, 0, 'v'},
                                               {"help", no_argument, 0, 'h'},
                                               {0, 0, 0, 0}};
        int c = 0, option_index = 0;
        while ((c = getopt_long(in_argc, in_argv, "g:wist:o:c:vh", long_options, &option_index)) >= 0) {
            switch (c) {
                case 'v':
                    fmt::print("textdiff v{}\n", TEXTDIFF_VERSION);
                    exit(0);
                case 'h':
                    opts.help = true;
                    return true;
                case 'g': {
                    auto granularity = textdiff::granularity_from_string(optarg);
                    if (!granularity) {
                        show_help(fmt::format("error: invalid granularity '{}'", optarg));
                        return false;
                    }
                    opts.diff.granularity = *granularity;
                } break;
                case 'w':
                    opts.diff.ignore_whitespace = true;
                    break;
                case 'i':
                    opts.diff.ignore_case = true;
                    break;
                case 's':
                    opts.diff.semantic_analysis = true;
                    break;
                case 't': {
                    auto threshold = parse_threshold(optarg);
                    if (!threshold) {
                        show_help(fmt::format("error: threshold must be a number between 0 and 1 ({})", optarg));
                        return false;
                    }
                    opts.diff.similarity_threshold = *threshold;
                } break;
                case 'o': {
                    auto format = textdiff::output_format_from_string(optarg);
                    if (!format) {
                        show_help(fmt::format("error: invalid output format '{}'", optarg));
                        return false;
                    }
                    opts.output = *format;
                } break;
                case 'c': {
                    auto chunk_size = parse_chunk_size(optarg);
                    if (!chunk_size) {
                        show_help(fmt::format("error: chunk size must be a positive integer ({})", optarg));
                        return false;
                    }
                    opts.stream = true;
                    opts.chunk_size = *chunk_size;
                } break;
                case kSummary:
                    opts.summary = true;
                    break;
                case kNoColor:
                    opts.color = false;
                    break;
                case '?':
                    show_help("error: invalid option");
                    return false;
                default:
                    show_help(fmt::format("error: invalid option: -{}", static_cast<char>(c)));
                    return false;
            }
        }

        int positional_count = in_argc - optind;
        if (positional_count != 2) {
            show_help("error: both <original> and <modified> are required");
            return false;
        }

        opts.original = in_argv[optind];
        opts.modified = in_argv[optind + 1];

        if (opts.original == "-" && opts.modified == "-") {
            show_help("error: only one of the texts can be read from stdin");
            return false;
        }
        return true;
    };

    // Load the global defaults before we override them with command line args
    textdiff::config_apply_options(opts);

    if (!parse_args(argc, argv)) {
        return 1;
    }

    if (opts.help) {
        show_help("");
        return 0;
    }

    std::string original_text;
    std::string modified_text;

    auto a_status = textdiff::resolve_input(opts.original, original_text);
    auto b_status = textdiff::resolve_input(opts.modified, modified_text);
    if (a_status != textdiff::InputStatus::kOk || b_status != textdiff::InputStatus::kOk) {
        if (a_status != textdiff::InputStatus::kOk) {
            fmt::print(stderr, "error: original '{}': {}\n", opts.original, textdiff::to_string(a_status));
        }
        if (b_status != textdiff::InputStatus::kOk) {
            fmt::print(stderr, "error: modified '{}': {}\n", opts.modified, textdiff::to_string(b_status));
        }
        return 1;
    }

    auto result = opts.stream ? run_stream(opts, original_text, modified_text)
                              : textdiff::diff(original_text, modified_text, opts.diff);

    if (opts.output == textdiff::OutputFormat::Json) {
        if (opts.summary) {
            fmt::print("{}\n", textdiff::format_json(result, textdiff::compute_insights(result),
                                                     textdiff::summarize_changes(result)));
        } else {
            fmt::print("{}\n", textdiff::format_json(result));
        }
        return 0;
    }

    bool use_color = opts.color && textdiff::tty_get_color_capability() != textdiff::TerminalColorCapability::None;
    if (use_color) {
        fmt::print("{}\n", textdiff::format_text_colored(result, opts.colors));
    } else {
        fmt::print("{}\n", textdiff::format_text(result));
    }

    if (opts.summary) {
        fmt::print("\n{}\n", textdiff::format_insights(textdiff::compute_insights(result),
                                                       textdiff::summarize_changes(result)));
    }

    return 0;
}
