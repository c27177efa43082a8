#include "config.hpp"

#include <fmt/format.h>
#include <sago/platform_folders.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <string>
#include <tuple>
#include <vector>

using namespace textdiff;

static std::string config_doc_general = R"foo(# General configuration for `textdiff`
#
# Configure default options. These can be overriden with command-line arguments.
#
#   granularity:          character, word, line, sentence or paragraph
#   similarity_threshold: 0.0 - 1.0, similarity above which a modified
#                         entry is explained as reworded
#   output:               text or json
#   chunk_size:           code points per chunk when streaming (-c)
#)foo";

static std::string config_doc_colors = R"foo(# Colors
#
# Each entry is an optional color followed by attributes, or the reverse.
# Supported colors are palette names and hex RGB colors:
#   '#RGB' and '#RRGGBB'. I.e '#F00' or '#FF0000' for bright red.
#
# Available color names (16 color palette SGR colors):
#   default, black, red, green, yellow, blue, magenta, cyan, light_gray,
#   dark_gray, light_red, light_green, light_yellow, light_blue,
#   light_magenta, light_cyan, white
#
# Available attributes:
#   'bold', 'dim', 'italic', 'underline', 'inverse', 'strikethrough'
#)foo";

enum class ConfigVariableType {
    Bool,
    Int,
    Float,
    String,
    Style,
};

enum class ConfigLoadResult {
    Ok,
    Invalid,
    DoesNotExist,
};

std::optional<OutputFormat>
textdiff::output_format_from_string(const std::string& s) {
    if (s == "text") {
        return OutputFormat::Text;
    } else if (s == "json") {
        return OutputFormat::Json;
    }
    return {};
}

std::string
textdiff::to_string(OutputFormat format) {
    switch (format) {
        case OutputFormat::Text:
            return "text";
        case OutputFormat::Json:
            return "json";
    }
    return "text";
}

std::string
textdiff::config_get_directory() {
    return fmt::format("{}/textdiff", sago::getConfigHome());
}

static ConfigLoadResult
config_load_file(const std::string& config_path, Value& config_table, ParseResult& load_result) {
    if (cfg_load_file(config_path, load_result, config_table)) {
        return ConfigLoadResult::Ok;
    }
    if (load_result.kind == ParseErrorKind::File) {
        return ConfigLoadResult::DoesNotExist;
    }
    return ConfigLoadResult::Invalid;
}

static void
config_save(const std::string& config_root, const std::string& config_path, const Value& config_value) {
    std::error_code ec;
    std::filesystem::create_directories(config_root, ec);
    if (ec) {
        fmt::print(stderr, "warning: failed to create '{}': {}\n", config_root, ec.message());
        return;
    }

    FILE* f = fopen(config_path.c_str(), "wb");
    if (!f) {
        fmt::print(stderr, "warning: failed to open '{}' for writing.\n", config_path);
        fmt::print(stderr, "   errno ({}) = {}\n", errno, strerror(errno));
        return;
    }

    std::string serialized = cfg_serialize(config_value);
    fwrite(serialized.c_str(), serialized.size(), 1, f);
    fclose(f);
}

using OptionVector = std::vector<std::tuple<std::string, ConfigVariableType, void*>>;

static int
config_sync_options(Value& config, const OptionVector& options) {
    int rejected = 0;

    auto reject = [&](const std::string& path, const char* expected) {
        fmt::print(stderr, "warning: ignoring config value '{}': expected {}\n", path, expected);
        rejected++;
    };

    for (const auto& [path, type, ptr] : options) {
        // Do we have a value for this option in the config we loaded?
        if (auto stored_value = config.lookup_value_by_path(path); stored_value) {
            // Yes. So we take the value and write it into our settings struct.
            auto& value = stored_value->get();
            switch (type) {
                case ConfigVariableType::Bool: {
                    if (value.is_bool()) {
                        *((bool*) ptr) = value.as_bool();
                    } else {
                        reject(path, "true or false");
                    }
                } break;
                case ConfigVariableType::Int: {
                    if (value.is_int()) {
                        *((int64_t*) ptr) = value.as_int();
                    } else {
                        reject(path, "an integer");
                    }
                } break;
                case ConfigVariableType::Float: {
                    if (value.is_float()) {
                        *((double*) ptr) = value.as_float();
                    } else if (value.is_int()) {
                        *((double*) ptr) = (double) value.as_int();
                    } else {
                        reject(path, "a number");
                    }
                } break;
                case ConfigVariableType::String: {
                    if (value.is_string()) {
                        *((std::string*) ptr) = value.as_string();
                    } else {
                        reject(path, "a string");
                    }
                } break;
                case ConfigVariableType::Style: {
                    auto style = value.is_string() ? TermStyle::parse_string(value.as_string()) : std::nullopt;
                    if (style) {
                        *((TermStyle*) ptr) = *style;
                    } else {
                        reject(path, "a color and attributes, e.g. 'bold green'");
                    }
                } break;
            }
        } else {
            // No such setting in the stored file, so we store the default value
            // from the struct.
            switch (type) {
                case ConfigVariableType::Bool: {
                    config.set_value_at(path, {Value::Bool{*(bool*) ptr}});
                } break;
                case ConfigVariableType::Int: {
                    config.set_value_at(path, {Value::Int{*(int64_t*) ptr}});
                } break;
                case ConfigVariableType::Float: {
                    config.set_value_at(path, {Value::Float{*(double*) ptr}});
                } break;
                case ConfigVariableType::String: {
                    config.set_value_at(path, {Value::String{*(std::string*) ptr}});
                } break;
                case ConfigVariableType::Style: {
                    config.set_value_at(path, {Value::String{((TermStyle*) ptr)->to_string()}});
                } break;
            }
        }
    }
    return rejected;
}

int
textdiff::config_apply_table(Value& config, ProgramOptions& program_options) {
    std::string granularity = to_string(program_options.diff.granularity);
    std::string output = to_string(program_options.output);
    double threshold = program_options.diff.similarity_threshold;
    int64_t chunk_size = program_options.chunk_size;

    auto& colors = program_options.colors;

    // clang-format off
    const OptionVector options = {
        { "general.granularity",          ConfigVariableType::String, &granularity },
        { "general.ignore_whitespace",    ConfigVariableType::Bool,   &program_options.diff.ignore_whitespace },
        { "general.ignore_case",          ConfigVariableType::Bool,   &program_options.diff.ignore_case },
        { "general.semantic_analysis",    ConfigVariableType::Bool,   &program_options.diff.semantic_analysis },
        { "general.similarity_threshold", ConfigVariableType::Float,  &threshold },
        { "general.chunk_size",           ConfigVariableType::Int,    &chunk_size },
        { "general.output",               ConfigVariableType::String, &output },

        { "colors.added",                 ConfigVariableType::Style,  &colors.added },
        { "colors.removed",               ConfigVariableType::Style,  &colors.removed },
        { "colors.modified",              ConfigVariableType::Style,  &colors.modified },
        { "colors.context",               ConfigVariableType::Style,  &colors.context },
    };
    // clang-format on

    int rejected = config_sync_options(config, options);

    if (auto g = granularity_from_string(granularity); g) {
        program_options.diff.granularity = *g;
    } else {
        fmt::print(stderr, "warning: ignoring unknown granularity '{}' in config\n", granularity);
        rejected++;
    }

    if (auto o = output_format_from_string(output); o) {
        program_options.output = *o;
    } else {
        fmt::print(stderr, "warning: ignoring unknown output format '{}' in config\n", output);
        rejected++;
    }

    if (threshold >= 0.0 && threshold <= 1.0) {
        program_options.diff.similarity_threshold = threshold;
    } else {
        fmt::print(stderr, "warning: ignoring similarity_threshold {}: must be between 0 and 1\n", threshold);
        rejected++;
    }

    if (chunk_size > 0) {
        program_options.chunk_size = chunk_size;
    } else {
        fmt::print(stderr, "warning: ignoring chunk_size {}: must be positive\n", chunk_size);
        rejected++;
    }

    return rejected;
}

void
textdiff::config_apply_options(ProgramOptions& program_options) {
    const std::string config_file_name = "textdiff.conf";
    const std::string config_root = config_get_directory();
    const std::string config_path = fmt::format("{}/{}", config_root, config_file_name);

    bool flush_config_to_disk = false;

    ParseResult config_parse_result;
    Value config_file_table_value;
    switch (config_load_file(config_path, config_file_table_value, config_parse_result)) {
        case ConfigLoadResult::Ok: {
        } break;
        case ConfigLoadResult::Invalid: {
            fmt::print(stderr, "error: {}\n\twhile parsing: {}\n", config_parse_result.error, config_path);
            // Options keep their built-in defaults.
            return;
        }
        case ConfigLoadResult::DoesNotExist: {
            fmt::print(stderr, "warning: could not find default config. creating file:\n\t{}\n", config_path);
            flush_config_to_disk = true;
        } break;
    }

    config_apply_table(config_file_table_value, program_options);

    // Write the configuration to disk with default settings
    if (flush_config_to_disk) {
        config_file_table_value["general"].key_comments.push_back(config_doc_general);
        config_file_table_value["colors"].key_comments.push_back(config_doc_colors);
        config_save(config_root, config_path, config_file_table_value);
    }
}
