#include "config_parser.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <tuple>

#define TRACE_ENABLE 0
#define TRACE(...)               \
    if (TRACE_ENABLE) {          \
        fmt::print(__VA_ARGS__); \
    }

using namespace textdiff;

namespace internal {

std::tuple<std::string_view, std::string_view>
str_split2(const std::string_view s, char delimiter) {
    auto pos = s.find(delimiter);
    if (pos == std::string::npos) {
        return std::make_tuple(s, "");
    }

    return std::make_tuple(s.substr(0, pos), s.substr(pos + 1, std::string::npos));
}

bool
is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r';
}

std::string_view
strip(std::string_view s) {
    while (!s.empty() && is_space(s.front())) {
        s.remove_prefix(1);
    }
    while (!s.empty() && is_space(s.back())) {
        s.remove_suffix(1);
    }
    return s;
}

bool
is_key_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' || c == '-' ||
           c == '.';
}

bool
is_valid_key(std::string_view key) {
    return !key.empty() && std::all_of(key.begin(), key.end(), is_key_char) && key.front() != '.' &&
           key.back() != '.' && key.find("..") == std::string_view::npos;
}

// Position of a '#' that starts a comment, skipping quoted text.
std::string_view::size_type
find_comment(std::string_view s) {
    char quote = 0;
    for (std::string_view::size_type i = 0; i < s.size(); i++) {
        char c = s[i];
        if (quote) {
            if (c == '\\' && quote == '"') {
                i++;
            } else if (c == quote) {
                quote = 0;
            }
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            return i;
        }
    }
    return std::string_view::npos;
}

bool
parse_quoted(std::string_view s, std::string& out) {
    char quote = s.front();
    out.clear();
    for (std::string_view::size_type i = 1; i < s.size(); i++) {
        char c = s[i];
        if (c == quote) {
            return i == s.size() - 1;
        }
        if (c == '\\' && quote == '"' && i + 1 < s.size()) {
            char next = s[++i];
            switch (next) {
                case 'n':
                    out += '\n';
                    break;
                case 't':
                    out += '\t';
                    break;
                default:
                    out += next;
                    break;
            }
            continue;
        }
        out += c;
    }
    return false;
}

bool
parse_value(std::string_view s, Value& value, std::string& error) {
    if (s.empty()) {
        error = "missing value";
        return false;
    }

    if (s.front() == '"' || s.front() == '\'') {
        std::string str;
        if (!parse_quoted(s, str)) {
            error = "unterminated string";
            return false;
        }
        value.v = Value::String{str};
        return true;
    }

    if (s == "true" || s == "false") {
        value.v = Value::Bool{s == "true"};
        return true;
    }

    const char* first = s.data();
    const char* last = s.data() + s.size();

    Value::Int i = 0;
    if (auto [ptr, ec] = std::from_chars(first, last, i); ec == std::errc() && ptr == last) {
        value.v = Value::Int{i};
        return true;
    }

    if (s.find_first_of(".eE") != std::string_view::npos) {
        std::string number{s};
        char* end = nullptr;
        double d = std::strtod(number.c_str(), &end);
        if (end == number.c_str() + number.size()) {
            value.v = Value::Float{d};
            return true;
        }
    }

    // Anything else is a bare word
    value.v = Value::String{std::string{s}};
    return true;
}

std::string
quote(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                out += c;
                break;
        }
    }
    return out + "\"";
}

void
serialize_comments(const Value& value, std::string& output) {
    for (const auto& comment : value.key_comments) {
        output += comment;
        if (!comment.empty() && comment.back() != '\n') {
            output += '\n';
        }
    }
}

void
serialize_table(const Value& table, const std::string& path, std::string& output) {
    for (const auto& [key, value] : table.as_table()) {
        if (value.is_table()) {
            continue;
        }
        serialize_comments(value, output);
        output += fmt::format("{} = {}\n", key, repr(value));
    }

    for (const auto& [key, value] : table.as_table()) {
        if (!value.is_table()) {
            continue;
        }
        auto section = path.empty() ? key : fmt::format("{}.{}", path, key);
        if (!output.empty()) {
            output += '\n';
        }
        serialize_comments(value, output);
        output += fmt::format("[{}]\n", section);
        serialize_table(value, section, output);
    }
}

}  // namespace internal

Value&
Value::operator[](const std::string& key) {
    auto& table = as_table();
    auto it = std::find_if(table.begin(), table.end(), [&](const auto& entry) { return entry.first == key; });
    if (it != table.end()) {
        return it->second;
    }
    table.emplace_back(key, Value{});
    return table.back().second;
}

bool
Value::contains(const std::string& key) {
    if (!is_table()) {
        return false;
    }
    const auto& table = as_table();
    return std::any_of(table.begin(), table.end(), [&](const auto& entry) { return entry.first == key; });
}

std::optional<std::reference_wrapper<Value>>
Value::lookup_value_by_path(std::string_view dotted_path) {
    Value* result_value = this;
    std::string_view remaining{dotted_path};
    while (!remaining.empty()) {
        auto [head, rest] = internal::str_split2(remaining, '.');
        std::string key{head};
        if (!result_value->contains(key)) {
            return std::nullopt;
        }
        result_value = &(*result_value)[key];
        remaining = rest;
    }
    return std::reference_wrapper(*result_value);
}

bool
Value::set_value_at(std::string_view dotted_path, Value value) {
    Value* iter = this;
    std::string_view remaining{dotted_path};
    while (true) {
        if (!iter->is_table()) {
            return false;
        }

        auto [head, rest] = internal::str_split2(remaining, '.');
        std::string key{head};
        if (key.empty()) {
            return false;
        }

        if (rest.empty()) {
            auto& slot = (*iter)[key];
            if (value.key_comments.empty()) {
                value.key_comments = std::move(slot.key_comments);
            }
            slot = std::move(value);
            return true;
        }

        iter = &(*iter)[key];
        remaining = rest;
    }
}

std::string
textdiff::repr(const Value& v) {
    if (v.is_table()) {
        return "{...}";
    } else if (v.is_int()) {
        return fmt::format("{}", v.as_int());
    } else if (v.is_float()) {
        // Keep a decimal point so the value reads back as a float.
        auto s = fmt::format("{}", v.as_float());
        if (s.find_first_of(".eEn") == std::string::npos) {
            s += ".0";
        }
        return s;
    } else if (v.is_bool()) {
        return v.as_bool() ? "true" : "false";
    }
    return internal::quote(v.as_string());
}

void
ParseResult::set_error(std::size_t line, std::string error_message) {
    kind = ParseErrorKind::Parsing;
    error = fmt::format("line {}: {}", line, error_message);
}

bool
textdiff::cfg_parse_value_tree(const std::string& input_data, ParseResult& result, Value& result_obj) {
    result = ParseResult{};
    result_obj = Value{};

    Value* section = &result_obj;
    std::vector<std::string> pending_comments;

    std::istringstream stream(input_data);
    std::string raw_line;
    std::size_t line_number = 0;

    while (std::getline(stream, raw_line)) {
        line_number++;
        std::string_view line = internal::strip(raw_line);

        if (line.empty()) {
            continue;
        }

        if (line.front() == '#') {
            pending_comments.emplace_back(line);
            continue;
        }

        if (auto comment = internal::find_comment(line); comment != std::string_view::npos) {
            line = internal::strip(line.substr(0, comment));
        }

        if (line.front() == '[') {
            if (line.back() != ']') {
                result.set_error(line_number, "expected ']' to close the section header");
                return false;
            }
            auto name = internal::strip(line.substr(1, line.size() - 2));
            if (!internal::is_valid_key(name)) {
                result.set_error(line_number, fmt::format("invalid section name '{}'", name));
                return false;
            }

            TRACE("section '{}'\n", name);

            auto existing = result_obj.lookup_value_by_path(name);
            if (!existing) {
                result_obj.set_value_at(name, Value{});
                existing = result_obj.lookup_value_by_path(name);
            }
            if (!existing || !existing->get().is_table()) {
                result.set_error(line_number, fmt::format("'{}' is not a section", name));
                return false;
            }
            section = &existing->get();
            std::move(pending_comments.begin(), pending_comments.end(), std::back_inserter(section->key_comments));
            pending_comments.clear();
            continue;
        }

        auto [raw_key, raw_value] = internal::str_split2(line, '=');
        if (raw_key.size() == line.size()) {
            result.set_error(line_number, "expected 'key = value'");
            return false;
        }

        auto key = internal::strip(raw_key);
        if (!internal::is_valid_key(key) || key.find('.') != std::string_view::npos) {
            result.set_error(line_number, fmt::format("invalid key '{}'", key));
            return false;
        }

        Value value;
        std::string error;
        if (!internal::parse_value(internal::strip(raw_value), value, error)) {
            result.set_error(line_number, fmt::format("{} for key '{}'", error, key));
            return false;
        }

        TRACE("  {} = {}\n", key, repr(value));

        value.key_comments = std::move(pending_comments);
        pending_comments.clear();
        (*section)[std::string{key}] = std::move(value);
    }

    return true;
}

bool
textdiff::cfg_load_file(const std::string& file_path, ParseResult& result, Value& result_obj) {
    std::error_code ec;
    if (!std::filesystem::exists(file_path, ec)) {
        result.kind = ParseErrorKind::File;
        result.error = "File does not exist";
        return false;
    }

    if (!std::filesystem::is_regular_file(file_path, ec)) {
        result.kind = ParseErrorKind::File;
        result.error = "File is not a regular file";
        return false;
    }

    std::ifstream ifs(file_path, std::ios::in | std::ios::binary);
    if (!ifs.is_open()) {
        result.kind = ParseErrorKind::File;
        result.error = "Failed to open file for reading";
        return false;
    }

    std::stringstream buffer;
    buffer << ifs.rdbuf();

    return cfg_parse_value_tree(buffer.str(), result, result_obj);
}

std::string
textdiff::cfg_serialize(const Value& value) {
    std::string output;
    if (value.is_table()) {
        internal::serialize_table(value, "", output);
    }
    return output;
}
