#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace textdiff {

/**

 Configuration file parser

 An INI dialect with typed values:

     # comment
     [general]
     granularity = "line"        # quoted or bare strings
     ignore_case = false         # booleans
     chunk_size = 1000           # integers
     similarity_threshold = 0.5  # floats

 Keys that appear before the first section header belong to the root
 table. A section name may be dotted ("[a.b]") to address nested tables.
 Tables remember insertion order so that a file can be written back out
 in the order it was read.
*/

struct Value {
    using Table = std::vector<std::pair<std::string, Value>>;
    using Int = int64_t;
    using Float = double;
    using Bool = bool;
    using String = std::string;

    std::variant<Table, Int, Float, Bool, String> v;

    // Comment lines written above the key (or section header) holding this value.
    std::vector<std::string> key_comments;

    // Find or insert `key`. The value must hold a table.
    Value&
    operator[](const std::string& key);

    bool
    contains(const std::string& key);

    // Find a nested value using e.g. "general.granularity"
    std::optional<std::reference_wrapper<Value>>
    lookup_value_by_path(std::string_view dotted_path);

    // Sets a nested value using e.g. set_value_at("general.chunk_size", {Value::Int{100}}),
    // creating intermediate tables. Fails if a non-table is in the way.
    bool
    set_value_at(std::string_view dotted_path, Value value);

    // clang-format off
    bool is_table() const { return std::holds_alternative<Value::Table>(v); }
    bool is_int() const { return std::holds_alternative<Value::Int>(v); }
    bool is_float() const { return std::holds_alternative<Value::Float>(v); }
    bool is_bool() const { return std::holds_alternative<Value::Bool>(v); }
    bool is_string() const { return std::holds_alternative<Value::String>(v); }

    Table& as_table() { return std::get<Value::Table>(v); }
    Int& as_int() { return std::get<Value::Int>(v); }
    Float& as_float() { return std::get<Value::Float>(v); }
    Bool& as_bool() { return std::get<Value::Bool>(v); }
    String& as_string() { return std::get<Value::String>(v); }

    const Table& as_table() const { return std::get<Value::Table>(v); }
    const Int& as_int() const { return std::get<Value::Int>(v); }
    const Float& as_float() const { return std::get<Value::Float>(v); }
    const Bool& as_bool() const { return std::get<Value::Bool>(v); }
    const String& as_string() const { return std::get<Value::String>(v); }
    // clang-format on
};

std::string
repr(const Value& v);

// clang-format off
enum class ParseErrorKind {
    None    = 1 << 0,
    File    = 1 << 1, // File related, could be made more granular
    Parsing = 1 << 2,
};
// clang-format on

struct ParseResult {
    ParseErrorKind kind = ParseErrorKind::None;
    std::string error;

    bool
    is_ok() const {
        return kind == ParseErrorKind::None;
    }

    void
    set_error(std::size_t line, std::string error_message);
};

// Parse the input into a root table.
bool
cfg_parse_value_tree(const std::string& input_data, ParseResult& result, Value& result_obj);

// Load a file and construct a value tree based on the contents
bool
cfg_load_file(const std::string& file_path, ParseResult& result, Value& result_obj);

// Serialize a root table. Scalars in the root are written first, then one
// [section] per nested table.
std::string
cfg_serialize(const Value& value);

}  // namespace textdiff
