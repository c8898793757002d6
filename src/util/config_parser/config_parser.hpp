#pragma once

#include "config_tokenizer.hpp"
#include "ordered_map.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace patchy {

/*
    Configuration language parser

    An INI file with typed values: `[section]` headers, `key = value` pairs,
    quoted strings, integers, booleans and `#` comments.

        # Applied to every diff
        [general]
            strip = 1
            fixup_policy = 'on-edit'

    The token stream is turned into a linear set of tree builder
    instructions,

        KEY 'general'
        TABLE_START
            KEY 'strip'
            VALUE 1
            ...
        TABLE_END

    which cfg_parse_value_tree folds into a Value tree. Comments travel as
    instructions too, so a loaded file can be written back with them.
*/

// Tree builder value type
enum class TbValueType {
    None,
    Int,
    Bool,
    String,
};

// Tree builder operator
enum class TbOperator {
    Key,
    Value,
    TableStart,
    TableEnd,
    Comment,
};

// Tree builder instruction
struct TbInstruction {
    TbOperator op = TbOperator::Comment;
    TbValueType oparg_type = TbValueType::None;
    std::string oparg_string;
    std::int64_t oparg_int = 0;
    bool oparg_bool = false;

    // Comment on a line of its own, as opposed to trailing a value.
    bool first_on_line = false;

    static TbInstruction
    Key(const std::string& key) {
        return {TbOperator::Key, TbValueType::None, key};
    }

    static TbInstruction
    TableStart() {
        return {TbOperator::TableStart};
    }

    static TbInstruction
    TableEnd() {
        return {TbOperator::TableEnd};
    }

    static TbInstruction
    Comment(const std::string& comment, bool first_on_line) {
        TbInstruction ins{TbOperator::Comment, TbValueType::None, comment};
        ins.first_on_line = first_on_line;
        return ins;
    }

    static TbInstruction
    Value(const std::string& value) {
        return {TbOperator::Value, TbValueType::String, value};
    }

    static TbInstruction
    Value(const char* value) {
        return {TbOperator::Value, TbValueType::String, value};
    }

    static TbInstruction
    Value(std::int64_t value) {
        return {TbOperator::Value, TbValueType::Int, {}, value};
    }

    static TbInstruction
    Value(bool value) {
        return {TbOperator::Value, TbValueType::Bool, {}, 0, value};
    }

    bool
    operator==(const TbInstruction& other) const {
        return op == other.op && oparg_type == other.oparg_type && oparg_string == other.oparg_string &&
               oparg_int == other.oparg_int && oparg_bool == other.oparg_bool;
    }
};

struct Value {
    using Table = OrderedMap<std::string, Value>;
    using Int = std::int64_t;
    using Bool = bool;
    using String = std::string;

    std::variant<Table, Int, Bool, String> v;

    // Comment lines above the key this value is assigned to, and the
    // comment trailing the value on its line.
    std::vector<std::string> key_comments;
    std::vector<std::string> value_comments;

    Value&
    operator[](const std::string& key) {
        return as_table()[key];
    }

    bool
    contains(const std::string& key) const {
        return is_table() && as_table().contains(key);
    }

    // Find a nested value using e.g. "general.strip"
    std::optional<std::reference_wrapper<Value>>
    lookup_value_by_path(std::string_view dotted_path);

    // Sets a nested value using e.g. set_value_at("general.strip", Value{Value::Int{1}}),
    // creating the tables on the way. Fails when a path component is not a table.
    bool
    set_value_at(std::string_view dotted_path, Value value);

    // clang-format off
    bool is_table() const { return std::holds_alternative<Value::Table>(v); }
    bool is_int() const { return std::holds_alternative<Value::Int>(v); }
    bool is_bool() const { return std::holds_alternative<Value::Bool>(v); }
    bool is_string() const { return std::holds_alternative<Value::String>(v); }

    Table& as_table() { return std::get<Value::Table>(v); }
    const Table& as_table() const { return std::get<Value::Table>(v); }
    Int& as_int() { return std::get<Value::Int>(v); }
    Bool& as_bool() { return std::get<Value::Bool>(v); }
    String& as_string() { return std::get<Value::String>(v); }
    // clang-format on
};

std::string
repr(const Value& v);

// clang-format off
enum class ParseErrorKind {
    None,
    File,          // Missing, unreadable or empty
    Tokenization,
    Parsing,
};
// clang-format on

struct ParseResult {
    ParseErrorKind kind = ParseErrorKind::None;
    std::string error;

    bool
    is_ok() const {
        return kind == ParseErrorKind::None;
    }

    bool
    set_error(const config_tokenizer::Token& token, const std::string& error_message);
};

bool
cfg_parse(const std::string& input_data, ParseResult& result, const std::function<void(TbInstruction)>& emit_cb);

bool
cfg_parse_collect(const std::string& input_data, ParseResult& result, std::vector<TbInstruction>& instructions);

bool
cfg_parse_value_tree(const std::string& input_data, ParseResult& result, Value& root);

// Load a file and construct a value tree from its contents.
bool
cfg_load_file(const std::string& file_path, ParseResult& result, Value& root);

std::string
repr(TbOperator op);

std::string
repr(TbValueType vt);

}  // namespace patchy
