#include "config_parser.hpp"

#include "config_tokenizer.hpp"

#include <fmt/format.h>

#include <fstream>
#include <sstream>
#include <stack>
#include <tuple>

using namespace patchy;
using namespace patchy::config_tokenizer;

namespace {

// clang-format off
const std::vector<std::tuple<TbOperator, std::string>> kOperatorNames = {
    { TbOperator::Key,        "Key"        },
    { TbOperator::Value,      "Value"      },
    { TbOperator::TableStart, "TableStart" },
    { TbOperator::TableEnd,   "TableEnd"   },
    { TbOperator::Comment,    "Comment"    },
};

const std::vector<std::tuple<TbValueType, std::string>> kValueTypeNames = {
    { TbValueType::None,   "None"   },
    { TbValueType::Int,    "Int"    },
    { TbValueType::Bool,   "Bool"   },
    { TbValueType::String, "String" },
};
// clang-format on

std::tuple<std::string_view, std::string_view>
str_split2(std::string_view s, char delimiter) {
    auto pos = s.find(delimiter);
    if (pos == std::string_view::npos) {
        return {s, {}};
    }
    return {s.substr(0, pos), s.substr(pos + 1)};
}

}  // namespace

std::optional<std::reference_wrapper<Value>>
Value::lookup_value_by_path(std::string_view dotted_path) {
    Value* result_value = this;
    std::string_view remaining{dotted_path};
    while (!remaining.empty()) {
        auto [head, rest] = str_split2(remaining, '.');
        std::string key{head};
        if (!result_value->contains(key)) {
            return std::nullopt;
        }
        result_value = &(*result_value)[key];
        remaining = rest;
    }
    return std::ref(*result_value);
}

bool
Value::set_value_at(std::string_view dotted_path, Value value) {
    Value* iter = this;
    std::string_view remaining{dotted_path};
    while (true) {
        auto [head, rest] = str_split2(remaining, '.');
        std::string key{head};
        if (key.empty() || !iter->is_table()) {
            return false;
        }

        if (rest.empty()) {
            auto& slot = (*iter)[key];
            // Keep the comments of the value being replaced
            if (value.key_comments.empty()) {
                value.key_comments = std::move(slot.key_comments);
            }
            slot = std::move(value);
            return true;
        }

        if (!iter->contains(key)) {
            iter->as_table().insert(key, Value{Value::Table{}});
        }
        iter = &(*iter)[key];
        remaining = rest;
    }
}

bool
ParseResult::set_error(const Token& token, const std::string& error_message) {
    kind = ParseErrorKind::Parsing;
    error = fmt::format("{} at line {} column {}", error_message, token.line, token.column);
    return false;
}

bool
patchy::cfg_parse(const std::string& input_data,
                  ParseResult& result,
                  const std::function<void(TbInstruction)>& emit_cb) {
    TokenizeResult tokenized;
    if (!config_tokenizer::tokenize(input_data, tokenized)) {
        result.kind = ParseErrorKind::Tokenization;
        result.error = tokenized.error;
        return false;
    }

    const auto& tokens = tokenized.tokens;
    std::size_t cursor = 0;
    bool in_section = false;

    auto expect = [&](TokenId expected_id) {
        const Token& token = tokens[cursor];
        if (!token.is(expected_id)) {
            return result.set_error(token, fmt::format("Expected {}, found {}", config_tokenizer::repr(expected_id),
                                                       config_tokenizer::repr(token.id)));
        }
        return true;
    };

    // Comments trailing a key, the assignment or the value stay with the value.
    auto eat_comments = [&]() {
        while (tokens[cursor].is(TokenId_Comment)) {
            const Token& token = tokens[cursor];
            emit_cb(TbInstruction::Comment(token.str_from(input_data), token.is(TokenId_FirstOnLine)));
            cursor++;
        }
    };

    while (!tokens[cursor].is(TokenId_Terminator)) {
        eat_comments();
        const Token& token = tokens[cursor];

        if (token.is(TokenId_Terminator)) {
            break;
        }

        if (token.is(TokenId_OpenBracket)) {
            if (in_section) {
                emit_cb(TbInstruction::TableEnd());
            }
            cursor++;
            if (!expect(TokenId_Identifier)) {
                return false;
            }
            emit_cb(TbInstruction::Key(tokens[cursor].str_from(input_data)));
            emit_cb(TbInstruction::TableStart());
            cursor++;
            if (!expect(TokenId_CloseBracket)) {
                return false;
            }
            cursor++;
            in_section = true;
            continue;
        }

        if (token.is(TokenId_Identifier)) {
            emit_cb(TbInstruction::Key(token.str_from(input_data)));
            cursor++;
            if (!expect(TokenId_Assign)) {
                return false;
            }
            cursor++;
            if (!expect(TokenId_MetaValue)) {
                return false;
            }

            const Token& value = tokens[cursor];
            if (value.is(TokenId_Boolean)) {
                emit_cb(TbInstruction::Value(value.boolean_arg));
            } else if (value.is(TokenId_Integer)) {
                emit_cb(TbInstruction::Value(value.int_arg));
            } else {
                emit_cb(TbInstruction::Value(value.string_arg));
            }
            cursor++;
            continue;
        }

        return result.set_error(token, fmt::format("Expected a section or a key, found {}",
                                                   config_tokenizer::repr(token.id)));
    }

    if (in_section) {
        emit_cb(TbInstruction::TableEnd());
    }

    result.kind = ParseErrorKind::None;
    return true;
}

bool
patchy::cfg_parse_collect(const std::string& input_data,
                          ParseResult& result,
                          std::vector<TbInstruction>& instructions) {
    return cfg_parse(input_data, result, [&](TbInstruction ins) { instructions.push_back(std::move(ins)); });
}

bool
patchy::cfg_parse_value_tree(const std::string& input_data, ParseResult& result, Value& root) {
    root = Value{Value::Table{}};
    std::stack<Value*> value_stack;
    value_stack.push(&root);

    std::string last_key;
    std::vector<std::string> pending_comments;

    // The value a comment on the same line belongs to
    Value* comment_context_value = nullptr;

    auto update_tree = [&](TbInstruction ins) {
        switch (ins.op) {
            case TbOperator::Comment: {
                if (!ins.first_on_line && comment_context_value != nullptr) {
                    comment_context_value->value_comments.push_back(ins.oparg_string);
                } else {
                    pending_comments.push_back(ins.oparg_string);
                }
            } break;
            case TbOperator::Key: {
                last_key = ins.oparg_string;
                comment_context_value = nullptr;
            } break;
            case TbOperator::TableStart: {
                Value table{Value::Table{}};
                table.key_comments = std::move(pending_comments);
                pending_comments.clear();
                auto& parent = value_stack.top()->as_table();
                parent.insert(last_key, std::move(table));
                value_stack.push(&parent[last_key]);
                comment_context_value = value_stack.top();
            } break;
            case TbOperator::Value: {
                Value value;
                if (ins.oparg_type == TbValueType::Int) {
                    value = Value{Value::Int{ins.oparg_int}};
                } else if (ins.oparg_type == TbValueType::Bool) {
                    value = Value{Value::Bool{ins.oparg_bool}};
                } else {
                    value = Value{Value::String{ins.oparg_string}};
                }
                value.key_comments = std::move(pending_comments);
                pending_comments.clear();

                auto& table = value_stack.top()->as_table();
                table.insert(last_key, std::move(value));
                comment_context_value = &table[last_key];
            } break;
            case TbOperator::TableEnd: {
                if (value_stack.size() > 1) {
                    value_stack.pop();
                }
                comment_context_value = nullptr;
            } break;
        }
    };

    if (!cfg_parse(input_data, result, update_tree)) {
        return false;
    }

    // Comments after the last key
    root.value_comments.insert(root.value_comments.end(), pending_comments.begin(), pending_comments.end());
    return true;
}

bool
patchy::cfg_load_file(const std::string& file_path, ParseResult& result, Value& root) {
    std::ifstream ifs;
    ifs.open(file_path, std::ios::in | std::ios::binary);
    if (!ifs.is_open()) {
        result.kind = ParseErrorKind::File;
        result.error = "Failed to open file for reading";
        return false;
    }

    std::stringstream buffer;
    buffer << ifs.rdbuf();
    if (ifs.bad()) {
        result.kind = ParseErrorKind::File;
        result.error = "Failed to read file";
        return false;
    }

    return cfg_parse_value_tree(buffer.str(), result, root);
}

std::string
patchy::repr(const Value& v) {
    if (v.is_table()) {
        return fmt::format("Table<{}>", v.as_table().size());
    } else if (v.is_int()) {
        return fmt::format("Integer<{}>", std::get<Value::Int>(v.v));
    } else if (v.is_bool()) {
        return fmt::format("Boolean<{}>", std::get<Value::Bool>(v.v));
    }
    return fmt::format("String<'{}'>", std::get<Value::String>(v.v));
}

std::string
patchy::repr(TbOperator op) {
    for (const auto& [value, name] : kOperatorNames) {
        if (value == op) {
            return name;
        }
    }
    return "Unknown";
}

std::string
patchy::repr(TbValueType vt) {
    for (const auto& [value, name] : kValueTypeNames) {
        if (value == vt) {
            return name;
        }
    }
    return "Unknown";
}
