#pragma once

/*
    Lexer for config files. Splits the text into brackets, assignments,
    comments and values, and tags each value as a string, an integer, a
    boolean or an identifier. Whitespace and newlines are dropped; a token
    remembers whether it was the first one on its line.
*/

#include <cstdint>
#include <string>
#include <vector>

namespace patchy {
namespace config_tokenizer {

using TokenId = std::uint32_t;
// clang-format off
const TokenId TokenId_OpenBracket  = 1 << 0;
const TokenId TokenId_CloseBracket = 1 << 1;
const TokenId TokenId_Assign       = 1 << 2;
const TokenId TokenId_Boolean      = 1 << 3;
const TokenId TokenId_Integer      = 1 << 4;
const TokenId TokenId_String       = 1 << 5;
const TokenId TokenId_Identifier   = 1 << 6;
const TokenId TokenId_Comment      = 1 << 7;
const TokenId TokenId_Terminator   = 1 << 8;

const TokenId TokenId_FirstOnLine  = 1 << 9; // Only whitespace before this token

const TokenId TokenId_MetaValue = TokenId_Boolean | TokenId_Integer | TokenId_String;
// clang-format on

struct Token {
    std::string::size_type start = 0;
    std::string::size_type length = 0;

    // 1-based
    std::size_t line = 0;
    std::size_t column = 0;

    TokenId id = 0;

    bool boolean_arg = false;
    std::int64_t int_arg = 0;

    // Unquoted and unescaped text of a string token
    std::string string_arg;

    std::string
    str_from(const std::string& text) const {
        return text.substr(start, length);
    }

    bool
    is(TokenId mask) const {
        return (id & mask) != 0;
    }
};

struct TokenizeResult {
    bool ok = false;
    std::vector<Token> tokens;
    std::string error;
};

// The token list always ends with a Terminator token.
bool
tokenize(const std::string& text, TokenizeResult& result);

bool
is_whitespace(char c);

std::string
repr(TokenId id);

}  // namespace config_tokenizer
}  // namespace patchy
