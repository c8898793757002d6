#pragma once

/*
    Scan through a text string and split it up into a vector of Tokens.

    A token is a subsequence of the string consisting of similar or related
    characters. Visually distinct chunks of text; words, whitespace runs,
    delimiter runs. The refinement engine diffs these instead of characters
    unless asked for character granularity.
*/

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace patchy {

using TokenFlag = std::uint8_t;
const TokenFlag TokenFlagNone = 0;
const TokenFlag TokenFlagSpace = 1 << 0;
const TokenFlag TokenFlagTab = 1 << 1;
const TokenFlag TokenFlagCR = 1 << 2;
const TokenFlag TokenFlagLF = 1 << 3;
const TokenFlag TokenFlagCRLF = 1 << 4;

const TokenFlag TokenFlagNewline = TokenFlagCR | TokenFlagLF | TokenFlagCRLF;

struct Token {
    std::size_t start = 0;
    std::size_t length = 0;
    std::uint32_t hash = 0;
    TokenFlag flags = TokenFlagNone;

    std::string
    str_from(std::string_view text) const {
        return std::string{text.substr(start, length)};
    }

    // Hash and length must agree; used as the diff unit equality.
    bool
    operator==(const Token& other) const {
        return hash == other.hash && length == other.length;
    }
};

std::string
repr(const Token& token, std::string_view source_text);

bool
is_whitespace(char c);

bool
is_empty(std::string_view s);

std::vector<Token>
tokenize(std::string_view text);

// One token per UTF-8 encoded code point; CR LF stays a single token.
std::vector<Token>
tokenize_chars(std::string_view text);

}  // namespace patchy
