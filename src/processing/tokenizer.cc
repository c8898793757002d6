#include "tokenizer.hpp"

#include "util/hash.hpp"

#include <fmt/format.h>

#include <string>
#include <vector>

using namespace patchy;

namespace {

bool
is_delimiter(char c) {
    const char delimiters[] = ".,+-*/|(){}<>[]!\"'#$%^&*=:;";
    for (const auto delimiter : delimiters) {
        if (delimiter == c) {
            return true;
        }
    }
    return false;
}

TokenFlag
whitespace_flag(char c) {
    switch (c) {
        case ' ':
            return TokenFlagSpace;
        case '\t':
            return TokenFlagTab;
        case '\r':
            return TokenFlagCR;
        case '\n':
            return TokenFlagLF;
        default:
            return TokenFlagNone;
    }
}

// Merge a LF token into a directly preceding CR token.
void
push_token(std::vector<Token>& result, std::string_view text, std::size_t start, std::size_t length, TokenFlag flags) {
    bool combine_crlf = (flags & TokenFlagLF) && !result.empty() && (result.back().flags & TokenFlagCR) &&
                        result.back().start + result.back().length == start;
    if (combine_crlf) {
        auto cr = result.back();
        result.pop_back();
        auto new_length = cr.length + length;
        result.push_back({cr.start, new_length, hash::hash(text.data() + cr.start, new_length), TokenFlagCRLF});
        return;
    }
    result.push_back({start, length, hash::hash(text.data() + start, length), flags});
}

std::size_t
utf8_sequence_length(unsigned char lead) {
    if (lead < 0x80) {
        return 1;
    } else if ((lead & 0xE0) == 0xC0) {
        return 2;
    } else if ((lead & 0xF0) == 0xE0) {
        return 3;
    } else if ((lead & 0xF8) == 0xF0) {
        return 4;
    }
    // Stray continuation or invalid byte; treat it as a unit of its own.
    return 1;
}

}  // namespace

std::string
patchy::repr(const Token& token, std::string_view source_text) {
    std::string s;
    for (char c : token.str_from(source_text)) {
        switch (c) {
            case '\n':
                s += "\\n";
                break;
            case '\r':
                s += "\\r";
                break;
            case '\t':
                s += "\\t";
                break;
            default:
                s += c;
        }
    }
    return fmt::format("Token(.start={:>3}, .length={:>3}, .flags={}, .text='{}')", token.start, token.length,
                       token.flags, s);
}

bool
patchy::is_whitespace(char c) {
    const char whitespaces[] = " \t\r\n\f\v";
    for (std::size_t i = 0; i + 1 < sizeof(whitespaces); i++) {
        if (whitespaces[i] == c) {
            return true;
        }
    }
    return false;
}

bool
patchy::is_empty(std::string_view s) {
    for (char c : s) {
        if (!patchy::is_whitespace(c)) {
            return false;
        }
    }
    return true;
}

std::vector<Token>
patchy::tokenize(std::string_view text) {
    std::vector<Token> result;

    std::size_t seeker = 0;
    const std::size_t size = text.size();

    while (seeker < size) {
        auto start_idx = seeker;
        char c = text[start_idx];
        TokenFlag token_flags = whitespace_flag(c);

        if (token_flags != TokenFlagNone || is_delimiter(c)) {
            // Runs of the same whitespace or delimiter character.
            while (seeker < size && text[seeker] == c) {
                seeker++;
            }
        } else {
            while (seeker < size && !is_delimiter(text[seeker]) && !is_whitespace(text[seeker])) {
                seeker++;
            }
            // Form feed and vertical tab end up here as single characters.
            if (seeker == start_idx) {
                seeker++;
            }
        }

        push_token(result, text, start_idx, seeker - start_idx, token_flags);
    }

    return result;
}

std::vector<Token>
patchy::tokenize_chars(std::string_view text) {
    std::vector<Token> result;

    std::size_t seeker = 0;
    while (seeker < text.size()) {
        auto length = utf8_sequence_length(static_cast<unsigned char>(text[seeker]));
        if (seeker + length > text.size()) {
            length = text.size() - seeker;
        }
        push_token(result, text, seeker, length, whitespace_flag(text[seeker]));
        seeker += length;
    }

    return result;
}
