#include "config_tokenizer.hpp"

#include <fmt/format.h>

#include <stdexcept>
#include <string>
#include <tuple>

using namespace patchy;
using namespace patchy::config_tokenizer;

namespace {

// clang-format off
const std::vector<std::tuple<TokenId, std::string>> kTokenNames = {
    { TokenId_OpenBracket,  "OpenBracket"  },
    { TokenId_CloseBracket, "CloseBracket" },
    { TokenId_Assign,       "Assign"       },
    { TokenId_Boolean,      "Boolean"      },
    { TokenId_Integer,      "Integer"      },
    { TokenId_String,       "String"       },
    { TokenId_Identifier,   "Identifier"   },
    { TokenId_Comment,      "Comment"      },
    { TokenId_Terminator,   "Terminator"   },
    { TokenId_FirstOnLine,  "FirstOnLine"  },
};
// clang-format on

bool
is_word_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' || c == '-' ||
           c == '.';
}

bool
is_integer(const std::string& word) {
    std::size_t i = word[0] == '-' ? 1 : 0;
    if (i == word.size()) {
        return false;
    }
    for (; i < word.size(); i++) {
        if (word[i] < '0' || word[i] > '9') {
            return false;
        }
    }
    return true;
}

}  // namespace

bool
config_tokenizer::is_whitespace(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

bool
config_tokenizer::tokenize(const std::string& text, TokenizeResult& result) {
    result.ok = false;
    result.tokens.clear();
    result.error.clear();

    std::size_t line = 1;
    std::size_t line_start = 0;
    bool first_on_line = true;

    std::size_t i = 0;
    while (i < text.size()) {
        char c = text[i];
        if (c == '\n') {
            line++;
            line_start = i + 1;
            first_on_line = true;
            i++;
            continue;
        }
        if (is_whitespace(c)) {
            i++;
            continue;
        }

        Token token;
        token.start = i;
        token.line = line;
        token.column = i - line_start + 1;
        if (first_on_line) {
            token.id |= TokenId_FirstOnLine;
        }
        first_on_line = false;

        if (c == '#' || (c == '/' && i + 1 < text.size() && text[i + 1] == '/')) {
            std::size_t end = text.find('\n', i);
            if (end == std::string::npos) {
                end = text.size();
            }
            while (end > i && (text[end - 1] == '\r' || text[end - 1] == ' ')) {
                end--;
            }
            token.id |= TokenId_Comment;
            token.length = end - i;
            i = end;
        } else if (c == '[' || c == ']' || c == '=') {
            token.id |= c == '[' ? TokenId_OpenBracket : c == ']' ? TokenId_CloseBracket : TokenId_Assign;
            token.length = 1;
            i++;
        } else if (c == '"' || c == '\'') {
            const char quote = c;
            std::size_t j = i + 1;
            bool closed = false;
            while (j < text.size() && text[j] != '\n') {
                if (text[j] == '\\' && j + 1 < text.size()) {
                    char escaped = text[j + 1];
                    token.string_arg += escaped == 'n' ? '\n' : escaped == 't' ? '\t' : escaped;
                    j += 2;
                    continue;
                }
                if (text[j] == quote) {
                    closed = true;
                    break;
                }
                token.string_arg += text[j];
                j++;
            }
            if (!closed) {
                result.error = fmt::format("Unterminated string at line {} column {}", token.line, token.column);
                return false;
            }
            token.id |= TokenId_String;
            token.length = j + 1 - i;
            i = j + 1;
        } else if (is_word_char(c)) {
            std::size_t j = i;
            while (j < text.size() && is_word_char(text[j])) {
                j++;
            }
            std::string word = text.substr(i, j - i);
            if (word == "true" || word == "false") {
                token.id |= TokenId_Boolean;
                token.boolean_arg = word == "true";
            } else if (is_integer(word)) {
                token.id |= TokenId_Integer;
                try {
                    token.int_arg = std::stoll(word);
                } catch (const std::out_of_range&) {
                    result.error =
                        fmt::format("Integer out of range at line {} column {}", token.line, token.column);
                    return false;
                }
            } else {
                token.id |= TokenId_Identifier;
            }
            token.length = j - i;
            i = j;
        } else {
            result.error = fmt::format("Unexpected character '{}' at line {} column {}", c, token.line, token.column);
            return false;
        }

        result.tokens.push_back(token);
    }

    Token terminator;
    terminator.start = text.size();
    terminator.line = line;
    terminator.column = text.size() - line_start + 1;
    terminator.id = TokenId_Terminator;
    result.tokens.push_back(terminator);

    result.ok = true;
    return true;
}

std::string
config_tokenizer::repr(TokenId id) {
    std::string names;
    for (const auto& [flag, name] : kTokenNames) {
        if (id & flag) {
            names += names.empty() ? name : "|" + name;
        }
    }
    return names.empty() ? "None" : names;
}
