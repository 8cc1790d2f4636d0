#pragma once

#include <string>
#include <vector>

namespace Script {

enum class TokenKind { Name, Keyword, Number, String, Op, Newline, End };

struct Token {
    TokenKind kind = TokenKind::End;
    std::string text;   // decoded value for String tokens
    int line = 1;
    int indent = -1;    // leading columns when the token starts a logical line, else -1
};

/**
 * @brief Splits snippet source into logical-line tokens.
 * @details Newlines inside brackets and after a backslash are joined. Blank and
 * comment-only lines produce no tokens. ';' separates statements on one line.
 * @throws Augur::ScriptSyntaxError on unterminated strings, f-strings, stray
 * characters or unclosed brackets.
 */
std::vector<Token> tokenize(const std::string& source);

bool isKeyword(const std::string& word);

} // namespace Script
