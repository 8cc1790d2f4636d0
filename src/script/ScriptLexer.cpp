#include "ScriptLexer.h"
#include "AugurExceptions.h"

#include <cctype>
#include <unordered_set>

namespace Script {

namespace {
bool isIdentStart(unsigned char c) {
    return std::isalpha(c) || c == '_' || c >= 0x80;
}

bool isIdentChar(unsigned char c) {
    return std::isalnum(c) || c == '_' || c >= 0x80;
}

bool isStringPrefix(const std::string& word) {
    std::string lower;
    for (char c : word) lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return lower == "r" || lower == "u" || lower == "b" || lower == "f" ||
           lower == "rb" || lower == "br" || lower == "fr" || lower == "rf";
}

void appendUtf8(std::string& out, unsigned long cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

const char* kThreeCharOps[] = {"**=", "//=", ">>=", "<<=", "..."};
const char* kTwoCharOps[] = {"**", "//", "==", "!=", "<=", ">=", "+=", "-=", "*=", "/=", "%=",
                             "&=", "|=", "^=", "<<", ">>", "->", ":="};
const std::string kSingleCharOps = "+-*/%<>=()[]{},:.~&|^@";
} // namespace

bool isKeyword(const std::string& word) {
    static const std::unordered_set<std::string> kKeywords = {
        "False", "None", "True", "and", "as", "assert", "async", "await", "break", "class",
        "continue", "def", "del", "elif", "else", "except", "finally", "for", "from", "global",
        "if", "import", "in", "is", "lambda", "nonlocal", "not", "or", "pass", "raise",
        "return", "try", "while", "with", "yield"};
    return kKeywords.count(word) > 0;
}

std::vector<Token> tokenize(const std::string& src) {
    std::vector<Token> out;
    const size_t n = src.size();
    size_t i = 0;
    int line = 1;
    int depth = 0;
    bool lineStart = true;
    bool needIndent = false;
    int pendingIndent = 0;

    auto fail = [&](const std::string& message) {
        throw Augur::ScriptSyntaxError(message, line);
    };

    auto emit = [&](TokenKind kind, std::string text, int tokenLine) {
        Token t;
        t.kind = kind;
        t.text = std::move(text);
        t.line = tokenLine;
        if (needIndent) {
            t.indent = pendingIndent;
            needIndent = false;
        }
        out.push_back(std::move(t));
    };

    auto emitNewline = [&]() {
        if (!out.empty() && out.back().kind != TokenKind::Newline) {
            Token t;
            t.kind = TokenKind::Newline;
            t.line = line;
            out.push_back(std::move(t));
        }
    };

    while (i < n) {
        if (lineStart && depth == 0) {
            int col = 0;
            size_t j = i;
            while (j < n && (src[j] == ' ' || src[j] == '\t' || src[j] == '\f')) {
                col += src[j] == '\t' ? 8 - (col % 8) : 1;
                ++j;
            }
            if (j >= n) {
                i = j;
                break;
            }
            if (src[j] == '\n' || src[j] == '\r' || src[j] == '#') {
                while (j < n && src[j] != '\n') ++j;
                if (j < n) {
                    ++j;
                    ++line;
                }
                i = j;
                continue;
            }
            pendingIndent = col;
            needIndent = true;
            lineStart = false;
            i = j;
        }

        const char c = src[i];

        if (c == ' ' || c == '\t' || c == '\f') {
            ++i;
            continue;
        }
        if (c == '#') {
            while (i < n && src[i] != '\n') ++i;
            continue;
        }
        if (c == '\\') {
            size_t j = i + 1;
            if (j < n && src[j] == '\r') ++j;
            if (j < n && src[j] == '\n') {
                i = j + 1;
                ++line;
                continue;
            }
            fail("unexpected character after line continuation character");
        }
        if (c == '\r' || c == '\n') {
            if (c == '\r' && i + 1 < n && src[i + 1] == '\n') ++i;
            ++i;
            if (depth == 0) {
                emitNewline();
                lineStart = true;
            }
            ++line;
            continue;
        }
        if (c == ';' && depth == 0) {
            emitNewline();
            needIndent = true;
            ++i;
            continue;
        }

        // Identifiers, keywords and prefixed strings.
        if (isIdentStart(static_cast<unsigned char>(c))) {
            size_t j = i;
            while (j < n && isIdentChar(static_cast<unsigned char>(src[j]))) ++j;
            std::string word = src.substr(i, j - i);
            if (j < n && (src[j] == '\'' || src[j] == '"') && isStringPrefix(word)) {
                bool raw = false;
                for (char p : word) {
                    const char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(p)));
                    if (lower == 'f') fail("f-strings are not supported");
                    if (lower == 'r') raw = true;
                }
                i = j;
                // Fall through to string scanning with the prefix consumed.
                const char quote = src[i];
                const bool triple = i + 2 < n && src[i + 1] == quote && src[i + 2] == quote;
                const int startLine = line;
                i += triple ? 3 : 1;
                std::string value;
                bool closed = false;
                while (i < n) {
                    const char d = src[i];
                    if (triple && d == quote && i + 2 < n && src[i + 1] == quote && src[i + 2] == quote) {
                        i += 3;
                        closed = true;
                        break;
                    }
                    if (!triple && d == quote) {
                        ++i;
                        closed = true;
                        break;
                    }
                    if (d == '\n') {
                        if (!triple) fail("unterminated string literal");
                        ++line;
                    }
                    if (d == '\\' && raw && i + 1 < n) {
                        value.push_back(d);
                        value.push_back(src[i + 1]);
                        i += 2;
                        continue;
                    }
                    value.push_back(d);
                    ++i;
                }
                if (!closed) fail("unterminated string literal");
                emit(TokenKind::String, std::move(value), startLine);
                continue;
            }
            const TokenKind kind = isKeyword(word) ? TokenKind::Keyword : TokenKind::Name;
            emit(kind, std::move(word), line);
            i = j;
            continue;
        }

        // Numbers.
        if (std::isdigit(static_cast<unsigned char>(c)) ||
            (c == '.' && i + 1 < n && std::isdigit(static_cast<unsigned char>(src[i + 1])))) {
            size_t j = i;
            std::string text;
            if (c == '0' && j + 1 < n && (src[j + 1] == 'x' || src[j + 1] == 'X')) {
                text = "0x";
                j += 2;
                while (j < n && (std::isxdigit(static_cast<unsigned char>(src[j])) || src[j] == '_')) {
                    if (src[j] != '_') text.push_back(src[j]);
                    ++j;
                }
            } else {
                while (j < n && (std::isdigit(static_cast<unsigned char>(src[j])) || src[j] == '_' || src[j] == '.')) {
                    if (src[j] != '_') text.push_back(src[j]);
                    ++j;
                }
                if (j < n && (src[j] == 'e' || src[j] == 'E')) {
                    size_t k = j + 1;
                    if (k < n && (src[k] == '+' || src[k] == '-')) ++k;
                    if (k < n && std::isdigit(static_cast<unsigned char>(src[k]))) {
                        text.append(src, j, k - j);
                        j = k;
                        while (j < n && std::isdigit(static_cast<unsigned char>(src[j]))) text.push_back(src[j++]);
                    }
                }
            }
            if (j < n && (src[j] == 'j' || src[j] == 'J')) fail("complex literals are not supported");
            if (j < n && isIdentStart(static_cast<unsigned char>(src[j]))) fail("invalid decimal literal");
            emit(TokenKind::Number, std::move(text), line);
            i = j;
            continue;
        }

        // Strings without prefix.
        if (c == '\'' || c == '"') {
            const char quote = c;
            const bool triple = i + 2 < n && src[i + 1] == quote && src[i + 2] == quote;
            const int startLine = line;
            i += triple ? 3 : 1;
            std::string value;
            bool closed = false;
            while (i < n) {
                const char d = src[i];
                if (triple && d == quote && i + 2 < n && src[i + 1] == quote && src[i + 2] == quote) {
                    i += 3;
                    closed = true;
                    break;
                }
                if (!triple && d == quote) {
                    ++i;
                    closed = true;
                    break;
                }
                if (d == '\n') {
                    if (!triple) fail("unterminated string literal");
                    ++line;
                    value.push_back(d);
                    ++i;
                    continue;
                }
                if (d == '\\' && i + 1 < n) {
                    const char e = src[i + 1];
                    i += 2;
                    switch (e) {
                        case 'n': value.push_back('\n'); break;
                        case 't': value.push_back('\t'); break;
                        case 'r': value.push_back('\r'); break;
                        case '0': value.push_back('\0'); break;
                        case '\\': value.push_back('\\'); break;
                        case '\'': value.push_back('\''); break;
                        case '"': value.push_back('"'); break;
                        case '\n': ++line; break;
                        case 'x':
                        case 'u': {
                            const size_t width = e == 'x' ? 2 : 4;
                            if (i + width > n) fail("truncated escape sequence");
                            unsigned long cp = 0;
                            for (size_t k = 0; k < width; ++k) {
                                const char h = src[i + k];
                                if (!std::isxdigit(static_cast<unsigned char>(h))) fail("truncated escape sequence");
                                cp = cp * 16 + static_cast<unsigned long>(std::isdigit(static_cast<unsigned char>(h))
                                    ? h - '0' : std::tolower(static_cast<unsigned char>(h)) - 'a' + 10);
                            }
                            i += width;
                            appendUtf8(value, cp);
                            break;
                        }
                        default:
                            value.push_back('\\');
                            value.push_back(e);
                            break;
                    }
                    continue;
                }
                value.push_back(d);
                ++i;
            }
            if (!closed) fail("unterminated string literal");
            emit(TokenKind::String, std::move(value), startLine);
            continue;
        }

        // Operators.
        bool matched = false;
        for (const char* op : kThreeCharOps) {
            if (src.compare(i, 3, op) == 0) {
                emit(TokenKind::Op, op, line);
                i += 3;
                matched = true;
                break;
            }
        }
        if (!matched) {
            for (const char* op : kTwoCharOps) {
                if (src.compare(i, 2, op) == 0) {
                    emit(TokenKind::Op, op, line);
                    i += 2;
                    matched = true;
                    break;
                }
            }
        }
        if (!matched && kSingleCharOps.find(c) != std::string::npos) {
            if (c == '(' || c == '[' || c == '{') ++depth;
            if (c == ')' || c == ']' || c == '}') {
                if (depth == 0) fail(std::string("unmatched '") + c + "'");
                --depth;
            }
            emit(TokenKind::Op, std::string(1, c), line);
            ++i;
            matched = true;
        }
        if (!matched) fail(std::string("invalid character '") + c + "'");
    }

    if (depth > 0) fail("unexpected EOF: unclosed bracket");
    emitNewline();
    Token end;
    end.kind = TokenKind::End;
    end.line = line;
    out.push_back(std::move(end));
    return out;
}

} // namespace Script
