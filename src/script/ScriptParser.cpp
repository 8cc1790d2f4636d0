#include "ScriptParser.h"
#include "AugurExceptions.h"

#include <utility>

namespace Script {

ScriptParser::ScriptParser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {
    if (tokens_.empty() || tokens_.back().kind != TokenKind::End) {
        Token end;
        end.kind = TokenKind::End;
        end.line = tokens_.empty() ? 1 : tokens_.back().line;
        tokens_.push_back(end);
    }
}

Program ScriptParser::parse(const std::string& source) {
    ScriptParser parser(tokenize(source));
    return parser.parseProgram();
}

const Token& ScriptParser::peek(size_t ahead) const {
    const size_t idx = pos_ + ahead;
    return idx < tokens_.size() ? tokens_[idx] : tokens_.back();
}

const Token& ScriptParser::advance() {
    const Token& t = peek();
    if (pos_ < tokens_.size() - 1) ++pos_;
    return t;
}

bool ScriptParser::checkOp(const char* op) const {
    return peek().kind == TokenKind::Op && peek().text == op;
}

bool ScriptParser::matchOp(const char* op) {
    if (!checkOp(op)) return false;
    advance();
    return true;
}

void ScriptParser::expectOp(const char* op) {
    if (!matchOp(op)) {
        fail(std::string("expected '") + op + "'");
    }
}

bool ScriptParser::checkKeyword(const char* kw) const {
    return peek().kind == TokenKind::Keyword && peek().text == kw;
}

bool ScriptParser::matchKeyword(const char* kw) {
    if (!checkKeyword(kw)) return false;
    advance();
    return true;
}

bool ScriptParser::atExpressionEnd() const {
    const Token& t = peek();
    if (t.kind == TokenKind::Newline || t.kind == TokenKind::End) return true;
    if (t.kind != TokenKind::Op) return false;
    return t.text == ")" || t.text == "]" || t.text == "}" || t.text == "=" || t.text == ":" ||
           (t.text.size() >= 2 && t.text.back() == '=' && t.text != "==" && t.text != "!=" &&
            t.text != "<=" && t.text != ">=");
}

void ScriptParser::fail(const std::string& message) const {
    throw Augur::ScriptSyntaxError(message, peek().line);
}

Program ScriptParser::parseProgram() {
    Program program;
    while (peek().kind != TokenKind::End) {
        if (peek().kind == TokenKind::Newline) {
            advance();
            continue;
        }
        program.body.push_back(parseStatement());
    }
    return program;
}

void ScriptParser::consumeNewline() {
    if (peek().kind == TokenKind::Newline) {
        advance();
        return;
    }
    if (peek().kind == TokenKind::End) return;
    fail("invalid syntax near '" + peek().text + "'");
}

void ScriptParser::skipIndentedBlock() {
    while (peek().kind != TokenKind::End && peek().indent > 0) {
        while (peek().kind != TokenKind::Newline && peek().kind != TokenKind::End) advance();
        consumeNewline();
    }
}

std::string ScriptParser::parseDottedName() {
    if (peek().kind != TokenKind::Name) fail("expected module name");
    std::string name = advance().text;
    while (checkOp(".") && peek(1).kind == TokenKind::Name) {
        advance();
        name += "." + advance().text;
    }
    return name;
}

void ScriptParser::checkAssignTarget(const ExprPtr& target) const {
    switch (target->kind) {
        case ExprKind::Name:
        case ExprKind::Subscript:
        case ExprKind::Attribute:
            return;
        case ExprKind::Tuple:
        case ExprKind::List:
            for (const auto& child : target->children) {
                if (child->kind != ExprKind::Name) {
                    throw Augur::ScriptSyntaxError("only names can be unpacked", target->line);
                }
            }
            return;
        default:
            throw Augur::ScriptSyntaxError("cannot assign to expression", target->line);
    }
}

Statement ScriptParser::parseStatement() {
    const Token& first = peek();
    if (first.indent > 0) fail("unexpected indent");

    Statement stmt;
    stmt.line = first.line;

    if (first.kind == TokenKind::Keyword) {
        const std::string kw = first.text;
        if (kw == "import" || kw == "from") {
            advance();
            stmt.kind = StmtKind::Import;
            stmt.name = parseDottedName();
            while (peek().kind != TokenKind::Newline && peek().kind != TokenKind::End) advance();
            consumeNewline();
            return stmt;
        }
        if (kw == "def" || kw == "class") {
            advance();
            stmt.kind = kw == "def" ? StmtKind::FunctionDef : StmtKind::ClassDef;
            if (peek().kind != TokenKind::Name) fail("invalid syntax after '" + kw + "'");
            stmt.name = advance().text;
            bool sawColon = false;
            while (peek().kind != TokenKind::Newline && peek().kind != TokenKind::End) {
                if (checkOp(":")) sawColon = true;
                advance();
            }
            if (!sawColon) fail("expected ':'");
            consumeNewline();
            skipIndentedBlock();
            return stmt;
        }
        if (kw != "not" && kw != "lambda" && kw != "None" && kw != "True" && kw != "False") {
            fail("'" + kw + "' statements are not supported");
        }
    }

    ExprPtr lhs = parseExprList();
    if (checkOp("=")) {
        advance();
        checkAssignTarget(lhs);
        ExprPtr rhs = parseExprList();
        if (checkOp("=")) fail("chained assignment is not supported");
        stmt.kind = StmtKind::Assign;
        stmt.target = lhs;
        stmt.value = rhs;
    } else if (peek().kind == TokenKind::Op && peek().text.size() >= 2 && peek().text.back() == '=' &&
               peek().text != "==" && peek().text != "!=" && peek().text != "<=" && peek().text != ">=") {
        const std::string op = peek().text.substr(0, peek().text.size() - 1);
        if (op == ":") fail("assignment expressions are not supported");
        advance();
        if (lhs->kind != ExprKind::Name && lhs->kind != ExprKind::Subscript && lhs->kind != ExprKind::Attribute) {
            fail("illegal expression for augmented assignment");
        }
        ExprPtr rhs = parseExprList();
        auto bin = makeExpr(ExprKind::BinOp, stmt.line, op);
        bin->children = {lhs, rhs};
        stmt.kind = StmtKind::Assign;
        stmt.target = lhs;
        stmt.value = bin;
    } else {
        stmt.kind = StmtKind::Expression;
        stmt.value = lhs;
    }
    consumeNewline();
    return stmt;
}

ExprPtr ScriptParser::parseExprList() {
    const int line = peek().line;
    ExprPtr first = parseTest();
    if (!checkOp(",")) return first;
    auto tuple = makeExpr(ExprKind::Tuple, line);
    tuple->children.push_back(first);
    while (matchOp(",")) {
        if (atExpressionEnd()) break;
        tuple->children.push_back(parseTest());
    }
    return tuple;
}

ExprPtr ScriptParser::parseTest() {
    if (checkKeyword("lambda")) fail("lambda expressions are not supported");
    const int line = peek().line;
    ExprPtr body = parseOrTest();
    if (!checkKeyword("if")) return body;
    advance();
    ExprPtr test = parseOrTest();
    if (!matchKeyword("else")) fail("expected 'else' in conditional expression");
    ExprPtr orelse = parseTest();
    auto node = makeExpr(ExprKind::Ternary, line);
    node->children = {body, test, orelse};
    return node;
}

ExprPtr ScriptParser::parseOrTest() {
    const int line = peek().line;
    ExprPtr first = parseAndTest();
    if (!checkKeyword("or")) return first;
    auto node = makeExpr(ExprKind::BoolOp, line, "or");
    node->children.push_back(first);
    while (matchKeyword("or")) node->children.push_back(parseAndTest());
    return node;
}

ExprPtr ScriptParser::parseAndTest() {
    const int line = peek().line;
    ExprPtr first = parseNotTest();
    if (!checkKeyword("and")) return first;
    auto node = makeExpr(ExprKind::BoolOp, line, "and");
    node->children.push_back(first);
    while (matchKeyword("and")) node->children.push_back(parseNotTest());
    return node;
}

ExprPtr ScriptParser::parseNotTest() {
    if (checkKeyword("not")) {
        const int line = advance().line;
        auto node = makeExpr(ExprKind::UnaryOp, line, "not");
        node->children.push_back(parseNotTest());
        return node;
    }
    return parseComparison();
}

ExprPtr ScriptParser::parseComparison() {
    const int line = peek().line;
    ExprPtr first = parseBitOr();
    ExprPtr node;
    while (true) {
        std::string op;
        const Token& t = peek();
        if (t.kind == TokenKind::Op &&
            (t.text == "<" || t.text == ">" || t.text == "==" || t.text == "!=" || t.text == "<=" || t.text == ">=")) {
            op = t.text;
            advance();
        } else if (checkKeyword("in")) {
            op = "in";
            advance();
        } else if (checkKeyword("not") && peek(1).kind == TokenKind::Keyword && peek(1).text == "in") {
            op = "not in";
            advance();
            advance();
        } else if (checkKeyword("is")) {
            advance();
            op = matchKeyword("not") ? "is not" : "is";
        } else {
            break;
        }
        if (!node) {
            node = makeExpr(ExprKind::Compare, line);
            node->children.push_back(first);
        }
        node->ops.push_back(op);
        node->children.push_back(parseBitOr());
    }
    return node ? node : first;
}

ExprPtr ScriptParser::parseBinaryLevel(std::initializer_list<const char*> ops, ExprPtr (ScriptParser::*next)()) {
    ExprPtr lhs = (this->*next)();
    while (true) {
        const char* matched = nullptr;
        for (const char* op : ops) {
            if (checkOp(op)) {
                matched = op;
                break;
            }
        }
        if (!matched) return lhs;
        const int line = advance().line;
        ExprPtr rhs = (this->*next)();
        auto node = makeExpr(ExprKind::BinOp, line, matched);
        node->children = {lhs, rhs};
        lhs = node;
    }
}

ExprPtr ScriptParser::parseBitOr() { return parseBinaryLevel({"|"}, &ScriptParser::parseBitXor); }
ExprPtr ScriptParser::parseBitXor() { return parseBinaryLevel({"^"}, &ScriptParser::parseBitAnd); }
ExprPtr ScriptParser::parseBitAnd() { return parseBinaryLevel({"&"}, &ScriptParser::parseShift); }
ExprPtr ScriptParser::parseShift() { return parseBinaryLevel({"<<", ">>"}, &ScriptParser::parseArith); }
ExprPtr ScriptParser::parseArith() { return parseBinaryLevel({"+", "-"}, &ScriptParser::parseTerm); }
ExprPtr ScriptParser::parseTerm() { return parseBinaryLevel({"*", "/", "//", "%", "@"}, &ScriptParser::parseFactor); }

ExprPtr ScriptParser::parseFactor() {
    if (checkOp("-") || checkOp("+") || checkOp("~")) {
        const Token& t = advance();
        auto node = makeExpr(ExprKind::UnaryOp, t.line, t.text);
        node->children.push_back(parseFactor());
        return node;
    }
    return parsePower();
}

ExprPtr ScriptParser::parsePower() {
    ExprPtr base = parsePostfix();
    if (!checkOp("**")) return base;
    const int line = advance().line;
    ExprPtr exponent = parseFactor();
    auto node = makeExpr(ExprKind::BinOp, line, "**");
    node->children = {base, exponent};
    return node;
}

ExprPtr ScriptParser::parsePostfix() {
    ExprPtr expr = parseAtom();
    while (true) {
        if (checkOp("(")) {
            expr = parseCall(expr);
        } else if (checkOp("[")) {
            expr = parseSubscript(expr);
        } else if (checkOp(".")) {
            advance();
            const Token& name = peek();
            if (name.kind != TokenKind::Name) fail("expected attribute name after '.'");
            auto node = makeExpr(ExprKind::Attribute, name.line, name.text);
            advance();
            node->children.push_back(expr);
            expr = node;
        } else {
            return expr;
        }
    }
}

void ScriptParser::rejectComprehension() const {
    if (checkKeyword("for") || checkKeyword("async")) fail("comprehensions are not supported");
}

ExprPtr ScriptParser::parseCall(ExprPtr callee) {
    const int line = advance().line;  // '('
    auto node = makeExpr(ExprKind::Call, line);
    node->children.push_back(std::move(callee));
    while (!checkOp(")")) {
        if (checkOp("*") || checkOp("**")) fail("starred arguments are not supported");
        if (peek().kind == TokenKind::Name && peek(1).kind == TokenKind::Op && peek(1).text == "=") {
            Keyword kw;
            kw.name = advance().text;
            advance();
            kw.value = parseTest();
            for (const auto& existing : node->keywords) {
                if (existing.name == kw.name) fail("keyword argument repeated: " + kw.name);
            }
            node->keywords.push_back(std::move(kw));
        } else {
            if (!node->keywords.empty()) fail("positional argument follows keyword argument");
            node->children.push_back(parseTest());
            rejectComprehension();
        }
        if (!matchOp(",")) break;
    }
    expectOp(")");
    return node;
}

ExprPtr ScriptParser::parseSubscriptItem() {
    const int line = peek().line;
    ExprPtr lower;
    if (!checkOp(":")) {
        lower = parseTest();
        if (!checkOp(":")) return lower;
    }
    advance();  // ':'
    auto slice = makeExpr(ExprKind::Slice, line);
    ExprPtr upper;
    ExprPtr step;
    if (!checkOp(":") && !checkOp(",") && !checkOp("]")) upper = parseTest();
    if (matchOp(":")) {
        if (!checkOp(",") && !checkOp("]")) step = parseTest();
    }
    slice->children = {lower, upper, step};
    return slice;
}

ExprPtr ScriptParser::parseSubscript(ExprPtr value) {
    const int line = advance().line;  // '['
    if (checkOp("]")) fail("empty subscript");
    ExprPtr first = parseSubscriptItem();
    ExprPtr index = first;
    if (checkOp(",")) {
        auto tuple = makeExpr(ExprKind::Tuple, line);
        tuple->children.push_back(first);
        while (matchOp(",")) {
            if (checkOp("]")) break;
            tuple->children.push_back(parseSubscriptItem());
        }
        index = tuple;
    }
    expectOp("]");
    auto node = makeExpr(ExprKind::Subscript, line);
    node->children = {std::move(value), index};
    return node;
}

ExprPtr ScriptParser::parseAtom() {
    const Token& t = peek();
    switch (t.kind) {
        case TokenKind::Name: {
            advance();
            return makeName(t.text, t.line);
        }
        case TokenKind::Number: {
            advance();
            return makeExpr(ExprKind::Number, t.line, t.text);
        }
        case TokenKind::String: {
            const int line = t.line;
            std::string value = advance().text;
            while (peek().kind == TokenKind::String) value += advance().text;
            return makeExpr(ExprKind::String, line, std::move(value));
        }
        case TokenKind::Keyword: {
            if (t.text == "True" || t.text == "False") {
                auto node = makeExpr(ExprKind::Bool, t.line);
                node->boolValue = t.text == "True";
                advance();
                return node;
            }
            if (t.text == "None") {
                advance();
                return makeExpr(ExprKind::NoneLit, t.line);
            }
            if (t.text == "lambda") fail("lambda expressions are not supported");
            if (t.text == "await" || t.text == "yield") fail("'" + t.text + "' is not supported");
            fail("invalid syntax near '" + t.text + "'");
        }
        case TokenKind::Op:
            break;
        case TokenKind::Newline:
        case TokenKind::End:
            fail("unexpected end of statement");
    }

    const int line = t.line;
    if (matchOp("(")) {
        if (matchOp(")")) return makeExpr(ExprKind::Tuple, line);
        ExprPtr first = parseTest();
        rejectComprehension();
        if (!checkOp(",")) {
            expectOp(")");
            return first;
        }
        auto tuple = makeExpr(ExprKind::Tuple, line);
        tuple->children.push_back(first);
        while (matchOp(",")) {
            if (checkOp(")")) break;
            tuple->children.push_back(parseTest());
        }
        expectOp(")");
        return tuple;
    }
    if (matchOp("[")) {
        auto list = makeExpr(ExprKind::List, line);
        while (!checkOp("]")) {
            if (checkOp("*")) fail("starred expressions are not supported");
            list->children.push_back(parseTest());
            rejectComprehension();
            if (!matchOp(",")) break;
        }
        expectOp("]");
        return list;
    }
    if (matchOp("{")) {
        auto dict = makeExpr(ExprKind::Dict, line);
        while (!checkOp("}")) {
            if (checkOp("**")) fail("dict unpacking is not supported");
            ExprPtr key = parseTest();
            if (!checkOp(":")) fail("set literals are not supported");
            advance();
            ExprPtr value = parseTest();
            rejectComprehension();
            dict->children.push_back(key);
            dict->children.push_back(value);
            if (!matchOp(",")) break;
        }
        expectOp("}");
        return dict;
    }
    fail("invalid syntax near '" + t.text + "'");
}

} // namespace Script
