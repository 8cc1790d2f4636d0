#pragma once

#include "ScriptAst.h"
#include "ScriptLexer.h"

#include <initializer_list>
#include <string>
#include <vector>

namespace Script {

/**
 * @brief Recursive-descent parser for the snippet language.
 * @details Follows Python operator precedence. Augmented assignment is
 * desugared to a plain assignment. import/from/def/class are kept as
 * statements so the validator can name them; their bodies are skipped.
 */
class ScriptParser {
public:
    explicit ScriptParser(std::vector<Token> tokens);

    /**
     * @throws Augur::ScriptSyntaxError on malformed or unsupported syntax.
     */
    static Program parse(const std::string& source);

    Program parseProgram();

private:
    const Token& peek(size_t ahead = 0) const;
    const Token& advance();
    bool checkOp(const char* op) const;
    bool matchOp(const char* op);
    void expectOp(const char* op);
    bool checkKeyword(const char* kw) const;
    bool matchKeyword(const char* kw);
    bool atExpressionEnd() const;
    [[noreturn]] void fail(const std::string& message) const;

    Statement parseStatement();
    void consumeNewline();
    void skipIndentedBlock();
    std::string parseDottedName();
    void checkAssignTarget(const ExprPtr& target) const;

    ExprPtr parseExprList();
    ExprPtr parseTest();
    ExprPtr parseOrTest();
    ExprPtr parseAndTest();
    ExprPtr parseNotTest();
    ExprPtr parseComparison();
    ExprPtr parseBinaryLevel(std::initializer_list<const char*> ops, ExprPtr (ScriptParser::*next)());
    ExprPtr parseBitOr();
    ExprPtr parseBitXor();
    ExprPtr parseBitAnd();
    ExprPtr parseShift();
    ExprPtr parseArith();
    ExprPtr parseTerm();
    ExprPtr parseFactor();
    ExprPtr parsePower();
    ExprPtr parsePostfix();
    ExprPtr parseAtom();
    ExprPtr parseCall(ExprPtr callee);
    ExprPtr parseSubscript(ExprPtr value);
    ExprPtr parseSubscriptItem();
    void rejectComprehension() const;

    std::vector<Token> tokens_;
    size_t pos_ = 0;
};

} // namespace Script
