#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace Script {

enum class ExprKind {
    Name,
    Number,
    String,
    Bool,
    NoneLit,
    List,
    Tuple,
    Dict,
    Attribute,
    Subscript,
    Slice,
    Call,
    BinOp,
    UnaryOp,
    BoolOp,
    Compare,
    Ternary
};

struct ExprNode;
using ExprPtr = std::shared_ptr<ExprNode>;

struct Keyword {
    std::string name;
    ExprPtr value;
};

/**
 * @brief One expression node.
 * @details Child layout by kind:
 *  Attribute [value] text=attr; Subscript [value, index]; Slice [lower, upper, step]
 *  (entries may be null); Call [callee, args...] plus keywords; BinOp [lhs, rhs]
 *  text=op; UnaryOp [operand] text=op; BoolOp operands text=and|or; Compare operands
 *  with ops between them; Ternary [body, test, orelse]; Dict [k0, v0, k1, v1, ...].
 *  Number keeps its source text; String keeps its decoded value.
 */
struct ExprNode {
    ExprKind kind = ExprKind::NoneLit;
    int line = 1;
    std::string text;
    bool boolValue = false;
    std::vector<ExprPtr> children;
    std::vector<std::string> ops;
    std::vector<Keyword> keywords;
};

ExprPtr makeExpr(ExprKind kind, int line, std::string text = {});
ExprPtr makeName(const std::string& id, int line);
ExprPtr makeCall(ExprPtr callee, std::vector<ExprPtr> args, int line);

enum class StmtKind { Expression, Assign, Import, FunctionDef, ClassDef };

struct Statement {
    StmtKind kind = StmtKind::Expression;
    int line = 1;
    ExprPtr target;     // Assign only
    ExprPtr value;      // Expression and Assign
    std::string name;   // imported module, function or class name
};

/**
 * @brief A parsed snippet. The epilogue holds statements appended after the
 * user's body (result normalization), kept apart so the body stays inspectable.
 */
struct Program {
    std::vector<Statement> body;
    std::vector<Statement> epilogue;
};

/**
 * @brief Rebuilds an expression bottom-up; fn sees each node after its children
 * were rebuilt and returns the replacement (or the node itself).
 */
ExprPtr transformExpr(const ExprPtr& expr, const std::function<ExprPtr(const ExprPtr&)>& fn);

/**
 * @brief Visits every node pre-order.
 */
void visitExpr(const ExprPtr& expr, const std::function<void(const ExprNode&)>& fn);

std::string quoteString(const std::string& value);
std::string toSource(const ExprPtr& expr);
std::string toSource(const Statement& stmt);
std::string toSource(const Program& program);

} // namespace Script
