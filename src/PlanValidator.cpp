#include "PlanValidator.h"
#include "AugurExceptions.h"
#include "ScriptParser.h"

#include <algorithm>

using namespace Script;

namespace {
constexpr const char* kResultName = "result";

bool isStrContains(const ExprNode& callee) {
    if (callee.kind != ExprKind::Attribute || callee.text != "contains") return false;
    const ExprNode& accessor = *callee.children[0];
    return accessor.kind == ExprKind::Attribute && accessor.text == "str";
}

// Names along a dotted callee: os.path.join -> {os, path, join}.
std::vector<std::string> calleeNames(const ExprNode& callee) {
    std::vector<std::string> names;
    const ExprNode* node = &callee;
    while (node->kind == ExprKind::Attribute) {
        names.push_back(node->text);
        node = node->children[0].get();
    }
    if (node->kind == ExprKind::Name) names.push_back(node->text);
    return names;
}

Statement assignResult(ExprPtr value, int line) {
    Statement stmt;
    stmt.kind = StmtKind::Assign;
    stmt.line = line;
    stmt.target = makeName(kResultName, line);
    stmt.value = std::move(value);
    return stmt;
}
} // namespace

PlanValidator::PlanValidator(std::vector<std::string> deniedNames)
    : deniedNames_(std::move(deniedNames)) {}

bool PlanValidator::isDenied(const std::string& name) const {
    return std::find(deniedNames_.begin(), deniedNames_.end(), name) != deniedNames_.end();
}

ExprPtr PlanValidator::rewrite(const ExprPtr& expr) {
    return transformExpr(expr, [](const ExprPtr& node) -> ExprPtr {
        if (node->kind == ExprKind::Name && node->text == "data") {
            return makeName("df", node->line);
        }
        if (node->kind == ExprKind::BinOp && node->text == "/") {
            return makeCall(makeName("safe_divide", node->line), {node->children[0], node->children[1]}, node->line);
        }
        if (node->kind == ExprKind::Call && isStrContains(*node->children[0]) && node->children.size() >= 2) {
            const ExprPtr& column = node->children[0]->children[0]->children[0];
            return makeCall(makeName("safe_contains", node->line), {column, node->children[1]}, node->line);
        }
        return node;
    });
}

std::string PlanValidator::findDeniedConstruct(const Statement& stmt) const {
    switch (stmt.kind) {
        case StmtKind::Import:
            return "import statements are not allowed ('import " + stmt.name + "', line " + std::to_string(stmt.line) + ")";
        case StmtKind::FunctionDef:
            return "function definitions are not allowed ('def " + stmt.name + "', line " + std::to_string(stmt.line) + ")";
        case StmtKind::ClassDef:
            return "class definitions are not allowed ('class " + stmt.name + "', line " + std::to_string(stmt.line) + ")";
        default:
            break;
    }

    std::string found;
    const auto check = [&](const ExprNode& node) {
        if (!found.empty() || node.kind != ExprKind::Call) return;
        for (const auto& name : calleeNames(*node.children[0])) {
            if (isDenied(name)) {
                found = "call to '" + name + "' is not allowed (line " + std::to_string(node.line) + ")";
                return;
            }
        }
    };
    if (stmt.target) visitExpr(stmt.target, check);
    if (stmt.value) visitExpr(stmt.value, check);
    return found;
}

ValidationResult PlanValidator::validate(const std::string& code) const {
    ValidationResult out;
    Program program;
    try {
        program = ScriptParser::parse(code);
    } catch (const Augur::ScriptSyntaxError& e) {
        out.error = e.what();
        return out;
    }

    for (const auto& stmt : program.body) {
        std::string denied = findDeniedConstruct(stmt);
        if (!denied.empty()) {
            out.error = "Disallowed construct: " + denied;
            return out;
        }
    }
    if (program.body.empty()) {
        out.error = "Snippet contains no statements";
        return out;
    }

    for (auto& stmt : program.body) {
        if (stmt.target) stmt.target = rewrite(stmt.target);
        if (stmt.value) stmt.value = rewrite(stmt.value);
    }

    const Statement last = program.body.back();
    if (last.kind == StmtKind::Expression) {
        program.body.back() = assignResult(last.value, last.line);
    } else if (!(last.target->kind == ExprKind::Name && last.target->text == kResultName)) {
        program.body.push_back(assignResult(last.target, last.line));
    }

    const int tailLine = program.body.back().line + 1;
    program.epilogue.push_back(
        assignResult(makeCall(makeName("zero_non_finite", tailLine), {makeName(kResultName, tailLine)}, tailLine), tailLine));

    out.ok = true;
    out.sanitizedCode = toSource(program);
    out.program = std::move(program);
    return out;
}
