#include "ScriptAst.h"

#include <cstdio>

namespace Script {

namespace {
int precedenceOf(const ExprNode& e) {
    switch (e.kind) {
        case ExprKind::Ternary: return 1;
        case ExprKind::BoolOp: return e.text == "or" ? 2 : 3;
        case ExprKind::UnaryOp: return e.text == "not" ? 4 : 12;
        case ExprKind::Compare: return 5;
        case ExprKind::BinOp:
            if (e.text == "|") return 6;
            if (e.text == "^") return 7;
            if (e.text == "&") return 8;
            if (e.text == "<<" || e.text == ">>") return 9;
            if (e.text == "+" || e.text == "-") return 10;
            if (e.text == "**") return 13;
            return 11;
        case ExprKind::Attribute:
        case ExprKind::Subscript:
        case ExprKind::Call:
            return 14;
        default:
            return 15;
    }
}

std::string print(const ExprPtr& e, int minPrec);

std::string printSubscriptIndex(const ExprPtr& index) {
    if (index->kind == ExprKind::Tuple && !index->children.empty()) {
        std::string out;
        for (size_t i = 0; i < index->children.size(); ++i) {
            if (i > 0) out += ", ";
            out += print(index->children[i], 1);
        }
        if (index->children.size() == 1) out += ",";
        return out;
    }
    return print(index, 1);
}

std::string printBody(const ExprNode& e) {
    switch (e.kind) {
        case ExprKind::Name:
        case ExprKind::Number:
            return e.text;
        case ExprKind::String:
            return quoteString(e.text);
        case ExprKind::Bool:
            return e.boolValue ? "True" : "False";
        case ExprKind::NoneLit:
            return "None";
        case ExprKind::List:
        case ExprKind::Tuple: {
            std::string out = e.kind == ExprKind::List ? "[" : "(";
            for (size_t i = 0; i < e.children.size(); ++i) {
                if (i > 0) out += ", ";
                out += print(e.children[i], 1);
            }
            if (e.kind == ExprKind::Tuple && e.children.size() == 1) out += ",";
            out += e.kind == ExprKind::List ? "]" : ")";
            return out;
        }
        case ExprKind::Dict: {
            std::string out = "{";
            for (size_t i = 0; i + 1 < e.children.size(); i += 2) {
                if (i > 0) out += ", ";
                out += print(e.children[i], 1) + ": " + print(e.children[i + 1], 1);
            }
            return out + "}";
        }
        case ExprKind::Attribute:
            return print(e.children[0], 14) + "." + e.text;
        case ExprKind::Subscript:
            return print(e.children[0], 14) + "[" + printSubscriptIndex(e.children[1]) + "]";
        case ExprKind::Slice: {
            std::string out;
            if (e.children[0]) out += print(e.children[0], 1);
            out += ":";
            if (e.children[1]) out += print(e.children[1], 1);
            if (e.children[2]) out += ":" + print(e.children[2], 1);
            return out;
        }
        case ExprKind::Call: {
            std::string out = print(e.children[0], 14) + "(";
            bool first = true;
            for (size_t i = 1; i < e.children.size(); ++i) {
                if (!first) out += ", ";
                out += print(e.children[i], 1);
                first = false;
            }
            for (const auto& kw : e.keywords) {
                if (!first) out += ", ";
                out += kw.name + "=" + print(kw.value, 1);
                first = false;
            }
            return out + ")";
        }
        case ExprKind::BinOp: {
            const int p = precedenceOf(e);
            const bool rightAssoc = e.text == "**";
            return print(e.children[0], rightAssoc ? p + 1 : p) + " " + e.text + " " +
                   print(e.children[1], rightAssoc ? p : p + 1);
        }
        case ExprKind::UnaryOp:
            if (e.text == "not") return "not " + print(e.children[0], 4);
            return e.text + print(e.children[0], 12);
        case ExprKind::BoolOp: {
            const int p = precedenceOf(e);
            std::string out;
            for (size_t i = 0; i < e.children.size(); ++i) {
                if (i > 0) out += " " + e.text + " ";
                out += print(e.children[i], p + 1);
            }
            return out;
        }
        case ExprKind::Compare: {
            std::string out = print(e.children[0], 6);
            for (size_t i = 0; i < e.ops.size() && i + 1 < e.children.size(); ++i) {
                out += " " + e.ops[i] + " " + print(e.children[i + 1], 6);
            }
            return out;
        }
        case ExprKind::Ternary:
            return print(e.children[0], 2) + " if " + print(e.children[1], 2) + " else " + print(e.children[2], 1);
    }
    return "";
}

std::string print(const ExprPtr& e, int minPrec) {
    if (!e) return "";
    const std::string body = printBody(*e);
    return precedenceOf(*e) < minPrec ? "(" + body + ")" : body;
}
} // namespace

ExprPtr makeExpr(ExprKind kind, int line, std::string text) {
    auto node = std::make_shared<ExprNode>();
    node->kind = kind;
    node->line = line;
    node->text = std::move(text);
    return node;
}

ExprPtr makeName(const std::string& id, int line) {
    return makeExpr(ExprKind::Name, line, id);
}

ExprPtr makeCall(ExprPtr callee, std::vector<ExprPtr> args, int line) {
    auto node = makeExpr(ExprKind::Call, line);
    node->children.reserve(args.size() + 1);
    node->children.push_back(std::move(callee));
    for (auto& a : args) node->children.push_back(std::move(a));
    return node;
}

ExprPtr transformExpr(const ExprPtr& expr, const std::function<ExprPtr(const ExprPtr&)>& fn) {
    if (!expr) return expr;
    auto copy = std::make_shared<ExprNode>(*expr);
    for (auto& child : copy->children) child = transformExpr(child, fn);
    for (auto& kw : copy->keywords) kw.value = transformExpr(kw.value, fn);
    return fn(copy);
}

void visitExpr(const ExprPtr& expr, const std::function<void(const ExprNode&)>& fn) {
    if (!expr) return;
    fn(*expr);
    for (const auto& child : expr->children) visitExpr(child, fn);
    for (const auto& kw : expr->keywords) visitExpr(kw.value, fn);
}

std::string quoteString(const std::string& value) {
    const bool hasSingle = value.find('\'') != std::string::npos;
    const bool hasDouble = value.find('"') != std::string::npos;
    const char quote = (hasSingle && !hasDouble) ? '"' : '\'';
    std::string out(1, quote);
    for (unsigned char c : value) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c == static_cast<unsigned char>(quote)) {
                    out.push_back('\\');
                    out.push_back(static_cast<char>(c));
                } else if (c < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\x%02x", c);
                    out += buf;
                } else {
                    out.push_back(static_cast<char>(c));
                }
        }
    }
    out.push_back(quote);
    return out;
}

std::string toSource(const ExprPtr& expr) {
    return print(expr, 0);
}

std::string toSource(const Statement& stmt) {
    switch (stmt.kind) {
        case StmtKind::Expression:
            return toSource(stmt.value);
        case StmtKind::Assign: {
            std::string target;
            if (stmt.target && stmt.target->kind == ExprKind::Tuple) {
                for (size_t i = 0; i < stmt.target->children.size(); ++i) {
                    if (i > 0) target += ", ";
                    target += toSource(stmt.target->children[i]);
                }
            } else {
                target = toSource(stmt.target);
            }
            return target + " = " + toSource(stmt.value);
        }
        case StmtKind::Import:
            return "import " + stmt.name;
        case StmtKind::FunctionDef:
            return "def " + stmt.name + "(...): ...";
        case StmtKind::ClassDef:
            return "class " + stmt.name + ": ...";
    }
    return "";
}

std::string toSource(const Program& program) {
    std::string out;
    for (const auto& s : program.body) out += toSource(s) + "\n";
    for (const auto& s : program.epilogue) out += toSource(s) + "\n";
    return out;
}

} // namespace Script
