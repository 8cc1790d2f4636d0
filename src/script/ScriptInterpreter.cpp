#include "ScriptInterpreter.h"
#include "FrameOps.h"
#include "ScriptBuiltins.h"
#include "SeriesOps.h"

#include <charconv>
#include <cmath>
#include <limits>

namespace Script {

namespace {
bool isString(const Value& v) {
    return v.isScalar() && std::holds_alternative<std::string>(v.scalar());
}

int64_t normalizedPosition(const Value& key, size_t size, const std::string& what) {
    if (!key.isScalar() || !(std::holds_alternative<int64_t>(key.scalar()) || std::holds_alternative<bool>(key.scalar()))) {
        raise("TypeError", what + " indices must be integers or slices, not " + typeName(key));
    }
    int64_t p = toInteger(key.scalar());
    if (p < 0) p += static_cast<int64_t>(size);
    if (p < 0 || p >= static_cast<int64_t>(size)) raise("IndexError", what + " index out of range");
    return p;
}

bool sameObject(const Value& a, const Value& b) {
    if (a.isNone() || b.isNone()) return a.isNone() && b.isNone();
    if (a.isScalar() && b.isScalar()) {
        const Scalar& x = a.scalar();
        const Scalar& y = b.scalar();
        if (x.index() != y.index()) return false;
        if (const auto* d = std::get_if<double>(&x)) return *d == std::get<double>(y) || (std::isnan(*d) && std::isnan(std::get<double>(y)));
        return scalarsEqual(x, y);
    }
    return false;
}

bool scalarListEquals(const Value& a, const Value& b) {
    if (a.isScalar() && b.isScalar()) return scalarsEqual(a.scalar(), b.scalar());
    return scalarTruthy(SeriesOps::compare("==", a, b).scalar());
}
} // namespace

ScriptInterpreter::ScriptInterpreter(std::ostream* printStream)
    : printStream_(printStream) {}

void ScriptInterpreter::bind(const std::string& name, Value value) {
    globals_[name] = std::move(value);
}

const Value* ScriptInterpreter::lookup(const std::string& name) const {
    const auto it = globals_.find(name);
    return it == globals_.end() ? nullptr : &it->second;
}

Value ScriptInterpreter::run(const Program& program) {
    for (const auto& stmt : program.body) execute(stmt);
    for (const auto& stmt : program.epilogue) execute(stmt);
    const Value* result = lookup("result");
    return result ? *result : Value::none();
}

void ScriptInterpreter::execute(const Statement& stmt) {
    switch (stmt.kind) {
        case StmtKind::Expression:
            evaluate(stmt.value);
            return;
        case StmtKind::Assign:
            assign(stmt.target, evaluate(stmt.value));
            return;
        case StmtKind::Import:
            raise("ImportError", "import of '" + stmt.name + "' is not allowed");
        case StmtKind::FunctionDef:
            raise("SyntaxError", "function definitions are not allowed");
        case StmtKind::ClassDef:
            raise("SyntaxError", "class definitions are not allowed");
    }
}

Value ScriptInterpreter::loadName(const std::string& name) const {
    if (const Value* v = lookup(name)) return *v;
    return Builtins::globalValue(name);
}

Value ScriptInterpreter::numberLiteral(const ExprNode& node) const {
    const std::string& text = node.text;
    if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        int64_t v = 0;
        auto [p, ec] = std::from_chars(text.data() + 2, text.data() + text.size(), v, 16);
        if (ec != std::errc{} || p != text.data() + text.size()) raise("ValueError", "invalid hexadecimal literal " + text);
        return Value::integer(v);
    }
    const bool isFloat = text.find_first_of(".eE") != std::string::npos;
    if (!isFloat) {
        int64_t v = 0;
        auto [p, ec] = std::from_chars(text.data(), text.data() + text.size(), v);
        if (ec == std::errc{} && p == text.data() + text.size()) return Value::integer(v);
    }
    double d = 0.0;
    auto [p, ec] = std::from_chars(text.data(), text.data() + text.size(), d);
    if (ec == std::errc::result_out_of_range) return Value::number(std::numeric_limits<double>::infinity());
    if (ec != std::errc{} || p != text.data() + text.size()) raise("ValueError", "invalid numeric literal " + text);
    return Value::number(d);
}

Value ScriptInterpreter::evalIndex(const ExprPtr& expr) {
    if (expr->kind == ExprKind::Slice) {
        Scalar bounds[3];
        for (size_t i = 0; i < 3; ++i) {
            if (!expr->children[i]) continue;
            const Value bound = evaluate(expr->children[i]);
            if (!bound.isScalar()) raise("TypeError", "slice bounds must be scalars, not " + typeName(bound));
            bounds[i] = bound.scalar();
        }
        return makeSlice(bounds[0], bounds[1], bounds[2]);
    }
    if (expr->kind == ExprKind::Tuple) {
        std::vector<Value> items;
        for (const auto& child : expr->children) items.push_back(evalIndex(child));
        return makeList(std::move(items), true);
    }
    return evaluate(expr);
}

Value ScriptInterpreter::evaluate(const ExprPtr& expr) {
    const ExprNode& node = *expr;
    switch (node.kind) {
        case ExprKind::Name:
            return loadName(node.text);
        case ExprKind::Number:
            return numberLiteral(node);
        case ExprKind::String:
            return Value::string(node.text);
        case ExprKind::Bool:
            return Value::boolean(node.boolValue);
        case ExprKind::NoneLit:
            return Value::none();
        case ExprKind::List:
        case ExprKind::Tuple: {
            std::vector<Value> items;
            items.reserve(node.children.size());
            for (const auto& child : node.children) items.push_back(evaluate(child));
            return makeList(std::move(items), node.kind == ExprKind::Tuple);
        }
        case ExprKind::Dict: {
            DictValue d;
            for (size_t i = 0; i + 1 < node.children.size(); i += 2) {
                const Value key = evaluate(node.children[i]);
                if (!key.isScalar()) raise("TypeError", "unhashable type: '" + typeName(key) + "'");
                d.set(key.scalar(), evaluate(node.children[i + 1]));
            }
            return Value(std::move(d));
        }
        case ExprKind::Attribute:
            return getAttribute(evaluate(node.children[0]), node.text);
        case ExprKind::Subscript:
            return getItem(evaluate(node.children[0]), evalIndex(node.children[1]));
        case ExprKind::Slice:
            return evalIndex(expr);
        case ExprKind::Call:
            return evalCall(node);
        case ExprKind::BinOp:
            return SeriesOps::binary(node.text, evaluate(node.children[0]), evaluate(node.children[1]));
        case ExprKind::UnaryOp: {
            const Value operand = evaluate(node.children[0]);
            if (node.text == "not") return Value::boolean(!truthy(operand));
            return SeriesOps::unary(node.text, operand);
        }
        case ExprKind::BoolOp: {
            const bool isAnd = node.text == "and";
            Value last;
            for (const auto& child : node.children) {
                last = evaluate(child);
                if (truthy(last) != isAnd) return last;
            }
            return last;
        }
        case ExprKind::Compare:
            return evalCompare(node);
        case ExprKind::Ternary:
            return truthy(evaluate(node.children[1])) ? evaluate(node.children[0]) : evaluate(node.children[2]);
    }
    raise("SyntaxError", "unsupported expression");
}

Value ScriptInterpreter::evalCompare(const ExprNode& node) {
    Value left = evaluate(node.children[0]);
    Value outcome;
    for (size_t i = 0; i < node.ops.size(); ++i) {
        Value right = evaluate(node.children[i + 1]);
        const std::string& op = node.ops[i];
        if (op == "in" || op == "not in") {
            const bool found = contains(right, left);
            outcome = Value::boolean(op == "in" ? found : !found);
        } else if (op == "is" || op == "is not") {
            const bool same = sameObject(left, right);
            outcome = Value::boolean(op == "is" ? same : !same);
        } else {
            outcome = SeriesOps::compare(op, left, right);
        }
        if (node.ops.size() == 1) return outcome;
        if (!truthy(outcome)) return outcome;
        left = std::move(right);
    }
    return outcome;
}

bool ScriptInterpreter::contains(const Value& container, const Value& item) {
    if (isString(container)) {
        if (!isString(item)) raise("TypeError", "'in <string>' requires string as left operand, not " + typeName(item));
        return std::get<std::string>(container.scalar()).find(std::get<std::string>(item.scalar())) != std::string::npos;
    }
    if (container.isDict()) {
        if (!item.isScalar()) raise("TypeError", "unhashable type: '" + typeName(item) + "'");
        return container.dict().find(item.scalar()) != nullptr;
    }
    if (container.isList()) {
        for (const auto& element : container.list().items) {
            if (element.isScalar() != item.isScalar()) continue;
            if (scalarListEquals(element, item)) return true;
        }
        return false;
    }
    if (container.isSeries()) {
        if (!item.isScalar()) return false;
        return !container.series().index.find({item.scalar()}).empty();
    }
    if (container.isFrame()) {
        return isString(item) && container.frame().findColumn(std::get<std::string>(item.scalar())) >= 0;
    }
    raise("TypeError", "argument of type '" + typeName(container) + "' is not iterable");
}

Value ScriptInterpreter::evalCall(const ExprNode& node) {
    const Value callee = evaluate(node.children[0]);
    CallArgs args;
    for (size_t i = 1; i < node.children.size(); ++i) args.positional.push_back(evaluate(node.children[i]));
    for (const auto& kw : node.keywords) args.keywords.emplace_back(kw.name, evaluate(kw.value));
    return callValue(callee, args);
}

Value ScriptInterpreter::callValue(const Value& callee, const CallArgs& args) {
    if (!callee.isObject()) raise("TypeError", "'" + typeName(callee) + "' object is not callable");
    const Object& fn = callee.object();
    switch (fn.kind) {
        case Object::Kind::Builtin:
        case Object::Kind::ModuleFunction:
            return Builtins::call(fn, args, printStream_);
        case Object::Kind::Method: {
            const Value& self = fn.self;
            if (self.isSeries()) {
                if (fn.name.rfind("str.", 0) == 0) return SeriesOps::strMethod(self.series(), fn.name.substr(4), args);
                if (fn.name.rfind("dt.", 0) == 0) return SeriesOps::dtMethod(self.series(), fn.name.substr(3), args);
                return SeriesOps::callMethod(self, fn.name, args);
            }
            if (self.isFrame()) return FrameOps::callMethod(self, fn.name, args);
            if (self.isGroupBy()) return FrameOps::groupByCall(self.groupBy(), fn.name, args);
            return Builtins::callMethod(self, fn.name, args);
        }
        default:
            break;
    }
    raise("TypeError", "'" + typeName(callee) + "' object is not callable");
}

Value ScriptInterpreter::getAttribute(const Value& v, const std::string& name) {
    if (v.isSeries()) return SeriesOps::getAttribute(v, name);
    if (v.isFrame()) return FrameOps::getAttribute(v, name);
    if (v.isGroupBy()) return FrameOps::groupByAttribute(v, name);
    if (v.isObject()) {
        const Object& o = v.object();
        if (o.kind == Object::Kind::StrAccessor) {
            if (!SeriesOps::hasStrMethod(name)) {
                raise("AttributeError", "'StringMethods' object has no attribute '" + name + "'");
            }
            Object method;
            method.kind = Object::Kind::Method;
            method.name = "str." + name;
            method.self = o.self;
            return Value(std::move(method));
        }
        if (o.kind == Object::Kind::DtAccessor) return SeriesOps::dtAttribute(o.self.series(), name);
        if (o.kind != Object::Kind::Module) {
            raise("AttributeError", "'" + typeName(v) + "' object has no attribute '" + name + "'");
        }
    }
    return Builtins::getAttribute(v, name);
}

Value ScriptInterpreter::getItem(const Value& container, const Value& key) {
    if (container.isSeries()) return SeriesOps::getItem(container.series(), key);
    if (container.isFrame()) return FrameOps::getItem(container.frame(), key);
    if (container.isGroupBy()) return FrameOps::groupByGetItem(container.groupBy(), key);
    if (container.isObject()) {
        const Object& o = container.object();
        if (o.kind == Object::Kind::ILocIndexer) {
            return o.self.isSeries() ? SeriesOps::ilocGet(o.self.series(), key) : FrameOps::ilocGet(o.self.frame(), key);
        }
        if (o.kind == Object::Kind::LocIndexer) {
            return o.self.isSeries() ? SeriesOps::locGet(o.self.series(), key) : FrameOps::locGet(o.self.frame(), key);
        }
    }
    if (container.isList()) {
        const auto& items = container.list().items;
        if (isSlice(key)) {
            std::vector<Value> picked;
            for (size_t p : slicePositions(key, items.size())) picked.push_back(items[p]);
            return makeList(std::move(picked), container.list().isTuple);
        }
        return items[static_cast<size_t>(normalizedPosition(key, items.size(), container.list().isTuple ? "tuple" : "list"))];
    }
    if (isString(container)) {
        const std::string& text = std::get<std::string>(container.scalar());
        if (isSlice(key)) {
            std::string picked;
            for (size_t p : slicePositions(key, text.size())) picked.push_back(text[p]);
            return Value::string(std::move(picked));
        }
        return Value::string(std::string(1, text[static_cast<size_t>(normalizedPosition(key, text.size(), "string"))]));
    }
    if (container.isDict()) {
        if (!key.isScalar()) raise("TypeError", "unhashable type: '" + typeName(key) + "'");
        if (const Value* found = container.dict().find(key.scalar())) return *found;
        raise("KeyError", scalarRepr(key.scalar()));
    }
    raise("TypeError", "'" + typeName(container) + "' object is not subscriptable");
}

void ScriptInterpreter::assign(const ExprPtr& target, Value value) {
    switch (target->kind) {
        case ExprKind::Name:
            globals_[target->text] = std::move(value);
            return;
        case ExprKind::Tuple:
        case ExprKind::List: {
            const std::vector<Value> items = Builtins::iterate(value);
            if (items.size() != target->children.size()) {
                raise("ValueError", std::string(items.size() > target->children.size() ? "too many" : "not enough") +
                                    " values to unpack (expected " + std::to_string(target->children.size()) + ")");
            }
            for (size_t i = 0; i < items.size(); ++i) assign(target->children[i], items[i]);
            return;
        }
        case ExprKind::Subscript: {
            const ExprPtr& base = target->children[0];
            const Value key = evalIndex(target->children[1]);
            if (base->kind == ExprKind::Attribute && (base->text == "loc" || base->text == "iloc")) {
                const ExprPtr& ownerExpr = base->children[0];
                const Value owner = evaluate(ownerExpr);
                const bool positional = base->text == "iloc";
                if (owner.isSeries()) {
                    const Series& s = owner.series();
                    assign(ownerExpr, Value(positional ? SeriesOps::ilocSet(s, key, value) : SeriesOps::setItem(s, key, value)));
                    return;
                }
                if (owner.isFrame()) {
                    const Frame& f = owner.frame();
                    assign(ownerExpr, Value(positional ? FrameOps::ilocSet(f, key, value) : FrameOps::locSet(f, key, value)));
                    return;
                }
                raise("AttributeError", "'" + typeName(owner) + "' object has no attribute '" + base->text + "'");
            }
            const Value container = evaluate(base);
            if (container.isFrame()) {
                assign(base, Value(FrameOps::setItem(container.frame(), key, value)));
            } else if (container.isSeries()) {
                assign(base, Value(SeriesOps::setItem(container.series(), key, value)));
            } else if (container.isDict()) {
                if (!key.isScalar()) raise("TypeError", "unhashable type: '" + typeName(key) + "'");
                DictValue d = container.dict();
                d.set(key.scalar(), std::move(value));
                assign(base, Value(std::move(d)));
            } else if (container.isList() && !container.list().isTuple) {
                ListValue l = container.list();
                l.items[static_cast<size_t>(normalizedPosition(key, l.items.size(), "list assignment"))] = std::move(value);
                assign(base, Value(std::move(l)));
            } else {
                raise("TypeError", "'" + typeName(container) + "' object does not support item assignment");
            }
            return;
        }
        case ExprKind::Attribute:
            raise("TypeError", "attribute assignment to '" + target->text + "' is not supported");
        default:
            raise("SyntaxError", "cannot assign to expression");
    }
}

} // namespace Script
