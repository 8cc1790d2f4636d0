#pragma once

#include "ScriptAst.h"
#include "ScriptValue.h"

#include <ostream>
#include <string>
#include <unordered_map>

namespace Script {

/**
 * @brief Tree-walking evaluator for parsed snippets.
 * @details Only registered operations are reachable: builtins, the pd/np
 * modules, the safe helpers, and methods of the runtime value types. Values
 * are immutable; item assignment copies the container and rebinds the root
 * name.
 */
class ScriptInterpreter {
public:
    /**
     * @param printStream receives print() output; nullptr discards it.
     */
    explicit ScriptInterpreter(std::ostream* printStream = nullptr);

    void bind(const std::string& name, Value value);
    const Value* lookup(const std::string& name) const;

    /**
     * @brief Executes body then epilogue and returns the `result` binding
     * (None when the snippet never bound it).
     * @throws Augur::ScriptError on any runtime failure.
     */
    Value run(const Program& program);

    void execute(const Statement& stmt);
    Value evaluate(const ExprPtr& expr);

private:
    Value loadName(const std::string& name) const;
    Value numberLiteral(const ExprNode& node) const;
    Value evalIndex(const ExprPtr& expr);
    Value evalCall(const ExprNode& node);
    Value evalCompare(const ExprNode& node);
    Value callValue(const Value& callee, const CallArgs& args);
    Value getAttribute(const Value& v, const std::string& name);
    Value getItem(const Value& container, const Value& key);
    bool contains(const Value& container, const Value& item);
    void assign(const ExprPtr& target, Value value);

    std::unordered_map<std::string, Value> globals_;
    std::ostream* printStream_ = nullptr;
};

} // namespace Script
