#pragma once

#include "ScriptAst.h"

#include <string>
#include <vector>

struct ValidationResult {
    bool ok = false;
    std::string sanitizedCode;
    std::string error;
    Script::Program program;   // rewritten tree, valid only when ok
};

/**
 * @brief Parses a metric snippet, rewrites unsafe idioms, rejects denied
 * constructs and binds the trailing value to `result`.
 * @details The deny-list is a structural check over the tree and not a
 * resource boundary; the interpreter only exposes registered operations.
 */
class PlanValidator {
public:
    explicit PlanValidator(std::vector<std::string> deniedNames = {"eval", "exec", "open", "system", "os"});

    /**
     * @brief Never throws; failures come back with ok=false and a message.
     */
    ValidationResult validate(const std::string& code) const;

    /**
     * @brief The three tree rewrites: X.str.contains(p) -> safe_contains(X, p),
     * a / b -> safe_divide(a, b), and the alias data -> df.
     */
    static Script::ExprPtr rewrite(const Script::ExprPtr& expr);

private:
    std::string findDeniedConstruct(const Script::Statement& stmt) const;
    bool isDenied(const std::string& name) const;

    std::vector<std::string> deniedNames_;
};
