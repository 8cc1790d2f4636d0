#pragma once

#include "ScriptValue.h"

#include <ostream>
#include <string>
#include <vector>

namespace Script {

/**
 * @brief Null-tolerant helpers the executor exposes to every snippet.
 */
namespace SafeOps {
/**
 * @brief a / b where a zero, missing or non-finite denominator, or a
 * non-finite quotient, yields 0. Works on scalars, series and frames.
 */
Value safeDivide(const Value& a, const Value& b);

/**
 * @brief Case-insensitive substring test; missing cells are false.
 */
Value safeContains(const Value& column, const Value& pattern);

/**
 * @brief Recursively replaces NaN and infinities with 0.
 */
Value cleanResult(const Value& v);

/**
 * @brief Replaces a non-finite scalar, or non-finite values of a flat dict,
 * with 0. Anything else is returned unchanged.
 */
Value zeroNonFinite(const Value& v);
} // namespace SafeOps

namespace Builtins {

/**
 * @brief Global names every snippet sees besides df and prior results.
 */
const std::vector<std::string>& globalNames();
Value globalValue(const std::string& name);

/**
 * @brief Calls a builtin or module function. print writes to out when set.
 */
Value call(const Object& fn, const CallArgs& args, std::ostream* out);

/**
 * @brief Attribute lookup on modules and plain values (str, list, dict,
 * Timestamp, Timedelta). Methods come back as bound Method objects.
 */
Value getAttribute(const Value& self, const std::string& name);
Value callMethod(const Value& self, const std::string& name, const CallArgs& args);

/**
 * @brief Python iteration order of a value: list items, dict keys, string
 * characters, series values, frame column names.
 */
std::vector<Value> iterate(const Value& v);

} // namespace Builtins
} // namespace Script
