#pragma once

#include "ScriptValue.h"

#include <functional>
#include <string>
#include <vector>

namespace Script {
namespace SeriesOps {

/**
 * @brief Arithmetic, bitwise and shift operators on two cells.
 * @details In elementwise mode missing operands propagate as NaN and division
 * by zero yields inf/NaN; in scalar mode Python rules apply (ZeroDivisionError).
 */
Scalar binaryScalar(const std::string& op, const Scalar& a, const Scalar& b, bool elementwise);
Scalar compareScalar(const std::string& op, const Scalar& a, const Scalar& b, bool elementwise);

Value binary(const std::string& op, const Value& a, const Value& b);
Value compare(const std::string& op, const Value& a, const Value& b);
Value unary(const std::string& op, const Value& v);

/**
 * @brief Combines two series cell by cell after aligning on index labels.
 * Identical indexes combine positionally; otherwise the result index is the
 * left labels followed by right-only labels, and absent cells are missing.
 */
Series combine(const Series& a, const Series& b, const std::function<Scalar(const Scalar&, const Scalar&)>& fn);
Series mapValues(const Series& s, const std::function<Scalar(const Scalar&)>& fn);

/**
 * @brief Reduces one column of cells: sum prod mean median min max std var
 * count size nunique first last any all.
 */
Scalar aggregate(const std::string& func, const std::vector<Scalar>& values, DType dtype, int64_t ddof = 1);
bool isAggregation(const std::string& func);

/**
 * @brief Row positions of target selected by a boolean mask. A mask with the
 * same labels applies positionally; otherwise it is looked up by label.
 */
std::vector<size_t> maskPositions(const Value& mask, const Index& target);
bool isBooleanMask(const Value& v);

std::vector<size_t> labelPositions(const Index& index, const Value& key);
std::vector<size_t> listLabelPositions(const Index& index, const Value& key);

/**
 * @brief Positions covered by a label slice; both ends are inclusive.
 */
std::vector<size_t> labelSlicePositions(const Index& index, const Value& slice);

/**
 * @brief Stable multi-key ordering of row positions. Missing cells sort last
 * unless naFirst is set.
 */
std::vector<size_t> sortOrder(const std::vector<const std::vector<Scalar>*>& keys,
                              const std::vector<bool>& ascending,
                              bool naFirst = false);

Value getAttribute(const Value& self, const std::string& name);
Value callMethod(const Value& self, const std::string& name, const CallArgs& args);
bool hasMethod(const std::string& name);

Value getItem(const Series& s, const Value& key);
Series setItem(const Series& s, const Value& key, const Value& value);
Value ilocGet(const Series& s, const Value& key);
Series ilocSet(const Series& s, const Value& key, const Value& value);
Value locGet(const Series& s, const Value& key);

Value strMethod(const Series& s, const std::string& name, const CallArgs& args);
bool hasStrMethod(const std::string& name);
Value dtAttribute(const Series& s, const std::string& name);
Value dtMethod(const Series& s, const std::string& name, const CallArgs& args);
bool hasDtMethod(const std::string& name);

/**
 * @brief Broadcasts a value to n cells aligned with index: scalar repeats,
 * series aligns by label (or position when labels match), list must match n.
 */
std::vector<Scalar> broadcast(const Value& value, const Index& index, const std::string& context);

std::vector<Scalar> toNumericValues(const std::vector<Scalar>& values, const std::string& errors);
std::vector<Scalar> toDatetimeValues(const std::vector<Scalar>& values, const std::string& errors);
Series astype(const Series& s, const Value& type);

double roundHalfEven(double v, int64_t decimals);

} // namespace SeriesOps
} // namespace Script
