#pragma once

#include "ScriptValue.h"
#include "TypedDataset.h"

#include <string>
#include <vector>

namespace Script {
namespace FrameOps {

/**
 * @brief Converts typed dataset columns into script cells with a range index.
 * Missing numeric cells become NaN, missing text and datetime cells None.
 */
Frame fromDataset(const TypedDataset& dataset);

/**
 * @brief Builds a frame from a dict of column -> list/series/scalar, or from
 * a list of row dicts (pd.DataFrame).
 */
Frame fromData(const Value& data, const Value* columns);

Value getAttribute(const Value& self, const std::string& name);
Value callMethod(const Value& self, const std::string& name, const CallArgs& args);
bool hasMethod(const std::string& name);

/**
 * @brief df[key]: a column name selects a Series, a list selects a Frame of
 * columns, a boolean mask or a slice selects rows.
 */
Value getItem(const Frame& f, const Value& key);

/**
 * @brief df[key] = value. Scalars broadcast, series align on labels, lists
 * must match the row count. A boolean-frame key assigns into the frame cells.
 */
Frame setItem(const Frame& f, const Value& key, const Value& value);

Value ilocGet(const Frame& f, const Value& key);
Frame ilocSet(const Frame& f, const Value& key, const Value& value);
Value locGet(const Frame& f, const Value& key);
Frame locSet(const Frame& f, const Value& key, const Value& value);

/**
 * @brief One frame row as a Series whose labels are the column names.
 */
Series rowSeries(const Frame& f, size_t row);

Value makeGroupBy(const Value& frame, const CallArgs& args);
Value groupByAttribute(const Value& self, const std::string& name);
Value groupByGetItem(const GroupBy& g, const Value& key);
Value groupByCall(const GroupBy& g, const std::string& name, const CallArgs& args);
bool hasGroupByMethod(const std::string& name);

} // namespace FrameOps
} // namespace Script
