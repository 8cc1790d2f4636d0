#include "FrameOps.h"
#include "SeriesOps.h"
#include "StatsUtils.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <unordered_map>
#include <unordered_set>

namespace Script {
namespace FrameOps {

namespace {
constexpr size_t kNoPos = static_cast<size_t>(-1);

struct Selection {
    std::vector<size_t> positions;
    bool single = false;
};

struct Groups {
    Index index;
    std::vector<std::vector<size_t>> rows;
};

Scalar nanScalar() {
    return Scalar(std::numeric_limits<double>::quiet_NaN());
}

bool isNumericDType(DType dtype) {
    return dtype == DType::Float || dtype == DType::Int || dtype == DType::Bool;
}

bool isString(const Value& v) {
    return v.isScalar() && std::holds_alternative<std::string>(v.scalar());
}

std::vector<std::string> stringList(const Value& v, const std::string& context) {
    std::vector<std::string> out;
    if (isString(v)) {
        out.push_back(std::get<std::string>(v.scalar()));
        return out;
    }
    for (const auto& s : scalarsFromValue(v, context)) {
        if (const auto* str = std::get_if<std::string>(&s)) {
            out.push_back(*str);
        } else {
            out.push_back(scalarStr(s));
        }
    }
    return out;
}

std::vector<std::string> columnNames(const Frame& f) {
    std::vector<std::string> out;
    out.reserve(f.columns.size());
    for (const auto& col : f.columns) out.push_back(col.name);
    return out;
}

size_t requireColumn(const Frame& f, const std::string& name) {
    const int idx = f.findColumn(name);
    if (idx < 0) raise("KeyError", "'" + name + "'");
    return static_cast<size_t>(idx);
}

Frame selectColumns(const Frame& f, const std::vector<std::string>& names) {
    std::vector<std::string> missing;
    for (const auto& n : names) {
        if (f.findColumn(n) < 0) missing.push_back("'" + n + "'");
    }
    if (!missing.empty()) {
        std::string joined;
        for (size_t i = 0; i < missing.size(); ++i) joined += (i ? ", " : "") + missing[i];
        raise("KeyError", "[" + joined + "] not in index");
    }
    Frame out;
    out.index = f.index;
    for (const auto& n : names) out.columns.push_back(f.columns[static_cast<size_t>(f.findColumn(n))]);
    return out;
}

int64_t intArg(const CallArgs& args, size_t pos, const std::string& kw, int64_t dflt) {
    const Value* v = args.get(pos, kw);
    if (!v || v->isNone()) return dflt;
    return toInteger(v->scalar());
}

bool boolArg(const CallArgs& args, size_t pos, const std::string& kw, bool dflt) {
    const Value* v = args.get(pos, kw);
    if (!v || v->isNone()) return dflt;
    return truthy(*v);
}

std::string stringArg(const CallArgs& args, size_t pos, const std::string& kw, const std::string& dflt) {
    const Value* v = args.get(pos, kw);
    if (!v || v->isNone()) return dflt;
    if (!isString(*v)) raise("TypeError", kw + " must be a string, not " + typeName(*v));
    return std::get<std::string>(v->scalar());
}

Value cellValue(const Scalar& s, DType dtype) {
    if (std::holds_alternative<std::monostate>(s) && (dtype == DType::Float || dtype == DType::Int)) {
        return Value(nanScalar());
    }
    return Value(s);
}

bool isIntKey(const Value& v) {
    return v.isScalar() && (std::holds_alternative<int64_t>(v.scalar()) || std::holds_alternative<bool>(v.scalar()));
}

bool isRowMask(const Value& v) {
    return SeriesOps::isBooleanMask(v);
}

Selection positionalRows(const Value& key, size_t n) {
    Selection sel;
    if (isSlice(key)) {
        sel.positions = slicePositions(key, n);
    } else if (isRowMask(key)) {
        // Positional masks ignore the mask's own labels.
        std::vector<Value> flags;
        for (const auto& v : scalarsFromValue(key, "boolean mask")) flags.push_back(Value::boolean(!isMissing(v) && scalarTruthy(v)));
        sel.positions = SeriesOps::maskPositions(makeList(std::move(flags)), Index::range(n));
    } else if (key.isList() || key.isSeries()) {
        for (const auto& s : scalarsFromValue(key, "positional indexer")) {
            int64_t p = toInteger(s);
            if (p < 0) p += static_cast<int64_t>(n);
            if (p < 0 || p >= static_cast<int64_t>(n)) raise("IndexError", "positional indexers are out-of-bounds");
            sel.positions.push_back(static_cast<size_t>(p));
        }
    } else if (isIntKey(key)) {
        int64_t p = toInteger(key.scalar());
        if (p < 0) p += static_cast<int64_t>(n);
        if (p < 0 || p >= static_cast<int64_t>(n)) raise("IndexError", "single positional indexer is out-of-bounds");
        sel.positions.push_back(static_cast<size_t>(p));
        sel.single = true;
    } else {
        raise("TypeError", "cannot index by position with " + typeName(key));
    }
    return sel;
}

Selection labelRows(const Frame& f, const Value& key) {
    Selection sel;
    if (isSlice(key)) {
        sel.positions = SeriesOps::labelSlicePositions(f.index, key);
    } else if (isRowMask(key)) {
        sel.positions = SeriesOps::maskPositions(key, f.index);
    } else if ((key.isList() && !key.list().isTuple) || key.isSeries()) {
        sel.positions = SeriesOps::listLabelPositions(f.index, key);
    } else {
        sel.positions = SeriesOps::labelPositions(f.index, key);
        sel.single = sel.positions.size() == 1;
    }
    return sel;
}

Selection positionalColumns(const Frame& f, const Value& key) {
    return positionalRows(key, f.columns.size());
}

Selection labelColumns(const Frame& f, const Value& key) {
    Selection sel;
    if (isSlice(key)) {
        const auto& parts = key.object().self.list().items;
        size_t start = 0;
        size_t stop = f.columns.size();
        if (!parts[0].isNone()) start = requireColumn(f, scalarStr(parts[0].scalar()));
        if (!parts[1].isNone()) stop = requireColumn(f, scalarStr(parts[1].scalar())) + 1;
        for (size_t i = start; i < stop; ++i) sel.positions.push_back(i);
    } else if (isString(key)) {
        sel.positions.push_back(requireColumn(f, std::get<std::string>(key.scalar())));
        sel.single = true;
    } else {
        for (const auto& name : stringList(key, "column list")) sel.positions.push_back(requireColumn(f, name));
    }
    return sel;
}

Value assemble(const Frame& f, const Selection& rows, const Selection& cols) {
    if (rows.single && cols.single) {
        const auto& col = f.columns[cols.positions.front()];
        return cellValue(col.values[rows.positions.front()], col.dtype);
    }
    if (cols.single) {
        return Value(f.column(cols.positions.front()).take(rows.positions));
    }
    Frame picked;
    picked.index = f.index;
    for (size_t c : cols.positions) picked.columns.push_back(f.columns[c]);
    if (rows.single) return Value(rowSeries(picked, rows.positions.front()));
    return Value(picked.take(rows.positions));
}

Selection allColumns(const Frame& f) {
    Selection sel;
    sel.positions.resize(f.columns.size());
    std::iota(sel.positions.begin(), sel.positions.end(), 0);
    return sel;
}

/**
 * @brief Writes value into the selected cells of one column.
 */
std::vector<Scalar> assignCells(const Frame& f, std::vector<Scalar> column, const std::vector<size_t>& rows, const Value& value) {
    if (value.isSeries()) {
        const std::vector<Scalar> aligned = SeriesOps::broadcast(value, f.index, "assignment");
        for (size_t r : rows) column[r] = aligned[r];
    } else if (value.isList()) {
        const auto items = scalarsFromValue(value, "assignment");
        if (items.size() != rows.size()) {
            raise("ValueError", "Must have equal len keys and value when setting with an iterable");
        }
        for (size_t i = 0; i < rows.size(); ++i) column[rows[i]] = items[i];
    } else {
        for (size_t r : rows) column[r] = value.scalar();
    }
    return column;
}

Frame assignRegion(const Frame& f, const std::vector<size_t>& rows, const std::vector<std::string>& columns, const Value& value) {
    Frame out = f;
    for (const auto& name : columns) {
        const int existing = out.findColumn(name);
        std::vector<Scalar> column = existing >= 0 ? out.columns[static_cast<size_t>(existing)].values
                                                   : std::vector<Scalar>(out.rows());
        Value cellSource = value;
        if (value.isFrame()) {
            const Frame& src = value.frame();
            const int srcIdx = src.findColumn(name);
            if (srcIdx < 0) raise("KeyError", "'" + name + "'");
            cellSource = Value(src.column(static_cast<size_t>(srcIdx)));
        }
        out.setColumn(name, assignCells(out, std::move(column), rows, cellSource));
    }
    return out;
}

std::vector<std::string> namesAt(const Frame& f, const std::vector<size_t>& positions) {
    std::vector<std::string> out;
    for (size_t p : positions) out.push_back(f.columns[p].name);
    return out;
}

Value reduceColumns(const Frame& f, const std::string& func, const CallArgs& args) {
    const bool numericOnlyDefault = func != "count" && func != "nunique" && func != "size";
    const bool numericOnly = boolArg(args, kNoPos, "numeric_only", numericOnlyDefault);
    const int64_t ddof = intArg(args, kNoPos, "ddof", 1);
    std::vector<Scalar> labels;
    std::vector<Scalar> values;
    for (const auto& col : f.columns) {
        if (numericOnly && !isNumericDType(col.dtype)) continue;
        labels.emplace_back(col.name);
        values.push_back(SeriesOps::aggregate(func, col.values, col.dtype, ddof));
    }
    return Value(Series::make(std::nullopt, std::move(values), Index::single("", std::move(labels))));
}

Frame mapCells(const Frame& f, const std::function<Scalar(const Scalar&)>& fn) {
    Frame out;
    out.index = f.index;
    for (const auto& col : f.columns) {
        std::vector<Scalar> values;
        values.reserve(col.values.size());
        for (const auto& v : col.values) values.push_back(fn(v));
        out.setColumn(col.name, std::move(values));
    }
    return out;
}

std::vector<size_t> duplicateFilter(const Frame& f, const std::vector<size_t>& cols, const std::string& keep) {
    std::vector<std::string> keys(f.rows());
    for (size_t r = 0; r < f.rows(); ++r) {
        for (size_t c : cols) {
            keys[r] += scalarKey(f.columns[c].values[r]);
            keys[r].push_back('\x1f');
        }
    }
    std::unordered_map<std::string, size_t> counts;
    for (const auto& k : keys) ++counts[k];
    std::unordered_map<std::string, size_t> seen;
    std::vector<size_t> rows;
    for (size_t r = 0; r < f.rows(); ++r) {
        const size_t occurrence = ++seen[keys[r]];
        if (keep == "last" ? occurrence == counts[keys[r]] : occurrence == 1) rows.push_back(r);
    }
    return rows;
}

Frame resetIndex(const Frame& f, bool drop) {
    Frame out;
    out.index = Index::range(f.rows());
    if (!drop && !f.index.isRange()) {
        for (size_t k = 0; k < f.index.nlevels(); ++k) {
            std::string levelName = f.index.names[k];
            if (levelName.empty()) levelName = f.index.nlevels() == 1 ? "index" : "level_" + std::to_string(k);
            if (f.findColumn(levelName) >= 0) raise("ValueError", "cannot insert " + levelName + ", already exists");
            out.setColumn(levelName, f.index.levels[k]);
        }
    } else if (!drop) {
        std::vector<Scalar> labels = f.index.levels.empty() ? std::vector<Scalar>{} : f.index.levels.front();
        if (f.findColumn("index") < 0) out.setColumn("index", std::move(labels));
    }
    for (const auto& col : f.columns) out.columns.push_back(col);
    return out;
}

Value frameToDict(const Frame& f, const std::string& orient) {
    const auto label = [&](size_t r) -> Scalar {
        return f.index.nlevels() == 1 ? f.index.levels.front()[r] : Scalar(f.index.displayAt(r));
    };
    if (orient == "records") {
        std::vector<Value> rows;
        for (size_t r = 0; r < f.rows(); ++r) {
            DictValue d;
            for (const auto& col : f.columns) d.set(Scalar(col.name), cellValue(col.values[r], col.dtype));
            rows.emplace_back(std::move(d));
        }
        return makeList(std::move(rows));
    }
    if (orient == "index") {
        DictValue out;
        for (size_t r = 0; r < f.rows(); ++r) {
            DictValue d;
            for (const auto& col : f.columns) d.set(Scalar(col.name), cellValue(col.values[r], col.dtype));
            out.set(label(r), Value(std::move(d)));
        }
        return Value(std::move(out));
    }
    DictValue out;
    for (const auto& col : f.columns) {
        if (orient == "list") {
            std::vector<Value> items;
            for (const auto& v : col.values) items.push_back(cellValue(v, col.dtype));
            out.set(Scalar(col.name), makeList(std::move(items)));
            continue;
        }
        if (orient != "dict") raise("ValueError", "orient '" + orient + "' not understood");
        DictValue d;
        for (size_t r = 0; r < f.rows(); ++r) d.set(label(r), cellValue(col.values[r], col.dtype));
        out.set(Scalar(col.name), Value(std::move(d)));
    }
    return Value(std::move(out));
}

Value correlationFrame(const Frame& f) {
    std::vector<std::vector<double>> data;
    std::vector<std::vector<uint8_t>> masks;
    std::vector<Scalar> labels;
    for (const auto& col : f.columns) {
        if (!isNumericDType(col.dtype)) continue;
        std::vector<double> xs(col.values.size(), 0.0);
        std::vector<uint8_t> missing(col.values.size(), 0);
        for (size_t r = 0; r < col.values.size(); ++r) {
            if (isMissing(col.values[r])) {
                missing[r] = 1;
            } else {
                xs[r] = toDouble(col.values[r]);
            }
        }
        data.push_back(std::move(xs));
        masks.push_back(std::move(missing));
        labels.emplace_back(col.name);
    }
    std::vector<const std::vector<double>*> cols;
    std::vector<const std::vector<uint8_t>*> colMasks;
    for (size_t i = 0; i < data.size(); ++i) {
        cols.push_back(&data[i]);
        colMasks.push_back(&masks[i]);
    }
    const auto matrix = StatsUtils::correlationMatrix(cols, colMasks);
    Frame out;
    out.index = Index::single("", labels);
    for (size_t j = 0; j < data.size(); ++j) {
        std::vector<Scalar> values;
        for (size_t i = 0; i < data.size(); ++i) values.emplace_back(matrix[i][j]);
        out.setColumn(std::get<std::string>(labels[j]), std::move(values));
    }
    return Value(std::move(out));
}

const std::unordered_set<std::string>& frameMethods() {
    static const std::unordered_set<std::string> kMethods = {
        "groupby", "head", "tail", "sort_values", "sort_index", "drop_duplicates", "dropna", "fillna",
        "copy", "nunique", "sum", "mean", "median", "min", "max", "std", "var", "count", "reset_index",
        "rename", "nlargest", "nsmallest", "drop", "set_index", "to_dict", "isna", "isnull", "notna",
        "notnull", "astype", "corr", "round", "abs", "any", "all"};
    return kMethods;
}

const std::unordered_set<std::string>& groupByMethods() {
    static const std::unordered_set<std::string> kMethods = {
        "sum", "mean", "median", "min", "max", "count", "size", "nunique", "std", "var", "first", "last",
        "prod", "agg", "aggregate", "transform"};
    return kMethods;
}

Groups computeGroups(const GroupBy& g) {
    const Frame& f = *g.frame;
    std::vector<size_t> keyCols;
    for (const auto& k : g.keys) keyCols.push_back(requireColumn(f, k));

    Groups groups;
    groups.index.names = g.keys;
    groups.index.levels.resize(keyCols.size());
    std::unordered_map<std::string, size_t> ids;
    for (size_t r = 0; r < f.rows(); ++r) {
        std::string key;
        bool hasMissing = false;
        for (size_t c : keyCols) {
            const Scalar& v = f.columns[c].values[r];
            if (isMissing(v)) hasMissing = true;
            key += scalarKey(v);
            key.push_back('\x1f');
        }
        if (hasMissing && g.dropna) continue;
        const auto it = ids.find(key);
        if (it != ids.end()) {
            groups.rows[it->second].push_back(r);
            continue;
        }
        ids.emplace(key, groups.rows.size());
        groups.rows.push_back({r});
        for (size_t k = 0; k < keyCols.size(); ++k) groups.index.levels[k].push_back(f.columns[keyCols[k]].values[r]);
    }

    if (g.sort && !groups.rows.empty()) {
        std::vector<const std::vector<Scalar>*> keys;
        for (const auto& level : groups.index.levels) keys.push_back(&level);
        const auto order = SeriesOps::sortOrder(keys, std::vector<bool>(keys.size(), true));
        Groups sorted;
        sorted.index = groups.index.take(order);
        for (size_t i : order) sorted.rows.push_back(std::move(groups.rows[i]));
        return sorted;
    }
    return groups;
}

std::vector<std::string> selectedColumns(const GroupBy& g) {
    if (!g.selection.empty()) return g.selection;
    std::vector<std::string> out;
    for (const auto& col : g.frame->columns) {
        if (std::find(g.keys.begin(), g.keys.end(), col.name) == g.keys.end()) out.push_back(col.name);
    }
    return out;
}

std::vector<Scalar> aggregateGroups(const Groups& groups, const FrameColumn& col, const std::string& func, int64_t ddof) {
    std::vector<Scalar> out;
    out.reserve(groups.rows.size());
    for (const auto& rows : groups.rows) {
        std::vector<Scalar> cells;
        cells.reserve(rows.size());
        for (size_t r : rows) cells.push_back(col.values[r]);
        out.push_back(SeriesOps::aggregate(func, cells, col.dtype, ddof));
    }
    return out;
}

Value finishGroupFrame(const GroupBy& g, Frame out) {
    if (!g.asIndex) return Value(resetIndex(out, false));
    return Value(std::move(out));
}

std::string funcName(const Value& v) {
    if (isString(v)) return std::get<std::string>(v.scalar());
    if (v.isObject()) {
        const std::string& name = v.object().name;
        const size_t dot = name.rfind('.');
        return dot == std::string::npos ? name : name.substr(dot + 1);
    }
    raise("TypeError", "aggregation function must be a string, got " + typeName(v));
}

void checkAggregation(const std::string& func) {
    if (!SeriesOps::isAggregation(func)) raise("AttributeError", "'" + func + "' is not a valid function for aggregation");
}

Value groupAgg(const GroupBy& g, const CallArgs& args) {
    const Groups groups = computeGroups(g);
    const Frame& f = *g.frame;
    const int64_t ddof = 1;
    Frame out;
    out.index = groups.index;

    const Value* spec = args.get(0, "func");
    if (!spec) {
        // Named aggregation: agg(total=('COL', 'sum'), ...)
        if (args.keywords.empty()) raise("TypeError", "agg() requires a function, list or dict of functions");
        for (const auto& kw : args.keywords) {
            if (!kw.second.isList() || kw.second.list().items.size() != 2) {
                raise("TypeError", "named aggregation for '" + kw.first + "' must be a (column, function) tuple");
            }
            const auto& pair = kw.second.list().items;
            const std::string column = g.seriesSelection ? g.selection.front() : scalarStr(pair[0].scalar());
            const std::string func = funcName(pair[1]);
            checkAggregation(func);
            const auto& col = f.columns[requireColumn(f, column)];
            out.setColumn(kw.first, aggregateGroups(groups, col, func, ddof));
        }
        return finishGroupFrame(g, std::move(out));
    }

    if (isString(*spec) || spec->isObject()) {
        const std::string func = funcName(*spec);
        checkAggregation(func);
        CallArgs rest;
        return groupByCall(g, func, rest);
    }

    if (spec->isList()) {
        std::vector<std::string> funcs;
        for (const auto& item : spec->list().items) {
            funcs.push_back(funcName(item));
            checkAggregation(funcs.back());
        }
        const auto columns = selectedColumns(g);
        for (const auto& name : columns) {
            const auto& col = f.columns[requireColumn(f, name)];
            for (const auto& func : funcs) {
                const std::string outName = g.seriesSelection ? func : name + "_" + func;
                out.setColumn(outName, aggregateGroups(groups, col, func, ddof));
            }
        }
        return finishGroupFrame(g, std::move(out));
    }

    if (spec->isDict()) {
        for (const auto& item : spec->dict().items) {
            const std::string name = scalarStr(item.first);
            const auto& col = f.columns[requireColumn(f, name)];
            if (item.second.isList()) {
                for (const auto& fv : item.second.list().items) {
                    const std::string func = funcName(fv);
                    checkAggregation(func);
                    out.setColumn(name + "_" + func, aggregateGroups(groups, col, func, ddof));
                }
            } else {
                const std::string func = funcName(item.second);
                checkAggregation(func);
                out.setColumn(name, aggregateGroups(groups, col, func, ddof));
            }
        }
        return finishGroupFrame(g, std::move(out));
    }
    raise("TypeError", "unsupported aggregation specification " + typeName(*spec));
}

Value methodObject(const Value& self, const std::string& name) {
    Object o;
    o.kind = Object::Kind::Method;
    o.name = name;
    o.self = self;
    return Value(std::move(o));
}
} // namespace

Frame fromDataset(const TypedDataset& dataset) {
    Frame f;
    f.index = Index::range(dataset.rowCount());
    for (const auto& col : dataset.columns()) {
        std::vector<Scalar> values;
        values.reserve(col.size());
        if (col.type == ColumnType::NUMERIC) {
            const auto& data = std::get<std::vector<double>>(col.values);
            bool integral = true;
            for (size_t r = 0; r < data.size(); ++r) {
                if (col.isMissing(r) || !std::isfinite(data[r]) || std::floor(data[r]) != data[r] ||
                    std::fabs(data[r]) > 9.0e15) {
                    integral = false;
                    break;
                }
            }
            for (size_t r = 0; r < data.size(); ++r) {
                if (col.isMissing(r)) {
                    values.push_back(nanScalar());
                } else if (integral) {
                    values.emplace_back(static_cast<int64_t>(data[r]));
                } else {
                    values.emplace_back(data[r]);
                }
            }
        } else if (col.type == ColumnType::DATETIME) {
            const auto& data = std::get<std::vector<int64_t>>(col.values);
            for (size_t r = 0; r < data.size(); ++r) {
                if (col.isMissing(r)) {
                    values.emplace_back();
                } else {
                    values.emplace_back(Timestamp{data[r]});
                }
            }
        } else {
            const auto& data = std::get<std::vector<std::string>>(col.values);
            for (size_t r = 0; r < data.size(); ++r) {
                if (col.isMissing(r)) {
                    values.emplace_back();
                } else {
                    values.emplace_back(data[r]);
                }
            }
        }
        FrameColumn fc;
        fc.name = col.name;
        fc.dtype = inferDType(values);
        fc.values = std::move(values);
        f.columns.push_back(std::move(fc));
    }
    return f;
}

Frame fromData(const Value& data, const Value* columns) {
    Frame f;
    if (data.isNone()) {
        if (columns) {
            for (const auto& name : stringList(*columns, "columns")) f.setColumn(name, {});
        }
        return f;
    }
    if (data.isFrame()) {
        f = data.frame();
    } else if (data.isDict()) {
        const auto& items = data.dict().items;
        for (const auto& item : items) {
            if (item.second.isSeries()) {
                f.index = item.second.series().index;
                break;
            }
            if (item.second.isList()) {
                f.index = Index::range(item.second.list().items.size());
                break;
            }
        }
        if (f.index.levels.empty()) {
            if (!items.empty()) raise("ValueError", "If using all scalar values, you must pass an index");
            f.index = Index::range(0);
        }
        for (const auto& item : items) {
            f.setColumn(scalarStr(item.first), SeriesOps::broadcast(item.second, f.index, "DataFrame"));
        }
    } else if (data.isList()) {
        const auto& rows = data.list().items;
        std::vector<std::string> names;
        for (const auto& row : rows) {
            if (!row.isDict()) raise("TypeError", "DataFrame rows must be dicts");
            for (const auto& item : row.dict().items) {
                const std::string name = scalarStr(item.first);
                if (std::find(names.begin(), names.end(), name) == names.end()) names.push_back(name);
            }
        }
        f.index = Index::range(rows.size());
        for (const auto& name : names) {
            std::vector<Scalar> values;
            for (const auto& row : rows) {
                const Value* cell = row.dict().find(Scalar(name));
                values.push_back(cell && cell->isScalar() ? cell->scalar() : Scalar{});
            }
            f.setColumn(name, std::move(values));
        }
    } else {
        raise("TypeError", "DataFrame constructor not properly called with " + typeName(data));
    }
    if (columns) f = selectColumns(f, stringList(*columns, "columns"));
    return f;
}

Series rowSeries(const Frame& f, size_t row) {
    std::vector<Scalar> labels;
    std::vector<Scalar> values;
    for (const auto& col : f.columns) {
        labels.emplace_back(col.name);
        values.push_back(col.values[row]);
    }
    return Series::make(f.index.displayAt(row), std::move(values), Index::single("", std::move(labels)));
}

bool hasMethod(const std::string& name) {
    return frameMethods().count(name) > 0;
}

Value getAttribute(const Value& self, const std::string& name) {
    const Frame& f = self.frame();
    if (name == "shape") {
        return makeList({Value::integer(static_cast<int64_t>(f.rows())),
                         Value::integer(static_cast<int64_t>(f.columns.size()))}, true);
    }
    if (name == "columns") {
        std::vector<Value> names;
        for (const auto& col : f.columns) names.push_back(Value::string(col.name));
        return makeList(std::move(names));
    }
    if (name == "empty") return Value::boolean(f.rows() == 0 || f.columns.empty());
    if (name == "size") return Value::integer(static_cast<int64_t>(f.rows() * f.columns.size()));
    if (name == "index") {
        std::vector<Value> labels;
        for (size_t r = 0; r < f.rows(); ++r) {
            if (f.index.nlevels() == 1) {
                labels.emplace_back(f.index.levels.front()[r]);
            } else {
                std::vector<Value> parts;
                for (const auto& level : f.index.levels) parts.emplace_back(level[r]);
                labels.push_back(makeList(std::move(parts), true));
            }
        }
        return makeList(std::move(labels));
    }
    if (name == "values") {
        std::vector<Value> rows;
        for (size_t r = 0; r < f.rows(); ++r) {
            std::vector<Value> cells;
            for (const auto& col : f.columns) cells.push_back(cellValue(col.values[r], col.dtype));
            rows.push_back(makeList(std::move(cells)));
        }
        return makeList(std::move(rows));
    }
    if (name == "dtypes") {
        DictValue d;
        for (const auto& col : f.columns) d.set(Scalar(col.name), Value::string(dtypeName(col.dtype)));
        return Value(std::move(d));
    }
    if (name == "iloc" || name == "loc") {
        Object o;
        o.kind = name == "iloc" ? Object::Kind::ILocIndexer : Object::Kind::LocIndexer;
        o.name = name;
        o.self = self;
        return Value(std::move(o));
    }
    if (hasMethod(name)) return methodObject(self, name);
    const int idx = f.findColumn(name);
    if (idx >= 0) return Value(f.column(static_cast<size_t>(idx)));
    raise("AttributeError", "'DataFrame' object has no attribute '" + name + "'");
}

Value getItem(const Frame& f, const Value& key) {
    if (isSlice(key)) return Value(f.take(slicePositions(key, f.rows())));
    if (isRowMask(key)) return Value(f.take(SeriesOps::maskPositions(key, f.index)));
    if (key.isList() || key.isSeries()) return Value(selectColumns(f, stringList(key, "column list")));
    if (key.isScalar()) {
        const std::string name = scalarStr(key.scalar());
        const int idx = f.findColumn(name);
        if (idx < 0) raise("KeyError", scalarRepr(key.scalar()));
        return Value(f.column(static_cast<size_t>(idx)));
    }
    raise("TypeError", "invalid DataFrame key of type " + typeName(key));
}

Frame setItem(const Frame& f, const Value& key, const Value& value) {
    if (isString(key)) {
        const std::string name = std::get<std::string>(key.scalar());
        Frame out = f;
        if (out.columns.empty() && out.rows() == 0) {
            if (value.isSeries()) {
                out.index = value.series().index;
            } else if (value.isList()) {
                out.index = Index::range(value.list().items.size());
            }
        }
        out.setColumn(name, SeriesOps::broadcast(value, out.index, "column assignment"));
        return out;
    }
    if (isRowMask(key)) {
        return assignRegion(f, SeriesOps::maskPositions(key, f.index), columnNames(f), value);
    }
    if (key.isList()) {
        const auto names = stringList(key, "column list");
        if (value.isFrame()) {
            const Frame& src = value.frame();
            if (src.columns.size() != names.size()) raise("ValueError", "Columns must be same length as key");
            Frame out = f;
            for (size_t i = 0; i < names.size(); ++i) {
                out.setColumn(names[i], SeriesOps::broadcast(Value(src.column(i)), out.index, "column assignment"));
            }
            return out;
        }
        Frame out = f;
        for (const auto& name : names) out.setColumn(name, SeriesOps::broadcast(value, out.index, "column assignment"));
        return out;
    }
    if (key.isScalar()) return setItem(f, Value::string(scalarStr(key.scalar())), value);
    raise("TypeError", "invalid DataFrame key of type " + typeName(key));
}

Value ilocGet(const Frame& f, const Value& key) {
    if (key.isList() && key.list().isTuple) {
        const auto& parts = key.list().items;
        if (parts.size() != 2) raise("IndexError", "Too many indexers");
        return assemble(f, positionalRows(parts[0], f.rows()), positionalColumns(f, parts[1]));
    }
    return assemble(f, positionalRows(key, f.rows()), allColumns(f));
}

Frame ilocSet(const Frame& f, const Value& key, const Value& value) {
    Selection rows;
    Selection cols = allColumns(f);
    if (key.isList() && key.list().isTuple) {
        const auto& parts = key.list().items;
        if (parts.size() != 2) raise("IndexError", "Too many indexers");
        rows = positionalRows(parts[0], f.rows());
        cols = positionalColumns(f, parts[1]);
    } else {
        rows = positionalRows(key, f.rows());
    }
    return assignRegion(f, rows.positions, namesAt(f, cols.positions), value);
}

Value locGet(const Frame& f, const Value& key) {
    if (key.isList() && key.list().isTuple && key.list().items.size() == 2 && f.index.nlevels() == 1) {
        const auto& parts = key.list().items;
        return assemble(f, labelRows(f, parts[0]), labelColumns(f, parts[1]));
    }
    return assemble(f, labelRows(f, key), allColumns(f));
}

Frame locSet(const Frame& f, const Value& key, const Value& value) {
    if (key.isList() && key.list().isTuple && key.list().items.size() == 2 && f.index.nlevels() == 1) {
        const auto& parts = key.list().items;
        const Selection rows = labelRows(f, parts[0]);
        std::vector<std::string> names;
        if (isString(parts[1])) {
            names.push_back(std::get<std::string>(parts[1].scalar()));
        } else if (isSlice(parts[1])) {
            names = namesAt(f, labelColumns(f, parts[1]).positions);
        } else {
            names = stringList(parts[1], "column list");
        }
        return assignRegion(f, rows.positions, names, value);
    }
    return assignRegion(f, labelRows(f, key).positions, columnNames(f), value);
}

Value callMethod(const Value& self, const std::string& name, const CallArgs& args) {
    const Frame& f = self.frame();

    if (name == "groupby") return makeGroupBy(self, args);
    if (name == "head" || name == "tail") {
        const int64_t n = intArg(args, 0, "n", 5);
        const int64_t size = static_cast<int64_t>(f.rows());
        const int64_t count = n >= 0 ? std::min(n, size) : std::max<int64_t>(0, size + n);
        std::vector<size_t> rows;
        const int64_t start = name == "head" ? 0 : size - count;
        for (int64_t i = start; i < start + count; ++i) rows.push_back(static_cast<size_t>(i));
        return Value(f.take(rows));
    }
    if (name == "sort_values") {
        const Value* by = args.get(0, "by");
        if (!by) raise("TypeError", "sort_values() missing required argument 'by'");
        const auto names = stringList(*by, "by");
        std::vector<bool> ascending(names.size(), true);
        if (const Value* asc = args.get(2, "ascending")) {
            if (asc->isList()) {
                const auto flags = scalarsFromValue(*asc, "ascending");
                if (flags.size() != names.size()) {
                    raise("ValueError", "Length of ascending (" + std::to_string(flags.size()) +
                                        ") != length of by (" + std::to_string(names.size()) + ")");
                }
                for (size_t i = 0; i < flags.size(); ++i) ascending[i] = scalarTruthy(flags[i]);
            } else {
                std::fill(ascending.begin(), ascending.end(), truthy(*asc));
            }
        }
        std::vector<const std::vector<Scalar>*> keys;
        for (const auto& n : names) keys.push_back(&f.columns[requireColumn(f, n)].values);
        const bool naFirst = stringArg(args, kNoPos, "na_position", "last") == "first";
        Frame out = f.take(SeriesOps::sortOrder(keys, ascending, naFirst));
        if (boolArg(args, kNoPos, "ignore_index", false)) out.index = Index::range(out.rows());
        return Value(std::move(out));
    }
    if (name == "sort_index") {
        const bool ascending = boolArg(args, 1, "ascending", true);
        std::vector<const std::vector<Scalar>*> keys;
        for (const auto& level : f.index.levels) keys.push_back(&level);
        return Value(f.take(SeriesOps::sortOrder(keys, std::vector<bool>(keys.size(), ascending))));
    }
    if (name == "drop_duplicates") {
        const Value* subset = args.get(0, "subset");
        std::vector<size_t> cols;
        if (subset && !subset->isNone()) {
            for (const auto& n : stringList(*subset, "subset")) cols.push_back(requireColumn(f, n));
        } else {
            cols = allColumns(f).positions;
        }
        Frame out = f.take(duplicateFilter(f, cols, stringArg(args, 1, "keep", "first")));
        if (boolArg(args, kNoPos, "ignore_index", false)) out.index = Index::range(out.rows());
        return Value(std::move(out));
    }
    if (name == "dropna") {
        const Value* subset = args.get(kNoPos, "subset");
        std::vector<size_t> cols;
        if (subset && !subset->isNone()) {
            for (const auto& n : stringList(*subset, "subset")) cols.push_back(requireColumn(f, n));
        } else {
            cols = allColumns(f).positions;
        }
        const bool all = stringArg(args, kNoPos, "how", "any") == "all";
        std::vector<size_t> rows;
        for (size_t r = 0; r < f.rows(); ++r) {
            size_t missing = 0;
            for (size_t c : cols) {
                if (isMissing(f.columns[c].values[r])) ++missing;
            }
            const bool drop = all ? (!cols.empty() && missing == cols.size()) : missing > 0;
            if (!drop) rows.push_back(r);
        }
        return Value(f.take(rows));
    }
    if (name == "fillna") {
        const Value* value = args.get(0, "value");
        if (!value) raise("ValueError", "Must specify a fill 'value'");
        Frame out = f;
        for (auto& col : out.columns) {
            Scalar fill;
            if (value->isDict()) {
                const Value* v = value->dict().find(Scalar(col.name));
                if (!v) continue;
                fill = v->scalar();
            } else {
                fill = value->scalar();
            }
            std::vector<Scalar> values = col.values;
            for (auto& v : values) {
                if (isMissing(v)) v = fill;
            }
            out.setColumn(col.name, std::move(values));
        }
        return Value(std::move(out));
    }
    if (name == "copy") return self;
    if (name == "nunique" || name == "count") {
        CallArgs none;
        return reduceColumns(f, name, none);
    }
    if (name == "sum" || name == "mean" || name == "median" || name == "min" || name == "max" ||
        name == "std" || name == "var" || name == "any" || name == "all") {
        return reduceColumns(f, name, args);
    }
    if (name == "reset_index") return Value(resetIndex(f, boolArg(args, 1, "drop", false)));
    if (name == "rename") {
        const Value* mapping = args.get(kNoPos, "columns");
        if (!mapping) mapping = args.get(0, "mapper");
        if (!mapping || !mapping->isDict()) raise("TypeError", "rename() requires a columns={old: new} mapping");
        Frame out = f;
        for (auto& col : out.columns) {
            if (const Value* repl = mapping->dict().find(Scalar(col.name))) col.name = scalarStr(repl->scalar());
        }
        return Value(std::move(out));
    }
    if (name == "nlargest" || name == "nsmallest") {
        const int64_t n = intArg(args, 0, "n", 5);
        const Value* columnsArg = args.get(1, "columns");
        if (!columnsArg) raise("TypeError", name + "() missing required argument 'columns'");
        const auto names = stringList(*columnsArg, "columns");
        std::vector<const std::vector<Scalar>*> keys;
        for (const auto& c : names) keys.push_back(&f.columns[requireColumn(f, c)].values);
        std::vector<size_t> order = SeriesOps::sortOrder(keys, std::vector<bool>(keys.size(), name == "nsmallest"));
        std::vector<size_t> rows;
        for (size_t r : order) {
            if (isMissing((*keys.front())[r])) continue;
            if (n >= 0 && rows.size() >= static_cast<size_t>(n)) break;
            rows.push_back(r);
        }
        return Value(f.take(rows));
    }
    if (name == "drop") {
        const Value* cols = args.get(kNoPos, "columns");
        const Value* labels = args.get(0, "labels");
        const bool byColumns = cols || intArg(args, 1, "axis", 0) == 1 ||
                               (args.get(1, "axis") && isString(*args.get(1, "axis")) &&
                                stringArg(args, 1, "axis", "") == "columns");
        if (byColumns) {
            const Value* target = cols ? cols : labels;
            if (!target) raise("TypeError", "drop() requires labels or columns");
            Frame out;
            out.index = f.index;
            const auto names = stringList(*target, "columns");
            for (const auto& n : names) requireColumn(f, n);
            for (const auto& col : f.columns) {
                if (std::find(names.begin(), names.end(), col.name) == names.end()) out.columns.push_back(col);
            }
            return Value(std::move(out));
        }
        const Value* target = labels ? labels : args.get(kNoPos, "index");
        if (!target) raise("TypeError", "drop() requires labels or columns");
        std::unordered_set<size_t> dropped;
        const auto positions = target->isScalar() ? SeriesOps::labelPositions(f.index, *target)
                                                  : SeriesOps::listLabelPositions(f.index, *target);
        dropped.insert(positions.begin(), positions.end());
        std::vector<size_t> rows;
        for (size_t r = 0; r < f.rows(); ++r) {
            if (!dropped.count(r)) rows.push_back(r);
        }
        return Value(f.take(rows));
    }
    if (name == "set_index") {
        const Value* keys = args.get(0, "keys");
        if (!keys) raise("TypeError", "set_index() missing required argument 'keys'");
        const auto names = stringList(*keys, "keys");
        Frame out;
        for (const auto& n : names) {
            const size_t c = requireColumn(f, n);
            out.index.names.push_back(n);
            out.index.levels.push_back(f.columns[c].values);
        }
        for (const auto& col : f.columns) {
            if (std::find(names.begin(), names.end(), col.name) == names.end()) out.columns.push_back(col);
        }
        return Value(std::move(out));
    }
    if (name == "to_dict") return frameToDict(f, stringArg(args, 0, "orient", "dict"));
    if (name == "isna" || name == "isnull" || name == "notna" || name == "notnull") {
        const bool wantMissing = name == "isna" || name == "isnull";
        return Value(mapCells(f, [&](const Scalar& v) { return Scalar(isMissing(v) == wantMissing); }));
    }
    if (name == "astype") {
        const Value* type = args.get(0, "dtype");
        if (!type) raise("TypeError", "astype() missing required argument 'dtype'");
        Frame out = f;
        for (size_t c = 0; c < f.columns.size(); ++c) {
            const Value* target = type;
            if (type->isDict()) {
                target = type->dict().find(Scalar(f.columns[c].name));
                if (!target) continue;
            }
            out.setColumn(f.columns[c].name, SeriesOps::astype(f.column(c), *target).values);
        }
        return Value(std::move(out));
    }
    if (name == "corr") return correlationFrame(f);
    if (name == "round" || name == "abs") {
        Frame out = f;
        for (size_t c = 0; c < f.columns.size(); ++c) {
            if (!isNumericDType(f.columns[c].dtype)) continue;
            const Value column(f.column(c));
            out.setColumn(f.columns[c].name, SeriesOps::callMethod(column, name, args).series().values);
        }
        return Value(std::move(out));
    }
    raise("AttributeError", "'DataFrame' object has no attribute '" + name + "'");
}

Value makeGroupBy(const Value& frame, const CallArgs& args) {
    const Value* by = args.get(0, "by");
    if (!by) raise("TypeError", "You have to supply one of 'by' and 'level'");

    Frame f = frame.frame();
    GroupBy g;
    const auto addKey = [&](const Value& key, size_t position) {
        if (key.isSeries()) {
            const Series& s = key.series();
            std::string name = s.name.value_or("key_" + std::to_string(position));
            const std::vector<Scalar> values = SeriesOps::broadcast(key, f.index, "groupby");
            const int existing = f.findColumn(name);
            if (existing >= 0 && f.columns[static_cast<size_t>(existing)].values.size() == values.size()) {
                bool same = true;
                for (size_t r = 0; r < values.size() && same; ++r) {
                    same = scalarKey(values[r]) == scalarKey(f.columns[static_cast<size_t>(existing)].values[r]);
                }
                if (!same) {
                    name += "_key";
                    f.setColumn(name, values);
                }
            } else {
                f.setColumn(name, values);
            }
            g.keys.push_back(name);
            return;
        }
        const std::string name = scalarStr(key.scalar());
        requireColumn(f, name);
        g.keys.push_back(name);
    };

    if (by->isList()) {
        size_t i = 0;
        for (const auto& item : by->list().items) addKey(item, i++);
    } else {
        addKey(*by, 0);
    }
    g.asIndex = boolArg(args, kNoPos, "as_index", true);
    g.sort = boolArg(args, kNoPos, "sort", true);
    g.dropna = boolArg(args, kNoPos, "dropna", true);
    g.frame = std::make_shared<const Frame>(std::move(f));
    return Value(std::move(g));
}

bool hasGroupByMethod(const std::string& name) {
    return groupByMethods().count(name) > 0;
}

Value groupByGetItem(const GroupBy& g, const Value& key) {
    GroupBy out = g;
    if (key.isList()) {
        out.selection = stringList(key, "column selection");
        out.seriesSelection = false;
    } else {
        out.selection = {scalarStr(key.scalar())};
        out.seriesSelection = true;
    }
    for (const auto& name : out.selection) {
        if (g.frame->findColumn(name) < 0) raise("KeyError", "Column not found: " + name);
    }
    return Value(std::move(out));
}

Value groupByAttribute(const Value& self, const std::string& name) {
    if (hasGroupByMethod(name)) return methodObject(self, name);
    const GroupBy& g = self.groupBy();
    if (g.frame->findColumn(name) >= 0) return groupByGetItem(g, Value::string(name));
    raise("AttributeError", "'DataFrameGroupBy' object has no attribute '" + name + "'");
}

Value groupByCall(const GroupBy& g, const std::string& name, const CallArgs& args) {
    if (name == "agg" || name == "aggregate") return groupAgg(g, args);

    const Frame& f = *g.frame;
    const Groups groups = computeGroups(g);

    if (name == "size") {
        std::vector<Scalar> counts;
        for (const auto& rows : groups.rows) counts.emplace_back(static_cast<int64_t>(rows.size()));
        if (!g.asIndex) {
            Frame out;
            out.index = groups.index;
            out.setColumn("size", std::move(counts));
            return Value(resetIndex(out, false));
        }
        return Value(Series::make(std::nullopt, std::move(counts), groups.index));
    }

    if (name == "transform") {
        const Value* spec = args.get(0, "func");
        if (!spec) raise("TypeError", "transform() missing required argument 'func'");
        const std::string func = funcName(*spec);
        checkAggregation(func);
        Frame out;
        out.index = f.index;
        for (const auto& colName : selectedColumns(g)) {
            const auto& col = f.columns[requireColumn(f, colName)];
            const auto perGroup = aggregateGroups(groups, col, func, 1);
            std::vector<Scalar> values(f.rows());
            for (size_t gi = 0; gi < groups.rows.size(); ++gi) {
                for (size_t r : groups.rows[gi]) values[r] = perGroup[gi];
            }
            out.setColumn(colName, std::move(values));
        }
        if (g.seriesSelection) return Value(out.column(0));
        return Value(std::move(out));
    }

    if (!SeriesOps::isAggregation(name)) {
        raise("AttributeError", "'DataFrameGroupBy' object has no attribute '" + name + "'");
    }
    const int64_t ddof = intArg(args, kNoPos, "ddof", 1);
    const bool numericFuncs = name == "sum" || name == "mean" || name == "median" || name == "std" ||
                              name == "var" || name == "prod";
    const bool numericOnly = boolArg(args, kNoPos, "numeric_only", g.selection.empty() && numericFuncs);

    Frame out;
    out.index = groups.index;
    for (const auto& colName : selectedColumns(g)) {
        const auto& col = f.columns[requireColumn(f, colName)];
        if (numericOnly && !isNumericDType(col.dtype)) continue;
        out.setColumn(colName, aggregateGroups(groups, col, name, ddof));
    }

    if (g.seriesSelection && g.asIndex) return Value(out.column(0));
    return finishGroupFrame(g, std::move(out));
}

} // namespace FrameOps
} // namespace Script
