#include "ScriptValue.h"
#include "AugurExceptions.h"
#include "ScriptAst.h"
#include "TypedDataset.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <sstream>

namespace Script {

namespace {
std::string formatFloatRepr(double v) {
    if (std::isnan(v)) return "nan";
    if (std::isinf(v)) return v > 0 ? "inf" : "-inf";
    char buf[40];
    for (int precision = 1; precision <= 17; ++precision) {
        std::snprintf(buf, sizeof(buf), "%.*g", precision, v);
        if (std::strtod(buf, nullptr) == v) break;
    }
    std::string out = buf;
    if (out.find_first_of(".en") == std::string::npos) out += ".0";
    return out;
}

std::string formatTimestamp(int64_t seconds) {
    std::string iso = formatIsoDateTime(seconds);
    iso[10] = ' ';
    return iso;
}

std::string formatTimedelta(int64_t seconds) {
    const bool negative = seconds < 0;
    int64_t days = seconds / 86400;
    int64_t rem = seconds % 86400;
    if (negative && rem != 0) {
        --days;
        rem += 86400;
    }
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%lld days %02lld:%02lld:%02lld",
                  static_cast<long long>(days), static_cast<long long>(rem / 3600),
                  static_cast<long long>((rem % 3600) / 60), static_cast<long long>(rem % 60));
    return buf;
}

int scalarClass(const Scalar& s) {
    if (isMissing(s)) return 4;
    if (isNumeric(s)) return 0;
    if (std::holds_alternative<std::string>(s)) return 1;
    if (std::holds_alternative<Timestamp>(s)) return 2;
    return 3;
}

std::string scalarTypeName(const Scalar& s) {
    switch (s.index()) {
        case 0: return "NoneType";
        case 1: return "bool";
        case 2: return "int";
        case 3: return "float";
        case 4: return "str";
        case 5: return "Timestamp";
        default: return "Timedelta";
    }
}
} // namespace

void raise(const std::string& category, const std::string& message) {
    throw Augur::ScriptError(category + ": " + message);
}

Index Index::range(size_t n) {
    Index idx;
    idx.names.push_back("");
    std::vector<Scalar> labels;
    labels.reserve(n);
    for (size_t i = 0; i < n; ++i) labels.emplace_back(static_cast<int64_t>(i));
    idx.levels.push_back(std::move(labels));
    return idx;
}

Index Index::single(std::string name, std::vector<Scalar> labels) {
    Index idx;
    idx.names.push_back(std::move(name));
    idx.levels.push_back(std::move(labels));
    return idx;
}

bool Index::isRange() const {
    if (levels.size() != 1 || !names.front().empty()) return false;
    const auto& labels = levels.front();
    for (size_t i = 0; i < labels.size(); ++i) {
        const auto* v = std::get_if<int64_t>(&labels[i]);
        if (!v || *v != static_cast<int64_t>(i)) return false;
    }
    return true;
}

std::vector<Scalar> Index::labelAt(size_t row) const {
    std::vector<Scalar> out;
    out.reserve(levels.size());
    for (const auto& level : levels) out.push_back(level[row]);
    return out;
}

std::string Index::keyAt(size_t row) const {
    if (levels.size() == 1) return scalarKey(levels.front()[row]);
    std::string key;
    for (size_t k = 0; k < levels.size(); ++k) {
        if (k > 0) key.push_back('\x1f');
        key += scalarKey(levels[k][row]);
    }
    return key;
}

std::string Index::displayAt(size_t row) const {
    if (levels.size() == 1) return scalarStr(levels.front()[row]);
    std::string out = "(";
    for (size_t k = 0; k < levels.size(); ++k) {
        if (k > 0) out += ", ";
        out += scalarRepr(levels[k][row]);
    }
    return out + ")";
}

Index Index::take(const std::vector<size_t>& rows) const {
    Index out;
    out.names = names;
    for (const auto& level : levels) {
        std::vector<Scalar> picked;
        picked.reserve(rows.size());
        for (size_t r : rows) picked.push_back(level[r]);
        out.levels.push_back(std::move(picked));
    }
    return out;
}

bool Index::sameLabels(const Index& other) const {
    if (size() != other.size() || nlevels() != other.nlevels()) return false;
    for (size_t r = 0; r < size(); ++r) {
        if (keyAt(r) != other.keyAt(r)) return false;
    }
    return true;
}

std::vector<size_t> Index::find(const std::vector<Scalar>& key) const {
    std::vector<size_t> out;
    if (key.size() != levels.size()) return out;
    std::string wanted;
    for (size_t k = 0; k < key.size(); ++k) {
        if (k > 0) wanted.push_back('\x1f');
        wanted += scalarKey(key[k]);
    }
    for (size_t r = 0; r < size(); ++r) {
        if (keyAt(r) == wanted) out.push_back(r);
    }
    return out;
}

Series Series::make(std::optional<std::string> name, std::vector<Scalar> values, Index index) {
    Series s;
    s.name = std::move(name);
    s.dtype = inferDType(values);
    s.values = std::move(values);
    s.index = std::move(index);
    if (s.index.size() != s.values.size()) s.index = Index::range(s.values.size());
    return s;
}

Series Series::make(std::optional<std::string> name, std::vector<Scalar> values) {
    const size_t n = values.size();
    return make(std::move(name), std::move(values), Index::range(n));
}

Series Series::take(const std::vector<size_t>& rows) const {
    Series out;
    out.name = name;
    out.dtype = dtype;
    out.values.reserve(rows.size());
    for (size_t r : rows) out.values.push_back(values[r]);
    out.index = index.take(rows);
    return out;
}

int Frame::findColumn(const std::string& name) const {
    for (size_t i = 0; i < columns.size(); ++i) {
        if (columns[i].name == name) return static_cast<int>(i);
    }
    return -1;
}

Series Frame::column(size_t i) const {
    Series s;
    s.name = columns[i].name;
    s.dtype = columns[i].dtype;
    s.values = columns[i].values;
    s.index = index;
    return s;
}

void Frame::setColumn(const std::string& name, std::vector<Scalar> values) {
    if (columns.empty() && rows() == 0 && !values.empty()) {
        index = Index::range(values.size());
    }
    if (values.size() != rows()) {
        raise("ValueError", "Length of values (" + std::to_string(values.size()) +
                            ") does not match length of index (" + std::to_string(rows()) + ")");
    }
    FrameColumn col;
    col.name = name;
    col.dtype = inferDType(values);
    col.values = std::move(values);
    const int existing = findColumn(name);
    if (existing >= 0) {
        columns[static_cast<size_t>(existing)] = std::move(col);
    } else {
        columns.push_back(std::move(col));
    }
}

Frame Frame::take(const std::vector<size_t>& rows) const {
    Frame out;
    out.index = index.take(rows);
    out.columns.reserve(columns.size());
    for (const auto& col : columns) {
        FrameColumn picked;
        picked.name = col.name;
        picked.dtype = col.dtype;
        picked.values.reserve(rows.size());
        for (size_t r : rows) picked.values.push_back(col.values[r]);
        out.columns.push_back(std::move(picked));
    }
    return out;
}

Value::Value(Series s) : data_(std::make_shared<const Series>(std::move(s))) {}
Value::Value(Frame f) : data_(std::make_shared<const Frame>(std::move(f))) {}
Value::Value(ListValue l) : data_(std::make_shared<const ListValue>(std::move(l))) {}
Value::Value(DictValue d) : data_(std::make_shared<const DictValue>(std::move(d))) {}
Value::Value(GroupBy g) : data_(std::make_shared<const GroupBy>(std::move(g))) {}
Value::Value(Object o) : data_(std::make_shared<const Object>(std::move(o))) {}

bool Value::isNone() const noexcept {
    const auto* s = std::get_if<Scalar>(&data_);
    return s && std::holds_alternative<std::monostate>(*s);
}

const Scalar& Value::scalar() const {
    if (const auto* s = std::get_if<Scalar>(&data_)) return *s;
    raise("TypeError", "expected a scalar, got " + typeName(*this));
}

const ListValue& Value::list() const {
    if (const auto* p = std::get_if<std::shared_ptr<const ListValue>>(&data_)) return **p;
    raise("TypeError", "expected a list, got " + typeName(*this));
}

const DictValue& Value::dict() const {
    if (const auto* p = std::get_if<std::shared_ptr<const DictValue>>(&data_)) return **p;
    raise("TypeError", "expected a dict, got " + typeName(*this));
}

const Series& Value::series() const {
    if (const auto* p = std::get_if<std::shared_ptr<const Series>>(&data_)) return **p;
    raise("TypeError", "expected a Series, got " + typeName(*this));
}

const Frame& Value::frame() const {
    if (const auto* p = std::get_if<std::shared_ptr<const Frame>>(&data_)) return **p;
    raise("TypeError", "expected a DataFrame, got " + typeName(*this));
}

const GroupBy& Value::groupBy() const {
    if (const auto* p = std::get_if<std::shared_ptr<const GroupBy>>(&data_)) return **p;
    raise("TypeError", "expected a GroupBy, got " + typeName(*this));
}

const Object& Value::object() const {
    if (const auto* p = std::get_if<std::shared_ptr<const Object>>(&data_)) return **p;
    raise("TypeError", "expected a callable, got " + typeName(*this));
}

std::shared_ptr<const Frame> Value::framePtr() const {
    if (const auto* p = std::get_if<std::shared_ptr<const Frame>>(&data_)) return *p;
    raise("TypeError", "expected a DataFrame, got " + typeName(*this));
}

const Value* DictValue::find(const Scalar& key) const {
    const std::string wanted = scalarKey(key);
    for (const auto& item : items) {
        if (scalarKey(item.first) == wanted) return &item.second;
    }
    return nullptr;
}

void DictValue::set(const Scalar& key, Value value) {
    const std::string wanted = scalarKey(key);
    for (auto& item : items) {
        if (scalarKey(item.first) == wanted) {
            item.second = std::move(value);
            return;
        }
    }
    items.emplace_back(key, std::move(value));
}

const Value* CallArgs::get(size_t position, const std::string& keyword) const {
    if (position < positional.size()) return &positional[position];
    for (const auto& kw : keywords) {
        if (kw.first == keyword) return &kw.second;
    }
    return nullptr;
}

void CallArgs::expectAtMost(size_t count, const std::string& function) const {
    if (positional.size() > count) {
        raise("TypeError", function + "() takes at most " + std::to_string(count) +
                           " positional argument(s) but " + std::to_string(positional.size()) + " were given");
    }
}

bool isMissing(const Scalar& s) noexcept {
    if (std::holds_alternative<std::monostate>(s)) return true;
    const auto* d = std::get_if<double>(&s);
    return d && std::isnan(*d);
}

bool isNumeric(const Scalar& s) noexcept {
    return std::holds_alternative<bool>(s) || std::holds_alternative<int64_t>(s) || std::holds_alternative<double>(s);
}

double toDouble(const Scalar& s) {
    if (const auto* b = std::get_if<bool>(&s)) return *b ? 1.0 : 0.0;
    if (const auto* i = std::get_if<int64_t>(&s)) return static_cast<double>(*i);
    if (const auto* d = std::get_if<double>(&s)) return *d;
    if (std::holds_alternative<std::monostate>(s)) return std::nan("");
    raise("TypeError", "must be real number, not " + scalarTypeName(s));
}

int64_t toInteger(const Scalar& s) {
    if (const auto* b = std::get_if<bool>(&s)) return *b ? 1 : 0;
    if (const auto* i = std::get_if<int64_t>(&s)) return *i;
    if (const auto* d = std::get_if<double>(&s)) {
        if (!std::isfinite(*d)) raise("ValueError", "cannot convert float " + formatFloatRepr(*d) + " to integer");
        return static_cast<int64_t>(*d);
    }
    raise("TypeError", "an integer is required, not " + scalarTypeName(s));
}

bool scalarTruthy(const Scalar& s) {
    switch (s.index()) {
        case 0: return false;
        case 1: return std::get<bool>(s);
        case 2: return std::get<int64_t>(s) != 0;
        case 3: return std::get<double>(s) != 0.0;
        case 4: return !std::get<std::string>(s).empty();
        case 5: return true;
        default: return std::get<Timedelta>(s).seconds != 0;
    }
}

bool truthy(const Value& v) {
    if (v.isScalar()) return scalarTruthy(v.scalar());
    if (v.isList()) return !v.list().items.empty();
    if (v.isDict()) return !v.dict().items.empty();
    if (v.isSeries() || v.isFrame()) {
        raise("ValueError", "The truth value of a " + typeName(v) +
                            " is ambiguous. Use a.empty, a.bool(), a.item(), a.any() or a.all().");
    }
    return true;
}

std::string scalarRepr(const Scalar& s) {
    switch (s.index()) {
        case 0: return "None";
        case 1: return std::get<bool>(s) ? "True" : "False";
        case 2: return std::to_string(std::get<int64_t>(s));
        case 3: return formatFloatRepr(std::get<double>(s));
        case 4: return quoteString(std::get<std::string>(s));
        case 5: return "Timestamp('" + formatTimestamp(std::get<Timestamp>(s).seconds) + "')";
        default: return "Timedelta('" + formatTimedelta(std::get<Timedelta>(s).seconds) + "')";
    }
}

std::string scalarStr(const Scalar& s) {
    switch (s.index()) {
        case 4: return std::get<std::string>(s);
        case 5: return formatTimestamp(std::get<Timestamp>(s).seconds);
        case 6: return formatTimedelta(std::get<Timedelta>(s).seconds);
        default: return scalarRepr(s);
    }
}

std::string scalarKey(const Scalar& s) {
    if (std::holds_alternative<std::monostate>(s)) return "_";
    if (isNumeric(s)) {
        if (const auto* i = std::get_if<int64_t>(&s)) return "n:" + std::to_string(*i);
        const double d = toDouble(s);
        if (std::isnan(d)) return "_";
        if (std::floor(d) == d && std::abs(d) < 9007199254740992.0) {
            return "n:" + std::to_string(static_cast<int64_t>(d));
        }
        return "n:" + formatFloatRepr(d);
    }
    if (const auto* str = std::get_if<std::string>(&s)) return "s:" + *str;
    if (const auto* ts = std::get_if<Timestamp>(&s)) return "t:" + std::to_string(ts->seconds);
    return "d:" + std::to_string(std::get<Timedelta>(s).seconds);
}

bool scalarsEqual(const Scalar& a, const Scalar& b) {
    const bool aNone = std::holds_alternative<std::monostate>(a);
    const bool bNone = std::holds_alternative<std::monostate>(b);
    if (aNone || bNone) return aNone && bNone;
    if (isNumeric(a) && isNumeric(b)) {
        if (std::holds_alternative<int64_t>(a) && std::holds_alternative<int64_t>(b)) {
            return std::get<int64_t>(a) == std::get<int64_t>(b);
        }
        return toDouble(a) == toDouble(b);
    }
    if (a.index() != b.index()) return false;
    if (const auto* s = std::get_if<std::string>(&a)) return *s == std::get<std::string>(b);
    if (const auto* t = std::get_if<Timestamp>(&a)) return t->seconds == std::get<Timestamp>(b).seconds;
    return std::get<Timedelta>(a).seconds == std::get<Timedelta>(b).seconds;
}

int compareScalars(const Scalar& a, const Scalar& b) {
    const int ca = scalarClass(a);
    const int cb = scalarClass(b);
    if (ca == 4 || cb == 4) return ca == cb ? 0 : (ca == 4 ? 1 : -1);
    if (ca != cb) {
        raise("TypeError", "'<' not supported between instances of '" + scalarTypeName(a) +
                           "' and '" + scalarTypeName(b) + "'");
    }
    switch (ca) {
        case 0: {
            if (std::holds_alternative<int64_t>(a) && std::holds_alternative<int64_t>(b)) {
                const int64_t x = std::get<int64_t>(a);
                const int64_t y = std::get<int64_t>(b);
                return x < y ? -1 : (x > y ? 1 : 0);
            }
            const double x = toDouble(a);
            const double y = toDouble(b);
            return x < y ? -1 : (x > y ? 1 : 0);
        }
        case 1: {
            const int c = std::get<std::string>(a).compare(std::get<std::string>(b));
            return c < 0 ? -1 : (c > 0 ? 1 : 0);
        }
        case 2: {
            const int64_t x = std::get<Timestamp>(a).seconds;
            const int64_t y = std::get<Timestamp>(b).seconds;
            return x < y ? -1 : (x > y ? 1 : 0);
        }
        default: {
            const int64_t x = std::get<Timedelta>(a).seconds;
            const int64_t y = std::get<Timedelta>(b).seconds;
            return x < y ? -1 : (x > y ? 1 : 0);
        }
    }
}

DType inferDType(std::vector<Scalar>& values) {
    size_t bools = 0;
    size_t ints = 0;
    size_t doubles = 0;
    size_t strings = 0;
    size_t stamps = 0;
    size_t deltas = 0;
    size_t nones = 0;
    for (const auto& v : values) {
        switch (v.index()) {
            case 0: ++nones; break;
            case 1: ++bools; break;
            case 2: ++ints; break;
            case 3: ++doubles; break;
            case 4: ++strings; break;
            case 5: ++stamps; break;
            default: ++deltas; break;
        }
    }
    const size_t present = values.size() - nones;
    if (present == 0) return doubles > 0 || values.empty() ? DType::Float : DType::Object;
    if (bools == present) return nones == 0 ? DType::Bool : DType::Object;
    if (ints + doubles == present) {
        if (doubles == 0 && nones == 0) return DType::Int;
        for (auto& v : values) {
            if (const auto* i = std::get_if<int64_t>(&v)) v = static_cast<double>(*i);
        }
        return DType::Float;
    }
    if (strings == present) return DType::String;
    if (stamps == present) return DType::Datetime;
    if (deltas == present) return DType::Timedelta;
    return DType::Object;
}

std::string dtypeName(DType dtype) {
    switch (dtype) {
        case DType::Float: return "float64";
        case DType::Int: return "int64";
        case DType::Bool: return "bool";
        case DType::Datetime: return "datetime64[ns]";
        case DType::Timedelta: return "timedelta64[ns]";
        case DType::String:
        case DType::Object:
            return "object";
    }
    return "object";
}

std::string typeName(const Value& v) {
    if (v.isScalar()) return scalarTypeName(v.scalar());
    if (v.isList()) return v.list().isTuple ? "tuple" : "list";
    if (v.isDict()) return "dict";
    if (v.isSeries()) return "Series";
    if (v.isFrame()) return "DataFrame";
    if (v.isGroupBy()) return v.groupBy().seriesSelection ? "SeriesGroupBy" : "DataFrameGroupBy";
    switch (v.object().kind) {
        case Object::Kind::Builtin:
        case Object::Kind::ModuleFunction:
            return "builtin_function_or_method";
        case Object::Kind::Module: return "module";
        case Object::Kind::Method: return "method";
        case Object::Kind::StrAccessor: return "StringMethods";
        case Object::Kind::DtAccessor: return "DatetimeProperties";
        case Object::Kind::ILocIndexer: return "_iLocIndexer";
        case Object::Kind::LocIndexer: return "_LocIndexer";
        case Object::Kind::Slice: return "slice";
    }
    return "object";
}

std::string valueRepr(const Value& v) {
    if (v.isScalar()) return scalarRepr(v.scalar());
    if (v.isList()) {
        const auto& l = v.list();
        std::string out = l.isTuple ? "(" : "[";
        for (size_t i = 0; i < l.items.size(); ++i) {
            if (i > 0) out += ", ";
            out += valueRepr(l.items[i]);
        }
        if (l.isTuple && l.items.size() == 1) out += ",";
        return out + (l.isTuple ? ")" : "]");
    }
    if (v.isDict()) {
        std::string out = "{";
        bool first = true;
        for (const auto& item : v.dict().items) {
            if (!first) out += ", ";
            out += scalarRepr(item.first) + ": " + valueRepr(item.second);
            first = false;
        }
        return out + "}";
    }
    if (v.isSeries()) {
        const auto& s = v.series();
        std::ostringstream os;
        for (size_t i = 0; i < s.size(); ++i) {
            os << s.index.displayAt(i) << "    " << scalarStr(s.values[i]) << "\n";
        }
        if (s.name) os << "Name: " << *s.name << ", ";
        os << "dtype: " << dtypeName(s.dtype);
        return os.str();
    }
    if (v.isFrame()) {
        const auto& f = v.frame();
        std::ostringstream os;
        for (const auto& col : f.columns) os << "\t" << col.name;
        for (size_t r = 0; r < f.rows(); ++r) {
            os << "\n" << f.index.displayAt(r);
            for (const auto& col : f.columns) os << "\t" << scalarStr(col.values[r]);
        }
        return os.str();
    }
    if (v.isGroupBy()) return "<" + typeName(v) + ">";
    return "<" + typeName(v) + " " + v.object().name + ">";
}

Value makeList(std::vector<Value> items, bool tuple) {
    ListValue l;
    l.items = std::move(items);
    l.isTuple = tuple;
    return Value(std::move(l));
}

Value makeSlice(Scalar start, Scalar stop, Scalar step) {
    Object o;
    o.kind = Object::Kind::Slice;
    o.name = "slice";
    o.self = makeList({Value(std::move(start)), Value(std::move(stop)), Value(std::move(step))}, true);
    return Value(std::move(o));
}

bool isSlice(const Value& v) {
    return v.isObject() && v.object().kind == Object::Kind::Slice;
}

std::vector<size_t> slicePositions(const Value& slice, size_t n) {
    const auto& parts = slice.object().self.list().items;
    const auto bound = [&](size_t i) -> std::optional<int64_t> {
        const Scalar& s = parts[i].scalar();
        if (std::holds_alternative<std::monostate>(s)) return std::nullopt;
        if (!std::holds_alternative<int64_t>(s) && !std::holds_alternative<bool>(s)) {
            raise("TypeError", "slice indices must be integers or None");
        }
        return toInteger(s);
    };
    const int64_t len = static_cast<int64_t>(n);
    const int64_t step = bound(2).value_or(1);
    if (step == 0) raise("ValueError", "slice step cannot be zero");

    const auto clampBound = [&](std::optional<int64_t> b, int64_t dflt) {
        if (!b) return dflt;
        int64_t v = *b;
        if (v < 0) v += len;
        if (step > 0) return std::max<int64_t>(0, std::min(v, len));
        return std::max<int64_t>(-1, std::min(v, len - 1));
    };

    std::vector<size_t> out;
    if (step > 0) {
        const int64_t start = clampBound(bound(0), 0);
        const int64_t stop = clampBound(bound(1), len);
        for (int64_t i = start; i < stop; i += step) out.push_back(static_cast<size_t>(i));
    } else {
        const int64_t start = clampBound(bound(0), len - 1);
        const int64_t stop = clampBound(bound(1), -1);
        for (int64_t i = start; i > stop; i += step) out.push_back(static_cast<size_t>(i));
    }
    return out;
}

std::vector<Scalar> scalarsFromValue(const Value& v, const std::string& context) {
    if (v.isSeries()) return v.series().values;
    if (v.isList()) {
        std::vector<Scalar> out;
        out.reserve(v.list().items.size());
        for (const auto& item : v.list().items) {
            if (!item.isScalar()) raise("TypeError", context + ": expected scalar elements, got " + typeName(item));
            out.push_back(item.scalar());
        }
        return out;
    }
    if (v.isScalar()) return {v.scalar()};
    raise("TypeError", context + ": expected list-like, got " + typeName(v));
}

} // namespace Script
