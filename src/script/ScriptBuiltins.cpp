#include "ScriptBuiltins.h"
#include "CommonUtils.h"
#include "FrameOps.h"
#include "SeriesOps.h"
#include "StatsUtils.h"
#include "TypedDataset.h"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <functional>
#include <limits>
#include <unordered_map>
#include <unordered_set>

namespace Script {

namespace {
constexpr size_t kNoPos = static_cast<size_t>(-1);

Scalar nanScalar() {
    return Scalar(std::numeric_limits<double>::quiet_NaN());
}

bool isString(const Value& v) {
    return v.isScalar() && std::holds_alternative<std::string>(v.scalar());
}

const std::string& stringOf(const Value& v, const std::string& context) {
    if (!isString(v)) raise("TypeError", context + " must be str, not " + typeName(v));
    return std::get<std::string>(v.scalar());
}

const Value& requireArg(const CallArgs& args, size_t pos, const std::string& kw, const std::string& fn) {
    const Value* v = args.get(pos, kw);
    if (!v) raise("TypeError", fn + "() missing required argument '" + kw + "'");
    return *v;
}

Value bindMethod(const Value& self, const std::string& name) {
    Object o;
    o.kind = Object::Kind::Method;
    o.name = name;
    o.self = self;
    return Value(std::move(o));
}

Value moduleFunction(const std::string& qualified) {
    Object o;
    o.kind = Object::Kind::ModuleFunction;
    o.name = qualified;
    return Value(std::move(o));
}

Value builtinObject(const std::string& name) {
    Object o;
    o.kind = Object::Kind::Builtin;
    o.name = name;
    return Value(std::move(o));
}

Value moduleObject(const std::string& name) {
    Object o;
    o.kind = Object::Kind::Module;
    o.name = name;
    return Value(std::move(o));
}

Series seriesOf(const Value& v) {
    if (v.isSeries()) return v.series();
    return Series::make(std::nullopt, scalarsFromValue(v, "array"));
}

/**
 * @brief Applies fn to every cell of a scalar, list, series or frame.
 */
Value mapCells(const Value& v, const std::function<Scalar(const Scalar&)>& fn) {
    if (v.isSeries()) return Value(SeriesOps::mapValues(v.series(), fn));
    if (v.isFrame()) {
        Frame out;
        out.index = v.frame().index;
        for (const auto& col : v.frame().columns) {
            std::vector<Scalar> values;
            values.reserve(col.values.size());
            for (const auto& c : col.values) values.push_back(fn(c));
            out.setColumn(col.name, std::move(values));
        }
        return Value(std::move(out));
    }
    if (v.isList()) {
        std::vector<Value> items;
        for (const auto& s : scalarsFromValue(v, "array")) items.emplace_back(fn(s));
        return makeList(std::move(items));
    }
    return Value(fn(v.scalar()));
}

std::function<Scalar(const Scalar&)> floatFunction(const std::string& name, double (*fn)(double)) {
    return [name, fn](const Scalar& s) -> Scalar {
        if (isMissing(s)) return nanScalar();
        if (!isNumeric(s)) raise("TypeError", "ufunc '" + name + "' not supported for the input types");
        return Scalar(fn(toDouble(s)));
    };
}

bool parseFloatText(const std::string& raw, double& out) {
    const std::string t = CommonUtils::toLower(CommonUtils::trim(raw));
    if (t == "nan" || t == "+nan" || t == "-nan") {
        out = std::numeric_limits<double>::quiet_NaN();
        return true;
    }
    if (t == "inf" || t == "+inf" || t == "infinity" || t == "+infinity") {
        out = std::numeric_limits<double>::infinity();
        return true;
    }
    if (t == "-inf" || t == "-infinity") {
        out = -std::numeric_limits<double>::infinity();
        return true;
    }
    const char* b = t.data();
    const char* e = b + t.size();
    if (b != e && *b == '+') ++b;
    auto [p, ec] = std::from_chars(b, e, out);
    return !t.empty() && ec == std::errc{} && p == e;
}

Scalar toFloat(const Scalar& s) {
    if (isNumeric(s)) return Scalar(toDouble(s));
    if (const auto* str = std::get_if<std::string>(&s)) {
        double d = 0.0;
        if (parseFloatText(*str, d)) return Scalar(d);
        raise("ValueError", "could not convert string to float: " + scalarRepr(s));
    }
    raise("TypeError", "float() argument must be a string or a real number, not '" + typeName(Value(s)) + "'");
}

Scalar toInt(const Scalar& s) {
    if (const auto* d = std::get_if<double>(&s)) {
        if (std::isnan(*d)) raise("ValueError", "cannot convert float NaN to integer");
        if (std::isinf(*d)) raise("OverflowError", "cannot convert float infinity to integer");
        return Scalar(static_cast<int64_t>(std::trunc(*d)));
    }
    if (isNumeric(s)) return Scalar(toInteger(s));
    if (const auto* str = std::get_if<std::string>(&s)) {
        const std::string t = CommonUtils::trim(*str);
        const char* b = t.data();
        const char* e = b + t.size();
        if (b != e && *b == '+') ++b;
        int64_t v = 0;
        auto [p, ec] = std::from_chars(b, e, v);
        if (!t.empty() && ec == std::errc{} && p == e) return Scalar(v);
        raise("ValueError", "invalid literal for int() with base 10: " + scalarRepr(s));
    }
    raise("TypeError", "int() argument must be a string or a real number, not '" + typeName(Value(s)) + "'");
}

Value roundValue(const Value& v, const Value* ndigits) {
    if (v.isSeries() || v.isFrame()) {
        CallArgs args;
        if (ndigits && !ndigits->isNone()) args.positional.push_back(*ndigits);
        return v.isSeries() ? SeriesOps::callMethod(v, "round", args) : FrameOps::callMethod(v, "round", args);
    }
    if (v.isList()) {
        return mapCells(v, [&](const Scalar& s) -> Scalar {
            const int64_t digits = ndigits && !ndigits->isNone() ? toInteger(ndigits->scalar()) : 0;
            if (const auto* d = std::get_if<double>(&s)) return Scalar(SeriesOps::roundHalfEven(*d, digits));
            return s;
        });
    }
    const Scalar& s = v.scalar();
    if (!isNumeric(s)) raise("TypeError", "type " + typeName(v) + " doesn't define __round__ method");
    if (!ndigits || ndigits->isNone()) {
        if (const auto* d = std::get_if<double>(&s)) {
            if (std::isnan(*d)) raise("ValueError", "cannot convert float NaN to integer");
            if (std::isinf(*d)) raise("OverflowError", "cannot convert float infinity to integer");
            return Value::integer(static_cast<int64_t>(std::nearbyint(*d)));
        }
        return Value::integer(toInteger(s));
    }
    if (const auto* d = std::get_if<double>(&s)) {
        return Value::number(SeriesOps::roundHalfEven(*d, toInteger(ndigits->scalar())));
    }
    return Value::integer(toInteger(s));
}

Value absValue(const Value& v) {
    if (v.isSeries()) return SeriesOps::callMethod(v, "abs", CallArgs{});
    if (v.isFrame()) return FrameOps::callMethod(v, "abs", CallArgs{});
    return mapCells(v, [](const Scalar& s) -> Scalar {
        if (const auto* d = std::get_if<double>(&s)) return Scalar(std::fabs(*d));
        if (const auto* td = std::get_if<Timedelta>(&s)) return Scalar(Timedelta{td->seconds < 0 ? -td->seconds : td->seconds});
        if (!isNumeric(s)) raise("TypeError", "bad operand type for abs(): '" + typeName(Value(s)) + "'");
        const int64_t i = toInteger(s);
        return Scalar(i < 0 ? -i : i);
    });
}

Value extremum(const CallArgs& args, bool wantMax) {
    const std::string fn = wantMax ? "max" : "min";
    std::vector<Value> items = args.positional.size() == 1 ? Builtins::iterate(args.positional.front()) : args.positional;
    if (items.empty()) {
        if (const Value* dflt = args.get(kNoPos, "default")) return *dflt;
        raise("ValueError", fn + "() arg is an empty sequence");
    }
    Value best = items.front();
    for (size_t i = 1; i < items.size(); ++i) {
        const Scalar better = SeriesOps::compareScalar(wantMax ? ">" : "<", items[i].scalar(), best.scalar(), false);
        if (scalarTruthy(better)) best = items[i];
    }
    return best;
}

/**
 * @brief numpy-style reduction: lists propagate NaN, series skip missing.
 */
Value npReduce(const std::string& func, const Value& v, const CallArgs& args) {
    const int64_t ddof = args.get(kNoPos, "ddof") ? toInteger(args.get(kNoPos, "ddof")->scalar()) : 0;
    if (v.isSeries()) {
        return Value(SeriesOps::aggregate(func, v.series().values, v.series().dtype, func == "std" || func == "var" ? ddof : 1));
    }
    if (v.isFrame()) {
        CallArgs frameArgs;
        if (func == "std" || func == "var") frameArgs.keywords.emplace_back("ddof", Value::integer(ddof));
        return FrameOps::callMethod(v, func, frameArgs);
    }
    const std::vector<Scalar> values = v.isScalar() ? std::vector<Scalar>{v.scalar()} : scalarsFromValue(v, "array");
    for (const auto& s : values) {
        if (isMissing(s)) return Value(nanScalar());
    }
    if (values.empty()) {
        if (func == "sum") return Value::number(0.0);
        if (func == "min" || func == "max") raise("ValueError", "zero-size array to reduction operation " + func + " which has no identity");
        return Value(nanScalar());
    }
    const DType dtype = [&] {
        std::vector<Scalar> copy = values;
        return inferDType(copy);
    }();
    return Value(SeriesOps::aggregate(func, values, dtype, func == "std" || func == "var" ? ddof : 1));
}

Value npPercentile(const Value& a, const Value& q) {
    std::vector<double> sorted;
    bool hasNan = false;
    for (const auto& s : a.isScalar() ? std::vector<Scalar>{a.scalar()} : scalarsFromValue(a, "array")) {
        if (isMissing(s)) {
            hasNan = true;
            continue;
        }
        if (!isNumeric(s)) raise("TypeError", "percentile requires numeric data");
        sorted.push_back(toDouble(s));
    }
    if (sorted.empty() && !hasNan) raise("IndexError", "cannot do a non-empty take from an empty axes.");
    std::sort(sorted.begin(), sorted.end());
    const auto at = [&](const Scalar& qs) -> double {
        const double pct = toDouble(qs);
        if (pct < 0.0 || pct > 100.0) raise("ValueError", "Percentiles must be in the range [0, 100]");
        if (hasNan) return std::numeric_limits<double>::quiet_NaN();
        return StatsUtils::percentileSorted(sorted, pct / 100.0);
    };
    if (q.isScalar()) return Value::number(at(q.scalar()));
    std::vector<Value> out;
    for (const auto& qs : scalarsFromValue(q, "q")) out.push_back(Value::number(at(qs)));
    return makeList(std::move(out));
}

Value npWhere(const Value& cond, const Value& x, const Value& y) {
    if (cond.isScalar()) return scalarTruthy(cond.scalar()) ? x : y;
    const Series mask = seriesOf(cond);
    const std::vector<Scalar> xs = SeriesOps::broadcast(x, mask.index, "where");
    const std::vector<Scalar> ys = SeriesOps::broadcast(y, mask.index, "where");
    std::vector<Scalar> values;
    values.reserve(mask.size());
    for (size_t i = 0; i < mask.size(); ++i) {
        const bool take = !isMissing(mask.values[i]) && scalarTruthy(mask.values[i]);
        values.push_back(take ? xs[i] : ys[i]);
    }
    return Value(Series::make(std::nullopt, std::move(values), mask.index));
}

Value pdSeries(const CallArgs& args) {
    const Value* data = args.get(0, "data");
    const Value* index = args.get(1, "index");
    const Value* name = args.get(kNoPos, "name");
    const Value* dtype = args.get(kNoPos, "dtype");
    std::optional<std::string> seriesName;
    if (name && !name->isNone()) seriesName = scalarStr(name->scalar());

    Series s;
    if (!data || data->isNone()) {
        s = Series::make(seriesName, {});
    } else if (data->isSeries()) {
        s = data->series();
        if (seriesName) s.name = seriesName;
    } else if (data->isDict()) {
        std::vector<Scalar> labels;
        std::vector<Scalar> values;
        for (const auto& item : data->dict().items) {
            labels.push_back(item.first);
            values.push_back(item.second.scalar());
        }
        s = Series::make(seriesName, std::move(values), Index::single("", std::move(labels)));
    } else if (data->isList()) {
        s = Series::make(seriesName, scalarsFromValue(*data, "Series data"));
    } else if (data->isScalar()) {
        const size_t n = index && !index->isNone() ? scalarsFromValue(*index, "index").size() : 1;
        s = Series::make(seriesName, std::vector<Scalar>(n, data->scalar()));
    } else {
        raise("TypeError", "cannot build a Series from " + typeName(*data));
    }
    if (index && !index->isNone() && !(data && data->isSeries())) {
        std::vector<Scalar> labels = scalarsFromValue(*index, "index");
        if (labels.size() != s.size()) {
            raise("ValueError", "Length of values (" + std::to_string(s.size()) +
                                ") does not match length of index (" + std::to_string(labels.size()) + ")");
        }
        s.index = Index::single("", std::move(labels));
    }
    if (dtype && !dtype->isNone()) s = SeriesOps::astype(s, *dtype);
    return Value(std::move(s));
}

Value pdConvert(const Value& arg, const std::string& errors, bool datetime) {
    const auto convert = [&](const std::vector<Scalar>& values) {
        return datetime ? SeriesOps::toDatetimeValues(values, errors) : SeriesOps::toNumericValues(values, errors);
    };
    if (arg.isSeries()) {
        const Series& s = arg.series();
        return Value(Series::make(s.name, convert(s.values), s.index));
    }
    if (arg.isList()) return Value(Series::make(std::nullopt, convert(scalarsFromValue(arg, "arg"))));
    if (arg.isScalar()) return Value(convert({arg.scalar()}).front());
    raise("TypeError", "arg must be a list, tuple, 1-d array, or Series");
}

Value pdMissingTest(const Value& v, bool wantMissing) {
    if (v.isSeries()) return SeriesOps::callMethod(v, wantMissing ? "isna" : "notna", CallArgs{});
    if (v.isFrame()) return FrameOps::callMethod(v, wantMissing ? "isna" : "notna", CallArgs{});
    return mapCells(v, [wantMissing](const Scalar& s) { return Scalar(isMissing(s) == wantMissing); });
}

Value pdTimedelta(const CallArgs& args) {
    if (const Value* text = args.get(0, "value")) {
        if (text->isScalar() && isNumeric(text->scalar())) {
            const std::string unit = args.get(1, "unit") ? stringOf(*args.get(1, "unit"), "unit") : "s";
            static const std::unordered_map<std::string, int64_t> kUnits = {
                {"s", 1}, {"seconds", 1}, {"m", 60}, {"minutes", 60}, {"h", 3600}, {"hours", 3600},
                {"D", 86400}, {"d", 86400}, {"days", 86400}, {"W", 604800}, {"weeks", 604800}};
            const auto it = kUnits.find(unit);
            if (it == kUnits.end()) raise("ValueError", "invalid unit abbreviation: " + unit);
            return Value(Scalar(Timedelta{static_cast<int64_t>(std::llround(toDouble(text->scalar()) * static_cast<double>(it->second)))}));
        }
        raise("ValueError", "only numeric Timedelta values are supported");
    }
    double seconds = 0.0;
    const std::pair<const char*, double> parts[] = {
        {"weeks", 604800.0}, {"days", 86400.0}, {"hours", 3600.0}, {"minutes", 60.0}, {"seconds", 1.0}};
    for (const auto& part : parts) {
        if (const Value* v = args.get(kNoPos, part.first)) seconds += toDouble(v->scalar()) * part.second;
    }
    return Value(Scalar(Timedelta{static_cast<int64_t>(std::llround(seconds))}));
}

/**
 * @brief str.format with positional {} / {N} fields and the common specs
 * ".Nf", ",", ",.Nf", ".N%" and "d".
 */
std::string formatString(const std::string& fmt, const CallArgs& args) {
    std::string out;
    size_t next = 0;
    for (size_t i = 0; i < fmt.size(); ++i) {
        const char c = fmt[i];
        if (c == '{' && i + 1 < fmt.size() && fmt[i + 1] == '{') {
            out.push_back('{');
            ++i;
            continue;
        }
        if (c == '}' && i + 1 < fmt.size() && fmt[i + 1] == '}') {
            out.push_back('}');
            ++i;
            continue;
        }
        if (c != '{') {
            out.push_back(c);
            continue;
        }
        const size_t close = fmt.find('}', i);
        if (close == std::string::npos) raise("ValueError", "Single '{' encountered in format string");
        const std::string field = fmt.substr(i + 1, close - i - 1);
        i = close;
        const size_t colon = field.find(':');
        const std::string ref = field.substr(0, colon);
        const std::string spec = colon == std::string::npos ? "" : field.substr(colon + 1);

        const Value* arg = nullptr;
        if (ref.empty()) {
            arg = args.get(next++, "");
        } else if (std::isdigit(static_cast<unsigned char>(ref.front()))) {
            arg = args.get(static_cast<size_t>(std::stoul(ref)), "");
        } else {
            arg = args.get(kNoPos, ref);
        }
        if (!arg) raise("IndexError", "Replacement index out of range for positional args tuple");
        if (!arg->isScalar()) {
            out += valueRepr(*arg);
            continue;
        }
        const Scalar& s = arg->scalar();
        if (spec.empty()) {
            out += scalarStr(s);
            continue;
        }

        std::string body = spec;
        const bool percent = !body.empty() && body.back() == '%';
        const bool fixed = !body.empty() && (body.back() == 'f' || body.back() == 'F');
        const bool integer = !body.empty() && body.back() == 'd';
        if (percent || fixed || integer) body.pop_back();
        const bool grouping = !body.empty() && body.front() == ',';
        if (grouping) body.erase(body.begin());
        int precision = fixed || percent ? 6 : -1;
        if (!body.empty() && body.front() == '.') precision = std::stoi(body.substr(1));
        else if (!body.empty()) raise("ValueError", "Unsupported format specifier '" + spec + "'");

        if (!isNumeric(s)) raise("ValueError", "Unknown format code for object of type '" + typeName(*arg) + "'");
        double x = toDouble(s);
        if (percent) x *= 100.0;
        std::string text;
        if (integer || (precision < 0 && !std::holds_alternative<double>(s))) {
            if (integer && std::holds_alternative<double>(s)) raise("ValueError", "Unknown format code 'd' for object of type 'float'");
            text = std::to_string(toInteger(s));
        } else if (precision < 0) {
            text = scalarStr(s);
        } else {
            text = CommonUtils::formatDouble(x, precision);
        }
        if (grouping) {
            const size_t start = (!text.empty() && text.front() == '-') ? 1 : 0;
            size_t end = text.find('.');
            if (end == std::string::npos) end = text.size();
            for (size_t pos = end; pos > start + 3; pos -= 3) text.insert(pos - 3, ",");
        }
        out += text;
        if (percent) out.push_back('%');
    }
    return out;
}

Value stringMethod(const std::string& self, const std::string& name, const CallArgs& args) {
    if (name == "lower") return Value::string(CommonUtils::toLower(self));
    if (name == "upper") return Value::string(CommonUtils::toUpper(self));
    if (name == "strip" || name == "lstrip" || name == "rstrip") {
        const Value* chars = args.get(0, "chars");
        const std::string set = chars && !chars->isNone() ? stringOf(*chars, "chars") : " \t\r\n\f\v";
        size_t b = 0;
        size_t e = self.size();
        if (name != "rstrip") {
            while (b < e && set.find(self[b]) != std::string::npos) ++b;
        }
        if (name != "lstrip") {
            while (e > b && set.find(self[e - 1]) != std::string::npos) --e;
        }
        return Value::string(self.substr(b, e - b));
    }
    if (name == "startswith" || name == "endswith") {
        const std::string& p = stringOf(requireArg(args, 0, "prefix", name), name + " argument");
        if (p.size() > self.size()) return Value::boolean(false);
        if (name == "startswith") return Value::boolean(self.compare(0, p.size(), p) == 0);
        return Value::boolean(self.compare(self.size() - p.size(), p.size(), p) == 0);
    }
    if (name == "replace") {
        const std::string& from = stringOf(requireArg(args, 0, "old", name), "replace argument");
        const std::string& to = stringOf(requireArg(args, 1, "new", name), "replace argument");
        if (from.empty()) return Value::string(self);
        std::string out;
        size_t start = 0;
        size_t found = 0;
        while ((found = self.find(from, start)) != std::string::npos) {
            out.append(self, start, found - start);
            out += to;
            start = found + from.size();
        }
        out.append(self, start, std::string::npos);
        return Value::string(std::move(out));
    }
    if (name == "split") {
        const Value* sep = args.get(0, "sep");
        std::vector<Value> parts;
        if (!sep || sep->isNone()) {
            std::string cur;
            for (char c : self) {
                if (std::isspace(static_cast<unsigned char>(c))) {
                    if (!cur.empty()) parts.push_back(Value::string(cur));
                    cur.clear();
                } else {
                    cur.push_back(c);
                }
            }
            if (!cur.empty()) parts.push_back(Value::string(cur));
            return makeList(std::move(parts));
        }
        const std::string& delim = stringOf(*sep, "sep");
        if (delim.empty()) raise("ValueError", "empty separator");
        size_t start = 0;
        size_t found = 0;
        while ((found = self.find(delim, start)) != std::string::npos) {
            parts.push_back(Value::string(self.substr(start, found - start)));
            start = found + delim.size();
        }
        parts.push_back(Value::string(self.substr(start)));
        return makeList(std::move(parts));
    }
    if (name == "join") {
        std::string out;
        bool first = true;
        for (const auto& item : Builtins::iterate(requireArg(args, 0, "iterable", name))) {
            if (!first) out += self;
            out += stringOf(item, "sequence item");
            first = false;
        }
        return Value::string(std::move(out));
    }
    if (name == "title" || name == "capitalize") {
        std::string out = self;
        bool startWord = true;
        for (size_t i = 0; i < out.size(); ++i) {
            const unsigned char u = static_cast<unsigned char>(out[i]);
            if (name == "capitalize") {
                out[i] = static_cast<char>(i == 0 ? std::toupper(u) : std::tolower(u));
                continue;
            }
            if (std::isalpha(u)) {
                out[i] = static_cast<char>(startWord ? std::toupper(u) : std::tolower(u));
                startWord = false;
            } else {
                startWord = true;
            }
        }
        return Value::string(std::move(out));
    }
    if (name == "find") {
        const size_t pos = self.find(stringOf(requireArg(args, 0, "sub", name), "find argument"));
        return Value::integer(pos == std::string::npos ? -1 : static_cast<int64_t>(pos));
    }
    if (name == "count") {
        const std::string& sub = stringOf(requireArg(args, 0, "sub", name), "count argument");
        if (sub.empty()) return Value::integer(static_cast<int64_t>(self.size() + 1));
        int64_t n = 0;
        for (size_t pos = self.find(sub); pos != std::string::npos; pos = self.find(sub, pos + sub.size())) ++n;
        return Value::integer(n);
    }
    if (name == "isdigit" || name == "isnumeric") {
        const bool digits = !self.empty() && std::all_of(self.begin(), self.end(), [](char c) {
            return std::isdigit(static_cast<unsigned char>(c)) != 0;
        });
        return Value::boolean(digits);
    }
    if (name == "format") return Value::string(formatString(self, args));
    raise("AttributeError", "'str' object has no attribute '" + name + "'");
}

const std::unordered_set<std::string>& stringMethodNames() {
    static const std::unordered_set<std::string> kNames = {
        "lower", "upper", "strip", "lstrip", "rstrip", "startswith", "endswith", "replace", "split",
        "join", "title", "capitalize", "find", "count", "isdigit", "isnumeric", "format"};
    return kNames;
}

Series singleton(const Scalar& s) {
    return Series::make(std::nullopt, {s});
}

const std::unordered_map<std::string, std::string>& moduleLongNames() {
    static const std::unordered_map<std::string, std::string> kNames = {{"pd", "pandas"}, {"np", "numpy"}};
    return kNames;
}

const std::unordered_set<std::string>& pdFunctions() {
    static const std::unordered_set<std::string> kNames = {
        "to_numeric", "to_datetime", "isna", "isnull", "notna", "notnull", "Series", "DataFrame",
        "Timestamp", "Timedelta"};
    return kNames;
}

const std::unordered_set<std::string>& npFunctions() {
    static const std::unordered_set<std::string> kNames = {
        "where", "sum", "mean", "median", "std", "var", "min", "max", "abs", "round", "sqrt", "log",
        "log1p", "log10", "exp", "floor", "ceil", "isnan", "isfinite", "percentile", "nanmean", "nansum"};
    return kNames;
}
} // namespace

namespace SafeOps {

namespace {
Scalar divideCell(const Scalar& a, const Scalar& b) {
    if ((!isMissing(a) && !isNumeric(a)) || (!isMissing(b) && !isNumeric(b))) {
        raise("TypeError", "unsupported operand type(s) for /: '" + typeName(Value(a)) + "' and '" + typeName(Value(b)) + "'");
    }
    if (isMissing(a) || isMissing(b)) return Scalar(0.0);
    const double den = toDouble(b);
    if (den == 0.0 || !std::isfinite(den)) return Scalar(0.0);
    const double q = toDouble(a) / den;
    return Scalar(std::isfinite(q) ? q : 0.0);
}

Scalar cleanCell(const Scalar& s, DType dtype) {
    if (const auto* d = std::get_if<double>(&s)) return std::isfinite(*d) ? s : Scalar(0.0);
    if (std::holds_alternative<std::monostate>(s) && (dtype == DType::Float || dtype == DType::Int)) return Scalar(0.0);
    return s;
}
} // namespace

Value safeDivide(const Value& a, const Value& b) {
    if (a.isFrame() || b.isFrame()) {
        const bool frameLeft = a.isFrame();
        const Frame& f = frameLeft ? a.frame() : b.frame();
        const Value& other = frameLeft ? b : a;
        Frame out;
        out.index = f.index;
        for (size_t c = 0; c < f.columns.size(); ++c) {
            const Value column(f.column(c));
            Value divided;
            if (other.isFrame()) {
                const int match = other.frame().findColumn(f.columns[c].name);
                const Value partner = match >= 0 ? Value(other.frame().column(static_cast<size_t>(match)))
                                                 : Value(nanScalar());
                divided = safeDivide(column, partner);
            } else {
                divided = frameLeft ? safeDivide(column, other) : safeDivide(other, column);
            }
            out.setColumn(f.columns[c].name, SeriesOps::broadcast(divided, out.index, "safe_divide"));
        }
        return Value(std::move(out));
    }
    const bool seriesLike = a.isSeries() || b.isSeries() || a.isList() || b.isList();
    if (!seriesLike) return Value(divideCell(a.scalar(), b.scalar()));
    if ((a.isSeries() || a.isList()) && (b.isSeries() || b.isList())) {
        return Value(SeriesOps::combine(seriesOf(a), seriesOf(b), divideCell));
    }
    if (a.isSeries() || a.isList()) {
        const Scalar& den = b.scalar();
        return Value(SeriesOps::mapValues(seriesOf(a), [&](const Scalar& x) { return divideCell(x, den); }));
    }
    const Scalar& num = a.scalar();
    return Value(SeriesOps::mapValues(seriesOf(b), [&](const Scalar& y) { return divideCell(num, y); }));
}

Value safeContains(const Value& column, const Value& pattern) {
    const std::string needle = pattern.isScalar() ? scalarStr(pattern.scalar()) : valueRepr(pattern);
    const auto test = [&](const Scalar& s) -> Scalar {
        if (isMissing(s)) return Scalar(false);
        if (const auto* str = std::get_if<std::string>(&s)) return Scalar(CommonUtils::containsIgnoreCase(*str, needle));
        return Scalar(CommonUtils::containsIgnoreCase(scalarStr(s), needle));
    };
    if (column.isSeries() || column.isList()) {
        Series s = SeriesOps::mapValues(seriesOf(column), test);
        return Value(std::move(s));
    }
    if (column.isScalar()) return Value(test(column.scalar()));
    raise("TypeError", "safe_contains() expects a column, got " + typeName(column));
}

Value cleanResult(const Value& v) {
    if (v.isScalar()) return Value(cleanCell(v.scalar(), DType::Object));
    if (v.isSeries()) {
        const Series& s = v.series();
        const DType dtype = s.dtype;
        return Value(SeriesOps::mapValues(s, [dtype](const Scalar& c) { return cleanCell(c, dtype); }));
    }
    if (v.isFrame()) {
        Frame out;
        out.index = v.frame().index;
        for (const auto& col : v.frame().columns) {
            std::vector<Scalar> values;
            values.reserve(col.values.size());
            for (const auto& c : col.values) values.push_back(cleanCell(c, col.dtype));
            out.setColumn(col.name, std::move(values));
        }
        return Value(std::move(out));
    }
    if (v.isList()) {
        std::vector<Value> items;
        items.reserve(v.list().items.size());
        for (const auto& item : v.list().items) items.push_back(cleanResult(item));
        return makeList(std::move(items), v.list().isTuple);
    }
    if (v.isDict()) {
        DictValue out;
        for (const auto& item : v.dict().items) out.set(item.first, cleanResult(item.second));
        return Value(std::move(out));
    }
    return v;
}

Value zeroNonFinite(const Value& v) {
    const auto nonFinite = [](const Value& x) {
        if (!x.isScalar()) return false;
        const auto* d = std::get_if<double>(&x.scalar());
        return d && !std::isfinite(*d);
    };
    if (nonFinite(v)) return Value::integer(0);
    if (v.isDict()) {
        DictValue out;
        for (const auto& item : v.dict().items) out.set(item.first, nonFinite(item.second) ? Value::integer(0) : item.second);
        return Value(std::move(out));
    }
    return v;
}

} // namespace SafeOps

namespace Builtins {

const std::vector<std::string>& globalNames() {
    static const std::vector<std::string> kNames = {
        "pd", "np", "float", "int", "str", "len", "round", "abs", "min", "max", "sum", "sorted", "list",
        "dict", "bool", "print", "safe_divide", "safe_contains", "clean_result", "zero_non_finite"};
    return kNames;
}

Value globalValue(const std::string& name) {
    if (name == "pd" || name == "np") return moduleObject(name);
    const auto& names = globalNames();
    if (std::find(names.begin(), names.end(), name) == names.end()) {
        raise("NameError", "name '" + name + "' is not defined");
    }
    return builtinObject(name);
}

std::vector<Value> iterate(const Value& v) {
    if (v.isList()) return v.list().items;
    if (v.isDict()) {
        std::vector<Value> keys;
        for (const auto& item : v.dict().items) keys.emplace_back(item.first);
        return keys;
    }
    if (v.isSeries()) {
        const Series& s = v.series();
        std::vector<Value> out;
        out.reserve(s.size());
        for (const auto& c : s.values) {
            const bool numeric = s.dtype == DType::Float || s.dtype == DType::Int;
            out.push_back(std::holds_alternative<std::monostate>(c) && numeric ? Value(nanScalar()) : Value(c));
        }
        return out;
    }
    if (v.isFrame()) {
        std::vector<Value> out;
        for (const auto& col : v.frame().columns) out.push_back(Value::string(col.name));
        return out;
    }
    if (isString(v)) {
        std::vector<Value> out;
        for (char c : std::get<std::string>(v.scalar())) out.push_back(Value::string(std::string(1, c)));
        return out;
    }
    raise("TypeError", "'" + typeName(v) + "' object is not iterable");
}

Value call(const Object& fn, const CallArgs& args, std::ostream* out) {
    const std::string& name = fn.name;

    if (fn.kind == Object::Kind::ModuleFunction) {
        const size_t dot = name.find('.');
        const std::string module = name.substr(0, dot);
        const std::string member = name.substr(dot + 1);
        if (module == "pd") {
            if (member == "to_numeric" || member == "to_datetime") {
                const Value* errorsArg = args.get(1, "errors");
                const std::string errors = errorsArg ? stringOf(*errorsArg, "errors") : "raise";
                if (errors != "raise" && errors != "coerce" && errors != "ignore") {
                    raise("ValueError", "invalid error value specified");
                }
                return pdConvert(requireArg(args, 0, "arg", member), errors, member == "to_datetime");
            }
            if (member == "isna" || member == "isnull") return pdMissingTest(requireArg(args, 0, "obj", member), true);
            if (member == "notna" || member == "notnull") return pdMissingTest(requireArg(args, 0, "obj", member), false);
            if (member == "Series") return pdSeries(args);
            if (member == "DataFrame") {
                const Value* data = args.get(0, "data");
                return Value(FrameOps::fromData(data ? *data : Value::none(), args.get(kNoPos, "columns")));
            }
            if (member == "Timestamp") {
                const Value& arg = requireArg(args, 0, "ts_input", member);
                return pdConvert(arg, "raise", true);
            }
            if (member == "Timedelta") return pdTimedelta(args);
        } else if (module == "np") {
            if (member == "where") {
                return npWhere(requireArg(args, 0, "condition", member), requireArg(args, 1, "x", member),
                               requireArg(args, 2, "y", member));
            }
            if (member == "sum" || member == "mean" || member == "median" || member == "std" || member == "var" ||
                member == "min" || member == "max") {
                return npReduce(member, requireArg(args, 0, "a", member), args);
            }
            if (member == "nanmean" || member == "nansum") {
                const Value& a = requireArg(args, 0, "a", member);
                const Series s = seriesOf(a.isScalar() ? makeList({a}) : a);
                return Value(SeriesOps::aggregate(member.substr(3), s.values, s.dtype));
            }
            if (member == "abs") return absValue(requireArg(args, 0, "x", member));
            if (member == "round") return roundValue(requireArg(args, 0, "a", member), args.get(1, "decimals"));
            if (member == "percentile") return npPercentile(requireArg(args, 0, "a", member), requireArg(args, 1, "q", member));
            if (member == "isnan" || member == "isfinite") {
                const bool nanTest = member == "isnan";
                return mapCells(requireArg(args, 0, "x", member), [nanTest, member](const Scalar& s) -> Scalar {
                    if (std::holds_alternative<std::monostate>(s)) return Scalar(nanTest);
                    if (!isNumeric(s)) raise("TypeError", "ufunc '" + member + "' not supported for the input types");
                    const double d = toDouble(s);
                    return Scalar(nanTest ? std::isnan(d) : std::isfinite(d));
                });
            }
            using UnaryFn = double (*)(double);
            static const std::unordered_map<std::string, UnaryFn> kUnary = {
                {"sqrt", [](double x) { return std::sqrt(x); }},
                {"log", [](double x) { return std::log(x); }},
                {"log1p", [](double x) { return std::log1p(x); }},
                {"log10", [](double x) { return std::log10(x); }},
                {"exp", [](double x) { return std::exp(x); }},
                {"floor", [](double x) { return std::floor(x); }},
                {"ceil", [](double x) { return std::ceil(x); }}};
            const auto it = kUnary.find(member);
            if (it != kUnary.end()) return mapCells(requireArg(args, 0, "x", member), floatFunction(member, it->second));
        }
        raise("AttributeError", "module '" + moduleLongNames().at(module) + "' has no attribute '" + member + "'");
    }

    if (name == "float" || name == "float64") {
        const Value* x = args.get(0, "x");
        if (!x) return Value::number(0.0);
        return Value(toFloat(x->scalar()));
    }
    if (name == "int" || name == "int64") {
        const Value* x = args.get(0, "x");
        if (!x) return Value::integer(0);
        return Value(toInt(x->scalar()));
    }
    if (name == "str") {
        const Value* x = args.get(0, "object");
        if (!x) return Value::string("");
        return Value::string(x->isScalar() ? scalarStr(x->scalar()) : valueRepr(*x));
    }
    if (name == "bool") {
        const Value* x = args.get(0, "x");
        return Value::boolean(x && truthy(*x));
    }
    if (name == "len") {
        const Value& x = requireArg(args, 0, "obj", name);
        if (x.isFrame()) return Value::integer(static_cast<int64_t>(x.frame().rows()));
        if (x.isGroupBy()) {
            GroupBy counted = x.groupBy();
            counted.asIndex = true;
            return Value::integer(static_cast<int64_t>(FrameOps::groupByCall(counted, "size", CallArgs{}).series().size()));
        }
        if (x.isScalar() && !isString(x)) raise("TypeError", "object of type '" + typeName(x) + "' has no len()");
        if (x.isObject()) raise("TypeError", "object of type '" + typeName(x) + "' has no len()");
        if (isString(x)) return Value::integer(static_cast<int64_t>(std::get<std::string>(x.scalar()).size()));
        if (x.isDict()) return Value::integer(static_cast<int64_t>(x.dict().items.size()));
        return Value::integer(static_cast<int64_t>(iterate(x).size()));
    }
    if (name == "round") return roundValue(requireArg(args, 0, "number", name), args.get(1, "ndigits"));
    if (name == "abs") return absValue(requireArg(args, 0, "x", name));
    if (name == "min" || name == "max") return extremum(args, name == "max");
    if (name == "sum") {
        const Value* start = args.get(1, "start");
        Scalar acc = start ? start->scalar() : Scalar(int64_t{0});
        for (const auto& item : iterate(requireArg(args, 0, "iterable", name))) {
            acc = SeriesOps::binaryScalar("+", acc, item.scalar(), false);
        }
        return Value(std::move(acc));
    }
    if (name == "sorted") {
        std::vector<Value> items = iterate(requireArg(args, 0, "iterable", name));
        const Value* reverse = args.get(kNoPos, "reverse");
        const bool descending = reverse && truthy(*reverse);
        std::stable_sort(items.begin(), items.end(), [&](const Value& a, const Value& b) {
            const int c = compareScalars(a.scalar(), b.scalar());
            return descending ? c > 0 : c < 0;
        });
        return makeList(std::move(items));
    }
    if (name == "list") {
        const Value* x = args.get(0, "iterable");
        if (!x) return makeList({});
        return makeList(iterate(*x));
    }
    if (name == "dict") {
        DictValue d;
        if (const Value* x = args.get(0, "mapping")) {
            if (x->isDict()) {
                d = x->dict();
            } else if (x->isSeries()) {
                const Series& s = x->series();
                for (size_t r = 0; r < s.size(); ++r) {
                    const Scalar key = s.index.nlevels() == 1 ? s.index.levels.front()[r] : Scalar(s.index.displayAt(r));
                    d.set(key, Value(s.values[r]));
                }
            } else {
                for (const auto& pair : iterate(*x)) {
                    if (!pair.isList() || pair.list().items.size() != 2) {
                        raise("ValueError", "dictionary update sequence element has wrong length");
                    }
                    d.set(pair.list().items[0].scalar(), pair.list().items[1]);
                }
            }
        }
        for (const auto& kw : args.keywords) {
            if (kw.first != "mapping") d.set(Scalar(kw.first), kw.second);
        }
        return Value(std::move(d));
    }
    if (name == "print") {
        if (out) {
            const Value* sepArg = args.get(kNoPos, "sep");
            const std::string sep = sepArg ? scalarStr(sepArg->scalar()) : " ";
            for (size_t i = 0; i < args.positional.size(); ++i) {
                if (i > 0) *out << sep;
                const Value& v = args.positional[i];
                *out << (v.isScalar() ? scalarStr(v.scalar()) : valueRepr(v));
            }
            *out << "\n";
        }
        return Value::none();
    }
    if (name == "safe_divide") {
        return SafeOps::safeDivide(requireArg(args, 0, "a", name), requireArg(args, 1, "b", name));
    }
    if (name == "safe_contains") {
        return SafeOps::safeContains(requireArg(args, 0, "column", name), requireArg(args, 1, "pattern", name));
    }
    if (name == "clean_result") return SafeOps::cleanResult(requireArg(args, 0, "value", name));
    if (name == "zero_non_finite") return SafeOps::zeroNonFinite(requireArg(args, 0, "value", name));
    raise("NameError", "name '" + name + "' is not defined");
}

Value getAttribute(const Value& self, const std::string& name) {
    if (self.isObject() && self.object().kind == Object::Kind::Module) {
        const std::string& module = self.object().name;
        if (module == "np") {
            if (name == "nan" || name == "NaN") return Value(nanScalar());
            if (name == "inf") return Value::number(std::numeric_limits<double>::infinity());
            if (name == "pi") return Value::number(3.14159265358979323846);
            if (name == "float64" || name == "int64") return builtinObject(name);
            if (npFunctions().count(name)) return moduleFunction("np." + name);
        } else {
            if (name == "NA" || name == "NaT") return Value::none();
            if (pdFunctions().count(name)) return moduleFunction("pd." + name);
        }
        raise("AttributeError", "module '" + moduleLongNames().at(module) + "' has no attribute '" + name + "'");
    }
    if (isString(self)) {
        if (stringMethodNames().count(name)) return bindMethod(self, name);
        raise("AttributeError", "'str' object has no attribute '" + name + "'");
    }
    if (self.isScalar() && std::holds_alternative<Timestamp>(self.scalar())) {
        static const std::unordered_set<std::string> kMethods = {"strftime", "weekday", "isoformat", "normalize", "day_name", "month_name", "date"};
        if (kMethods.count(name)) return bindMethod(self, name);
        return Value(SeriesOps::dtAttribute(singleton(self.scalar()), name).series().values.front());
    }
    if (self.isScalar() && std::holds_alternative<Timedelta>(self.scalar())) {
        if (name == "total_seconds") return bindMethod(self, name);
        if (name == "days" || name == "seconds") {
            return Value(SeriesOps::dtAttribute(singleton(self.scalar()), name).series().values.front());
        }
        raise("AttributeError", "'Timedelta' object has no attribute '" + name + "'");
    }
    if (self.isList()) {
        static const std::unordered_set<std::string> kMethods = {"tolist", "copy", "count", "index", "sum", "mean", "min", "max"};
        if (kMethods.count(name)) return bindMethod(self, name);
    }
    if (self.isDict()) {
        static const std::unordered_set<std::string> kMethods = {"keys", "values", "items", "get", "copy"};
        if (kMethods.count(name)) return bindMethod(self, name);
    }
    raise("AttributeError", "'" + typeName(self) + "' object has no attribute '" + name + "'");
}

Value callMethod(const Value& self, const std::string& name, const CallArgs& args) {
    if (isString(self)) return stringMethod(std::get<std::string>(self.scalar()), name, args);

    if (self.isScalar() && std::holds_alternative<Timestamp>(self.scalar())) {
        const Series one = singleton(self.scalar());
        const int64_t seconds = std::get<Timestamp>(self.scalar()).seconds;
        if (name == "weekday") return Value(SeriesOps::dtAttribute(one, "weekday").series().values.front());
        if (name == "isoformat") return Value::string(formatIsoDateTime(seconds));
        if (name == "date") return Value(SeriesOps::dtAttribute(one, "date").series().values.front());
        return Value(SeriesOps::dtMethod(one, name, args).series().values.front());
    }
    if (self.isScalar() && std::holds_alternative<Timedelta>(self.scalar())) {
        return Value(SeriesOps::dtMethod(singleton(self.scalar()), name, args).series().values.front());
    }

    if (self.isList()) {
        const auto& items = self.list().items;
        if (name == "tolist" || name == "copy") return makeList(items);
        if (name == "count") {
            const Value& target = requireArg(args, 0, "value", name);
            int64_t n = 0;
            for (const auto& item : items) {
                if (item.isScalar() && target.isScalar() && scalarsEqual(item.scalar(), target.scalar())) ++n;
            }
            return Value::integer(n);
        }
        if (name == "index") {
            const Value& target = requireArg(args, 0, "value", name);
            for (size_t i = 0; i < items.size(); ++i) {
                if (items[i].isScalar() && target.isScalar() && scalarsEqual(items[i].scalar(), target.scalar())) {
                    return Value::integer(static_cast<int64_t>(i));
                }
            }
            raise("ValueError", valueRepr(target) + " is not in list");
        }
        return npReduce(name, self, args);
    }

    if (self.isDict()) {
        const auto& d = self.dict();
        if (name == "keys") return makeList(iterate(self));
        if (name == "values") {
            std::vector<Value> values;
            for (const auto& item : d.items) values.push_back(item.second);
            return makeList(std::move(values));
        }
        if (name == "items") {
            std::vector<Value> pairs;
            for (const auto& item : d.items) pairs.push_back(makeList({Value(item.first), item.second}, true));
            return makeList(std::move(pairs));
        }
        if (name == "get") {
            const Value& key = requireArg(args, 0, "key", name);
            if (const Value* found = d.find(key.scalar())) return *found;
            const Value* dflt = args.get(1, "default");
            return dflt ? *dflt : Value::none();
        }
        if (name == "copy") return self;
    }
    raise("AttributeError", "'" + typeName(self) + "' object has no attribute '" + name + "'");
}

} // namespace Builtins
} // namespace Script
