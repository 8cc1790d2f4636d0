#include "SeriesOps.h"
#include "CommonUtils.h"
#include "StatsUtils.h"
#include "TypedDataset.h"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <ctime>
#include <limits>
#include <numeric>
#include <regex>
#include <unordered_map>
#include <unordered_set>

namespace Script {
namespace SeriesOps {

namespace {
constexpr size_t kNoPos = static_cast<size_t>(-1);

Scalar nanScalar() {
    return Scalar(std::numeric_limits<double>::quiet_NaN());
}

bool isIntLike(const Scalar& s) {
    return std::holds_alternative<bool>(s) || std::holds_alternative<int64_t>(s);
}

std::string scalarType(const Scalar& s) {
    return typeName(Value(s));
}

[[noreturn]] void unsupported(const std::string& op, const Scalar& a, const Scalar& b) {
    raise("TypeError", "unsupported operand type(s) for " + op + ": '" + scalarType(a) + "' and '" + scalarType(b) + "'");
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
    const Scalar& s = v->scalar();
    if (const auto* str = std::get_if<std::string>(&s)) return *str;
    raise("TypeError", kw + " must be a string, not " + scalarType(s));
}

Value cellValue(const Scalar& s, DType dtype) {
    if (std::holds_alternative<std::monostate>(s) && (dtype == DType::Float || dtype == DType::Int)) {
        return Value(nanScalar());
    }
    return Value(s);
}

Value labelValue(const Index& index, size_t row) {
    if (index.nlevels() == 1) return Value(index.levels.front()[row]);
    std::vector<Value> parts;
    for (const auto& level : index.levels) parts.emplace_back(level[row]);
    return makeList(std::move(parts), true);
}

Value seriesToList(const Series& s) {
    std::vector<Value> items;
    items.reserve(s.size());
    for (const auto& v : s.values) items.push_back(cellValue(v, s.dtype));
    return makeList(std::move(items));
}

std::vector<size_t> presentPositions(const Series& s) {
    std::vector<size_t> out;
    for (size_t i = 0; i < s.size(); ++i) {
        if (!isMissing(s.values[i])) out.push_back(i);
    }
    return out;
}

Scalar numericBinary(const std::string& op, const Scalar& a, const Scalar& b, bool elementwise) {
    const bool ints = isIntLike(a) && isIntLike(b);
    if (op == "+" || op == "-" || op == "*") {
        if (ints) {
            const int64_t x = toInteger(a);
            const int64_t y = toInteger(b);
            int64_t r = 0;
            bool overflow = false;
            if (op == "+") overflow = __builtin_add_overflow(x, y, &r);
            else if (op == "-") overflow = __builtin_sub_overflow(x, y, &r);
            else overflow = __builtin_mul_overflow(x, y, &r);
            if (!overflow) return Scalar(r);
        }
        const double x = toDouble(a);
        const double y = toDouble(b);
        return Scalar(op == "+" ? x + y : (op == "-" ? x - y : x * y));
    }

    const double x = toDouble(a);
    const double y = toDouble(b);
    const auto zeroDivision = [&](const char* message) -> Scalar {
        if (!elementwise) raise("ZeroDivisionError", message);
        if (x == 0.0 || std::isnan(x)) return nanScalar();
        const bool negative = std::signbit(x) != std::signbit(y);
        return Scalar(negative ? -std::numeric_limits<double>::infinity() : std::numeric_limits<double>::infinity());
    };

    if (op == "/") {
        if (y == 0.0) return zeroDivision("division by zero");
        return Scalar(x / y);
    }
    if (op == "//") {
        if (ints) {
            const int64_t xi = toInteger(a);
            const int64_t yi = toInteger(b);
            if (yi == 0) return zeroDivision("integer division or modulo by zero");
            int64_t q = xi / yi;
            if ((xi % yi != 0) && ((xi < 0) != (yi < 0))) --q;
            return Scalar(q);
        }
        if (y == 0.0) return zeroDivision("float floor division by zero");
        return Scalar(std::floor(x / y));
    }
    if (op == "%") {
        if (ints) {
            const int64_t xi = toInteger(a);
            const int64_t yi = toInteger(b);
            if (yi == 0) {
                if (!elementwise) raise("ZeroDivisionError", "integer division or modulo by zero");
                return nanScalar();
            }
            int64_t r = xi % yi;
            if (r != 0 && ((r < 0) != (yi < 0))) r += yi;
            return Scalar(r);
        }
        if (y == 0.0) {
            if (!elementwise) raise("ZeroDivisionError", "float modulo");
            return nanScalar();
        }
        double r = std::fmod(x, y);
        if (r != 0.0 && ((r < 0.0) != (y < 0.0))) r += y;
        return Scalar(r);
    }
    if (op == "**") {
        if (ints && toInteger(b) >= 0) {
            int64_t base = toInteger(a);
            int64_t exp = toInteger(b);
            int64_t result = 1;
            bool overflow = false;
            while (exp > 0 && !overflow) {
                if (exp & 1) overflow = __builtin_mul_overflow(result, base, &result);
                exp >>= 1;
                if (exp > 0 && !overflow) overflow = __builtin_mul_overflow(base, base, &base);
            }
            if (!overflow) return Scalar(result);
        }
        if (x == 0.0 && y < 0.0 && !elementwise) {
            raise("ZeroDivisionError", "0.0 cannot be raised to a negative power");
        }
        return Scalar(std::pow(x, y));
    }
    unsupported(op, a, b);
}

void coerceTimestampString(Scalar& a, Scalar& b) {
    const auto convert = [](Scalar& target) {
        if (const auto* s = std::get_if<std::string>(&target)) {
            int64_t ts = 0;
            if (TypedDataset::parseDateTimeToken(*s, ts)) target = Timestamp{ts};
        }
    };
    if (std::holds_alternative<Timestamp>(a) && std::holds_alternative<std::string>(b)) convert(b);
    if (std::holds_alternative<Timestamp>(b) && std::holds_alternative<std::string>(a)) convert(a);
}

Value frameBinary(const std::string& op, const Value& a, const Value& b, bool comparison) {
    const auto apply = [&](const Scalar& x, const Scalar& y) {
        return comparison ? compareScalar(op, x, y, true) : binaryScalar(op, x, y, true);
    };
    if (a.isFrame() && b.isFrame()) {
        const Frame& fa = a.frame();
        const Frame& fb = b.frame();
        if (!fa.index.sameLabels(fb.index)) {
            raise("ValueError", "Can only operate on identically-labeled DataFrame objects");
        }
        Frame out;
        out.index = fa.index;
        std::vector<std::string> names;
        for (const auto& col : fa.columns) names.push_back(col.name);
        for (const auto& col : fb.columns) {
            if (fa.findColumn(col.name) < 0) names.push_back(col.name);
        }
        for (const auto& name : names) {
            const int ia = fa.findColumn(name);
            const int ib = fb.findColumn(name);
            std::vector<Scalar> values(out.rows());
            for (size_t r = 0; r < out.rows(); ++r) {
                const Scalar x = ia >= 0 ? fa.columns[static_cast<size_t>(ia)].values[r] : Scalar{};
                const Scalar y = ib >= 0 ? fb.columns[static_cast<size_t>(ib)].values[r] : Scalar{};
                values[r] = apply(x, y);
            }
            out.setColumn(name, std::move(values));
        }
        return Value(std::move(out));
    }
    const bool frameLeft = a.isFrame();
    const Value& other = frameLeft ? b : a;
    if (!other.isScalar()) {
        raise("TypeError", "DataFrame operations are only supported with scalars or DataFrames, not " + typeName(other));
    }
    const Frame& f = frameLeft ? a.frame() : b.frame();
    Frame out;
    out.index = f.index;
    for (const auto& col : f.columns) {
        std::vector<Scalar> values;
        values.reserve(col.values.size());
        for (const auto& v : col.values) {
            values.push_back(frameLeft ? apply(v, other.scalar()) : apply(other.scalar(), v));
        }
        out.setColumn(col.name, std::move(values));
    }
    return Value(std::move(out));
}

Series listAsSeries(const Value& list, const Series& like) {
    std::vector<Scalar> values = scalarsFromValue(list, "operand");
    if (values.size() != like.size()) {
        raise("ValueError", "Lengths must match: " + std::to_string(values.size()) + " vs " + std::to_string(like.size()));
    }
    return Series::make(std::nullopt, std::move(values), like.index);
}

bool valueEquals(const Value& a, const Value& b) {
    if (a.isScalar() && b.isScalar()) return scalarsEqual(a.scalar(), b.scalar());
    if (a.isList() && b.isList()) {
        const auto& la = a.list().items;
        const auto& lb = b.list().items;
        if (la.size() != lb.size() || a.list().isTuple != b.list().isTuple) return false;
        for (size_t i = 0; i < la.size(); ++i) {
            if (!valueEquals(la[i], lb[i])) return false;
        }
        return true;
    }
    if (a.isDict() && b.isDict()) {
        const auto& da = a.dict().items;
        if (da.size() != b.dict().items.size()) return false;
        for (const auto& item : da) {
            const Value* other = b.dict().find(item.first);
            if (!other || !valueEquals(item.second, *other)) return false;
        }
        return true;
    }
    return false;
}

std::vector<size_t> intPositions(const Value& key, size_t n) {
    std::vector<size_t> out;
    for (const auto& s : scalarsFromValue(key, "positional indexer")) {
        int64_t p = toInteger(s);
        if (p < 0) p += static_cast<int64_t>(n);
        if (p < 0 || p >= static_cast<int64_t>(n)) raise("IndexError", "positional indexers are out-of-bounds");
        out.push_back(static_cast<size_t>(p));
    }
    return out;
}

bool isBoolList(const Value& v) {
    if (!v.isList() || v.list().items.empty()) return false;
    for (const auto& item : v.list().items) {
        if (!item.isScalar() || !std::holds_alternative<bool>(item.scalar())) return false;
    }
    return true;
}

Series assignPositions(const Series& s, const std::vector<size_t>& positions, const Value& value) {
    std::vector<Scalar> values = s.values;
    if (value.isSeries()) {
        const Series& src = value.series();
        for (size_t p : positions) {
            const auto found = src.index.find(s.index.labelAt(p));
            values[p] = found.empty() ? Scalar{} : src.values[found.front()];
        }
    } else if (value.isList()) {
        const auto items = scalarsFromValue(value, "assignment");
        if (items.size() != positions.size()) {
            raise("ValueError", "cannot set using a list-like indexer with a different length than the value");
        }
        for (size_t i = 0; i < positions.size(); ++i) values[positions[i]] = items[i];
    } else {
        for (size_t p : positions) values[p] = value.scalar();
    }
    return Series::make(s.name, std::move(values), s.index);
}

Series withValues(const Series& s, std::vector<Scalar> values) {
    return Series::make(s.name, std::move(values), s.index);
}

Series headTail(const Series& s, int64_t n, bool head) {
    const int64_t size = static_cast<int64_t>(s.size());
    int64_t count = n >= 0 ? std::min(n, size) : std::max<int64_t>(0, size + n);
    std::vector<size_t> rows;
    const int64_t start = head ? 0 : size - count;
    for (int64_t i = start; i < start + count; ++i) rows.push_back(static_cast<size_t>(i));
    return s.take(rows);
}

std::vector<double> numericPresent(const Series& s) {
    std::vector<double> out;
    for (const auto& v : s.values) {
        if (isMissing(v)) continue;
        if (!isNumeric(v)) raise("TypeError", "could not convert " + scalarRepr(v) + " to numeric");
        out.push_back(toDouble(v));
    }
    return out;
}

std::unordered_set<std::string> keySet(const Value& values) {
    std::unordered_set<std::string> out;
    if (values.isDict()) {
        for (const auto& item : values.dict().items) out.insert(scalarKey(item.first));
        return out;
    }
    for (const auto& s : scalarsFromValue(values, "isin")) out.insert(scalarKey(s));
    return out;
}

const char* kDayNames[] = {"Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday", "Sunday"};
const char* kMonthNames[] = {"January", "February", "March", "April", "May", "June", "July",
                             "August", "September", "October", "November", "December"};

int64_t floorDays(int64_t seconds) {
    int64_t days = seconds / 86400;
    if (seconds % 86400 < 0) --days;
    return days;
}

int isoWeek(int64_t seconds) {
    int year = 0;
    int month = 0;
    int day = 0;
    int weekday = 0;
    civilFromUnixSeconds(seconds, year, month, day, weekday);
    const int64_t thursday = floorDays(seconds) - weekday + 3;
    int ty = 0;
    int tm = 0;
    int td = 0;
    int tw = 0;
    civilFromUnixSeconds(thursday * 86400, ty, tm, td, tw);
    const int64_t jan1 = unixSecondsFromCivil(ty, 1, 1) / 86400;
    return static_cast<int>((thursday - jan1) / 7 + 1);
}

std::string formatStrftime(int64_t seconds, const std::string& fmt) {
    int year = 0;
    int month = 0;
    int day = 0;
    int weekday = 0;
    civilFromUnixSeconds(seconds, year, month, day, weekday);
    int64_t rem = seconds % 86400;
    if (rem < 0) rem += 86400;
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = static_cast<int>(rem / 3600);
    tm.tm_min = static_cast<int>((rem % 3600) / 60);
    tm.tm_sec = static_cast<int>(rem % 60);
    tm.tm_wday = (weekday + 1) % 7;
    tm.tm_yday = static_cast<int>(floorDays(seconds) - unixSecondsFromCivil(year, 1, 1) / 86400);
    char buf[256];
    const size_t written = std::strftime(buf, sizeof(buf), fmt.c_str(), &tm);
    return std::string(buf, written);
}

const std::unordered_set<std::string>& seriesMethods() {
    static const std::unordered_set<std::string> kMethods = {
        "sum", "prod", "mean", "median", "min", "max", "std", "var", "count", "nunique", "quantile",
        "idxmax", "idxmin", "any", "all", "value_counts", "unique", "tolist", "to_list", "to_dict",
        "sort_values", "sort_index", "head", "tail", "nlargest", "nsmallest", "isin", "isna", "isnull",
        "notna", "notnull", "fillna", "astype", "between", "abs", "round", "cumsum", "diff", "pct_change",
        "shift", "reset_index", "rename", "dropna", "copy", "drop_duplicates", "corr", "clip", "replace",
        "map", "item"};
    return kMethods;
}
} // namespace

std::vector<size_t> labelSlicePositions(const Index& index, const Value& slice) {
    const auto& parts = slice.object().self.list().items;
    size_t start = 0;
    size_t stop = index.size();
    if (!parts[0].isNone()) {
        const auto found = index.find({parts[0].scalar()});
        if (found.empty()) raise("KeyError", scalarRepr(parts[0].scalar()));
        start = found.front();
    }
    if (!parts[1].isNone()) {
        const auto found = index.find({parts[1].scalar()});
        if (found.empty()) raise("KeyError", scalarRepr(parts[1].scalar()));
        stop = found.back() + 1;
    }
    std::vector<size_t> out;
    for (size_t i = start; i < stop; ++i) out.push_back(i);
    return out;
}

std::vector<size_t> listLabelPositions(const Index& index, const Value& key) {
    std::vector<size_t> out;
    for (const auto& label : scalarsFromValue(key, "label list")) {
        const auto found = index.find({label});
        if (found.empty()) raise("KeyError", "[" + scalarRepr(label) + "] not in index");
        out.insert(out.end(), found.begin(), found.end());
    }
    return out;
}

double roundHalfEven(double v, int64_t decimals) {
    if (!std::isfinite(v)) return v;
    const double scale = std::pow(10.0, static_cast<double>(decimals));
    const double r = std::nearbyint(v * scale) / scale;
    return r == 0.0 ? 0.0 : r;
}

Scalar binaryScalar(const std::string& op, const Scalar& a, const Scalar& b, bool elementwise) {
    const bool bitwise = op == "&" || op == "|" || op == "^";
    if (elementwise && (isMissing(a) || isMissing(b))) {
        if (bitwise) {
            // Missing cells act as False inside boolean masks.
            const bool x = !isMissing(a) && scalarTruthy(a);
            const bool y = !isMissing(b) && scalarTruthy(b);
            if (op == "&") return Scalar(x && y);
            if (op == "|") return Scalar(x || y);
            return Scalar(x != y);
        }
        if (op == "+" && (std::holds_alternative<std::string>(a) || std::holds_alternative<std::string>(b))) {
            return Scalar{};
        }
        return nanScalar();
    }

    if (bitwise || op == "<<" || op == ">>") {
        if (bitwise && std::holds_alternative<bool>(a) && std::holds_alternative<bool>(b)) {
            const bool x = std::get<bool>(a);
            const bool y = std::get<bool>(b);
            if (op == "&") return Scalar(x && y);
            if (op == "|") return Scalar(x || y);
            return Scalar(x != y);
        }
        if (isIntLike(a) && isIntLike(b)) {
            const int64_t x = toInteger(a);
            const int64_t y = toInteger(b);
            if (op == "&") return Scalar(static_cast<int64_t>(x & y));
            if (op == "|") return Scalar(static_cast<int64_t>(x | y));
            if (op == "^") return Scalar(static_cast<int64_t>(x ^ y));
            if (y < 0) raise("ValueError", "negative shift count");
            if (op == "<<") return Scalar(y >= 63 ? int64_t{0} : static_cast<int64_t>(static_cast<uint64_t>(x) << y));
            return Scalar(y >= 63 ? (x < 0 ? int64_t{-1} : int64_t{0}) : static_cast<int64_t>(x >> y));
        }
        unsupported(op, a, b);
    }

    if (op == "@") unsupported(op, a, b);

    if (isNumeric(a) && isNumeric(b)) return numericBinary(op, a, b, elementwise);
    if (!elementwise && (std::holds_alternative<std::monostate>(a) || std::holds_alternative<std::monostate>(b))) {
        unsupported(op, a, b);
    }

    const auto* sa = std::get_if<std::string>(&a);
    const auto* sb = std::get_if<std::string>(&b);
    if (sa && sb && op == "+") return Scalar(*sa + *sb);
    if (op == "*" && ((sa && isIntLike(b)) || (sb && isIntLike(a)))) {
        const std::string& text = sa ? *sa : *sb;
        const int64_t times = toInteger(sa ? b : a);
        std::string out;
        for (int64_t i = 0; i < times; ++i) out += text;
        return Scalar(std::move(out));
    }

    const auto* ta = std::get_if<Timestamp>(&a);
    const auto* tb = std::get_if<Timestamp>(&b);
    const auto* da = std::get_if<Timedelta>(&a);
    const auto* db = std::get_if<Timedelta>(&b);
    if (ta && tb && op == "-") return Scalar(Timedelta{ta->seconds - tb->seconds});
    if (ta && db && (op == "+" || op == "-")) {
        return Scalar(Timestamp{op == "+" ? ta->seconds + db->seconds : ta->seconds - db->seconds});
    }
    if (da && tb && op == "+") return Scalar(Timestamp{tb->seconds + da->seconds});
    if (da && db) {
        if (op == "+") return Scalar(Timedelta{da->seconds + db->seconds});
        if (op == "-") return Scalar(Timedelta{da->seconds - db->seconds});
        if (op == "/") {
            if (db->seconds == 0) return numericBinary("/", Scalar(da->seconds), Scalar(int64_t{0}), elementwise);
            return Scalar(static_cast<double>(da->seconds) / static_cast<double>(db->seconds));
        }
    }
    if (da && isNumeric(b) && (op == "*" || op == "/")) {
        const double factor = toDouble(b);
        if (op == "/" && factor == 0.0) {
            if (!elementwise) raise("ZeroDivisionError", "division by zero");
            return Scalar{};
        }
        const double secs = op == "*" ? static_cast<double>(da->seconds) * factor : static_cast<double>(da->seconds) / factor;
        return Scalar(Timedelta{static_cast<int64_t>(std::llround(secs))});
    }
    unsupported(op, a, b);
}

Scalar compareScalar(const std::string& op, const Scalar& a, const Scalar& b, bool elementwise) {
    Scalar x = a;
    Scalar y = b;
    coerceTimestampString(x, y);
    if (op == "==" || op == "!=") {
        const bool eq = (elementwise && (isMissing(x) || isMissing(y))) ? false : scalarsEqual(x, y);
        return Scalar(op == "==" ? eq : !eq);
    }
    if (isMissing(x) || isMissing(y)) {
        if (!elementwise && (std::holds_alternative<std::monostate>(x) || std::holds_alternative<std::monostate>(y))) {
            raise("TypeError", "'" + op + "' not supported between instances of '" + scalarType(x) +
                               "' and '" + scalarType(y) + "'");
        }
        return Scalar(false);
    }
    const int c = compareScalars(x, y);
    if (op == "<") return Scalar(c < 0);
    if (op == "<=") return Scalar(c <= 0);
    if (op == ">") return Scalar(c > 0);
    if (op == ">=") return Scalar(c >= 0);
    raise("ValueError", "unknown comparison operator " + op);
}

Series combine(const Series& a, const Series& b, const std::function<Scalar(const Scalar&, const Scalar&)>& fn) {
    const std::optional<std::string> name = a.name == b.name ? a.name : std::nullopt;
    if (a.index.sameLabels(b.index)) {
        std::vector<Scalar> values;
        values.reserve(a.size());
        for (size_t i = 0; i < a.size(); ++i) values.push_back(fn(a.values[i], b.values[i]));
        return Series::make(name, std::move(values), a.index);
    }
    if (a.index.nlevels() != b.index.nlevels()) {
        raise("ValueError", "cannot align series with different index levels");
    }

    std::unordered_map<std::string, size_t> aPos;
    std::unordered_map<std::string, size_t> bPos;
    for (size_t r = 0; r < a.size(); ++r) aPos.emplace(a.index.keyAt(r), r);
    for (size_t r = 0; r < b.size(); ++r) bPos.emplace(b.index.keyAt(r), r);

    Index index;
    index.names = a.index.names;
    index.levels.resize(a.index.nlevels());
    std::vector<Scalar> values;
    const auto pushLabel = [&](const Index& from, size_t row) {
        for (size_t k = 0; k < from.nlevels(); ++k) index.levels[k].push_back(from.levels[k][row]);
    };

    for (size_t r = 0; r < a.size(); ++r) {
        const auto it = bPos.find(a.index.keyAt(r));
        values.push_back(fn(a.values[r], it != bPos.end() ? b.values[it->second] : Scalar{}));
        pushLabel(a.index, r);
    }
    std::unordered_set<std::string> added;
    for (size_t r = 0; r < b.size(); ++r) {
        const std::string key = b.index.keyAt(r);
        if (aPos.count(key) || !added.insert(key).second) continue;
        values.push_back(fn(Scalar{}, b.values[r]));
        pushLabel(b.index, r);
    }
    return Series::make(name, std::move(values), std::move(index));
}

Series mapValues(const Series& s, const std::function<Scalar(const Scalar&)>& fn) {
    std::vector<Scalar> values;
    values.reserve(s.size());
    for (const auto& v : s.values) values.push_back(fn(v));
    return Series::make(s.name, std::move(values), s.index);
}

Value binary(const std::string& op, const Value& a, const Value& b) {
    if (a.isFrame() || b.isFrame()) return frameBinary(op, a, b, false);
    const auto cell = [&](const Scalar& x, const Scalar& y) { return binaryScalar(op, x, y, true); };
    if (a.isSeries() && b.isSeries()) return Value(combine(a.series(), b.series(), cell));
    if (a.isSeries()) {
        if (b.isList()) return Value(combine(a.series(), listAsSeries(b, a.series()), cell));
        const Scalar& y = b.scalar();
        return Value(mapValues(a.series(), [&](const Scalar& x) { return cell(x, y); }));
    }
    if (b.isSeries()) {
        if (a.isList()) return Value(combine(listAsSeries(a, b.series()), b.series(), cell));
        const Scalar& x = a.scalar();
        return Value(mapValues(b.series(), [&](const Scalar& y) { return cell(x, y); }));
    }
    if (a.isList() || b.isList()) {
        if (a.isList() && b.isList() && op == "+") {
            std::vector<Value> items = a.list().items;
            items.insert(items.end(), b.list().items.begin(), b.list().items.end());
            return makeList(std::move(items), a.list().isTuple);
        }
        if (op == "*" && (a.isList() != b.isList())) {
            const Value& list = a.isList() ? a : b;
            const int64_t times = toInteger((a.isList() ? b : a).scalar());
            std::vector<Value> items;
            for (int64_t i = 0; i < times; ++i) {
                items.insert(items.end(), list.list().items.begin(), list.list().items.end());
            }
            return makeList(std::move(items), list.list().isTuple);
        }
        raise("TypeError", "unsupported operand type(s) for " + op + ": '" + typeName(a) + "' and '" + typeName(b) + "'");
    }
    if (a.isScalar() && b.isScalar()) return Value(binaryScalar(op, a.scalar(), b.scalar(), false));
    raise("TypeError", "unsupported operand type(s) for " + op + ": '" + typeName(a) + "' and '" + typeName(b) + "'");
}

Value compare(const std::string& op, const Value& a, const Value& b) {
    if (a.isFrame() || b.isFrame()) return frameBinary(op, a, b, true);
    const auto cell = [&](const Scalar& x, const Scalar& y) { return compareScalar(op, x, y, true); };
    if (a.isSeries() && b.isSeries()) {
        if (!a.series().index.sameLabels(b.series().index)) {
            raise("ValueError", "Can only compare identically-labeled Series objects");
        }
        return Value(combine(a.series(), b.series(), cell));
    }
    if (a.isSeries()) {
        if (b.isList()) return Value(combine(a.series(), listAsSeries(b, a.series()), cell));
        const Scalar& y = b.scalar();
        return Value(mapValues(a.series(), [&](const Scalar& x) { return cell(x, y); }));
    }
    if (b.isSeries()) {
        if (a.isList()) return Value(combine(listAsSeries(a, b.series()), b.series(), cell));
        const Scalar& x = a.scalar();
        return Value(mapValues(b.series(), [&](const Scalar& y) { return cell(x, y); }));
    }
    if (a.isScalar() && b.isScalar()) return Value(compareScalar(op, a.scalar(), b.scalar(), false));
    if (op == "==") return Value::boolean(valueEquals(a, b));
    if (op == "!=") return Value::boolean(!valueEquals(a, b));
    raise("TypeError", "'" + op + "' not supported between instances of '" + typeName(a) + "' and '" + typeName(b) + "'");
}

Value unary(const std::string& op, const Value& v) {
    const auto cell = [&](const Scalar& s, bool elementwise) -> Scalar {
        if (elementwise && isMissing(s)) return nanScalar();
        if (op == "~") {
            if (const auto* b = std::get_if<bool>(&s)) return Scalar(!*b);
            if (const auto* i = std::get_if<int64_t>(&s)) return Scalar(static_cast<int64_t>(~*i));
        } else if (isNumeric(s)) {
            if (const auto* d = std::get_if<double>(&s)) return Scalar(op == "-" ? -*d : *d);
            const int64_t i = toInteger(s);
            return Scalar(op == "-" ? -i : i);
        } else if (const auto* td = std::get_if<Timedelta>(&s)) {
            return Scalar(Timedelta{op == "-" ? -td->seconds : td->seconds});
        }
        raise("TypeError", "bad operand type for unary " + op + ": '" + scalarType(s) + "'");
    };
    if (v.isSeries()) {
        return Value(mapValues(v.series(), [&](const Scalar& s) { return cell(s, true); }));
    }
    if (v.isFrame()) {
        Frame out;
        out.index = v.frame().index;
        for (const auto& col : v.frame().columns) {
            std::vector<Scalar> values;
            for (const auto& s : col.values) values.push_back(cell(s, true));
            out.setColumn(col.name, std::move(values));
        }
        return Value(std::move(out));
    }
    return Value(cell(v.scalar(), false));
}

bool isAggregation(const std::string& func) {
    static const std::unordered_set<std::string> kAggs = {
        "sum", "prod", "mean", "median", "min", "max", "std", "var", "count", "size", "nunique",
        "first", "last", "any", "all"};
    return kAggs.count(func) > 0;
}

Scalar aggregate(const std::string& func, const std::vector<Scalar>& values, DType dtype, int64_t ddof) {
    if (func == "size") return Scalar(static_cast<int64_t>(values.size()));

    std::vector<Scalar> present;
    present.reserve(values.size());
    for (const auto& v : values) {
        if (!isMissing(v)) present.push_back(v);
    }

    if (func == "count") return Scalar(static_cast<int64_t>(present.size()));
    if (func == "nunique") {
        std::unordered_set<std::string> keys;
        for (const auto& v : present) keys.insert(scalarKey(v));
        return Scalar(static_cast<int64_t>(keys.size()));
    }
    if (func == "first") return present.empty() ? nanScalar() : present.front();
    if (func == "last") return present.empty() ? nanScalar() : present.back();
    if (func == "any" || func == "all") {
        const bool wantAny = func == "any";
        for (const auto& v : present) {
            if (scalarTruthy(v) == wantAny) return Scalar(wantAny);
        }
        return Scalar(!wantAny);
    }
    if (func == "min" || func == "max") {
        if (present.empty()) return nanScalar();
        Scalar best = present.front();
        for (size_t i = 1; i < present.size(); ++i) {
            const int c = compareScalars(present[i], best);
            if ((func == "min" && c < 0) || (func == "max" && c > 0)) best = present[i];
        }
        return best;
    }
    if (func == "sum" || func == "prod") {
        const bool isSum = func == "sum";
        bool allStrings = !present.empty();
        bool allInts = dtype != DType::Float;
        bool allDeltas = !present.empty();
        for (const auto& v : present) {
            if (!std::holds_alternative<std::string>(v)) allStrings = false;
            if (!std::holds_alternative<Timedelta>(v)) allDeltas = false;
            if (!isIntLike(v)) allInts = false;
        }
        if (allStrings && isSum) {
            std::string out;
            for (const auto& v : present) out += std::get<std::string>(v);
            return Scalar(std::move(out));
        }
        if (allDeltas && isSum) {
            int64_t total = 0;
            for (const auto& v : present) total += std::get<Timedelta>(v).seconds;
            return Scalar(Timedelta{total});
        }
        for (const auto& v : present) {
            if (!isNumeric(v)) {
                raise("TypeError", std::string("unsupported operand type(s) for ") + (isSum ? "+" : "*") +
                                   ": 'int' and '" + scalarType(v) + "'");
            }
        }
        if (allInts) {
            int64_t acc = isSum ? 0 : 1;
            bool overflow = false;
            for (const auto& v : present) {
                overflow = isSum ? __builtin_add_overflow(acc, toInteger(v), &acc)
                                 : __builtin_mul_overflow(acc, toInteger(v), &acc);
                if (overflow) break;
            }
            if (!overflow) return Scalar(acc);
        }
        double acc = isSum ? 0.0 : 1.0;
        for (const auto& v : present) acc = isSum ? acc + toDouble(v) : acc * toDouble(v);
        return Scalar(acc);
    }

    if (func == "mean" || func == "median" || func == "std" || func == "var") {
        std::vector<double> xs;
        xs.reserve(present.size());
        for (const auto& v : present) {
            if (!isNumeric(v)) raise("TypeError", "could not convert " + scalarRepr(v) + " to numeric");
            xs.push_back(toDouble(v));
        }
        if (xs.empty()) return nanScalar();
        if (func == "mean") return Scalar(StatsUtils::runningMean(xs));
        if (func == "median") return Scalar(CommonUtils::medianByNth(xs));
        const int64_t n = static_cast<int64_t>(xs.size());
        if (n - ddof <= 0) return nanScalar();
        const double mean = StatsUtils::runningMean(xs);
        double sq = 0.0;
        for (double x : xs) sq += (x - mean) * (x - mean);
        const double var = sq / static_cast<double>(n - ddof);
        return Scalar(func == "var" ? var : std::sqrt(var));
    }
    raise("ValueError", "unknown aggregation '" + func + "'");
}

bool isBooleanMask(const Value& v) {
    if (v.isSeries()) {
        const Series& s = v.series();
        if (s.dtype == DType::Bool) return true;
        if (s.dtype != DType::Object || s.size() == 0) return false;
        for (const auto& x : s.values) {
            if (!std::holds_alternative<bool>(x) && !isMissing(x)) return false;
        }
        return true;
    }
    return isBoolList(v);
}

std::vector<size_t> maskPositions(const Value& mask, const Index& target) {
    std::vector<size_t> out;
    if (mask.isList()) {
        const auto& items = mask.list().items;
        if (items.size() != target.size()) {
            raise("IndexError", "Boolean index has wrong length: " + std::to_string(items.size()) +
                                " instead of " + std::to_string(target.size()));
        }
        for (size_t i = 0; i < items.size(); ++i) {
            if (truthy(items[i])) out.push_back(i);
        }
        return out;
    }
    const Series& m = mask.series();
    const auto selected = [](const Scalar& s) { return !isMissing(s) && scalarTruthy(s); };
    if (m.index.sameLabels(target)) {
        for (size_t i = 0; i < m.size(); ++i) {
            if (selected(m.values[i])) out.push_back(i);
        }
        return out;
    }
    std::unordered_map<std::string, size_t> pos;
    for (size_t r = 0; r < m.size(); ++r) pos.emplace(m.index.keyAt(r), r);
    for (size_t r = 0; r < target.size(); ++r) {
        const auto it = pos.find(target.keyAt(r));
        if (it == pos.end()) raise("ValueError", "Unalignable boolean Series provided as indexer");
        if (selected(m.values[it->second])) out.push_back(r);
    }
    return out;
}

std::vector<size_t> labelPositions(const Index& index, const Value& key) {
    std::vector<Scalar> label;
    if (key.isList() && key.list().isTuple && index.nlevels() > 1) {
        label = scalarsFromValue(key, "label");
    } else {
        label.push_back(key.scalar());
    }
    auto found = index.find(label);
    if (found.empty()) raise("KeyError", key.isScalar() ? scalarRepr(key.scalar()) : valueRepr(key));
    return found;
}

std::vector<Scalar> broadcast(const Value& value, const Index& index, const std::string& context) {
    const size_t n = index.size();
    if (value.isScalar()) return std::vector<Scalar>(n, value.scalar());
    if (value.isSeries()) {
        const Series& s = value.series();
        if (s.index.sameLabels(index)) return s.values;
        std::unordered_map<std::string, size_t> pos;
        for (size_t r = 0; r < s.size(); ++r) pos.emplace(s.index.keyAt(r), r);
        std::vector<Scalar> out(n);
        for (size_t r = 0; r < n; ++r) {
            const auto it = pos.find(index.keyAt(r));
            if (it != pos.end()) out[r] = s.values[it->second];
        }
        return out;
    }
    if (value.isList()) {
        auto items = scalarsFromValue(value, context);
        if (items.size() != n) {
            raise("ValueError", "Length of values (" + std::to_string(items.size()) +
                                ") does not match length of index (" + std::to_string(n) + ")");
        }
        return items;
    }
    raise("TypeError", context + ": cannot assign " + typeName(value));
}

std::vector<Scalar> toNumericValues(const std::vector<Scalar>& values, const std::string& errors) {
    std::vector<Scalar> out;
    out.reserve(values.size());
    for (const auto& v : values) {
        if (isMissing(v)) {
            out.push_back(nanScalar());
            continue;
        }
        if (isNumeric(v)) {
            out.push_back(std::holds_alternative<bool>(v) ? Scalar(toInteger(v)) : v);
            continue;
        }
        if (const auto* s = std::get_if<std::string>(&v)) {
            const std::string t = CommonUtils::trim(*s);
            const char* b = t.data();
            const char* e = b + t.size();
            int64_t iv = 0;
            auto [ip, iec] = std::from_chars(b, e, iv);
            if (!t.empty() && iec == std::errc{} && ip == e) {
                out.push_back(Scalar(iv));
                continue;
            }
            double dv = 0.0;
            const char* start = (!t.empty() && t.front() == '+') ? b + 1 : b;
            auto [dp, dec] = std::from_chars(start, e, dv);
            if (!t.empty() && dec == std::errc{} && dp == e) {
                out.push_back(Scalar(dv));
                continue;
            }
            const std::string lower = CommonUtils::toLower(t);
            if (lower == "nan" || lower.empty()) {
                out.push_back(nanScalar());
                continue;
            }
        }
        if (errors == "coerce") {
            out.push_back(nanScalar());
        } else if (errors == "ignore") {
            return values;
        } else {
            raise("ValueError", "Unable to parse string " + scalarRepr(v));
        }
    }
    return out;
}

std::vector<Scalar> toDatetimeValues(const std::vector<Scalar>& values, const std::string& errors) {
    std::vector<Scalar> out;
    out.reserve(values.size());
    for (const auto& v : values) {
        if (isMissing(v)) {
            out.emplace_back();
            continue;
        }
        if (std::holds_alternative<Timestamp>(v)) {
            out.push_back(v);
            continue;
        }
        if (const auto* s = std::get_if<std::string>(&v)) {
            int64_t ts = 0;
            if (TypedDataset::parseDateTimeToken(*s, ts)) {
                out.push_back(Scalar(Timestamp{ts}));
                continue;
            }
        }
        if (errors == "coerce") {
            out.emplace_back();
        } else if (errors == "ignore") {
            return values;
        } else {
            raise("ValueError", "Unknown datetime string format, unable to parse: " + scalarStr(v));
        }
    }
    return out;
}

Series astype(const Series& s, const Value& type) {
    std::string target;
    if (type.isObject() && type.object().kind == Object::Kind::Builtin) {
        target = type.object().name;
    } else if (type.isScalar() && std::holds_alternative<std::string>(type.scalar())) {
        target = std::get<std::string>(type.scalar());
    } else {
        raise("TypeError", "data type not understood: " + valueRepr(type));
    }

    if (target == "float" || target == "float64" || target == "float32") {
        return mapValues(s, [](const Scalar& v) -> Scalar {
            if (isMissing(v)) return nanScalar();
            if (isNumeric(v)) return Scalar(toDouble(v));
            if (const auto* str = std::get_if<std::string>(&v)) {
                const std::string t = CommonUtils::trim(*str);
                double d = 0.0;
                auto [p, ec] = std::from_chars(t.data(), t.data() + t.size(), d);
                if (!t.empty() && ec == std::errc{} && p == t.data() + t.size()) return Scalar(d);
                raise("ValueError", "could not convert string to float: " + scalarRepr(v));
            }
            raise("TypeError", "cannot convert " + scalarRepr(v) + " to float");
        });
    }
    if (target == "int" || target == "int64" || target == "int32") {
        return mapValues(s, [](const Scalar& v) -> Scalar {
            if (isMissing(v)) raise("ValueError", "Cannot convert non-finite values (NA or inf) to integer");
            if (isNumeric(v)) return Scalar(toInteger(v));
            if (const auto* str = std::get_if<std::string>(&v)) {
                const std::string t = CommonUtils::trim(*str);
                int64_t i = 0;
                auto [p, ec] = std::from_chars(t.data(), t.data() + t.size(), i);
                if (!t.empty() && ec == std::errc{} && p == t.data() + t.size()) return Scalar(i);
                raise("ValueError", "invalid literal for int() with base 10: " + scalarRepr(v));
            }
            raise("TypeError", "cannot convert " + scalarRepr(v) + " to int");
        });
    }
    if (target == "str" || target == "string") {
        const DType dtype = s.dtype;
        return mapValues(s, [dtype](const Scalar& v) -> Scalar {
            if (std::holds_alternative<std::monostate>(v) && dtype == DType::Float) return Scalar(std::string("nan"));
            return Scalar(scalarStr(v));
        });
    }
    if (target == "bool") {
        return mapValues(s, [](const Scalar& v) -> Scalar { return Scalar(scalarTruthy(v)); });
    }
    if (target == "category" || target == "object") return s;
    if (target.rfind("datetime64", 0) == 0) return withValues(s, toDatetimeValues(s.values, "raise"));
    raise("TypeError", "data type '" + target + "' not understood");
}

bool hasMethod(const std::string& name) {
    return seriesMethods().count(name) > 0;
}

Value getAttribute(const Value& self, const std::string& name) {
    const Series& s = self.series();
    if (name == "size") return Value::integer(static_cast<int64_t>(s.size()));
    if (name == "name") return s.name ? Value::string(*s.name) : Value::none();
    if (name == "values") return seriesToList(s);
    if (name == "index") {
        std::vector<Value> labels;
        for (size_t r = 0; r < s.size(); ++r) labels.push_back(labelValue(s.index, r));
        return makeList(std::move(labels));
    }
    if (name == "empty") return Value::boolean(s.size() == 0);
    if (name == "shape") return makeList({Value::integer(static_cast<int64_t>(s.size()))}, true);
    if (name == "dtype") return Value::string(dtypeName(s.dtype));
    if (name == "str" || name == "dt" || name == "iloc" || name == "loc") {
        Object o;
        o.self = self;
        o.name = name;
        if (name == "str") {
            if (s.dtype != DType::String && s.dtype != DType::Object) {
                raise("AttributeError", "Can only use .str accessor with string values!");
            }
            o.kind = Object::Kind::StrAccessor;
        } else if (name == "dt") {
            if (s.dtype != DType::Datetime && s.dtype != DType::Timedelta) {
                raise("AttributeError", "Can only use .dt accessor with datetimelike values");
            }
            o.kind = Object::Kind::DtAccessor;
        } else {
            o.kind = name == "iloc" ? Object::Kind::ILocIndexer : Object::Kind::LocIndexer;
        }
        return Value(std::move(o));
    }
    if (hasMethod(name)) {
        Object o;
        o.kind = Object::Kind::Method;
        o.name = name;
        o.self = self;
        return Value(std::move(o));
    }
    raise("AttributeError", "'Series' object has no attribute '" + name + "'");
}

Value callMethod(const Value& self, const std::string& name, const CallArgs& args) {
    const Series& s = self.series();

    if (name == "std" || name == "var") {
        return cellValue(aggregate(name, s.values, s.dtype, intArg(args, kNoPos, "ddof", 1)), DType::Float);
    }
    if (isAggregation(name)) {
        return cellValue(aggregate(name, s.values, s.dtype), DType::Float);
    }
    if (name == "quantile") {
        const Value* q = args.get(0, "q");
        std::vector<double> sorted = numericPresent(s);
        std::sort(sorted.begin(), sorted.end());
        const auto at = [&](double qq) {
            if (qq < 0.0 || qq > 1.0) raise("ValueError", "percentiles should all be in the interval [0, 1]");
            return sorted.empty() ? std::numeric_limits<double>::quiet_NaN() : StatsUtils::percentileSorted(sorted, qq);
        };
        if (q && (q->isList() || q->isSeries())) {
            std::vector<Scalar> labels = scalarsFromValue(*q, "quantile");
            std::vector<Scalar> values;
            for (const auto& l : labels) values.push_back(Scalar(at(toDouble(l))));
            return Value(Series::make(s.name, std::move(values), Index::single("", std::move(labels))));
        }
        return Value::number(at(q ? toDouble(q->scalar()) : 0.5));
    }
    if (name == "idxmax" || name == "idxmin") {
        size_t best = kNoPos;
        for (size_t i = 0; i < s.size(); ++i) {
            if (isMissing(s.values[i])) continue;
            if (best == kNoPos) {
                best = i;
                continue;
            }
            const int c = compareScalars(s.values[i], s.values[best]);
            if ((name == "idxmax" && c > 0) || (name == "idxmin" && c < 0)) best = i;
        }
        if (best == kNoPos) raise("ValueError", "attempt to get " + name.substr(3) + " of an empty sequence");
        return labelValue(s.index, best);
    }
    if (name == "item") {
        if (s.size() != 1) raise("ValueError", "can only convert an array of size 1 to a Python scalar");
        return cellValue(s.values.front(), s.dtype);
    }
    if (name == "value_counts") {
        const bool normalize = boolArg(args, 0, "normalize", false);
        const bool sortCounts = boolArg(args, 1, "sort", true);
        const bool ascending = boolArg(args, 2, "ascending", false);
        const bool dropna = boolArg(args, 4, "dropna", true);
        std::vector<Scalar> labels;
        std::vector<int64_t> counts;
        std::unordered_map<std::string, size_t> pos;
        for (const auto& v : s.values) {
            if (isMissing(v) && dropna) continue;
            const std::string key = scalarKey(v);
            const auto it = pos.find(key);
            if (it == pos.end()) {
                pos.emplace(key, labels.size());
                labels.push_back(isMissing(v) ? nanScalar() : v);
                counts.push_back(1);
            } else {
                ++counts[it->second];
            }
        }
        std::vector<size_t> order(labels.size());
        std::iota(order.begin(), order.end(), 0);
        if (sortCounts) {
            std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
                return ascending ? counts[a] < counts[b] : counts[a] > counts[b];
            });
        }
        const int64_t total = std::accumulate(counts.begin(), counts.end(), int64_t{0});
        std::vector<Scalar> outLabels;
        std::vector<Scalar> outValues;
        for (size_t i : order) {
            outLabels.push_back(labels[i]);
            if (normalize) {
                outValues.push_back(Scalar(total > 0 ? static_cast<double>(counts[i]) / static_cast<double>(total) : 0.0));
            } else {
                outValues.push_back(Scalar(counts[i]));
            }
        }
        return Value(Series::make(std::string(normalize ? "proportion" : "count"), std::move(outValues),
                                  Index::single(s.name.value_or(""), std::move(outLabels))));
    }
    if (name == "unique") {
        std::vector<Value> items;
        std::unordered_set<std::string> seen;
        for (const auto& v : s.values) {
            if (seen.insert(scalarKey(v)).second) items.push_back(cellValue(v, s.dtype));
        }
        return makeList(std::move(items));
    }
    if (name == "tolist" || name == "to_list") return seriesToList(s);
    if (name == "to_dict") {
        DictValue d;
        for (size_t r = 0; r < s.size(); ++r) {
            const Scalar key = s.index.nlevels() == 1 ? s.index.levels.front()[r] : Scalar(s.index.displayAt(r));
            d.set(key, cellValue(s.values[r], s.dtype));
        }
        return Value(std::move(d));
    }
    if (name == "sort_values" || name == "sort_index") {
        const bool ascending = boolArg(args, name == "sort_values" ? 1 : 2, "ascending", true);
        const bool naFirst = stringArg(args, kNoPos, "na_position", "last") == "first";
        std::vector<const std::vector<Scalar>*> keys;
        if (name == "sort_values") {
            keys.push_back(&s.values);
        } else {
            for (const auto& level : s.index.levels) keys.push_back(&level);
        }
        return Value(s.take(sortOrder(keys, std::vector<bool>(keys.size(), ascending), naFirst)));
    }
    if (name == "head" || name == "tail") {
        return Value(headTail(s, intArg(args, 0, "n", 5), name == "head"));
    }
    if (name == "nlargest" || name == "nsmallest") {
        const int64_t n = intArg(args, 0, "n", 5);
        std::vector<size_t> order = presentPositions(s);
        const bool largest = name == "nlargest";
        std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
            const int c = compareScalars(s.values[a], s.values[b]);
            return largest ? c > 0 : c < 0;
        });
        if (n >= 0 && static_cast<size_t>(n) < order.size()) order.resize(static_cast<size_t>(n));
        return Value(s.take(order));
    }
    if (name == "isin") {
        const Value* values = args.get(0, "values");
        if (!values) raise("TypeError", "isin() missing required argument 'values'");
        const auto keys = keySet(*values);
        return Value(mapValues(s, [&](const Scalar& v) -> Scalar { return Scalar(keys.count(scalarKey(v)) > 0); }));
    }
    if (name == "isna" || name == "isnull" || name == "notna" || name == "notnull") {
        const bool wantMissing = name == "isna" || name == "isnull";
        return Value(mapValues(s, [&](const Scalar& v) -> Scalar { return Scalar(isMissing(v) == wantMissing); }));
    }
    if (name == "fillna") {
        const Value* value = args.get(0, "value");
        const std::string method = stringArg(args, kNoPos, "method", "");
        std::vector<Scalar> values = s.values;
        if (method == "ffill" || method == "pad") {
            for (size_t i = 1; i < values.size(); ++i) {
                if (isMissing(values[i])) values[i] = values[i - 1];
            }
        } else if (method == "bfill" || method == "backfill") {
            for (size_t i = values.size(); i-- > 1;) {
                if (isMissing(values[i - 1])) values[i - 1] = values[i];
            }
        } else {
            if (!value) raise("ValueError", "Must specify a fill 'value' or 'method'.");
            const std::vector<Scalar> fill = broadcast(*value, s.index, "fillna");
            for (size_t i = 0; i < values.size(); ++i) {
                if (isMissing(values[i])) values[i] = fill[i];
            }
        }
        return Value(withValues(s, std::move(values)));
    }
    if (name == "astype") {
        const Value* type = args.get(0, "dtype");
        if (!type) raise("TypeError", "astype() missing required argument 'dtype'");
        return Value(astype(s, *type));
    }
    if (name == "between") {
        const Value* left = args.get(0, "left");
        const Value* right = args.get(1, "right");
        if (!left || !right) raise("TypeError", "between() missing required arguments 'left' and 'right'");
        const std::string inclusive = stringArg(args, 2, "inclusive", "both");
        const std::string lo = (inclusive == "both" || inclusive == "left") ? ">=" : ">";
        const std::string hi = (inclusive == "both" || inclusive == "right") ? "<=" : "<";
        return Value(mapValues(s, [&](const Scalar& v) -> Scalar {
            const bool a = scalarTruthy(compareScalar(lo, v, left->scalar(), true));
            const bool b = scalarTruthy(compareScalar(hi, v, right->scalar(), true));
            return Scalar(a && b);
        }));
    }
    if (name == "abs") {
        return Value(mapValues(s, [](const Scalar& v) -> Scalar {
            if (isMissing(v)) return nanScalar();
            if (const auto* d = std::get_if<double>(&v)) return Scalar(std::abs(*d));
            if (const auto* td = std::get_if<Timedelta>(&v)) return Scalar(Timedelta{td->seconds < 0 ? -td->seconds : td->seconds});
            if (!isNumeric(v)) raise("TypeError", "bad operand type for abs(): '" + scalarType(v) + "'");
            const int64_t i = toInteger(v);
            return Scalar(i < 0 ? -i : i);
        }));
    }
    if (name == "round") {
        const int64_t decimals = intArg(args, 0, "decimals", 0);
        return Value(mapValues(s, [&](const Scalar& v) -> Scalar {
            if (const auto* d = std::get_if<double>(&v)) return Scalar(roundHalfEven(*d, decimals));
            return v;
        }));
    }
    if (name == "clip") {
        const Value* lower = args.get(0, "lower");
        const Value* upper = args.get(1, "upper");
        return Value(mapValues(s, [&](const Scalar& v) -> Scalar {
            if (isMissing(v)) return v;
            Scalar out = v;
            if (lower && !lower->isNone() && compareScalars(out, lower->scalar()) < 0) out = lower->scalar();
            if (upper && !upper->isNone() && compareScalars(out, upper->scalar()) > 0) out = upper->scalar();
            return out;
        }));
    }
    if (name == "cumsum") {
        std::vector<Scalar> values;
        Scalar acc = Scalar(int64_t{0});
        for (const auto& v : s.values) {
            if (isMissing(v)) {
                values.push_back(nanScalar());
                continue;
            }
            acc = binaryScalar("+", acc, v, true);
            values.push_back(acc);
        }
        return Value(withValues(s, std::move(values)));
    }
    if (name == "diff" || name == "pct_change" || name == "shift") {
        const int64_t periods = intArg(args, 0, "periods", 1);
        const Value* fillValue = args.get(kNoPos, "fill_value");
        const int64_t n = static_cast<int64_t>(s.size());
        std::vector<Scalar> values;
        values.reserve(s.size());
        for (int64_t i = 0; i < n; ++i) {
            const int64_t j = i - periods;
            if (j < 0 || j >= n) {
                values.push_back(name == "shift" && fillValue ? fillValue->scalar() : nanScalar());
                continue;
            }
            const Scalar& cur = s.values[static_cast<size_t>(i)];
            const Scalar& prev = s.values[static_cast<size_t>(j)];
            if (name == "shift") {
                values.push_back(prev);
            } else if (name == "diff") {
                values.push_back(binaryScalar("-", cur, prev, true));
            } else {
                const Scalar ratio = binaryScalar("/", cur, prev, true);
                values.push_back(binaryScalar("-", ratio, Scalar(int64_t{1}), true));
            }
        }
        return Value(withValues(s, std::move(values)));
    }
    if (name == "reset_index") {
        const bool drop = boolArg(args, 1, "drop", false);
        if (drop) return Value(Series::make(s.name, s.values));
        Frame out;
        out.index = Index::range(s.size());
        for (size_t k = 0; k < s.index.nlevels(); ++k) {
            std::string levelName = s.index.names[k];
            if (levelName.empty()) levelName = s.index.nlevels() == 1 ? "index" : "level_" + std::to_string(k);
            out.setColumn(levelName, s.index.levels[k]);
        }
        const std::string valueName = stringArg(args, kNoPos, "name", s.name.value_or("0"));
        out.setColumn(valueName, s.values);
        return Value(std::move(out));
    }
    if (name == "rename") {
        const Value* arg = args.get(0, "index");
        if (!arg) return self;
        if (arg->isDict()) {
            Series out = s;
            for (auto& level : out.index.levels) {
                for (auto& label : level) {
                    if (const Value* repl = arg->dict().find(label)) label = repl->scalar();
                }
            }
            return Value(std::move(out));
        }
        Series out = s;
        if (arg->isNone()) {
            out.name.reset();
        } else {
            out.name = scalarStr(arg->scalar());
        }
        return Value(std::move(out));
    }
    if (name == "dropna") return Value(s.take(presentPositions(s)));
    if (name == "copy") return self;
    if (name == "drop_duplicates") {
        const std::string keep = stringArg(args, 0, "keep", "first");
        std::unordered_map<std::string, size_t> counts;
        for (const auto& v : s.values) ++counts[scalarKey(v)];
        std::unordered_map<std::string, size_t> seen;
        std::vector<size_t> rows;
        for (size_t i = 0; i < s.size(); ++i) {
            const std::string key = scalarKey(s.values[i]);
            const size_t occurrence = ++seen[key];
            if (keep == "last" ? occurrence == counts[key] : occurrence == 1) rows.push_back(i);
        }
        return Value(s.take(rows));
    }
    if (name == "corr") {
        const Value* other = args.get(0, "other");
        if (!other || !other->isSeries()) raise("TypeError", "corr() requires another Series");
        const Series& o = other->series();
        std::vector<double> xs;
        std::vector<double> ys;
        std::vector<uint8_t> xm;
        std::vector<uint8_t> ym;
        combine(s, o, [&](const Scalar& a, const Scalar& b) -> Scalar {
            const bool usable = !isMissing(a) && !isMissing(b) && isNumeric(a) && isNumeric(b);
            xs.push_back(usable ? toDouble(a) : 0.0);
            ys.push_back(usable ? toDouble(b) : 0.0);
            xm.push_back(usable ? 0 : 1);
            ym.push_back(usable ? 0 : 1);
            return Scalar{};
        });
        const auto r = StatsUtils::pearsonPairwise(xs, xm, ys, ym);
        return Value::number(r.value_or(std::numeric_limits<double>::quiet_NaN()));
    }
    if (name == "replace" || name == "map") {
        const Value* from = args.get(0, name == "map" ? "arg" : "to_replace");
        if (!from) raise("TypeError", name + "() missing required argument");
        if (from->isDict()) {
            const DictValue& mapping = from->dict();
            return Value(mapValues(s, [&](const Scalar& v) -> Scalar {
                if (const Value* repl = mapping.find(v)) return repl->scalar();
                return name == "map" ? Scalar{} : v;
            }));
        }
        if (name == "map") raise("TypeError", "map() only accepts a dict mapping");
        const Value* to = args.get(1, "value");
        if (!to) raise("TypeError", "replace() missing required argument 'value'");
        const auto keys = keySet(*from);
        return Value(mapValues(s, [&](const Scalar& v) -> Scalar {
            return keys.count(scalarKey(v)) ? to->scalar() : v;
        }));
    }
    raise("AttributeError", "'Series' object has no attribute '" + name + "'");
}

std::vector<size_t> sortOrder(const std::vector<const std::vector<Scalar>*>& keys,
                              const std::vector<bool>& ascending,
                              bool naFirst) {
    const size_t n = keys.empty() ? 0 : keys.front()->size();
    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](size_t i, size_t j) {
        for (size_t k = 0; k < keys.size(); ++k) {
            const Scalar& a = (*keys[k])[i];
            const Scalar& b = (*keys[k])[j];
            const bool ma = isMissing(a);
            const bool mb = isMissing(b);
            if (ma || mb) {
                if (ma && mb) continue;
                return naFirst ? ma : mb;
            }
            const int c = compareScalars(a, b);
            if (c != 0) return ascending[k] ? c < 0 : c > 0;
        }
        return false;
    });
    return order;
}

Value getItem(const Series& s, const Value& key) {
    if (isSlice(key)) return Value(s.take(slicePositions(key, s.size())));
    if (isBooleanMask(key)) return Value(s.take(maskPositions(key, s.index)));
    if ((key.isList() && !key.list().isTuple) || key.isSeries()) {
        return Value(s.take(listLabelPositions(s.index, key)));
    }
    std::vector<size_t> found;
    if (key.isScalar() || (key.isList() && s.index.nlevels() > 1)) {
        std::vector<Scalar> label = key.isScalar() ? std::vector<Scalar>{key.scalar()} : scalarsFromValue(key, "label");
        found = s.index.find(label);
    }
    if (found.empty() && key.isScalar() && std::holds_alternative<int64_t>(key.scalar())) {
        bool integerLabels = s.index.nlevels() == 1;
        if (integerLabels) {
            for (const auto& l : s.index.levels.front()) {
                if (!std::holds_alternative<int64_t>(l)) {
                    integerLabels = false;
                    break;
                }
            }
        }
        if (!integerLabels || s.size() == 0) return ilocGet(s, key);
    }
    if (found.empty()) raise("KeyError", key.isScalar() ? scalarRepr(key.scalar()) : valueRepr(key));
    if (found.size() == 1) return cellValue(s.values[found.front()], s.dtype);
    return Value(s.take(found));
}

Series setItem(const Series& s, const Value& key, const Value& value) {
    if (isSlice(key)) return assignPositions(s, slicePositions(key, s.size()), value);
    if (isBooleanMask(key)) return assignPositions(s, maskPositions(key, s.index), value);
    if ((key.isList() && !key.list().isTuple) || key.isSeries()) {
        return assignPositions(s, listLabelPositions(s.index, key), value);
    }
    const std::vector<size_t> found = s.index.find({key.scalar()});
    if (!found.empty()) return assignPositions(s, found, value);
    if (s.index.nlevels() != 1) raise("KeyError", scalarRepr(key.scalar()));
    Series out = s;
    out.values.push_back(value.scalar());
    out.index.levels.front().push_back(key.scalar());
    return Series::make(out.name, std::move(out.values), std::move(out.index));
}

Value ilocGet(const Series& s, const Value& key) {
    if (isSlice(key)) return Value(s.take(slicePositions(key, s.size())));
    if (isBoolList(key) || (key.isSeries() && isBooleanMask(key))) {
        return Value(s.take(maskPositions(key.isSeries() ? seriesToList(key.series()) : key, s.index)));
    }
    if (key.isList() || key.isSeries()) return Value(s.take(intPositions(key, s.size())));
    int64_t p = toInteger(key.scalar());
    if (p < 0) p += static_cast<int64_t>(s.size());
    if (p < 0 || p >= static_cast<int64_t>(s.size())) raise("IndexError", "single positional indexer is out-of-bounds");
    return cellValue(s.values[static_cast<size_t>(p)], s.dtype);
}

Series ilocSet(const Series& s, const Value& key, const Value& value) {
    if (isSlice(key)) return assignPositions(s, slicePositions(key, s.size()), value);
    if (isBoolList(key)) return assignPositions(s, maskPositions(key, s.index), value);
    if (key.isList() || key.isSeries()) return assignPositions(s, intPositions(key, s.size()), value);
    return assignPositions(s, intPositions(key, s.size()), value);
}

Value locGet(const Series& s, const Value& key) {
    if (isSlice(key)) return Value(s.take(labelSlicePositions(s.index, key)));
    if (isBooleanMask(key)) return Value(s.take(maskPositions(key, s.index)));
    if ((key.isList() && !key.list().isTuple) || key.isSeries()) return Value(s.take(listLabelPositions(s.index, key)));
    const auto found = labelPositions(s.index, key);
    if (found.size() == 1) return cellValue(s.values[found.front()], s.dtype);
    return Value(s.take(found));
}

bool hasStrMethod(const std::string& name) {
    static const std::unordered_set<std::string> kMethods = {
        "contains", "startswith", "endswith", "lower", "upper", "strip", "lstrip", "rstrip",
        "title", "len", "replace", "slice"};
    return kMethods.count(name) > 0;
}

Value strMethod(const Series& s, const std::string& name, const CallArgs& args) {
    const auto perString = [&](const std::function<Scalar(const std::string&)>& fn, const Scalar& naValue) {
        return Value(mapValues(s, [&](const Scalar& v) -> Scalar {
            if (const auto* str = std::get_if<std::string>(&v)) return fn(*str);
            return naValue;
        }));
    };

    if (name == "contains") {
        const std::string pat = stringArg(args, 0, "pat", "");
        const bool caseSensitive = boolArg(args, 1, "case", true);
        const bool regex = boolArg(args, 4, "regex", true);
        const Value* na = args.get(3, "na");
        const Scalar naValue = na ? na->scalar() : nanScalar();
        if (regex) {
            std::regex re;
            try {
                re = std::regex(pat, caseSensitive ? std::regex::ECMAScript : std::regex::ECMAScript | std::regex::icase);
            } catch (const std::regex_error& e) {
                raise("ValueError", "invalid regular expression '" + pat + "': " + e.what());
            }
            return perString([&](const std::string& v) { return Scalar(std::regex_search(v, re)); }, naValue);
        }
        return perString([&](const std::string& v) {
            return Scalar(caseSensitive ? v.find(pat) != std::string::npos : CommonUtils::containsIgnoreCase(v, pat));
        }, naValue);
    }
    if (name == "startswith" || name == "endswith") {
        const std::string pat = stringArg(args, 0, "pat", "");
        const bool start = name == "startswith";
        return perString([&](const std::string& v) {
            if (pat.size() > v.size()) return Scalar(false);
            return Scalar(start ? v.compare(0, pat.size(), pat) == 0 : v.compare(v.size() - pat.size(), pat.size(), pat) == 0);
        }, nanScalar());
    }
    if (name == "lower") return perString([](const std::string& v) { return Scalar(CommonUtils::toLower(v)); }, Scalar{});
    if (name == "upper") return perString([](const std::string& v) { return Scalar(CommonUtils::toUpper(v)); }, Scalar{});
    if (name == "strip" || name == "lstrip" || name == "rstrip") {
        const std::string chars = stringArg(args, 0, "to_strip", " \t\r\n\f\v");
        return perString([&](const std::string& v) {
            size_t b = 0;
            size_t e = v.size();
            if (name != "rstrip") {
                while (b < e && chars.find(v[b]) != std::string::npos) ++b;
            }
            if (name != "lstrip") {
                while (e > b && chars.find(v[e - 1]) != std::string::npos) --e;
            }
            return Scalar(v.substr(b, e - b));
        }, Scalar{});
    }
    if (name == "title") {
        return perString([](const std::string& v) {
            std::string out = v;
            bool startWord = true;
            for (auto& c : out) {
                const unsigned char u = static_cast<unsigned char>(c);
                if (std::isalpha(u)) {
                    c = static_cast<char>(startWord ? std::toupper(u) : std::tolower(u));
                    startWord = false;
                } else {
                    startWord = true;
                }
            }
            return Scalar(out);
        }, Scalar{});
    }
    if (name == "len") return perString([](const std::string& v) { return Scalar(static_cast<int64_t>(v.size())); }, nanScalar());
    if (name == "replace") {
        const std::string pat = stringArg(args, 0, "pat", "");
        const std::string repl = stringArg(args, 1, "repl", "");
        const bool regex = boolArg(args, 4, "regex", false);
        if (regex) {
            std::regex re;
            try {
                re = std::regex(pat);
            } catch (const std::regex_error& e) {
                raise("ValueError", "invalid regular expression '" + pat + "': " + e.what());
            }
            return perString([&](const std::string& v) { return Scalar(std::regex_replace(v, re, repl)); }, Scalar{});
        }
        return perString([&](const std::string& v) {
            if (pat.empty()) return Scalar(v);
            std::string out;
            size_t start = 0;
            size_t found = 0;
            while ((found = v.find(pat, start)) != std::string::npos) {
                out.append(v, start, found - start);
                out += repl;
                start = found + pat.size();
            }
            out.append(v, start, std::string::npos);
            return Scalar(out);
        }, Scalar{});
    }
    if (name == "slice") {
        const Value sliceSpec = makeSlice(args.has(0, "start") ? args.get(0, "start")->scalar() : Scalar{},
                                          args.has(1, "stop") ? args.get(1, "stop")->scalar() : Scalar{},
                                          args.has(2, "step") ? args.get(2, "step")->scalar() : Scalar{});
        return perString([&](const std::string& v) {
            std::string out;
            for (size_t p : slicePositions(sliceSpec, v.size())) out.push_back(v[p]);
            return Scalar(out);
        }, Scalar{});
    }
    raise("AttributeError", "'StringMethods' object has no attribute '" + name + "'");
}

Value dtAttribute(const Series& s, const std::string& name) {
    if (s.dtype == DType::Timedelta) {
        if (name == "days" || name == "seconds") {
            return Value(mapValues(s, [&](const Scalar& v) -> Scalar {
                const auto* td = std::get_if<Timedelta>(&v);
                if (!td) return nanScalar();
                const int64_t days = floorDays(td->seconds);
                return Scalar(name == "days" ? days : td->seconds - days * 86400);
            }));
        }
        if (hasDtMethod(name)) {
            Object o;
            o.kind = Object::Kind::Method;
            o.name = "dt." + name;
            o.self = Value(s);
            return Value(std::move(o));
        }
        raise("AttributeError", "'TimedeltaProperties' object has no attribute '" + name + "'");
    }

    const auto part = [&](const std::function<int64_t(int64_t)>& fn) {
        return Value(mapValues(s, [&](const Scalar& v) -> Scalar {
            const auto* ts = std::get_if<Timestamp>(&v);
            if (!ts) return nanScalar();
            return Scalar(fn(ts->seconds));
        }));
    };
    const auto civil = [](int64_t secs, int which) -> int64_t {
        int y = 0;
        int m = 0;
        int d = 0;
        int wd = 0;
        civilFromUnixSeconds(secs, y, m, d, wd);
        switch (which) {
            case 0: return y;
            case 1: return m;
            case 2: return d;
            default: return wd;
        }
    };
    const auto secondsOfDay = [](int64_t secs) {
        int64_t rem = secs % 86400;
        return rem < 0 ? rem + 86400 : rem;
    };

    if (name == "year") return part([&](int64_t t) { return civil(t, 0); });
    if (name == "month") return part([&](int64_t t) { return civil(t, 1); });
    if (name == "day") return part([&](int64_t t) { return civil(t, 2); });
    if (name == "dayofweek" || name == "weekday" || name == "day_of_week") return part([&](int64_t t) { return civil(t, 3); });
    if (name == "quarter") return part([&](int64_t t) { return (civil(t, 1) - 1) / 3 + 1; });
    if (name == "hour") return part([&](int64_t t) { return secondsOfDay(t) / 3600; });
    if (name == "minute") return part([&](int64_t t) { return (secondsOfDay(t) % 3600) / 60; });
    if (name == "second") return part([&](int64_t t) { return secondsOfDay(t) % 60; });
    if (name == "dayofyear" || name == "day_of_year") {
        return part([&](int64_t t) { return floorDays(t) - unixSecondsFromCivil(static_cast<int>(civil(t, 0)), 1, 1) / 86400 + 1; });
    }
    if (name == "week" || name == "weekofyear") return part([](int64_t t) { return static_cast<int64_t>(isoWeek(t)); });
    if (name == "date") {
        return Value(mapValues(s, [](const Scalar& v) -> Scalar {
            const auto* ts = std::get_if<Timestamp>(&v);
            if (!ts) return Scalar{};
            return Scalar(Timestamp{floorDays(ts->seconds) * 86400});
        }));
    }
    if (hasDtMethod(name)) {
        Object o;
        o.kind = Object::Kind::Method;
        o.name = "dt." + name;
        o.self = Value(s);
        return Value(std::move(o));
    }
    raise("AttributeError", "'DatetimeProperties' object has no attribute '" + name + "'");
}

bool hasDtMethod(const std::string& name) {
    return name == "strftime" || name == "day_name" || name == "month_name" || name == "normalize" ||
           name == "total_seconds";
}

Value dtMethod(const Series& s, const std::string& name, const CallArgs& args) {
    if (name == "total_seconds") {
        return Value(mapValues(s, [](const Scalar& v) -> Scalar {
            const auto* td = std::get_if<Timedelta>(&v);
            return td ? Scalar(static_cast<double>(td->seconds)) : nanScalar();
        }));
    }
    const auto perStamp = [&](const std::function<Scalar(int64_t)>& fn) {
        return Value(mapValues(s, [&](const Scalar& v) -> Scalar {
            const auto* ts = std::get_if<Timestamp>(&v);
            return ts ? fn(ts->seconds) : Scalar{};
        }));
    };
    if (name == "strftime") {
        const std::string fmt = stringArg(args, 0, "date_format", "%Y-%m-%d");
        return perStamp([&](int64_t t) { return Scalar(formatStrftime(t, fmt)); });
    }
    if (name == "day_name") {
        return perStamp([](int64_t t) {
            int y = 0;
            int m = 0;
            int d = 0;
            int wd = 0;
            civilFromUnixSeconds(t, y, m, d, wd);
            return Scalar(std::string(kDayNames[wd]));
        });
    }
    if (name == "month_name") {
        return perStamp([](int64_t t) {
            int y = 0;
            int m = 0;
            int d = 0;
            int wd = 0;
            civilFromUnixSeconds(t, y, m, d, wd);
            return Scalar(std::string(kMonthNames[m - 1]));
        });
    }
    if (name == "normalize") return perStamp([](int64_t t) { return Scalar(Timestamp{floorDays(t) * 86400}); });
    raise("AttributeError", "'DatetimeProperties' object has no attribute '" + name + "'");
}

} // namespace SeriesOps
} // namespace Script
