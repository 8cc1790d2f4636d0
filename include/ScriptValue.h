#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace Script {

struct Timestamp {
    int64_t seconds = 0;
};

struct Timedelta {
    int64_t seconds = 0;
};

/**
 * @brief One cell. std::monostate is None / missing.
 */
using Scalar = std::variant<std::monostate, bool, int64_t, double, std::string, Timestamp, Timedelta>;

enum class DType { Float, Int, Bool, String, Datetime, Timedelta, Object };

/**
 * @brief Row labels, stored column-major: levels[k][row]. A single-level
 * index has one level; groupby on several keys produces one level per key.
 */
struct Index {
    std::vector<std::string> names;
    std::vector<std::vector<Scalar>> levels;

    static Index range(size_t n);
    static Index single(std::string name, std::vector<Scalar> labels);

    size_t size() const noexcept { return levels.empty() ? 0 : levels.front().size(); }
    size_t nlevels() const noexcept { return levels.size(); }
    bool isRange() const;

    std::vector<Scalar> labelAt(size_t row) const;
    std::string keyAt(size_t row) const;
    std::string displayAt(size_t row) const;

    Index take(const std::vector<size_t>& rows) const;
    bool sameLabels(const Index& other) const;

    /**
     * @brief Positions whose label equals key (one entry per level).
     */
    std::vector<size_t> find(const std::vector<Scalar>& key) const;
};

struct Series {
    std::optional<std::string> name;
    DType dtype = DType::Object;
    std::vector<Scalar> values;
    Index index;

    /**
     * @brief Builds a series, inferring dtype. Integer data containing missing
     * cells is promoted to float, as in a float column with NaN.
     */
    static Series make(std::optional<std::string> name, std::vector<Scalar> values, Index index);
    static Series make(std::optional<std::string> name, std::vector<Scalar> values);

    size_t size() const noexcept { return values.size(); }
    Series take(const std::vector<size_t>& rows) const;
};

struct FrameColumn {
    std::string name;
    DType dtype = DType::Object;
    std::vector<Scalar> values;
};

struct Frame {
    Index index;
    std::vector<FrameColumn> columns;

    size_t rows() const noexcept { return index.size(); }
    int findColumn(const std::string& name) const;
    Series column(size_t i) const;

    /**
     * @brief Replaces or appends a column. Values must have rows() entries.
     */
    void setColumn(const std::string& name, std::vector<Scalar> values);
    Frame take(const std::vector<size_t>& rows) const;
};

struct ListValue;
struct DictValue;
struct GroupBy;
struct Object;

/**
 * @brief Script value. Aggregates are shared and immutable; mutation goes
 * through copy-then-rebind in the interpreter.
 */
class Value {
public:
    using Storage = std::variant<Scalar,
                                 std::shared_ptr<const ListValue>,
                                 std::shared_ptr<const DictValue>,
                                 std::shared_ptr<const Series>,
                                 std::shared_ptr<const Frame>,
                                 std::shared_ptr<const GroupBy>,
                                 std::shared_ptr<const Object>>;

    Value() = default;
    explicit Value(Scalar s) : data_(std::move(s)) {}
    explicit Value(Series s);
    explicit Value(Frame f);
    explicit Value(ListValue l);
    explicit Value(DictValue d);
    explicit Value(GroupBy g);
    explicit Value(Object o);

    static Value none() { return Value(); }
    static Value boolean(bool b) { return Value(Scalar(b)); }
    static Value integer(int64_t i) { return Value(Scalar(i)); }
    static Value number(double d) { return Value(Scalar(d)); }
    static Value string(std::string s) { return Value(Scalar(std::move(s))); }

    bool isScalar() const noexcept { return std::holds_alternative<Scalar>(data_); }
    bool isNone() const noexcept;
    bool isList() const noexcept { return std::holds_alternative<std::shared_ptr<const ListValue>>(data_); }
    bool isDict() const noexcept { return std::holds_alternative<std::shared_ptr<const DictValue>>(data_); }
    bool isSeries() const noexcept { return std::holds_alternative<std::shared_ptr<const Series>>(data_); }
    bool isFrame() const noexcept { return std::holds_alternative<std::shared_ptr<const Frame>>(data_); }
    bool isGroupBy() const noexcept { return std::holds_alternative<std::shared_ptr<const GroupBy>>(data_); }
    bool isObject() const noexcept { return std::holds_alternative<std::shared_ptr<const Object>>(data_); }

    // Typed accessors throw Augur::ScriptError (TypeError) on mismatch.
    const Scalar& scalar() const;
    const ListValue& list() const;
    const DictValue& dict() const;
    const Series& series() const;
    const Frame& frame() const;
    const GroupBy& groupBy() const;
    const Object& object() const;

    std::shared_ptr<const Frame> framePtr() const;

private:
    Storage data_;
};

struct ListValue {
    std::vector<Value> items;
    bool isTuple = false;
};

struct DictValue {
    std::vector<std::pair<Scalar, Value>> items;

    const Value* find(const Scalar& key) const;
    void set(const Scalar& key, Value value);
};

struct GroupBy {
    std::shared_ptr<const Frame> frame;
    std::vector<std::string> keys;
    std::vector<std::string> selection;   // empty: every non-key column
    bool seriesSelection = false;
    bool asIndex = true;
    bool sort = true;
    bool dropna = true;
};

struct Object {
    enum class Kind {
        Builtin,
        Module,
        ModuleFunction,
        Method,
        StrAccessor,
        DtAccessor,
        ILocIndexer,
        LocIndexer,
        Slice
    };

    Kind kind = Kind::Builtin;
    std::string name;   // builtin, module, "pd.to_numeric", or method name
    Value self;
};

/**
 * @brief Positional and keyword arguments of one call.
 */
struct CallArgs {
    std::vector<Value> positional;
    std::vector<std::pair<std::string, Value>> keywords;

    const Value* get(size_t position, const std::string& keyword) const;
    bool has(size_t position, const std::string& keyword) const { return get(position, keyword) != nullptr; }
    void expectAtMost(size_t count, const std::string& function) const;
};

[[noreturn]] void raise(const std::string& category, const std::string& message);

bool isMissing(const Scalar& s) noexcept;
bool isNumeric(const Scalar& s) noexcept;
double toDouble(const Scalar& s);
int64_t toInteger(const Scalar& s);
bool scalarTruthy(const Scalar& s);
bool truthy(const Value& v);

std::string scalarRepr(const Scalar& s);
std::string scalarStr(const Scalar& s);

/**
 * @brief Identity key for hashing labels and distinct values. Numerically
 * equal ints, floats and bools share a key.
 */
std::string scalarKey(const Scalar& s);
bool scalarsEqual(const Scalar& a, const Scalar& b);

/**
 * @brief Total order used by sorting: numbers, then strings, then others;
 * missing sorts last.
 */
int compareScalars(const Scalar& a, const Scalar& b);

DType inferDType(std::vector<Scalar>& values);
std::string dtypeName(DType dtype);
std::string typeName(const Value& v);
std::string valueRepr(const Value& v);

Value makeList(std::vector<Value> items, bool tuple = false);

/**
 * @brief A start:stop:step slice; bounds are None or integers (labels for .loc).
 */
Value makeSlice(Scalar start, Scalar stop, Scalar step);
bool isSlice(const Value& v);

/**
 * @brief Positions selected by a slice over n rows, Python semantics.
 */
std::vector<size_t> slicePositions(const Value& slice, size_t n);
std::vector<Scalar> scalarsFromValue(const Value& v, const std::string& context);

} // namespace Script
