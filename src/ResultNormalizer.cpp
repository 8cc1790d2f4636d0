#include "ResultNormalizer.h"
#include "CommonUtils.h"
#include "ScriptBuiltins.h"
#include "StatsUtils.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <unordered_map>

using namespace Script;

namespace {
bool numericDType(DType dtype) {
    return dtype == DType::Float || dtype == DType::Int;
}

bool presentNumber(const Scalar& cell) {
    if (!isNumeric(cell) || isMissing(cell)) return false;
    return std::isfinite(toDouble(cell));
}

double meanOf(const std::vector<double>& values) {
    return StatsUtils::runningMean(values);
}
} // namespace

const std::vector<ResultNormalizer::PercentileRange>& ResultNormalizer::percentileRanges() {
    static const std::vector<PercentileRange> kRanges = {
        {0.0, 1.0, "0-1"},
        {1.0, 5.0, "1-5"},
        {5.0, 10.0, "5-10"},
        {10.0, 25.0, "10-25"},
        {25.0, 50.0, "25-50"},
        {50.0, 100.0, "50-100"}
    };
    return kRanges;
}

ResultNormalizer::ResultNormalizer(const EngineConfig& config)
    : config_(config) {}

double ResultNormalizer::roundValue(double v) const {
    if (!std::isfinite(v)) return 0.0;
    return CommonUtils::roundTo(v, config_.resultPrecision);
}

JsonValue ResultNormalizer::normalize(const Value& value, const Frame& dataset) const {
    try {
        size_t entries = 0;
        if (value.isSeries()) entries = value.series().size();
        else if (value.isFrame()) entries = value.frame().rows();
        else if (value.isList()) entries = value.list().items.size();

        if (entries > config_.largeResultThreshold) {
            if (const auto source = bucketSource(value)) {
                if (config_.verbose) {
                    std::cout << "[Augur][Normalizer] Result has " << entries
                              << " entries; summarizing into percentile buckets\n";
                }
                return percentileBuckets(*source, dataset);
            }
            if (config_.verbose) {
                std::cout << "[Augur][Normalizer] Result has " << entries
                          << " entries; returning a sample of " << config_.sampleSize << "\n";
            }
            return samplingSummary(value);
        }
        return convert(SafeOps::cleanResult(value));
    } catch (const std::exception& e) {
        std::cerr << "[Augur][Normalizer] Falling back to string form: " << e.what() << "\n";
        return JsonValue::string(valueRepr(value));
    }
}

JsonValue ResultNormalizer::normalize(const JsonValue& value) const {
    switch (value.type) {
        case JsonValue::Type::Number:
            return JsonValue::number(roundValue(value.numberValue));
        case JsonValue::Type::Array: {
            JsonValue out = JsonValue::array();
            for (const auto& item : value.arrayValue) out.push(normalize(item));
            return out;
        }
        case JsonValue::Type::Object: {
            JsonValue out = JsonValue::object();
            for (const auto& member : value.objectValue) out.set(member.first, normalize(member.second));
            return out;
        }
        default:
            return value;
    }
}

Value ResultNormalizer::toScriptValue(const JsonValue& value) {
    switch (value.type) {
        case JsonValue::Type::Null:
            return Value::none();
        case JsonValue::Type::Bool:
            return Value::boolean(value.booleanValue);
        case JsonValue::Type::Integer:
            return Value::integer(value.integerValue);
        case JsonValue::Type::Number:
            return Value::number(value.numberValue);
        case JsonValue::Type::String:
            return Value::string(value.stringValue);
        case JsonValue::Type::Array: {
            std::vector<Value> items;
            items.reserve(value.arrayValue.size());
            for (const auto& item : value.arrayValue) items.push_back(toScriptValue(item));
            return makeList(std::move(items));
        }
        case JsonValue::Type::Object: {
            DictValue d;
            for (const auto& member : value.objectValue) d.set(Scalar(member.first), toScriptValue(member.second));
            return Value(std::move(d));
        }
    }
    return Value::none();
}

JsonValue ResultNormalizer::convertScalar(const Scalar& cell) const {
    if (std::holds_alternative<std::monostate>(cell)) return JsonValue::null();
    if (const auto* b = std::get_if<bool>(&cell)) return JsonValue::boolean(*b);
    if (const auto* i = std::get_if<int64_t>(&cell)) return JsonValue::integer(*i);
    if (const auto* d = std::get_if<double>(&cell)) return JsonValue::number(roundValue(*d));
    if (const auto* s = std::get_if<std::string>(&cell)) return JsonValue::string(*s);
    return JsonValue::string(scalarStr(cell));
}

JsonValue ResultNormalizer::seriesObject(const Series& series, size_t limit) const {
    JsonValue out = JsonValue::object();
    const size_t n = std::min(limit, series.size());
    for (size_t i = 0; i < n; ++i) out.set(series.index.displayAt(i), convertScalar(series.values[i]));
    return out;
}

JsonValue ResultNormalizer::frameRecords(const Frame& frame, size_t limit) const {
    JsonValue out = JsonValue::array();
    const size_t n = std::min(limit, frame.rows());
    for (size_t r = 0; r < n; ++r) {
        JsonValue record = JsonValue::object();
        for (const auto& col : frame.columns) record.set(col.name, convertScalar(col.values[r]));
        out.push(std::move(record));
    }
    return out;
}

JsonValue ResultNormalizer::convert(const Value& value) const {
    if (value.isScalar()) return convertScalar(value.scalar());
    if (value.isSeries()) return seriesObject(value.series(), std::numeric_limits<size_t>::max());
    if (value.isFrame()) return frameRecords(value.frame(), std::numeric_limits<size_t>::max());
    if (value.isList()) {
        JsonValue out = JsonValue::array();
        for (const auto& item : value.list().items) out.push(convert(item));
        return out;
    }
    if (value.isDict()) {
        JsonValue out = JsonValue::object();
        for (const auto& item : value.dict().items) out.set(scalarStr(item.first), convert(item.second));
        return out;
    }
    return JsonValue::string(valueRepr(value));
}

std::optional<Series> ResultNormalizer::bucketSource(const Value& value) const {
    std::optional<Series> source;
    if (value.isSeries() && numericDType(value.series().dtype)) {
        source = value.series();
    } else if (value.isFrame()) {
        const Frame& f = value.frame();
        int numericColumn = -1;
        for (size_t c = 0; c < f.columns.size(); ++c) {
            if (!numericDType(f.columns[c].dtype)) continue;
            if (numericColumn >= 0) return std::nullopt;
            numericColumn = static_cast<int>(c);
        }
        if (numericColumn < 0) return std::nullopt;
        source = f.column(static_cast<size_t>(numericColumn));
    }
    if (!source) return std::nullopt;
    const bool anyNumber = std::any_of(source->values.begin(), source->values.end(), presentNumber);
    if (!anyNumber) return std::nullopt;
    return source;
}

std::vector<std::vector<size_t>> ResultNormalizer::entityRows(const Series& values, const Frame& dataset) const {
    std::vector<std::vector<size_t>> rows(values.size());
    const Index& index = values.index;
    const bool namedIndex = index.nlevels() == 1 && !index.names.empty() && !index.names.front().empty();
    const int keyColumn = namedIndex ? dataset.findColumn(index.names.front()) : -1;

    if (keyColumn >= 0) {
        std::unordered_map<std::string, std::vector<size_t>> byKey;
        const auto& cells = dataset.columns[static_cast<size_t>(keyColumn)].values;
        for (size_t r = 0; r < cells.size(); ++r) {
            if (!isMissing(cells[r])) byKey[scalarKey(cells[r])].push_back(r);
        }
        for (size_t i = 0; i < values.size(); ++i) {
            const auto it = byKey.find(index.keyAt(i));
            if (it != byKey.end()) rows[i] = it->second;
        }
        return rows;
    }

    if (index.nlevels() != dataset.index.nlevels()) return rows;
    for (size_t i = 0; i < values.size(); ++i) rows[i] = dataset.index.find(index.labelAt(i));
    return rows;
}

JsonValue ResultNormalizer::describeRows(const Frame& dataset, const std::vector<size_t>& rows) const {
    JsonValue categorical = JsonValue::object();
    for (const auto& name : config_.characteristicCategoricalColumns) {
        const int c = dataset.findColumn(name);
        if (c < 0) continue;
        const auto& cells = dataset.columns[static_cast<size_t>(c)].values;

        std::vector<std::pair<std::string, size_t>> counts;
        std::unordered_map<std::string, size_t> slot;
        size_t present = 0;
        for (size_t r : rows) {
            if (isMissing(cells[r])) continue;
            ++present;
            const std::string label = scalarStr(cells[r]);
            const auto it = slot.find(label);
            if (it == slot.end()) {
                slot.emplace(label, counts.size());
                counts.emplace_back(label, 1);
            } else {
                ++counts[it->second].second;
            }
        }
        std::stable_sort(counts.begin(), counts.end(), [](const auto& a, const auto& b) {
            return a.second > b.second;
        });

        JsonValue top = JsonValue::object();
        for (size_t k = 0; k < counts.size() && k < 2; ++k) {
            top.set(counts[k].first, JsonValue::number(CommonUtils::roundTo(
                static_cast<double>(counts[k].second) / static_cast<double>(present), 2)));
        }
        categorical.set(name, std::move(top));
    }

    JsonValue numeric = JsonValue::object();
    for (const auto& name : config_.characteristicNumericColumns) {
        const int c = dataset.findColumn(name);
        if (c < 0) continue;
        const auto& cells = dataset.columns[static_cast<size_t>(c)].values;
        std::vector<double> values;
        for (size_t r : rows) {
            if (presentNumber(cells[r])) values.push_back(toDouble(cells[r]));
        }
        if (values.empty()) continue;
        JsonValue stats = JsonValue::object();
        stats.set("average", JsonValue::number(roundValue(meanOf(values))));
        stats.set("median", JsonValue::number(roundValue(CommonUtils::medianByNth(values))));
        numeric.set(name, std::move(stats));
    }

    JsonValue out = JsonValue::object();
    out.set("categorical", std::move(categorical));
    out.set("numeric", std::move(numeric));
    return out;
}

JsonValue ResultNormalizer::percentileBuckets(const Series& source, const Frame& dataset) const {
    std::vector<size_t> positions;
    std::vector<double> values;
    for (size_t i = 0; i < source.size(); ++i) {
        if (!presentNumber(source.values[i])) continue;
        positions.push_back(i);
        values.push_back(toDouble(source.values[i]));
    }

    const std::vector<double> percentiles = StatsUtils::descendingPercentileRanks(values);
    const std::vector<std::vector<size_t>> entities = entityRows(source, dataset);

    JsonValue buckets = JsonValue::array();
    for (const auto& range : percentileRanges()) {
        try {
            std::vector<double> selected;
            std::vector<size_t> rows;
            std::vector<uint8_t> seen(dataset.rows(), 0);
            for (size_t k = 0; k < values.size(); ++k) {
                if (!(percentiles[k] > range.lower && percentiles[k] <= range.upper)) continue;
                selected.push_back(values[k]);
                for (size_t r : entities[positions[k]]) {
                    if (seen[r]) continue;
                    seen[r] = 1;
                    rows.push_back(r);
                }
            }
            if (selected.empty()) continue;

            const auto [lo, hi] = std::minmax_element(selected.begin(), selected.end());
            JsonValue stats = JsonValue::object();
            stats.set("min", JsonValue::number(roundValue(*lo)));
            stats.set("max", JsonValue::number(roundValue(*hi)));
            stats.set("mean", JsonValue::number(roundValue(meanOf(selected))));
            stats.set("median", JsonValue::number(roundValue(CommonUtils::medianByNth(selected))));

            std::sort(rows.begin(), rows.end());
            JsonValue bucket = JsonValue::object();
            bucket.set("range", JsonValue::string(range.label));
            bucket.set("stats", std::move(stats));
            bucket.set("sample_size", JsonValue::integer(static_cast<int64_t>(selected.size())));
            bucket.set("characteristics", describeRows(dataset, rows));
            buckets.push(std::move(bucket));
        } catch (const std::exception& e) {
            std::cerr << "[Augur][Normalizer] Skipping percentile range " << range.label << ": " << e.what() << "\n";
        }
    }

    JsonValue out = JsonValue::object();
    out.set("summary_type", JsonValue::string("percentile_buckets"));
    out.set("total_count", JsonValue::integer(static_cast<int64_t>(values.size())));
    out.set("buckets", std::move(buckets));
    return out;
}

JsonValue ResultNormalizer::samplingSummary(const Value& value) const {
    JsonValue summary = JsonValue::object();
    JsonValue mean = JsonValue::null();
    JsonValue sample;
    size_t count = 0;

    if (value.isSeries()) {
        const Series& s = value.series();
        count = s.size();
        if (numericDType(s.dtype)) {
            std::vector<double> numbers;
            for (const auto& cell : s.values) {
                if (presentNumber(cell)) numbers.push_back(toDouble(cell));
            }
            mean = JsonValue::number(roundValue(meanOf(numbers)));
        }
        sample = seriesObject(s, config_.sampleSize);
    } else if (value.isFrame()) {
        const Frame& f = value.frame();
        count = f.rows();
        JsonValue means = JsonValue::object();
        for (const auto& col : f.columns) {
            if (!numericDType(col.dtype)) continue;
            std::vector<double> numbers;
            for (const auto& cell : col.values) {
                if (presentNumber(cell)) numbers.push_back(toDouble(cell));
            }
            means.set(col.name, JsonValue::number(roundValue(meanOf(numbers))));
        }
        if (means.size() > 0) mean = std::move(means);
        sample = frameRecords(f, config_.sampleSize);
    } else {
        const auto& items = value.list().items;
        count = items.size();
        std::vector<double> numbers;
        bool allNumeric = true;
        sample = JsonValue::array();
        for (size_t i = 0; i < items.size(); ++i) {
            if (allNumeric) {
                if (items[i].isScalar() && presentNumber(items[i].scalar())) numbers.push_back(toDouble(items[i].scalar()));
                else allNumeric = false;
            }
            if (i < config_.sampleSize) sample.push(convert(items[i]));
        }
        if (allNumeric) mean = JsonValue::number(roundValue(meanOf(numbers)));
    }

    summary.set("count", JsonValue::integer(static_cast<int64_t>(count)));
    summary.set("mean", std::move(mean));
    summary.set("sample", std::move(sample));
    JsonValue out = JsonValue::object();
    out.set("summary", std::move(summary));
    return out;
}
