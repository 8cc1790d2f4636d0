#include "PatternDetector.h"
#include "CommonUtils.h"
#include "StatsUtils.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <numeric>
#include <unordered_map>

namespace {
constexpr int64_t kSecondsPerDay = 86400;

struct CivilDate {
    int year = 0;
    int month = 0;
    int day = 0;
    int64_t timeOfDay = 0;
};

CivilDate civil(int64_t seconds) {
    CivilDate out;
    int weekday = 0;
    civilFromUnixSeconds(seconds, out.year, out.month, out.day, weekday);
    out.timeOfDay = ((seconds % kSecondsPerDay) + kSecondsPerDay) % kSecondsPerDay;
    return out;
}

int daysInMonth(int year, int month) {
    const int nextYear = month == 12 ? year + 1 : year;
    const int nextMonth = month == 12 ? 1 : month + 1;
    return static_cast<int>((unixSecondsFromCivil(nextYear, nextMonth, 1) - unixSecondsFromCivil(year, month, 1)) / kSecondsPerDay);
}

std::string withMultiple(int64_t count, const char* unit) {
    return count == 1 ? std::string(unit) : std::to_string(count) + unit;
}

// Distinct non-missing labels of a column with their counts, first-seen order.
std::vector<std::pair<std::string, size_t>> valueCounts(const TypedColumn& column) {
    std::vector<std::pair<std::string, size_t>> counts;
    std::unordered_map<std::string, size_t> slot;
    for (size_t r = 0; r < column.size(); ++r) {
        if (column.isMissing(r)) continue;
        std::string label = column.cellAsString(r);
        const auto it = slot.find(label);
        if (it == slot.end()) {
            slot.emplace(label, counts.size());
            counts.emplace_back(std::move(label), 1);
        } else {
            ++counts[it->second].second;
        }
    }
    return counts;
}

std::vector<double> presentValues(const TypedColumn& column) {
    std::vector<double> out;
    const auto& values = std::get<std::vector<double>>(column.values);
    for (size_t r = 0; r < values.size(); ++r) {
        if (!column.isMissing(r) && std::isfinite(values[r])) out.push_back(values[r]);
    }
    return out;
}

std::string metricType(const TypedColumn& column) {
    const std::vector<double> values = presentValues(column);
    if (values.empty()) return "continuous_metric";
    if (*std::min_element(values.begin(), values.end()) < 0.0) return "change_metric";
    const bool integral = std::all_of(values.begin(), values.end(), [](double v) { return std::floor(v) == v; });
    return integral ? "count_metric" : "continuous_metric";
}
} // namespace

PatternDetector::PatternDetector(const EngineConfig& config)
    : config_(config) {}

JsonValue PatternDetector::emptyReport() {
    JsonValue report = JsonValue::object();
    report.set("temporal_patterns", JsonValue::object());
    report.set("correlations", JsonValue::array());
    report.set("categorical_patterns", JsonValue::object());
    report.set("key_metrics", JsonValue::object());
    JsonValue relationships = JsonValue::object();
    relationships.set("correlations", JsonValue::object());
    relationships.set("dependencies", JsonValue::object());
    report.set("relationships", std::move(relationships));
    return report;
}

std::optional<std::string> PatternDetector::inferFrequency(const std::vector<int64_t>& unixSeconds) {
    if (unixSeconds.size() < 3) return std::nullopt;
    std::vector<int64_t> points = unixSeconds;
    if (points.front() > points.back()) std::reverse(points.begin(), points.end());
    for (size_t i = 1; i < points.size(); ++i) {
        if (points[i] <= points[i - 1]) return std::nullopt;
    }

    const int64_t step = points[1] - points[0];
    bool fixedStep = true;
    for (size_t i = 2; i < points.size() && fixedStep; ++i) {
        fixedStep = (points[i] - points[i - 1]) == step;
    }
    if (fixedStep) {
        if (step % (7 * kSecondsPerDay) == 0) return withMultiple(step / (7 * kSecondsPerDay), "W");
        if (step % kSecondsPerDay == 0) return withMultiple(step / kSecondsPerDay, "D");
        if (step % 3600 == 0) return withMultiple(step / 3600, "H");
        if (step % 60 == 0) return withMultiple(step / 60, "T");
        return withMultiple(step, "S");
    }

    // Calendar steps: month starts, month ends, year ends.
    std::vector<CivilDate> dates;
    dates.reserve(points.size());
    for (int64_t p : points) dates.push_back(civil(p));
    const int64_t timeOfDay = dates.front().timeOfDay;
    bool allMonthStart = true;
    bool allMonthEnd = true;
    for (const auto& d : dates) {
        if (d.timeOfDay != timeOfDay) return std::nullopt;
        allMonthStart = allMonthStart && d.day == 1;
        allMonthEnd = allMonthEnd && d.day == daysInMonth(d.year, d.month);
    }
    if (!allMonthStart && !allMonthEnd) return std::nullopt;

    const auto monthIndex = [](const CivilDate& d) { return static_cast<int64_t>(d.year) * 12 + d.month; };
    const int64_t monthStep = monthIndex(dates[1]) - monthIndex(dates[0]);
    for (size_t i = 2; i < dates.size(); ++i) {
        if (monthIndex(dates[i]) - monthIndex(dates[i - 1]) != monthStep) return std::nullopt;
    }
    if (monthStep == 12 && allMonthEnd && dates.front().month == 12) return std::string("A");
    if (monthStep == 12 && allMonthStart && dates.front().month == 1) return std::string("AS");
    if (monthStep <= 0) return std::nullopt;
    return withMultiple(monthStep, allMonthStart ? "MS" : "M");
}

PatternDetector::CategoricalImpact PatternDetector::categoricalImpact(const TypedColumn& categorical,
                                                                      const TypedColumn& numeric) const {
    CategoricalImpact out;
    try {
        const auto& labels = std::get<std::vector<std::string>>(categorical.values);
        const auto& values = std::get<std::vector<double>>(numeric.values);

        std::unordered_map<std::string, size_t> slot;
        std::vector<std::pair<double, size_t>> sums;
        for (size_t r = 0; r < labels.size() && r < values.size(); ++r) {
            if (categorical.isMissing(r) || numeric.isMissing(r)) continue;
            const auto it = slot.find(labels[r]);
            if (it == slot.end()) {
                slot.emplace(labels[r], sums.size());
                sums.emplace_back(values[r], 1);
            } else {
                sums[it->second].first += values[r];
                ++sums[it->second].second;
            }
        }

        const double overallMean = StatsUtils::runningMean(presentValues(numeric));
        double strength = 0.0;
        if (sums.size() >= 2 && overallMean != 0.0) {
            std::vector<double> groupMeans;
            groupMeans.reserve(sums.size());
            for (const auto& s : sums) groupMeans.push_back(s.first / static_cast<double>(s.second));
            strength = StatsUtils::sampleStdDev(groupMeans) / overallMean;
        }
        if (!std::isfinite(strength)) {
            out.impact = "error";
            return out;
        }

        out.strength = CommonUtils::roundTo(strength, 3);
        if (strength > config_.impactHighThreshold) out.impact = "high";
        else if (strength > config_.impactMediumThreshold) out.impact = "medium";
        else out.impact = "low";
    } catch (const std::exception& e) {
        std::cerr << "[Augur][Patterns] Impact of " << categorical.name << " on " << numeric.name
                  << " failed: " << e.what() << "\n";
        out = CategoricalImpact{0.0, "error"};
    }
    return out;
}

JsonValue PatternDetector::temporalPatterns(const TypedDataset& dataset) const {
    JsonValue out = JsonValue::object();
    for (size_t idx : dataset.datetimeColumnIndices()) {
        const TypedColumn& col = dataset.columns()[idx];
        const auto& values = std::get<std::vector<int64_t>>(col.values);
        std::vector<int64_t> present;
        for (size_t r = 0; r < values.size(); ++r) {
            if (!col.isMissing(r)) present.push_back(values[r]);
        }
        if (present.empty()) continue;

        const auto [minIt, maxIt] = std::minmax_element(present.begin(), present.end());
        const auto frequency = inferFrequency(present);

        JsonValue range = JsonValue::object();
        range.set("start", JsonValue::string(formatIsoDateTime(*minIt)));
        range.set("end", JsonValue::string(formatIsoDateTime(*maxIt)));
        range.set("span_days", JsonValue::integer((*maxIt - *minIt) / kSecondsPerDay));

        JsonValue entry = JsonValue::object();
        entry.set("frequency", frequency ? JsonValue::string(*frequency) : JsonValue::null());
        entry.set("range", std::move(range));
        out.set(col.name, std::move(entry));
    }
    return out;
}

JsonValue PatternDetector::categoricalPatterns(const TypedDataset& dataset) const {
    JsonValue out = JsonValue::object();
    if (dataset.rowCount() == 0) return out;
    const auto numericIdx = dataset.numericColumnIndices();

    for (size_t idx : dataset.categoricalColumnIndices()) {
        const TypedColumn& col = dataset.columns()[idx];
        auto counts = valueCounts(col);
        const double uniqueRatio = static_cast<double>(counts.size()) / static_cast<double>(dataset.rowCount());
        if (uniqueRatio >= config_.categoricalUniqueRatio) continue;

        size_t present = 0;
        for (const auto& c : counts) present += c.second;
        std::stable_sort(counts.begin(), counts.end(), [](const auto& a, const auto& b) {
            return a.second > b.second;
        });
        JsonValue distribution = JsonValue::object();
        for (const auto& c : counts) {
            distribution.set(c.first, JsonValue::number(static_cast<double>(c.second) / static_cast<double>(present)));
        }

        JsonValue entry = JsonValue::object();
        entry.set("unique_values", JsonValue::integer(static_cast<int64_t>(counts.size())));
        entry.set("distribution", std::move(distribution));
        if (!numericIdx.empty()) {
            JsonValue impacts = JsonValue::object();
            for (size_t n : numericIdx) {
                const CategoricalImpact impact = categoricalImpact(col, dataset.columns()[n]);
                JsonValue item = JsonValue::object();
                item.set("strength", JsonValue::number(impact.strength));
                item.set("impact", JsonValue::string(impact.impact));
                impacts.set(dataset.columns()[n].name, std::move(item));
            }
            entry.set("numeric_impacts", std::move(impacts));
        }
        out.set(col.name, std::move(entry));
    }
    return out;
}

JsonValue PatternDetector::keyMetrics(const TypedDataset& dataset, const JsonValue& relationships) const {
    struct Influence {
        size_t column;
        size_t count = 0;
        std::vector<std::string> related;
    };

    const JsonValue* correlations = relationships.find("correlations");
    const JsonValue* dependencies = relationships.find("dependencies");

    std::vector<Influence> ranked;
    for (size_t idx : dataset.numericColumnIndices()) {
        const std::string& name = dataset.columns()[idx].name;
        Influence inf{idx, 0, {}};
        for (const auto& member : correlations->objectValue) {
            const JsonValue* pair = member.second.find("columns");
            const std::string& a = pair->arrayValue[0].stringValue;
            const std::string& b = pair->arrayValue[1].stringValue;
            if (a != name && b != name) continue;
            ++inf.count;
            inf.related.push_back(a == name ? b : a);
        }
        for (const auto& member : dependencies->objectValue) {
            if (member.second.find("numeric_column")->stringValue == name) ++inf.count;
        }
        ranked.push_back(std::move(inf));
    }
    std::stable_sort(ranked.begin(), ranked.end(), [](const Influence& a, const Influence& b) {
        return a.count > b.count;
    });

    JsonValue out = JsonValue::object();
    for (size_t i = 0; i < ranked.size() && i < config_.maxKeyMetrics; ++i) {
        const TypedColumn& col = dataset.columns()[ranked[i].column];
        JsonValue related = JsonValue::array();
        for (const auto& r : ranked[i].related) related.push(JsonValue::string(r));
        JsonValue entry = JsonValue::object();
        entry.set("relationship_count", JsonValue::integer(static_cast<int64_t>(ranked[i].count)));
        entry.set("type", JsonValue::string(metricType(col)));
        entry.set("related_metrics", std::move(related));
        out.set(col.name, std::move(entry));
    }
    return out;
}

JsonValue PatternDetector::detect(const TypedDataset& dataset) const {
    try {
        JsonValue report = emptyReport();
        report.set("temporal_patterns", temporalPatterns(dataset));

        const auto numericIdx = dataset.numericColumnIndices();
        JsonValue relationships = JsonValue::object();
        JsonValue relCorrelations = JsonValue::object();
        JsonValue dependencies = JsonValue::object();
        JsonValue correlations = JsonValue::array();

        if (numericIdx.size() >= 2) {
            std::vector<const std::vector<double>*> columns;
            std::vector<const std::vector<uint8_t>*> missing;
            for (size_t idx : numericIdx) {
                columns.push_back(&std::get<std::vector<double>>(dataset.columns()[idx].values));
                missing.push_back(&dataset.columns()[idx].missing);
            }
            const auto matrix = StatsUtils::correlationMatrix(columns, missing);

            for (size_t i = 0; i < numericIdx.size(); ++i) {
                for (size_t j = i + 1; j < numericIdx.size(); ++j) {
                    const double r = matrix[i][j];
                    if (!std::isfinite(r)) continue;
                    const std::string& a = dataset.columns()[numericIdx[i]].name;
                    const std::string& b = dataset.columns()[numericIdx[j]].name;
                    JsonValue pair = JsonValue::array({JsonValue::string(a), JsonValue::string(b)});

                    if (std::abs(r) > config_.strongCorrelationThreshold) {
                        JsonValue entry = JsonValue::object();
                        entry.set("columns", pair);
                        entry.set("correlation", JsonValue::number(r));
                        correlations.push(std::move(entry));
                    }
                    if (std::abs(r) > config_.relationshipCorrelationThreshold) {
                        JsonValue entry = JsonValue::object();
                        entry.set("strength", JsonValue::number(CommonUtils::roundTo(r, 3)));
                        entry.set("direction", JsonValue::string(r > 0 ? "positive" : "negative"));
                        entry.set("columns", std::move(pair));
                        relCorrelations.set(a + "_" + b, std::move(entry));
                    }
                }
            }

            for (size_t c : dataset.categoricalColumnIndices()) {
                for (size_t n : numericIdx) {
                    const TypedColumn& cat = dataset.columns()[c];
                    const TypedColumn& num = dataset.columns()[n];
                    const CategoricalImpact impact = categoricalImpact(cat, num);
                    if (impact.strength <= config_.dependencyStrengthThreshold) continue;
                    JsonValue entry = JsonValue::object();
                    entry.set("strength", JsonValue::number(impact.strength));
                    entry.set("impact", JsonValue::string(impact.impact));
                    entry.set("numeric_column", JsonValue::string(num.name));
                    dependencies.set(cat.name + "_" + num.name, std::move(entry));
                }
            }
        }

        relationships.set("correlations", std::move(relCorrelations));
        relationships.set("dependencies", std::move(dependencies));
        report.set("correlations", std::move(correlations));
        report.set("categorical_patterns", categoricalPatterns(dataset));
        report.set("key_metrics", keyMetrics(dataset, relationships));
        report.set("relationships", std::move(relationships));

        if (config_.verbose) {
            std::cout << "[Augur][Patterns] " << report.find("correlations")->size() << " strong correlations, "
                      << report.find("categorical_patterns")->size() << " categorical patterns, "
                      << report.find("key_metrics")->size() << " key metrics\n";
        }
        return report;
    } catch (const std::exception& e) {
        std::cerr << "[Augur Error] Pattern detection failed: " << e.what() << "\n";
        return emptyReport();
    }
}

namespace {
const TypedColumn* findColumnIgnoreCase(const TypedDataset& dataset, const std::string& name) {
    for (const auto& col : dataset.columns()) {
        if (CommonUtils::toLower(col.name) == name) return &col;
    }
    return nullptr;
}

// Column total with thousands separators tolerated; unparseable cells count as zero.
double columnTotal(const TypedColumn& column) {
    if (column.type == ColumnType::NUMERIC) {
        const std::vector<double> values = presentValues(column);
        return std::accumulate(values.begin(), values.end(), 0.0);
    }
    double total = 0.0;
    for (size_t r = 0; r < column.size(); ++r) {
        if (column.isMissing(r)) continue;
        std::string text = CommonUtils::trim(column.cellAsString(r));
        text.erase(std::remove(text.begin(), text.end(), ','), text.end());
        double parsed = 0.0;
        if (TypedDataset::parseNumericToken(text, parsed, TypedDataset::NumericSeparatorPolicy::US_THOUSANDS) &&
            std::isfinite(parsed)) {
            total += parsed;
        }
    }
    return total;
}

JsonValue columnRange(const TypedColumn& column) {
    JsonValue range = JsonValue::object();
    range.set("start", JsonValue::null());
    range.set("end", JsonValue::null());
    if (column.type == ColumnType::DATETIME) {
        const auto& values = std::get<std::vector<int64_t>>(column.values);
        std::optional<int64_t> lo;
        std::optional<int64_t> hi;
        for (size_t r = 0; r < values.size(); ++r) {
            if (column.isMissing(r)) continue;
            if (!lo || values[r] < *lo) lo = values[r];
            if (!hi || values[r] > *hi) hi = values[r];
        }
        if (lo) {
            range.set("start", JsonValue::string(formatIsoDateTime(*lo)));
            range.set("end", JsonValue::string(formatIsoDateTime(*hi)));
        }
    } else if (column.type == ColumnType::NUMERIC) {
        const std::vector<double> values = presentValues(column);
        if (!values.empty()) {
            const auto bounds = std::minmax_element(values.begin(), values.end());
            range.set("start", JsonValue::number(*bounds.first));
            range.set("end", JsonValue::number(*bounds.second));
        }
    } else {
        const auto counts = valueCounts(column);
        if (!counts.empty()) {
            const auto bounds = std::minmax_element(counts.begin(), counts.end(),
                                                    [](const auto& a, const auto& b) { return a.first < b.first; });
            range.set("start", JsonValue::string(bounds.first->first));
            range.set("end", JsonValue::string(bounds.second->first));
        }
    }
    return range;
}

// Counts per label, most frequent first; ties keep first-seen order.
JsonValue distribution(const TypedColumn& column) {
    auto counts = valueCounts(column);
    std::stable_sort(counts.begin(), counts.end(), [](const auto& a, const auto& b) { return a.second > b.second; });
    JsonValue out = JsonValue::object();
    for (const auto& c : counts) out.set(c.first, JsonValue::integer(static_cast<int64_t>(c.second)));
    return out;
}
} // namespace

JsonValue PatternDetector::dataSummary(const TypedDataset& dataset) const {
    JsonValue summary = JsonValue::object();
    summary.set("total_records", JsonValue::integer(static_cast<int64_t>(dataset.rowCount())));
    summary.set("metrics", JsonValue::object());
    try {
        if (const TypedColumn* week = findColumnIgnoreCase(dataset, "week")) {
            summary.set("date_range", columnRange(*week));
        }

        JsonValue metrics = JsonValue::object();
        static const std::vector<std::pair<std::string, std::string>> totals = {
            {"views", "total_views"}, {"clicks", "total_clicks"}, {"attributed_revenue", "total_revenue"}};
        for (const auto& t : totals) {
            if (const TypedColumn* col = findColumnIgnoreCase(dataset, t.first)) {
                metrics.set(t.second, JsonValue::number(columnTotal(*col)));
            }
        }
        if (const TypedColumn* col = findColumnIgnoreCase(dataset, "widget_name")) {
            metrics.set("widget_distribution", distribution(*col));
        }
        if (const TypedColumn* col = findColumnIgnoreCase(dataset, "layout")) {
            metrics.set("layout_distribution", distribution(*col));
        }
        if (const TypedColumn* col = findColumnIgnoreCase(dataset, "customer_id")) {
            metrics.set("unique_customers", JsonValue::integer(static_cast<int64_t>(valueCounts(*col).size())));
        }
        summary.set("metrics", std::move(metrics));
    } catch (const std::exception& e) {
        std::cerr << "[Augur Error] Data summary failed: " << e.what() << "\n";
    }
    return summary;
}
