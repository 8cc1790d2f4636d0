#include "PatternDetector.h"
#include "TypedDataset.h"

#include <catch2/catch.hpp>

#include <limits>

namespace {
constexpr int64_t kDay = 86400;

// 30 rows: CHANNEL has 2 values (ratio 0.067), REGION has 3 (ratio 0.1).
TypedDataset trafficDataset() {
    std::vector<std::vector<std::string>> rows;
    for (int i = 0; i < 30; ++i) {
        const std::string channel = i % 2 == 0 ? "search" : "social";
        const std::string region = i % 3 == 0 ? "north" : (i % 3 == 1 ? "south" : "west");
        const int views = 100 + i * 10;
        const int clicks = 5 + i;
        const int spend = (i * 7) % 11;
        rows.push_back({channel, region, std::to_string(views), std::to_string(clicks), std::to_string(spend)});
    }
    return TypedDataset::fromRecords({"CHANNEL", "REGION", "VIEWS", "CLICKS", "SPEND"}, rows);
}

std::vector<int64_t> steps(int64_t start, int64_t step, int count) {
    std::vector<int64_t> out;
    for (int i = 0; i < count; ++i) out.push_back(start + step * i);
    return out;
}
} // namespace

TEST_CASE("PatternDetector - report always carries every section", "[patterns]") {
    const JsonValue empty = PatternDetector::emptyReport();
    for (const char* key : {"temporal_patterns", "correlations", "categorical_patterns", "key_metrics", "relationships"}) {
        CHECK(empty.find(key) != nullptr);
    }
    CHECK(empty.find("correlations")->isArray());
    CHECK(empty.find("relationships")->find("dependencies")->isObject());
}

TEST_CASE("PatternDetector - dataset without numeric columns", "[patterns]") {
    const TypedDataset dataset = TypedDataset::fromRecords(
        {"WIDGET_NAME", "LAYOUT"}, {{"a", "grid"}, {"b", "list"}, {"c", "grid"}});
    const JsonValue report = PatternDetector(EngineConfig{}).detect(dataset);
    CHECK(report.find("correlations")->size() == 0);
    CHECK(report.find("key_metrics")->size() == 0);
    CHECK(report.find("relationships")->find("correlations")->size() == 0);
    CHECK(report.find("relationships")->find("dependencies")->size() == 0);
}

TEST_CASE("PatternDetector - empty dataset yields empty sections", "[patterns]") {
    const JsonValue report = PatternDetector(EngineConfig{}).detect(TypedDataset{});
    CHECK(report == PatternDetector::emptyReport());
}

TEST_CASE("PatternDetector - correlations and relationships", "[patterns]") {
    const JsonValue report = PatternDetector(EngineConfig{}).detect(trafficDataset());

    const JsonValue& strong = *report.find("correlations");
    REQUIRE(strong.size() == 1);
    const JsonValue& pair = *strong.arrayValue[0].find("columns");
    CHECK(pair.arrayValue[0].stringValue == "VIEWS");
    CHECK(pair.arrayValue[1].stringValue == "CLICKS");
    CHECK(strong.arrayValue[0].find("correlation")->asDouble() == Approx(1.0));

    const JsonValue* rel = report.find("relationships")->find("correlations")->find("VIEWS_CLICKS");
    REQUIRE(rel != nullptr);
    CHECK(rel->find("direction")->stringValue == "positive");
    CHECK(rel->find("strength")->asDouble() == Approx(1.0));
}

TEST_CASE("PatternDetector - categorical patterns respect the unique ratio", "[patterns]") {
    const JsonValue report = PatternDetector(EngineConfig{}).detect(trafficDataset());
    const JsonValue& patterns = *report.find("categorical_patterns");
    REQUIRE(patterns.find("CHANNEL") != nullptr);
    CHECK(patterns.find("REGION") == nullptr);

    const JsonValue& channel = *patterns.find("CHANNEL");
    CHECK(channel.find("unique_values")->integerValue == 2);
    CHECK(channel.find("distribution")->find("search")->asDouble() == Approx(0.5));
    const JsonValue* impacts = channel.find("numeric_impacts");
    REQUIRE(impacts != nullptr);
    CHECK(impacts->size() == 3);
    CHECK(impacts->find("VIEWS")->find("impact")->stringValue == "low");

    EngineConfig loose;
    loose.categoricalUniqueRatio = 0.5;
    const JsonValue looser = PatternDetector(loose).detect(trafficDataset());
    CHECK(looser.find("categorical_patterns")->find("REGION") != nullptr);
}

TEST_CASE("PatternDetector - categorical impact levels", "[patterns]") {
    const PatternDetector detector{EngineConfig{}};
    const TypedColumn groups = TypedColumn::categorical("SEGMENT", {"a", "a", "b", "b"});

    SECTION("high") {
        const auto impact = detector.categoricalImpact(groups, TypedColumn::numeric("V", {10, 10, 30, 30}));
        CHECK(impact.impact == "high");
        CHECK(impact.strength == Approx(0.707).margin(0.001));
    }
    SECTION("medium") {
        const auto impact = detector.categoricalImpact(groups, TypedColumn::numeric("V", {16, 16, 24, 24}));
        CHECK(impact.impact == "medium");
        CHECK(impact.strength == Approx(0.283).margin(0.001));
    }
    SECTION("low") {
        const auto impact = detector.categoricalImpact(groups, TypedColumn::numeric("V", {19, 19, 21, 21}));
        CHECK(impact.impact == "low");
    }
    SECTION("single group has no spread") {
        const TypedColumn one = TypedColumn::categorical("SEGMENT", {"a", "a"});
        CHECK(detector.categoricalImpact(one, TypedColumn::numeric("V", {1, 2})).strength == 0.0);
    }
    SECTION("mismatched column types report an error") {
        const auto impact = detector.categoricalImpact(groups, TypedColumn::categorical("V", {"x", "y", "x", "y"}));
        CHECK(impact.strength == 0.0);
        CHECK(impact.impact == "error");
    }
    SECTION("non-finite spread reports an error") {
        const double inf = std::numeric_limits<double>::infinity();
        const auto impact = detector.categoricalImpact(groups, TypedColumn::numeric("V", {inf, inf, 1, 1}));
        CHECK(impact.strength == 0.0);
        CHECK(impact.impact == "error");
    }
}

TEST_CASE("PatternDetector - impact errors keep the report well shaped", "[patterns]") {
    const double inf = std::numeric_limits<double>::infinity();
    TypedDataset dataset;
    dataset.addColumn(TypedColumn::categorical("SEGMENT", {"a", "a", "b", "b"}));
    dataset.addColumn(TypedColumn::numeric("V", {inf, inf, 1, 1}));
    dataset.addColumn(TypedColumn::numeric("W", {1, 2, 3, 4}));

    const JsonValue report = PatternDetector(EngineConfig{}).detect(dataset);
    for (const char* key : {"temporal_patterns", "correlations", "categorical_patterns", "key_metrics", "relationships"}) {
        INFO(key);
        CHECK(report.find(key) != nullptr);
    }
    const JsonValue& dependencies = *report.find("relationships")->find("dependencies");
    CHECK(dependencies.find("SEGMENT_V") == nullptr);
    CHECK(dependencies.find("SEGMENT_W") != nullptr);
}

TEST_CASE("PatternDetector - data summary of a campaign export", "[patterns][summary]") {
    const PatternDetector detector{EngineConfig{}};
    const TypedDataset dataset = TypedDataset::fromRecords(
        {"week", "widget_name", "layout", "views", "clicks", "attributed_revenue", "customer_id"},
        {{"2024-01-15", "Alpha", "grid", "1,000", "10", "5.5", "c1"},
         {"2024-01-01", "Beta", "list", "2,500", "20", "4.5", "c2"},
         {"2024-01-08", "Alpha", "grid", "500", "", "n/a", "c1"},
         {"2024-01-22", "Gamma", "grid", "oops", "5", "1,000", "c3"}});

    const JsonValue summary = detector.dataSummary(dataset);
    CHECK(summary.find("total_records")->integerValue == 4);

    const JsonValue* range = summary.find("date_range");
    REQUIRE(range != nullptr);
    CHECK(range->find("start")->stringValue == "2024-01-01T00:00:00");
    CHECK(range->find("end")->stringValue == "2024-01-22T00:00:00");

    const JsonValue& metrics = *summary.find("metrics");
    CHECK(metrics.find("total_views")->asDouble() == Approx(4000.0));
    CHECK(metrics.find("total_clicks")->asDouble() == Approx(35.0));
    CHECK(metrics.find("total_revenue")->asDouble() == Approx(1010.0));
    CHECK(metrics.find("unique_customers")->integerValue == 3);

    const JsonValue& widgets = *metrics.find("widget_distribution");
    REQUIRE(widgets.size() == 3);
    CHECK(widgets.objectValue[0].first == "Alpha");
    CHECK(widgets.objectValue[0].second.integerValue == 2);
    CHECK(widgets.objectValue[1].first == "Beta");
    CHECK(metrics.find("layout_distribution")->find("grid")->integerValue == 3);
}

TEST_CASE("PatternDetector - data summary leaves out absent columns", "[patterns][summary]") {
    const PatternDetector detector{EngineConfig{}};
    const JsonValue summary = detector.dataSummary(
        TypedDataset::fromRecords({"SPEND", "REGION"}, {{"1", "north"}, {"2", "south"}}));
    CHECK(summary.find("total_records")->integerValue == 2);
    CHECK(summary.find("date_range") == nullptr);
    CHECK(summary.find("metrics")->isObject());
    CHECK(summary.find("metrics")->size() == 0);

    const JsonValue empty = detector.dataSummary(TypedDataset{});
    CHECK(empty.find("total_records")->integerValue == 0);
}

TEST_CASE("PatternDetector - key metrics rank by relationship count", "[patterns]") {
    EngineConfig config;
    config.dependencyStrengthThreshold = 100.0;
    const JsonValue report = PatternDetector(config).detect(trafficDataset());
    const JsonValue& metrics = *report.find("key_metrics");
    REQUIRE(metrics.size() == 3);
    CHECK(metrics.objectValue[0].first == "VIEWS");
    CHECK(metrics.objectValue[0].second.find("relationship_count")->integerValue == 1);
    CHECK(metrics.objectValue[0].second.find("type")->stringValue == "count_metric");
    CHECK(metrics.objectValue[0].second.find("related_metrics")->arrayValue[0].stringValue == "CLICKS");
    CHECK(metrics.objectValue[2].first == "SPEND");

    EngineConfig capped = config;
    capped.maxKeyMetrics = 1;
    CHECK(PatternDetector(capped).detect(trafficDataset()).find("key_metrics")->size() == 1);
}

TEST_CASE("PatternDetector - frequency inference", "[patterns][temporal]") {
    const int64_t jan1 = unixSecondsFromCivil(2024, 1, 1);
    CHECK(PatternDetector::inferFrequency(steps(jan1, kDay, 5)) == std::optional<std::string>("D"));
    CHECK(PatternDetector::inferFrequency(steps(jan1, 2 * kDay, 5)) == std::optional<std::string>("2D"));
    CHECK(PatternDetector::inferFrequency(steps(jan1, 7 * kDay, 4)) == std::optional<std::string>("W"));
    CHECK(PatternDetector::inferFrequency(steps(jan1, 3600, 4)) == std::optional<std::string>("H"));
    CHECK(PatternDetector::inferFrequency(steps(jan1, 900, 4)) == std::optional<std::string>("15T"));

    const std::vector<int64_t> monthStarts = {jan1, unixSecondsFromCivil(2024, 2, 1), unixSecondsFromCivil(2024, 3, 1)};
    CHECK(PatternDetector::inferFrequency(monthStarts) == std::optional<std::string>("MS"));
    const std::vector<int64_t> monthEnds = {unixSecondsFromCivil(2024, 1, 31), unixSecondsFromCivil(2024, 2, 29),
                                            unixSecondsFromCivil(2024, 3, 31)};
    CHECK(PatternDetector::inferFrequency(monthEnds) == std::optional<std::string>("M"));
    const std::vector<int64_t> yearEnds = {unixSecondsFromCivil(2022, 12, 31), unixSecondsFromCivil(2023, 12, 31),
                                           unixSecondsFromCivil(2024, 12, 31)};
    CHECK(PatternDetector::inferFrequency(yearEnds) == std::optional<std::string>("A"));

    CHECK_FALSE(PatternDetector::inferFrequency(steps(jan1, kDay, 2)));
    CHECK_FALSE(PatternDetector::inferFrequency({jan1, jan1 + kDay, jan1 + 5 * kDay}));
    CHECK_FALSE(PatternDetector::inferFrequency({jan1, jan1, jan1 + kDay}));
}

TEST_CASE("PatternDetector - temporal patterns per datetime column", "[patterns][temporal]") {
    const TypedDataset dataset = TypedDataset::fromRecords(
        {"DATE", "VIEWS"},
        {{"2024-03-01", "10"}, {"2024-03-02", "12"}, {"2024-03-03", "9"}, {"2024-03-04", "15"}});
    const JsonValue report = PatternDetector(EngineConfig{}).detect(dataset);
    const JsonValue* date = report.find("temporal_patterns")->find("DATE");
    REQUIRE(date != nullptr);
    CHECK(date->find("frequency")->stringValue == "D");
    CHECK(date->find("range")->find("start")->stringValue == "2024-03-01T00:00:00");
    CHECK(date->find("range")->find("span_days")->integerValue == 3);
}
