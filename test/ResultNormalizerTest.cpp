#include "ResultNormalizer.h"
#include "TestHelpers.h"

#include <catch2/catch.hpp>

#include <cmath>
#include <limits>

using namespace Script;

namespace {
// Widget-level table with VIEWS 1..n.
Frame widgetFrame(size_t n) {
    std::vector<Scalar> names;
    std::vector<Scalar> layouts;
    std::vector<Scalar> views;
    for (size_t i = 0; i < n; ++i) {
        names.emplace_back("W" + std::to_string(i % 3));
        layouts.emplace_back(std::string(i % 2 == 0 ? "grid" : "list"));
        views.emplace_back(static_cast<int64_t>(i + 1));
    }
    Frame f;
    f.setColumn("WIDGET_NAME", std::move(names));
    f.setColumn("LAYOUT", std::move(layouts));
    f.setColumn("VIEWS", std::move(views));
    return f;
}

Value viewsOf(const Frame& f) {
    return Value(f.column(static_cast<size_t>(f.findColumn("VIEWS"))));
}
} // namespace

TEST_CASE("ResultNormalizer - scalars are rounded and cleaned", "[normalizer]") {
    const ResultNormalizer normalizer{EngineConfig{}};
    const Frame empty;
    CHECK(normalizer.normalize(Value::number(3.14159), empty).asDouble() == Approx(3.14));
    CHECK(normalizer.normalize(Value::number(std::numeric_limits<double>::infinity()), empty).asDouble() == 0.0);
    CHECK(normalizer.normalize(Value::integer(7), empty).isInteger());
    CHECK(normalizer.normalize(Value::none(), empty).isNull());
    CHECK(normalizer.normalize(Value::string("ok"), empty).stringValue == "ok");

    EngineConfig precise;
    precise.resultPrecision = 4;
    CHECK(ResultNormalizer(precise).normalize(Value::number(3.14159), empty).asDouble() == Approx(3.1416));
}

TEST_CASE("ResultNormalizer - containers become JSON objects and arrays", "[normalizer]") {
    const ResultNormalizer normalizer{EngineConfig{}};
    const Value frame = TestHelpers::frameOf(TestHelpers::campaignDataset());

    SECTION("series keyed by label") {
        const Value grouped = TestHelpers::runSnippet("result = df.groupby('LAYOUT')['VIEWS'].mean()", frame);
        const JsonValue json = normalizer.normalize(grouped, frame.frame());
        REQUIRE(json.isObject());
        CHECK(json.find("grid")->asDouble() == Approx(266.67));
        CHECK(json.find("list")->asDouble() == Approx(100.0));
    }
    SECTION("frame as records") {
        const Value head = TestHelpers::runSnippet("result = df[['WIDGET_NAME', 'VIEWS']].head(2)", frame);
        const JsonValue json = normalizer.normalize(head, frame.frame());
        REQUIRE(json.isArray());
        REQUIRE(json.size() == 2);
        CHECK(json.arrayValue[1].find("WIDGET_NAME")->stringValue == "Beta");
        CHECK(json.arrayValue[1].find("VIEWS")->integerValue == 200);
    }
    SECTION("nested dicts and lists") {
        const Value nested = TestHelpers::runSnippet("result = {'top': [1, 1.239], 'none': None}", frame);
        const JsonValue json = normalizer.normalize(nested, frame.frame());
        REQUIRE(json.find("top")->isArray());
        CHECK(json.find("top")->arrayValue[1].asDouble() == Approx(1.24));
        CHECK(json.find("none")->isNull());
    }
    SECTION("timestamps become strings") {
        const Value first = TestHelpers::runSnippet("result = df['DATE'].min()", frame);
        const JsonValue json = normalizer.normalize(first, frame.frame());
        REQUIRE(json.isString());
        CHECK(json.stringValue.find("2024-01-01") == 0);
    }
}

TEST_CASE("ResultNormalizer - large numeric series become percentile buckets", "[normalizer][buckets]") {
    const ResultNormalizer normalizer{EngineConfig{}};
    const Frame dataset = widgetFrame(1500);
    const JsonValue json = normalizer.normalize(viewsOf(dataset), dataset);

    REQUIRE(json.find("summary_type") != nullptr);
    CHECK(json.find("summary_type")->stringValue == "percentile_buckets");
    CHECK(json.find("total_count")->integerValue == 1500);

    const JsonValue& buckets = *json.find("buckets");
    REQUIRE(buckets.isArray());
    REQUIRE(buckets.size() <= 6);
    REQUIRE(buckets.size() == 6);

    int64_t covered = 0;
    for (const auto& bucket : buckets.arrayValue) {
        const JsonValue& stats = *bucket.find("stats");
        const double lo = stats.find("min")->asDouble();
        const double hi = stats.find("max")->asDouble();
        const double mean = stats.find("mean")->asDouble();
        CHECK(lo <= mean);
        CHECK(mean <= hi);
        covered += bucket.find("sample_size")->integerValue;
    }
    CHECK(covered <= 1500);
    CHECK(covered == 1500);

    const JsonValue& top = buckets.arrayValue.front();
    CHECK(top.find("range")->stringValue == "0-1");
    CHECK(top.find("sample_size")->integerValue == 15);
    CHECK(top.find("stats")->find("max")->asDouble() == Approx(1500.0));
    CHECK(top.find("stats")->find("min")->asDouble() == Approx(1486.0));

    const JsonValue& characteristics = *top.find("characteristics");
    const JsonValue* views = characteristics.find("numeric")->find("VIEWS");
    REQUIRE(views != nullptr);
    CHECK(views->find("average")->asDouble() == Approx(1493.0));
    const JsonValue* widgets = characteristics.find("categorical")->find("WIDGET_NAME");
    REQUIRE(widgets != nullptr);
    CHECK(widgets->size() == 2);
    CHECK(characteristics.find("categorical")->find("ACCOUNT_NAME") == nullptr);

    CHECK(buckets.arrayValue.back().find("range")->stringValue == "50-100");
    CHECK(buckets.arrayValue.back().find("sample_size")->integerValue == 750);
}

TEST_CASE("ResultNormalizer - groupby results join back through the key column", "[normalizer][buckets]") {
    EngineConfig config;
    config.largeResultThreshold = 10;
    const ResultNormalizer normalizer(config);

    std::vector<Scalar> names;
    std::vector<Scalar> views;
    for (int i = 0; i < 40; ++i) {
        names.emplace_back("W" + std::to_string(i % 20));
        views.emplace_back(static_cast<int64_t>(i % 20 == 0 ? 1000 : i));
    }
    Frame dataset;
    dataset.setColumn("WIDGET_NAME", std::move(names));
    dataset.setColumn("VIEWS", std::move(views));

    const Value grouped = TestHelpers::runSnippet("result = df.groupby('WIDGET_NAME')['VIEWS'].sum()", Value(dataset));
    const JsonValue json = normalizer.normalize(grouped, dataset);
    REQUIRE(json.find("summary_type") != nullptr);
    const JsonValue& buckets = *json.find("buckets");
    REQUIRE(buckets.size() > 0);

    // W0 holds the largest total and sits alone in the top 5 percent.
    const JsonValue& top = buckets.arrayValue.front();
    CHECK(top.find("range")->stringValue == "1-5");
    CHECK(top.find("sample_size")->integerValue == 1);
    const JsonValue* widgets = top.find("characteristics")->find("categorical")->find("WIDGET_NAME");
    REQUIRE(widgets != nullptr);
    CHECK(widgets->find("W0")->asDouble() == Approx(1.0));
}

TEST_CASE("ResultNormalizer - large non-numeric results are sampled", "[normalizer][sampling]") {
    EngineConfig config;
    config.sampleSize = 5;
    const ResultNormalizer normalizer(config);
    const Frame dataset = widgetFrame(1200);

    SECTION("string series") {
        const Value names(dataset.column(0));
        const JsonValue json = normalizer.normalize(names, dataset);
        const JsonValue* summary = json.find("summary");
        REQUIRE(summary != nullptr);
        CHECK(summary->find("count")->integerValue == 1200);
        CHECK(summary->find("mean")->isNull());
        CHECK(summary->find("sample")->size() == 5);
    }
    SECTION("frame with several numeric columns") {
        Frame wide = dataset;
        std::vector<Scalar> clicks(wide.rows(), Scalar(int64_t{2}));
        wide.setColumn("CLICKS", std::move(clicks));
        const JsonValue json = normalizer.normalize(Value(wide), dataset);
        const JsonValue* summary = json.find("summary");
        REQUIRE(summary != nullptr);
        CHECK(summary->find("mean")->find("CLICKS")->asDouble() == Approx(2.0));
        CHECK(summary->find("mean")->find("VIEWS")->asDouble() == Approx(600.5));
        REQUIRE(summary->find("sample")->isArray());
        CHECK(summary->find("sample")->size() == 5);
    }
    SECTION("list of numbers") {
        std::vector<Value> items;
        for (int i = 0; i < 1001; ++i) items.push_back(Value::integer(1));
        const JsonValue json = normalizer.normalize(makeList(std::move(items)), dataset);
        CHECK(json.find("summary")->find("mean")->asDouble() == Approx(1.0));
    }
}

TEST_CASE("ResultNormalizer - normalizing twice changes nothing", "[normalizer]") {
    const ResultNormalizer normalizer{EngineConfig{}};
    const Frame dataset = widgetFrame(1500);
    const Value frame = TestHelpers::frameOf(TestHelpers::campaignDataset());

    const std::vector<JsonValue> outputs = {
        normalizer.normalize(Value::number(2.0 / 3.0), dataset),
        normalizer.normalize(viewsOf(dataset), dataset),
        normalizer.normalize(TestHelpers::runSnippet("result = df.groupby('LAYOUT')['CLICKS'].mean()", frame), frame.frame())
    };
    for (const auto& once : outputs) {
        CHECK(normalizer.normalize(once) == once);
        CHECK(parseJsonText(once.dump()) == once);
    }
}

TEST_CASE("ResultNormalizer - JSON converts back into script values", "[normalizer]") {
    const JsonValue json = parseJsonText(R"({"total": 14500, "rate": 0.92, "tags": ["a", null], "ok": true})");
    const Value v = ResultNormalizer::toScriptValue(json);
    REQUIRE(v.isDict());
    CHECK(std::get<int64_t>(v.dict().find(Scalar(std::string("total")))->scalar()) == 14500);
    CHECK(toDouble(v.dict().find(Scalar(std::string("rate")))->scalar()) == Approx(0.92));
    const Value* tags = v.dict().find(Scalar(std::string("tags")));
    REQUIRE(tags->isList());
    CHECK(tags->list().items[1].isNone());
    CHECK(std::get<bool>(v.dict().find(Scalar(std::string("ok")))->scalar()));
}
