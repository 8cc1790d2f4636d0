#include "PlanEngine.h"
#include "TestHelpers.h"

#include <catch2/catch.hpp>

namespace {
const std::string kDataDir = AUGUR_TEST_DATA_DIR;
}

TEST_CASE("PlanEngine - pattern report has every section", "[engine]") {
    const PlanEngine engine;
    const JsonValue report = engine.detectPatterns(TypedDataset::loadCsv(kDataDir + "/views.csv"));

    for (const char* key : {"correlations", "categorical_patterns", "temporal_patterns", "key_metrics", "relationships"}) {
        INFO(key);
        CHECK(report.find(key) != nullptr);
    }
    CHECK(report.find("correlations")->isArray());
    CHECK(report.find("key_metrics")->isObject());
}

TEST_CASE("PlanEngine - executes a plan on the raw dataset", "[engine]") {
    const PlanEngine engine;
    const TypedDataset dataset = TypedDataset::loadCsv(kDataDir + "/views.csv");
    const MetricResults results = engine.executePlan(dataset, AnalysisPlan::loadFile(kDataDir + "/plan.json"));

    REQUIRE(results.size() == 4);
    CHECK(results.find("Total Views")->value.asDouble() == Approx(14500.0));

    const JsonValue json = results.toJson();
    CHECK(json.objectValue[1].first == "Average CTR");
    CHECK(json.find("Average CTR")->asDouble() == Approx(0.92));

    CHECK(dataset.rowCount() == 12);
    CHECK(dataset.columns()[0].name == "widget_name");
}

TEST_CASE("PlanEngine - empty plan gives empty results", "[engine]") {
    const PlanEngine engine;
    const MetricResults results = engine.executePlan(TestHelpers::campaignDataset(), AnalysisPlan{});
    CHECK(results.empty());
    CHECK(results.toJson().isObject());
    CHECK(results.toJson().objectValue.empty());
}

TEST_CASE("PlanEngine - ratios over zero denominators come back as zero", "[engine]") {
    const PlanEngine engine;
    AnalysisPlan plan;
    plan.metrics = {
        {"CTR", "df['CLICKS'] / df['VIEWS']"},
        {"Max CTR", "(df['CLICKS'] / df['VIEWS']).max()"},
        {"Overall", "df['CLICKS'].sum() / df[df['VIEWS'] < 0]['VIEWS'].sum()"},
    };
    const MetricResults results = engine.executePlan(TestHelpers::campaignDataset(), plan);

    const JsonValue& ctr = results.find("CTR")->value;
    REQUIRE(ctr.isObject());
    CHECK(ctr.find("0")->asDouble() == Approx(0.1));
    CHECK(ctr.find("3")->asDouble() == Approx(0.0));
    CHECK(results.find("Max CTR")->value.asDouble() == Approx(0.15));
    CHECK_FALSE(results.find("Overall")->failed);
    CHECK(results.find("Overall")->value.asDouble() == Approx(0.0));
}

TEST_CASE("PlanEngine - configuration reaches the executor", "[engine]") {
    EngineConfig config;
    config.deniedNames = {"len"};
    const PlanEngine engine(config);
    AnalysisPlan plan;
    plan.metrics = {{"Rows", "len(df)"}};
    const MetricResults results = engine.executePlan(TestHelpers::campaignDataset(), plan);
    CHECK(results.find("Rows")->failed);
    CHECK_THAT(results.find("Rows")->error, Catch::Contains("'len'"));
}

TEST_CASE("PlanEngine - data summary of the raw export", "[engine][summary]") {
    const PlanEngine engine;
    const JsonValue summary = engine.summarizeData(TypedDataset::loadCsv(kDataDir + "/views.csv"));

    CHECK(summary.find("total_records")->integerValue == 12);
    const JsonValue& metrics = *summary.find("metrics");
    CHECK(metrics.find("total_views")->asDouble() == Approx(24499.0));
    const JsonValue& widgets = *metrics.find("widget_distribution");
    CHECK(widgets.objectValue[0].first == "Alpha");
    CHECK(widgets.objectValue[0].second.integerValue == 3);
    CHECK(summary.find("date_range") == nullptr);
}
