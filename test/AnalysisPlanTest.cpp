#include "AnalysisPlan.h"
#include "AugurExceptions.h"

#include <catch2/catch.hpp>

namespace {
const std::string kDataDir = AUGUR_TEST_DATA_DIR;
}

TEST_CASE("AnalysisPlan - parses metrics in order", "[plan]") {
    const AnalysisPlan plan = AnalysisPlan::loadFile(kDataDir + "/plan.json");
    REQUIRE(plan.metrics.size() == 4);
    CHECK(plan.metrics[0].name == "Total Views");
    CHECK(plan.metrics[0].code == "df['VIEWS'].sum()");
    CHECK(plan.metrics[3].name == "Scaled Total");
}

TEST_CASE("AnalysisPlan - empty metric list is allowed", "[plan]") {
    CHECK(AnalysisPlan::fromJson(parseJsonText(R"({"metrics": []})")).metrics.empty());
}

TEST_CASE("AnalysisPlan - malformed plans", "[plan]") {
    REQUIRE_THROWS_AS(AnalysisPlan::fromJson(parseJsonText("[]")), Augur::PlanException);
    REQUIRE_THROWS_WITH(AnalysisPlan::fromJson(parseJsonText(R"({"metric": []})")), Catch::Contains("'metrics'"));
    REQUIRE_THROWS_WITH(AnalysisPlan::fromJson(parseJsonText(R"({"metrics": [{"name": "", "code": "1"}]})")),
                        Catch::Contains("metrics[0]"));
    REQUIRE_THROWS_WITH(AnalysisPlan::fromJson(parseJsonText(R"({"metrics": [{"name": "a", "code": "1"}, {"name": "b"}]})")),
                        Catch::Contains("metrics[1]"));
    REQUIRE_THROWS_AS(AnalysisPlan::loadFile(kDataDir + "/missing_plan.json"), Augur::IOException);
    REQUIRE_THROWS_AS(AnalysisPlan::loadFile(kDataDir + "/engine.conf"), Augur::PlanException);
}

TEST_CASE("MetricResults - entries keep plan order and replace by name", "[plan]") {
    MetricResults results;
    results.add({"Total Views", JsonValue::integer(10), false, ""});
    results.add({"Average CTR", JsonValue::null(), true, "ZeroDivisionError: division by zero"});
    results.add({"Total Views", JsonValue::integer(20), false, ""});

    REQUIRE(results.size() == 2);
    CHECK(results.entries()[0].value.integerValue == 20);
    CHECK(results.find("Average CTR")->failed);
    CHECK(results.find("Nope") == nullptr);

    const JsonValue json = results.toJson();
    CHECK(json.objectValue[0].first == "Total Views");
    const JsonValue* failed = json.find("Average CTR");
    REQUIRE(failed != nullptr);
    CHECK(failed->find("metric")->stringValue == "Average CTR");
    CHECK(failed->find("error")->stringValue == "ZeroDivisionError: division by zero");
}

TEST_CASE("AnalysisPlan - metric names become identifiers", "[plan]") {
    CHECK(metricIdentifier("Total Views") == "total_views");
    CHECK(metricIdentifier("  CTR ") == "ctr");
    CHECK(metricIdentifier("Views Per Widget") == "views_per_widget");
}
