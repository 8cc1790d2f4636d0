#include "AugurExceptions.h"
#include "SandboxExecutor.h"
#include "ScriptParser.h"
#include "TestHelpers.h"

#include <catch2/catch.hpp>

#include <numeric>

namespace {
const std::string kDataDir = AUGUR_TEST_DATA_DIR;

const TypedColumn& columnNamed(const TypedDataset& dataset, const std::string& name) {
    const int idx = dataset.findColumnIndex(name);
    REQUIRE(idx >= 0);
    return dataset.columns()[static_cast<size_t>(idx)];
}

double columnSum(const TypedDataset& dataset, const std::string& name) {
    const auto& values = std::get<std::vector<double>>(columnNamed(dataset, name).values);
    return std::accumulate(values.begin(), values.end(), 0.0);
}

AnalysisPlan planOf(std::vector<MetricSpec> metrics) {
    AnalysisPlan plan;
    plan.metrics = std::move(metrics);
    return plan;
}
} // namespace

TEST_CASE("SandboxExecutor - prepares a loaded export", "[executor]") {
    const SandboxExecutor executor{EngineConfig{}};
    const TypedDataset raw = TypedDataset::loadCsv(kDataDir + "/views.csv");
    const TypedDataset prepared = executor.prepareDataset(raw);

    CHECK(raw.rowCount() == 12);
    REQUIRE(prepared.rowCount() == 10);
    CHECK(prepared.columns()[0].name == "WIDGET_NAME");
    CHECK(prepared.columns()[3].name == "CLICKS");
    CHECK(columnNamed(prepared, "VIEWS").type == ColumnType::NUMERIC);
    CHECK(columnSum(prepared, "VIEWS") == Approx(14500.0));
    CHECK(columnSum(prepared, "CLICKS") == Approx(134.0));
}

TEST_CASE("SandboxExecutor - coerces count columns stored as text", "[executor]") {
    const SandboxExecutor executor{EngineConfig{}};
    const TypedDataset raw = TypedDataset::fromRecords(
        {"widget_name", "number_of_items"},
        {{"Alpha", "1,000"}, {"Beta", "junk"}, {"Gamma", ""}, {"Delta", "12"}});
    const TypedDataset prepared = executor.prepareDataset(raw);

    const TypedColumn& items = columnNamed(prepared, "NUMBER_OF_ITEMS");
    REQUIRE(items.type == ColumnType::NUMERIC);
    const auto& values = std::get<std::vector<double>>(items.values);
    CHECK(values == std::vector<double>{1000.0, 0.0, 0.0, 12.0});
    CHECK_FALSE(items.isMissing(2));
}

TEST_CASE("SandboxExecutor - placeholder rows are matched per configured column", "[executor]") {
    EngineConfig config;
    config.placeholderTerms = {"tbd"};
    const SandboxExecutor executor(config);
    const TypedDataset raw = TypedDataset::fromRecords(
        {"WIDGET_NAME", "NOTE", "VIEWS"},
        {{" TBD ", "ok", "1"}, {"Alpha", "tbd", "2"}, {"widget", "ok", "3"}});
    const TypedDataset prepared = executor.prepareDataset(raw);

    REQUIRE(prepared.rowCount() == 2);
    CHECK(columnSum(prepared, "VIEWS") == Approx(5.0));
}

TEST_CASE("SandboxExecutor - execute reports errors instead of throwing", "[executor]") {
    const SandboxExecutor executor{EngineConfig{}};
    const Script::Value frame = TestHelpers::frameOf(TestHelpers::campaignDataset());

    const auto ok = executor.execute(Script::ScriptParser::parse("result = df['VIEWS'].sum()"), frame, {});
    REQUIRE(ok.ok);
    CHECK(std::get<int64_t>(ok.value.scalar()) == 1000);

    const auto missing = executor.execute(Script::ScriptParser::parse("result = df['NOPE'].sum()"), frame, {});
    CHECK_FALSE(missing.ok);
    CHECK_THAT(missing.error, Catch::StartsWith("KeyError"));

    const auto divided = executor.execute(Script::ScriptParser::parse("result = 1 / 0"), frame, {});
    CHECK_FALSE(divided.ok);
    CHECK_THAT(divided.error, Catch::StartsWith("ZeroDivisionError"));
}

TEST_CASE("SandboxExecutor - earlier results are visible to later snippets", "[executor]") {
    MetricResults results;
    results.add({"Total Views", JsonValue::integer(1000), false, ""});
    results.add({"Broken Metric", JsonValue::null(), true, "KeyError: 'X'"});

    const auto bindings = SandboxExecutor::priorBindings(results);
    REQUIRE(bindings.size() == 2);
    CHECK(bindings[0].first == "total_views");
    CHECK(bindings[1].first == "broken_metric");
    CHECK(bindings[1].second.isNone());

    const SandboxExecutor executor{EngineConfig{}};
    const Script::Value frame = TestHelpers::frameOf(TestHelpers::campaignDataset());
    const auto outcome = executor.execute(
        Script::ScriptParser::parse("result = total_views * 2 if broken_metric is None else 0"), frame, bindings);
    REQUIRE(outcome.ok);
    CHECK(std::get<int64_t>(outcome.value.scalar()) == 2000);
}

TEST_CASE("SandboxExecutor - runs a plan end to end", "[executor]") {
    const SandboxExecutor executor{EngineConfig{}};
    const TypedDataset prepared = executor.prepareDataset(TypedDataset::loadCsv(kDataDir + "/views.csv"));
    const MetricResults results = executor.executePlan(prepared, AnalysisPlan::loadFile(kDataDir + "/plan.json"));

    REQUIRE(results.size() == 4);
    for (const auto& entry : results.entries()) {
        INFO(entry.name << ": " << entry.error);
        CHECK_FALSE(entry.failed);
    }

    CHECK(results.find("Total Views")->value.asDouble() == Approx(14500.0));
    CHECK(results.find("Average CTR")->value.asDouble() == Approx(0.92));
    CHECK(results.find("Scaled Total")->value.asDouble() == Approx(14.5));

    const JsonValue& perWidget = results.find("Views Per Widget")->value;
    REQUIRE(perWidget.isObject());
    REQUIRE(perWidget.objectValue.size() == 4);
    CHECK(perWidget.find("Alpha")->asDouble() == Approx(3800.0));
    CHECK(perWidget.find("Beta")->asDouble() == Approx(4400.0));
    CHECK(perWidget.find("Delta")->asDouble() == Approx(3300.0));
    CHECK(perWidget.find("Gamma")->asDouble() == Approx(3000.0));
}

TEST_CASE("SandboxExecutor - a failing metric does not stop the plan", "[executor]") {
    const SandboxExecutor executor{EngineConfig{}};
    const TypedDataset prepared = executor.prepareDataset(TestHelpers::campaignDataset());
    const MetricResults results = executor.executePlan(prepared, planOf({
        {"Shell", "import os\nos.system('ls')"},
        {"Rows", "len(df)"},
        {"Missing Column", "df['SPEND'].sum()"},
        {"Nothing", "None"},
        {"Uses Failed", "shell"},
    }));

    REQUIRE(results.size() == 5);
    const MetricResult* shell = results.find("Shell");
    CHECK(shell->failed);
    CHECK_THAT(shell->error, Catch::Contains("import statements are not allowed"));
    CHECK(shell->toJson().find("metric")->stringValue == "Shell");

    CHECK_FALSE(results.find("Rows")->failed);
    CHECK(results.find("Rows")->value.asDouble() == Approx(5.0));

    CHECK(results.find("Missing Column")->failed);
    CHECK_THAT(results.find("Missing Column")->error, Catch::StartsWith("KeyError"));

    CHECK_FALSE(results.find("Nothing")->failed);
    CHECK(results.find("Nothing")->value.isNull());

    CHECK_FALSE(results.find("Uses Failed")->failed);
    CHECK(results.find("Uses Failed")->value.isNull());
}

TEST_CASE("SandboxExecutor - a repeated metric name keeps the first position", "[executor]") {
    const SandboxExecutor executor{EngineConfig{}};
    const TypedDataset prepared = executor.prepareDataset(TestHelpers::campaignDataset());
    const MetricResults results = executor.executePlan(prepared, planOf({
        {"Score", "1"},
        {"Other", "score + 1"},
        {"Score", "other * 10"},
    }));

    REQUIRE(results.size() == 2);
    CHECK(results.entries()[0].name == "Score");
    CHECK(results.entries()[0].value.asDouble() == Approx(20.0));
    CHECK(results.entries()[1].value.asDouble() == Approx(2.0));
}
