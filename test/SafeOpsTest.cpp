#include "AugurExceptions.h"
#include "ScriptBuiltins.h"
#include "TestHelpers.h"

#include <catch2/catch.hpp>

#include <cmath>
#include <limits>

using namespace Script;

TEST_CASE("SafeOps - scalar division never raises", "[safeops]") {
    CHECK(toDouble(SafeOps::safeDivide(Value::integer(10), Value::integer(4)).scalar()) == Approx(2.5));
    CHECK(toDouble(SafeOps::safeDivide(Value::integer(1), Value::integer(0)).scalar()) == 0.0);
    CHECK(toDouble(SafeOps::safeDivide(Value::number(-3.0), Value::number(0.0)).scalar()) == 0.0);
    CHECK(toDouble(SafeOps::safeDivide(Value::none(), Value::integer(2)).scalar()) == 0.0);
    REQUIRE_THROWS_WITH(SafeOps::safeDivide(Value::string("a"), Value::integer(2)), Catch::StartsWith("TypeError"));
}

TEST_CASE("SafeOps - column ratio is zero where the denominator is zero", "[safeops]") {
    const Frame f = FrameOps::fromDataset(TestHelpers::campaignDataset());
    const Value clicks(f.column(static_cast<size_t>(f.findColumn("CLICKS"))));
    const Value views(f.column(static_cast<size_t>(f.findColumn("VIEWS"))));

    const Value ratio = SafeOps::safeDivide(clicks, views);
    REQUIRE(ratio.isSeries());
    const auto& v = ratio.series().values;
    REQUIRE(v.size() == 5);
    CHECK(toDouble(v[0]) == Approx(0.1));
    CHECK(toDouble(v[1]) == Approx(0.15));
    CHECK(toDouble(v[3]) == 0.0);
    for (const auto& cell : v) CHECK(std::isfinite(toDouble(cell)));
}

TEST_CASE("SafeOps - scalar numerator over a column", "[safeops]") {
    const Value denominators(TestHelpers::numberSeries({2.0, 0.0, 4.0}));
    const Value out = SafeOps::safeDivide(Value::integer(8), denominators);
    const auto& v = out.series().values;
    CHECK(toDouble(v[0]) == Approx(4.0));
    CHECK(toDouble(v[1]) == 0.0);
    CHECK(toDouble(v[2]) == Approx(2.0));
}

TEST_CASE("SafeOps - frame division matches columns by name", "[safeops]") {
    const Value frame = TestHelpers::runSnippet("result = df[['VIEWS', 'CLICKS']]",
                                                TestHelpers::frameOf(TestHelpers::campaignDataset()));
    const Value halved = SafeOps::safeDivide(frame, Value::integer(2));
    REQUIRE(halved.isFrame());
    CHECK(toDouble(halved.frame().columns[0].values[0]) == Approx(50.0));
}

TEST_CASE("SafeOps - contains is case-insensitive and missing-safe", "[safeops]") {
    const Value names(Series::make(std::string("WIDGET_NAME"),
                                   {Scalar(std::string("Promo Banner")), Scalar{}, Scalar(std::string("footer"))}));
    const Value mask = SafeOps::safeContains(names, Value::string("BANNER"));
    REQUIRE(mask.isSeries());
    CHECK(std::get<bool>(mask.series().values[0]));
    CHECK_FALSE(std::get<bool>(mask.series().values[1]));
    CHECK_FALSE(std::get<bool>(mask.series().values[2]));

    CHECK(std::get<bool>(SafeOps::safeContains(Value::string("Sidebar"), Value::string("bar")).scalar()));
    REQUIRE_THROWS_AS(SafeOps::safeContains(Value(DictValue{}), Value::string("x")), Augur::ScriptError);
}

TEST_CASE("SafeOps - clean_result zeroes non-finite numbers", "[safeops]") {
    const double inf = std::numeric_limits<double>::infinity();
    const Value cleaned = SafeOps::cleanResult(Value(TestHelpers::numberSeries({1.0, inf, std::nan("")})));
    const auto& v = cleaned.series().values;
    CHECK(toDouble(v[0]) == Approx(1.0));
    CHECK(toDouble(v[1]) == 0.0);
    CHECK(toDouble(v[2]) == 0.0);

    DictValue d;
    d.set(Scalar(std::string("rate")), Value::number(-inf));
    d.set(Scalar(std::string("label")), Value::string("x"));
    const Value cleanedDict = SafeOps::cleanResult(Value(d));
    CHECK(toDouble(cleanedDict.dict().find(Scalar(std::string("rate")))->scalar()) == 0.0);
    CHECK(std::get<std::string>(cleanedDict.dict().find(Scalar(std::string("label")))->scalar()) == "x");
}

TEST_CASE("SafeOps - zero_non_finite only touches scalars and dict values", "[safeops]") {
    const Value zeroed = SafeOps::zeroNonFinite(Value::number(std::nan("")));
    REQUIRE(std::holds_alternative<int64_t>(zeroed.scalar()));
    CHECK(std::get<int64_t>(zeroed.scalar()) == 0);
    CHECK(toDouble(SafeOps::zeroNonFinite(Value::number(2.5)).scalar()) == Approx(2.5));

    const Value series(TestHelpers::numberSeries({std::nan("")}));
    CHECK(std::isnan(toDouble(SafeOps::zeroNonFinite(series).series().values[0])));
}

TEST_CASE("SafeOps - helpers are reachable from snippets", "[safeops]") {
    const Value v = TestHelpers::runSnippet("result = safe_divide(df['CLICKS'].sum(), 0)",
                                            TestHelpers::frameOf(TestHelpers::campaignDataset()));
    CHECK(toDouble(v.scalar()) == 0.0);
}
