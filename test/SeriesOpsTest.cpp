#include "SeriesOps.h"
#include "TestHelpers.h"

#include <catch2/catch.hpp>

#include <cmath>

using namespace Script;
using TestHelpers::runSnippet;

namespace {
Value run(const std::string& code) {
    return runSnippet(code, TestHelpers::frameOf(TestHelpers::campaignDataset()));
}

std::vector<Scalar> ints(std::initializer_list<int64_t> values) {
    std::vector<Scalar> out;
    for (int64_t v : values) out.emplace_back(v);
    return out;
}
} // namespace

TEST_CASE("SeriesOps - aggregate keeps integer sums integral", "[series]") {
    const Scalar total = SeriesOps::aggregate("sum", ints({1, 2, 3}), DType::Int);
    REQUIRE(std::holds_alternative<int64_t>(total));
    CHECK(std::get<int64_t>(total) == 6);

    const Scalar floatTotal = SeriesOps::aggregate("sum", {Scalar(1.5), Scalar(2.5)}, DType::Float);
    REQUIRE(std::holds_alternative<double>(floatTotal));
    CHECK(std::get<double>(floatTotal) == Approx(4.0));
}

TEST_CASE("SeriesOps - aggregate skips missing cells except for size", "[series]") {
    const std::vector<Scalar> cells = {Scalar(2.0), Scalar{}, Scalar(4.0), Scalar(9.0)};
    CHECK(std::get<int64_t>(SeriesOps::aggregate("count", cells, DType::Float)) == 3);
    CHECK(std::get<int64_t>(SeriesOps::aggregate("size", cells, DType::Float)) == 4);
    CHECK(toDouble(SeriesOps::aggregate("mean", cells, DType::Float)) == Approx(5.0));
    CHECK(toDouble(SeriesOps::aggregate("median", cells, DType::Float)) == Approx(4.0));
    CHECK(toDouble(SeriesOps::aggregate("min", cells, DType::Float)) == Approx(2.0));
    CHECK(toDouble(SeriesOps::aggregate("std", cells, DType::Float)) == Approx(3.605551).epsilon(1e-5));
    CHECK(toDouble(SeriesOps::aggregate("var", cells, DType::Float, 0)) == Approx(26.0 / 3.0));
    CHECK(std::get<int64_t>(SeriesOps::aggregate("nunique", ints({1, 1, 2}), DType::Int)) == 2);
    CHECK(SeriesOps::isAggregation("sum"));
    CHECK_FALSE(SeriesOps::isAggregation("cumsum"));
}

TEST_CASE("SeriesOps - elementwise division by zero yields inf and nan", "[series]") {
    const Value numerators(Series::make(std::string("n"), {Scalar(int64_t{4}), Scalar(int64_t{0}), Scalar(int64_t{-3})}));
    const Value denominators(Series::make(std::string("d"), {Scalar(int64_t{0}), Scalar(int64_t{0}), Scalar(int64_t{0})}));
    const Value quotient = SeriesOps::binary("/", numerators, denominators);
    REQUIRE(quotient.isSeries());
    const auto& v = quotient.series().values;
    CHECK(std::isinf(toDouble(v[0])));
    CHECK(toDouble(v[0]) > 0.0);
    CHECK(std::isnan(toDouble(v[1])));
    CHECK(toDouble(v[2]) < 0.0);
}

TEST_CASE("SeriesOps - half-even rounding", "[series]") {
    CHECK(SeriesOps::roundHalfEven(2.5, 0) == Approx(2.0));
    CHECK(SeriesOps::roundHalfEven(3.5, 0) == Approx(4.0));
    CHECK(SeriesOps::roundHalfEven(1.234, 2) == Approx(1.23));
}

TEST_CASE("SeriesOps - value_counts orders by count then first appearance", "[series]") {
    const Value v = run("result = df['WIDGET_NAME'].value_counts()");
    REQUIRE(v.isSeries());
    const Series& s = v.series();
    REQUIRE(s.size() == 3);
    CHECK(s.name == std::optional<std::string>("count"));
    CHECK(s.index.names.front() == "WIDGET_NAME");
    CHECK(s.index.displayAt(0) == "Alpha");
    CHECK(s.index.displayAt(1) == "Beta");
    CHECK(s.index.displayAt(2) == "Gamma");
    CHECK(std::get<int64_t>(s.values[2]) == 1);

    const Value share = run("result = df['LAYOUT'].value_counts(normalize=True)");
    CHECK(share.series().name == std::optional<std::string>("proportion"));
    CHECK(toDouble(share.series().values[0]) == Approx(0.6));
}

TEST_CASE("SeriesOps - common methods", "[series]") {
    SECTION("quantile and idxmax") {
        CHECK(toDouble(run("result = df['VIEWS'].quantile(0.5)").scalar()) == Approx(200.0));
        CHECK(std::get<int64_t>(run("result = df['VIEWS'].idxmax()").scalar()) == 4);
    }
    SECTION("sorting and head") {
        const Value v = run("result = df['CLICKS'].sort_values(ascending=False).head(2)");
        REQUIRE(v.series().size() == 2);
        CHECK(toDouble(v.series().values[0]) == Approx(40.0));
        CHECK(toDouble(v.series().values[1]) == Approx(30.0));
    }
    SECTION("nlargest keeps original labels") {
        const Value v = run("result = df['VIEWS'].nlargest(1)");
        CHECK(v.series().index.displayAt(0) == "4");
    }
    SECTION("isin and between") {
        CHECK(std::get<int64_t>(run("result = df['WIDGET_NAME'].isin(['Alpha', 'Gamma']).sum()").scalar()) == 3);
        CHECK(std::get<int64_t>(run("result = df['VIEWS'].between(100, 300).sum()").scalar()) == 3);
    }
    SECTION("cumsum and diff") {
        const Value cum = run("result = df['CLICKS'].cumsum()");
        CHECK(toDouble(cum.series().values[4]) == Approx(105.0));
        const Value diff = run("result = df['CLICKS'].diff()");
        CHECK(isMissing(diff.series().values[0]));
        CHECK(toDouble(diff.series().values[1]) == Approx(20.0));
    }
    SECTION("astype to str") {
        const Value v = run("result = df['VIEWS'].astype(str).tolist()");
        REQUIRE(v.isList());
        CHECK(std::get<std::string>(v.list().items[1].scalar()) == "200");
    }
}

TEST_CASE("SeriesOps - str accessor", "[series][str]") {
    CHECK(std::get<int64_t>(run("result = df['WIDGET_NAME'].str.contains('alp', case=False).sum()").scalar()) == 2);
    CHECK(std::get<int64_t>(run("result = df['WIDGET_NAME'].str.startswith('B').sum()").scalar()) == 2);
    const Value upper = run("result = df['LAYOUT'].str.upper()");
    CHECK(std::get<std::string>(upper.series().values[0]) == "GRID");
    CHECK(std::get<int64_t>(run("result = df['WIDGET_NAME'].str.len().max()").scalar()) == 5);
}

TEST_CASE("SeriesOps - dt accessor", "[series][dt]") {
    CHECK(std::get<int64_t>(run("result = df['DATE'].dt.day.sum()").scalar()) == 15);
    const Value weekday = run("result = df['DATE'].dt.dayofweek");
    CHECK(std::get<int64_t>(weekday.series().values[0]) == 0);
    CHECK(std::get<int64_t>(run("result = df['DATE'].dt.month.max()").scalar()) == 1);
}
