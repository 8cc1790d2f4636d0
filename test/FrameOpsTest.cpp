#include "FrameOps.h"
#include "TestHelpers.h"

#include <catch2/catch.hpp>

using namespace Script;
using TestHelpers::runSnippet;

namespace {
Value run(const std::string& code) {
    return runSnippet(code, TestHelpers::frameOf(TestHelpers::campaignDataset()));
}
} // namespace

TEST_CASE("FrameOps - dataset columns map to script dtypes", "[frame]") {
    const Frame f = FrameOps::fromDataset(TestHelpers::campaignDataset());
    REQUIRE(f.rows() == 5);
    REQUIRE(f.columns.size() == 5);
    CHECK(f.index.isRange());
    CHECK(f.columns[f.findColumn("WIDGET_NAME")].dtype == DType::String);
    CHECK(f.columns[f.findColumn("VIEWS")].dtype == DType::Int);
    CHECK(f.columns[f.findColumn("DATE")].dtype == DType::Datetime);
    CHECK(f.findColumn("MISSING") == -1);
}

TEST_CASE("FrameOps - numeric columns with gaps stay float", "[frame]") {
    const TypedDataset dataset = TypedDataset::fromRecords({"SPEND"}, {{"1.5"}, {""}, {"3"}, {"4"}, {"5"}});
    const Frame f = FrameOps::fromDataset(dataset);
    REQUIRE(f.columns.size() == 1);
    CHECK(f.columns[0].dtype == DType::Float);
    CHECK(isMissing(f.columns[0].values[1]));
}

TEST_CASE("FrameOps - selection and ordering", "[frame]") {
    SECTION("column list") {
        const Value v = run("result = df[['VIEWS', 'CLICKS']]");
        REQUIRE(v.isFrame());
        CHECK(v.frame().columns.size() == 2);
        CHECK(v.frame().columns[1].name == "CLICKS");
    }
    SECTION("sort_values then head") {
        const Value v = run("result = df.sort_values('CLICKS', ascending=False).head(2)");
        REQUIRE(v.frame().rows() == 2);
        CHECK(std::get<std::string>(v.frame().columns[0].values[0]) == "Beta");
        CHECK(v.frame().index.displayAt(0) == "4");
    }
    SECTION("iloc and loc") {
        CHECK(std::get<int64_t>(run("result = df.iloc[1, 2]").scalar()) == 200);
        CHECK(std::get<std::string>(run("result = df.loc[2, 'WIDGET_NAME']").scalar()) == "Alpha");
        CHECK(run("result = df.iloc[1:3]").frame().rows() == 2);
    }
    SECTION("column reductions") {
        const Value v = run("result = df[['VIEWS', 'CLICKS']].sum()");
        REQUIRE(v.isSeries());
        CHECK(v.series().index.displayAt(0) == "VIEWS");
        CHECK(toDouble(v.series().values[0]) == Approx(1000.0));
        CHECK(toDouble(v.series().values[1]) == Approx(105.0));
    }
}

TEST_CASE("FrameOps - groupby variants", "[frame][groupby]") {
    SECTION("multiple keys produce one index level per key") {
        const Value v = run("result = df.groupby(['WIDGET_NAME', 'LAYOUT'])['CLICKS'].sum()");
        REQUIRE(v.isSeries());
        CHECK(v.series().index.nlevels() == 2);
        CHECK(v.series().size() == 4);
    }
    SECTION("as_index=False keeps keys as columns") {
        const Value v = run("result = df.groupby('LAYOUT', as_index=False)['VIEWS'].mean()");
        REQUIRE(v.isFrame());
        CHECK(v.frame().columns[0].name == "LAYOUT");
        CHECK(toDouble(v.frame().columns[1].values[0]) == Approx(800.0 / 3.0));
        CHECK(toDouble(v.frame().columns[1].values[1]) == Approx(100.0));
    }
    SECTION("size counts rows per group") {
        const Value v = run("result = df.groupby('WIDGET_NAME').size()");
        CHECK(std::get<int64_t>(v.series().values[0]) == 2);
        CHECK(std::get<int64_t>(v.series().values[2]) == 1);
    }
    SECTION("named aggregation") {
        const Value v = run("result = df.groupby('LAYOUT').agg(total=('VIEWS', 'sum'), widgets=('WIDGET_NAME', 'nunique'))");
        REQUIRE(v.isFrame());
        CHECK(v.frame().columns[0].name == "total");
        CHECK(toDouble(v.frame().columns[0].values[0]) == Approx(800.0));
        CHECK(std::get<int64_t>(v.frame().columns[1].values[1]) == 2);
    }
    SECTION("transform broadcasts back to rows") {
        const Value v = run("result = df.groupby('WIDGET_NAME')['VIEWS'].transform('sum')");
        REQUIRE(v.series().size() == 5);
        CHECK(toDouble(v.series().values[2]) == Approx(400.0));
    }
    SECTION("reset_index turns keys into columns") {
        const Value v = run("result = df.groupby('WIDGET_NAME')['VIEWS'].sum().reset_index()");
        REQUIRE(v.isFrame());
        CHECK(v.frame().columns[0].name == "WIDGET_NAME");
        CHECK(v.frame().columns[1].name == "VIEWS");
    }
}

TEST_CASE("FrameOps - constructing frames in a snippet", "[frame]") {
    const Value v = runSnippet("result = pd.DataFrame({'a': [1, 2, 3], 'b': ['x', 'y', 'z']})", Value::none());
    REQUIRE(v.isFrame());
    CHECK(v.frame().rows() == 3);
    CHECK(v.frame().columns[1].dtype == DType::String);
}
