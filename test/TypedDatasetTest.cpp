#include "AugurExceptions.h"
#include "TypedDataset.h"

#include <catch2/catch.hpp>

namespace {
const std::string kDataDir = AUGUR_TEST_DATA_DIR;
}

TEST_CASE("TypedDataset - loads and types a CSV file", "[dataset]") {
    const TypedDataset dataset = TypedDataset::loadCsv(kDataDir + "/views.csv");
    REQUIRE(dataset.rowCount() == 12);
    REQUIRE(dataset.colCount() == 4);
    CHECK(dataset.columns()[0].name == "widget_name");
    CHECK(dataset.columns()[0].type == ColumnType::CATEGORICAL);

    const int views = dataset.findColumnIndex("views");
    REQUIRE(views >= 0);
    const TypedColumn& col = dataset.columns()[static_cast<size_t>(views)];
    CHECK(col.type == ColumnType::NUMERIC);
    CHECK(std::get<std::vector<double>>(col.values)[0] == Approx(1000.0));
    CHECK(col.isMissing(4));
    CHECK(col.cellAsString(4) == "nan");
    CHECK(dataset.numericColumnIndices().size() == 2);
    CHECK(dataset.findColumnIndex("VIEWS") == -1);
}

TEST_CASE("TypedDataset - missing files raise IO errors", "[dataset]") {
    REQUIRE_THROWS_AS(TypedDataset::loadCsv(kDataDir + "/does_not_exist.csv"), Augur::IOException);
}

TEST_CASE("TypedDataset - type inference from records", "[dataset]") {
    const TypedDataset dataset = TypedDataset::fromRecords(
        {" DATE ", "SPEND", "NOTE", "SPEND"},
        {{"2024-01-01", "1.5", "ok"},
         {"2024-01-02", "n/a", "fine", "3"},
         {"2024-01-03", "2", "NA", "4"}});
    REQUIRE(dataset.colCount() == 4);
    CHECK(dataset.columns()[0].name == "DATE");
    CHECK(dataset.columns()[0].type == ColumnType::DATETIME);
    CHECK(dataset.columns()[1].type == ColumnType::NUMERIC);
    CHECK(dataset.columns()[1].isMissing(1));
    CHECK(dataset.columns()[2].type == ColumnType::CATEGORICAL);
    CHECK(dataset.columns()[2].isMissing(2));
    CHECK(dataset.columns()[3].name == "SPEND_2");
    CHECK(dataset.columns()[3].isMissing(0));
    CHECK(dataset.datetimeColumnIndices() == std::vector<size_t>{0});
}

TEST_CASE("TypedDataset - numeric token policies", "[dataset]") {
    double v = 0.0;
    CHECK(TypedDataset::parseNumericToken("1,234", v));
    CHECK(v == Approx(1234.0));
    CHECK(TypedDataset::parseNumericToken("1,234.5", v));
    CHECK(v == Approx(1234.5));
    CHECK(TypedDataset::parseNumericToken("1.234,5", v));
    CHECK(v == Approx(1234.5));
    CHECK(TypedDataset::parseNumericToken("$42", v));
    CHECK(v == Approx(42.0));
    CHECK(TypedDataset::parseNumericToken("12%", v));
    CHECK(v == Approx(12.0));
    CHECK(TypedDataset::parseNumericToken("1,5", v, TypedDataset::NumericSeparatorPolicy::EUROPEAN));
    CHECK(v == Approx(1.5));
    CHECK(TypedDataset::parseNumericToken("1,500", v, TypedDataset::NumericSeparatorPolicy::US_THOUSANDS));
    CHECK(v == Approx(1500.0));
    CHECK_FALSE(TypedDataset::parseNumericToken("abc", v));
    CHECK_FALSE(TypedDataset::parseNumericToken("null", v));
}

TEST_CASE("TypedDataset - date tokens", "[dataset]") {
    int64_t ts = 0;
    REQUIRE(TypedDataset::parseDateTimeToken("2024-02-29 13:45:10", ts));
    CHECK(formatIsoDateTime(ts) == "2024-02-29T13:45:10");
    CHECK(ts == unixSecondsFromCivil(2024, 2, 29) + 13 * 3600 + 45 * 60 + 10);
    CHECK_FALSE(TypedDataset::parseDateTimeToken("2023-02-29", ts));
    CHECK_FALSE(TypedDataset::parseDateTimeToken("not a date", ts));

    int year = 0;
    int month = 0;
    int day = 0;
    int weekday = -1;
    civilFromUnixSeconds(unixSecondsFromCivil(2024, 1, 7), year, month, day, weekday);
    CHECK(year == 2024);
    CHECK(day == 7);
    CHECK(weekday == 6);
}

TEST_CASE("TypedDataset - row removal and column checks", "[dataset]") {
    TypedDataset dataset = TypedDataset::fromRecords({"A", "B"}, {{"1", "x"}, {"2", "y"}, {"3", "z"}});
    dataset.removeRows({1, 0, 1});
    REQUIRE(dataset.rowCount() == 2);
    CHECK(std::get<std::vector<std::string>>(dataset.columns()[1].values)[1] == "z");
    REQUIRE_THROWS_AS(dataset.removeRows({1}), Augur::DatasetException);

    dataset.addColumn(TypedColumn::numeric("C", {5.0, 6.0}));
    CHECK(dataset.colCount() == 3);
    REQUIRE_THROWS_AS(dataset.addColumn(TypedColumn::numeric("C", {1.0, 2.0})), Augur::DatasetException);
    REQUIRE_THROWS_AS(dataset.addColumn(TypedColumn::numeric("D", {1.0})), Augur::DatasetException);
}
