#include "AugurExceptions.h"
#include "TestHelpers.h"

#include <catch2/catch.hpp>

#include <cmath>
#include <sstream>

using namespace Script;
using TestHelpers::runSnippet;

namespace {
Value run(const std::string& code) {
    return runSnippet(code, TestHelpers::frameOf(TestHelpers::campaignDataset()));
}
} // namespace

TEST_CASE("ScriptInterpreter - scalar arithmetic follows integer and float rules", "[interpreter]") {
    CHECK(std::get<int64_t>(run("result = 7 // 2").scalar()) == 3);
    CHECK(std::get<int64_t>(run("result = -7 // 2").scalar()) == -4);
    CHECK(std::get<int64_t>(run("result = -7 % 3").scalar()) == 2);
    CHECK(std::get<double>(run("result = 7 / 2").scalar()) == Approx(3.5));
    CHECK(std::get<int64_t>(run("result = 2 ** 10").scalar()) == 1024);
    CHECK(std::get<int64_t>(run("result = 0x1F").scalar()) == 31);
    CHECK(std::get<double>(run("result = 1.5e2").scalar()) == Approx(150.0));
}

TEST_CASE("ScriptInterpreter - scalar division by zero raises", "[interpreter]") {
    REQUIRE_THROWS_WITH(run("result = 1 / 0"), Catch::StartsWith("ZeroDivisionError"));
    REQUIRE_THROWS_AS(run("result = 5 % 0"), Augur::ScriptError);
}

TEST_CASE("ScriptInterpreter - names, tuples and containers", "[interpreter]") {
    SECTION("tuple unpacking") {
        CHECK(std::get<int64_t>(run("a, b = 3, 4\nresult = a * 10 + b").scalar()) == 34);
    }
    SECTION("list indexing and slicing") {
        const Value v = run("items = [1, 2, 3, 4]\nresult = items[-1] + len(items[1:3])");
        CHECK(std::get<int64_t>(v.scalar()) == 6);
    }
    SECTION("dict access and membership") {
        const Value v = run("d = {'a': 1, 'b': 2}\nd['c'] = 3\nresult = d['c'] if 'c' in d else 0");
        CHECK(std::get<int64_t>(v.scalar()) == 3);
    }
    SECTION("chained comparison") {
        CHECK(std::get<bool>(run("result = 1 < 2 <= 2").scalar()));
        CHECK_FALSE(std::get<bool>(run("result = 1 < 2 > 5").scalar()));
    }
    SECTION("boolean operators short-circuit to operands") {
        CHECK(std::get<int64_t>(run("result = 0 or 5").scalar()) == 5);
        CHECK(std::get<int64_t>(run("result = 3 and 4").scalar()) == 4);
    }
    SECTION("unknown names") {
        REQUIRE_THROWS_WITH(run("result = missing_name + 1"), Catch::StartsWith("NameError"));
    }
}

TEST_CASE("ScriptInterpreter - builtins", "[interpreter]") {
    CHECK(std::get<int64_t>(run("result = max([3, 9, 2])").scalar()) == 9);
    CHECK(std::get<int64_t>(run("result = abs(-4)").scalar()) == 4);
    CHECK(std::get<double>(run("result = round(3.14159, 2)").scalar()) == Approx(3.14));
    CHECK(std::get<int64_t>(run("result = int('42')").scalar()) == 42);
    CHECK(std::get<std::string>(run("result = str(5) + 'x'").scalar()) == "5x");
    CHECK(std::get<int64_t>(run("result = sum([1, 2, 3])").scalar()) == 6);
}

TEST_CASE("ScriptInterpreter - print writes to the configured stream", "[interpreter]") {
    std::ostringstream out;
    ScriptInterpreter interpreter(&out);
    interpreter.run(ScriptParser::parse("print('views', 5, sep='=')"));
    CHECK(out.str() == "views=5\n");

    ScriptInterpreter silent;
    REQUIRE_NOTHROW(silent.run(ScriptParser::parse("print('dropped')")));
}

TEST_CASE("ScriptInterpreter - dataframe expressions", "[interpreter][frame]") {
    SECTION("column sum keeps integers") {
        const Value v = run("result = df['VIEWS'].sum()");
        REQUIRE(std::holds_alternative<int64_t>(v.scalar()));
        CHECK(std::get<int64_t>(v.scalar()) == 1000);
    }
    SECTION("len and shape") {
        CHECK(std::get<int64_t>(run("result = len(df)").scalar()) == 5);
        const Value shape = run("result = df.shape");
        REQUIRE(shape.isList());
        CHECK(std::get<int64_t>(shape.list().items[1].scalar()) == 5);
    }
    SECTION("boolean mask filtering") {
        const Value v = run("result = df[df['VIEWS'] > 150]['CLICKS'].sum()");
        CHECK(std::get<int64_t>(v.scalar()) == 90);
    }
    SECTION("combined masks") {
        const Value v = run("result = len(df[(df['LAYOUT'] == 'grid') & (df['CLICKS'] >= 20)])");
        CHECK(std::get<int64_t>(v.scalar()) == 2);
    }
    SECTION("groupby aggregation is sorted by key") {
        const Value v = run("result = df.groupby('WIDGET_NAME')['VIEWS'].sum()");
        REQUIRE(v.isSeries());
        const Series& s = v.series();
        REQUIRE(s.size() == 3);
        CHECK(s.index.displayAt(0) == "Alpha");
        CHECK(s.index.displayAt(2) == "Gamma");
        CHECK(toDouble(s.values[0]) == Approx(400.0));
        CHECK(toDouble(s.values[1]) == Approx(600.0));
        CHECK(toDouble(s.values[2]) == Approx(0.0));
    }
    SECTION("column assignment rebinds the frame") {
        const Value v = run("df['CTR'] = df['CLICKS'] / df['VIEWS']\nresult = df['CTR'].max()");
        CHECK(std::isinf(toDouble(v.scalar())));
    }
    SECTION("missing column") {
        REQUIRE_THROWS_WITH(run("result = df['NOPE']"), Catch::StartsWith("KeyError"));
    }
}

TEST_CASE("ScriptInterpreter - result defaults to None", "[interpreter]") {
    CHECK(run("x = 1").isNone());
}

TEST_CASE("ScriptInterpreter - bound values are visible to snippets", "[interpreter]") {
    ScriptInterpreter interpreter;
    interpreter.bind("total_views", Value::integer(1000));
    const Value v = interpreter.run(ScriptParser::parse("result = total_views * 2"));
    CHECK(std::get<int64_t>(v.scalar()) == 2000);
    REQUIRE(interpreter.lookup("result") != nullptr);
    CHECK(interpreter.lookup("nothing") == nullptr);
}
