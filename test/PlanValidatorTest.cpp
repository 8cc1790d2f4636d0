#include "PlanValidator.h"

#include <catch2/catch.hpp>

using namespace Script;

namespace {
std::string lastBodyLine(const ValidationResult& r) {
    REQUIRE_FALSE(r.program.body.empty());
    return toSource(r.program.body.back());
}
} // namespace

TEST_CASE("PlanValidator - rejects imports", "[validator]") {
    const PlanValidator validator;
    const ValidationResult r = validator.validate("import os\nresult = 1");
    CHECK_FALSE(r.ok);
    CHECK(r.error.find("import") != std::string::npos);
    CHECK(r.error.find("line 1") != std::string::npos);

    const ValidationResult from = validator.validate("x = 1\nfrom subprocess import run");
    CHECK_FALSE(from.ok);
    CHECK(from.error.find("line 2") != std::string::npos);
}

TEST_CASE("PlanValidator - rejects denied calls anywhere in a callee chain", "[validator]") {
    const PlanValidator validator;
    SECTION("direct call") {
        const ValidationResult r = validator.validate("result = eval('1 + 1')");
        CHECK_FALSE(r.ok);
        CHECK(r.error.find("eval") != std::string::npos);
    }
    SECTION("nested in an argument") {
        const ValidationResult r = validator.validate("result = len(open('/etc/passwd'))");
        CHECK_FALSE(r.ok);
        CHECK(r.error.find("open") != std::string::npos);
    }
    SECTION("dotted module call") {
        const ValidationResult r = validator.validate("os.system('ls')");
        CHECK_FALSE(r.ok);
        CHECK(r.error.find("system") != std::string::npos);
    }
    SECTION("custom deny list") {
        const PlanValidator strict({"print"});
        CHECK_FALSE(strict.validate("print(1)").ok);
        CHECK(strict.validate("result = eval").ok);
    }
}

TEST_CASE("PlanValidator - rejects definitions, syntax errors and empty snippets", "[validator]") {
    const PlanValidator validator;
    CHECK(validator.validate("def f():\n    return 1").error.find("function definitions") != std::string::npos);
    CHECK(validator.validate("class A:\n    pass").error.find("class definitions") != std::string::npos);
    CHECK(validator.validate("result = (").error.find("SyntaxError") == 0);
    CHECK(validator.validate("# only a comment\n").error == "Snippet contains no statements");
}

TEST_CASE("PlanValidator - binds the result of the last statement", "[validator]") {
    const PlanValidator validator;
    SECTION("trailing expression") {
        const ValidationResult r = validator.validate("df['VIEWS'].sum()");
        REQUIRE(r.ok);
        CHECK(r.program.body.size() == 1);
        CHECK(lastBodyLine(r) == "result = df['VIEWS'].sum()");
    }
    SECTION("trailing assignment to another name") {
        const ValidationResult r = validator.validate("x = df['A'].sum()");
        REQUIRE(r.ok);
        REQUIRE(r.program.body.size() == 2);
        CHECK(lastBodyLine(r) == "result = x");
    }
    SECTION("explicit result is left alone") {
        const ValidationResult r = validator.validate("result = 1");
        REQUIRE(r.ok);
        CHECK(r.program.body.size() == 1);
    }
    SECTION("every snippet ends with the finite-value guard") {
        const ValidationResult r = validator.validate("result = 1");
        REQUIRE(r.program.epilogue.size() == 1);
        CHECK(toSource(r.program.epilogue.front()) == "result = zero_non_finite(result)");
        CHECK(r.sanitizedCode == "result = 1\nresult = zero_non_finite(result)\n");
    }
}

TEST_CASE("PlanValidator - rewrites division, str.contains and the data alias", "[validator]") {
    const PlanValidator validator;
    SECTION("division") {
        const ValidationResult r = validator.validate("result = df['CLICKS'].sum() / df['VIEWS'].sum() * 100");
        REQUIRE(r.ok);
        CHECK(lastBodyLine(r) == "result = safe_divide(df['CLICKS'].sum(), df['VIEWS'].sum()) * 100");
    }
    SECTION("nested division") {
        const ValidationResult r = validator.validate("a / (b / c)");
        REQUIRE(r.ok);
        CHECK(lastBodyLine(r) == "result = safe_divide(a, safe_divide(b, c))");
    }
    SECTION("str.contains") {
        const ValidationResult r = validator.validate("df[df['WIDGET_NAME'].str.contains('promo')]");
        REQUIRE(r.ok);
        CHECK(lastBodyLine(r) == "result = df[safe_contains(df['WIDGET_NAME'], 'promo')]");
    }
    SECTION("data alias") {
        const ValidationResult r = validator.validate("total = data['VIEWS'].sum()");
        REQUIRE(r.ok);
        CHECK(toSource(r.program.body.front()) == "total = df['VIEWS'].sum()");
    }
    SECTION("floor division is untouched") {
        const ValidationResult r = validator.validate("7 // 2");
        REQUIRE(r.ok);
        CHECK(lastBodyLine(r) == "result = 7 // 2");
    }
}
