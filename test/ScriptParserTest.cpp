#include "AugurExceptions.h"
#include "ScriptLexer.h"
#include "ScriptParser.h"

#include <catch2/catch.hpp>

using namespace Script;

TEST_CASE("ScriptLexer - reserved words lex as keywords", "[parser][lexer]") {
    const std::vector<Token> tokens = tokenize("result = None if x is not y else True");
    REQUIRE(tokens.size() >= 10);
    CHECK(tokens[0].kind == TokenKind::Name);
    CHECK(tokens[0].text == "result");
    CHECK(tokens[2].kind == TokenKind::Keyword);
    CHECK(tokens[2].text == "None");
    CHECK(tokens[3].kind == TokenKind::Keyword);
    CHECK(tokens[3].text == "if");
    CHECK(tokens[4].kind == TokenKind::Name);
    CHECK(tokens[5].kind == TokenKind::Keyword);
    CHECK(tokens[6].kind == TokenKind::Keyword);
    CHECK(tokens[6].text == "not");
    CHECK(tokens[8].kind == TokenKind::Keyword);
    CHECK(tokens[9].kind == TokenKind::Keyword);
    CHECK(tokens[9].text == "True");

    const std::vector<Token> import = tokenize("import os");
    REQUIRE(import.size() >= 2);
    CHECK(import[0].kind == TokenKind::Keyword);
    CHECK(import[0].text == "import");
    CHECK(import[1].kind == TokenKind::Name);
}

TEST_CASE("ScriptParser - keyword expressions parse", "[parser]") {
    const Program program = ScriptParser::parse("y = a if flag else None\nz = not (a and b) or c in d");
    REQUIRE(program.body.size() == 2);
    CHECK(toSource(program.body[0]) == "y = a if flag else None");
    CHECK_NOTHROW(ScriptParser::parse("df.sort_values(ascending=False).head(True)"));
}

TEST_CASE("ScriptParser - statements keep operator precedence", "[parser]") {
    const Program program = ScriptParser::parse("x = 1 + 2 * 3\ny = (1 + 2) * 3\nx");
    REQUIRE(program.body.size() == 3);
    CHECK(program.body[0].kind == StmtKind::Assign);
    CHECK(toSource(program.body[0]) == "x = 1 + 2 * 3");
    CHECK(toSource(program.body[1]) == "y = (1 + 2) * 3");
    CHECK(program.body[2].kind == StmtKind::Expression);
    CHECK(program.epilogue.empty());
}

TEST_CASE("ScriptParser - augmented assignment desugars to a binary op", "[parser]") {
    const Program program = ScriptParser::parse("total = 1\ntotal += 2");
    REQUIRE(program.body.size() == 2);
    CHECK(toSource(program.body[1]) == "total = total + 2");
}

TEST_CASE("ScriptParser - calls, subscripts and keywords print back", "[parser]") {
    const std::string source = "df.groupby('WIDGET_NAME')['VIEWS'].sum(min_count=1)";
    const Program program = ScriptParser::parse(source);
    REQUIRE(program.body.size() == 1);
    CHECK(toSource(program.body[0]) == source);

    const Program sliced = ScriptParser::parse("df.iloc[1:3, 0]");
    CHECK(toSource(sliced.body[0]) == "df.iloc[1:3, 0]");
}

TEST_CASE("ScriptParser - blank lines, comments and semicolons", "[parser]") {
    const Program program = ScriptParser::parse("# leading comment\n\na = 1; b = 2\n\nresult = a + b  # trailing\n");
    REQUIRE(program.body.size() == 3);
    CHECK(program.body[2].line == 5);
}

TEST_CASE("ScriptParser - imports and definitions are kept for the validator", "[parser]") {
    SECTION("import") {
        const Program program = ScriptParser::parse("import os\nx = 1");
        REQUIRE(program.body.size() == 2);
        CHECK(program.body[0].kind == StmtKind::Import);
        CHECK(program.body[0].name == "os");
    }
    SECTION("from-import") {
        const Program program = ScriptParser::parse("from os.path import join");
        REQUIRE(program.body.size() == 1);
        CHECK(program.body[0].kind == StmtKind::Import);
        CHECK(program.body[0].name == "os.path");
    }
    SECTION("function body is skipped") {
        const Program program = ScriptParser::parse("def helper(x):\n    return x * 2\ny = 1");
        REQUIRE(program.body.size() == 2);
        CHECK(program.body[0].kind == StmtKind::FunctionDef);
        CHECK(program.body[0].name == "helper");
        CHECK(program.body[1].kind == StmtKind::Assign);
    }
}

TEST_CASE("ScriptParser - unsupported syntax raises with a line number", "[parser]") {
    SECTION("unclosed bracket") {
        REQUIRE_THROWS_AS(ScriptParser::parse("x = (1 +"), Augur::ScriptSyntaxError);
    }
    SECTION("lambda") {
        try {
            ScriptParser::parse("a = 1\nb = lambda v: v");
            FAIL("expected a syntax error");
        } catch (const Augur::ScriptSyntaxError& e) {
            CHECK(e.line() == 2);
            CHECK(std::string(e.what()).find("lambda") != std::string::npos);
        }
    }
    SECTION("comprehension") {
        REQUIRE_THROWS_WITH(ScriptParser::parse("[v for v in df]"), Catch::Contains("comprehensions"));
    }
    SECTION("loops") {
        REQUIRE_THROWS_WITH(ScriptParser::parse("for v in df:\n    pass"), Catch::Contains("'for'"));
    }
    SECTION("chained assignment") {
        REQUIRE_THROWS_AS(ScriptParser::parse("a = b = 1"), Augur::ScriptSyntaxError);
    }
}
