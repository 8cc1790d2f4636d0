#include "AugurExceptions.h"
#include "EngineConfig.h"

#include <catch2/catch.hpp>

#include <string>
#include <vector>

namespace {
const std::string kDataDir = AUGUR_TEST_DATA_DIR;

AppConfig parseArgs(std::vector<std::string> args) {
    args.insert(args.begin(), "augur");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    return AppConfig::fromArgs(static_cast<int>(argv.size()), argv.data());
}
} // namespace

TEST_CASE("EngineConfig - defaults are valid", "[config]") {
    const EngineConfig config;
    REQUIRE_NOTHROW(config.validate());
    CHECK(config.largeResultThreshold == 1000);
    CHECK(config.sampleSize == 50);
    CHECK(config.characteristicNumericColumns == std::vector<std::string>{"VIEWS", "CLICKS"});
}

TEST_CASE("EngineConfig - set accepts normalized keys", "[config]") {
    EngineConfig config;
    config.set("Strong-Correlation-Threshold", "0.9");
    config.set("max_key_metrics", "3");
    config.set("denied_names", "[\"eval\", \"exec\"]");
    config.set("verbose", "yes");
    CHECK(config.strongCorrelationThreshold == Approx(0.9));
    CHECK(config.maxKeyMetrics == 3);
    CHECK(config.deniedNames == std::vector<std::string>{"eval", "exec"});
    CHECK(config.verbose);
}

TEST_CASE("EngineConfig - bad keys and values", "[config]") {
    EngineConfig config;
    REQUIRE_THROWS_WITH(config.set("no_such_key", "1"), Catch::Contains("Unknown config key"));
    REQUIRE_THROWS_AS(config.set("sample_size", "ten"), Augur::ConfigurationException);
    REQUIRE_THROWS_AS(config.set("sample_size", "0"), Augur::ConfigurationException);
    REQUIRE_THROWS_AS(config.set("result_precision", "2.5"), Augur::ConfigurationException);
    REQUIRE_THROWS_AS(config.set("verbose", "maybe"), Augur::ConfigurationException);
}

TEST_CASE("EngineConfig - validate checks ranges", "[config]") {
    EngineConfig config;
    config.strongCorrelationThreshold = 1.5;
    REQUIRE_THROWS_WITH(config.validate(), Catch::Contains("strong_correlation_threshold"));

    config = EngineConfig{};
    config.impactMediumThreshold = 0.8;
    REQUIRE_THROWS_AS(config.validate(), Augur::ConfigurationException);

    config = EngineConfig{};
    config.resultPrecision = 13;
    REQUIRE_THROWS_AS(config.validate(), Augur::ConfigurationException);
}

TEST_CASE("EngineConfig - loads key: value files", "[config]") {
    const EngineConfig config = EngineConfig::fromFile(kDataDir + "/engine.conf", EngineConfig{});
    CHECK(config.strongCorrelationThreshold == Approx(0.8));
    CHECK(config.largeResultThreshold == 200);
    CHECK(config.placeholderTerms == std::vector<std::string>{"widget", "n/a placeholder"});
    CHECK_FALSE(config.verbose);
    CHECK(config.sampleSize == 50);

    REQUIRE_THROWS_WITH(EngineConfig::fromFile(kDataDir + "/bad_engine.conf", EngineConfig{}),
                        Catch::Contains("line 2"));
    REQUIRE_THROWS_AS(EngineConfig::fromFile(kDataDir + "/missing.conf", EngineConfig{}),
                      Augur::ConfigurationException);
}

TEST_CASE("AppConfig - command line parsing", "[config][cli]") {
    SECTION("dataset with options") {
        const AppConfig config = parseArgs({"data.csv", "--plan", "plan.json", "--output", "out.json",
                                            "--delimiter", ";", "--verbose"});
        CHECK(config.datasetPath == "data.csv");
        CHECK(config.planPath == "plan.json");
        CHECK(config.outputPath == "out.json");
        CHECK(config.delimiter == ';');
        CHECK(config.engine.verbose);
        CHECK_FALSE(config.showHelp);
    }
    SECTION("flags override the config file") {
        const AppConfig config = parseArgs({"--config", kDataDir + "/engine.conf", "data.csv", "--verbose"});
        CHECK(config.engine.largeResultThreshold == 200);
        CHECK(config.engine.verbose);
    }
    SECTION("help short-circuits") {
        CHECK(parseArgs({"--help"}).showHelp);
        CHECK(parseArgs({"data.csv", "-h"}).showHelp);
    }
    SECTION("errors") {
        REQUIRE_THROWS_WITH(parseArgs({}), Catch::Contains("Usage"));
        REQUIRE_THROWS_WITH(parseArgs({"data.csv", "--bogus"}), Catch::Contains("--bogus"));
        REQUIRE_THROWS_WITH(parseArgs({"a.csv", "b.csv"}), Catch::Contains("b.csv"));
        REQUIRE_THROWS_AS(parseArgs({"data.csv", "--delimiter", "::"}), Augur::ConfigurationException);
        REQUIRE_THROWS_AS(parseArgs({"data.csv", "--plan"}), Augur::ConfigurationException);
    }
}
