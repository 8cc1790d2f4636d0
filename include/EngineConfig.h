#pragma once
#include <string>
#include <vector>

struct EngineConfig {
    // Pattern detection.
    double strongCorrelationThreshold = 0.7;        // |r| above this lands in "correlations"
    double relationshipCorrelationThreshold = 0.3;  // |r| above this lands in relationships.correlations
    double dependencyStrengthThreshold = 0.1;       // categorical impact strength for relationships.dependencies
    double categoricalUniqueRatio = 0.1;            // distinct/rows below this is a low-cardinality column
    double impactHighThreshold = 0.5;
    double impactMediumThreshold = 0.2;
    size_t maxKeyMetrics = 5;

    // Result normalization.
    size_t largeResultThreshold = 1000;
    size_t sampleSize = 50;
    int resultPrecision = 2;
    std::vector<std::string> characteristicCategoricalColumns = {"WIDGET_NAME", "LAYOUT", "PLACEMENT", "ACCOUNT_NAME"};
    std::vector<std::string> characteristicNumericColumns = {"VIEWS", "CLICKS"};

    // Dataset preparation before plan execution.
    std::vector<std::string> placeholderColumns = {"WIDGET_NAME", "LAYOUT", "PLACEMENT", "ACCOUNT_NAME"};
    std::vector<std::string> placeholderTerms = {"widget", "account", "placement"};
    std::vector<std::string> numericCoercionMarkers = {"VIEWS", "CLICKS", "NUMBER_OF"};

    // Snippet validation.
    std::vector<std::string> deniedNames = {"eval", "exec", "open", "system", "os"};

    bool verbose = false;

    /**
     * @brief Loads config values from a lightweight YAML/JSON-like key:value file.
     * @pre configPath points to a readable text file.
     * @post Returns merged config using `base` as defaults.
     * @throws Augur::ConfigurationException on unknown keys, parse or validation failures.
     */
    static EngineConfig fromFile(const std::string& configPath, const EngineConfig& base);

    /**
     * @brief Applies one `key: value` setting. Keys are case-insensitive and
     * accept '-' for '_'.
     * @throws Augur::ConfigurationException on unknown keys or malformed values.
     */
    void set(const std::string& key, const std::string& value);

    /**
     * @brief Validates threshold ranges and sizes.
     * @throws Augur::ConfigurationException on invalid values.
     */
    void validate() const;
};

struct AppConfig {
    std::string datasetPath;
    std::string planPath;
    std::string outputPath;
    std::string configPath;
    char delimiter = ',';
    bool showHelp = false;

    EngineConfig engine;

    /**
     * @brief Builds config from CLI args and optional config file override.
     * @post Returns a validated config object unless showHelp is set.
     * @throws Augur::ConfigurationException on invalid arguments or values.
     */
    static AppConfig fromArgs(int argc, char* argv[]);

    static std::string usage();
};
