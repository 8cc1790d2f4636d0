#include "EngineConfig.h"
#include "AugurExceptions.h"
#include "CommonUtils.h"

#include <algorithm>
#include <fstream>
#include <unordered_map>

namespace {
template <typename T, typename Parser>
T parseNumericStrict(const std::string& value,
                     const std::string& key,
                     const std::string& errorPrefix,
                     Parser parser) {
    try {
        size_t pos = 0;
        T parsed = parser(value, &pos);
        if (pos != value.size()) {
            throw Augur::ConfigurationException(errorPrefix + key + ": " + value);
        }
        return parsed;
    } catch (const Augur::AugurException&) {
        throw;
    } catch (const std::exception& ex) {
        throw Augur::ConfigurationException(errorPrefix + key + ": " + value + " (" + ex.what() + ")");
    }
}

int parseIntStrict(const std::string& value, const std::string& key, int minValue) {
    int parsed = parseNumericStrict<int>(
        value,
        key,
        "Invalid integer for ",
        [](const std::string& v, size_t* pos) { return std::stoi(v, pos); });
    if (parsed < minValue) {
        throw Augur::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return parsed;
}

double parseDoubleStrict(const std::string& value, const std::string& key) {
    return parseNumericStrict<double>(
        value,
        key,
        "Invalid number for ",
        [](const std::string& v, size_t* pos) { return std::stod(v, pos); });
}

bool parseBoolStrict(const std::string& value, const std::string& key) {
    std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw Augur::ConfigurationException("Invalid boolean for " + key + ": " + value);
}

size_t findSeparatorOutsideQuotes(const std::string& line, char sep) {
    bool inQuotes = false;
    for (size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (c == '"') {
            inQuotes = !inQuotes;
            continue;
        }
        if (!inQuotes && c == sep) return i;
    }
    return std::string::npos;
}

std::string maybeUnquote(std::string value) {
    value = CommonUtils::trim(value);
    if (!value.empty() && value.back() == ',') value = CommonUtils::trim(value.substr(0, value.size() - 1));
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

std::string normalizeConfigKey(std::string key) {
    std::string out = CommonUtils::toLower(CommonUtils::trim(key));
    std::replace(out.begin(), out.end(), '-', '_');
    return out;
}

// Lists accept "a, b" or a bracketed ["a", "b"].
std::vector<std::string> parseList(std::string value) {
    value = CommonUtils::trim(value);
    if (value.size() >= 2 && value.front() == '[' && value.back() == ']') {
        value = value.substr(1, value.size() - 2);
    }
    std::vector<std::string> out;
    for (const auto& item : CommonUtils::splitList(value)) {
        std::string v = maybeUnquote(item);
        if (!v.empty()) out.push_back(v);
    }
    return out;
}

void checkUnitInterval(double value, const std::string& key) {
    if (value < 0.0 || value > 1.0) {
        throw Augur::ConfigurationException(key + " must be within [0,1]");
    }
}
} // namespace

void EngineConfig::set(const std::string& rawKey, const std::string& value) {
    using DoubleField = double EngineConfig::*;
    using ListField = std::vector<std::string> EngineConfig::*;
    struct SizeRule {
        size_t EngineConfig::*member;
        int minValue;
    };

    static const std::unordered_map<std::string, DoubleField> doubleFields = {
        {"strong_correlation_threshold", &EngineConfig::strongCorrelationThreshold},
        {"relationship_correlation_threshold", &EngineConfig::relationshipCorrelationThreshold},
        {"dependency_strength_threshold", &EngineConfig::dependencyStrengthThreshold},
        {"categorical_unique_ratio", &EngineConfig::categoricalUniqueRatio},
        {"impact_high_threshold", &EngineConfig::impactHighThreshold},
        {"impact_medium_threshold", &EngineConfig::impactMediumThreshold}
    };
    static const std::unordered_map<std::string, SizeRule> sizeFields = {
        {"max_key_metrics", {&EngineConfig::maxKeyMetrics, 0}},
        {"large_result_threshold", {&EngineConfig::largeResultThreshold, 1}},
        {"sample_size", {&EngineConfig::sampleSize, 1}}
    };
    static const std::unordered_map<std::string, ListField> listFields = {
        {"characteristic_categorical_columns", &EngineConfig::characteristicCategoricalColumns},
        {"characteristic_numeric_columns", &EngineConfig::characteristicNumericColumns},
        {"placeholder_columns", &EngineConfig::placeholderColumns},
        {"placeholder_terms", &EngineConfig::placeholderTerms},
        {"numeric_coercion_markers", &EngineConfig::numericCoercionMarkers},
        {"denied_names", &EngineConfig::deniedNames}
    };

    const std::string key = normalizeConfigKey(rawKey);
    if (key == "result_precision") {
        resultPrecision = parseIntStrict(value, key, 0);
        return;
    }
    if (key == "verbose") {
        verbose = parseBoolStrict(value, key);
        return;
    }
    if (const auto it = doubleFields.find(key); it != doubleFields.end()) {
        this->*(it->second) = parseDoubleStrict(value, key);
        return;
    }
    if (const auto it = sizeFields.find(key); it != sizeFields.end()) {
        this->*(it->second.member) = static_cast<size_t>(parseIntStrict(value, key, it->second.minValue));
        return;
    }
    if (const auto it = listFields.find(key); it != listFields.end()) {
        this->*(it->second) = parseList(value);
        return;
    }
    throw Augur::ConfigurationException("Unknown config key: " + rawKey);
}

EngineConfig EngineConfig::fromFile(const std::string& configPath, const EngineConfig& base) {
    std::ifstream in(configPath);
    if (!in) throw Augur::ConfigurationException("Could not open config file: " + configPath);

    EngineConfig config = base;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = CommonUtils::trim(line);
        if (line.empty() || line[0] == '#' || line == "{" || line == "}") continue;

        const size_t sep = findSeparatorOutsideQuotes(line, ':');
        if (sep == std::string::npos) {
            throw Augur::ConfigurationException(
                "Config parse error at line " + std::to_string(lineNo) + ": expected key: value");
        }

        const std::string key = maybeUnquote(line.substr(0, sep));
        const std::string value = maybeUnquote(line.substr(sep + 1));
        try {
            config.set(key, value);
        } catch (const Augur::AugurException& ex) {
            throw Augur::ConfigurationException(
                "Config parse error at line " + std::to_string(lineNo) +
                ": '" + line + "' -> " + ex.what());
        }
    }
    config.validate();
    return config;
}

void EngineConfig::validate() const {
    checkUnitInterval(strongCorrelationThreshold, "strong_correlation_threshold");
    checkUnitInterval(relationshipCorrelationThreshold, "relationship_correlation_threshold");
    checkUnitInterval(categoricalUniqueRatio, "categorical_unique_ratio");
    if (dependencyStrengthThreshold < 0.0) {
        throw Augur::ConfigurationException("dependency_strength_threshold must be >= 0");
    }
    if (impactMediumThreshold < 0.0 || impactMediumThreshold > impactHighThreshold) {
        throw Augur::ConfigurationException("impact_medium_threshold must be >= 0 and <= impact_high_threshold");
    }
    if (largeResultThreshold == 0 || sampleSize == 0) {
        throw Augur::ConfigurationException("large_result_threshold and sample_size must be > 0");
    }
    if (resultPrecision < 0 || resultPrecision > 12) {
        throw Augur::ConfigurationException("result_precision must be within [0,12]");
    }
}

std::string AppConfig::usage() {
    return "Usage: augur <dataset.csv> [--plan plan.json] [--config path] [--output path] "
           "[--delimiter ,] [--verbose] [--help]";
}

AppConfig AppConfig::fromArgs(int argc, char* argv[]) {
    AppConfig config;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            config.showHelp = true;
            return config;
        }
        if (arg == "--config" && i + 1 < argc) config.configPath = argv[++i];
    }
    if (!config.configPath.empty()) {
        config.engine = EngineConfig::fromFile(config.configPath, config.engine);
    }

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            ++i;
        } else if (arg == "--plan" && i + 1 < argc) {
            config.planPath = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            config.outputPath = argv[++i];
        } else if (arg == "--delimiter" && i + 1 < argc) {
            const std::string v = argv[++i];
            if (v.size() != 1) throw Augur::ConfigurationException("--delimiter expects a single character");
            config.delimiter = v[0];
        } else if (arg == "--verbose") {
            config.engine.verbose = true;
        } else if (arg.rfind("--", 0) == 0) {
            throw Augur::ConfigurationException("Unknown or incomplete option: " + arg);
        } else if (config.datasetPath.empty()) {
            config.datasetPath = arg;
        } else {
            throw Augur::ConfigurationException("Unexpected argument: " + arg);
        }
    }

    if (config.datasetPath.empty()) {
        throw Augur::ConfigurationException(usage());
    }
    config.engine.validate();
    return config;
}
