#include "AnalysisPlan.h"
#include "AugurExceptions.h"
#include "EngineConfig.h"
#include "PlanEngine.h"
#include "TypedDataset.h"

#include <fstream>
#include <iostream>
#include <string>

namespace {
void printUsage() {
    std::cout << AppConfig::usage() << "\n"
              << "Options:\n"
              << "  --plan <file>        Analysis plan JSON: {\"metrics\": [{\"name\", \"code\"}, ...]}\n"
              << "  --config <file>      key: value file overriding engine thresholds\n"
              << "  --output <file>      Write the JSON report to a file instead of stdout\n"
              << "  --delimiter <char>   CSV delimiter character (default: ,)\n"
              << "  --verbose            Enable progress logs\n"
              << "  --help               Show this help message\n";
}

// Progress logs go to stderr while the report itself owns stdout.
class CoutToCerr {
public:
    explicit CoutToCerr(bool active) : saved_(active ? std::cout.rdbuf(std::cerr.rdbuf()) : nullptr) {}
    ~CoutToCerr() {
        if (saved_) std::cout.rdbuf(saved_);
    }
    CoutToCerr(const CoutToCerr&) = delete;
    CoutToCerr& operator=(const CoutToCerr&) = delete;

private:
    std::streambuf* saved_;
};
} // namespace

int main(int argc, char* argv[]) {
    AppConfig config;
    try {
        config = AppConfig::fromArgs(argc, argv);
    } catch (const Augur::AugurException& e) {
        std::cerr << "[Augur Error] " << e.what() << "\n";
        printUsage();
        return 1;
    }
    if (config.showHelp) {
        printUsage();
        return 0;
    }

    JsonValue report = JsonValue::object();
    try {
        CoutToCerr redirect(config.outputPath.empty());

        const TypedDataset dataset = TypedDataset::loadCsv(config.datasetPath, config.delimiter);
        if (config.engine.verbose) {
            std::cout << "[Augur] Loaded " << dataset.rowCount() << " rows x " << dataset.colCount()
                      << " columns from " << config.datasetPath << "\n";
        }

        AnalysisPlan plan;
        if (!config.planPath.empty()) plan = AnalysisPlan::loadFile(config.planPath);

        const PlanEngine engine(config.engine);
        report.set("summary", engine.summarizeData(dataset));
        report.set("patterns", engine.detectPatterns(dataset));
        report.set("analysis", engine.executePlan(dataset, plan).toJson());
    } catch (const Augur::AugurException& e) {
        std::cerr << "[Augur Error] " << e.what() << "\n";
        return 1;
    }

    const std::string text = report.dump(2);
    if (config.outputPath.empty()) {
        std::cout << text << "\n";
        return 0;
    }

    std::ofstream out(config.outputPath);
    if (!out) {
        std::cerr << "[Augur Error] Could not open output file: " << config.outputPath << "\n";
        return 1;
    }
    out << text << "\n";
    if (!out) {
        std::cerr << "[Augur Error] Failed writing output file: " << config.outputPath << "\n";
        return 1;
    }
    std::cout << "[Augur] Report written to " << config.outputPath << "\n";
    return 0;
}
