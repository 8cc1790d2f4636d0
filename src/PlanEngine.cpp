#include "PlanEngine.h"

#include <iostream>

PlanEngine::PlanEngine(EngineConfig config)
    : config_(std::move(config)), detector_(config_), executor_(config_) {}

JsonValue PlanEngine::detectPatterns(const TypedDataset& dataset) const {
    if (config_.verbose) {
        std::cout << "[Augur][Patterns] Profiling " << dataset.rowCount() << " rows x "
                  << dataset.colCount() << " columns\n";
    }
    return detector_.detect(dataset);
}

MetricResults PlanEngine::executePlan(const TypedDataset& dataset, const AnalysisPlan& plan) const {
    try {
        const TypedDataset prepared = executor_.prepareDataset(dataset);
        return executor_.executePlan(prepared, plan);
    } catch (const std::exception& e) {
        std::cerr << "[Augur Error] Executing analysis plan failed: " << e.what() << "\n";
        MetricResults results;
        for (const auto& metric : plan.metrics) {
            MetricResult entry;
            entry.name = metric.name;
            entry.failed = true;
            entry.error = e.what();
            results.add(std::move(entry));
        }
        return results;
    }
}
