#pragma once

#include "AnalysisPlan.h"
#include "EngineConfig.h"
#include "JsonValue.h"
#include "PatternDetector.h"
#include "SandboxExecutor.h"
#include "TypedDataset.h"

/**
 * @brief Entry point of the engine: dataset profiling and plan execution.
 * Holds no per-request state; both operations never throw.
 */
class PlanEngine {
public:
    explicit PlanEngine(EngineConfig config = EngineConfig{});

    JsonValue detectPatterns(const TypedDataset& dataset) const;

    JsonValue summarizeData(const TypedDataset& dataset) const { return detector_.dataSummary(dataset); }

    /**
     * @brief Prepares a private copy of the dataset and runs every metric in
     * plan order. A failure before any metric could run marks every metric
     * with that error.
     */
    MetricResults executePlan(const TypedDataset& dataset, const AnalysisPlan& plan) const;

    const EngineConfig& config() const noexcept { return config_; }

private:
    EngineConfig config_;
    PatternDetector detector_;
    SandboxExecutor executor_;
};
