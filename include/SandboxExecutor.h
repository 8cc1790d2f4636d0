#pragma once

#include "AnalysisPlan.h"
#include "EngineConfig.h"
#include "PlanValidator.h"
#include "ResultNormalizer.h"
#include "ScriptValue.h"
#include "TypedDataset.h"

#include <string>
#include <utility>
#include <vector>

/**
 * @brief Runs validated metric snippets against a prepared dataset, one fresh
 * interpreter per metric.
 */
class SandboxExecutor {
public:
    struct Outcome {
        bool ok = false;
        Script::Value value;
        std::string error;
    };

    using Bindings = std::vector<std::pair<std::string, Script::Value>>;

    explicit SandboxExecutor(const EngineConfig& config);

    /**
     * @brief Private copy with uppercase column names, header-like and
     * placeholder rows removed, and count columns coerced to numbers.
     */
    TypedDataset prepareDataset(const TypedDataset& dataset) const;

    /**
     * @brief Executes one validated program with `df` bound to the frame and
     * each prior result bound under its identifier. Never throws.
     */
    Outcome execute(const Script::Program& program, const Script::Value& frame, const Bindings& priors) const;

    /**
     * @brief Validates, executes and normalizes each metric in plan order.
     * @param prepared output of prepareDataset().
     */
    MetricResults executePlan(const TypedDataset& prepared, const AnalysisPlan& plan) const;

    /**
     * @brief Namespace entries derived from earlier results; failed metrics
     * are visible as None.
     */
    static Bindings priorBindings(const MetricResults& results);

private:
    MetricResults runMetric(MetricResults results, const MetricSpec& metric, const Script::Value& frame) const;

    EngineConfig config_;
    PlanValidator validator_;
    ResultNormalizer normalizer_;
};
