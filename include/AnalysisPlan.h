#pragma once

#include "JsonValue.h"

#include <string>
#include <vector>

struct MetricSpec {
    std::string name;
    std::string code;
};

struct AnalysisPlan {
    std::vector<MetricSpec> metrics;

    /**
     * @brief Reads {"metrics": [{"name": ..., "code": ...}, ...]}; other
     * members are ignored.
     * @throws Augur::PlanException when the shape is wrong or a name/code is missing.
     */
    static AnalysisPlan fromJson(const JsonValue& root);
    static AnalysisPlan loadFile(const std::string& path);
};

struct MetricResult {
    std::string name;
    JsonValue value;
    bool failed = false;
    std::string error;

    /**
     * @brief The value as emitted: {"metric", "error"} for a failure.
     */
    JsonValue toJson() const;
};

/**
 * @brief Metric results in plan order. A repeated name replaces the earlier
 * entry and keeps its position.
 */
class MetricResults {
public:
    void add(MetricResult result);

    const std::vector<MetricResult>& entries() const noexcept { return entries_; }
    const MetricResult* find(const std::string& name) const;
    size_t size() const noexcept { return entries_.size(); }
    bool empty() const noexcept { return entries_.empty(); }

    JsonValue toJson() const;

private:
    std::vector<MetricResult> entries_;
};

/**
 * @brief Identifier a later snippet uses for a prior metric: lowercase,
 * spaces replaced by underscores.
 */
std::string metricIdentifier(const std::string& metricName);
