#pragma once

#include "EngineConfig.h"
#include "JsonValue.h"
#include "TypedDataset.h"

#include <optional>
#include <string>
#include <vector>

/**
 * @brief Statistical profile of a dataset: temporal ranges, strong
 * correlations, low-cardinality categorical columns, relationship graph and
 * the most connected numeric columns.
 */
class PatternDetector {
public:
    struct CategoricalImpact {
        double strength = 0.0;
        std::string impact = "low";   // high|medium|low|error
    };

    explicit PatternDetector(const EngineConfig& config);

    /**
     * @brief Builds the pattern report. Never throws: an internal failure is
     * logged and yields emptyReport().
     */
    JsonValue detect(const TypedDataset& dataset) const;

    static JsonValue emptyReport();

    /**
     * @brief Headline figures of a campaign export: record count, WEEK range,
     * comma-tolerant VIEWS/CLICKS/ATTRIBUTED_REVENUE totals, WIDGET_NAME and
     * LAYOUT distributions and distinct CUSTOMER_ID count. Column names match
     * case-insensitively; absent columns are left out. Never throws.
     */
    JsonValue dataSummary(const TypedDataset& dataset) const;

    /**
     * @brief Spread of per-category means of `numeric` relative to its overall
     * mean, rounded to 3 decimals.
     */
    CategoricalImpact categoricalImpact(const TypedColumn& categorical, const TypedColumn& numeric) const;

    /**
     * @brief Regular sampling frequency of a timestamp sequence ("S", "T",
     * "H", "D", "W", "MS", "M", "A", "AS", or a multiple such as "15T"); nullopt
     * when fewer than three points exist or spacing is irregular.
     */
    static std::optional<std::string> inferFrequency(const std::vector<int64_t>& unixSeconds);

private:
    JsonValue temporalPatterns(const TypedDataset& dataset) const;
    JsonValue categoricalPatterns(const TypedDataset& dataset) const;
    JsonValue keyMetrics(const TypedDataset& dataset, const JsonValue& relationships) const;

    EngineConfig config_;
};
