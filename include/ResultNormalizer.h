#pragma once

#include "EngineConfig.h"
#include "JsonValue.h"
#include "ScriptValue.h"

#include <optional>
#include <string>
#include <vector>

/**
 * @brief Turns script values into strict JSON.
 * @details Oversized series and frames are summarized into fixed percentile
 * buckets, or into a count/mean/sample summary when bucketing does not apply.
 * Floats are rounded to EngineConfig::resultPrecision and non-finite numbers
 * become 0.
 */
class ResultNormalizer {
public:
    struct PercentileRange {
        double lower;
        double upper;
        const char* label;
    };

    static const std::vector<PercentileRange>& percentileRanges();

    explicit ResultNormalizer(const EngineConfig& config);

    /**
     * @param dataset the prepared frame the snippet ran against; used to
     * describe the rows behind each percentile bucket.
     * @note Never throws; on failure the value's repr string is returned.
     */
    JsonValue normalize(const Script::Value& value, const Script::Frame& dataset) const;

    /**
     * @brief Rounds floats and zeroes non-finite numbers of a JSON document.
     */
    JsonValue normalize(const JsonValue& value) const;

    /**
     * @brief Inverse mapping used to expose prior results to later snippets.
     */
    static Script::Value toScriptValue(const JsonValue& value);

private:
    JsonValue convert(const Script::Value& value) const;
    JsonValue convertScalar(const Script::Scalar& cell) const;
    JsonValue seriesObject(const Script::Series& series, size_t limit) const;
    JsonValue frameRecords(const Script::Frame& frame, size_t limit) const;

    std::optional<Script::Series> bucketSource(const Script::Value& value) const;
    JsonValue percentileBuckets(const Script::Series& values, const Script::Frame& dataset) const;
    JsonValue samplingSummary(const Script::Value& value) const;
    JsonValue describeRows(const Script::Frame& dataset, const std::vector<size_t>& rows) const;
    std::vector<std::vector<size_t>> entityRows(const Script::Series& values, const Script::Frame& dataset) const;

    double roundValue(double v) const;

    EngineConfig config_;
};
