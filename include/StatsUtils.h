#pragma once

#include <cstdint>
#include <optional>
#include <vector>

namespace StatsUtils {
double runningMean(const std::vector<double>& values);
double percentileSorted(const std::vector<double>& sorted, double q);

/**
 * @brief Sample standard deviation (n - 1). Returns NaN for fewer than two values.
 */
double sampleStdDev(const std::vector<double>& values);

/**
 * @brief Pearson r over rows where both inputs are present.
 * @post Returns std::nullopt when fewer than two complete rows exist or either side is constant.
 */
std::optional<double> pearsonPairwise(const std::vector<double>& x,
                                      const std::vector<uint8_t>& xMissing,
                                      const std::vector<double>& y,
                                      const std::vector<uint8_t>& yMissing);

/**
 * @brief Symmetric correlation matrix, NaN where undefined, 1 on the diagonal.
 */
std::vector<std::vector<double>> correlationMatrix(const std::vector<const std::vector<double>*>& columns,
                                                   const std::vector<const std::vector<uint8_t>*>& missing);

/**
 * @brief Percentile of each value when ranked descending, ties sharing the average rank.
 * @details rank 1 is the largest value; percentile = rank / n * 100.
 */
std::vector<double> descendingPercentileRanks(const std::vector<double>& values);
}
