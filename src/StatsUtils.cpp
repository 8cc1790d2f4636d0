#include "StatsUtils.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace StatsUtils {
double runningMean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    const double sum = std::accumulate(values.begin(), values.end(), 0.0);
    return sum / static_cast<double>(values.size());
}

double percentileSorted(const std::vector<double>& sorted, double q) {
    if (sorted.empty()) return 0.0;
    if (sorted.size() == 1) return sorted.front();

    const double qq = std::clamp(q, 0.0, 1.0);
    const double pos = qq * static_cast<double>(sorted.size() - 1);
    const size_t lo = static_cast<size_t>(std::floor(pos));
    const size_t hi = static_cast<size_t>(std::ceil(pos));
    const double t = pos - static_cast<double>(lo);
    return sorted[lo] * (1.0 - t) + sorted[hi] * t;
}

double sampleStdDev(const std::vector<double>& values) {
    if (values.size() < 2) return std::numeric_limits<double>::quiet_NaN();
    const double mean = runningMean(values);
    double sq = 0.0;
    for (double v : values) sq += (v - mean) * (v - mean);
    return std::sqrt(sq / static_cast<double>(values.size() - 1));
}

std::optional<double> pearsonPairwise(const std::vector<double>& x,
                                      const std::vector<uint8_t>& xMissing,
                                      const std::vector<double>& y,
                                      const std::vector<uint8_t>& yMissing) {
    const size_t n = std::min(x.size(), y.size());
    std::vector<double> xs;
    std::vector<double> ys;
    xs.reserve(n);
    ys.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        const bool xm = i < xMissing.size() && xMissing[i];
        const bool ym = i < yMissing.size() && yMissing[i];
        if (xm || ym || !std::isfinite(x[i]) || !std::isfinite(y[i])) continue;
        xs.push_back(x[i]);
        ys.push_back(y[i]);
    }
    if (xs.size() < 2) return std::nullopt;

    const double mx = runningMean(xs);
    const double my = runningMean(ys);
    double sxy = 0.0;
    double sxx = 0.0;
    double syy = 0.0;
    for (size_t i = 0; i < xs.size(); ++i) {
        const double dx = xs[i] - mx;
        const double dy = ys[i] - my;
        sxy += dx * dy;
        sxx += dx * dx;
        syy += dy * dy;
    }
    if (sxx <= 0.0 || syy <= 0.0) return std::nullopt;
    const double r = sxy / std::sqrt(sxx * syy);
    return std::clamp(r, -1.0, 1.0);
}

std::vector<std::vector<double>> correlationMatrix(const std::vector<const std::vector<double>*>& columns,
                                                   const std::vector<const std::vector<uint8_t>*>& missing) {
    const size_t cols = columns.size();
    std::vector<std::vector<double>> matrix(cols, std::vector<double>(cols, 1.0));

    // Each (i, j) pair writes only its own two cells.
    #ifdef USE_OPENMP
    #pragma omp parallel for schedule(dynamic)
    #endif
    for (long long ii = 0; ii < static_cast<long long>(cols); ++ii) {
        const size_t i = static_cast<size_t>(ii);
        for (size_t j = i + 1; j < cols; ++j) {
            const auto r = pearsonPairwise(*columns[i], *missing[i], *columns[j], *missing[j]);
            const double value = r.value_or(std::numeric_limits<double>::quiet_NaN());
            matrix[i][j] = value;
            matrix[j][i] = value;
        }
    }
    return matrix;
}

std::vector<double> descendingPercentileRanks(const std::vector<double>& values) {
    const size_t n = values.size();
    std::vector<double> pct(n, 0.0);
    if (n == 0) return pct;

    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        return values[a] > values[b];
    });

    size_t i = 0;
    while (i < n) {
        size_t j = i + 1;
        while (j < n && values[order[j]] == values[order[i]]) ++j;
        // Ranks i+1..j share their average.
        const double avgRank = (static_cast<double>(i + 1) + static_cast<double>(j)) / 2.0;
        for (size_t k = i; k < j; ++k) {
            pct[order[k]] = avgRank / static_cast<double>(n) * 100.0;
        }
        i = j;
    }
    return pct;
}
}
