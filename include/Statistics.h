#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

// Every field is NaN when undefined; count is the number of present values used.
struct ColumnStats {
    size_t count = 0;
    double min;
    double max;
    double mean;
    double stddev;
    double q1;
    double median;
    double q3;
};

namespace Statistics {
/**
 * @brief Moments and quartiles over present (finite) values.
 * @post stddev is NaN for fewer than 2 values; everything is NaN for none.
 */
ColumnStats calculateStats(const std::vector<double>& values);

/**
 * @brief Linear interpolation between order statistics at position q*(n-1).
 * @pre sorted ascending.
 */
double percentileSorted(const std::vector<double>& sorted, double q);

/**
 * @brief Pearson r over rows where both masks are clear.
 * @return NaN for fewer than 2 joint rows or zero variance on either side.
 */
double pearsonPairwise(const std::vector<double>& x, const std::vector<uint8_t>& xMissing,
                       const std::vector<double>& y, const std::vector<uint8_t>& yMissing);

double silvermanBandwidth(const std::vector<double>& sorted);
std::vector<double> kdeEvaluate(const std::vector<double>& sample,
                                const std::vector<double>& grid,
                                double bandwidth);
}
