#include "Statistics.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace {
constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

double meanOf(const std::vector<double>& values) {
    if (values.empty()) return kNaN;
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double stddevSample(const std::vector<double>& values) {
    if (values.size() < 2) return kNaN;
    const double mu = meanOf(values);
    double s2 = 0.0;
    for (double v : values) {
        const double d = v - mu;
        s2 += d * d;
    }
    s2 /= static_cast<double>(values.size() - 1);
    return std::sqrt(std::max(0.0, s2));
}
} // namespace

double Statistics::percentileSorted(const std::vector<double>& sorted, double q) {
    if (sorted.empty()) return kNaN;
    if (sorted.size() == 1) return sorted.front();

    const double qq = std::clamp(q, 0.0, 1.0);
    const double pos = qq * static_cast<double>(sorted.size() - 1);
    const size_t lo = static_cast<size_t>(std::floor(pos));
    const size_t hi = static_cast<size_t>(std::ceil(pos));
    const double t = pos - static_cast<double>(lo);
    return sorted[lo] * (1.0 - t) + sorted[hi] * t;
}

ColumnStats Statistics::calculateStats(const std::vector<double>& values) {
    ColumnStats stats{0, kNaN, kNaN, kNaN, kNaN, kNaN, kNaN, kNaN};

    std::vector<double> finite;
    finite.reserve(values.size());
    for (double value : values) {
        if (std::isfinite(value)) finite.push_back(value);
    }
    if (finite.empty()) return stats;

    std::sort(finite.begin(), finite.end());
    stats.count = finite.size();
    stats.min = finite.front();
    stats.max = finite.back();
    stats.mean = meanOf(finite);
    stats.stddev = stddevSample(finite);
    stats.q1 = percentileSorted(finite, 0.25);
    stats.median = percentileSorted(finite, 0.50);
    stats.q3 = percentileSorted(finite, 0.75);
    return stats;
}

double Statistics::pearsonPairwise(const std::vector<double>& x, const std::vector<uint8_t>& xMissing,
                                   const std::vector<double>& y, const std::vector<uint8_t>& yMissing) {
    const size_t rows = std::min({x.size(), y.size(), xMissing.size(), yMissing.size()});

    std::vector<double> jx;
    std::vector<double> jy;
    jx.reserve(rows);
    jy.reserve(rows);
    for (size_t r = 0; r < rows; ++r) {
        if (xMissing[r] || yMissing[r]) continue;
        if (!std::isfinite(x[r]) || !std::isfinite(y[r])) continue;
        jx.push_back(x[r]);
        jy.push_back(y[r]);
    }
    if (jx.size() < 2) return kNaN;

    const double mx = meanOf(jx);
    const double my = meanOf(jy);
    double sxx = 0.0;
    double syy = 0.0;
    double sxy = 0.0;
    for (size_t i = 0; i < jx.size(); ++i) {
        const double dx = jx[i] - mx;
        const double dy = jy[i] - my;
        sxx += dx * dx;
        syy += dy * dy;
        sxy += dx * dy;
    }
    if (sxx <= 0.0 || syy <= 0.0) return kNaN;

    const double r = sxy / std::sqrt(sxx * syy);
    return std::clamp(r, -1.0, 1.0);
}

double Statistics::silvermanBandwidth(const std::vector<double>& sorted) {
    if (sorted.size() < 2) return 1.0;
    const double sigma = stddevSample(sorted);
    const double iqr = percentileSorted(sorted, 0.75) - percentileSorted(sorted, 0.25);
    double robustSigma = sigma;
    if (iqr > 0.0) {
        robustSigma = std::min(sigma > 0.0 ? sigma : iqr / 1.34, iqr / 1.34);
    }
    if (!std::isfinite(robustSigma) || robustSigma <= 1e-12) robustSigma = std::max(1e-3, sigma);
    const double n = static_cast<double>(sorted.size());
    double h = 1.06 * robustSigma * std::pow(std::max(1.0, n), -0.2);
    if (!std::isfinite(h) || h <= 1e-12) h = 1e-3;
    return h;
}

std::vector<double> Statistics::kdeEvaluate(const std::vector<double>& sample,
                                            const std::vector<double>& grid,
                                            double bandwidth) {
    std::vector<double> density(grid.size(), 0.0);
    if (sample.empty() || grid.empty() || bandwidth <= 0.0) return density;

    const double inv = 1.0 / (std::sqrt(2.0 * 3.14159265358979323846) * bandwidth * static_cast<double>(sample.size()));
    for (size_t i = 0; i < grid.size(); ++i) {
        double s = 0.0;
        const double gx = grid[i];
        for (double v : sample) {
            const double z = (gx - v) / bandwidth;
            s += std::exp(-0.5 * z * z);
        }
        density[i] = inv * s;
    }
    return density;
}
