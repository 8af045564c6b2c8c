#include "QualityAssessor.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <variant>
#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace {
constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
}

const DescriptiveRow* QualityReport::findDescribe(const std::string& column) const {
    for (const auto& row : describe) if (row.column == column) return &row;
    return nullptr;
}

const OutlierSummary* QualityReport::findOutliers(const std::string& column) const {
    for (const auto& row : outliers) if (row.column == column) return &row;
    return nullptr;
}

std::vector<MissingnessEntry> QualityAssessor::missingness(const Dataset& dataset) const {
    std::vector<MissingnessEntry> out;
    out.reserve(dataset.colCount());
    const size_t n = dataset.rowCount();
    for (const auto& col : dataset.columns()) {
        const size_t missing = col.missingCount();
        const double pct = (n == 0) ? 0.0 : (100.0 * static_cast<double>(missing) / static_cast<double>(n));
        out.push_back({col.name, missing, pct});
    }
    std::stable_sort(out.begin(), out.end(), [](const MissingnessEntry& a, const MissingnessEntry& b) {
        return a.missing > b.missing;
    });
    return out;
}

std::vector<DescriptiveRow> QualityAssessor::describe(const Dataset& dataset) const {
    const std::vector<size_t> numericIdx = dataset.numericColumnIndices();
    std::vector<DescriptiveRow> out(numericIdx.size());

    #ifdef USE_OPENMP
    #pragma omp parallel for schedule(static)
    #endif
    for (size_t pos = 0; pos < numericIdx.size(); ++pos) {
        const size_t idx = numericIdx[pos];
        out[pos].column = dataset.column(idx).name;
        out[pos].stats = Statistics::calculateStats(dataset.presentNumericValues(idx));
    }
    return out;
}

OutlierSummary QualityAssessor::fence(const Column& column, const ColumnStats& stats) const {
    OutlierSummary out{column.name, stats.q1, stats.q3, kNaN, kNaN, kNaN, kNaN, kNaN, {}};
    if (!std::isfinite(stats.q1) || !std::isfinite(stats.q3)) return out;

    out.iqr = stats.q3 - stats.q1;
    out.lowerFence = stats.q1 - iqrMultiplier_ * out.iqr;
    out.upperFence = stats.q3 + iqrMultiplier_ * out.iqr;

    const auto& values = std::get<std::vector<double>>(column.values);
    for (size_t r = 0; r < values.size(); ++r) {
        if (column.isMissing(r)) continue;
        const double v = values[r];
        if (v < out.lowerFence || v > out.upperFence) {
            out.rows.push_back(r);
            continue;
        }
        if (!std::isfinite(out.lowerWhisker) || v < out.lowerWhisker) out.lowerWhisker = v;
        if (!std::isfinite(out.upperWhisker) || v > out.upperWhisker) out.upperWhisker = v;
    }
    return out;
}

QualityReport QualityAssessor::assess(const Dataset& dataset) const {
    QualityReport report;
    report.missingness = missingness(dataset);
    report.describe = describe(dataset);

    const std::vector<size_t> numericIdx = dataset.numericColumnIndices();
    report.outliers.resize(numericIdx.size());

    #ifdef USE_OPENMP
    #pragma omp parallel for schedule(static)
    #endif
    for (size_t pos = 0; pos < numericIdx.size(); ++pos) {
        report.outliers[pos] = fence(dataset.column(numericIdx[pos]), report.describe[pos].stats);
    }
    return report;
}
