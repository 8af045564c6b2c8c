#include "BivariateAnalyzer.h"
#include "Statistics.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <variant>
#ifdef USE_OPENMP
#include <omp.h>
#endif

double CorrelationMatrix::lookup(const std::string& a, const std::string& b) const {
    const auto ia = std::find(columns.begin(), columns.end(), a);
    const auto ib = std::find(columns.begin(), columns.end(), b);
    if (ia == columns.end() || ib == columns.end()) return std::numeric_limits<double>::quiet_NaN();
    return at(static_cast<size_t>(ia - columns.begin()), static_cast<size_t>(ib - columns.begin()));
}

CorrelationMatrix BivariateAnalyzer::correlationMatrix(const Dataset& dataset) const {
    CorrelationMatrix matrix;
    const std::vector<size_t> numericIdx = dataset.numericColumnIndices();
    const size_t p = numericIdx.size();
    for (size_t idx : numericIdx) matrix.columns.push_back(dataset.column(idx).name);
    matrix.values.assign(p * p, std::numeric_limits<double>::quiet_NaN());

    #ifdef USE_OPENMP
    #pragma omp parallel for schedule(dynamic)
    #endif
    for (size_t i = 0; i < p; ++i) {
        const Column& ci = dataset.column(numericIdx[i]);
        const auto& xi = std::get<std::vector<double>>(ci.values);
        for (size_t j = i; j < p; ++j) {
            const Column& cj = dataset.column(numericIdx[j]);
            const auto& xj = std::get<std::vector<double>>(cj.values);
            double r = Statistics::pearsonPairwise(xi, ci.missing, xj, cj.missing);
            if (i == j && std::isfinite(r)) r = 1.0;
            matrix.values[i * p + j] = r;
            matrix.values[j * p + i] = r;
        }
    }
    return matrix;
}

JointFeatureSummary BivariateAnalyzer::jointSummary(const Dataset& dataset, std::vector<std::string>* skipped) const {
    JointFeatureSummary summary;
    summary.xColumn = options_.xColumn;
    summary.yColumn = options_.yColumn;
    summary.emphasisColumn = options_.emphasisColumn;

    const Column* cols[3] = {nullptr, nullptr, nullptr};
    const std::string* names[3] = {&options_.xColumn, &options_.yColumn, &options_.emphasisColumn};
    for (size_t k = 0; k < 3; ++k) {
        const int idx = dataset.findColumnIndex(*names[k]);
        if (idx < 0 || dataset.column(static_cast<size_t>(idx)).kind != ColumnKind::NUMERIC) {
            if (skipped) skipped->push_back("joint feature summary: '" + *names[k] + "' absent or not numeric");
            return summary;
        }
        cols[k] = &dataset.column(static_cast<size_t>(idx));
    }
    summary.available = true;

    const auto& xs = std::get<std::vector<double>>(cols[0]->values);
    const auto& ys = std::get<std::vector<double>>(cols[1]->values);
    const auto& es = std::get<std::vector<double>>(cols[2]->values);

    double eMin = std::numeric_limits<double>::infinity();
    double eMax = -std::numeric_limits<double>::infinity();
    for (size_t r = 0; r < dataset.rowCount(); ++r) {
        if (cols[0]->isMissing(r) || cols[1]->isMissing(r) || cols[2]->isMissing(r)) continue;
        summary.points.push_back({r, xs[r], ys[r], es[r], 0.0});
        eMin = std::min(eMin, es[r]);
        eMax = std::max(eMax, es[r]);
    }

    const double span = eMax - eMin;
    const double midpoint = 0.5 * (options_.sizeMin + options_.sizeMax);
    for (auto& pt : summary.points) {
        if (!(span > 0.0)) {
            pt.size = midpoint;
        } else {
            pt.size = options_.sizeMin + (pt.emphasis - eMin) / span * (options_.sizeMax - options_.sizeMin);
        }
    }
    return summary;
}

BivariateReport BivariateAnalyzer::analyze(const Dataset& dataset) const {
    BivariateReport report;
    report.correlation = correlationMatrix(dataset);
    report.joint = jointSummary(dataset, &report.skipped);
    return report;
}
