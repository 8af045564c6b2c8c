#include "UnivariateAnalyzer.h"
#include "Statistics.h"

#include <algorithm>
#include <cmath>
#include <unordered_map>
#include <variant>
#ifdef USE_OPENMP
#include <omp.h>
#endif

size_t Histogram::modalBin() const {
    size_t best = 0;
    for (size_t i = 1; i < bins.size(); ++i) {
        if (bins[i].count > bins[best].count) best = i;
    }
    return best;
}

const Histogram* UnivariateReport::findHistogram(const std::string& column) const {
    for (const auto& h : histograms) if (h.column == column) return &h;
    return nullptr;
}

const CategoricalFrequency* UnivariateReport::findFrequency(const std::string& column) const {
    for (const auto& f : frequencies) if (f.column == column) return &f;
    return nullptr;
}

Histogram UnivariateAnalyzer::histogram(const std::string& column, const std::vector<double>& values, size_t bins) {
    Histogram hist;
    hist.column = column;
    hist.total = values.size();
    if (values.empty() || bins == 0) return hist;

    const auto [minIt, maxIt] = std::minmax_element(values.begin(), values.end());
    const double lo = *minIt;
    const double hi = *maxIt;

    if (!(hi > lo)) {
        hist.bins.push_back({lo, hi, values.size()});
        return hist;
    }

    hist.binWidth = (hi - lo) / static_cast<double>(bins);
    hist.bins.resize(bins);
    for (size_t b = 0; b < bins; ++b) {
        hist.bins[b].lower = lo + static_cast<double>(b) * hist.binWidth;
        hist.bins[b].upper = (b + 1 == bins) ? hi : lo + static_cast<double>(b + 1) * hist.binWidth;
    }

    for (double v : values) {
        size_t idx = static_cast<size_t>(std::floor((v - lo) / hist.binWidth));
        if (idx >= bins) idx = bins - 1;
        // Rounding in the division can land a value one bin off its [lower, upper) range.
        while (idx > 0 && v < hist.bins[idx].lower) --idx;
        while (idx + 1 < bins && v >= hist.bins[idx + 1].lower) ++idx;
        hist.bins[idx].count++;
    }
    return hist;
}

void UnivariateAnalyzer::attachDensity(Histogram& hist, const std::vector<double>& values, size_t points) {
    if (values.size() < 2 || points < 2) return;

    std::vector<double> sorted = values;
    std::sort(sorted.begin(), sorted.end());
    const double lo = sorted.front();
    const double hi = sorted.back();
    if (!(hi > lo)) return;

    hist.densityX.resize(points);
    const double step = (hi - lo) / static_cast<double>(points - 1);
    for (size_t i = 0; i < points; ++i) hist.densityX[i] = lo + static_cast<double>(i) * step;
    hist.densityX.back() = hi;

    hist.density = Statistics::kdeEvaluate(sorted, hist.densityX, Statistics::silvermanBandwidth(sorted));

    const double scale = static_cast<double>(sorted.size()) * hist.binWidth;
    hist.densityScaled.resize(hist.density.size());
    for (size_t i = 0; i < hist.density.size(); ++i) hist.densityScaled[i] = hist.density[i] * scale;
}

CategoricalFrequency UnivariateAnalyzer::frequency(const Column& column) {
    CategoricalFrequency freq;
    freq.column = column.name;
    if (column.kind != ColumnKind::CATEGORICAL) return freq;

    const auto& values = std::get<std::vector<std::string>>(column.values);
    std::unordered_map<std::string, size_t> slot;
    for (size_t r = 0; r < values.size(); ++r) {
        if (column.isMissing(r)) continue;
        ++freq.present;
        auto it = slot.find(values[r]);
        if (it == slot.end()) {
            slot.emplace(values[r], freq.entries.size());
            freq.entries.push_back({values[r], 1, 0.0});
        } else {
            freq.entries[it->second].count++;
        }
    }

    std::stable_sort(freq.entries.begin(), freq.entries.end(), [](const CategoryCount& a, const CategoryCount& b) {
        return a.count > b.count;
    });
    for (auto& e : freq.entries) {
        e.share = static_cast<double>(e.count) / static_cast<double>(freq.present);
    }
    return freq;
}

UnivariateReport UnivariateAnalyzer::analyze(const Dataset& dataset) const {
    UnivariateReport report;

    const std::vector<size_t> numericIdx = dataset.numericColumnIndices();
    report.histograms.resize(numericIdx.size());

    #ifdef USE_OPENMP
    #pragma omp parallel for schedule(static)
    #endif
    for (size_t pos = 0; pos < numericIdx.size(); ++pos) {
        const size_t idx = numericIdx[pos];
        const std::vector<double> values = dataset.presentNumericValues(idx);
        Histogram hist = histogram(dataset.column(idx).name, values, options_.bins);
        if (options_.density) attachDensity(hist, values, options_.densityPoints);
        report.histograms[pos] = std::move(hist);
    }

    for (const auto& name : options_.logColumns) {
        const int idx = dataset.findColumnIndex(name);
        if (idx < 0 || dataset.column(static_cast<size_t>(idx)).kind != ColumnKind::NUMERIC) {
            report.skipped.push_back("log histogram for '" + name + "': column absent or not numeric");
            continue;
        }
        std::vector<double> logged;
        for (double v : dataset.presentNumericValues(static_cast<size_t>(idx))) {
            if (v >= 0.0) logged.push_back(std::log1p(v));
        }
        Histogram hist = histogram(name, logged, options_.bins);
        hist.logScale = true;
        report.logHistograms.push_back(std::move(hist));
    }

    for (size_t idx : dataset.categoricalColumnIndices()) {
        report.frequencies.push_back(frequency(dataset.column(idx)));
    }
    return report;
}
