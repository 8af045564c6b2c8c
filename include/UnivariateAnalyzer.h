#pragma once
#include "Dataset.h"

#include <string>
#include <vector>

struct HistogramBin {
    double lower = 0.0;
    double upper = 0.0;
    size_t count = 0;
};

/**
 * @brief Equal-width bins over [min, max]; the last bin is closed.
 * @details densityX/density hold the KDE samples (a probability density);
 * densityScaled is the same curve multiplied by total * binWidth for overlaying on counts.
 */
struct Histogram {
    std::string column;
    bool logScale = false;
    size_t total = 0;
    double binWidth = 0.0;
    std::vector<HistogramBin> bins;
    std::vector<double> densityX;
    std::vector<double> density;
    std::vector<double> densityScaled;

    size_t modalBin() const;
};

struct CategoryCount {
    std::string value;
    size_t count = 0;
    double share = 0.0;
};

struct CategoricalFrequency {
    std::string column;
    size_t present = 0;
    std::vector<CategoryCount> entries;
};

struct UnivariateOptions {
    size_t bins = 10;
    bool density = true;
    size_t densityPoints = 100;
    std::vector<std::string> logColumns = {"budget"};
};

struct UnivariateReport {
    std::vector<Histogram> histograms;
    std::vector<Histogram> logHistograms;
    std::vector<CategoricalFrequency> frequencies;
    std::vector<std::string> skipped;

    const Histogram* findHistogram(const std::string& column) const;
    const CategoricalFrequency* findFrequency(const std::string& column) const;
};

class UnivariateAnalyzer {
public:
    explicit UnivariateAnalyzer(UnivariateOptions options = {}) : options_(std::move(options)) {}

    /**
     * @brief Bins present values; an empty input yields no bins.
     * @post Bin counts sum to values.size(); min == max yields one degenerate bin.
     */
    static Histogram histogram(const std::string& column, const std::vector<double>& values, size_t bins);

    /**
     * @brief Gaussian KDE with Silverman bandwidth over [min, max].
     * @details Skipped for fewer than 2 values or zero range.
     */
    static void attachDensity(Histogram& hist, const std::vector<double>& values, size_t points);

    /**
     * @brief Count descending, ties in first-seen order.
     */
    static CategoricalFrequency frequency(const Column& column);

    UnivariateReport analyze(const Dataset& dataset) const;

private:
    UnivariateOptions options_;
};
