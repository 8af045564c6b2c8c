#pragma once
#include "Dataset.h"

#include <string>
#include <vector>

/**
 * @brief Symmetric Pearson matrix over the numeric columns, row-major.
 * @details Undefined entries (too few joint rows, zero variance) are NaN.
 */
struct CorrelationMatrix {
    std::vector<std::string> columns;
    std::vector<double> values;

    size_t size() const noexcept { return columns.size(); }
    double at(size_t i, size_t j) const { return values[i * columns.size() + j]; }

    /**
     * @brief Entry for two named columns, NaN when either is absent.
     */
    double lookup(const std::string& a, const std::string& b) const;
};

struct JointPoint {
    size_t row = 0;
    double x = 0.0;
    double y = 0.0;
    double emphasis = 0.0;
    double size = 0.0;
};

struct JointFeatureSummary {
    std::string xColumn;
    std::string yColumn;
    std::string emphasisColumn;
    bool available = false;
    std::vector<JointPoint> points;
};

struct JointOptions {
    std::string xColumn = "budget";
    std::string yColumn = "revenue";
    std::string emphasisColumn = "vote_average";
    double sizeMin = 20.0;
    double sizeMax = 200.0;
};

struct BivariateReport {
    CorrelationMatrix correlation;
    JointFeatureSummary joint;
    std::vector<std::string> skipped;
};

class BivariateAnalyzer {
public:
    explicit BivariateAnalyzer(JointOptions options = {}) : options_(std::move(options)) {}

    CorrelationMatrix correlationMatrix(const Dataset& dataset) const;

    /**
     * @brief Rows where x, y and emphasis are all present, emphasis rescaled onto [sizeMin, sizeMax].
     * @post available is false (and a reason is appended to skipped) when a column is absent or non-numeric.
     */
    JointFeatureSummary jointSummary(const Dataset& dataset, std::vector<std::string>* skipped = nullptr) const;

    BivariateReport analyze(const Dataset& dataset) const;

private:
    JointOptions options_;
};
