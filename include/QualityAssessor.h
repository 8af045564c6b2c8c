#pragma once
#include "Dataset.h"
#include "Statistics.h"

#include <string>
#include <vector>

struct MissingnessEntry {
    std::string column;
    size_t missing = 0;
    double percent = 0.0;
};

struct DescriptiveRow {
    std::string column;
    ColumnStats stats;
};

/**
 * @brief Tukey fences for one numeric column.
 * @details Whiskers are the most extreme present values inside the fences.
 * All bounds are NaN when the quartiles are undefined, and then no row is flagged.
 */
struct OutlierSummary {
    std::string column;
    double q1;
    double q3;
    double iqr;
    double lowerFence;
    double upperFence;
    double lowerWhisker;
    double upperWhisker;
    std::vector<size_t> rows;
};

struct QualityReport {
    std::vector<MissingnessEntry> missingness;
    std::vector<DescriptiveRow> describe;
    std::vector<OutlierSummary> outliers;

    const DescriptiveRow* findDescribe(const std::string& column) const;
    const OutlierSummary* findOutliers(const std::string& column) const;
};

class QualityAssessor {
public:
    explicit QualityAssessor(double iqrMultiplier = 1.5) : iqrMultiplier_(iqrMultiplier) {}

    /**
     * @brief Missing count and percentage per column, count descending.
     * @post Ties keep column order; percentage is 0 for an empty dataset.
     */
    std::vector<MissingnessEntry> missingness(const Dataset& dataset) const;

    std::vector<DescriptiveRow> describe(const Dataset& dataset) const;

    OutlierSummary fence(const Column& column, const ColumnStats& stats) const;

    QualityReport assess(const Dataset& dataset) const;

private:
    double iqrMultiplier_;
};
