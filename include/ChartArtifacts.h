#pragma once
#include "AutoConfig.h"
#include "BivariateAnalyzer.h"
#include "QualityAssessor.h"
#include "UnivariateAnalyzer.h"
#include <string>
#include <vector>

/**
 * @brief Writes chart-ready data files plus gnuplot scripts that render them.
 * @details Files land in assetsDir. Each write returns the file name (relative to assetsDir),
 * or an empty string after recording a warning. Nothing is rendered here.
 */
class ChartArtifacts {
public:
    ChartArtifacts(std::string assetsDir, ChartStyle style, std::string format = "dat");

    std::string writeStyle();
    std::string writeHistogram(const Histogram& hist);
    std::string writeCategoryCounts(const CategoricalFrequency& freq);
    std::string writeBoxSummary(const QualityReport& quality);
    std::string writeCorrelation(const CorrelationMatrix& matrix);
    std::string writeJoint(const JointFeatureSummary& joint);

    /**
     * @brief Parquet copies of the histogram and scatter tables (native Parquet builds only).
     */
    void writeParquetTables(const UnivariateReport& univariate, const JointFeatureSummary& joint);

    std::vector<std::string> writeAll(const QualityReport& quality,
                                      const UnivariateReport& univariate,
                                      const BivariateReport& bivariate);

    const std::string& assetsDir() const noexcept { return assetsDir_; }
    const std::vector<std::string>& warnings() const noexcept { return warnings_; }

    static std::string sanitizeId(const std::string& id);

private:
    std::string assetsDir_;
    ChartStyle style_;
    std::string format_;
    bool dirReady_ = false;
    std::vector<std::string> warnings_;

    std::string styledHeader(const std::string& id, const std::string& title) const;
    std::string writeFile(const std::string& name, const std::string& content);
};
