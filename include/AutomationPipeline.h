#pragma once

#include "AutoConfig.h"
#include "BivariateAnalyzer.h"
#include "DatasetLoader.h"
#include "InsightEngine.h"
#include "QualityAssessor.h"
#include "ReportEngine.h"
#include "StructuralInspector.h"
#include "UnivariateAnalyzer.h"

#include <string>
#include <vector>

/**
 * @brief Everything one run derives from a dataset.
 * @details skipped lists the statistics dropped for schema gaps or absent
 * designated columns, in stage order.
 */
struct AnalysisBundle {
    LoadResult load;
    StructureReport structure;
    QualityReport quality;
    UnivariateReport univariate;
    BivariateReport bivariate;
    std::vector<InsightRecord> insights;
    std::vector<std::string> skipped;

    const Dataset& dataset() const noexcept { return load.dataset; }
};

class AutomationPipeline final {
public:
    /**
     * @brief Runs every analysis stage over an already loaded source.
     * @throws Marquee::ConfigurationException when config fails validation; nothing runs then.
     */
    static AnalysisBundle analyze(LoadResult load, const AutoConfig& config);

    /**
     * @brief Load, analyze, print, then write the Markdown report and chart data.
     * @return 0; write failures are logged as warnings.
     */
    int run(const AutoConfig& config);

    const AnalysisBundle& lastBundle() const noexcept { return bundle_; }

    static ReportEngine buildReport(const AnalysisBundle& bundle, const AutoConfig& config,
                                    const std::vector<std::string>& artifactLinks);

private:
    AnalysisBundle bundle_;
};
