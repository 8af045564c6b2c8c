#pragma once
#include "BivariateAnalyzer.h"
#include "InsightEngine.h"
#include "QualityAssessor.h"
#include "StructuralInspector.h"
#include "UnivariateAnalyzer.h"
#include <string>
#include <vector>

class TerminalUI {
public:
    // Inspection
    static void printShape(const StructureReport& structure);
    static void printColumnInfo(const StructureReport& structure);
    static void printHeadPreview(const StructureReport& structure);

    // Quality
    static void printMissingness(const std::vector<MissingnessEntry>& missingness);
    static void printDescribeTable(const std::vector<DescriptiveRow>& rows);
    static void printOutliers(const std::vector<OutlierSummary>& outliers);

    // Distributions and relationships
    static void printTopCategories(const std::vector<CategoricalFrequency>& frequencies, size_t topN);
    static void printCorrelationMatrix(const CorrelationMatrix& matrix);

    static void printInsights(const std::vector<InsightRecord>& insights);
    static void printSkipped(const std::vector<std::string>& skipped);
};
