#include "AutomationPipeline.h"

#include "ChartArtifacts.h"
#include "CommonUtils.h"
#include "MarqueeExceptions.h"
#include "TerminalUI.h"

#include <algorithm>
#include <filesystem>
#include <iostream>

namespace {
namespace fs = std::filesystem;

std::vector<std::string> statsCells(const std::string& column, const ColumnStats& s) {
    return {column,
            std::to_string(s.count),
            CommonUtils::toFixed(s.mean, 4),
            CommonUtils::toFixed(s.stddev, 4),
            CommonUtils::toFixed(s.min, 4),
            CommonUtils::toFixed(s.q1, 4),
            CommonUtils::toFixed(s.median, 4),
            CommonUtils::toFixed(s.q3, 4),
            CommonUtils::toFixed(s.max, 4)};
}

std::string joinRows(const std::vector<size_t>& rows) {
    if (rows.empty()) return "none";
    std::string out;
    for (size_t i = 0; i < rows.size(); ++i) {
        if (i) out += ", ";
        out += std::to_string(rows[i]);
    }
    return out;
}

struct ResolvedPaths {
    fs::path outputDir;
    fs::path reportPath;
    fs::path assetsPath;
};

ResolvedPaths resolvePaths(const AutoConfig& config) {
    ResolvedPaths paths;
    paths.outputDir = fs::path(config.outputDir);
    paths.reportPath = fs::path(config.reportFile);
    if (paths.reportPath.is_relative()) paths.reportPath = paths.outputDir / paths.reportPath;
    paths.assetsPath = fs::path(config.assetsDir);
    if (paths.assetsPath.is_relative()) paths.assetsPath = paths.outputDir / paths.assetsPath;
    return paths;
}

void printStages(const AnalysisBundle& bundle, const AutoConfig& config) {
    TerminalUI::printShape(bundle.structure);
    TerminalUI::printColumnInfo(bundle.structure);
    TerminalUI::printHeadPreview(bundle.structure);
    TerminalUI::printMissingness(bundle.quality.missingness);
    TerminalUI::printDescribeTable(bundle.quality.describe);
    TerminalUI::printOutliers(bundle.quality.outliers);
    TerminalUI::printTopCategories(bundle.univariate.frequencies, config.topCategories);
    TerminalUI::printCorrelationMatrix(bundle.bivariate.correlation);
    TerminalUI::printInsights(bundle.insights);
    TerminalUI::printSkipped(bundle.skipped);
}
} // namespace

AnalysisBundle AutomationPipeline::analyze(LoadResult load, const AutoConfig& config) {
    config.validate();

    AnalysisBundle bundle;
    bundle.load = std::move(load);
    const Dataset& data = bundle.load.dataset;

    for (const auto& gap : bundle.load.schemaGaps) bundle.skipped.push_back(gap.describe());

    bundle.structure = StructuralInspector(config.previewRows).inspect(data);
    bundle.quality = QualityAssessor(config.outlierIqrMultiplier).assess(data);

    UnivariateOptions uni;
    uni.bins = config.bins;
    uni.density = config.density;
    uni.densityPoints = config.densityPoints;
    uni.logColumns = config.logHistogramColumns;
    bundle.univariate = UnivariateAnalyzer(uni).analyze(data);
    bundle.skipped.insert(bundle.skipped.end(), bundle.univariate.skipped.begin(), bundle.univariate.skipped.end());

    JointOptions joint;
    joint.xColumn = config.jointX;
    joint.yColumn = config.jointY;
    joint.emphasisColumn = config.jointEmphasis;
    joint.sizeMin = config.sizeMin;
    joint.sizeMax = config.sizeMax;
    bundle.bivariate = BivariateAnalyzer(joint).analyze(data);
    bundle.skipped.insert(bundle.skipped.end(), bundle.bivariate.skipped.begin(), bundle.bivariate.skipped.end());

    InsightThresholds thresholds;
    thresholds.correlationThreshold = config.correlationThreshold;
    thresholds.missingThreshold = config.missingThreshold;
    thresholds.topCategories = config.topCategories;
    thresholds.financialX = config.jointX;
    thresholds.financialY = config.jointY;
    thresholds.categoryColumn = config.categoryColumn;
    thresholds.profileColumn = config.profileColumn;
    bundle.insights = InsightEngine(thresholds).synthesize(bundle.quality, bundle.univariate, bundle.bivariate);

    return bundle;
}

ReportEngine AutomationPipeline::buildReport(const AnalysisBundle& bundle,
                                             const AutoConfig& config,
                                             const std::vector<std::string>& artifactLinks) {
    ReportEngine report;
    const Dataset& data = bundle.dataset();

    report.addTitle("Marquee EDA Report: " + data.sourceName());
    if (bundle.load.usedFallback) {
        report.addParagraph("The configured source could not be read (" + bundle.load.fallbackReason +
                            "); the built-in 5-row movie sample was analyzed instead.");
    }

    report.addSection("Structure");
    report.addParagraph("Shape: " + std::to_string(bundle.structure.rows) + " rows x " +
                        std::to_string(bundle.structure.cols) + " columns.");
    {
        std::vector<std::vector<std::string>> rows;
        for (const auto& c : bundle.structure.columns) {
            rows.push_back({c.name, columnKindName(c.kind), std::to_string(c.nonNull)});
        }
        report.addTable("Column Info", {"Column", "Kind", "Non-Null"}, rows);
    }
    if (!bundle.structure.previewRows.empty()) {
        report.addTable("First " + std::to_string(bundle.structure.previewRows.size()) + " Rows",
                        bundle.structure.previewHeader, bundle.structure.previewRows);
    }

    report.addSection("Data Quality");
    {
        std::vector<std::vector<std::string>> rows;
        for (const auto& m : bundle.quality.missingness) {
            rows.push_back({m.column, std::to_string(m.missing), CommonUtils::toFixed(m.percent) + "%"});
        }
        report.addTable("Missing Values", {"Column", "Missing", "Percent"}, rows);
    }
    {
        std::vector<std::vector<std::string>> rows;
        for (const auto& d : bundle.quality.describe) rows.push_back(statsCells(d.column, d.stats));
        report.addTable("Descriptive Statistics", {"Column", "Count", "Mean", "Std", "Min", "25%", "50%", "75%", "Max"}, rows);
    }
    {
        std::vector<std::vector<std::string>> rows;
        for (const auto& o : bundle.quality.outliers) {
            rows.push_back({o.column,
                            CommonUtils::toFixed(o.iqr, 4),
                            CommonUtils::toFixed(o.lowerFence, 4),
                            CommonUtils::toFixed(o.upperFence, 4),
                            CommonUtils::toFixed(o.lowerWhisker, 4),
                            CommonUtils::toFixed(o.upperWhisker, 4),
                            joinRows(o.rows)});
        }
        report.addTable("Outliers (k = " + CommonUtils::toFixed(config.outlierIqrMultiplier) + ")",
                        {"Column", "IQR", "Lower Fence", "Upper Fence", "Lower Whisker", "Upper Whisker", "Flagged Rows"}, rows);
    }

    report.addSection("Distributions");
    {
        std::vector<std::vector<std::string>> rows;
        auto addRows = [&rows](const std::vector<Histogram>& hists) {
            for (const auto& h : hists) {
                if (h.bins.empty()) {
                    rows.push_back({h.column, h.logScale ? "log1p" : "linear", "0", "-", "-"});
                    continue;
                }
                const HistogramBin& modal = h.bins[h.modalBin()];
                rows.push_back({h.column,
                                h.logScale ? "log1p" : "linear",
                                std::to_string(h.bins.size()),
                                CommonUtils::toFixed(h.binWidth, 4),
                                "[" + CommonUtils::toFixed(modal.lower) + ", " + CommonUtils::toFixed(modal.upper) + "] (" +
                                    std::to_string(modal.count) + ")"});
            }
        };
        addRows(bundle.univariate.histograms);
        addRows(bundle.univariate.logHistograms);
        report.addTable("Histograms", {"Column", "Scale", "Bins", "Bin Width", "Modal Bin"}, rows);
    }
    for (const auto& f : bundle.univariate.frequencies) {
        std::vector<std::vector<std::string>> rows;
        const size_t shown = std::min(config.topCategories, f.entries.size());
        for (size_t i = 0; i < shown; ++i) {
            const auto& e = f.entries[i];
            rows.push_back({e.value, std::to_string(e.count), CommonUtils::toFixed(e.share * 100.0, 1) + "%"});
        }
        report.addTable("Top " + f.column + " Values (" + std::to_string(f.entries.size()) + " distinct)",
                        {"Value", "Count", "Share"}, rows);
    }

    report.addSection("Relationships");
    {
        const CorrelationMatrix& m = bundle.bivariate.correlation;
        std::vector<std::string> headers = {"Column"};
        headers.insert(headers.end(), m.columns.begin(), m.columns.end());
        std::vector<std::vector<std::string>> rows;
        for (size_t i = 0; i < m.size(); ++i) {
            std::vector<std::string> row = {m.columns[i]};
            for (size_t j = 0; j < m.size(); ++j) row.push_back(CommonUtils::toFixed(m.at(i, j), 4));
            rows.push_back(std::move(row));
        }
        report.addTable("Correlation Matrix", headers, rows);
    }
    const JointFeatureSummary& joint = bundle.bivariate.joint;
    if (joint.available) {
        report.addParagraph("Joint feature chart: " + joint.xColumn + " vs " + joint.yColumn + " sized by " +
                            joint.emphasisColumn + ", " + std::to_string(joint.points.size()) + " complete rows.");
    }

    report.addSection("Key Insights");
    if (bundle.insights.empty()) {
        report.addParagraph("No insight rule fired for this dataset.");
    } else {
        std::vector<std::string> items;
        for (const auto& rec : bundle.insights) items.push_back("**" + rec.title + "**: " + rec.text);
        report.addOrderedList(items);
    }

    if (!bundle.skipped.empty()) {
        report.addSection("Skipped Statistics");
        std::vector<std::vector<std::string>> rows;
        for (const auto& s : bundle.skipped) rows.push_back({s});
        report.addTable("Skipped", {"Reason"}, rows);
    }

    if (!artifactLinks.empty()) {
        report.addSection("Chart Data");
        for (const auto& link : artifactLinks) {
            report.addDataLink(fs::path(link).filename().string(), link);
        }
    }
    return report;
}

int AutomationPipeline::run(const AutoConfig& config) {
    config.validate();

    DatasetLoader loader(config.datasetPath, config.delimiter);
    loader.setColumnKindOverrides(config.columnKindOverrides());
    loader.setVerbose(config.verbose);
    LoadResult load = loader.load();

    if (config.verbose) {
        std::cout << "[Marquee] Analyzing " << load.dataset.sourceName() << " ("
                  << load.dataset.rowCount() << " rows, " << load.dataset.colCount() << " columns)...\n";
    }
    bundle_ = analyze(std::move(load), config);
    printStages(bundle_, config);

    if (!config.writeOutputs) return 0;

    const ResolvedPaths paths = resolvePaths(config);
    std::error_code ec;
    fs::create_directories(paths.outputDir, ec);
    if (ec) {
        std::cout << "[Marquee][Warning] Could not create output directory '" << paths.outputDir.string()
                  << "': " << ec.message() << "\n";
        return 0;
    }

    ChartArtifacts artifacts(paths.assetsPath.string(), config.chart, config.artifactFormat);
    const std::vector<std::string> written = artifacts.writeAll(bundle_.quality, bundle_.univariate, bundle_.bivariate);
    for (const auto& w : artifacts.warnings()) std::cout << "[Marquee][Warning] Chart data: " << w << "\n";

    std::vector<std::string> links;
    const fs::path reportDir = paths.reportPath.parent_path();
    for (const auto& name : written) {
        const fs::path full = paths.assetsPath / name;
        const fs::path rel = full.lexically_relative(reportDir.empty() ? fs::path(".") : reportDir);
        links.push_back((rel.empty() ? full : rel).generic_string());
    }

    try {
        buildReport(bundle_, config, links).save(paths.reportPath.string());
        if (config.verbose) std::cout << "[Marquee] Report written to " << paths.reportPath.string() << "\n";
    } catch (const Marquee::IOException& e) {
        std::cout << "[Marquee][Warning] " << e.what() << "\n";
    }

    if (config.verbose) {
        std::cout << "[Marquee] Chart data: " << written.size() << " file(s) in " << paths.assetsPath.string() << "\n";
        std::cout << "[Marquee] Pipeline complete.\n";
    }
    return 0;
}
