#include "BivariateAnalyzer.h"
#include "ChartArtifacts.h"
#include "DatasetLoader.h"
#include "MarqueeExceptions.h"
#include "QualityAssessor.h"
#include "ReportEngine.h"
#include "UnivariateAnalyzer.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace {
namespace fs = std::filesystem;

fs::path scratchDir() {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    const fs::path dir = fs::temp_directory_path() / (std::string("marquee_outputs_") + info->name());
    std::error_code ec;
    fs::remove_all(dir, ec);
    return dir;
}

std::string slurp(const fs::path& path) {
    std::ifstream in(path);
    std::ostringstream os;
    os << in.rdbuf();
    return os.str();
}

bool contains(const std::vector<std::string>& names, const std::string& name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}
} // namespace

TEST(ReportEngineTest, BuildsMarkdownInCallOrder) {
    ReportEngine report;
    report.addTitle("Marquee EDA Report");
    report.addSection("Structure");
    report.addParagraph("Shape: 5 rows x 9 columns.");
    report.addTable("Top genre Values", {"Value", "Count"}, {{"Action", "2"}, {"Sci|Fi", "1"}});
    report.addOrderedList({"first", "second"});
    report.addDataLink("correlation.dat", "chart_data/correlation.dat");

    const std::string& body = report.body();
    EXPECT_EQ(body.rfind("# Marquee EDA Report\n\n", 0), 0u);
    EXPECT_LT(body.find("## Structure"), body.find("### Top genre Values"));
    EXPECT_NE(body.find("| Value | Count |\n| --- | --- |\n| Action | 2 |\n| Sci\\|Fi | 1 |\n"), std::string::npos);
    EXPECT_NE(body.find("1. first\n2. second\n"), std::string::npos);
    EXPECT_NE(body.find("- [correlation.dat](chart_data/correlation.dat)\n"), std::string::npos);
}

TEST(ReportEngineTest, WideTablesRenderAsHtml) {
    ReportEngine report;
    std::vector<std::string> headers;
    for (int i = 0; i < 10; ++i) headers.push_back("c" + std::to_string(i));
    report.addTable("Wide", headers, {std::vector<std::string>(10, "a<b")});

    EXPECT_NE(report.body().find("<table>"), std::string::npos);
    EXPECT_NE(report.body().find("<td>a&lt;b</td>"), std::string::npos);
}

TEST(ReportEngineTest, SaveWritesFileAndThrowsOnBadPath) {
    const fs::path dir = scratchDir();
    fs::create_directories(dir);
    ReportEngine report;
    report.addTitle("T");
    report.save((dir / "r.md").string());
    EXPECT_EQ(slurp(dir / "r.md"), "# T\n\n");

    EXPECT_THROW(report.save((dir / "missing" / "sub" / "r.md").string()), Marquee::IOException);
    fs::remove_all(dir);
}

TEST(ChartArtifactsTest, SanitizeIdReplacesUnsafeCharacters) {
    EXPECT_EQ(ChartArtifacts::sanitizeId("hist_vote average/2"), "hist_vote_average_2");
    EXPECT_EQ(ChartArtifacts::sanitizeId(""), "chart");
}

TEST(ChartArtifactsTest, WritesEveryChartDataFile) {
    const Dataset data = DatasetLoader::syntheticMovies();
    const QualityReport quality = QualityAssessor().assess(data);
    const UnivariateReport univariate = UnivariateAnalyzer().analyze(data);
    const BivariateReport bivariate = BivariateAnalyzer().analyze(data);

    const fs::path dir = scratchDir();
    ChartStyle style;
    style.theme = "dark";
    style.fontFamily = "DejaVu Sans";
    ChartArtifacts artifacts(dir.string(), style);
    const auto written = artifacts.writeAll(quality, univariate, bivariate);

    EXPECT_TRUE(artifacts.warnings().empty());
    EXPECT_TRUE(contains(written, "chart_style.txt"));
    EXPECT_TRUE(contains(written, "hist_runtime.dat"));
    EXPECT_TRUE(contains(written, "loghist_budget.dat"));
    EXPECT_TRUE(contains(written, "counts_genre.dat"));
    EXPECT_TRUE(contains(written, "box_summary.dat"));
    EXPECT_TRUE(contains(written, "correlation.dat"));
    EXPECT_TRUE(contains(written, "joint_budget_revenue.dat"));
    for (const auto& name : written) EXPECT_TRUE(fs::exists(dir / name)) << name;
    EXPECT_TRUE(fs::exists(dir / "hist_runtime.plt"));
    EXPECT_TRUE(fs::exists(dir / "correlation.plt"));

    const std::string styleText = slurp(dir / "chart_style.txt");
    EXPECT_NE(styleText.find("theme: dark\n"), std::string::npos);
    EXPECT_NE(styleText.find("font: DejaVu Sans\n"), std::string::npos);

    const std::string counts = slurp(dir / "counts_genre.dat");
    EXPECT_NE(counts.find("\"Action\" 2 0.4\n"), std::string::npos);

    const std::string joint = slurp(dir / "joint_budget_revenue.dat");
    EXPECT_EQ(std::count(joint.begin(), joint.end(), '\n'), 6);

    const std::string script = slurp(dir / "hist_runtime.plt");
    EXPECT_NE(script.find("set output 'hist_runtime.png'"), std::string::npos);
    EXPECT_NE(script.find("DejaVu Sans,10"), std::string::npos);
    fs::remove_all(dir);
}

TEST(ChartArtifactsTest, UnavailableJointSummaryWritesNothing) {
    const fs::path dir = scratchDir();
    ChartArtifacts artifacts(dir.string(), ChartStyle{});
    EXPECT_TRUE(artifacts.writeJoint(JointFeatureSummary{}).empty());
    EXPECT_TRUE(artifacts.warnings().empty());
    fs::remove_all(dir);
}

TEST(ChartArtifactsTest, ParquetRequestWithoutNativeSupportOnlyWarns) {
#ifndef MARQUEE_USE_NATIVE_PARQUET
    const Dataset data = DatasetLoader::syntheticMovies();
    const fs::path dir = scratchDir();
    ChartArtifacts artifacts(dir.string(), ChartStyle{}, "parquet");
    const auto written = artifacts.writeAll(QualityAssessor().assess(data), UnivariateAnalyzer().analyze(data),
                                            BivariateAnalyzer().analyze(data));
    EXPECT_TRUE(contains(written, "correlation.dat"));
    ASSERT_EQ(artifacts.warnings().size(), 1u);
    EXPECT_NE(artifacts.warnings()[0].find("parquet"), std::string::npos);
    fs::remove_all(dir);
#else
    GTEST_SKIP() << "native parquet build";
#endif
}
