#include "DatasetLoader.h"
#include "QualityAssessor.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>

namespace {
Column numeric(const std::string& name, const std::vector<double>& values) {
    Column col;
    col.name = name;
    col.kind = ColumnKind::NUMERIC;
    col.values = values;
    col.missing.assign(values.size(), 0);
    for (size_t i = 0; i < values.size(); ++i) {
        if (std::isnan(values[i])) col.missing[i] = 1;
    }
    return col;
}

const double kNaN = std::nan("");
} // namespace

TEST(QualityAssessorTest, MissingnessIsSortedByCountWithStableTies) {
    const Dataset data("inline", {numeric("a", {1, kNaN, 3, 4}),
                                  numeric("b", {kNaN, kNaN, 3, 4}),
                                  numeric("c", {1, 2, 3, kNaN}),
                                  numeric("d", {1, 2, 3, 4})});
    const auto report = QualityAssessor().missingness(data);

    ASSERT_EQ(report.size(), 4u);
    EXPECT_EQ(report[0].column, "b");
    EXPECT_EQ(report[0].missing, 2u);
    EXPECT_DOUBLE_EQ(report[0].percent, 50.0);
    EXPECT_EQ(report[1].column, "a");
    EXPECT_EQ(report[2].column, "c");
    EXPECT_EQ(report[3].column, "d");
    for (const auto& m : report) {
        EXPECT_EQ(static_cast<size_t>(std::lround(m.percent * 4 / 100.0)), m.missing);
    }
}

TEST(QualityAssessorTest, MissingnessOfEmptyRowsIsZeroPercent) {
    const Dataset data("inline", {numeric("a", {})});
    const auto report = QualityAssessor().missingness(data);
    ASSERT_EQ(report.size(), 1u);
    EXPECT_EQ(report[0].percent, 0.0);
}

TEST(QualityAssessorTest, DescribeUsesSampleStdAndInterpolatedQuartiles) {
    const Dataset data("inline", {numeric("x", {4, 1, kNaN, 3, 2})});
    const auto rows = QualityAssessor().describe(data);
    ASSERT_EQ(rows.size(), 1u);

    const ColumnStats& s = rows[0].stats;
    EXPECT_EQ(s.count, 4u);
    EXPECT_DOUBLE_EQ(s.min, 1.0);
    EXPECT_DOUBLE_EQ(s.max, 4.0);
    EXPECT_DOUBLE_EQ(s.mean, 2.5);
    EXPECT_NEAR(s.stddev, std::sqrt(5.0 / 3.0), 1e-12);
    EXPECT_DOUBLE_EQ(s.q1, 1.75);
    EXPECT_DOUBLE_EQ(s.median, 2.5);
    EXPECT_DOUBLE_EQ(s.q3, 3.25);
}

TEST(QualityAssessorTest, UndefinedStatisticsAreNaN) {
    const Dataset data("inline", {numeric("empty", {kNaN, kNaN}), numeric("single", {kNaN, 7})});
    const auto rows = QualityAssessor().describe(data);
    ASSERT_EQ(rows.size(), 2u);

    EXPECT_EQ(rows[0].stats.count, 0u);
    EXPECT_TRUE(std::isnan(rows[0].stats.mean));
    EXPECT_TRUE(std::isnan(rows[0].stats.median));
    EXPECT_TRUE(std::isnan(rows[0].stats.min));

    EXPECT_EQ(rows[1].stats.count, 1u);
    EXPECT_DOUBLE_EQ(rows[1].stats.mean, 7.0);
    EXPECT_DOUBLE_EQ(rows[1].stats.q1, 7.0);
    EXPECT_TRUE(std::isnan(rows[1].stats.stddev));
}

TEST(QualityAssessorTest, FencesFlagOnlyValuesStrictlyOutside) {
    // q1 = 2, q3 = 7: fences [-5.5, 14.5]
    const Dataset data("inline", {numeric("x", {1, 2, 3, 4, 5, 7, 7.5, -1, 30})});
    const QualityReport report = QualityAssessor().assess(data);
    ASSERT_EQ(report.outliers.size(), 1u);

    const OutlierSummary& o = report.outliers[0];
    const ColumnStats& s = report.describe[0].stats;
    EXPECT_DOUBLE_EQ(o.lowerFence, s.q1 - 1.5 * (s.q3 - s.q1));
    EXPECT_DOUBLE_EQ(o.upperFence, s.q3 + 1.5 * (s.q3 - s.q1));
    EXPECT_EQ(o.rows, std::vector<size_t>{8});
    for (size_t r = 0; r < data.rowCount(); ++r) {
        const double v = std::get<std::vector<double>>(data.column(0).values)[r];
        const bool outside = v < o.lowerFence || v > o.upperFence;
        const bool flagged = std::find(o.rows.begin(), o.rows.end(), r) != o.rows.end();
        EXPECT_EQ(outside, flagged) << "row " << r;
    }
}

TEST(QualityAssessorTest, WhiskersAreExtremesInsideFences) {
    const Dataset data("inline", {numeric("x", {10, 11, 12, 13, 14, 100})});
    const QualityReport report = QualityAssessor().assess(data);
    const OutlierSummary& o = report.outliers[0];

    ASSERT_EQ(o.rows, std::vector<size_t>{5});
    EXPECT_DOUBLE_EQ(o.lowerWhisker, 10.0);
    EXPECT_DOUBLE_EQ(o.upperWhisker, 14.0);
}

TEST(QualityAssessorTest, ZeroIqrFlagsEveryNonConstantValue) {
    const Dataset data("inline", {numeric("x", {5, 5, 5, 5, 5, 5, 9, 1})});
    const QualityReport report = QualityAssessor().assess(data);
    const OutlierSummary& o = report.outliers[0];

    EXPECT_DOUBLE_EQ(o.iqr, 0.0);
    EXPECT_EQ(o.rows, (std::vector<size_t>{6, 7}));
}

TEST(QualityAssessorTest, MultiplierWidensFences) {
    const Dataset data("inline", {numeric("x", {10, 11, 12, 13, 14, 20})});
    EXPECT_EQ(QualityAssessor(1.5).assess(data).outliers[0].rows.size(), 1u);
    EXPECT_TRUE(QualityAssessor(3.0).assess(data).outliers[0].rows.empty());
}

TEST(QualityAssessorTest, UndefinedQuartilesFlagNothing) {
    const Dataset data("inline", {numeric("x", {kNaN, kNaN, kNaN})});
    const QualityReport report = QualityAssessor().assess(data);
    const OutlierSummary& o = report.outliers[0];
    EXPECT_TRUE(std::isnan(o.lowerFence));
    EXPECT_TRUE(std::isnan(o.upperFence));
    EXPECT_TRUE(o.rows.empty());
}

TEST(QualityAssessorTest, SyntheticSampleHasNoMissingValues) {
    const QualityReport report = QualityAssessor().assess(DatasetLoader::syntheticMovies());
    ASSERT_EQ(report.missingness.size(), 9u);
    for (const auto& m : report.missingness) EXPECT_EQ(m.missing, 0u) << m.column;

    const DescriptiveRow* runtime = report.findDescribe("runtime");
    ASSERT_NE(runtime, nullptr);
    EXPECT_DOUBLE_EQ(runtime->stats.mean, 153.8);
    EXPECT_DOUBLE_EQ(runtime->stats.median, 148.0);
    EXPECT_EQ(report.findDescribe("genre"), nullptr);
}
