#include "DatasetLoader.h"
#include "StructuralInspector.h"

#include <gtest/gtest.h>

#include <cmath>

TEST(StructuralInspectorTest, ShapeMatchesDataset) {
    const Dataset data = DatasetLoader::syntheticMovies();
    const StructureReport report = StructuralInspector().inspect(data);

    EXPECT_EQ(report.rows, data.rowCount());
    EXPECT_EQ(report.cols, data.colCount());
    ASSERT_EQ(report.columns.size(), 9u);
    EXPECT_EQ(report.columns[2].name, "budget");
    EXPECT_EQ(report.columns[2].kind, ColumnKind::NUMERIC);
    EXPECT_EQ(report.columns[1].kind, ColumnKind::DATE);
    for (const auto& c : report.columns) EXPECT_EQ(c.nonNull, 5u) << c.name;
}

TEST(StructuralInspectorTest, HeadPreviewRendersMissingAsNaN) {
    Column runtime;
    runtime.name = "runtime";
    runtime.kind = ColumnKind::NUMERIC;
    runtime.values = std::vector<double>{120.0, std::nan(""), 95.5};
    runtime.missing = {0, 1, 0};

    Column genre;
    genre.name = "genre";
    genre.kind = ColumnKind::CATEGORICAL;
    genre.values = std::vector<std::string>{"Drama", "", "Comedy"};
    genre.missing = {0, 1, 0};

    const Dataset data("inline", {runtime, genre});
    const StructureReport report = StructuralInspector(2).inspect(data);

    EXPECT_EQ(report.columns[0].nonNull, 2u);
    ASSERT_EQ(report.previewRows.size(), 2u);
    EXPECT_EQ(report.previewHeader, (std::vector<std::string>{"runtime", "genre"}));
    EXPECT_EQ(report.previewRows[0], (std::vector<std::string>{"120", "Drama"}));
    EXPECT_EQ(report.previewRows[1], (std::vector<std::string>{"NaN", "NaN"}));
}

TEST(StructuralInspectorTest, PreviewNeverExceedsRowCount) {
    const Dataset data = DatasetLoader::syntheticMovies();
    EXPECT_EQ(StructuralInspector(50).inspect(data).previewRows.size(), 5u);
    EXPECT_TRUE(StructuralInspector(0).inspect(data).previewRows.empty());
}

TEST(StructuralInspectorTest, EmptyDatasetYieldsEmptyReport) {
    const StructureReport report = StructuralInspector().inspect(Dataset());
    EXPECT_EQ(report.rows, 0u);
    EXPECT_EQ(report.cols, 0u);
    EXPECT_TRUE(report.columns.empty());
    EXPECT_TRUE(report.previewRows.empty());
}
