#include "StructuralInspector.h"

#include <algorithm>

StructureReport StructuralInspector::inspect(const Dataset& dataset) const {
    StructureReport report;
    if (dataset.colCount() == 0) return report;

    report.rows = dataset.rowCount();
    report.cols = dataset.colCount();
    report.columns.reserve(report.cols);
    for (const auto& col : dataset.columns()) {
        report.columns.push_back({col.name, col.kind, col.size() - col.missingCount()});
        report.previewHeader.push_back(col.name);
    }

    const size_t shown = std::min(previewRows_, report.rows);
    report.previewRows.reserve(shown);
    for (size_t r = 0; r < shown; ++r) {
        std::vector<std::string> row;
        row.reserve(report.cols);
        for (const auto& col : dataset.columns()) row.push_back(col.cellText(r));
        report.previewRows.push_back(std::move(row));
    }
    return report;
}
