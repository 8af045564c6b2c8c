#pragma once
#include "Dataset.h"

#include <string>
#include <vector>

struct ColumnInfo {
    std::string name;
    ColumnKind kind = ColumnKind::CATEGORICAL;
    size_t nonNull = 0;
};

struct StructureReport {
    size_t rows = 0;
    size_t cols = 0;
    std::vector<ColumnInfo> columns;
    std::vector<std::string> previewHeader;
    std::vector<std::vector<std::string>> previewRows;
};

class StructuralInspector {
public:
    explicit StructuralInspector(size_t previewRows = 5) : previewRows_(previewRows) {}

    /**
     * @brief Shape, per-column kind and non-null counts, and a head preview.
     * @post An empty dataset yields an empty report.
     */
    StructureReport inspect(const Dataset& dataset) const;

private:
    size_t previewRows_;
};
