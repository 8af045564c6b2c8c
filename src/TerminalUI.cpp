#include "TerminalUI.h"
#include "CommonUtils.h"
#include <algorithm>
#include <iomanip>
#include <iostream>

namespace {
constexpr int kRuleWidth = 108;

void banner(const std::string& title) {
    const std::string label = " " + title + " ";
    const int side = std::max(2, (kRuleWidth - static_cast<int>(label.size())) / 2);
    std::cout << "\n" << std::string(static_cast<size_t>(side), '=') << label
              << std::string(static_cast<size_t>(std::max(2, kRuleWidth - side - static_cast<int>(label.size()))), '=') << "\n";
}

void closing() {
    std::cout << std::string(kRuleWidth, '=') << "\n";
}

int nameWidth(const std::vector<std::string>& names) {
    size_t maxNameLen = 15;
    for (const auto& name : names) maxNameLen = std::max(maxNameLen, name.length());
    return static_cast<int>(maxNameLen) + 2;
}
} // namespace

void TerminalUI::printShape(const StructureReport& structure) {
    std::cout << "\n--- Dataset Shape (Rows, Columns) ---\n";
    std::cout << "(" << structure.rows << ", " << structure.cols << ")\n";
}

void TerminalUI::printColumnInfo(const StructureReport& structure) {
    std::vector<std::string> names;
    for (const auto& c : structure.columns) names.push_back(c.name);
    const int w = nameWidth(names);

    banner("COLUMN INFO");
    std::cout << std::left << std::setw(6) << "#" << std::setw(w) << "Column"
              << std::setw(16) << "Non-Null Count" << "Kind\n";
    std::cout << std::string(static_cast<size_t>(w + 34), '-') << "\n";
    for (size_t i = 0; i < structure.columns.size(); ++i) {
        const auto& c = structure.columns[i];
        std::cout << std::left << std::setw(6) << i << std::setw(w) << c.name
                  << std::setw(16) << (std::to_string(c.nonNull) + " non-null") << columnKindName(c.kind) << "\n";
    }
    closing();
}

void TerminalUI::printHeadPreview(const StructureReport& structure) {
    if (structure.previewRows.empty()) return;
    std::cout << "\n--- First " << structure.previewRows.size() << " Rows ---\n";

    std::vector<size_t> widths(structure.previewHeader.size(), 0);
    for (size_t c = 0; c < widths.size(); ++c) {
        widths[c] = structure.previewHeader[c].size();
        for (const auto& row : structure.previewRows) widths[c] = std::max(widths[c], row[c].size());
    }

    std::cout << std::left << std::setw(4) << "";
    for (size_t c = 0; c < widths.size(); ++c) std::cout << std::setw(static_cast<int>(widths[c] + 2)) << structure.previewHeader[c];
    std::cout << "\n";
    for (size_t r = 0; r < structure.previewRows.size(); ++r) {
        std::cout << std::left << std::setw(4) << r;
        for (size_t c = 0; c < widths.size(); ++c) {
            std::cout << std::setw(static_cast<int>(widths[c] + 2)) << structure.previewRows[r][c];
        }
        std::cout << "\n";
    }
}

void TerminalUI::printMissingness(const std::vector<MissingnessEntry>& missingness) {
    std::vector<std::string> names;
    for (const auto& m : missingness) names.push_back(m.column);
    const int w = nameWidth(names);

    banner("MISSING VALUES");
    std::cout << std::left << std::setw(w) << "Column" << std::right << std::setw(10) << "Missing"
              << std::setw(12) << "Percent" << "\n";
    std::cout << std::string(static_cast<size_t>(w + 22), '-') << "\n";
    for (const auto& m : missingness) {
        std::cout << std::left << std::setw(w) << m.column << std::right << std::setw(10) << m.missing
                  << std::setw(11) << CommonUtils::toFixed(m.percent) << "%\n";
    }
    closing();
}

void TerminalUI::printDescribeTable(const std::vector<DescriptiveRow>& rows) {
    std::vector<std::string> names;
    for (const auto& r : rows) names.push_back(r.column);
    const int w = nameWidth(names);

    banner("DESCRIPTIVE STATISTICS");
    std::cout << std::left << std::setw(w) << "Feature" << std::right
              << std::setw(7) << "Count"
              << std::setw(17) << "Mean"
              << std::setw(17) << "Std"
              << std::setw(17) << "Min"
              << std::setw(17) << "25%"
              << std::setw(17) << "50%"
              << std::setw(17) << "75%"
              << std::setw(17) << "Max" << "\n";
    std::cout << std::string(static_cast<size_t>(w + 7 + 17 * 7), '-') << "\n";
    for (const auto& r : rows) {
        const ColumnStats& s = r.stats;
        std::cout << std::left << std::setw(w) << r.column << std::right
                  << std::setw(7) << s.count
                  << std::setw(17) << CommonUtils::toFixed(s.mean)
                  << std::setw(17) << CommonUtils::toFixed(s.stddev)
                  << std::setw(17) << CommonUtils::toFixed(s.min)
                  << std::setw(17) << CommonUtils::toFixed(s.q1)
                  << std::setw(17) << CommonUtils::toFixed(s.median)
                  << std::setw(17) << CommonUtils::toFixed(s.q3)
                  << std::setw(17) << CommonUtils::toFixed(s.max) << "\n";
    }
    closing();
}

void TerminalUI::printOutliers(const std::vector<OutlierSummary>& outliers) {
    banner("OUTLIERS (IQR FENCES)");
    for (const auto& o : outliers) {
        std::cout << "    -> " << std::left << std::setw(15) << o.column
                  << " fences [" << CommonUtils::toFixed(o.lowerFence) << ", " << CommonUtils::toFixed(o.upperFence) << "]"
                  << " | flagged rows: ";
        if (o.rows.empty()) {
            std::cout << "none";
        } else {
            for (size_t i = 0; i < o.rows.size(); ++i) std::cout << (i ? ", " : "") << o.rows[i];
        }
        std::cout << "\n";
    }
    closing();
}

void TerminalUI::printTopCategories(const std::vector<CategoricalFrequency>& frequencies, size_t topN) {
    banner("TOP CATEGORIES");
    for (const auto& f : frequencies) {
        std::cout << "    [" << f.column << "] " << f.entries.size() << " distinct\n";
        const size_t shown = std::min(topN, f.entries.size());
        for (size_t i = 0; i < shown; ++i) {
            const auto& e = f.entries[i];
            std::cout << "        " << std::left << std::setw(24) << e.value << std::right << std::setw(8) << e.count
                      << std::setw(10) << CommonUtils::toFixed(e.share * 100.0, 1) << "%\n";
        }
    }
    closing();
}

void TerminalUI::printCorrelationMatrix(const CorrelationMatrix& matrix) {
    const int w = nameWidth(matrix.columns);
    banner("CORRELATION MATRIX");
    std::cout << std::setw(w) << " ";
    for (const auto& name : matrix.columns) std::cout << std::right << std::setw(14) << name;
    std::cout << "\n" << std::string(static_cast<size_t>(w) + 14 * matrix.size(), '-') << "\n";
    for (size_t i = 0; i < matrix.size(); ++i) {
        std::cout << std::left << std::setw(w) << matrix.columns[i] << std::right;
        for (size_t j = 0; j < matrix.size(); ++j) {
            std::cout << std::setw(14) << CommonUtils::toFixed(matrix.at(i, j), 4);
        }
        std::cout << "\n";
    }
    closing();
}

void TerminalUI::printInsights(const std::vector<InsightRecord>& insights) {
    banner("KEY INSIGHTS");
    if (insights.empty()) {
        std::cout << "    -> No insight rule fired for this dataset.\n";
    }
    for (const auto& rec : insights) {
        std::cout << "    " << rec.rank << ". [" << rec.ruleId << "] " << rec.text << "\n";
    }
    closing();
}

void TerminalUI::printSkipped(const std::vector<std::string>& skipped) {
    if (skipped.empty()) return;
    std::cout << "\n[Marquee] Skipped statistics:\n";
    for (const auto& s : skipped) std::cout << "        - " << s << "\n";
}
