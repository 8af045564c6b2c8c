#include "Dataset.h"
#include "MarqueeExceptions.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <sstream>
#include <unordered_set>

namespace {
void civilFromDays(int64_t z, int& year, unsigned& month, unsigned& day) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    day = doy - (153 * mp + 2) / 5 + 1;
    month = mp < 10 ? mp + 3 : mp - 9;
    year = static_cast<int>(yoe) + static_cast<int>(era) * 400 + (month <= 2 ? 1 : 0);
}

std::string formatUnixSeconds(int64_t seconds) {
    int64_t days = seconds / 86400;
    int64_t rem = seconds % 86400;
    if (rem < 0) {
        rem += 86400;
        --days;
    }
    int year = 0;
    unsigned month = 0;
    unsigned day = 0;
    civilFromDays(days, year, month, day);

    char buf[32];
    if (rem == 0) {
        std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", year, month, day);
    } else {
        std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u %02d:%02d:%02d", year, month, day,
                      static_cast<int>(rem / 3600), static_cast<int>((rem % 3600) / 60), static_cast<int>(rem % 60));
    }
    return buf;
}

std::string formatNumber(double v) {
    if (std::isfinite(v) && std::abs(v) < 1e15 && v == std::floor(v)) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.0f", v);
        return buf;
    }
    std::ostringstream os;
    os.precision(6);
    os << v;
    return os.str();
}

bool storageMatchesKind(const Column& col) {
    switch (col.kind) {
        case ColumnKind::NUMERIC: return std::holds_alternative<std::vector<double>>(col.values);
        case ColumnKind::CATEGORICAL: return std::holds_alternative<std::vector<std::string>>(col.values);
        case ColumnKind::DATE: return std::holds_alternative<std::vector<int64_t>>(col.values);
        case ColumnKind::BOOLEAN: return std::holds_alternative<std::vector<uint8_t>>(col.values);
    }
    return false;
}

size_t storageLength(const ColumnStorage& values) {
    return std::visit([](const auto& v) { return v.size(); }, values);
}
} // namespace

const char* columnKindName(ColumnKind kind) {
    switch (kind) {
        case ColumnKind::NUMERIC: return "numeric";
        case ColumnKind::CATEGORICAL: return "categorical";
        case ColumnKind::DATE: return "date";
        case ColumnKind::BOOLEAN: return "boolean";
    }
    return "unknown";
}

size_t Column::missingCount() const {
    return static_cast<size_t>(std::count(missing.begin(), missing.end(), static_cast<uint8_t>(1)));
}

std::string Column::cellText(size_t row) const {
    if (isMissing(row)) return "NaN";
    switch (kind) {
        case ColumnKind::NUMERIC: return formatNumber(std::get<std::vector<double>>(values)[row]);
        case ColumnKind::CATEGORICAL: return std::get<std::vector<std::string>>(values)[row];
        case ColumnKind::DATE: return formatUnixSeconds(std::get<std::vector<int64_t>>(values)[row]);
        case ColumnKind::BOOLEAN: return std::get<std::vector<uint8_t>>(values)[row] ? "True" : "False";
    }
    return "";
}

Dataset::Dataset(std::string sourceName, std::vector<Column> columns)
    : sourceName_(std::move(sourceName)), columns_(std::move(columns)) {
    std::unordered_set<std::string> names;
    rowCount_ = columns_.empty() ? 0 : columns_.front().missing.size();

    for (auto& col : columns_) {
        if (!names.insert(col.name).second) {
            throw Marquee::DatasetException("Duplicate column name: " + col.name);
        }
        if (!storageMatchesKind(col)) {
            throw Marquee::DatasetException("Storage does not match declared kind for column: " + col.name);
        }
        if (col.missing.size() != rowCount_ || storageLength(col.values) != rowCount_) {
            throw Marquee::DatasetException("Column length mismatch for column: " + col.name);
        }
        // Missing numeric slots carry NaN so a stray read cannot pass for data.
        if (col.kind == ColumnKind::NUMERIC) {
            auto& vals = std::get<std::vector<double>>(col.values);
            for (size_t r = 0; r < rowCount_; ++r) {
                if (col.missing[r] || !std::isfinite(vals[r])) {
                    col.missing[r] = 1;
                    vals[r] = std::nan("");
                }
            }
        }
    }
}

int Dataset::findColumnIndex(const std::string& name) const {
    for (size_t i = 0; i < columns_.size(); ++i) if (columns_[i].name == name) return static_cast<int>(i);
    return -1;
}

std::vector<size_t> Dataset::numericColumnIndices() const {
    std::vector<size_t> out;
    for (size_t i = 0; i < columns_.size(); ++i) if (columns_[i].kind == ColumnKind::NUMERIC) out.push_back(i);
    return out;
}

std::vector<size_t> Dataset::categoricalColumnIndices() const {
    std::vector<size_t> out;
    for (size_t i = 0; i < columns_.size(); ++i) if (columns_[i].kind == ColumnKind::CATEGORICAL) out.push_back(i);
    return out;
}

std::vector<double> Dataset::presentNumericValues(size_t idx) const {
    const Column& col = columns_.at(idx);
    if (col.kind != ColumnKind::NUMERIC) {
        throw Marquee::DatasetException("Column is not numeric: " + col.name);
    }
    const auto& vals = std::get<std::vector<double>>(col.values);
    std::vector<double> out;
    out.reserve(vals.size());
    for (size_t r = 0; r < vals.size(); ++r) {
        if (!col.missing[r]) out.push_back(vals[r]);
    }
    return out;
}
