#pragma once
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

enum class ColumnKind { NUMERIC, CATEGORICAL, DATE, BOOLEAN };

// NUMERIC -> double, CATEGORICAL -> string, DATE -> unix seconds, BOOLEAN -> 0/1.
using ColumnStorage = std::variant<std::vector<double>, std::vector<std::string>, std::vector<int64_t>, std::vector<uint8_t>>;
using MissingMask = std::vector<uint8_t>;

const char* columnKindName(ColumnKind kind);

struct Column {
    std::string name;
    ColumnKind kind = ColumnKind::CATEGORICAL;
    ColumnStorage values = std::vector<std::string>{};
    MissingMask missing;

    size_t size() const noexcept { return missing.size(); }
    bool isMissing(size_t row) const { return missing[row] != 0; }

    /**
     * @brief Counts missing markers on every call; nothing is cached.
     */
    size_t missingCount() const;

    /**
     * @brief Renders one cell the way report tables show it ("NaN" for missing).
     */
    std::string cellText(size_t row) const;
};

class Dataset {
public:
    Dataset() = default;

    /**
     * @brief Takes ownership of fully built columns.
     * @pre Every column has the same length and a storage alternative matching its kind.
     * @throws Marquee::DatasetException on duplicate names, length mismatch or kind/storage mismatch.
     */
    Dataset(std::string sourceName, std::vector<Column> columns);

    const std::string& sourceName() const noexcept { return sourceName_; }
    size_t rowCount() const noexcept { return rowCount_; }
    size_t colCount() const noexcept { return columns_.size(); }

    const std::vector<Column>& columns() const noexcept { return columns_; }
    const Column& column(size_t idx) const { return columns_.at(idx); }

    /**
     * @brief Returns index of named column or -1 when absent.
     */
    int findColumnIndex(const std::string& name) const;

    std::vector<size_t> numericColumnIndices() const;
    std::vector<size_t> categoricalColumnIndices() const;

    /**
     * @brief Present values of a numeric column in row order.
     * @throws Marquee::DatasetException when the column is not numeric.
     */
    std::vector<double> presentNumericValues(size_t idx) const;

private:
    std::string sourceName_;
    size_t rowCount_ = 0;
    std::vector<Column> columns_;
};
