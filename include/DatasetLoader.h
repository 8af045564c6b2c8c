#pragma once
#include "Dataset.h"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

struct SchemaRequirement {
    std::string column;
    ColumnKind kind = ColumnKind::NUMERIC;
};

struct SchemaGap {
    std::string column;
    ColumnKind expected = ColumnKind::NUMERIC;
    bool absent = true;
    ColumnKind actual = ColumnKind::CATEGORICAL;

    std::string describe() const;
};

struct LoadResult {
    Dataset dataset;
    bool usedFallback = false;
    std::string fallbackReason;
    std::vector<SchemaGap> schemaGaps;
    size_t paddedRows = 0;
    size_t truncatedRows = 0;
    size_t skippedRows = 0;

    bool hasGap(const std::string& column) const;
};

class DatasetLoader {
public:
    explicit DatasetLoader(std::string path, char delimiter = ',');

    void setColumnKindOverride(const std::string& column, ColumnKind kind) { kindOverrides_[column] = kind; }
    void setColumnKindOverrides(std::unordered_map<std::string, ColumnKind> overrides) { kindOverrides_ = std::move(overrides); }
    void setVerbose(bool verbose) noexcept { verbose_ = verbose; }

    /**
     * @brief Reads the source, or substitutes syntheticMovies() when it cannot be read.
     * @post result.dataset is always usable; usedFallback/fallbackReason record a recovery.
     * @details Schema validation runs against whichever dataset was produced.
     */
    LoadResult load() const;

    /**
     * @brief Strict CSV read with kind inference.
     * @throws Marquee::IOException when the path is empty, absent or unreadable.
     * @throws Marquee::DatasetException on an empty or malformed header.
     */
    Dataset readCsv(LoadResult* stats = nullptr) const;

    /**
     * @brief Canonical 5-row movie sample used when no source is available.
     */
    static Dataset syntheticMovies();

    /**
     * @brief budget, revenue, runtime, vote_average (numeric) and genre (categorical).
     */
    static const std::vector<SchemaRequirement>& analyticalColumns();
    static std::vector<SchemaGap> validateSchema(const Dataset& dataset);

    static bool isMissingToken(const std::string& raw);
    static bool parseNumber(const std::string& raw, double& out);
    static bool parseBoolean(const std::string& raw, bool& out);
    static bool parseDate(const std::string& raw, int64_t& outUnixSeconds);

private:
    std::string path_;
    char delimiter_;
    bool verbose_ = true;
    std::unordered_map<std::string, ColumnKind> kindOverrides_;
};
