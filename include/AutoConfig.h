#pragma once
#include "Dataset.h"

#include <string>
#include <unordered_map>
#include <vector>

// Per-run chart style handed to ChartArtifacts; nothing here is process-wide.
struct ChartStyle {
    std::string theme = "whitegrid";   // whitegrid|darkgrid|white|dark|ticks
    double width = 10.0;
    double height = 6.0;
    std::string fontFamily = "Inter";
};

struct AutoConfig {
    std::string datasetPath;
    std::string outputDir = "marquee_output";
    std::string reportFile = "eda_report.md";
    std::string assetsDir = "chart_data";
    std::string artifactFormat = "dat";   // dat|parquet
    char delimiter = ',';

    size_t bins = 10;
    double outlierIqrMultiplier = 1.5;
    double correlationThreshold = 0.7;
    double missingThreshold = 5.0;        // percent
    size_t topCategories = 2;

    bool density = true;
    size_t densityPoints = 100;
    size_t previewRows = 5;
    std::vector<std::string> logHistogramColumns = {"budget"};

    std::string jointX = "budget";
    std::string jointY = "revenue";
    std::string jointEmphasis = "vote_average";
    double sizeMin = 20.0;
    double sizeMax = 200.0;

    std::string categoryColumn = "genre";
    std::string profileColumn = "runtime";

    // column name -> numeric|categorical|date|boolean
    std::unordered_map<std::string, std::string> columnTypeOverrides;

    bool writeOutputs = true;
    bool verbose = true;

    ChartStyle chart;

    /**
     * @brief Builds config from CLI args; `--config path` is read first and flags override it.
     * @details argv[1] is the dataset path unless it starts with "--". A missing path is allowed
     * and leads to the synthetic sample.
     * @post Returns a validated config object.
     * @throws Marquee::ConfigurationException on unknown flags or invalid values.
     */
    static AutoConfig fromArgs(int argc, char* argv[]);

    /**
     * @brief Loads config values from a loose YAML/JSON-like key:value file.
     * @post Returns merged config using `base` as defaults.
     * @throws Marquee::ConfigurationException on parse/validation failures, with the line number.
     */
    static AutoConfig fromFile(const std::string& configPath, const AutoConfig& base);

    /**
     * @brief Validates ranges and enum-like fields.
     * @throws Marquee::ConfigurationException on invalid values.
     */
    void validate() const;

    std::unordered_map<std::string, ColumnKind> columnKindOverrides() const;

    static std::string usage();
};
