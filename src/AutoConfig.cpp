#include "AutoConfig.h"
#include "CommonUtils.h"
#include "MarqueeExceptions.h"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>
#include <unordered_set>

namespace {
template <typename T, typename Parser>
T parseNumericStrict(const std::string& value,
                     const std::string& key,
                     const std::string& errorPrefix,
                     Parser parser) {
    try {
        size_t pos = 0;
        T parsed = parser(value, &pos);
        if (pos != value.size()) {
            throw Marquee::ConfigurationException(errorPrefix + key + ": " + value);
        }
        return parsed;
    } catch (const Marquee::MarqueeException&) {
        throw;
    } catch (const std::exception& ex) {
        throw Marquee::ConfigurationException(errorPrefix + key + ": " + value + " (" + ex.what() + ")");
    }
}

std::string stripStructuralTokensOutsideQuotes(const std::string& line) {
    std::string out;
    out.reserve(line.size());

    bool inQuotes = false;
    for (char c : line) {
        if (c == '"') {
            inQuotes = !inQuotes;
            out.push_back(c);
            continue;
        }
        if (!inQuotes && (c == '{' || c == '}')) continue;
        out.push_back(c);
    }

    size_t lastNonSpace = out.find_last_not_of(" \t\r\n");
    if (lastNonSpace != std::string::npos && out[lastNonSpace] == ',') {
        out.erase(lastNonSpace, 1);
    }
    return out;
}

size_t findSeparatorOutsideQuotes(const std::string& line, char sep) {
    bool inQuotes = false;
    for (size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '"') {
            inQuotes = !inQuotes;
            continue;
        }
        if (!inQuotes && line[i] == sep) return i;
    }
    return std::string::npos;
}

std::string maybeUnquote(std::string value) {
    value = CommonUtils::trim(value);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

// snake_case for plain keys; type.<column> keeps the column name as written.
std::string normalizeConfigKey(std::string key) {
    key = CommonUtils::trim(key);
    const std::string lowered = CommonUtils::toLower(key);
    if (lowered.rfind("type.", 0) == 0) {
        return "type." + key.substr(5);
    }
    std::string out = lowered;
    std::replace(out.begin(), out.end(), '-', '_');
    return out;
}

int parseIntStrict(const std::string& value, const std::string& key, int minValue) {
    int parsed = parseNumericStrict<int>(
        value,
        key,
        "Invalid integer for ",
        [](const std::string& v, size_t* pos) { return std::stoi(v, pos); });
    if (parsed < minValue) {
        throw Marquee::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return parsed;
}

double parseDoubleStrict(const std::string& value, const std::string& key, double minValue) {
    double parsed = parseNumericStrict<double>(
        value,
        key,
        "Invalid number for ",
        [](const std::string& v, size_t* pos) { return std::stod(v, pos); });
    if (!std::isfinite(parsed)) {
        throw Marquee::ConfigurationException("Value for " + key + " must be finite");
    }
    if (parsed < minValue) {
        throw Marquee::ConfigurationException("Value for " + key + " must be >= " + CommonUtils::toFixed(minValue, 1));
    }
    return parsed;
}

bool parseBoolStrict(const std::string& value, const std::string& key) {
    std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw Marquee::ConfigurationException("Invalid boolean for " + key + ": " + value);
}

char parseDelimiter(const std::string& value) {
    const std::string lowered = CommonUtils::toLower(value);
    if (lowered == "\\t" || lowered == "tab") return '\t';
    if (value.size() != 1) throw Marquee::ConfigurationException("delimiter expects a single character");
    return value[0];
}

bool isValidColumnTypeOverride(const std::string& value) {
    static const std::unordered_set<std::string> allowed = {
        "numeric", "categorical", "date", "boolean"
    };
    return allowed.find(CommonUtils::toLower(CommonUtils::trim(value))) != allowed.end();
}

/**
 * @brief Applies one normalized key. Returns false for keys it does not know.
 */
bool assignKeyValue(AutoConfig& config, const std::string& key, const std::string& value) {
    if (key == "delimiter") {
        config.delimiter = parseDelimiter(value);
        return true;
    }
    if (key == "log_histogram_columns") {
        config.logHistogramColumns = CommonUtils::splitList(value);
        return true;
    }
    if (key.rfind("type.", 0) == 0) {
        const std::string column = CommonUtils::trim(key.substr(5));
        if (column.empty()) {
            throw Marquee::ConfigurationException("type.<column> requires a non-empty column name");
        }
        const std::string normalized = CommonUtils::toLower(CommonUtils::trim(value));
        if (!isValidColumnTypeOverride(normalized)) {
            throw Marquee::ConfigurationException("invalid column type override '" + value +
                                                  "' (allowed: numeric, categorical, date, boolean)");
        }
        config.columnTypeOverrides[column] = normalized;
        return true;
    }

    struct SizeRule {
        size_t AutoConfig::*member;
        int minValue;
    };
    struct DoubleRule {
        double AutoConfig::*member;
        double minValue;
    };
    struct ChartDoubleRule {
        double ChartStyle::*member;
        double minValue;
    };

    static const std::unordered_map<std::string, std::string AutoConfig::*> rawStringFields = {
        {"dataset", &AutoConfig::datasetPath},
        {"output_dir", &AutoConfig::outputDir},
        {"report_file", &AutoConfig::reportFile},
        {"assets_dir", &AutoConfig::assetsDir},
        {"joint_x", &AutoConfig::jointX},
        {"joint_y", &AutoConfig::jointY},
        {"joint_emphasis", &AutoConfig::jointEmphasis},
        {"category_column", &AutoConfig::categoryColumn},
        {"profile_column", &AutoConfig::profileColumn}
    };
    static const std::unordered_map<std::string, std::string AutoConfig::*> lowerStringFields = {
        {"artifact_format", &AutoConfig::artifactFormat}
    };
    static const std::unordered_map<std::string, bool AutoConfig::*> boolFields = {
        {"density", &AutoConfig::density},
        {"write_outputs", &AutoConfig::writeOutputs},
        {"verbose", &AutoConfig::verbose}
    };
    static const std::unordered_map<std::string, SizeRule> sizeFields = {
        {"bins", {&AutoConfig::bins, 1}},
        {"top_categories", {&AutoConfig::topCategories, 1}},
        {"density_points", {&AutoConfig::densityPoints, 2}},
        {"preview_rows", {&AutoConfig::previewRows, 0}}
    };
    static const std::unordered_map<std::string, DoubleRule> doubleFields = {
        {"outlier_iqr_multiplier", {&AutoConfig::outlierIqrMultiplier, 0.0}},
        {"correlation_threshold", {&AutoConfig::correlationThreshold, 0.0}},
        {"missing_threshold", {&AutoConfig::missingThreshold, 0.0}},
        {"size_min", {&AutoConfig::sizeMin, 0.0}},
        {"size_max", {&AutoConfig::sizeMax, 0.0}}
    };
    static const std::unordered_map<std::string, ChartDoubleRule> chartDoubleFields = {
        {"chart_width", {&ChartStyle::width, 0.1}},
        {"chart_height", {&ChartStyle::height, 0.1}}
    };

    if (key == "chart_theme") {
        config.chart.theme = CommonUtils::toLower(value);
        return true;
    }
    if (key == "chart_font") {
        config.chart.fontFamily = value;
        return true;
    }
    if (const auto it = rawStringFields.find(key); it != rawStringFields.end()) {
        config.*(it->second) = value;
        return true;
    }
    if (const auto it = lowerStringFields.find(key); it != lowerStringFields.end()) {
        config.*(it->second) = CommonUtils::toLower(value);
        return true;
    }
    if (const auto it = boolFields.find(key); it != boolFields.end()) {
        config.*(it->second) = parseBoolStrict(value, key);
        return true;
    }
    if (const auto it = sizeFields.find(key); it != sizeFields.end()) {
        config.*(it->second.member) = static_cast<size_t>(parseIntStrict(value, key, it->second.minValue));
        return true;
    }
    if (const auto it = doubleFields.find(key); it != doubleFields.end()) {
        config.*(it->second.member) = parseDoubleStrict(value, key, it->second.minValue);
        return true;
    }
    if (const auto it = chartDoubleFields.find(key); it != chartDoubleFields.end()) {
        config.chart.*(it->second.member) = parseDoubleStrict(value, key, it->second.minValue);
        return true;
    }
    return false;
}
}

std::string AutoConfig::usage() {
    return "Usage: marquee [dataset.csv] [--config path] [--delimiter ,] [--bins N] [--outlier-iqr-multiplier >=0] "
           "[--correlation-threshold 0..1] [--missing-threshold 0..100] [--top-categories N] [--density true|false] "
           "[--density-points N] [--preview-rows N] [--log-histogram-columns a,b] [--joint-x col] [--joint-y col] "
           "[--joint-emphasis col] [--size-min N] [--size-max N] [--category-column col] [--profile-column col] "
           "[--type.<column> numeric|categorical|date|boolean] [--output-dir dir] [--report-file name] "
           "[--assets-dir name] [--artifact-format dat|parquet] [--chart-theme whitegrid|darkgrid|white|dark|ticks] "
           "[--chart-width N] [--chart-height N] [--chart-font name] [--write-outputs true|false] [--verbose true|false]";
}

AutoConfig AutoConfig::fromArgs(int argc, char* argv[]) {
    AutoConfig config;
    int first = 1;
    if (argc >= 2 && std::string(argv[1]).rfind("--", 0) != 0) {
        config.datasetPath = argv[1];
        first = 2;
    }

    for (int i = first; i < argc; ++i) {
        if (std::string(argv[i]) == "--config") {
            if (i + 1 >= argc) throw Marquee::ConfigurationException("Missing value for --config");
            const std::string positionalPath = config.datasetPath;
            config = fromFile(argv[i + 1], config);
            if (!positionalPath.empty()) config.datasetPath = positionalPath;
            break;
        }
    }

    for (int i = first; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0) {
            throw Marquee::ConfigurationException("Unexpected argument: " + arg + "\n" + usage());
        }
        if (i + 1 >= argc) {
            throw Marquee::ConfigurationException("Missing value for " + arg);
        }
        const std::string value = argv[++i];
        if (arg == "--config") continue;

        const std::string key = normalizeConfigKey(arg.substr(2));
        bool known = false;
        try {
            known = assignKeyValue(config, key, value);
        } catch (const Marquee::MarqueeException& ex) {
            throw Marquee::ConfigurationException(arg + ": " + ex.what());
        }
        if (!known) {
            throw Marquee::ConfigurationException("Unknown option: " + arg + "\n" + usage());
        }
    }

    config.validate();
    return config;
}

AutoConfig AutoConfig::fromFile(const std::string& configPath, const AutoConfig& base) {
    std::ifstream in(configPath);
    if (!in) throw Marquee::ConfigurationException("Could not open config file: " + configPath);

    AutoConfig config = base;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = CommonUtils::trim(line);
        if (line.empty() || line[0] == '#') continue;

        // Loose YAML (key: value) and loose JSON-ish ("key": "value",)
        line = CommonUtils::trim(stripStructuralTokensOutsideQuotes(line));
        if (line.empty()) continue;

        size_t sep = findSeparatorOutsideQuotes(line, ':');
        if (sep == std::string::npos) continue;

        std::string key = normalizeConfigKey(maybeUnquote(line.substr(0, sep)));
        std::string value = maybeUnquote(line.substr(sep + 1));

        bool known = false;
        try {
            known = assignKeyValue(config, key, value);
        } catch (const Marquee::MarqueeException& ex) {
            throw Marquee::ConfigurationException(
                "Config parse error at line " + std::to_string(lineNo) +
                ": '" + line + "' -> " + ex.what());
        }
        if (!known) {
            std::cout << "[Marquee][Warning] Ignoring unknown config key '" << key << "' at line " << lineNo << "\n";
        }
    }
    config.validate();

    return config;
}

void AutoConfig::validate() const {
    const auto isIn = [](const std::string& value, const std::vector<std::string>& allowed) {
        return std::find(allowed.begin(), allowed.end(), value) != allowed.end();
    };

    if (bins < 1) {
        throw Marquee::ConfigurationException("bins must be >= 1");
    }
    if (!std::isfinite(outlierIqrMultiplier) || outlierIqrMultiplier < 0.0) {
        throw Marquee::ConfigurationException("outlier_iqr_multiplier must be >= 0");
    }
    if (!(correlationThreshold >= 0.0 && correlationThreshold <= 1.0)) {
        throw Marquee::ConfigurationException("correlation_threshold must be within [0,1]");
    }
    if (!(missingThreshold >= 0.0 && missingThreshold <= 100.0)) {
        throw Marquee::ConfigurationException("missing_threshold must be within [0,100]");
    }
    if (topCategories < 1) {
        throw Marquee::ConfigurationException("top_categories must be >= 1");
    }
    if (densityPoints < 2) {
        throw Marquee::ConfigurationException("density_points must be >= 2");
    }
    if (!(sizeMin >= 0.0 && sizeMin < sizeMax) || !std::isfinite(sizeMax)) {
        throw Marquee::ConfigurationException("size_min and size_max must satisfy 0 <= size_min < size_max");
    }
    if (delimiter == '"' || delimiter == '\n' || delimiter == '\r') {
        throw Marquee::ConfigurationException("delimiter cannot be a quote or line break");
    }
    if (!isIn(artifactFormat, {"dat", "parquet"})) {
        throw Marquee::ConfigurationException("artifact_format must be one of: dat, parquet");
    }
    if (!isIn(chart.theme, {"whitegrid", "darkgrid", "white", "dark", "ticks"})) {
        throw Marquee::ConfigurationException("chart_theme must be one of: whitegrid, darkgrid, white, dark, ticks");
    }
    if (!(chart.width > 0.0) || !(chart.height > 0.0)) {
        throw Marquee::ConfigurationException("chart_width and chart_height must be > 0");
    }
    if (CommonUtils::trim(chart.fontFamily).empty()) {
        throw Marquee::ConfigurationException("chart_font cannot be empty");
    }
    if (outputDir.empty() || reportFile.empty() || assetsDir.empty()) {
        throw Marquee::ConfigurationException("output_dir, report_file and assets_dir cannot be empty");
    }
    if (jointX.empty() || jointY.empty() || jointEmphasis.empty()) {
        throw Marquee::ConfigurationException("joint_x, joint_y and joint_emphasis cannot be empty");
    }
    if (categoryColumn.empty() || profileColumn.empty()) {
        throw Marquee::ConfigurationException("category_column and profile_column cannot be empty");
    }

    for (const auto& kv : columnTypeOverrides) {
        if (CommonUtils::trim(kv.first).empty()) {
            throw Marquee::ConfigurationException("Invalid type override: column name cannot be empty");
        }
        if (!isValidColumnTypeOverride(kv.second)) {
            throw Marquee::ConfigurationException(
                "Invalid type override for column '" + kv.first +
                "': '" + kv.second + "' (allowed: numeric, categorical, date, boolean)");
        }
    }
}

std::unordered_map<std::string, ColumnKind> AutoConfig::columnKindOverrides() const {
    std::unordered_map<std::string, ColumnKind> out;
    for (const auto& kv : columnTypeOverrides) {
        const std::string kind = CommonUtils::toLower(CommonUtils::trim(kv.second));
        if (kind == "numeric") out[kv.first] = ColumnKind::NUMERIC;
        else if (kind == "date") out[kv.first] = ColumnKind::DATE;
        else if (kind == "boolean") out[kv.first] = ColumnKind::BOOLEAN;
        else out[kv.first] = ColumnKind::CATEGORICAL;
    }
    return out;
}
