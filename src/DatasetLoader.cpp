#include "DatasetLoader.h"
#include "CSVUtils.h"
#include "CommonUtils.h"
#include "MarqueeExceptions.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace {
bool parseFixedInt(const std::string& s, size_t offset, size_t len, int& out) {
    if (offset + len > s.size()) return false;
    int value = 0;
    for (size_t i = 0; i < len; ++i) {
        unsigned char ch = static_cast<unsigned char>(s[offset + i]);
        if (ch < '0' || ch > '9') return false;
        value = value * 10 + static_cast<int>(ch - '0');
    }
    out = value;
    return true;
}

bool isLeapYear(int year) {
    if (year % 400 == 0) return true;
    if (year % 100 == 0) return false;
    return (year % 4 == 0);
}

int daysInMonth(int year, int month) {
    static const int kMonthDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) return 0;
    if (month == 2) return isLeapYear(year) ? 29 : 28;
    return kMonthDays[month - 1];
}

int64_t daysFromCivil(int y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const int mp = static_cast<int>(m) + (m > 2 ? -3 : 9);
    const unsigned doy = (153 * static_cast<unsigned>(mp) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return static_cast<int64_t>(era) * 146097 + static_cast<int64_t>(doe) - 719468;
}

bool parseTimePart(const std::string& timePart, int& hour, int& minute, int& second) {
    hour = minute = second = 0;
    if (timePart.empty()) return true;
    if (timePart.size() != 8) return false;
    return parseFixedInt(timePart, 0, 2, hour) && timePart[2] == ':' &&
           parseFixedInt(timePart, 3, 2, minute) && timePart[5] == ':' &&
           parseFixedInt(timePart, 6, 2, second);
}

// YYYY-MM-DD, or DD/MM/YYYY vs MM/DD/YYYY decided by which field exceeds 12.
bool parseDatePart(const std::string& datePart, int& year, int& month, int& day) {
    if (datePart.size() == 10 && datePart[4] == '-' && datePart[7] == '-') {
        return parseFixedInt(datePart, 0, 4, year) &&
               parseFixedInt(datePart, 5, 2, month) &&
               parseFixedInt(datePart, 8, 2, day);
    }

    if (datePart.size() == 10 && datePart[2] == '/' && datePart[5] == '/') {
        int a = 0;
        int b = 0;
        if (!parseFixedInt(datePart, 0, 2, a) ||
            !parseFixedInt(datePart, 3, 2, b) ||
            !parseFixedInt(datePart, 6, 4, year)) {
            return false;
        }
        if (a > 12 && b <= 12) {
            day = a;
            month = b;
        } else {
            month = a;
            day = b;
        }
        return true;
    }
    return false;
}

// Accepts 1,234,567.89 style grouping; anything else with a comma is rejected.
bool stripThousandsSeparators(std::string& s) {
    if (s.find(',') == std::string::npos) return true;

    const size_t digitsBegin = (!s.empty() && s.front() == '-') ? 1 : 0;
    const size_t dot = s.find('.');
    const std::string integerPart = s.substr(digitsBegin, dot == std::string::npos ? std::string::npos : dot - digitsBegin);

    size_t groupLen = 0;
    bool firstGroup = true;
    for (char ch : integerPart) {
        if (ch == ',') {
            if (groupLen == 0 || groupLen > 3 || (!firstGroup && groupLen != 3)) return false;
            firstGroup = false;
            groupLen = 0;
        } else if (std::isdigit(static_cast<unsigned char>(ch))) {
            ++groupLen;
        } else {
            return false;
        }
    }
    if (groupLen != 3) return false;
    if (dot != std::string::npos && s.find(',', dot) != std::string::npos) return false;

    s.erase(std::remove(s.begin(), s.end(), ','), s.end());
    return true;
}

ColumnKind inferKind(const std::vector<std::string>& tokens) {
    size_t present = 0;
    size_t boolHits = 0;
    size_t dateHits = 0;
    size_t numericHits = 0;
    for (const auto& token : tokens) {
        if (DatasetLoader::isMissingToken(token)) continue;
        ++present;
        bool b = false;
        int64_t ts = 0;
        double dv = 0.0;
        if (DatasetLoader::parseBoolean(token, b)) ++boolHits;
        if (DatasetLoader::parseDate(token, ts)) ++dateHits;
        if (DatasetLoader::parseNumber(token, dv)) ++numericHits;
    }

    if (present == 0) return ColumnKind::CATEGORICAL;
    if (boolHits == present) return ColumnKind::BOOLEAN;
    // A few stray tokens do not demote a typed column; they are read as missing.
    if (dateHits * 10 >= present * 9) return ColumnKind::DATE;
    if (numericHits * 10 >= present * 9) return ColumnKind::NUMERIC;
    return ColumnKind::CATEGORICAL;
}

Column buildColumn(const std::string& name, ColumnKind kind, const std::vector<std::string>& tokens) {
    Column col;
    col.name = name;
    col.kind = kind;
    col.missing.assign(tokens.size(), static_cast<uint8_t>(0));

    switch (kind) {
        case ColumnKind::NUMERIC: {
            std::vector<double> values(tokens.size(), std::nan(""));
            for (size_t r = 0; r < tokens.size(); ++r) {
                if (!DatasetLoader::parseNumber(tokens[r], values[r])) {
                    values[r] = std::nan("");
                    col.missing[r] = static_cast<uint8_t>(1);
                }
            }
            col.values = std::move(values);
            break;
        }
        case ColumnKind::DATE: {
            std::vector<int64_t> values(tokens.size(), 0);
            for (size_t r = 0; r < tokens.size(); ++r) {
                if (!DatasetLoader::parseDate(tokens[r], values[r])) {
                    values[r] = 0;
                    col.missing[r] = static_cast<uint8_t>(1);
                }
            }
            col.values = std::move(values);
            break;
        }
        case ColumnKind::BOOLEAN: {
            std::vector<uint8_t> values(tokens.size(), static_cast<uint8_t>(0));
            for (size_t r = 0; r < tokens.size(); ++r) {
                bool b = false;
                if (DatasetLoader::parseBoolean(tokens[r], b)) {
                    values[r] = static_cast<uint8_t>(b ? 1 : 0);
                } else {
                    col.missing[r] = static_cast<uint8_t>(1);
                }
            }
            col.values = std::move(values);
            break;
        }
        case ColumnKind::CATEGORICAL: {
            std::vector<std::string> values(tokens.size());
            for (size_t r = 0; r < tokens.size(); ++r) {
                if (DatasetLoader::isMissingToken(tokens[r])) {
                    col.missing[r] = static_cast<uint8_t>(1);
                } else {
                    values[r] = CommonUtils::trim(tokens[r]);
                }
            }
            col.values = std::move(values);
            break;
        }
    }
    return col;
}

Column numericColumn(const std::string& name, std::vector<double> values) {
    Column col;
    col.name = name;
    col.kind = ColumnKind::NUMERIC;
    col.missing.assign(values.size(), static_cast<uint8_t>(0));
    col.values = std::move(values);
    return col;
}

Column textColumn(const std::string& name, std::vector<std::string> values) {
    Column col;
    col.name = name;
    col.kind = ColumnKind::CATEGORICAL;
    col.missing.assign(values.size(), static_cast<uint8_t>(0));
    col.values = std::move(values);
    return col;
}
} // namespace

std::string SchemaGap::describe() const {
    if (absent) {
        return column + ": column absent (expected " + columnKindName(expected) + ")";
    }
    return column + ": expected " + std::string(columnKindName(expected)) + ", found " + columnKindName(actual);
}

bool LoadResult::hasGap(const std::string& column) const {
    return std::any_of(schemaGaps.begin(), schemaGaps.end(), [&](const SchemaGap& gap) { return gap.column == column; });
}

DatasetLoader::DatasetLoader(std::string path, char delimiter)
    : path_(std::move(path)), delimiter_(delimiter) {}

bool DatasetLoader::isMissingToken(const std::string& raw) {
    std::string s = CommonUtils::trim(raw);
    if (s.empty()) return true;
    s = CommonUtils::toLower(s);
    return s == "na" || s == "n/a" || s == "null" || s == "none" || s == "nan" || s == "missing";
}

bool DatasetLoader::parseNumber(const std::string& raw, double& out) {
    if (isMissingToken(raw)) return false;

    std::string cleaned;
    cleaned.reserve(raw.size());
    for (char ch : raw) {
        if (!std::isspace(static_cast<unsigned char>(ch)) && ch != '_') cleaned.push_back(ch);
    }
    if (!cleaned.empty() && cleaned.front() == '+') cleaned.erase(cleaned.begin());
    if (!cleaned.empty() && cleaned.front() == '$') cleaned.erase(cleaned.begin());
    if (cleaned.empty() || !stripThousandsSeparators(cleaned)) return false;

    double value = 0.0;
    const char* b = cleaned.data();
    const char* e = b + cleaned.size();
    auto [p, ec] = std::from_chars(b, e, value, std::chars_format::general);
    if (ec != std::errc{} || p != e || !std::isfinite(value)) return false;
    out = value;
    return true;
}

bool DatasetLoader::parseBoolean(const std::string& raw, bool& out) {
    const std::string s = CommonUtils::toLower(CommonUtils::trim(raw));
    if (s == "true") {
        out = true;
        return true;
    }
    if (s == "false") {
        out = false;
        return true;
    }
    return false;
}

bool DatasetLoader::parseDate(const std::string& raw, int64_t& outUnixSeconds) {
    const std::string s = CommonUtils::trim(raw);
    if (s.empty() || isMissingToken(s)) return false;

    std::string datePart = s;
    std::string timePart;
    const size_t sep = s.find(' ');
    if (sep != std::string::npos) {
        datePart = s.substr(0, sep);
        timePart = s.substr(sep + 1);
    }

    int year = 0;
    int month = 0;
    int day = 0;
    int hour = 0;
    int minute = 0;
    int second = 0;
    if (!parseDatePart(datePart, year, month, day)) return false;
    if (!parseTimePart(timePart, hour, minute, second)) return false;

    if (month < 1 || month > 12) return false;
    if (day < 1 || day > daysInMonth(year, month)) return false;
    if (hour > 23 || minute > 59 || second > 59) return false;

    const int64_t days = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    outUnixSeconds = days * 86400 + static_cast<int64_t>(hour) * 3600 + static_cast<int64_t>(minute) * 60 + second;
    return true;
}

Dataset DatasetLoader::readCsv(LoadResult* stats) const {
    if (path_.empty()) throw Marquee::IOException("No dataset path given");

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path_, ec) || ec) {
        throw Marquee::IOException("Could not open file: " + path_);
    }
    std::ifstream in(path_, std::ios::binary);
    if (!in) throw Marquee::IOException("Could not open file: " + path_);

    CSVUtils::skipBOM(in);

    bool malformed = false;
    auto header = CSVUtils::parseCSVLine(in, delimiter_, &malformed);
    if (malformed || header.empty()) throw Marquee::DatasetException("Malformed or empty CSV header");
    header = CSVUtils::normalizeHeader(header);

    std::vector<std::vector<std::string>> rows;
    size_t padded = 0;
    size_t truncated = 0;
    size_t skipped = 0;
    while (in.peek() != EOF) {
        auto row = CSVUtils::parseCSVLine(in, delimiter_, &malformed);
        if (malformed) {
            ++skipped;
            continue;
        }
        if (row.empty()) continue;
        if (row.size() < header.size()) {
            ++padded;
            row.resize(header.size());
        } else if (row.size() > header.size()) {
            ++truncated;
            row.resize(header.size());
        }
        rows.push_back(std::move(row));
    }

    std::unordered_map<std::string, ColumnKind> overrides;
    for (const auto& kv : kindOverrides_) overrides[CommonUtils::toLower(kv.first)] = kv.second;

    std::vector<Column> columns;
    columns.reserve(header.size());
    std::vector<std::string> tokens(rows.size());
    for (size_t c = 0; c < header.size(); ++c) {
        for (size_t r = 0; r < rows.size(); ++r) tokens[r] = rows[r][c];

        const auto it = overrides.find(CommonUtils::toLower(header[c]));
        const ColumnKind kind = (it != overrides.end()) ? it->second : inferKind(tokens);
        columns.push_back(buildColumn(header[c], kind, tokens));
    }

    if (padded > 0) {
        std::cout << "[Marquee][Warning] Padded " << padded << " short row(s) with missing values.\n";
    }
    if (truncated > 0) {
        std::cout << "[Marquee][Warning] Truncated " << truncated << " long row(s) to " << header.size() << " fields.\n";
    }
    if (skipped > 0) {
        std::cout << "[Marquee][Warning] Skipped " << skipped << " record(s) with an unterminated quote.\n";
    }
    if (stats) {
        stats->paddedRows = padded;
        stats->truncatedRows = truncated;
        stats->skippedRows = skipped;
    }

    return Dataset(path_, std::move(columns));
}

LoadResult DatasetLoader::load() const {
    LoadResult result;
    try {
        result.dataset = readCsv(&result);
        if (verbose_) {
            std::cout << "[Marquee][Loader] Read " << result.dataset.rowCount() << " rows x "
                      << result.dataset.colCount() << " columns from " << path_ << "\n";
        }
    } catch (const Marquee::MarqueeException& e) {
        result = LoadResult{};
        result.usedFallback = true;
        result.fallbackReason = e.what();
        result.dataset = syntheticMovies();
        std::cout << "[Marquee][Warning] Dataset source unavailable (" << e.what()
                  << "). Using the built-in " << result.dataset.rowCount() << "-row movie sample.\n";
    }

    result.schemaGaps = validateSchema(result.dataset);
    for (const auto& gap : result.schemaGaps) {
        std::cout << "[Marquee][Warning] Schema gap: " << gap.describe() << ". Dependent statistics are skipped.\n";
    }
    return result;
}

Dataset DatasetLoader::syntheticMovies() {
    std::vector<Column> columns;
    columns.push_back(textColumn("title", {"Avatar", "Titanic", "Avengers", "Joker", "Inception"}));

    columns.push_back(buildColumn("release_date", ColumnKind::DATE,
                                  {"2009-12-18", "1997-12-19", "2012-05-04", "2019-10-04", "2010-07-16"}));

    columns.push_back(numericColumn("budget", {237000000.0, 200000000.0, 220000000.0, 55000000.0, 160000000.0}));
    columns.push_back(numericColumn("revenue", {2787965087.0, 2257844554.0, 1518815515.0, 1074219000.0, 825532764.0}));
    columns.push_back(numericColumn("runtime", {162.0, 194.0, 143.0, 122.0, 148.0}));
    columns.push_back(numericColumn("vote_average", {7.2, 7.5, 7.8, 8.4, 8.8}));
    columns.push_back(textColumn("genre", {"Action", "Drama", "Action", "Drama", "Sci-Fi"}));
    columns.push_back(textColumn("director", {"James Cameron", "James Cameron", "Joss Whedon", "Todd Phillips", "Christopher Nolan"}));

    Column english;
    english.name = "is_english";
    english.kind = ColumnKind::BOOLEAN;
    english.values = std::vector<uint8_t>(5, static_cast<uint8_t>(1));
    english.missing.assign(5, static_cast<uint8_t>(0));
    columns.push_back(std::move(english));

    return Dataset("synthetic_movies", std::move(columns));
}

const std::vector<SchemaRequirement>& DatasetLoader::analyticalColumns() {
    static const std::vector<SchemaRequirement> kColumns = {
        {"budget", ColumnKind::NUMERIC},
        {"revenue", ColumnKind::NUMERIC},
        {"runtime", ColumnKind::NUMERIC},
        {"vote_average", ColumnKind::NUMERIC},
        {"genre", ColumnKind::CATEGORICAL},
    };
    return kColumns;
}

std::vector<SchemaGap> DatasetLoader::validateSchema(const Dataset& dataset) {
    std::vector<SchemaGap> gaps;
    for (const auto& req : analyticalColumns()) {
        const int idx = dataset.findColumnIndex(req.column);
        if (idx < 0) {
            gaps.push_back({req.column, req.kind, true, ColumnKind::CATEGORICAL});
            continue;
        }
        const ColumnKind actual = dataset.column(static_cast<size_t>(idx)).kind;
        if (actual != req.kind) {
            gaps.push_back({req.column, req.kind, false, actual});
        }
    }
    return gaps;
}
